/*
 * History store - RawLine
 * Copyright (c) 2025 iDev srl - Luigi De Astis <l.deastis@idev-srl.com>
 * MIT License.
 */
#pragma once
#include <string>
#include <vector>
#include <optional>
#include <cstddef>

namespace rawline {

// Append-only list of committed lines plus a browse position used by Up/Down.
// Browsing replaces the line under edit; unsaved edits are not stashed, and
// there is no blank entry below the newest line.
class History {
public:
    History() = default;
    void append(const std::string& line); // browse position moves past the newest entry
    std::optional<std::string> prev();    // nullopt when already at the oldest entry
    std::optional<std::string> next();    // nullopt when already at the newest entry

    std::size_t size() const { return m_lines.size(); }
    bool empty() const { return m_lines.empty(); }
    std::size_t browse_pos() const { return m_pos; }
    const std::vector<std::string>& entries() const { return m_lines; }
private:
    std::vector<std::string> m_lines;
    std::size_t m_pos = 0; // 0 <= m_pos <= m_lines.size()
};

} // namespace rawline
