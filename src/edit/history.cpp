/*
 * History store implementation - RawLine
 * Copyright (c) 2025 iDev srl - Luigi De Astis <l.deastis@idev-srl.com>
 * MIT License.
 */
#include <rawline/edit/history.hpp>

namespace rawline {

void History::append(const std::string& line) {
    m_lines.push_back(line);
    m_pos = m_lines.size();
}

std::optional<std::string> History::prev() {
    if (m_lines.empty() || m_pos == 0) return std::nullopt;
    --m_pos;
    return m_lines[m_pos];
}

std::optional<std::string> History::next() {
    if (m_pos + 1 >= m_lines.size()) return std::nullopt;
    ++m_pos;
    return m_lines[m_pos];
}

} // namespace rawline
