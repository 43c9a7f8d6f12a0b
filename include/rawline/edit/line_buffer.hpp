/*
 * Line buffer - RawLine
 * Copyright (c) 2025 iDev srl - Luigi De Astis <l.deastis@idev-srl.com>
 * MIT License.
 */
#pragma once
#include <string>
#include <cstddef>

namespace rawline {

// Text of the line under edit (UTF-8) and a cursor counted in characters.
// Invariant: 0 <= cursor() <= length().
class LineBuffer {
public:
    LineBuffer() = default;

    void insert(char32_t c);
    bool delete_before_cursor();  // false when cursor is at 0
    bool move_cursor(int delta);  // false when already clamped at a bound
    void replace(const std::string& text);
    std::string take();           // returns the text and leaves the buffer empty

    const std::string& text() const { return m_text; }
    std::size_t cursor() const { return m_cursor; }
    std::size_t length() const { return m_length; }
    bool empty() const { return m_text.empty(); }
    bool at_end() const { return m_cursor == m_length; }

    std::string tail_from_cursor() const;
    std::size_t chars_after_cursor() const { return m_length - m_cursor; }
private:
    std::string m_text;
    std::size_t m_cursor = 0; // character index
    std::size_t m_length = 0; // character count of m_text
};

} // namespace rawline
