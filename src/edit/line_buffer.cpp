/*
 * Line buffer implementation - RawLine
 * Copyright (c) 2025 iDev srl - Luigi De Astis <l.deastis@idev-srl.com>
 * MIT License.
 */
#include <rawline/edit/line_buffer.hpp>
#include <rawline/text/utf8.hpp>
#include <utility>

namespace rawline {

void LineBuffer::insert(char32_t c) {
    std::size_t at = utf8::byte_offset(m_text, m_cursor);
    m_text.insert(at, utf8::encode(c));
    ++m_length;
    ++m_cursor;
}

bool LineBuffer::delete_before_cursor() {
    if (m_cursor == 0) return false;
    std::size_t from = utf8::byte_offset(m_text, m_cursor - 1);
    std::size_t to = utf8::byte_offset(m_text, m_cursor);
    m_text.erase(from, to - from);
    --m_length;
    --m_cursor;
    return true;
}

bool LineBuffer::move_cursor(int delta) {
    std::size_t target = m_cursor;
    if (delta < 0) {
        std::size_t back = static_cast<std::size_t>(-delta);
        target = back > m_cursor ? 0 : m_cursor - back;
    } else {
        target = m_cursor + static_cast<std::size_t>(delta);
        if (target > m_length) target = m_length;
    }
    if (target == m_cursor) return false;
    m_cursor = target;
    return true;
}

void LineBuffer::replace(const std::string& text) {
    m_text = text;
    m_length = utf8::length(m_text);
    m_cursor = 0;
}

std::string LineBuffer::take() {
    std::string out = std::move(m_text);
    m_text.clear();
    m_length = 0;
    m_cursor = 0;
    return out;
}

std::string LineBuffer::tail_from_cursor() const {
    return m_text.substr(utf8::byte_offset(m_text, m_cursor));
}

} // namespace rawline
