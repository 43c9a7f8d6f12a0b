/*
 * Terminal renderer implementation - RawLine
 * Copyright (c) 2025 iDev srl - Luigi De Astis <l.deastis@idev-srl.com>
 * MIT License.
 */
#include <rawline/render/renderer.hpp>
#include <rawline/text/utf8.hpp>

namespace rawline {

namespace ansi {
std::string cursor_left(std::size_t n) {
    if (n == 0) return {};
    return "\x1b[" + std::to_string(n) + "D";
}
std::string cursor_right(std::size_t n) {
    if (n == 0) return {};
    return "\x1b[" + std::to_string(n) + "C";
}
} // namespace ansi

MaybeError Renderer::emit(const std::string& bytes) {
    if (auto err = m_out.write(bytes)) return err;
    return m_out.flush();
}

MaybeError Renderer::prompt() { return emit(m_prompt); }

MaybeError Renderer::append_char(char32_t c) { return emit(utf8::encode(c)); }

MaybeError Renderer::insert_char(const LineBuffer& buf, std::size_t old_cursor) {
    std::string out = ansi::cursor_left(old_cursor);
    out += buf.text();
    out += ansi::kEraseToEol;
    out += ansi::cursor_left(buf.length() - buf.cursor());
    return emit(out);
}

MaybeError Renderer::delete_backward(const LineBuffer& buf) {
    std::string out = ansi::cursor_left(1);
    out += buf.tail_from_cursor();
    out += ansi::kEraseToEol;
    out += ansi::cursor_left(buf.chars_after_cursor());
    return emit(out);
}

MaybeError Renderer::cursor_left() { return emit(ansi::cursor_left(1)); }

MaybeError Renderer::cursor_right() { return emit(ansi::cursor_right(1)); }

MaybeError Renderer::redraw_line(const LineBuffer& buf) {
    std::string out = "\r" + m_prompt + buf.text() + ansi::kEraseToEol;
    out += ansi::cursor_left(buf.length() - buf.cursor());
    return emit(out);
}

MaybeError Renderer::commit(const std::string* output) {
    std::string out = "\r\n";
    if (output && !output->empty()) { out += *output; out += "\r\n"; }
    out += m_prompt;
    return emit(out);
}

MaybeError Renderer::terminate() { return emit("\r\n"); }

} // namespace rawline
