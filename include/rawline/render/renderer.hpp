/*
 * Terminal renderer - RawLine
 * Copyright (c) 2025 iDev srl - Luigi De Astis <l.deastis@idev-srl.com>
 * MIT License.
 *
 * Keeps the visible line in step with the LineBuffer using three primitives:
 * relative cursor moves (ESC[nC / ESC[nD), erase to end of line (ESC[K) and
 * carriage return + redraw. Every character is assumed to take one column.
 * That includes a '\n' inserted by a continuation line: the cursor arithmetic
 * is single-row, so edits after it leave the screen out of step with the buffer.
 * Each public call writes its output and flushes before returning.
 */
#pragma once
#include <rawline/core/error.hpp>
#include <rawline/edit/line_buffer.hpp>
#include <rawline/term/io.hpp>
#include <string>
#include <cstddef>
#include <utility>

namespace rawline {

namespace ansi {
inline constexpr const char* kEraseToEol = "\x1b[K";
std::string cursor_left(std::size_t n);
std::string cursor_right(std::size_t n);
} // namespace ansi

class Renderer {
public:
    Renderer(OutputSink& out, std::string prompt) : m_out(out), m_prompt(std::move(prompt)) {}

    MaybeError prompt();
    // Character appended at the end of the line.
    MaybeError append_char(char32_t c);
    // Character inserted before the end; `old_cursor` is the column before insertion.
    MaybeError insert_char(const LineBuffer& buf, std::size_t old_cursor);
    MaybeError delete_backward(const LineBuffer& buf);
    MaybeError cursor_left();
    MaybeError cursor_right();
    // Full redraw after loading a history entry; leaves the cursor on column 0 of the text.
    MaybeError redraw_line(const LineBuffer& buf);
    // Ends the edited line, prints the processor's output if any, then a new prompt.
    MaybeError commit(const std::string* output);
    MaybeError terminate();

    const std::string& prompt_text() const { return m_prompt; }
private:
    MaybeError emit(const std::string& bytes);
    OutputSink& m_out;
    std::string m_prompt;
};

} // namespace rawline
