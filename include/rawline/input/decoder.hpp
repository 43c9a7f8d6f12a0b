/*
 * RawLine Input Decoder Module
 *
 * Copyright (c) 2025 iDev srl
 * Author: Luigi De Astis <l.deastis@idev-srl.com>
 *
 * Description:
 *   Byte-driven state machine turning the raw terminal input stream into discrete
 *   edit actions. Handles plain characters (including multi-byte UTF-8), control
 *   bytes (Enter, Backspace, Ctrl-C) and the CSI arrow-key sequences ESC [ A..D.
 *   This is the first stage of the editor pipeline, ahead of the line buffer and
 *   the renderer.
 *
 * License (MIT):
 *   Permission is hereby granted, free of charge, to any person obtaining a copy of this
 *   software and associated documentation files (the "Software"), to deal in the Software
 *   without restriction, including without limitation the rights to use, copy, modify, merge,
 *   publish, distribute, sublicense, and/or sell copies of the Software, and to permit persons
 *   to whom the Software is furnished to do so, subject to the following conditions:
 *
 *   The above copyright notice and this permission notice shall be included in all copies or
 *   substantial portions of the Software.
 *
 *   THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR IMPLIED,
 *   INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY, FITNESS FOR A PARTICULAR
 *   PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE AUTHORS OR COPYRIGHT HOLDERS BE LIABLE
 *   FOR ANY CLAIM, DAMAGES OR OTHER LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR
 *   OTHERWISE, ARISING FROM, OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER
 *   DEALINGS IN THE SOFTWARE.
 */
#pragma once
#include <string>
#include <optional>
#include <cstddef>

namespace rawline {

enum class ActionKind {
    InsertChar,
    DeleteBackward,
    CursorLeft,
    CursorRight,
    HistoryPrev,
    HistoryNext,
    Commit,
    Terminate
};

struct EditAction {
    ActionKind kind;
    char32_t ch = 0; // only for InsertChar
};

enum class DecoderState { Normal, Escape, BracketedEscape };

struct DecoderOptions {
    bool quit_on_q = true; // plain 'q' in Normal state terminates
};

class Decoder {
public:
    explicit Decoder(DecoderOptions opts = {});
    std::optional<EditAction> feed(unsigned char byte);
    void reset();

    DecoderState state() const { return m_state; }
    bool pending_char() const { return !m_utf8.empty(); }

    // Diagnostics for dropped input (unknown escape tails, invalid UTF-8).
    std::size_t rejected_count() const { return m_rejected; }
    const std::string& last_rejected() const { return m_last_rejected; }
private:
    std::optional<EditAction> feed_normal(unsigned char byte);
    std::optional<EditAction> feed_utf8(unsigned char byte);
    std::optional<EditAction> classify(char32_t cp);
    void reject(std::string bytes);

    DecoderOptions m_opts;
    DecoderState m_state = DecoderState::Normal;
    std::string m_seq;   // raw bytes of the escape sequence in progress
    std::string m_utf8;  // pending multi-byte character
    std::size_t m_utf8_expected = 0;
    std::size_t m_rejected = 0;
    std::string m_last_rejected;
};

} // namespace rawline
