/*
 * Line editor - RawLine
 * Copyright (c) 2025 iDev srl - Luigi De Astis <l.deastis@idev-srl.com>
 * MIT License.
 *
 * Reads bytes, decodes them into edit actions, applies them to the line buffer
 * and history, and keeps the terminal in sync through the Renderer. Committed
 * lines go to history first, then to the LineProcessor.
 */
#pragma once
#include <rawline/core/error.hpp>
#include <rawline/input/decoder.hpp>
#include <rawline/edit/line_buffer.hpp>
#include <rawline/edit/history.hpp>
#include <rawline/render/renderer.hpp>
#include <rawline/term/io.hpp>
#include <rawline/term/raw_mode.hpp>
#include <rawline/line/processor.hpp>
#include <string>
#include <ostream>

namespace rawline {

struct EditorOptions {
    std::string prompt = "> ";
    bool quit_on_q = true;
    bool echo = true;              // print the processor's output after each commit
    bool debug = false;            // trace dropped input on `diag`
    std::ostream* diag = nullptr;  // std::cerr when null
};

class Editor {
public:
    // processor and complete are optional and not owned.
    Editor(InputSource& in, OutputSink& out, TerminalMode& mode, EditorOptions opts = {},
           LineProcessor* processor = nullptr, CompletenessPredicate* complete = nullptr);
    Editor(const Editor&) = delete;
    Editor& operator=(const Editor&) = delete;

    // Acquires the terminal mode, loops until terminate / end of input / error,
    // and releases the terminal mode on every way out.
    MaybeError run();

    // One input byte through decoder, buffer, history and renderer.
    MaybeError step(unsigned char byte);
    MaybeError apply(const EditAction& action);

    bool finished() const { return m_finished; }
    const LineBuffer& buffer() const { return m_buffer; }
    const History& history() const { return m_history; }
    const Decoder& decoder() const { return m_decoder; }
private:
    MaybeError insert(char32_t c);
    MaybeError delete_backward();
    MaybeError move_cursor(int delta);
    MaybeError load_history(bool older);
    MaybeError commit();
    void trace(const std::string& msg);

    InputSource& m_in;
    TerminalMode& m_mode;
    EditorOptions m_opts;
    LineProcessor* m_processor;
    CompletenessPredicate* m_complete;
    Decoder m_decoder;
    LineBuffer m_buffer;
    History m_history;
    Renderer m_render;
    bool m_finished = false;
};

} // namespace rawline
