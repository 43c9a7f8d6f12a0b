/*
 * Line editor implementation - RawLine
 * Copyright (c) 2025 iDev srl - Luigi De Astis <l.deastis@idev-srl.com>
 * MIT License.
 */
#include <rawline/line/editor.hpp>
#include <iostream>
#include <iomanip>
#include <sstream>

namespace rawline {

namespace {

// Gives the terminal mode back when the loop unwinds, whatever the reason.
class ModeRelease {
public:
    explicit ModeRelease(TerminalMode& mode) : m_mode(mode) {}
    ModeRelease(const ModeRelease&) = delete;
    ModeRelease& operator=(const ModeRelease&) = delete;
    ~ModeRelease() { m_mode.release(); }
private:
    TerminalMode& m_mode;
};

std::string hex_bytes(const std::string& bytes) {
    std::ostringstream oss;
    for (std::size_t i = 0; i < bytes.size(); ++i) {
        if (i) oss << ' ';
        oss << std::hex << std::setw(2) << std::setfill('0')
            << static_cast<int>(static_cast<unsigned char>(bytes[i]));
    }
    return oss.str();
}

} // namespace

Editor::Editor(InputSource& in, OutputSink& out, TerminalMode& mode, EditorOptions opts,
               LineProcessor* processor, CompletenessPredicate* complete)
    : m_in(in), m_mode(mode), m_opts(std::move(opts)), m_processor(processor), m_complete(complete),
      m_decoder(DecoderOptions{m_opts.quit_on_q}), m_render(out, m_opts.prompt) {}

MaybeError Editor::run() {
    if (auto err = m_mode.acquire()) return err;
    ModeRelease guard(m_mode);
    m_finished = false;
    if (auto err = m_render.prompt()) return err;
    while (!m_finished) {
        ReadResult r = m_in.read_byte();
        if (r.status == ReadStatus::Eof) {
            m_finished = true;
            return m_render.terminate();
        }
        if (r.status == ReadStatus::Failed) return r.error;
        if (auto err = step(r.byte)) return err;
    }
    return std::nullopt;
}

MaybeError Editor::step(unsigned char byte) {
    std::size_t rejected = m_decoder.rejected_count();
    auto action = m_decoder.feed(byte);
    if (m_opts.debug && m_decoder.rejected_count() != rejected)
        trace("dropped input: " + hex_bytes(m_decoder.last_rejected()));
    if (!action) return std::nullopt;
    return apply(*action);
}

MaybeError Editor::apply(const EditAction& action) {
    switch (action.kind) {
        case ActionKind::InsertChar: return insert(action.ch);
        case ActionKind::DeleteBackward: return delete_backward();
        case ActionKind::CursorLeft: return move_cursor(-1);
        case ActionKind::CursorRight: return move_cursor(1);
        case ActionKind::HistoryPrev: return load_history(true);
        case ActionKind::HistoryNext: return load_history(false);
        case ActionKind::Commit: return commit();
        case ActionKind::Terminate:
            // uncommitted text is dropped, history untouched
            m_finished = true;
            return m_render.terminate();
    }
    return std::nullopt;
}

MaybeError Editor::insert(char32_t c) {
    std::size_t old_cursor = m_buffer.cursor();
    bool at_end = m_buffer.at_end();
    m_buffer.insert(c);
    if (at_end) return m_render.append_char(c);
    return m_render.insert_char(m_buffer, old_cursor);
}

MaybeError Editor::delete_backward() {
    if (!m_buffer.delete_before_cursor()) return std::nullopt;
    return m_render.delete_backward(m_buffer);
}

MaybeError Editor::move_cursor(int delta) {
    if (!m_buffer.move_cursor(delta)) return std::nullopt;
    return delta < 0 ? m_render.cursor_left() : m_render.cursor_right();
}

MaybeError Editor::load_history(bool older) {
    auto line = older ? m_history.prev() : m_history.next();
    if (!line) return std::nullopt;
    m_buffer.replace(*line);
    return m_render.redraw_line(m_buffer);
}

MaybeError Editor::commit() {
    if (m_complete && !m_complete->is_complete(m_buffer.text())) return insert(U'\n');
    std::string line = m_buffer.take();
    m_history.append(line);
    m_decoder.reset();
    if (!m_processor) return m_render.commit(nullptr);
    ProcessResult res = m_processor->process(line);
    if (!res.ok) {
        if (auto err = m_render.terminate()) return err;
        return Error{ErrorKind::LineProcessingFailure, res.error};
    }
    return m_render.commit(m_opts.echo ? &res.output : nullptr);
}

void Editor::trace(const std::string& msg) {
    std::ostream& os = m_opts.diag ? *m_opts.diag : std::cerr;
    os << "[rawline] " << msg << "\r\n";
}

} // namespace rawline
