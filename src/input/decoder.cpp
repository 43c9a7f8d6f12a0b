/*
 * Input decoder implementation - RawLine
 * Copyright (c) 2025 iDev srl - Luigi De Astis <l.deastis@idev-srl.com>
 * MIT License.
 */
#include <rawline/input/decoder.hpp>
#include <rawline/text/utf8.hpp>
#include <utility>

namespace rawline {

namespace {
constexpr unsigned char ETX = 0x03;
constexpr unsigned char BS  = 0x08;
constexpr unsigned char ESC = 0x1B;
constexpr unsigned char DEL = 0x7F;
}

Decoder::Decoder(DecoderOptions opts) : m_opts(opts) {}

void Decoder::reset() {
    m_state = DecoderState::Normal;
    m_seq.clear();
    m_utf8.clear();
    m_utf8_expected = 0;
}

void Decoder::reject(std::string bytes) {
    ++m_rejected;
    m_last_rejected = std::move(bytes);
}

std::optional<EditAction> Decoder::feed(unsigned char byte) {
    // Ctrl-C wins in every state, half-read sequences are thrown away.
    if (byte == ETX) {
        reset();
        return EditAction{ActionKind::Terminate};
    }
    switch (m_state) {
        case DecoderState::Escape:
            m_seq.push_back(static_cast<char>(byte));
            if (byte == '[') { m_state = DecoderState::BracketedEscape; return std::nullopt; }
            reject(m_seq);
            reset();
            return std::nullopt;
        case DecoderState::BracketedEscape: {
            m_seq.push_back(static_cast<char>(byte));
            std::optional<EditAction> act;
            switch (byte) {
                case 'A': act = EditAction{ActionKind::HistoryPrev}; break;
                case 'B': act = EditAction{ActionKind::HistoryNext}; break;
                case 'C': act = EditAction{ActionKind::CursorRight}; break;
                case 'D': act = EditAction{ActionKind::CursorLeft}; break;
                default: reject(m_seq); break;
            }
            reset();
            return act;
        }
        case DecoderState::Normal:
            break;
    }
    if (!m_utf8.empty()) return feed_utf8(byte);
    return feed_normal(byte);
}

std::optional<EditAction> Decoder::feed_utf8(unsigned char byte) {
    if (!utf8::is_continuation(byte)) {
        // Interrupted character: drop it and treat this byte from scratch.
        reject(m_utf8);
        m_utf8.clear();
        m_utf8_expected = 0;
        return feed_normal(byte);
    }
    m_utf8.push_back(static_cast<char>(byte));
    if (m_utf8.size() < m_utf8_expected) return std::nullopt;
    char32_t cp = 0;
    bool ok = utf8::decode(m_utf8, cp);
    if (!ok) reject(m_utf8);
    m_utf8.clear();
    m_utf8_expected = 0;
    if (!ok) return std::nullopt;
    return classify(cp);
}

std::optional<EditAction> Decoder::feed_normal(unsigned char byte) {
    switch (byte) {
        case ESC:
            m_state = DecoderState::Escape;
            m_seq.assign(1, static_cast<char>(byte));
            return std::nullopt;
        case '\r':
        case '\n':
            return EditAction{ActionKind::Commit};
        case BS:
        case DEL:
            return EditAction{ActionKind::DeleteBackward};
        default:
            break;
    }
    if (byte == 'q' && m_opts.quit_on_q) return EditAction{ActionKind::Terminate};
    if (byte < 0x80) return classify(byte);
    std::size_t n = utf8::sequence_length(byte);
    if (n == 0) {
        // stray continuation byte or a lead that can never be valid
        reject(std::string(1, static_cast<char>(byte)));
        return std::nullopt;
    }
    m_utf8.assign(1, static_cast<char>(byte));
    m_utf8_expected = n;
    return std::nullopt;
}

std::optional<EditAction> Decoder::classify(char32_t cp) {
    bool printable = (cp >= 0x20 && cp < 0x7F) || cp >= 0xA0;
    bool whitespace = cp == 0x0B || cp == 0x0C || cp == 0x85; // VT, FF, NEL; never tab
    if (!printable && !whitespace) return std::nullopt;
    return EditAction{ActionKind::InsertChar, cp};
}

} // namespace rawline
