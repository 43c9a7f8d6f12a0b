/*
 * UTF-8 helpers implementation - RawLine
 * Copyright (c) 2025 iDev srl - Luigi De Astis <l.deastis@idev-srl.com>
 * MIT License.
 */
#include <rawline/text/utf8.hpp>

namespace rawline::utf8 {

std::size_t sequence_length(unsigned char b) {
    if (b < 0x80) return 1;
    if (b >= 0xC2 && b <= 0xDF) return 2;
    if (b >= 0xE0 && b <= 0xEF) return 3;
    if (b >= 0xF0 && b <= 0xF4) return 4;
    return 0;
}

bool decode(const std::string& seq, char32_t& out) {
    if (seq.empty()) return false;
    unsigned char lead = static_cast<unsigned char>(seq[0]);
    std::size_t n = sequence_length(lead);
    if (n == 0 || n != seq.size()) return false;
    char32_t cp;
    switch (n) {
        case 1: out = lead; return true;
        case 2: cp = lead & 0x1F; break;
        case 3: cp = lead & 0x0F; break;
        default: cp = lead & 0x07; break;
    }
    for (std::size_t i = 1; i < n; ++i) {
        unsigned char b = static_cast<unsigned char>(seq[i]);
        if (!is_continuation(b)) return false;
        cp = (cp << 6) | (b & 0x3F);
    }
    static const char32_t min_for_len[] = {0, 0, 0x80, 0x800, 0x10000};
    if (cp < min_for_len[n]) return false;           // overlong
    if (cp >= 0xD800 && cp <= 0xDFFF) return false;  // surrogate
    if (cp > 0x10FFFF) return false;
    out = cp;
    return true;
}

std::string encode(char32_t cp) {
    std::string out;
    if (cp < 0x80) {
        out.push_back(static_cast<char>(cp));
    } else if (cp < 0x800) {
        out.push_back(static_cast<char>(0xC0 | (cp >> 6)));
        out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
    } else if (cp < 0x10000) {
        out.push_back(static_cast<char>(0xE0 | (cp >> 12)));
        out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
        out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
    } else {
        out.push_back(static_cast<char>(0xF0 | (cp >> 18)));
        out.push_back(static_cast<char>(0x80 | ((cp >> 12) & 0x3F)));
        out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
        out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
    }
    return out;
}

std::size_t length(const std::string& text) {
    std::size_t n = 0;
    for (char c : text) if (!is_continuation(static_cast<unsigned char>(c))) ++n;
    return n;
}

std::size_t byte_offset(const std::string& text, std::size_t index) {
    std::size_t count = 0;
    for (std::size_t i = 0; i < text.size(); ++i) {
        if (is_continuation(static_cast<unsigned char>(text[i]))) continue;
        if (count == index) return i;
        ++count;
    }
    return text.size();
}

} // namespace rawline::utf8
