/*
 * UTF-8 helpers - RawLine
 * Copyright (c) 2025 iDev srl - Luigi De Astis <l.deastis@idev-srl.com>
 * MIT License.
 */
#pragma once
#include <string>
#include <cstddef>

namespace rawline::utf8 {

inline bool is_continuation(unsigned char b) { return (b & 0xC0) == 0x80; }

// Total length of the sequence introduced by lead byte b, 0 if b cannot start one.
// Rejects 0xC0/0xC1 (always overlong) and 0xF5..0xFF (beyond U+10FFFF).
std::size_t sequence_length(unsigned char b);

// Decodes exactly one complete sequence. Returns false on overlong forms,
// surrogates, values past U+10FFFF or malformed continuation bytes.
bool decode(const std::string& seq, char32_t& out);

std::string encode(char32_t cp);

// Number of characters (not bytes) in well-formed text.
std::size_t length(const std::string& text);

// Byte offset where character index `index` starts; text.size() when index == length.
std::size_t byte_offset(const std::string& text, std::size_t index);

} // namespace rawline::utf8
