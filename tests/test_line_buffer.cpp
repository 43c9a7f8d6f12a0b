/*
 * Line buffer tests - RawLine
 * Copyright (c) 2025 iDev srl - Luigi De Astis <l.deastis@idev-srl.com>
 * MIT License.
 */
#include <gtest/gtest.h>
#include <rawline/edit/line_buffer.hpp>
#include <rawline/text/utf8.hpp>
#include <random>

using namespace rawline;

static void type(LineBuffer& b, const std::u32string& s) { for (char32_t c : s) b.insert(c); }

TEST(LineBuffer, InsertInMiddle) {
    LineBuffer b;
    type(b, U"ab");
    EXPECT_TRUE(b.move_cursor(-1));
    EXPECT_TRUE(b.move_cursor(-1));
    b.insert(U'x');
    EXPECT_EQ(b.text(), "xab");
    EXPECT_EQ(b.cursor(), 1u);
    EXPECT_EQ(b.tail_from_cursor(), "ab");
    EXPECT_EQ(b.chars_after_cursor(), 2u);
}

TEST(LineBuffer, BackspaceAtStartIsNoop) {
    LineBuffer b;
    EXPECT_FALSE(b.delete_before_cursor());
    type(b, U"hi");
    b.move_cursor(-2);
    EXPECT_FALSE(b.delete_before_cursor());
    EXPECT_EQ(b.text(), "hi");
    EXPECT_EQ(b.cursor(), 0u);
}

TEST(LineBuffer, CursorClamps) {
    LineBuffer b;
    EXPECT_FALSE(b.move_cursor(-1));
    EXPECT_FALSE(b.move_cursor(1));
    type(b, U"abc");
    EXPECT_FALSE(b.move_cursor(1));
    EXPECT_TRUE(b.move_cursor(-10));
    EXPECT_EQ(b.cursor(), 0u);
    EXPECT_TRUE(b.move_cursor(10));
    EXPECT_EQ(b.cursor(), 3u);
}

TEST(LineBuffer, InsertThenDeleteRestores) {
    LineBuffer b;
    type(b, U"hello");
    b.move_cursor(-2);
    std::string before = b.text(); std::size_t pos = b.cursor();
    b.insert(U'Z');
    EXPECT_TRUE(b.delete_before_cursor());
    EXPECT_EQ(b.text(), before);
    EXPECT_EQ(b.cursor(), pos);
}

TEST(LineBuffer, MultiByteInsertDelete) {
    LineBuffer b;
    type(b, U"ab");
    b.move_cursor(-1);
    std::size_t len_before = b.length();
    b.insert(U'\u00e9');
    EXPECT_EQ(b.text(), "a\xc3\xa9" "b");
    EXPECT_EQ(b.length(), 3u);
    EXPECT_EQ(b.text().size(), 4u);
    EXPECT_TRUE(b.delete_before_cursor());
    EXPECT_EQ(b.text(), "ab");
    EXPECT_EQ(b.length(), len_before);
    EXPECT_EQ(b.cursor(), 1u);
}

TEST(LineBuffer, DeleteInsideMultiByteText) {
    LineBuffer b;
    type(b, U"\u20ac\u00e9x");
    b.move_cursor(-1);
    EXPECT_TRUE(b.delete_before_cursor()); // removes é
    EXPECT_EQ(b.text(), "\xe2\x82\xac" "x");
    EXPECT_EQ(b.cursor(), 1u);
    EXPECT_EQ(b.tail_from_cursor(), "x");
}

TEST(LineBuffer, ReplaceAndTake) {
    LineBuffer b;
    type(b, U"draft");
    b.replace("caf\xc3\xa9");
    EXPECT_EQ(b.cursor(), 0u);
    EXPECT_EQ(b.length(), 4u);
    EXPECT_EQ(b.take(), "caf\xc3\xa9");
    EXPECT_TRUE(b.empty());
    EXPECT_EQ(b.cursor(), 0u);
    EXPECT_EQ(b.length(), 0u);
}

TEST(LineBuffer, CursorInvariantUnderRandomEdits) {
    std::mt19937 rng(1234);
    const char32_t alphabet[] = {U'a', U'z', U' ', U'\u00e9', U'\u20ac', U'\U0001F600'};
    LineBuffer b;
    for (int i = 0; i < 2000; ++i) {
        switch (rng() % 4) {
            case 0: b.insert(alphabet[rng() % 6]); break;
            case 1: b.delete_before_cursor(); break;
            case 2: b.move_cursor(-1); break;
            default: b.move_cursor(1); break;
        }
        ASSERT_LE(b.cursor(), b.length());
        ASSERT_EQ(b.length(), utf8::length(b.text()));
    }
}
