#include <gtest/gtest.h>
#include <rawline/text/utf8.hpp>

using namespace rawline;

TEST(Utf8, EncodeWidths) {
    EXPECT_EQ(utf8::encode(U'A'), "A");
    EXPECT_EQ(utf8::encode(U'\u00e9'), "\xc3\xa9");
    EXPECT_EQ(utf8::encode(U'\u20ac'), "\xe2\x82\xac");
    EXPECT_EQ(utf8::encode(U'\U0001F600'), "\xf0\x9f\x98\x80");
}

TEST(Utf8, DecodeRejectsOverlongAndOutOfRange) {
    char32_t cp = 0;
    EXPECT_TRUE(utf8::decode("\xe2\x82\xac", cp));
    EXPECT_EQ(cp, U'\u20ac');
    EXPECT_FALSE(utf8::decode("\xe0\x80\xaf", cp)); // overlong '/'
    EXPECT_FALSE(utf8::decode("\xf4\x90\x80\x80", cp)); // > U+10FFFF
    EXPECT_FALSE(utf8::decode("\xc3", cp));
}

TEST(Utf8, LengthAndOffsets) {
    std::string s = "a\xc3\xa9\xe2\x82\xac" "b"; // a é € b
    EXPECT_EQ(utf8::length(s), 4u);
    EXPECT_EQ(utf8::byte_offset(s, 0), 0u);
    EXPECT_EQ(utf8::byte_offset(s, 1), 1u);
    EXPECT_EQ(utf8::byte_offset(s, 2), 3u);
    EXPECT_EQ(utf8::byte_offset(s, 3), 6u);
    EXPECT_EQ(utf8::byte_offset(s, 4), s.size());
}
