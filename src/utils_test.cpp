#include <gtest/gtest.h>

#include "utils.hpp"

TEST(Utils, CanCountCodePoints)
{
    EXPECT_EQ(utf8Length(""), 0u);
    EXPECT_EQ(utf8Length("abc"), 3u);
    // é, 中, and an emoji take 2, 3, and 4 bytes.
    EXPECT_EQ(utf8Length("\xc3\xa9"), 1u);
    EXPECT_EQ(utf8Length("\xe4\xb8\xad"), 1u);
    EXPECT_EQ(utf8Length("\xf0\x9f\x98\x80"), 1u);
    EXPECT_EQ(utf8Length("a\xc3\xa9\xe4\xb8\xad\xf0\x9f\x98\x80"), 4u);
}

TEST(Utils, RejectsInvalidUTF8)
{
    // Lone continuation byte
    EXPECT_FALSE(utf8Length("\x80").has_value());
    // Truncated sequence
    EXPECT_FALSE(utf8Length("\xe4\xb8").has_value());
    // Overlong encoding of “/”
    EXPECT_FALSE(utf8Length("\xc0\xaf").has_value());
    // UTF-16 surrogate
    EXPECT_FALSE(utf8Length("\xed\xa0\x80").has_value());
    // Beyond U+10FFFF
    EXPECT_FALSE(utf8Length("\xf4\x90\x80\x80").has_value());
}

TEST(Utils, CanTakeCodePointPrefix)
{
    EXPECT_EQ(utf8Prefix("abcdef", 3), "abc");
    EXPECT_EQ(utf8Prefix("ab", 3), "ab");
    EXPECT_EQ(utf8Prefix("\xc3\xa9\xc3\xa9\xc3\xa9", 2), "\xc3\xa9\xc3\xa9");
    EXPECT_EQ(utf8Prefix("abc", 0), "");
}

TEST(Utils, CanEncodeHex)
{
    Bytes bytes = {0x00, 0x0f, 0xab, 0xff};
    EXPECT_EQ(hexEncode(bytes), "000fabff");
    EXPECT_EQ(hexEncode(std::string_view("AB")), "4142");
    EXPECT_EQ(hexEncode(Bytes()), "");
}

TEST(Utils, CanDecodeHex)
{
    auto bytes = hexDecode("000fABff");
    ASSERT_TRUE(bytes.has_value());
    EXPECT_EQ(*bytes, (Bytes{0x00, 0x0f, 0xab, 0xff}));
    EXPECT_EQ(hexDecode(""), Bytes());
    EXPECT_FALSE(hexDecode("abc").has_value());
    EXPECT_FALSE(hexDecode("zz").has_value());
}
