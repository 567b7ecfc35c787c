#include <gtest/gtest.h>
#include "core/text_utils.hpp"

static const std::string REPLACEMENT = "\xEF\xBF\xBD";

TEST(TextUtilsTest, ValidUtf8IsUnchanged)
{
    std::string text = "plain ascii, caf\xC3\xA9, \xE2\x82\xAC, \xF0\x9F\x98\x80";
    EXPECT_EQ(TextUtils::sanitizeUtf8(text), text);
}

TEST(TextUtilsTest, InvalidBytesAreReplaced)
{
    EXPECT_EQ(TextUtils::sanitizeUtf8("a\xFF" "b"), "a" + REPLACEMENT + "b");
    // Lone continuation byte
    EXPECT_EQ(TextUtils::sanitizeUtf8("\x80"), REPLACEMENT);
}

TEST(TextUtilsTest, TruncatedSequenceIsReplaced)
{
    std::string out = TextUtils::sanitizeUtf8("x\xE2\x82");
    EXPECT_EQ(out.substr(0, 1), "x");
    EXPECT_NE(out.find(REPLACEMENT), std::string::npos);
    EXPECT_EQ(out.find('\x82'), std::string::npos);
}

TEST(TextUtilsTest, OverlongAndSurrogatesAreRejected)
{
    // Overlong encoding of '/'
    EXPECT_EQ(TextUtils::sanitizeUtf8("\xC0\xAF").find('/'), std::string::npos);
    EXPECT_NE(TextUtils::sanitizeUtf8("\xC0\xAF").find(REPLACEMENT), std::string::npos);
    // U+D800
    EXPECT_NE(TextUtils::sanitizeUtf8("\xED\xA0\x80").find(REPLACEMENT), std::string::npos);
}

TEST(TextUtilsTest, SplitLinesHandlesAllTerminators)
{
    auto lines = TextUtils::splitLines("a\nb\r\nc\rd");
    ASSERT_EQ(lines.size(), 4u);
    EXPECT_EQ(lines[0], "a");
    EXPECT_EQ(lines[1], "b");
    EXPECT_EQ(lines[2], "c");
    EXPECT_EQ(lines[3], "d");
}

TEST(TextUtilsTest, SplitLinesDropsTrailingTerminator)
{
    auto lines = TextUtils::splitLines("one\r\ntwo\r\n");
    ASSERT_EQ(lines.size(), 2u);
    EXPECT_EQ(lines[1], "two");
    EXPECT_TRUE(TextUtils::splitLines("").empty());
}

TEST(TextUtilsTest, SplitLinesKeepsInnerEmptyLines)
{
    auto lines = TextUtils::splitLines("a\n\nb");
    ASSERT_EQ(lines.size(), 3u);
    EXPECT_EQ(lines[1], "");
}
