#include "common/TextUtils.hpp"

#include <gtest/gtest.h>

using namespace feedlib::common;

TEST(TextUtilsTest, TrimAndLower) {
  EXPECT_EQ(trim("  \t hello \r\n"), "hello");
  EXPECT_EQ(trim(" \n "), "");
  EXPECT_EQ(toLower("Application/RSS+XML"), "application/rss+xml");
}

TEST(TextUtilsTest, CollapseWhitespace) {
  EXPECT_EQ(collapseWhitespace("  a \n\n b\t\tc  "), "a b c");
  EXPECT_EQ(collapseWhitespace(""), "");
}

TEST(TextUtilsTest, Utf8LengthCountsCodePoints) {
  EXPECT_EQ(utf8Length("abc"), 3u);
  EXPECT_EQ(utf8Length("\xE4\xB8\xAD\xE6\x96\x87"), 2u);  // "中文"
}

TEST(TextUtilsTest, Utf8TruncateKeepsWholeCharacters) {
  EXPECT_EQ(utf8Truncate("\xE4\xB8\xAD\xE6\x96\x87", 1), "\xE4\xB8\xAD");
  EXPECT_EQ(utf8Truncate("abc", 5), "abc");
  EXPECT_EQ(utf8Truncate("abc", 0), "");
}

TEST(TextUtilsTest, ShortenAddsPlaceholder) {
  EXPECT_EQ(shorten("123456789", 8), "12345...");
  EXPECT_EQ(shorten("12345678", 8), "12345678");
  EXPECT_EQ(utf8Length(shorten(std::string(500, 'x'), 300)), 300u);
}
