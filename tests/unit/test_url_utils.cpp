#include "common/UrlUtils.hpp"

#include <gtest/gtest.h>

using namespace feedlib::common;

TEST(UrlUtilsTest, ParseUrlSplitsComponents) {
  auto oParts = parseUrl("https://Example.com:8443/feed.xml?x=1");
  ASSERT_TRUE(oParts.has_value());
  EXPECT_EQ(oParts->sScheme, "https");
  EXPECT_EQ(oParts->iPort, 8443);
  EXPECT_EQ(oParts->sPath, "/feed.xml");
}

TEST(UrlUtilsTest, ParseUrlDefaultsPortAndStripsBrackets) {
  auto oParts = parseUrl("http://[::1]/rss");
  ASSERT_TRUE(oParts.has_value());
  EXPECT_EQ(oParts->sHost, "::1");
  EXPECT_EQ(oParts->iPort, 80);
}

TEST(UrlUtilsTest, ParseUrlRejectsRelative) {
  EXPECT_FALSE(parseUrl("/feed.xml").has_value());
}

TEST(UrlUtilsTest, NormalizeResolvesRelativeAgainstBase) {
  EXPECT_EQ(normalizeUrl("../img/a.png", "https://blog.example.com/posts/1/"),
            "https://blog.example.com/posts/img/a.png");
  EXPECT_EQ(normalizeUrl("/about", "https://blog.example.com/posts/1"),
            "https://blog.example.com/about");
}

TEST(UrlUtilsTest, NormalizeProtocolRelativeUsesBaseScheme) {
  EXPECT_EQ(normalizeUrl("//cdn.example.com/a.js", "https://blog.example.com/"),
            "https://cdn.example.com/a.js");
  EXPECT_EQ(normalizeUrl("//cdn.example.com/a.js"), "http://cdn.example.com/a.js");
}

TEST(UrlUtilsTest, NormalizeAddsSchemeWithoutBase) {
  EXPECT_EQ(normalizeUrl("example.com/feed"), "http://example.com/feed");
}

TEST(UrlUtilsTest, NormalizeLeavesForeignSchemes) {
  EXPECT_EQ(normalizeUrl("mailto:someone@example.com", "https://example.com/"),
            "mailto:someone@example.com");
}

TEST(UrlUtilsTest, ValidateUrl) {
  EXPECT_TRUE(validateUrl("https://example.com/feed").has_value());
  EXPECT_FALSE(validateUrl("ftp://example.com/feed").has_value());
  EXPECT_FALSE(validateUrl("not a url").has_value());
  EXPECT_FALSE(validateUrl("").has_value());
  EXPECT_FALSE(validateUrl("https://example.com/" + std::string(kMaxUrlLength, 'a')).has_value());
}

TEST(UrlUtilsTest, PathExtension) {
  EXPECT_EQ(urlPathExtension("https://example.com/feed.XML?x=1"), "xml");
  EXPECT_EQ(urlPathExtension("https://example.com/v1.2/feed"), "");
  EXPECT_EQ(urlPathExtension("https://example.com/"), "");
}
