#include "fetch/EncodingDetector.hpp"

#include <gtest/gtest.h>

#include <string>

using feedlib::fetch::EncodingDetector;

TEST(EncodingDetectorTest, CharsetFromContentType) {
  EXPECT_EQ(EncodingDetector::charsetFromContentType("text/xml; charset=UTF-8"), "utf-8");
  EXPECT_EQ(EncodingDetector::charsetFromContentType("application/atom+xml; charset='GB2312'"),
            "gb2312");
  EXPECT_EQ(EncodingDetector::charsetFromContentType("text/html;Charset=\"utf8\""), "utf-8");
  EXPECT_EQ(EncodingDetector::charsetFromContentType("text/html; q=1; charset=latin1"),
            "iso-8859-1");
  EXPECT_FALSE(EncodingDetector::charsetFromContentType("text/html").has_value());
  EXPECT_FALSE(EncodingDetector::charsetFromContentType("text/html; charset=").has_value());
}

TEST(EncodingDetectorTest, NormalizeCharsetAliases) {
  EXPECT_EQ(EncodingDetector::normalizeCharset(" 'UTF8' "), "utf-8");
  EXPECT_EQ(EncodingDetector::normalizeCharset("Latin-1"), "iso-8859-1");
  EXPECT_EQ(EncodingDetector::normalizeCharset("cp1252"), "windows-1252");
  EXPECT_EQ(EncodingDetector::normalizeCharset("GBK"), "gbk");
}

TEST(EncodingDetectorTest, DeclaredCharsetRoundTrip) {
  const std::string sAscii = "<rss><channel><title>hello</title></channel></rss>";
  for (const char* pCharset : {"utf-8", "us-ascii", "iso-8859-1", "gbk", "windows-1252"}) {
    EXPECT_EQ(EncodingDetector::detect(std::string(pCharset), sAscii), pCharset);
  }
}

TEST(EncodingDetectorTest, DeclaredCharsetRejectedWhenContentDisagrees) {
  // "中文" encoded as GBK is not valid UTF-8.
  const std::string sGbk = "<p>\xD6\xD0\xCE\xC4</p>";
  EXPECT_NE(EncodingDetector::detect(std::string("utf-8"), sGbk), "utf-8");
}

TEST(EncodingDetectorTest, DefaultsToUtf8ForValidUtf8) {
  EXPECT_EQ(EncodingDetector::detect(std::nullopt, "plain ascii"), "utf-8");
  EXPECT_EQ(EncodingDetector::detect(std::nullopt, "\xE4\xB8\xAD\xE6\x96\x87"), "utf-8");
  EXPECT_EQ(EncodingDetector::detect(std::nullopt, ""), "utf-8");
}

TEST(EncodingDetectorTest, UnknownDeclaredCharsetFallsBack) {
  EXPECT_EQ(EncodingDetector::detect(std::string("x-no-such-charset"), "hello"), "utf-8");
}

TEST(EncodingDetectorTest, HonoursByteOrderMark) {
  const std::string sUtf16 = std::string("\xFF\xFE", 2) + std::string("<\0r\0s\0s\0", 8);
  EXPECT_EQ(EncodingDetector::detect(std::nullopt, sUtf16), "utf-16le");
}

TEST(EncodingDetectorTest, UsesXmlDeclaration) {
  const std::string sDoc =
      "<?xml version=\"1.0\" encoding=\"GB2312\"?><rss><title>\xD6\xD0\xCE\xC4</title></rss>";
  EXPECT_EQ(EncodingDetector::detect(std::nullopt, sDoc), "gb2312");
}

TEST(EncodingDetectorTest, UsesMetaCharset) {
  const std::string sDoc =
      "<html><head><meta charset=\"windows-1252\"></head><body>caf\xE9</body></html>";
  EXPECT_EQ(EncodingDetector::detect(std::nullopt, sDoc), "windows-1252");
}

TEST(EncodingDetectorTest, TruncatedMultibyteAcceptedOnlyWhenTruncated) {
  const std::string sCut = "abc\xE4\xB8";  // first two bytes of "中"
  EXPECT_TRUE(EncodingDetector::decodesCleanly("utf-8", sCut, true));
  EXPECT_FALSE(EncodingDetector::decodesCleanly("utf-8", sCut, false));
}

TEST(EncodingDetectorTest, NeverReturnsEmpty) {
  std::string sBinary;
  for (int i = 0; i < 256; ++i) sBinary += static_cast<char>(i);
  EXPECT_FALSE(EncodingDetector::detect(std::nullopt, sBinary).empty());
}
