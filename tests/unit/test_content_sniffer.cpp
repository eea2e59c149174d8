#include "fetch/ContentSniffer.hpp"

#include <gtest/gtest.h>

#include <optional>
#include <string>

using namespace feedlib::fetch;

namespace {

constexpr const char* kRss = "<?xml version=\"1.0\"?><rss version=\"2.0\"><channel/></rss>";

}  // namespace

TEST(ContentSnifferTest, SupportedDeclaredTypes) {
  for (const char* pType :
       {"text/html", "text/plain", "application/xml", "application/json", "text/xml",
        "application/rss+xml", "application/atom+xml; charset=utf-8", "application/rdf+xml",
        "application/feed+json", "application/xhtml+xml", "TEXT/HTML"}) {
    EXPECT_TRUE(ContentSniffer::classify(std::string(pType), kRss).bSupported) << pType;
  }
}

TEST(ContentSnifferTest, UnsupportedDeclaredTypesIgnoreBody) {
  for (const char* pType : {"image/png", "text/csv", "application/pdf", "audio/mpeg",
                            "video/mp4", "font/woff2", "application/zip"}) {
    const auto sr = ContentSniffer::classify(std::string(pType), kRss);
    EXPECT_FALSE(sr.bSupported) << pType;
    EXPECT_FALSE(sr.oFeedType.has_value()) << pType;
  }
}

TEST(ContentSnifferTest, FamilyFromStructuralMarkers) {
  EXPECT_EQ(ContentSniffer::sniffFeedType(kRss), FeedType::Rss);
  EXPECT_EQ(ContentSniffer::sniffFeedType("\xEF\xBB\xBF  <feed xmlns=\"http://www.w3.org/2005/Atom\">"),
            FeedType::Atom);
  EXPECT_EQ(ContentSniffer::sniffFeedType("<rdf:RDF xmlns:rdf=\"x\">"), FeedType::Rss);
  EXPECT_EQ(ContentSniffer::sniffFeedType("<!DOCTYPE html><html>"), FeedType::Html);
  EXPECT_EQ(ContentSniffer::sniffFeedType("\n{\"version\": \"https://jsonfeed.org/version/1\"}"),
            FeedType::Json);
  EXPECT_EQ(ContentSniffer::sniffFeedType("<?xml version=\"1.0\"?><opml/>"), FeedType::Xml);
  EXPECT_FALSE(ContentSniffer::sniffFeedType("hello world").has_value());
  EXPECT_FALSE(ContentSniffer::sniffFeedType("   ").has_value());
}

TEST(ContentSnifferTest, DeclaredTypeUsesSniffedFamily) {
  const auto sr = ContentSniffer::classify(std::string("text/html"), kRss);
  ASSERT_TRUE(sr.oFeedType.has_value());
  EXPECT_EQ(*sr.oFeedType, FeedType::Rss);

  const auto srPlain = ContentSniffer::classify(std::string("application/atom+xml"), "garbage");
  ASSERT_TRUE(srPlain.oFeedType.has_value());
  EXPECT_EQ(*srPlain.oFeedType, FeedType::Atom);
}

TEST(ContentSnifferTest, OctetStreamSniffsBody) {
  EXPECT_TRUE(ContentSniffer::classify(std::string("application/octet-stream"), kRss).bSupported);
  EXPECT_FALSE(
      ContentSniffer::classify(std::string("application/octet-stream"), "\x89PNG\r\n").bSupported);
}

TEST(ContentSnifferTest, OctetStreamAcceptedByUrlExtension) {
  const auto sr = ContentSniffer::classify(std::string("application/octet-stream"), "binary?",
                                           "https://example.com/feed.xml");
  EXPECT_TRUE(sr.bSupported);
  EXPECT_EQ(sr.oFeedType, FeedType::Unknown);
}

TEST(ContentSnifferTest, MissingTypeAcceptsText) {
  EXPECT_TRUE(ContentSniffer::classify(std::nullopt, "just some text").bSupported);
  EXPECT_FALSE(ContentSniffer::classify(std::nullopt, std::string("\x00\x01\x02", 3)).bSupported);
  EXPECT_FALSE(ContentSniffer::classify(std::nullopt, "").bSupported);
}

TEST(ContentSnifferTest, MimeTypeStripsParameters) {
  EXPECT_EQ(ContentSniffer::mimeType("Application/RSS+XML; charset=utf-8"), "application/rss+xml");
  EXPECT_EQ(feedTypeName(FeedType::Json), "json");
}
