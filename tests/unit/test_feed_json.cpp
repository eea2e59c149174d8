#include "parse/FeedJson.hpp"

#include "common/Errors.hpp"

#include <gtest/gtest.h>
#include <nlohmann/json.hpp>

#include <string>

using feedlib::common::ValidationError;
using json = nlohmann::json;
using namespace feedlib::parse;

TEST(FeedJsonTest, ReadsTokenizerOutput) {
  const auto j = json::parse(R"({
    "feed": {"version": "atom10", "title": "Blog", "url": "https://example.com/atom.xml",
             "home_url": null},
    "storys": [
      {"ident": "1", "title": "One", "content": "<p>a</p>", "dt_published": "2020-01-02T03:04:05Z"},
      {"ident": "2"}
    ]
  })");
  const auto rfr = j.get<RawFeedResult>();

  EXPECT_EQ(rfr.rfFeed.oVersion, "atom10");
  EXPECT_FALSE(rfr.rfFeed.oHomeUrl.has_value());
  EXPECT_FALSE(rfr.rfFeed.oIconUrl.has_value());
  ASSERT_EQ(rfr.vStorys.size(), 2u);
  EXPECT_EQ(rfr.vStorys[0].oDtPublished, "2020-01-02T03:04:05Z");
  EXPECT_FALSE(rfr.vStorys[1].oTitle.has_value());
}

TEST(FeedJsonTest, MissingSectionsAreEmpty) {
  const auto rfr = json::object().get<RawFeedResult>();
  EXPECT_FALSE(rfr.rfFeed.oTitle.has_value());
  EXPECT_TRUE(rfr.vStorys.empty());
}

TEST(FeedJsonTest, RejectsWrongTypes) {
  try {
    json::parse(R"({"feed": {"title": 42}})").get<RawFeedResult>();
    FAIL() << "expected ValidationError";
  } catch (const ValidationError& ex) {
    EXPECT_EQ(ex._sField, "title");
    EXPECT_EQ(ex._sErrorCode, "invalid_type");
  }
  EXPECT_THROW(json::parse(R"({"storys": {}})").get<RawFeedResult>(), ValidationError);
  EXPECT_THROW(json::parse(R"({"storys": [1]})").get<RawFeedResult>(), ValidationError);
  EXPECT_THROW(json::array().get<RawFeedResult>(), ValidationError);
}

TEST(FeedJsonTest, WritesParsedResult) {
  RawFeedResult rfr;
  rfr.rfFeed.oTitle = "Blog";
  rfr.rfFeed.oUrl = "https://example.com/feed";
  RawStory rs;
  rs.oIdent = "https://example.com/p/1";
  rs.oTitle = "Post";
  rs.oDtPublished = "Thu, 02 Jan 2020 03:04:05 GMT";
  rfr.vStorys.push_back(rs);

  FeedParser fp;
  const json j = fp.parse(rfr);

  ASSERT_TRUE(j.contains("feed"));
  ASSERT_TRUE(j.contains("storys"));
  EXPECT_EQ(j["feed"]["title"], "Blog");
  EXPECT_TRUE(j["feed"]["home_url"].is_null());
  EXPECT_TRUE(j["feed"]["dt_updated"].is_null());

  ASSERT_EQ(j["storys"].size(), 1u);
  const auto& jStory = j["storys"][0];
  EXPECT_EQ(jStory["ident"], "https://example.com/p/1");
  EXPECT_EQ(jStory["url"], "https://example.com/p/1");
  EXPECT_EQ(jStory["dt_published"], "2020-01-02T03:04:05Z");
  EXPECT_EQ(jStory["has_mathjax"], false);
  EXPECT_TRUE(jStory["content"].is_null());
  EXPECT_EQ(jStory["summary"], "");
}
