#include "fetch/AsyncFeedReader.hpp"
#include "fetch/FeedReader.hpp"

#include "common/Config.hpp"
#include "support/LocalHttpServer.hpp"

#include <gtest/gtest.h>

#include <future>
#include <memory>
#include <optional>
#include <string>
#include <vector>

using namespace feedlib::fetch;
using feedlib::common::Config;
using feedlib::test::LocalHttpServer;
using feedlib::test::ServerRequest;
using feedlib::test::ServerResponse;

namespace {

const std::string kRssBody =
    "<?xml version=\"1.0\" encoding=\"utf-8\"?>"
    "<rss version=\"2.0\"><channel><title>Test</title>"
    "<item><title>One</title><link>https://example.com/1</link></item>"
    "</channel></rss>";

const std::vector<int> kStatuses = {200, 201, 301, 302, 400, 403, 404, 500, 502, 600};

Config testConfig() {
  Config cfg;
  cfg.iRequestTimeoutSeconds = 5;
  cfg.iMaxRedirects = 3;
  cfg.iThreadPoolSize = 4;
  return cfg;
}

ServerResponse fixed(int iStatus, const std::string& sContentType, const std::string& sBody) {
  ServerResponse resp;
  resp.iStatus = iStatus;
  resp.vHeaders = {{"Content-Type", sContentType}};
  resp.sBody = sBody;
  return resp;
}

FetchOptions allowLocal() {
  FetchOptions fo;
  fo.bAllowPrivateAddress = true;
  return fo;
}

}  // namespace

class FeedReaderTest : public ::testing::Test {
 protected:
  void SetUp() override {
    for (int iStatus : kStatuses) {
      _lhs.route("/status/" + std::to_string(iStatus), [iStatus](const ServerRequest&) {
        return fixed(iStatus, "application/rss+xml; charset=utf-8", kRssBody);
      });
    }
    _lhs.route("/image", [](const ServerRequest&) {
      return fixed(200, "image/png", std::string("\x89PNG\r\n\x1a\n", 8) + std::string(64, '\0'));
    });
    _lhs.route("/csv", [](const ServerRequest&) { return fixed(200, "text/csv", "a,b,c\n1,2,3\n"); });
    _lhs.route("/redirect", [](const ServerRequest&) {
      ServerResponse resp;
      resp.iStatus = 302;
      resp.vHeaders = {{"Location", "/status/200"}};
      return resp;
    });
    _lhs.route("/loop", [](const ServerRequest&) {
      ServerResponse resp;
      resp.iStatus = 301;
      resp.vHeaders = {{"Location", "/loop"}};
      return resp;
    });
    _lhs.route("/big", [](const ServerRequest&) {
      return fixed(200, "text/html", "<html>" + std::string(64 * 1024, 'x') + "</html>");
    });
    _lhs.route("/cache", [](const ServerRequest&) {
      ServerResponse resp = fixed(200, "application/atom+xml", "<feed></feed>");
      resp.vHeaders.emplace_back("ETag", "\"v2\"");
      resp.vHeaders.emplace_back("Last-Modified", "Thu, 02 Jan 2020 03:04:05 GMT");
      return resp;
    });
  }

  LocalHttpServer _lhs;
};

TEST_F(FeedReaderTest, ReturnsUpstreamStatusesSync) {
  FeedReader frd(testConfig());
  for (int iStatus : kStatuses) {
    const std::string sUrl = _lhs.url("/status/" + std::to_string(iStatus));
    const FeedResponse fr = frd.read(sUrl, allowLocal());
    EXPECT_EQ(fr.status(), iStatus) << statusName(fr.status());
    EXPECT_EQ(fr.url(), sUrl);
    EXPECT_EQ(fr.content(), kRssBody) << iStatus;
    EXPECT_EQ(fr.encoding(), "utf-8") << iStatus;
    EXPECT_EQ(fr.contentType(), "application/rss+xml; charset=utf-8");
    EXPECT_FALSE(fr.useProxy());
    if (fr.ok()) {
      EXPECT_EQ(fr.feedType(), "rss");
    } else {
      EXPECT_FALSE(fr.feedType().has_value()) << iStatus;
    }
  }
}

TEST_F(FeedReaderTest, ReturnsUpstreamStatusesAsync) {
  AsyncFeedReader afr(testConfig());
  std::vector<std::future<FeedResponse>> vFutures;
  for (int iStatus : kStatuses) {
    vFutures.push_back(afr.read(_lhs.url("/status/" + std::to_string(iStatus)), allowLocal()));
  }
  for (size_t i = 0; i < kStatuses.size(); ++i) {
    const FeedResponse fr = vFutures[i].get();
    EXPECT_EQ(fr.status(), kStatuses[i]);
    EXPECT_EQ(fr.content(), kRssBody);
  }
  afr.shutdown();
}

TEST_F(FeedReaderTest, RejectsNonWebpageContent) {
  FeedReader frd(testConfig());
  for (const char* pPath : {"/image", "/csv"}) {
    const FeedResponse fr = frd.read(_lhs.url(pPath), allowLocal());
    EXPECT_TRUE(fr.is(FeedResponseStatus::ContentTypeNotSupportError)) << pPath;
    EXPECT_TRUE(fr.content().empty()) << pPath;
  }
}

TEST_F(FeedReaderTest, AllowNonWebpageKeepsBody) {
  FeedReader frd(testConfig());
  FetchOptions fo = allowLocal();
  fo.bAllowNonWebpage = true;
  const FeedResponse fr = frd.read(_lhs.url("/csv"), fo);
  EXPECT_EQ(fr.status(), 200);
  EXPECT_EQ(fr.content(), "a,b,c\n1,2,3\n");
}

TEST_F(FeedReaderTest, PrivateAddressRefusedBeforeConnecting) {
  FeedReader frd(testConfig());
  const FeedResponse fr = frd.read(_lhs.url("/status/200"));
  EXPECT_TRUE(fr.is(FeedResponseStatus::PrivateAddressError)) << statusName(fr.status());
  EXPECT_EQ(statusName(fr.status()), "PRIVATE_ADDRESS_ERROR");
  EXPECT_TRUE(fr.content().empty());
  EXPECT_EQ(_lhs.requestCount(), 0);
}

TEST_F(FeedReaderTest, PrivateAddressRefusedAsync) {
  AsyncFeedReader afr(testConfig());
  const FeedResponse fr = afr.read(_lhs.url("/status/200")).get();
  EXPECT_TRUE(fr.is(FeedResponseStatus::PrivateAddressError));
  EXPECT_EQ(_lhs.requestCount(), 0);
}

TEST_F(FeedReaderTest, FollowsRedirects) {
  FeedReader frd(testConfig());
  const FeedResponse fr = frd.read(_lhs.url("/redirect"), allowLocal());
  EXPECT_EQ(fr.status(), 200);
  EXPECT_EQ(fr.url(), _lhs.url("/status/200"));
  EXPECT_EQ(fr.content(), kRssBody);
}

TEST_F(FeedReaderTest, RedirectLoopStops) {
  FeedReader frd(testConfig());
  const FeedResponse fr = frd.read(_lhs.url("/loop"), allowLocal());
  EXPECT_TRUE(fr.is(FeedResponseStatus::TooManyRedirectError)) << statusName(fr.status());
  EXPECT_EQ(_lhs.requestCount(), 4);
}

TEST_F(FeedReaderTest, OversizedBodyIsResponseError) {
  Config cfg = testConfig();
  cfg.iMaxContentLength = 1024;
  FeedReader frd(cfg);
  const FeedResponse fr = frd.read(_lhs.url("/big"), allowLocal());
  EXPECT_TRUE(fr.is(FeedResponseStatus::ResponseError)) << statusName(fr.status());
  EXPECT_TRUE(fr.content().empty());
}

TEST_F(FeedReaderTest, SendsConditionalHeadersAndKeepsValidators) {
  FeedReader frd(testConfig());
  FetchOptions fo = allowLocal();
  fo.oEtag = "\"v1\"";
  fo.oLastModified = "Wed, 01 Jan 2020 00:00:00 GMT";
  const FeedResponse fr = frd.read(_lhs.url("/cache"), fo);

  EXPECT_EQ(fr.status(), 200);
  EXPECT_EQ(fr.feedType(), "atom");
  EXPECT_EQ(fr.etag(), "\"v2\"");
  EXPECT_EQ(fr.lastModified(), "Thu, 02 Jan 2020 03:04:05 GMT");

  const auto vRequests = _lhs.requests();
  ASSERT_EQ(vRequests.size(), 1u);
  const auto& mHeaders = vRequests[0].mHeaders;
  EXPECT_EQ(mHeaders.at("if-none-match"), "\"v1\"");
  EXPECT_EQ(mHeaders.at("if-modified-since"), "Wed, 01 Jan 2020 00:00:00 GMT");
  EXPECT_EQ(mHeaders.at("user-agent"), FeedReader::kUserAgent);
}

TEST_F(FeedReaderTest, InvalidUrlIsUnknownError) {
  FeedReader frd(testConfig());
  EXPECT_TRUE(frd.read("ftp://example.com/feed").is(FeedResponseStatus::UnknownError));
  EXPECT_TRUE(frd.read("not a url").is(FeedResponseStatus::UnknownError));
}

TEST_F(FeedReaderTest, ProxyRequestedWithoutRelayReadsDirectly) {
  FeedReader frd(testConfig());
  FetchOptions fo = allowLocal();
  fo.bUseProxy = true;
  const FeedResponse fr = frd.read(_lhs.url("/status/200"), fo);
  EXPECT_EQ(fr.status(), 200);
  EXPECT_FALSE(fr.useProxy());
}

TEST(FeedReaderConnectTest, RefusedConnectionIsConnectionError) {
  std::string sUrl;
  {
    LocalHttpServer lhsClosed;
    sUrl = lhsClosed.url("/feed");
  }
  FeedReader frd(testConfig());
  const FeedResponse fr = frd.read(sUrl, allowLocal());
  EXPECT_TRUE(fr.is(FeedResponseStatus::ConnectionError)) << statusName(fr.status());
}

// ── Encoding ───────────────────────────────────────────────────────────────

class FeedReaderEncodingTest : public ::testing::Test {
 protected:
  LocalHttpServer _lhs;

  std::optional<std::string> encodingFor(const std::string& sContentType,
                                         const std::string& sBody) {
    _lhs.route("/doc", [sContentType, sBody](const ServerRequest&) {
      return fixed(200, sContentType, sBody);
    });
    FeedReader frd(testConfig());
    return frd.read(_lhs.url("/doc"), allowLocal()).encoding();
  }
};

TEST_F(FeedReaderEncodingTest, DeclaredCharsetWins) {
  EXPECT_EQ(encodingFor("text/html; charset=gbk", "<html>hello</html>"), "gbk");
  EXPECT_EQ(encodingFor("text/html; charset=ISO-8859-1", "<html>hello</html>"), "iso-8859-1");
}

TEST_F(FeedReaderEncodingTest, DocumentDeclarationUsedWithoutHeaderCharset) {
  const std::string sBody =
      "<?xml version=\"1.0\" encoding=\"GB2312\"?><rss><title>\xD6\xD0\xCE\xC4</title></rss>";
  EXPECT_EQ(encodingFor("application/xml", sBody), "gb2312");
}

TEST_F(FeedReaderEncodingTest, WrongDeclaredCharsetIsCorrected) {
  const std::string sBody = "<html><p>\xD6\xD0\xCE\xC4\xD6\xD0\xCE\xC4</p></html>";
  const auto oEncoding = encodingFor("text/html; charset=utf-8", sBody);
  ASSERT_TRUE(oEncoding.has_value());
  EXPECT_NE(*oEncoding, "utf-8");
}

TEST_F(FeedReaderEncodingTest, EmptyBodyHasNoEncoding) {
  _lhs.route("/empty", [](const ServerRequest&) { return fixed(404, "text/html", ""); });
  FeedReader frd(testConfig());
  const FeedResponse fr = frd.read(_lhs.url("/empty"), allowLocal());
  EXPECT_EQ(fr.status(), 404);
  EXPECT_FALSE(fr.encoding().has_value());
}
