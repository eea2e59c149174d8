#pragma once

#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "common/Config.hpp"
#include "fetch/AddressGuard.hpp"
#include "fetch/FeedResponse.hpp"
#include "fetch/HttpTransport.hpp"
#include "fetch/ProxyRelayClient.hpp"

namespace feedlib::fetch {

/// Per-call fetch options.
/// Class abbreviation: fo
struct FetchOptions {
  bool bUseProxy = false;
  bool bAllowPrivateAddress = false;
  bool bAllowNonWebpage = false;
  std::optional<std::string> oProxyUrl;    // overrides FEEDLIB_RSS_PROXY_URL
  std::optional<std::string> oProxyToken;  // overrides FEEDLIB_RSS_PROXY_TOKEN
  std::optional<std::string> oEtag;          // sent as If-None-Match
  std::optional<std::string> oLastModified;  // sent as If-Modified-Since
};

/// Blocking feed fetcher. Holds no per-call mutable state, so one instance
/// may serve concurrent read() calls.
/// Class abbreviation: frd
class FeedReader {
 public:
  static constexpr const char* kUserAgent = "feedlib/1.0 (feed fetcher; compatible; Mozilla/5.0)";
  static constexpr const char* kAccept =
      "application/rss+xml, application/atom+xml, application/feed+json, application/xml;q=0.9, "
      "text/html;q=0.8, */*;q=0.5";

  /// Throws ConfigError if cfg is invalid. Null transport/resolver select
  /// libcurl and getaddrinfo.
  explicit FeedReader(common::Config cfg, std::shared_ptr<IHttpTransport> spTransport = nullptr,
                      std::shared_ptr<IHostResolver> spResolver = nullptr);

  /// Fetch sUrl. Always returns a response; failures are sentinel statuses.
  /// Throws ConfigError only for an inconsistent proxy configuration.
  FeedResponse read(const std::string& sUrl, const FetchOptions& foOptions = {}) const;

  const common::Config& config() const { return _cfg; }

 private:
  FeedResponse readDirect(const std::string& sUrl, const FetchOptions& foOptions) const;
  FeedResponse readViaProxy(const std::string& sUrl, const FetchOptions& foOptions,
                            const std::string& sProxyUrl, const std::string& sToken) const;

  /// Shared tail of both paths: content-type guard, encoding and feed type.
  FeedResponse finish(FeedResponse frRaw, bool bAllowNonWebpage) const;

  std::vector<std::pair<std::string, std::string>> requestHeaders(
      const FetchOptions& foOptions) const;

  common::Config _cfg;
  std::shared_ptr<IHttpTransport> _spTransport;
  AddressGuard _agGuard;
  ProxyRelayClient _prcRelay;
};

}  // namespace feedlib::fetch
