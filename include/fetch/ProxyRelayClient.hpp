#pragma once

#include <cstdint>
#include <memory>
#include <string>
#include <utility>
#include <vector>

#include "fetch/FeedResponse.hpp"
#include "fetch/HttpTransport.hpp"

namespace feedlib::fetch {

/// Client for the trusted fetch relay.
///
/// Request: POST <proxy_url> with JSON {"token", "method": "GET", "url", "headers"}.
/// Response: the relay's body is the upstream body; the upstream status is in
/// the x-rss-proxy-status header, or the literal "ERROR" when the relay could
/// not fetch the target.
/// Class abbreviation: prc
class ProxyRelayClient {
 public:
  static constexpr const char* kStatusHeader = "x-rss-proxy-status";

  ProxyRelayClient(std::shared_ptr<IHttpTransport> spTransport, int iTimeoutSeconds,
                   int64_t iMaxBodyBytes);

  /// Any relay failure (transport error, non-200 relay status, missing or
  /// invalid status header, "ERROR") yields RSS_PROXY_ERROR with empty content.
  /// The returned response carries the relay's Content-Type/ETag/Last-Modified
  /// and useProxy() == true.
  FeedResponse relay(const std::string& sUrl,
                     const std::vector<std::pair<std::string, std::string>>& vHeaders,
                     const std::string& sToken, const std::string& sProxyUrl) const;

  /// JSON body sent to the relay.
  static std::string buildRequestBody(
      const std::string& sUrl, const std::vector<std::pair<std::string, std::string>>& vHeaders,
      const std::string& sToken);

 private:
  std::shared_ptr<IHttpTransport> _spTransport;
  int _iTimeoutSeconds;
  int64_t _iMaxBodyBytes;
};

}  // namespace feedlib::fetch
