#pragma once

#include <cstddef>
#include <cstdint>
#include <functional>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "fetch/FeedResponse.hpp"

namespace feedlib::fetch {

/// Response headers keyed by lowercase name. Repeated headers keep the last value.
using HeaderMap = std::map<std::string, std::string>;

/// Called once per transfer with the status, headers and the first body bytes
/// (up to nDecideBytes, or the whole body if shorter). Returning false aborts
/// the transfer.
using BodyGate = std::function<bool(int iStatus, const HeaderMap& mHeaders,
                                    std::string_view svPrefix)>;

/// One HTTP exchange. Redirects are never followed by the transport.
/// Class abbreviation: hq
struct HttpRequest {
  std::string sMethod = "GET";
  std::string sUrl;
  std::vector<std::pair<std::string, std::string>> vHeaders;
  std::string sBody;
  std::string sResolvePin;  // "host:port:address", empty = system resolution
  int iTimeoutSeconds = 30;
  int64_t iMaxBodyBytes = 0;  // 0 = unlimited
  std::size_t nDecideBytes = 4096;
  BodyGate fnAcceptBody;
};

/// Class abbreviation: hr
struct HttpResult {
  int iStatus = 0;
  HeaderMap mHeaders;
  std::string sBody;
  std::optional<FeedResponseStatus> oFailure;  // transport-level failure
  bool bRejected = false;                      // fnAcceptBody returned false

  std::optional<std::string> header(const std::string& sLowerName) const {
    auto it = mHeaders.find(sLowerName);
    if (it == mHeaders.end()) return std::nullopt;
    return it->second;
  }
};

/// Pure abstract interface for the HTTP client used by the fetcher.
class IHttpTransport {
 public:
  virtual ~IHttpTransport() = default;

  /// Never throws for network failures; they are reported in oFailure.
  virtual HttpResult perform(const HttpRequest& hqRequest) = 0;
};

}  // namespace feedlib::fetch
