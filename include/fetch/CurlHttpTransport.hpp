#pragma once

#include <curl/curl.h>

#include "fetch/HttpTransport.hpp"

namespace feedlib::fetch {

/// libcurl easy-handle transport. One handle per perform(), so a single
/// instance is safe to share between threads.
/// Class abbreviation: cht
class CurlHttpTransport : public IHttpTransport {
 public:
  CurlHttpTransport();
  ~CurlHttpTransport() override = default;

  HttpResult perform(const HttpRequest& hqRequest) override;

  /// Map a libcurl error to a fetch status. bConnected separates connect
  /// timeouts from read timeouts.
  static FeedResponseStatus mapCurlError(CURLcode code, bool bConnected);
};

}  // namespace feedlib::fetch
