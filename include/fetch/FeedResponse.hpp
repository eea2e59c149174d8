#pragma once

#include <optional>
#include <string>

namespace feedlib::fetch {

/// Sentinel outcomes that are not HTTP status codes.
/// All values are negative so they never collide with upstream codes.
enum class FeedResponseStatus : int {
  UnknownError = -100,
  ConnectionError = -200,
  DnsError = -201,
  PrivateAddressError = -202,
  ConnectionTimeout = -203,
  SslError = -204,
  ReadTimeout = -205,
  ConnectionReset = -206,
  ProxyError = -300,
  RssProxyError = -301,
  ResponseError = -400,
  TooManyRedirectError = -401,
  ChunkedEncodingError = -402,
  ContentDecodingError = -403,
  ContentTypeNotSupportError = -404,
};

/// "PRIVATE_ADDRESS_ERROR" for sentinels, "HTTP_404" for HTTP codes.
std::string statusName(int iStatus);

/// Transport metadata carried alongside the body.
/// Class abbreviation: rm
struct ResponseMeta {
  std::optional<std::string> oEtag;
  std::optional<std::string> oLastModified;
  std::optional<std::string> oContentType;  // raw declared header
  bool bUseProxy = false;
};

/// Normalized outcome of one fetch. Immutable once constructed.
/// content() is the raw body; decoding is left to the caller.
/// Class abbreviation: fr
class FeedResponse {
 public:
  FeedResponse(int iStatus, std::string sUrl, std::string sContent = {},
               std::optional<std::string> oEncoding = std::nullopt,
               std::optional<std::string> oFeedType = std::nullopt, ResponseMeta rmMeta = {});
  FeedResponse(FeedResponseStatus eStatus, std::string sUrl, ResponseMeta rmMeta = {});

  int status() const { return _iStatus; }
  const std::string& url() const { return _sUrl; }
  const std::string& content() const { return _sContent; }
  const std::optional<std::string>& encoding() const { return _oEncoding; }
  const std::optional<std::string>& feedType() const { return _oFeedType; }
  const std::optional<std::string>& etag() const { return _rmMeta.oEtag; }
  const std::optional<std::string>& lastModified() const { return _rmMeta.oLastModified; }
  const std::optional<std::string>& contentType() const { return _rmMeta.oContentType; }
  const ResponseMeta& meta() const { return _rmMeta; }
  bool useProxy() const { return _rmMeta.bUseProxy; }

  /// Media type without parameters, lowercased ("application/rss+xml").
  std::optional<std::string> mimeType() const;

  /// True for 2xx upstream statuses.
  bool ok() const { return _iStatus >= 200 && _iStatus < 300; }

  bool is(FeedResponseStatus eStatus) const { return _iStatus == static_cast<int>(eStatus); }

 private:
  int _iStatus;
  std::string _sUrl;
  std::string _sContent;
  std::optional<std::string> _oEncoding;
  std::optional<std::string> _oFeedType;
  ResponseMeta _rmMeta;
};

}  // namespace feedlib::fetch
