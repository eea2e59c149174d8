#include "fetch/FeedResponse.hpp"

#include "fetch/ContentSniffer.hpp"

#include <utility>

namespace feedlib::fetch {

std::string statusName(int iStatus) {
  switch (static_cast<FeedResponseStatus>(iStatus)) {
    case FeedResponseStatus::UnknownError: return "UNKNOWN_ERROR";
    case FeedResponseStatus::ConnectionError: return "CONNECTION_ERROR";
    case FeedResponseStatus::DnsError: return "DNS_ERROR";
    case FeedResponseStatus::PrivateAddressError: return "PRIVATE_ADDRESS_ERROR";
    case FeedResponseStatus::ConnectionTimeout: return "CONNECTION_TIMEOUT";
    case FeedResponseStatus::SslError: return "SSL_ERROR";
    case FeedResponseStatus::ReadTimeout: return "READ_TIMEOUT";
    case FeedResponseStatus::ConnectionReset: return "CONNECTION_RESET";
    case FeedResponseStatus::ProxyError: return "PROXY_ERROR";
    case FeedResponseStatus::RssProxyError: return "RSS_PROXY_ERROR";
    case FeedResponseStatus::ResponseError: return "RESPONSE_ERROR";
    case FeedResponseStatus::TooManyRedirectError: return "TOO_MANY_REDIRECT_ERROR";
    case FeedResponseStatus::ChunkedEncodingError: return "CHUNKED_ENCODING_ERROR";
    case FeedResponseStatus::ContentDecodingError: return "CONTENT_DECODING_ERROR";
    case FeedResponseStatus::ContentTypeNotSupportError: return "CONTENT_TYPE_NOT_SUPPORT_ERROR";
  }
  return "HTTP_" + std::to_string(iStatus);
}

FeedResponse::FeedResponse(int iStatus, std::string sUrl, std::string sContent,
                           std::optional<std::string> oEncoding,
                           std::optional<std::string> oFeedType, ResponseMeta rmMeta)
    : _iStatus(iStatus),
      _sUrl(std::move(sUrl)),
      _sContent(std::move(sContent)),
      _oEncoding(std::move(oEncoding)),
      _oFeedType(std::move(oFeedType)),
      _rmMeta(std::move(rmMeta)) {}

FeedResponse::FeedResponse(FeedResponseStatus eStatus, std::string sUrl, ResponseMeta rmMeta)
    : FeedResponse(static_cast<int>(eStatus), std::move(sUrl), {}, std::nullopt, std::nullopt,
                   std::move(rmMeta)) {}

std::optional<std::string> FeedResponse::mimeType() const {
  if (!_rmMeta.oContentType) {
    return std::nullopt;
  }
  const std::string sMime = ContentSniffer::mimeType(*_rmMeta.oContentType);
  if (sMime.empty()) {
    return std::nullopt;
  }
  return sMime;
}

}  // namespace feedlib::fetch
