#include "fetch/ProxyRelayClient.hpp"

#include "common/Logger.hpp"
#include "common/TextUtils.hpp"

#include <nlohmann/json.hpp>

#include <cctype>

namespace feedlib::fetch {

namespace {

std::optional<int> parseRelayStatus(const std::string& sValue) {
  const std::string sTrimmed = common::trim(sValue);
  if (sTrimmed.empty() || sTrimmed.size() > 4) {
    return std::nullopt;
  }
  for (char c : sTrimmed) {
    if (!std::isdigit(static_cast<unsigned char>(c))) {
      return std::nullopt;
    }
  }
  return std::stoi(sTrimmed);
}

}  // namespace

ProxyRelayClient::ProxyRelayClient(std::shared_ptr<IHttpTransport> spTransport,
                                   int iTimeoutSeconds, int64_t iMaxBodyBytes)
    : _spTransport(std::move(spTransport)),
      _iTimeoutSeconds(iTimeoutSeconds),
      _iMaxBodyBytes(iMaxBodyBytes) {}

std::string ProxyRelayClient::buildRequestBody(
    const std::string& sUrl, const std::vector<std::pair<std::string, std::string>>& vHeaders,
    const std::string& sToken) {
  nlohmann::json jHeaders = nlohmann::json::object();
  for (const auto& [sName, sValue] : vHeaders) {
    jHeaders[sName] = sValue;
  }
  nlohmann::json jBody = {
      {"token", sToken},
      {"method", "GET"},
      {"url", sUrl},
      {"headers", jHeaders},
  };
  // URLs and header values are not guaranteed to be UTF-8
  return jBody.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
}

FeedResponse ProxyRelayClient::relay(
    const std::string& sUrl, const std::vector<std::pair<std::string, std::string>>& vHeaders,
    const std::string& sToken, const std::string& sProxyUrl) const {
  auto spLog = common::Logger::get();

  HttpRequest hqRequest;
  hqRequest.sMethod = "POST";
  hqRequest.sUrl = sProxyUrl;
  hqRequest.vHeaders = {{"Content-Type", "application/json"}};
  hqRequest.sBody = buildRequestBody(sUrl, vHeaders, sToken);
  // Relay round trip includes the upstream fetch.
  hqRequest.iTimeoutSeconds = _iTimeoutSeconds * 2;
  hqRequest.iMaxBodyBytes = _iMaxBodyBytes;

  const HttpResult hr = _spTransport->perform(hqRequest);

  ResponseMeta rmMeta;
  rmMeta.bUseProxy = true;

  if (hr.oFailure == FeedResponseStatus::ResponseError) {
    return FeedResponse(FeedResponseStatus::ResponseError, sUrl, rmMeta);
  }
  if (hr.oFailure) {
    spLog->warn("RSS proxy request for {} failed: {}", sUrl,
                statusName(static_cast<int>(*hr.oFailure)));
    return FeedResponse(FeedResponseStatus::RssProxyError, sUrl, rmMeta);
  }
  if (hr.iStatus != 200) {
    spLog->warn("RSS proxy returned HTTP {} for {}", hr.iStatus, sUrl);
    return FeedResponse(FeedResponseStatus::RssProxyError, sUrl, rmMeta);
  }

  const auto oStatusHeader = hr.header(kStatusHeader);
  if (!oStatusHeader) {
    spLog->warn("RSS proxy response for {} has no {} header", sUrl, kStatusHeader);
    return FeedResponse(FeedResponseStatus::RssProxyError, sUrl, rmMeta);
  }
  if (common::trim(*oStatusHeader) == "ERROR") {
    spLog->warn("RSS proxy failed to fetch {}: {}", sUrl, common::shorten(hr.sBody, 200));
    return FeedResponse(FeedResponseStatus::RssProxyError, sUrl, rmMeta);
  }
  const auto oStatus = parseRelayStatus(*oStatusHeader);
  if (!oStatus) {
    spLog->warn("RSS proxy sent invalid status '{}' for {}", *oStatusHeader, sUrl);
    return FeedResponse(FeedResponseStatus::RssProxyError, sUrl, rmMeta);
  }

  rmMeta.oContentType = hr.header("content-type");
  rmMeta.oEtag = hr.header("etag");
  rmMeta.oLastModified = hr.header("last-modified");
  return FeedResponse(*oStatus, sUrl, hr.sBody, std::nullopt, std::nullopt, rmMeta);
}

}  // namespace feedlib::fetch
