#include "fetch/FeedReader.hpp"

#include "common/Errors.hpp"
#include "common/Logger.hpp"
#include "common/UrlUtils.hpp"
#include "fetch/ContentSniffer.hpp"
#include "fetch/CurlHttpTransport.hpp"
#include "fetch/EncodingDetector.hpp"

namespace feedlib::fetch {

namespace {

bool isSuccess(int iStatus) { return iStatus >= 200 && iStatus < 300; }

bool isRedirect(int iStatus) {
  return iStatus == 301 || iStatus == 302 || iStatus == 303 || iStatus == 307 ||
         iStatus == 308;
}

std::shared_ptr<IHttpTransport> orDefault(std::shared_ptr<IHttpTransport> spTransport) {
  return spTransport ? std::move(spTransport) : std::make_shared<CurlHttpTransport>();
}

std::shared_ptr<IHostResolver> orDefault(std::shared_ptr<IHostResolver> spResolver) {
  return spResolver ? std::move(spResolver) : std::make_shared<SystemHostResolver>();
}

}  // namespace

FeedReader::FeedReader(common::Config cfg, std::shared_ptr<IHttpTransport> spTransport,
                       std::shared_ptr<IHostResolver> spResolver)
    : _cfg(std::move(cfg)),
      _spTransport(orDefault(std::move(spTransport))),
      _agGuard(orDefault(std::move(spResolver))),
      _prcRelay(_spTransport, _cfg.iRequestTimeoutSeconds, _cfg.iMaxContentLength) {
  _cfg.validate();
}

std::vector<std::pair<std::string, std::string>> FeedReader::requestHeaders(
    const FetchOptions& foOptions) const {
  std::vector<std::pair<std::string, std::string>> vHeaders = {
      {"User-Agent", kUserAgent},
      {"Accept", kAccept},
  };
  if (foOptions.oEtag) {
    vHeaders.emplace_back("If-None-Match", *foOptions.oEtag);
  }
  if (foOptions.oLastModified) {
    vHeaders.emplace_back("If-Modified-Since", *foOptions.oLastModified);
  }
  return vHeaders;
}

FeedResponse FeedReader::read(const std::string& sUrl, const FetchOptions& foOptions) const {
  if (foOptions.bUseProxy) {
    const auto oProxyUrl = foOptions.oProxyUrl ? foOptions.oProxyUrl : _cfg.oRssProxyUrl;
    const auto oToken = foOptions.oProxyToken ? foOptions.oProxyToken : _cfg.oRssProxyToken;
    if (oProxyUrl) {
      if (!common::validateUrl(*oProxyUrl)) {
        throw common::ConfigError("invalid_proxy_url", "RSS proxy URL is not a valid http(s) URL");
      }
      if (!oToken || oToken->empty()) {
        throw common::ConfigError("missing_proxy_token", "RSS proxy URL set without a token");
      }
      return readViaProxy(sUrl, foOptions, *oProxyUrl, *oToken);
    }
    common::Logger::get()->debug("use_proxy requested for {} but no RSS proxy configured", sUrl);
  }
  return readDirect(sUrl, foOptions);
}

FeedResponse FeedReader::readViaProxy(const std::string& sUrl, const FetchOptions& foOptions,
                                      const std::string& sProxyUrl,
                                      const std::string& sToken) const {
  if (!common::validateUrl(sUrl)) {
    return FeedResponse(FeedResponseStatus::UnknownError, sUrl, ResponseMeta{.bUseProxy = true});
  }
  FeedResponse frRaw = _prcRelay.relay(sUrl, requestHeaders(foOptions), sToken, sProxyUrl);
  return finish(std::move(frRaw), foOptions.bAllowNonWebpage);
}

FeedResponse FeedReader::readDirect(const std::string& sUrl, const FetchOptions& foOptions) const {
  auto spLog = common::Logger::get();
  std::string sCurrent = sUrl;

  for (int iHop = 0;; ++iHop) {
    if (!common::validateUrl(sCurrent)) {
      spLog->debug("Refusing to fetch invalid URL '{}'", sCurrent);
      return FeedResponse(FeedResponseStatus::UnknownError, sCurrent);
    }

    HttpRequest hqRequest;
    hqRequest.sUrl = sCurrent;
    hqRequest.vHeaders = requestHeaders(foOptions);
    hqRequest.iTimeoutSeconds = _cfg.iRequestTimeoutSeconds;
    hqRequest.iMaxBodyBytes = _cfg.iMaxContentLength;
    hqRequest.nDecideBytes = ContentSniffer::kSniffBytes;

    if (!foOptions.bAllowPrivateAddress) {
      const GuardResult gr = _agGuard.check(sCurrent);
      switch (gr.eVerdict) {
        case GuardVerdict::PrivateAddress:
          return FeedResponse(FeedResponseStatus::PrivateAddressError, sCurrent);
        case GuardVerdict::ResolveFailed:
          return FeedResponse(FeedResponseStatus::DnsError, sCurrent);
        case GuardVerdict::InvalidUrl:
          return FeedResponse(FeedResponseStatus::UnknownError, sCurrent);
        case GuardVerdict::Allowed:
          hqRequest.sResolvePin = gr.resolvePin();
          break;
      }
    }

    if (!foOptions.bAllowNonWebpage) {
      hqRequest.fnAcceptBody = [sCurrent](int iStatus, const HeaderMap& mHeaders,
                                          std::string_view svPrefix) {
        if (!isSuccess(iStatus)) {
          return true;
        }
        std::optional<std::string> oContentType;
        if (auto it = mHeaders.find("content-type"); it != mHeaders.end()) {
          oContentType = it->second;
        }
        return ContentSniffer::classify(oContentType, svPrefix, sCurrent).bSupported;
      };
    }

    HttpResult hr = _spTransport->perform(hqRequest);

    ResponseMeta rmMeta;
    rmMeta.oContentType = hr.header("content-type");
    rmMeta.oEtag = hr.header("etag");
    rmMeta.oLastModified = hr.header("last-modified");

    if (hr.bRejected) {
      spLog->warn("Content type '{}' of {} is not supported",
                  rmMeta.oContentType.value_or("<none>"), sCurrent);
      return FeedResponse(FeedResponseStatus::ContentTypeNotSupportError, sCurrent, rmMeta);
    }
    if (hr.oFailure) {
      return FeedResponse(*hr.oFailure, sCurrent, rmMeta);
    }

    const auto oLocation = hr.header("location");
    if (isRedirect(hr.iStatus) && oLocation && !oLocation->empty()) {
      if (iHop >= _cfg.iMaxRedirects) {
        spLog->debug("Too many redirects fetching {}", sUrl);
        return FeedResponse(FeedResponseStatus::TooManyRedirectError, sCurrent, rmMeta);
      }
      const std::string sNext = common::normalizeUrl(*oLocation, sCurrent);
      spLog->debug("Redirect {} {} -> {}", hr.iStatus, sCurrent, sNext);
      sCurrent = sNext;
      continue;
    }

    spLog->debug("Fetched {} status={} bytes={}", sCurrent, hr.iStatus, hr.sBody.size());
    return finish(FeedResponse(hr.iStatus, sCurrent, std::move(hr.sBody), std::nullopt,
                               std::nullopt, std::move(rmMeta)),
                  foOptions.bAllowNonWebpage);
  }
}

FeedResponse FeedReader::finish(FeedResponse frRaw, bool bAllowNonWebpage) const {
  if (frRaw.status() < 0) {
    return frRaw;
  }

  std::optional<std::string> oFeedType;
  if (frRaw.ok()) {
    const SniffResult sr = ContentSniffer::classify(frRaw.contentType(), frRaw.content(),
                                                    frRaw.url());
    if (!sr.bSupported && !bAllowNonWebpage) {
      common::Logger::get()->warn("Content type '{}' of {} is not supported",
                                  frRaw.contentType().value_or("<none>"), frRaw.url());
      return FeedResponse(FeedResponseStatus::ContentTypeNotSupportError, frRaw.url(),
                          frRaw.meta());
    }
    if (sr.oFeedType) {
      oFeedType = feedTypeName(*sr.oFeedType);
    }
  }

  std::optional<std::string> oEncoding;
  if (!frRaw.content().empty()) {
    std::optional<std::string> oDeclared;
    if (frRaw.contentType()) {
      oDeclared = EncodingDetector::charsetFromContentType(*frRaw.contentType());
    }
    oEncoding = EncodingDetector::detect(oDeclared, frRaw.content());
  }

  return FeedResponse(frRaw.status(), frRaw.url(), frRaw.content(), std::move(oEncoding),
                      std::move(oFeedType), frRaw.meta());
}

}  // namespace feedlib::fetch
