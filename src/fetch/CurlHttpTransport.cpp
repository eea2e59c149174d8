#include "fetch/CurlHttpTransport.hpp"

#include "common/Logger.hpp"
#include "common/TextUtils.hpp"

#include <memory>
#include <mutex>
#include <stdexcept>

namespace feedlib::fetch {

namespace {

using CurlPtr = std::unique_ptr<CURL, decltype(&curl_easy_cleanup)>;
using SlistPtr = std::unique_ptr<curl_slist, decltype(&curl_slist_free_all)>;

std::once_flag g_curlInitFlag;

/// Per-transfer state shared by the callbacks.
struct TransferState {
  const HttpRequest* pRequest = nullptr;
  HttpResult* pResult = nullptr;
  bool bDecided = false;
  bool bTooLarge = false;

  void decide() {
    bDecided = true;
    if (!pRequest->fnAcceptBody) {
      return;
    }
    const std::string_view svBody(pResult->sBody);
    if (!pRequest->fnAcceptBody(pResult->iStatus, pResult->mHeaders,
                                svBody.substr(0, pRequest->nDecideBytes))) {
      pResult->bRejected = true;
    }
  }
};

void appendSlist(SlistPtr& upList, const std::string& sLine) {
  curl_slist* pNew = curl_slist_append(upList.get(), sLine.c_str());
  if (!pNew) {
    throw std::bad_alloc();
  }
  upList.release();
  upList.reset(pNew);
}

size_t headerCallback(char* pBuffer, size_t nSize, size_t nItems, void* pUserData) {
  auto* pState = static_cast<TransferState*>(pUserData);
  const size_t nBytes = nSize * nItems;
  std::string sLine(pBuffer, nBytes);

  if (sLine.rfind("HTTP/", 0) == 0) {
    // New response head (e.g. after 100 Continue): start over.
    pState->pResult->mHeaders.clear();
    const auto nSpace = sLine.find(' ');
    if (nSpace != std::string::npos) {
      try {
        pState->pResult->iStatus = std::stoi(sLine.substr(nSpace + 1, 3));
      } catch (const std::logic_error&) {
        pState->pResult->iStatus = 0;
      }
    }
    return nBytes;
  }

  const auto nColon = sLine.find(':');
  if (nColon != std::string::npos) {
    std::string sName = common::toLower(common::trim(sLine.substr(0, nColon)));
    pState->pResult->mHeaders[sName] = common::trim(sLine.substr(nColon + 1));
  }
  return nBytes;
}

size_t writeCallback(char* pData, size_t nSize, size_t nMemb, void* pUserData) {
  auto* pState = static_cast<TransferState*>(pUserData);
  const size_t nBytes = nSize * nMemb;
  HttpResult& hr = *pState->pResult;

  const int64_t iLimit = pState->pRequest->iMaxBodyBytes;
  if (iLimit > 0 && static_cast<int64_t>(hr.sBody.size() + nBytes) > iLimit) {
    pState->bTooLarge = true;
    return 0;
  }
  hr.sBody.append(pData, nBytes);

  if (!pState->bDecided && hr.sBody.size() >= pState->pRequest->nDecideBytes) {
    pState->decide();
    if (hr.bRejected) {
      return 0;
    }
  }
  return nBytes;
}

}  // namespace

CurlHttpTransport::CurlHttpTransport() {
  std::call_once(g_curlInitFlag, []() {
    if (curl_global_init(CURL_GLOBAL_ALL) != CURLE_OK) {
      throw std::runtime_error("curl_global_init failed");
    }
  });
}

FeedResponseStatus CurlHttpTransport::mapCurlError(CURLcode code, bool bConnected) {
  switch (code) {
    case CURLE_COULDNT_RESOLVE_HOST:
      return FeedResponseStatus::DnsError;
    case CURLE_COULDNT_CONNECT:
      return FeedResponseStatus::ConnectionError;
    case CURLE_OPERATION_TIMEDOUT:
      return bConnected ? FeedResponseStatus::ReadTimeout : FeedResponseStatus::ConnectionTimeout;
    case CURLE_SSL_CONNECT_ERROR:
    case CURLE_PEER_FAILED_VERIFICATION:
    case CURLE_SSL_CERTPROBLEM:
    case CURLE_SSL_CIPHER:
    case CURLE_SSL_CACERT_BADFILE:
    case CURLE_SSL_ISSUER_ERROR:
    case CURLE_SSL_PINNEDPUBKEYNOTMATCH:
    case CURLE_SSL_INVALIDCERTSTATUS:
      return FeedResponseStatus::SslError;
    case CURLE_RECV_ERROR:
    case CURLE_SEND_ERROR:
    case CURLE_GOT_NOTHING:
    case CURLE_HTTP2:
    case CURLE_HTTP2_STREAM:
      return FeedResponseStatus::ConnectionReset;
    case CURLE_COULDNT_RESOLVE_PROXY:
      return FeedResponseStatus::ProxyError;
    case CURLE_TOO_MANY_REDIRECTS:
      return FeedResponseStatus::TooManyRedirectError;
    case CURLE_BAD_CONTENT_ENCODING:
      return FeedResponseStatus::ContentDecodingError;
    case CURLE_PARTIAL_FILE:
      return FeedResponseStatus::ChunkedEncodingError;
    case CURLE_FILESIZE_EXCEEDED:
    case CURLE_WRITE_ERROR:
    case CURLE_WEIRD_SERVER_REPLY:
      return FeedResponseStatus::ResponseError;
    default:
      return FeedResponseStatus::UnknownError;
  }
}

HttpResult CurlHttpTransport::perform(const HttpRequest& hqRequest) {
  HttpResult hr;
  auto spLog = common::Logger::get();

  CurlPtr upCurl(curl_easy_init(), &curl_easy_cleanup);
  if (!upCurl) {
    hr.oFailure = FeedResponseStatus::UnknownError;
    return hr;
  }
  CURL* pCurl = upCurl.get();

  TransferState tsState;
  tsState.pRequest = &hqRequest;
  tsState.pResult = &hr;

  SlistPtr upHeaders(nullptr, &curl_slist_free_all);
  for (const auto& [sName, sValue] : hqRequest.vHeaders) {
    appendSlist(upHeaders, sName + ": " + sValue);
  }
  appendSlist(upHeaders, "Expect:");

  SlistPtr upResolve(nullptr, &curl_slist_free_all);
  if (!hqRequest.sResolvePin.empty()) {
    appendSlist(upResolve, hqRequest.sResolvePin);
    curl_easy_setopt(pCurl, CURLOPT_RESOLVE, upResolve.get());
  }

  curl_easy_setopt(pCurl, CURLOPT_URL, hqRequest.sUrl.c_str());
  curl_easy_setopt(pCurl, CURLOPT_PROTOCOLS_STR, "http,https");
  curl_easy_setopt(pCurl, CURLOPT_HTTPHEADER, upHeaders.get());
  curl_easy_setopt(pCurl, CURLOPT_HEADERFUNCTION, headerCallback);
  curl_easy_setopt(pCurl, CURLOPT_HEADERDATA, &tsState);
  curl_easy_setopt(pCurl, CURLOPT_WRITEFUNCTION, writeCallback);
  curl_easy_setopt(pCurl, CURLOPT_WRITEDATA, &tsState);
  curl_easy_setopt(pCurl, CURLOPT_NOSIGNAL, 1L);
  curl_easy_setopt(pCurl, CURLOPT_FOLLOWLOCATION, 0L);
  curl_easy_setopt(pCurl, CURLOPT_ACCEPT_ENCODING, "gzip, deflate");
  curl_easy_setopt(pCurl, CURLOPT_SSL_VERIFYPEER, 1L);
  curl_easy_setopt(pCurl, CURLOPT_TIMEOUT, static_cast<long>(hqRequest.iTimeoutSeconds));
  curl_easy_setopt(pCurl, CURLOPT_CONNECTTIMEOUT, static_cast<long>(hqRequest.iTimeoutSeconds));
  if (hqRequest.iMaxBodyBytes > 0) {
    curl_easy_setopt(pCurl, CURLOPT_MAXFILESIZE_LARGE,
                     static_cast<curl_off_t>(hqRequest.iMaxBodyBytes));
  }

  if (hqRequest.sMethod == "POST") {
    curl_easy_setopt(pCurl, CURLOPT_POSTFIELDS, hqRequest.sBody.c_str());
    curl_easy_setopt(pCurl, CURLOPT_POSTFIELDSIZE_LARGE,
                     static_cast<curl_off_t>(hqRequest.sBody.size()));
  } else if (hqRequest.sMethod == "GET") {
    curl_easy_setopt(pCurl, CURLOPT_HTTPGET, 1L);
  } else {
    curl_easy_setopt(pCurl, CURLOPT_CUSTOMREQUEST, hqRequest.sMethod.c_str());
  }

  const CURLcode rc = curl_easy_perform(pCurl);

  if (hr.bRejected) {
    hr.sBody.clear();
    return hr;
  }
  if (tsState.bTooLarge || rc == CURLE_FILESIZE_EXCEEDED) {
    spLog->warn("Response body of {} exceeds {} bytes", hqRequest.sUrl, hqRequest.iMaxBodyBytes);
    hr.sBody.clear();
    hr.oFailure = FeedResponseStatus::ResponseError;
    return hr;
  }
  if (rc != CURLE_OK) {
    curl_off_t tConnect = 0;
    curl_easy_getinfo(pCurl, CURLINFO_CONNECT_TIME_T, &tConnect);
    const bool bConnected = tConnect > 0 || hr.iStatus > 0;
    hr.oFailure = mapCurlError(rc, bConnected);
    spLog->debug("{} {} failed: {} ({})", hqRequest.sMethod, hqRequest.sUrl,
                 curl_easy_strerror(rc), statusName(static_cast<int>(*hr.oFailure)));
    hr.sBody.clear();
    return hr;
  }

  long lStatus = 0;
  curl_easy_getinfo(pCurl, CURLINFO_RESPONSE_CODE, &lStatus);
  if (lStatus > 0) {
    hr.iStatus = static_cast<int>(lStatus);
  }
  if (!tsState.bDecided) {
    tsState.decide();
    if (hr.bRejected) {
      hr.sBody.clear();
    }
  }
  return hr;
}

}  // namespace feedlib::fetch
