#include "common/UrlUtils.hpp"

#include "common/TextUtils.hpp"

#include <curl/curl.h>

#include <algorithm>
#include <cctype>
#include <memory>

namespace feedlib::common {

namespace {

using CurlUrlPtr = std::unique_ptr<CURLU, decltype(&curl_url_cleanup)>;

CurlUrlPtr makeHandle() {
  return CurlUrlPtr(curl_url(), &curl_url_cleanup);
}

std::optional<std::string> getPart(CURLU* pHandle, CURLUPart part, unsigned int uFlags = 0) {
  char* pValue = nullptr;
  if (curl_url_get(pHandle, part, &pValue, uFlags) != CURLUE_OK || !pValue) {
    return std::nullopt;
  }
  std::string sValue(pValue);
  curl_free(pValue);
  return sValue;
}

bool startsWithNoCase(const std::string& sValue, const char* pPrefix) {
  const std::string sPrefix(pPrefix);
  if (sValue.size() < sPrefix.size()) return false;
  return toLower(sValue.substr(0, sPrefix.size())) == sPrefix;
}

/// "mailto:", "javascript:", "data:" ... but not "example.com:8080/".
bool hasForeignScheme(const std::string& sUrl) {
  const auto nColon = sUrl.find(':');
  if (nColon == std::string::npos || nColon == 0) return false;
  for (size_t i = 0; i < nColon; ++i) {
    const unsigned char c = static_cast<unsigned char>(sUrl[i]);
    const bool bSchemeChar = std::isalpha(c) || (i > 0 && (std::isdigit(c) || c == '+' || c == '-'));
    if (!bSchemeChar) return false;
  }
  return true;
}

std::string stripControlChars(const std::string& sValue) {
  std::string sResult;
  sResult.reserve(sValue.size());
  for (char c : sValue) {
    if (c != '\n' && c != '\r' && c != '\t') {
      sResult += c;
    }
  }
  return trim(sResult);
}

}  // namespace

std::optional<UrlParts> parseUrl(const std::string& sUrl) {
  auto upHandle = makeHandle();
  if (!upHandle || curl_url_set(upHandle.get(), CURLUPART_URL, sUrl.c_str(), 0) != CURLUE_OK) {
    return std::nullopt;
  }

  UrlParts up;
  up.sScheme = toLower(getPart(upHandle.get(), CURLUPART_SCHEME).value_or(""));
  up.sHost = getPart(upHandle.get(), CURLUPART_HOST).value_or("");
  if (up.sHost.size() >= 2 && up.sHost.front() == '[' && up.sHost.back() == ']') {
    up.sHost = up.sHost.substr(1, up.sHost.size() - 2);
  }
  const auto oPort = getPart(upHandle.get(), CURLUPART_PORT, CURLU_DEFAULT_PORT);
  if (oPort) {
    try {
      up.iPort = std::stoi(*oPort);
    } catch (const std::logic_error&) {
      return std::nullopt;
    }
  }
  up.sPath = getPart(upHandle.get(), CURLUPART_PATH).value_or("/");
  if (up.sScheme.empty() || up.sHost.empty()) {
    return std::nullopt;
  }
  return up;
}

std::string normalizeUrl(const std::string& sUrl, const std::string& sBaseUrl) {
  std::string sValue = stripControlChars(sUrl);
  if (sValue.empty()) {
    return sValue;
  }

  if (sValue.rfind("//", 0) == 0) {
    std::string sScheme = "http";
    if (const auto oBase = parseUrl(sBaseUrl)) {
      sScheme = oBase->sScheme;
    }
    sValue = sScheme + ":" + sValue;
  } else if (!startsWithNoCase(sValue, "http://") && !startsWithNoCase(sValue, "https://")) {
    if (hasForeignScheme(sValue)) {
      return sValue;
    }
    if (sBaseUrl.empty()) {
      sValue = "http://" + sValue;
    } else {
      auto upHandle = makeHandle();
      if (!upHandle ||
          curl_url_set(upHandle.get(), CURLUPART_URL, sBaseUrl.c_str(), 0) != CURLUE_OK ||
          curl_url_set(upHandle.get(), CURLUPART_URL, sValue.c_str(), 0) != CURLUE_OK) {
        return sValue;
      }
      return getPart(upHandle.get(), CURLUPART_URL).value_or(sValue);
    }
  }

  auto upHandle = makeHandle();
  if (!upHandle || curl_url_set(upHandle.get(), CURLUPART_URL, sValue.c_str(), 0) != CURLUE_OK) {
    return sValue;
  }
  return getPart(upHandle.get(), CURLUPART_URL).value_or(sValue);
}

std::optional<std::string> validateUrl(const std::string& sUrl) {
  if (sUrl.empty() || utf8Length(sUrl) > kMaxUrlLength) {
    return std::nullopt;
  }
  const auto oParts = parseUrl(sUrl);
  if (!oParts || (oParts->sScheme != "http" && oParts->sScheme != "https")) {
    return std::nullopt;
  }
  return sUrl;
}

std::string urlPathExtension(const std::string& sUrl) {
  std::string sPath;
  if (const auto oParts = parseUrl(sUrl)) {
    sPath = oParts->sPath;
  } else {
    sPath = sUrl.substr(0, sUrl.find_first_of("?#"));
  }
  const auto nSlash = sPath.rfind('/');
  const auto nDot = sPath.rfind('.');
  if (nDot == std::string::npos || (nSlash != std::string::npos && nDot < nSlash)) {
    return {};
  }
  return toLower(sPath.substr(nDot + 1));
}

}  // namespace feedlib::common
