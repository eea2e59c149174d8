#include "common/Config.hpp"

#include "common/Errors.hpp"
#include "common/UrlUtils.hpp"

#include <cstdlib>
#include <fstream>
#include <limits>
#include <sstream>
#include <string>

namespace feedlib::common {

std::string Config::getEnv(const char* pVarName) {
  const char* pValue = std::getenv(pVarName);
  return pValue ? std::string(pValue) : std::string{};
}

int64_t Config::getEnvInt(const char* pVarName, int64_t iDefault) {
  const std::string sValue = getEnv(pVarName);
  if (sValue.empty()) {
    return iDefault;
  }
  try {
    size_t nPos = 0;
    const long long iValue = std::stoll(sValue, &nPos);
    if (nPos != sValue.size()) {
      throw std::invalid_argument(sValue);
    }
    return static_cast<int64_t>(iValue);
  } catch (const std::logic_error&) {
    throw ConfigError("invalid_integer",
                      std::string("Invalid integer value for ") + pVarName + ": " + sValue);
  }
}

int Config::getEnvInt32(const char* pVarName, int iDefault) {
  const int64_t iValue = getEnvInt(pVarName, iDefault);
  if (iValue < std::numeric_limits<int>::min() || iValue > std::numeric_limits<int>::max()) {
    throw ConfigError("integer_out_of_range",
                      std::string("Integer value for ") + pVarName + " is out of range: " +
                          std::to_string(iValue));
  }
  return static_cast<int>(iValue);
}

std::optional<std::string> Config::loadSecret(const char* pVarName) {
  // Try the direct env var first
  std::string sValue = getEnv(pVarName);
  if (!sValue.empty()) {
    return sValue;
  }

  const std::string sFileVar = std::string(pVarName) + "_FILE";
  const std::string sFilePath = getEnv(sFileVar.c_str());
  if (sFilePath.empty()) {
    return std::nullopt;
  }

  std::ifstream ifs(sFilePath);
  if (!ifs.is_open()) {
    throw ConfigError("secret_file_unreadable",
                      std::string("Cannot open secret file specified by ") + sFileVar + ": " +
                          sFilePath);
  }

  std::ostringstream oss;
  oss << ifs.rdbuf();
  sValue = oss.str();

  // Trim trailing whitespace/newlines
  while (!sValue.empty() &&
         (sValue.back() == '\n' || sValue.back() == '\r' || sValue.back() == ' ')) {
    sValue.pop_back();
  }

  if (sValue.empty()) {
    throw ConfigError("secret_file_empty",
                      std::string("Secret file is empty: ") + sFilePath + " (from " + sFileVar +
                          ")");
  }

  return sValue;
}

Config Config::load() {
  Config cfg;

  const std::string sLogLevel = getEnv("FEEDLIB_LOG_LEVEL");
  if (!sLogLevel.empty()) {
    cfg.sLogLevel = sLogLevel;
  }

  // RSS proxy relay
  const std::string sProxyUrl = getEnv("FEEDLIB_RSS_PROXY_URL");
  if (!sProxyUrl.empty()) {
    cfg.oRssProxyUrl = sProxyUrl;
  }
  cfg.oRssProxyToken = loadSecret("FEEDLIB_RSS_PROXY_TOKEN");

  // HTTP
  cfg.iRequestTimeoutSeconds = getEnvInt32("FEEDLIB_REQUEST_TIMEOUT_SECONDS", 30);
  cfg.iMaxContentLength = getEnvInt("FEEDLIB_MAX_CONTENT_LENGTH", 10 * 1024 * 1024);
  cfg.iMaxRedirects = getEnvInt32("FEEDLIB_MAX_REDIRECTS", 10);
  cfg.iThreadPoolSize = getEnvInt32("FEEDLIB_THREAD_POOL_SIZE", 0);

  cfg.validate();
  return cfg;
}

void Config::validate() const {
  if (oRssProxyUrl) {
    if (!validateUrl(*oRssProxyUrl)) {
      throw ConfigError("invalid_proxy_url",
                        "FEEDLIB_RSS_PROXY_URL must be an http(s) URL (got '" + *oRssProxyUrl +
                            "')");
    }
    if (!oRssProxyToken || oRssProxyToken->empty()) {
      throw ConfigError("missing_proxy_token",
                        "FEEDLIB_RSS_PROXY_TOKEN is required when FEEDLIB_RSS_PROXY_URL is set");
    }
  }

  // Relay requests wait twice the timeout.
  if (iRequestTimeoutSeconds < 1 ||
      iRequestTimeoutSeconds > std::numeric_limits<int>::max() / 2) {
    throw ConfigError("invalid_timeout",
                      "FEEDLIB_REQUEST_TIMEOUT_SECONDS must be between 1 and " +
                          std::to_string(std::numeric_limits<int>::max() / 2) + " (got " +
                          std::to_string(iRequestTimeoutSeconds) + ")");
  }

  if (iMaxContentLength < 1) {
    throw ConfigError("invalid_max_content_length",
                      "FEEDLIB_MAX_CONTENT_LENGTH must be >= 1 (got " +
                          std::to_string(iMaxContentLength) + ")");
  }

  if (iMaxRedirects < 0) {
    throw ConfigError("invalid_max_redirects",
                      "FEEDLIB_MAX_REDIRECTS must be >= 0 (got " +
                          std::to_string(iMaxRedirects) + ")");
  }

  if (iThreadPoolSize < 0) {
    throw ConfigError("invalid_thread_pool_size",
                      "FEEDLIB_THREAD_POOL_SIZE must be >= 0 (got " +
                          std::to_string(iThreadPoolSize) + ")");
  }
}

}  // namespace feedlib::common
