#pragma once

#include <cstdint>
#include <optional>
#include <string>

namespace feedlib::common {

/// Environment variable loader for the fetcher and parser.
/// Loads all env vars into a typed struct with validation.
/// Class abbreviation: cfg
struct Config {
  // ── Logging ───────────────────────────────────────────────────────────
  std::string sLogLevel = "info";

  // ── RSS proxy relay ───────────────────────────────────────────────────
  std::optional<std::string> oRssProxyUrl;
  std::optional<std::string> oRssProxyToken;

  // ── HTTP ──────────────────────────────────────────────────────────────
  int iRequestTimeoutSeconds = 30;
  int64_t iMaxContentLength = 10 * 1024 * 1024;
  int iMaxRedirects = 10;

  // ── Thread pool ───────────────────────────────────────────────────────
  int iThreadPoolSize = 0;  // 0 = std::thread::hardware_concurrency()

  /// Load and validate all config from environment variables.
  /// Implements _FILE fallback for FEEDLIB_RSS_PROXY_TOKEN.
  /// Throws ConfigError on invalid values or constraints.
  static Config load();

  /// Check cross-field constraints. Called by load(); readers call it on
  /// hand-built configs too.
  void validate() const;

 private:
  /// Read an optional secret with _FILE fallback.
  /// If varName is unset, tries varName + "_FILE" and reads file contents.
  /// Trims trailing whitespace/newlines from file contents.
  static std::optional<std::string> loadSecret(const char* pVarName);

  /// Read an env var, return empty string if unset.
  static std::string getEnv(const char* pVarName);

  /// Read an env var as int with a default value.
  static int64_t getEnvInt(const char* pVarName, int64_t iDefault);

  /// getEnvInt() for int fields; throws ConfigError outside the int range.
  static int getEnvInt32(const char* pVarName, int iDefault);
};

}  // namespace feedlib::common
