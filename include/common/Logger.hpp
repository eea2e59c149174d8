#pragma once

#include <memory>
#include <string>

#include <spdlog/spdlog.h>

namespace feedlib::common {

/// Thin wrapper over spdlog for structured logging.
/// Logs go to stderr so CLI output on stdout (fetch summaries, FeedResult
/// JSON) stays machine-readable. Uses spdlog's default logger to avoid static
/// destruction order issues. Safe to call from fetcher worker threads.
/// Class abbreviation: N/A (static interface)
///
/// Usage:
///   Logger::init("debug");
///   Logger::get()->info("Fetched {} ({} bytes)", sUrl, nBytes);
class Logger {
 public:
  /// Initialize the global logger with the given level string.
  /// Valid levels: "trace", "debug", "info", "warn", "error", "critical", "off"
  /// A second call only changes the level.
  static void init(const std::string& sLevel);

  /// Get the shared spdlog logger instance, initializing at "info" on first use.
  static std::shared_ptr<spdlog::logger> get();

 private:
  static bool _bInitialized;
};

}  // namespace feedlib::common
