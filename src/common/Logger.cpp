#include "common/Logger.hpp"

#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include <mutex>

namespace feedlib::common {

bool Logger::_bInitialized = false;

namespace {
std::mutex g_mtxInit;
}  // namespace

void Logger::init(const std::string& sLevel) {
  std::lock_guard<std::mutex> lock(g_mtxInit);
  if (_bInitialized) {
    // Re-initialization: just update level
    spdlog::set_level(spdlog::level::from_str(sLevel));
    return;
  }

  auto spLogger = spdlog::stderr_color_mt("feedlib");
  spLogger->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] [%n] %v");

  auto level = spdlog::level::from_str(sLevel);
  spLogger->set_level(level);
  spdlog::set_default_logger(spLogger);

  _bInitialized = true;
  spLogger->debug("Logger initialized at level '{}'", sLevel);
}

std::shared_ptr<spdlog::logger> Logger::get() {
  {
    std::lock_guard<std::mutex> lock(g_mtxInit);
    if (_bInitialized) {
      return spdlog::default_logger();
    }
  }
  init("info");
  return spdlog::default_logger();
}

}  // namespace feedlib::common
