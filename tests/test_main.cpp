/// Custom test entry point. Initializes the feedlib logger quietly and shuts
/// spdlog down explicitly before exit, avoiding static destruction order
/// issues with the spdlog shared library on GCC 15 / glibc. Uses _exit() to
/// skip atexit handlers that trigger double-free in spdlog's unload path.
///
/// FEEDLIB_TEST_LOG_LEVEL overrides the default "warn" level for debugging.

#include <gtest/gtest.h>
#include <spdlog/spdlog.h>

#include <cstdlib>
#include <string>
#include <unistd.h>

#include "common/Logger.hpp"

int main(int argc, char** argv) {
  ::testing::InitGoogleTest(&argc, argv);

  const char* pLevel = std::getenv("FEEDLIB_TEST_LOG_LEVEL");
  feedlib::common::Logger::init(pLevel ? std::string(pLevel) : std::string("warn"));

  int iResult = RUN_ALL_TESTS();

  // Explicitly shutdown spdlog before exit
  spdlog::drop_all();
  spdlog::shutdown();

  // All test results are already printed; the exit code is what matters.
  _exit(iResult);
}
