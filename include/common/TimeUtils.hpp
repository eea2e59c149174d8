#pragma once

#include <chrono>
#include <optional>
#include <string>

namespace feedlib::common {

using TimePoint = std::chrono::system_clock::time_point;

/// Parse the timestamp forms found in feeds:
///   RFC 3339  "2020-01-02T03:04:05.123+08:00", "2020-01-02 03:04:05Z", "2020-01-02"
///   RFC 822   "Thu, 02 Jan 2020 03:04:05 GMT", "2 Jan 20 03:04 -0700"
/// Missing zone means UTC. Returns nullopt for anything else.
std::optional<TimePoint> parseTimestamp(const std::string& sValue);

/// "2020-01-02T03:04:05Z"
std::string formatRfc3339(TimePoint tpValue);

}  // namespace feedlib::common
