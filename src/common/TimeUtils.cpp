#include "common/TimeUtils.hpp"

#include "common/TextUtils.hpp"

#include <array>
#include <cctype>
#include <cstdio>
#include <cstring>
#include <ctime>

namespace feedlib::common {

namespace {

struct Fields {
  int iYear = 0;
  int iMonth = 0;
  int iDay = 0;
  int iHour = 0;
  int iMinute = 0;
  int iSecond = 0;
  int iOffsetSeconds = 0;
};

constexpr std::array<const char*, 12> kMonths = {"jan", "feb", "mar", "apr", "may", "jun",
                                                 "jul", "aug", "sep", "oct", "nov", "dec"};

int daysInMonth(int iYear, int iMonth) {
  static constexpr std::array<int, 12> kDays = {31, 28, 31, 30, 31, 30, 31, 31, 30, 31, 30, 31};
  const bool bLeap = (iYear % 4 == 0 && iYear % 100 != 0) || iYear % 400 == 0;
  return iMonth == 2 && bLeap ? 29 : kDays[static_cast<size_t>(iMonth - 1)];
}

std::optional<TimePoint> toTimePoint(const Fields& f) {
  if (f.iYear < 1970 || f.iYear > 9999 || f.iMonth < 1 || f.iMonth > 12 || f.iDay < 1 ||
      f.iDay > daysInMonth(f.iYear, f.iMonth) || f.iHour < 0 || f.iHour > 23 ||
      f.iMinute < 0 || f.iMinute > 59 || f.iSecond < 0 || f.iSecond > 60) {
    return std::nullopt;
  }
  std::tm tmValue{};
  tmValue.tm_year = f.iYear - 1900;
  tmValue.tm_mon = f.iMonth - 1;
  tmValue.tm_mday = f.iDay;
  tmValue.tm_hour = f.iHour;
  tmValue.tm_min = f.iMinute;
  tmValue.tm_sec = f.iSecond;
  const std::time_t tEpoch = timegm(&tmValue);
  if (tEpoch == static_cast<std::time_t>(-1)) {
    return std::nullopt;
  }
  return std::chrono::system_clock::from_time_t(tEpoch - f.iOffsetSeconds);
}

/// "Z", "+08:00", "-0700", "GMT", "PST", "" -> seconds east of UTC.
std::optional<int> parseZone(std::string sZone) {
  sZone = toLower(trim(sZone));
  if (sZone.empty() || sZone == "z" || sZone == "gmt" || sZone == "ut" || sZone == "utc") {
    return 0;
  }
  if (sZone[0] == '+' || sZone[0] == '-') {
    const int iSign = sZone[0] == '-' ? -1 : 1;
    std::string sDigits;
    for (size_t i = 1; i < sZone.size(); ++i) {
      if (std::isdigit(static_cast<unsigned char>(sZone[i]))) {
        sDigits += sZone[i];
      } else if (sZone[i] != ':') {
        return std::nullopt;
      }
    }
    if (sDigits.size() == 2) sDigits += "00";
    if (sDigits.size() != 4) return std::nullopt;
    const int iHours = std::stoi(sDigits.substr(0, 2));
    const int iMinutes = std::stoi(sDigits.substr(2, 2));
    return iSign * (iHours * 3600 + iMinutes * 60);
  }
  static const std::array<std::pair<const char*, int>, 8> kNamedZones = {{
      {"est", -5}, {"edt", -4}, {"cst", -6}, {"cdt", -5},
      {"mst", -7}, {"mdt", -6}, {"pst", -8}, {"pdt", -7},
  }};
  for (const auto& [pName, iHours] : kNamedZones) {
    if (sZone == pName) return iHours * 3600;
  }
  return std::nullopt;
}

std::optional<TimePoint> parseRfc3339(const std::string& sValue) {
  Fields f;
  int nRead = 0;
  if (std::sscanf(sValue.c_str(), "%4d-%2d-%2d%n", &f.iYear, &f.iMonth, &f.iDay, &nRead) != 3) {
    return std::nullopt;
  }
  std::string sRest = sValue.substr(static_cast<size_t>(nRead));
  if (sRest.empty()) {
    return toTimePoint(f);
  }
  if (sRest[0] != 'T' && sRest[0] != 't' && sRest[0] != ' ') {
    return std::nullopt;
  }
  sRest = sRest.substr(1);
  nRead = 0;
  if (std::sscanf(sRest.c_str(), "%2d:%2d%n", &f.iHour, &f.iMinute, &nRead) != 2) {
    return std::nullopt;
  }
  sRest = sRest.substr(static_cast<size_t>(nRead));
  if (!sRest.empty() && sRest[0] == ':') {
    nRead = 0;
    if (std::sscanf(sRest.c_str(), ":%2d%n", &f.iSecond, &nRead) != 1) {
      return std::nullopt;
    }
    sRest = sRest.substr(static_cast<size_t>(nRead));
  }
  if (!sRest.empty() && (sRest[0] == '.' || sRest[0] == ',')) {
    size_t i = 1;
    while (i < sRest.size() && std::isdigit(static_cast<unsigned char>(sRest[i]))) ++i;
    sRest = sRest.substr(i);
  }
  const auto oOffset = parseZone(sRest);
  if (!oOffset) {
    return std::nullopt;
  }
  f.iOffsetSeconds = *oOffset;
  return toTimePoint(f);
}

std::optional<TimePoint> parseRfc822(const std::string& sValue) {
  std::string sRest = sValue;
  const auto nComma = sRest.find(',');
  if (nComma != std::string::npos) {
    sRest = trim(sRest.substr(nComma + 1));
  }

  Fields f;
  char vMonth[4] = {0};
  int nRead = 0;
  if (std::sscanf(sRest.c_str(), "%2d %3s %4d %2d:%2d%n", &f.iDay, vMonth, &f.iYear, &f.iHour,
                  &f.iMinute, &nRead) != 5) {
    return std::nullopt;
  }
  sRest = sRest.substr(static_cast<size_t>(nRead));
  if (!sRest.empty() && sRest[0] == ':') {
    nRead = 0;
    if (std::sscanf(sRest.c_str(), ":%2d%n", &f.iSecond, &nRead) != 1) {
      return std::nullopt;
    }
    sRest = sRest.substr(static_cast<size_t>(nRead));
  }

  const std::string sMonth = toLower(vMonth);
  for (size_t i = 0; i < kMonths.size(); ++i) {
    if (sMonth == kMonths[i]) {
      f.iMonth = static_cast<int>(i) + 1;
      break;
    }
  }
  if (f.iYear < 100) {
    f.iYear += f.iYear < 70 ? 2000 : 1900;
  }

  const auto oOffset = parseZone(sRest);
  if (!oOffset) {
    return std::nullopt;
  }
  f.iOffsetSeconds = *oOffset;
  return toTimePoint(f);
}

}  // namespace

std::optional<TimePoint> parseTimestamp(const std::string& sValue) {
  const std::string sTrimmed = trim(sValue);
  if (sTrimmed.empty()) {
    return std::nullopt;
  }
  if (std::isdigit(static_cast<unsigned char>(sTrimmed[0])) && sTrimmed.size() >= 10 &&
      sTrimmed[4] == '-') {
    return parseRfc3339(sTrimmed);
  }
  return parseRfc822(sTrimmed);
}

std::string formatRfc3339(TimePoint tpValue) {
  const std::time_t tValue = std::chrono::system_clock::to_time_t(tpValue);
  std::tm tmValue{};
  gmtime_r(&tValue, &tmValue);
  char vBuffer[32];
  std::strftime(vBuffer, sizeof(vBuffer), "%Y-%m-%dT%H:%M:%SZ", &tmValue);
  return vBuffer;
}

}  // namespace feedlib::common
