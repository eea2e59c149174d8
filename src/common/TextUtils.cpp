#include "common/TextUtils.hpp"

#include <algorithm>
#include <cctype>

namespace feedlib::common {

namespace {

bool isContinuationByte(char c) {
  return (static_cast<unsigned char>(c) & 0xC0) == 0x80;
}

}  // namespace

std::string toLower(std::string sValue) {
  std::transform(sValue.begin(), sValue.end(), sValue.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return sValue;
}

std::string trim(const std::string& sValue) {
  const auto nStart = sValue.find_first_not_of(" \t\r\n\f\v");
  if (nStart == std::string::npos) {
    return {};
  }
  const auto nEnd = sValue.find_last_not_of(" \t\r\n\f\v");
  return sValue.substr(nStart, nEnd - nStart + 1);
}

std::string collapseWhitespace(const std::string& sValue) {
  std::string sResult;
  sResult.reserve(sValue.size());
  bool bPendingSpace = false;
  for (char c : sValue) {
    if (std::isspace(static_cast<unsigned char>(c))) {
      bPendingSpace = !sResult.empty();
      continue;
    }
    if (bPendingSpace) {
      sResult += ' ';
      bPendingSpace = false;
    }
    sResult += c;
  }
  return sResult;
}

std::size_t utf8Length(const std::string& sValue) {
  return static_cast<std::size_t>(
      std::count_if(sValue.begin(), sValue.end(), [](char c) { return !isContinuationByte(c); }));
}

std::string utf8Truncate(const std::string& sValue, std::size_t nMaxChars) {
  std::size_t nChars = 0;
  for (std::size_t i = 0; i < sValue.size(); ++i) {
    if (isContinuationByte(sValue[i])) continue;
    if (nChars == nMaxChars) {
      return sValue.substr(0, i);
    }
    ++nChars;
  }
  return sValue;
}

std::string shorten(const std::string& sValue, std::size_t nWidth,
                    const std::string& sPlaceholder) {
  if (utf8Length(sValue) <= nWidth) {
    return sValue;
  }
  const std::size_t nPlaceholder = utf8Length(sPlaceholder);
  const std::size_t nKeep = nWidth > nPlaceholder ? nWidth - nPlaceholder : 0;
  return utf8Truncate(sValue, nKeep) + sPlaceholder;
}

}  // namespace feedlib::common
