#pragma once

#include <cstddef>
#include <string>

namespace feedlib::common {

std::string toLower(std::string sValue);

/// Strip leading/trailing ASCII whitespace.
std::string trim(const std::string& sValue);

/// Replace every run of whitespace with one space and trim.
std::string collapseWhitespace(const std::string& sValue);

/// Number of code points in a UTF-8 string (continuation bytes are not counted).
std::size_t utf8Length(const std::string& sValue);

/// Keep at most nMaxChars code points; never splits a multi-byte sequence.
std::string utf8Truncate(const std::string& sValue, std::size_t nMaxChars);

/// Truncate to nWidth code points, ending with sPlaceholder when shortened.
///   shorten("123456789", 8) == "12345..."
std::string shorten(const std::string& sValue, std::size_t nWidth,
                    const std::string& sPlaceholder = "...");

}  // namespace feedlib::common
