#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>

namespace feedlib::fetch {

/// Best-effort text encoding detection for fetched bodies.
/// Names are lowercase iconv/WHATWG-style labels ("utf-8", "gbk", "windows-1252").
/// Class abbreviation: ed
class EncodingDetector {
 public:
  /// Bytes inspected when validating a charset or running statistical detection.
  static constexpr std::size_t kPrefixBytes = 64 * 1024;

  /// Never returns an empty name. Preference order: the declared charset if the
  /// prefix decodes cleanly under it, BOM, in-document declaration, UTF-8,
  /// ICU statistical detection, then "utf-8".
  static std::string detect(const std::optional<std::string>& oDeclaredCharset,
                            std::string_view svContent);

  /// charset parameter of a Content-Type header, normalized; nullopt if absent.
  ///   "application/atom+xml; charset='GB2312'" -> "gb2312"
  static std::optional<std::string> charsetFromContentType(const std::string& sContentType);

  /// Strip quotes/whitespace, lowercase and map common aliases.
  static std::string normalizeCharset(const std::string& sCharset);

  /// True if svContent decodes under sCharset without errors. A multi-byte
  /// sequence cut off at the end is accepted when bTruncated is set.
  static bool decodesCleanly(const std::string& sCharset, std::string_view svContent,
                             bool bTruncated);

 private:
  static std::optional<std::string> charsetFromBom(std::string_view svContent);
  static std::optional<std::string> charsetFromDocument(std::string_view svContent);
  static std::optional<std::string> detectStatistically(std::string_view svContent);
};

}  // namespace feedlib::fetch
