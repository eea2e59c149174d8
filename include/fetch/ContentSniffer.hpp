#pragma once

#include <optional>
#include <string>
#include <string_view>

namespace feedlib::fetch {

/// Structural family of a fetched document.
enum class FeedType { Rss, Atom, Json, Html, Xml, Unknown };

/// "rss", "atom", "json", "html", "xml", "unknown"
std::string feedTypeName(FeedType eType);

/// Result of classifying a response body.
/// Class abbreviation: sr
struct SniffResult {
  bool bSupported = false;
  std::optional<FeedType> oFeedType;
};

/// Decides whether a payload is an acceptable webpage/feed and which family it is.
/// Only the first kSniffBytes of the body are inspected.
/// Class abbreviation: cs
class ContentSniffer {
 public:
  static constexpr std::size_t kSniffBytes = 4096;

  /// Classify by declared Content-Type (may be absent or malformed), the body
  /// prefix, and the request URL (used only for untyped/octet-stream bodies).
  static SniffResult classify(const std::optional<std::string>& oContentType,
                              std::string_view svBody, const std::string& sUrl = {});

  /// True when the declared media type is a webpage/feed type.
  static bool isWebpageType(const std::string& sMimeType);

  /// Detect the family from structural markers; nullopt when no marker matches.
  static std::optional<FeedType> sniffFeedType(std::string_view svBody);

  /// "Application/RSS+XML; charset=utf-8" -> "application/rss+xml"
  static std::string mimeType(const std::string& sContentType);
};

}  // namespace feedlib::fetch
