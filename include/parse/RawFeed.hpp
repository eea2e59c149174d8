#pragma once

#include <optional>
#include <string>
#include <vector>

namespace feedlib::parse {

/// Feed-level fields as produced by the feed tokenizer. Every field is
/// optional and unvalidated.
/// Class abbreviation: rf
struct RawFeed {
  std::optional<std::string> oVersion;
  std::optional<std::string> oTitle;
  std::optional<std::string> oUrl;
  std::optional<std::string> oHomeUrl;
  std::optional<std::string> oIconUrl;
  std::optional<std::string> oDescription;
  std::optional<std::string> oDtUpdated;
  std::optional<std::string> oAuthorName;
  std::optional<std::string> oAuthorUrl;
  std::optional<std::string> oAuthorAvatarUrl;
};

/// Class abbreviation: rs
struct RawStory {
  std::optional<std::string> oIdent;
  std::optional<std::string> oTitle;
  std::optional<std::string> oUrl;
  std::optional<std::string> oContent;
  std::optional<std::string> oSummary;
  std::optional<std::string> oImageUrl;
  std::optional<std::string> oDtPublished;
  std::optional<std::string> oDtUpdated;
  std::optional<std::string> oAuthorName;
  std::optional<std::string> oAuthorUrl;
  std::optional<std::string> oAuthorAvatarUrl;
};

/// Tokenizer output consumed by FeedParser.
/// Class abbreviation: rfr
struct RawFeedResult {
  RawFeed rfFeed;
  std::vector<RawStory> vStorys;
};

}  // namespace feedlib::parse
