#pragma once

#include <cstddef>
#include <string>
#include <utility>
#include <vector>

#include "parse/FeedChecksum.hpp"
#include "parse/RawFeed.hpp"
#include "parse/Schema.hpp"

namespace feedlib::parse {

/// Parse output. checksum() is the parser's private copy after the parse.
/// Class abbreviation: fres
class FeedResult {
 public:
  FeedResult(Feed fdFeed, std::vector<Story> vStorys, FeedChecksum fcChecksum)
      : _fdFeed(std::move(fdFeed)),
        _vStorys(std::move(vStorys)),
        _fcChecksum(std::move(fcChecksum)) {}

  const Feed& feed() const { return _fdFeed; }
  const std::vector<Story>& storys() const { return _vStorys; }
  const FeedChecksum& checksum() const { return _fcChecksum; }

 private:
  Feed _fdFeed;
  std::vector<Story> _vStorys;
  FeedChecksum _fcChecksum;
};

/// Turns tokenizer output into validated records, skipping stories whose
/// content is unchanged since the checksum was taken.
/// Class abbreviation: fp
class FeedParser {
 public:
  /// Content at or above this size (after cleaning) is downgraded to text.
  static constexpr std::size_t kMaxHtmlContentBytes = 1024 * 1024;

  /// fcChecksum is copied; the caller's instance is never modified.
  explicit FeedParser(const FeedChecksum& fcChecksum = FeedChecksum(), bool bValidate = true);

  /// Throws FeedParserError on a hard validation failure when validation is on.
  FeedResult parse(const RawFeedResult& rfrRaw);

 private:
  Feed normalizeFeed(const RawFeed& rfFeed) const;
  Story normalizeStory(const RawStory& rsStory, const std::string& sFeedUrl) const;

  FeedChecksum _fcChecksum;
  bool _bValidate;
};

}  // namespace feedlib::parse
