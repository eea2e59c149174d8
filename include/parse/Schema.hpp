#pragma once

#include <cstddef>
#include <optional>
#include <string>

#include "common/TimeUtils.hpp"

namespace feedlib::parse {

// ── Field limits (Unicode code points) ─────────────────────────────────────

constexpr std::size_t kMaxVersionLength = 200;
constexpr std::size_t kMaxTitleLength = 200;
constexpr std::size_t kMaxIdentLength = 200;
constexpr std::size_t kMaxDescriptionLength = 300;
constexpr std::size_t kMaxSummaryLength = 300;
constexpr std::size_t kMaxAuthorNameLength = 100;

/// Normalized feed record.
/// Class abbreviation: fd
struct Feed {
  std::string sVersion;
  std::string sTitle;
  std::string sUrl;
  std::optional<std::string> oHomeUrl;
  std::optional<std::string> oIconUrl;
  std::string sDescription;
  std::optional<common::TimePoint> oDtUpdated;
  std::optional<std::string> oAuthorName;
  std::optional<std::string> oAuthorUrl;
  std::optional<std::string> oAuthorAvatarUrl;
};

/// Normalized story record. sIdent is never rewritten after tokenizing.
/// Class abbreviation: st
struct Story {
  std::string sIdent;
  std::string sTitle;
  std::optional<std::string> oUrl;
  std::optional<std::string> oContent;
  std::string sSummary;
  bool bHasMathjax = false;
  std::optional<std::string> oImageUrl;
  std::optional<common::TimePoint> oDtPublished;
  std::optional<common::TimePoint> oDtUpdated;
  std::optional<std::string> oAuthorName;
  std::optional<std::string> oAuthorUrl;
  std::optional<std::string> oAuthorAvatarUrl;
};

/// Throws ValidationError naming the first offending field.
void validateFeed(const Feed& fdFeed);

/// Throws ValidationError naming the first offending field.
void validateStory(const Story& stStory);

}  // namespace feedlib::parse
