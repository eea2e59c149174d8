#include "parse/Schema.hpp"

#include "common/Errors.hpp"
#include "common/TextUtils.hpp"
#include "common/UrlUtils.hpp"

namespace feedlib::parse {

namespace {

void requireNonEmpty(const char* pField, const std::string& sValue) {
  if (sValue.empty()) {
    throw common::ValidationError(pField, "required", std::string(pField) + " is required");
  }
}

void requireMaxLength(const char* pField, const std::string& sValue, std::size_t nMax) {
  const std::size_t nLength = common::utf8Length(sValue);
  if (nLength > nMax) {
    throw common::ValidationError(pField, "too_long",
                                  std::string(pField) + " has " + std::to_string(nLength) +
                                      " characters, limit is " + std::to_string(nMax));
  }
}

void requireUrl(const char* pField, const std::string& sValue) {
  if (!common::validateUrl(sValue)) {
    throw common::ValidationError(pField, "invalid_url",
                                  std::string(pField) + " is not a valid URL: " +
                                      common::shorten(sValue, 80));
  }
}

void optionalUrl(const char* pField, const std::optional<std::string>& oValue) {
  if (oValue) {
    requireUrl(pField, *oValue);
  }
}

void optionalMaxLength(const char* pField, const std::optional<std::string>& oValue,
                       std::size_t nMax) {
  if (oValue) {
    requireMaxLength(pField, *oValue, nMax);
  }
}

}  // namespace

void validateFeed(const Feed& fdFeed) {
  requireMaxLength("version", fdFeed.sVersion, kMaxVersionLength);
  requireNonEmpty("title", fdFeed.sTitle);
  requireMaxLength("title", fdFeed.sTitle, kMaxTitleLength);
  requireNonEmpty("url", fdFeed.sUrl);
  requireUrl("url", fdFeed.sUrl);
  optionalUrl("home_url", fdFeed.oHomeUrl);
  optionalUrl("icon_url", fdFeed.oIconUrl);
  requireMaxLength("description", fdFeed.sDescription, kMaxDescriptionLength);
  optionalMaxLength("author_name", fdFeed.oAuthorName, kMaxAuthorNameLength);
  optionalUrl("author_url", fdFeed.oAuthorUrl);
  optionalUrl("author_avatar_url", fdFeed.oAuthorAvatarUrl);
}

void validateStory(const Story& stStory) {
  requireNonEmpty("ident", stStory.sIdent);
  requireMaxLength("ident", stStory.sIdent, kMaxIdentLength);
  requireNonEmpty("title", stStory.sTitle);
  requireMaxLength("title", stStory.sTitle, kMaxTitleLength);
  optionalUrl("url", stStory.oUrl);
  requireMaxLength("summary", stStory.sSummary, kMaxSummaryLength);
  optionalUrl("image_url", stStory.oImageUrl);
  optionalMaxLength("author_name", stStory.oAuthorName, kMaxAuthorNameLength);
  optionalUrl("author_url", stStory.oAuthorUrl);
  optionalUrl("author_avatar_url", stStory.oAuthorAvatarUrl);
}

}  // namespace feedlib::parse
