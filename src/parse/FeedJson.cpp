#include "parse/FeedJson.hpp"

#include "common/Errors.hpp"
#include "common/TimeUtils.hpp"

#include <optional>
#include <string>

namespace feedlib::parse {

namespace {

std::optional<std::string> optionalString(const nlohmann::json& j, const char* pKey) {
  auto it = j.find(pKey);
  if (it == j.end() || it->is_null()) {
    return std::nullopt;
  }
  if (!it->is_string()) {
    throw common::ValidationError(pKey, "invalid_type", std::string(pKey) + " must be a string");
  }
  return it->get<std::string>();
}

void requireObject(const nlohmann::json& j, const char* pWhat) {
  if (!j.is_object()) {
    throw common::ValidationError(pWhat, "invalid_type", std::string(pWhat) + " must be an object");
  }
}

nlohmann::json optionalJson(const std::optional<std::string>& oValue) {
  return oValue ? nlohmann::json(*oValue) : nlohmann::json(nullptr);
}

nlohmann::json optionalJson(const std::optional<common::TimePoint>& oValue) {
  return oValue ? nlohmann::json(common::formatRfc3339(*oValue)) : nlohmann::json(nullptr);
}

}  // namespace

// ── Input ──────────────────────────────────────────────────────────────────

void from_json(const nlohmann::json& j, RawFeed& rfFeed) {
  requireObject(j, "feed");
  rfFeed.oVersion = optionalString(j, "version");
  rfFeed.oTitle = optionalString(j, "title");
  rfFeed.oUrl = optionalString(j, "url");
  rfFeed.oHomeUrl = optionalString(j, "home_url");
  rfFeed.oIconUrl = optionalString(j, "icon_url");
  rfFeed.oDescription = optionalString(j, "description");
  rfFeed.oDtUpdated = optionalString(j, "dt_updated");
  rfFeed.oAuthorName = optionalString(j, "author_name");
  rfFeed.oAuthorUrl = optionalString(j, "author_url");
  rfFeed.oAuthorAvatarUrl = optionalString(j, "author_avatar_url");
}

void from_json(const nlohmann::json& j, RawStory& rsStory) {
  requireObject(j, "story");
  rsStory.oIdent = optionalString(j, "ident");
  rsStory.oTitle = optionalString(j, "title");
  rsStory.oUrl = optionalString(j, "url");
  rsStory.oContent = optionalString(j, "content");
  rsStory.oSummary = optionalString(j, "summary");
  rsStory.oImageUrl = optionalString(j, "image_url");
  rsStory.oDtPublished = optionalString(j, "dt_published");
  rsStory.oDtUpdated = optionalString(j, "dt_updated");
  rsStory.oAuthorName = optionalString(j, "author_name");
  rsStory.oAuthorUrl = optionalString(j, "author_url");
  rsStory.oAuthorAvatarUrl = optionalString(j, "author_avatar_url");
}

void from_json(const nlohmann::json& j, RawFeedResult& rfrResult) {
  requireObject(j, "result");
  rfrResult.rfFeed = j.contains("feed") ? j.at("feed").get<RawFeed>() : RawFeed{};
  rfrResult.vStorys.clear();
  if (auto it = j.find("storys"); it != j.end() && !it->is_null()) {
    if (!it->is_array()) {
      throw common::ValidationError("storys", "invalid_type", "storys must be an array");
    }
    for (const auto& jStory : *it) {
      rfrResult.vStorys.push_back(jStory.get<RawStory>());
    }
  }
}

// ── Output ─────────────────────────────────────────────────────────────────

void to_json(nlohmann::json& j, const Feed& fdFeed) {
  j = nlohmann::json{
      {"version", fdFeed.sVersion},
      {"title", fdFeed.sTitle},
      {"url", fdFeed.sUrl},
      {"home_url", optionalJson(fdFeed.oHomeUrl)},
      {"icon_url", optionalJson(fdFeed.oIconUrl)},
      {"description", fdFeed.sDescription},
      {"dt_updated", optionalJson(fdFeed.oDtUpdated)},
      {"author_name", optionalJson(fdFeed.oAuthorName)},
      {"author_url", optionalJson(fdFeed.oAuthorUrl)},
      {"author_avatar_url", optionalJson(fdFeed.oAuthorAvatarUrl)},
  };
}

void to_json(nlohmann::json& j, const Story& stStory) {
  j = nlohmann::json{
      {"ident", stStory.sIdent},
      {"title", stStory.sTitle},
      {"url", optionalJson(stStory.oUrl)},
      {"content", optionalJson(stStory.oContent)},
      {"summary", stStory.sSummary},
      {"has_mathjax", stStory.bHasMathjax},
      {"image_url", optionalJson(stStory.oImageUrl)},
      {"dt_published", optionalJson(stStory.oDtPublished)},
      {"dt_updated", optionalJson(stStory.oDtUpdated)},
      {"author_name", optionalJson(stStory.oAuthorName)},
      {"author_url", optionalJson(stStory.oAuthorUrl)},
      {"author_avatar_url", optionalJson(stStory.oAuthorAvatarUrl)},
  };
}

void to_json(nlohmann::json& j, const FeedResult& fresResult) {
  j = nlohmann::json{
      {"feed", fresResult.feed()},
      {"storys", fresResult.storys()},
  };
}

}  // namespace feedlib::parse
