#pragma once

#include <nlohmann/json.hpp>

#include "parse/FeedParser.hpp"
#include "parse/RawFeed.hpp"

namespace feedlib::parse {

// Tokenizer dumps use snake_case keys: {"feed": {...}, "storys": [{...}]}.
// Missing and null keys become nullopt; other non-string values throw
// ValidationError naming the key.

void from_json(const nlohmann::json& j, RawFeed& rfFeed);
void from_json(const nlohmann::json& j, RawStory& rsStory);
void from_json(const nlohmann::json& j, RawFeedResult& rfrResult);

// Output uses the same keys; timestamps are RFC 3339 UTC, absent values null.

void to_json(nlohmann::json& j, const Feed& fdFeed);
void to_json(nlohmann::json& j, const Story& stStory);
void to_json(nlohmann::json& j, const FeedResult& fresResult);

}  // namespace feedlib::parse
