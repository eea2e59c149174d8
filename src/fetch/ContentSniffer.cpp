#include "fetch/ContentSniffer.hpp"

#include "common/TextUtils.hpp"
#include "common/UrlUtils.hpp"

#include <algorithm>
#include <array>
#include <utility>

namespace feedlib::fetch {

namespace {

constexpr std::array<const char*, 8> kFeedExtensions = {"xml", "rss", "atom", "rdf",
                                                        "json", "html", "htm", "xhtml"};

FeedType feedTypeFromMime(const std::string& sMime) {
  if (sMime.find("rss") != std::string::npos || sMime.find("rdf") != std::string::npos) {
    return FeedType::Rss;
  }
  if (sMime.find("atom") != std::string::npos) return FeedType::Atom;
  if (sMime.find("json") != std::string::npos) return FeedType::Json;
  if (sMime.find("html") != std::string::npos) return FeedType::Html;
  if (sMime.find("xml") != std::string::npos) return FeedType::Xml;
  return FeedType::Unknown;
}

bool endsWith(const std::string& sValue, const std::string& sSuffix) {
  return sValue.size() >= sSuffix.size() &&
         sValue.compare(sValue.size() - sSuffix.size(), sSuffix.size(), sSuffix) == 0;
}

bool isWellFormedMime(const std::string& sMime) {
  const auto nSlash = sMime.find('/');
  return nSlash != std::string::npos && nSlash > 0 && nSlash + 1 < sMime.size() &&
         sMime.find(' ') == std::string::npos;
}

}  // namespace

std::string feedTypeName(FeedType eType) {
  switch (eType) {
    case FeedType::Rss: return "rss";
    case FeedType::Atom: return "atom";
    case FeedType::Json: return "json";
    case FeedType::Html: return "html";
    case FeedType::Xml: return "xml";
    case FeedType::Unknown: return "unknown";
  }
  return "unknown";
}

std::string ContentSniffer::mimeType(const std::string& sContentType) {
  return common::toLower(common::trim(sContentType.substr(0, sContentType.find(';'))));
}

bool ContentSniffer::isWebpageType(const std::string& sMimeType) {
  const std::string sMime = common::toLower(common::trim(sMimeType));
  if (sMime == "text/html" || sMime == "text/plain" || sMime == "application/xml" ||
      sMime == "application/json") {
    return true;
  }
  if (sMime.rfind("text/", 0) == 0 && endsWith(sMime, "xml")) {
    return true;
  }
  if (sMime.rfind("application/", 0) == 0 &&
      (endsWith(sMime, "+xml") || endsWith(sMime, "+json"))) {
    return true;
  }
  return false;
}

std::optional<FeedType> ContentSniffer::sniffFeedType(std::string_view svBody) {
  svBody = svBody.substr(0, std::min(svBody.size(), kSniffBytes));
  if (svBody.substr(0, 3) == "\xEF\xBB\xBF") {
    svBody.remove_prefix(3);
  }
  const auto nStart = svBody.find_first_not_of(" \t\r\n");
  if (nStart == std::string_view::npos) {
    return std::nullopt;
  }
  svBody.remove_prefix(nStart);

  if (svBody.front() == '{' || svBody.front() == '[') {
    return FeedType::Json;
  }
  if (svBody.front() != '<') {
    return std::nullopt;
  }

  const std::string sHead = common::toLower(std::string(svBody));
  const std::array<std::pair<const char*, FeedType>, 5> vMarkers = {{
      {"<rss", FeedType::Rss},
      {"<rdf:rdf", FeedType::Rss},
      {"<feed", FeedType::Atom},
      {"<html", FeedType::Html},
      {"<!doctype html", FeedType::Html},
  }};

  size_t nBest = std::string::npos;
  FeedType eBest = FeedType::Xml;
  for (const auto& [pMarker, eType] : vMarkers) {
    const auto nPos = sHead.find(pMarker);
    if (nPos < nBest) {
      nBest = nPos;
      eBest = eType;
    }
  }
  return eBest;
}

SniffResult ContentSniffer::classify(const std::optional<std::string>& oContentType,
                                     std::string_view svBody, const std::string& sUrl) {
  const std::string sMime = oContentType ? mimeType(*oContentType) : std::string{};
  const auto oSniffed = sniffFeedType(svBody);

  if (isWellFormedMime(sMime) && sMime != "application/octet-stream") {
    if (!isWebpageType(sMime)) {
      return SniffResult{false, std::nullopt};
    }
    return SniffResult{true, oSniffed.value_or(feedTypeFromMime(sMime))};
  }

  // Untyped, malformed or octet-stream: trust structure, then the URL.
  if (oSniffed) {
    return SniffResult{true, oSniffed};
  }
  const std::string sExtension = common::urlPathExtension(sUrl);
  if (std::find(kFeedExtensions.begin(), kFeedExtensions.end(), sExtension) !=
      kFeedExtensions.end()) {
    return SniffResult{true, FeedType::Unknown};
  }
  if (sMime.empty() && !svBody.empty() &&
      svBody.substr(0, kSniffBytes).find('\0') == std::string_view::npos) {
    return SniffResult{true, FeedType::Unknown};
  }
  return SniffResult{false, std::nullopt};
}

}  // namespace feedlib::fetch
