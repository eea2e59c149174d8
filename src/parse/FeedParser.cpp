#include "parse/FeedParser.hpp"

#include "common/Errors.hpp"
#include "common/Logger.hpp"
#include "common/TextUtils.hpp"
#include "common/TimeUtils.hpp"
#include "common/UrlUtils.hpp"
#include "parse/HtmlProcessor.hpp"

namespace feedlib::parse {

namespace {

/// HTML fragment -> single-line text of at most nMaxChars code points.
std::string htmlToLine(const std::optional<std::string>& oHtml, std::size_t nMaxChars) {
  if (!oHtml) return {};
  return common::utf8Truncate(common::collapseWhitespace(HtmlProcessor::toText(*oHtml)),
                              nMaxChars);
}

std::optional<std::string> optionalLine(const std::optional<std::string>& oHtml,
                                        std::size_t nMaxChars) {
  std::string sValue = htmlToLine(oHtml, nMaxChars);
  if (sValue.empty()) return std::nullopt;
  return sValue;
}

/// Normalize against sBaseUrl; anything that is not a valid URL afterwards is dropped.
std::optional<std::string> softUrl(const std::optional<std::string>& oUrl,
                                   const std::string& sBaseUrl) {
  if (!oUrl || common::trim(*oUrl).empty()) return std::nullopt;
  return common::validateUrl(common::normalizeUrl(*oUrl, sBaseUrl));
}

std::optional<common::TimePoint> timestamp(const std::optional<std::string>& oValue) {
  if (!oValue) return std::nullopt;
  return common::parseTimestamp(*oValue);
}

std::string summarize(const std::string& sHtml) {
  return common::shorten(common::collapseWhitespace(HtmlProcessor::toText(HtmlProcessor::clean(sHtml))),
                         kMaxSummaryLength);
}

}  // namespace

FeedParser::FeedParser(const FeedChecksum& fcChecksum, bool bValidate)
    : _fcChecksum(fcChecksum.copy()), _bValidate(bValidate) {}

Feed FeedParser::normalizeFeed(const RawFeed& rfFeed) const {
  Feed fd;
  fd.sVersion = common::trim(rfFeed.oVersion.value_or(""));
  fd.sTitle = htmlToLine(rfFeed.oTitle, kMaxTitleLength);
  fd.sUrl = common::trim(rfFeed.oUrl.value_or(""));
  fd.oHomeUrl = softUrl(rfFeed.oHomeUrl, fd.sUrl);
  fd.oIconUrl = softUrl(rfFeed.oIconUrl, fd.sUrl);
  fd.sDescription = htmlToLine(rfFeed.oDescription, kMaxDescriptionLength);
  fd.oDtUpdated = timestamp(rfFeed.oDtUpdated);
  fd.oAuthorName = optionalLine(rfFeed.oAuthorName, kMaxAuthorNameLength);
  fd.oAuthorUrl = softUrl(rfFeed.oAuthorUrl, fd.sUrl);
  fd.oAuthorAvatarUrl = softUrl(rfFeed.oAuthorAvatarUrl, fd.sUrl);
  return fd;
}

Story FeedParser::normalizeStory(const RawStory& rsStory, const std::string& sFeedUrl) const {
  Story st;
  st.sIdent = rsStory.oIdent.value_or("");
  st.sTitle = htmlToLine(rsStory.oTitle, kMaxTitleLength);

  const std::string sLink = rsStory.oUrl && !common::trim(*rsStory.oUrl).empty()
                                ? *rsStory.oUrl
                                : st.sIdent;
  st.oUrl = common::validateUrl(common::normalizeUrl(sLink, sFeedUrl));
  const std::string sBaseUrl = st.oUrl.value_or(sFeedUrl);

  st.oImageUrl = softUrl(rsStory.oImageUrl, sBaseUrl);
  st.oAuthorName = optionalLine(rsStory.oAuthorName, kMaxAuthorNameLength);
  st.oAuthorUrl = softUrl(rsStory.oAuthorUrl, sBaseUrl);
  st.oAuthorAvatarUrl = softUrl(rsStory.oAuthorAvatarUrl, sBaseUrl);
  st.oDtPublished = timestamp(rsStory.oDtPublished);
  st.oDtUpdated = timestamp(rsStory.oDtUpdated);

  if (rsStory.oContent) {
    st.bHasMathjax = HtmlProcessor::hasMathjax(*rsStory.oContent);
    std::string sContent = HtmlProcessor::clean(*rsStory.oContent);
    if (sContent.size() >= kMaxHtmlContentBytes) {
      common::Logger::get()->warn(
          "Story {} content is {} bytes, too large, keeping plain text only", sBaseUrl,
          sContent.size());
      sContent = HtmlProcessor::toText(sContent);
    } else {
      sContent = HtmlProcessor::processLinks(sContent, sBaseUrl);
    }
    st.oContent = std::move(sContent);
  }

  if (rsStory.oSummary && !common::trim(*rsStory.oSummary).empty()) {
    st.sSummary = summarize(*rsStory.oSummary);
  } else if (rsStory.oContent) {
    st.sSummary = summarize(*rsStory.oContent);
  }
  return st;
}

FeedResult FeedParser::parse(const RawFeedResult& rfrRaw) {
  std::vector<const RawStory*> vUpdated;
  for (const auto& rs : rfrRaw.vStorys) {
    if (_fcChecksum.update(rs.oIdent.value_or(""), rs.oContent.value_or(""))) {
      vUpdated.push_back(&rs);
    }
  }

  Feed fd = normalizeFeed(rfrRaw.rfFeed);
  std::vector<Story> vStorys;
  vStorys.reserve(vUpdated.size());
  for (const RawStory* pStory : vUpdated) {
    vStorys.push_back(normalizeStory(*pStory, fd.sUrl));
  }

  if (_bValidate) {
    try {
      validateFeed(fd);
    } catch (const common::ValidationError& ex) {
      throw common::FeedParserError(ex._sField, std::nullopt, ex._sErrorCode,
                                    std::string("feed.") + ex.what());
    }
    for (std::size_t i = 0; i < vStorys.size(); ++i) {
      try {
        validateStory(vStorys[i]);
      } catch (const common::ValidationError& ex) {
        throw common::FeedParserError(ex._sField, i, ex._sErrorCode,
                                      "storys[" + std::to_string(i) + "]." + ex.what());
      }
    }
  }

  common::Logger::get()->debug("Parsed feed {}: {} of {} storys updated", fd.sUrl, vStorys.size(),
                               rfrRaw.vStorys.size());
  return FeedResult(std::move(fd), std::move(vStorys), _fcChecksum.copy());
}

}  // namespace feedlib::parse
