#include "fetch/EncodingDetector.hpp"

#include "common/Logger.hpp"
#include "common/TextUtils.hpp"

#include <iconv.h>
#include <unicode/ucsdet.h>

#include <array>
#include <cerrno>
#include <memory>
#include <utility>
#include <vector>

namespace feedlib::fetch {

namespace {

constexpr std::size_t kDeclarationScanBytes = 1024;

const std::array<std::pair<const char*, const char*>, 20> kAliases = {{
    {"utf8", "utf-8"},
    {"unicode-1-1-utf-8", "utf-8"},
    {"latin1", "iso-8859-1"},
    {"latin-1", "iso-8859-1"},
    {"iso8859-1", "iso-8859-1"},
    {"iso_8859-1", "iso-8859-1"},
    {"l1", "iso-8859-1"},
    {"ascii", "us-ascii"},
    {"us_ascii", "us-ascii"},
    {"cp1252", "windows-1252"},
    {"x-cp1252", "windows-1252"},
    {"cp1251", "windows-1251"},
    {"x-gbk", "gbk"},
    {"cp936", "gbk"},
    {"gb_2312-80", "gb2312"},
    {"sjis", "shift_jis"},
    {"shift-jis", "shift_jis"},
    {"x-sjis", "shift_jis"},
    {"euc_jp", "euc-jp"},
    {"big5-hkscs", "big5hkscs"},
}};

/// Value of `key=...` after nFrom, with optional quotes; empty if absent.
std::string attributeValue(const std::string& sHead, size_t nFrom) {
  size_t i = nFrom;
  while (i < sHead.size() && (sHead[i] == ' ' || sHead[i] == '=')) ++i;
  if (i < sHead.size() && (sHead[i] == '"' || sHead[i] == '\'')) ++i;
  const size_t nStart = i;
  while (i < sHead.size() && sHead[i] != '"' && sHead[i] != '\'' && sHead[i] != ' ' &&
         sHead[i] != ';' && sHead[i] != '>' && sHead[i] != '?' && sHead[i] != '/') {
    ++i;
  }
  return sHead.substr(nStart, i - nStart);
}

}  // namespace

std::string EncodingDetector::normalizeCharset(const std::string& sCharset) {
  std::string sValue = common::trim(sCharset);
  while (!sValue.empty() && (sValue.front() == '"' || sValue.front() == '\'')) {
    sValue.erase(sValue.begin());
  }
  while (!sValue.empty() && (sValue.back() == '"' || sValue.back() == '\'')) {
    sValue.pop_back();
  }
  sValue = common::toLower(common::trim(sValue));
  for (const auto& [pAlias, pName] : kAliases) {
    if (sValue == pAlias) {
      return pName;
    }
  }
  return sValue;
}

std::optional<std::string> EncodingDetector::charsetFromContentType(
    const std::string& sContentType) {
  size_t nStart = sContentType.find(';');
  while (nStart != std::string::npos) {
    const size_t nEnd = sContentType.find(';', nStart + 1);
    const std::string sParam = sContentType.substr(
        nStart + 1, nEnd == std::string::npos ? std::string::npos : nEnd - nStart - 1);
    const auto nEq = sParam.find('=');
    if (nEq != std::string::npos &&
        common::toLower(common::trim(sParam.substr(0, nEq))) == "charset") {
      std::string sCharset = normalizeCharset(sParam.substr(nEq + 1));
      if (!sCharset.empty()) {
        return sCharset;
      }
    }
    nStart = nEnd;
  }
  return std::nullopt;
}

bool EncodingDetector::decodesCleanly(const std::string& sCharset, std::string_view svContent,
                                      bool bTruncated) {
  iconv_t cd = iconv_open("UTF-8", sCharset.c_str());
  if (cd == reinterpret_cast<iconv_t>(-1)) {
    return false;
  }
  std::unique_ptr<void, int (*)(iconv_t)> upGuard(cd, &iconv_close);

  char* pIn = const_cast<char*>(svContent.data());
  size_t nInLeft = svContent.size();
  std::vector<char> vOut(16 * 1024);

  while (nInLeft > 0) {
    char* pOut = vOut.data();
    size_t nOutLeft = vOut.size();
    const size_t nResult = iconv(cd, &pIn, &nInLeft, &pOut, &nOutLeft);
    if (nResult != static_cast<size_t>(-1)) {
      continue;
    }
    if (errno == E2BIG) {
      continue;
    }
    if (errno == EINVAL) {
      // Incomplete multi-byte sequence at the end of the input.
      return bTruncated;
    }
    return false;  // EILSEQ
  }
  return true;
}

std::optional<std::string> EncodingDetector::charsetFromBom(std::string_view svContent) {
  if (svContent.substr(0, 3) == "\xEF\xBB\xBF") return "utf-8";
  if (svContent.substr(0, 2) == "\xFF\xFE") return "utf-16le";
  if (svContent.substr(0, 2) == "\xFE\xFF") return "utf-16be";
  return std::nullopt;
}

std::optional<std::string> EncodingDetector::charsetFromDocument(std::string_view svContent) {
  const std::string sHead =
      common::toLower(std::string(svContent.substr(0, kDeclarationScanBytes)));

  const auto nXmlDecl = sHead.find("<?xml");
  if (nXmlDecl != std::string::npos) {
    const auto nDeclEnd = sHead.find("?>", nXmlDecl);
    const auto nEncoding = sHead.find("encoding", nXmlDecl);
    if (nEncoding != std::string::npos && nEncoding < nDeclEnd) {
      std::string sCharset = normalizeCharset(attributeValue(sHead, nEncoding + 8));
      if (!sCharset.empty()) return sCharset;
    }
  }

  const auto nMeta = sHead.find("<meta");
  if (nMeta != std::string::npos) {
    const auto nCharset = sHead.find("charset", nMeta);
    if (nCharset != std::string::npos) {
      std::string sCharset = normalizeCharset(attributeValue(sHead, nCharset + 7));
      if (!sCharset.empty()) return sCharset;
    }
  }
  return std::nullopt;
}

std::optional<std::string> EncodingDetector::detectStatistically(std::string_view svContent) {
  UErrorCode status = U_ZERO_ERROR;
  std::unique_ptr<UCharsetDetector, decltype(&ucsdet_close)> upDetector(ucsdet_open(&status),
                                                                        &ucsdet_close);
  if (U_FAILURE(status) || !upDetector) {
    return std::nullopt;
  }

  ucsdet_setText(upDetector.get(), svContent.data(), static_cast<int32_t>(svContent.size()),
                 &status);
  int32_t iMatches = 0;
  const UCharsetMatch** ppMatches = ucsdet_detectAll(upDetector.get(), &iMatches, &status);
  if (U_FAILURE(status) || !ppMatches) {
    return std::nullopt;
  }
  // Best confidence first; take the first candidate iconv can decode.
  for (int32_t i = 0; i < iMatches; ++i) {
    UErrorCode nameStatus = U_ZERO_ERROR;
    const char* pName = ucsdet_getName(ppMatches[i], &nameStatus);
    if (U_FAILURE(nameStatus) || !pName) {
      continue;
    }
    std::string sCharset = normalizeCharset(pName);
    if (decodesCleanly(sCharset, svContent, svContent.size() >= kPrefixBytes)) {
      return sCharset;
    }
  }
  return std::nullopt;
}

std::string EncodingDetector::detect(const std::optional<std::string>& oDeclaredCharset,
                                     std::string_view svContent) {
  const bool bTruncated = svContent.size() > kPrefixBytes;
  const std::string_view svPrefix = svContent.substr(0, kPrefixBytes);

  if (oDeclaredCharset) {
    const std::string sDeclared = normalizeCharset(*oDeclaredCharset);
    if (!sDeclared.empty() && decodesCleanly(sDeclared, svPrefix, bTruncated)) {
      return sDeclared;
    }
    common::Logger::get()->debug("Declared charset '{}' does not match content, detecting",
                                 *oDeclaredCharset);
  }

  if (auto oBom = charsetFromBom(svPrefix)) {
    return *oBom;
  }
  if (auto oDocument = charsetFromDocument(svPrefix);
      oDocument && decodesCleanly(*oDocument, svPrefix, bTruncated)) {
    return *oDocument;
  }
  if (decodesCleanly("utf-8", svPrefix, bTruncated)) {
    return "utf-8";
  }
  if (auto oDetected = detectStatistically(svPrefix)) {
    return *oDetected;
  }
  return "utf-8";
}

}  // namespace feedlib::fetch
