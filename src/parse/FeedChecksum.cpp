#include "parse/FeedChecksum.hpp"

#include "common/Errors.hpp"

#include <openssl/evp.h>

#include <algorithm>
#include <cstring>
#include <vector>

namespace feedlib::parse {

FeedChecksum::Digest FeedChecksum::hash(const std::string& sValue) {
  unsigned char vMd[EVP_MAX_MD_SIZE];
  unsigned int uMdLen = 0;
  if (EVP_Digest(sValue.data(), sValue.size(), vMd, &uMdLen, EVP_sha256(), nullptr) != 1 ||
      uMdLen < kDigestBytes) {
    throw common::FeedError("digest_failed", "SHA-256 digest failed");
  }
  Digest dg{};
  std::memcpy(dg.data(), vMd, kDigestBytes);
  return dg;
}

bool FeedChecksum::update(const std::string& sIdent, const std::string& sContent) {
  const Digest dgIdent = hash(sIdent);
  const Digest dgContent = hash(sContent);

  auto it = _mEntries.find(dgIdent);
  const bool bChanged = it == _mEntries.end() || it->second.dgContent != dgContent;
  _mEntries[dgIdent] = Entry{dgContent, _uNextSequence++};
  return bChanged;
}

std::string FeedChecksum::dump(std::size_t nLimit) const {
  using EntryRef = std::pair<const Digest*, const Entry*>;
  std::vector<EntryRef> vEntries;
  vEntries.reserve(_mEntries.size());
  for (const auto& [dgIdent, entry] : _mEntries) {
    vEntries.emplace_back(&dgIdent, &entry);
  }
  std::sort(vEntries.begin(), vEntries.end(), [](const EntryRef& a, const EntryRef& b) {
    return a.second->uSequence < b.second->uSequence;
  });
  if (vEntries.size() > nLimit) {
    vEntries.erase(vEntries.begin(), vEntries.end() - static_cast<std::ptrdiff_t>(nLimit));
  }

  std::string sData;
  sData.reserve(1 + vEntries.size() * kDigestBytes * 2);
  sData.push_back(static_cast<char>(kFormatVersion));
  for (const auto& [pIdent, pEntry] : vEntries) {
    sData.append(reinterpret_cast<const char*>(pIdent->data()), kDigestBytes);
    sData.append(reinterpret_cast<const char*>(pEntry->dgContent.data()), kDigestBytes);
  }
  return sData;
}

FeedChecksum FeedChecksum::load(const std::string& sData) {
  if (sData.empty()) {
    throw common::ChecksumFormatError("empty_checksum", "Checksum data is empty");
  }
  if (static_cast<std::uint8_t>(sData[0]) != kFormatVersion) {
    throw common::ChecksumFormatError(
        "unsupported_version",
        "Unsupported checksum version " + std::to_string(static_cast<std::uint8_t>(sData[0])));
  }
  constexpr std::size_t kEntryBytes = kDigestBytes * 2;
  if ((sData.size() - 1) % kEntryBytes != 0) {
    throw common::ChecksumFormatError("truncated_checksum",
                                      "Checksum data length " + std::to_string(sData.size()) +
                                          " is not a whole number of entries");
  }

  FeedChecksum fc;
  for (std::size_t nOffset = 1; nOffset < sData.size(); nOffset += kEntryBytes) {
    Digest dgIdent{};
    Digest dgContent{};
    std::memcpy(dgIdent.data(), sData.data() + nOffset, kDigestBytes);
    std::memcpy(dgContent.data(), sData.data() + nOffset + kDigestBytes, kDigestBytes);
    fc._mEntries[dgIdent] = Entry{dgContent, fc._uNextSequence++};
  }
  return fc;
}

}  // namespace feedlib::parse
