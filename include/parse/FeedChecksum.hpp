#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <map>
#include <string>

namespace feedlib::parse {

/// Story identity -> content hash, used to skip unchanged stories.
///
/// Identities and contents are stored as truncated SHA-256 digests, so the
/// persisted form has a fixed width per entry:
///   [version:1] ([ident digest:8][content digest:8])*
/// Entries are ordered oldest to newest by last update.
/// Class abbreviation: fc
class FeedChecksum {
 public:
  static constexpr std::size_t kDigestBytes = 8;
  static constexpr std::uint8_t kFormatVersion = 1;
  static constexpr std::size_t kDefaultDumpLimit = 300;

  FeedChecksum() = default;

  /// Independent snapshot; updates to either side never affect the other.
  FeedChecksum copy() const { return *this; }

  /// Record sContent for sIdent. True when the identity is new or its
  /// content hash changed.
  bool update(const std::string& sIdent, const std::string& sContent);

  std::size_t size() const { return _mEntries.size(); }

  /// Serialize the nLimit most recently updated entries.
  std::string dump(std::size_t nLimit = kDefaultDumpLimit) const;

  /// Throws ChecksumFormatError on a malformed blob.
  static FeedChecksum load(const std::string& sData);

 private:
  using Digest = std::array<std::uint8_t, kDigestBytes>;

  struct Entry {
    Digest dgContent;
    std::uint64_t uSequence = 0;
  };

  static Digest hash(const std::string& sValue);

  std::map<Digest, Entry> _mEntries;
  std::uint64_t _uNextSequence = 0;
};

}  // namespace feedlib::parse
