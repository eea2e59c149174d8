#pragma once

#include <cstddef>
#include <optional>
#include <stdexcept>
#include <string>
#include <utility>

namespace feedlib::common {

/// Base error for all library-level exceptions.
/// Carries a machine-readable error code slug.
struct FeedError : public std::runtime_error {
  std::string _sErrorCode;

  explicit FeedError(std::string sCode, std::string sMsg)
      : std::runtime_error(std::move(sMsg)), _sErrorCode(std::move(sCode)) {}
};

/// Malformed or inconsistent configuration (env vars, reader options).
struct ConfigError : FeedError {
  explicit ConfigError(std::string sCode, std::string sMsg)
      : FeedError(std::move(sCode), std::move(sMsg)) {}
};

/// A single schema field failed validation.
struct ValidationError : FeedError {
  std::string _sField;

  explicit ValidationError(std::string sField, std::string sCode, std::string sMsg)
      : FeedError(std::move(sCode), std::move(sMsg)), _sField(std::move(sField)) {}
};

/// Parse aborted by a hard validation failure.
/// _oStoryIndex is set when the failure belongs to a story (position in storys).
struct FeedParserError : FeedError {
  std::string _sField;
  std::optional<std::size_t> _oStoryIndex;

  explicit FeedParserError(std::string sField, std::optional<std::size_t> oStoryIndex,
                           std::string sCode, std::string sMsg)
      : FeedError(std::move(sCode), std::move(sMsg)),
        _sField(std::move(sField)),
        _oStoryIndex(oStoryIndex) {}
};

/// Persisted checksum blob could not be decoded.
struct ChecksumFormatError : FeedError {
  explicit ChecksumFormatError(std::string sCode, std::string sMsg)
      : FeedError(std::move(sCode), std::move(sMsg)) {}
};

}  // namespace feedlib::common
