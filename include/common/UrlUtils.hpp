#pragma once

#include <cstddef>
#include <optional>
#include <string>

namespace feedlib::common {

/// Longest URL accepted by validateUrl().
constexpr std::size_t kMaxUrlLength = 2048;

/// Components of an absolute URL as understood by the transport.
/// Class abbreviation: up
struct UrlParts {
  std::string sScheme;  // lowercase
  std::string sHost;    // without IPv6 brackets
  int iPort = 0;        // explicit or scheme default
  std::string sPath;
};

/// Parse an absolute URL with libcurl's URL API.
/// Returns nullopt for relative or malformed input.
std::optional<UrlParts> parseUrl(const std::string& sUrl);

/// Normalize a possibly relative, protocol-relative or scheme-less URL.
/// Relative references resolve against sBaseUrl; without a base, http:// is assumed.
/// Never throws; input that cannot be normalized is returned trimmed.
std::string normalizeUrl(const std::string& sUrl, const std::string& sBaseUrl = {});

/// Returns the URL when it is an absolute http(s) URL with a host and at most
/// kMaxUrlLength characters, nullopt otherwise.
std::optional<std::string> validateUrl(const std::string& sUrl);

/// Lowercased path extension (".xml" -> "xml"), empty if none.
std::string urlPathExtension(const std::string& sUrl);

}  // namespace feedlib::common
