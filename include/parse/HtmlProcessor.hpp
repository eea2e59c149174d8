#pragma once

#include <string>

namespace feedlib::parse {

/// HTML fragment sanitizing and flattening on top of libxml2's HTML parser.
/// All functions take and return UTF-8 fragments (no <html>/<body> wrapper).
/// Class abbreviation: N/A (static interface)
class HtmlProcessor {
 public:
  /// Remove active content: script, style, iframe, object, embed, form
  /// controls, frames, link/meta/base, comments, on* and style attributes,
  /// and javascript:/vbscript: URLs.
  static std::string clean(const std::string& sHtml);

  /// Visible text with entities decoded; block elements become line breaks.
  static std::string toText(const std::string& sHtml);

  /// Resolve relative href/src against sBaseUrl and open http(s) anchors in a
  /// new tab with rel="noopener noreferrer".
  static std::string processLinks(const std::string& sHtml, const std::string& sBaseUrl);

  /// True if the markup contains MathML, TeX delimiters or MathJax/KaTeX.
  static bool hasMathjax(const std::string& sHtml);
};

}  // namespace feedlib::parse
