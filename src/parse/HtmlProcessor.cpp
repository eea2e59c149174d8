#include "parse/HtmlProcessor.hpp"

#include "common/TextUtils.hpp"
#include "common/UrlUtils.hpp"

#include <libxml/HTMLparser.h>
#include <libxml/HTMLtree.h>
#include <libxml/parser.h>
#include <libxml/tree.h>
#include <libxml/xmlIO.h>

#include <array>
#include <cstring>
#include <memory>
#include <mutex>
#include <string_view>

namespace feedlib::parse {

namespace {

using XmlDocPtr = std::unique_ptr<xmlDoc, decltype(&xmlFreeDoc)>;

constexpr const char* kWrapperOpen = "<div data-feedlib-root=\"1\">";
constexpr const char* kWrapperClose = "</div>";

constexpr std::array<std::string_view, 22> kDroppedElements = {
    "script", "style",  "iframe", "object", "embed",  "applet", "form",  "input",    "button",
    "select", "textarea", "link", "meta",   "base",   "frame",  "frameset", "noscript", "title",
    "animate", "set", "animatetransform", "animatemotion",
};

constexpr std::array<std::string_view, 8> kUrlAttributes = {
    "href", "src", "action", "formaction", "background", "poster", "cite", "longdesc",
};

constexpr std::array<std::string_view, 25> kBlockElements = {
    "p",  "div", "br", "li",    "ul",    "ol",      "dl",         "dt",      "dd",
    "h1", "h2",  "h3", "h4",    "h5",    "h6",      "tr",         "table",   "blockquote",
    "pre", "hr", "section", "article", "header", "footer", "figure",
};

std::once_flag g_xmlInitFlag;

template <std::size_t N>
bool contains(const std::array<std::string_view, N>& vValues, std::string_view svName) {
  for (const auto& sv : vValues) {
    if (sv == svName) return true;
  }
  return false;
}

std::string_view nodeName(xmlNodePtr pNode) {
  return pNode->name ? std::string_view(reinterpret_cast<const char*>(pNode->name))
                     : std::string_view{};
}

std::string propValue(xmlNodePtr pNode, const xmlChar* pName) {
  xmlChar* pValue = xmlGetProp(pNode, pName);
  if (!pValue) return {};
  std::string sValue(reinterpret_cast<const char*>(pValue));
  xmlFree(pValue);
  return sValue;
}

std::string attrValue(xmlAttrPtr pAttr) {
  xmlChar* pValue = xmlNodeListGetString(pAttr->doc, pAttr->children, 1);
  if (!pValue) return {};
  std::string sValue(reinterpret_cast<const char*>(pValue));
  xmlFree(pValue);
  return sValue;
}

XmlDocPtr parseFragment(const std::string& sHtml) {
  std::call_once(g_xmlInitFlag, []() { xmlInitParser(); });
  const std::string sWrapped = kWrapperOpen + sHtml + kWrapperClose;
  return XmlDocPtr(htmlReadMemory(sWrapped.data(), static_cast<int>(sWrapped.size()), nullptr,
                                  "UTF-8",
                                  HTML_PARSE_RECOVER | HTML_PARSE_NOERROR |
                                      HTML_PARSE_NOWARNING | HTML_PARSE_NONET),
                   &xmlFreeDoc);
}

xmlNodePtr findBody(xmlDocPtr pDoc) {
  xmlNodePtr pRoot = xmlDocGetRootElement(pDoc);
  if (!pRoot) return nullptr;
  for (xmlNodePtr p = pRoot->children; p; p = p->next) {
    if (p->type == XML_ELEMENT_NODE && nodeName(p) == "body") return p;
  }
  return nullptr;
}

bool isWrapper(xmlNodePtr pNode) {
  return pNode->type == XML_ELEMENT_NODE && nodeName(pNode) == "div" &&
         propValue(pNode, BAD_CAST "data-feedlib-root") == "1";
}

/// Children of body, with the wrapper element replaced by its own children.
template <typename Fn>
void forEachTopLevel(xmlNodePtr pBody, Fn&& fnVisit) {
  xmlNodePtr pNext = nullptr;
  for (xmlNodePtr p = pBody->children; p; p = pNext) {
    pNext = p->next;
    if (isWrapper(p)) {
      xmlNodePtr pInnerNext = nullptr;
      for (xmlNodePtr q = p->children; q; q = pInnerNext) {
        pInnerNext = q->next;
        fnVisit(q);
      }
    } else {
      fnVisit(p);
    }
  }
}

std::string serialize(xmlDocPtr pDoc) {
  xmlNodePtr pBody = findBody(pDoc);
  if (!pBody) return {};

  std::unique_ptr<xmlBuffer, decltype(&xmlBufferFree)> upBuffer(xmlBufferCreate(),
                                                                 &xmlBufferFree);
  if (!upBuffer) {
    throw std::bad_alloc();
  }
  xmlOutputBufferPtr pOut = xmlOutputBufferCreateBuffer(upBuffer.get(), nullptr);
  if (!pOut) {
    throw std::bad_alloc();
  }
  forEachTopLevel(pBody, [&](xmlNodePtr p) {
    htmlNodeDumpFormatOutput(pOut, pDoc, p, "UTF-8", 0);
  });
  xmlOutputBufferClose(pOut);  // flushes into upBuffer

  const xmlChar* pContent = xmlBufferContent(upBuffer.get());
  if (!pContent) return {};
  return std::string(reinterpret_cast<const char*>(pContent),
                     static_cast<std::size_t>(xmlBufferLength(upBuffer.get())));
}

bool isDangerousUrl(const std::string& sValue) {
  std::string sCompact;
  for (char c : sValue) {
    if (static_cast<unsigned char>(c) > 0x20) sCompact += c;
  }
  sCompact = common::toLower(sCompact);
  return sCompact.rfind("javascript:", 0) == 0 || sCompact.rfind("vbscript:", 0) == 0 ||
         sCompact.rfind("data:text/html", 0) == 0;
}

void sanitizeNode(xmlNodePtr pNode) {
  xmlNodePtr pNext = nullptr;
  for (xmlNodePtr pChild = pNode->children; pChild; pChild = pNext) {
    pNext = pChild->next;
    if (pChild->type == XML_COMMENT_NODE ||
        (pChild->type == XML_ELEMENT_NODE && contains(kDroppedElements, nodeName(pChild)))) {
      xmlUnlinkNode(pChild);
      xmlFreeNode(pChild);
      continue;
    }
    if (pChild->type != XML_ELEMENT_NODE) {
      continue;
    }

    xmlAttrPtr pAttrNext = nullptr;
    for (xmlAttrPtr pAttr = pChild->properties; pAttr; pAttr = pAttrNext) {
      pAttrNext = pAttr->next;
      const std::string sName =
          common::toLower(reinterpret_cast<const char*>(pAttr->name));
      // xlink:href and friends keep their prefix in the HTML parser
      const auto nColon = sName.rfind(':');
      const std::string sLocalName =
          nColon == std::string::npos ? sName : sName.substr(nColon + 1);
      const bool bHandler = sLocalName.size() > 2 && sLocalName.compare(0, 2, "on") == 0;
      const bool bBadUrl = contains(kUrlAttributes, sLocalName) &&
                           isDangerousUrl(attrValue(pAttr));
      if (bHandler || sName == "style" || bBadUrl) {
        xmlRemoveProp(pAttr);
      }
    }
    sanitizeNode(pChild);
  }
}

void collectText(xmlNodePtr pNode, std::string& sOut) {
  for (xmlNodePtr p = pNode->children; p; p = p->next) {
    if (p->type == XML_TEXT_NODE || p->type == XML_CDATA_SECTION_NODE) {
      if (p->content) sOut += reinterpret_cast<const char*>(p->content);
      continue;
    }
    if (p->type != XML_ELEMENT_NODE) continue;
    const auto svName = nodeName(p);
    if (svName == "script" || svName == "style" || svName == "noscript" || svName == "title") {
      continue;
    }
    const bool bBlock = contains(kBlockElements, svName);
    if (bBlock) sOut += '\n';
    collectText(p, sOut);
    if (bBlock) sOut += '\n';
  }
}

void rewriteLinks(xmlNodePtr pNode, const std::string& sBaseUrl) {
  for (xmlNodePtr p = pNode->children; p; p = p->next) {
    if (p->type != XML_ELEMENT_NODE) continue;

    for (const char* pAttr : {"href", "src"}) {
      const xmlChar* pName = BAD_CAST pAttr;
      if (!xmlHasProp(p, pName)) continue;
      const std::string sValue = common::trim(propValue(p, pName));
      if (sValue.empty() || sValue.front() == '#') continue;
      const std::string sAbsolute = common::normalizeUrl(sValue, sBaseUrl);
      xmlSetProp(p, pName, BAD_CAST sAbsolute.c_str());
    }

    if (nodeName(p) == "a" && xmlHasProp(p, BAD_CAST "href")) {
      const std::string sHref = common::toLower(propValue(p, BAD_CAST "href"));
      if (sHref.rfind("http://", 0) == 0 || sHref.rfind("https://", 0) == 0) {
        xmlSetProp(p, BAD_CAST "target", BAD_CAST "_blank");
        xmlSetProp(p, BAD_CAST "rel", BAD_CAST "noopener noreferrer");
      }
    }
    rewriteLinks(p, sBaseUrl);
  }
}

}  // namespace

std::string HtmlProcessor::clean(const std::string& sHtml) {
  if (common::trim(sHtml).empty()) return {};
  auto upDoc = parseFragment(sHtml);
  if (!upDoc) return {};
  xmlNodePtr pBody = findBody(upDoc.get());
  if (!pBody) return {};
  sanitizeNode(pBody);
  return serialize(upDoc.get());
}

std::string HtmlProcessor::toText(const std::string& sHtml) {
  if (common::trim(sHtml).empty()) return {};
  auto upDoc = parseFragment(sHtml);
  if (!upDoc) return {};
  xmlNodePtr pBody = findBody(upDoc.get());
  if (!pBody) return {};

  std::string sRaw;
  collectText(pBody, sRaw);

  // Trim each line and squeeze blank lines.
  std::string sResult;
  size_t nStart = 0;
  while (nStart <= sRaw.size()) {
    const size_t nEnd = sRaw.find('\n', nStart);
    const std::string sLine = common::trim(
        sRaw.substr(nStart, nEnd == std::string::npos ? std::string::npos : nEnd - nStart));
    if (!sLine.empty()) {
      if (!sResult.empty()) sResult += '\n';
      sResult += sLine;
    }
    if (nEnd == std::string::npos) break;
    nStart = nEnd + 1;
  }
  return sResult;
}

std::string HtmlProcessor::processLinks(const std::string& sHtml, const std::string& sBaseUrl) {
  if (common::trim(sHtml).empty()) return {};
  auto upDoc = parseFragment(sHtml);
  if (!upDoc) return sHtml;
  xmlNodePtr pBody = findBody(upDoc.get());
  if (!pBody) return sHtml;
  rewriteLinks(pBody, sBaseUrl);
  return serialize(upDoc.get());
}

bool HtmlProcessor::hasMathjax(const std::string& sHtml) {
  const std::string sLower = common::toLower(sHtml);
  if (sLower.find("<math") != std::string::npos || sLower.find("mathjax") != std::string::npos ||
      sLower.find("katex") != std::string::npos) {
    return true;
  }
  const auto pairedDelimiter = [&sHtml](const char* pOpen, const char* pClose) {
    const auto nOpen = sHtml.find(pOpen);
    return nOpen != std::string::npos &&
           sHtml.find(pClose, nOpen + std::strlen(pOpen)) != std::string::npos;
  };
  return pairedDelimiter("$$", "$$") || pairedDelimiter("\\(", "\\)") ||
         pairedDelimiter("\\[", "\\]");
}

}  // namespace feedlib::parse
