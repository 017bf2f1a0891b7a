#include "document.h"

#include <mutex>

#include <libxml/HTMLparser.h>
#include <libxml/HTMLtree.h>
#include <libxml/parser.h>
#include <libxml/xmlIO.h>

#include "../util/string_util.h"

namespace xsel {

namespace {

const char kEmptyDocument[] = "<html/>";

void ensure_parser_initialized() {
  static std::once_flag once;
  std::call_once(once, [] { xmlInitParser(); });
}

xmlDocPtr parse_bytes(const std::string& body, DocumentKind kind, const char* url) {
  if (kind == DocumentKind::Xml) {
    // External entities stay unresolved: no XML_PARSE_NOENT, no XML_PARSE_DTDLOAD.
    return xmlReadMemory(body.data(), static_cast<int>(body.size()), url, "UTF-8",
                         XML_PARSE_RECOVER | XML_PARSE_NONET | XML_PARSE_NOCDATA |
                             XML_PARSE_NOERROR | XML_PARSE_NOWARNING);
  }
  return htmlReadMemory(body.data(), static_cast<int>(body.size()), url, "UTF-8",
                        HTML_PARSE_RECOVER | HTML_PARSE_NONET | HTML_PARSE_COMPACT |
                            HTML_PARSE_NOERROR | HTML_PARSE_NOWARNING);
}

void collect_elements(xmlNodePtr node, std::vector<xmlNodePtr>& out) {
  if (!node || node->type != XML_ELEMENT_NODE) return;
  out.push_back(node);
  for (xmlNodePtr child = node->children; child != nullptr; child = child->next) {
    collect_elements(child, out);
  }
}

}  // namespace

Document::Document(xmlDocPtr doc, DocumentKind kind) : doc_(doc), kind_(kind) {}

Document::~Document() {
  for (xmlNodePtr node : detached_) {
    xmlFreeNode(node);
  }
  for (xmlNsPtr ns : retired_namespaces_) {
    xmlFreeNsList(ns);
  }
  if (doc_) {
    xmlFreeDoc(doc_);
  }
}

xmlNodePtr Document::root() const {
  return xmlDocGetRootElement(doc_);
}

void Document::detach(xmlNodePtr node) {
  xmlUnlinkNode(node);
  detached_.push_back(node);
}

void Document::strip_namespaces(xmlNodePtr node) {
  std::vector<xmlNodePtr> elements;
  collect_elements(node, elements);
  for (xmlNodePtr el : elements) {
    el->ns = nullptr;
    std::vector<xmlAttrPtr> qualified;
    for (xmlAttrPtr attr = el->properties; attr != nullptr; attr = attr->next) {
      if (attr->ns) qualified.push_back(attr);
    }
    for (xmlAttrPtr attr : qualified) {
      // The qualified attribute wins over an unqualified one of the same local name.
      xmlAttrPtr plain = xmlHasNsProp(el, attr->name, nullptr);
      if (plain && plain != attr && plain->ns == nullptr) {
        xmlRemoveProp(plain);
      }
      attr->ns = nullptr;
    }
    if (el->nsDef) {
      retired_namespaces_.push_back(el->nsDef);
      el->nsDef = nullptr;
    }
  }
}

std::shared_ptr<Document> materialize_root(const std::string& text,
                                           DocumentKind kind,
                                           const std::optional<std::string>& base_url) {
  ensure_parser_initialized();
  std::string body = util::trim_ws(util::strip_nul(text));
  if (body.empty()) {
    body = kEmptyDocument;
  }
  const char* url = base_url ? base_url->c_str() : nullptr;
  xmlDocPtr doc = parse_bytes(body, kind, url);
  if (doc && !xmlDocGetRootElement(doc)) {
    xmlFreeDoc(doc);
    doc = nullptr;
  }
  if (!doc) {
    doc = parse_bytes(kEmptyDocument, kind, url);
  }
  return std::make_shared<Document>(doc, kind);
}

std::string serialize_node(xmlNodePtr node, DocumentKind kind) {
  xmlOutputBufferPtr out = xmlAllocOutputBuffer(nullptr);
  if (!out) return "";
  if (kind == DocumentKind::Html) {
    htmlNodeDumpFormatOutput(out, node->doc, node, "UTF-8", 0);
  } else {
    xmlNodeDumpOutput(out, node->doc, node, 0, 0, "UTF-8");
  }
  xmlOutputBufferFlush(out);
  std::string result;
  const xmlChar* content = xmlOutputBufferGetContent(out);
  if (content) {
    result.assign(reinterpret_cast<const char*>(content), xmlOutputBufferGetSize(out));
  }
  xmlOutputBufferClose(out);
  return result;
}

std::optional<std::string> direct_text(xmlNodePtr node) {
  if (!node) return std::nullopt;
  if (node->type != XML_ELEMENT_NODE) {
    if (!node->content) return std::nullopt;
    return std::string(reinterpret_cast<const char*>(node->content));
  }
  xmlNodePtr child = node->children;
  if (!child || (child->type != XML_TEXT_NODE && child->type != XML_CDATA_SECTION_NODE)) {
    return std::nullopt;
  }
  std::string out;
  for (; child != nullptr; child = child->next) {
    if (child->type != XML_TEXT_NODE && child->type != XML_CDATA_SECTION_NODE) break;
    if (child->content) {
      out += reinterpret_cast<const char*>(child->content);
    }
  }
  return out;
}

std::string node_string_value(xmlNodePtr node) {
  xmlChar* content = xmlNodeGetContent(node);
  if (!content) return "";
  std::string out(reinterpret_cast<const char*>(content));
  xmlFree(content);
  return out;
}

Attributes node_attributes(xmlNodePtr node) {
  Attributes out;
  if (!node || node->type != XML_ELEMENT_NODE) return out;
  for (xmlAttrPtr attr = node->properties; attr != nullptr; attr = attr->next) {
    std::string name = reinterpret_cast<const char*>(attr->name);
    if (attr->ns && attr->ns->href) {
      name = "{" + std::string(reinterpret_cast<const char*>(attr->ns->href)) + "}" + name;
    }
    xmlChar* value = xmlNodeListGetString(node->doc, attr->children, 1);
    if (value) {
      out[name] = reinterpret_cast<const char*>(value);
      xmlFree(value);
    } else {
      out[name] = "";
    }
  }
  return out;
}

}  // namespace xsel
