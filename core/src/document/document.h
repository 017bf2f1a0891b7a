#pragma once

#include <memory>
#include <optional>
#include <string>
#include <vector>

#include <libxml/tree.h>

#include "xsel/selector.h"

namespace xsel {

/// Owns one libxml2 document and every node ever detached from it.
/// MUST free detached nodes before the document itself (they borrow its dictionary).
/// Shared through std::shared_ptr by every selector navigated from the same root.
class Document {
 public:
  Document(xmlDocPtr doc, DocumentKind kind);
  ~Document();

  Document(const Document&) = delete;
  Document& operator=(const Document&) = delete;

  xmlDocPtr doc() const { return doc_; }
  /// Returns the document element (never null for a materialized document).
  xmlNodePtr root() const;
  DocumentKind kind() const { return kind_; }

  /// Unlinks node from its parent and keeps it alive for outstanding handles.
  void detach(xmlNodePtr node);
  /// Drops namespaces from node and its descendants. Their declarations are unlinked but kept
  /// until destruction, since detached nodes may still point at them.
  void strip_namespaces(xmlNodePtr node);

 private:
  xmlDocPtr doc_ = nullptr;
  DocumentKind kind_ = DocumentKind::Html;
  std::vector<xmlNodePtr> detached_;
  std::vector<xmlNsPtr> retired_namespaces_;
};

/// Parses text into a document of the given tree kind (Html or Xml).
/// MUST never throw on malformed markup: the parser recovers, and a document without a root
/// element is replaced by `<html/>`. The XML path never resolves external entities.
/// base_url becomes the document URL used for relative reference resolution.
std::shared_ptr<Document> materialize_root(const std::string& text,
                                           DocumentKind kind,
                                           const std::optional<std::string>& base_url);

/// Serializes one node without its tail, with HTML or XML output rules.
std::string serialize_node(xmlNodePtr node, DocumentKind kind);
/// Returns the text before the first child element (nullopt when there is none).
std::optional<std::string> direct_text(xmlNodePtr node);
/// Returns the string value of a non-element node (attribute value, text content).
std::string node_string_value(xmlNodePtr node);
/// Collects attributes of an element; namespaced names are written `{uri}local`.
Attributes node_attributes(xmlNodePtr node);

}  // namespace xsel
