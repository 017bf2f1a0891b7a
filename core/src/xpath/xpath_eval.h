#pragma once

#include <string>
#include <vector>

#include <libxml/tree.h>
#include <libxml/xpath.h>

#include "xsel/selector.h"

namespace xsel::xpath {

/// One entry of an evaluation result, normalized from libxml2's object types.
/// Element, comment and processing-instruction nodes stay nodes; attribute, text and
/// namespace nodes are read out as strings.
struct Item {
  enum class Kind { Node, String, Number, Boolean } kind = Kind::String;
  xmlNodePtr node = nullptr;
  std::string text;
  double number = 0.0;
  bool boolean = false;
};

/// Collects libxml2 error reports raised while one expression is compiled and evaluated.
/// Only the first report of each kind is kept; later ones are follow-on noise.
struct ErrorSink {
  std::string message;
  /// Unstructured text from libxml2's generic error channel.
  std::string generic;
  /// Extra detail from extension functions (e.g. a bad regex inside re:test).
  std::string detail;
};

/// Evaluates query with context as the context node.
/// MUST throw xsel::QueryError for compilation or evaluation failures, never a libxml2 error.
/// Node-set results keep document order; scalar results become a single item.
std::vector<Item> evaluate(xmlNodePtr context,
                           const std::string& query,
                           const NamespaceMap& namespaces,
                           const XPathVariables& variables);

/// Registers the EXSLT regular-expression and set functions on a context.
/// Functions are bound to the EXSLT namespace URIs, so any prefix mapped to them works.
void register_extensions(xmlXPathContextPtr ctx);

extern const char kRegexNamespace[];
extern const char kSetsNamespace[];

}  // namespace xsel::xpath
