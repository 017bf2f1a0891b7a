#pragma once

#include <cstddef>
#include <iosfwd>
#include <map>
#include <memory>
#include <optional>
#include <regex>
#include <string>
#include <unordered_map>
#include <variant>
#include <vector>

#include <nlohmann/json.hpp>

struct _xmlNode;

namespace xsel {

class Document;
class SelectorList;

/// Identifies which document model and query languages apply to a selector.
/// MUST stay a closed set; every dispatch point switches over all four values.
enum class DocumentKind {
  Html,
  Xml,
  Json,
  Text,
};

/// Parses a kind name (`html`, `xml`, `json`, `text`); returns nullopt for anything else.
std::optional<DocumentKind> parse_document_kind(const std::string& name);
/// Returns the lowercase name of a kind.
const char* document_kind_name(DocumentKind kind);

using Json = nlohmann::ordered_json;
using NamespaceMap = std::map<std::string, std::string>;
using XPathVariable = std::variant<std::string, double, bool>;
using XPathVariables = std::map<std::string, XPathVariable>;
using Attributes = std::unordered_map<std::string, std::string>;

/// Handle on one node of a parsed tree.
/// The document is shared by every selector navigated from the same root; the node pointer is
/// owned by that document, attached or detached, for as long as the handle lives.
struct TreeRef {
  std::shared_ptr<Document> document;
  _xmlNode* node = nullptr;
};

/// Value held by a selector: absent (failed JSON parse), a tree node, a JSON value, or a string.
using SelectorRoot = std::variant<std::monostate, TreeRef, Json, std::string>;

/// Construction options shared by every selector factory.
/// `type` is validated by name so unknown kinds surface as InvalidArgument.
struct SelectorOptions {
  std::optional<std::string> type;
  NamespaceMap namespaces;
  std::optional<std::string> base_url;
  /// Producing query, kept for repr() only.
  std::optional<std::string> expression;
};

/// Returns the namespaces every new selector starts with (`re` and `set` EXSLT prefixes).
const NamespaceMap& default_namespaces();

/// Wraps one parsed document fragment and exposes XPath, CSS and JMESPath querying over it.
/// Results are SelectorLists of new Selectors, so every result can be queried again.
/// Copies share the underlying tree; removal through one copy is visible through all of them.
class Selector {
 public:
  /// Parses text according to options.type (html when unset).
  /// MUST reject invalid UTF-8 and unknown type names with InvalidArgument.
  explicit Selector(const std::string& text, const SelectorOptions& options = {});
  /// General constructor: exactly the original argument set (text, root, options).
  /// MUST throw InvalidArgument when neither text nor root is supplied.
  Selector(const std::optional<std::string>& text,
           const std::optional<SelectorRoot>& root,
           const SelectorOptions& options);

  /// Wraps an already parsed value; kind defaults to html for tree nodes and json otherwise.
  static Selector from_root(SelectorRoot root, const SelectorOptions& options = {});

  DocumentKind kind() const { return kind_; }
  const SelectorRoot& root() const { return root_; }
  const NamespaceMap& namespaces() const { return namespaces_; }
  const std::optional<std::string>& expression() const { return expression_; }
  /// True when JSON text given at construction failed to parse and the root is absent.
  bool json_parse_failed() const { return json_parse_failed_; }

  /// Evaluates an XPath expression against the held node.
  /// MUST promote text selectors to html first and MUST reject json selectors.
  /// Call-scoped namespaces apply to this call only and are not copied into results.
  SelectorList xpath(const std::string& query,
                     const NamespaceMap& namespaces = {},
                     const XPathVariables& variables = {});
  /// Translates a CSS selector to XPath with the kind's dialect and evaluates it.
  SelectorList css(const std::string& query);
  /// Evaluates a JMESPath expression against the held JSON value, or against JSON text found
  /// in the held string or element. Unparseable JSON is queried as null.
  SelectorList jmespath(const std::string& query,
                        std::optional<DocumentKind> kind_override = std::nullopt) const;

  /// Serializes the held value: markup for tree nodes, the string itself for strings,
  /// compact JSON for other JSON values.
  std::string get() const;
  std::vector<std::string> getall() const;
  std::string extract() const { return get(); }
  std::vector<std::string> extract_all() const { return getall(); }

  /// Applies a regex to get() and returns matches (group texts when the pattern has groups).
  /// Character references are decoded unless replace_entities is false; &amp; and &lt; stay.
  /// Matching is per code point, so results are always valid UTF-8.
  std::vector<std::string> re(const std::string& pattern, bool replace_entities = true) const;
  /// Precompiled form; the pattern works on UTF-32 text.
  std::vector<std::string> re(const std::wregex& pattern, bool replace_entities = true) const;
  std::optional<std::string> re_first(const std::string& pattern,
                                      bool replace_entities = true) const;
  std::string re_first_or(const std::string& pattern,
                          const std::string& default_value,
                          bool replace_entities = true) const;

  /// Returns the attributes of the held element; empty for anything else.
  Attributes attrib() const;

  /// Registers a prefix for future xpath()/css() calls on this selector.
  void register_namespace(const std::string& prefix, const std::string& uri);
  /// Strips namespaces from every element and attribute below the held node and drops the
  /// now unused declarations, so plain names match in XPath.
  void remove_namespaces();

  /// Unlinks the held node from its parent.
  /// MUST throw CannotRemoveElementWithoutRoot for non-node selections and
  /// CannotRemoveElementWithoutParent for the document element.
  void remove();

  /// True when get() is non-empty.
  explicit operator bool() const;
  /// Diagnostic form: <Selector xpath='//p' data='<p>x</p>'>.
  std::string repr() const;

 private:
  void load_tree(const std::string& text, DocumentKind kind,
                 const std::optional<std::string>& base_url);
  void promote_to_tree(const char* method);
  Json json_document() const;

  DocumentKind kind_ = DocumentKind::Html;
  SelectorRoot root_;
  NamespaceMap namespaces_;
  std::optional<std::string> expression_;
  std::optional<std::string> raw_text_;
  bool json_parse_failed_ = false;
};

std::ostream& operator<<(std::ostream& os, const Selector& selector);

}  // namespace xsel
