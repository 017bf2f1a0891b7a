#include "xsel/selector.h"

#include <ostream>
#include <utility>

#include <jmespath/jmespath.h>
#include <libxml/tree.h>

#include "css/css_translator.h"
#include "document/document.h"
#include "util/regex_extract.h"
#include "util/string_util.h"
#include "xpath/xpath_eval.h"
#include "xsel/errors.h"
#include "xsel/selector_list.h"

namespace xsel {

namespace {

const TreeRef* as_tree(const SelectorRoot& root) {
  const TreeRef* tree = std::get_if<TreeRef>(&root);
  if (tree == nullptr || tree->node == nullptr) return nullptr;
  return tree;
}

bool is_tree_kind(DocumentKind kind) {
  return kind == DocumentKind::Html || kind == DocumentKind::Xml;
}

Json parse_json_or_null(const std::string& text) {
  Json parsed = Json::parse(text, nullptr, false);
  if (parsed.is_discarded()) return nullptr;
  return parsed;
}

/// Renders a JSON value as extraction text: strings verbatim, everything else compact.
std::string json_text(const Json& value) {
  if (value.is_string()) return value.get<std::string>();
  return value.dump();
}

/// Quotes a string for repr() output, preferring single quotes.
std::string quote(const std::string& text) {
  char q = (text.find('\'') != std::string::npos && text.find('"') == std::string::npos) ? '"'
                                                                                        : '\'';
  std::string out(1, q);
  for (char c : text) {
    switch (c) {
      case '\\': out += "\\\\"; break;
      case '\n': out += "\\n"; break;
      case '\r': out += "\\r"; break;
      case '\t': out += "\\t"; break;
      default:
        if (c == q) out.push_back('\\');
        out.push_back(c);
    }
  }
  out.push_back(q);
  return out;
}

/// Runs a JMESPath expression through jmespath.cpp, which works on plain nlohmann::json.
/// Values cross the boundary as JSON text: xsel holds ordered_json, the library plain json.
Json search_json(const std::string& query, const Json& document) {
  ::jmespath::Json input = ::jmespath::Json::parse(document.dump());
  ::jmespath::Expression expression(query);
  ::jmespath::Json output = ::jmespath::search(expression, input);
  return Json::parse(output.dump());
}

}  // namespace

std::optional<DocumentKind> parse_document_kind(const std::string& name) {
  if (name == "html") return DocumentKind::Html;
  if (name == "xml") return DocumentKind::Xml;
  if (name == "json") return DocumentKind::Json;
  if (name == "text") return DocumentKind::Text;
  return std::nullopt;
}

const char* document_kind_name(DocumentKind kind) {
  switch (kind) {
    case DocumentKind::Html: return "html";
    case DocumentKind::Xml: return "xml";
    case DocumentKind::Json: return "json";
    case DocumentKind::Text: return "text";
  }
  return "html";
}

const NamespaceMap& default_namespaces() {
  static const NamespaceMap namespaces = {
      {"re", xpath::kRegexNamespace},
      {"set", xpath::kSetsNamespace},
  };
  return namespaces;
}

Selector::Selector(const std::string& text, const SelectorOptions& options)
    : Selector(std::optional<std::string>(text), std::nullopt, options) {}

Selector::Selector(const std::optional<std::string>& text,
                   const std::optional<SelectorRoot>& root,
                   const SelectorOptions& options)
    : namespaces_(default_namespaces()), expression_(options.expression) {
  std::optional<DocumentKind> requested;
  if (options.type.has_value()) {
    requested = parse_document_kind(*options.type);
    if (!requested.has_value()) {
      throw InvalidArgument("Invalid type: " + *options.type);
    }
  }
  if (!text.has_value() && !root.has_value()) {
    throw InvalidArgument("Selector needs either text or root argument");
  }
  for (const auto& entry : options.namespaces) {
    namespaces_[entry.first] = entry.second;
  }

  if (text.has_value()) {
    if (!util::is_valid_utf8(*text)) {
      throw InvalidArgument("text argument should be valid UTF-8 text");
    }
    raw_text_ = text;
    DocumentKind kind = requested.value_or(DocumentKind::Html);
    switch (kind) {
      case DocumentKind::Html:
      case DocumentKind::Xml:
        load_tree(*text, kind, options.base_url);
        break;
      case DocumentKind::Json: {
        kind_ = kind;
        Json parsed = Json::parse(*text, nullptr, false);
        if (parsed.is_discarded()) {
          json_parse_failed_ = true;
          root_ = std::monostate{};
        } else {
          root_ = std::move(parsed);
        }
        break;
      }
      case DocumentKind::Text:
        kind_ = kind;
        root_ = *text;
        break;
    }
    return;
  }

  root_ = *root;
  if (requested.has_value()) {
    kind_ = *requested;
  } else {
    kind_ = std::holds_alternative<TreeRef>(root_) ? DocumentKind::Html : DocumentKind::Json;
  }
}

Selector Selector::from_root(SelectorRoot root, const SelectorOptions& options) {
  return Selector(std::nullopt, std::optional<SelectorRoot>(std::move(root)), options);
}

void Selector::load_tree(const std::string& text, DocumentKind kind,
                         const std::optional<std::string>& base_url) {
  std::shared_ptr<Document> document = materialize_root(text, kind, base_url);
  xmlNodePtr node = document->root();
  kind_ = kind;
  root_ = TreeRef{std::move(document), node};
}

void Selector::promote_to_tree(const char* method) {
  switch (kind_) {
    case DocumentKind::Html:
    case DocumentKind::Xml:
      return;
    case DocumentKind::Text:
      load_tree(get(), DocumentKind::Html, std::nullopt);
      return;
    case DocumentKind::Json:
      break;
  }
  throw UnsupportedOperation(std::string("Cannot use ") + method + " on a Selector of type '" +
                             document_kind_name(kind_) + "'");
}

SelectorList Selector::xpath(const std::string& query,
                             const NamespaceMap& namespaces,
                             const XPathVariables& variables) {
  promote_to_tree("xpath");
  const TreeRef* tree = as_tree(root_);
  if (tree == nullptr) return SelectorList();

  NamespaceMap merged = namespaces_;
  for (const auto& entry : namespaces) {
    merged[entry.first] = entry.second;
  }
  std::vector<xpath::Item> items = xpath::evaluate(tree->node, query, merged, variables);

  SelectorOptions options;
  options.type = document_kind_name(kind_);
  options.namespaces = namespaces_;
  options.expression = query;

  std::vector<Selector> results;
  results.reserve(items.size());
  for (auto& item : items) {
    switch (item.kind) {
      case xpath::Item::Kind::Node:
        results.push_back(from_root(TreeRef{tree->document, item.node}, options));
        break;
      case xpath::Item::Kind::String:
        results.push_back(from_root(std::move(item.text), options));
        break;
      case xpath::Item::Kind::Number:
        results.push_back(from_root(Json(item.number), options));
        break;
      case xpath::Item::Kind::Boolean:
        results.push_back(from_root(Json(item.boolean), options));
        break;
    }
  }
  return SelectorList(std::move(results));
}

SelectorList Selector::css(const std::string& query) {
  promote_to_tree("css");
  css::Dialect dialect = kind_ == DocumentKind::Html ? css::Dialect::Html : css::Dialect::Generic;
  std::string translated;
  try {
    translated = css::css_to_xpath(query, dialect);
  } catch (const css::TranslateError& e) {
    throw QueryError(std::string("CSS error: ") + e.what() + " in " + query, query);
  }
  return xpath(translated);
}

Json Selector::json_document() const {
  if (kind_ == DocumentKind::Json) {
    if (const Json* value = std::get_if<Json>(&root_)) return *value;
    if (const std::string* text = std::get_if<std::string>(&root_)) return *text;
    return nullptr;
  }
  if (const std::string* text = std::get_if<std::string>(&root_)) {
    return parse_json_or_null(*text);
  }
  if (const TreeRef* tree = as_tree(root_)) {
    std::optional<std::string> text = direct_text(tree->node);
    if (text.has_value()) return parse_json_or_null(*text);
    return raw_text_.has_value() ? parse_json_or_null(*raw_text_) : Json();
  }
  if (const Json* value = std::get_if<Json>(&root_)) {
    if (value->is_string()) return parse_json_or_null(value->get<std::string>());
    return *value;
  }
  return nullptr;
}

SelectorList Selector::jmespath(const std::string& query,
                                std::optional<DocumentKind> kind_override) const {
  Json result;
  try {
    result = search_json(query, json_document());
  } catch (const ::jmespath::SyntaxError&) {
    throw QueryError("JMESPath error: invalid syntax in " + query, query);
  } catch (const ::jmespath::Exception&) {
    throw QueryError("JMESPath error: evaluation failed in " + query, query);
  }
  if (result.is_null()) return SelectorList();
  if (!result.is_array()) {
    Json wrapped = Json::array();
    wrapped.push_back(std::move(result));
    result = std::move(wrapped);
  }

  std::vector<Selector> results;
  results.reserve(result.size());
  for (auto& value : result) {
    SelectorOptions options;
    options.expression = query;
    if (value.is_string()) {
      options.type = document_kind_name(kind_override.value_or(DocumentKind::Text));
      results.emplace_back(value.get<std::string>(), options);
    } else {
      if (kind_override.has_value()) options.type = document_kind_name(*kind_override);
      results.push_back(from_root(std::move(value), options));
    }
  }
  return SelectorList(std::move(results));
}

std::string Selector::get() const {
  if (kind_ == DocumentKind::Text || kind_ == DocumentKind::Json) {
    if (const std::string* text = std::get_if<std::string>(&root_)) return *text;
    if (const Json* value = std::get_if<Json>(&root_)) return json_text(*value);
    if (const TreeRef* tree = as_tree(root_)) return serialize_node(tree->node, kind_);
    return "";
  }
  if (const TreeRef* tree = as_tree(root_)) return serialize_node(tree->node, kind_);
  if (const std::string* text = std::get_if<std::string>(&root_)) return *text;
  if (const Json* value = std::get_if<Json>(&root_)) {
    if (value->is_boolean()) return value->get<bool>() ? "1" : "0";
    if (value->is_number_float()) return util::format_number(value->get<double>());
    return json_text(*value);
  }
  return "";
}

std::vector<std::string> Selector::getall() const {
  return {get()};
}

std::vector<std::string> Selector::re(const std::string& pattern, bool replace_entities) const {
  return re(util::compile_pattern(pattern), replace_entities);
}

std::vector<std::string> Selector::re(const std::wregex& pattern, bool replace_entities) const {
  return util::extract_regex(pattern, get(), replace_entities);
}

std::optional<std::string> Selector::re_first(const std::string& pattern,
                                              bool replace_entities) const {
  std::vector<std::string> matches = re(pattern, replace_entities);
  if (matches.empty()) return std::nullopt;
  return matches.front();
}

std::string Selector::re_first_or(const std::string& pattern,
                                  const std::string& default_value,
                                  bool replace_entities) const {
  return re_first(pattern, replace_entities).value_or(default_value);
}

Attributes Selector::attrib() const {
  const TreeRef* tree = as_tree(root_);
  if (tree == nullptr || tree->node->type != XML_ELEMENT_NODE) return {};
  return node_attributes(tree->node);
}

void Selector::register_namespace(const std::string& prefix, const std::string& uri) {
  namespaces_[prefix] = uri;
}

void Selector::remove_namespaces() {
  const TreeRef* tree = as_tree(root_);
  if (tree == nullptr || tree->document == nullptr) return;
  tree->document->strip_namespaces(tree->node);
}

void Selector::remove() {
  const TreeRef* tree = as_tree(root_);
  if (tree == nullptr || tree->document == nullptr) {
    throw CannotRemoveElementWithoutRoot(
        "The node you're trying to remove has no root, are you trying to remove a "
        "pseudo-element? Try to use 'li' as a selector instead of 'li::text' or '//li' "
        "instead of '//li/text()', for example.");
  }
  xmlNodePtr parent = tree->node->parent;
  if (parent == nullptr || parent->type == XML_DOCUMENT_NODE ||
      parent->type == XML_HTML_DOCUMENT_NODE) {
    throw CannotRemoveElementWithoutParent(
        "The node you're trying to remove has no parent, are you trying to remove a root "
        "element?");
  }
  tree->document->detach(tree->node);
}

Selector::operator bool() const {
  return !get().empty();
}

std::string Selector::repr() const {
  std::string data = quote(util::shorten(get(), 40));
  const char* field = kind_ == DocumentKind::Json ? "jmespath" : "xpath";
  std::string expression = expression_.has_value() ? quote(*expression_) : "None";
  return std::string("<Selector ") + field + "=" + expression + " data=" + data + ">";
}

std::ostream& operator<<(std::ostream& os, const Selector& selector) {
  return os << selector.repr();
}

}  // namespace xsel
