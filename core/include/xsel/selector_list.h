#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

#include "xsel/selector.h"

namespace xsel {

/// Ordered result of a query; broadcasts the Selector surface over its elements.
/// MUST preserve result order and MUST flatten per-element results exactly one level.
/// Entries are never dropped by remove(): the list reflects query results, not tree membership.
class SelectorList {
 public:
  using value_type = Selector;
  using iterator = std::vector<Selector>::iterator;
  using const_iterator = std::vector<Selector>::const_iterator;

  SelectorList() = default;
  explicit SelectorList(std::vector<Selector> items);

  size_t size() const { return items_.size(); }
  bool empty() const { return items_.empty(); }
  Selector& operator[](size_t index) { return items_[index]; }
  const Selector& operator[](size_t index) const { return items_[index]; }
  /// Bounds-checked access; negative indices count from the end.
  Selector& at(std::ptrdiff_t index);
  const Selector& at(std::ptrdiff_t index) const;
  iterator begin() { return items_.begin(); }
  iterator end() { return items_.end(); }
  const_iterator begin() const { return items_.begin(); }
  const_iterator end() const { return items_.end(); }
  void push_back(Selector selector) { items_.push_back(std::move(selector)); }
  /// Returns elements [start, stop) as a new list; bounds are clamped, negatives count from the end.
  SelectorList slice(std::ptrdiff_t start, std::ptrdiff_t stop) const;

  SelectorList xpath(const std::string& query,
                     const NamespaceMap& namespaces = {},
                     const XPathVariables& variables = {});
  SelectorList css(const std::string& query);
  SelectorList jmespath(const std::string& query,
                        std::optional<DocumentKind> kind_override = std::nullopt) const;

  std::vector<std::string> re(const std::string& pattern, bool replace_entities = true) const;
  /// First regex match across elements in order, or nullopt.
  std::optional<std::string> re_first(const std::string& pattern,
                                      bool replace_entities = true) const;
  std::string re_first_or(const std::string& pattern,
                          const std::string& default_value,
                          bool replace_entities = true) const;

  std::vector<std::string> getall() const;
  std::vector<std::string> extract() const { return getall(); }
  /// get() of the first element, or nullopt for an empty list.
  std::optional<std::string> get() const;
  std::string get(const std::string& default_value) const;
  std::optional<std::string> extract_first() const { return get(); }

  /// Attributes of the first element; empty for an empty list.
  Attributes attrib() const;

  /// Removes every element's node in order.
  /// MUST stop at the first failure and propagate it.
  void remove();

 private:
  /// Maps a possibly negative index to a position; throws std::out_of_range.
  size_t resolve_index(std::ptrdiff_t index) const;

  std::vector<Selector> items_;
};

}  // namespace xsel
