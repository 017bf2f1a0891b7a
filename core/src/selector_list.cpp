#include "xsel/selector_list.h"

#include <stdexcept>
#include <utility>

#include "util/flatten.h"
#include "util/regex_extract.h"

namespace xsel {

namespace {

std::vector<Selector> flatten_lists(std::vector<SelectorList> lists) {
  std::vector<std::vector<Selector>> nested;
  nested.reserve(lists.size());
  for (auto& list : lists) {
    nested.emplace_back(list.begin(), list.end());
  }
  return util::flatten(std::move(nested));
}

}  // namespace

SelectorList::SelectorList(std::vector<Selector> items) : items_(std::move(items)) {}

size_t SelectorList::resolve_index(std::ptrdiff_t index) const {
  std::ptrdiff_t size = static_cast<std::ptrdiff_t>(items_.size());
  std::ptrdiff_t resolved = index < 0 ? size + index : index;
  if (resolved < 0 || resolved >= size) {
    throw std::out_of_range("SelectorList index out of range");
  }
  return static_cast<size_t>(resolved);
}

Selector& SelectorList::at(std::ptrdiff_t index) {
  return items_[resolve_index(index)];
}

const Selector& SelectorList::at(std::ptrdiff_t index) const {
  return items_[resolve_index(index)];
}

SelectorList SelectorList::slice(std::ptrdiff_t start, std::ptrdiff_t stop) const {
  std::ptrdiff_t size = static_cast<std::ptrdiff_t>(items_.size());
  auto clamp = [size](std::ptrdiff_t at) {
    if (at < 0) at += size;
    if (at < 0) return std::ptrdiff_t{0};
    return at > size ? size : at;
  };
  std::ptrdiff_t from = clamp(start);
  std::ptrdiff_t to = clamp(stop);
  std::vector<Selector> out;
  for (std::ptrdiff_t i = from; i < to; ++i) {
    out.push_back(items_[static_cast<size_t>(i)]);
  }
  return SelectorList(std::move(out));
}

SelectorList SelectorList::xpath(const std::string& query,
                                 const NamespaceMap& namespaces,
                                 const XPathVariables& variables) {
  std::vector<SelectorList> parts;
  parts.reserve(items_.size());
  for (auto& item : items_) {
    parts.push_back(item.xpath(query, namespaces, variables));
  }
  return SelectorList(flatten_lists(std::move(parts)));
}

SelectorList SelectorList::css(const std::string& query) {
  std::vector<SelectorList> parts;
  parts.reserve(items_.size());
  for (auto& item : items_) {
    parts.push_back(item.css(query));
  }
  return SelectorList(flatten_lists(std::move(parts)));
}

SelectorList SelectorList::jmespath(const std::string& query,
                                    std::optional<DocumentKind> kind_override) const {
  std::vector<SelectorList> parts;
  parts.reserve(items_.size());
  for (const auto& item : items_) {
    parts.push_back(item.jmespath(query, kind_override));
  }
  return SelectorList(flatten_lists(std::move(parts)));
}

std::vector<std::string> SelectorList::re(const std::string& pattern,
                                          bool replace_entities) const {
  util::Pattern compiled = util::compile_pattern(pattern);
  std::vector<std::vector<std::string>> parts;
  parts.reserve(items_.size());
  for (const auto& item : items_) {
    parts.push_back(item.re(compiled, replace_entities));
  }
  return util::flatten(std::move(parts));
}

std::optional<std::string> SelectorList::re_first(const std::string& pattern,
                                                  bool replace_entities) const {
  util::Pattern compiled = util::compile_pattern(pattern);
  for (const auto& item : items_) {
    std::vector<std::string> matches = item.re(compiled, replace_entities);
    if (!matches.empty()) return matches.front();
  }
  return std::nullopt;
}

std::string SelectorList::re_first_or(const std::string& pattern,
                                      const std::string& default_value,
                                      bool replace_entities) const {
  return re_first(pattern, replace_entities).value_or(default_value);
}

std::vector<std::string> SelectorList::getall() const {
  std::vector<std::string> out;
  out.reserve(items_.size());
  for (const auto& item : items_) {
    out.push_back(item.get());
  }
  return out;
}

std::optional<std::string> SelectorList::get() const {
  if (items_.empty()) return std::nullopt;
  return items_.front().get();
}

std::string SelectorList::get(const std::string& default_value) const {
  return get().value_or(default_value);
}

Attributes SelectorList::attrib() const {
  if (items_.empty()) return {};
  return items_.front().attrib();
}

void SelectorList::remove() {
  for (auto& item : items_) {
    item.remove();
  }
}

}  // namespace xsel
