#pragma once

#include <stdexcept>
#include <string>

namespace xsel::css {

/// Html lowercases element and attribute names and knows the HTML form pseudo-classes;
/// Generic keeps names case-sensitive, as XML requires.
enum class Dialect {
  Generic,
  Html,
};

/// Raised for selector syntax errors and for selectors that have no XPath equivalent.
class TranslateError : public std::runtime_error {
 public:
  explicit TranslateError(const std::string& message) : std::runtime_error(message) {}
};

/// Translates a CSS selector group into an XPath expression.
/// Each selector of the group is prefixed with prefix and joined with " | ".
/// Supports the ::text and ::attr(name) pseudo-elements for text and attribute extraction.
std::string css_to_xpath(const std::string& css,
                         Dialect dialect,
                         const std::string& prefix = "descendant-or-self::");

/// Quotes a string as an XPath literal, falling back to concat() when it holds both quotes.
std::string xpath_literal(const std::string& value);

}  // namespace xsel::css
