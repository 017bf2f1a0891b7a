#pragma once

#include <exception>
#include <string>
#include <vector>

#include "xsel/xsel.h"

inline xsel::SelectorOptions options_of_type(const std::string& type) {
  xsel::SelectorOptions options;
  options.type = type;
  return options;
}

inline xsel::Selector xml_selector(const std::string& text) {
  return xsel::Selector(text, options_of_type("xml"));
}

inline xsel::Selector json_selector(const std::string& text) {
  return xsel::Selector(text, options_of_type("json"));
}

inline xsel::Selector text_selector(const std::string& text) {
  return xsel::Selector(text, options_of_type("text"));
}

/// True when fn throws exactly the error type E (or a subclass).
template <typename E, typename Fn>
bool throws_as(Fn&& fn) {
  try {
    fn();
  } catch (const E&) {
    return true;
  } catch (const std::exception&) {
    return false;
  }
  return false;
}

inline std::string join(const std::vector<std::string>& values, const std::string& sep = "|") {
  std::string out;
  for (size_t i = 0; i < values.size(); ++i) {
    if (i > 0) out += sep;
    out += values[i];
  }
  return out;
}
