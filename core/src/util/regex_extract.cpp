#include "regex_extract.h"

#include <locale>
#include <set>
#include <stdexcept>

#include "entities.h"
#include "string_util.h"
#include "xsel/errors.h"

namespace xsel::util {

namespace {

const std::locale& pattern_locale() {
  static const std::locale locale = [] {
    for (const char* name : {"C.UTF-8", "C.utf8", "en_US.UTF-8"}) {
      try {
        return std::locale(name);
      } catch (const std::runtime_error&) {
        // Not installed; try the next one.
      }
    }
    return std::locale::classic();
  }();
  return locale;
}

}  // namespace

Pattern compile_pattern(const std::string& pattern, bool ignore_case) {
  auto syntax = std::regex::ECMAScript;
  if (ignore_case) syntax |= std::regex::icase;
  Pattern compiled;
  compiled.imbue(pattern_locale());
  try {
    compiled.assign(utf8_to_wide(pattern), syntax);
  } catch (const std::regex_error& ex) {
    throw InvalidArgument("Invalid regular expression '" + pattern + "': " + ex.what());
  }
  return compiled;
}

std::vector<std::string> extract_regex(const Pattern& pattern,
                                       const std::string& text,
                                       bool decode_entities) {
  const std::wstring wide = utf8_to_wide(text);
  std::vector<std::string> strings;
  const size_t groups = pattern.mark_count();
  for (auto it = std::wsregex_iterator(wide.begin(), wide.end(), pattern);
       it != std::wsregex_iterator(); ++it) {
    const std::wsmatch& match = *it;
    if (groups == 0) {
      strings.push_back(wide_to_utf8(match.str(0)));
      continue;
    }
    for (size_t g = 1; g <= groups; ++g) {
      strings.push_back(wide_to_utf8(match.str(g)));
    }
  }
  if (!decode_entities) return strings;

  static const std::set<std::string> kKeep = {"lt", "amp"};
  for (auto& s : strings) {
    s = replace_entities(s, kKeep);
  }
  return strings;
}

bool search_first(const Pattern& pattern, const std::string& text, std::string& match) {
  const std::wstring wide = utf8_to_wide(text);
  std::wsmatch found;
  if (!std::regex_search(wide, found, pattern)) return false;
  match = wide_to_utf8(found.str(0));
  return true;
}

std::string replace_matches(const Pattern& pattern,
                            const std::string& text,
                            const std::string& replacement,
                            bool global) {
  auto mode = global ? std::regex_constants::format_default
                     : std::regex_constants::format_first_only;
  return wide_to_utf8(
      std::regex_replace(utf8_to_wide(text), pattern, utf8_to_wide(replacement), mode));
}

}  // namespace xsel::util
