#pragma once

#include <regex>
#include <string>
#include <vector>

namespace xsel::util {

/// Patterns run over UTF-32 so that `.`, classes and `\w` see whole code points.
using Pattern = std::wregex;

/// Compiles a UTF-8 ECMAScript pattern, classifying characters with a UTF-8 locale when one
/// is installed.
/// MUST throw xsel::InvalidArgument (never std::regex_error) for a malformed pattern.
Pattern compile_pattern(const std::string& pattern, bool ignore_case = false);

/// Collects all non-overlapping matches of pattern in UTF-8 text.
/// Without groups every whole match is returned; with groups every group of every match is
/// returned in order (unmatched groups as empty strings).
/// When decode_entities is set, each result has character references decoded except
/// &amp; and &lt;.
std::vector<std::string> extract_regex(const Pattern& pattern,
                                       const std::string& text,
                                       bool decode_entities);

/// Stores the first match of pattern in text; false when there is none.
bool search_first(const Pattern& pattern, const std::string& text, std::string& match);

/// Replaces the first match (or every match when global is set) with an ECMAScript format.
std::string replace_matches(const Pattern& pattern,
                            const std::string& text,
                            const std::string& replacement,
                            bool global);

}  // namespace xsel::util
