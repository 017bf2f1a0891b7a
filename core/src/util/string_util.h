#pragma once

#include <cstdint>
#include <string>
#include <string_view>

namespace xsel::util {

/// Converts a string to lowercase for case-insensitive comparisons.
/// MUST avoid locale-sensitive behavior to keep translation deterministic.
std::string to_lower(const std::string& s);
/// Trims leading and trailing ASCII whitespace.
/// MUST preserve internal whitespace and MUST not modify the input.
std::string trim_ws(const std::string& s);
/// Removes every embedded NUL character.
std::string strip_nul(std::string_view s);
/// Returns true when the bytes form well-formed UTF-8 (no overlongs, no surrogates).
bool is_valid_utf8(std::string_view s);
/// Decodes UTF-8 into one wide character per code point; malformed bytes become U+FFFD.
std::wstring utf8_to_wide(std::string_view s);
/// Encodes wide characters (code points) back to UTF-8.
std::string wide_to_utf8(std::wstring_view s);
/// Appends the UTF-8 encoding of a code point; invalid code points append U+FFFD.
void append_utf8(std::string& out, uint32_t code_point);
/// Shortens text to width code units, ending with suffix when cut.
/// MUST return at most width characters; width smaller than the suffix keeps the suffix tail.
std::string shorten(const std::string& text, size_t width, const std::string& suffix = "...");
/// Formats a double in shortest round-trip form ("3.0" for integral values, "nan", "inf").
std::string format_number(double value);

}  // namespace xsel::util
