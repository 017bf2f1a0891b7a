#include "entities.h"

#include <cctype>
#include <cstdint>
#include <optional>

#include <libxml/HTMLparser.h>

#include "string_util.h"

namespace xsel::util {

namespace {

// windows-1252 mapping for 0x80-0x9F; 0 marks the five undefined positions.
constexpr uint32_t kCp1252[32] = {
    0x20AC, 0,      0x201A, 0x0192, 0x201E, 0x2026, 0x2020, 0x2021,
    0x02C6, 0x2030, 0x0160, 0x2039, 0x0152, 0,      0x017D, 0,
    0,      0x2018, 0x2019, 0x201C, 0x201D, 0x2022, 0x2013, 0x2014,
    0x02DC, 0x2122, 0x0161, 0x203A, 0x0153, 0,      0x017E, 0x0178,
};

std::optional<uint32_t> lookup_named(const std::string& name) {
  const htmlEntityDesc* desc = htmlEntityLookup(reinterpret_cast<const xmlChar*>(name.c_str()));
  if (!desc) {
    std::string lower = to_lower(name);
    desc = htmlEntityLookup(reinterpret_cast<const xmlChar*>(lower.c_str()));
  }
  if (!desc) return std::nullopt;
  return static_cast<uint32_t>(desc->value);
}

std::optional<uint32_t> parse_number(const std::string& digits, int base) {
  uint64_t value = 0;
  for (char c : digits) {
    int d = 0;
    if (std::isdigit(static_cast<unsigned char>(c))) {
      d = c - '0';
    } else {
      d = std::tolower(static_cast<unsigned char>(c)) - 'a' + 10;
    }
    value = value * static_cast<uint64_t>(base) + static_cast<uint64_t>(d);
    if (value > 0x10FFFF) return std::nullopt;
  }
  return static_cast<uint32_t>(value);
}

bool append_code_point(std::string& out, uint32_t cp) {
  if (cp >= 0x80 && cp <= 0x9F) {
    uint32_t mapped = kCp1252[cp - 0x80];
    if (mapped == 0) return false;
    append_utf8(out, mapped);
    return true;
  }
  if (cp > 0x10FFFF || (cp >= 0xD800 && cp <= 0xDFFF)) return false;
  append_utf8(out, cp);
  return true;
}

}  // namespace

std::string replace_entities(const std::string& text,
                             const std::set<std::string>& keep,
                             bool remove_illegal) {
  std::string out;
  out.reserve(text.size());
  size_t i = 0;
  while (i < text.size()) {
    if (text[i] != '&') {
      out.push_back(text[i++]);
      continue;
    }
    size_t start = i;
    size_t j = i + 1;
    std::string body;
    int base = 0;
    if (j < text.size() && text[j] == '#') {
      ++j;
      if (j < text.size() && (text[j] == 'x' || text[j] == 'X') && j + 1 < text.size() &&
          std::isxdigit(static_cast<unsigned char>(text[j + 1]))) {
        ++j;
        base = 16;
        while (j < text.size() && std::isxdigit(static_cast<unsigned char>(text[j]))) {
          body.push_back(text[j++]);
        }
      } else {
        base = 10;
        while (j < text.size() && std::isdigit(static_cast<unsigned char>(text[j]))) {
          body.push_back(text[j++]);
        }
      }
    } else {
      while (j < text.size() && std::isalnum(static_cast<unsigned char>(text[j]))) {
        body.push_back(text[j++]);
      }
    }
    if (body.empty()) {
      out.push_back(text[i++]);
      continue;
    }
    bool semicolon = j < text.size() && text[j] == ';';
    size_t end = semicolon ? j + 1 : j;
    std::string original = text.substr(start, end - start);

    if (base == 0 && keep.count(to_lower(body)) > 0) {
      out += original;
      i = end;
      continue;
    }
    std::optional<uint32_t> cp = base == 0 ? lookup_named(body) : parse_number(body, base);
    if (cp.has_value() && append_code_point(out, *cp)) {
      i = end;
      continue;
    }
    if (!(remove_illegal && semicolon)) {
      out += original;
    }
    i = end;
  }
  return out;
}

}  // namespace xsel::util
