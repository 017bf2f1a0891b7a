#include "css_lexer.h"

#include <cctype>
#include <cstdint>

#include "../util/string_util.h"

namespace xsel::css {

Lexer::Lexer(const std::string& input) : input_(input) {}

bool Lexer::is_name_start(char c) {
  unsigned char uc = static_cast<unsigned char>(c);
  return std::isalpha(uc) || c == '_' || uc >= 0x80;
}

bool Lexer::is_name_char(char c) {
  unsigned char uc = static_cast<unsigned char>(c);
  return std::isalnum(uc) || c == '_' || c == '-' || uc >= 0x80;
}

bool Lexer::starts_ident(size_t at) const {
  if (at >= input_.size()) return false;
  char c = input_[at];
  if (c == '-') {
    ++at;
    if (at >= input_.size()) return false;
    c = input_[at];
  }
  return is_name_start(c) || c == '\\';
}

Token Lexer::next() {
  if (pos_ >= input_.size()) {
    return Token{TokenType::End, "", pos_};
  }
  size_t start = pos_;
  char c = input_[pos_];
  if (std::isspace(static_cast<unsigned char>(c))) {
    while (pos_ < input_.size() && std::isspace(static_cast<unsigned char>(input_[pos_]))) {
      ++pos_;
    }
    return Token{TokenType::Whitespace, " ", start};
  }
  if (c == '"' || c == '\'') {
    return lex_string();
  }
  if (c == '#' && pos_ + 1 < input_.size() &&
      (is_name_char(input_[pos_ + 1]) || input_[pos_ + 1] == '\\')) {
    ++pos_;
    return lex_name(TokenType::Hash, start);
  }
  if (starts_ident(pos_)) {
    return lex_name(TokenType::Ident, start);
  }
  if (std::isdigit(static_cast<unsigned char>(c)) ||
      (c == '.' && pos_ + 1 < input_.size() &&
       std::isdigit(static_cast<unsigned char>(input_[pos_ + 1])))) {
    return lex_number();
  }
  if ((c == '~' || c == '|' || c == '^' || c == '$' || c == '*' || c == '!') &&
      pos_ + 1 < input_.size() && input_[pos_ + 1] == '=') {
    pos_ += 2;
    return Token{TokenType::Match, input_.substr(start, 2), start};
  }
  ++pos_;
  return Token{TokenType::Delim, std::string(1, c), start};
}

Token Lexer::lex_string() {
  size_t start = pos_;
  char quote = input_[pos_++];
  std::string out;
  while (pos_ < input_.size()) {
    char c = input_[pos_];
    if (c == quote) {
      ++pos_;
      return Token{TokenType::String, out, start};
    }
    if (c == '\\') {
      ++pos_;
      if (pos_ < input_.size() && input_[pos_] == '\n') {
        ++pos_;
        continue;
      }
      out += read_escape();
      continue;
    }
    out.push_back(c);
    ++pos_;
  }
  return Token{TokenType::Invalid, "Unclosed string", start};
}

Token Lexer::lex_name(TokenType type, size_t start) {
  std::string out;
  while (pos_ < input_.size()) {
    char c = input_[pos_];
    if (c == '\\') {
      ++pos_;
      out += read_escape();
      continue;
    }
    if (!is_name_char(c)) break;
    out.push_back(c);
    ++pos_;
  }
  return Token{type, out, start};
}

Token Lexer::lex_number() {
  size_t start = pos_;
  while (pos_ < input_.size() &&
         (std::isdigit(static_cast<unsigned char>(input_[pos_])) || input_[pos_] == '.')) {
    ++pos_;
  }
  return Token{TokenType::Number, input_.substr(start, pos_ - start), start};
}

std::string Lexer::read_escape() {
  if (pos_ >= input_.size()) return "";
  std::string out;
  size_t digits = 0;
  uint32_t cp = 0;
  while (pos_ < input_.size() && digits < 6 &&
         std::isxdigit(static_cast<unsigned char>(input_[pos_]))) {
    char h = input_[pos_++];
    cp = cp * 16 + static_cast<uint32_t>(std::isdigit(static_cast<unsigned char>(h))
                                             ? h - '0'
                                             : std::tolower(static_cast<unsigned char>(h)) - 'a' + 10);
    ++digits;
  }
  if (digits > 0) {
    if (pos_ < input_.size() && std::isspace(static_cast<unsigned char>(input_[pos_]))) {
      ++pos_;
    }
    util::append_utf8(out, cp == 0 ? 0xFFFD : cp);
    return out;
  }
  out.push_back(input_[pos_++]);
  return out;
}

std::string Lexer::read_raw_until_paren() {
  size_t start = pos_;
  while (pos_ < input_.size() && input_[pos_] != ')') {
    ++pos_;
  }
  return input_.substr(start, pos_ - start);
}

}  // namespace xsel::css
