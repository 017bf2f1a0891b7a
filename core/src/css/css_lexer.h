#pragma once

#include <cstddef>
#include <string>

namespace xsel::css {

enum class TokenType {
  Ident,
  Hash,
  String,
  Number,
  Whitespace,
  Delim,
  Match,  // ~= |= ^= $= *= !=
  End,
  Invalid,
};

struct Token {
  TokenType type = TokenType::End;
  std::string text;
  size_t pos = 0;
};

/// Tokenizes a CSS selector group.
/// Whitespace is a token because it is the descendant combinator.
class Lexer {
 public:
  explicit Lexer(const std::string& input);
  Token next();
  /// Consumes raw text up to (not including) the matching close paren at the current position.
  /// Used for nth-* arguments, whose an+b syntax does not tokenize cleanly.
  std::string read_raw_until_paren();
  size_t position() const { return pos_; }

 private:
  Token lex_string();
  Token lex_name(TokenType type, size_t start);
  Token lex_number();
  bool starts_ident(size_t at) const;
  std::string read_escape();

  static bool is_name_start(char c);
  static bool is_name_char(char c);

  const std::string& input_;
  size_t pos_ = 0;
};

}  // namespace xsel::css
