#pragma once

#include <optional>
#include <string>

#include "css_ast.h"
#include "css_lexer.h"

namespace xsel::css {

struct ParseError {
  std::string message;
  size_t position = 0;
};

struct ParseResult {
  std::optional<SelectorGroup> group;
  std::optional<ParseError> error;
};

/// Parses a comma separated selector group.
/// MUST report the first syntax error with its byte position instead of throwing.
ParseResult parse_selector_group(const std::string& input);

class Parser {
 public:
  explicit Parser(const std::string& input);
  ParseResult parse();

 private:
  bool parse_complex(ComplexSelector& out);
  bool parse_compound(Compound& out, ComplexSelector* owner);
  bool parse_type_selector(Compound& out);
  bool parse_attrib(AttribSelector& out);
  bool parse_pseudo(Compound& compound);
  bool parse_pseudo_element(ComplexSelector& owner);

  void advance();
  void skip_ws();
  bool set_error(const std::string& message);
  static std::string describe(const Token& token);

  Lexer lexer_;
  Token current_;
  bool has_error_ = false;
  ParseError error_;
};

}  // namespace xsel::css
