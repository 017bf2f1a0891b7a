#include "css_parser.h"

#include "../util/string_util.h"

namespace xsel::css {

namespace {

bool is_delim(const Token& token, char c) {
  return token.type == TokenType::Delim && token.text.size() == 1 && token.text[0] == c;
}

bool ends_selector(const Token& token) {
  return token.type == TokenType::End || is_delim(token, ',');
}

}  // namespace

ParseResult parse_selector_group(const std::string& input) {
  Parser parser(input);
  return parser.parse();
}

Parser::Parser(const std::string& input) : lexer_(input) {
  advance();
}

void Parser::advance() {
  current_ = lexer_.next();
  if (current_.type == TokenType::Invalid) {
    set_error(current_.text);
  }
}

void Parser::skip_ws() {
  while (current_.type == TokenType::Whitespace) {
    advance();
  }
}

bool Parser::set_error(const std::string& message) {
  if (!has_error_) {
    has_error_ = true;
    error_.message = message;
    error_.position = current_.pos;
  }
  return false;
}

std::string Parser::describe(const Token& token) {
  switch (token.type) {
    case TokenType::End:
      return "<EOF>";
    case TokenType::Whitespace:
      return "<WS>";
    case TokenType::String:
      return "<STRING '" + token.text + "'>";
    case TokenType::Ident:
      return "<IDENT '" + token.text + "'>";
    case TokenType::Hash:
      return "<HASH '" + token.text + "'>";
    default:
      return "<DELIM '" + token.text + "'>";
  }
}

ParseResult Parser::parse() {
  ParseResult result;
  SelectorGroup group;
  skip_ws();
  while (!has_error_) {
    ComplexSelector selector;
    if (!parse_complex(selector)) break;
    group.push_back(std::move(selector));
    skip_ws();
    if (current_.type == TokenType::End) {
      result.group = std::move(group);
      return result;
    }
    if (!is_delim(current_, ',')) {
      set_error("Expected ',' or end of selector, got " + describe(current_));
      break;
    }
    advance();
    skip_ws();
  }
  result.error = error_;
  return result;
}

bool Parser::parse_complex(ComplexSelector& out) {
  Compound first;
  if (!parse_compound(first, &out)) return false;
  out.compounds.push_back(std::move(first));
  while (true) {
    if (out.pseudo_element.has_value()) {
      skip_ws();
      if (!ends_selector(current_)) {
        return set_error("Got pseudo-element ::" + out.pseudo_element->name +
                         " not at the end of a selector");
      }
      return true;
    }
    char combinator = ' ';
    bool saw_ws = current_.type == TokenType::Whitespace;
    skip_ws();
    if (ends_selector(current_)) return true;
    if (is_delim(current_, '>') || is_delim(current_, '+') || is_delim(current_, '~')) {
      combinator = current_.text[0];
      advance();
      skip_ws();
    } else if (!saw_ws) {
      return set_error("Expected selector, got " + describe(current_));
    }
    Compound next;
    if (!parse_compound(next, &out)) return false;
    out.combinators.push_back(combinator);
    out.compounds.push_back(std::move(next));
  }
}

bool Parser::parse_type_selector(Compound& out) {
  if (current_.type != TokenType::Ident && !is_delim(current_, '*') && !is_delim(current_, '|')) {
    return false;
  }
  std::string first;
  if (!is_delim(current_, '|')) {
    first = current_.type == TokenType::Ident ? current_.text : "";
    advance();
  }
  if (is_delim(current_, '|')) {
    advance();
    if (current_.type == TokenType::Ident) {
      out.element = current_.text;
    } else if (!is_delim(current_, '*')) {
      return set_error("Expected element name after '|', got " + describe(current_));
    }
    if (!first.empty()) out.ns = first;
    advance();
    return true;
  }
  out.element = first;
  return true;
}

bool Parser::parse_compound(Compound& out, ComplexSelector* owner) {
  bool any = parse_type_selector(out);
  if (has_error_) return false;
  while (true) {
    if (current_.type == TokenType::Hash) {
      out.simples.push_back(HashSelector{current_.text});
      advance();
    } else if (is_delim(current_, '.')) {
      advance();
      if (current_.type != TokenType::Ident) {
        return set_error("Expected ident after '.', got " + describe(current_));
      }
      out.simples.push_back(ClassSelector{current_.text});
      advance();
    } else if (is_delim(current_, '[')) {
      AttribSelector attrib;
      if (!parse_attrib(attrib)) return false;
      out.simples.push_back(std::move(attrib));
    } else if (is_delim(current_, ':')) {
      advance();
      if (is_delim(current_, ':')) {
        if (!owner) {
          return set_error("Got pseudo-element inside :not() at position " +
                           std::to_string(current_.pos));
        }
        advance();
        return parse_pseudo_element(*owner);
      }
      if (!parse_pseudo(out)) return false;
    } else {
      break;
    }
    any = true;
  }
  if (!any) {
    return set_error("Expected selector, got " + describe(current_));
  }
  return true;
}

bool Parser::parse_attrib(AttribSelector& out) {
  advance();
  skip_ws();
  if (current_.type != TokenType::Ident && !is_delim(current_, '|')) {
    return set_error("Expected attribute name, got " + describe(current_));
  }
  if (current_.type == TokenType::Ident) {
    out.name = current_.text;
    advance();
  }
  if (is_delim(current_, '|')) {
    advance();
    if (current_.type != TokenType::Ident) {
      return set_error("Expected attribute name after '|', got " + describe(current_));
    }
    if (!out.name.empty()) out.ns = out.name;
    out.name = current_.text;
    advance();
  }
  skip_ws();
  if (is_delim(current_, ']')) {
    advance();
    return true;
  }
  if (current_.type == TokenType::Match || is_delim(current_, '=')) {
    out.op = current_.text;
  } else {
    return set_error("Operator expected, got " + describe(current_));
  }
  advance();
  skip_ws();
  if (current_.type != TokenType::Ident && current_.type != TokenType::String &&
      current_.type != TokenType::Number) {
    return set_error("Expected string or ident, got " + describe(current_));
  }
  out.value = current_.text;
  advance();
  skip_ws();
  if (!is_delim(current_, ']')) {
    return set_error("Expected ']', got " + describe(current_));
  }
  advance();
  return true;
}

bool Parser::parse_pseudo(Compound& compound) {
  if (current_.type != TokenType::Ident) {
    return set_error("Expected ident after ':', got " + describe(current_));
  }
  PseudoClass pseudo;
  pseudo.name = util::to_lower(current_.text);
  advance();
  if (!is_delim(current_, '(')) {
    compound.simples.push_back(std::move(pseudo));
    return true;
  }
  pseudo.functional = true;
  if (pseudo.name.rfind("nth-", 0) == 0) {
    pseudo.argument = util::trim_ws(lexer_.read_raw_until_paren());
    advance();
  } else {
    advance();
    skip_ws();
    if (pseudo.name == "not") {
      pseudo.negation = std::make_shared<Compound>();
      if (!parse_compound(*pseudo.negation, nullptr)) return false;
    } else {
      if (current_.type != TokenType::String && current_.type != TokenType::Ident &&
          current_.type != TokenType::Number) {
        return set_error("Expected a single string or ident for :" + pseudo.name +
                         "(), got " + describe(current_));
      }
      pseudo.argument = current_.text;
      advance();
    }
    skip_ws();
  }
  if (!is_delim(current_, ')')) {
    return set_error("Expected ')', got " + describe(current_));
  }
  advance();
  compound.simples.push_back(std::move(pseudo));
  return true;
}

bool Parser::parse_pseudo_element(ComplexSelector& owner) {
  if (current_.type != TokenType::Ident) {
    return set_error("Expected ident after '::', got " + describe(current_));
  }
  PseudoElement element;
  element.name = util::to_lower(current_.text);
  advance();
  if (is_delim(current_, '(')) {
    advance();
    skip_ws();
    if (current_.type != TokenType::Ident && current_.type != TokenType::String) {
      return set_error("Expected a single string or ident for ::" + element.name +
                       "(), got " + describe(current_));
    }
    element.argument = current_.text;
    advance();
    skip_ws();
    if (!is_delim(current_, ')')) {
      return set_error("Expected ')', got " + describe(current_));
    }
    advance();
  }
  owner.pseudo_element = std::move(element);
  return true;
}

}  // namespace xsel::css
