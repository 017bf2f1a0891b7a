#include "css_translator.h"

#include <cctype>
#include <cstdlib>
#include <optional>
#include <utility>
#include <vector>

#include "css_parser.h"
#include "../util/string_util.h"

namespace xsel::css {

namespace {

/// XPath step under construction: path + element + [condition].
struct XPathExpr {
  std::string path;
  std::string element = "*";
  std::string condition;
  bool textnode = false;
  std::optional<std::string> attribute;

  void add_condition(const std::string& cond) {
    condition = condition.empty() ? cond : "(" + condition + ") and (" + cond + ")";
  }

  void add_name_test() {
    if (element == "*") return;
    add_condition("name() = " + xpath_literal(element));
    element = "*";
  }

  std::string base() const {
    std::string out = path + element;
    if (!condition.empty()) out += "[" + condition + "]";
    return out;
  }

  std::string str() const {
    std::string out = base();
    const std::string any_child = "::*/*";
    auto ends_with_any_child = [&](const std::string& s) {
      return s.size() >= any_child.size() &&
             s.compare(s.size() - any_child.size(), any_child.size(), any_child) == 0;
    };
    if (textnode) {
      if (out == "*") {
        out = "text()";
      } else if (ends_with_any_child(out)) {
        out = out.substr(0, out.size() - 3) + "text()";
      } else {
        out += "/text()";
      }
    }
    if (attribute.has_value()) {
      if (ends_with_any_child(out)) {
        out = out.substr(0, out.size() - 2);
      }
      out += "/@" + *attribute;
    }
    return out;
  }

  void join(const std::string& combiner, const XPathExpr& other) {
    std::string joined = base() + combiner;
    if (other.path != "*/") joined += other.path;
    path = joined;
    element = other.element;
    condition = other.condition;
  }
};

bool is_safe_name(const std::string& name) {
  if (name.empty()) return false;
  unsigned char first = static_cast<unsigned char>(name[0]);
  if (!std::isalpha(first) && name[0] != '_') return false;
  for (char c : name) {
    unsigned char uc = static_cast<unsigned char>(c);
    if (!std::isalnum(uc) && c != '_' && c != '.' && c != '-') return false;
  }
  return true;
}

bool is_non_whitespace(const std::string& value) {
  if (value.empty()) return false;
  for (char c : value) {
    if (std::isspace(static_cast<unsigned char>(c))) return false;
  }
  return true;
}

/// Parses an+b; returns false for anything else.
bool parse_series(std::string text, long& a, long& b) {
  std::string s;
  for (char c : text) {
    if (!std::isspace(static_cast<unsigned char>(c))) s.push_back(c);
  }
  s = util::to_lower(s);
  auto parse_int = [](const std::string& digits, long& out) {
    if (digits.empty()) return false;
    char* end = nullptr;
    out = std::strtol(digits.c_str(), &end, 10);
    return end && *end == '\0';
  };
  if (s == "odd") {
    a = 2;
    b = 1;
    return true;
  }
  if (s == "even") {
    a = 2;
    b = 0;
    return true;
  }
  size_t n = s.find('n');
  if (n == std::string::npos) {
    a = 0;
    return parse_int(s, b);
  }
  std::string a_text = s.substr(0, n);
  std::string b_text = s.substr(n + 1);
  if (a_text.empty() || a_text == "+") {
    a = 1;
  } else if (a_text == "-") {
    a = -1;
  } else if (!parse_int(a_text, a)) {
    return false;
  }
  if (b_text.empty()) {
    b = 0;
    return true;
  }
  return parse_int(b_text, b);
}

class Translator {
 public:
  explicit Translator(Dialect dialect) : dialect_(dialect) {}

  std::string translate(const SelectorGroup& group, const std::string& prefix) const {
    std::string out;
    for (const auto& selector : group) {
      if (!out.empty()) out += " | ";
      out += prefix + translate_complex(selector).str();
    }
    return out;
  }

 private:
  bool html() const { return dialect_ == Dialect::Html; }

  XPathExpr translate_complex(const ComplexSelector& selector) const {
    XPathExpr xpath = translate_compound(selector.compounds.front());
    for (size_t i = 0; i < selector.combinators.size(); ++i) {
      XPathExpr right = translate_compound(selector.compounds[i + 1]);
      switch (selector.combinators[i]) {
        case '>':
          xpath.join("/", right);
          break;
        case '+':
          xpath.join("/following-sibling::", right);
          xpath.add_name_test();
          xpath.add_condition("position() = 1");
          break;
        case '~':
          xpath.join("/following-sibling::", right);
          break;
        default:
          xpath.join("/descendant-or-self::*/", right);
          break;
      }
    }
    if (selector.pseudo_element.has_value()) {
      apply_pseudo_element(xpath, *selector.pseudo_element);
    }
    return xpath;
  }

  XPathExpr translate_compound(const Compound& compound) const {
    XPathExpr xpath;
    bool safe = true;
    if (!compound.element.empty()) {
      xpath.element = html() ? util::to_lower(compound.element) : compound.element;
      safe = is_safe_name(xpath.element);
    }
    if (compound.ns.has_value()) {
      xpath.element = *compound.ns + ":" + xpath.element;
      safe = safe && is_safe_name(*compound.ns);
    }
    if (!safe) xpath.add_name_test();

    for (const auto& simple : compound.simples) {
      if (const auto* hash = std::get_if<HashSelector>(&simple)) {
        xpath.add_condition("@id = " + xpath_literal(hash->id));
      } else if (const auto* cls = std::get_if<ClassSelector>(&simple)) {
        xpath.add_condition(
            "@class and contains(concat(' ', normalize-space(@class), ' '), " +
            xpath_literal(" " + cls->name + " ") + ")");
      } else if (const auto* attrib = std::get_if<AttribSelector>(&simple)) {
        apply_attrib(xpath, *attrib);
      } else {
        apply_pseudo_class(xpath, std::get<PseudoClass>(simple));
      }
    }
    return xpath;
  }

  void apply_attrib(XPathExpr& xpath, const AttribSelector& attrib) const {
    std::string name = html() ? util::to_lower(attrib.name) : attrib.name;
    bool safe = is_safe_name(name);
    if (attrib.ns.has_value()) {
      name = *attrib.ns + ":" + name;
      safe = safe && is_safe_name(*attrib.ns);
    }
    std::string attr = safe ? "@" + name : "attribute::*[name() = " + xpath_literal(name) + "]";
    const std::string& value = attrib.value;
    const std::string& op = attrib.op;
    if (op.empty()) {
      xpath.add_condition(attr);
    } else if (op == "=") {
      xpath.add_condition(attr + " = " + xpath_literal(value));
    } else if (op == "!=") {
      xpath.add_condition("not(" + attr + ") or " + attr + " != " + xpath_literal(value));
    } else if (op == "~=") {
      if (is_non_whitespace(value)) {
        xpath.add_condition(attr + " and contains(concat(' ', normalize-space(" + attr +
                            "), ' '), " + xpath_literal(" " + value + " ") + ")");
      } else {
        xpath.add_condition("0");
      }
    } else if (op == "|=") {
      xpath.add_condition(attr + " and (" + attr + " = " + xpath_literal(value) +
                          " or starts-with(" + attr + ", " + xpath_literal(value + "-") + "))");
    } else if (value.empty()) {
      xpath.add_condition("0");
    } else if (op == "^=") {
      xpath.add_condition(attr + " and starts-with(" + attr + ", " + xpath_literal(value) + ")");
    } else if (op == "$=") {
      xpath.add_condition(attr + " and substring(" + attr + ", string-length(" + attr + ")-" +
                          std::to_string(value.size() - 1) + ") = " + xpath_literal(value));
    } else if (op == "*=") {
      xpath.add_condition(attr + " and contains(" + attr + ", " + xpath_literal(value) + ")");
    } else {
      throw TranslateError("Unknown attribute operator '" + op + "'");
    }
  }

  void apply_nth(XPathExpr& xpath, const PseudoClass& pseudo, bool last, bool of_type) const {
    long a = 0;
    long b = 0;
    if (!parse_series(pseudo.argument, a, b)) {
      throw TranslateError("Invalid series: '" + pseudo.argument + "'");
    }
    if (of_type && xpath.element == "*") {
      throw TranslateError("*:" + pseudo.name + "() is not implemented");
    }
    long b_min_1 = b - 1;
    if (a == 1 && b_min_1 <= 0) return;
    if (a < 0 && b_min_1 < 1) {
      xpath.add_condition("0");
      return;
    }
    std::string nodetest = of_type ? xpath.element : "*";
    std::string siblings =
        "count(" + std::string(last ? "following" : "preceding") + "-sibling::" + nodetest + ")";
    if (a == 0) {
      xpath.add_condition(siblings + " = " + std::to_string(b_min_1));
      return;
    }
    std::vector<std::string> expressions;
    if (a > 0) {
      if (b_min_1 > 0) expressions.push_back(siblings + " >= " + std::to_string(b_min_1));
    } else {
      expressions.push_back(siblings + " <= " + std::to_string(b_min_1));
    }
    if (std::labs(a) != 1) {
      std::string left = siblings;
      long modulus = std::labs(a);
      long b_neg = ((-b_min_1) % modulus + modulus) % modulus;
      if (b_neg != 0) {
        left = "(" + left + " +" + std::to_string(b_neg) + ")";
      }
      expressions.push_back(left + " mod " + std::to_string(a) + " = 0");
    }
    std::string condition;
    for (const auto& expression : expressions) {
      if (!condition.empty()) condition += " and ";
      condition += expressions.size() > 1 ? "(" + expression + ")" : expression;
    }
    xpath.add_condition(condition);
  }

  void apply_pseudo_class(XPathExpr& xpath, const PseudoClass& pseudo) const {
    const std::string& name = pseudo.name;
    if (pseudo.functional) {
      if (name == "nth-child") return apply_nth(xpath, pseudo, false, false);
      if (name == "nth-last-child") return apply_nth(xpath, pseudo, true, false);
      if (name == "nth-of-type") return apply_nth(xpath, pseudo, false, true);
      if (name == "nth-last-of-type") return apply_nth(xpath, pseudo, true, true);
      if (name == "contains") {
        xpath.add_condition("contains(., " + xpath_literal(pseudo.argument) + ")");
        return;
      }
      if (name == "lang") {
        if (html()) {
          xpath.add_condition(
              "ancestor-or-self::*[@lang][1][starts-with(concat(translate(@lang, "
              "'ABCDEFGHIJKLMNOPQRSTUVWXYZ', 'abcdefghijklmnopqrstuvwxyz'), '-'), " +
              xpath_literal(util::to_lower(pseudo.argument) + "-") + ")]");
        } else {
          xpath.add_condition("lang(" + xpath_literal(pseudo.argument) + ")");
        }
        return;
      }
      if (name == "not") {
        XPathExpr sub = translate_compound(*pseudo.negation);
        sub.add_name_test();
        xpath.add_condition(sub.condition.empty() ? "0" : "not(" + sub.condition + ")");
        return;
      }
      throw TranslateError("The pseudo-class :" + name + "() is unknown");
    }
    if (name == "first-child") {
      xpath.add_condition("count(preceding-sibling::*) = 0");
    } else if (name == "last-child") {
      xpath.add_condition("count(following-sibling::*) = 0");
    } else if (name == "first-of-type" || name == "last-of-type" || name == "only-of-type") {
      if (xpath.element == "*") {
        throw TranslateError("*:" + name + " is not implemented");
      }
      if (name == "first-of-type") {
        xpath.add_condition("count(preceding-sibling::" + xpath.element + ") = 0");
      } else if (name == "last-of-type") {
        xpath.add_condition("count(following-sibling::" + xpath.element + ") = 0");
      } else {
        xpath.add_condition("count(parent::*/child::" + xpath.element + ") = 1");
      }
    } else if (name == "only-child") {
      xpath.add_condition("count(parent::*/child::*) = 1");
    } else if (name == "empty") {
      xpath.add_condition("not(*) and not(string-length())");
    } else if (name == "root") {
      xpath.add_condition("not(parent::*)");
    } else if (html() && name == "checked") {
      xpath.add_condition(
          "(@selected and name(.) = 'option') or (@checked and (name(.) = 'input' or "
          "name(.) = 'command')and (@type = 'checkbox' or @type = 'radio'))");
    } else if (html() && name == "link") {
      xpath.add_condition("@href and (name(.) = 'a' or name(.) = 'link' or name(.) = 'area')");
    } else if (html() && name == "disabled") {
      xpath.add_condition(
          "(@disabled and ((name(.) = 'input' and @type != 'hidden') or name(.) = 'button' or "
          "name(.) = 'select' or name(.) = 'textarea' or name(.) = 'command' or "
          "name(.) = 'fieldset' or name(.) = 'optgroup' or name(.) = 'option')) or "
          "(((name(.) = 'input' and @type != 'hidden') or name(.) = 'button' or "
          "name(.) = 'select' or name(.) = 'textarea') and ancestor::fieldset[@disabled])");
    } else if (html() && name == "enabled") {
      xpath.add_condition(
          "(@href and (name(.) = 'a' or name(.) = 'link' or name(.) = 'area')) or "
          "((name(.) = 'command' or name(.) = 'fieldset' or name(.) = 'optgroup') and "
          "not(@disabled)) or (((name(.) = 'input' and @type != 'hidden') or "
          "name(.) = 'button' or name(.) = 'select' or name(.) = 'textarea' or "
          "name(.) = 'keygen') and not (@disabled or ancestor::fieldset[@disabled])) or "
          "(name(.) = 'option' and not(@disabled or ancestor::optgroup[@disabled]))");
    } else if (name == "link" || name == "visited" || name == "hover" || name == "active" ||
               name == "focus" || name == "target" || name == "enabled" ||
               name == "disabled" || name == "checked") {
      // Dynamic state never matches a static document.
      xpath.add_condition("0");
    } else {
      throw TranslateError("The pseudo-class :" + name + " is unknown");
    }
  }

  void apply_pseudo_element(XPathExpr& xpath, const PseudoElement& element) const {
    if (element.name == "text" && !element.argument.has_value()) {
      xpath.textnode = true;
      return;
    }
    if (element.name == "attr" && element.argument.has_value()) {
      xpath.attribute = *element.argument;
      return;
    }
    throw TranslateError("The pseudo-element ::" + element.name +
                         (element.argument.has_value() ? "()" : "") + " is unknown");
  }

  Dialect dialect_;
};

}  // namespace

std::string xpath_literal(const std::string& value) {
  if (value.find('\'') == std::string::npos) return "'" + value + "'";
  if (value.find('"') == std::string::npos) return "\"" + value + "\"";
  std::string out = "concat(";
  bool first = true;
  size_t i = 0;
  while (i < value.size()) {
    bool quotes = value[i] == '\'';
    size_t j = i;
    while (j < value.size() && (value[j] == '\'') == quotes) ++j;
    std::string part = value.substr(i, j - i);
    if (!first) out += ",";
    out += quotes ? "\"" + part + "\"" : "'" + part + "'";
    first = false;
    i = j;
  }
  out += ")";
  return out;
}

std::string css_to_xpath(const std::string& css, Dialect dialect, const std::string& prefix) {
  ParseResult parsed = parse_selector_group(css);
  if (!parsed.group.has_value()) {
    const ParseError& error = *parsed.error;
    throw TranslateError(error.message + " at position " + std::to_string(error.position));
  }
  return Translator(dialect).translate(*parsed.group, prefix);
}

}  // namespace xsel::css
