#pragma once

#include <memory>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace xsel::css {

struct Compound;

struct HashSelector {
  std::string id;
};

struct ClassSelector {
  std::string name;
};

struct AttribSelector {
  std::optional<std::string> ns;
  std::string name;
  /// Empty for [name]; otherwise one of = ~= |= ^= $= *= !=.
  std::string op;
  std::string value;
};

struct PseudoClass {
  std::string name;
  bool functional = false;
  /// Raw argument text for functional pseudo-classes (nth-*, contains, lang).
  std::string argument;
  /// Inner selector of :not(...).
  std::shared_ptr<Compound> negation;
};

using SimpleSelector = std::variant<HashSelector, ClassSelector, AttribSelector, PseudoClass>;

/// A type selector (empty element means `*`) followed by its simple selectors.
struct Compound {
  std::optional<std::string> ns;
  std::string element;
  std::vector<SimpleSelector> simples;
};

struct PseudoElement {
  std::string name;
  std::optional<std::string> argument;
};

/// Compounds joined by combinators: combinators[i] sits between compounds[i] and [i + 1]
/// and is one of ' ', '>', '+', '~'.
struct ComplexSelector {
  std::vector<Compound> compounds;
  std::vector<char> combinators;
  std::optional<PseudoElement> pseudo_element;
};

using SelectorGroup = std::vector<ComplexSelector>;

}  // namespace xsel::css
