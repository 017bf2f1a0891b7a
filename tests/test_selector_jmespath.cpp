#include "test_harness.h"

#include <string>

#include "test_utils.h"

using xsel::DocumentKind;
using xsel::Selector;
using xsel::SelectorList;

namespace {

void test_jmespath_on_json() {
  Selector sel = json_selector(R"({"a": {"b": 5}})");
  SelectorList result = sel.jmespath("a.b");
  expect_eq(result.size(), 1, "one result");
  expect_eq(result.get("missing"), "5", "number renders as json");
  expect_true(result[0].kind() == DocumentKind::Json, "non-string results are json");
  expect_eq(json_selector(R"({"a": {}})").jmespath("a.b").size(), 0, "null is no result");
}

void test_jmespath_arrays_and_strings() {
  Selector sel = json_selector(R"({"users": [{"name": "ann"}, {"name": "bob"}]})");
  SelectorList names = sel.jmespath("users[*].name");
  expect_eq(join(names.getall()), "ann|bob", "array results are spread");
  expect_true(names[0].kind() == DocumentKind::Text, "strings become text selectors");
  expect_eq(sel.jmespath("users[0]").get("missing"), "{\"name\":\"ann\"}",
            "objects render as compact json");
  expect_eq(names.jmespath("@").size(), 0, "plain strings are not json");
}

void test_jmespath_kind_override() {
  Selector sel = json_selector(R"({"html": "<p>x</p>"})");
  SelectorList parsed = sel.jmespath("html", DocumentKind::Html);
  expect_true(parsed[0].kind() == DocumentKind::Html, "override applies to strings");
  expect_eq(parsed.css("p::text").get("missing"), "x", "override parses the markup");
}

void test_jmespath_inside_markup() {
  Selector sel(
      "<div><script type=\"application/json\">{\"id\": 7, \"tags\": [\"a\", \"b\"]}</script>"
      "</div>");
  SelectorList data = sel.css("script::text");
  expect_eq(data.jmespath("id").get("missing"), "7", "json embedded in a text node");
  expect_eq(sel.css("script").jmespath("tags[1]").get("missing"), "b",
            "json in the direct text of an element");
  expect_eq(sel.css("div").jmespath("id").size(), 0,
            "element without direct text falls back to null");
}

void test_jmespath_on_text_and_bad_json() {
  Selector text = text_selector(R"([{"v": 1}, {"v": 2}])");
  expect_eq(join(text.jmespath("[*].v").getall()), "1|2", "text selectors hold json");

  Selector broken = json_selector("{oops");
  expect_true(broken.json_parse_failed(), "parse failure is flagged");
  expect_eq(broken.get(), "", "absent root renders empty");
  expect_eq(broken.jmespath("a").size(), 0, "absent root queries as null");
  expect_eq(broken.jmespath("type(@)").get("missing"), "null", "null is the queried value");
}

void test_jmespath_expressions() {
  Selector people = json_selector(R"({"people": [{"name": "a", "age": 30},
                                                 {"name": "b", "age": 20},
                                                 {"age": 40}]})");
  expect_eq(join(people.jmespath("people[*].name").getall()), "a|b",
            "projection skips missing fields");
  expect_eq(join(people.jmespath("people[?age > `25`].age").getall()), "30|40", "filter");
  expect_eq(people.jmespath("people[?name == 'b'] | [0].age").get("missing"), "20",
            "pipe stops the projection");
  expect_eq(join(people.jmespath("sort_by(people, &age)[*].age").getall()), "20|30|40",
            "expression references");
  expect_eq(join(json_selector(R"({"a": 1, "b": 2})").jmespath("[a, b]").getall()), "1|2",
            "multiselect list is spread");
  expect_eq(people.jmespath("length(people)").get("missing"), "3", "function call");
}

void test_jmespath_errors() {
  Selector sel = json_selector("{}");
  bool caught = false;
  try {
    sel.jmespath("a[");
  } catch (const xsel::QueryError& ex) {
    caught = true;
    expect_eq(ex.expression(), "a[", "expression kept");
    expect_true(std::string(ex.what()).find("JMESPath error") == 0, "message prefix");
  }
  expect_true(caught, "syntax error is a QueryError");
  expect_true(throws_as<xsel::QueryError>([&] { sel.jmespath("length(`1`)"); }),
              "function type error is a QueryError");
  expect_true(throws_as<xsel::QueryError>([&] { sel.jmespath("nope(@)"); }),
              "unknown function is a QueryError");
  expect_true(throws_as<xsel::QueryError>([&] { sel.jmespath("a."); }),
              "dangling dot is a QueryError");
}

void test_jmespath_repr() {
  Selector sel = json_selector(R"({"a": 1})");
  expect_eq(sel.jmespath("a")[0].repr(), "<Selector jmespath='a' data='1'>",
            "json selectors report the jmespath expression");
}

}  // namespace

void register_selector_jmespath_tests(std::vector<TestCase>& tests) {
  tests.push_back({"selector_jmespath_on_json", test_jmespath_on_json});
  tests.push_back({"selector_jmespath_arrays_and_strings", test_jmespath_arrays_and_strings});
  tests.push_back({"selector_jmespath_kind_override", test_jmespath_kind_override});
  tests.push_back({"selector_jmespath_inside_markup", test_jmespath_inside_markup});
  tests.push_back({"selector_jmespath_on_text_and_bad_json", test_jmespath_on_text_and_bad_json});
  tests.push_back({"selector_jmespath_expressions", test_jmespath_expressions});
  tests.push_back({"selector_jmespath_errors", test_jmespath_errors});
  tests.push_back({"selector_jmespath_repr", test_jmespath_repr});
}
