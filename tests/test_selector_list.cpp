#include "test_harness.h"

#include <stdexcept>
#include <string>

#include "test_utils.h"

using xsel::Selector;
using xsel::SelectorList;

namespace {

const char kPage[] =
    "<div><ul id=\"a\"><li>1</li><li>2</li></ul><ul id=\"b\"><li>3</li></ul></div>";

void test_list_flattens_in_order() {
  Selector sel(kPage);
  SelectorList lists = sel.css("ul");
  expect_eq(lists.size(), 2, "two lists");
  expect_eq(join(lists.xpath("./li/text()").getall()), "1|2|3", "one level, document order");
  expect_eq(join(lists.css("li").css("li::text").getall()), "1|2|3", "chained lists flatten");
}

void test_list_indexing() {
  Selector sel(kPage);
  SelectorList items = sel.css("li");
  expect_eq(items.at(0).get(), "<li>1</li>", "first");
  expect_eq(items.at(-1).get(), "<li>3</li>", "negative index counts from the end");
  bool thrown = false;
  try {
    items.at(3);
  } catch (const std::out_of_range&) {
    thrown = true;
  }
  expect_true(thrown, "out of range index throws");
  expect_true(throws_as<std::out_of_range>([&] { items.at(-4); }), "too negative throws");

  const SelectorList& view = items;
  expect_eq(view.at(-2).get(), "<li>2</li>", "const access resolves the same index");
  expect_true(throws_as<std::out_of_range>([&] { view.at(5); }), "const access checks bounds");
}

void test_list_slicing() {
  Selector sel(kPage);
  SelectorList items = sel.css("li::text");
  expect_eq(join(items.slice(1, 10).getall()), "2|3", "stop is clamped");
  expect_eq(join(items.slice(-2, 3).getall()), "2|3", "negative start");
  expect_eq(items.slice(2, 1).size(), 0, "empty when start passes stop");
  expect_eq(items.slice(0, 2).get("none"), "1", "slices keep the surface");
}

void test_list_get_and_attrib() {
  Selector sel(kPage);
  SelectorList empty = sel.css("table");
  expect_true(!empty.get().has_value(), "empty list get is nullopt");
  expect_eq(empty.get("none"), "none", "default for empty list");
  expect_eq(empty.getall().size(), 0, "getall of empty list");
  expect_eq(empty.attrib().size(), 0, "attrib of empty list");

  SelectorList lists = sel.css("ul");
  xsel::Attributes attributes = lists.attrib();
  expect_eq(attributes.size(), 1, "first element attributes");
  expect_eq(attributes["id"], "a", "attribute value of the first element");
  expect_eq(lists.extract_first().value_or(""), lists.get("x"), "extract_first aliases get");
}

}  // namespace

void register_selector_list_tests(std::vector<TestCase>& tests) {
  tests.push_back({"selector_list_flattens_in_order", test_list_flattens_in_order});
  tests.push_back({"selector_list_indexing", test_list_indexing});
  tests.push_back({"selector_list_slicing", test_list_slicing});
  tests.push_back({"selector_list_get_and_attrib", test_list_get_and_attrib});
}
