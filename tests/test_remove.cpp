#include "test_harness.h"

#include <string>

#include "test_utils.h"

using xsel::Selector;
using xsel::SelectorList;

namespace {

const char kList[] = "<ul><li>1</li><li>2</li><li>3</li></ul>";

void test_remove_element() {
  Selector sel(kList);
  SelectorList items = sel.css("li");
  Selector held = items[1];
  items[1].remove();
  expect_eq(join(sel.css("li::text").getall()), "1|3", "removed node is unreachable");
  expect_eq(held.get(), "<li>2</li>", "held handle still serializes");
  expect_eq(items.size(), 3, "list keeps its entries");
  expect_eq(held.xpath("./text()").get("missing"), "2", "detached node can still be queried");
}

void test_remove_list() {
  Selector sel(kList);
  sel.css("li").remove();
  expect_eq(sel.css("li").size(), 0, "all items removed");
  expect_eq(sel.get(), "<html><body><ul></ul></body></html>", "document reflects removal");
}

void test_remove_errors() {
  Selector sel(kList);
  expect_true(throws_as<xsel::CannotRemoveElementWithoutParent>([&] { sel.remove(); }),
              "document element cannot be removed");
  expect_true(throws_as<xsel::CannotRemoveElementWithoutRoot>([&] {
                sel.css("li::text")[0].remove();
              }),
              "text results have no node to remove");
  Selector json = json_selector("[1]");
  expect_true(throws_as<xsel::CannotRemoveElementWithoutRoot>([&] { json.remove(); }),
              "json selectors cannot remove");
  expect_true(throws_as<xsel::Error>([&] { sel.remove(); }), "removal errors share a base");
}

void test_remove_list_stops_at_failure() {
  Selector sel("<div><p>a</p><p>b</p></div>");
  SelectorList mixed = sel.css("p");
  mixed.push_back(sel.css("p::text")[0]);
  mixed.push_back(sel.css("div")[0]);
  bool caught = false;
  try {
    mixed.remove();
  } catch (const xsel::CannotRemoveElementWithoutRoot&) {
    caught = true;
  }
  expect_true(caught, "first failure propagates");
  expect_eq(sel.css("p").size(), 0, "elements before the failure were removed");
  expect_eq(sel.css("div").size(), 1, "elements after the failure stay");
}

}  // namespace

void register_remove_tests(std::vector<TestCase>& tests) {
  tests.push_back({"remove_element", test_remove_element});
  tests.push_back({"remove_list", test_remove_list});
  tests.push_back({"remove_errors", test_remove_errors});
  tests.push_back({"remove_list_stops_at_failure", test_remove_list_stops_at_failure});
}
