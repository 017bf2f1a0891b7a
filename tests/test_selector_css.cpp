#include "test_harness.h"

#include <string>

#include "test_utils.h"

using xsel::Selector;
using xsel::SelectorList;

namespace {

const char kPage[] =
    "<html><body>"
    "<div id=\"main\"><p class=\"lead intro\">first</p><p>second</p></div>"
    "<ul><li><a href=\"/a\">A</a></li><li><a href=\"/b\">B</a></li></ul>"
    "</body></html>";

void test_css_matches_xpath() {
  Selector sel("<div><p>x</p><p>y</p></div>");
  expect_eq(join(sel.css("p").getall()), "<p>x</p>|<p>y</p>", "css p");
  expect_eq(join(sel.css("p").getall()), join(sel.xpath("//p").getall()),
            "css and xpath agree");
}

void test_css_pseudo_elements() {
  Selector sel(kPage);
  expect_eq(join(sel.css("a::attr(href)").getall()), "/a|/b", "attribute values");
  expect_eq(join(sel.css("li a::text").getall()), "A|B", "text nodes");
  expect_eq(sel.css("#main > p.lead::text").get("missing"), "first", "id, class and child");
  expect_eq(sel.css("p.intro").size(), 1, "class matches one token of many");
  expect_eq(sel.css("li:nth-child(2) a::text").get("missing"), "B", "nth-child");
  expect_eq(join(sel.css("div *::text").getall()), "first|second",
            "universal before ::text keeps descendant text");
}

void test_css_chaining() {
  Selector sel(kPage);
  SelectorList items = sel.css("li");
  expect_eq(items.size(), 2, "two list items");
  expect_eq(join(items.css("a::text").getall()), "A|B", "chained css flattens");
  expect_eq(join(items.xpath("./a/@href").getall()), "/a|/b", "css then xpath");
}

void test_css_case_rules() {
  Selector html(kPage);
  expect_eq(html.css("P").size(), 2, "html element names are case-insensitive");

  Selector xml = xml_selector("<Root><Item>1</Item></Root>");
  expect_eq(xml.css("Item").size(), 1, "xml keeps case");
  expect_eq(xml.css("item").size(), 0, "xml element names are case-sensitive");
}

void test_css_errors() {
  Selector sel(kPage);
  bool caught = false;
  try {
    sel.css("p[");
  } catch (const xsel::QueryError& ex) {
    caught = true;
    expect_eq(ex.expression(), "p[", "css error keeps the selector");
  }
  expect_true(caught, "malformed css throws QueryError");
  expect_true(throws_as<xsel::QueryError>([&] { sel.css("p::shadow"); }),
              "unknown pseudo-element throws QueryError");
  Selector json = json_selector("[1]");
  expect_true(throws_as<xsel::UnsupportedOperation>([&] { json.css("p"); }),
              "css on json throws");
}

void test_css_on_text_promotes() {
  Selector text = text_selector("<b>bold</b>");
  expect_eq(text.css("b::text").get("missing"), "bold", "text selector parsed on demand");
}

}  // namespace

void register_selector_css_tests(std::vector<TestCase>& tests) {
  tests.push_back({"selector_css_matches_xpath", test_css_matches_xpath});
  tests.push_back({"selector_css_pseudo_elements", test_css_pseudo_elements});
  tests.push_back({"selector_css_chaining", test_css_chaining});
  tests.push_back({"selector_css_case_rules", test_css_case_rules});
  tests.push_back({"selector_css_errors", test_css_errors});
  tests.push_back({"selector_css_on_text_promotes", test_css_on_text_promotes});
}
