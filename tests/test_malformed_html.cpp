#include "test_harness.h"

#include <string>

#include "test_utils.h"

using xsel::Selector;

namespace {

void test_missing_closing_tags() {
  Selector sel("<html><body><div><p>Hi");
  expect_eq(sel.css("p::text").get("missing"), "Hi", "missing closing tags should still parse p");
}

void test_mismatched_nesting() {
  Selector sel("<div><span>Title</div>");
  expect_eq(sel.css("span::text").get("missing"), "Title",
            "mismatched nesting should still parse span");
}

void test_empty_input_gets_placeholder() {
  expect_eq(Selector("").get(), "<html></html>", "empty html input");
  expect_eq(Selector(std::string("\0\0", 2)).get(), "<html></html>", "NUL-only input");
  expect_eq(Selector(" \n\t ").get(), "<html></html>", "whitespace-only input");
  expect_eq(xml_selector("").get(), "<html/>", "empty xml input");
}

void test_broken_xml_recovers() {
  Selector recovered = xml_selector("<root><a>1</a><b>2</root>");
  expect_eq(recovered.xpath("//a/text()").get("missing"), "1", "recover mode keeps content");
  Selector garbage = xml_selector("not xml at all <<<");
  expect_eq(garbage.get(), "<html/>", "no root element falls back to placeholder");
}

void test_invalid_utf8_rejected() {
  expect_true(throws_as<xsel::InvalidArgument>([] { Selector("<div>\xFF\xFE junk</div>"); }),
              "junk bytes are rejected before parsing");
}

void test_reparse_is_stable() {
  Selector first("<p>one<br>two<p>three");
  std::string once = first.get();
  Selector second(once);
  expect_eq(second.get(), once, "serialized html parses back to itself");
}

void test_xml_entities_not_expanded() {
  const std::string doc =
      "<?xml version=\"1.0\"?>"
      "<!DOCTYPE r [<!ENTITY ext SYSTEM \"file:///etc/hostname\">]>"
      "<r>&ext;</r>";
  Selector sel = xml_selector(doc);
  expect_eq(sel.xpath("string(/r)").get("missing"), "", "external entities stay unresolved");
}

}  // namespace

void register_malformed_html_tests(std::vector<TestCase>& tests) {
  tests.push_back({"malformed_missing_closing_tags", test_missing_closing_tags});
  tests.push_back({"malformed_mismatched_nesting", test_mismatched_nesting});
  tests.push_back({"malformed_empty_input_gets_placeholder", test_empty_input_gets_placeholder});
  tests.push_back({"malformed_broken_xml_recovers", test_broken_xml_recovers});
  tests.push_back({"malformed_invalid_utf8_rejected", test_invalid_utf8_rejected});
  tests.push_back({"malformed_reparse_is_stable", test_reparse_is_stable});
  tests.push_back({"malformed_xml_entities_not_expanded", test_xml_entities_not_expanded});
}
