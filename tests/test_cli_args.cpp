#include "test_harness.h"

#include <string>
#include <variant>
#include <vector>

#include "cli_args.h"

using xsel::cli::CliOptions;
using xsel::cli::QueryStep;

namespace {

bool parse(std::vector<const char*> args, CliOptions& options, std::string& error) {
  args.insert(args.begin(), "xsel");
  return xsel::cli::parse_cli_args(static_cast<int>(args.size()),
                                   const_cast<char**>(args.data()), options, error);
}

void test_parse_cli_args_collects_steps_in_order() {
  CliOptions options;
  std::string error;
  bool ok = parse({"--input", "page.html", "--css", "li", "--xpath", "./a/@href",
                   "--jmespath", "items", "--first"},
                  options, error);
  expect_true(ok, "query steps accepted");
  expect_eq(options.input, "page.html", "input path parsed");
  expect_eq(options.steps.size(), 3, "three steps");
  expect_true(options.steps[0].language == QueryStep::Language::Css, "css first");
  expect_true(options.steps[1].language == QueryStep::Language::XPath, "xpath second");
  expect_true(options.steps[2].language == QueryStep::Language::Jmespath, "jmespath third");
  expect_eq(options.steps[1].expression, "./a/@href", "expression kept verbatim");
  expect_true(options.first, "first parsed");
  expect_eq(options.type, "html", "type defaults to html");
}

void test_parse_cli_args_assignments() {
  CliOptions options;
  std::string error;
  bool ok = parse({"--type", "xml", "--ns", "a=urn:a", "--var", "n=2", "--var", "s=x=y",
                   "--strip-namespaces", "--mode", "json"},
                  options, error);
  expect_true(ok, "assignments accepted");
  expect_eq(options.type, "xml", "type parsed");
  expect_eq(options.namespaces["a"], "urn:a", "namespace prefix bound");
  expect_eq(std::get<std::string>(options.variables["n"]), "2", "variables are strings");
  expect_eq(std::get<std::string>(options.variables["s"]), "x=y", "split at the first '='");
  expect_true(options.strip_namespaces, "strip-namespaces parsed");
  expect_eq(options.output_mode, "json", "mode parsed");
}

void test_parse_cli_args_rejects_missing_value() {
  CliOptions options;
  std::string error;
  bool ok = parse({"--xpath"}, options, error);
  expect_true(!ok, "missing value is rejected");
  expect_eq(error, "Missing value for --xpath", "missing value has clear error");
}

void test_parse_cli_args_rejects_unknown_argument() {
  CliOptions options;
  std::string error;
  bool ok = parse({"--unknown"}, options, error);
  expect_true(!ok, "unknown argument is rejected");
  expect_eq(error, "Unknown argument: --unknown", "unknown argument is named");
}

void test_parse_cli_args_rejects_bad_values() {
  CliOptions options;
  std::string error;
  expect_true(!parse({"--type", "yaml"}, options, error), "unknown type rejected");
  expect_eq(error, "Invalid --type value (use html|xml|json|text)", "type error message");
  expect_true(!parse({"--mode", "table"}, options, error), "unknown mode rejected");
  expect_true(!parse({"--ns", "=urn:a"}, options, error), "empty prefix rejected");
  expect_eq(error, "Invalid --ns value (use prefix=uri): =urn:a", "namespace error message");
  expect_true(!parse({"--re", "x", "--attrib"}, options, error), "conflicting actions rejected");
  expect_eq(error, "--re, --attrib and --remove are mutually exclusive", "conflict message");
  expect_eq(options.type, "html", "options untouched on failure");
}

void test_parse_cli_args_accepts_version_flag() {
  CliOptions options;
  std::string error;
  bool ok = parse({"--version"}, options, error);
  expect_true(ok, "version flag accepted");
  expect_true(options.show_version, "version flag parsed");
  expect_true(!options.show_help, "help not set");
}

}  // namespace

void register_cli_args_tests(std::vector<TestCase>& tests) {
  tests.push_back({"parse_cli_args_collects_steps_in_order",
                   test_parse_cli_args_collects_steps_in_order});
  tests.push_back({"parse_cli_args_assignments", test_parse_cli_args_assignments});
  tests.push_back({"parse_cli_args_rejects_missing_value", test_parse_cli_args_rejects_missing_value});
  tests.push_back({"parse_cli_args_rejects_unknown_argument",
                   test_parse_cli_args_rejects_unknown_argument});
  tests.push_back({"parse_cli_args_rejects_bad_values", test_parse_cli_args_rejects_bad_values});
  tests.push_back({"parse_cli_args_accepts_version_flag", test_parse_cli_args_accepts_version_flag});
}
