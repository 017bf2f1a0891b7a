#pragma once

#include <iosfwd>
#include <optional>
#include <string>
#include <vector>

#include "xsel/selector.h"

namespace xsel::cli {

/// One query step; steps run in command line order, each over the previous step's results.
struct QueryStep {
  enum class Language { XPath, Css, Jmespath } language = Language::XPath;
  std::string expression;
};

struct CliOptions {
  std::string input;
  std::string type = "html";
  std::vector<QueryStep> steps;
  std::optional<std::string> regex;
  bool first = false;
  bool attrib = false;
  bool remove = false;
  NamespaceMap namespaces;
  XPathVariables variables;
  std::optional<std::string> base_url;
  std::string output_mode = "plain";
  bool strip_namespaces = false;
  bool quiet = false;
  bool show_help = false;
  bool show_version = false;
};

/// Prints the startup help shown when xsel runs without arguments.
void print_startup_help(std::ostream& os);
/// Prints the explicit help requested by --help.
/// MUST stay synchronized with supported flags.
void print_help(std::ostream& os);
/// Parses argv into typed options so main can dispatch consistently.
/// MUST return false for invalid flags, setting error to a one-line message.
bool parse_cli_args(int argc, char** argv, CliOptions& options, std::string& error);

}  // namespace xsel::cli
