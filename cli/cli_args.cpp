#include "cli_args.h"

#include <ostream>
#include <string>

#include "cli_utils.h"

namespace xsel::cli {

void print_startup_help(std::ostream& os) {
  os << "xsel - query HTML, XML, JSON and text with XPath, CSS and JMESPath\n\n";
  os << "Usage:\n";
  os << "  xsel --xpath <expr> [--input <path>]\n";
  os << "  xsel --css <selector> [--re <pattern>] [--first]\n";
  os << "  xsel --type json --jmespath <expr>\n";
  os << "  xsel --version\n\n";
  os << "Notes:\n";
  os << "  - If --input is omitted, the document is read from stdin.\n";
  os << "  - --xpath, --css and --jmespath may be repeated; they apply in order.\n";
  os << "  - Exit codes: 0=success, 1=query/runtime error, 2=CLI/IO usage error.\n\n";
  os << "Examples:\n";
  os << "  xsel --css \"a::attr(href)\" --input ./page.html\n";
  os << "  xsel --xpath \"//script/text()\" --jmespath \"items[].name\" --input ./page.html\n";
}

void print_help(std::ostream& os) {
  os << "Usage: xsel [--input <path>] [--type html|xml|json|text] [--base-url <url>]\n";
  os << "            [--xpath <expr>]... [--css <selector>]... [--jmespath <expr>]...\n";
  os << "            [--re <pattern>] [--first] [--attrib] [--remove]\n";
  os << "            [--ns <prefix=uri>]... [--var <name=value>]...\n";
  os << "            [--strip-namespaces] [--mode plain|json] [--quiet]\n";
  os << "       xsel --version\n";
  os << "If --input is omitted, the document is read from stdin.\n";
  os << "--first prints only the first result (or first regex match).\n";
  os << "--attrib prints the attributes of the first result.\n";
  os << "--remove removes every result from the document and prints the document.\n";
  os << "--var binds an XPath variable ($name) to a string value.\n";
  os << "--mode json prints results as a JSON array (an object for --attrib).\n";
  os << "Exit codes: 0=success, 1=query/runtime error, 2=CLI/IO usage error.\n";
}

bool parse_cli_args(int argc, char** argv, CliOptions& options, std::string& error) {
  CliOptions parsed = options;
  auto take_value = [&](int& i, const std::string& flag, std::string& out) {
    if (i + 1 >= argc) {
      error = "Missing value for " + flag;
      return false;
    }
    out = argv[++i];
    return true;
  };

  for (int i = 1; i < argc; ++i) {
    std::string arg = argv[i];
    std::string value;
    if (arg == "--input") {
      if (!take_value(i, arg, parsed.input)) return false;
    } else if (arg == "--type") {
      if (!take_value(i, arg, value)) return false;
      if (!parse_document_kind(value).has_value()) {
        error = "Invalid --type value (use html|xml|json|text)";
        return false;
      }
      parsed.type = value;
    } else if (arg == "--xpath" || arg == "--css" || arg == "--jmespath") {
      QueryStep step;
      if (!take_value(i, arg, step.expression)) return false;
      if (arg == "--css") {
        step.language = QueryStep::Language::Css;
      } else if (arg == "--jmespath") {
        step.language = QueryStep::Language::Jmespath;
      }
      parsed.steps.push_back(step);
    } else if (arg == "--re") {
      if (!take_value(i, arg, value)) return false;
      parsed.regex = value;
    } else if (arg == "--ns" || arg == "--var") {
      if (!take_value(i, arg, value)) return false;
      std::string name;
      std::string rhs;
      if (!split_assignment(value, name, rhs)) {
        error = "Invalid " + arg + " value (use " + (arg == "--ns" ? "prefix=uri" : "name=value") +
                "): " + value;
        return false;
      }
      if (arg == "--ns") {
        parsed.namespaces[name] = rhs;
      } else {
        parsed.variables[name] = rhs;
      }
    } else if (arg == "--base-url") {
      if (!take_value(i, arg, value)) return false;
      parsed.base_url = value;
    } else if (arg == "--mode") {
      if (!take_value(i, arg, value)) return false;
      if (value != "plain" && value != "json") {
        error = "Invalid --mode value (use plain|json)";
        return false;
      }
      parsed.output_mode = value;
    } else if (arg == "--first") {
      parsed.first = true;
    } else if (arg == "--attrib") {
      parsed.attrib = true;
    } else if (arg == "--remove") {
      parsed.remove = true;
    } else if (arg == "--strip-namespaces") {
      parsed.strip_namespaces = true;
    } else if (arg == "--quiet") {
      parsed.quiet = true;
    } else if (arg == "--help") {
      parsed.show_help = true;
    } else if (arg == "--version") {
      parsed.show_version = true;
    } else {
      error = "Unknown argument: " + arg;
      return false;
    }
  }

  int actions = (parsed.regex.has_value() ? 1 : 0) + (parsed.attrib ? 1 : 0) +
                (parsed.remove ? 1 : 0);
  if (actions > 1) {
    error = "--re, --attrib and --remove are mutually exclusive";
    return false;
  }
  options = parsed;
  return true;
}

}  // namespace xsel::cli
