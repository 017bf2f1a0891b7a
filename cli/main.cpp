#include <algorithm>
#include <iostream>
#include <optional>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

#include <nlohmann/json.hpp>

#include "xsel/xsel.h"
#include "cli_args.h"
#include "cli_utils.h"

using namespace xsel::cli;

namespace {

void print_values(const std::vector<std::string>& values, const std::string& mode) {
  if (mode == "json") {
    std::cout << nlohmann::json(values).dump(2) << std::endl;
    return;
  }
  for (const auto& value : values) {
    std::cout << value << "\n";
  }
  std::cout.flush();
}

void print_attributes(const xsel::Attributes& attributes, const std::string& mode) {
  std::vector<std::pair<std::string, std::string>> sorted(attributes.begin(), attributes.end());
  std::sort(sorted.begin(), sorted.end());
  if (mode == "json") {
    nlohmann::ordered_json out = nlohmann::ordered_json::object();
    for (const auto& entry : sorted) out[entry.first] = entry.second;
    std::cout << out.dump(2) << std::endl;
    return;
  }
  for (const auto& entry : sorted) {
    std::cout << entry.first << "=" << entry.second << "\n";
  }
  std::cout.flush();
}

xsel::SelectorList run_steps(xsel::Selector& root, const CliOptions& options) {
  xsel::SelectorList current(std::vector<xsel::Selector>{root});
  for (const auto& step : options.steps) {
    switch (step.language) {
      case QueryStep::Language::XPath:
        current = current.xpath(step.expression, {}, options.variables);
        break;
      case QueryStep::Language::Css:
        current = current.css(step.expression);
        break;
      case QueryStep::Language::Jmespath:
        current = current.jmespath(step.expression);
        break;
    }
  }
  return current;
}

}  // namespace

/// Entry point: reads one document, runs the query chain and prints the results.
/// MUST preserve exit codes for script usage and MUST not hide fatal errors.
int main(int argc, char** argv) {
  if (argc == 1) {
    print_startup_help(std::cout);
    return 0;
  }

  CliOptions options;
  std::string arg_error;
  if (!parse_cli_args(argc, argv, options, arg_error)) {
    std::cerr << "Error: " << arg_error << "\n";
    return 2;
  }
  if (options.show_help) {
    print_help(std::cout);
    return 0;
  }
  if (options.show_version) {
    std::cout << "xsel " << xsel::version_string() << std::endl;
    return 0;
  }

  std::string text;
  try {
    text = options.input.empty() ? read_stdin() : read_file(options.input);
  } catch (const std::exception& ex) {
    std::cerr << "Error: " << ex.what() << std::endl;
    return 2;
  }

  xsel::SelectorOptions selector_options;
  selector_options.type = options.type;
  selector_options.namespaces = options.namespaces;
  selector_options.base_url = options.base_url;

  try {
    std::optional<xsel::Selector> root;
    try {
      root.emplace(text, selector_options);
    } catch (const xsel::InvalidArgument& ex) {
      std::cerr << "Error: " << ex.what() << std::endl;
      return 2;
    }
    if (root->kind() == xsel::DocumentKind::Json && root->json_parse_failed() && !options.quiet) {
      std::cerr << "Warning: input is not valid JSON; querying null" << std::endl;
    }
    if (options.strip_namespaces) {
      root->remove_namespaces();
    }

    xsel::SelectorList results = run_steps(*root, options);

    if (options.remove) {
      results.remove();
      print_values({root->get()}, options.output_mode);
      return 0;
    }
    if (options.attrib) {
      print_attributes(results.attrib(), options.output_mode);
      return 0;
    }

    std::vector<std::string> values;
    if (options.regex.has_value()) {
      if (options.first) {
        std::optional<std::string> match = results.re_first(*options.regex);
        if (match.has_value()) values.push_back(*match);
      } else {
        values = results.re(*options.regex);
      }
    } else if (options.first) {
      std::optional<std::string> value = results.get();
      if (value.has_value()) values.push_back(*value);
    } else {
      values = results.getall();
    }
    if (values.empty() && !options.quiet) {
      std::cerr << "No matches." << std::endl;
    }
    print_values(values, options.output_mode);
    return 0;
  } catch (const std::exception& ex) {
    std::cerr << "Error: " << ex.what() << std::endl;
    return 1;
  }
}
