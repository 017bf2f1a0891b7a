#pragma once

#include <string>

namespace xsel::cli {

/// Loads a whole file in binary mode.
/// MUST throw std::runtime_error when the file cannot be opened.
std::string read_file(const std::string& path);
/// Reads stdin to end of stream.
std::string read_stdin();
/// Splits `name=value` at the first '='; returns false when name is empty or '=' is missing.
bool split_assignment(const std::string& text, std::string& name, std::string& value);

}  // namespace xsel::cli
