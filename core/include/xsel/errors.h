#pragma once

#include <stdexcept>
#include <string>
#include <utility>

namespace xsel {

/// Base class for every error raised by the selector API.
/// MUST stay a std::runtime_error so callers can catch library failures uniformly.
class Error : public std::runtime_error {
 public:
  explicit Error(const std::string& message) : std::runtime_error(message) {}
};

/// Raised for bad constructor arguments (unknown type, missing text/root, invalid UTF-8)
/// and for regex patterns that fail to compile.
class InvalidArgument : public Error {
 public:
  explicit InvalidArgument(const std::string& message) : Error(message) {}
};

/// Raised when a query method does not apply to the selector's document kind.
class UnsupportedOperation : public Error {
 public:
  explicit UnsupportedOperation(const std::string& message) : Error(message) {}
};

/// Raised for malformed or evaluator-rejected XPath, CSS and JMESPath expressions.
/// MUST carry the original expression text for diagnostics.
class QueryError : public Error {
 public:
  QueryError(const std::string& message, std::string expression)
      : Error(message), expression_(std::move(expression)) {}

  const std::string& expression() const { return expression_; }

 private:
  std::string expression_;
};

/// Raised when removing a selection that is not a structural node (text, attribute, JSON value).
class CannotRemoveElementWithoutRoot : public Error {
 public:
  explicit CannotRemoveElementWithoutRoot(const std::string& message) : Error(message) {}
};

/// Raised when removing the document element or an already detached node.
class CannotRemoveElementWithoutParent : public Error {
 public:
  explicit CannotRemoveElementWithoutParent(const std::string& message) : Error(message) {}
};

}  // namespace xsel
