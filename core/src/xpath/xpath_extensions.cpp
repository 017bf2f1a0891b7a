#include <regex>
#include <string>

#include <libxml/xpathInternals.h>

#include "../util/regex_extract.h"
#include "xpath_eval.h"
#include "xsel/errors.h"

namespace xsel::xpath {

const char kRegexNamespace[] = "http://exslt.org/regular-expressions";
const char kSetsNamespace[] = "http://exslt.org/sets";

namespace {

const xmlChar* as_xml(const char* s) {
  return reinterpret_cast<const xmlChar*>(s);
}

/// Pops a string argument off the XPath stack; false when the stack reported an error.
bool pop_string(xmlXPathParserContextPtr ctxt, std::string& out) {
  xmlChar* value = xmlXPathPopString(ctxt);
  if (xmlXPathCheckError(ctxt)) {
    if (value) xmlFree(value);
    return false;
  }
  out = value ? reinterpret_cast<const char*>(value) : "";
  if (value) xmlFree(value);
  return true;
}

void report(xmlXPathParserContextPtr ctxt, const std::string& detail) {
  if (ctxt->context && ctxt->context->userData) {
    static_cast<ErrorSink*>(ctxt->context->userData)->detail = detail;
  }
  xmlXPathErr(ctxt, XPATH_EXPR_ERROR);
}

bool build_regex(xmlXPathParserContextPtr ctxt,
                 const std::string& pattern,
                 const std::string& flags,
                 util::Pattern& out) {
  try {
    out = util::compile_pattern(pattern, flags.find('i') != std::string::npos);
    return true;
  } catch (const InvalidArgument& ex) {
    report(ctxt, ex.what());
    return false;
  }
}

// re:test(string, pattern[, flags])
void regex_test(xmlXPathParserContextPtr ctxt, int nargs) {
  if (nargs < 2 || nargs > 3) {
    xmlXPathSetArityError(ctxt);
    return;
  }
  std::string flags;
  if (nargs == 3 && !pop_string(ctxt, flags)) return;
  std::string pattern;
  std::string input;
  if (!pop_string(ctxt, pattern) || !pop_string(ctxt, input)) return;
  util::Pattern re;
  if (!build_regex(ctxt, pattern, flags, re)) return;
  bool found = false;
  try {
    std::string ignored;
    found = util::search_first(re, input, ignored);
  } catch (const std::regex_error& ex) {
    report(ctxt, std::string("regular expression failed (") + ex.what() + ")");
    return;
  }
  xmlXPathReturnBoolean(ctxt, found ? 1 : 0);
}

// re:match(string, pattern[, flags]) -> text of the first match, empty when none.
void regex_match(xmlXPathParserContextPtr ctxt, int nargs) {
  if (nargs < 2 || nargs > 3) {
    xmlXPathSetArityError(ctxt);
    return;
  }
  std::string flags;
  if (nargs == 3 && !pop_string(ctxt, flags)) return;
  std::string pattern;
  std::string input;
  if (!pop_string(ctxt, pattern) || !pop_string(ctxt, input)) return;
  util::Pattern re;
  if (!build_regex(ctxt, pattern, flags, re)) return;
  std::string text;
  bool found = false;
  try {
    found = util::search_first(re, input, text);
  } catch (const std::regex_error& ex) {
    report(ctxt, std::string("regular expression failed (") + ex.what() + ")");
    return;
  }
  if (!found) {
    xmlXPathReturnEmptyString(ctxt);
    return;
  }
  valuePush(ctxt, xmlXPathNewCString(text.c_str()));
}

// re:replace(string, pattern, flags, replacement); the g flag replaces every match.
void regex_replace(xmlXPathParserContextPtr ctxt, int nargs) {
  if (nargs != 4) {
    xmlXPathSetArityError(ctxt);
    return;
  }
  std::string replacement;
  std::string flags;
  std::string pattern;
  std::string input;
  if (!pop_string(ctxt, replacement) || !pop_string(ctxt, flags) ||
      !pop_string(ctxt, pattern) || !pop_string(ctxt, input)) {
    return;
  }
  util::Pattern re;
  if (!build_regex(ctxt, pattern, flags, re)) return;
  std::string out;
  try {
    out = util::replace_matches(re, input, replacement, flags.find('g') != std::string::npos);
  } catch (const std::regex_error& ex) {
    report(ctxt, std::string("regular expression failed (") + ex.what() + ")");
    return;
  }
  valuePush(ctxt, xmlXPathNewCString(out.c_str()));
}

/// Pops the two node-set arguments of a binary set function (second one first).
bool pop_node_sets(xmlXPathParserContextPtr ctxt, int nargs,
                   xmlNodeSetPtr& first, xmlNodeSetPtr& second) {
  if (nargs != 2) {
    xmlXPathSetArityError(ctxt);
    return false;
  }
  second = xmlXPathPopNodeSet(ctxt);
  if (!second || xmlXPathCheckError(ctxt)) return false;
  first = xmlXPathPopNodeSet(ctxt);
  if (!first || xmlXPathCheckError(ctxt)) {
    xmlXPathFreeNodeSet(second);
    return false;
  }
  return true;
}

using SetOperation = xmlNodeSetPtr (*)(xmlNodeSetPtr, xmlNodeSetPtr);

/// libxml2 set operations may hand back their first argument; free only what is not returned.
void apply_set_operation(xmlXPathParserContextPtr ctxt, int nargs, SetOperation op) {
  xmlNodeSetPtr first = nullptr;
  xmlNodeSetPtr second = nullptr;
  if (!pop_node_sets(ctxt, nargs, first, second)) return;
  xmlNodeSetPtr result = op(first, second);
  if (result != first) xmlXPathFreeNodeSet(first);
  if (result != second) xmlXPathFreeNodeSet(second);
  xmlXPathReturnNodeSet(ctxt, result);
}

void set_difference(xmlXPathParserContextPtr ctxt, int nargs) {
  apply_set_operation(ctxt, nargs, xmlXPathDifference);
}

void set_intersection(xmlXPathParserContextPtr ctxt, int nargs) {
  apply_set_operation(ctxt, nargs, xmlXPathIntersection);
}

void set_leading(xmlXPathParserContextPtr ctxt, int nargs) {
  apply_set_operation(ctxt, nargs, xmlXPathLeading);
}

void set_trailing(xmlXPathParserContextPtr ctxt, int nargs) {
  apply_set_operation(ctxt, nargs, xmlXPathTrailing);
}

void set_has_same_node(xmlXPathParserContextPtr ctxt, int nargs) {
  xmlNodeSetPtr first = nullptr;
  xmlNodeSetPtr second = nullptr;
  if (!pop_node_sets(ctxt, nargs, first, second)) return;
  int same = xmlXPathHasSameNodes(first, second);
  xmlXPathFreeNodeSet(first);
  xmlXPathFreeNodeSet(second);
  xmlXPathReturnBoolean(ctxt, same);
}

void set_distinct(xmlXPathParserContextPtr ctxt, int nargs) {
  if (nargs != 1) {
    xmlXPathSetArityError(ctxt);
    return;
  }
  xmlNodeSetPtr nodes = xmlXPathPopNodeSet(ctxt);
  if (!nodes || xmlXPathCheckError(ctxt)) return;
  xmlNodeSetPtr result = xmlXPathDistinct(nodes);
  if (result != nodes) xmlXPathFreeNodeSet(nodes);
  xmlXPathReturnNodeSet(ctxt, result);
}

}  // namespace

void register_extensions(xmlXPathContextPtr ctx) {
  const xmlChar* re_ns = as_xml(kRegexNamespace);
  xmlXPathRegisterFuncNS(ctx, as_xml("test"), re_ns, regex_test);
  xmlXPathRegisterFuncNS(ctx, as_xml("match"), re_ns, regex_match);
  xmlXPathRegisterFuncNS(ctx, as_xml("replace"), re_ns, regex_replace);

  const xmlChar* set_ns = as_xml(kSetsNamespace);
  xmlXPathRegisterFuncNS(ctx, as_xml("difference"), set_ns, set_difference);
  xmlXPathRegisterFuncNS(ctx, as_xml("intersection"), set_ns, set_intersection);
  xmlXPathRegisterFuncNS(ctx, as_xml("leading"), set_ns, set_leading);
  xmlXPathRegisterFuncNS(ctx, as_xml("trailing"), set_ns, set_trailing);
  xmlXPathRegisterFuncNS(ctx, as_xml("has-same-node"), set_ns, set_has_same_node);
  xmlXPathRegisterFuncNS(ctx, as_xml("distinct"), set_ns, set_distinct);
}

}  // namespace xsel::xpath
