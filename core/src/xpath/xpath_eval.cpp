#include "xpath_eval.h"

#include <cstdarg>
#include <cstdio>
#include <memory>

#include <libxml/globals.h>
#include <libxml/xmlerror.h>
#include <libxml/xpathInternals.h>

#include "../util/string_util.h"
#include "xsel/errors.h"

namespace xsel::xpath {

namespace {

struct ContextDeleter {
  void operator()(xmlXPathContextPtr ctx) const { xmlXPathFreeContext(ctx); }
};
struct CompExprDeleter {
  void operator()(xmlXPathCompExprPtr comp) const { xmlXPathFreeCompExpr(comp); }
};
struct ObjectDeleter {
  void operator()(xmlXPathObjectPtr obj) const { xmlXPathFreeObject(obj); }
};

#if LIBXML_VERSION >= 21200
void capture_error(void* user_data, const xmlError* error) {
#else
void capture_error(void* user_data, xmlErrorPtr error) {
#endif
  auto* sink = static_cast<ErrorSink*>(user_data);
  if (!sink || !error || !error->message || !sink->message.empty()) return;
  sink->message = util::trim_ws(error->message);
}

// Some evaluation failures are first reported on the generic channel, before the
// structured error that follows them.
void capture_generic(void* user_data, const char* format, ...) {
  auto* sink = static_cast<ErrorSink*>(user_data);
  if (!sink || !format || !sink->generic.empty()) return;
  char buffer[512];
  va_list args;
  va_start(args, format);
  std::vsnprintf(buffer, sizeof(buffer), format, args);
  va_end(args);
  sink->generic = util::trim_ws(buffer);
}

/// Routes libxml2's global error channels into sink while alive, restoring the previous
/// handlers on exit. Nothing reaches stderr during compilation or evaluation.
class ErrorCapture {
 public:
  explicit ErrorCapture(ErrorSink* sink)
      : generic_(xmlGenericError),
        generic_context_(xmlGenericErrorContext),
        structured_(xmlStructuredError),
        structured_context_(xmlStructuredErrorContext) {
    xmlSetGenericErrorFunc(sink, capture_generic);
    xmlSetStructuredErrorFunc(sink, capture_error);
  }
  ~ErrorCapture() {
    xmlSetGenericErrorFunc(generic_context_, generic_);
    xmlSetStructuredErrorFunc(structured_context_, structured_);
  }

  ErrorCapture(const ErrorCapture&) = delete;
  ErrorCapture& operator=(const ErrorCapture&) = delete;

 private:
  xmlGenericErrorFunc generic_;
  void* generic_context_;
  xmlStructuredErrorFunc structured_;
  void* structured_context_;
};

xmlXPathObjectPtr make_variable(const XPathVariable& value) {
  if (const auto* s = std::get_if<std::string>(&value)) {
    return xmlXPathNewCString(s->c_str());
  }
  if (const auto* d = std::get_if<double>(&value)) {
    return xmlXPathNewFloat(*d);
  }
  return xmlXPathNewBoolean(std::get<bool>(value) ? 1 : 0);
}

[[noreturn]] void raise(const ErrorSink& sink, const std::string& query) {
  std::string message = sink.message;
  if (message.empty()) message = sink.generic;
  if (message.empty()) message = "Invalid expression";
  if (!sink.detail.empty()) {
    message += ": " + sink.detail;
  } else if (!sink.generic.empty() && message != sink.generic) {
    message += ": " + sink.generic;
  }
  throw QueryError("XPath error: " + message + " in " + query, query);
}

Item node_item(xmlNodePtr node) {
  Item item;
  switch (node->type) {
    case XML_ELEMENT_NODE:
    case XML_COMMENT_NODE:
    case XML_PI_NODE:
      item.kind = Item::Kind::Node;
      item.node = node;
      return item;
    case XML_DOCUMENT_NODE:
    case XML_HTML_DOCUMENT_NODE:
      item.kind = Item::Kind::Node;
      item.node = xmlDocGetRootElement(reinterpret_cast<xmlDocPtr>(node));
      return item;
    case XML_NAMESPACE_DECL: {
      auto* ns = reinterpret_cast<xmlNsPtr>(node);
      item.kind = Item::Kind::String;
      if (ns->href) item.text = reinterpret_cast<const char*>(ns->href);
      return item;
    }
    default: {
      item.kind = Item::Kind::String;
      xmlChar* content = xmlNodeGetContent(node);
      if (content) {
        item.text = reinterpret_cast<const char*>(content);
        xmlFree(content);
      }
      return item;
    }
  }
}

}  // namespace

std::vector<Item> evaluate(xmlNodePtr context,
                           const std::string& query,
                           const NamespaceMap& namespaces,
                           const XPathVariables& variables) {
  std::unique_ptr<xmlXPathContext, ContextDeleter> ctx(xmlXPathNewContext(context->doc));
  if (!ctx) {
    throw QueryError("XPath error: cannot allocate evaluation context in " + query, query);
  }
  ErrorSink sink;
  ErrorCapture capture(&sink);
  ctx->node = context;
  ctx->userData = &sink;
#if LIBXML_VERSION >= 21300
  xmlXPathSetErrorHandler(ctx.get(), capture_error, &sink);
#else
  ctx->error = capture_error;
#endif

  for (const auto& [prefix, uri] : namespaces) {
    if (prefix.empty()) continue;
    xmlXPathRegisterNs(ctx.get(), reinterpret_cast<const xmlChar*>(prefix.c_str()),
                       reinterpret_cast<const xmlChar*>(uri.c_str()));
  }
  for (const auto& [name, value] : variables) {
    xmlXPathRegisterVariable(ctx.get(), reinterpret_cast<const xmlChar*>(name.c_str()),
                             make_variable(value));
  }
  register_extensions(ctx.get());

  std::unique_ptr<xmlXPathCompExpr, CompExprDeleter> comp(
      xmlXPathCtxtCompile(ctx.get(), reinterpret_cast<const xmlChar*>(query.c_str())));
  if (!comp) {
    raise(sink, query);
  }
  std::unique_ptr<xmlXPathObject, ObjectDeleter> obj(xmlXPathCompiledEval(comp.get(), ctx.get()));
  if (!obj) {
    raise(sink, query);
  }

  std::vector<Item> items;
  switch (obj->type) {
    case XPATH_NODESET: {
      xmlNodeSetPtr nodes = obj->nodesetval;
      if (!nodes) break;
      items.reserve(static_cast<size_t>(nodes->nodeNr));
      for (int i = 0; i < nodes->nodeNr; ++i) {
        Item item = node_item(nodes->nodeTab[i]);
        if (item.kind == Item::Kind::Node && !item.node) continue;
        items.push_back(std::move(item));
      }
      break;
    }
    case XPATH_BOOLEAN: {
      Item item;
      item.kind = Item::Kind::Boolean;
      item.boolean = obj->boolval != 0;
      items.push_back(item);
      break;
    }
    case XPATH_NUMBER: {
      Item item;
      item.kind = Item::Kind::Number;
      item.number = obj->floatval;
      items.push_back(item);
      break;
    }
    default: {
      Item item;
      item.kind = Item::Kind::String;
      xmlChar* value = xmlXPathCastToString(obj.get());
      if (value) {
        item.text = reinterpret_cast<const char*>(value);
        xmlFree(value);
      }
      items.push_back(std::move(item));
      break;
    }
  }
  return items;
}

}  // namespace xsel::xpath
