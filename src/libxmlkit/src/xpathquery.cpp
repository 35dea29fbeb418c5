#include "xmlkit/xpathquery.hpp"

#include <libxml/parser.h>
#include <libxml/xpath.h>
#include <libxml/xpathInternals.h>

#include <algorithm>
#include <cctype>

#include "xmlkit/compositelogger.hpp"
#include "xmlkit/errorcollector.hpp"
#include "xmlkit/xmlexception.hpp"

namespace xmlkit {

namespace {

// Байты >= 0x80 относятся к многобайтовым символам UTF-8 в имени
bool isNameStartChar(char c) {
  const auto byte = static_cast<unsigned char>(c);
  return std::isalnum(byte) != 0 || c == '_' || byte >= 0x80;
}

bool isNameChar(char c) { return isNameStartChar(c) || c == '-' || c == '.'; }

void replaceAll(std::string& subject, const std::string& from,
                const std::string& to) {
  if (from.empty()) return;
  std::size_t pos = 0;
  while ((pos = subject.find(from, pos)) != std::string::npos) {
    subject.replace(pos, from.size(), to);
    pos += to.size();
  }
}

/**
 * Переписывает шаги пути `tag` в начале выражения и после '/' в
 * `*[local-name()="tag"]`. Имена функций, осей и имена с префиксом
 * (за которыми следует '(' или ':') не трогаются.
 */
std::string rewriteLocalNames(const std::string& query) {
  std::string result;
  result.reserve(query.size() * 2);

  std::size_t i = 0;
  const std::size_t n = query.size();
  while (i < n) {
    const bool stepStart = i == 0 || query[i - 1] == '/';
    if (stepStart && isNameStartChar(query[i])) {
      std::size_t end = i;
      while (end < n && isNameChar(query[end])) ++end;
      const std::string name = query.substr(i, end - i);
      if (end < n && (query[end] == '(' || query[end] == ':')) {
        result += name;
      } else {
        result += "*[local-name()=\"" + name + "\"]";
      }
      i = end;
      continue;
    }
    result += query[i];
    ++i;
  }
  return result;
}

std::string nodeName(xmlNodePtr node) {
  std::string name = node->name ? reinterpret_cast<const char*>(node->name) : "";
  if (node->ns && node->ns->prefix) {
    name = reinterpret_cast<const char*>(node->ns->prefix) + (":" + name);
  }
  return name;
}

std::string nodeValue(xmlNodePtr node) {
  xmlChar* content = xmlNodeGetContent(node);
  if (!content) return "";
  std::string value(reinterpret_cast<const char*>(content));
  xmlFree(content);
  return value;
}

}  // namespace

XPathQuery::XPathQuery(const std::string& xml, Namespaces namespaces)
    : namespaces_(std::move(namespaces)) {
  XmlErrorCollector errors;
  xmlDocPtr parsed = xmlReadMemory(xml.data(), static_cast<int>(xml.size()),
                                   nullptr, nullptr, XML_PARSE_NONET);
  bool failed = parsed == nullptr;
  for (const auto& diagnostic : errors.diagnostics()) {
    if (diagnostic.level != XmlDiagnostic::Level::Warning) failed = true;
  }
  if (failed) {
    if (parsed) xmlFreeDoc(parsed);
    const std::string reason = errors.lastMessage();
    CompositeLogger::instance().error("XPathQuery: failed to parse XML: " +
                                      reason);
    throw InvalidXmlError("The provided XML is not valid: " + reason,
                          errors.take());
  }
  owner_.reset(parsed, &xmlFreeDoc);
  document_ = parsed;
}

XPathQuery::XPathQuery(xmlDocPtr document, Namespaces namespaces)
    : document_(document), namespaces_(std::move(namespaces)) {}

Data XPathQuery::get(const std::string& query, const Params& params,
                     xmlNodePtr contextNode) const {
  NodeList nodes = getNodes(query, params, contextNode);

  if (nodes.empty()) {
    return nullptr;
  }
  if (nodes.size() == 1) {
    return projectNode(nodes.item(0));
  }

  Data results = Data::array();
  for (xmlNodePtr node : nodes) {
    results.push_back(projectNode(node));
  }
  return results;
}

std::vector<std::string> XPathQuery::getValues(const std::string& query,
                                               const Params& params,
                                               xmlNodePtr contextNode) const {
  NodeList nodes = getNodes(query, params, contextNode);

  std::vector<std::string> values;
  values.reserve(nodes.size());
  for (xmlNodePtr node : nodes) {
    values.push_back(nodeValue(node));
  }
  return values;
}

std::optional<std::string> XPathQuery::getValue(const std::string& query,
                                                const Params& params,
                                                xmlNodePtr contextNode) const {
  NodeList nodes = getNodes(query, params, contextNode);
  if (nodes.empty()) return std::nullopt;
  return nodeValue(nodes.item(0));
}

NodeList XPathQuery::getNodes(const std::string& query, const Params& params,
                              xmlNodePtr contextNode) const {
  const std::string resolved = resolveQuery(query, params);

  XmlErrorCollector errors;
  std::unique_ptr<xmlXPathContext, decltype(&xmlXPathFreeContext)> ctx(
      xmlXPathNewContext(document_), &xmlXPathFreeContext);
  if (!ctx) {
    throw InvalidXPathError(
        "An error occurred while executing the XPath expression: " + resolved +
        ". Failed to create XPath context.");
  }
  ctx->node = contextNode ? contextNode : reinterpret_cast<xmlNodePtr>(document_);

  if (namespaceAware()) {
    // Пространства имён, видимые из контекстного узла
    xmlNodePtr scope = contextNode ? contextNode : xmlDocGetRootElement(document_);
    if (scope) {
      xmlNsPtr* inScope = xmlGetNsList(document_, scope);
      if (inScope) {
        for (xmlNsPtr* ns = inScope; *ns; ++ns) {
          if ((*ns)->prefix) {
            xmlXPathRegisterNs(ctx.get(), (*ns)->prefix, (*ns)->href);
          }
        }
        xmlFree(inScope);
      }
    }
    for (const auto& [prefix, uri] : namespaces_) {
      xmlXPathRegisterNs(ctx.get(), BAD_CAST prefix.c_str(),
                         BAD_CAST uri.c_str());
    }
  }

  xmlXPathObjectPtr result =
      xmlXPathEvalExpression(BAD_CAST resolved.c_str(), ctx.get());
  if (!result || !errors.empty()) {
    if (result) xmlXPathFreeObject(result);
    std::string reason = errors.lastMessage();
    if (reason.empty()) reason = "An error occurred in XPathQuery.";
    CompositeLogger::instance().debug("XPathQuery: evaluation failed for " +
                                      resolved + ": " + reason);
    throw InvalidXPathError(
        "An error occurred while executing the XPath expression: " + resolved +
            ". " + reason,
        errors.take());
  }

  return NodeList(result, owner_);
}

std::string XPathQuery::resolveQuery(const std::string& query,
                                     const Params& params) const {
  const std::string rewritten =
      namespaceAware() ? query : rewriteLocalNames(query);
  if (params.empty()) return rewritten;

  // Заполнитель :name подставляется только целиком; ':' после имени или
  // второго ':' принадлежит префиксу или оси и не трогается
  std::string resolved;
  resolved.reserve(rewritten.size());
  std::size_t i = 0;
  const std::size_t n = rewritten.size();
  while (i < n) {
    const bool placeholder =
        rewritten[i] == ':' && i + 1 < n && isNameStartChar(rewritten[i + 1]) &&
        (i == 0 || (!isNameChar(rewritten[i - 1]) && rewritten[i - 1] != ':'));
    if (!placeholder) {
      resolved += rewritten[i++];
      continue;
    }

    std::size_t end = i + 1;
    while (end < n && isNameChar(rewritten[end])) ++end;
    const std::string name = rewritten.substr(i + 1, end - i - 1);

    const auto param = std::find_if(
        params.begin(), params.end(), [&name](const auto& entry) {
          const auto start = entry.first.find_first_not_of(':');
          return start != std::string::npos &&
                 entry.first.compare(start, std::string::npos, name) == 0;
        });
    resolved += param != params.end() ? quoteValue(param->second)
                                      : rewritten.substr(i, end - i);
    i = end;
  }

  return resolved;
}

std::string XPathQuery::quoteValue(const std::string& value) {
  if (value.find('\'') == std::string::npos) {
    return "'" + value + "'";
  }
  if (value.find('"') == std::string::npos) {
    return "\"" + value + "\"";
  }

  std::string parts = value;
  replaceAll(parts, "'", "',\"'\",'");
  return "concat('" + parts + "')";
}

Data XPathQuery::projectNode(xmlNodePtr node) {
  if (!node) return nullptr;

  Data children = Data::object();
  std::map<std::string, int> counts;

  for (xmlNodePtr child = node->children; child; child = child->next) {
    if (child->type != XML_ELEMENT_NODE) continue;

    const std::string name = nodeName(child);
    const int count = ++counts[name];
    if (count == 1) {
      children[name] = projectNode(child);
      continue;
    }
    if (count == 2) {
      Data list = Data::array();
      list.push_back(std::move(children[name]));
      children[name] = std::move(list);
    }
    children[name].push_back(projectNode(child));
  }

  if (!children.empty()) {
    return children;
  }
  if (node->type == XML_DOCUMENT_NODE) {
    return nullptr;
  }
  return nodeValue(node);
}

}  // namespace xmlkit
