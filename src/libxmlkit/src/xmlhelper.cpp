#include "xmlkit/xmlhelper.hpp"

#include <libxml/parser.h>
#include <libxml/xpath.h>

#include <cctype>
#include <memory>
#include <utility>

#include "xmlkit/compositelogger.hpp"
#include "xmlkit/errorcollector.hpp"
#include "xmlkit/xmlexception.hpp"

namespace xmlkit {

namespace {

void replaceAll(std::string& subject, const std::string& from,
                const std::string& to) {
  if (from.empty()) return;
  std::size_t pos = 0;
  while ((pos = subject.find(from, pos)) != std::string::npos) {
    subject.replace(pos, from.size(), to);
    pos += to.size();
  }
}

// Порядок важен: замены выполняются последовательно по всей строке
const std::pair<const char*, const char*> kPredefinedEntities[] = {
    {"&amp;", "&"},  {"&#38;", "&"},  {"&lt;", "<"},   {"&#60;", "<"},
    {"&gt;", ">"},   {"&#62;", ">"},  {"&quot;", "\""}, {"&#34;", "\""},
    {"&apos;", "'"}, {"&#39;", "'"},
};

}  // namespace

std::string XmlHelper::sanitize(const std::string& value) {
  if (value.empty() || isNumeric(value)) {
    return value;
  }

  std::string result;
  result.reserve(value.size());
  for (char c : value) {
    const auto byte = static_cast<unsigned char>(c);
    if (byte <= 0x1F || byte == 0x7F) continue;
    result += c;
  }

  for (const auto& [entity, character] : kPredefinedEntities) {
    replaceAll(result, entity, character);
  }

  replaceAll(result, "&", "&amp;");

  return result;
}

std::string XmlHelper::fixEntities(const std::string& xml) {
  std::string fixed;
  fixed.reserve(xml.size());

  const std::size_t n = xml.size();
  bool convert = false;
  bool inAttribute = false;
  char attributeDelimiter = '\0';

  for (std::size_t i = 0; i < n; ++i) {
    const char c = xml[i];

    if (!convert && c == '=' && i + 1 < n &&
        (xml[i + 1] == '"' || xml[i + 1] == '\'')) {
      inAttribute = true;
      attributeDelimiter = xml[i + 1];
      fixed += c;
      fixed += attributeDelimiter;
      ++i;
      continue;
    }

    if (inAttribute && c == attributeDelimiter) {
      inAttribute = false;
      attributeDelimiter = '\0';
      fixed += c;
      continue;
    }

    if (c == '>') convert = true;
    if (c == '<') convert = false;

    if (convert && !inAttribute) {
      if (c == '\'') {
        fixed += "&apos;";
        continue;
      }
      if (c == '"') {
        fixed += "&quot;";
        continue;
      }
    }
    fixed += c;
  }

  return fixed;
}

bool XmlHelper::isNumeric(const std::string& value) {
  std::size_t i = 0;
  const std::size_t n = value.size();
  auto isSpace = [](char c) {
    return c == ' ' || c == '\t' || c == '\n' || c == '\r' || c == '\v' ||
           c == '\f';
  };
  auto isDigit = [](char c) {
    return std::isdigit(static_cast<unsigned char>(c)) != 0;
  };

  while (i < n && isSpace(value[i])) ++i;
  if (i < n && (value[i] == '+' || value[i] == '-')) ++i;

  std::size_t digits = 0;
  while (i < n && isDigit(value[i])) {
    ++i;
    ++digits;
  }
  if (i < n && value[i] == '.') {
    ++i;
    while (i < n && isDigit(value[i])) {
      ++i;
      ++digits;
    }
  }
  if (digits == 0) return false;

  if (i < n && (value[i] == 'e' || value[i] == 'E')) {
    std::size_t j = i + 1;
    if (j < n && (value[j] == '+' || value[j] == '-')) ++j;
    std::size_t expDigits = 0;
    while (j < n && isDigit(value[j])) {
      ++j;
      ++expDigits;
    }
    if (expDigits == 0) return false;
    i = j;
  }

  while (i < n && isSpace(value[i])) ++i;
  return i == n;
}

namespace {

xmlXPathObjectPtr evaluate(xmlDocPtr document, const std::string& expression) {
  XmlErrorCollector errors;

  std::unique_ptr<xmlXPathContext, decltype(&xmlXPathFreeContext)> ctx(
      xmlXPathNewContext(document), &xmlXPathFreeContext);
  if (!ctx) {
    throw InvalidXPathError("Failed to create XPath context for: " +
                            expression);
  }
  ctx->node = reinterpret_cast<xmlNodePtr>(document);

  xmlXPathObjectPtr result =
      xmlXPathEvalExpression(BAD_CAST expression.c_str(), ctx.get());
  if (!result) {
    CompositeLogger::instance().debug("XmlHelper: invalid XPath expression " +
                                      expression);
    throw InvalidXPathError("Invalid XPath expression: " + expression,
                            errors.take());
  }
  return result;
}

}  // namespace

NodeList XmlHelper::xpath(xmlDocPtr document, const std::string& expression) {
  return NodeList(evaluate(document, expression));
}

NodeList XmlHelper::xpath(const std::string& xml,
                          const std::string& expression) {
  std::shared_ptr<xmlDoc> document;
  {
    XmlErrorCollector errors;
    xmlDocPtr parsed = xmlReadMemory(xml.data(), static_cast<int>(xml.size()),
                                     nullptr, nullptr, XML_PARSE_NONET);
    if (!parsed) {
      throw InvalidXmlError("The provided XML is not valid:", errors.take());
    }
    document.reset(parsed, &xmlFreeDoc);
  }

  return NodeList(evaluate(document.get(), expression), document);
}

}  // namespace xmlkit
