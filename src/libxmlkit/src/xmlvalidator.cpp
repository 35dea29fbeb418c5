#include "xmlkit/xmlvalidator.hpp"

#include <algorithm>
#include <filesystem>

#include "xmlkit/compositelogger.hpp"

namespace fs = std::filesystem;

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

}  // namespace

XmlValidator::XmlValidator(Translations translations)
    : translations_(std::move(translations)) {}

const Translations& XmlValidator::defaultTranslations() {
  static const Translations defaults = {
      {"': ", "' (línea %(line)s): "},
      {": [facet 'pattern'] The value", ": has the value"},
      {": This element is not expected. Expected is one of",
       ": was not expected, the expected was one of the following"},
      {": This element is not expected. Expected is",
       ": was not expected, the expected was"},
      {"is not accepted by the pattern",
       "is not valid according to the regular expression (pattern)"},
      {"is not a valid value of the local atomic type",
       "is not a valid value for the field type"},
      {"is not a valid value of the atomic type",
       "is not a valid value for the field type"},
      {": [facet 'maxLength'] The value has a length of ",
       ": the value of the field has a length of "},
      {"; this exceeds the allowed maximum length of ",
       " characters exceeding the maximum allowed length of "},
      {": [facet 'enumeration'] The value ", ": the value "},
      {"is not an element of the set",
       "is not valid, it must be one of the following values"},
      {"[facet 'minLength'] The value has a length of",
       "the value of the field has a length of "},
      {"; this underruns the allowed minimum length of",
       " and the minimum required length is"},
      {"Missing child element(s). Expected is",
       "must have inside, lower level, the field"},
      {"Character content other than whitespace is not allowed because the "
       "content type is 'element-only'",
       "the value of the field is invalid"},
      {"Element", "Field"},
      {" ( ", " '"},
      {" ).", "'."},
      {"No matching global declaration available for the validation root",
       "The root node of the XML does not match what is expected in the "
       "schema definition"},
  };
  return defaults;
}

Translations XmlValidator::merge(Translations base, const Translations& extra) {
  for (const auto& [from, to] : extra) {
    auto it = std::find_if(base.begin(), base.end(), [&](const auto& entry) {
      return entry.first == from;
    });
    if (it != base.end()) {
      it->second = to;
    } else {
      base.emplace_back(from, to);
    }
  }
  return base;
}

std::vector<std::string> XmlValidator::translate(
    const std::vector<XmlDiagnostic>& diagnostics,
    const Translations& extra) const {
  const Translations table =
      merge(merge(defaultTranslations(), translations_), extra);

  std::vector<std::string> messages;
  messages.reserve(diagnostics.size());
  for (const auto& diagnostic : diagnostics) {
    std::string message = diagnostic.message;
    for (const auto& [from, to] : table) {
      replaceAll(message, from, to);
    }
    replaceAll(message, "%(line)s", std::to_string(diagnostic.line));
    messages.push_back(std::move(message));
  }
  return messages;
}

void XmlValidator::validate(const XmlDocument& document,
                            const std::optional<std::string>& schemaPath,
                            const Translations& translations) {
  const std::string schema =
      schemaPath ? *schemaPath : resolveSchemaPath(document);

  std::vector<XmlDiagnostic> diagnostics;
  const bool valid = document.schemaValidate(schema, diagnostics);
  if (valid) {
    CompositeLogger::instance().debug("XmlValidator: document <" +
                                      document.getName() +
                                      "> is valid against " + schema);
    return;
  }

  // Пространство имён документа в сообщениях libxml2 выводится как {uri}
  Translations extra = translations;
  extra.emplace_back("{" + document.getNamespace().value_or("") + "}", "");
  std::vector<std::string> errors = translate(diagnostics, extra);

  const std::string schemaName = fs::path(schema).filename().string();
  CompositeLogger::instance().error("XmlValidator: document <" +
                                    document.getName() +
                                    "> failed validation against " +
                                    schemaName);
  throw SchemaValidationError(
      "The XML validation failed using the schema " + schemaName + ".",
      std::move(errors), std::move(diagnostics));
}

std::string XmlValidator::resolveSchemaPath(const XmlDocument& document) const {
  const std::optional<std::string> schema = document.getSchema();
  if (!schema) {
    throw XmlException(
        "The XML does not contain a valid schema location in the "
        "\"xsi:schemaLocation\" attribute.");
  }

  std::error_code ec;
  if (!fs::exists(*schema, ec)) {
    throw XmlException(
        "To validate an XML, the absolute path to the schema must be "
        "specified.");
  }
  return *schema;
}

}  // namespace xmlkit
