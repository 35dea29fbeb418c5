/**
 * @file xmlconfig.hpp
 * @brief Настройки документов, журнала, запросов и валидатора.
 *
 * @details
 * Формат файла:
 * @code
 {
   "document":  { "version": "1.0", "encoding": "ISO-8859-1",
                  "format_output": true },
   "logging":   { "level": "info" },
   "query":     { "namespaces": { "ds": "http://www.w3.org/2000/09/xmldsig#" } },
   "validator": { "translations": { "Element": "Campo" } }
 }
 @endcode
 * Все разделы и поля необязательны.
 */

#pragma once

#include <memory>
#include <nlohmann/json.hpp>
#include <string>

#include "xmlkit/ilogger.hpp"
#include "xmlkit/xmldocument.hpp"
#include "xmlkit/xmlvalidator.hpp"
#include "xmlkit/xpathquery.hpp"

namespace xmlkit {

struct XmlConfig {
  std::string version = XmlDocument::kDefaultVersion;
  std::string encoding = XmlDocument::kDefaultEncoding;
  bool formatOutput = true;
  LogLevel logLevel = LogLevel::LOG_INFO;
  XPathQuery::Namespaces namespaces;
  Translations translations;

  /**
   * @brief Строит настройки из JSON.
   * @throw std::runtime_error если поле имеет неверный тип
   * @throw std::invalid_argument при неизвестном уровне журнала
   */
  static XmlConfig fromJson(const nlohmann::ordered_json& src);

  /// Пустой документ с настроенными версией, кодировкой и форматированием.
  std::unique_ptr<XmlDocument> createDocument() const;
};

}  // namespace xmlkit
