/**
 * @file xmlvalidator.hpp
 * @brief Проверка документа по схеме XSD с упрощением сообщений libxml2.
 */

#pragma once

#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "xmlkit/xmldocument.hpp"
#include "xmlkit/xmlexception.hpp"

namespace xmlkit {

/**
 * @brief Упорядоченная таблица замен "фрагмент -> текст".
 *
 * Замены применяются последовательно, каждая ко всему сообщению.
 */
using Translations = std::vector<std::pair<std::string, std::string>>;

class IXmlValidator {
 public:
  virtual ~IXmlValidator() = default;

  /**
   * @brief Проверяет документ по схеме.
   * @param schemaPath Путь к XSD; по умолчанию XmlDocument::getSchema()
   * @param translations Дополнительные замены для сообщений об ошибках
   * @throw SchemaValidationError если документ не соответствует схеме
   * @throw XmlException если схема не указана или не найдена
   */
  virtual void validate(const XmlDocument& document,
                        const std::optional<std::string>& schemaPath,
                        const Translations& translations) = 0;
};

class XmlValidator : public IXmlValidator {
 public:
  XmlValidator() = default;
  /// @param translations Замены, добавляемые к стандартной таблице
  explicit XmlValidator(Translations translations);

  void validate(const XmlDocument& document,
                const std::optional<std::string>& schemaPath = std::nullopt,
                const Translations& translations = {}) override;

  /// Стандартная таблица упрощения сообщений libxml2.
  static const Translations& defaultTranslations();

  /**
   * @brief Объединяет таблицы: ключ из @p extra заменяет значение
   * существующего ключа на его прежнем месте, новые ключи добавляются в конец.
   */
  static Translations merge(Translations base, const Translations& extra);

  /**
   * @brief Переводит сообщения libxml2.
   *
   * @details
   * К сообщению применяются стандартная таблица, таблица из конструктора и
   * @p extra, затем "%(line)s" заменяется номером строки.
   */
  std::vector<std::string> translate(
      const std::vector<XmlDiagnostic>& diagnostics,
      const Translations& extra = {}) const;

 private:
  std::string resolveSchemaPath(const XmlDocument& document) const;

  Translations translations_;
};

}  // namespace xmlkit
