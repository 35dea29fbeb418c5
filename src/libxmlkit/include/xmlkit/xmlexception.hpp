/**
 * @file xmlexception.hpp
 * @brief Иерархия исключений библиотеки xmlkit.
 *
 * @details
 * Все ошибки библиотеки наследуются от XmlException (std::runtime_error).
 * Исключение хранит человекочитаемый список ошибок и, если они получены от
 * libxml2, структурированные диагностические записи (XmlDiagnostic).
 *
 * | Класс                   | Ситуация                                     |
 * |-------------------------|----------------------------------------------|
 * | EmptyDocumentError      | загрузка пустого содержимого                 |
 * | MalformedXmlError       | синтаксическая ошибка при загрузке документа |
 * | InvalidStructureError   | данные нарушают соглашения кодека            |
 * | InvalidXPathError       | ошибка разбора или вычисления XPath          |
 * | InvalidXmlError         | некорректный XML в XPathQuery                |
 * | XPathNodeNotFoundError  | XPath для канонизации ничего не нашёл        |
 * | SchemaValidationError   | документ не прошёл проверку по XSD           |
 */

#pragma once

#include <stdexcept>
#include <string>
#include <vector>

namespace xmlkit {

/**
 * @struct XmlDiagnostic
 * @brief Диагностическое сообщение libxml2 (аналог xmlError).
 */
struct XmlDiagnostic {
  enum class Level { Warning, Error, Fatal };

  Level level = Level::Error;
  int code = 0;
  int line = 0;
  int column = 0;
  std::string message;  ///< Текст без завершающих пробелов и переводов строк

  /**
   * @brief "Error <уровень>: <текст> in line <l>, column <c> (Code: <n>)."
   */
  std::string toString() const;
};

std::string levelToString(XmlDiagnostic::Level level);

class XmlException : public std::runtime_error {
 public:
  explicit XmlException(const std::string& message,
                        std::vector<XmlDiagnostic> diagnostics = {});
  XmlException(const std::string& message, std::vector<std::string> errors,
               std::vector<XmlDiagnostic> diagnostics);

  /// Сообщения об ошибках в текстовом виде.
  const std::vector<std::string>& errors() const noexcept { return errors_; }

  /// Исходные записи libxml2 (может быть пустым).
  const std::vector<XmlDiagnostic>& diagnostics() const noexcept {
    return diagnostics_;
  }

 private:
  static std::string compose(const std::string& message,
                             const std::vector<std::string>& errors);

  std::vector<std::string> errors_;
  std::vector<XmlDiagnostic> diagnostics_;
};

class EmptyDocumentError : public XmlException {
 public:
  using XmlException::XmlException;
};

class MalformedXmlError : public XmlException {
 public:
  using XmlException::XmlException;
};

class InvalidStructureError : public XmlException {
 public:
  using XmlException::XmlException;
};

class InvalidXPathError : public XmlException {
 public:
  using XmlException::XmlException;
};

class InvalidXmlError : public XmlException {
 public:
  using XmlException::XmlException;
};

class XPathNodeNotFoundError : public XmlException {
 public:
  using XmlException::XmlException;
};

class SchemaValidationError : public XmlException {
 public:
  using XmlException::XmlException;
};

}  // namespace xmlkit
