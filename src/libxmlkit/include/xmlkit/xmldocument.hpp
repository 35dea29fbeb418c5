/**
 * @file xmldocument.hpp
 * @brief Документ XML: владение деревом libxml2, загрузка, сериализация,
 * канонизация и доступ к данным.
 *
 * @details
 * XmlDocument владеет одним xmlDoc. Рабочая кодировка документа (по
 * умолчанию ISO-8859-1) определяет:
 * - в какую кодировку перекодируется входной UTF-8 при loadXml();
 * - в какой кодировке выдаются saveXml(), getXml() и c14nWithEncoding().
 *
 * Запросы (query(), getNodes()) выполняет XPathQuery, создаваемый при первом
 * обращении, в режиме без пространств имён. Результат toArray() вычисляется
 * один раз и сбрасывается при loadXml() и invalidateCache(). Изменения
 * дерева напрямую через API libxml2 кэш не сбрасывают.
 */

#pragma once

#include <libxml/tree.h>

#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "xmlkit/nodelist.hpp"
#include "xmlkit/structureddata.hpp"
#include "xmlkit/xmlexception.hpp"
#include "xmlkit/xpathquery.hpp"

namespace xmlkit {

class XmlDocument {
 public:
  static constexpr const char* kDefaultVersion = "1.0";
  static constexpr const char* kDefaultEncoding = "ISO-8859-1";

  explicit XmlDocument(const std::string& version = kDefaultVersion,
                       const std::string& encoding = kDefaultEncoding);
  ~XmlDocument();

  XmlDocument(const XmlDocument&) = delete;
  XmlDocument& operator=(const XmlDocument&) = delete;
  XmlDocument(XmlDocument&&) noexcept;
  XmlDocument& operator=(XmlDocument&&) noexcept;

  /// Дерево libxml2. Владение остаётся у документа.
  xmlDocPtr get() const noexcept { return document_.get(); }

  const std::string& version() const noexcept { return version_; }
  const std::string& encoding() const noexcept { return encoding_; }

  bool formatOutput() const noexcept { return formatOutput_; }
  void setFormatOutput(bool format) noexcept { formatOutput_ = format; }

  /// Корневой элемент или nullptr.
  xmlNodePtr getDocumentElement() const noexcept;

  /// Имя корневого элемента (с префиксом) или пустая строка.
  std::string getName() const;

  /// Пространство имён по умолчанию, объявленное на корневом элементе.
  std::optional<std::string> getNamespace() const;

  /// Путь к схеме: второй элемент списка xsi:schemaLocation корня.
  std::optional<std::string> getSchema() const;

  /**
   * @brief Загружает документ из текста XML, заменяя текущее дерево.
   *
   * @details
   * Текст в UTF-8 при рабочей кодировке, отличной от UTF-8, перекодируется;
   * при отсутствии объявления XML оно добавляется. Пробельные текстовые
   * узлы сохраняются.
   *
   * @param options Дополнительные флаги xmlParserOption
   * @throw EmptyDocumentError если @p source пуст
   * @throw MalformedXmlError если текст не разобран (с диагностикой libxml2)
   */
  void loadXml(const std::string& source, int options = 0);

  /**
   * @brief Сериализует документ (или узел) с исправлением сущностей.
   *
   * @details
   * Документ выводится в рабочей кодировке с объявлением XML, узел в UTF-8
   * без объявления. Результат проходит через XmlHelper::fixEntities().
   */
  std::string saveXml(xmlNodePtr node = nullptr) const;

  /// saveXml() без объявления XML и без пробелов по краям.
  std::string getXml() const;

  /**
   * @brief Каноническая форма (C14N 1.0 или исключающая) в UTF-8.
   * @param node Узел для канонизации поддерева или nullptr для документа
   */
  std::string c14n(xmlNodePtr node = nullptr, bool exclusive = false,
                   bool withComments = false) const;

  /**
   * @brief Каноническая форма в рабочей кодировке.
   *
   * @details
   * Канонизирует первый узел по @p xpath (или весь документ, если выражение
   * пустое), исправляет сущности и перекодирует результат из UTF-8.
   *
   * @throw XPathNodeNotFoundError если по выражению ничего не найдено
   */
  std::string c14nWithEncoding(const std::string& xpath = "",
                               bool exclusive = false,
                               bool withComments = false) const;

  /// c14nWithEncoding() с удалёнными пробелами между тегами.
  std::string c14nWithEncodingFlattened(const std::string& xpath = "",
                                        bool exclusive = false,
                                        bool withComments = false) const;

  /// Каноническая форма узла /<корень>/Signature, если он есть.
  std::optional<std::string> getSignatureNodeXml() const;

  Data query(const std::string& query,
             const XPathQuery::Params& params = {}) const;

  NodeList getNodes(const std::string& query,
                    const XPathQuery::Params& params = {}) const;

  /**
   * @brief Значение по пути через точку, например "Invoice.Lines.Line.0".
   *
   * @details
   * Путь разрешается по toArray(). Сегмент из цифр обращается к элементу
   * массива. Если путь не существует, возвращается @p defaultValue.
   */
  Data get(const std::string& selector, const Data& defaultValue = nullptr) const;

  /// Проекция всего документа, вычисляемая один раз.
  const Data& toArray() const;

  /// Сбрасывает результат toArray() после изменения дерева.
  void invalidateCache() noexcept;

  /**
   * @brief Проверяет документ по схеме XSD.
   * @param[out] diagnostics Сообщения libxml2, полученные при проверке
   * @return true если документ соответствует схеме
   * @throw XmlException если схему не удалось разобрать
   */
  bool schemaValidate(const std::string& schemaPath,
                      std::vector<XmlDiagnostic>& diagnostics) const;

 private:
  struct DocDeleter {
    void operator()(xmlDocPtr doc) const {
      if (doc) xmlFreeDoc(doc);
    }
  };

  XPathQuery& xpath() const;

  std::unique_ptr<xmlDoc, DocDeleter> document_;
  std::string version_;
  std::string encoding_;
  bool formatOutput_ = true;

  mutable std::unique_ptr<XPathQuery> xpath_;
  mutable std::optional<Data> array_;
};

}  // namespace xmlkit
