/**
 * @file xmlencoder.hpp
 * @brief Построение дерева XML из структурированных данных.
 *
 * @details
 * Соглашения (см. structureddata.hpp):
 * - ключ объекта становится именем элемента;
 * - "@attributes" задаёт атрибуты родительского элемента;
 * - "@value" задаёт текст родительского элемента;
 * - массив порождает одноимённые элементы одного уровня;
 * - null, false, [] и {} элемент не создают, "" и true создают пустой.
 *
 * Каждое текстовое значение проходит через XmlHelper::sanitize().
 */

#pragma once

#include <libxml/tree.h>

#include <memory>
#include <optional>
#include <string>

#include "xmlkit/structureddata.hpp"
#include "xmlkit/xmldocument.hpp"

namespace xmlkit {

/// Пространство имён создаваемых элементов.
struct XmlNamespace {
  std::string uri;
  std::string prefix;  ///< Пустой префикс объявляет пространство по умолчанию
};

class IXmlEncoder {
 public:
  virtual ~IXmlEncoder() = default;

  /// Создаёт новый документ из @p data.
  virtual std::unique_ptr<XmlDocument> encode(
      const Data& data,
      const std::optional<XmlNamespace>& ns = std::nullopt) = 0;

  /**
   * @brief Добавляет узлы из @p data в существующий документ.
   * @param parent Элемент, в который добавляются узлы, или nullptr для
   *               корня документа
   */
  virtual XmlDocument& encodeInto(const Data& data, XmlDocument& doc,
                                  const std::optional<XmlNamespace>& ns,
                                  xmlNodePtr parent) = 0;
};

class XmlEncoder : public IXmlEncoder {
 public:
  /**
   * @throw InvalidStructureError если данные нарушают соглашения: атрибут
   *        со значением-массивом или объектом, массив внутри массива, второй
   *        корневой элемент, нескалярный "@value"
   */
  std::unique_ptr<XmlDocument> encode(
      const Data& data,
      const std::optional<XmlNamespace>& ns = std::nullopt) override;

  XmlDocument& encodeInto(const Data& data, XmlDocument& doc,
                          const std::optional<XmlNamespace>& ns = std::nullopt,
                          xmlNodePtr parent = nullptr) override;

 private:
  void encodeNode(const Data& data, xmlDocPtr doc,
                  const std::optional<XmlNamespace>& ns, xmlNodePtr parent);
  void addAttributes(xmlNodePtr node, const Data& attributes);
  void declareNamespace(xmlNodePtr node, const std::string& uri,
                        const std::string& prefix);
  void addChildren(xmlDocPtr doc, xmlNodePtr parent, const std::string& tag,
                   const Data& children, const std::optional<XmlNamespace>& ns);
  xmlNodePtr appendElement(xmlDocPtr doc, xmlNodePtr parent,
                           const std::string& tag, const std::string* text,
                           const std::optional<XmlNamespace>& ns);
};

}  // namespace xmlkit
