/**
 * @file xmldecoder.hpp
 * @brief Преобразование дерева XML в структурированные данные.
 *
 * @details
 * Обратная операция к XmlEncoder:
 * - элемент без атрибутов с единственным текстовым узлом становится строкой;
 * - атрибуты попадают в "@attributes", текст рядом с атрибутами или
 *   дочерними элементами в "@value" (несколько текстовых узлов склеиваются);
 * - пустой элемент без атрибутов даёт null;
 * - одноимённые соседние элементы собираются в массив. Элементы массива,
 *   имеющие структуру, раскладываются в объект без лишнего уровня с именем
 *   тега.
 */

#pragma once

#include <libxml/tree.h>

#include "xmlkit/structureddata.hpp"
#include "xmlkit/xmldocument.hpp"

namespace xmlkit {

class IXmlDecoder {
 public:
  virtual ~IXmlDecoder() = default;

  /// Данные документа в виде {корень: ...} или пустой объект без корня.
  virtual Data decode(const XmlDocument& document) = 0;

  /// Данные элемента в виде {тег: ...}.
  virtual Data decode(xmlNodePtr element) = 0;
};

class XmlDecoder : public IXmlDecoder {
 public:
  Data decode(const XmlDocument& document) override;
  Data decode(xmlNodePtr element) override;

  /**
   * @brief Добавляет данные элемента в существующий объект @p data.
   *
   * @param twinsAsArray false: содержимое пишется в data[тег];
   *                     true: содержимое пишется прямо в @p data (элемент
   *                     массива одноимённых узлов)
   */
  void decodeInto(xmlNodePtr element, Data& data, bool twinsAsArray = false);

 private:
  void decodeChild(xmlNodePtr child, xmlNodePtr element, Data& self);
};

}  // namespace xmlkit
