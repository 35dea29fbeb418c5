/**
 * @file xmlhelper.hpp
 * @brief Утилиты подготовки текста для XML и исправления сущностей.
 *
 * @details
 * Содержит операции, от которых зависит побайтовая совместимость XML с
 * канонизацией C14N и проверкой электронной подписи XML-DSIG:
 * - sanitize(): очистка значений перед вставкой в дерево;
 * - fixEntities(): замена кавычек на &apos; и &quot; в текстовом
 *   содержимом сериализованного XML;
 * - xpath(): разовый XPath-запрос к документу или строке XML.
 */

#pragma once

#include <libxml/tree.h>

#include <string>

#include "xmlkit/nodelist.hpp"

namespace xmlkit {

class XmlHelper {
 public:
  /**
   * @brief Очищает значение, присваиваемое узлу XML.
   *
   * @details
   * Пустые и числовые значения возвращаются без изменений. Иначе:
   * 1. удаляются управляющие символы 0x00-0x1F и 0x7F;
   * 2. предопределённые сущности (&amp; &lt; &gt; &quot; &apos; и их
   *    числовые формы) заменяются символами;
   * 3. каждый '&' снова записывается как "&amp;".
   *
   * Символы '<', '>', '"' и '\'' остаются как есть: их экранирует libxml2 при
   * сериализации. Амперсанд экранируется заранее, потому что содержимое узла
   * задаётся через xmlNodeSetContent/xmlNewDocNode, которые разбирают ссылки
   * на сущности.
   */
  static std::string sanitize(const std::string& value);

  /**
   * @brief Заменяет ' и " на &apos; и &quot; в текстовом содержимом XML.
   *
   * @details
   * Посимвольный проход с двумя состояниями: "внутри текста" ('>' включает,
   * '<' выключает) и "внутри значения атрибута" ('=' с кавычкой сразу после
   * включает, та же кавычка выключает). Теги и значения атрибутов не
   * меняются. Для некорректного XML исключений нет, обрабатывается всё,
   * что удалось просканировать.
   */
  static std::string fixEntities(const std::string& xml);

  /**
   * @brief Числовая строка в смысле "целое или десятичное число".
   *
   * @details
   * Допускаются пробелы по краям, знак, дробная часть и экспонента:
   * "42", " -1.5", "1e3", ".5".
   */
  static bool isNumeric(const std::string& value);

  /**
   * @brief Выполняет XPath-выражение над документом.
   * @throw InvalidXPathError при ошибке в выражении
   */
  static NodeList xpath(xmlDocPtr document, const std::string& expression);

  /**
   * @brief Разбирает XML и выполняет над ним XPath-выражение.
   *
   * @details
   * Разобранный документ живёт, пока жив возвращённый список.
   * @throw InvalidXmlError если строка не является корректным XML
   * @throw InvalidXPathError при ошибке в выражении
   */
  static NodeList xpath(const std::string& xml, const std::string& expression);
};

}  // namespace xmlkit
