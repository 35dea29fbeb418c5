/**
 * @file xpathquery.hpp
 * @brief XPath-запросы с параметрами и проекция узлов в структурированные
 * данные.
 *
 * @details
 * Возможности:
 * - именованные параметры `:name` в выражении, значения подставляются как
 *   корректно экранированные литералы XPath;
 * - режим без пространств имён: если префиксы не заданы, каждый шаг пути
 *   `tag` переписывается в `*[local-name()="tag"]`, поэтому запрос находит
 *   элементы независимо от их пространства имён;
 * - запросы относительно контекстного узла;
 * - рекурсивная проекция узла в Data с объединением одноимённых соседей
 *   в массив.
 *
 * @code
 *   XPathQuery query(xml);
 *   Data total = query.get("/Invoice/Total");
 *   Data line = query.get("//Line[@id=:id]", {{"id", "3"}});
 * @endcode
 */

#pragma once

#include <libxml/tree.h>

#include <map>
#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "xmlkit/nodelist.hpp"
#include "xmlkit/structureddata.hpp"

namespace xmlkit {

class XPathQuery {
 public:
  /// Префикс -> URI пространства имён.
  using Namespaces = std::map<std::string, std::string>;
  /// Имя параметра (с ':' или без) -> значение, в порядке подстановки.
  using Params = std::vector<std::pair<std::string, std::string>>;

  /**
   * @brief Разбирает XML и строит запросы над собственной копией документа.
   * @throw InvalidXmlError если строка не является корректным XML
   */
  explicit XPathQuery(const std::string& xml, Namespaces namespaces = {});

  /**
   * @brief Запросы над существующим документом.
   * @param document Документ, который должен жить дольше объекта запроса
   */
  explicit XPathQuery(xmlDocPtr document, Namespaces namespaces = {});

  xmlDocPtr document() const noexcept { return document_; }

  /// Включён ли режим с учётом пространств имён.
  bool namespaceAware() const noexcept { return !namespaces_.empty(); }

  /**
   * @brief Выполняет запрос и возвращает проекцию результата.
   * @return null если ничего не найдено; проекцию единственного узла;
   *         массив проекций, если узлов несколько
   */
  Data get(const std::string& query, const Params& params = {},
           xmlNodePtr contextNode = nullptr) const;

  /// Текстовые значения всех найденных узлов.
  std::vector<std::string> getValues(const std::string& query,
                                     const Params& params = {},
                                     xmlNodePtr contextNode = nullptr) const;

  /// Текстовое значение первого найденного узла.
  std::optional<std::string> getValue(const std::string& query,
                                      const Params& params = {},
                                      xmlNodePtr contextNode = nullptr) const;

  /**
   * @brief Выполняет запрос и возвращает найденные узлы.
   * @throw InvalidXPathError при ошибке разбора или вычисления выражения
   */
  NodeList getNodes(const std::string& query, const Params& params = {},
                    xmlNodePtr contextNode = nullptr) const;

  /**
   * @brief Итоговое выражение: переписанные шаги (в режиме без пространств
   * имён) и подставленные параметры.
   */
  std::string resolveQuery(const std::string& query,
                           const Params& params = {}) const;

  /**
   * @brief Литерал XPath для строки.
   *
   * @details
   * `'v'`, если в строке нет апострофа; `"v"`, если есть апостроф, но нет
   * кавычки; иначе выражение concat(), собирающее строку из частей.
   */
  static std::string quoteValue(const std::string& value);

  /**
   * @brief Проекция узла: значение листа или объект дочерних элементов.
   *
   * @details
   * Дочерние элементы перечисляются по порядку. Первое вхождение имени
   * сохраняется как значение, второе превращает его в массив, последующие
   * дописываются в массив. Узел без дочерних элементов даёт свой текст.
   */
  static Data projectNode(xmlNodePtr node);

 private:
  std::shared_ptr<xmlDoc> owner_;
  xmlDocPtr document_ = nullptr;
  Namespaces namespaces_;
};

}  // namespace xmlkit
