/**
 * @file nodelist.hpp
 * @brief Результат XPath-запроса: упорядоченный список узлов libxml2.
 */

#pragma once

#include <libxml/tree.h>
#include <libxml/xpath.h>

#include <cstddef>
#include <memory>

namespace xmlkit {

/**
 * @class NodeList
 * @brief Владеет xmlXPathObject и даёт доступ к найденным узлам.
 *
 * @details
 * Узлы принадлежат документу, а не списку: список нельзя использовать после
 * освобождения документа, по которому выполнялся запрос. Результат, не
 * являющийся набором узлов (число, строка), представляется пустым списком.
 */
class NodeList {
 public:
  NodeList() = default;
  /**
   * @param result Результат xmlXPathEval, список становится его владельцем
   * @param owner  Документ, который должен жить не меньше списка (для
   *               документов, разобранных только ради одного запроса)
   */
  explicit NodeList(xmlXPathObjectPtr result,
                    std::shared_ptr<xmlDoc> owner = nullptr);

  std::size_t size() const noexcept;
  bool empty() const noexcept { return size() == 0; }

  /// Узел по индексу или nullptr за пределами списка.
  xmlNodePtr item(std::size_t index) const noexcept;

  xmlNodePtr* begin() const noexcept;
  xmlNodePtr* end() const noexcept;

 private:
  struct ObjectDeleter {
    void operator()(xmlXPathObjectPtr object) const {
      if (object) xmlXPathFreeObject(object);
    }
  };

  std::shared_ptr<xmlDoc> owner_;
  std::shared_ptr<xmlXPathObject> result_;
};

}  // namespace xmlkit
