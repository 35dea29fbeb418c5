#include "xmlkit/nodelist.hpp"

#include <utility>

namespace xmlkit {

NodeList::NodeList(xmlXPathObjectPtr result, std::shared_ptr<xmlDoc> owner)
    : owner_(std::move(owner)), result_(result, ObjectDeleter{}) {}

std::size_t NodeList::size() const noexcept {
  if (!result_ || result_->type != XPATH_NODESET || !result_->nodesetval) {
    return 0;
  }
  return static_cast<std::size_t>(result_->nodesetval->nodeNr);
}

xmlNodePtr NodeList::item(std::size_t index) const noexcept {
  if (index >= size()) return nullptr;
  return result_->nodesetval->nodeTab[index];
}

xmlNodePtr* NodeList::begin() const noexcept {
  if (size() == 0) return nullptr;
  return result_->nodesetval->nodeTab;
}

xmlNodePtr* NodeList::end() const noexcept {
  if (size() == 0) return nullptr;
  return result_->nodesetval->nodeTab + result_->nodesetval->nodeNr;
}

}  // namespace xmlkit
