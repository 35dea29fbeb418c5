#include "xmlkit/xmldecoder.hpp"

#include <string>

#include "xmlkit/compositelogger.hpp"

namespace xmlkit {

namespace {

std::string qualifiedName(xmlNodePtr node) {
  std::string name = reinterpret_cast<const char*>(node->name);
  if (node->ns && node->ns->prefix) {
    name = reinterpret_cast<const char*>(node->ns->prefix) + (":" + name);
  }
  return name;
}

std::string content(xmlNodePtr node) {
  xmlChar* text = xmlNodeGetContent(node);
  if (!text) return "";
  std::string value(reinterpret_cast<const char*>(text));
  xmlFree(text);
  return value;
}

std::string trim(const std::string& value) {
  const auto begin = value.find_first_not_of(" \t\r\n\v\f");
  if (begin == std::string::npos) return "";
  const auto end = value.find_last_not_of(" \t\r\n\v\f");
  return value.substr(begin, end - begin + 1);
}

bool hasElementChildren(xmlNodePtr node) {
  for (xmlNodePtr child = node->children; child; child = child->next) {
    if (child->type == XML_ELEMENT_NODE) return true;
  }
  return false;
}

std::size_t countChildren(xmlNodePtr node) {
  std::size_t count = 0;
  for (xmlNodePtr child = node->children; child; child = child->next) {
    ++count;
  }
  return count;
}

std::size_t countTwins(xmlNodePtr parent, const std::string& name) {
  std::size_t count = 0;
  for (xmlNodePtr child = parent->children; child; child = child->next) {
    if (child->type == XML_ELEMENT_NODE && qualifiedName(child) == name) {
      ++count;
    }
  }
  return count;
}

void ensureObject(Data& value) {
  if (!value.is_object()) value = Data::object();
}

void appendValue(Data& self, const std::string& text) {
  ensureObject(self);
  Data& value = self[kValueKey];
  if (value.is_string()) {
    value = value.get<std::string>() + text;
  } else {
    value = text;
  }
}

}  // namespace

Data XmlDecoder::decode(const XmlDocument& document) {
  xmlNodePtr root = document.getDocumentElement();
  if (!root) return Data::object();
  return decode(root);
}

Data XmlDecoder::decode(xmlNodePtr element) {
  if (!element || element->type != XML_ELEMENT_NODE) return Data::object();

  CompositeLogger::instance().debug("XmlDecoder: decoding <" +
                                    qualifiedName(element) + ">");
  Data data = Data::object();
  data[qualifiedName(element)] = nullptr;
  decodeInto(element, data, false);
  return data;
}

void XmlDecoder::decodeChild(xmlNodePtr child, xmlNodePtr element,
                             Data& self) {
  const std::string childTag = qualifiedName(child);
  ensureObject(self);

  if (countTwins(element, childTag) == 1) {
    if (!self.contains(childTag)) self[childTag] = nullptr;
    decodeInto(child, self, false);
    return;
  }

  Data& list = self[childTag];
  if (!list.is_array()) list = Data::array();

  const bool leaf = child->properties == nullptr && !hasElementChildren(child);
  const std::string text = leaf ? trim(content(child)) : std::string();
  if (leaf && !text.empty()) {
    list.push_back(text);
  } else if (leaf) {
    list.push_back(nullptr);
  } else {
    list.push_back(Data::object());
    decodeInto(child, list.back(), true);
  }
}

void XmlDecoder::decodeInto(xmlNodePtr element, Data& data,
                            bool twinsAsArray) {
  const std::string key = qualifiedName(element);
  if (!twinsAsArray) ensureObject(data);
  Data& self = twinsAsArray ? data : data[key];

  const bool hasAttributes = element->properties != nullptr;
  if (hasAttributes) {
    ensureObject(self);
    Data attributes = Data::object();
    for (xmlAttrPtr attr = element->properties; attr; attr = attr->next) {
      attributes[qualifiedName(reinterpret_cast<xmlNodePtr>(attr))] =
          content(reinterpret_cast<xmlNodePtr>(attr));
    }
    self[kAttributesKey] = std::move(attributes);
  }

  const std::size_t childCount = countChildren(element);
  for (xmlNodePtr child = element->children; child; child = child->next) {
    switch (child->type) {
      case XML_TEXT_NODE:
      case XML_CDATA_SECTION_NODE: {
        const std::string text = trim(content(child));
        if (text.empty()) break;

        if (!hasAttributes && childCount == 1 && self.is_null()) {
          self = text;
        } else {
          appendValue(self, text);
        }
        break;
      }
      case XML_ELEMENT_NODE:
        decodeChild(child, element, self);
        break;
      default:
        break;
    }
  }
}

}  // namespace xmlkit
