#include "xmlkit/xmlencoder.hpp"

#include "xmlkit/compositelogger.hpp"
#include "xmlkit/xmlexception.hpp"
#include "xmlkit/xmlhelper.hpp"

namespace xmlkit {

namespace {

bool isDocumentNode(xmlNodePtr node) {
  return node->type == XML_DOCUMENT_NODE ||
         node->type == XML_HTML_DOCUMENT_NODE;
}

std::string nodeName(xmlNodePtr node) {
  if (isDocumentNode(node)) return "#document";
  std::string name = reinterpret_cast<const char*>(node->name);
  if (node->ns && node->ns->prefix) {
    name = reinterpret_cast<const char*>(node->ns->prefix) + (":" + name);
  }
  return name;
}

}  // namespace

std::unique_ptr<XmlDocument> XmlEncoder::encode(
    const Data& data, const std::optional<XmlNamespace>& ns) {
  auto doc = std::make_unique<XmlDocument>();
  encodeInto(data, *doc, ns, nullptr);
  return doc;
}

XmlDocument& XmlEncoder::encodeInto(const Data& data, XmlDocument& doc,
                                    const std::optional<XmlNamespace>& ns,
                                    xmlNodePtr parent) {
  if (!data.is_object()) {
    throw InvalidStructureError(
        "The data to encode must be a mapping of node names to values.");
  }

  xmlNodePtr start = parent ? parent : reinterpret_cast<xmlNodePtr>(doc.get());
  CompositeLogger::instance().debug("XmlEncoder: encoding " +
                                    std::to_string(data.size()) +
                                    " entries into <" + nodeName(start) + ">");

  encodeNode(data, doc.get(), ns, start);
  doc.invalidateCache();
  return doc;
}

void XmlEncoder::encodeNode(const Data& data, xmlDocPtr doc,
                            const std::optional<XmlNamespace>& ns,
                            xmlNodePtr parent) {
  // Атрибуты идут первыми: объявления xmlns должны быть видны дочерним узлам.
  // На уровне документа атрибуты некуда добавить.
  const auto attributes = data.find(kAttributesKey);
  if (attributes != data.end() && attributes->is_object() &&
      parent->type == XML_ELEMENT_NODE) {
    addAttributes(parent, *attributes);
  }

  for (const auto& [key, value] : data.items()) {
    if (key == kAttributesKey) {
      continue;
    } else if (key == kValueKey) {
      if (isSkipValue(value)) continue;
      if (!isScalarValue(value)) {
        throw InvalidStructureError(
            "The value of \"@value\" in the node \"" + nodeName(parent) +
            "\" must be a scalar. The value is: " + value.dump());
      }
      if (parent->type == XML_ELEMENT_NODE) {
        const std::string text = XmlHelper::sanitize(scalarToString(value));
        xmlNodeSetContent(parent, BAD_CAST text.c_str());
      }
    } else if (value.is_array() || value.is_object()) {
      if (!value.empty()) {
        addChildren(doc, parent, key, value, ns);
      }
    } else if (!isSkipValue(value)) {
      const std::string text = XmlHelper::sanitize(scalarToString(value));
      appendElement(doc, parent, key, &text, ns);
    }
  }
}

void XmlEncoder::addAttributes(xmlNodePtr node, const Data& attributes) {
  for (const auto& [name, value] : attributes.items()) {
    if (value.is_array() || value.is_object()) {
      throw InvalidStructureError(
          "The type of data of the value entered for the attribute \"" + name +
          "\" of the node \"" + nodeName(node) +
          "\" is incorrect (cannot be an array). The value is: " +
          value.dump());
    }
  }

  // Сначала объявления пространств имён, чтобы префиксы остальных
  // атрибутов разрешались независимо от порядка ключей
  for (const auto& [name, value] : attributes.items()) {
    if (isSkipValue(value)) continue;
    if (name == "xmlns") {
      declareNamespace(node, scalarToString(value), "");
    } else if (name.rfind("xmlns:", 0) == 0) {
      declareNamespace(node, scalarToString(value), name.substr(6));
    }
  }

  for (const auto& [name, value] : attributes.items()) {
    if (isSkipValue(value)) continue;
    if (name == "xmlns" || name.rfind("xmlns:", 0) == 0) continue;

    const std::string text = scalarToString(value);
    const auto colon = name.find(':');
    if (colon != std::string::npos && colon > 0 && colon + 1 < name.size()) {
      const std::string prefix = name.substr(0, colon);
      const std::string local = name.substr(colon + 1);
      xmlNsPtr ns = xmlSearchNs(node->doc, node, BAD_CAST prefix.c_str());
      if (ns) {
        xmlSetNsProp(node, ns, BAD_CAST local.c_str(), BAD_CAST text.c_str());
        continue;
      }
      CompositeLogger::instance().warning(
          "XmlEncoder: prefix \"" + prefix + "\" of the attribute \"" + name +
          "\" is not declared on <" + nodeName(node) + ">");
    }
    xmlSetProp(node, BAD_CAST name.c_str(), BAD_CAST text.c_str());
  }
}

void XmlEncoder::declareNamespace(xmlNodePtr node, const std::string& uri,
                                  const std::string& prefix) {
  const xmlChar* rawPrefix =
      prefix.empty() ? nullptr : BAD_CAST prefix.c_str();

  xmlNsPtr ns = nullptr;
  for (xmlNsPtr def = node->nsDef; def; def = def->next) {
    if (xmlStrEqual(def->prefix, rawPrefix)) {
      ns = def;
      break;
    }
  }
  if (ns) {
    // Повторное объявление того же префикса на узле: оставляем первое
    if (!xmlStrEqual(ns->href, BAD_CAST uri.c_str())) {
      CompositeLogger::instance().warning(
          "XmlEncoder: namespace prefix \"" + prefix + "\" on <" +
          nodeName(node) + "> is already bound to another URI");
    }
  } else {
    ns = xmlNewNs(node, BAD_CAST uri.c_str(), rawPrefix);
    if (!ns) {
      throw XmlException("Failed to declare the namespace \"" + uri +
                         "\" on <" + nodeName(node) + ">");
    }
  }

  // Пространство по умолчанию задаёт имя самого узла
  if (!rawPrefix && !node->ns) {
    xmlSetNs(node, ns);
  }
}

void XmlEncoder::addChildren(xmlDocPtr doc, xmlNodePtr parent,
                             const std::string& tag, const Data& children,
                             const std::optional<XmlNamespace>& ns) {
  Data records = children;
  if (children.is_object()) {
    records = Data::array();
    records.push_back(children);
  }

  for (const auto& child : records) {
    if (isSkipValue(child)) continue;

    if (child.is_array()) {
      throw InvalidStructureError(
          "The node \"" + tag +
          "\" allows including arrays, but they must be arrays with other "
          "nodes. The current value is incorrect: " +
          child.dump());
    }

    if (child.is_object()) {
      xmlNodePtr node = appendElement(doc, parent, tag, nullptr, ns);
      encodeNode(child, doc, ns, node);
    } else {
      const std::string text = XmlHelper::sanitize(scalarToString(child));
      appendElement(doc, parent, tag, &text, ns);
    }
  }
}

xmlNodePtr XmlEncoder::appendElement(xmlDocPtr doc, xmlNodePtr parent,
                                     const std::string& tag,
                                     const std::string* text,
                                     const std::optional<XmlNamespace>& ns) {
  if (isDocumentNode(parent) && xmlDocGetRootElement(doc)) {
    throw InvalidStructureError(
        "The document already has the root element <" +
        nodeName(xmlDocGetRootElement(doc)) + ">, the node <" + tag +
        "> cannot be added as a second root.");
  }

  xmlNodePtr node =
      xmlNewDocNode(doc, nullptr, BAD_CAST tag.c_str(),
                    text && !text->empty() ? BAD_CAST text->c_str() : nullptr);
  if (!node) {
    throw XmlException("Failed to create the node <" + tag + ">");
  }
  if (!xmlAddChild(parent, node)) {
    xmlFreeNode(node);
    throw XmlException("Failed to append the node <" + tag + ">");
  }

  if (ns) {
    // Объявление переиспользуется, если оно уже видно из родителя
    xmlNsPtr found = xmlSearchNsByHref(doc, node, BAD_CAST ns->uri.c_str());
    if (!found) {
      found = xmlNewNs(node, BAD_CAST ns->uri.c_str(),
                       ns->prefix.empty() ? nullptr
                                          : BAD_CAST ns->prefix.c_str());
    }
    xmlSetNs(node, found);
  } else if (parent->type == XML_ELEMENT_NODE) {
    // Узел без явного пространства наследует пространство по умолчанию,
    // объявленное выше, как это сделал бы парсер при чтении документа
    xmlNsPtr inherited = xmlSearchNs(doc, parent, nullptr);
    if (inherited) {
      xmlSetNs(node, inherited);
    }
  }

  return node;
}

}  // namespace xmlkit
