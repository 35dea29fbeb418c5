#include "xmlkit/xmldocument.hpp"

#include <libxml/c14n.h>
#include <libxml/parser.h>
#include <libxml/xmlIO.h>
#include <libxml/xmlschemas.h>

#include <cctype>
#include <charconv>
#include <regex>
#include <sstream>
#include <utility>

#include "xmlkit/compositelogger.hpp"
#include "xmlkit/encodingtranscoder.hpp"
#include "xmlkit/errorcollector.hpp"
#include "xmlkit/xmlhelper.hpp"

namespace xmlkit {

namespace {

constexpr const char* kXsiNamespace =
    "http://www.w3.org/2001/XMLSchema-instance";

std::string trim(const std::string& value) {
  const auto begin = value.find_first_not_of(" \t\r\n");
  if (begin == std::string::npos) return "";
  const auto end = value.find_last_not_of(" \t\r\n");
  return value.substr(begin, end - begin + 1);
}

bool isIndex(const std::string& key) {
  if (key.empty()) return false;
  for (char c : key) {
    if (!std::isdigit(static_cast<unsigned char>(c))) return false;
  }
  return true;
}

// Узел виден, если он сам или один из его предков является целевым.
int isInSubtree(void* target, xmlNodePtr node, xmlNodePtr parent) {
  xmlNodePtr current =
      (node && node->type == XML_NAMESPACE_DECL) ? parent : node;
  for (; current; current = current->parent) {
    if (current == static_cast<xmlNodePtr>(target)) return 1;
  }
  return 0;
}

}  // namespace

XmlDocument::XmlDocument(const std::string& version,
                         const std::string& encoding)
    : document_(xmlNewDoc(BAD_CAST version.c_str())),
      version_(version),
      encoding_(EncodingTranscoder::normalizeName(encoding)) {
  if (!document_) {
    throw XmlException("Failed to create XML document");
  }
  document_->encoding = xmlStrdup(BAD_CAST encoding_.c_str());
}

XmlDocument::~XmlDocument() = default;

XmlDocument::XmlDocument(XmlDocument&&) noexcept = default;

XmlDocument& XmlDocument::operator=(XmlDocument&&) noexcept = default;

xmlNodePtr XmlDocument::getDocumentElement() const noexcept {
  return document_ ? xmlDocGetRootElement(document_.get()) : nullptr;
}

std::string XmlDocument::getName() const {
  xmlNodePtr root = getDocumentElement();
  if (!root) return "";
  std::string name = reinterpret_cast<const char*>(root->name);
  if (root->ns && root->ns->prefix) {
    name = reinterpret_cast<const char*>(root->ns->prefix) + (":" + name);
  }
  return name;
}

std::optional<std::string> XmlDocument::getNamespace() const {
  xmlNodePtr root = getDocumentElement();
  if (!root) return std::nullopt;

  for (xmlNsPtr ns = root->nsDef; ns; ns = ns->next) {
    if (!ns->prefix && ns->href && *ns->href) {
      return std::string(reinterpret_cast<const char*>(ns->href));
    }
  }
  return std::nullopt;
}

std::optional<std::string> XmlDocument::getSchema() const {
  xmlNodePtr root = getDocumentElement();
  if (!root) return std::nullopt;

  xmlChar* location =
      xmlGetNsProp(root, BAD_CAST "schemaLocation", BAD_CAST kXsiNamespace);
  if (!location) return std::nullopt;
  std::string schemaLocation(reinterpret_cast<const char*>(location));
  xmlFree(location);

  std::istringstream tokens(schemaLocation);
  std::string namespaceUri, schema;
  if (!(tokens >> namespaceUri >> schema)) {
    return std::nullopt;
  }
  return schema;
}

void XmlDocument::loadXml(const std::string& source, int options) {
  if (source.empty()) {
    throw EmptyDocumentError("The XML content that you want to load is empty.");
  }

  const std::string prepared =
      EncodingTranscoder::prepareForLoad(source, encoding_);

  XmlErrorCollector errors;
  xmlDocPtr parsed =
      xmlReadMemory(prepared.data(), static_cast<int>(prepared.size()),
                    nullptr, nullptr, options | XML_PARSE_NONET);
  if (!parsed) {
    CompositeLogger::instance().error("XmlDocument: failed to load XML: " +
                                      errors.lastMessage());
    throw MalformedXmlError("Error loading the XML.", errors.take());
  }

  document_.reset(parsed);
  xpath_.reset();
  array_.reset();

  CompositeLogger::instance().debug("XmlDocument: loaded document <" +
                                    getName() + ">");
}

std::string XmlDocument::saveXml(xmlNodePtr node) const {
  std::string xml;

  if (!node) {
    xmlChar* memory = nullptr;
    int size = 0;
    xmlDocDumpFormatMemoryEnc(document_.get(), &memory, &size,
                              encoding_.c_str(), formatOutput_ ? 1 : 0);
    if (memory) {
      xml.assign(reinterpret_cast<const char*>(memory),
                 static_cast<std::size_t>(size));
      xmlFree(memory);
    }
  } else {
    std::unique_ptr<xmlBuffer, decltype(&xmlBufferFree)> buffer(
        xmlBufferCreate(), &xmlBufferFree);
    if (!buffer) {
      throw XmlException("Failed to allocate serialization buffer");
    }
    if (xmlNodeDump(buffer.get(), document_.get(), node, 0,
                    formatOutput_ ? 1 : 0) < 0) {
      throw XmlException("Failed to serialize XML node");
    }
    xml.assign(reinterpret_cast<const char*>(xmlBufferContent(buffer.get())),
               static_cast<std::size_t>(xmlBufferLength(buffer.get())));
  }

  return XmlHelper::fixEntities(xml);
}

std::string XmlDocument::getXml() const {
  static const std::regex declarationRegex(
      R"(<\?xml\s+version="1\.0"\s+encoding="[^"]+"\s*\?>)",
      std::regex_constants::icase);

  return trim(std::regex_replace(saveXml(), declarationRegex, ""));
}

std::string XmlDocument::c14n(xmlNodePtr node, bool exclusive,
                              bool withComments) const {
  const int mode = exclusive ? XML_C14N_EXCLUSIVE_1_0 : XML_C14N_1_0;
  XmlErrorCollector errors;

  if (!node) {
    xmlChar* memory = nullptr;
    const int size = xmlC14NDocDumpMemory(document_.get(), nullptr, mode,
                                          nullptr, withComments ? 1 : 0,
                                          &memory);
    if (size < 0 || !memory) {
      if (memory) xmlFree(memory);
      throw XmlException("Failed to canonicalize the XML document.",
                         errors.take());
    }
    std::string canonical(reinterpret_cast<const char*>(memory),
                          static_cast<std::size_t>(size));
    xmlFree(memory);
    return canonical;
  }

  std::unique_ptr<xmlOutputBuffer, decltype(&xmlOutputBufferClose)> output(
      xmlAllocOutputBuffer(nullptr), &xmlOutputBufferClose);
  if (!output) {
    throw XmlException("Failed to allocate canonicalization buffer");
  }

  const int rc = xmlC14NExecute(document_.get(), &isInSubtree, node, mode,
                                nullptr, withComments ? 1 : 0, output.get());
  if (rc < 0) {
    throw XmlException("Failed to canonicalize the XML node.", errors.take());
  }

  return std::string(
      reinterpret_cast<const char*>(xmlOutputBufferGetContent(output.get())),
      xmlOutputBufferGetSize(output.get()));
}

std::string XmlDocument::c14nWithEncoding(const std::string& xpath,
                                          bool exclusive,
                                          bool withComments) const {
  xmlNodePtr node = nullptr;
  if (!xpath.empty()) {
    node = getNodes(xpath).item(0);
    if (!node) {
      throw XPathNodeNotFoundError(
          "It was not possible to obtain the node with the XPath " + xpath +
          ".");
    }
  }

  std::string xml = XmlHelper::fixEntities(c14n(node, exclusive, withComments));

  // C14N всегда выдаёт UTF-8
  return EncodingTranscoder::fromUtf8(xml, encoding_);
}

std::string XmlDocument::c14nWithEncodingFlattened(const std::string& xpath,
                                                   bool exclusive,
                                                   bool withComments) const {
  static const std::regex betweenTags(R"(>\s+<)");
  return std::regex_replace(c14nWithEncoding(xpath, exclusive, withComments),
                            betweenTags, "><");
}

std::optional<std::string> XmlDocument::getSignatureNodeXml() const {
  const std::string name = getName();
  if (name.empty()) return std::nullopt;

  xmlNodePtr signature = getNodes("/" + name + "/Signature").item(0);
  if (!signature) return std::nullopt;
  return c14n(signature);
}

XPathQuery& XmlDocument::xpath() const {
  if (!xpath_) {
    xpath_ = std::make_unique<XPathQuery>(document_.get());
  }
  return *xpath_;
}

Data XmlDocument::query(const std::string& query,
                        const XPathQuery::Params& params) const {
  return xpath().get(query, params);
}

NodeList XmlDocument::getNodes(const std::string& query,
                               const XPathQuery::Params& params) const {
  return xpath().getNodes(query, params);
}

Data XmlDocument::get(const std::string& selector,
                      const Data& defaultValue) const {
  const Data* current = &toArray();

  std::size_t start = 0;
  while (true) {
    const auto dot = selector.find('.', start);
    const std::string key = selector.substr(
        start, dot == std::string::npos ? std::string::npos : dot - start);

    if (current->is_object()) {
      auto it = current->find(key);
      if (it == current->end()) return defaultValue;
      current = &*it;
    } else if (current->is_array() && isIndex(key)) {
      std::size_t index = 0;
      const auto parsed =
          std::from_chars(key.data(), key.data() + key.size(), index);
      if (parsed.ec != std::errc() || index >= current->size()) return defaultValue;
      current = &(*current)[index];
    } else {
      return defaultValue;
    }

    if (dot == std::string::npos) break;
    start = dot + 1;
  }

  return *current;
}

const Data& XmlDocument::toArray() const {
  if (!array_) {
    Data projection = query("/");
    array_ = projection.is_object() ? std::move(projection) : Data::object();
  }
  return *array_;
}

void XmlDocument::invalidateCache() noexcept { array_.reset(); }

bool XmlDocument::schemaValidate(const std::string& schemaPath,
                                 std::vector<XmlDiagnostic>& diagnostics) const {
  XmlErrorCollector errors;

  std::unique_ptr<xmlSchemaParserCtxt, decltype(&xmlSchemaFreeParserCtxt)>
      parserCtxt(xmlSchemaNewParserCtxt(schemaPath.c_str()),
                 &xmlSchemaFreeParserCtxt);
  if (!parserCtxt) {
    throw XmlException("Failed to create schema parser for " + schemaPath,
                       errors.take());
  }

  std::unique_ptr<xmlSchema, decltype(&xmlSchemaFree)> schema(
      xmlSchemaParse(parserCtxt.get()), &xmlSchemaFree);
  if (!schema) {
    throw XmlException("Failed to parse the schema " + schemaPath,
                       errors.take());
  }

  std::unique_ptr<xmlSchemaValidCtxt, decltype(&xmlSchemaFreeValidCtxt)>
      validCtxt(xmlSchemaNewValidCtxt(schema.get()), &xmlSchemaFreeValidCtxt);
  if (!validCtxt) {
    throw XmlException("Failed to create schema validation context",
                       errors.take());
  }

  const int rc = xmlSchemaValidateDoc(validCtxt.get(), document_.get());
  diagnostics = errors.take();

  CompositeLogger::instance().debug("XmlDocument: schema validation against " +
                                    schemaPath + " returned " +
                                    std::to_string(rc));
  return rc == 0;
}

}  // namespace xmlkit
