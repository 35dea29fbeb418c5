#pragma once

#include <libxml/tree.h>

#include <memory>
#include <optional>
#include <string>

#include "xmlkit/xmldecoder.hpp"
#include "xmlkit/xmlencoder.hpp"
#include "xmlkit/xmlvalidator.hpp"

namespace xmlkit {

/**
 * @class XmlService
 * @brief Единая точка доступа к кодированию, декодированию и проверке XML.
 *
 * @details
 * Делегирует работу реализациям интерфейсов IXmlEncoder, IXmlDecoder и
 * IXmlValidator, которые можно подменить (например, в тестах).
 */
class XmlService {
 public:
  /// Сервис со стандартными реализациями.
  XmlService();
  XmlService(std::shared_ptr<IXmlEncoder> encoder,
             std::shared_ptr<IXmlDecoder> decoder,
             std::shared_ptr<IXmlValidator> validator);

  std::unique_ptr<XmlDocument> encode(
      const Data& data, const std::optional<XmlNamespace>& ns = std::nullopt);

  XmlDocument& encode(const Data& data, XmlDocument& doc,
                      const std::optional<XmlNamespace>& ns = std::nullopt,
                      xmlNodePtr parent = nullptr);

  Data decode(const XmlDocument& document);
  Data decode(xmlNodePtr element);

  void validate(const XmlDocument& document,
                const std::optional<std::string>& schemaPath = std::nullopt,
                const Translations& translations = {});

 private:
  std::shared_ptr<IXmlEncoder> encoder_;
  std::shared_ptr<IXmlDecoder> decoder_;
  std::shared_ptr<IXmlValidator> validator_;
};

}  // namespace xmlkit
