#include "xmlkit/xmlservice.hpp"

#include <stdexcept>
#include <utility>

namespace xmlkit {

XmlService::XmlService()
    : XmlService(std::make_shared<XmlEncoder>(), std::make_shared<XmlDecoder>(),
                 std::make_shared<XmlValidator>()) {}

XmlService::XmlService(std::shared_ptr<IXmlEncoder> encoder,
                       std::shared_ptr<IXmlDecoder> decoder,
                       std::shared_ptr<IXmlValidator> validator)
    : encoder_(std::move(encoder)),
      decoder_(std::move(decoder)),
      validator_(std::move(validator)) {
  if (!encoder_ || !decoder_ || !validator_) {
    throw std::invalid_argument("XmlService requires encoder, decoder and validator");
  }
}

std::unique_ptr<XmlDocument> XmlService::encode(
    const Data& data, const std::optional<XmlNamespace>& ns) {
  return encoder_->encode(data, ns);
}

XmlDocument& XmlService::encode(const Data& data, XmlDocument& doc,
                                const std::optional<XmlNamespace>& ns,
                                xmlNodePtr parent) {
  return encoder_->encodeInto(data, doc, ns, parent);
}

Data XmlService::decode(const XmlDocument& document) {
  return decoder_->decode(document);
}

Data XmlService::decode(xmlNodePtr element) {
  return decoder_->decode(element);
}

void XmlService::validate(const XmlDocument& document,
                          const std::optional<std::string>& schemaPath,
                          const Translations& translations) {
  validator_->validate(document, schemaPath, translations);
}

}  // namespace xmlkit
