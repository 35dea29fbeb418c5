#include "xmlkit/xmlconfig.hpp"

#include <stdexcept>

namespace xmlkit {

namespace {

const nlohmann::ordered_json* section(const nlohmann::ordered_json& src,
                                      const std::string& name) {
  if (!src.contains(name)) return nullptr;
  const auto& value = src[name];
  if (!value.is_object()) {
    throw std::runtime_error("Config section '" + name + "' must be an object");
  }
  return &value;
}

std::string stringField(const nlohmann::ordered_json& src,
                        const std::string& name, const std::string& fallback) {
  if (!src.contains(name)) return fallback;
  if (!src[name].is_string()) {
    throw std::runtime_error("Config field '" + name + "' must be a string");
  }
  return src[name].get<std::string>();
}

}  // namespace

XmlConfig XmlConfig::fromJson(const nlohmann::ordered_json& src) {
  XmlConfig config;
  if (src.is_null()) return config;
  if (!src.is_object()) {
    throw std::runtime_error("Config root must be an object");
  }

  if (const auto* document = section(src, "document")) {
    config.version = stringField(*document, "version", config.version);
    config.encoding = stringField(*document, "encoding", config.encoding);
    if (document->contains("format_output")) {
      if (!(*document)["format_output"].is_boolean()) {
        throw std::runtime_error("Config field 'format_output' must be a boolean");
      }
      config.formatOutput = (*document)["format_output"].get<bool>();
    }
  }

  if (const auto* logging = section(src, "logging")) {
    if (logging->contains("level")) {
      config.logLevel = parseLogLevel(stringField(*logging, "level", "info"));
    }
  }

  if (const auto* query = section(src, "query")) {
    if (const auto* namespaces = section(*query, "namespaces")) {
      for (auto it = namespaces->begin(); it != namespaces->end(); ++it) {
        if (!it.value().is_string()) {
          throw std::runtime_error("Namespace URI for prefix '" + it.key() +
                                   "' must be a string");
        }
        config.namespaces[it.key()] = it.value().get<std::string>();
      }
    }
  }

  if (const auto* validator = section(src, "validator")) {
    if (const auto* translations = section(*validator, "translations")) {
      for (auto it = translations->begin(); it != translations->end(); ++it) {
        if (!it.value().is_string()) {
          throw std::runtime_error("Translation for '" + it.key() +
                                   "' must be a string");
        }
        config.translations.emplace_back(it.key(),
                                         it.value().get<std::string>());
      }
    }
  }

  return config;
}

std::unique_ptr<XmlDocument> XmlConfig::createDocument() const {
  auto document = std::make_unique<XmlDocument>(version, encoding);
  document->setFormatOutput(formatOutput);
  return document;
}

}  // namespace xmlkit
