/**
 * @file command_controller.cpp
 * @brief Реализация команд утилиты xmlkit
 */

#include "../include/command_controller.hpp"

#include <cstdlib>
#include <fstream>
#include <iostream>
#include <memory>
#include <optional>
#include <sstream>
#include <type_traits>

#include "xmlkit/compositelogger.hpp"
#include "xmlkit/configloader.hpp"
#include "xmlkit/consolelogger.hpp"
#include "xmlkit/xpathquery.hpp"

CommandController::CommandController(std::ostream &out) : out_(out) {}

int CommandController::run(int argc, char **argv) {
  ParsedArgs args;
  try {
    ArgumentParser parser;
    args = parser.parse(argc, argv);
  } catch (const std::invalid_argument &e) {
    std::cerr << e.what() << "\n";
    std::cerr << "Run 'xmlkit --help' for usage.\n";
    return EXIT_FAILURE;
  }

  if (args.help_message) {
    ArgumentParser::printHelp();
    return EXIT_SUCCESS;
  }

  try {
    initLogger(args, config_);
    config_ = loadConfig(args);
    initLogger(args, config_);

    xmlkit::CompositeLogger::instance().debug("Command controller: running '" +
                                              args.command + "'");
    if (args.command == "encode") {
      encode(args);
    } else if (args.command == "decode") {
      decode(args);
    } else if (args.command == "query") {
      query(args);
    } else if (args.command == "c14n") {
      canonicalize(args);
    } else if (args.command == "validate") {
      validate(args);
    }
  } catch (const std::exception &e) {
    xmlkit::CompositeLogger::instance().error("Command '" + args.command +
                                              "' failed: " + e.what());
    xmlkit::CompositeLogger::instance().flush();
    return EXIT_FAILURE;
  }

  xmlkit::CompositeLogger::instance().flush();
  return EXIT_SUCCESS;
}

xmlkit::XmlConfig CommandController::loadConfig(const ParsedArgs &args) {
  if (!args.config_path) {
    return xmlkit::XmlConfig{};
  }
  xmlkit::ConfigLoader loader;
  return xmlkit::XmlConfig::fromJson(loader.loadFromFile(*args.config_path));
}

void CommandController::initLogger(const ParsedArgs &args,
                                   const xmlkit::XmlConfig &config) {
  auto &composite_logger = xmlkit::CompositeLogger::instance();

  // Лямбда для безопасного создания shared_ptr из синглтона
  auto getSingletonPtr = [](auto &singleton) {
    return std::shared_ptr<std::remove_reference_t<decltype(singleton)>>(
        &singleton, [](auto *) {});
  };

  const xmlkit::LogLevel level = args.log_level
                                     ? xmlkit::parseLogLevel(*args.log_level)
                                     : config.logLevel;

  auto &console = xmlkit::ConsoleLogger::instance();
  console.setLogLevel(level);
  composite_logger.clear();
  composite_logger.addLogger(getSingletonPtr(console));
  composite_logger.setLogLevel(level);
}

std::string CommandController::readFile(const std::string &path) {
  std::ifstream file(path, std::ios::binary);
  if (!file.is_open()) {
    throw std::runtime_error("Failed to open file " + path);
  }
  std::ostringstream ss;
  ss << file.rdbuf();
  return ss.str();
}

std::unique_ptr<xmlkit::XmlDocument> CommandController::loadDocument(
    const std::string &path) {
  auto document = config_.createDocument();
  document->loadXml(readFile(path));
  return document;
}

void CommandController::encode(const ParsedArgs &args) {
  xmlkit::Data data;
  try {
    data = xmlkit::Data::parse(readFile(args.positional[0]));
  } catch (const nlohmann::json::parse_error &e) {
    throw std::runtime_error("Invalid JSON in " + args.positional[0] + ": " +
                             e.what());
  }

  std::optional<xmlkit::XmlNamespace> ns;
  if (args.namespace_uri) {
    ns = xmlkit::XmlNamespace{*args.namespace_uri, args.namespace_prefix};
  }

  auto document = config_.createDocument();
  service_.encode(data, *document, ns);
  out_ << document->saveXml();
}

void CommandController::decode(const ParsedArgs &args) {
  auto document = loadDocument(args.positional[0]);
  out_ << service_.decode(*document).dump(2) << "\n";
}

void CommandController::query(const ParsedArgs &args) {
  auto document = loadDocument(args.positional[0]);

  xmlkit::XPathQuery::Namespaces namespaces = config_.namespaces;
  for (const auto &[prefix, uri] : args.namespaces) {
    namespaces[prefix] = uri;
  }

  xmlkit::XPathQuery xpath(document->get(), namespaces);
  out_ << xpath.get(args.positional[1], args.params).dump(2) << "\n";
}

void CommandController::canonicalize(const ParsedArgs &args) {
  auto document = loadDocument(args.positional[0]);
  const std::string expression = args.xpath.value_or("");
  out_ << (args.flatten ? document->c14nWithEncodingFlattened(expression)
                        : document->c14nWithEncoding(expression));
}

void CommandController::validate(const ParsedArgs &args) {
  auto document = loadDocument(args.positional[0]);
  service_.validate(*document, args.schema, config_.translations);
  out_ << args.positional[0] << ": valid\n";
}
