/**
 * @file command_controller.hpp
 * @brief Выполнение команд утилиты xmlkit
 *
 * @details
 * CommandController объединяет разбор аргументов, загрузку конфигурации,
 * инициализацию журнала и вызов операций библиотеки xmlkit. Результат
 * команды выводится в std::cout, журнал и ошибки в std::cerr.
 */
#pragma once

#include <iosfwd>
#include <memory>
#include <string>

#include "../include/argumentparser.hpp"
#include "xmlkit/xmlconfig.hpp"
#include "xmlkit/xmldocument.hpp"
#include "xmlkit/xmlservice.hpp"

class CommandController {
 public:
  explicit CommandController(std::ostream &out);

  /**
   * @brief Основная точка входа утилиты
   * @return EXIT_SUCCESS или EXIT_FAILURE
   */
  int run(int argc, char **argv);

 private:
  void initLogger(const ParsedArgs &args, const xmlkit::XmlConfig &config);
  xmlkit::XmlConfig loadConfig(const ParsedArgs &args);

  std::unique_ptr<xmlkit::XmlDocument> loadDocument(const std::string &path);

  void encode(const ParsedArgs &args);
  void decode(const ParsedArgs &args);
  void query(const ParsedArgs &args);
  void canonicalize(const ParsedArgs &args);
  void validate(const ParsedArgs &args);

  static std::string readFile(const std::string &path);

  std::ostream &out_;
  xmlkit::XmlConfig config_;
  xmlkit::XmlService service_;
};
