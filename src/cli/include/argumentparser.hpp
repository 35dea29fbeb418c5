/**
 * @file argumentparser.hpp
 * @brief Разбор аргументов командной строки утилиты xmlkit
 *
 * @details
 * Формат вызова:
 * @code
 xmlkit [--config-file FILE] [--log-level LEVEL] <command> <args...> [options]
 @endcode
 * Значения опций задаются как "--option=value" или "--option value".
 * Некорректные аргументы приводят к std::invalid_argument.
 */
#pragma once
#include <map>
#include <optional>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

struct ParsedArgs {
  std::string command;
  std::vector<std::string> positional;
  std::optional<std::string> config_path;
  std::optional<std::string> log_level;
  std::optional<std::string> namespace_uri;
  std::string namespace_prefix;
  std::vector<std::pair<std::string, std::string>> params;
  std::map<std::string, std::string> namespaces;
  std::optional<std::string> xpath;
  std::optional<std::string> schema;
  bool flatten = false;
  bool help_message = false;
};

class ArgumentParser {
 public:
  /**
   * @brief Разбирает argv
   * @throw std::invalid_argument при неизвестной команде или опции,
   *        недостающем значении или неверном числе аргументов команды
   */
  ParsedArgs parse(int argc, char **argv);

  static void printHelp();

 private:
  static const std::vector<std::string> validLogLevels;
  static const std::vector<std::pair<std::string, std::size_t>> commands;

  std::string takeValue(const std::string &arg, const std::string &name,
                        int &i, int argc, char **argv);
  void parseNamespace(const std::string &value, ParsedArgs &args);
  std::pair<std::string, std::string> parsePair(const std::string &value,
                                                const std::string &option);
  void parseLogLevel(const std::string &value, ParsedArgs &args);
  void validateCommand(const ParsedArgs &args);
};
