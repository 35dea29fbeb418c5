/**
 * @file argumentparser.cpp
 * @brief Реализация парсера аргументов командной строки
 */

#include "../include/argumentparser.hpp"

#include <algorithm>
#include <iostream>

using namespace std;

const vector<string> ArgumentParser::validLogLevels = {
    "debug", "info", "warning", "error", "critical"};

// Команда и число её позиционных аргументов
const vector<pair<string, size_t>> ArgumentParser::commands = {
    {"encode", 1}, {"decode", 1}, {"query", 2}, {"c14n", 1}, {"validate", 1}};

ParsedArgs ArgumentParser::parse(int argc, char **argv) {
  ParsedArgs args;

  for (int i = 1; i < argc; ++i) {
    string arg = argv[i];

    if (arg == "--help" || arg == "-h") {
      args.help_message = true;
    } else if (arg == "--flatten") {
      args.flatten = true;
    } else if (arg.compare(0, 13, "--config-file") == 0) {
      args.config_path = takeValue(arg, "--config-file", i, argc, argv);
    } else if (arg.compare(0, 11, "--log-level") == 0) {
      parseLogLevel(takeValue(arg, "--log-level", i, argc, argv), args);
    } else if (arg.compare(0, 11, "--namespace") == 0) {
      parseNamespace(takeValue(arg, "--namespace", i, argc, argv), args);
    } else if (arg.compare(0, 7, "--param") == 0) {
      args.params.push_back(
          parsePair(takeValue(arg, "--param", i, argc, argv), "--param"));
    } else if (arg.compare(0, 4, "--ns") == 0) {
      auto [prefix, uri] = parsePair(takeValue(arg, "--ns", i, argc, argv), "--ns");
      args.namespaces[prefix] = uri;
    } else if (arg.compare(0, 7, "--xpath") == 0) {
      args.xpath = takeValue(arg, "--xpath", i, argc, argv);
    } else if (arg.compare(0, 8, "--schema") == 0) {
      args.schema = takeValue(arg, "--schema", i, argc, argv);
    } else if (arg.size() > 1 && arg[0] == '-') {
      throw invalid_argument("ArgumentParser: Unknown argument: " + arg);
    } else if (args.command.empty()) {
      args.command = arg;
    } else {
      args.positional.push_back(arg);
    }
  }

  if (!args.help_message) {
    validateCommand(args);
  }
  return args;
}

string ArgumentParser::takeValue(const string &arg, const string &name, int &i,
                                 int argc, char **argv) {
  if (arg.size() > name.size()) {
    if (arg[name.size()] != '=') {
      throw invalid_argument("ArgumentParser: Unknown argument: " + arg);
    }
    return arg.substr(name.size() + 1);
  }
  if (i + 1 < argc) {
    return argv[++i];
  }
  throw invalid_argument("ArgumentParser: " + name + " requires a value");
}

void ArgumentParser::parseNamespace(const string &value, ParsedArgs &args) {
  size_t commaPos = value.find(',');
  string uri = value.substr(0, commaPos);
  if (uri.empty()) {
    throw invalid_argument(
        "ArgumentParser: Invalid namespace format. Use --namespace=uri[,prefix]");
  }
  args.namespace_uri = uri;
  args.namespace_prefix =
      commaPos == string::npos ? string() : value.substr(commaPos + 1);
}

pair<string, string> ArgumentParser::parsePair(const string &value,
                                               const string &option) {
  size_t eqPos = value.find('=');
  if (eqPos == string::npos || eqPos == 0) {
    throw invalid_argument("ArgumentParser: Invalid " + option +
                           " format. Use " + option + "=name=value");
  }
  return {value.substr(0, eqPos), value.substr(eqPos + 1)};
}

void ArgumentParser::parseLogLevel(const string &value, ParsedArgs &args) {
  if (find(validLogLevels.begin(), validLogLevels.end(), value) ==
      validLogLevels.end()) {
    throw invalid_argument("ArgumentParser: Invalid log level: " + value);
  }
  args.log_level = value;
}

void ArgumentParser::validateCommand(const ParsedArgs &args) {
  if (args.command.empty()) {
    throw invalid_argument("ArgumentParser: No command specified");
  }

  auto it = find_if(commands.begin(), commands.end(),
                    [&](const auto &entry) { return entry.first == args.command; });
  if (it == commands.end()) {
    throw invalid_argument("ArgumentParser: Unknown command: " + args.command);
  }
  if (args.positional.size() != it->second) {
    throw invalid_argument("ArgumentParser: Command '" + args.command +
                           "' expects " + to_string(it->second) +
                           " argument(s), got " +
                           to_string(args.positional.size()));
  }
}

void ArgumentParser::printHelp() {
  cout << "xmlkit - structured data <-> XML codec\n\n"
       << "Usage:\n"
       << " xmlkit [options] <command> <args>\n\n"
       << "Commands:\n"
       << " encode <data.json>          Encode JSON data to XML\n"
       << " decode <file.xml>           Decode XML to JSON\n"
       << " query <file.xml> <xpath>    Run an XPath query, print JSON\n"
       << " c14n <file.xml>             Canonical form in the working encoding\n"
       << " validate <file.xml>         Validate against the XSD schema\n\n"
       << "Options:\n"
       << " --help, -h                  Show this help message\n"
       << " --config-file=FILE          Configuration file path\n"
       << " --log-level=LEVEL           Logging level "
          "[debug|info|warning|error|critical]\n"
       << " --namespace=URI[,PREFIX]    Namespace of encoded elements\n"
       << " --param=NAME=VALUE          Query parameter (repeatable)\n"
       << " --ns=PREFIX=URI             Query namespace prefix (repeatable)\n"
       << " --xpath=EXPR                Node to canonicalize\n"
       << " --flatten                   Remove whitespace between tags\n"
       << " --schema=FILE               Schema for validation\n";
}
