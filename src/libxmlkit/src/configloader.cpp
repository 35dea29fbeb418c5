#include "xmlkit/configloader.hpp"

#include <fstream>
#include <sstream>

namespace xmlkit {

nlohmann::ordered_json ConfigLoader::loadFromFile(const std::string &filename) {
  if (filename.empty()) {
    throw std::invalid_argument("ConfigLoader: empty configuration file name");
  }
  nlohmann::ordered_json config = readFileContents(filename);
  lastLoadedFile = filename;
  return config;
}

std::string ConfigLoader::getLastLoadedFile() const { return lastLoadedFile; }

bool ConfigLoader::hasLoadedFile() const { return !lastLoadedFile.empty(); }

nlohmann::ordered_json ConfigLoader::readFileContents(
    const std::string &filename) const {
  std::ifstream file(filename);

  if (!file.is_open()) {
    throw std::runtime_error("ConfigLoader: Failed to open file " + filename);
  }

  try {
    nlohmann::ordered_json config;
    file >> config;
    return config;
  } catch (const nlohmann::json::parse_error &e) {
    std::stringstream ss;
    ss << "ConfigLoader: JSON parse error: " << e.what() << " at byte "
       << e.byte;
    throw std::runtime_error(ss.str());
  }
}

}  // namespace xmlkit
