#include "xmlkit/ilogger.hpp"

#include <array>
#include <cctype>
#include <stdexcept>
#include <utility>

namespace xmlkit {

namespace {

// Порядок совпадает с перечислением LogLevel
constexpr std::array<std::pair<const char*, LogLevel>, 5> kLevels{{
    {"DEBUG", LogLevel::LOG_DEBUG},
    {"INFO", LogLevel::LOG_INFO},
    {"WARNING", LogLevel::LOG_WARNING},
    {"ERROR", LogLevel::LOG_ERROR},
    {"CRITICAL", LogLevel::LOG_CRITICAL},
}};

bool equalsIgnoreCase(const std::string& name, const char* label) {
  std::size_t i = 0;
  for (; i < name.size() && label[i]; ++i) {
    if (std::toupper(static_cast<unsigned char>(name[i])) != label[i]) {
      return false;
    }
  }
  return i == name.size() && !label[i];
}

}  // namespace

LogLevel ILogger::getLogLevel() const {
  return currentLevel_.load(std::memory_order_acquire);
}

void ILogger::debug(const std::string& message) {
  log(LogLevel::LOG_DEBUG, message);
}

void ILogger::info(const std::string& message) {
  log(LogLevel::LOG_INFO, message);
}

void ILogger::warning(const std::string& message) {
  log(LogLevel::LOG_WARNING, message);
}

void ILogger::error(const std::string& message) {
  log(LogLevel::LOG_ERROR, message);
}

void ILogger::critical(const std::string& message) {
  log(LogLevel::LOG_CRITICAL, message);
}

const char* logLevelLabel(LogLevel level) noexcept {
  const auto index = static_cast<std::size_t>(level);
  return index < kLevels.size() ? kLevels[index].first : "UNKNOWN";
}

LogLevel parseLogLevel(const std::string& name) {
  for (const auto& [label, level] : kLevels) {
    if (equalsIgnoreCase(name, label)) return level;
  }
  throw std::invalid_argument("Unknown log level: " + name);
}

}  // namespace xmlkit
