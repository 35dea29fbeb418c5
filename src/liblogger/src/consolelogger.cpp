#include "xmlkit/consolelogger.hpp"

#include <unistd.h>

#include <chrono>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <sstream>

namespace {

constexpr const char* kColorReset = "\033[0m";

}  // namespace

xmlkit::ConsoleLogger& xmlkit::ConsoleLogger::instance() {
  static xmlkit::ConsoleLogger instance;
  return instance;
}

xmlkit::ConsoleLogger::ConsoleLogger() : colored_(isatty(STDERR_FILENO) != 0) {}

void xmlkit::ConsoleLogger::init(const LogLevel level) { setLogLevel(level); }

void xmlkit::ConsoleLogger::setLogLevel(xmlkit::LogLevel level) {
  currentLevel_.store(level, std::memory_order_release);
}

void xmlkit::ConsoleLogger::flush() {
  std::lock_guard<std::mutex> lock(mutex_);
  std::cerr.flush();
}

void xmlkit::ConsoleLogger::log(LogLevel level, const std::string& message) {
  if (shouldSkipLog(level)) return;

  const std::time_t now =
      std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
  std::tm local{};
  localtime_r(&now, &local);

  std::ostringstream formatted;
  formatted << std::put_time(&local, "%Y-%m-%d %T") << " ["
            << logLevelLabel(level) << "] " << message;
  const std::string formattedMsg = formatted.str();

  std::lock_guard lock(mutex_);
  if (colored_) {
    std::cerr << colorCode(level) << formattedMsg << kColorReset << std::endl;
  } else {
    std::cerr << formattedMsg << std::endl;
  }
}

bool xmlkit::ConsoleLogger::shouldSkipLog(LogLevel level) const {
  return static_cast<int>(level) <
         static_cast<int>(currentLevel_.load(std::memory_order_acquire));
}

const char* xmlkit::ConsoleLogger::colorCode(LogLevel level) {
  switch (level) {
    case LogLevel::LOG_DEBUG:
      return "\033[36m";
    case LogLevel::LOG_INFO:
      return "\033[32m";
    case LogLevel::LOG_WARNING:
      return "\033[33m";
    case LogLevel::LOG_ERROR:
      return "\033[31m";
    case LogLevel::LOG_CRITICAL:
      return "\033[41m\033[37m";  // белый на красном
  }
  return kColorReset;
}
