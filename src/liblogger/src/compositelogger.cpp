#include "xmlkit/compositelogger.hpp"

namespace xmlkit {

CompositeLogger& CompositeLogger::instance() {
  static CompositeLogger instance;
  return instance;
}

void CompositeLogger::addLogger(const std::shared_ptr<ILogger>& logger) {
  loggers_.push_back(logger);
}

void CompositeLogger::clear() { loggers_.clear(); }

void CompositeLogger::init(const LogLevel level) {
  for (auto& logger : loggers_) {
    if (logger) logger->init(level);
  }
}

void CompositeLogger::setLogLevel(LogLevel level) {
  currentLevel_.store(level, std::memory_order_release);
  for (auto& logger : loggers_) {
    if (logger) logger->setLogLevel(level);
  }
}

void CompositeLogger::flush() {
  for (auto& logger : loggers_) {
    if (logger) logger->flush();
  }
}

void CompositeLogger::debug(const std::string& message) {
  for (auto& logger : loggers_) {
    if (logger) logger->debug(message);
  }
}

void CompositeLogger::info(const std::string& message) {
  for (auto& logger : loggers_) {
    if (logger) logger->info(message);
  }
}

void CompositeLogger::warning(const std::string& message) {
  for (auto& logger : loggers_) {
    if (logger) logger->warning(message);
  }
}

void CompositeLogger::error(const std::string& message) {
  for (auto& logger : loggers_) {
    if (logger) logger->error(message);
  }
}

void CompositeLogger::critical(const std::string& message) {
  for (auto& logger : loggers_) {
    if (logger) logger->critical(message);
  }
}

void CompositeLogger::log(LogLevel, const std::string&) {}

bool CompositeLogger::shouldSkipLog(LogLevel) const {
  // Фильтрацию по уровню выполняют вложенные логгеры
  return false;
}

}  // namespace xmlkit
