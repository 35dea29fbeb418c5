#pragma once

#include "xmlkit/ilogger.hpp"

namespace xmlkit {

/**
 * @class ConsoleLogger
 * @brief Цветной вывод журнала в стандартный поток ошибок.
 *
 * @details
 * Стандартный вывод занят результатами команд (XML, JSON), поэтому
 * записи журнала направляются в std::cerr. Цвет уровня добавляется только
 * если stderr является терминалом.
 */
class ConsoleLogger : public ILogger {
 public:
  static ConsoleLogger& instance();

  void init(const LogLevel level) override;
  void setLogLevel(LogLevel level) override;
  void flush() override;

 protected:
  ConsoleLogger();
  ~ConsoleLogger() override = default;
  void log(LogLevel level, const std::string& message) override;
  bool shouldSkipLog(LogLevel level) const override;

 private:
  static const char* colorCode(LogLevel level);

  mutable std::mutex mutex_;
  const bool colored_;
};
}  // namespace xmlkit
