/**
 * @file ilogger.hpp
 * @brief Базовый интерфейс логгеров xmlkit и вспомогательные компоненты.
 *
 * @details
 * Определяет уровни логирования и абстрактный класс ILogger, от которого
 * наследуются ConsoleLogger и CompositeLogger.
 */

#pragma once

#include <atomic>
#include <mutex>
#include <string>

namespace xmlkit {

enum class LogLevel {
  LOG_DEBUG,
  LOG_INFO,
  LOG_WARNING,
  LOG_ERROR,
  LOG_CRITICAL
};

class ILogger {
 public:
  virtual void init(const LogLevel level) = 0;

  virtual void setLogLevel(LogLevel level) = 0;
  virtual LogLevel getLogLevel() const;

  virtual void debug(const std::string& message);
  virtual void info(const std::string& message);
  virtual void warning(const std::string& message);
  virtual void error(const std::string& message);
  virtual void critical(const std::string& message);

  virtual void flush() = 0;

 protected:
  std::atomic<LogLevel> currentLevel_ = LogLevel::LOG_INFO;
  virtual ~ILogger() = default;
  virtual void log(LogLevel, const std::string&) = 0;
  virtual bool shouldSkipLog(LogLevel level) const = 0;
};

/// Метка уровня в записи журнала: "DEBUG", "INFO", ...
const char* logLevelLabel(LogLevel level) noexcept;

/**
 * @brief Разбирает имя уровня из конфигурации или командной строки.
 *
 * Регистр не учитывается: "debug", "Warning" и "CRITICAL" допустимы.
 * @throw std::invalid_argument для неизвестного имени
 */
LogLevel parseLogLevel(const std::string& name);

}  // namespace xmlkit
