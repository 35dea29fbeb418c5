#pragma once

#include <initializer_list>
#include <memory>
#include <vector>

#include "xmlkit/ilogger.hpp"

namespace xmlkit {

/**
 * @class CompositeLogger
 * @brief Точка входа журнала библиотеки: рассылает записи всем
 * зарегистрированным логгерам.
 *
 * @details
 * Пока ни один логгер не добавлен, записи никуда не выводятся, поэтому
 * библиотека xmlkit молчит, если приложение не настроило журнал.
 */
class CompositeLogger : public ILogger {
 public:
  static CompositeLogger& instance();

  CompositeLogger() = default;
  CompositeLogger(std::initializer_list<std::shared_ptr<ILogger>> loggers)
      : loggers_(loggers) {}

  void addLogger(const std::shared_ptr<ILogger>& logger);

  /// Удаляет все зарегистрированные логгеры.
  void clear();

  void init(const LogLevel level) override;

  void setLogLevel(LogLevel level) override;

  void flush() override;

  void debug(const std::string& message) override;
  void info(const std::string& message) override;
  void warning(const std::string& message) override;
  void error(const std::string& message) override;
  void critical(const std::string& message) override;

 protected:
  bool shouldSkipLog(LogLevel level) const override;
  void log(LogLevel level, const std::string&) override;

 private:
  std::vector<std::shared_ptr<ILogger>> loggers_;
};

}  // namespace xmlkit
