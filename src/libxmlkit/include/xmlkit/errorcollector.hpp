/**
 * @file errorcollector.hpp
 * @brief Сбор сообщений libxml2 на время одной операции.
 *
 * @details
 * libxml2 по умолчанию печатает ошибки в stderr. XmlErrorCollector на время
 * своего существования подменяет структурированный обработчик ошибок и
 * складывает сообщения в вектор XmlDiagnostic; деструктор восстанавливает
 * прежний обработчик.
 *
 * @code
 *   XmlErrorCollector errors;
 *   xmlDocPtr doc = xmlReadMemory(...);
 *   if (!doc) throw MalformedXmlError("...", errors.take());
 * @endcode
 */

#pragma once

#include <libxml/xmlerror.h>

#include <string>
#include <vector>

#include "xmlkit/xmlexception.hpp"

namespace xmlkit {

class XmlErrorCollector {
 public:
  XmlErrorCollector();
  ~XmlErrorCollector();

  XmlErrorCollector(const XmlErrorCollector&) = delete;
  XmlErrorCollector& operator=(const XmlErrorCollector&) = delete;

  bool empty() const noexcept { return diagnostics_.empty(); }
  const std::vector<XmlDiagnostic>& diagnostics() const noexcept {
    return diagnostics_;
  }

  /// Последнее сообщение в виде "<текст>." или пустая строка.
  std::string lastMessage() const;

  /// Забирает накопленные сообщения, оставляя коллектор пустым.
  std::vector<XmlDiagnostic> take();

 private:
  static void onStructuredError(void* userData, xmlErrorPtr error);

  std::vector<XmlDiagnostic> diagnostics_;
  xmlStructuredErrorFunc previousHandler_;
  void* previousContext_;
};

}  // namespace xmlkit
