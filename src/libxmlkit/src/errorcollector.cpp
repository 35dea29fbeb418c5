#include "xmlkit/errorcollector.hpp"

#include <libxml/globals.h>

#include <utility>

namespace xmlkit {

namespace {

std::string trimMessage(const char* text) {
  if (!text) return "";
  std::string message(text);
  const auto end = message.find_last_not_of(" \t\r\n");
  if (end == std::string::npos) return "";
  const auto begin = message.find_first_not_of(" \t\r\n");
  return message.substr(begin, end - begin + 1);
}

}  // namespace

XmlErrorCollector::XmlErrorCollector()
    : previousHandler_(xmlStructuredError),
      previousContext_(xmlStructuredErrorContext) {
  xmlSetStructuredErrorFunc(this, &XmlErrorCollector::onStructuredError);
}

XmlErrorCollector::~XmlErrorCollector() {
  xmlSetStructuredErrorFunc(previousContext_, previousHandler_);
}

std::string XmlErrorCollector::lastMessage() const {
  if (diagnostics_.empty()) return "";
  return diagnostics_.back().message + ".";
}

std::vector<XmlDiagnostic> XmlErrorCollector::take() {
  return std::exchange(diagnostics_, {});
}

void XmlErrorCollector::onStructuredError(void* userData, xmlErrorPtr error) {
  auto* self = static_cast<XmlErrorCollector*>(userData);
  if (!self || !error) return;

  XmlDiagnostic diagnostic;
  switch (error->level) {
    case XML_ERR_WARNING:
      diagnostic.level = XmlDiagnostic::Level::Warning;
      break;
    case XML_ERR_FATAL:
      diagnostic.level = XmlDiagnostic::Level::Fatal;
      break;
    case XML_ERR_ERROR:
    default:
      diagnostic.level = XmlDiagnostic::Level::Error;
      break;
  }
  diagnostic.code = error->code;
  diagnostic.line = error->line;
  diagnostic.column = error->int2;
  diagnostic.message = trimMessage(error->message);
  self->diagnostics_.push_back(std::move(diagnostic));
}

}  // namespace xmlkit
