#include "xmlkit/xmlexception.hpp"

#include <sstream>
#include <utility>

namespace xmlkit {

std::string levelToString(XmlDiagnostic::Level level) {
  switch (level) {
    case XmlDiagnostic::Level::Warning:
      return "Warning";
    case XmlDiagnostic::Level::Error:
      return "Error";
    case XmlDiagnostic::Level::Fatal:
      return "Fatal";
  }
  return "Error";
}

std::string XmlDiagnostic::toString() const {
  std::ostringstream oss;
  oss << "Error " << levelToString(level) << ": " << message << " in line "
      << line << ", column " << column << " (Code: " << code << ").";
  return oss.str();
}

namespace {

std::vector<std::string> describe(const std::vector<XmlDiagnostic>& diagnostics) {
  std::vector<std::string> errors;
  errors.reserve(diagnostics.size());
  for (const auto& diagnostic : diagnostics) {
    errors.push_back(diagnostic.toString());
  }
  return errors;
}

}  // namespace

XmlException::XmlException(const std::string& message,
                           std::vector<XmlDiagnostic> diagnostics)
    : XmlException(message, describe(diagnostics), diagnostics) {}

XmlException::XmlException(const std::string& message,
                           std::vector<std::string> errors,
                           std::vector<XmlDiagnostic> diagnostics)
    : std::runtime_error(compose(message, errors)),
      errors_(std::move(errors)),
      diagnostics_(std::move(diagnostics)) {}

std::string XmlException::compose(const std::string& message,
                                  const std::vector<std::string>& errors) {
  std::string result = message;
  for (const auto& error : errors) {
    if (!result.empty()) result += ' ';
    result += error;
  }
  return result;
}

}  // namespace xmlkit
