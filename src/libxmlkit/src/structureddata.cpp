#include "xmlkit/structureddata.hpp"

namespace xmlkit {

bool isSkipValue(const Data& value) {
  if (value.is_null()) return true;
  if (value.is_boolean()) return !value.get<bool>();
  if (value.is_array() || value.is_object()) return value.empty();
  return false;
}

bool isScalarValue(const Data& value) {
  return value.is_string() || value.is_number() || value.is_boolean();
}

std::string scalarToString(const Data& value) {
  if (value.is_string()) return value.get<std::string>();
  if (value.is_boolean()) return "";
  if (value.is_number()) return value.dump();
  return "";
}

}  // namespace xmlkit
