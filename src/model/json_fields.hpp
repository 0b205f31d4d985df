#pragma once

#include "core/json_dom.hpp"

#include <cmath>
#include <cstdint>
#include <string>
#include <string_view>

namespace agentwatch::model::detail {

using JsonValue = core::json::Value;

inline bool ReadRequiredString(const JsonValue& root, std::string_view key, std::string& out,
                               std::string& error) {
  const JsonValue* value = core::json::FindMember(root, key);
  if (value == nullptr || value->type != JsonValue::Type::kString) {
    error = "field '" + std::string(key) + "' must be a string";
    return false;
  }
  out = value->string_value;
  return true;
}

// Absent numeric members keep `out` unchanged; present ones must be finite.
inline bool ReadOptionalNumber(const JsonValue& root, std::string_view key, double& out,
                               std::string& error) {
  const JsonValue* value = core::json::FindMember(root, key);
  if (value == nullptr || value->type == JsonValue::Type::kNull) {
    return true;
  }
  if (value->type != JsonValue::Type::kNumber || !std::isfinite(value->number_value)) {
    error = "field '" + std::string(key) + "' must be a finite number";
    return false;
  }
  out = value->number_value;
  return true;
}

inline bool ReadOptionalInteger(const JsonValue& root, std::string_view key, std::int64_t& out,
                                std::string& error) {
  double parsed = static_cast<double>(out);
  if (!ReadOptionalNumber(root, key, parsed, error)) {
    return false;
  }
  if (std::floor(parsed) != parsed) {
    error = "field '" + std::string(key) + "' must be an integer";
    return false;
  }
  out = static_cast<std::int64_t>(parsed);
  return true;
}

// Payload members default to an empty object when absent or null.
inline bool ReadOptionalObject(const JsonValue& root, std::string_view key, JsonValue& out,
                               std::string& error) {
  const JsonValue* value = core::json::FindMember(root, key);
  if (value == nullptr || value->type == JsonValue::Type::kNull) {
    out = core::json::MakeObject();
    return true;
  }
  if (value->type != JsonValue::Type::kObject) {
    error = "field '" + std::string(key) + "' must be an object";
    return false;
  }
  out = *value;
  return true;
}

} // namespace agentwatch::model::detail
