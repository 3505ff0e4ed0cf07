#include "khiops_report/json_value.hpp"

namespace kr {

double JsonValue::as_double() const {
  if (kind() == Kind::Int) return static_cast<double>(std::get<std::int64_t>(v_));
  return std::get<double>(v_);
}

const JsonValue* JsonValue::find(std::string_view key) const {
  if (!is_object()) return nullptr;
  return find_member(as_object(), key);
}

std::size_t JsonValue::size() const noexcept {
  if (is_array()) return std::get<Array>(v_).size();
  if (is_object()) return std::get<Object>(v_).size();
  return 0;
}

const char* kind_name(JsonValue::Kind k) noexcept {
  switch (k) {
    case JsonValue::Kind::Null:   return "null";
    case JsonValue::Kind::Bool:   return "bool";
    case JsonValue::Kind::Int:    return "integer";
    case JsonValue::Kind::Double: return "number";
    case JsonValue::Kind::String: return "string";
    case JsonValue::Kind::Array:  return "array";
    case JsonValue::Kind::Object: return "object";
  }
  return "?";
}

const JsonValue* find_member(const JsonValue::Object& obj, std::string_view key) {
  for (const auto& m : obj) if (m.first == key) return &m.second;
  return nullptr;
}

}
