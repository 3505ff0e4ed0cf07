#pragma once
#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>
#include <utility>
#include <variant>
#include <vector>

namespace kr {

// Materialized JSON value. Objects keep members in source order.
class JsonValue {
public:
  using Array  = std::vector<JsonValue>;
  using Member = std::pair<std::string, JsonValue>;
  using Object = std::vector<Member>;

  enum class Kind { Null, Bool, Int, Double, String, Array, Object };

  JsonValue() = default;
  JsonValue(std::nullptr_t) {}
  JsonValue(bool b) : v_(b) {}
  JsonValue(int i) : v_(static_cast<std::int64_t>(i)) {}
  JsonValue(std::int64_t i) : v_(i) {}
  JsonValue(double d) : v_(d) {}
  JsonValue(const char* s) : v_(std::string(s)) {}
  JsonValue(std::string s) : v_(std::move(s)) {}
  JsonValue(Array a) : v_(std::move(a)) {}
  JsonValue(Object o) : v_(std::move(o)) {}

  Kind kind() const noexcept { return static_cast<Kind>(v_.index()); }

  bool is_null() const noexcept   { return kind() == Kind::Null; }
  bool is_bool() const noexcept   { return kind() == Kind::Bool; }
  bool is_int() const noexcept    { return kind() == Kind::Int; }
  bool is_number() const noexcept { return kind() == Kind::Int || kind() == Kind::Double; }
  bool is_string() const noexcept { return kind() == Kind::String; }
  bool is_array() const noexcept  { return kind() == Kind::Array; }
  bool is_object() const noexcept { return kind() == Kind::Object; }
  bool is_scalar() const noexcept { return !is_array() && !is_object(); }

  // Accessors throw std::bad_variant_access on kind mismatch.
  bool as_bool() const { return std::get<bool>(v_); }
  std::int64_t as_int() const { return std::get<std::int64_t>(v_); }
  double as_double() const;   // Int widens to double
  const std::string& as_string() const { return std::get<std::string>(v_); }
  const Array& as_array() const { return std::get<Array>(v_); }
  const Object& as_object() const { return std::get<Object>(v_); }
  Array& as_array() { return std::get<Array>(v_); }
  Object& as_object() { return std::get<Object>(v_); }

  // Object member lookup (first match); nullptr when absent or not an object.
  const JsonValue* find(std::string_view key) const;

  // Array length or object member count; 0 for scalars.
  std::size_t size() const noexcept;

  friend bool operator==(const JsonValue& a, const JsonValue& b) { return a.v_ == b.v_; }
  friend bool operator!=(const JsonValue& a, const JsonValue& b) { return !(a == b); }

private:
  std::variant<std::nullptr_t, bool, std::int64_t, double, std::string, Array, Object> v_{nullptr};
};

const char* kind_name(JsonValue::Kind k) noexcept;

// Lookup in an ordered member list.
const JsonValue* find_member(const JsonValue::Object& obj, std::string_view key);

// Serialize; `pretty` indents with two spaces.
std::string to_json(const JsonValue& v, bool pretty = false);

// Materialize a whole in-memory document with the streaming tokenizer.
// Throws MalformedInputError.
JsonValue parse_json(std::string_view text);

}
