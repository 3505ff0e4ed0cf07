#include "khiops_report/json_value.hpp"

#include <cmath>
#include <cstdio>
#include <sstream>
#include <string>

namespace kr {

static void esc(std::ostringstream& o, const std::string& s) {
  o << '"';
  for (char c : s) {
    switch (c) {
      case '\\': o << "\\\\"; break;
      case '"':  o << "\\\""; break;
      case '\n': o << "\\n";  break;
      case '\r': o << "\\r";  break;
      case '\t': o << "\\t";  break;
      case '\b': o << "\\b";  break;
      case '\f': o << "\\f";  break;
      default:
        if (static_cast<unsigned char>(c) < 0x20) {
          char tmp[8];
          std::snprintf(tmp, sizeof(tmp), "\\u%04x", static_cast<unsigned>(c));
          o << tmp;
        } else {
          o << c;
        }
        break;
    }
  }
  o << '"';
}

// Doubles keep a fraction or exponent so they read back as doubles.
static void num(std::ostringstream& o, double v) {
  if (!std::isfinite(v)) { o << "null"; return; }
  char tmp[64];
  int n = std::snprintf(tmp, sizeof(tmp), "%.17g", v);
  std::string s(tmp, (n > 0) ? static_cast<std::size_t>(n) : 0);
  if (s.find_first_of(".eE") == std::string::npos) s += ".0";
  o << s;
}

static void newline(std::ostringstream& o, bool pretty, int depth) {
  if (!pretty) return;
  o << '\n';
  for (int i = 0; i < depth; ++i) o << "  ";
}

static void write(std::ostringstream& o, const JsonValue& v, bool pretty, int depth) {
  switch (v.kind()) {
    case JsonValue::Kind::Null:   o << "null"; break;
    case JsonValue::Kind::Bool:   o << (v.as_bool() ? "true" : "false"); break;
    case JsonValue::Kind::Int:    o << v.as_int(); break;
    case JsonValue::Kind::Double: num(o, v.as_double()); break;
    case JsonValue::Kind::String: esc(o, v.as_string()); break;
    case JsonValue::Kind::Array: {
      const auto& a = v.as_array();
      o << '[';
      for (std::size_t i = 0; i < a.size(); ++i) {
        if (i) o << ',';
        newline(o, pretty, depth + 1);
        write(o, a[i], pretty, depth + 1);
      }
      if (!a.empty()) newline(o, pretty, depth);
      o << ']';
      break;
    }
    case JsonValue::Kind::Object: {
      const auto& obj = v.as_object();
      o << '{';
      for (std::size_t i = 0; i < obj.size(); ++i) {
        if (i) o << ',';
        newline(o, pretty, depth + 1);
        esc(o, obj[i].first);
        o << (pretty ? ": " : ":");
        write(o, obj[i].second, pretty, depth + 1);
      }
      if (!obj.empty()) newline(o, pretty, depth);
      o << '}';
      break;
    }
  }
}

std::string to_json(const JsonValue& v, bool pretty) {
  std::ostringstream o;
  write(o, v, pretty, 0);
  return o.str();
}

}
