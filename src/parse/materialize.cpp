#include "khiops_report/byte_source.hpp"
#include "khiops_report/errors.hpp"
#include "khiops_report/json_value.hpp"
#include "khiops_report/structural_parser.hpp"
#include "khiops_report/token_json.hpp"

#include <charconv>
#include <cmath>
#include <string>
#include <system_error>
#include <fast_float/fast_float.h>

namespace kr {

// Integers that fit int64 stay exact; everything else goes through fast_float.
static JsonValue number_value(const std::string& lex, std::uint64_t offset) {
  const char* first = lex.data();
  const char* last = lex.data() + lex.size();
  if (lex.find_first_of(".eE") == std::string::npos) {
    std::int64_t i = 0;
    auto [ptr, ec] = std::from_chars(first, last, i);
    if (ec == std::errc() && ptr == last) return JsonValue(i);
  }
  double d = 0.0;
  auto res = fast_float::from_chars(first, last, d);
  if (res.ptr != last) throw MalformedInputError("invalid number '" + lex + "'", offset);
  // Underflow to zero is accepted, overflow is not.
  if (std::isinf(d)) {
    throw MalformedInputError("number out of range '" + lex + "'", offset);
  }
  return JsonValue(d);
}

JsonValue materialize(JsonTokenizer& tokens, const Token& first) {
  switch (first.type) {
    case TokenType::ObjectStart: {
      JsonValue::Object obj;
      Token key;
      while (tokens.next(key) && key.type != TokenType::ObjectEnd) {
        std::string name = std::move(key.text);
        Token v;
        tokens.next(v);
        obj.emplace_back(std::move(name), materialize(tokens, v));
      }
      return JsonValue(std::move(obj));
    }
    case TokenType::ArrayStart: {
      JsonValue::Array arr;
      Token v;
      while (tokens.next(v) && v.type != TokenType::ArrayEnd) {
        arr.push_back(materialize(tokens, v));
      }
      return JsonValue(std::move(arr));
    }
    case TokenType::String: return JsonValue(first.text);
    case TokenType::Number: return number_value(first.text, first.offset);
    case TokenType::True:   return JsonValue(true);
    case TokenType::False:  return JsonValue(false);
    case TokenType::Null:   return JsonValue(nullptr);
    default:
      throw MalformedInputError(std::string("unexpected ") + token_name(first.type), first.offset);
  }
}

JsonValue parse_json(std::string_view text) {
  MemorySource src{std::string(text)};
  auto cursor = src.open_cursor();
  TokenizerConfig cfg;
  JsonTokenizer tok(*cursor, cfg);
  Token first;
  if (!tok.next(first)) throw MalformedInputError("empty document", 0);
  JsonValue v = materialize(tok, first);
  Token rest;
  tok.next(rest);  // throws on trailing characters
  return v;
}

}
