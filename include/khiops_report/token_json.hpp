#pragma once
#include <cstddef>
#include <cstdint>
#include <string>

namespace kr {

class ByteCursor;

enum class TokenType {
  ObjectStart, ObjectEnd, ArrayStart, ArrayEnd,
  Key, String, Number, True, False, Null
};

const char* token_name(TokenType t) noexcept;

struct Token {
  TokenType     type = TokenType::Null;
  std::uint64_t offset = 0;   // first byte of the token
  std::uint64_t end = 0;      // one past the last byte
  std::string   text;         // unescaped for Key/String, raw lexeme for Number
};

// Byte range [offset, offset + length) of a value that was skipped, not parsed.
struct Span {
  std::uint64_t offset = 0;
  std::uint64_t length = 0;
  std::uint64_t end() const noexcept { return offset + length; }
};

struct TokenizerConfig {
  std::size_t   chunk_bytes = 512 * 1024;
  std::size_t   max_depth   = 512;
  std::uint64_t limit       = UINT64_MAX;  // bytes to read from the start position
};

// Forward-only, offset-stamped JSON tokenizer over a cursor, driven by
// RapidJSON's iterative reader. Validates grammar and UTF-8 as it goes; every
// failure is a MalformedInputError with the absolute offset of the offending
// byte (or of the end of input).
class JsonTokenizer {
public:
  // Starts at the cursor's current position.
  JsonTokenizer(ByteCursor& cursor, const TokenizerConfig& cfg);
  ~JsonTokenizer();

  JsonTokenizer(const JsonTokenizer&) = delete;
  JsonTokenizer& operator=(const JsonTokenizer&) = delete;

  // False once the root value is complete and only whitespace remains.
  bool next(Token& out);

  // Only valid where a value is expected (after a Key, or inside an array).
  // Consumes it, validated but not materialized, and returns its byte range.
  Span skip_value();

  // Type of the value about to be produced, without consuming it.
  // Only valid where skip_value() is.
  TokenType peek_value();

  // Nesting depth of the containers currently open.
  std::size_t depth() const noexcept;

  std::uint64_t position() const noexcept;
  std::uint64_t bytes_read() const noexcept;
  std::uint64_t tokens() const noexcept;

private:
  struct Impl; Impl* p_;
};

}
