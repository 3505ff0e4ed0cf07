#include "khiops_report/token_json.hpp"
#include "khiops_report/byte_source.hpp"
#include "khiops_report/chunk_reader.hpp"
#include "khiops_report/errors.hpp"

#include <rapidjson/error/en.h>
#include <rapidjson/reader.h>

#include <stdexcept>
#include <string>
#include <utility>

namespace kr {

const char* token_name(TokenType t) noexcept {
  switch (t) {
    case TokenType::ObjectStart: return "'{'";
    case TokenType::ObjectEnd:   return "'}'";
    case TokenType::ArrayStart:  return "'['";
    case TokenType::ArrayEnd:    return "']'";
    case TokenType::Key:         return "key";
    case TokenType::String:      return "string";
    case TokenType::Number:      return "number";
    case TokenType::True:        return "true";
    case TokenType::False:       return "false";
    case TokenType::Null:        return "null";
  }
  return "?";
}

namespace {

// Numbers stay raw lexemes; conversion happens in materialize().
constexpr unsigned kParseFlags =
  rapidjson::kParseValidateEncodingFlag | rapidjson::kParseNumbersAsStringsFlag;

bool is_brace(TokenType t) noexcept {
  return t == TokenType::ObjectStart || t == TokenType::ObjectEnd ||
         t == TokenType::ArrayStart || t == TokenType::ArrayEnd;
}

// RapidJSON input stream over a ChunkReader. Tell() is the absolute source
// offset; '\0' marks the end of input. While armed, the first significant
// byte taken is recorded as the start of the next token.
class ChunkStream {
public:
  typedef char Ch;

  ChunkStream(ByteCursor& cursor, const TokenizerConfig& cfg)
    : reader_(cursor, ChunkReader::Config{cfg.chunk_bytes, cfg.limit}) {
    chunk_.offset = cursor.tell();
    refill();
  }

  Ch Peek() const { return pos_ < chunk_.data.size() ? chunk_.data[pos_] : '\0'; }

  Ch Take() {
    if (pos_ >= chunk_.data.size()) return '\0';
    const Ch c = chunk_.data[pos_];
    if (armed_ && c != ' ' && c != '\t' && c != '\n' && c != '\r' && c != ',' && c != ':') {
      start_ = Tell();
      armed_ = false;
    }
    if (++pos_ == chunk_.data.size()) refill();
    return c;
  }

  std::size_t Tell() const { return static_cast<std::size_t>(chunk_.offset + pos_); }

  // Read-only stream.
  Ch* PutBegin() { RAPIDJSON_ASSERT(false); return nullptr; }
  void Put(Ch) { RAPIDJSON_ASSERT(false); }
  void Flush() { RAPIDJSON_ASSERT(false); }
  std::size_t PutEnd(Ch*) { RAPIDJSON_ASSERT(false); return 0; }

  void arm() noexcept { armed_ = true; start_ = Tell(); }
  std::uint64_t start() const noexcept { return start_; }

  // True when every byte was consumed; a '\0' byte in the input is not the end.
  bool exhausted() const noexcept { return pos_ >= chunk_.data.size(); }

  std::uint64_t bytes_read() const noexcept { return reader_.bytes_read(); }

private:
  void refill() {
    Chunk next;
    while (reader_.read_next(next)) {
      if (next.data.empty()) continue;
      chunk_ = next;
      pos_ = 0;
      return;
    }
  }

  ChunkReader reader_;
  Chunk chunk_;
  std::size_t pos_{0};
  bool armed_{false};
  std::uint64_t start_{0};
};

// Copies the single event of one IterativeParseNext() call into a Token.
struct TokenSink : rapidjson::BaseReaderHandler<rapidjson::UTF8<>, TokenSink> {
  const ChunkStream* in = nullptr;
  Token* out = nullptr;

  bool emit(TokenType t) {
    out->type = t;
    out->end = in->Tell();
    return true;
  }
  bool text(TokenType t, const char* s, rapidjson::SizeType n) {
    out->text.assign(s, n);
    return emit(t);
  }

  bool Null() { return emit(TokenType::Null); }
  bool Bool(bool b) { return emit(b ? TokenType::True : TokenType::False); }
  bool RawNumber(const char* s, rapidjson::SizeType n, bool) { return text(TokenType::Number, s, n); }
  bool String(const char* s, rapidjson::SizeType n, bool) { return text(TokenType::String, s, n); }
  bool Key(const char* s, rapidjson::SizeType n, bool) { return text(TokenType::Key, s, n); }
  bool StartObject() { return emit(TokenType::ObjectStart); }
  bool EndObject(rapidjson::SizeType) { return emit(TokenType::ObjectEnd); }
  bool StartArray() { return emit(TokenType::ArrayStart); }
  bool EndArray(rapidjson::SizeType) { return emit(TokenType::ArrayEnd); }
};

}

struct JsonTokenizer::Impl {
  TokenizerConfig cfg;
  ChunkStream in;
  rapidjson::Reader reader;
  TokenSink sink;
  Token pending;
  bool has_pending{false};
  std::size_t depth{0};
  std::uint64_t tokens{0};

  Impl(ByteCursor& cursor, const TokenizerConfig& c) : cfg(c), in(cursor, c) {
    sink.in = &in;
    reader.IterativeParseInit();
  }

  [[noreturn]] void fail_parse() const {
    throw MalformedInputError(rapidjson::GetParseError_En(reader.GetParseErrorCode()),
                              reader.GetErrorOffset());
  }

  // Pulls one token from the reader, bypassing `pending`.
  void read(Token& out) {
    out.text.clear();
    sink.out = &out;
    in.arm();
    if (!reader.IterativeParseNext<kParseFlags>(in, sink) || reader.HasParseError()) fail_parse();
    out.offset = in.start();
    if (is_brace(out.type)) out.end = out.offset + 1;
    ++tokens;

    if (out.type == TokenType::ObjectStart || out.type == TokenType::ArrayStart) {
      if (++depth > cfg.max_depth) {
        throw MalformedInputError("nesting deeper than " + std::to_string(cfg.max_depth), out.offset);
      }
    } else if (out.type == TokenType::ObjectEnd || out.type == TokenType::ArrayEnd) {
      --depth;
    }

    if (reader.IterativeParseComplete() && !in.exhausted()) {
      throw MalformedInputError("trailing characters after document", in.Tell());
    }
  }

  bool next(Token& out) {
    if (has_pending) {
      out = std::move(pending);
      has_pending = false;
      return true;
    }
    if (reader.IterativeParseComplete()) return false;
    read(out);
    return true;
  }

  // Next token, which must start a value.
  Token take_value() {
    Token t;
    if (!next(t) || t.type == TokenType::Key || t.type == TokenType::ObjectEnd ||
        t.type == TokenType::ArrayEnd) {
      throw std::logic_error("JsonTokenizer: not at a value position");
    }
    return t;
  }

  TokenType peek_value() {
    if (!has_pending) {
      if (reader.IterativeParseComplete()) {
        throw std::logic_error("JsonTokenizer: not at a value position");
      }
      read(pending);
      has_pending = true;
    }
    if (pending.type == TokenType::Key || pending.type == TokenType::ObjectEnd) {
      throw std::logic_error("JsonTokenizer: not at a value position");
    }
    return pending.type;
  }

  // Container values are consumed until their depth closes again; only the
  // bracket depth is kept, nothing is materialized.
  Span skip_value() {
    Token first = take_value();
    Span span;
    span.offset = first.offset;
    std::uint64_t end = first.end;
    if (first.type == TokenType::ObjectStart || first.type == TokenType::ArrayStart) {
      const std::size_t floor = depth - 1;
      Token t;
      while (depth > floor) {
        read(t);
        end = t.end;
      }
    }
    span.length = end - span.offset;
    return span;
  }

  std::uint64_t position() const { return has_pending ? pending.offset : in.Tell(); }
};

JsonTokenizer::JsonTokenizer(ByteCursor& cursor, const TokenizerConfig& cfg)
  : p_(new Impl(cursor, cfg)) {}

JsonTokenizer::~JsonTokenizer() { delete p_; }

bool JsonTokenizer::next(Token& out) { return p_->next(out); }
Span JsonTokenizer::skip_value() { return p_->skip_value(); }
TokenType JsonTokenizer::peek_value() { return p_->peek_value(); }

std::size_t JsonTokenizer::depth() const noexcept { return p_->depth; }
std::uint64_t JsonTokenizer::position() const noexcept { return p_->position(); }
std::uint64_t JsonTokenizer::bytes_read() const noexcept { return p_->in.bytes_read(); }
std::uint64_t JsonTokenizer::tokens() const noexcept { return p_->tokens; }

}
