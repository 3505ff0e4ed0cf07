#include "khiops_report/detail_resolver.hpp"
#include "khiops_report/byte_source.hpp"
#include "khiops_report/chunk_reader.hpp"
#include "khiops_report/errors.hpp"
#include "khiops_report/metrics.hpp"
#include "khiops_report/structural_parser.hpp"
#include "khiops_report/token_json.hpp"

#include <simdjson.h>
#include <cstring>
#include <string>
#include <string_view>
#include <utility>

namespace kr {

const JsonValue* DetailCache::find(const DetailKey& key) const {
  std::lock_guard<std::mutex> lk(mu_);
  auto it = entries_.find(key);
  return it == entries_.end() ? nullptr : it->second.get();
}

const JsonValue& DetailCache::insert(const DetailKey& key, JsonValue value) {
  std::lock_guard<std::mutex> lk(mu_);
  auto it = entries_.find(key);
  if (it == entries_.end()) {
    it = entries_.emplace(key, std::make_unique<const JsonValue>(std::move(value))).first;
  }
  return *it->second;
}

std::size_t DetailCache::size() const {
  std::lock_guard<std::mutex> lk(mu_);
  return entries_.size();
}

static JsonValue from_dom(simdjson::dom::element e, std::uint64_t span_offset) {
  switch (e.type()) {
    case simdjson::dom::element_type::OBJECT: {
      simdjson::dom::object obj;
      if (e.get_object().get(obj)) break;
      JsonValue::Object out;
      out.reserve(obj.size());
      for (simdjson::dom::key_value_pair field : obj) {
        out.emplace_back(std::string(field.key), from_dom(field.value, span_offset));
      }
      return JsonValue(std::move(out));
    }
    case simdjson::dom::element_type::ARRAY: {
      simdjson::dom::array arr;
      if (e.get_array().get(arr)) break;
      JsonValue::Array out;
      out.reserve(arr.size());
      for (simdjson::dom::element child : arr) out.push_back(from_dom(child, span_offset));
      return JsonValue(std::move(out));
    }
    case simdjson::dom::element_type::INT64: {
      std::int64_t v = 0;
      if (e.get_int64().get(v)) break;
      return JsonValue(v);
    }
    case simdjson::dom::element_type::UINT64: {
      std::uint64_t v = 0;
      if (e.get_uint64().get(v)) break;
      return JsonValue(static_cast<double>(v));
    }
    case simdjson::dom::element_type::DOUBLE: {
      double v = 0.0;
      if (e.get_double().get(v)) break;
      return JsonValue(v);
    }
    case simdjson::dom::element_type::STRING: {
      std::string_view s;
      if (e.get_string().get(s)) break;
      return JsonValue(std::string(s));
    }
    case simdjson::dom::element_type::BOOL: {
      bool b = false;
      if (e.get_bool().get(b)) break;
      return JsonValue(b);
    }
    case simdjson::dom::element_type::NULL_VALUE:
      return JsonValue(nullptr);
    default:
      break;
  }
  throw MalformedInputError("unsupported value in detail span", span_offset);
}

DetailResolver::DetailResolver(std::shared_ptr<const ByteSource> source, ResolverConfig cfg,
                               ReaderMetrics& metrics)
  : source_(std::move(source)), cfg_(std::move(cfg)), metrics_(metrics) {}

std::shared_ptr<const ByteSource> DetailResolver::source() const {
  std::lock_guard<std::mutex> lk(source_mu_);
  return source_;
}

void DetailResolver::release() {
  std::lock_guard<std::mutex> lk(source_mu_);
  source_.reset();
}

void DetailResolver::log(LogLevel lv, const std::string& msg) const {
  if (cfg_.log && lv >= cfg_.log_level) cfg_.log(lv, msg);
}

// Materializes a span with the streaming lexer. Used when simdjson rejects a
// span: either the lexer accepts it too (integers beyond 64 bits) and its
// value matches what the index pass produced, or its error locates the fault.
static JsonValue reparse_span(const ByteSource& src, const DetailSpan& span, std::size_t max_depth) {
  auto cursor = src.open_cursor();
  cursor->seek(span.offset);
  TokenizerConfig tcfg;
  tcfg.max_depth = max_depth;
  tcfg.limit = span.length;
  JsonTokenizer tok(*cursor, tcfg);
  Token first;
  if (!tok.next(first)) throw MalformedInputError("empty detail span", span.offset);
  JsonValue v = materialize(tok, first);
  Token rest;
  tok.next(rest);  // throws on trailing characters
  return v;
}

JsonValue DetailResolver::read_and_parse(const ByteSource& src, const DetailSpan& span,
                                         const CancelToken* cancel) const {
  auto cursor = src.open_cursor();
  cursor->seek(span.offset);

  simdjson::padded_string buf(static_cast<std::size_t>(span.length));
  std::size_t got = 0;
  ChunkReader reader(*cursor, ChunkReader::Config{cfg_.chunk_bytes, span.length});
  reader.for_each_chunk([&](const Chunk& c) {
    if (cancel && cancel->load()) throw CancelledError(c.offset);
    std::memcpy(buf.data() + got, c.data.data(), c.data.size());
    got += c.data.size();
    return true;
  });
  if (got < span.length) {
    throw MalformedInputError("source ended inside a detail span", span.offset + got);
  }
  if (cancel && cancel->load()) throw CancelledError(span.end());

  thread_local simdjson::dom::parser parser;
  simdjson::dom::element doc;
  auto err = parser.parse(buf).get(doc);
  if (err) {
    JsonValue v = reparse_span(src, span, cfg_.max_depth);
    log(LogLevel::Debug, std::string("simdjson rejected span at ") + std::to_string(span.offset) +
                         " (" + simdjson::error_message(err) + "), kept the streaming parse");
    return v;
  }
  return from_dom(doc, span.offset);
}

const JsonValue& DetailResolver::resolve(const DetailKey& key, const DetailSpan& span,
                                         const CancelToken* cancel) {
  if (const JsonValue* hit = cache_.find(key)) {
    metrics_.add_cache_hit();
    return *hit;
  }

  auto src = source();
  if (!src) throw ReportClosedError();

  try {
    JsonValue v = read_and_parse(*src, span, cancel);
    metrics_.add_resolved(span.length);
    log(LogLevel::Debug, "resolved '" + key.rank + "' (" + std::to_string(span.length) +
                         " bytes at " + std::to_string(span.offset) + ")");
    return cache_.insert(key, std::move(v));
  } catch (const CancelledError&) {
    log(LogLevel::Debug, "resolution of '" + key.rank + "' cancelled");
    throw;
  } catch (const ReportError& e) {
    metrics_.add_failure();
    log(LogLevel::Error, "resolution of '" + key.rank + "' failed: " + e.what());
    throw;
  }
}

}
