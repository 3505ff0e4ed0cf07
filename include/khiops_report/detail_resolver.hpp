#pragma once
#include "khiops_report/json_value.hpp"
#include "khiops_report/log.hpp"
#include "khiops_report/rank_index.hpp"

#include <atomic>
#include <cstddef>
#include <map>
#include <memory>
#include <mutex>
#include <string>

namespace kr {

class ByteSource;
class ReaderMetrics;

// Set by the caller to abandon an in-flight resolution.
using CancelToken = std::atomic<bool>;

// Rank -> materialized value. Entries are inserted whole and never evicted,
// so returned references stay valid for the cache's lifetime.
class DetailCache {
public:
  const JsonValue* find(const DetailKey& key) const;

  // Keeps the first value stored under `key`; returns the stored one.
  const JsonValue& insert(const DetailKey& key, JsonValue value);

  std::size_t size() const;

private:
  mutable std::mutex mu_;
  std::map<DetailKey, std::unique_ptr<const JsonValue>> entries_;
};

struct ResolverConfig {
  std::size_t chunk_bytes = 256 * 1024;
  std::size_t max_depth   = 512;
  LogSink     log;
  LogLevel    log_level   = LogLevel::Warn;
};

// Seeks to a span on its own cursor and parses only that span. Safe to call
// concurrently; each call opens an independent cursor.
class DetailResolver {
public:
  DetailResolver(std::shared_ptr<const ByteSource> source, ResolverConfig cfg,
                 ReaderMetrics& metrics);

  // Throws MalformedInputError (offset within the source) or CancelledError.
  // Nothing is cached when it throws.
  const JsonValue& resolve(const DetailKey& key, const DetailSpan& span,
                           const CancelToken* cancel = nullptr);

  bool cached(const DetailKey& key) const { return cache_.find(key) != nullptr; }
  std::size_t cache_size() const { return cache_.size(); }

  // Drops the source; later resolutions of uncached keys throw ReportClosedError.
  void release();

private:
  std::shared_ptr<const ByteSource> source() const;
  JsonValue read_and_parse(const ByteSource& src, const DetailSpan& span,
                           const CancelToken* cancel) const;
  void log(LogLevel lv, const std::string& msg) const;

  mutable std::mutex source_mu_;
  std::shared_ptr<const ByteSource> source_;
  ResolverConfig cfg_;
  ReaderMetrics& metrics_;
  DetailCache cache_;
};

}
