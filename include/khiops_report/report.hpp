#pragma once
#include "khiops_report/detail_resolver.hpp"
#include "khiops_report/errors.hpp"
#include "khiops_report/json_value.hpp"
#include "khiops_report/log.hpp"
#include "khiops_report/metrics.hpp"
#include "khiops_report/rank_index.hpp"
#include "khiops_report/report_model.hpp"
#include "khiops_report/structural_parser.hpp"

#include <atomic>
#include <map>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

namespace kr {

class ByteSource;

struct ReaderConfig {
  std::size_t  chunk_bytes        = 512 * 1024;  // index pass read size
  std::size_t  detail_chunk_bytes = 256 * 1024;  // per-resolution read size
  std::size_t  max_depth          = 512;
  std::string  summary_key        = "Summary";
  std::string  rank_key           = "Rank";
  std::string  detail_marker      = "detail";
  std::string  items_key;                        // empty: first array of each section
  bool         skip_invalid_items = false;
  LogSink      log                = log_to_stderr;
  LogLevel     log_level          = LogLevel::Warn;
};

// Open report: sections and item summaries are materialized by one streaming
// pass; detailed items are parsed on demand and cached for the handle's life.
class Report {
public:
  // Throws MalformedInputError / SchemaViolationError; no handle on failure.
  static std::unique_ptr<Report> open(const std::string& path, const ReaderConfig& cfg = {});
  static std::unique_ptr<Report> open(std::shared_ptr<const ByteSource> source,
                                      const ReaderConfig& cfg = {});

  ~Report();
  Report(const Report&) = delete;
  Report& operator=(const Report&) = delete;

  const std::vector<ReportSection>& sections() const noexcept { return sections_; }
  const ReportSection* find_section(std::string_view name) const;

  const JsonValue::Object& document_attributes() const noexcept { return document_attributes_; }
  const std::vector<ReportWarning>& warnings() const noexcept { return warnings_; }
  const DetailIndex& index() const noexcept { return index_; }

  bool has_detail(const std::string& rank) const;
  bool has_detail(const std::string& section, const std::string& rank) const;

  // Throws NoDetailError when the rank has no detailed entry.
  const DetailSpan& detail_span(const std::string& rank) const;

  // Root scope first, then section scopes in source order.
  const JsonValue& get_detail(const std::string& rank, const CancelToken* cancel = nullptr);

  // The section's own detail dictionary first, then the root scope.
  const JsonValue& get_detail(const std::string& section, const std::string& rank,
                              const CancelToken* cancel = nullptr);

  // Composite member kept as a span (e.g. curves); section "" names a root
  // array. Throws NoDetailError when there is no such member.
  const JsonValue& get_extra(const std::string& section, const std::string& key,
                             const CancelToken* cancel = nullptr);

  // Releases the source. Sections stay readable; detail access throws ReportClosedError.
  void close();
  bool is_open() const noexcept { return !closed_.load(); }

  std::string source_name() const { return source_name_; }
  ReaderStats stats() const { return metrics_->snapshot(); }

private:
  Report(std::shared_ptr<const ByteSource> source, const ReaderConfig& cfg, BuildResult built,
         std::unique_ptr<ReaderMetrics> metrics);

  void check_open() const;

  std::string source_name_;
  std::vector<ReportSection> sections_;
  JsonValue::Object document_attributes_;
  const DetailIndex index_;
  std::map<DetailKey, DetailSpan> extras_;
  std::vector<ReportWarning> warnings_;
  std::unique_ptr<ReaderMetrics> metrics_;
  std::vector<std::string> section_names_;
  std::unique_ptr<DetailResolver> resolver_;
  std::unique_ptr<DetailResolver> extras_resolver_;  // separate cache: extra keys may equal ranks
  std::atomic<bool> closed_{false};
};

}
