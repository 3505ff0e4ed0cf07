#include "khiops_report/report.hpp"
#include "khiops_report/byte_source.hpp"
#include "khiops_report/token_json.hpp"

#include <stdexcept>
#include <utility>

namespace kr {

namespace {

ResolverConfig resolver_config(const ReaderConfig& cfg) {
  ResolverConfig r;
  r.chunk_bytes = cfg.detail_chunk_bytes;
  r.max_depth = cfg.max_depth;
  r.log = cfg.log;
  r.log_level = cfg.log_level;
  return r;
}

}

std::unique_ptr<Report> Report::open(const std::string& path, const ReaderConfig& cfg) {
  return open(std::make_shared<FileSource>(path), cfg);
}

std::unique_ptr<Report> Report::open(std::shared_ptr<const ByteSource> source,
                                     const ReaderConfig& cfg) {
  if (!source) throw std::invalid_argument("Report::open: null source");

  auto log = [&](LogLevel lv, const std::string& msg) {
    if (cfg.log && lv >= cfg.log_level) cfg.log(lv, msg);
  };
  const std::string name = source->describe();
  log(LogLevel::Info, "indexing " + name + " (" + std::to_string(source->size()) + " bytes)");

  auto metrics = std::make_unique<ReaderMetrics>();
  metrics->start_stage("index_pass");

  auto cursor = source->open_cursor();
  TokenizerConfig tcfg;
  tcfg.chunk_bytes = cfg.chunk_bytes;
  tcfg.max_depth = cfg.max_depth;
  JsonTokenizer tokens(*cursor, tcfg);

  SchemaConfig scfg;
  scfg.summary_key = cfg.summary_key;
  scfg.rank_key = cfg.rank_key;
  scfg.detail_marker = cfg.detail_marker;
  scfg.items_key = cfg.items_key;
  scfg.skip_invalid_items = cfg.skip_invalid_items;
  StructuralParser parser(scfg);
  RankIndexBuilder builder(cfg.rank_key);

  try {
    parser.parse(tokens, [&](const StructuralEvent& ev) { builder.on_event(ev); });
  } catch (const ReportError& e) {
    log(LogLevel::Error, name + ": " + e.what());
    throw;
  }

  metrics->end_stage("index_pass");
  metrics->add_index_bytes(tokens.bytes_read());
  metrics->add_index_tokens(tokens.tokens());

  BuildResult built = builder.finish();
  std::uint64_t items = 0;
  for (const auto& s : built.sections) items += s.items.size();
  metrics->set_shape(built.sections.size(), items, built.index.size());
  if (!built.warnings.empty()) {
    std::size_t missing = 0, dangling = 0, skipped = 0;
    for (const auto& w : built.warnings) {
      log(LogLevel::Info, w.message());
      switch (w.kind) {
        case ReportWarning::Kind::MissingDetail:  ++missing; break;
        case ReportWarning::Kind::DanglingDetail: ++dangling; break;
        case ReportWarning::Kind::SkippedItem:    ++skipped; break;
      }
    }
    log(LogLevel::Warn, name + ": " + std::to_string(built.warnings.size()) + " warnings (" +
                        std::to_string(missing) + " missing details, " +
                        std::to_string(dangling) + " dangling details, " +
                        std::to_string(skipped) + " skipped items)");
  }
  log(LogLevel::Info, "indexed " + name + ": " + std::to_string(built.sections.size()) +
                      " sections, " + std::to_string(items) + " items, " +
                      std::to_string(built.index.size()) + " details");

  return std::unique_ptr<Report>(new Report(std::move(source), cfg, std::move(built), std::move(metrics)));
}

Report::Report(std::shared_ptr<const ByteSource> source, const ReaderConfig& cfg, BuildResult built,
               std::unique_ptr<ReaderMetrics> metrics)
  : source_name_(source->describe()),
    sections_(std::move(built.sections)),
    document_attributes_(std::move(built.document_attributes)),
    index_(std::move(built.index)),
    extras_(std::move(built.extras)),
    warnings_(std::move(built.warnings)),
    metrics_(std::move(metrics)) {
  section_names_.reserve(sections_.size());
  for (const auto& s : sections_) section_names_.push_back(s.name);
  resolver_ = std::make_unique<DetailResolver>(source, resolver_config(cfg), *metrics_);
  extras_resolver_ = std::make_unique<DetailResolver>(std::move(source), resolver_config(cfg), *metrics_);
}

Report::~Report() = default;

const ReportSection* Report::find_section(std::string_view name) const {
  for (const auto& s : sections_) if (s.name == name) return &s;
  return nullptr;
}

bool Report::has_detail(const std::string& rank) const {
  return index_.find_any(rank, section_names_) != nullptr;
}

bool Report::has_detail(const std::string& section, const std::string& rank) const {
  return index_.find(section, rank) || index_.find("", rank);
}

const DetailSpan& Report::detail_span(const std::string& rank) const {
  const DetailSpan* span = index_.find_any(rank, section_names_);
  if (!span) throw NoDetailError(rank);
  return *span;
}

void Report::check_open() const {
  if (closed_.load()) throw ReportClosedError();
}

const JsonValue& Report::get_detail(const std::string& rank, const CancelToken* cancel) {
  check_open();
  DetailKey hit;
  const DetailSpan* span = index_.find_any(rank, section_names_, &hit);
  if (!span) throw NoDetailError(rank);
  return resolver_->resolve(hit, *span, cancel);
}

const JsonValue& Report::get_detail(const std::string& section, const std::string& rank,
                                    const CancelToken* cancel) {
  check_open();
  if (const DetailSpan* span = index_.find(section, rank)) {
    return resolver_->resolve(DetailKey{section, rank}, *span, cancel);
  }
  if (const DetailSpan* span = index_.find("", rank)) {
    return resolver_->resolve(DetailKey{"", rank}, *span, cancel);
  }
  throw NoDetailError(rank);
}

const JsonValue& Report::get_extra(const std::string& section, const std::string& key,
                                   const CancelToken* cancel) {
  check_open();
  DetailKey k{section, key};
  auto it = extras_.find(k);
  if (it == extras_.end()) throw NoDetailError(section.empty() ? key : section + "/" + key);
  return extras_resolver_->resolve(k, it->second, cancel);
}

void Report::close() {
  if (closed_.exchange(true)) return;
  resolver_->release();
  extras_resolver_->release();
}

}
