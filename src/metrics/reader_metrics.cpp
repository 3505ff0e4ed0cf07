#include "khiops_report/metrics.hpp"

namespace kr {

void ReaderMetrics::reset() {
  index_bytes_ = index_tokens_ = 0;
  sections_ = items_ = detail_entries_ = 0;
  details_resolved_ = detail_bytes_ = cache_hits_ = resolve_failures_ = 0;
  std::lock_guard<std::mutex> lk(stage_mu_);
  stage_accum_ms_.clear();
  stage_starts_.clear();
}

void ReaderMetrics::set_shape(std::uint64_t sections, std::uint64_t items,
                              std::uint64_t details) noexcept {
  sections_ = sections;
  items_ = items;
  detail_entries_ = details;
}

void ReaderMetrics::start_stage(std::string_view name) {
  std::lock_guard<std::mutex> lk(stage_mu_);
  stage_starts_[std::string(name)] = std::chrono::steady_clock::now();
}

void ReaderMetrics::end_stage(std::string_view name) {
  std::lock_guard<std::mutex> lk(stage_mu_);
  auto key = std::string(name);
  auto it = stage_starts_.find(key);
  if (it == stage_starts_.end()) return;
  auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
              std::chrono::steady_clock::now() - it->second).count();
  stage_accum_ms_[key] += static_cast<std::uint64_t>(ms);
  stage_starts_.erase(it);
}

ReaderStats ReaderMetrics::snapshot() const {
  ReaderStats r;
  r.index_bytes = index_bytes_;
  r.index_tokens = index_tokens_;
  r.sections = sections_;
  r.items = items_;
  r.detail_entries = detail_entries_;
  r.details_resolved = details_resolved_;
  r.detail_bytes = detail_bytes_;
  r.cache_hits = cache_hits_;
  r.resolve_failures = resolve_failures_;

  std::lock_guard<std::mutex> lk(stage_mu_);
  r.stages.reserve(stage_accum_ms_.size());
  for (auto& kv : stage_accum_ms_) r.stages.push_back(StageTiming{kv.first, kv.second});
  return r;
}

}
