#pragma once
#include <atomic>
#include <chrono>
#include <cstdint>
#include <mutex>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace kr {

struct StageTiming {
  std::string name;
  std::uint64_t duration_ms = 0;
};

struct ReaderStats {
  std::uint64_t index_bytes = 0;       // bytes scanned by the streaming pass
  std::uint64_t index_tokens = 0;
  std::uint64_t sections = 0;
  std::uint64_t items = 0;
  std::uint64_t detail_entries = 0;
  std::uint64_t details_resolved = 0;  // successful span parses
  std::uint64_t detail_bytes = 0;      // bytes read to resolve spans
  std::uint64_t cache_hits = 0;
  std::uint64_t resolve_failures = 0;

  std::vector<StageTiming> stages;
};

// Counters shared by the index pass and concurrent resolutions.
class ReaderMetrics {
public:
  void reset();

  void add_index_bytes(std::uint64_t b) noexcept { index_bytes_ += b; }
  void add_index_tokens(std::uint64_t n) noexcept { index_tokens_ += n; }
  void set_shape(std::uint64_t sections, std::uint64_t items, std::uint64_t details) noexcept;
  void add_resolved(std::uint64_t bytes) noexcept { ++details_resolved_; detail_bytes_ += bytes; }
  void add_cache_hit() noexcept { ++cache_hits_; }
  void add_failure() noexcept { ++resolve_failures_; }

  void start_stage(std::string_view name);
  void end_stage(std::string_view name);

  ReaderStats snapshot() const;

private:
  std::atomic<std::uint64_t> index_bytes_{0};
  std::atomic<std::uint64_t> index_tokens_{0};
  std::atomic<std::uint64_t> sections_{0};
  std::atomic<std::uint64_t> items_{0};
  std::atomic<std::uint64_t> detail_entries_{0};
  std::atomic<std::uint64_t> details_resolved_{0};
  std::atomic<std::uint64_t> detail_bytes_{0};
  std::atomic<std::uint64_t> cache_hits_{0};
  std::atomic<std::uint64_t> resolve_failures_{0};

  mutable std::mutex stage_mu_;
  std::unordered_map<std::string, std::uint64_t> stage_accum_ms_;
  std::unordered_map<std::string, std::chrono::steady_clock::time_point> stage_starts_;
};

}
