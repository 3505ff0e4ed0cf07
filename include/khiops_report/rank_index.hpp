#pragma once
#include "khiops_report/report_model.hpp"
#include "khiops_report/structural_parser.hpp"
#include "khiops_report/token_json.hpp"

#include <cstdint>
#include <map>
#include <string>
#include <utility>
#include <vector>

namespace kr {

// Where a detail lives: a section scope, or the root scope ("").
struct DetailKey {
  std::string scope;
  std::string rank;
  bool operator<(const DetailKey& o) const {
    return scope != o.scope ? scope < o.scope : rank < o.rank;
  }
};

struct DetailSpan {
  std::uint64_t offset = 0;
  std::uint64_t length = 0;
  std::uint64_t end() const noexcept { return offset + length; }
};

struct ReportWarning {
  enum class Kind { DanglingDetail, MissingDetail, SkippedItem };
  Kind          kind = Kind::MissingDetail;
  std::string   scope;   // section name, "" for the root scope
  std::string   rank;
  std::uint64_t offset = 0;
  std::string   message() const;
};

// Rank -> span map for one report. Immutable once built.
class DetailIndex {
public:
  const DetailSpan* find(const std::string& scope, const std::string& rank) const;

  // Root scope first, then section scopes in the given order.
  const DetailSpan* find_any(const std::string& rank,
                             const std::vector<std::string>& section_order,
                             DetailKey* hit = nullptr) const;

  // False when the key is already present.
  bool insert(DetailKey key, DetailSpan span);

  std::size_t size() const noexcept { return spans_.size(); }
  const std::map<DetailKey, DetailSpan>& entries() const noexcept { return spans_; }

private:
  std::map<DetailKey, DetailSpan> spans_;
};

struct BuildResult {
  std::vector<ReportSection> sections;
  JsonValue::Object document_attributes;
  std::map<DetailKey, DetailSpan> extras;   // rank field holds the member key
  DetailIndex index;
  std::vector<ReportWarning> warnings;
};

// Subscriber to StructuralParser events. Call finish() after the pass.
class RankIndexBuilder {
public:
  explicit RankIndexBuilder(std::string rank_key = "Rank");
  ~RankIndexBuilder();

  RankIndexBuilder(const RankIndexBuilder&) = delete;
  RankIndexBuilder& operator=(const RankIndexBuilder&) = delete;

  // Throws SchemaViolationError on duplicate ranks.
  void on_event(const StructuralEvent& ev);

  // Cross-checks items against details and hands over the result.
  BuildResult finish();

private:
  struct Impl; Impl* p_;
};

}
