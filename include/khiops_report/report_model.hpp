#pragma once
#include "khiops_report/json_value.hpp"

#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace kr {

enum class SectionKind { Modeling, Evaluation, Preparation, Other };

const char* section_kind_name(SectionKind k) noexcept;

// Classified from the section name ("Modeling report", "trainEvaluationReport", ...).
SectionKind classify_section(std::string_view name) noexcept;

// One analyzed entity. Summary attributes are always materialized; the
// detail, if any, is only reachable through Report::get_detail.
struct ReportItem {
  std::string       rank;
  JsonValue::Object attributes;   // every member of the item object, rank included
  std::uint64_t     offset = 0;
  bool              has_detail = false;

  const JsonValue* find(std::string_view key) const { return find_member(attributes, key); }
};

struct ReportSection {
  std::string              name;
  SectionKind              kind = SectionKind::Other;
  std::uint64_t            offset = 0;
  JsonValue::Object        summary;
  JsonValue::Object        attributes;   // scalar members outside the summary
  std::string              items_key;    // key of the item list, empty when absent
  std::vector<ReportItem>  items;
  std::vector<std::string> extras;       // composite members kept as lazy spans

  const ReportItem* find_item(std::string_view rank) const;
};

}
