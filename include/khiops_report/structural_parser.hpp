#pragma once
#include "khiops_report/json_value.hpp"
#include "khiops_report/token_json.hpp"

#include <cstdint>
#include <functional>
#include <string>

namespace kr {

class JsonTokenizer;

// Key names and policies of the report schema. Keys are matched
// case-insensitively so both "Summary"/"Rank" and Khiops' "summary"/"rank"
// are recognized.
struct SchemaConfig {
  std::string summary_key   = "Summary";
  std::string rank_key      = "Rank";
  std::string detail_marker = "detail";   // substring marking a detail dictionary
  std::string items_key;                  // empty: first array member of a section
  bool        skip_invalid_items = false; // drop rank-less items instead of failing
};

struct StructuralEvent {
  enum class Kind {
    DocumentAttribute,  // key, value (root scalar)
    DocumentExtra,      // key, span  (root array)
    SectionStart,       // section, offset
    SectionAttribute,   // section, key, value
    SummaryAttribute,   // section, key, value
    ItemsStart,         // section, key
    Item,               // section, rank, value (whole item object), offset
    ItemSkipped,        // section, offset, key (what was missing)
    SectionExtra,       // section, key, span
    SectionEnd,         // section, offset
    DetailsStart,       // scope, key, offset
    Detail,             // scope, rank, span
    DetailsEnd          // scope
  };

  Kind          kind = Kind::SectionStart;
  std::string   section;  // current section; for details, the scope ("" = root)
  std::string   key;
  std::string   rank;
  JsonValue     value;
  Span          span;
  std::uint64_t offset = 0;
};

const char* event_name(StructuralEvent::Kind k) noexcept;

// Single-pass recognizer for the report layout. Events are delivered
// synchronously in document order; detail and extra values are skipped and
// reported as spans only.
class StructuralParser {
public:
  using EventCallback = std::function<void(const StructuralEvent&)>;

  explicit StructuralParser(SchemaConfig cfg);

  // Consumes the whole document. Throws MalformedInputError or SchemaViolationError.
  void parse(JsonTokenizer& tokens, const EventCallback& on_event);

  static bool key_equals(std::string_view a, std::string_view b) noexcept;
  static bool key_contains(std::string_view key, std::string_view marker) noexcept;

private:
  SchemaConfig cfg_;
};

// Builds a value from the token stream, starting with `first` (already consumed).
JsonValue materialize(JsonTokenizer& tokens, const Token& first);

}
