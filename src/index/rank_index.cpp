#include "khiops_report/rank_index.hpp"
#include "khiops_report/errors.hpp"

#include <map>
#include <set>
#include <string>
#include <utility>

namespace kr {

std::string ReportWarning::message() const {
  const std::string where = scope.empty() ? std::string("root scope") : "section '" + scope + "'";
  switch (kind) {
    case Kind::DanglingDetail:
      return "detail '" + rank + "' in " + where + " has no matching item";
    case Kind::MissingDetail:
      return "item '" + rank + "' in " + where + " has no detail";
    case Kind::SkippedItem:
      return "skipped invalid item in " + where + " at byte " + std::to_string(offset);
  }
  return "?";
}

bool DetailIndex::insert(DetailKey key, DetailSpan span) {
  return spans_.emplace(std::move(key), span).second;
}

const DetailSpan* DetailIndex::find(const std::string& scope, const std::string& rank) const {
  auto it = spans_.find(DetailKey{scope, rank});
  return it == spans_.end() ? nullptr : &it->second;
}

const DetailSpan* DetailIndex::find_any(const std::string& rank,
                                        const std::vector<std::string>& section_order,
                                        DetailKey* hit) const {
  if (const DetailSpan* s = find("", rank)) {
    if (hit) *hit = DetailKey{"", rank};
    return s;
  }
  for (const auto& scope : section_order) {
    if (scope.empty()) continue;
    if (const DetailSpan* s = find(scope, rank)) {
      if (hit) *hit = DetailKey{scope, rank};
      return s;
    }
  }
  return nullptr;
}

struct RankIndexBuilder::Impl {
  std::string rank_key;
  BuildResult out;
  std::size_t current{0};
  bool in_section{false};
  std::map<std::string, std::set<std::string>> ranks_by_section;

  ReportSection& section(const StructuralEvent& ev) {
    if (!in_section) {
      throw SchemaViolationError("enclosing section", std::string(event_name(ev.kind)), ev.offset);
    }
    return out.sections[current];
  }

  void on_event(const StructuralEvent& ev) {
    using K = StructuralEvent::Kind;
    switch (ev.kind) {
      case K::DocumentAttribute:
        out.document_attributes.emplace_back(ev.key, ev.value);
        break;
      case K::DocumentExtra:
        out.extras[DetailKey{"", ev.key}] = DetailSpan{ev.span.offset, ev.span.length};
        break;
      case K::SectionStart: {
        if (ranks_by_section.count(ev.section)) {
          throw SchemaViolationError("unique section name", "a duplicate '" + ev.section + "'", ev.offset);
        }
        ranks_by_section[ev.section];
        ReportSection s;
        s.name = ev.section;
        s.kind = classify_section(ev.section);
        s.offset = ev.offset;
        out.sections.push_back(std::move(s));
        current = out.sections.size() - 1;
        in_section = true;
        break;
      }
      case K::SectionAttribute:
        section(ev).attributes.emplace_back(ev.key, ev.value);
        break;
      case K::SummaryAttribute:
        section(ev).summary.emplace_back(ev.key, ev.value);
        break;
      case K::ItemsStart:
        section(ev).items_key = ev.key;
        break;
      case K::Item: {
        ReportSection& s = section(ev);
        if (!ranks_by_section[s.name].insert(ev.rank).second) {
          throw SchemaViolationError("unique " + rank_key + " in section '" + s.name + "'",
                                     "a duplicate '" + ev.rank + "'", ev.offset);
        }
        ReportItem item;
        item.rank = ev.rank;
        item.attributes = ev.value.as_object();
        item.offset = ev.offset;
        s.items.push_back(std::move(item));
        break;
      }
      case K::ItemSkipped: {
        ReportWarning w;
        w.kind = ReportWarning::Kind::SkippedItem;
        w.scope = ev.section;
        w.offset = ev.offset;
        out.warnings.push_back(std::move(w));
        break;
      }
      case K::SectionExtra:
        section(ev).extras.push_back(ev.key);
        out.extras[DetailKey{ev.section, ev.key}] = DetailSpan{ev.span.offset, ev.span.length};
        break;
      case K::SectionEnd:
        in_section = false;
        break;
      case K::DetailsStart:
      case K::DetailsEnd:
        break;
      case K::Detail:
        if (!out.index.insert(DetailKey{ev.section, ev.rank}, DetailSpan{ev.span.offset, ev.span.length})) {
          const std::string where = ev.section.empty() ? std::string("root") : "section '" + ev.section + "'";
          throw SchemaViolationError("unique " + rank_key + " in " + where + " detail dictionary",
                                     "a duplicate '" + ev.rank + "'", ev.offset);
        }
        break;
    }
  }

  void cross_check() {
    for (auto& s : out.sections) {
      for (auto& item : s.items) {
        item.has_detail = out.index.find(s.name, item.rank) || out.index.find("", item.rank);
        if (item.has_detail) continue;
        ReportWarning w;
        w.kind = ReportWarning::Kind::MissingDetail;
        w.scope = s.name;
        w.rank = item.rank;
        w.offset = item.offset;
        out.warnings.push_back(std::move(w));
      }
    }

    for (const auto& kv : out.index.entries()) {
      const DetailKey& key = kv.first;
      bool matched = false;
      if (key.scope.empty()) {
        for (const auto& sr : ranks_by_section) {
          if (sr.second.count(key.rank)) { matched = true; break; }
        }
      } else {
        auto it = ranks_by_section.find(key.scope);
        matched = it != ranks_by_section.end() && it->second.count(key.rank) > 0;
      }
      if (matched) continue;
      ReportWarning w;
      w.kind = ReportWarning::Kind::DanglingDetail;
      w.scope = key.scope;
      w.rank = key.rank;
      w.offset = kv.second.offset;
      out.warnings.push_back(std::move(w));
    }
  }
};

RankIndexBuilder::RankIndexBuilder(std::string rank_key)
  : p_(new Impl{std::move(rank_key), {}, 0, false, {}}) {}

RankIndexBuilder::~RankIndexBuilder() { delete p_; }

void RankIndexBuilder::on_event(const StructuralEvent& ev) { p_->on_event(ev); }

BuildResult RankIndexBuilder::finish() {
  p_->cross_check();
  return std::move(p_->out);
}

}
