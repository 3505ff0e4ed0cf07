#include "khiops_report/structural_parser.hpp"
#include "khiops_report/errors.hpp"
#include "khiops_report/token_json.hpp"

#include <cctype>
#include <string>
#include <utility>
#include <vector>

namespace kr {

const char* event_name(StructuralEvent::Kind k) noexcept {
  using K = StructuralEvent::Kind;
  switch (k) {
    case K::DocumentAttribute: return "document-attribute";
    case K::DocumentExtra:     return "document-extra";
    case K::SectionStart:      return "section-start";
    case K::SectionAttribute:  return "section-attribute";
    case K::SummaryAttribute:  return "summary-attribute";
    case K::ItemsStart:        return "items-start";
    case K::Item:              return "item";
    case K::ItemSkipped:       return "item-skipped";
    case K::SectionExtra:      return "section-extra";
    case K::SectionEnd:        return "section-end";
    case K::DetailsStart:      return "details-start";
    case K::Detail:            return "detail";
    case K::DetailsEnd:        return "details-end";
  }
  return "?";
}

static char lower(char c) noexcept {
  return static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
}

bool StructuralParser::key_equals(std::string_view a, std::string_view b) noexcept {
  if (a.size() != b.size()) return false;
  for (std::size_t i = 0; i < a.size(); ++i) if (lower(a[i]) != lower(b[i])) return false;
  return true;
}

bool StructuralParser::key_contains(std::string_view key, std::string_view marker) noexcept {
  if (marker.empty() || marker.size() > key.size()) return false;
  for (std::size_t i = 0; i + marker.size() <= key.size(); ++i) {
    if (key_equals(key.substr(i, marker.size()), marker)) return true;
  }
  return false;
}

static std::string describe_keys(const std::vector<std::string>& keys) {
  if (keys.empty()) return "no members";
  std::string out = "members [";
  for (std::size_t i = 0; i < keys.size(); ++i) {
    if (i) out += ", ";
    out += keys[i];
  }
  out += "]";
  return out;
}

namespace {

// One run over a document.
struct Pass {
  const SchemaConfig& cfg;
  JsonTokenizer& t;
  const StructuralParser::EventCallback& emit;

  StructuralEvent event(StructuralEvent::Kind k, const std::string& section) const {
    StructuralEvent ev;
    ev.kind = k;
    ev.section = section;
    return ev;
  }

  void details(const std::string& scope, const std::string& key) {
    Token open;
    t.next(open);
    auto start = event(StructuralEvent::Kind::DetailsStart, scope);
    start.key = key;
    start.offset = open.offset;
    emit(start);

    Token k;
    while (t.next(k) && k.type != TokenType::ObjectEnd) {
      auto ev = event(StructuralEvent::Kind::Detail, scope);
      ev.rank = std::move(k.text);
      ev.offset = k.offset;
      ev.span = t.skip_value();
      emit(ev);
    }
    emit(event(StructuralEvent::Kind::DetailsEnd, scope));
  }

  void summary(const std::string& section) {
    Token open;
    t.next(open);
    Token k;
    while (t.next(k) && k.type != TokenType::ObjectEnd) {
      auto ev = event(StructuralEvent::Kind::SummaryAttribute, section);
      ev.key = std::move(k.text);
      ev.offset = k.offset;
      Token v;
      t.next(v);
      ev.value = materialize(t, v);
      emit(ev);
    }
  }

  void skip_item(const std::string& section, std::uint64_t offset, const std::string& missing) {
    auto ev = event(StructuralEvent::Kind::ItemSkipped, section);
    ev.offset = offset;
    ev.key = missing;
    emit(ev);
  }

  void items(const std::string& section, const std::string& key) {
    auto start = event(StructuralEvent::Kind::ItemsStart, section);
    start.key = key;
    emit(start);

    Token open;
    t.next(open);
    Token it;
    while (t.next(it) && it.type != TokenType::ArrayEnd) {
      const std::uint64_t at = it.offset;
      if (it.type != TokenType::ObjectStart) {
        const char* found = token_name(it.type);
        (void)materialize(t, it);
        if (!cfg.skip_invalid_items) throw SchemaViolationError("item object", found, at);
        skip_item(section, at, "object");
        continue;
      }

      JsonValue item = materialize(t, it);
      const JsonValue* rank = nullptr;
      for (const auto& m : item.as_object()) {
        if (StructuralParser::key_equals(m.first, cfg.rank_key)) { rank = &m.second; break; }
      }
      if (!rank || !rank->is_string()) {
        const std::string expected = "string '" + cfg.rank_key + "' member";
        const std::string found = rank ? std::string(kind_name(rank->kind()))
                                       : "item without '" + cfg.rank_key + "'";
        if (!cfg.skip_invalid_items) throw SchemaViolationError(expected, found, at);
        skip_item(section, at, cfg.rank_key);
        continue;
      }

      auto ev = event(StructuralEvent::Kind::Item, section);
      ev.rank = rank->as_string();
      ev.offset = at;
      ev.value = std::move(item);
      emit(ev);
    }
  }

  void section(const std::string& name) {
    Token open;
    t.next(open);
    auto start = event(StructuralEvent::Kind::SectionStart, name);
    start.offset = open.offset;
    emit(start);

    bool have_summary = false;
    bool have_items = false;
    std::vector<std::string> seen;
    std::uint64_t end_at = open.offset;

    Token key;
    while (t.next(key)) {
      if (key.type == TokenType::ObjectEnd) { end_at = key.offset; break; }
      seen.push_back(key.text);
      const TokenType vt = t.peek_value();

      if (StructuralParser::key_equals(key.text, cfg.summary_key)) {
        if (have_summary) {
          throw SchemaViolationError("one '" + cfg.summary_key + "' member",
                                     "a duplicate '" + key.text + "'", key.offset);
        }
        if (vt != TokenType::ObjectStart) {
          throw SchemaViolationError("object for '" + key.text + "'", token_name(vt), t.position());
        }
        summary(name);
        have_summary = true;
        continue;
      }

      if (vt == TokenType::ObjectStart && StructuralParser::key_contains(key.text, cfg.detail_marker)) {
        details(name, key.text);
        continue;
      }

      if (vt == TokenType::ArrayStart && !have_items &&
          (cfg.items_key.empty() || StructuralParser::key_equals(key.text, cfg.items_key))) {
        items(name, key.text);
        have_items = true;
        continue;
      }

      if (vt == TokenType::ArrayStart || vt == TokenType::ObjectStart) {
        auto ev = event(StructuralEvent::Kind::SectionExtra, name);
        ev.key = key.text;
        ev.offset = key.offset;
        ev.span = t.skip_value();
        emit(ev);
        continue;
      }

      auto ev = event(StructuralEvent::Kind::SectionAttribute, name);
      ev.key = key.text;
      ev.offset = key.offset;
      Token v;
      t.next(v);
      ev.value = materialize(t, v);
      emit(ev);
    }

    if (!have_summary) {
      throw SchemaViolationError("'" + cfg.summary_key + "' member in section '" + name + "'",
                                 describe_keys(seen), open.offset);
    }
    auto end = event(StructuralEvent::Kind::SectionEnd, name);
    end.offset = end_at;
    emit(end);
  }

  void document() {
    Token root;
    if (!t.next(root)) throw MalformedInputError("empty document", t.position());
    if (root.type != TokenType::ObjectStart) {
      throw SchemaViolationError("root object", token_name(root.type), root.offset);
    }

    Token key;
    while (t.next(key) && key.type != TokenType::ObjectEnd) {
      const TokenType vt = t.peek_value();
      if (vt == TokenType::ObjectStart) {
        if (StructuralParser::key_contains(key.text, cfg.detail_marker)) details("", key.text);
        else section(key.text);
        continue;
      }
      if (vt == TokenType::ArrayStart) {
        auto ev = event(StructuralEvent::Kind::DocumentExtra, "");
        ev.key = key.text;
        ev.offset = key.offset;
        ev.span = t.skip_value();
        emit(ev);
        continue;
      }
      auto ev = event(StructuralEvent::Kind::DocumentAttribute, "");
      ev.key = key.text;
      ev.offset = key.offset;
      Token v;
      t.next(v);
      ev.value = materialize(t, v);
      emit(ev);
    }

    Token rest;
    t.next(rest);  // throws on trailing characters
  }
};

}

StructuralParser::StructuralParser(SchemaConfig cfg) : cfg_(std::move(cfg)) {}

void StructuralParser::parse(JsonTokenizer& tokens, const EventCallback& on_event) {
  Pass pass{cfg_, tokens, on_event};
  pass.document();
}

}
