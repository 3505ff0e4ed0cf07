#include "khiops_report/errors.hpp"
#include "khiops_report/report.hpp"
#include "khiops_report/report_format.hpp"

#include <cstdlib>
#include <iostream>
#include <string>
#include <vector>

namespace {

struct Cli {
  std::string file;
  bool list = false;
  bool warnings = false;
  bool stats = false;
  bool pretty = false;
  bool quiet = false;
  std::string section;
  std::vector<std::string> details;   // ranks to resolve
  std::vector<std::string> extras;    // section extras to resolve
  kr::ReaderConfig reader;
};

void usage(std::ostream& o) {
  o << "Usage: khiops-report <file> [--list] [--detail=RANK]... [--section=NAME]\n"
       "                     [--extra=KEY --section=NAME] [--warnings] [--stats]\n"
       "                     [--chunk-bytes=N] [--max-depth=N] [--rank-key=K]\n"
       "                     [--summary-key=K] [--items-key=K] [--skip-invalid-items]\n"
       "                     [--pretty] [--quiet] [--verbose]\n";
}

// Returns false on a usage error.
bool parse_cli(int argc, char** argv, Cli& c) {
  for (int i = 1; i < argc; ++i) {
    std::string a(argv[i]);
    auto eat = [&](const char* pfx, std::string* out) {
      if (a.rfind(pfx, 0) == 0) { *out = a.substr(std::string(pfx).size()); return true; }
      return false;
    };
    auto eat_n = [&](const char* pfx, std::size_t* out) {
      if (a.rfind(pfx, 0) != 0) return false;
      *out = static_cast<std::size_t>(std::stoull(a.substr(std::string(pfx).size())));
      return true;
    };
    std::string v;
    if (eat("--detail=", &v)) { c.details.push_back(v); continue; }
    if (eat("--extra=", &v))  { c.extras.push_back(v); continue; }
    if (eat("--section=", &c.section)) continue;
    if (eat_n("--chunk-bytes=", &c.reader.chunk_bytes)) continue;
    if (eat_n("--max-depth=", &c.reader.max_depth)) continue;
    if (eat("--rank-key=", &c.reader.rank_key)) continue;
    if (eat("--summary-key=", &c.reader.summary_key)) continue;
    if (eat("--items-key=", &c.reader.items_key)) continue;
    if (a == "--skip-invalid-items") { c.reader.skip_invalid_items = true; continue; }
    if (a == "--list")     { c.list = true; continue; }
    if (a == "--warnings") { c.warnings = true; continue; }
    if (a == "--stats")    { c.stats = true; continue; }
    if (a == "--pretty")   { c.pretty = true; continue; }
    if (a == "--quiet")    { c.quiet = true; continue; }
    if (a == "--verbose")  { c.reader.log_level = kr::LogLevel::Debug; continue; }
    if (a == "-h" || a == "--help") { usage(std::cout); std::exit(0); }
    if (a.rfind("--", 0) == 0) { std::cerr << "[report] unknown option: " << a << "\n"; return false; }
    if (!c.file.empty()) { std::cerr << "[report] more than one input file\n"; return false; }
    c.file = a;
  }
  if (c.file.empty()) { std::cerr << "[report] missing input file\n"; return false; }
  if (!c.extras.empty() && c.section.empty()) {
    std::cerr << "[report] --extra needs --section\n";
    return false;
  }
  if (c.quiet) c.reader.log_level = kr::LogLevel::Error;
  if (c.details.empty() && c.extras.empty() && !c.warnings && !c.stats) c.list = true;
  return true;
}

void print_object(const char* label, const kr::JsonValue::Object& obj, const char* indent) {
  if (obj.empty()) return;
  std::cout << indent << label << ":\n";
  for (const auto& m : obj) {
    std::cout << indent << "  " << m.first << " = " << kr::to_json(m.second) << "\n";
  }
}

void list_report(const kr::Report& r) {
  print_object("document", r.document_attributes(), "");
  for (const auto& s : r.sections()) {
    std::cout << "section \"" << s.name << "\" (" << kr::section_kind_name(s.kind) << ", "
              << s.items.size() << " items";
    if (!s.items_key.empty()) std::cout << " in \"" << s.items_key << "\"";
    std::cout << ")\n";
    print_object("summary", s.summary, "  ");
    for (const auto& item : s.items) {
      std::cout << "  " << item.rank << (item.has_detail ? " [detail]" : "");
      for (const auto& m : item.attributes) {
        if (m.first == item.rank || !m.second.is_scalar()) continue;
        if (m.second.is_string() && m.second.as_string() == item.rank) continue;
        std::cout << " " << m.first << "=" << kr::to_json(m.second);
      }
      std::cout << "\n";
    }
    for (const auto& e : s.extras) std::cout << "  extra \"" << e << "\"\n";
  }
}

void print_stats(const kr::ReaderStats& st) {
  std::cout << "index_bytes=" << st.index_bytes
            << " tokens=" << st.index_tokens
            << " sections=" << st.sections
            << " items=" << st.items
            << " detail_entries=" << st.detail_entries
            << " details_resolved=" << st.details_resolved
            << " detail_bytes=" << st.detail_bytes
            << " cache_hits=" << st.cache_hits << "\n";
  for (const auto& t : st.stages) std::cout << "stage " << t.name << " " << t.duration_ms << " ms\n";
}

}

int main(int argc, char** argv) {
  Cli cli;
  try {
    if (!parse_cli(argc, argv, cli)) { usage(std::cerr); return 1; }
  } catch (const std::exception& e) {
    std::cerr << "[report] bad option value: " << e.what() << "\n";
    return 1;
  }

  if (kr::detect_format(cli.file) == kr::ReportFormat::Unknown && !cli.quiet) {
    std::cerr << "[report] warn: unexpected extension, reading " << cli.file << " as JSON\n";
  }

  std::unique_ptr<kr::Report> report;
  try {
    report = kr::Report::open(cli.file, cli.reader);
  } catch (const kr::ReportError& e) {
    std::cerr << "[report] error: " << e.what() << "\n";
    return 2;
  }

  if (cli.list) list_report(*report);
  if (cli.warnings) {
    for (const auto& w : report->warnings()) std::cout << "warning: " << w.message() << "\n";
  }

  int rc = 0;
  for (const auto& rank : cli.details) {
    try {
      const kr::JsonValue& v = cli.section.empty() ? report->get_detail(rank)
                                                   : report->get_detail(cli.section, rank);
      std::cout << kr::to_json(v, cli.pretty) << "\n";
    } catch (const kr::NoDetailError& e) {
      std::cerr << "[report] " << e.what() << "\n";
      rc = 3;
    } catch (const kr::ReportError& e) {
      std::cerr << "[report] error: " << e.what() << "\n";
      return 2;
    }
  }
  for (const auto& key : cli.extras) {
    try {
      std::cout << kr::to_json(report->get_extra(cli.section, key), cli.pretty) << "\n";
    } catch (const kr::NoDetailError& e) {
      std::cerr << "[report] " << e.what() << "\n";
      rc = 3;
    } catch (const kr::ReportError& e) {
      std::cerr << "[report] error: " << e.what() << "\n";
      return 2;
    }
  }

  if (cli.stats) print_stats(report->stats());
  report->close();
  return rc;
}
