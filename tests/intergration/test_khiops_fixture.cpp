#include "khiops_report/errors.hpp"
#include "khiops_report/report.hpp"
#include "khiops_report/report_format.hpp"
#include "test_util.hpp"

#include <atomic>
#include <iostream>
#include <map>
#include <string>
#include <thread>
#include <utility>
#include <vector>

static const char* kFixture = "tests/data/khiops_like.khj";

static kr::ReaderConfig config(kr_test::CapturedLog& log) {
  kr::ReaderConfig cfg;
  cfg.log = log.sink();
  cfg.chunk_bytes = 256;
  cfg.detail_chunk_bytes = 64;
  return cfg;
}

static void test_structure() {
  kr_test::CapturedLog log;
  auto report = kr::Report::open(std::string(kFixture), config(log));
  kr_test::check(report->source_name() == kFixture, "report->source_name() == kFixture");
  kr_test::check(kr::detect_format(kFixture) == kr::ReportFormat::KhiopsJson, "kr::detect_format(kFixture) == kr::ReportFormat::KhiopsJson");

  const auto& doc = report->document_attributes();
  kr_test::check(doc.size() == 3, "doc.size() == 3");
  kr_test::check(kr::find_member(doc, "tool")->as_string() == "Khiops", "kr::find_member(doc, 'tool')->as_string() == 'Khiops'");
  kr_test::check(kr::find_member(doc, "version")->as_string() == "10.1.1", "kr::find_member(doc, 'version')->as_string() == '10.1.1'");

  const auto& sections = report->sections();
  kr_test::check(sections.size() == 3, "sections.size() == 3");
  if (sections.size() != 3) return;
  kr_test::check(sections[0].name == "modelingReport" && sections[0].kind == kr::SectionKind::Modeling, "sections[0].name == 'modelingReport' && sections[0].kind == kr::SectionKind::Modeling");
  kr_test::check(sections[1].name == "trainEvaluationReport" && sections[1].kind == kr::SectionKind::Evaluation, "sections[1].name == 'trainEvaluationReport' && sections[1].kind == kr::SectionKind::Evaluation");
  kr_test::check(sections[2].name == "preparationReport" && sections[2].kind == kr::SectionKind::Preparation, "sections[2].name == 'preparationReport' && sections[2].kind == kr::SectionKind::Preparation");

  kr_test::check(sections[0].items_key == "trainedPredictors", "sections[0].items_key == 'trainedPredictors'");
  kr_test::check(sections[0].items.size() == 1 && sections[0].items[0].rank == "R1", "sections[0].items.size() == 1 && sections[0].items[0].rank == 'R1'");
  kr_test::check(sections[0].items[0].find("family")->as_string() == "Selective Naive Bayes", "sections[0].items[0].find('family')->as_string() == 'Selective Naive Bayes'");
  kr_test::check(kr::find_member(sections[0].attributes, "reportType")->as_string() == "Modeling", "kr::find_member(sections[0].attributes, 'reportType')->as_string() == 'Modeling'");

  kr_test::check(sections[1].items_key == "predictorsPerformance", "sections[1].items_key == 'predictorsPerformance'");
  kr_test::check(sections[1].items[0].find("auc")->as_double() == 0.92518, "sections[1].items[0].find('auc')->as_double() == 0.92518");
  kr_test::check(sections[1].extras.size() == 1 && sections[1].extras[0] == "liftCurves", "sections[1].extras.size() == 1 && sections[1].extras[0] == 'liftCurves'");
  kr_test::check(kr::find_member(sections[1].summary, "instances")->as_int() == 34174, "kr::find_member(sections[1].summary, 'instances')->as_int() == 34174");

  const kr::ReportSection& prep = sections[2];
  kr_test::check(prep.items.size() == 3, "prep.items.size() == 3");
  kr_test::check(prep.find_item("R02") != nullptr, "prep.find_item('R02') != nullptr");
  kr_test::check(prep.find_item("R02")->has_detail, "prep.find_item('R02')->has_detail");
  kr_test::check(!prep.find_item("R03")->has_detail, "!prep.find_item('R03')->has_detail");
  const kr::JsonValue* vars = kr::find_member(prep.summary, "variables");
  kr_test::check(vars && vars->is_object(), "vars && vars->is_object()");
  kr_test::check(vars->find("numbers")->as_array()[1].as_int() == 6, "vars->find('numbers')->as_array()[1].as_int() == 6");

  kr_test::check(report->index().size() == 5, "report->index().size() == 5");
  kr_test::check(report->index().find("preparationReport", "R09") != nullptr, "report->index().find('preparationReport', 'R09') != nullptr");
  kr_test::check(report->index().find("", "R1") == nullptr, "report->index().find('', 'R1') == nullptr");

  int missing = 0, dangling = 0;
  for (const auto& w : report->warnings()) {
    if (w.kind == kr::ReportWarning::Kind::MissingDetail) {
      ++missing;
      kr_test::check(w.rank == "R03" && w.scope == "preparationReport", "w.rank == 'R03' && w.scope == 'preparationReport'");
    }
    if (w.kind == kr::ReportWarning::Kind::DanglingDetail) {
      ++dangling;
      kr_test::check(w.rank == "R09", "w.rank == 'R09'");
    }
  }
  kr_test::check(missing == 1 && dangling == 1, "missing == 1 && dangling == 1");
  kr_test::check(report->warnings().size() == 2, "report->warnings().size() == 2");
  // One summary line at the default level, per-warning lines at info.
  kr_test::check(log.lines.size() == 1, "one warn line");
  kr_test::check(!log.lines.empty() &&
                 log.lines[0].find("warn: ") == 0 &&
                 log.lines[0].find("2 warnings (1 missing details, 1 dangling details, 0 skipped items)") != std::string::npos,
                 "warning summary line");

  kr_test::CapturedLog verbose;
  kr::ReaderConfig cfg = config(verbose);
  cfg.log_level = kr::LogLevel::Info;
  kr::Report::open(std::string(kFixture), cfg);
  int info_warnings = 0, warn_lines = 0;
  for (const auto& line : verbose.lines) {
    if (line.find("warn: ") == 0) ++warn_lines;
    if (line.find("info: ") == 0 && (line.find("R03") != std::string::npos || line.find("R09") != std::string::npos)) {
      ++info_warnings;
    }
  }
  kr_test::check(warn_lines == 1, "single warn line at info level");
  kr_test::check(info_warnings == 2, "each warning logged at info");
}

static void test_details() {
  kr_test::CapturedLog log;
  auto report = kr::Report::open(std::string(kFixture), config(log));

  // Unscoped lookup takes the first section holding the rank.
  const kr::JsonValue& r1 = report->get_detail("R1");
  kr_test::check(r1.find("selectedVariables") != nullptr, "r1.find('selectedVariables') != nullptr");
  kr_test::check(r1.find("selectedVariables")->size() == 2, "r1.find('selectedVariables')->size() == 2");

  const kr::JsonValue& perf = report->get_detail("trainEvaluationReport", "R1");
  const kr::JsonValue* matrix = perf.find("confusionMatrix")->find("matrix");
  kr_test::check(matrix->as_array()[1].as_array()[1].as_int() == 5392, "matrix->as_array()[1].as_array()[1].as_int() == 5392");

  const kr::JsonValue& r01 = report->get_detail("R01");
  const kr::JsonValue* grid = r01.find("dataGrid");
  kr_test::check(grid->find("isSupervised")->as_bool(), "grid->find('isSupervised')->as_bool()");
  kr_test::check(grid->find("note")->as_string() == "caf\xC3\xA9 \xF0\x9F\x98\x83 tab\tend", "grid->find('note')->as_string() == 'caf\\xC3\\xA9 \\xF0\\x9F\\x98\\x83 tab\\tend'");
  kr_test::check(grid->find("dimensions")->as_array()[0].find("partition")->size() == 3, "grid->find('dimensions')->as_array()[0].find('partition')->size() == 3");

  kr_test::check(report->get_detail("preparationReport", "R02").find("dataGrid")->find("scale")->as_double() == -1.5e-3, "report->get_detail('preparationReport', 'R02').find('dataGrid')->find('scale')->as_double() == -1.5e-3");
  kr_test::check(report->get_detail("R09").find("orphan")->as_bool(), "report->get_detail('R09').find('orphan')->as_bool()");
  kr_test::expect_throw<kr::NoDetailError>([&]{ report->get_detail("R03"); }, "report->get_detail('R03')");
  kr_test::expect_throw<kr::NoDetailError>([&]{ report->get_detail("modelingReport", "R01"); }, "report->get_detail('modelingReport', 'R01')");

  const kr::JsonValue& lift = report->get_extra("trainEvaluationReport", "liftCurves");
  kr_test::check(lift.is_array() && lift.size() == 1, "lift.is_array() && lift.size() == 1");
  kr_test::check(lift.as_array()[0].find("targetValue")->as_string() == "less", "lift.as_array()[0].find('targetValue')->as_string() == 'less'");

  const auto st = report->stats();
  kr_test::check(st.details_resolved == 6, "st.details_resolved == 6");
  kr_test::check(st.sections == 3, "st.sections == 3");
  kr_test::check(st.items == 5, "st.items == 5");
}

static void test_concurrent_resolution() {
  kr_test::CapturedLog log;
  const std::vector<std::pair<std::string, std::string>> keys = {
    {"modelingReport", "R1"}, {"trainEvaluationReport", "R1"},
    {"preparationReport", "R01"}, {"preparationReport", "R02"}, {"preparationReport", "R09"},
  };

  auto sequential = kr::Report::open(std::string(kFixture), config(log));
  std::map<std::pair<std::string, std::string>, kr::JsonValue> expected;
  for (const auto& k : keys) expected[k] = sequential->get_detail(k.first, k.second);

  auto shared = kr::Report::open(std::string(kFixture), config(log));
  std::atomic<int> mismatches{0};
  std::atomic<int> errors{0};
  std::vector<std::thread> workers;
  for (int t = 0; t < 8; ++t) {
    workers.emplace_back([&, t] {
      for (std::size_t i = 0; i < keys.size() * 4; ++i) {
        const auto& k = keys[(i + static_cast<std::size_t>(t)) % keys.size()];
        try {
          if (!(shared->get_detail(k.first, k.second) == expected.at(k))) ++mismatches;
        } catch (const kr::ReportError& e) {
          std::cerr << "worker " << t << ": " << e.what() << "\n";
          ++errors;
        }
      }
    });
  }
  for (auto& w : workers) w.join();
  kr_test::check(mismatches.load() == 0, "mismatches.load() == 0");
  kr_test::check(errors.load() == 0, "errors.load() == 0");

  // Every key ends up cached exactly once, at a stable address.
  for (const auto& k : keys) {
    kr_test::check(&shared->get_detail(k.first, k.second) == &shared->get_detail(k.first, k.second), "&shared->get_detail(k.first, k.second) == &shared->get_detail(k.first, k.second)");
  }
  const auto st = shared->stats();
  kr_test::check(st.details_resolved >= keys.size(), "st.details_resolved >= keys.size()");
  kr_test::check(st.resolve_failures == 0, "st.resolve_failures == 0");
}

static void test_missing_file() {
  kr_test::CapturedLog log;
  kr_test::expect_throw<kr::MalformedInputError>([&]{ kr::Report::open(std::string("tests/data/no_such_report.khj"), config(log)); }, "kr::Report::open(std::string('tests/data/no_such_report.khj'), config(log))");
}

int main(){
  test_structure();
  test_details();
  test_concurrent_resolution();
  test_missing_file();
  return kr_test::finish("khiops_fixture");
}
