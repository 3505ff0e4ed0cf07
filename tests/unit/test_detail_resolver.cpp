#include "khiops_report/byte_source.hpp"
#include "khiops_report/detail_resolver.hpp"
#include "khiops_report/errors.hpp"
#include "khiops_report/json_value.hpp"
#include "khiops_report/metrics.hpp"
#include "test_util.hpp"

#include <iostream>
#include <memory>
#include <string>

static kr::DetailSpan span_of(const std::string& doc, const std::string& needle) {
  auto at = doc.find(needle);
  return kr::DetailSpan{at, needle.size()};
}

int main(){
  const std::string doc =
    "{\"D\": {\"R1\": {\"m\": [[1, 2], [3, 4]], \"s\": \"\\u00e9\"}, \"R2\": [0.5, null, false],"
    " \"R3\": {\"broken\": [1, }, \"R4\": 42}}";
  auto src = std::make_shared<kr_test::CountingSource>(doc);
  kr::ReaderMetrics metrics;
  kr::ResolverConfig cfg;
  cfg.chunk_bytes = 4;
  kr_test::CapturedLog log;
  cfg.log = log.sink();
  cfg.log_level = kr::LogLevel::Debug;
  kr::DetailResolver res(src, cfg, metrics);

  // Parse of a span, then a cache hit with no source access.
  {
    const kr::DetailKey key{"", "R1"};
    const kr::DetailSpan sp = span_of(doc, "{\"m\": [[1, 2], [3, 4]], \"s\": \"\\u00e9\"}");
    const kr::JsonValue& v = res.resolve(key, sp);
    kr_test::check(v == kr::parse_json("{\"m\": [[1, 2], [3, 4]], \"s\": \"\\u00e9\"}"), "v == kr::parse_json('{'m': [[1, 2], [3, 4]], 's': '\\\\u00e9'}')");
    kr_test::check(v.find("s")->as_string() == "\xC3\xA9", "v.find('s')->as_string() == '\\xC3\\xA9'");
    kr_test::check(res.cached(key), "res.cached(key)");

    const auto reads = src->reads.load();
    const auto cursors = src->cursors.load();
    const kr::JsonValue& again = res.resolve(key, sp);
    kr_test::check(&again == &v, "&again == &v");
    kr_test::check(src->reads.load() == reads, "src->reads.load() == reads");
    kr_test::check(src->cursors.load() == cursors, "src->cursors.load() == cursors");
    kr_test::check(metrics.snapshot().cache_hits == 1, "metrics.snapshot().cache_hits == 1");
    kr_test::check(metrics.snapshot().details_resolved == 1, "metrics.snapshot().details_resolved == 1");
    kr_test::check(metrics.snapshot().detail_bytes == sp.length, "metrics.snapshot().detail_bytes == sp.length");
  }

  // Arrays and scalars are valid detail values.
  {
    const kr::JsonValue& v = res.resolve({"", "R2"}, span_of(doc, "[0.5, null, false]"));
    kr_test::check(v.is_array() && v.size() == 3, "v.is_array() && v.size() == 3");
    kr_test::check(v.as_array()[0].as_double() == 0.5, "v.as_array()[0].as_double() == 0.5");
    kr_test::check(v.as_array()[1].is_null(), "v.as_array()[1].is_null()");
    const kr::JsonValue& n = res.resolve({"", "R4"}, span_of(doc, "42"));
    kr_test::check(n.is_int() && n.as_int() == 42, "n.is_int() && n.as_int() == 42");
  }

  // A malformed span reports the source offset of the failure and caches nothing.
  {
    const kr::DetailKey key{"", "R3"};
    const kr::DetailSpan sp = span_of(doc, "{\"broken\": [1, }");
    bool thrown = false;
    try { res.resolve(key, sp); } catch (const kr::MalformedInputError& e) {
      thrown = true;
      kr_test::check(e.offset() == sp.offset + 15, "e.offset() == sp.offset + 15");
    }
    kr_test::check(thrown, "thrown");
    kr_test::check(!res.cached(key), "!res.cached(key)");
    kr_test::check(metrics.snapshot().resolve_failures == 1, "metrics.snapshot().resolve_failures == 1");
  }

  // Integers past 64 bits fall back to the streaming parse instead of failing.
  {
    const std::string wide =
      "{\"R6\": {\"n\": 123456789012345678901234567890}, \"R7\": [18446744073709551616, -0, 2]}";
    auto wsrc = std::make_shared<kr::MemorySource>(wide);
    kr::ReaderMetrics wmetrics;
    kr::DetailResolver wres(wsrc, cfg, wmetrics);
    const std::size_t before = log.lines.size();

    const kr::JsonValue& n = wres.resolve({"", "R6"}, span_of(wide, "{\"n\": 123456789012345678901234567890}"));
    kr_test::check(n == kr::parse_json("{\"n\": 123456789012345678901234567890}"), "R6 keeps the wide integer");
    const kr::JsonValue& a = wres.resolve({"", "R7"}, span_of(wide, "[18446744073709551616, -0, 2]"));
    kr_test::check(a == kr::parse_json("[18446744073709551616, -0, 2]"), "R7 keeps the wide integer");
    kr_test::check(a.size() == 3 && a.as_array()[1].is_int() && a.as_array()[2].as_int() == 2, "R7 small integers");
    kr_test::check(wmetrics.snapshot().resolve_failures == 0, "no failures for wide integers");
    kr_test::check(wmetrics.snapshot().details_resolved == 2, "wide integers resolved");

    bool fell_back = false;
    for (std::size_t i = before; i < log.lines.size(); ++i) {
      if (log.lines[i].find("simdjson rejected span") != std::string::npos) fell_back = true;
    }
    kr_test::check(fell_back, "fallback is logged");
  }

  // A span past the end of the source.
  kr_test::expect_throw<kr::MalformedInputError>([&]{ res.resolve({"", "R5"}, kr::DetailSpan{doc.size() - 2, 10}); }, "res.resolve({'', 'R5'}, kr::DetailSpan{doc.size() - 2, 10})");

  // Cancellation leaves no cache entry and the resolver usable.
  {
    kr::CancelToken cancel{true};
    const kr::DetailKey key{"", "R2b"};
    const kr::DetailSpan sp = span_of(doc, "[0.5, null, false]");
    kr_test::expect_throw<kr::CancelledError>([&]{ res.resolve(key, sp, &cancel); }, "res.resolve(key, sp, &cancel)");
    kr_test::check(!res.cached(key), "!res.cached(key)");
    cancel = false;
    kr_test::check(res.resolve(key, sp, &cancel).size() == 3, "res.resolve(key, sp, &cancel).size() == 3");
  }

  // After release only cached entries remain reachable.
  {
    const std::size_t cached = res.cache_size();
    res.release();
    kr_test::check(res.resolve({"", "R1"}, span_of(doc, "{\"m\"")).is_object(), "res.resolve({'', 'R1'}, span_of(doc, '{'m'')).is_object()");
    kr_test::expect_throw<kr::ReportClosedError>([&]{ res.resolve({"", "R9"}, kr::DetailSpan{0, 1}); }, "res.resolve({'', 'R9'}, kr::DetailSpan{0, 1})");
    kr_test::check(res.cache_size() == cached, "res.cache_size() == cached");
  }

  kr_test::check(!log.lines.empty(), "!log.lines.empty()");
  return kr_test::finish("detail_resolver");
}
