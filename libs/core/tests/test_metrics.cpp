#include "aegis/core/metrics.h"

#include <kj/test.h>

using namespace aegis::core;

namespace {

KJ_TEST("Metrics: series names with labels") {
  Label labels[] = {{"service"_kj, "pricing"_kj}, {"status"_kj, "200"_kj}};
  KJ_EXPECT(series_name("aegis_requests_total"_kj, labels) ==
            "aegis_requests_total{service=\"pricing\",status=\"200\"}");
  KJ_EXPECT(series_name("aegis_ws_connections"_kj, nullptr) == "aegis_ws_connections");

  Label quoted[] = {{"key"_kj, "a\"b"_kj}};
  KJ_EXPECT(series_name("f"_kj, quoted) == "f{key=\"a\\\"b\"}");
}

KJ_TEST("Metrics: family_of strips labels") {
  KJ_EXPECT(family_of("aegis_breaker_state{key=\"x\"}"_kj) == "aegis_breaker_state");
  KJ_EXPECT(family_of("aegis_ws_connections"_kj) == "aegis_ws_connections");
}

KJ_TEST("Metrics: labelled series are created once") {
  MetricsRegistry registry;
  Label scope[] = {{"scope"_kj, "global"_kj}};

  auto& first = registry.counter_series("rejections"_kj, scope);
  first.increment();
  auto& second = registry.counter_series("rejections"_kj, scope);
  second.increment(2);

  KJ_EXPECT(&first == &second);
  KJ_EXPECT(registry.counter_value("rejections{scope=\"global\"}"_kj) == kj::Maybe<int64_t>(3));
  KJ_EXPECT(registry.counter_value("rejections"_kj) == kj::none);
}

KJ_TEST("Metrics: gauges set and move") {
  MetricsRegistry registry;
  auto& gauge = registry.gauge_series("connections"_kj);
  gauge.set(5);
  gauge.increment();
  gauge.decrement(2);
  KJ_EXPECT(registry.gauge_value("connections"_kj) == kj::Maybe<int64_t>(4));
}

KJ_TEST("Metrics: histogram buckets are cumulative") {
  Histogram histogram("latency"_kj, ""_kj, kj::heapArray<double>({0.1, 1.0}));
  histogram.observe(0.05);
  histogram.observe(0.5);
  histogram.observe(5.0);

  KJ_EXPECT(histogram.count() == 3);
  KJ_EXPECT(histogram.bucket_count(0) == 1);
  KJ_EXPECT(histogram.bucket_count(1) == 2);
  KJ_EXPECT(histogram.sum() > 5.5);
}

KJ_TEST("Metrics: Prometheus export groups series per family") {
  MetricsRegistry registry;
  registry.describe("aegis_breaker_state"_kj, "Breaker state"_kj);
  Label a[] = {{"key"_kj, "a"_kj}};
  Label b[] = {{"key"_kj, "b"_kj}};
  registry.gauge_series("aegis_breaker_state"_kj, a).set(1);
  registry.gauge_series("aegis_breaker_state"_kj, b).set(0);
  registry.counter_series("aegis_breaker_transitions_total"_kj, a).increment();

  auto text = registry.to_prometheus();

  KJ_EXPECT(text.contains("# HELP aegis_breaker_state Breaker state\n"));
  KJ_EXPECT(text.contains("# TYPE aegis_breaker_state gauge\n"));
  KJ_EXPECT(text.contains("aegis_breaker_state{key=\"a\"} 1\n"));
  KJ_EXPECT(text.contains("aegis_breaker_state{key=\"b\"} 0\n"));
  KJ_EXPECT(text.contains("# TYPE aegis_breaker_transitions_total counter\n"));

  // One TYPE line per family, even with several series.
  size_t type_lines = 0;
  kj::StringPtr rest = text;
  while (true) {
    KJ_IF_SOME(pos, rest.find("# TYPE aegis_breaker_state "_kj)) {
      ++type_lines;
      rest = rest.slice(pos + 1);
    }
    else {
      break;
    }
  }
  KJ_EXPECT(type_lines == 1);
}

} // namespace
