#include "aegis/core/metrics.h"

#include <kj/common.h>
#include <kj/memory.h>
#include <kj/mutex.h>
#include <kj/string-tree.h>

namespace aegis::core {

namespace {

kj::String escape_label_value(kj::StringPtr value) {
  kj::Vector<char> out(value.size() + 2);
  for (char c : value) {
    if (c == '\\' || c == '"') {
      out.add('\\');
      out.add(c);
    } else if (c == '\n') {
      out.addAll("\\n"_kj);
    } else {
      out.add(c);
    }
  }
  out.add('\0');
  return kj::String(out.releaseAsArray());
}

template <typename Map> kj::StringPtr describe_or_empty(const Map& descriptions, kj::StringPtr f) {
  KJ_IF_SOME(text, descriptions.find(f)) {
    return text;
  }
  return ""_kj;
}

} // namespace

kj::String series_name(kj::StringPtr family, kj::ArrayPtr<const Label> labels) {
  if (labels.size() == 0) {
    return kj::str(family);
  }
  kj::Vector<kj::String> parts(labels.size());
  for (const auto& label : labels) {
    parts.add(kj::str(label.name, "=\"", escape_label_value(label.value), "\""));
  }
  return kj::str(family, "{", kj::strArray(parts, ","), "}");
}

kj::String family_of(kj::StringPtr series) {
  KJ_IF_SOME(brace, series.findFirst('{')) {
    return kj::str(series.slice(0, brace));
  }
  return kj::str(series);
}

// ============================================================================
// Histogram
// ============================================================================

Histogram::Histogram(kj::StringPtr name, kj::StringPtr description, kj::Array<double> buckets)
    : Metric(name, description), buckets_(kj::mv(buckets)),
      bucket_counts_(kj::heapArray<std::atomic<int64_t>>(buckets_.size())) {
  for (auto& c : bucket_counts_) {
    c.store(0, std::memory_order_relaxed);
  }
}

void Histogram::observe(double value) noexcept {
  count_.fetch_add(1, std::memory_order_relaxed);
  sum_.fetch_add(value, std::memory_order_relaxed);
  for (size_t i = 0; i < buckets_.size(); ++i) {
    if (value <= buckets_[i]) {
      bucket_counts_[i].fetch_add(1, std::memory_order_relaxed);
    }
  }
}

kj::Array<double> Histogram::default_buckets() {
  return kj::heapArray<double>(
      {0.001, 0.0025, 0.005, 0.01, 0.025, 0.05, 0.1, 0.25, 0.5, 1.0, 2.5, 5.0, 10.0, 30.0});
}

// ============================================================================
// MetricsRegistry
// ============================================================================

Counter& MetricsRegistry::counter_series(kj::StringPtr family, kj::ArrayPtr<const Label> labels,
                                         kj::StringPtr description) {
  auto name = series_name(family, labels);
  auto lock = guarded_.lockExclusive();
  if (description.size() > 0 && lock->descriptions.find(family) == kj::none) {
    lock->descriptions.insert(kj::str(family), kj::str(description));
  }
  KJ_IF_SOME(existing, lock->counters.find(name)) {
    return *existing;
  }
  auto metric = kj::heap<Counter>(name, description);
  Counter& ref = *metric;
  lock->counters.insert(kj::mv(name), kj::mv(metric));
  return ref;
}

Gauge& MetricsRegistry::gauge_series(kj::StringPtr family, kj::ArrayPtr<const Label> labels,
                                     kj::StringPtr description) {
  auto name = series_name(family, labels);
  auto lock = guarded_.lockExclusive();
  if (description.size() > 0 && lock->descriptions.find(family) == kj::none) {
    lock->descriptions.insert(kj::str(family), kj::str(description));
  }
  KJ_IF_SOME(existing, lock->gauges.find(name)) {
    return *existing;
  }
  auto metric = kj::heap<Gauge>(name, description);
  Gauge& ref = *metric;
  lock->gauges.insert(kj::mv(name), kj::mv(metric));
  return ref;
}

Histogram& MetricsRegistry::histogram_series(kj::StringPtr family,
                                             kj::ArrayPtr<const Label> labels,
                                             kj::StringPtr description) {
  auto name = series_name(family, labels);
  auto lock = guarded_.lockExclusive();
  if (description.size() > 0 && lock->descriptions.find(family) == kj::none) {
    lock->descriptions.insert(kj::str(family), kj::str(description));
  }
  KJ_IF_SOME(existing, lock->histograms.find(name)) {
    return *existing;
  }
  auto metric = kj::heap<Histogram>(name, description);
  Histogram& ref = *metric;
  lock->histograms.insert(kj::mv(name), kj::mv(metric));
  return ref;
}

void MetricsRegistry::describe(kj::StringPtr family, kj::StringPtr description) {
  auto lock = guarded_.lockExclusive();
  lock->descriptions.upsert(kj::str(family), kj::str(description),
                            [](kj::String& existing, kj::String&& replacement) {
                              existing = kj::mv(replacement);
                            });
}

kj::Maybe<int64_t> MetricsRegistry::counter_value(kj::StringPtr series) const {
  auto lock = guarded_.lockShared();
  KJ_IF_SOME(metric, lock->counters.find(series)) {
    return metric->value();
  }
  return kj::none;
}

kj::Maybe<int64_t> MetricsRegistry::gauge_value(kj::StringPtr series) const {
  auto lock = guarded_.lockShared();
  KJ_IF_SOME(metric, lock->gauges.find(series)) {
    return metric->value();
  }
  return kj::none;
}

kj::String MetricsRegistry::to_prometheus() const {
  auto lock = guarded_.lockShared();

  kj::Vector<kj::StringTree> lines;

  // Group series by family so HELP/TYPE precede a contiguous block.
  auto emit_scalar_families = [&](const auto& series_map, kj::StringPtr type_name) {
    using FamilyMap = kj::TreeMap<kj::String, kj::Vector<kj::StringPtr>>;
    FamilyMap families;
    for (const auto& entry : series_map) {
      auto family = family_of(entry.key);
      auto& members = families.findOrCreate(family, [&]() {
        return FamilyMap::Entry{kj::str(family), kj::Vector<kj::StringPtr>()};
      });
      members.add(entry.key);
    }
    for (const auto& family : families) {
      auto help = describe_or_empty(lock->descriptions, family.key);
      if (help.size() > 0) {
        lines.add(kj::strTree("# HELP "_kj, family.key, " "_kj, help, "\n"_kj));
      }
      lines.add(kj::strTree("# TYPE "_kj, family.key, " "_kj, type_name, "\n"_kj));
      for (auto series : family.value) {
        KJ_IF_SOME(metric, series_map.find(series)) {
          lines.add(kj::strTree(series, " "_kj, metric->value(), "\n"_kj));
        }
      }
    }
  };

  emit_scalar_families(lock->counters, "counter"_kj);
  emit_scalar_families(lock->gauges, "gauge"_kj);

  for (const auto& entry : lock->histograms) {
    const auto& name = entry.key;
    const auto& histogram = entry.value;
    auto help = describe_or_empty(lock->descriptions, name);
    if (help.size() > 0) {
      lines.add(kj::strTree("# HELP "_kj, name, " "_kj, help, "\n"_kj));
    }
    lines.add(kj::strTree("# TYPE "_kj, name, " histogram\n"_kj));
    auto buckets = histogram->buckets();
    for (size_t i = 0; i < buckets.size(); ++i) {
      lines.add(kj::strTree(name, "_bucket{le=\""_kj, buckets[i], "\"} "_kj,
                            histogram->bucket_count(i), "\n"_kj));
    }
    lines.add(kj::strTree(name, "_bucket{le=\"+Inf\"} "_kj, histogram->count(), "\n"_kj));
    lines.add(kj::strTree(name, "_sum "_kj, histogram->sum(), "\n"_kj));
    lines.add(kj::strTree(name, "_count "_kj, histogram->count(), "\n"_kj));
  }

  return kj::StringTree(lines.releaseAsArray(), ""_kj).flatten();
}

// Thread-safe lazily created global registry
struct GlobalMetricsState {
  kj::Maybe<kj::Own<MetricsRegistry>> registry{kj::none};
};
static kj::MutexGuarded<GlobalMetricsState> g_metrics_registry;

MetricsRegistry& global_metrics() {
  auto lock = g_metrics_registry.lockExclusive();
  KJ_IF_SOME(registry, lock->registry) {
    return *registry;
  }
  auto registry = kj::heap<MetricsRegistry>();
  registry->describe("aegis_requests_total"_kj, "Proxied requests by service and status"_kj);
  registry->describe("aegis_request_duration_seconds"_kj,
                     "End-to-end proxied request latency in seconds"_kj);
  registry->describe("aegis_breaker_state"_kj,
                     "Circuit breaker state per key (0 closed, 1 open, 2 half-open)"_kj);
  registry->describe("aegis_breaker_transitions_total"_kj,
                     "Circuit breaker state transitions per key"_kj);
  registry->describe("aegis_ratelimit_rejections_total"_kj, "Rate limit rejections by scope"_kj);
  registry->describe("aegis_proxy_retries_total"_kj, "Proxy retry attempts by service"_kj);
  registry->describe("aegis_registry_healthy_instances"_kj,
                     "Healthy instances per logical service"_kj);
  registry->describe("aegis_ws_connections"_kj, "Open realtime connections"_kj);
  registry->describe("aegis_ws_subscriptions"_kj, "Active channel subscriptions"_kj);
  registry->describe("aegis_ws_dropped_messages_total"_kj,
                     "Realtime messages dropped on full connection queues"_kj);

  MetricsRegistry& ref = *registry;
  lock->registry = kj::mv(registry);
  return ref;
}

} // namespace aegis::core
