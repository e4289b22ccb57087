#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>
#include <kj/array.h>
#include <kj/common.h>
#include <kj/map.h>
#include <kj/memory.h>
#include <kj/mutex.h>
#include <kj/string.h>
#include <kj/vector.h>

namespace aegis::core {

enum class MetricType { Counter, Gauge, Histogram };

/**
 * @brief One label of a metric series, e.g. {"scope", "global"}
 */
struct Label {
  kj::StringPtr name;
  kj::StringPtr value;
};

/**
 * @brief Build the series identifier `family{a="x",b="y"}`
 *
 * Labels keep the order given; values are escaped per the Prometheus text format.
 * With no labels the identifier is just the family name.
 */
[[nodiscard]] kj::String series_name(kj::StringPtr family, kj::ArrayPtr<const Label> labels);

/**
 * @brief Family part of a series identifier (everything before '{')
 */
[[nodiscard]] kj::String family_of(kj::StringPtr series);

class Metric {
public:
  explicit Metric(kj::StringPtr name, kj::StringPtr description)
      : name_(kj::heapString(name)), description_(kj::heapString(description)) {}
  virtual ~Metric() noexcept = default;

  [[nodiscard]] kj::StringPtr name() const noexcept {
    return name_;
  }
  [[nodiscard]] kj::StringPtr description() const noexcept {
    return description_;
  }
  [[nodiscard]] virtual MetricType type() const noexcept = 0;

private:
  kj::String name_;
  kj::String description_;
};

// Monotonically increasing
class Counter final : public Metric {
public:
  explicit Counter(kj::StringPtr name, kj::StringPtr description) : Metric(name, description) {}

  void increment(int64_t value = 1) noexcept {
    count_.fetch_add(value, std::memory_order_relaxed);
  }

  [[nodiscard]] int64_t value() const noexcept {
    return count_.load(std::memory_order_relaxed);
  }

  [[nodiscard]] MetricType type() const noexcept override {
    return MetricType::Counter;
  }

private:
  std::atomic<int64_t> count_{0};
};

class Gauge final : public Metric {
public:
  explicit Gauge(kj::StringPtr name, kj::StringPtr description) : Metric(name, description) {}

  void increment(int64_t value = 1) noexcept {
    value_.fetch_add(value, std::memory_order_relaxed);
  }
  void decrement(int64_t value = 1) noexcept {
    value_.fetch_sub(value, std::memory_order_relaxed);
  }
  void set(int64_t value) noexcept {
    value_.store(value, std::memory_order_relaxed);
  }

  [[nodiscard]] int64_t value() const noexcept {
    return value_.load(std::memory_order_relaxed);
  }

  [[nodiscard]] MetricType type() const noexcept override {
    return MetricType::Gauge;
  }

private:
  std::atomic<int64_t> value_{0};
};

/**
 * @brief Wall-clock stopwatch for latency measurement
 */
class Timer final {
public:
  Timer() : start_time_(std::chrono::steady_clock::now()) {}

  void restart() noexcept {
    start_time_ = std::chrono::steady_clock::now();
  }

  [[nodiscard]] double elapsed_seconds() const noexcept {
    return std::chrono::duration<double>(std::chrono::steady_clock::now() - start_time_).count();
  }

  [[nodiscard]] std::chrono::milliseconds elapsed_ms() const noexcept {
    return std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() -
                                                                 start_time_);
  }

private:
  std::chrono::steady_clock::time_point start_time_;
};

class Histogram final : public Metric {
public:
  explicit Histogram(kj::StringPtr name, kj::StringPtr description,
                     kj::Array<double> buckets = default_buckets());

  void observe(double value) noexcept;

  [[nodiscard]] int64_t count() const noexcept {
    return count_.load(std::memory_order_relaxed);
  }
  [[nodiscard]] double sum() const noexcept {
    return sum_.load(std::memory_order_relaxed);
  }
  [[nodiscard]] kj::ArrayPtr<const double> buckets() const noexcept {
    return buckets_;
  }
  [[nodiscard]] int64_t bucket_count(size_t index) const noexcept {
    return bucket_counts_[index].load(std::memory_order_relaxed);
  }

  [[nodiscard]] MetricType type() const noexcept override {
    return MetricType::Histogram;
  }

  static kj::Array<double> default_buckets();

private:
  kj::Array<double> buckets_;
  kj::Array<std::atomic<int64_t>> bucket_counts_;
  std::atomic<int64_t> count_{0};
  std::atomic<double> sum_{0.0};
};

/**
 * @brief Process-wide metric registry with Prometheus text export
 *
 * Series are created on first use by the *_series accessors so that labelled
 * families (one series per breaker key, per rate-limit scope, ...) need no
 * upfront registration. Returned references stay valid for the registry's
 * lifetime; series are never removed.
 */
class MetricsRegistry final {
public:
  MetricsRegistry() = default;

  Counter& counter_series(kj::StringPtr family, kj::ArrayPtr<const Label> labels = nullptr,
                          kj::StringPtr description = ""_kj);
  Gauge& gauge_series(kj::StringPtr family, kj::ArrayPtr<const Label> labels = nullptr,
                      kj::StringPtr description = ""_kj);
  Histogram& histogram_series(kj::StringPtr family, kj::ArrayPtr<const Label> labels = nullptr,
                              kj::StringPtr description = ""_kj);

  /**
   * @brief Set the HELP text of a family before or after its series exist
   */
  void describe(kj::StringPtr family, kj::StringPtr description);

  [[nodiscard]] kj::Maybe<int64_t> counter_value(kj::StringPtr series) const;
  [[nodiscard]] kj::Maybe<int64_t> gauge_value(kj::StringPtr series) const;

  [[nodiscard]] kj::String to_prometheus() const;

private:
  struct RegistryState {
    kj::TreeMap<kj::String, kj::Own<Counter>> counters;
    kj::TreeMap<kj::String, kj::Own<Gauge>> gauges;
    kj::TreeMap<kj::String, kj::Own<Histogram>> histograms;
    kj::TreeMap<kj::String, kj::String> descriptions;
  };

  kj::MutexGuarded<RegistryState> guarded_;
};

[[nodiscard]] MetricsRegistry& global_metrics();

inline void counter_inc(kj::StringPtr family, kj::ArrayPtr<const Label> labels = nullptr,
                        int64_t value = 1) {
  global_metrics().counter_series(family, labels).increment(value);
}

inline void gauge_set(kj::StringPtr family, kj::ArrayPtr<const Label> labels, int64_t value) {
  global_metrics().gauge_series(family, labels).set(value);
}

inline void gauge_inc(kj::StringPtr family, kj::ArrayPtr<const Label> labels = nullptr,
                      int64_t value = 1) {
  global_metrics().gauge_series(family, labels).increment(value);
}

inline void gauge_dec(kj::StringPtr family, kj::ArrayPtr<const Label> labels = nullptr,
                      int64_t value = 1) {
  global_metrics().gauge_series(family, labels).decrement(value);
}

inline void histogram_observe(kj::StringPtr family, double value) {
  global_metrics().histogram_series(family).observe(value);
}

} // namespace aegis::core
