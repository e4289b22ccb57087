#pragma once

#include "aegis/core/time.h"
#include "aegis/registry/discovery_backend.h"
#include "aegis/registry/service_registry.h"

#include <atomic>
#include <cstdint>
#include <kj/async-io.h>
#include <kj/common.h>
#include <kj/compat/http.h>
#include <kj/memory.h>
#include <kj/timer.h>

namespace aegis::registry {

/**
 * @brief Decides whether one instance is currently healthy
 *
 * Rejections are treated as a failed probe by the caller.
 */
class HealthProbe {
public:
  virtual ~HealthProbe() noexcept(false) = default;

  virtual kj::Promise<bool> probe(const ServiceInstance& instance) = 0;
};

/**
 * @brief GET <health_path> on the instance; any 2xx is healthy
 */
class HttpHealthProbe final : public HealthProbe {
public:
  HttpHealthProbe(kj::Timer& timer, kj::Network& network, const kj::HttpHeaderTable& header_table)
      : timer_(timer), network_(network), header_table_(header_table) {}

  kj::Promise<bool> probe(const ServiceInstance& instance) override;

private:
  kj::Timer& timer_;
  kj::Network& network_;
  const kj::HttpHeaderTable& header_table_;
};

struct HealthCheckerConfig {
  uint64_t interval_ms{30000};
  uint64_t timeout_ms{5000};
  uint64_t reconcile_interval_ms{60000};
};

/**
 * @brief Background probe and reconciliation loops on the KJ event loop
 *
 * Probes every instance immediately on start and then once per interval.
 * Reconciliation against the discovery backend runs on its own slower cadence.
 * Probe failures only change instance health; they never propagate.
 */
class HealthChecker final {
public:
  HealthChecker(ServiceRegistry& registry, HealthProbe& probe, kj::Timer& timer,
                HealthCheckerConfig config = HealthCheckerConfig{},
                kj::Maybe<DiscoveryBackend&> backend = kj::none,
                core::MillisClock clock = core::MillisClock([]() { return core::now_unix_ms(); }));

  // Never resolves unless a loop fails; cancel by dropping the promise
  kj::Promise<void> run();

  // One probe round over every known instance
  kj::Promise<void> check_all();

  // One reconciliation pass; backend errors are logged and swallowed
  void reconcile_now();

  [[nodiscard]] uint64_t rounds_completed() const noexcept {
    return rounds_.load(std::memory_order_relaxed);
  }

private:
  kj::Promise<void> probe_loop();
  kj::Promise<void> reconcile_loop();
  kj::Promise<void> probe_one(ServiceInstance instance);

  ServiceRegistry& registry_;
  HealthProbe& probe_;
  kj::Timer& timer_;
  HealthCheckerConfig config_;
  kj::Maybe<DiscoveryBackend&> backend_;
  core::MillisClock clock_;
  std::atomic<uint64_t> rounds_{0};
};

} // namespace aegis::registry
