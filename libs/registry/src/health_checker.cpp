#include "aegis/registry/health_checker.h"

#include <kj/debug.h>
#include <kj/vector.h>

namespace aegis::registry {

kj::Promise<bool> HttpHealthProbe::probe(const ServiceInstance& instance) {
  auto address = co_await network_.parseAddress(instance.address, instance.port);

  auto client = kj::newHttpClient(timer_, header_table_, *address, kj::HttpClientSettings());

  kj::HttpHeaders headers(header_table_);
  auto host = instance.authority();
  headers.set(kj::HttpHeaderId::HOST, host);

  auto request = client->request(kj::HttpMethod::GET, instance.health_path, headers);
  auto response = co_await kj::mv(request.response);
  // Drain so the connection closes cleanly
  co_await response.body->readAllBytes();
  co_return response.statusCode >= 200 && response.statusCode < 300;
}

HealthChecker::HealthChecker(ServiceRegistry& registry, HealthProbe& probe, kj::Timer& timer,
                             HealthCheckerConfig config, kj::Maybe<DiscoveryBackend&> backend,
                             core::MillisClock clock)
    : registry_(registry), probe_(probe), timer_(timer), config_(config), backend_(backend),
      clock_(kj::mv(clock)) {}

kj::Promise<void> HealthChecker::run() {
  KJ_LOG(INFO, "Health checker started", config_.interval_ms, config_.timeout_ms,
         config_.reconcile_interval_ms);
  return probe_loop().exclusiveJoin(reconcile_loop());
}

kj::Promise<void> HealthChecker::probe_loop() {
  while (true) {
    co_await check_all();
    co_await timer_.afterDelay(static_cast<int64_t>(config_.interval_ms) * kj::MILLISECONDS);
  }
}

kj::Promise<void> HealthChecker::reconcile_loop() {
  if (backend_ == kj::none) {
    co_await kj::Promise<void>(kj::NEVER_DONE);
  }
  while (true) {
    co_await timer_.afterDelay(static_cast<int64_t>(config_.reconcile_interval_ms) *
                               kj::MILLISECONDS);
    reconcile_now();
  }
}

kj::Promise<void> HealthChecker::check_all() {
  kj::Vector<kj::Promise<void>> probes;
  for (auto& name : registry_.service_names()) {
    for (auto& instance : registry_.all_instances(name)) {
      probes.add(probe_one(kj::mv(instance)));
    }
  }
  co_await kj::joinPromises(probes.releaseAsArray());
  rounds_.fetch_add(1, std::memory_order_relaxed);
}

kj::Promise<void> HealthChecker::probe_one(ServiceInstance instance) {
  bool ok = co_await timer_
                .timeoutAfter(static_cast<int64_t>(config_.timeout_ms) * kj::MILLISECONDS,
                              probe_.probe(instance))
                .catch_([&instance](kj::Exception&& e) -> bool {
                  KJ_LOG(DBG, "Health probe failed", instance.service_name, instance.id,
                         e.getDescription());
                  return false;
                });
  registry_.record_probe(instance.service_name, instance.id, ok, clock_());
}

void HealthChecker::reconcile_now() {
  KJ_IF_SOME(backend, backend_) {
    KJ_IF_SOME(exception, kj::runCatchingExceptions([&]() {
                 registry_.reconcile(backend.list_all_services());
               })) {
      KJ_LOG(WARNING, "Discovery reconciliation failed", exception.getDescription());
    }
  }
}

} // namespace aegis::registry
