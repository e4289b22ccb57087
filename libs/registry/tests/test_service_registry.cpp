#include "aegis/core/error.h"
#include "aegis/core/json.h"
#include "aegis/registry/discovery_backend.h"
#include "aegis/registry/service_registry.h"

#include <atomic>
#include <kj/test.h>
#include <kj/thread.h>
#include <kj/vector.h>

namespace aegis::registry {
namespace {

ServiceInstance make_instance(kj::StringPtr service, kj::StringPtr id, uint16_t port,
                              bool healthy = true) {
  ServiceInstance instance;
  instance.service_name = kj::str(service);
  instance.id = kj::str(id);
  instance.address = kj::str("10.0.0.", port % 250);
  instance.port = port;
  instance.healthy = healthy;
  return instance;
}

KJ_TEST("ServiceRegistry: register rejects incomplete instances") {
  ServiceRegistry registry;

  auto no_address = make_instance("pricing"_kj, "p1"_kj, 9001);
  no_address.address = kj::str();
  bool threw = false;
  try {
    registry.register_instance(kj::mv(no_address));
  } catch (const core::InvalidInstanceException& e) {
    threw = true;
    KJ_EXPECT(e.code() == core::ErrorCode::InvalidInstance);
  }
  KJ_EXPECT(threw);

  auto no_port = make_instance("pricing"_kj, "p1"_kj, 9001);
  no_port.port = 0;
  threw = false;
  try {
    registry.register_instance(kj::mv(no_port));
  } catch (const core::InvalidInstanceException&) {
    threw = true;
  }
  KJ_EXPECT(threw);
  KJ_EXPECT(registry.all_instances("pricing"_kj).size() == 0);
}

KJ_TEST("ServiceRegistry: register is an idempotent upsert") {
  ServiceRegistry registry;
  registry.register_instance(make_instance("pricing"_kj, "p1"_kj, 9001));
  registry.register_instance(make_instance("pricing"_kj, "p1"_kj, 9005));

  auto all = registry.all_instances("pricing"_kj);
  KJ_ASSERT(all.size() == 1);
  KJ_EXPECT(all[0].port == 9005);
}

KJ_TEST("ServiceRegistry: list_healthy filters and never fails") {
  ServiceRegistry registry;
  registry.register_instance(make_instance("pricing"_kj, "p1"_kj, 9001));
  registry.register_instance(make_instance("pricing"_kj, "p2"_kj, 9002, false));

  auto healthy = registry.list_healthy("pricing"_kj);
  KJ_ASSERT(healthy.size() == 1);
  KJ_EXPECT(healthy[0].id == "p1");
  KJ_EXPECT(registry.list_healthy("unknown"_kj).size() == 0);
}

KJ_TEST("ServiceRegistry: pick with no healthy instance throws ServiceUnavailable") {
  ServiceRegistry registry;
  registry.register_instance(make_instance("pricing"_kj, "p1"_kj, 9001, false));

  for (auto service : {"pricing"_kj, "missing"_kj}) {
    bool threw = false;
    try {
      auto instance = registry.pick(service);
      (void)instance;
    } catch (const core::ServiceUnavailableException& e) {
      threw = true;
      KJ_EXPECT(e.service_name() == service);
    }
    KJ_EXPECT(threw);
    KJ_EXPECT(registry.try_pick(service) == kj::none);
  }
}

KJ_TEST("ServiceRegistry: pick spreads load across every healthy instance") {
  ServiceRegistry registry;
  registry.register_instance(make_instance("pricing"_kj, "p1"_kj, 9001));
  registry.register_instance(make_instance("pricing"_kj, "p2"_kj, 9002));
  registry.register_instance(make_instance("pricing"_kj, "p3"_kj, 9003));
  registry.register_instance(make_instance("pricing"_kj, "down"_kj, 9004, false));

  size_t counts[3] = {0, 0, 0};
  for (int i = 0; i < 1000; ++i) {
    auto instance = registry.pick("pricing"_kj);
    KJ_ASSERT(instance.id != "down");
    if (instance.id == "p1") {
      ++counts[0];
    } else if (instance.id == "p2") {
      ++counts[1];
    } else {
      ++counts[2];
    }
  }
  for (auto count : counts) {
    KJ_EXPECT(count > 200, count);
  }
}

KJ_TEST("ServiceRegistry: concurrent picks see whole instances while probes rewrite them") {
  ServiceRegistry registry;
  for (uint16_t n = 1; n <= 4; ++n) {
    registry.register_instance(make_instance("pricing"_kj, kj::str("p", n), 9000 + n));
  }

  std::atomic<bool> writing{true};
  std::atomic<size_t> malformed{0};
  std::atomic<size_t> unavailable{0};
  std::atomic<size_t> counts[4] = {0, 0, 0, 0};

  {
    // p4 flaps while p1..p3 are re-registered in place
    kj::Thread writer([&]() {
      for (int64_t round = 0; round < 2000; ++round) {
        registry.record_probe("pricing"_kj, "p4"_kj, round % 2 == 0, round);
        uint16_t n = static_cast<uint16_t>(round % 3 + 1);
        registry.register_instance(make_instance("pricing"_kj, kj::str("p", n), 9000 + n));
      }
      registry.record_probe("pricing"_kj, "p4"_kj, false, 2000);
      writing.store(false);
    });

    kj::Vector<kj::Own<kj::Thread>> readers;
    for (int t = 0; t < 4; ++t) {
      readers.add(kj::heap<kj::Thread>([&]() {
        for (int i = 0; i < 250 || writing.load(); ++i) {
          KJ_IF_SOME(instance, registry.try_pick("pricing"_kj)) {
            bool whole = instance.id.size() == 2 && instance.id[0] == 'p' &&
                         instance.port == 9000 + (instance.id[1] - '0') &&
                         instance.address == kj::str("10.0.0.", instance.port % 250) &&
                         instance.healthy;
            if (!whole) {
              malformed.fetch_add(1);
              continue;
            }
            counts[instance.id[1] - '1'].fetch_add(1);
          } else {
            unavailable.fetch_add(1);
          }
        }
      }));
    }
  }

  KJ_EXPECT(malformed.load() == 0, malformed.load());
  KJ_EXPECT(unavailable.load() == 0, unavailable.load());
  for (int n = 0; n < 3; ++n) {
    KJ_EXPECT(counts[n].load() > 0, n);
  }
  KJ_EXPECT(registry.list_healthy("pricing"_kj).size() == 3);
}

KJ_TEST("ServiceRegistry: deregister is a no-op when absent") {
  ServiceRegistry registry;
  registry.register_instance(make_instance("pricing"_kj, "p1"_kj, 9001));

  registry.deregister("p1"_kj);
  KJ_EXPECT(registry.all_instances("pricing"_kj).size() == 0);
  registry.deregister("p1"_kj);
  KJ_EXPECT(!registry.deregister("pricing"_kj, "p1"_kj));
}

KJ_TEST("ServiceRegistry: snapshots are immutable once published") {
  ServiceRegistry registry;
  registry.register_instance(make_instance("pricing"_kj, "p1"_kj, 9001));
  auto before = registry.snapshot("pricing"_kj);

  registry.register_instance(make_instance("pricing"_kj, "p2"_kj, 9002));
  KJ_EXPECT(before->instances.size() == 1);
  KJ_EXPECT(registry.snapshot("pricing"_kj)->instances.size() == 2);
}

KJ_TEST("ServiceRegistry: probe outcomes drive health transitions") {
  ServiceRegistry registry(RegistryConfig{3});
  registry.register_instance(make_instance("pricing"_kj, "p1"_kj, 9001));

  kj::Vector<kj::String> events;
  registry.set_health_listener([&](const HealthEvent& event) {
    events.add(kj::str(event.instance_id, ":", to_string(event.transition)));
  });

  KJ_EXPECT(registry.record_probe("pricing"_kj, "p1"_kj, true, 10) == HealthTransition::None);
  KJ_EXPECT(registry.record_probe("pricing"_kj, "p1"_kj, false, 20) ==
            HealthTransition::BecameUnhealthy);
  KJ_EXPECT(registry.healthy_count("pricing"_kj) == 0);

  // A failed probe keeps the instance around.
  KJ_EXPECT(registry.all_instances("pricing"_kj).size() == 1);

  KJ_EXPECT(registry.record_probe("pricing"_kj, "p1"_kj, true, 30) ==
            HealthTransition::BecameHealthy);
  KJ_IF_SOME(instance, registry.find("pricing"_kj, "p1"_kj)) {
    KJ_EXPECT(instance.last_health_check_ms == 30);
    KJ_EXPECT(instance.missed_checks == 0);
  }
  else {
    KJ_FAIL_EXPECT("instance vanished");
  }

  KJ_ASSERT(events.size() == 2);
  KJ_EXPECT(events[0] == "p1:unhealthy");
  KJ_EXPECT(events[1] == "p1:healthy");
}

KJ_TEST("ServiceRegistry: instance removed after max missed checks") {
  ServiceRegistry registry(RegistryConfig{3});
  registry.register_instance(make_instance("pricing"_kj, "p1"_kj, 9001));

  registry.record_probe("pricing"_kj, "p1"_kj, false, 1);
  registry.record_probe("pricing"_kj, "p1"_kj, false, 2);
  KJ_EXPECT(registry.all_instances("pricing"_kj).size() == 1);
  KJ_EXPECT(registry.record_probe("pricing"_kj, "p1"_kj, false, 3) == HealthTransition::Removed);
  KJ_EXPECT(registry.all_instances("pricing"_kj).size() == 0);
}

KJ_TEST("ServiceRegistry: reconcile keeps health and drops unreported instances") {
  ServiceRegistry registry;
  registry.register_instance(make_instance("pricing"_kj, "p1"_kj, 9001));
  registry.register_instance(make_instance("pricing"_kj, "p2"_kj, 9002));
  registry.register_instance(make_instance("search"_kj, "s1"_kj, 9101));
  registry.record_probe("pricing"_kj, "p1"_kj, false, 5);

  size_t removed = 0;
  registry.set_health_listener([&](const HealthEvent& event) {
    if (event.transition == HealthTransition::Removed) {
      ++removed;
    }
  });

  ServiceMap reported;
  kj::Vector<ServiceInstance> pricing;
  pricing.add(make_instance("pricing"_kj, "p1"_kj, 9001));
  pricing.add(make_instance("pricing"_kj, "p3"_kj, 9003));
  reported.insert(kj::str("pricing"), kj::mv(pricing));

  registry.reconcile(reported);

  auto all = registry.all_instances("pricing"_kj);
  KJ_ASSERT(all.size() == 2);
  KJ_IF_SOME(p1, registry.find("pricing"_kj, "p1"_kj)) {
    KJ_EXPECT(!p1.healthy);
  }
  else {
    KJ_FAIL_EXPECT("p1 missing after reconcile");
  }
  KJ_EXPECT(registry.find("pricing"_kj, "p2"_kj) == kj::none);
  KJ_EXPECT(registry.find("pricing"_kj, "p3"_kj) != kj::none);
  KJ_EXPECT(registry.all_instances("search"_kj).size() == 0);
  KJ_EXPECT(removed == 2);
}

KJ_TEST("StaticDiscoveryBackend: loads the service catalog") {
  auto doc = core::JsonDocument::parse(R"({
    "services": [{
      "name": "pricing",
      "health_path": "/status",
      "instances": [
        {"id": "p1", "address": "127.0.0.1", "port": 9001, "tags": ["v2", "v2"],
         "metadata": {"zone": "a"}},
        {"id": "p2", "address": "127.0.0.1", "port": 9002}
      ]
    }]
  })"_kj);

  auto backend = StaticDiscoveryBackend::from_catalog(doc.root());
  KJ_EXPECT(backend->instance_count() == 2);

  auto services = backend->list_all_services();
  KJ_IF_SOME(pricing, services.find("pricing"_kj)) {
    KJ_ASSERT(pricing.size() == 2);
    KJ_EXPECT(pricing[0].health_path == "/status");
    KJ_EXPECT(pricing[0].tags.size() == 1);
    KJ_EXPECT(pricing[0].metadata.find("zone"_kj) != kj::none);
  }
  else {
    KJ_FAIL_EXPECT("pricing not loaded");
  }

  backend->deregister_instance("pricing"_kj, "p1"_kj);
  KJ_EXPECT(backend->instance_count() == 1);
}

KJ_TEST("StaticDiscoveryBackend: rejects instances without a port") {
  auto doc = core::JsonDocument::parse(
      R"({"services":[{"name":"pricing","instances":[{"id":"p1","address":"h"}]}]})"_kj);
  bool threw = false;
  try {
    auto backend = StaticDiscoveryBackend::from_catalog(doc.root());
    (void)backend;
  } catch (const core::ValidationException&) {
    threw = true;
  }
  KJ_EXPECT(threw);
}

} // namespace
} // namespace aegis::registry
