#include "aegis/registry/health_checker.h"

#include <kj/async-io.h>
#include <kj/map.h>
#include <kj/test.h>

namespace aegis::registry {
namespace {

// Probe whose answer per instance id is scripted by the test
class ScriptedProbe final : public HealthProbe {
public:
  kj::TreeMap<kj::String, bool> answers;
  kj::TreeMap<kj::String, bool> hang;
  size_t calls{0};

  kj::Promise<bool> probe(const ServiceInstance& instance) override {
    ++calls;
    if (hang.find(instance.id) != kj::none) {
      return kj::Promise<bool>(kj::NEVER_DONE);
    }
    KJ_IF_SOME(answer, answers.find(instance.id)) {
      return answer;
    }
    return KJ_EXCEPTION(DISCONNECTED, "connection refused");
  }
};

ServiceInstance make_instance(kj::StringPtr id, uint16_t port) {
  ServiceInstance instance;
  instance.service_name = kj::str("pricing");
  instance.id = kj::str(id);
  instance.address = kj::str("127.0.0.1");
  instance.port = port;
  return instance;
}

KJ_TEST("HealthChecker: one round applies every probe outcome") {
  auto io = kj::setupAsyncIo();
  ServiceRegistry registry;
  registry.register_instance(make_instance("ok"_kj, 9001));
  registry.register_instance(make_instance("bad"_kj, 9002));
  registry.register_instance(make_instance("refused"_kj, 9003));

  ScriptedProbe probe;
  probe.answers.insert(kj::str("ok"), true);
  probe.answers.insert(kj::str("bad"), false);

  HealthChecker checker(registry, probe, io.provider->getTimer(), HealthCheckerConfig{},
                        kj::none, []() -> int64_t { return 42; });
  checker.check_all().wait(io.waitScope);

  KJ_EXPECT(probe.calls == 3);
  KJ_EXPECT(checker.rounds_completed() == 1);
  KJ_EXPECT(registry.healthy_count("pricing"_kj) == 1);
  KJ_IF_SOME(ok, registry.find("pricing"_kj, "ok"_kj)) {
    KJ_EXPECT(ok.healthy);
    KJ_EXPECT(ok.last_health_check_ms == 42);
  }
  else {
    KJ_FAIL_EXPECT("instance missing");
  }
  // Probe errors only mark unhealthy; nothing is removed.
  KJ_EXPECT(registry.all_instances("pricing"_kj).size() == 3);
}

KJ_TEST("HealthChecker: probe timeout counts as failure") {
  auto io = kj::setupAsyncIo();
  ServiceRegistry registry;
  registry.register_instance(make_instance("slow"_kj, 9001));

  ScriptedProbe probe;
  probe.hang.insert(kj::str("slow"), true);

  HealthCheckerConfig config;
  config.timeout_ms = 20;
  HealthChecker checker(registry, probe, io.provider->getTimer(), config);
  checker.check_all().wait(io.waitScope);

  KJ_EXPECT(registry.healthy_count("pricing"_kj) == 0);
}

KJ_TEST("HealthChecker: reconcile_now pulls from the discovery backend") {
  auto io = kj::setupAsyncIo();
  ServiceRegistry registry;
  registry.register_instance(make_instance("stale"_kj, 9009));

  StaticDiscoveryBackend backend;
  backend.register_instance(make_instance("fresh"_kj, 9001));

  ScriptedProbe probe;
  HealthChecker checker(registry, probe, io.provider->getTimer(), HealthCheckerConfig{},
                        backend);
  checker.reconcile_now();

  KJ_EXPECT(registry.find("pricing"_kj, "fresh"_kj) != kj::none);
  KJ_EXPECT(registry.find("pricing"_kj, "stale"_kj) == kj::none);
}

KJ_TEST("HealthChecker: run probes immediately") {
  auto io = kj::setupAsyncIo();
  ServiceRegistry registry;
  registry.register_instance(make_instance("ok"_kj, 9001));

  ScriptedProbe probe;
  probe.answers.insert(kj::str("ok"), true);

  HealthChecker checker(registry, probe, io.provider->getTimer());
  auto running = checker.run();
  io.provider->getTimer().afterDelay(20 * kj::MILLISECONDS).wait(io.waitScope);

  KJ_EXPECT(probe.calls == 1);
  KJ_EXPECT(checker.rounds_completed() == 1);
}

} // namespace
} // namespace aegis::registry
