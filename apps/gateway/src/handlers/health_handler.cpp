#include "handlers/health_handler.h"

#include "aegis/core/json.h"
#include "aegis/core/time.h"
#include "aegis/registry/service_registry.h"
#include "realtime/fanout_gateway.h"

namespace aegis::gateway {

HealthHandler::HealthHandler(registry::ServiceRegistry& registry,
                             const realtime::FanoutGateway& fanout)
    : registry_(registry), fanout_(fanout), started_at_ms_(core::now_steady_ms()) {}

kj::Promise<void> HealthHandler::handleHealth(RequestContext& ctx) {
  bool degraded = false;
  auto names = registry_.service_names();
  auto fanout_stats = fanout_.stats();

  auto body = core::JsonBuilder::object();
  body.put_object("services"_kj, [&](core::JsonBuilder& services) {
    for (auto& name : names) {
      auto snapshot = registry_.snapshot(name);
      auto healthy = snapshot->healthy_count();
      if (healthy == 0) {
        degraded = true;
      }
      services.put_object(name, [&](core::JsonBuilder& service) {
        service.put("healthy"_kj, healthy);
        service.put("total"_kj, snapshot->instances.size());
      });
    }
  });
  body.put_object("websocket"_kj, [&](core::JsonBuilder& websocket) {
    websocket.put("connections"_kj, fanout_stats.connections);
    websocket.put("subscriptions"_kj, fanout_stats.subscriptions);
  });
  body.put("status"_kj, degraded ? "degraded"_kj : "ok"_kj);
  body.put("timestamp"_kj, core::now_utc_iso8601());
  body.put("uptime_seconds"_kj, (core::now_steady_ms() - started_at_ms_) / 1000);

  return ctx.sendJson(200, body.build());
}

} // namespace aegis::gateway
