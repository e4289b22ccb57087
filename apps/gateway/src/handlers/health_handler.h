#pragma once

#include "request_context.h"

#include <cstdint>
#include <kj/async.h>
#include <kj/string.h>

namespace aegis::registry {
class ServiceRegistry;
}

namespace aegis::gateway {

namespace realtime {
class FanoutGateway;
}

/**
 * Gateway liveness handler.
 *
 * Handles endpoint:
 * - GET /health - always 200 while the process serves requests
 *
 * Response format:
 * {
 *   "status": "ok" | "degraded",
 *   "timestamp": "2026-10-19T09:26:00.000Z",
 *   "uptime_seconds": 3600,
 *   "services": {"pricing": {"healthy": 2, "total": 3}},
 *   "websocket": {"connections": 12, "subscriptions": 30}
 * }
 *
 * "degraded" means at least one known service has no healthy instance.
 */
class HealthHandler {
public:
  HealthHandler(registry::ServiceRegistry& registry, const realtime::FanoutGateway& fanout);

  kj::Promise<void> handleHealth(RequestContext& ctx);

private:
  registry::ServiceRegistry& registry_;
  const realtime::FanoutGateway& fanout_;
  int64_t started_at_ms_;
};

} // namespace aegis::gateway
