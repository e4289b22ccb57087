#pragma once

#include "request_context.h"

#include <kj/async.h>
#include <kj/string.h>

namespace aegis::registry {
class ServiceRegistry;
}

namespace aegis::resilience {
class CircuitBreakerRegistry;
}

namespace aegis::gateway {

namespace middleware {
class RateLimiter;
}

/**
 * @brief Check X-Admin-Token against the configured token
 *
 * Sends 401 UNAUTHORIZED when the header is missing and 403 FORBIDDEN when it
 * does not match; the comparison is constant time.
 *
 * @return none when authorized, otherwise the promise of the error response
 */
kj::Maybe<kj::Promise<void>> requireAdmin(RequestContext& ctx, kj::StringPtr admin_token);

/**
 * Operator endpoints, registered only when an admin token is configured.
 *
 * Handles endpoints:
 * - GET    /admin/services                 - catalog with per-instance health
 * - GET    /admin/breakers                 - every breaker key and its state
 * - POST   /admin/breakers/{key}/reset     - force a breaker back to CLOSED
 * - GET    /admin/ratelimit/{scope}/{key}  - current window of one key
 * - DELETE /admin/ratelimit/{scope}/{key}  - drop the window of one key
 *
 * Breaker and rate limit keys contain '/' and ':', so clients percent-encode
 * them into a single path segment.
 */
class AdminHandler {
public:
  AdminHandler(kj::StringPtr admin_token, registry::ServiceRegistry& registry,
               resilience::CircuitBreakerRegistry& breakers, middleware::RateLimiter& limiter);

  kj::Promise<void> handleListServices(RequestContext& ctx);
  kj::Promise<void> handleListBreakers(RequestContext& ctx);
  kj::Promise<void> handleResetBreaker(RequestContext& ctx);
  kj::Promise<void> handleGetRateLimit(RequestContext& ctx);
  kj::Promise<void> handleResetRateLimit(RequestContext& ctx);

private:
  kj::String admin_token_;
  registry::ServiceRegistry& registry_;
  resilience::CircuitBreakerRegistry& breakers_;
  middleware::RateLimiter& limiter_;
};

} // namespace aegis::gateway
