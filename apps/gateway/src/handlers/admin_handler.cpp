#include "handlers/admin_handler.h"

#include "aegis/core/json.h"
#include "aegis/registry/service_registry.h"
#include "aegis/resilience/circuit_breaker.h"
#include "middleware/rate_limiter.h"

#include <kj/debug.h>
#include <kj/encoding.h>
#include <openssl/crypto.h>

namespace aegis::gateway {

namespace {

// Path parameter, percent-decoded; none when absent, empty or malformed
kj::Maybe<kj::String> decodedParam(RequestContext& ctx, kj::StringPtr name) {
  KJ_IF_SOME(raw, ctx.pathParam(name)) {
    auto decoded = kj::decodeUriComponent(raw);
    if (!decoded.hadErrors && decoded.size() > 0) {
      return kj::String(kj::mv(decoded));
    }
  }
  return kj::none;
}

struct RateLimitTarget {
  middleware::RateLimitScope scope;
  kj::String key;
};

kj::Maybe<RateLimitTarget> rateLimitTarget(RequestContext& ctx) {
  KJ_IF_SOME(scope_name, ctx.pathParam("scope"_kj)) {
    KJ_IF_SOME(scope, middleware::parse_scope(scope_name)) {
      auto maybeKey = decodedParam(ctx, "key"_kj);
      KJ_IF_SOME(key, maybeKey) {
        return RateLimitTarget{scope, kj::mv(key)};
      }
    }
  }
  return kj::none;
}

} // namespace

kj::Maybe<kj::Promise<void>> requireAdmin(RequestContext& ctx, kj::StringPtr admin_token) {
  KJ_IF_SOME(presented, ctx.getHeader("X-Admin-Token"_kj)) {
    if (admin_token.size() > 0 && presented.size() == admin_token.size() &&
        CRYPTO_memcmp(presented.begin(), admin_token.begin(), admin_token.size()) == 0) {
      return kj::none;
    }
    KJ_LOG(WARNING, "Rejected admin request with wrong token", ctx.path, ctx.clientIP);
    return ctx.sendError(core::ErrorCode::Forbidden, "invalid admin token"_kj);
  }
  return ctx.sendError(core::ErrorCode::Unauthorized, "admin token required"_kj);
}

AdminHandler::AdminHandler(kj::StringPtr admin_token, registry::ServiceRegistry& registry,
                           resilience::CircuitBreakerRegistry& breakers,
                           middleware::RateLimiter& limiter)
    : admin_token_(kj::str(admin_token)), registry_(registry), breakers_(breakers),
      limiter_(limiter) {
  KJ_REQUIRE(admin_token_.size() > 0, "admin endpoints need a token");
}

kj::Promise<void> AdminHandler::handleListServices(RequestContext& ctx) {
  auto maybeDenied = requireAdmin(ctx, admin_token_);
  KJ_IF_SOME(denied, maybeDenied) {
    return kj::mv(denied);
  }

  auto body = core::JsonBuilder::object();
  body.put_array("services"_kj, [&](core::JsonBuilder& services) {
    for (auto& name : registry_.service_names()) {
      auto snapshot = registry_.snapshot(name);
      services.add_object([&](core::JsonBuilder& service) {
        service.put("name"_kj, name);
        service.put("healthy"_kj, snapshot->healthy_count());
        service.put_array("instances"_kj, [&](core::JsonBuilder& instances) {
          for (auto& instance : snapshot->instances) {
            instances.add_object([&](core::JsonBuilder& item) {
              item.put("id"_kj, instance.id);
              item.put("address"_kj, instance.address);
              item.put("port"_kj, static_cast<int>(instance.port));
              item.put("healthy"_kj, instance.healthy);
              item.put("lastHealthCheck"_kj, instance.last_health_check_ms);
              item.put("missedChecks"_kj, static_cast<int64_t>(instance.missed_checks));
              item.put("healthPath"_kj, instance.health_path);
              item.put_array("tags"_kj, [&](core::JsonBuilder& tags) {
                for (auto& tag : instance.tags) {
                  tags.add(tag);
                }
              });
              item.put_object("metadata"_kj, [&](core::JsonBuilder& metadata) {
                for (auto& entry : instance.metadata) {
                  metadata.put(entry.key, entry.value);
                }
              });
            });
          }
        });
      });
    }
  });

  return ctx.sendJson(200, body.build());
}

kj::Promise<void> AdminHandler::handleListBreakers(RequestContext& ctx) {
  auto maybeDenied = requireAdmin(ctx, admin_token_);
  KJ_IF_SOME(denied, maybeDenied) {
    return kj::mv(denied);
  }

  auto now = breakers_.now_ms();
  auto body = core::JsonBuilder::object();
  body.put_array("breakers"_kj, [&](core::JsonBuilder& breakers) {
    for (auto& snapshot : breakers_.snapshots()) {
      breakers.add_object([&](core::JsonBuilder& item) {
        item.put("key"_kj, snapshot.key);
        item.put("state"_kj, resilience::to_string(snapshot.state));
        item.put("consecutiveFailures"_kj, static_cast<int64_t>(snapshot.consecutive_failures));
        KJ_IF_SOME(last_failure, snapshot.last_failure_at_ms) {
          item.put("lastFailureAgoMs"_kj, now - last_failure);
        }
        KJ_IF_SOME(next_retry, snapshot.next_retry_at_ms) {
          item.put("retryInMs"_kj, next_retry > now ? next_retry - now : int64_t(0));
        }
        item.put("trialInFlight"_kj, snapshot.trial_in_flight);
        item.put("recoveryTimeoutMs"_kj, snapshot.recovery_timeout_ms);
        item.put("totalRequests"_kj, snapshot.total_requests);
        item.put("successfulRequests"_kj, snapshot.successful_requests);
        item.put("failedRequests"_kj, snapshot.failed_requests);
        item.put("rejectedRequests"_kj, snapshot.rejected_requests);
        item.put("stateTransitions"_kj, snapshot.state_transitions);
      });
    }
  });

  return ctx.sendJson(200, body.build());
}

kj::Promise<void> AdminHandler::handleResetBreaker(RequestContext& ctx) {
  auto maybeDenied = requireAdmin(ctx, admin_token_);
  KJ_IF_SOME(denied, maybeDenied) {
    return kj::mv(denied);
  }

  auto maybeKey = decodedParam(ctx, "key"_kj);
  KJ_IF_SOME(key, maybeKey) {
    if (!breakers_.reset(key)) {
      return ctx.sendError(core::ErrorCode::NotFound, "unknown breaker key"_kj);
    }
    KJ_LOG(INFO, "Breaker reset by operator", key);
    return ctx.sendJson(200, core::JsonBuilder::object()
                                 .put("key"_kj, key)
                                 .put("state"_kj, resilience::to_string(breakers_.state(key)))
                                 .build());
  }
  return ctx.sendError(core::ErrorCode::ValidationError, "invalid breaker key"_kj);
}

kj::Promise<void> AdminHandler::handleGetRateLimit(RequestContext& ctx) {
  auto maybeDenied = requireAdmin(ctx, admin_token_);
  KJ_IF_SOME(denied, maybeDenied) {
    return kj::mv(denied);
  }

  auto maybeTarget = rateLimitTarget(ctx);
  KJ_IF_SOME(target, maybeTarget) {
    KJ_IF_SOME(window, limiter_.stats(target.scope, target.key)) {
      auto remaining = window.limit > window.count ? window.limit - window.count : uint64_t(0);
      return ctx.sendJson(200, core::JsonBuilder::object()
                                   .put("scope"_kj, middleware::to_string(target.scope))
                                   .put("key"_kj, target.key)
                                   .put("count"_kj, window.count)
                                   .put("limit"_kj, window.limit)
                                   .put("remaining"_kj, remaining)
                                   .put("windowStartMs"_kj, window.window_start_ms)
                                   .put("resetAtMs"_kj, window.reset_at_ms())
                                   .build());
    }
    return ctx.sendError(core::ErrorCode::NotFound, "no rate limit window for key"_kj);
  }
  return ctx.sendError(core::ErrorCode::ValidationError,
                       "scope must be global, service or user"_kj);
}

kj::Promise<void> AdminHandler::handleResetRateLimit(RequestContext& ctx) {
  auto maybeDenied = requireAdmin(ctx, admin_token_);
  KJ_IF_SOME(denied, maybeDenied) {
    return kj::mv(denied);
  }

  auto maybeTarget = rateLimitTarget(ctx);
  KJ_IF_SOME(target, maybeTarget) {
    if (!limiter_.reset(target.scope, target.key)) {
      return ctx.sendError(core::ErrorCode::NotFound, "no rate limit window for key"_kj);
    }
    return ctx.sendJson(200, core::JsonBuilder::object()
                                 .put("scope"_kj, middleware::to_string(target.scope))
                                 .put("key"_kj, target.key)
                                 .put("reset"_kj, true)
                                 .build());
  }
  return ctx.sendError(core::ErrorCode::ValidationError,
                       "scope must be global, service or user"_kj);
}

} // namespace aegis::gateway
