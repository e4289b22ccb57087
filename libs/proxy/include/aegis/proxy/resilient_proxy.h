#pragma once

#include "aegis/core/error.h"
#include "aegis/core/time.h"
#include "aegis/proxy/upstream.h"
#include "aegis/registry/service_registry.h"
#include "aegis/resilience/circuit_breaker.h"
#include "aegis/resilience/retry_policy.h"

#include <atomic>
#include <cstdint>
#include <kj/async.h>
#include <kj/common.h>
#include <kj/one-of.h>
#include <kj/string.h>
#include <kj/timer.h>

namespace aegis::proxy {

/**
 * @brief Caller-visible failure of a forwarded request
 *
 * Messages never contain instance addresses.
 */
struct ProxyError {
  core::ErrorCode code{core::ErrorCode::InternalError};
  kj::String message;
  uint32_t http_status{500};
  kj::Maybe<int64_t> retry_after_ms;
};

struct ForwardRequest {
  kj::String service;
  kj::HttpMethod method{kj::HttpMethod::GET};
  // Inbound path, version prefix still attached
  kj::String path;
  kj::String query;
  // Route template used for the breaker key, e.g. "/price/{symbol}"
  kj::String route_template;
  bool idempotent{false};
  HeaderList headers;
  kj::Array<kj::byte> body;
  kj::String client_ip;
  kj::String inbound_proto;
  kj::String inbound_host;
  // Absolute deadline on the proxy clock; none means now + default timeout
  kj::Maybe<int64_t> deadline_ms;
};

using ForwardResult = kj::OneOf<UpstreamResponse, ProxyError>;

struct ProxyConfig {
  resilience::RetryPolicy retry;
  kj::String api_prefix{kj::str("/api/v1")};
  int64_t default_timeout_ms{30000};
};

struct ProxyStats {
  std::atomic<uint64_t> total{0};
  std::atomic<uint64_t> succeeded{0};
  std::atomic<uint64_t> retried{0};
  std::atomic<uint64_t> failed{0};
  std::atomic<uint64_t> breaker_rejections{0};
};

/**
 * @brief Forwards requests to a healthy instance with breaker, deadline and retries
 *
 * Each attempt picks a fresh instance, asks the breaker for a permit and sends
 * with the remaining deadline as its timeout. Transport failures and 5xx are
 * retried with exponential backoff only when the route is declared idempotent.
 * 4xx responses are returned unchanged and never retried.
 */
class ResilientProxy final {
public:
  ResilientProxy(registry::ServiceRegistry& registry,
                 resilience::CircuitBreakerRegistry& breakers, UpstreamTransport& transport,
                 kj::Timer& timer, ProxyConfig config = ProxyConfig(),
                 core::MillisClock clock = core::steady_millis_clock());

  KJ_DISALLOW_COPY_AND_MOVE(ResilientProxy);

  kj::Promise<ForwardResult> forward(ForwardRequest request);

  // service:METHOD:route_template
  [[nodiscard]] static kj::String breaker_key(kj::StringPtr service, kj::HttpMethod method,
                                              kj::StringPtr route_template);

  [[nodiscard]] const ProxyStats& stats() const noexcept {
    return stats_;
  }
  [[nodiscard]] const ProxyConfig& config() const noexcept {
    return config_;
  }

private:
  struct Attempt {
    kj::Maybe<UpstreamResponse> response;
    kj::Maybe<ProxyError> error;
    bool retryable{false};
  };

  kj::Promise<Attempt> attempt_once(const ForwardRequest& request, kj::StringPtr key,
                                    kj::StringPtr target_path, int64_t deadline);
  UpstreamRequest build_request(const ForwardRequest& request,
                                const registry::ServiceInstance& instance,
                                kj::StringPtr target_path) const;
  ProxyError finish(const ForwardRequest& request, ProxyError error);

  registry::ServiceRegistry& registry_;
  resilience::CircuitBreakerRegistry& breakers_;
  UpstreamTransport& transport_;
  kj::Timer& timer_;
  ProxyConfig config_;
  core::MillisClock clock_;
  ProxyStats stats_;
};

} // namespace aegis::proxy
