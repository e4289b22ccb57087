#pragma once

#include "router.h"

#include <cstdint>
#include <kj/async-io.h>
#include <kj/compat/http.h>
#include <kj/string.h>
#include <kj/timer.h>

namespace aegis::proxy {
class ResilientProxy;
struct ProxyError;
} // namespace aegis::proxy

namespace aegis::gateway {

class RouteTable;

namespace auth {
class TokenVerifier;
}
namespace middleware {
class RateLimiter;
}
namespace realtime {
class FanoutGateway;
}

struct GatewayServerConfig {
  kj::String api_prefix{kj::str("/api/v1")};
  kj::String ws_path{kj::str("/ws")};
  uint64_t max_body_bytes{10 * 1024 * 1024};
};

/**
 * @brief HTTP front door of the gateway.
 *
 * GatewayServer implements kj::HttpService and handles every inbound request.
 *
 * Request flow:
 * 1. Parse URL to extract path and query string
 * 2. WebSocket upgrades on ws_path go to the realtime fan-out
 * 3. Gateway endpoints (/health, /metrics, /admin/..., /internal/...) go
 *    through the Router, including its 405 and OPTIONS handling
 * 4. Paths under api_prefix are resolved against the RouteTable, charged to
 *    the RateLimiter (global, service, user) and forwarded by the
 *    ResilientProxy; the upstream response is relayed with sanitized headers
 * 5. Anything else is 404 NOT_FOUND
 */
class GatewayServer final : public kj::HttpService {
public:
  /**
   * @brief Construct a GatewayServer; every collaborator must outlive it.
   */
  GatewayServer(const kj::HttpHeaderTable& headerTable, Router& router, const RouteTable& routes,
                proxy::ResilientProxy& proxy, middleware::RateLimiter& limiter,
                const auth::TokenVerifier& verifier, realtime::FanoutGateway& fanout,
                kj::Timer& timer, GatewayServerConfig config = GatewayServerConfig{});

  kj::Promise<void> request(kj::HttpMethod method, kj::StringPtr url,
                            const kj::HttpHeaders& headers, kj::AsyncInputStream& requestBody,
                            Response& response) override;

private:
  const kj::HttpHeaderTable& headerTable_;
  Router& router_;
  const RouteTable& routes_;
  proxy::ResilientProxy& proxy_;
  middleware::RateLimiter& limiter_;
  const auth::TokenVerifier& verifier_;
  realtime::FanoutGateway& fanout_;
  kj::Timer& timer_;
  GatewayServerConfig config_;

  kj::Promise<void> handleProxy(kj::HttpMethod method, kj::String path, kj::String stripped,
                                kj::String query, const kj::HttpHeaders& headers,
                                kj::AsyncInputStream& requestBody, Response& response);

  kj::Promise<void> handleMethodNotAllowed(kj::HttpMethod method, kj::StringPtr path,
                                           Response& response);

  kj::Promise<void> sendError(Response& response, core::ErrorCode code, kj::StringPtr message);
  kj::Promise<void> sendProxyError(Response& response, const proxy::ProxyError& error);
  kj::Promise<void> sendErrorBody(Response& response, uint32_t status, core::ErrorCode code,
                                  kj::StringPtr message, kj::Maybe<int64_t> retryAfterMs);

  /**
   * @brief Whether a path belongs to proxied traffic; sets the prefix-free path.
   */
  bool underApiPrefix(kj::StringPtr path, kj::String& stripped) const;

  /**
   * @brief Parse URL to extract path (without query string).
   *
   * @param url The full URL path (may include query string)
   * @return The path portion without query string
   */
  static kj::String extractPath(kj::StringPtr url);

  /**
   * @brief Parse URL to extract query string.
   *
   * @param url The full URL path (may include query string)
   * @return The query string (without leading '?'), or empty string if none
   */
  static kj::StringPtr extractQueryString(kj::StringPtr url);

  /**
   * @brief Build Allow header value from list of methods.
   *
   * @param methods Vector of HTTP method names
   * @return Comma-separated Allow header value
   */
  static kj::String buildAllowHeader(const kj::Vector<kj::String>& methods);

  static void recordRequest(kj::StringPtr service, uint32_t status, double seconds);
};

} // namespace aegis::gateway
