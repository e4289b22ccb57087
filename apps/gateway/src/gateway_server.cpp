#include "gateway_server.h"

#include "aegis/core/error.h"
#include "aegis/core/metrics.h"
#include "aegis/proxy/header_rewriter.h"
#include "aegis/proxy/resilient_proxy.h"
#include "auth/token_verifier.h"
#include "middleware/rate_limiter.h"
#include "realtime/fanout_gateway.h"
#include "realtime/websocket_session.h"
#include "route_table.h"
#include "util/http_utils.h"

#include <kj/debug.h>
#include <kj/memory.h>
#include <kj/string.h>
#include <kj/vector.h>

namespace aegis::gateway {

GatewayServer::GatewayServer(const kj::HttpHeaderTable& headerTable, Router& router,
                             const RouteTable& routes, proxy::ResilientProxy& proxy,
                             middleware::RateLimiter& limiter, const auth::TokenVerifier& verifier,
                             realtime::FanoutGateway& fanout, kj::Timer& timer,
                             GatewayServerConfig config)
    : headerTable_(headerTable), router_(router), routes_(routes), proxy_(proxy),
      limiter_(limiter), verifier_(verifier), fanout_(fanout), timer_(timer),
      config_(kj::mv(config)) {}

kj::Promise<void> GatewayServer::request(kj::HttpMethod method, kj::StringPtr url,
                                         const kj::HttpHeaders& headers,
                                         kj::AsyncInputStream& requestBody, Response& response) {
  // Extract path and query string from URL
  kj::String path = extractPath(url);
  kj::StringPtr queryString = extractQueryString(url);

  KJ_LOG(DBG, "Incoming request", "method", Router::get_method_name(method), "path", path, "query",
         queryString);

  if (path == config_.ws_path) {
    if (headers.isWebSocket()) {
      return realtime::WebSocketSession::serve(fanout_, timer_, verifier_, headers, queryString,
                                               headerTable_, response);
    }
    return sendError(response, core::ErrorCode::ValidationError, "WebSocket upgrade required"_kj);
  }

  // Gateway endpoints
  auto maybeMatch = router_.match(method, path);
  KJ_IF_SOME(match, maybeMatch) {
    auto ctx = kj::heap(RequestContext{.method = method,
                                       .path = path,
                                       .queryString = queryString,
                                       .headers = headers,
                                       .body = requestBody,
                                       .response = response,
                                       .headerTable = headerTable_,
                                       .path_params = kj::mv(match.path_params),
                                       .identity = auth::Identity::anonymous(),
                                       .clientIP = util::getClientIP(headers)});

    auto promise = match.handler(*ctx);
    return promise.attach(kj::mv(ctx), kj::mv(path));
  }

  if (router_.has_path(path)) {
    return handleMethodNotAllowed(method, path, response);
  }

  kj::String stripped;
  if (underApiPrefix(path, stripped)) {
    return handleProxy(method, kj::mv(path), kj::mv(stripped), kj::str(queryString), headers,
                       requestBody, response);
  }

  return sendError(response, core::ErrorCode::NotFound, kj::str("no route for ", path));
}

kj::Promise<void> GatewayServer::handleProxy(kj::HttpMethod method, kj::String path,
                                             kj::String stripped, kj::String query,
                                             const kj::HttpHeaders& headers,
                                             kj::AsyncInputStream& requestBody,
                                             Response& response) {
  core::Timer stopwatch;

  auto maybeRoute = routes_.resolve(method, stripped);
  if (maybeRoute == kj::none) {
    co_await sendError(response, core::ErrorCode::NotFound,
                       kj::str("no service serves ", stripped));
    co_return;
  }
  auto& route = KJ_ASSERT_NONNULL(maybeRoute);
  auto service = kj::str(route.service);

  KJ_IF_SOME(length, headers.get(kj::HttpHeaderId::CONTENT_LENGTH)) {
    KJ_IF_SOME(size, length.tryParseAs<uint64_t>()) {
      if (size > config_.max_body_bytes) {
        co_await sendError(response, core::ErrorCode::ValidationError,
                           "request body too large"_kj);
        co_return;
      }
    }
  }

  // Invalid tokens fall back to anonymous: quota by client IP, Authorization still forwarded
  auto identity = auth::Identity::anonymous();
  KJ_IF_SOME(authorization, util::getHeader(headers, "Authorization"_kj)) {
    KJ_IF_SOME(token, auth::bearer_token(authorization)) {
      auto maybeIdentity = verifier_.verify(token);
      KJ_IF_SOME(verified, maybeIdentity) {
        identity = kj::mv(verified);
      } else {
        KJ_LOG(DBG, "Bearer token rejected", auth::to_string(verifier_.last_error()));
      }
    }
  }

  auto clientIP = util::getClientIP(headers);
  auto limit = limiter_.check(service, identity, clientIP);
  if (!limit.allowed) {
    recordRequest(service, 429, stopwatch.elapsed_seconds());
    co_await middleware::RateLimiter::send_429_response(limit, headerTable_, response);
    co_return;
  }

  // Headers are only valid until the body is first read
  proxy::ForwardRequest forward;
  forward.service = kj::str(service);
  forward.method = method;
  forward.path = kj::mv(path);
  forward.query = kj::mv(query);
  forward.route_template = kj::str(route.route_template);
  forward.idempotent = route.idempotent;
  forward.headers = proxy::copy_from_kj_headers(headers);
  forward.client_ip = kj::mv(clientIP);
  forward.inbound_proto = kj::str(util::getHeader(headers, "X-Forwarded-Proto"_kj).orDefault("http"_kj));
  forward.inbound_host = kj::str(headers.get(kj::HttpHeaderId::HOST).orDefault(""_kj));
  forward.body = co_await requestBody.readAllBytes(config_.max_body_bytes);

  auto result = co_await proxy_.forward(kj::mv(forward));

  KJ_IF_SOME(upstream, result.tryGet<proxy::UpstreamResponse>()) {
    kj::HttpHeaders responseHeaders(headerTable_);
    proxy::copy_to_kj_headers(upstream.headers, responseHeaders);
    middleware::RateLimiter::set_rate_limit_headers(responseHeaders, limit);
    recordRequest(service, upstream.status, stopwatch.elapsed_seconds());

    auto stream = response.send(upstream.status, upstream.status_text, responseHeaders,
                                upstream.body.size());
    co_await stream->write(upstream.body.asPtr());
    co_return;
  }

  auto& error = result.get<proxy::ProxyError>();
  recordRequest(service, error.http_status, stopwatch.elapsed_seconds());
  co_await sendProxyError(response, error);
}

kj::Promise<void> GatewayServer::handleMethodNotAllowed(kj::HttpMethod method,
                                                        kj::StringPtr path, Response& response) {
  kj::Vector<kj::String> allowedMethods = router_.get_methods_for_path(path);

  // Handle OPTIONS specially - return 204 with Allow header
  if (method == kj::HttpMethod::OPTIONS) {
    allowedMethods.add(kj::str("OPTIONS"));
    kj::String allowHeader = buildAllowHeader(allowedMethods);

    kj::HttpHeaders responseHeaders(headerTable_);
    responseHeaders.addPtrPtr("Allow"_kj, allowHeader);
    responseHeaders.takeOwnership(kj::mv(allowHeader));
    response.send(204, "No Content"_kj, responseHeaders, uint64_t(0));
    return kj::READY_NOW;
  }

  kj::String allowHeader = buildAllowHeader(allowedMethods);
  kj::HttpHeaders responseHeaders(headerTable_);
  responseHeaders.addPtrPtr("Allow"_kj, allowHeader);
  responseHeaders.takeOwnership(kj::mv(allowHeader));
  responseHeaders.setPtr(kj::HttpHeaderId::CONTENT_TYPE, "application/json"_kj);

  kj::String body = core::error_body(core::ErrorCode::ValidationError,
                                     kj::str("method ", Router::get_method_name(method),
                                             " not allowed on ", path));
  auto stream = response.send(405, "Method Not Allowed"_kj, responseHeaders, body.size());
  auto writePromise = stream->write(body.asBytes());
  return writePromise.attach(kj::mv(stream), kj::mv(body));
}

kj::Promise<void> GatewayServer::sendError(Response& response, core::ErrorCode code,
                                           kj::StringPtr message) {
  return sendErrorBody(response, static_cast<uint32_t>(core::to_http_status(code)), code, message,
                       kj::none);
}

kj::Promise<void> GatewayServer::sendProxyError(Response& response,
                                                const proxy::ProxyError& error) {
  return sendErrorBody(response, error.http_status, error.code, error.message,
                       error.retry_after_ms);
}

kj::Promise<void> GatewayServer::sendErrorBody(Response& response, uint32_t status,
                                               core::ErrorCode code, kj::StringPtr message,
                                               kj::Maybe<int64_t> retryAfterMs) {
  kj::HttpHeaders responseHeaders(headerTable_);
  responseHeaders.setPtr(kj::HttpHeaderId::CONTENT_TYPE, "application/json"_kj);
  KJ_IF_SOME(ms, retryAfterMs) {
    responseHeaders.addPtr("Retry-After"_kj, util::retryAfterSeconds(ms));
  }

  kj::String body = core::error_body(code, message);
  auto stream = response.send(status, util::statusText(status), responseHeaders, body.size());
  auto writePromise = stream->write(body.asBytes());
  return writePromise.attach(kj::mv(stream), kj::mv(body));
}

bool GatewayServer::underApiPrefix(kj::StringPtr path, kj::String& stripped) const {
  stripped = proxy::strip_version_prefix(path, config_.api_prefix);
  return config_.api_prefix == "/"_kj || stripped != path;
}

void GatewayServer::recordRequest(kj::StringPtr service, uint32_t status, double seconds) {
  auto statusLabel = kj::str(status);
  const core::Label labels[] = {{"service"_kj, service}, {"status"_kj, statusLabel}};
  core::counter_inc("aegis_requests_total"_kj, labels);
  core::histogram_observe("aegis_request_duration_seconds"_kj, seconds);
}

kj::String GatewayServer::extractPath(kj::StringPtr url) {
  KJ_IF_SOME(queryStart, url.findFirst('?')) {
    return kj::str(url.slice(0, queryStart));
  }
  return kj::str(url);
}

kj::StringPtr GatewayServer::extractQueryString(kj::StringPtr url) {
  KJ_IF_SOME(queryStart, url.findFirst('?')) {
    return url.slice(queryStart + 1);
  }
  return ""_kj;
}

kj::String GatewayServer::buildAllowHeader(const kj::Vector<kj::String>& methods) {
  if (methods.size() == 0) {
    return kj::str();
  }

  kj::Vector<kj::StringPtr> parts;
  for (const auto& method : methods) {
    parts.add(method);
  }
  return kj::strArray(parts, ", ");
}

} // namespace aegis::gateway
