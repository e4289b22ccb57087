#include "aegis/proxy/resilient_proxy.h"

#include "aegis/core/metrics.h"
#include "aegis/proxy/header_rewriter.h"

#include <kj/debug.h>

namespace aegis::proxy {

namespace {

using Outcome = kj::OneOf<UpstreamResponse, kj::Exception>;

ProxyError make_error(core::ErrorCode code, kj::String message,
                      kj::Maybe<int64_t> retry_after_ms = kj::none) {
  return ProxyError{code, kj::mv(message), static_cast<uint32_t>(core::to_http_status(code)),
                    retry_after_ms};
}

} // namespace

ResilientProxy::ResilientProxy(registry::ServiceRegistry& registry,
                               resilience::CircuitBreakerRegistry& breakers,
                               UpstreamTransport& transport, kj::Timer& timer, ProxyConfig config,
                               core::MillisClock clock)
    : registry_(registry), breakers_(breakers), transport_(transport), timer_(timer),
      config_(kj::mv(config)), clock_(kj::mv(clock)) {}

kj::String ResilientProxy::breaker_key(kj::StringPtr service, kj::HttpMethod method,
                                       kj::StringPtr route_template) {
  return kj::str(service, ":", method, ":", route_template);
}

UpstreamRequest ResilientProxy::build_request(const ForwardRequest& request,
                                              const registry::ServiceInstance& instance,
                                              kj::StringPtr target_path) const {
  UpstreamRequest upstream;
  upstream.method = request.method;
  upstream.address = kj::str(instance.address);
  upstream.port = instance.port;
  upstream.authority = instance.authority();
  upstream.path_and_query = kj::str(target_path);
  upstream.headers = strip_hop_by_hop(request.headers);
  add_forwarded_headers(upstream.headers,
                        ForwardedInfo{request.client_ip, request.inbound_proto, request.inbound_host});
  // Copied per attempt; a retry needs the body again
  upstream.body = kj::heapArray<kj::byte>(request.body.asPtr());
  return upstream;
}

kj::Promise<ResilientProxy::Attempt> ResilientProxy::attempt_once(const ForwardRequest& request,
                                                                  kj::StringPtr key,
                                                                  kj::StringPtr target_path,
                                                                  int64_t deadline) {
  Attempt result;

  auto picked = registry_.try_pick(request.service);
  if (picked == kj::none) {
    result.error = make_error(core::ErrorCode::ServiceUnavailable,
                              kj::str("no healthy instance of service '", request.service, "'"));
    co_return result;
  }
  auto instance = kj::mv(KJ_ASSERT_NONNULL(picked));

  auto admission = breakers_.acquire(key);
  if (!admission.admitted()) {
    stats_.breaker_rejections.fetch_add(1, std::memory_order_relaxed);
    result.error = make_error(core::ErrorCode::ServiceUnavailable,
                              kj::str("service '", request.service, "' is temporarily unavailable"),
                              breakers_.retry_after_ms(admission.retry_at_ms));
    co_return result;
  }
  auto permit = kj::mv(KJ_ASSERT_NONNULL(admission.permit));

  int64_t remaining = deadline - clock_();
  if (remaining <= 0) {
    // Expired before anything was sent; the downstream is not at fault
    permit->ignore();
    result.error = make_error(core::ErrorCode::Timeout, kj::str("request deadline exceeded"));
    co_return result;
  }

  Outcome outcome =
      co_await timer_
          .timeoutAfter(remaining * kj::MILLISECONDS,
                        transport_.send(build_request(request, instance, target_path)))
          .then([](UpstreamResponse&& response) -> Outcome { return kj::mv(response); },
                [](kj::Exception&& exception) -> Outcome { return kj::mv(exception); });

  KJ_SWITCH_ONEOF(outcome) {
    KJ_CASE_ONEOF(response, UpstreamResponse) {
      if (resilience::is_retryable_status(response.status)) {
        permit->failure(core::ErrorCode::BadGateway);
        result.retryable = true;
      } else {
        // 4xx is the caller's problem, not the downstream's
        permit->success();
      }
      result.response = kj::mv(response);
    }
    KJ_CASE_ONEOF(exception, kj::Exception) {
      KJ_LOG(DBG, "Upstream attempt failed", request.service, instance.id,
             exception.getDescription());
      // timeoutAfter() rejects with OVERLOADED
      core::ErrorCode cause = core::ErrorCode::BadGateway;
      kj::String message;
      if (exception.getType() == kj::Exception::Type::OVERLOADED || clock_() >= deadline) {
        cause = core::ErrorCode::Timeout;
        message = kj::str("service '", request.service, "' did not respond in time");
      } else if (exception.getType() == kj::Exception::Type::DISCONNECTED) {
        cause = core::ErrorCode::NetworkError;
        message = kj::str("could not connect to service '", request.service, "'");
      } else {
        message = kj::str("invalid response from service '", request.service, "'");
      }
      permit->failure(cause);
      result.retryable = resilience::is_retryable_error(cause);
      // Callers see a refused connection as the service being unavailable
      auto reported = cause == core::ErrorCode::NetworkError ? core::ErrorCode::ServiceUnavailable
                                                             : cause;
      result.error = make_error(reported, kj::mv(message));
    }
  }
  co_return result;
}

ProxyError ResilientProxy::finish(const ForwardRequest& request, ProxyError error) {
  stats_.failed.fetch_add(1, std::memory_order_relaxed);
  KJ_LOG(DBG, "Forward failed", request.service, core::to_string(error.code), error.http_status);
  return error;
}

kj::Promise<ForwardResult> ResilientProxy::forward(ForwardRequest request) {
  stats_.total.fetch_add(1, std::memory_order_relaxed);

  int64_t deadline = clock_() + config_.default_timeout_ms;
  KJ_IF_SOME(requested, request.deadline_ms) {
    deadline = requested;
  }

  auto key = breaker_key(request.service, request.method, request.route_template);
  auto target_path = strip_version_prefix(request.path, config_.api_prefix);
  if (request.query.size() > 0) {
    target_path = kj::str(target_path, "?", request.query);
  }

  uint32_t attempts = 0;
  while (true) {
    auto attempt = co_await attempt_once(request, key, target_path, deadline);
    ++attempts;

    if (!attempt.retryable) {
      KJ_IF_SOME(response, attempt.response) {
        stats_.succeeded.fetch_add(1, std::memory_order_relaxed);
        co_return kj::mv(response);
      }
    }

    if (attempt.retryable && request.idempotent && config_.retry.allows_another(attempts)) {
      int64_t delay = config_.retry.delay_ms(attempts - 1);
      // Backoff never sleeps past the deadline
      if (delay < deadline - clock_()) {
        stats_.retried.fetch_add(1, std::memory_order_relaxed);
        const core::Label labels[] = {{"service"_kj, request.service}};
        core::counter_inc("aegis_proxy_retries_total"_kj, labels);
        KJ_LOG(DBG, "Retrying upstream call", request.service, attempts, delay);
        if (delay > 0) {
          co_await timer_.afterDelay(delay * kj::MILLISECONDS);
        }
        continue;
      }
    }

    KJ_IF_SOME(response, attempt.response) {
      co_return finish(request,
                       make_error(core::ErrorCode::BadGateway,
                                  kj::str("service '", request.service, "' failed with status ",
                                          response.status)));
    }
    KJ_IF_SOME(error, attempt.error) {
      co_return finish(request, kj::mv(error));
    }
    co_return finish(request, make_error(core::ErrorCode::InternalError,
                                         kj::str("forward produced no result")));
  }
}

} // namespace aegis::proxy
