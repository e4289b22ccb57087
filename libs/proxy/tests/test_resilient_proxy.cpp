#include "aegis/proxy/header_rewriter.h"
#include "aegis/proxy/resilient_proxy.h"

#include <kj/async-io.h>
#include <kj/test.h>
#include <kj/vector.h>

namespace aegis::proxy {
namespace {

// Scripted upstream: each send() consumes the next step
class FakeTransport final : public UpstreamTransport {
public:
  enum class Step { Ok, NotFound, Unavailable, Refuse, Garbage, Hang };

  kj::Vector<Step> script;
  kj::Vector<UpstreamRequest> received;

  kj::Promise<UpstreamResponse> send(UpstreamRequest request) override {
    Step step = script.size() > received.size() ? script[received.size()] : Step::Ok;
    received.add(kj::mv(request));
    switch (step) {
    case Step::Ok:
      return respond(200, "OK"_kj, "{\"price\":101.5}"_kj);
    case Step::NotFound:
      return respond(404, "Not Found"_kj, "{\"error\":\"no such symbol\"}"_kj);
    case Step::Unavailable:
      return respond(503, "Service Unavailable"_kj, ""_kj);
    case Step::Refuse:
      return KJ_EXCEPTION(DISCONNECTED, "connection refused");
    case Step::Garbage:
      return KJ_EXCEPTION(FAILED, "invalid HTTP status line");
    case Step::Hang:
      return kj::Promise<UpstreamResponse>(kj::NEVER_DONE);
    }
    return KJ_EXCEPTION(FAILED, "unreachable");
  }

private:
  static kj::Promise<UpstreamResponse> respond(uint32_t status, kj::StringPtr text,
                                               kj::StringPtr body) {
    UpstreamResponse response;
    response.status = status;
    response.status_text = kj::str(text);
    response.headers.add(HeaderField{kj::str("Content-Type"), kj::str("application/json")});
    response.body = kj::heapArray<kj::byte>(body.asBytes());
    return kj::mv(response);
  }
};

struct ProxyFixture {
  kj::AsyncIoContext io = kj::setupAsyncIo();
  registry::ServiceRegistry registry;
  resilience::CircuitBreakerRegistry breakers;
  FakeTransport transport;
  kj::Own<ResilientProxy> proxy;

  explicit ProxyFixture(uint32_t max_retries = 2, size_t instances = 1) {
    for (size_t i = 0; i < instances; ++i) {
      registry::ServiceInstance instance;
      instance.service_name = kj::str("pricing");
      instance.id = kj::str("p", i);
      instance.address = kj::str("10.1.0.", i + 1);
      instance.port = 8080;
      registry.register_instance(kj::mv(instance));
    }
    ProxyConfig config;
    config.retry.max_retries = max_retries;
    config.retry.base_delay_ms = 1;
    config.retry.max_delay_ms = 4;
    proxy = kj::heap<ResilientProxy>(registry, breakers, transport, io.provider->getTimer(),
                                     kj::mv(config));
  }

  ForwardResult forward(kj::StringPtr path, bool idempotent = true,
                        kj::Maybe<int64_t> timeout_ms = kj::none) {
    ForwardRequest request;
    request.service = kj::str("pricing");
    request.method = kj::HttpMethod::GET;
    request.path = kj::str(path);
    request.route_template = kj::str("/price");
    request.idempotent = idempotent;
    request.headers.add(HeaderField{kj::str("Connection"), kj::str("keep-alive, X-Trace")});
    request.headers.add(HeaderField{kj::str("X-Trace"), kj::str("abc")});
    request.headers.add(HeaderField{kj::str("Accept"), kj::str("application/json")});
    request.client_ip = kj::str("203.0.113.9");
    request.inbound_proto = kj::str("https");
    request.inbound_host = kj::str("api.example.com");
    KJ_IF_SOME(timeout, timeout_ms) {
      request.deadline_ms = core::now_steady_ms() + timeout;
    }
    return proxy->forward(kj::mv(request)).wait(io.waitScope);
  }
};

const ProxyError& expect_error(const ForwardResult& result) {
  KJ_ASSERT(result.is<ProxyError>(), "expected a proxy error");
  return result.get<ProxyError>();
}

KJ_TEST("ResilientProxy: rewrites path and headers for the picked instance") {
  ProxyFixture fixture;
  auto result = fixture.forward("/api/v1/price/BTC"_kj);

  KJ_ASSERT(result.is<UpstreamResponse>());
  KJ_EXPECT(result.get<UpstreamResponse>().status == 200);

  KJ_ASSERT(fixture.transport.received.size() == 1);
  auto& sent = fixture.transport.received[0];
  KJ_EXPECT(sent.path_and_query == "/price/BTC");
  KJ_EXPECT(sent.authority == "10.1.0.1:8080");
  KJ_EXPECT(find_header(sent.headers, "connection"_kj) == kj::none);
  KJ_EXPECT(find_header(sent.headers, "x-trace"_kj) == kj::none);
  KJ_EXPECT(KJ_ASSERT_NONNULL(find_header(sent.headers, "accept"_kj)) == "application/json");
  KJ_EXPECT(KJ_ASSERT_NONNULL(find_header(sent.headers, "x-forwarded-for"_kj)) == "203.0.113.9");
  KJ_EXPECT(KJ_ASSERT_NONNULL(find_header(sent.headers, "x-forwarded-proto"_kj)) == "https");
  KJ_EXPECT(KJ_ASSERT_NONNULL(find_header(sent.headers, "x-forwarded-host"_kj)) ==
            "api.example.com");
  KJ_EXPECT(fixture.proxy->stats().succeeded.load() == 1);
}

KJ_TEST("ResilientProxy: no healthy instance fails without retry") {
  ProxyFixture fixture(2, 0);
  auto result = fixture.forward("/api/v1/price"_kj);

  auto& error = expect_error(result);
  KJ_EXPECT(error.code == core::ErrorCode::ServiceUnavailable);
  KJ_EXPECT(error.http_status == 503);
  KJ_EXPECT(fixture.transport.received.size() == 0);
}

KJ_TEST("ResilientProxy: 4xx passes through and is never retried") {
  ProxyFixture fixture;
  fixture.transport.script.add(FakeTransport::Step::NotFound);

  auto result = fixture.forward("/api/v1/price/XYZ"_kj);
  KJ_ASSERT(result.is<UpstreamResponse>());
  auto& response = result.get<UpstreamResponse>();
  KJ_EXPECT(response.status == 404);
  KJ_EXPECT(kj::str(response.body.asPtr().asChars()) == "{\"error\":\"no such symbol\"}");
  KJ_EXPECT(fixture.transport.received.size() == 1);
  KJ_EXPECT(fixture.breakers.state("pricing:GET:/price"_kj) == resilience::CircuitState::Closed);
}

KJ_TEST("ResilientProxy: retries 5xx and transport failures on idempotent routes") {
  ProxyFixture fixture;
  fixture.transport.script.add(FakeTransport::Step::Unavailable);
  fixture.transport.script.add(FakeTransport::Step::Refuse);
  fixture.transport.script.add(FakeTransport::Step::Ok);

  auto result = fixture.forward("/api/v1/price"_kj);
  KJ_ASSERT(result.is<UpstreamResponse>());
  KJ_EXPECT(fixture.transport.received.size() == 3);
  KJ_EXPECT(fixture.proxy->stats().retried.load() == 2);
}

KJ_TEST("ResilientProxy: gives up after max retries") {
  ProxyFixture fixture;
  for (int i = 0; i < 5; ++i) {
    fixture.transport.script.add(FakeTransport::Step::Unavailable);
  }

  auto result = fixture.forward("/api/v1/price"_kj);
  auto& error = expect_error(result);
  KJ_EXPECT(error.code == core::ErrorCode::BadGateway);
  KJ_EXPECT(error.http_status == 502);
  // Original attempt plus two retries
  KJ_EXPECT(fixture.transport.received.size() == 3);
}

KJ_TEST("ResilientProxy: malformed upstream responses are retried, then BAD_GATEWAY") {
  ProxyFixture fixture;
  for (int i = 0; i < 3; ++i) {
    fixture.transport.script.add(FakeTransport::Step::Garbage);
  }

  auto result = fixture.forward("/api/v1/price"_kj);
  auto& error = expect_error(result);
  KJ_EXPECT(error.code == core::ErrorCode::BadGateway);
  KJ_EXPECT(error.http_status == 502);
  KJ_EXPECT(fixture.transport.received.size() == 3);
  KJ_EXPECT(fixture.proxy->stats().retried.load() == 2);
}

KJ_TEST("ResilientProxy: undeclared routes are never retried") {
  ProxyFixture fixture;
  fixture.transport.script.add(FakeTransport::Step::Refuse);

  auto result = fixture.forward("/api/v1/price"_kj, false);
  auto& error = expect_error(result);
  KJ_EXPECT(error.code == core::ErrorCode::ServiceUnavailable);
  KJ_EXPECT(fixture.transport.received.size() == 1);
}

KJ_TEST("ResilientProxy: deadline expiry yields TIMEOUT") {
  ProxyFixture fixture;
  fixture.transport.script.add(FakeTransport::Step::Hang);

  auto result = fixture.forward("/api/v1/price"_kj, true, int64_t{30});
  auto& error = expect_error(result);
  KJ_EXPECT(error.code == core::ErrorCode::Timeout);
  KJ_EXPECT(error.http_status == 504);
  KJ_EXPECT(fixture.transport.received.size() == 1);
}

KJ_TEST("ResilientProxy: open breaker fails fast with a retry hint") {
  ProxyFixture fixture(0);
  for (int i = 0; i < 5; ++i) {
    fixture.transport.script.add(FakeTransport::Step::Unavailable);
  }

  for (int i = 0; i < 5; ++i) {
    auto result = fixture.forward("/api/v1/price"_kj);
    KJ_EXPECT(expect_error(result).code == core::ErrorCode::BadGateway);
  }
  KJ_EXPECT(fixture.transport.received.size() == 5);

  auto sixth = fixture.forward("/api/v1/price"_kj);
  auto& error = expect_error(sixth);
  KJ_EXPECT(error.code == core::ErrorCode::ServiceUnavailable);
  KJ_EXPECT(fixture.transport.received.size() == 5);
  KJ_IF_SOME(retry_after, error.retry_after_ms) {
    KJ_EXPECT(retry_after > 0 && retry_after <= 10000, retry_after);
  }
  else {
    KJ_FAIL_EXPECT("missing retry hint");
  }
  KJ_EXPECT(fixture.proxy->stats().breaker_rejections.load() == 1);
}

KJ_TEST("Header rewriting: version prefix stripping") {
  KJ_EXPECT(strip_version_prefix("/api/v1/price"_kj, "/api/v1"_kj) == "/price");
  KJ_EXPECT(strip_version_prefix("/api/v1"_kj, "/api/v1/"_kj) == "/");
  KJ_EXPECT(strip_version_prefix("/api/v22/orders?x=1"_kj, "/api/v1"_kj) == "/orders?x=1");
  KJ_EXPECT(strip_version_prefix("/api/v1x/price"_kj, "/api/v1"_kj) == "/api/v1x/price");
  KJ_EXPECT(strip_version_prefix("/health"_kj, "/api/v1"_kj) == "/health");
}

KJ_TEST("Header rewriting: X-Forwarded-For appends to an existing chain") {
  HeaderList headers;
  headers.add(HeaderField{kj::str("X-Forwarded-For"), kj::str("198.51.100.1")});
  headers.add(HeaderField{kj::str("X-Forwarded-Proto"), kj::str("http")});
  add_forwarded_headers(headers, ForwardedInfo{"203.0.113.9"_kj, "https"_kj, "gw"_kj});

  KJ_EXPECT(KJ_ASSERT_NONNULL(find_header(headers, "X-Forwarded-For"_kj)) ==
            "198.51.100.1, 203.0.113.9");
  KJ_EXPECT(KJ_ASSERT_NONNULL(find_header(headers, "X-Forwarded-Proto"_kj)) == "https");
  KJ_EXPECT(headers.size() == 3);
}

KJ_TEST("Header rewriting: hop-by-hop names are case-insensitive") {
  KJ_EXPECT(is_hop_by_hop("Transfer-Encoding"_kj));
  KJ_EXPECT(is_hop_by_hop("PROXY-AUTHORIZATION"_kj));
  KJ_EXPECT(is_hop_by_hop("te"_kj));
  KJ_EXPECT(!is_hop_by_hop("Authorization"_kj));
  KJ_EXPECT(!is_hop_by_hop("Content-Type"_kj));
}

} // namespace
} // namespace aegis::proxy
