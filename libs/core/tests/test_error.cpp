#include "aegis/core/error.h"
#include "aegis/core/json.h"

#include <kj/test.h>

using namespace aegis::core;

namespace {

KJ_TEST("Error: wire strings are stable") {
  KJ_EXPECT(to_string(ErrorCode::ServiceUnavailable) == "SERVICE_UNAVAILABLE");
  KJ_EXPECT(to_string(ErrorCode::CircuitOpen) == "CIRCUIT_OPEN");
  KJ_EXPECT(to_string(ErrorCode::RateLimited) == "RATE_LIMITED");
  KJ_EXPECT(to_string(ErrorCode::Timeout) == "TIMEOUT");
  KJ_EXPECT(to_string(ErrorCode::BadGateway) == "BAD_GATEWAY");
  KJ_EXPECT(to_string(ErrorCode::InvalidInstance) == "INVALID_INSTANCE");
}

KJ_TEST("Error: to_error_code inverts to_string") {
  KJ_EXPECT(to_error_code("RATE_LIMITED"_kj) == ErrorCode::RateLimited);
  KJ_EXPECT(to_error_code("CANCELLED"_kj) == ErrorCode::Cancelled);
  KJ_EXPECT(to_error_code("SOMETHING_ELSE"_kj) == ErrorCode::InternalError);
}

KJ_TEST("Error: HTTP status mapping") {
  KJ_EXPECT(to_http_status(ErrorCode::ServiceUnavailable) == 503);
  KJ_EXPECT(to_http_status(ErrorCode::CircuitOpen) == 503);
  KJ_EXPECT(to_http_status(ErrorCode::RateLimited) == 429);
  KJ_EXPECT(to_http_status(ErrorCode::Timeout) == 504);
  KJ_EXPECT(to_http_status(ErrorCode::BadGateway) == 502);
  KJ_EXPECT(to_http_status(ErrorCode::ParseError) == 400);
  KJ_EXPECT(to_http_status(ErrorCode::Unauthorized) == 401);
  KJ_EXPECT(to_http_status(ErrorCode::Forbidden) == 403);
  KJ_EXPECT(to_http_status(ErrorCode::NotFound) == 404);
  KJ_EXPECT(to_http_status(ErrorCode::InternalError) == 500);
}

KJ_TEST("Error: exceptions carry code and context") {
  try {
    throw CircuitOpenException("breaker open"_kj, "pricing:GET:/price"_kj, 2500);
  } catch (const AegisException& e) {
    KJ_EXPECT(e.code() == ErrorCode::CircuitOpen);
    KJ_EXPECT(e.message() == "breaker open");
    KJ_EXPECT(e.line() > 0);
  }

  RateLimitException limited("too many"_kj, "user"_kj, 1200);
  KJ_EXPECT(limited.scope() == "user");
  KJ_EXPECT(limited.retry_after_ms() == 1200);

  ServiceUnavailableException unavailable("no instance"_kj, "pricing"_kj);
  ServiceUnavailableException copy(unavailable);
  KJ_EXPECT(copy.service_name() == "pricing");
  KJ_EXPECT(copy.code() == ErrorCode::ServiceUnavailable);
}

KJ_TEST("Error: toKjException prefixes the wire code") {
  TimeoutException timeout("deadline exceeded"_kj);
  auto kj_exception = timeout.toKjException();
  KJ_EXPECT(kj_exception.getType() == kj::Exception::Type::OVERLOADED);
  KJ_EXPECT(kj_exception.getDescription().startsWith("TIMEOUT: "));
}

KJ_TEST("Error: error_body shape and escaping") {
  auto body = error_body(ErrorCode::RateLimited, "limit \"user\" exceeded"_kj);
  auto doc = JsonDocument::parse(body);
  KJ_EXPECT(doc.root()["error"]["code"].get_string() == "RATE_LIMITED");
  KJ_EXPECT(doc.root()["error"]["message"].get_string() == "limit \"user\" exceeded");
}

} // namespace
