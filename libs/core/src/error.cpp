#include "aegis/core/error.h"

#include "aegis/core/json.h"

#include <kj/common.h>
#include <kj/string.h>

namespace aegis::core {

kj::StringPtr to_string(ErrorCode code) {
  switch (code) {
  case ErrorCode::Success:
    return "SUCCESS"_kj;
  case ErrorCode::InternalError:
    return "INTERNAL_ERROR"_kj;
  case ErrorCode::InvalidInstance:
    return "INVALID_INSTANCE"_kj;
  case ErrorCode::ServiceUnavailable:
    return "SERVICE_UNAVAILABLE"_kj;
  case ErrorCode::CircuitOpen:
    return "CIRCUIT_OPEN"_kj;
  case ErrorCode::RateLimited:
    return "RATE_LIMITED"_kj;
  case ErrorCode::Timeout:
    return "TIMEOUT"_kj;
  case ErrorCode::BadGateway:
    return "BAD_GATEWAY"_kj;
  case ErrorCode::Cancelled:
    return "CANCELLED"_kj;
  case ErrorCode::NetworkError:
    return "NETWORK_ERROR"_kj;
  case ErrorCode::ValidationError:
    return "VALIDATION_ERROR"_kj;
  case ErrorCode::ParseError:
    return "PARSE_ERROR"_kj;
  case ErrorCode::ResourceExhausted:
    return "RESOURCE_EXHAUSTED"_kj;
  case ErrorCode::NotFound:
    return "NOT_FOUND"_kj;
  case ErrorCode::Unauthorized:
    return "UNAUTHORIZED"_kj;
  case ErrorCode::Forbidden:
    return "FORBIDDEN"_kj;
  case ErrorCode::ConfigurationError:
    return "CONFIGURATION_ERROR"_kj;
  }
  return "INTERNAL_ERROR"_kj;
}

ErrorCode to_error_code(kj::StringPtr str) {
  static constexpr ErrorCode kAll[] = {
      ErrorCode::Success,           ErrorCode::InternalError,   ErrorCode::InvalidInstance,
      ErrorCode::ServiceUnavailable, ErrorCode::CircuitOpen,    ErrorCode::RateLimited,
      ErrorCode::Timeout,           ErrorCode::BadGateway,      ErrorCode::Cancelled,
      ErrorCode::NetworkError,      ErrorCode::ValidationError, ErrorCode::ParseError,
      ErrorCode::ResourceExhausted, ErrorCode::NotFound,        ErrorCode::Unauthorized,
      ErrorCode::Forbidden,         ErrorCode::ConfigurationError,
  };
  for (auto code : kAll) {
    if (to_string(code) == str) {
      return code;
    }
  }
  return ErrorCode::InternalError;
}

int to_http_status(ErrorCode code) {
  switch (code) {
  case ErrorCode::Success:
    return 200;
  case ErrorCode::ServiceUnavailable:
  case ErrorCode::CircuitOpen:
    return 503;
  case ErrorCode::RateLimited:
    return 429;
  case ErrorCode::Timeout:
    return 504;
  case ErrorCode::BadGateway:
  case ErrorCode::NetworkError:
    return 502;
  case ErrorCode::ValidationError:
  case ErrorCode::ParseError:
  case ErrorCode::InvalidInstance:
    return 400;
  case ErrorCode::Unauthorized:
    return 401;
  case ErrorCode::Forbidden:
    return 403;
  case ErrorCode::NotFound:
    return 404;
  case ErrorCode::Cancelled:
    return 499;
  case ErrorCode::ResourceExhausted:
  case ErrorCode::ConfigurationError:
  case ErrorCode::InternalError:
    return 500;
  }
  return 500;
}

kj::String error_body(ErrorCode code, kj::StringPtr message) {
  return JsonBuilder::object()
      .put_object("error"_kj,
                  [&](JsonBuilder& err) {
                    err.put("code"_kj, to_string(code));
                    err.put("message"_kj, message);
                  })
      .build();
}

} // namespace aegis::core
