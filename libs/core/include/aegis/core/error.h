#pragma once

#include <cstdint>
#include <kj/common.h>
#include <kj/debug.h>
#include <kj/exception.h>
#include <kj/string.h>
#include <source_location>

namespace aegis::core {

/**
 * @brief Stable error codes surfaced to callers
 *
 * The string form of each code (see to_string) is part of the wire contract
 * and must never change once released.
 */
enum class ErrorCode : int {
  Success = 0,
  InternalError = 1,
  InvalidInstance = 2,
  ServiceUnavailable = 3,
  CircuitOpen = 4,
  RateLimited = 5,
  Timeout = 6,
  BadGateway = 7,
  Cancelled = 8,
  NetworkError = 9,
  ValidationError = 10,
  ParseError = 11,
  ResourceExhausted = 12,
  NotFound = 13,
  Unauthorized = 14,
  Forbidden = 15,
  ConfigurationError = 16,
};

[[nodiscard]] kj::StringPtr to_string(ErrorCode code);
[[nodiscard]] ErrorCode to_error_code(kj::StringPtr str);

/**
 * @brief HTTP status a caller sees for a given error code
 */
[[nodiscard]] int to_http_status(ErrorCode code);

/**
 * @brief Base exception for all Aegis errors
 *
 * Carries the message, the source location it was raised from, the KJ exception
 * type used when it is rethrown through KJ infrastructure, and the stable
 * ErrorCode used for the caller-visible error body.
 */
class AegisException {
public:
  explicit AegisException(kj::StringPtr message, ErrorCode code = ErrorCode::InternalError,
                          kj::Exception::Type type = kj::Exception::Type::FAILED,
                          const std::source_location& location = std::source_location::current())
      : message_(kj::str(message)), file_(kj::str(location.file_name())), line_(location.line()),
        code_(code), type_(type) {}

  virtual ~AegisException() = default;

  AegisException(AegisException&&) = default;
  AegisException& operator=(AegisException&&) = default;

  AegisException(const AegisException& other)
      : message_(kj::str(other.message_)), file_(kj::str(other.file_)), line_(other.line_),
        code_(other.code_), type_(other.type_) {}

  AegisException& operator=(const AegisException& other) {
    if (this != &other) {
      message_ = kj::str(other.message_);
      file_ = kj::str(other.file_);
      line_ = other.line_;
      code_ = other.code_;
      type_ = other.type_;
    }
    return *this;
  }

  [[nodiscard]] kj::StringPtr message() const noexcept {
    return message_;
  }
  [[nodiscard]] kj::StringPtr file() const noexcept {
    return file_;
  }
  [[nodiscard]] int line() const noexcept {
    return line_;
  }
  [[nodiscard]] ErrorCode code() const noexcept {
    return code_;
  }
  [[nodiscard]] kj::Exception::Type type() const noexcept {
    return type_;
  }

  [[nodiscard]] const char* what() const noexcept {
    return message_.cStr();
  }

  // Convert to kj::Exception for throwing via KJ infrastructure
  [[nodiscard]] kj::Exception toKjException() const {
    return kj::Exception(type_, file_.cStr(), line_, kj::str(to_string(code_), ": ", message_));
  }

private:
  kj::String message_;
  kj::String file_;
  int line_;
  ErrorCode code_;
  kj::Exception::Type type_;
};

class InvalidInstanceException : public AegisException {
public:
  explicit InvalidInstanceException(
      kj::StringPtr message, const std::source_location& location = std::source_location::current())
      : AegisException(message, ErrorCode::InvalidInstance, kj::Exception::Type::FAILED, location) {}
};

class ServiceUnavailableException : public AegisException {
public:
  explicit ServiceUnavailableException(
      kj::StringPtr message, kj::StringPtr service_name = ""_kj,
      const std::source_location& location = std::source_location::current())
      : AegisException(message, ErrorCode::ServiceUnavailable, kj::Exception::Type::UNIMPLEMENTED,
                       location),
        service_name_(kj::str(service_name)) {}

  ServiceUnavailableException(const ServiceUnavailableException& other)
      : AegisException(other), service_name_(kj::str(other.service_name_)) {}

  [[nodiscard]] kj::StringPtr service_name() const noexcept {
    return service_name_;
  }

private:
  kj::String service_name_;
};

class CircuitOpenException : public AegisException {
public:
  explicit CircuitOpenException(kj::StringPtr message, kj::StringPtr breaker_key = ""_kj,
                                int64_t retry_after_ms = 0,
                                const std::source_location& location = std::source_location::current())
      : AegisException(message, ErrorCode::CircuitOpen, kj::Exception::Type::OVERLOADED, location),
        breaker_key_(kj::str(breaker_key)), retry_after_ms_(retry_after_ms) {}

  CircuitOpenException(const CircuitOpenException& other)
      : AegisException(other), breaker_key_(kj::str(other.breaker_key_)),
        retry_after_ms_(other.retry_after_ms_) {}

  [[nodiscard]] kj::StringPtr breaker_key() const noexcept {
    return breaker_key_;
  }
  [[nodiscard]] int64_t retry_after_ms() const noexcept {
    return retry_after_ms_;
  }

private:
  kj::String breaker_key_;
  int64_t retry_after_ms_;
};

class RateLimitException : public AegisException {
public:
  explicit RateLimitException(kj::StringPtr message, kj::StringPtr scope = ""_kj,
                              int64_t retry_after_ms = 0,
                              const std::source_location& location = std::source_location::current())
      : AegisException(message, ErrorCode::RateLimited, kj::Exception::Type::OVERLOADED, location),
        scope_(kj::str(scope)), retry_after_ms_(retry_after_ms) {}

  RateLimitException(const RateLimitException& other)
      : AegisException(other), scope_(kj::str(other.scope_)),
        retry_after_ms_(other.retry_after_ms_) {}

  [[nodiscard]] kj::StringPtr scope() const noexcept {
    return scope_;
  }
  [[nodiscard]] int64_t retry_after_ms() const noexcept {
    return retry_after_ms_;
  }

private:
  kj::String scope_;
  int64_t retry_after_ms_;
};

class TimeoutException : public AegisException {
public:
  explicit TimeoutException(kj::StringPtr message,
                            const std::source_location& location = std::source_location::current())
      : AegisException(message, ErrorCode::Timeout, kj::Exception::Type::OVERLOADED, location) {}
};

class BadGatewayException : public AegisException {
public:
  explicit BadGatewayException(kj::StringPtr message, int upstream_status = 0,
                               const std::source_location& location = std::source_location::current())
      : AegisException(message, ErrorCode::BadGateway, kj::Exception::Type::FAILED, location),
        upstream_status_(upstream_status) {}

  [[nodiscard]] int upstream_status() const noexcept {
    return upstream_status_;
  }

private:
  int upstream_status_;
};

class NetworkException : public AegisException {
public:
  explicit NetworkException(kj::StringPtr message,
                            const std::source_location& location = std::source_location::current())
      : AegisException(message, ErrorCode::NetworkError, kj::Exception::Type::DISCONNECTED,
                       location) {}
};

class ValidationException : public AegisException {
public:
  explicit ValidationException(kj::StringPtr message,
                               const std::source_location& location = std::source_location::current())
      : AegisException(message, ErrorCode::ValidationError, kj::Exception::Type::FAILED, location) {}
};

class ParseException : public AegisException {
public:
  explicit ParseException(kj::StringPtr message,
                          const std::source_location& location = std::source_location::current())
      : AegisException(message, ErrorCode::ParseError, kj::Exception::Type::FAILED, location) {}
};

class ResourceException : public AegisException {
public:
  explicit ResourceException(kj::StringPtr message,
                             const std::source_location& location = std::source_location::current())
      : AegisException(message, ErrorCode::ResourceExhausted, kj::Exception::Type::OVERLOADED,
                       location) {}
};

class ConfigurationException : public AegisException {
public:
  explicit ConfigurationException(
      kj::StringPtr message, const std::source_location& location = std::source_location::current())
      : AegisException(message, ErrorCode::ConfigurationError, kj::Exception::Type::FAILED,
                       location) {}
};

/**
 * @brief Caller-visible JSON error body
 *
 * Produces {"error":{"code":"<CODE>","message":"<message>"}} with the message
 * JSON-escaped.
 */
[[nodiscard]] kj::String error_body(ErrorCode code, kj::StringPtr message);

#define AEGIS_REQUIRE(condition, ...) KJ_REQUIRE(condition, ##__VA_ARGS__)
#define AEGIS_FAIL_REQUIRE(...) KJ_FAIL_REQUIRE(__VA_ARGS__)

} // namespace aegis::core
