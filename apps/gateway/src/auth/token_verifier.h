#pragma once

#include "aegis/core/time.h"
#include "auth/identity.h"

#include <cstdint>
#include <kj/array.h>
#include <kj/common.h>
#include <kj/mutex.h>
#include <kj/string.h>

namespace aegis::gateway::auth {

/**
 * @brief Why the last verification failed
 */
enum class TokenError {
  NONE,
  INVALID_FORMAT,     // not header.payload.signature
  INVALID_BASE64,     // a part is not valid Base64URL
  INVALID_JSON,       // header or payload is not a JSON object
  ALGORITHM_MISMATCH, // alg other than HS256
  MISSING_CLAIMS,     // sub, iat or exp absent
  EXPIRED,            // exp in the past
  FUTURE_ISSUED,      // iat more than the allowed skew ahead
  INVALID_SIGNATURE,  // HMAC mismatch
};

[[nodiscard]] kj::StringPtr to_string(TokenError error);

/**
 * @brief HS256 bearer token verification
 *
 * Tokens carry the standard sub/iat/exp claims plus:
 * - "tier": one of free, basic, premium, enterprise (defaults to free)
 * - "permissions": array of permission strings, e.g. ["account:read"]
 *
 * Verification never throws for malformed input; callers that get none
 * treat the connection or request as anonymous.
 */
class TokenVerifier {
public:
  /**
   * @param secret HMAC key, must not be empty
   * @param clock Unix milliseconds
   */
  explicit TokenVerifier(kj::StringPtr secret,
                         core::MillisClock clock = core::MillisClock([]() {
                           return core::now_unix_ms();
                         }));

  TokenVerifier(const TokenVerifier&) = delete;
  TokenVerifier& operator=(const TokenVerifier&) = delete;

  [[nodiscard]] kj::Maybe<Identity> verify(kj::StringPtr token) const;

  /**
   * @brief Issue a signed token
   *
   * Used by operator tooling and tests; the gateway itself never issues tokens.
   */
  [[nodiscard]] kj::String issue(kj::StringPtr subject, Tier tier,
                                 kj::ArrayPtr<const kj::StringPtr> permissions,
                                 int64_t ttl_seconds = 3600) const;

  [[nodiscard]] TokenError last_error() const;

private:
  [[nodiscard]] int64_t now_seconds() const;
  [[nodiscard]] kj::Array<kj::byte> sign(kj::ArrayPtr<const kj::byte> data) const;
  [[nodiscard]] bool verify_signature(kj::ArrayPtr<const kj::byte> data,
                                      kj::ArrayPtr<const kj::byte> signature) const;
  void set_last_error(TokenError error) const;

  kj::String secret_;
  mutable core::MillisClock clock_;
  mutable kj::MutexGuarded<TokenError> last_error_;
};

/**
 * @brief Extract the token from "Authorization: Bearer <token>"
 */
[[nodiscard]] kj::Maybe<kj::StringPtr> bearer_token(kj::StringPtr authorization);

} // namespace aegis::gateway::auth
