#pragma once

#include <cstdint>
#include <kj/compat/http.h>
#include <kj/string.h>

namespace aegis::gateway::util {

/**
 * @brief HTTP utility functions for gateway.
 */

/**
 * @brief Case-insensitive header lookup.
 *
 * @param headers HTTP headers
 * @param name Header name in any case
 * @return First value with that name, or none
 */
kj::Maybe<kj::StringPtr> getHeader(const kj::HttpHeaders& headers, kj::StringPtr name);

/**
 * @brief Get client IP address from headers.
 *
 * Uses the first X-Forwarded-For hop, then X-Real-IP.
 *
 * @param headers HTTP headers
 * @return Client IP as string, or "unknown" if not found
 */
kj::String getClientIP(const kj::HttpHeaders& headers);

/**
 * @brief Decoded value of one query string parameter.
 *
 * @param query Query string without the leading '?'
 * @param name Parameter name
 * @return Percent-decoded value of the first occurrence, or none
 */
kj::Maybe<kj::String> getQueryParam(kj::StringPtr query, kj::StringPtr name);

/**
 * @brief Retry-After header value from a millisecond hint.
 *
 * Whole seconds, rounded up, never below 1.
 */
kj::String retryAfterSeconds(int64_t retryAfterMs);

/**
 * @brief Check if method is safe (no side effects).
 *
 * @param method HTTP method
 * @return true if method is GET or HEAD
 */
bool isSafeMethod(kj::HttpMethod method);

/**
 * @brief Status line text for the codes the gateway produces itself.
 */
kj::StringPtr statusText(uint32_t status);

} // namespace aegis::gateway::util
