#pragma once

#include "aegis/core/time.h"
#include "auth/identity.h"

#include <atomic>
#include <cstdint>
#include <kj/array.h>
#include <kj/async.h>
#include <kj/common.h>
#include <kj/compat/http.h>
#include <kj/map.h>
#include <kj/mutex.h>
#include <kj/string.h>
#include <kj/timer.h>

namespace aegis::gateway::middleware {

/**
 * @brief One fixed window counter
 *
 * `count` only grows for admitted requests; rejected requests leave it at the limit.
 */
struct RateLimitWindow {
  int64_t window_start_ms{0};
  int64_t window_ms{0};
  uint64_t count{0};
  uint64_t limit{0};

  [[nodiscard]] int64_t reset_at_ms() const noexcept {
    return window_start_ms + window_ms;
  }
};

/**
 * @brief Outcome of charging one key
 */
struct WindowDecision {
  bool allowed{false};
  uint64_t limit{0};
  uint64_t remaining{0};
  int64_t reset_at_ms{0};
  // Zero when allowed
  int64_t retry_after_ms{0};
};

/**
 * @brief Sharded map of key -> fixed window counter
 *
 * Keys are spread over a fixed number of shards, each behind its own mutex, so
 * unrelated callers never contend on one lock. Windows reset lazily: the first
 * access at or after window_start + window reinitializes the counter.
 */
class FixedWindowLimiter {
public:
  static constexpr size_t kShardCount = 16;

  FixedWindowLimiter() = default;
  FixedWindowLimiter(const FixedWindowLimiter&) = delete;
  FixedWindowLimiter& operator=(const FixedWindowLimiter&) = delete;

  /**
   * @brief Admit and count one request for key, or reject it
   *
   * A limit of zero rejects everything.
   */
  [[nodiscard]] WindowDecision try_acquire(kj::StringPtr key, uint64_t limit, int64_t window_ms,
                                           int64_t now_ms);

  bool reset(kj::StringPtr key);

  [[nodiscard]] kj::Maybe<RateLimitWindow> snapshot(kj::StringPtr key) const;

  // Drops windows that have fully elapsed; returns how many were removed
  size_t prune(int64_t now_ms);

  [[nodiscard]] size_t size() const;

private:
  using WindowMap = kj::HashMap<kj::String, RateLimitWindow>;

  [[nodiscard]] const kj::MutexGuarded<WindowMap>& shard_for(kj::StringPtr key) const;
  [[nodiscard]] kj::MutexGuarded<WindowMap>& shard_for(kj::StringPtr key);

  kj::MutexGuarded<WindowMap> shards_[kShardCount];
};

enum class RateLimitScope : uint8_t {
  Global = 0,
  Service = 1,
  User = 2,
};

[[nodiscard]] kj::StringPtr to_string(RateLimitScope scope);
[[nodiscard]] kj::Maybe<RateLimitScope> parse_scope(kj::StringPtr name);

/**
 * @brief Configuration for RateLimiter
 */
struct RateLimiterConfig {
  uint64_t global_limit{10000};
  uint64_t service_limit{2000};
  // Per-service replacements for service_limit
  kj::HashMap<kj::String, uint64_t> service_overrides;
  uint64_t anonymous_limit{100};
  int64_t window_ms{60000};

  uint64_t free_limit{10};
  uint64_t basic_limit{60};
  uint64_t premium_limit{300};
  uint64_t enterprise_limit{1000};

  [[nodiscard]] uint64_t tier_limit(auth::Tier tier) const;
};

/**
 * @brief Result of a full global -> service -> user check
 *
 * When allowed, limit/remaining/reset describe the user scope (the tightest
 * one a caller can reason about). When rejected, they describe the scope that
 * rejected.
 */
struct RateLimitResult {
  bool allowed{false};
  kj::Maybe<RateLimitScope> rejected_by;
  uint64_t limit{0};
  uint64_t remaining{0};
  int64_t reset_at_ms{0};
  int64_t retry_after_ms{0};
};

struct RateLimiterStats {
  std::atomic<uint64_t> checked{0};
  std::atomic<uint64_t> rejected_global{0};
  std::atomic<uint64_t> rejected_service{0};
  std::atomic<uint64_t> rejected_user{0};
};

/**
 * @brief Multi-tier quota enforcement with fixed windows
 *
 * Scopes are checked strictly in the order global, service, user. The first
 * scope that rejects ends the check; scopes after it are not charged. Scopes
 * before it keep the charge.
 *
 * The user key is the token subject for authenticated callers and the client
 * IP otherwise. Authenticated callers get their tier's limit, anonymous ones
 * get anonymous_limit.
 *
 * Usage:
 * ```cpp
 * RateLimiter limiter(config);
 * auto result = limiter.check("pricing"_kj, identity, client_ip);
 * if (!result.allowed) {
 *   return RateLimiter::send_429_response(result, header_table, response);
 * }
 * ```
 */
class RateLimiter {
public:
  explicit RateLimiter(RateLimiterConfig config = RateLimiterConfig(),
                       core::MillisClock clock = core::MillisClock([]() {
                         return core::now_unix_ms();
                       }));

  RateLimiter(const RateLimiter&) = delete;
  RateLimiter& operator=(const RateLimiter&) = delete;

  [[nodiscard]] RateLimitResult check(kj::StringPtr service, const auth::Identity& identity,
                                      kj::StringPtr client_ip);

  // Key the user scope uses for this caller
  [[nodiscard]] static kj::StringPtr user_key(const auth::Identity& identity,
                                              kj::StringPtr client_ip);

  [[nodiscard]] kj::Maybe<RateLimitWindow> stats(RateLimitScope scope, kj::StringPtr key) const;
  bool reset(RateLimitScope scope, kj::StringPtr key);

  // Drops expired windows in every scope
  size_t prune();

  /**
   * @brief Prune once per window until the returned promise is dropped
   *
   * Windows are otherwise only removed by reset(); user keys include client
   * addresses, one window per distinct caller.
   */
  kj::Promise<void> run_pruner(kj::Timer& timer);

  // Live windows across all scopes
  [[nodiscard]] size_t window_count() const;

  [[nodiscard]] const RateLimiterConfig& config() const noexcept {
    return config_;
  }
  [[nodiscard]] const RateLimiterStats& counters() const noexcept {
    return stats_;
  }

  /**
   * @brief Set X-RateLimit-Limit, X-RateLimit-Remaining, X-RateLimit-Reset
   * and, when rejected, Retry-After (whole seconds, rounded up, at least 1)
   */
  static void set_rate_limit_headers(kj::HttpHeaders& headers, const RateLimitResult& result);

  /**
   * @brief Send a 429 with the RATE_LIMITED error body and rate limit headers
   */
  static kj::Promise<void> send_429_response(const RateLimitResult& result,
                                             const kj::HttpHeaderTable& header_table,
                                             kj::HttpService::Response& response);

private:
  [[nodiscard]] uint64_t service_limit(kj::StringPtr service) const;
  [[nodiscard]] FixedWindowLimiter& limiter_for(RateLimitScope scope);
  [[nodiscard]] const FixedWindowLimiter& limiter_for(RateLimitScope scope) const;
  RateLimitResult reject(RateLimitScope scope, const WindowDecision& decision);

  RateLimiterConfig config_;
  core::MillisClock clock_;
  FixedWindowLimiter global_;
  FixedWindowLimiter services_;
  FixedWindowLimiter users_;
  RateLimiterStats stats_;
};

} // namespace aegis::gateway::middleware
