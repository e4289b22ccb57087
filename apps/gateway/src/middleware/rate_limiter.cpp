#include "middleware/rate_limiter.h"

#include "aegis/core/error.h"
#include "aegis/core/metrics.h"
#include "util/http_utils.h"

#include <algorithm>
#include <kj/debug.h>
#include <kj/hash.h>

namespace aegis::gateway::middleware {

namespace {

WindowDecision decide(const RateLimitWindow& window, uint64_t limit, int64_t now_ms) {
  WindowDecision decision;
  decision.limit = limit;
  decision.reset_at_ms = window.reset_at_ms();
  if (window.count < limit) {
    decision.allowed = true;
    decision.remaining = limit - window.count;
  } else {
    decision.retry_after_ms = std::max<int64_t>(1, window.reset_at_ms() - now_ms);
  }
  return decision;
}

RateLimitWindow fresh_window(uint64_t limit, int64_t window_ms, int64_t now_ms) {
  return RateLimitWindow{now_ms, window_ms, 0, limit};
}

} // namespace

// FixedWindowLimiter ---------------------------------------------------------

const kj::MutexGuarded<FixedWindowLimiter::WindowMap>&
FixedWindowLimiter::shard_for(kj::StringPtr key) const {
  return shards_[kj::hashCode(key) % kShardCount];
}

kj::MutexGuarded<FixedWindowLimiter::WindowMap>& FixedWindowLimiter::shard_for(kj::StringPtr key) {
  return shards_[kj::hashCode(key) % kShardCount];
}

WindowDecision FixedWindowLimiter::try_acquire(kj::StringPtr key, uint64_t limit, int64_t window_ms,
                                               int64_t now_ms) {
  auto lock = shard_for(key).lockExclusive();
  auto& window = lock->findOrCreate(key, [&]() {
    return WindowMap::Entry{kj::str(key), fresh_window(limit, window_ms, now_ms)};
  });

  if (now_ms >= window.window_start_ms + window_ms) {
    window = fresh_window(limit, window_ms, now_ms);
  }
  window.limit = limit;
  window.window_ms = window_ms;

  auto decision = decide(window, limit, now_ms);
  if (decision.allowed) {
    window.count++;
    decision.remaining--;
  }
  return decision;
}

bool FixedWindowLimiter::reset(kj::StringPtr key) {
  return shard_for(key).lockExclusive()->erase(key);
}

kj::Maybe<RateLimitWindow> FixedWindowLimiter::snapshot(kj::StringPtr key) const {
  auto lock = shard_for(key).lockShared();
  KJ_IF_SOME(window, lock->find(key)) {
    return window;
  }
  return kj::none;
}

size_t FixedWindowLimiter::prune(int64_t now_ms) {
  size_t removed = 0;
  for (auto& shard : shards_) {
    auto lock = shard.lockExclusive();
    removed += lock->eraseAll([now_ms](const kj::String&, const RateLimitWindow& window) {
      return now_ms >= window.reset_at_ms();
    });
  }
  return removed;
}

size_t FixedWindowLimiter::size() const {
  size_t total = 0;
  for (auto& shard : shards_) {
    total += shard.lockShared()->size();
  }
  return total;
}

// RateLimiter ----------------------------------------------------------------

kj::StringPtr to_string(RateLimitScope scope) {
  switch (scope) {
  case RateLimitScope::Global:
    return "global"_kj;
  case RateLimitScope::Service:
    return "service"_kj;
  case RateLimitScope::User:
    return "user"_kj;
  }
  return "global"_kj;
}

kj::Maybe<RateLimitScope> parse_scope(kj::StringPtr name) {
  if (name == "global"_kj) {
    return RateLimitScope::Global;
  }
  if (name == "service"_kj) {
    return RateLimitScope::Service;
  }
  if (name == "user"_kj) {
    return RateLimitScope::User;
  }
  return kj::none;
}

uint64_t RateLimiterConfig::tier_limit(auth::Tier tier) const {
  switch (tier) {
  case auth::Tier::Free:
    return free_limit;
  case auth::Tier::Basic:
    return basic_limit;
  case auth::Tier::Premium:
    return premium_limit;
  case auth::Tier::Enterprise:
    return enterprise_limit;
  }
  return free_limit;
}

RateLimiter::RateLimiter(RateLimiterConfig config, core::MillisClock clock)
    : config_(kj::mv(config)), clock_(kj::mv(clock)) {
  AEGIS_REQUIRE(config_.window_ms > 0, "rate limit window must be positive");
}

kj::StringPtr RateLimiter::user_key(const auth::Identity& identity, kj::StringPtr client_ip) {
  if (identity.authenticated && identity.subject.size() > 0) {
    return identity.subject;
  }
  return client_ip;
}

uint64_t RateLimiter::service_limit(kj::StringPtr service) const {
  KJ_IF_SOME(limit, config_.service_overrides.find(service)) {
    return limit;
  }
  return config_.service_limit;
}

FixedWindowLimiter& RateLimiter::limiter_for(RateLimitScope scope) {
  switch (scope) {
  case RateLimitScope::Global:
    return global_;
  case RateLimitScope::Service:
    return services_;
  case RateLimitScope::User:
    return users_;
  }
  KJ_UNREACHABLE;
}

const FixedWindowLimiter& RateLimiter::limiter_for(RateLimitScope scope) const {
  switch (scope) {
  case RateLimitScope::Global:
    return global_;
  case RateLimitScope::Service:
    return services_;
  case RateLimitScope::User:
    return users_;
  }
  KJ_UNREACHABLE;
}

RateLimitResult RateLimiter::reject(RateLimitScope scope, const WindowDecision& decision) {
  switch (scope) {
  case RateLimitScope::Global:
    stats_.rejected_global.fetch_add(1, std::memory_order_relaxed);
    break;
  case RateLimitScope::Service:
    stats_.rejected_service.fetch_add(1, std::memory_order_relaxed);
    break;
  case RateLimitScope::User:
    stats_.rejected_user.fetch_add(1, std::memory_order_relaxed);
    break;
  }
  const core::Label labels[] = {{"scope"_kj, to_string(scope)}};
  core::counter_inc("aegis_ratelimit_rejections_total"_kj, labels);

  RateLimitResult result;
  result.allowed = false;
  result.rejected_by = scope;
  result.limit = decision.limit;
  result.remaining = 0;
  result.reset_at_ms = decision.reset_at_ms;
  result.retry_after_ms = decision.retry_after_ms;
  return result;
}

RateLimitResult RateLimiter::check(kj::StringPtr service, const auth::Identity& identity,
                                   kj::StringPtr client_ip) {
  stats_.checked.fetch_add(1, std::memory_order_relaxed);
  int64_t now = clock_();

  auto global = global_.try_acquire("global"_kj, config_.global_limit, config_.window_ms, now);
  if (!global.allowed) {
    return reject(RateLimitScope::Global, global);
  }

  auto per_service = services_.try_acquire(service, service_limit(service), config_.window_ms, now);
  if (!per_service.allowed) {
    return reject(RateLimitScope::Service, per_service);
  }

  uint64_t user_limit =
      identity.authenticated ? config_.tier_limit(identity.tier) : config_.anonymous_limit;
  auto key = user_key(identity, client_ip);
  auto user = users_.try_acquire(key, user_limit, config_.window_ms, now);
  if (!user.allowed) {
    KJ_LOG(DBG, "Caller over quota", key, user_limit);
    return reject(RateLimitScope::User, user);
  }

  RateLimitResult result;
  result.allowed = true;
  result.limit = user.limit;
  result.remaining = user.remaining;
  result.reset_at_ms = user.reset_at_ms;
  return result;
}

kj::Maybe<RateLimitWindow> RateLimiter::stats(RateLimitScope scope, kj::StringPtr key) const {
  return limiter_for(scope).snapshot(key);
}

bool RateLimiter::reset(RateLimitScope scope, kj::StringPtr key) {
  bool removed = limiter_for(scope).reset(key);
  if (removed) {
    KJ_LOG(INFO, "Rate limit window reset", to_string(scope), key);
  }
  return removed;
}

size_t RateLimiter::prune() {
  int64_t now = clock_();
  return global_.prune(now) + services_.prune(now) + users_.prune(now);
}

kj::Promise<void> RateLimiter::run_pruner(kj::Timer& timer) {
  while (true) {
    co_await timer.afterDelay(config_.window_ms * kj::MILLISECONDS);
    auto removed = prune();
    KJ_LOG(DBG, "Pruned rate limit windows", removed, window_count());
  }
}

size_t RateLimiter::window_count() const {
  return global_.size() + services_.size() + users_.size();
}

void RateLimiter::set_rate_limit_headers(kj::HttpHeaders& headers, const RateLimitResult& result) {
  headers.addPtr("X-RateLimit-Limit"_kj, kj::str(result.limit));
  headers.addPtr("X-RateLimit-Remaining"_kj, kj::str(result.remaining));
  // Unix seconds
  headers.addPtr("X-RateLimit-Reset"_kj, kj::str(result.reset_at_ms / 1000));
  if (!result.allowed) {
    headers.addPtr("Retry-After"_kj, util::retryAfterSeconds(result.retry_after_ms));
  }
}

kj::Promise<void> RateLimiter::send_429_response(const RateLimitResult& result,
                                                 const kj::HttpHeaderTable& header_table,
                                                 kj::HttpService::Response& response) {
  kj::HttpHeaders headers(header_table);
  headers.setPtr(kj::HttpHeaderId::CONTENT_TYPE, "application/json"_kj);
  set_rate_limit_headers(headers, result);

  kj::StringPtr scope = "global"_kj;
  KJ_IF_SOME(rejected, result.rejected_by) {
    scope = to_string(rejected);
  }
  auto body = core::error_body(core::ErrorCode::RateLimited,
                               kj::str("rate limit exceeded for ", scope, " scope"));

  auto stream = response.send(429, "Too Many Requests"_kj, headers, body.size());
  auto promise = stream->write(body.asBytes());
  return promise.attach(kj::mv(stream), kj::mv(body));
}

} // namespace aegis::gateway::middleware
