#include "middleware/rate_limiter.h"

#include <atomic>
#include <kj/async-io.h>
#include <kj/compat/http.h>
#include <kj/test.h>
#include <thread>
#include <vector>

namespace aegis::gateway::middleware {
namespace {

kj::Maybe<kj::StringPtr> findHeader(const kj::HttpHeaders& headers, kj::StringPtr name) {
  kj::Maybe<kj::StringPtr> result = kj::none;
  headers.forEach([&](kj::StringPtr headerName, kj::StringPtr headerValue) {
    if (headerName == name) {
      result = headerValue;
    }
  });
  return result;
}

auth::Identity authenticated(kj::StringPtr subject, auth::Tier tier) {
  auth::Identity identity;
  identity.authenticated = true;
  identity.subject = kj::str(subject);
  identity.tier = tier;
  return identity;
}

// Limiter whose clock is a plain variable owned by the test
struct ManualLimiter {
  int64_t now = 1'000'000;
  RateLimiter limiter;

  explicit ManualLimiter(RateLimiterConfig config)
      : limiter(kj::mv(config), core::MillisClock([this]() { return now; })) {}
};

RateLimiterConfig smallConfig() {
  RateLimiterConfig config;
  config.global_limit = 1000;
  config.service_limit = 1000;
  config.anonymous_limit = 10;
  config.free_limit = 10;
  config.window_ms = 60'000;
  return config;
}

KJ_TEST("RateLimiter: default configuration") {
  RateLimiterConfig config;
  KJ_EXPECT(config.global_limit == 10000);
  KJ_EXPECT(config.service_limit == 2000);
  KJ_EXPECT(config.anonymous_limit == 100);
  KJ_EXPECT(config.window_ms == 60'000);
  KJ_EXPECT(config.tier_limit(auth::Tier::Free) == 10);
  KJ_EXPECT(config.tier_limit(auth::Tier::Enterprise) == 1000);
}

KJ_TEST("RateLimiter: eleventh request in the window is rejected by the user scope") {
  ManualLimiter fixture(smallConfig());
  auto caller = authenticated("alice"_kj, auth::Tier::Free);

  for (int i = 0; i < 10; ++i) {
    auto result = fixture.limiter.check("pricing"_kj, caller, "198.51.100.1"_kj);
    KJ_EXPECT(result.allowed, i);
    KJ_EXPECT(result.remaining == static_cast<uint64_t>(9 - i));
  }

  auto rejected = fixture.limiter.check("pricing"_kj, caller, "198.51.100.1"_kj);
  KJ_EXPECT(!rejected.allowed);
  KJ_EXPECT(KJ_ASSERT_NONNULL(rejected.rejected_by) == RateLimitScope::User);
  KJ_EXPECT(rejected.retry_after_ms > 0);
  KJ_EXPECT(rejected.retry_after_ms <= 60'000);
  KJ_EXPECT(fixture.limiter.counters().rejected_user.load() == 1);

  // Rejections do not push the counter past the limit
  auto window = KJ_ASSERT_NONNULL(fixture.limiter.stats(RateLimitScope::User, "alice"_kj));
  KJ_EXPECT(window.count == 10);
}

KJ_TEST("RateLimiter: window elapses and the count restarts at one") {
  ManualLimiter fixture(smallConfig());
  auto caller = authenticated("bob"_kj, auth::Tier::Free);

  for (int i = 0; i < 10; ++i) {
    KJ_EXPECT(fixture.limiter.check("pricing"_kj, caller, "198.51.100.2"_kj).allowed);
  }
  KJ_EXPECT(!fixture.limiter.check("pricing"_kj, caller, "198.51.100.2"_kj).allowed);

  fixture.now += 60'000;
  auto result = fixture.limiter.check("pricing"_kj, caller, "198.51.100.2"_kj);
  KJ_EXPECT(result.allowed);

  auto window = KJ_ASSERT_NONNULL(fixture.limiter.stats(RateLimitScope::User, "bob"_kj));
  KJ_EXPECT(window.count == 1);
  KJ_EXPECT(window.window_start_ms == fixture.now);
}

KJ_TEST("RateLimiter: retry hint points at the end of the window") {
  ManualLimiter fixture(smallConfig());
  auto caller = authenticated("carol"_kj, auth::Tier::Free);

  for (int i = 0; i < 10; ++i) {
    KJ_EXPECT(fixture.limiter.check("pricing"_kj, caller, ""_kj).allowed);
  }
  fixture.now += 45'000;
  auto rejected = fixture.limiter.check("pricing"_kj, caller, ""_kj);
  KJ_EXPECT(!rejected.allowed);
  KJ_EXPECT(rejected.retry_after_ms == 15'000);
}

KJ_TEST("RateLimiter: global rejection leaves service and user scopes uncharged") {
  auto config = smallConfig();
  config.global_limit = 2;
  ManualLimiter fixture(kj::mv(config));
  auto caller = authenticated("dave"_kj, auth::Tier::Basic);

  KJ_EXPECT(fixture.limiter.check("pricing"_kj, caller, ""_kj).allowed);
  KJ_EXPECT(fixture.limiter.check("pricing"_kj, caller, ""_kj).allowed);

  auto rejected = fixture.limiter.check("pricing"_kj, caller, ""_kj);
  KJ_EXPECT(!rejected.allowed);
  KJ_EXPECT(KJ_ASSERT_NONNULL(rejected.rejected_by) == RateLimitScope::Global);

  auto service = KJ_ASSERT_NONNULL(fixture.limiter.stats(RateLimitScope::Service, "pricing"_kj));
  KJ_EXPECT(service.count == 2);
  auto user = KJ_ASSERT_NONNULL(fixture.limiter.stats(RateLimitScope::User, "dave"_kj));
  KJ_EXPECT(user.count == 2);
}

KJ_TEST("RateLimiter: service rejection keeps the global charge") {
  auto config = smallConfig();
  config.service_limit = 1;
  ManualLimiter fixture(kj::mv(config));
  auto caller = authenticated("erin"_kj, auth::Tier::Basic);

  KJ_EXPECT(fixture.limiter.check("orders"_kj, caller, ""_kj).allowed);
  auto rejected = fixture.limiter.check("orders"_kj, caller, ""_kj);
  KJ_EXPECT(KJ_ASSERT_NONNULL(rejected.rejected_by) == RateLimitScope::Service);

  auto global = KJ_ASSERT_NONNULL(fixture.limiter.stats(RateLimitScope::Global, "global"_kj));
  KJ_EXPECT(global.count == 2);
  auto user = KJ_ASSERT_NONNULL(fixture.limiter.stats(RateLimitScope::User, "erin"_kj));
  KJ_EXPECT(user.count == 1);

  // Other services keep their own budget
  KJ_EXPECT(fixture.limiter.check("pricing"_kj, caller, ""_kj).allowed);
}

KJ_TEST("RateLimiter: service overrides replace the default service limit") {
  auto config = smallConfig();
  config.service_overrides.insert(kj::str("search"), 1);
  ManualLimiter fixture(kj::mv(config));
  auto caller = auth::Identity::anonymous();

  KJ_EXPECT(fixture.limiter.check("search"_kj, caller, "192.0.2.1"_kj).allowed);
  KJ_EXPECT(!fixture.limiter.check("search"_kj, caller, "192.0.2.2"_kj).allowed);
  KJ_EXPECT(fixture.limiter.check("pricing"_kj, caller, "192.0.2.3"_kj).allowed);
}

KJ_TEST("RateLimiter: anonymous callers are keyed by client IP") {
  auto config = smallConfig();
  config.anonymous_limit = 2;
  ManualLimiter fixture(kj::mv(config));
  auto anonymous = auth::Identity::anonymous();

  KJ_EXPECT(RateLimiter::user_key(anonymous, "203.0.113.7"_kj) == "203.0.113.7");
  KJ_EXPECT(fixture.limiter.check("pricing"_kj, anonymous, "203.0.113.7"_kj).allowed);
  KJ_EXPECT(fixture.limiter.check("pricing"_kj, anonymous, "203.0.113.7"_kj).allowed);
  KJ_EXPECT(!fixture.limiter.check("pricing"_kj, anonymous, "203.0.113.7"_kj).allowed);
  KJ_EXPECT(fixture.limiter.check("pricing"_kj, anonymous, "203.0.113.8"_kj).allowed);
}

KJ_TEST("RateLimiter: higher tiers get larger budgets") {
  auto config = smallConfig();
  config.free_limit = 1;
  config.premium_limit = 3;
  ManualLimiter fixture(kj::mv(config));
  auto free = authenticated("free-user"_kj, auth::Tier::Free);
  auto premium = authenticated("premium-user"_kj, auth::Tier::Premium);

  KJ_EXPECT(fixture.limiter.check("pricing"_kj, free, ""_kj).allowed);
  KJ_EXPECT(!fixture.limiter.check("pricing"_kj, free, ""_kj).allowed);

  for (int i = 0; i < 3; ++i) {
    KJ_EXPECT(fixture.limiter.check("pricing"_kj, premium, ""_kj).allowed);
  }
  KJ_EXPECT(!fixture.limiter.check("pricing"_kj, premium, ""_kj).allowed);
}

KJ_TEST("RateLimiter: reset clears one key") {
  ManualLimiter fixture(smallConfig());
  auto caller = authenticated("frank"_kj, auth::Tier::Free);

  for (int i = 0; i < 10; ++i) {
    KJ_EXPECT(fixture.limiter.check("pricing"_kj, caller, ""_kj).allowed);
  }
  KJ_EXPECT(fixture.limiter.reset(RateLimitScope::User, "frank"_kj));
  KJ_EXPECT(!fixture.limiter.reset(RateLimitScope::User, "frank"_kj));
  KJ_EXPECT(fixture.limiter.stats(RateLimitScope::User, "frank"_kj) == kj::none);
  KJ_EXPECT(fixture.limiter.check("pricing"_kj, caller, ""_kj).allowed);
}

KJ_TEST("RateLimiter: prune drops elapsed windows") {
  ManualLimiter fixture(smallConfig());
  auto caller = authenticated("grace"_kj, auth::Tier::Free);
  KJ_EXPECT(fixture.limiter.check("pricing"_kj, caller, ""_kj).allowed);

  KJ_EXPECT(fixture.limiter.prune() == 0);
  fixture.now += 60'000;
  // global, service and user windows
  KJ_EXPECT(fixture.limiter.prune() == 3);
}

KJ_TEST("RateLimiter: pruner loop removes windows of one-off callers") {
  auto io = kj::setupAsyncIo();
  auto config = smallConfig();
  config.window_ms = 5;
  ManualLimiter fixture(kj::mv(config));
  auto pruning = fixture.limiter.run_pruner(io.provider->getTimer()).eagerlyEvaluate(nullptr);

  auto anonymous = auth::Identity::anonymous();
  for (int i = 0; i < 20; ++i) {
    auto ip = kj::str("198.51.100.", i);
    KJ_EXPECT(fixture.limiter.check("pricing"_kj, anonymous, ip).allowed);
  }
  // global, service and one user window per address
  KJ_EXPECT(fixture.limiter.window_count() == 22);

  fixture.now += 5;
  io.provider->getTimer().afterDelay(30 * kj::MILLISECONDS).wait(io.waitScope);
  KJ_EXPECT(fixture.limiter.window_count() == 0);
  KJ_EXPECT(fixture.limiter.stats(RateLimitScope::User, "198.51.100.7"_kj) == kj::none);
}

KJ_TEST("RateLimiter: scope names round-trip") {
  KJ_EXPECT(to_string(RateLimitScope::Service) == "service");
  KJ_EXPECT(KJ_ASSERT_NONNULL(parse_scope("user"_kj)) == RateLimitScope::User);
  KJ_EXPECT(parse_scope("tenant"_kj) == kj::none);
}

KJ_TEST("RateLimiter: headers on a rejected result include Retry-After") {
  kj::HttpHeaderTable table;
  kj::HttpHeaders headers(table);

  RateLimitResult result;
  result.allowed = false;
  result.rejected_by = RateLimitScope::User;
  result.limit = 10;
  result.remaining = 0;
  result.reset_at_ms = 1'060'000;
  result.retry_after_ms = 1'500;
  RateLimiter::set_rate_limit_headers(headers, result);

  KJ_EXPECT(KJ_ASSERT_NONNULL(findHeader(headers, "X-RateLimit-Limit"_kj)) == "10");
  KJ_EXPECT(KJ_ASSERT_NONNULL(findHeader(headers, "X-RateLimit-Remaining"_kj)) == "0");
  KJ_EXPECT(KJ_ASSERT_NONNULL(findHeader(headers, "X-RateLimit-Reset"_kj)) == "1060");
  KJ_EXPECT(KJ_ASSERT_NONNULL(findHeader(headers, "Retry-After"_kj)) == "2");
}

KJ_TEST("RateLimiter: allowed result carries no Retry-After") {
  kj::HttpHeaderTable table;
  kj::HttpHeaders headers(table);

  RateLimitResult result;
  result.allowed = true;
  result.limit = 60;
  result.remaining = 59;
  RateLimiter::set_rate_limit_headers(headers, result);

  KJ_EXPECT(findHeader(headers, "Retry-After"_kj) == kj::none);
  KJ_EXPECT(KJ_ASSERT_NONNULL(findHeader(headers, "X-RateLimit-Remaining"_kj)) == "59");
}

KJ_TEST("RateLimiter: concurrent checks never admit more than the limit") {
  auto config = smallConfig();
  config.anonymous_limit = 100;
  RateLimiter limiter(kj::mv(config));
  std::atomic<int> admitted{0};

  std::vector<std::thread> threads;
  for (int t = 0; t < 4; ++t) {
    threads.emplace_back([&]() {
      auto anonymous = auth::Identity::anonymous();
      for (int i = 0; i < 50; ++i) {
        if (limiter.check("pricing"_kj, anonymous, "192.0.2.50"_kj).allowed) {
          admitted.fetch_add(1);
        }
      }
    });
  }
  for (auto& thread : threads) {
    thread.join();
  }

  KJ_EXPECT(admitted.load() == 100);
}

} // namespace
} // namespace aegis::gateway::middleware
