#include "realtime/channel_policy.h"

#include <kj/test.h>

namespace aegis::gateway::realtime {
namespace {

auth::Identity member(auth::Tier tier, kj::ArrayPtr<const kj::StringPtr> permissions = nullptr) {
  auth::Identity identity;
  identity.authenticated = true;
  identity.subject = kj::str("member-", auth::to_string(tier));
  identity.tier = tier;
  for (auto permission : permissions) {
    identity.permissions.add(kj::str(permission));
  }
  return identity;
}

KJ_TEST("can_subscribe: public channels admit anonymous connections") {
  auto anonymous = auth::Identity::anonymous();
  KJ_EXPECT(can_subscribe(anonymous, "prices.basic"_kj).allowed);
  KJ_EXPECT(can_subscribe(anonymous, "services.health"_kj).allowed);
  KJ_EXPECT(can_subscribe(anonymous, "market.BTC-USD"_kj).allowed);
}

KJ_TEST("can_subscribe: tier channels need an authenticated caller at that tier") {
  auto anonymous = auth::Identity::anonymous();
  auto basic = member(auth::Tier::Basic);
  auto premium = member(auth::Tier::Premium);
  auto enterprise = member(auth::Tier::Enterprise);

  auto denied = can_subscribe(anonymous, "prices.vip"_kj);
  KJ_EXPECT(!denied.allowed);
  KJ_EXPECT(denied.code == core::ErrorCode::Forbidden);

  KJ_EXPECT(!can_subscribe(basic, "prices.vip"_kj).allowed);
  KJ_EXPECT(can_subscribe(premium, "prices.vip"_kj).allowed);
  KJ_EXPECT(can_subscribe(enterprise, "prices.vip"_kj).allowed);

  KJ_EXPECT(!can_subscribe(premium, "signals.enterprise"_kj).allowed);
  KJ_EXPECT(can_subscribe(enterprise, "signals.enterprise"_kj).allowed);
}

KJ_TEST("can_subscribe: permission channels check the permission claim") {
  kj::StringPtr reader[] = {"account:read"_kj};
  auto withPermission = member(auth::Tier::Free, reader);
  auto withoutPermission = member(auth::Tier::Enterprise);

  KJ_EXPECT(can_subscribe(withPermission, "account.balances"_kj).allowed);

  auto denied = can_subscribe(withoutPermission, "account.balances"_kj);
  KJ_EXPECT(!denied.allowed);
  KJ_EXPECT(denied.code == core::ErrorCode::Forbidden);
  KJ_EXPECT(denied.reason == "missing permission");
}

KJ_TEST("can_subscribe: unknown channels are NOT_FOUND") {
  auto enterprise = member(auth::Tier::Enterprise);
  auto decision = can_subscribe(enterprise, "prices.platinum"_kj);
  KJ_EXPECT(!decision.allowed);
  KJ_EXPECT(decision.code == core::ErrorCode::NotFound);

  // A wildcard needs at least one character after the prefix
  KJ_EXPECT(can_subscribe(enterprise, "market."_kj).code == core::ErrorCode::NotFound);
  KJ_EXPECT(find_channel_rule("market"_kj) == kj::none);
}

KJ_TEST("can_subscribe: the same inputs always give the same answer") {
  auto premium = member(auth::Tier::Premium);
  for (int i = 0; i < 3; ++i) {
    KJ_EXPECT(can_subscribe(premium, "prices.vip"_kj).allowed);
    KJ_EXPECT(!can_subscribe(premium, "admin.audit"_kj).allowed);
  }
}

KJ_TEST("channel_rules: every rule resolves to itself") {
  for (auto& rule : channel_rules()) {
    kj::String probe = rule.pattern.endsWith(".*"_kj)
                           ? kj::str(rule.pattern.slice(0, rule.pattern.size() - 1), "x")
                           : kj::str(rule.pattern);
    auto& found = KJ_ASSERT_NONNULL(find_channel_rule(probe));
    KJ_EXPECT(found.pattern == rule.pattern, probe);
  }
}

} // namespace
} // namespace aegis::gateway::realtime
