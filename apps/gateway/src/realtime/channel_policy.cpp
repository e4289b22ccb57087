#include "realtime/channel_policy.h"

namespace aegis::gateway::realtime {

namespace {

const ChannelRule kChannelRules[] = {
    {"prices.basic"_kj, Requirement::Public, auth::Tier::Free, ""_kj},
    {"prices.vip"_kj, Requirement::Tier, auth::Tier::Premium, ""_kj},
    {"signals.premium"_kj, Requirement::Tier, auth::Tier::Premium, ""_kj},
    {"signals.enterprise"_kj, Requirement::Tier, auth::Tier::Enterprise, ""_kj},
    {"services.health"_kj, Requirement::Public, auth::Tier::Free, ""_kj},
    {"announcements"_kj, Requirement::Public, auth::Tier::Free, ""_kj},
    {"market.*"_kj, Requirement::Public, auth::Tier::Free, ""_kj},
    {"account.*"_kj, Requirement::Permission, auth::Tier::Free, "account:read"_kj},
    {"admin.*"_kj, Requirement::Permission, auth::Tier::Free, "admin"_kj},
};

bool pattern_matches(kj::StringPtr pattern, kj::StringPtr channel) {
  if (pattern.endsWith(".*"_kj)) {
    auto prefix = pattern.slice(0, pattern.size() - 1);
    return channel.size() > prefix.size() && channel.slice(0, prefix.size()) == prefix;
  }
  return pattern == channel;
}

} // namespace

kj::ArrayPtr<const ChannelRule> channel_rules() {
  return kChannelRules;
}

kj::Maybe<const ChannelRule&> find_channel_rule(kj::StringPtr channel) {
  for (auto& rule : kChannelRules) {
    if (pattern_matches(rule.pattern, channel)) {
      return rule;
    }
  }
  return kj::none;
}

SubscribeDecision can_subscribe(const auth::Identity& identity, kj::StringPtr channel) {
  SubscribeDecision decision;
  KJ_IF_SOME(rule, find_channel_rule(channel)) {
    switch (rule.requirement) {
    case Requirement::Public:
      decision.allowed = true;
      break;
    case Requirement::Tier:
      decision.allowed = identity.has_tier(rule.tier);
      if (!decision.allowed) {
        decision.code = core::ErrorCode::Forbidden;
        decision.reason = "subscription tier too low"_kj;
      }
      break;
    case Requirement::Permission:
      decision.allowed = identity.has_permission(rule.permission);
      if (!decision.allowed) {
        decision.code = core::ErrorCode::Forbidden;
        decision.reason = "missing permission"_kj;
      }
      break;
    }
  } else {
    decision.code = core::ErrorCode::NotFound;
    decision.reason = "unknown channel"_kj;
  }
  return decision;
}

} // namespace aegis::gateway::realtime
