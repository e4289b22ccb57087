#pragma once

#include "aegis/core/error.h"
#include "auth/identity.h"

#include <kj/array.h>
#include <kj/common.h>
#include <kj/string.h>

namespace aegis::gateway::realtime {

enum class Requirement {
  Public,     // anyone, including anonymous connections
  Tier,       // authenticated with at least `tier`
  Permission, // authenticated holding `permission`
};

/**
 * @brief One row of the channel capability table
 *
 * A pattern ending in ".*" matches every channel with that prefix followed by
 * at least one more character; any other pattern matches exactly.
 */
struct ChannelRule {
  kj::StringPtr pattern;
  Requirement requirement;
  auth::Tier tier;
  kj::StringPtr permission;
};

/**
 * @brief The static channel -> required capability table, most specific first
 */
[[nodiscard]] kj::ArrayPtr<const ChannelRule> channel_rules();

struct SubscribeDecision {
  bool allowed{false};
  // Set when rejected: FORBIDDEN for a missing claim, NOT_FOUND for unknown channels
  core::ErrorCode code{core::ErrorCode::Success};
  kj::StringPtr reason;
};

/**
 * @brief Pure check of one identity against one channel
 *
 * Depends only on its arguments and the static table.
 */
[[nodiscard]] SubscribeDecision can_subscribe(const auth::Identity& identity,
                                              kj::StringPtr channel);

[[nodiscard]] kj::Maybe<const ChannelRule&> find_channel_rule(kj::StringPtr channel);

} // namespace aegis::gateway::realtime
