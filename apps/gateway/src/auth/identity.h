#pragma once

#include <cstdint>
#include <kj/common.h>
#include <kj/string.h>
#include <kj/vector.h>

namespace aegis::gateway::auth {

/**
 * @brief Subscription tier carried in the token's "tier" claim
 *
 * Ordered: a higher tier satisfies every requirement of a lower one.
 */
enum class Tier : uint8_t {
  Free = 0,
  Basic = 1,
  Premium = 2,
  Enterprise = 3,
};

[[nodiscard]] kj::StringPtr to_string(Tier tier);

// Unknown names yield none
[[nodiscard]] kj::Maybe<Tier> parse_tier(kj::StringPtr name);

/**
 * @brief Who is calling, as established from a bearer token
 *
 * Anonymous callers have an empty subject, the Free tier and no permissions.
 */
struct Identity {
  bool authenticated{false};
  kj::String subject;
  Tier tier{Tier::Free};
  kj::Vector<kj::String> permissions;

  Identity() = default;
  Identity(Identity&&) = default;
  Identity& operator=(Identity&&) = default;
  Identity(const Identity&) = delete;
  Identity& operator=(const Identity&) = delete;

  static Identity anonymous() {
    return Identity();
  }

  [[nodiscard]] Identity clone() const;
  [[nodiscard]] bool has_permission(kj::StringPtr permission) const;
  [[nodiscard]] bool has_tier(Tier required) const {
    return authenticated && static_cast<uint8_t>(tier) >= static_cast<uint8_t>(required);
  }
};

} // namespace aegis::gateway::auth
