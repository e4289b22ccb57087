#include "auth/identity.h"

namespace aegis::gateway::auth {

kj::StringPtr to_string(Tier tier) {
  switch (tier) {
  case Tier::Free:
    return "free"_kj;
  case Tier::Basic:
    return "basic"_kj;
  case Tier::Premium:
    return "premium"_kj;
  case Tier::Enterprise:
    return "enterprise"_kj;
  }
  return "free"_kj;
}

kj::Maybe<Tier> parse_tier(kj::StringPtr name) {
  if (name == "free"_kj) {
    return Tier::Free;
  }
  if (name == "basic"_kj) {
    return Tier::Basic;
  }
  if (name == "premium"_kj) {
    return Tier::Premium;
  }
  if (name == "enterprise"_kj) {
    return Tier::Enterprise;
  }
  return kj::none;
}

Identity Identity::clone() const {
  Identity copy;
  copy.authenticated = authenticated;
  copy.subject = kj::str(subject);
  copy.tier = tier;
  copy.permissions.reserve(permissions.size());
  for (auto& permission : permissions) {
    copy.permissions.add(kj::str(permission));
  }
  return copy;
}

bool Identity::has_permission(kj::StringPtr permission) const {
  if (!authenticated) {
    return false;
  }
  for (auto& held : permissions) {
    if (held == permission) {
      return true;
    }
  }
  return false;
}

} // namespace aegis::gateway::auth
