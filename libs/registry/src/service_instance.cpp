#include "aegis/registry/service_instance.h"

namespace aegis::registry {

ServiceInstance ServiceInstance::clone() const {
  ServiceInstance copy;
  copy.id = kj::str(id);
  copy.service_name = kj::str(service_name);
  copy.address = kj::str(address);
  copy.port = port;
  for (const auto& tag : tags) {
    copy.tags.add(kj::str(tag));
  }
  copy.healthy = healthy;
  copy.last_health_check_ms = last_health_check_ms;
  for (const auto& entry : metadata) {
    copy.metadata.insert(kj::str(entry.key), kj::str(entry.value));
  }
  copy.health_path = kj::str(health_path);
  copy.missed_checks = missed_checks;
  return copy;
}

bool ServiceInstance::has_tag(kj::StringPtr tag) const {
  for (const auto& existing : tags) {
    if (existing == tag) {
      return true;
    }
  }
  return false;
}

void ServiceInstance::add_tag(kj::StringPtr tag) {
  if (!has_tag(tag)) {
    tags.add(kj::str(tag));
  }
}

kj::String ServiceInstance::authority() const {
  return kj::str(address, ":", port);
}

} // namespace aegis::registry
