#pragma once

#include <cstdint>
#include <kj/common.h>
#include <kj/map.h>
#include <kj/string.h>
#include <kj/vector.h>

namespace aegis::registry {

/**
 * @brief One running copy of a logical service
 *
 * (service_name, id) identifies an instance. `healthy` is the only flag the
 * proxy consults when choosing where to send a request.
 */
struct ServiceInstance {
  kj::String id;
  kj::String service_name;
  kj::String address;
  uint16_t port{0};
  kj::Vector<kj::String> tags;
  bool healthy{true};
  int64_t last_health_check_ms{0};
  kj::TreeMap<kj::String, kj::String> metadata;

  kj::String health_path = kj::str("/health");
  uint32_t missed_checks{0};

  ServiceInstance() = default;
  ServiceInstance(ServiceInstance&&) = default;
  ServiceInstance& operator=(ServiceInstance&&) = default;
  ServiceInstance(const ServiceInstance&) = delete;
  ServiceInstance& operator=(const ServiceInstance&) = delete;

  [[nodiscard]] ServiceInstance clone() const;

  [[nodiscard]] bool has_tag(kj::StringPtr tag) const;

  // Adds the tag unless already present
  void add_tag(kj::StringPtr tag);

  // "address:port"
  [[nodiscard]] kj::String authority() const;
};

} // namespace aegis::registry
