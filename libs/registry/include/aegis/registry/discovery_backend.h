#pragma once

#include "aegis/core/json.h"
#include "aegis/registry/service_instance.h"

#include <kj/common.h>
#include <kj/map.h>
#include <kj/memory.h>
#include <kj/mutex.h>
#include <kj/string.h>
#include <kj/vector.h>

namespace aegis::registry {

using ServiceMap = kj::TreeMap<kj::String, kj::Vector<ServiceInstance>>;

/**
 * @brief Source of truth for which instances exist
 *
 * Any concrete backend (Consul-like, DNS-SD, static file) implements this. The
 * registry pulls list_all_services() periodically to reconcile its catalog.
 */
class DiscoveryBackend {
public:
  virtual ~DiscoveryBackend() noexcept(false) = default;

  [[nodiscard]] virtual ServiceMap list_all_services() = 0;

  virtual void register_instance(const ServiceInstance& instance) = 0;
  virtual void deregister_instance(kj::StringPtr service_name, kj::StringPtr id) = 0;
};

/**
 * @brief In-memory backend seeded from the service catalog file
 *
 * Catalog format:
 * {"services":[{"name","health_path","instances":[{"id","address","port","tags","metadata"}]}]}
 */
class StaticDiscoveryBackend final : public DiscoveryBackend {
public:
  StaticDiscoveryBackend() = default;

  /**
   * @brief Build a backend from a parsed catalog document
   * @throws ValidationException when an entry is missing its name, address or port
   */
  static kj::Own<StaticDiscoveryBackend> from_catalog(const core::JsonValue& root);

  [[nodiscard]] ServiceMap list_all_services() override;
  void register_instance(const ServiceInstance& instance) override;
  void deregister_instance(kj::StringPtr service_name, kj::StringPtr id) override;

  [[nodiscard]] size_t instance_count() const;

private:
  kj::MutexGuarded<ServiceMap> services_;
};

} // namespace aegis::registry
