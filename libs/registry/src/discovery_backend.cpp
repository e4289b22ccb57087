#include "aegis/registry/discovery_backend.h"

#include "aegis/core/error.h"

#include <kj/debug.h>

namespace aegis::registry {

namespace {

ServiceMap clone_map(const ServiceMap& source) {
  ServiceMap copy;
  for (const auto& entry : source) {
    kj::Vector<ServiceInstance> instances(entry.value.size());
    for (const auto& instance : entry.value) {
      instances.add(instance.clone());
    }
    copy.insert(kj::str(entry.key), kj::mv(instances));
  }
  return copy;
}

} // namespace

kj::Own<StaticDiscoveryBackend> StaticDiscoveryBackend::from_catalog(const core::JsonValue& root) {
  auto backend = kj::heap<StaticDiscoveryBackend>();
  auto services = root["services"];
  if (!services.is_array()) {
    throw core::ValidationException("service catalog must contain a \"services\" array"_kj);
  }

  services.for_each_array([&](const core::JsonValue& service) {
    auto name = service["name"].get_string();
    if (name.size() == 0) {
      throw core::ValidationException("service entry without a name"_kj);
    }
    auto health_path = service["health_path"].get_string("/health"_kj);

    service["instances"].for_each_array([&](const core::JsonValue& node) {
      ServiceInstance instance;
      instance.service_name = kj::str(name);
      instance.id = node["id"].get_string();
      instance.address = node["address"].get_string();
      auto port = node["port"].get_int(0);
      if (instance.id.size() == 0 || instance.address.size() == 0 || port <= 0 || port > 65535) {
        throw core::ValidationException(
            kj::str("instance of service '", name, "' needs id, address and a valid port"));
      }
      instance.port = static_cast<uint16_t>(port);
      instance.health_path = kj::str(health_path);
      node["tags"].for_each_array([&](const core::JsonValue& tag) {
        if (tag.is_string()) {
          instance.add_tag(tag.get_string());
        }
      });
      node["metadata"].for_each_object([&](kj::StringPtr key, const core::JsonValue& value) {
        instance.metadata.upsert(kj::str(key), value.is_string() ? value.get_string() : value.to_json());
      });
      backend->register_instance(instance);
    });
  });

  return backend;
}

ServiceMap StaticDiscoveryBackend::list_all_services() {
  return clone_map(*services_.lockShared());
}

void StaticDiscoveryBackend::register_instance(const ServiceInstance& instance) {
  auto lock = services_.lockExclusive();
  auto& instances = lock->findOrCreate(instance.service_name, [&]() {
    return ServiceMap::Entry{kj::str(instance.service_name), kj::Vector<ServiceInstance>()};
  });
  for (auto& existing : instances) {
    if (existing.id == instance.id) {
      existing = instance.clone();
      return;
    }
  }
  instances.add(instance.clone());
}

void StaticDiscoveryBackend::deregister_instance(kj::StringPtr service_name, kj::StringPtr id) {
  auto lock = services_.lockExclusive();
  KJ_IF_SOME(instances, lock->find(service_name)) {
    kj::Vector<ServiceInstance> kept(instances.size());
    for (auto& instance : instances) {
      if (instance.id != id) {
        kept.add(kj::mv(instance));
      }
    }
    instances = kj::mv(kept);
  }
}

size_t StaticDiscoveryBackend::instance_count() const {
  auto lock = services_.lockShared();
  size_t total = 0;
  for (const auto& entry : *lock) {
    total += entry.value.size();
  }
  return total;
}

} // namespace aegis::registry
