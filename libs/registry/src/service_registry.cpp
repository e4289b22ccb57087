#include "aegis/registry/service_registry.h"

#include "aegis/core/error.h"
#include "aegis/core/metrics.h"

#include <kj/debug.h>
#include <random>

namespace aegis::registry {

namespace {

size_t random_index(size_t bound) {
  thread_local std::random_device rd;
  thread_local std::mt19937_64 gen(rd());
  std::uniform_int_distribution<size_t> dis(0, bound - 1);
  return dis(gen);
}

void update_healthy_gauge(kj::StringPtr service_name, size_t healthy) {
  core::Label labels[] = {{"service"_kj, service_name}};
  core::gauge_set("aegis_registry_healthy_instances"_kj, labels, static_cast<int64_t>(healthy));
}

} // namespace

size_t InstanceSnapshot::healthy_count() const {
  size_t count = 0;
  for (const auto& instance : instances) {
    if (instance.healthy) {
      ++count;
    }
  }
  return count;
}

kj::StringPtr to_string(HealthTransition transition) {
  switch (transition) {
  case HealthTransition::None:
    return "none"_kj;
  case HealthTransition::BecameHealthy:
    return "healthy"_kj;
  case HealthTransition::BecameUnhealthy:
    return "unhealthy"_kj;
  case HealthTransition::Removed:
    return "removed"_kj;
  }
  return "unknown"_kj;
}

ServiceRegistry::ServiceRegistry(RegistryConfig config) : config_(config) {}

kj::Maybe<const ServiceRegistry::ServiceEntry&>
ServiceRegistry::find_entry(kj::StringPtr service_name) const {
  auto lock = services_.lockShared();
  KJ_IF_SOME(entry, lock->find(service_name)) {
    const ServiceEntry& ref = *entry;
    return ref;
  }
  return kj::none;
}

const ServiceRegistry::ServiceEntry& ServiceRegistry::entry_for(kj::StringPtr service_name) {
  KJ_IF_SOME(entry, find_entry(service_name)) {
    return entry;
  }
  using EntryMap = kj::TreeMap<kj::String, kj::Own<ServiceEntry>>;
  auto lock = services_.lockExclusive();
  auto& entry = lock->findOrCreate(service_name, [&]() {
    return EntryMap::Entry{kj::str(service_name), kj::heap<ServiceEntry>()};
  });
  return *entry;
}

kj::Vector<ServiceInstance> ServiceRegistry::copy_instances(const InstanceSnapshot& snapshot) {
  kj::Vector<ServiceInstance> copy(snapshot.instances.size() + 1);
  for (const auto& instance : snapshot.instances) {
    copy.add(instance.clone());
  }
  return copy;
}

size_t ServiceRegistry::publish(kj::StringPtr service_name,
                                kj::Locked<kj::Own<const InstanceSnapshot>>& lock,
                                kj::Vector<ServiceInstance> instances) {
  kj::Own<const InstanceSnapshot> next = kj::atomicRefcounted<InstanceSnapshot>(kj::mv(instances));
  size_t healthy = next->healthy_count();
  *lock = kj::mv(next);
  update_healthy_gauge(service_name, healthy);
  return healthy;
}

void ServiceRegistry::notify(kj::StringPtr service_name, kj::StringPtr id,
                             HealthTransition transition, size_t healthy_count) {
  if (transition == HealthTransition::None) {
    return;
  }
  KJ_LOG(INFO, "Instance health transition", service_name, id, to_string(transition),
         healthy_count);
  KJ_IF_SOME(listener, listener_) {
    listener(HealthEvent{service_name, id, transition, healthy_count});
  }
}

void ServiceRegistry::register_instance(ServiceInstance instance) {
  if (instance.id.size() == 0 || instance.service_name.size() == 0) {
    throw core::InvalidInstanceException("instance id and service name are required"_kj);
  }
  if (instance.address.size() == 0 || instance.port == 0) {
    throw core::InvalidInstanceException(
        kj::str("instance '", instance.id, "' of '", instance.service_name,
                "' is missing its address or port"));
  }

  auto service_name = kj::str(instance.service_name);
  const auto& entry = entry_for(service_name);
  auto lock = entry.current.lockExclusive();
  auto instances = copy_instances(**lock);

  bool replaced = false;
  for (auto& existing : instances) {
    if (existing.id == instance.id) {
      existing = kj::mv(instance);
      replaced = true;
      break;
    }
  }
  if (!replaced) {
    KJ_LOG(INFO, "Instance registered", service_name, instance.id);
    instances.add(kj::mv(instance));
  }
  publish(service_name, lock, kj::mv(instances));
}

void ServiceRegistry::deregister(kj::StringPtr id) {
  for (auto& name : service_names()) {
    if (deregister(name, id)) {
      return;
    }
  }
}

bool ServiceRegistry::deregister(kj::StringPtr service_name, kj::StringPtr id) {
  size_t healthy = 0;
  {
    KJ_IF_SOME(entry, find_entry(service_name)) {
      auto lock = entry.current.lockExclusive();
      kj::Vector<ServiceInstance> kept((*lock)->instances.size());
      bool found = false;
      for (const auto& instance : (*lock)->instances) {
        if (instance.id == id) {
          found = true;
        } else {
          kept.add(instance.clone());
        }
      }
      if (!found) {
        return false;
      }
      healthy = publish(service_name, lock, kj::mv(kept));
    }
    else {
      return false;
    }
  }
  KJ_LOG(INFO, "Instance deregistered", service_name, id);
  notify(service_name, id, HealthTransition::Removed, healthy);
  return true;
}

kj::Own<const InstanceSnapshot> ServiceRegistry::snapshot(kj::StringPtr service_name) const {
  KJ_IF_SOME(entry, find_entry(service_name)) {
    auto lock = entry.current.lockShared();
    return kj::atomicAddRef(**lock);
  }
  return kj::atomicRefcounted<InstanceSnapshot>();
}

kj::Vector<ServiceInstance> ServiceRegistry::list_healthy(kj::StringPtr service_name) const {
  auto current = snapshot(service_name);
  kj::Vector<ServiceInstance> healthy;
  for (const auto& instance : current->instances) {
    if (instance.healthy) {
      healthy.add(instance.clone());
    }
  }
  return healthy;
}

kj::Vector<ServiceInstance> ServiceRegistry::all_instances(kj::StringPtr service_name) const {
  return copy_instances(*snapshot(service_name));
}

kj::Maybe<ServiceInstance> ServiceRegistry::try_pick(kj::StringPtr service_name) const {
  auto current = snapshot(service_name);
  size_t healthy = current->healthy_count();
  if (healthy == 0) {
    return kj::none;
  }
  size_t target = random_index(healthy);
  for (const auto& instance : current->instances) {
    if (!instance.healthy) {
      continue;
    }
    if (target == 0) {
      return instance.clone();
    }
    --target;
  }
  return kj::none;
}

ServiceInstance ServiceRegistry::pick(kj::StringPtr service_name) const {
  KJ_IF_SOME(instance, try_pick(service_name)) {
    return kj::mv(instance);
  }
  throw core::ServiceUnavailableException(
      kj::str("no healthy instance of '", service_name, "'"), service_name);
}

kj::Maybe<ServiceInstance> ServiceRegistry::find(kj::StringPtr service_name,
                                                 kj::StringPtr id) const {
  auto current = snapshot(service_name);
  for (const auto& instance : current->instances) {
    if (instance.id == id) {
      return instance.clone();
    }
  }
  return kj::none;
}

kj::Vector<kj::String> ServiceRegistry::service_names() const {
  auto lock = services_.lockShared();
  kj::Vector<kj::String> names(lock->size());
  for (const auto& entry : *lock) {
    names.add(kj::str(entry.key));
  }
  return names;
}

size_t ServiceRegistry::healthy_count(kj::StringPtr service_name) const {
  return snapshot(service_name)->healthy_count();
}

HealthTransition ServiceRegistry::record_probe(kj::StringPtr service_name, kj::StringPtr id,
                                               bool ok, int64_t now_ms) {
  HealthTransition transition = HealthTransition::None;
  size_t healthy = 0;
  {
    KJ_IF_SOME(entry, find_entry(service_name)) {
      auto lock = entry.current.lockExclusive();
      auto instances = copy_instances(**lock);
      kj::Vector<ServiceInstance> kept(instances.size());
      bool found = false;

      for (auto& instance : instances) {
        if (instance.id != id) {
          kept.add(kj::mv(instance));
          continue;
        }
        found = true;
        instance.last_health_check_ms = now_ms;
        if (ok) {
          instance.missed_checks = 0;
          if (!instance.healthy) {
            instance.healthy = true;
            transition = HealthTransition::BecameHealthy;
          }
          kept.add(kj::mv(instance));
          continue;
        }

        ++instance.missed_checks;
        if (config_.max_missed_checks > 0 && instance.missed_checks >= config_.max_missed_checks) {
          transition = HealthTransition::Removed;
          continue;
        }
        if (instance.healthy) {
          instance.healthy = false;
          transition = HealthTransition::BecameUnhealthy;
        }
        kept.add(kj::mv(instance));
      }

      if (!found) {
        return HealthTransition::None;
      }
      healthy = publish(service_name, lock, kj::mv(kept));
    }
    else {
      return HealthTransition::None;
    }
  }

  if (transition == HealthTransition::Removed) {
    KJ_LOG(INFO, "Instance removed after missed health checks", service_name, id,
           config_.max_missed_checks);
  }
  notify(service_name, id, transition, healthy);
  return transition;
}

void ServiceRegistry::reconcile(const ServiceMap& reported) {
  struct Removal {
    kj::String service_name;
    kj::String id;
    size_t healthy;
  };
  kj::Vector<Removal> removals;

  for (const auto& service : reported) {
    const auto& entry = entry_for(service.key);
    auto lock = entry.current.lockExclusive();
    const auto& previous = (*lock)->instances;

    kj::Vector<ServiceInstance> next(service.value.size());
    for (const auto& incoming : service.value) {
      auto instance = incoming.clone();
      instance.service_name = kj::str(service.key);
      for (const auto& known : previous) {
        if (known.id == instance.id) {
          instance.healthy = known.healthy;
          instance.missed_checks = known.missed_checks;
          instance.last_health_check_ms = known.last_health_check_ms;
          break;
        }
      }
      next.add(kj::mv(instance));
    }

    kj::Vector<kj::String> dropped;
    for (const auto& known : previous) {
      bool still_reported = false;
      for (const auto& instance : next) {
        if (instance.id == known.id) {
          still_reported = true;
          break;
        }
      }
      if (!still_reported) {
        dropped.add(kj::str(known.id));
      }
    }

    size_t healthy = publish(service.key, lock, kj::mv(next));
    for (auto& id : dropped) {
      removals.add(Removal{kj::str(service.key), kj::mv(id), healthy});
    }
  }

  // Services the backend no longer reports at all
  for (auto& name : service_names()) {
    if (reported.find(name) != kj::none) {
      continue;
    }
    KJ_IF_SOME(entry, find_entry(name)) {
      auto lock = entry.current.lockExclusive();
      for (const auto& known : (*lock)->instances) {
        removals.add(Removal{kj::str(name), kj::str(known.id), 0});
      }
      if ((*lock)->instances.size() > 0) {
        publish(name, lock, kj::Vector<ServiceInstance>());
      }
    }
  }

  for (const auto& removal : removals) {
    KJ_LOG(INFO, "Instance removed by reconciliation", removal.service_name, removal.id);
    notify(removal.service_name, removal.id, HealthTransition::Removed, removal.healthy);
  }
}

void ServiceRegistry::set_health_listener(HealthListener listener) {
  listener_ = kj::mv(listener);
}

} // namespace aegis::registry
