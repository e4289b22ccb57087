#pragma once

#include "aegis/registry/discovery_backend.h"
#include "aegis/registry/service_instance.h"

#include <atomic>
#include <cstdint>
#include <kj/common.h>
#include <kj/function.h>
#include <kj/map.h>
#include <kj/memory.h>
#include <kj/mutex.h>
#include <kj/refcount.h>
#include <kj/string.h>
#include <kj/vector.h>

namespace aegis::registry {

/**
 * @brief Immutable instance list of one service
 *
 * Published by atomic reference swap; readers hold a reference and never
 * observe a partially updated list.
 */
struct InstanceSnapshot final : public kj::AtomicRefcounted {
  kj::Vector<ServiceInstance> instances;

  InstanceSnapshot() = default;
  explicit InstanceSnapshot(kj::Vector<ServiceInstance> list) : instances(kj::mv(list)) {}

  [[nodiscard]] size_t healthy_count() const;
};

enum class HealthTransition {
  None,
  BecameHealthy,
  BecameUnhealthy,
  Removed,
};

[[nodiscard]] kj::StringPtr to_string(HealthTransition transition);

struct HealthEvent {
  kj::StringPtr service_name;
  kj::StringPtr instance_id;
  HealthTransition transition;
  size_t healthy_count;
};

using HealthListener = kj::Function<void(const HealthEvent& event)>;

struct RegistryConfig {
  // Consecutive failed probes before an instance is dropped; 0 keeps it forever
  uint32_t max_missed_checks{10};
};

/**
 * @brief Live set of instances per logical service
 *
 * Thread safety: the service -> entry map is read under a shared lock and only
 * written when a service name first appears. Each entry serializes its own
 * writers and publishes a new InstanceSnapshot per mutation, so request paths
 * reading one service never contend with the health loop writing another.
 */
class ServiceRegistry final {
public:
  explicit ServiceRegistry(RegistryConfig config = RegistryConfig{});

  ServiceRegistry(const ServiceRegistry&) = delete;
  ServiceRegistry& operator=(const ServiceRegistry&) = delete;

  /**
   * @brief Idempotent upsert by (service_name, id)
   * @throws InvalidInstanceException if id, service name, address or port is missing
   */
  void register_instance(ServiceInstance instance);

  // No-op when the instance is already gone
  void deregister(kj::StringPtr id);
  bool deregister(kj::StringPtr service_name, kj::StringPtr id);

  // Healthy instances only; empty (never an error) when none
  [[nodiscard]] kj::Vector<ServiceInstance> list_healthy(kj::StringPtr service_name) const;
  [[nodiscard]] kj::Vector<ServiceInstance> all_instances(kj::StringPtr service_name) const;

  /**
   * @brief Uniform random choice among healthy instances
   * @throws ServiceUnavailableException when no healthy instance exists
   */
  [[nodiscard]] ServiceInstance pick(kj::StringPtr service_name) const;
  [[nodiscard]] kj::Maybe<ServiceInstance> try_pick(kj::StringPtr service_name) const;

  [[nodiscard]] kj::Maybe<ServiceInstance> find(kj::StringPtr service_name,
                                                kj::StringPtr id) const;
  [[nodiscard]] kj::Vector<kj::String> service_names() const;
  [[nodiscard]] size_t healthy_count(kj::StringPtr service_name) const;

  // Current snapshot, or an empty one for unknown services
  [[nodiscard]] kj::Own<const InstanceSnapshot> snapshot(kj::StringPtr service_name) const;

  /**
   * @brief Apply one probe outcome
   *
   * A failed probe only marks the instance unhealthy until max_missed_checks
   * consecutive failures, at which point it is removed.
   */
  HealthTransition record_probe(kj::StringPtr service_name, kj::StringPtr id, bool ok,
                                int64_t now_ms);

  /**
   * @brief Align the catalog with what the discovery backend reports
   *
   * Reported instances are upserted keeping their known health state; instances
   * no longer reported are removed.
   */
  void reconcile(const ServiceMap& reported);

  // Invoked outside registry locks; set before the health loop starts
  void set_health_listener(HealthListener listener);

  [[nodiscard]] const RegistryConfig& config() const noexcept {
    return config_;
  }

private:
  struct ServiceEntry {
    kj::MutexGuarded<kj::Own<const InstanceSnapshot>> current;

    ServiceEntry() : current(kj::atomicRefcounted<InstanceSnapshot>()) {}
  };

  // Entries are never removed, so references stay valid after the map lock is released
  [[nodiscard]] kj::Maybe<const ServiceEntry&> find_entry(kj::StringPtr service_name) const;
  const ServiceEntry& entry_for(kj::StringPtr service_name);

  static kj::Vector<ServiceInstance> copy_instances(const InstanceSnapshot& snapshot);
  static size_t publish(kj::StringPtr service_name, kj::Locked<kj::Own<const InstanceSnapshot>>& lock,
                        kj::Vector<ServiceInstance> instances);
  void notify(kj::StringPtr service_name, kj::StringPtr id, HealthTransition transition,
              size_t healthy_count);

  RegistryConfig config_;
  kj::MutexGuarded<kj::TreeMap<kj::String, kj::Own<ServiceEntry>>> services_;
  kj::Maybe<HealthListener> listener_;
};

} // namespace aegis::registry
