#include "realtime/fanout_gateway.h"

#include "aegis/core/json.h"
#include "aegis/core/metrics.h"
#include "realtime/channel_policy.h"
#include "realtime/frame_codec.h"

#include <kj/debug.h>

namespace aegis::gateway::realtime {

FanoutGateway::FanoutGateway(FanoutConfig config, core::MillisClock clock)
    : config_(kj::mv(config)), clock_(kj::mv(clock)) {
  KJ_REQUIRE(config_.max_connections > 0, "max_connections must be positive");
  KJ_REQUIRE(config_.queue_capacity > 0, "queue_capacity must be positive");
}

FanoutGateway::~FanoutGateway() {
  close_all();
}

kj::Maybe<kj::Own<Connection>> FanoutGateway::open(auth::Identity identity) {
  auto lock = state_.lockExclusive();
  if (lock->connections.size() >= config_.max_connections) {
    KJ_LOG(WARNING, "WebSocket connection limit reached", config_.max_connections);
    return kj::none;
  }

  auto id = next_id_.fetch_add(1, std::memory_order_relaxed);
  auto connection = kj::refcounted<Connection>(id, kj::mv(identity), config_.queue_capacity);
  auto& owner = connection->identity();
  if (owner.authenticated) {
    join_group(lock->by_subject, owner.subject, id);
  }
  lock->connections.insert(id, Entry{kj::addRef(*connection), kj::HashMap<kj::String, int64_t>()});
  publish_gauges(*lock);
  return kj::mv(connection);
}

void FanoutGateway::disconnect(uint64_t connection_id) {
  kj::Maybe<kj::Own<Connection>> removed;
  {
    auto lock = state_.lockExclusive();
    KJ_IF_SOME(entry, lock->connections.find(connection_id)) {
      for (auto& subscription : entry.subscriptions) {
        leave_group(lock->groups, subscription.key, connection_id);
      }
      lock->subscription_total -= entry.subscriptions.size();

      auto& owner = entry.connection->identity();
      if (owner.authenticated) {
        leave_group(lock->by_subject, owner.subject, connection_id);
      }
      removed = kj::mv(entry.connection);
    }
    else {
      return;
    }
    lock->connections.erase(connection_id);
    publish_gauges(*lock);
  }

  message_limits_.reset(kj::str(connection_id, ":sub"));
  message_limits_.reset(kj::str(connection_id, ":ping"));

  KJ_IF_SOME(connection, removed) {
    connection->close();
  }
}

SubscribeResult FanoutGateway::subscribe(uint64_t connection_id,
                                         kj::ArrayPtr<const kj::String> channels) {
  SubscribeResult result;
  auto now = clock_();

  auto lock = state_.lockExclusive();
  KJ_IF_SOME(entry, lock->connections.find(connection_id)) {
    for (auto& channel : channels) {
      if (entry.subscriptions.find(channel) != kj::none) {
        result.accepted.add(kj::str(channel));
        continue;
      }

      auto decision = can_subscribe(entry.connection->identity(), channel);
      if (!decision.allowed) {
        result.rejected.add(RejectedChannel{kj::str(channel), decision.code, kj::str(decision.reason)});
        continue;
      }
      if (entry.subscriptions.size() >= config_.max_channels_per_connection) {
        result.rejected.add(RejectedChannel{kj::str(channel), core::ErrorCode::ResourceExhausted,
                                            kj::str("channel limit reached")});
        continue;
      }

      entry.subscriptions.insert(kj::str(channel), now);
      join_group(lock->groups, channel, connection_id);
      ++lock->subscription_total;
      result.accepted.add(kj::str(channel));
    }
    publish_gauges(*lock);
  }
  else {
    for (auto& channel : channels) {
      result.rejected.add(RejectedChannel{kj::str(channel), core::ErrorCode::NotFound,
                                          kj::str("unknown connection")});
    }
  }
  return result;
}

void FanoutGateway::unsubscribe(uint64_t connection_id, kj::ArrayPtr<const kj::String> channels) {
  auto lock = state_.lockExclusive();
  KJ_IF_SOME(entry, lock->connections.find(connection_id)) {
    for (auto& channel : channels) {
      if (entry.subscriptions.erase(channel)) {
        leave_group(lock->groups, channel, connection_id);
        --lock->subscription_total;
      }
    }
    publish_gauges(*lock);
  }
}

size_t FanoutGateway::broadcast(kj::StringPtr channel, kj::StringPtr event,
                                kj::StringPtr payload_json) {
  auto frame = event_frame(channel, event, payload_json);
  size_t delivered = 0;
  size_t dropped = 0;

  {
    auto lock = state_.lockExclusive();
    KJ_IF_SOME(members, lock->groups.find(channel)) {
      for (auto id : members) {
        KJ_IF_SOME(entry, lock->connections.find(id)) {
          if (entry.connection->enqueue(kj::str(frame))) {
            ++delivered;
          } else {
            ++dropped;
          }
        }
      }
    }
  }

  delivered_.fetch_add(delivered, std::memory_order_relaxed);
  dropped_.fetch_add(dropped, std::memory_order_relaxed);
  return delivered;
}

size_t FanoutGateway::broadcast_to_identity(kj::StringPtr subject, kj::StringPtr event,
                                            kj::StringPtr payload_json) {
  auto frame = direct_frame(event, payload_json);
  size_t delivered = 0;
  size_t dropped = 0;

  {
    auto lock = state_.lockExclusive();
    KJ_IF_SOME(members, lock->by_subject.find(subject)) {
      for (auto id : members) {
        KJ_IF_SOME(entry, lock->connections.find(id)) {
          if (entry.connection->enqueue(kj::str(frame))) {
            ++delivered;
          } else {
            ++dropped;
          }
        }
      }
    }
  }

  delivered_.fetch_add(delivered, std::memory_order_relaxed);
  dropped_.fetch_add(dropped, std::memory_order_relaxed);
  return delivered;
}

bool FanoutGateway::allow_message(uint64_t connection_id, MessageKind kind) {
  auto now = clock_();
  switch (kind) {
  case MessageKind::Subscription:
    return message_limits_
        .try_acquire(kj::str(connection_id, ":sub"), config_.subscription_message_limit,
                     config_.subscription_window_ms, now)
        .allowed;
  case MessageKind::Ping:
    return message_limits_
        .try_acquire(kj::str(connection_id, ":ping"), config_.ping_limit, config_.ping_window_ms,
                     now)
        .allowed;
  }
  KJ_UNREACHABLE;
}

bool FanoutGateway::is_subscribed(uint64_t connection_id, kj::StringPtr channel) const {
  auto lock = state_.lockShared();
  KJ_IF_SOME(entry, lock->connections.find(connection_id)) {
    return entry.subscriptions.find(channel) != kj::none;
  }
  return false;
}

kj::Vector<kj::String> FanoutGateway::subscriptions_of(uint64_t connection_id) const {
  kj::Vector<kj::String> channels;
  auto lock = state_.lockShared();
  KJ_IF_SOME(entry, lock->connections.find(connection_id)) {
    for (auto& subscription : entry.subscriptions) {
      channels.add(kj::str(subscription.key));
    }
  }
  return channels;
}

size_t FanoutGateway::subscriber_count(kj::StringPtr channel) const {
  auto lock = state_.lockShared();
  KJ_IF_SOME(members, lock->groups.find(channel)) {
    return members.size();
  }
  return 0;
}

size_t FanoutGateway::connection_count() const {
  return state_.lockShared()->connections.size();
}

FanoutStats FanoutGateway::stats() const {
  FanoutStats stats;
  {
    auto lock = state_.lockShared();
    stats.connections = lock->connections.size();
    stats.subscriptions = lock->subscription_total;
    stats.channels = lock->groups.size();
  }
  stats.delivered = delivered_.load(std::memory_order_relaxed);
  stats.dropped = dropped_.load(std::memory_order_relaxed);
  return stats;
}

void FanoutGateway::close_all() {
  kj::Vector<kj::Own<Connection>> closing;
  {
    auto lock = state_.lockExclusive();
    for (auto& entry : lock->connections) {
      closing.add(kj::mv(entry.value.connection));
    }
    lock->connections.clear();
    lock->groups.clear();
    lock->by_subject.clear();
    lock->subscription_total = 0;
    publish_gauges(*lock);
  }

  for (auto& connection : closing) {
    connection->close();
  }
  if (closing.size() > 0) {
    KJ_LOG(INFO, "Closed all WebSocket connections", closing.size());
  }
}

void FanoutGateway::join_group(Groups& groups, kj::StringPtr key, uint64_t connection_id) {
  KJ_IF_SOME(members, groups.find(key)) {
    if (!members.contains(connection_id)) {
      members.insert(connection_id);
    }
  }
  else {
    kj::HashSet<uint64_t> members;
    members.insert(connection_id);
    groups.insert(kj::str(key), kj::mv(members));
  }
}

void FanoutGateway::leave_group(Groups& groups, kj::StringPtr key, uint64_t connection_id) {
  bool now_empty = false;
  KJ_IF_SOME(members, groups.find(key)) {
    members.eraseMatch(connection_id);
    now_empty = members.size() == 0;
  }
  if (now_empty) {
    groups.erase(key);
  }
}

void FanoutGateway::publish_gauges(const State& state) {
  core::gauge_set("aegis_ws_connections"_kj, nullptr, static_cast<int64_t>(state.connections.size()));
  core::gauge_set("aegis_ws_subscriptions"_kj, nullptr,
                  static_cast<int64_t>(state.subscription_total));
}

size_t publish_health_event(FanoutGateway& gateway, const registry::HealthEvent& event) {
  auto payload = core::JsonBuilder::object()
                     .put("service"_kj, event.service_name)
                     .put("instance"_kj, event.instance_id)
                     .put("healthyInstances"_kj, static_cast<int64_t>(event.healthy_count))
                     .build();
  return gateway.broadcast("services.health"_kj, registry::to_string(event.transition), payload);
}

} // namespace aegis::gateway::realtime
