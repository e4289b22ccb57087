#pragma once

#include "aegis/core/error.h"
#include "aegis/core/time.h"
#include "aegis/registry/service_registry.h"
#include "auth/identity.h"
#include "middleware/rate_limiter.h"
#include "realtime/connection.h"

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <kj/common.h>
#include <kj/map.h>
#include <kj/memory.h>
#include <kj/mutex.h>
#include <kj/string.h>
#include <kj/vector.h>

namespace aegis::gateway::realtime {

/**
 * @brief Configuration for FanoutGateway
 */
struct FanoutConfig {
  size_t max_connections{10000};
  size_t queue_capacity{256};              ///< Outbound frames buffered per connection
  size_t max_channels_per_connection{50};
  int64_t idle_timeout_ms{300000};         ///< Close after this long without inbound frames

  uint64_t subscription_message_limit{10}; ///< subscribe + unsubscribe frames per window
  int64_t subscription_window_ms{10000};
  uint64_t ping_limit{5};
  int64_t ping_window_ms{1000};
};

struct RejectedChannel {
  kj::String channel;
  core::ErrorCode code;
  kj::String reason;
};

struct SubscribeResult {
  kj::Vector<kj::String> accepted;
  kj::Vector<RejectedChannel> rejected;
};

enum class MessageKind {
  Subscription,
  Ping,
};

struct FanoutStats {
  size_t connections{0};
  size_t subscriptions{0};
  size_t channels{0};
  uint64_t delivered{0};
  uint64_t dropped{0};
};

/**
 * @brief Connection registry, channel subscriptions and broadcast
 *
 * Each channel has a fan-out group (the set of subscribed connection ids).
 * Broadcasting only enqueues into each member's bounded queue, so one slow or
 * dead connection never delays delivery to the others.
 *
 * Authorization is checked through can_subscribe() on every subscribe call
 * and never cached.
 *
 * Thread safety: all membership state sits behind one mutex; frames are
 * handed to connections through their own queues.
 */
class FanoutGateway {
public:
  explicit FanoutGateway(FanoutConfig config = FanoutConfig{},
                         core::MillisClock clock = core::steady_millis_clock());
  ~FanoutGateway();

  FanoutGateway(const FanoutGateway&) = delete;
  FanoutGateway& operator=(const FanoutGateway&) = delete;

  /**
   * @brief Register a new connection
   *
   * @return The connection, shared with the gateway, or none when
   *         max_connections is reached
   */
  kj::Maybe<kj::Own<Connection>> open(auth::Identity identity);

  /**
   * @brief Close a connection and cascade-remove all of its subscriptions
   *
   * No-op for unknown ids.
   */
  void disconnect(uint64_t connection_id);

  /**
   * @brief Authorize and record subscriptions
   *
   * Each channel is decided on its own; rejections never abort the others.
   * Channels already held are reported as accepted again. For an unknown
   * connection every channel is rejected with NOT_FOUND.
   */
  SubscribeResult subscribe(uint64_t connection_id, kj::ArrayPtr<const kj::String> channels);

  // Idempotent; unknown connections or channels are ignored
  void unsubscribe(uint64_t connection_id, kj::ArrayPtr<const kj::String> channels);

  /**
   * @brief Deliver an event to every connection subscribed to channel
   * @return Number of connections whose queue accepted the frame
   */
  size_t broadcast(kj::StringPtr channel, kj::StringPtr event, kj::StringPtr payload_json);

  /**
   * @brief Deliver an event to every connection authenticated as subject,
   *        regardless of subscriptions
   */
  size_t broadcast_to_identity(kj::StringPtr subject, kj::StringPtr event,
                               kj::StringPtr payload_json);

  /**
   * @brief Charge one inbound control frame against the per-connection limits
   * @return false when the frame exceeds the limit for its kind
   */
  bool allow_message(uint64_t connection_id, MessageKind kind);

  [[nodiscard]] bool is_subscribed(uint64_t connection_id, kj::StringPtr channel) const;
  [[nodiscard]] kj::Vector<kj::String> subscriptions_of(uint64_t connection_id) const;
  [[nodiscard]] size_t subscriber_count(kj::StringPtr channel) const;
  [[nodiscard]] size_t connection_count() const;
  [[nodiscard]] FanoutStats stats() const;

  // Closes every connection; used on shutdown
  void close_all();

  [[nodiscard]] const FanoutConfig& config() const noexcept {
    return config_;
  }

private:
  struct Entry {
    kj::Own<Connection> connection;
    // channel -> granted at (ms)
    kj::HashMap<kj::String, int64_t> subscriptions;
  };

  // key -> member connection ids
  using Groups = kj::HashMap<kj::String, kj::HashSet<uint64_t>>;

  struct State {
    kj::HashMap<uint64_t, Entry> connections;
    Groups groups;     // by channel
    Groups by_subject; // authenticated connections only
    size_t subscription_total{0};
  };

  static void join_group(Groups& groups, kj::StringPtr key, uint64_t connection_id);
  static void leave_group(Groups& groups, kj::StringPtr key, uint64_t connection_id);
  static void publish_gauges(const State& state);

  FanoutConfig config_;
  core::MillisClock clock_;
  std::atomic<uint64_t> next_id_{1};
  std::atomic<uint64_t> delivered_{0};
  std::atomic<uint64_t> dropped_{0};
  middleware::FixedWindowLimiter message_limits_;
  kj::MutexGuarded<State> state_;
};

/**
 * @brief Publish a registry health transition on the services.health channel
 *
 * The event is named after the transition (e.g. "unhealthy"); the payload carries
 * service, instance and the service's healthy instance count.
 */
size_t publish_health_event(FanoutGateway& gateway, const registry::HealthEvent& event);

} // namespace aegis::gateway::realtime
