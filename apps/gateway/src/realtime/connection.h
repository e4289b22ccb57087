#pragma once

#include "auth/identity.h"

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <kj/async.h>
#include <kj/common.h>
#include <kj/memory.h>
#include <kj/mutex.h>
#include <kj/refcount.h>
#include <kj/string.h>
#include <kj/vector.h>

namespace aegis::gateway::realtime {

/**
 * @brief One client connection as seen by the fan-out gateway
 *
 * Outbound frames go through a bounded queue drained by a single send loop
 * (next_frame()). enqueue() never blocks: when the queue is full the new frame
 * is dropped and counted, so a slow client cannot stall a broadcast.
 *
 * Shared between the FanoutGateway (which routes frames to it) and the
 * WebSocket session (which drains it); whichever lets go last frees it.
 */
class Connection : public kj::Refcounted {
public:
  Connection(uint64_t id, auth::Identity identity, size_t queue_capacity);
  ~Connection() noexcept;

  [[nodiscard]] uint64_t id() const noexcept {
    return id_;
  }
  [[nodiscard]] const auth::Identity& identity() const noexcept {
    return identity_;
  }

  /**
   * @brief Queue a frame for sending
   * @return false if the connection is closed or the frame was dropped
   */
  bool enqueue(kj::String frame);

  /**
   * @brief Next queued frame, waiting if none is queued
   *
   * Resolves to none once the connection is closed. Only one call may be
   * outstanding at a time.
   */
  kj::Promise<kj::Maybe<kj::String>> next_frame();

  void close();
  [[nodiscard]] bool is_closed() const;

  [[nodiscard]] size_t queued() const;
  [[nodiscard]] uint64_t delivered() const noexcept {
    return delivered_.load(std::memory_order_relaxed);
  }
  [[nodiscard]] uint64_t dropped() const noexcept {
    return dropped_.load(std::memory_order_relaxed);
  }

private:
  Connection(const Connection&) = delete;
  Connection& operator=(const Connection&) = delete;

  struct QueueState {
    kj::Maybe<kj::Own<kj::CrossThreadPromiseFulfiller<kj::Maybe<kj::String>>>> fulfiller;
    kj::Vector<kj::String> pending;
    size_t pending_head{0};
  };

  void record_drop();

  const uint64_t id_;
  const auth::Identity identity_;
  const size_t capacity_;

  std::atomic<bool> closed_{false};
  std::atomic<uint64_t> delivered_{0};
  std::atomic<uint64_t> dropped_{0};

  kj::MutexGuarded<QueueState> state_;
};

} // namespace aegis::gateway::realtime
