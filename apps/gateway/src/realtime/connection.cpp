#include "realtime/connection.h"

#include "aegis/core/metrics.h"

#include <kj/debug.h>

namespace aegis::gateway::realtime {

Connection::Connection(uint64_t id, auth::Identity identity, size_t queue_capacity)
    : id_(id), identity_(kj::mv(identity)), capacity_(queue_capacity) {
  KJ_REQUIRE(queue_capacity > 0, "connection queue capacity must be positive");
}

Connection::~Connection() noexcept {
  close();
}

bool Connection::enqueue(kj::String frame) {
  if (closed_.load(std::memory_order_acquire)) {
    return false;
  }

  auto lock = state_.lockExclusive();
  KJ_IF_SOME(fulfiller, lock->fulfiller) {
    fulfiller->fulfill(kj::mv(frame));
    lock->fulfiller = kj::none;
    delivered_.fetch_add(1, std::memory_order_relaxed);
    return true;
  }

  if (lock->pending.size() - lock->pending_head >= capacity_) {
    record_drop();
    return false;
  }

  lock->pending.add(kj::mv(frame));
  delivered_.fetch_add(1, std::memory_order_relaxed);
  return true;
}

kj::Promise<kj::Maybe<kj::String>> Connection::next_frame() {
  if (closed_.load(std::memory_order_acquire)) {
    return kj::Maybe<kj::String>(kj::none);
  }

  auto lock = state_.lockExclusive();
  if (lock->pending_head < lock->pending.size()) {
    auto frame = kj::mv(lock->pending[lock->pending_head]);
    ++lock->pending_head;
    if (lock->pending_head == lock->pending.size()) {
      lock->pending.clear();
      lock->pending_head = 0;
    }
    return kj::Maybe<kj::String>(kj::mv(frame));
  }

  auto paf = kj::newPromiseAndCrossThreadFulfiller<kj::Maybe<kj::String>>();
  lock->fulfiller = kj::mv(paf.fulfiller);
  return kj::mv(paf.promise);
}

void Connection::close() {
  if (closed_.exchange(true, std::memory_order_acq_rel)) {
    return;
  }

  auto lock = state_.lockExclusive();
  lock->pending.clear();
  lock->pending_head = 0;
  KJ_IF_SOME(fulfiller, lock->fulfiller) {
    fulfiller->fulfill(kj::none);
    lock->fulfiller = kj::none;
  }
}

bool Connection::is_closed() const {
  return closed_.load(std::memory_order_acquire);
}

size_t Connection::queued() const {
  auto lock = state_.lockShared();
  return lock->pending.size() - lock->pending_head;
}

void Connection::record_drop() {
  auto total = dropped_.fetch_add(1, std::memory_order_relaxed) + 1;
  core::counter_inc("aegis_ws_dropped_messages_total"_kj);
  // Logged on the first drop and every 100th after
  if (total == 1 || total % 100 == 0) {
    KJ_LOG(WARNING, "Outbound queue full, dropping frame", id_, capacity_, total);
  }
}

} // namespace aegis::gateway::realtime
