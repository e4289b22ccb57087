#pragma once

#include "aegis/core/error.h"
#include "aegis/core/time.h"

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
#include <type_traits>

namespace aegis::resilience {

enum class CircuitState {
  Closed,   // Calls pass through
  Open,     // Calls fail fast until next_retry_at
  HalfOpen, // One trial call decides recovery
};

/**
 * @brief Convert CircuitState to string
 */
[[nodiscard]] inline kj::StringPtr to_string(CircuitState state) {
  switch (state) {
  case CircuitState::Closed:
    return "closed"_kj;
  case CircuitState::Open:
    return "open"_kj;
  case CircuitState::HalfOpen:
    return "half_open"_kj;
  }
  return "unknown"_kj;
}

// Value exported through aegis_breaker_state{key}
[[nodiscard]] inline int64_t gauge_value(CircuitState state) {
  switch (state) {
  case CircuitState::Closed:
    return 0;
  case CircuitState::Open:
    return 1;
  case CircuitState::HalfOpen:
    return 2;
  }
  return 0;
}

/**
 * @brief Breaker policy shared by every key of a registry
 *
 * Move-only because the expected-error allowlist is a kj::Vector.
 */
struct BreakerConfig {
  uint32_t failure_threshold{5};
  int64_t recovery_timeout_ms{10000};
  // > 1.0 grows the recovery timeout after each failed trial, capped below
  double backoff_multiplier{1.0};
  int64_t max_recovery_timeout_ms{300000};
  // Outcomes with these codes never count as failures
  kj::Vector<core::ErrorCode> expected_errors;

  BreakerConfig() {
    expected_errors.add(core::ErrorCode::Cancelled);
  }

  BreakerConfig(BreakerConfig&&) = default;
  BreakerConfig& operator=(BreakerConfig&&) = default;

  [[nodiscard]] bool is_expected(core::ErrorCode code) const;
};

/**
 * @brief Per-key counters, updated without taking the key's mutex
 */
struct CircuitBreakerStats {
  std::atomic<uint64_t> total_requests{0};
  std::atomic<uint64_t> successful_requests{0};
  std::atomic<uint64_t> failed_requests{0};
  std::atomic<uint64_t> ignored_requests{0};
  std::atomic<uint64_t> rejected_requests{0};
  std::atomic<uint64_t> state_transitions{0};

  void reset() {
    total_requests.store(0);
    successful_requests.store(0);
    failed_requests.store(0);
    ignored_requests.store(0);
    rejected_requests.store(0);
    state_transitions.store(0);
  }
};

struct BreakerSnapshot {
  kj::String key;
  CircuitState state{CircuitState::Closed};
  uint32_t consecutive_failures{0};
  kj::Maybe<int64_t> last_failure_at_ms;
  kj::Maybe<int64_t> next_retry_at_ms;
  uint32_t successes_in_half_open{0};
  bool trial_in_flight{false};
  int64_t recovery_timeout_ms{0};
  uint64_t total_requests{0};
  uint64_t successful_requests{0};
  uint64_t failed_requests{0};
  uint64_t rejected_requests{0};
  uint64_t state_transitions{0};
};

// Runs with no breaker lock held, possibly on several threads at once
using StateChangeCallback =
    kj::ConstFunction<void(kj::StringPtr key, CircuitState old_state, CircuitState new_state)>;

class CircuitBreakerRegistry;

/**
 * @brief State of one breaker key; created lazily, never destroyed
 */
struct KeyBreaker {
  struct BreakerState {
    CircuitState state{CircuitState::Closed};
    uint32_t consecutive_failures{0};
    kj::Maybe<int64_t> last_failure_at_ms;
    kj::Maybe<int64_t> next_retry_at_ms;
    uint32_t successes_in_half_open{0};
    bool trial_in_flight{false};
    // Bumped for every admitted trial; only the latest trial may settle HALF_OPEN
    uint64_t trial_generation{0};
    int64_t recovery_timeout_ms{0};
  };

  KeyBreaker(kj::StringPtr name, int64_t recovery_timeout_ms) : key(kj::str(name)) {
    state.getWithoutLock().recovery_timeout_ms = recovery_timeout_ms;
  }

  kj::String key;
  kj::MutexGuarded<BreakerState> state;
  mutable CircuitBreakerStats stats;
};

/**
 * @brief Admission ticket for one downstream call
 *
 * Must be completed exactly once with success(), failure() or ignore(). A permit
 * destroyed without completion is reported as ErrorCode::Cancelled, which the
 * default allowlist does not count against the key.
 */
class CallPermit final {
public:
  CallPermit(CircuitBreakerRegistry& registry, const KeyBreaker& breaker,
             kj::Maybe<uint64_t> trial_generation)
      : registry_(registry), breaker_(breaker), trial_(trial_generation) {}
  ~CallPermit();

  KJ_DISALLOW_COPY_AND_MOVE(CallPermit);

  void success();
  void failure(core::ErrorCode code);
  void ignore();

  [[nodiscard]] bool is_trial() const noexcept {
    return trial_ != kj::none;
  }
  [[nodiscard]] bool completed() const noexcept {
    return completed_;
  }
  [[nodiscard]] kj::StringPtr key() const noexcept {
    return breaker_.key;
  }

private:
  CircuitBreakerRegistry& registry_;
  const KeyBreaker& breaker_;
  kj::Maybe<uint64_t> trial_;
  bool completed_{false};
};

/**
 * @brief Result of CircuitBreakerRegistry::acquire
 *
 * Either a permit, or a rejection with the time at which a call may be tried
 * again.
 */
struct Admission {
  kj::Maybe<kj::Own<CallPermit>> permit;
  int64_t retry_at_ms{0};

  [[nodiscard]] bool admitted() const {
    return permit != kj::none;
  }
};

/**
 * @brief Table of independent circuit breakers keyed by service, method and route
 *
 * Thread safety: the key table is read under a shared lock and written only when
 * a key is first seen. Each key has its own mutex, so keys never contend with
 * each other. Transition callbacks run after the key's mutex is released.
 */
class CircuitBreakerRegistry final {
public:
  explicit CircuitBreakerRegistry(BreakerConfig config = BreakerConfig(),
                                  core::MillisClock clock = core::steady_millis_clock());

  KJ_DISALLOW_COPY_AND_MOVE(CircuitBreakerRegistry);

  /**
   * @brief Ask to place one call through `key`
   *
   * CLOSED admits. OPEN rejects until next_retry_at, then admits exactly one
   * trial and moves to HALF_OPEN. HALF_OPEN rejects while the trial is in flight.
   */
  [[nodiscard]] Admission acquire(kj::StringPtr key);

  /**
   * @brief Run `fn` under the breaker for `key`
   *
   * Throws CircuitOpenException without calling `fn` when rejected. Exceptions
   * from `fn` are recorded (AegisException by its code, anything else as
   * INTERNAL_ERROR) and rethrown. Never retries.
   */
  template <typename Func> auto execute(kj::StringPtr key, Func&& fn) -> decltype(fn()) {
    using Result = decltype(fn());
    auto admission = acquire(key);
    KJ_IF_SOME(permit, admission.permit) {
      try {
        if constexpr (std::is_void_v<Result>) {
          fn();
          permit->success();
          return;
        } else {
          Result result = fn();
          permit->success();
          return result;
        }
      } catch (const core::AegisException& e) {
        permit->failure(e.code());
        throw;
      } catch (...) {
        permit->failure(core::ErrorCode::InternalError);
        throw;
      }
    }
    throw core::CircuitOpenException(kj::str("circuit open for '", key, "'"), key,
                                     retry_after_ms(admission.retry_at_ms));
  }

  [[nodiscard]] CircuitState state(kj::StringPtr key) const;
  [[nodiscard]] kj::Maybe<BreakerSnapshot> snapshot(kj::StringPtr key) const;
  [[nodiscard]] kj::Vector<BreakerSnapshot> snapshots() const;

  // Force CLOSED; returns false when the key was never used
  bool reset(kj::StringPtr key);

  void set_state_change_callback(StateChangeCallback callback);

  [[nodiscard]] const BreakerConfig& config() const noexcept {
    return config_;
  }

  [[nodiscard]] int64_t now_ms() const {
    return clock_();
  }

  // Milliseconds from now until `retry_at_ms`, never negative
  [[nodiscard]] int64_t retry_after_ms(int64_t retry_at_ms) const;

private:
  friend class CallPermit;

  enum class Outcome { Success, Failure, Ignored };

  struct Transition {
    CircuitState from;
    CircuitState to;
  };

  [[nodiscard]] kj::Maybe<const KeyBreaker&> find(kj::StringPtr key) const;
  const KeyBreaker& breaker_for(kj::StringPtr key);

  void complete(const KeyBreaker& breaker, kj::Maybe<uint64_t> trial, Outcome outcome,
                core::ErrorCode code);
  void open(KeyBreaker::BreakerState& state, int64_t now, kj::Maybe<Transition>& transition);
  void move_to(KeyBreaker::BreakerState& state, CircuitState next,
               kj::Maybe<Transition>& transition);
  void publish(const KeyBreaker& breaker, kj::Maybe<Transition> transition);

  BreakerConfig config_;
  mutable core::MillisClock clock_;
  kj::MutexGuarded<kj::TreeMap<kj::String, kj::Own<KeyBreaker>>> breakers_;
  struct CallbackSlot final : public kj::AtomicRefcounted {
    explicit CallbackSlot(StateChangeCallback fn) : callback(kj::mv(fn)) {}
    StateChangeCallback callback;
  };

  // Swapped whole; publish() holds a reference, not the mutex, while calling
  kj::MutexGuarded<kj::Maybe<kj::Own<const CallbackSlot>>> callback_;
};

} // namespace aegis::resilience
