#include "aegis/resilience/circuit_breaker.h"

#include "aegis/core/metrics.h"

#include <algorithm>
#include <kj/debug.h>

namespace aegis::resilience {

namespace {

// Retry hint handed out while a half-open trial is in flight
constexpr int64_t kTrialInFlightRetryMs = 1000;

void export_state(kj::StringPtr key, CircuitState state) {
  const core::Label labels[] = {{"key"_kj, key}};
  core::gauge_set("aegis_breaker_state"_kj, labels, gauge_value(state));
}

} // namespace

bool BreakerConfig::is_expected(core::ErrorCode code) const {
  for (auto expected : expected_errors) {
    if (expected == code) {
      return true;
    }
  }
  return false;
}

// CallPermit ----------------------------------------------------------------

CallPermit::~CallPermit() {
  if (!completed_) {
    completed_ = true;
    registry_.complete(breaker_, trial_, CircuitBreakerRegistry::Outcome::Failure,
                       core::ErrorCode::Cancelled);
  }
}

void CallPermit::success() {
  KJ_REQUIRE(!completed_, "call permit already completed", breaker_.key);
  completed_ = true;
  registry_.complete(breaker_, trial_, CircuitBreakerRegistry::Outcome::Success,
                     core::ErrorCode::Success);
}

void CallPermit::failure(core::ErrorCode code) {
  KJ_REQUIRE(!completed_, "call permit already completed", breaker_.key);
  completed_ = true;
  registry_.complete(breaker_, trial_, CircuitBreakerRegistry::Outcome::Failure, code);
}

void CallPermit::ignore() {
  KJ_REQUIRE(!completed_, "call permit already completed", breaker_.key);
  completed_ = true;
  registry_.complete(breaker_, trial_, CircuitBreakerRegistry::Outcome::Ignored,
                     core::ErrorCode::Success);
}

// CircuitBreakerRegistry ----------------------------------------------------

CircuitBreakerRegistry::CircuitBreakerRegistry(BreakerConfig config, core::MillisClock clock)
    : config_(kj::mv(config)), clock_(kj::mv(clock)) {
  AEGIS_REQUIRE(config_.failure_threshold > 0, "failure threshold must be positive");
  AEGIS_REQUIRE(config_.recovery_timeout_ms > 0, "recovery timeout must be positive");
  if (config_.max_recovery_timeout_ms < config_.recovery_timeout_ms) {
    config_.max_recovery_timeout_ms = config_.recovery_timeout_ms;
  }
}

kj::Maybe<const KeyBreaker&> CircuitBreakerRegistry::find(kj::StringPtr key) const {
  auto lock = breakers_.lockShared();
  KJ_IF_SOME(breaker, lock->find(key)) {
    const KeyBreaker& ref = *breaker;
    return ref;
  }
  return kj::none;
}

const KeyBreaker& CircuitBreakerRegistry::breaker_for(kj::StringPtr key) {
  KJ_IF_SOME(breaker, find(key)) {
    return breaker;
  }
  using BreakerMap = kj::TreeMap<kj::String, kj::Own<KeyBreaker>>;
  bool created = false;
  const KeyBreaker* result = nullptr;
  {
    auto lock = breakers_.lockExclusive();
    auto& breaker = lock->findOrCreate(key, [&]() {
      created = true;
      return BreakerMap::Entry{kj::str(key), kj::heap<KeyBreaker>(key, config_.recovery_timeout_ms)};
    });
    result = breaker.get();
  }
  if (created) {
    export_state(key, CircuitState::Closed);
  }
  return *result;
}

int64_t CircuitBreakerRegistry::retry_after_ms(int64_t retry_at_ms) const {
  return std::max<int64_t>(0, retry_at_ms - now_ms());
}

Admission CircuitBreakerRegistry::acquire(kj::StringPtr key) {
  auto& breaker = breaker_for(key);
  breaker.stats.total_requests++;

  int64_t now = now_ms();
  kj::Maybe<Transition> transition;
  Admission admission;
  {
    auto lock = breaker.state.lockExclusive();
    switch (lock->state) {
    case CircuitState::Closed:
      admission.permit = kj::heap<CallPermit>(*this, breaker, kj::none);
      break;

    case CircuitState::Open: {
      int64_t retry_at = now;
      KJ_IF_SOME(next, lock->next_retry_at_ms) {
        retry_at = next;
      }
      if (now >= retry_at) {
        move_to(*lock, CircuitState::HalfOpen, transition);
        lock->trial_in_flight = true;
        admission.permit = kj::heap<CallPermit>(*this, breaker, ++lock->trial_generation);
      } else {
        admission.retry_at_ms = retry_at;
      }
      break;
    }

    case CircuitState::HalfOpen:
      if (lock->trial_in_flight) {
        admission.retry_at_ms = now + kTrialInFlightRetryMs;
      } else {
        // Previous trial was ignored or cancelled; admit a new one
        lock->trial_in_flight = true;
        admission.permit = kj::heap<CallPermit>(*this, breaker, ++lock->trial_generation);
      }
      break;
    }
  }

  if (!admission.admitted()) {
    breaker.stats.rejected_requests++;
    KJ_LOG(DBG, "Circuit breaker rejected call", key, admission.retry_at_ms);
  }
  publish(breaker, transition);
  return admission;
}

void CircuitBreakerRegistry::complete(const KeyBreaker& breaker, kj::Maybe<uint64_t> trial,
                                      Outcome outcome, core::ErrorCode code) {
  if (outcome == Outcome::Failure && config_.is_expected(code)) {
    outcome = Outcome::Ignored;
  }

  int64_t now = now_ms();
  kj::Maybe<Transition> transition;
  {
    auto lock = breaker.state.lockExclusive();
    // A trial from before a reset() or an earlier half-open round is stale
    bool current_trial = false;
    KJ_IF_SOME(generation, trial) {
      current_trial =
          lock->state == CircuitState::HalfOpen && generation == lock->trial_generation;
    }
    if (current_trial) {
      lock->trial_in_flight = false;
    }

    switch (outcome) {
    case Outcome::Success:
      breaker.stats.successful_requests++;
      if (current_trial) {
        lock->successes_in_half_open++;
        move_to(*lock, CircuitState::Closed, transition);
      } else if (lock->state == CircuitState::Closed) {
        lock->consecutive_failures = 0;
      }
      break;

    case Outcome::Failure:
      breaker.stats.failed_requests++;
      lock->last_failure_at_ms = now;
      if (current_trial) {
        if (config_.backoff_multiplier > 1.0) {
          auto grown = static_cast<int64_t>(static_cast<double>(lock->recovery_timeout_ms) *
                                            config_.backoff_multiplier);
          lock->recovery_timeout_ms = std::min(grown, config_.max_recovery_timeout_ms);
        }
        open(*lock, now, transition);
      } else if (lock->state == CircuitState::Closed) {
        lock->consecutive_failures++;
        if (lock->consecutive_failures >= config_.failure_threshold) {
          open(*lock, now, transition);
        }
      }
      // Late failures of calls admitted before the breaker opened change nothing
      break;

    case Outcome::Ignored:
      breaker.stats.ignored_requests++;
      break;
    }
  }
  publish(breaker, transition);
}

void CircuitBreakerRegistry::open(KeyBreaker::BreakerState& state, int64_t now,
                                  kj::Maybe<Transition>& transition) {
  move_to(state, CircuitState::Open, transition);
  state.next_retry_at_ms = now + state.recovery_timeout_ms;
}

void CircuitBreakerRegistry::move_to(KeyBreaker::BreakerState& state, CircuitState next,
                                     kj::Maybe<Transition>& transition) {
  if (state.state == next) {
    return;
  }
  CircuitState previous = state.state;
  state.state = next;

  if (previous == CircuitState::Open) {
    state.next_retry_at_ms = kj::none;
  }
  switch (next) {
  case CircuitState::Closed:
    state.consecutive_failures = 0;
    state.successes_in_half_open = 0;
    state.trial_in_flight = false;
    state.recovery_timeout_ms = config_.recovery_timeout_ms;
    break;
  case CircuitState::Open:
    state.successes_in_half_open = 0;
    state.trial_in_flight = false;
    break;
  case CircuitState::HalfOpen:
    state.successes_in_half_open = 0;
    break;
  }

  transition = Transition{previous, next};
}

void CircuitBreakerRegistry::publish(const KeyBreaker& breaker, kj::Maybe<Transition> transition) {
  KJ_IF_SOME(change, transition) {
    breaker.stats.state_transitions++;
    export_state(breaker.key, change.to);
    const core::Label labels[] = {{"key"_kj, breaker.key}};
    core::counter_inc("aegis_breaker_transitions_total"_kj, labels);

    KJ_LOG(WARNING, "Circuit breaker state change", breaker.key, to_string(change.from),
           to_string(change.to));

    kj::Maybe<kj::Own<const CallbackSlot>> slot;
    {
      auto lock = callback_.lockShared();
      KJ_IF_SOME(current, *lock) {
        slot = kj::atomicAddRef(*current);
      }
    }
    KJ_IF_SOME(current, slot) {
      current->callback(breaker.key, change.from, change.to);
    }
  }
}

CircuitState CircuitBreakerRegistry::state(kj::StringPtr key) const {
  KJ_IF_SOME(breaker, find(key)) {
    return breaker.state.lockShared()->state;
  }
  return CircuitState::Closed;
}

namespace {

BreakerSnapshot make_snapshot(const KeyBreaker& breaker) {
  BreakerSnapshot snapshot;
  snapshot.key = kj::str(breaker.key);
  {
    auto lock = breaker.state.lockShared();
    snapshot.state = lock->state;
    snapshot.consecutive_failures = lock->consecutive_failures;
    snapshot.last_failure_at_ms = lock->last_failure_at_ms;
    snapshot.next_retry_at_ms = lock->next_retry_at_ms;
    snapshot.successes_in_half_open = lock->successes_in_half_open;
    snapshot.trial_in_flight = lock->trial_in_flight;
    snapshot.recovery_timeout_ms = lock->recovery_timeout_ms;
  }
  snapshot.total_requests = breaker.stats.total_requests.load();
  snapshot.successful_requests = breaker.stats.successful_requests.load();
  snapshot.failed_requests = breaker.stats.failed_requests.load();
  snapshot.rejected_requests = breaker.stats.rejected_requests.load();
  snapshot.state_transitions = breaker.stats.state_transitions.load();
  return snapshot;
}

} // namespace

kj::Maybe<BreakerSnapshot> CircuitBreakerRegistry::snapshot(kj::StringPtr key) const {
  KJ_IF_SOME(breaker, find(key)) {
    return make_snapshot(breaker);
  }
  return kj::none;
}

kj::Vector<BreakerSnapshot> CircuitBreakerRegistry::snapshots() const {
  auto lock = breakers_.lockShared();
  kj::Vector<BreakerSnapshot> result(lock->size());
  for (const auto& entry : *lock) {
    result.add(make_snapshot(*entry.value));
  }
  return result;
}

bool CircuitBreakerRegistry::reset(kj::StringPtr key) {
  KJ_IF_SOME(breaker, find(key)) {
    kj::Maybe<Transition> transition;
    {
      auto lock = breaker.state.lockExclusive();
      move_to(*lock, CircuitState::Closed, transition);
      lock->consecutive_failures = 0;
      lock->last_failure_at_ms = kj::none;
    }
    KJ_LOG(INFO, "Circuit breaker reset", key);
    publish(breaker, transition);
    return true;
  }
  return false;
}

void CircuitBreakerRegistry::set_state_change_callback(StateChangeCallback callback) {
  kj::Own<const CallbackSlot> slot = kj::atomicRefcounted<CallbackSlot>(kj::mv(callback));
  *callback_.lockExclusive() = kj::mv(slot);
}

} // namespace aegis::resilience
