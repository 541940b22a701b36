#include "resilix/resilience/circuit_breaker.h"

#include "resilix/core/error.h"

#include <kj/debug.h>

namespace resilix::resilience {

namespace {

void require_config(bool condition, kj::StringPtr message) {
  if (!condition) {
    core::throw_error(core::ErrorCode::ConfigurationError,
                      kj::str("invalid circuit breaker config: ", message));
  }
}

const CircuitBreakerConfig& validated(const CircuitBreakerConfig& config) {
  config.validate();
  return config;
}

} // namespace

void CircuitBreakerConfig::validate() const {
  require_config(failure_rate_threshold > 0.0 && failure_rate_threshold <= 1.0,
                 "failure_rate_threshold must be in (0, 1]");
  require_config(minimum_calls >= 1, "minimum_calls must be at least 1");
  require_config(sliding_window_size >= minimum_calls,
                 "sliding_window_size must be at least minimum_calls");
  require_config(sliding_window_duration > 0 * kj::NANOSECONDS,
                 "sliding_window_duration must be positive");
  require_config(open_duration >= 0 * kj::NANOSECONDS, "open_duration must not be negative");
  require_config(half_open_max_calls >= 1, "half_open_max_calls must be at least 1");
  require_config(half_open_success_threshold >= 1 &&
                     half_open_success_threshold <= half_open_max_calls,
                 "half_open_success_threshold must be in [1, half_open_max_calls]");
}

CircuitBreaker::CircuitBreaker(kj::StringPtr name, CircuitBreakerConfig config,
                               const kj::MonotonicClock& clock)
    : name_(kj::heapString(name)), clock_(clock), guarded_(validated(config), clock.now()) {}

bool CircuitBreaker::allow_request() {
  return try_acquire() != kj::none;
}

kj::Maybe<CircuitPermit> CircuitBreaker::try_acquire() {
  kj::Maybe<Transition> fired;
  kj::Maybe<CircuitPermit> permit;
  {
    auto lock = guarded_.lockExclusive();
    stats_.total_requests++;

    if (lock->state == CircuitState::Open &&
        clock_.now() - lock->opened_at >= lock->config.open_duration) {
      transition_state(*lock, CircuitState::HalfOpen);
    }

    switch (lock->state) {
    case CircuitState::Closed:
      permit = CircuitPermit{lock->generation};
      break;
    case CircuitState::Open:
      break;
    case CircuitState::HalfOpen:
      if (lock->half_open_admitted < lock->config.half_open_max_calls) {
        lock->half_open_admitted++;
        permit = CircuitPermit{lock->generation};
      }
      break;
    }

    if (permit == kj::none) {
      stats_.rejected_requests++;
    }
    fired = kj::mv(lock->pending);
    lock->pending = kj::none;
  }
  notify(kj::mv(fired));
  return permit;
}

void CircuitBreaker::record_success() {
  kj::Maybe<Transition> fired;
  {
    auto lock = guarded_.lockExclusive();
    stats_.successful_requests++;
    on_success(*lock);
    fired = kj::mv(lock->pending);
    lock->pending = kj::none;
  }
  notify(kj::mv(fired));
}

void CircuitBreaker::record_success(CircuitPermit permit) {
  kj::Maybe<Transition> fired;
  {
    auto lock = guarded_.lockExclusive();
    stats_.successful_requests++;
    if (permit.generation == lock->generation) {
      on_success(*lock);
    }
    fired = kj::mv(lock->pending);
    lock->pending = kj::none;
  }
  notify(kj::mv(fired));
}

void CircuitBreaker::record_failure() {
  kj::Maybe<Transition> fired;
  {
    auto lock = guarded_.lockExclusive();
    stats_.failed_requests++;
    on_failure(*lock);
    fired = kj::mv(lock->pending);
    lock->pending = kj::none;
  }
  notify(kj::mv(fired));
}

void CircuitBreaker::record_failure(CircuitPermit permit) {
  kj::Maybe<Transition> fired;
  {
    auto lock = guarded_.lockExclusive();
    stats_.failed_requests++;
    if (permit.generation == lock->generation) {
      on_failure(*lock);
    }
    fired = kj::mv(lock->pending);
    lock->pending = kj::none;
  }
  notify(kj::mv(fired));
}

void CircuitBreaker::release_permission() {
  on_release(*guarded_.lockExclusive());
}

void CircuitBreaker::release_permission(CircuitPermit permit) {
  auto lock = guarded_.lockExclusive();
  if (permit.generation == lock->generation) {
    on_release(*lock);
  }
}

void CircuitBreaker::configure(const CircuitBreakerConfig& config) {
  config.validate();
  kj::Maybe<Transition> fired;
  {
    auto lock = guarded_.lockExclusive();
    lock->generation++;
    lock->config = config;
    lock->window.reconfigure(config.sliding_window_size, config.sliding_window_duration);
    transition_state(*lock, CircuitState::Closed);
    fired = kj::mv(lock->pending);
    lock->pending = kj::none;
  }
  notify(kj::mv(fired));
}

void CircuitBreaker::reset() {
  kj::Maybe<Transition> fired;
  {
    auto lock = guarded_.lockExclusive();
    lock->generation++;
    lock->window.clear();
    transition_state(*lock, CircuitState::Closed);
    fired = kj::mv(lock->pending);
    lock->pending = kj::none;
  }
  notify(kj::mv(fired));
}

CircuitState CircuitBreaker::state() const {
  return guarded_.lockShared()->state;
}

double CircuitBreaker::failure_rate() const {
  return guarded_.lockShared()->window.failure_rate();
}

size_t CircuitBreaker::window_size() const {
  return guarded_.lockShared()->window.size();
}

CircuitBreakerConfig CircuitBreaker::config() const {
  return guarded_.lockShared()->config;
}

void CircuitBreaker::on_success(BreakerState& state) {
  switch (state.state) {
  case CircuitState::Closed: {
    auto now = clock_.now();
    state.window.evict(now);
    state.window.add(now, false);
    break;
  }
  case CircuitState::HalfOpen:
    state.half_open_successes++;
    if (state.half_open_successes >= state.config.half_open_success_threshold) {
      transition_state(state, CircuitState::Closed);
    }
    break;
  case CircuitState::Open:
    break;
  }
}

void CircuitBreaker::on_failure(BreakerState& state) {
  switch (state.state) {
  case CircuitState::Closed: {
    auto now = clock_.now();
    state.window.evict(now);
    state.window.add(now, true);
    maybe_open(state);
    break;
  }
  case CircuitState::HalfOpen:
    // Any trial failure reopens immediately
    transition_state(state, CircuitState::Open);
    break;
  case CircuitState::Open:
    break;
  }
}

void CircuitBreaker::on_release(BreakerState& state) {
  if (state.state == CircuitState::HalfOpen && state.half_open_admitted > 0) {
    state.half_open_admitted--;
  }
}

void CircuitBreaker::maybe_open(BreakerState& state) {
  if (state.window.size() >= state.config.minimum_calls &&
      state.window.failure_rate() >= state.config.failure_rate_threshold) {
    transition_state(state, CircuitState::Open);
  }
}

void CircuitBreaker::transition_state(BreakerState& state, CircuitState new_state) {
  if (state.state == new_state) {
    return;
  }

  CircuitState old_state = state.state;
  state.state = new_state;
  state.generation++;
  state.half_open_admitted = 0;
  state.half_open_successes = 0;

  switch (new_state) {
  case CircuitState::Open:
    state.opened_at = clock_.now();
    state.window.clear();
    break;
  case CircuitState::Closed:
    state.window.clear();
    break;
  case CircuitState::HalfOpen:
    break;
  }

  stats_.state_transitions++;
  state.pending = Transition{old_state, new_state};
}

void CircuitBreaker::notify(kj::Maybe<Transition> transition) {
  KJ_IF_SOME(t, transition) {
    KJ_IF_SOME(callback, on_state_change_) {
      callback(t.from, t.to);
    }
  }
}

} // namespace resilix::resilience
