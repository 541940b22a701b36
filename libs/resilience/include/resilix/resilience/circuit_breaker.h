#pragma once

#include "resilix/core/time.h"
#include "resilix/resilience/rolling_window.h"

// std::atomic for lightweight counters (KJ MutexGuarded has overhead)
#include <atomic>
#include <cstdint>
#include <kj/common.h>
#include <kj/function.h>
#include <kj/mutex.h>
#include <kj/string.h>
#include <kj/time.h>

namespace resilix::resilience {

enum class CircuitState {
  Closed,   // Normal operation
  Open,     // Circuit is tripped, blocking requests
  HalfOpen, // Testing if service recovered
};

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

struct CircuitBreakerConfig {
  double failure_rate_threshold = 0.5; // Open when the window's failure rate reaches this
  uint32_t minimum_calls = 10;         // Samples required before the rate is evaluated
  uint32_t sliding_window_size = 20;   // Maximum samples kept
  kj::Duration sliding_window_duration = 60 * kj::SECONDS; // Samples older than this are evicted
  kj::Duration open_duration = 30 * kj::SECONDS;           // Time in Open before trial calls
  uint32_t half_open_max_calls = 3;         // Trial calls admitted in HalfOpen
  uint32_t half_open_success_threshold = 3; // Trial successes needed to close

  // Throws an ErrorCode::ConfigurationError exception on invalid values
  void validate() const;
};

struct CircuitBreakerStats {
  std::atomic<uint64_t> total_requests{0};
  std::atomic<uint64_t> successful_requests{0};
  std::atomic<uint64_t> failed_requests{0};
  std::atomic<uint64_t> rejected_requests{0};
  std::atomic<uint64_t> state_transitions{0};

  void reset() {
    total_requests.store(0);
    successful_requests.store(0);
    failed_requests.store(0);
    rejected_requests.store(0);
    state_transitions.store(0);
  }
};

using StateChangeCallback = kj::Function<void(CircuitState old_state, CircuitState new_state)>;

// Admission handed out by try_acquire(). Outcomes recorded against a permit
// whose state period has since ended are dropped.
struct CircuitPermit {
  uint64_t generation;
};

/**
 * @brief Rolling-window circuit breaker
 *
 * Closed: every call is admitted and each recorded outcome lands in the
 * rolling window; once the window holds at least minimum_calls samples and
 * the failure rate reaches the threshold, the circuit opens.
 *
 * Open: calls are rejected until open_duration has elapsed since opening; the
 * next allow_request() then moves to HalfOpen. Outcomes recorded while Open
 * are ignored.
 *
 * HalfOpen: at most half_open_max_calls trial calls are admitted. A single
 * failure reopens the circuit; half_open_success_threshold successes close it.
 * Opening and closing both clear the window.
 *
 * Every state change, reset and reconfiguration starts a new generation.
 * Callers whose calls may outlive a state change use try_acquire() and pass
 * the permit back, so a late outcome from an earlier generation neither
 * lands in the window nor counts as a trial result.
 *
 * All state is guarded by one mutex, so concurrent callers observe a
 * linearizable sequence of admissions and outcomes. The state-change callback
 * runs after the mutex is released.
 */
class CircuitBreaker final {
public:
  explicit CircuitBreaker(kj::StringPtr name, CircuitBreakerConfig config = {},
                          const kj::MonotonicClock& clock = core::monotonic_clock());

  KJ_DISALLOW_COPY_AND_MOVE(CircuitBreaker);

  // Check if request is allowed
  [[nodiscard]] bool allow_request();
  [[nodiscard]] kj::Maybe<CircuitPermit> try_acquire();

  // Record outcome of an admitted call. The permit-less forms apply to the
  // current generation.
  void record_success();
  void record_failure();
  void record_success(CircuitPermit permit);
  void record_failure(CircuitPermit permit);

  // Admitted call finished without an outcome that counts (ignored or cancelled)
  void release_permission();
  void release_permission(CircuitPermit permit);

  // Replace thresholds; clears the window and returns to Closed
  void configure(const CircuitBreakerConfig& config);

  // Manual reset to Closed with an empty window
  void reset();

  [[nodiscard]] CircuitState state() const;
  [[nodiscard]] double failure_rate() const;
  [[nodiscard]] size_t window_size() const;
  [[nodiscard]] CircuitBreakerConfig config() const;

  [[nodiscard]] kj::StringPtr name() const noexcept {
    return name_;
  }

  [[nodiscard]] const CircuitBreakerStats& stats() const noexcept {
    return stats_;
  }
  void reset_stats() {
    stats_.reset();
  }

  // Must be set before the breaker is shared between threads
  void set_state_change_callback(StateChangeCallback callback) {
    on_state_change_ = kj::mv(callback);
  }

private:
  struct Transition {
    CircuitState from;
    CircuitState to;
  };

  struct BreakerState {
    CircuitBreakerConfig config;
    CircuitState state{CircuitState::Closed};
    RollingWindow window;
    kj::TimePoint opened_at;
    uint32_t half_open_admitted{0};
    uint32_t half_open_successes{0};
    uint64_t generation{0};
    kj::Maybe<Transition> pending;

    BreakerState(const CircuitBreakerConfig& cfg, kj::TimePoint now)
        : config(cfg), window(cfg.sliding_window_size, cfg.sliding_window_duration),
          opened_at(now) {}
  };

  void on_success(BreakerState& state);
  void on_failure(BreakerState& state);
  void on_release(BreakerState& state);
  void transition_state(BreakerState& state, CircuitState new_state);
  void maybe_open(BreakerState& state);
  void notify(kj::Maybe<Transition> transition);

  kj::String name_;
  const kj::MonotonicClock& clock_;
  kj::MutexGuarded<BreakerState> guarded_;
  CircuitBreakerStats stats_;
  kj::Maybe<StateChangeCallback> on_state_change_;
};

} // namespace resilix::resilience
