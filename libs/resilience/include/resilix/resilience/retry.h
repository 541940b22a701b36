#pragma once

#include "resilix/core/error.h"
#include "resilix/resilience/backoff.h"

#include <cstdint>
#include <kj/async.h>
#include <kj/common.h>
#include <kj/exception.h>
#include <kj/function.h>
#include <kj/memory.h>
#include <kj/one-of.h>
#include <kj/timer.h>

namespace resilix::resilience {

using FailurePredicate = kj::ConstFunction<bool(const kj::Exception&)>;

/**
 * @brief Configuration for retry behavior
 *
 * Move-only because the backoff and predicate are owned callables.
 */
struct RetryConfig {
  uint32_t max_attempts = 3; // Total attempts including the first call
  kj::Own<const BackoffStrategy> backoff = kj::heap<ExponentialBackoff>();
  bool retry_on_timeout = true;
  // Custom retryable-failure classifier; replaces the default classification
  // of untagged and Transient/Permanent tagged exceptions
  kj::Maybe<FailurePredicate> retry_predicate;

  RetryConfig() = default;
  RetryConfig(RetryConfig&&) = default;
  RetryConfig& operator=(RetryConfig&&) = default;
  RetryConfig(const RetryConfig&) = delete;
  RetryConfig& operator=(const RetryConfig&) = delete;

  /**
   * @brief Whether a failed attempt may be retried
   *
   * Circuit-open and bulkhead rejections are never retried. Timeouts follow
   * retry_on_timeout. Everything else goes to retry_predicate when set;
   * otherwise TransientFailure tags and DISCONNECTED/OVERLOADED exceptions are
   * retryable.
   */
  [[nodiscard]] bool is_retryable(const kj::Exception& exception) const;
};

// (attempt that failed, its error, delay before the next attempt)
using RetryCallback = kj::Function<void(uint32_t, const kj::Exception&, kj::Duration)>;

/**
 * @brief Asynchronous retry loop with pluggable backoff
 *
 * run() invokes the attempt function with attempt numbers 1..max_attempts,
 * waiting `backoff->delay(n)` on the timer between attempts. The wait is a
 * timer promise, so other work on the event loop proceeds meanwhile; dropping
 * the returned promise stops further attempts.
 *
 * The executor, its config and the timer must outlive the promise returned
 * by run().
 */
class RetryExecutor final {
public:
  RetryExecutor(const RetryConfig& config, kj::Timer& timer) : config_(config), timer_(timer) {}

  KJ_DISALLOW_COPY_AND_MOVE(RetryExecutor);

  void set_retry_callback(RetryCallback callback) {
    on_retry_ = kj::mv(callback);
  }

  /**
   * @brief Stop retrying once the next delay would end at or past `deadline`
   *
   * The execution then fails with an ErrorCode::Timeout exception.
   */
  void set_deadline(kj::TimePoint deadline) {
    deadline_ = deadline;
  }

  template <typename T> kj::Promise<T> run(kj::Function<kj::Promise<T>(uint32_t attempt)> attempt);

  // Attempts started by the most recent run()
  [[nodiscard]] uint32_t attempts() const noexcept {
    return attempts_;
  }

private:
  template <typename T>
  kj::Promise<T> attempt_loop(kj::Function<kj::Promise<T>(uint32_t)>& attempt, uint32_t n);

  // Decide what follows a failed attempt: a delay, or the error to surface
  kj::OneOf<kj::Duration, kj::Exception> next_step(uint32_t attempt, kj::Exception&& error);

  const RetryConfig& config_;
  kj::Timer& timer_;
  kj::Maybe<RetryCallback> on_retry_;
  kj::Maybe<kj::TimePoint> deadline_;
  uint32_t attempts_ = 0;
};

template <typename T>
kj::Promise<T> RetryExecutor::run(kj::Function<kj::Promise<T>(uint32_t attempt)> attempt) {
  attempts_ = 0;
  auto owned = kj::heap(kj::mv(attempt));
  auto promise = attempt_loop(*owned, 1);
  return promise.attach(kj::mv(owned));
}

template <typename T>
kj::Promise<T> RetryExecutor::attempt_loop(kj::Function<kj::Promise<T>(uint32_t)>& attempt,
                                           uint32_t n) {
  attempts_ = n;
  return kj::evalNow([&attempt, n]() { return attempt(n); })
      .catch_([this, &attempt, n](kj::Exception&& error) -> kj::Promise<T> {
        auto step = next_step(n, kj::mv(error));
        KJ_SWITCH_ONEOF(step) {
          KJ_CASE_ONEOF(delay, kj::Duration) {
            return timer_.afterDelay(delay).then(
                [this, &attempt, n]() { return attempt_loop(attempt, n + 1); });
          }
          KJ_CASE_ONEOF(failure, kj::Exception) {
            return kj::mv(failure);
          }
        }
        KJ_UNREACHABLE;
      });
}

} // namespace resilix::resilience
