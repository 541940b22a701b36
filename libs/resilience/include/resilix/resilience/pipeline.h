#pragma once

#include "resilix/core/error.h"
#include "resilix/core/time.h"
#include "resilix/resilience/registry.h"
#include "resilix/resilience/result.h"
#include "resilix/resilience/retry.h"
#include "resilix/resilience/timeout.h"

#include <kj/async.h>
#include <kj/common.h>
#include <kj/function.h>
#include <kj/memory.h>
#include <kj/timer.h>

namespace resilix::resilience {

template <typename T>
using FallbackFunction = kj::Function<kj::Promise<T>(const ResilienceError& error)>;

// Terminal error code of a failed execution
[[nodiscard]] core::ErrorCode classify_failure(const ResilienceConfig& config,
                                               const kj::Exception& error);

/**
 * @brief Reports exactly one outcome of an admitted attempt to the breaker
 *
 * An attempt dropped before settling (caller cancellation, overall timeout)
 * gives its permission back. Outcomes are reported against the permit, so an
 * attempt that outlives a breaker state change cannot affect the new state.
 */
class AttemptGuard final {
public:
  AttemptGuard(CircuitBreaker& breaker, CircuitPermit permit)
      : breaker_(breaker), permit_(permit) {}
  ~AttemptGuard() noexcept;

  KJ_DISALLOW_COPY_AND_MOVE(AttemptGuard);

  void succeeded();
  // Records a failure sample or releases the permission, per `config`
  void failed(const ResilienceConfig& config, const kj::Exception& error);

private:
  CircuitBreaker& breaker_;
  CircuitPermit permit_;
  bool settled_ = false;
};

namespace detail {

/**
 * @brief State of one execute() call, owned by the promise it returns
 */
template <typename T> class Execution final {
public:
  Execution(ResilienceRegistry& registry, kj::Timer& timer, ResourceState& resource,
            kj::Function<kj::Promise<T>()> operation, kj::Maybe<FallbackFunction<T>> fallback)
      : registry_(registry), timer_(timer), resource_(resource), snapshot_(resource.config()),
        operation_(kj::mv(operation)), fallback_(kj::mv(fallback)), started_(timer.now()) {}

  KJ_DISALLOW_COPY_AND_MOVE(Execution);

  kj::Promise<PipelineResult<T>> start() {
    resource_.metrics().calls.increment();
    return resource_.bulkhead().acquire(timer_).then(
        [this](BulkheadPermit&& permit) -> kj::Promise<PipelineResult<T>> {
          permit_ = kj::mv(permit);
          update_in_flight();
          return run_attempts();
        },
        [this](kj::Exception&& error) -> kj::Promise<PipelineResult<T>> {
          registry_.report_bulkhead_rejection(resource_, error);
          return finish_failure(kj::mv(error));
        });
  }

private:
  const ResilienceConfig& config() const {
    return snapshot_->config();
  }

  kj::Promise<PipelineResult<T>> run_attempts() {
    retry_ = kj::heap<RetryExecutor>(config().retry, timer_);
    KJ_IF_SOME(timeout, config().overall_timeout) {
      deadline_ = started_ + timeout;
      retry_->set_deadline(started_ + timeout);
    }
    retry_->set_retry_callback(
        [this](uint32_t attempt, const kj::Exception& error, kj::Duration delay) {
          registry_.report_retry(resource_, attempt, error, delay);
        });

    return retry_->template run<T>([this](uint32_t attempt) { return run_attempt(attempt); })
        .then(
            [this](T&& value) -> kj::Promise<PipelineResult<T>> {
              return finish_success(kj::mv(value));
            },
            [this](kj::Exception&& error) -> kj::Promise<PipelineResult<T>> {
              // A timeout no attempt reported is the overall deadline stopping retries
              if (!timeout_reported_ && core::has_error_code(error, core::ErrorCode::Timeout)) {
                registry_.report_timeout(resource_);
              }
              return finish_failure(kj::mv(error));
            });
  }

  kj::Promise<T> run_attempt(uint32_t attempt) {
    attempts_ = attempt;
    timeout_reported_ = false;

    kj::Maybe<kj::Duration> bound = config().attempt_timeout;
    KJ_IF_SOME(deadline, deadline_) {
      auto remaining = deadline - timer_.now();
      if (remaining <= 0 * kj::NANOSECONDS) {
        return core::make_exception(core::ErrorCode::Timeout,
                                    kj::str("overall timeout of '", resource_.name(),
                                            "' exceeded before attempt ", attempt));
      }
      KJ_IF_SOME(limit, bound) {
        if (remaining < limit) {
          bound = remaining;
        }
      } else {
        bound = remaining;
      }
    }

    auto& breaker = resource_.circuit_breaker();
    kj::Own<AttemptGuard> guard;
    KJ_IF_SOME(admitted, breaker.try_acquire()) {
      guard = kj::heap<AttemptGuard>(breaker, admitted);
    } else {
      registry_.report_circuit_rejection(resource_);
      return core::make_exception(core::ErrorCode::CircuitOpen,
                                  kj::str("circuit breaker '", resource_.name(), "' is open"));
    }

    auto& settle = *guard;
    auto call = kj::evalNow([this]() { return operation_(); });
    KJ_IF_SOME(limit, bound) {
      call = with_timeout(timer_, limit, kj::mv(call));
    }
    return call
        .then(
            [&settle](T&& value) -> kj::Promise<T> {
              settle.succeeded();
              return kj::mv(value);
            },
            [this, &settle](kj::Exception&& error) -> kj::Promise<T> {
              settle.failed(config(), error);
              if (core::has_error_code(error, core::ErrorCode::Timeout)) {
                timeout_reported_ = true;
                registry_.report_timeout(resource_);
              }
              return kj::mv(error);
            })
        .attach(kj::mv(guard));
  }

  kj::Promise<PipelineResult<T>> finish_success(T value) {
    auto elapsed = record_latency();
    resource_.metrics().success.increment();
    release_permit();
    return PipelineResult<T>::success(kj::mv(value), attempts_, elapsed);
  }

  kj::Promise<PipelineResult<T>> finish_failure(kj::Exception error) {
    release_permit();
    auto code = classify_failure(config(), error);
    error_ = ResilienceError{code, kj::heapString(resource_.name()), kj::mv(error)};

    KJ_IF_SOME(fallback, fallback_) {
      auto& cause = KJ_ASSERT_NONNULL(error_);
      return kj::evalNow([&fallback, &cause]() { return fallback(cause); })
          .then(
              [this](T&& value) -> kj::Promise<PipelineResult<T>> {
                auto elapsed = record_latency();
                resource_.metrics().fallback.increment();
                return PipelineResult<T>::fallback(kj::mv(value), take_error(), attempts_,
                                                   elapsed);
              },
              [this](kj::Exception&& fallback_error) -> kj::Promise<PipelineResult<T>> {
                auto cause = take_error();
                registry_.logger().error(kj::str("fallback for '", resource_.name(),
                                                 "' failed after ", core::to_string(cause.code),
                                                 ": ", fallback_error.getDescription()));
                auto elapsed = record_latency();
                resource_.metrics().failure.increment();
                return PipelineResult<T>::failure(
                    ResilienceError{core::ErrorCode::FallbackFailure, kj::mv(cause.resource),
                                    kj::mv(fallback_error)},
                    attempts_, elapsed);
              });
    }

    auto elapsed = record_latency();
    resource_.metrics().failure.increment();
    return PipelineResult<T>::failure(take_error(), attempts_, elapsed);
  }

  ResilienceError take_error() {
    auto error = kj::mv(KJ_ASSERT_NONNULL(error_));
    error_ = kj::none;
    return error;
  }

  kj::Duration record_latency() {
    auto elapsed = timer_.now() - started_;
    resource_.metrics().latency_seconds.observe(core::to_seconds(elapsed));
    return elapsed;
  }

  void release_permit() {
    if (permit_.is_held()) {
      permit_.release();
      update_in_flight();
    }
  }

  void update_in_flight() {
    resource_.metrics().bulkhead_in_flight.set(resource_.bulkhead().in_flight());
  }

  ResilienceRegistry& registry_;
  kj::Timer& timer_;
  ResourceState& resource_;
  kj::Own<const ConfigSnapshot> snapshot_;
  kj::Function<kj::Promise<T>()> operation_;
  kj::Maybe<FallbackFunction<T>> fallback_;
  kj::TimePoint started_;
  kj::Maybe<kj::TimePoint> deadline_;
  kj::Own<RetryExecutor> retry_;
  BulkheadPermit permit_;
  uint32_t attempts_ = 0;
  bool timeout_reported_ = false;
  kj::Maybe<ResilienceError> error_;
};

} // namespace detail

/**
 * @brief Runs operations under the resilience policy of a named resource
 *
 * Order of protection: bulkhead admission, then per attempt the circuit
 * breaker and the attempt timeout, with retries and backoff between attempts.
 * A terminal failure invokes the fallback when one is given.
 *
 * A pipeline belongs to one thread's event loop (its timer); the registry it
 * reads may be shared across threads. Dropping the promise returned by
 * execute() cancels the execution: the running attempt is dropped, no further
 * attempts start and the bulkhead permit is released.
 */
class ResiliencePipeline final {
public:
  ResiliencePipeline(ResilienceRegistry& registry, kj::Timer& timer)
      : registry_(registry), timer_(timer) {}

  KJ_DISALLOW_COPY_AND_MOVE(ResiliencePipeline);

  template <typename T>
  kj::Promise<PipelineResult<T>> execute(kj::StringPtr resource,
                                         kj::Function<kj::Promise<T>()> operation) {
    return start<T>(resource, kj::mv(operation), kj::none);
  }

  // `fallback` runs once on terminal failure and receives the classified error
  template <typename T>
  kj::Promise<PipelineResult<T>> execute(kj::StringPtr resource,
                                         kj::Function<kj::Promise<T>()> operation,
                                         FallbackFunction<T> fallback) {
    return start<T>(resource, kj::mv(operation), kj::mv(fallback));
  }

  [[nodiscard]] ResilienceRegistry& registry() noexcept {
    return registry_;
  }

private:
  template <typename T>
  kj::Promise<PipelineResult<T>> start(kj::StringPtr resource,
                                       kj::Function<kj::Promise<T>()> operation,
                                       kj::Maybe<FallbackFunction<T>> fallback) {
    auto execution = kj::heap<detail::Execution<T>>(
        registry_, timer_, registry_.resource(resource), kj::mv(operation), kj::mv(fallback));
    auto promise = execution->start();
    return promise.attach(kj::mv(execution));
  }

  ResilienceRegistry& registry_;
  kj::Timer& timer_;
};

} // namespace resilix::resilience
