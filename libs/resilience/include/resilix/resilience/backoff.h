#pragma once

#include <cstdint>
#include <kj/array.h>
#include <kj/common.h>
#include <kj/function.h>
#include <kj/time.h>

namespace resilix::resilience {

/**
 * @brief Delay schedule between retry attempts
 *
 * `attempt` is the 1-based number of the attempt that just failed, so the
 * wait before the second attempt is `delay(1)`. Implementations are immutable
 * and safe to share across threads.
 */
class BackoffStrategy {
public:
  virtual ~BackoffStrategy() = default;

  [[nodiscard]] virtual kj::Duration delay(uint32_t attempt) const = 0;
};

// Same delay before every retry
class FixedBackoff final : public BackoffStrategy {
public:
  explicit FixedBackoff(kj::Duration delay) : delay_(delay) {}

  [[nodiscard]] kj::Duration delay(uint32_t attempt) const override;

private:
  kj::Duration delay_;
};

// initial + increment * (attempt - 1), capped at max_delay
class LinearBackoff final : public BackoffStrategy {
public:
  LinearBackoff(kj::Duration initial, kj::Duration increment, kj::Duration max_delay)
      : initial_(initial), increment_(increment), max_delay_(max_delay) {}

  [[nodiscard]] kj::Duration delay(uint32_t attempt) const override;

private:
  kj::Duration initial_;
  kj::Duration increment_;
  kj::Duration max_delay_;
};

/**
 * @brief Exponential backoff with cap and jitter
 *
 * delay = min(max_delay, initial * multiplier^(attempt - 1)), then scaled by a
 * uniform random factor in [1 - jitter, 1 + jitter]. The jittered value is
 * never negative.
 */
class ExponentialBackoff final : public BackoffStrategy {
public:
  explicit ExponentialBackoff(kj::Duration initial = 100 * kj::MILLISECONDS,
                              double multiplier = 2.0,
                              kj::Duration max_delay = 30 * kj::SECONDS, double jitter = 0.1)
      : initial_(initial), multiplier_(multiplier), max_delay_(max_delay), jitter_(jitter) {}

  [[nodiscard]] kj::Duration delay(uint32_t attempt) const override;

  [[nodiscard]] kj::Duration base_delay(uint32_t attempt) const;
  [[nodiscard]] double jitter() const noexcept {
    return jitter_;
  }

private:
  kj::Duration initial_;
  double multiplier_;
  kj::Duration max_delay_;
  double jitter_;
};

// Explicit list of delays; attempts past the end reuse the last entry
class ScheduleBackoff final : public BackoffStrategy {
public:
  explicit ScheduleBackoff(kj::Array<kj::Duration> delays) : delays_(kj::mv(delays)) {}

  [[nodiscard]] kj::Duration delay(uint32_t attempt) const override;

private:
  kj::Array<kj::Duration> delays_;
};

// Caller-supplied generator; must be thread-safe if the config is shared
class FunctionBackoff final : public BackoffStrategy {
public:
  explicit FunctionBackoff(kj::ConstFunction<kj::Duration(uint32_t)> generator)
      : generator_(kj::mv(generator)) {}

  [[nodiscard]] kj::Duration delay(uint32_t attempt) const override {
    return generator_(attempt);
  }

private:
  kj::ConstFunction<kj::Duration(uint32_t)> generator_;
};

} // namespace resilix::resilience
