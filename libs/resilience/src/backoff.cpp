#include "resilix/resilience/backoff.h"

#include <cmath>
#include <random>

namespace resilix::resilience {

namespace {

int64_t to_ns(kj::Duration d) {
  return d / kj::NANOSECONDS;
}

std::mt19937_64& jitter_engine() {
  thread_local std::mt19937_64 engine{std::random_device{}()};
  return engine;
}

} // namespace

kj::Duration FixedBackoff::delay(uint32_t /* attempt */) const {
  return delay_;
}

kj::Duration LinearBackoff::delay(uint32_t attempt) const {
  uint32_t steps = attempt > 0 ? attempt - 1 : 0;
  auto delay = initial_ + increment_ * static_cast<int64_t>(steps);
  return kj::min(delay, max_delay_);
}

kj::Duration ExponentialBackoff::base_delay(uint32_t attempt) const {
  uint32_t exponent = attempt > 0 ? attempt - 1 : 0;
  double delay_ns = static_cast<double>(to_ns(initial_)) * std::pow(multiplier_, exponent);
  delay_ns = std::min(delay_ns, static_cast<double>(to_ns(max_delay_)));
  return static_cast<int64_t>(delay_ns) * kj::NANOSECONDS;
}

kj::Duration ExponentialBackoff::delay(uint32_t attempt) const {
  auto base = base_delay(attempt);
  if (jitter_ <= 0.0) {
    return base;
  }
  std::uniform_real_distribution<double> dist(1.0 - jitter_, 1.0 + jitter_);
  double jittered = static_cast<double>(to_ns(base)) * dist(jitter_engine());
  return static_cast<int64_t>(std::max(jittered, 0.0)) * kj::NANOSECONDS;
}

kj::Duration ScheduleBackoff::delay(uint32_t attempt) const {
  if (delays_.size() == 0) {
    return 0 * kj::NANOSECONDS;
  }
  size_t index = attempt > 0 ? attempt - 1 : 0;
  return delays_[kj::min(index, delays_.size() - 1)];
}

} // namespace resilix::resilience
