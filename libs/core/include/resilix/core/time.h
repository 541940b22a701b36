#pragma once

#include <chrono>
#include <cstdint>
#include <kj/common.h>
#include <kj/string.h>
#include <kj/time.h>

namespace resilix::core {

// YYYY-MM-DDTHH:MM:SS.mmmZ
[[nodiscard]] kj::String to_utc_iso8601(std::chrono::system_clock::time_point time);
[[nodiscard]] kj::String now_utc_iso8601();

/**
 * @brief Process-wide monotonic clock shared by all resilience state
 *
 * Thread-safe; unlike a kj::Timer it does not belong to any event loop.
 */
[[nodiscard]] const kj::MonotonicClock& monotonic_clock();

[[nodiscard]] inline kj::Duration from_millis(std::int64_t ms) {
  return ms * kj::MILLISECONDS;
}

[[nodiscard]] inline std::int64_t to_millis(kj::Duration duration) {
  return duration / kj::MILLISECONDS;
}

[[nodiscard]] inline double to_seconds(kj::Duration duration) {
  return static_cast<double>(duration / kj::NANOSECONDS) / 1e9;
}

} // namespace resilix::core
