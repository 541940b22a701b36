#pragma once

#include <cstddef>
#include <kj/array.h>
#include <kj/common.h>
#include <kj/time.h>

namespace resilix::resilience {

struct CallRecord {
  kj::TimePoint at;
  bool failed;
};

/**
 * @brief Bounded ring of recent call outcomes
 *
 * Holds at most `capacity` records; the oldest is overwritten when full, and
 * evict() drops records older than `max_age`. The failure count is kept
 * incrementally. Not thread-safe: the owning circuit breaker locks around it.
 */
class RollingWindow final {
public:
  RollingWindow(size_t capacity, kj::Duration max_age);

  void add(kj::TimePoint at, bool failed);
  void evict(kj::TimePoint now);
  void clear();

  // Clears the window
  void reconfigure(size_t capacity, kj::Duration max_age);

  [[nodiscard]] size_t size() const noexcept {
    return count_;
  }
  [[nodiscard]] size_t failures() const noexcept {
    return failures_;
  }
  [[nodiscard]] size_t capacity() const noexcept {
    return records_.size();
  }
  [[nodiscard]] double failure_rate() const noexcept;

private:
  void pop_oldest();

  kj::Array<CallRecord> records_;
  kj::Duration max_age_;
  size_t head_ = 0; // index of the oldest record
  size_t count_ = 0;
  size_t failures_ = 0;
};

} // namespace resilix::resilience
