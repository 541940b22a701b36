#pragma once

#include <atomic>
#include <cstdint>
#include <deque>
#include <kj/async.h>
#include <kj/common.h>
#include <kj/map.h>
#include <kj/memory.h>
#include <kj/mutex.h>
#include <kj/string.h>
#include <kj/time.h>
#include <kj/timer.h>

namespace resilix::resilience {

struct BulkheadConfig {
  uint32_t max_concurrent_calls = 25;
  uint32_t max_wait_queue = 0; // 0 rejects immediately when full
  // Longest time a queued caller waits for a permit; none waits indefinitely
  kj::Maybe<kj::Duration> max_wait_duration;

  // Throws an ErrorCode::ConfigurationError exception on invalid values
  void validate() const;
};

struct BulkheadStats {
  std::atomic<uint64_t> admitted{0};
  std::atomic<uint64_t> rejected{0};
  std::atomic<uint64_t> queued{0};
  std::atomic<uint64_t> wait_timeouts{0};
};

class Bulkhead;

/**
 * @brief Scoped bulkhead admission
 *
 * Move-only. Releases its slot exactly once: on destruction, on release(),
 * or never if moved from.
 */
class BulkheadPermit final {
public:
  BulkheadPermit() = default;
  BulkheadPermit(BulkheadPermit&& other) noexcept : bulkhead_(other.bulkhead_) {
    other.bulkhead_ = kj::none;
  }
  BulkheadPermit& operator=(BulkheadPermit&& other) noexcept;
  KJ_DISALLOW_COPY(BulkheadPermit);
  ~BulkheadPermit() noexcept;

  void release() noexcept;

  [[nodiscard]] bool is_held() const noexcept {
    return bulkhead_ != kj::none;
  }

private:
  friend class Bulkhead;
  explicit BulkheadPermit(Bulkhead& bulkhead) : bulkhead_(bulkhead) {}

  kj::Maybe<Bulkhead&> bulkhead_;
};

/**
 * @brief Counting semaphore bounding concurrent calls to one resource
 *
 * The in-flight count never exceeds max_concurrent_calls. When full, callers
 * of acquire() wait in a FIFO queue of at most max_wait_queue entries; a
 * released permit passes straight to the oldest waiter, so queued callers
 * cannot be overtaken by new arrivals.
 *
 * Waiters may live on other threads' event loops; wake-ups use cross-thread
 * fulfillers. Dropping an acquire() promise removes the waiter, returning the
 * permit if it had already been handed over.
 */
class Bulkhead final {
public:
  explicit Bulkhead(kj::StringPtr name, BulkheadConfig config = {});
  ~Bulkhead() noexcept;

  KJ_DISALLOW_COPY_AND_MOVE(Bulkhead);

  // Admit immediately or return none; never queues
  [[nodiscard]] kj::Maybe<BulkheadPermit> try_acquire();

  /**
   * @brief Admit now, or queue until a permit is released
   *
   * Rejects with an ErrorCode::BulkheadFull exception when the queue is full
   * or the wait exceeds max_wait_duration. Must be called on a thread with a
   * KJ event loop; `timer` belongs to that loop.
   */
  [[nodiscard]] kj::Promise<BulkheadPermit> acquire(kj::Timer& timer);

  /**
   * @brief Replace limits
   *
   * Permits already held stay valid; while in-flight exceeds a lowered
   * maximum, releases retire slots instead of waking waiters.
   */
  void configure(const BulkheadConfig& config);

  [[nodiscard]] uint32_t in_flight() const;
  [[nodiscard]] size_t queued() const;
  [[nodiscard]] BulkheadConfig config() const;

  [[nodiscard]] kj::StringPtr name() const noexcept {
    return name_;
  }
  [[nodiscard]] const BulkheadStats& stats() const noexcept {
    return stats_;
  }

private:
  friend class BulkheadPermit;

  struct Waiter {
    uint64_t id;
    kj::Own<kj::CrossThreadPromiseFulfiller<void>> fulfiller;
  };

  struct State {
    BulkheadConfig config;
    uint32_t in_flight{0};
    uint64_t next_waiter_id{0};
    std::deque<Waiter> waiters;
    // Waiters that were handed a permit but have not yet claimed it
    kj::HashSet<uint64_t> granted;

    explicit State(const BulkheadConfig& cfg) : config(cfg) {}
  };

  void release();
  void abandon_waiter(uint64_t id);
  kj::Promise<BulkheadPermit> reject(kj::StringPtr reason);

  kj::String name_;
  kj::MutexGuarded<State> guarded_;
  BulkheadStats stats_;
};

} // namespace resilix::resilience
