#include "resilix/resilience/bulkhead.h"

#include "resilix/core/error.h"

#include <kj/debug.h>
#include <kj/vector.h>

namespace resilix::resilience {

using core::ErrorCode;

void BulkheadConfig::validate() const {
  if (max_concurrent_calls < 1) {
    core::throw_error(ErrorCode::ConfigurationError,
                      "invalid bulkhead config: max_concurrent_calls must be at least 1");
  }
  KJ_IF_SOME(wait, max_wait_duration) {
    if (wait < 0 * kj::NANOSECONDS) {
      core::throw_error(ErrorCode::ConfigurationError,
                        "invalid bulkhead config: max_wait_duration must not be negative");
    }
  }
}

namespace {

const BulkheadConfig& validated(const BulkheadConfig& config) {
  config.validate();
  return config;
}

} // namespace

// ============================================================================
// BulkheadPermit
// ============================================================================

BulkheadPermit& BulkheadPermit::operator=(BulkheadPermit&& other) noexcept {
  if (this != &other) {
    release();
    bulkhead_ = other.bulkhead_;
    other.bulkhead_ = kj::none;
  }
  return *this;
}

BulkheadPermit::~BulkheadPermit() noexcept {
  release();
}

void BulkheadPermit::release() noexcept {
  KJ_IF_SOME(bulkhead, bulkhead_) {
    bulkhead_ = kj::none;
    bulkhead.release();
  }
}

// ============================================================================
// Bulkhead
// ============================================================================

Bulkhead::Bulkhead(kj::StringPtr name, BulkheadConfig config)
    : name_(kj::heapString(name)), guarded_(validated(config)) {}

Bulkhead::~Bulkhead() noexcept = default;

kj::Maybe<BulkheadPermit> Bulkhead::try_acquire() {
  {
    auto lock = guarded_.lockExclusive();
    if (lock->in_flight < lock->config.max_concurrent_calls && lock->waiters.empty()) {
      lock->in_flight++;
      stats_.admitted++;
      return BulkheadPermit(*this);
    }
  }
  stats_.rejected++;
  return kj::none;
}

kj::Promise<BulkheadPermit> Bulkhead::acquire(kj::Timer& timer) {
  uint64_t id = 0;
  kj::Maybe<kj::Duration> max_wait;
  kj::Promise<void> granted = nullptr;
  {
    auto lock = guarded_.lockExclusive();
    if (lock->in_flight < lock->config.max_concurrent_calls && lock->waiters.empty()) {
      lock->in_flight++;
      stats_.admitted++;
      return BulkheadPermit(*this);
    }
    if (lock->waiters.size() >= lock->config.max_wait_queue) {
      return reject("wait queue full"_kj);
    }
    auto paf = kj::newPromiseAndCrossThreadFulfiller<void>();
    granted = kj::mv(paf.promise);
    id = lock->next_waiter_id++;
    lock->waiters.push_back(Waiter{id, kj::mv(paf.fulfiller)});
    max_wait = lock->config.max_wait_duration;
  }
  stats_.queued++;

  // Runs when the wait ends for any reason; a no-op once the permit is claimed
  auto guard = kj::defer([this, id]() { abandon_waiter(id); });

  kj::Promise<BulkheadPermit> waiting = granted
                                            .then([this, id]() {
                                              auto lock = guarded_.lockExclusive();
                                              lock->granted.erase(id);
                                              stats_.admitted++;
                                              return BulkheadPermit(*this);
                                            })
                                            .attach(kj::mv(guard));

  KJ_IF_SOME(limit, max_wait) {
    return waiting.exclusiveJoin(
        timer.afterDelay(limit).then([this]() -> kj::Promise<BulkheadPermit> {
          stats_.wait_timeouts++;
          return reject("timed out waiting for a permit"_kj);
        }));
  }
  return waiting;
}

void Bulkhead::configure(const BulkheadConfig& config) {
  config.validate();
  kj::Vector<kj::Own<kj::CrossThreadPromiseFulfiller<void>>> wake;
  {
    auto lock = guarded_.lockExclusive();
    lock->config = config;
    // A raised limit admits queued callers right away
    while (lock->in_flight < lock->config.max_concurrent_calls && !lock->waiters.empty()) {
      auto waiter = kj::mv(lock->waiters.front());
      lock->waiters.pop_front();
      lock->granted.insert(waiter.id);
      lock->in_flight++;
      wake.add(kj::mv(waiter.fulfiller));
    }
  }
  for (auto& fulfiller : wake) {
    fulfiller->fulfill();
  }
}

uint32_t Bulkhead::in_flight() const {
  return guarded_.lockShared()->in_flight;
}

size_t Bulkhead::queued() const {
  return guarded_.lockShared()->waiters.size();
}

BulkheadConfig Bulkhead::config() const {
  return guarded_.lockShared()->config;
}

void Bulkhead::release() {
  kj::Maybe<kj::Own<kj::CrossThreadPromiseFulfiller<void>>> wake;
  {
    auto lock = guarded_.lockExclusive();
    if (!lock->waiters.empty() && lock->in_flight <= lock->config.max_concurrent_calls) {
      // Hand the slot to the oldest waiter; in_flight is unchanged
      auto waiter = kj::mv(lock->waiters.front());
      lock->waiters.pop_front();
      lock->granted.insert(waiter.id);
      wake = kj::mv(waiter.fulfiller);
    } else {
      KJ_ASSERT(lock->in_flight > 0, "bulkhead released more permits than it granted", name_);
      lock->in_flight--;
    }
  }
  KJ_IF_SOME(fulfiller, wake) {
    fulfiller->fulfill();
  }
}

void Bulkhead::abandon_waiter(uint64_t id) {
  bool holds_permit = false;
  {
    auto lock = guarded_.lockExclusive();
    for (auto it = lock->waiters.begin(); it != lock->waiters.end(); ++it) {
      if (it->id == id) {
        lock->waiters.erase(it);
        return;
      }
    }
    holds_permit = lock->granted.erase(id);
  }
  if (holds_permit) {
    release();
  }
}

kj::Promise<BulkheadPermit> Bulkhead::reject(kj::StringPtr reason) {
  stats_.rejected++;
  return core::make_exception(ErrorCode::BulkheadFull,
                              kj::str("bulkhead '", name_, "' rejected call: ", reason));
}

} // namespace resilix::resilience
