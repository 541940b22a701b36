#include "resilix/resilience/rolling_window.h"

#include "resilix/core/error.h"

namespace resilix::resilience {

namespace {

kj::Array<CallRecord> make_records(size_t capacity) {
  auto builder = kj::heapArrayBuilder<CallRecord>(capacity);
  for (size_t i = 0; i < capacity; ++i) {
    builder.add(CallRecord{kj::origin<kj::TimePoint>(), false});
  }
  return builder.finish();
}

} // namespace

RollingWindow::RollingWindow(size_t capacity, kj::Duration max_age)
    : records_(make_records(capacity)), max_age_(max_age) {
  RESILIX_REQUIRE(capacity > 0, "rolling window capacity must be positive");
}

void RollingWindow::add(kj::TimePoint at, bool failed) {
  if (count_ == records_.size()) {
    pop_oldest();
  }
  records_[(head_ + count_) % records_.size()] = CallRecord{at, failed};
  ++count_;
  if (failed) {
    ++failures_;
  }
}

void RollingWindow::evict(kj::TimePoint now) {
  while (count_ > 0 && now - records_[head_].at >= max_age_) {
    pop_oldest();
  }
}

void RollingWindow::clear() {
  head_ = 0;
  count_ = 0;
  failures_ = 0;
}

void RollingWindow::reconfigure(size_t capacity, kj::Duration max_age) {
  RESILIX_REQUIRE(capacity > 0, "rolling window capacity must be positive");
  records_ = make_records(capacity);
  max_age_ = max_age;
  clear();
}

double RollingWindow::failure_rate() const noexcept {
  if (count_ == 0) {
    return 0.0;
  }
  return static_cast<double>(failures_) / static_cast<double>(count_);
}

void RollingWindow::pop_oldest() {
  if (records_[head_].failed) {
    --failures_;
  }
  head_ = (head_ + 1) % records_.size();
  --count_;
}

} // namespace resilix::resilience
