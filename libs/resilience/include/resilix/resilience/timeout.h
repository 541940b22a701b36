#pragma once

#include "resilix/core/error.h"
#include "resilix/core/time.h"

#include <kj/async.h>
#include <kj/common.h>
#include <kj/function.h>
#include <kj/timer.h>

namespace resilix::resilience {

/**
 * @brief Race a promise against a timer
 *
 * If `timeout` elapses first the promise is dropped, which cancels the
 * underlying work cooperatively, and the result rejects with an
 * ErrorCode::Timeout exception after invoking `on_timeout`. Work that does not
 * observe cancellation may keep running, but the caller is released.
 */
template <typename T>
kj::Promise<T> with_timeout(kj::Timer& timer, kj::Duration timeout, kj::Promise<T> promise,
                            kj::Maybe<kj::Function<void()>> on_timeout = kj::none) {
  return promise.exclusiveJoin(timer.afterDelay(timeout).then(
      [timeout, on_timeout = kj::mv(on_timeout)]() mutable -> kj::Promise<T> {
        KJ_IF_SOME(callback, on_timeout) {
          callback();
        }
        return core::make_exception(core::ErrorCode::Timeout,
                                    kj::str("operation timed out after ",
                                            core::to_millis(timeout), "ms"));
      }));
}

/**
 * @brief Like with_timeout(), bounded by an absolute deadline on the timer's clock
 */
template <typename T>
kj::Promise<T> with_deadline(kj::Timer& timer, kj::TimePoint deadline, kj::Promise<T> promise,
                             kj::Maybe<kj::Function<void()>> on_timeout = kj::none) {
  auto remaining = deadline - timer.now();
  if (remaining < 0 * kj::NANOSECONDS) {
    remaining = 0 * kj::NANOSECONDS;
  }
  return with_timeout(timer, remaining, kj::mv(promise), kj::mv(on_timeout));
}

} // namespace resilix::resilience
