#pragma once

#include <kj/async.h>
#include <kj/debug.h>
#include <kj/timer.h>

namespace resilix::resilience::test {

// Run `promise` to completion, jumping the manual timer to each pending event
template <typename T>
T drive(kj::Promise<T>& promise, kj::TimerImpl& timer, kj::WaitScope& wait_scope) {
  while (!promise.poll(wait_scope)) {
    KJ_IF_SOME(next, timer.nextEvent()) {
      timer.advanceTo(next);
    } else {
      KJ_FAIL_ASSERT("promise can never complete");
    }
  }
  return promise.wait(wait_scope);
}

// Advance the manual timer by `delay`, running whatever becomes ready
inline void advance(kj::TimerImpl& timer, kj::WaitScope& wait_scope, kj::Duration delay) {
  timer.advanceTo(timer.now() + delay);
  wait_scope.poll();
}

} // namespace resilix::resilience::test
