#include "kj/test.h"
#include "resilix/core/error.h"
#include "resilix/resilience/timeout.h"
#include "test_util.h"

#include <kj/async-io.h>
#include <kj/async.h>
#include <kj/timer.h>

using namespace resilix::resilience;
using resilix::core::ErrorCode;
using resilix::core::has_error_code;
using resilix::resilience::test::drive;

namespace {

struct TimeoutFixture {
  kj::EventLoop loop;
  kj::WaitScope wait_scope{loop};
  kj::TimerImpl timer{kj::origin<kj::TimePoint>()};
};

KJ_TEST("with_timeout: Fast operation keeps its value") {
  TimeoutFixture f;
  auto operation = f.timer.afterDelay(10 * kj::MILLISECONDS).then([]() { return 7; });
  auto promise = with_timeout(f.timer, 50 * kj::MILLISECONDS, kj::mv(operation));

  KJ_EXPECT(drive(promise, f.timer, f.wait_scope) == 7);
  KJ_EXPECT(f.timer.now() - kj::origin<kj::TimePoint>() == 10 * kj::MILLISECONDS);
}

KJ_TEST("with_timeout: Slow operation times out") {
  TimeoutFixture f;
  bool callback_fired = false;
  kj::Promise<int> never = kj::NEVER_DONE;
  auto promise = with_timeout(f.timer, 50 * kj::MILLISECONDS, kj::mv(never),
                              kj::Function<void()>([&]() { callback_fired = true; }));

  auto result = kj::runCatchingExceptions([&]() { drive(promise, f.timer, f.wait_scope); });
  KJ_IF_SOME(error, result) {
    KJ_EXPECT(has_error_code(error, ErrorCode::Timeout));
    KJ_EXPECT(error.getDescription().contains("timed out after 50ms"_kj));
  } else {
    KJ_FAIL_EXPECT("expected a timeout");
  }
  KJ_EXPECT(callback_fired);
  KJ_EXPECT(f.timer.now() - kj::origin<kj::TimePoint>() == 50 * kj::MILLISECONDS);
}

KJ_TEST("with_timeout: Losing operation is cancelled") {
  TimeoutFixture f;
  bool destroyed = false;
  kj::Promise<int> slow = f.timer.afterDelay(1 * kj::SECONDS)
                              .then([]() { return 1; })
                              .attach(kj::defer([&]() { destroyed = true; }));
  auto promise = with_timeout(f.timer, 20 * kj::MILLISECONDS, kj::mv(slow));

  KJ_EXPECT_THROW_MESSAGE("timed out", drive(promise, f.timer, f.wait_scope));
  KJ_EXPECT(destroyed);
}

KJ_TEST("with_timeout: Operation errors pass through") {
  TimeoutFixture f;
  kj::Promise<int> failing = KJ_EXCEPTION(DISCONNECTED, "connection reset");
  auto promise = with_timeout(f.timer, 50 * kj::MILLISECONDS, kj::mv(failing));

  auto result = kj::runCatchingExceptions([&]() { drive(promise, f.timer, f.wait_scope); });
  KJ_IF_SOME(error, result) {
    KJ_EXPECT(!has_error_code(error, ErrorCode::Timeout));
    KJ_EXPECT(error.getType() == kj::Exception::Type::DISCONNECTED);
  } else {
    KJ_FAIL_EXPECT("expected the operation error");
  }
}

KJ_TEST("with_deadline: Past deadline times out at once") {
  TimeoutFixture f;
  f.timer.advanceTo(f.timer.now() + 1 * kj::SECONDS);
  auto deadline = f.timer.now() - 10 * kj::MILLISECONDS;

  kj::Promise<int> never = kj::NEVER_DONE;
  auto promise = with_deadline(f.timer, deadline, kj::mv(never));
  KJ_EXPECT_THROW_MESSAGE("timed out after 0ms", drive(promise, f.timer, f.wait_scope));
}

KJ_TEST("with_timeout: Caller is unblocked on a real timer") {
  auto io = kj::setupAsyncIo();
  auto& timer = io.provider->getTimer();

  auto started = timer.now();
  auto held = timer.afterDelay(5 * kj::SECONDS).then([]() { return 1; });
  auto promise = with_timeout(timer, 30 * kj::MILLISECONDS, kj::mv(held));

  KJ_EXPECT_THROW_MESSAGE("timed out", promise.wait(io.waitScope));
  auto elapsed = timer.now() - started;
  KJ_EXPECT(elapsed >= 30 * kj::MILLISECONDS, elapsed);
  KJ_EXPECT(elapsed < 1 * kj::SECONDS, elapsed);
}

} // namespace
