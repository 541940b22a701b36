#include "kj/test.h"
#include "resilix/core/error.h"
#include "resilix/resilience/retry.h"
#include "test_util.h"

#include <kj/async.h>
#include <kj/timer.h>
#include <kj/vector.h>

using namespace resilix::resilience;
using resilix::core::ErrorCode;
using resilix::core::has_error_code;
using resilix::core::make_exception;
using resilix::resilience::test::drive;

namespace {

struct RetryFixture {
  kj::EventLoop loop;
  kj::WaitScope wait_scope{loop};
  kj::TimerImpl timer{kj::origin<kj::TimePoint>()};
};

RetryConfig fixed_config(uint32_t max_attempts, kj::Duration delay) {
  RetryConfig config;
  config.max_attempts = max_attempts;
  config.backoff = kj::heap<FixedBackoff>(delay);
  return config;
}

KJ_TEST("RetryExecutor: Success on first attempt") {
  RetryFixture f;
  auto config = fixed_config(3, 10 * kj::MILLISECONDS);
  RetryExecutor executor(config, f.timer);

  int calls = 0;
  auto promise = executor.run<int>([&](uint32_t) -> kj::Promise<int> {
    ++calls;
    return 42;
  });

  KJ_EXPECT(drive(promise, f.timer, f.wait_scope) == 42);
  KJ_EXPECT(calls == 1);
  KJ_EXPECT(executor.attempts() == 1);
  KJ_EXPECT(f.timer.now() == kj::origin<kj::TimePoint>());
}

KJ_TEST("RetryExecutor: Transient failures are retried with backoff") {
  RetryFixture f;
  auto config = fixed_config(3, 10 * kj::MILLISECONDS);
  RetryExecutor executor(config, f.timer);

  auto promise = executor.run<int>([&](uint32_t attempt) -> kj::Promise<int> {
    if (attempt < 3) {
      return make_exception(ErrorCode::TransientFailure, "flaky"_kj);
    }
    return static_cast<int>(attempt);
  });

  KJ_EXPECT(drive(promise, f.timer, f.wait_scope) == 3);
  KJ_EXPECT(executor.attempts() == 3);
  // Two 10ms waits between three attempts
  KJ_EXPECT(f.timer.now() - kj::origin<kj::TimePoint>() == 20 * kj::MILLISECONDS);
}

KJ_TEST("RetryExecutor: Exhausted attempts surface the last error") {
  RetryFixture f;
  auto config = fixed_config(4, 1 * kj::MILLISECONDS);
  RetryExecutor executor(config, f.timer);

  int calls = 0;
  auto promise = executor.run<int>([&](uint32_t attempt) -> kj::Promise<int> {
    ++calls;
    return make_exception(ErrorCode::TransientFailure, kj::str("failure ", attempt));
  });

  KJ_EXPECT_THROW_MESSAGE("failure 4", drive(promise, f.timer, f.wait_scope));
  KJ_EXPECT(calls == 4);
}

KJ_TEST("RetryExecutor: Synchronous throws count as failed attempts") {
  RetryFixture f;
  auto config = fixed_config(2, 1 * kj::MILLISECONDS);
  RetryExecutor executor(config, f.timer);

  int calls = 0;
  auto promise = executor.run<int>([&](uint32_t) -> kj::Promise<int> {
    ++calls;
    kj::throwFatalException(make_exception(ErrorCode::TransientFailure, "thrown"_kj));
  });

  KJ_EXPECT_THROW_MESSAGE("thrown", drive(promise, f.timer, f.wait_scope));
  KJ_EXPECT(calls == 2);
}

KJ_TEST("RetryExecutor: Permanent failures are not retried") {
  RetryFixture f;
  auto config = fixed_config(5, 1 * kj::MILLISECONDS);
  RetryExecutor executor(config, f.timer);

  int calls = 0;
  auto promise = executor.run<int>([&](uint32_t) -> kj::Promise<int> {
    ++calls;
    return make_exception(ErrorCode::PermanentFailure, "bad request"_kj);
  });

  KJ_EXPECT_THROW_MESSAGE("bad request", drive(promise, f.timer, f.wait_scope));
  KJ_EXPECT(calls == 1);
}

KJ_TEST("RetryExecutor: Circuit and bulkhead rejections are never retried") {
  RetryConfig config;
  KJ_EXPECT(!config.is_retryable(make_exception(ErrorCode::CircuitOpen, "open"_kj)));
  KJ_EXPECT(!config.is_retryable(make_exception(ErrorCode::BulkheadFull, "full"_kj)));
  KJ_EXPECT(!config.is_retryable(make_exception(ErrorCode::ConfigurationError, "bad"_kj)));

  // Not even when a predicate accepts everything
  config.retry_predicate = FailurePredicate([](const kj::Exception&) { return true; });
  KJ_EXPECT(!config.is_retryable(make_exception(ErrorCode::CircuitOpen, "open"_kj)));
}

KJ_TEST("RetryConfig: Default classification of untagged exceptions") {
  RetryConfig config;
  kj::Exception disconnected(kj::Exception::Type::DISCONNECTED, __FILE__, __LINE__,
                             kj::str("connection reset"));
  kj::Exception overloaded(kj::Exception::Type::OVERLOADED, __FILE__, __LINE__,
                           kj::str("try later"));
  kj::Exception failed(kj::Exception::Type::FAILED, __FILE__, __LINE__, kj::str("logic error"));

  KJ_EXPECT(config.is_retryable(disconnected));
  KJ_EXPECT(config.is_retryable(overloaded));
  KJ_EXPECT(!config.is_retryable(failed));
}

KJ_TEST("RetryConfig: Timeout follows retry_on_timeout") {
  RetryConfig config;
  auto timeout = make_exception(ErrorCode::Timeout, "slow"_kj);
  KJ_EXPECT(config.is_retryable(timeout));
  config.retry_on_timeout = false;
  KJ_EXPECT(!config.is_retryable(timeout));
}

KJ_TEST("RetryExecutor: Custom retry predicate") {
  RetryFixture f;
  auto config = fixed_config(5, 1 * kj::MILLISECONDS);
  config.retry_predicate = FailurePredicate([](const kj::Exception& e) {
    return e.getDescription().contains("retry me"_kj);
  });
  RetryExecutor executor(config, f.timer);

  int calls = 0;
  auto promise = executor.run<int>([&](uint32_t attempt) -> kj::Promise<int> {
    ++calls;
    if (attempt == 1) {
      return KJ_EXCEPTION(FAILED, "please retry me");
    }
    return KJ_EXCEPTION(FAILED, "give up");
  });

  KJ_EXPECT_THROW_MESSAGE("give up", drive(promise, f.timer, f.wait_scope));
  KJ_EXPECT(calls == 2);
}

KJ_TEST("RetryExecutor: Callback sees attempt, error and delay") {
  RetryFixture f;
  RetryConfig config;
  config.max_attempts = 3;
  config.backoff = kj::heap<LinearBackoff>(10 * kj::MILLISECONDS, 5 * kj::MILLISECONDS,
                                           1 * kj::SECONDS);
  RetryExecutor executor(config, f.timer);

  kj::Vector<uint32_t> attempts;
  kj::Vector<kj::Duration> delays;
  executor.set_retry_callback([&](uint32_t attempt, const kj::Exception& error,
                                  kj::Duration delay) {
    KJ_EXPECT(error.getDescription().contains("flaky"_kj));
    attempts.add(attempt);
    delays.add(delay);
  });

  auto promise = executor.run<int>([&](uint32_t) -> kj::Promise<int> {
    return make_exception(ErrorCode::TransientFailure, "flaky"_kj);
  });
  KJ_EXPECT_THROW_MESSAGE("flaky", drive(promise, f.timer, f.wait_scope));

  // No callback after the final attempt
  KJ_ASSERT(attempts.size() == 2);
  KJ_EXPECT(attempts[0] == 1);
  KJ_EXPECT(attempts[1] == 2);
  KJ_EXPECT(delays[0] == 10 * kj::MILLISECONDS);
  KJ_EXPECT(delays[1] == 15 * kj::MILLISECONDS);
}

KJ_TEST("RetryExecutor: Deadline stops retrying with a timeout") {
  RetryFixture f;
  auto config = fixed_config(5, 10 * kj::MILLISECONDS);
  RetryExecutor executor(config, f.timer);
  executor.set_deadline(f.timer.now() + 15 * kj::MILLISECONDS);

  int calls = 0;
  auto promise = executor.run<int>([&](uint32_t) -> kj::Promise<int> {
    ++calls;
    return make_exception(ErrorCode::TransientFailure, "unavailable"_kj);
  });

  auto result = kj::runCatchingExceptions([&]() { drive(promise, f.timer, f.wait_scope); });
  KJ_IF_SOME(error, result) {
    KJ_EXPECT(has_error_code(error, ErrorCode::Timeout));
    KJ_EXPECT(error.getDescription().contains("unavailable"_kj));
  } else {
    KJ_FAIL_EXPECT("expected a timeout");
  }
  // Attempt at 0ms and 10ms; a wait until 20ms would cross the deadline
  KJ_EXPECT(calls == 2);
}

KJ_TEST("RetryExecutor: Dropping the promise stops further attempts") {
  RetryFixture f;
  auto config = fixed_config(3, 10 * kj::MILLISECONDS);
  RetryExecutor executor(config, f.timer);

  int calls = 0;
  {
    auto promise = executor.run<int>([&](uint32_t) -> kj::Promise<int> {
      ++calls;
      return make_exception(ErrorCode::TransientFailure, "flaky"_kj);
    });
    KJ_EXPECT(!promise.poll(f.wait_scope));
    KJ_EXPECT(calls == 1);
  }

  resilix::resilience::test::advance(f.timer, f.wait_scope, 100 * kj::MILLISECONDS);
  KJ_EXPECT(calls == 1);
}

} // namespace
