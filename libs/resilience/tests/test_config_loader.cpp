#include "kj/test.h"
#include "resilix/core/error.h"
#include "resilix/core/logger.h"
#include "resilix/resilience/config_loader.h"

#include <filesystem> // Test cleanup only
#include <fstream>
#include <kj/timer.h>

using namespace resilix;
using namespace resilix::resilience;
using core::Config;
using core::ErrorCode;

namespace {

// Error code of the exception thrown by `func`, none if it did not throw
template <typename Func> kj::Maybe<ErrorCode> thrown_code(Func&& func) {
  KJ_IF_SOME(exception, kj::runCatchingExceptions(kj::fwd<Func>(func))) {
    return core::error_code_of(exception);
  }
  return kj::none;
}

ErrorCode parse_error(kj::StringPtr json) {
  auto section = Config::parse(json);
  return KJ_ASSERT_NONNULL(thrown_code([&]() { (void)parse_resilience_config(section); }));
}

struct LoaderFixture {
  LoaderFixture() {
    logger.set_level(core::LogLevel::Off);
  }

  kj::TimerImpl clock{kj::origin<kj::TimePoint>()};
  core::Logger logger;
  ResilienceRegistry registry{clock, logger};
};

// ============================================================================
// Backoff
// ============================================================================

KJ_TEST("parse_backoff: Fixed") {
  auto backoff = parse_backoff(Config::parse(R"({"type": "fixed", "delay_ms": 250})"_kj));
  KJ_EXPECT(backoff->delay(1) == 250 * kj::MILLISECONDS);
  KJ_EXPECT(backoff->delay(9) == 250 * kj::MILLISECONDS);
}

KJ_TEST("parse_backoff: Linear") {
  auto backoff = parse_backoff(Config::parse(
      R"({"type": "linear", "initial_ms": 100, "increment_ms": 50, "max_ms": 220})"_kj));
  KJ_EXPECT(backoff->delay(1) == 100 * kj::MILLISECONDS);
  KJ_EXPECT(backoff->delay(2) == 150 * kj::MILLISECONDS);
  KJ_EXPECT(backoff->delay(4) == 220 * kj::MILLISECONDS);
}

KJ_TEST("parse_backoff: Exponential without jitter") {
  auto backoff = parse_backoff(Config::parse(
      R"({"type": "exponential", "initial_ms": 10, "multiplier": 3, "max_ms": 200,
          "jitter": 0})"_kj));
  KJ_EXPECT(backoff->delay(1) == 10 * kj::MILLISECONDS);
  KJ_EXPECT(backoff->delay(2) == 30 * kj::MILLISECONDS);
  KJ_EXPECT(backoff->delay(3) == 90 * kj::MILLISECONDS);
  KJ_EXPECT(backoff->delay(4) == 200 * kj::MILLISECONDS);
}

KJ_TEST("parse_backoff: Exponential is the default type") {
  auto backoff = parse_backoff(Config::parse(R"({"initial_ms": 40, "jitter": 0})"_kj));
  KJ_EXPECT(backoff->delay(2) == 80 * kj::MILLISECONDS);
}

KJ_TEST("parse_backoff: Schedule") {
  auto backoff =
      parse_backoff(Config::parse(R"({"type": "schedule", "delays_ms": [5, 50, 500]})"_kj));
  KJ_EXPECT(backoff->delay(1) == 5 * kj::MILLISECONDS);
  KJ_EXPECT(backoff->delay(3) == 500 * kj::MILLISECONDS);
  KJ_EXPECT(backoff->delay(7) == 500 * kj::MILLISECONDS);
}

KJ_TEST("parse_backoff: Invalid sections are configuration errors") {
  for (auto json : {R"({"type": "random"})", R"({"type": "schedule"})",
                    R"({"type": "schedule", "delays_ms": [10, -1]})",
                    R"({"type": "exponential", "multiplier": 0.5})",
                    R"({"type": "exponential", "jitter": 1.5})",
                    R"({"type": "fixed", "delay_ms": "soon"})"}) {
    auto section = Config::parse(json);
    auto code = thrown_code([&]() { (void)parse_backoff(section); });
    KJ_EXPECT(KJ_ASSERT_NONNULL(code) == ErrorCode::ConfigurationError, json);
  }
}

// ============================================================================
// Resource config
// ============================================================================

KJ_TEST("parse_resilience_config: Reads every key") {
  auto config = parse_resilience_config(Config::parse(R"({
        "max_attempts": 4,
        "retry_on_timeout": false,
        "backoff": {"type": "fixed", "delay_ms": 20},
        "failure_rate_threshold": 0.25,
        "minimum_calls": 8,
        "sliding_window_size": 16,
        "sliding_window_ms": 60000,
        "open_duration_ms": 5000,
        "half_open_max_calls": 2,
        "half_open_success_threshold": 1,
        "max_concurrent_calls": 12,
        "max_wait_queue": 6,
        "max_wait_ms": 300,
        "timeout_ms": 1500,
        "overall_timeout_ms": 4000
    })"_kj));

  KJ_EXPECT(config.retry.max_attempts == 4);
  KJ_EXPECT(!config.retry.retry_on_timeout);
  KJ_EXPECT(config.retry.backoff->delay(3) == 20 * kj::MILLISECONDS);

  auto& breaker = config.circuit_breaker;
  KJ_EXPECT(breaker.failure_rate_threshold == 0.25);
  KJ_EXPECT(breaker.minimum_calls == 8);
  KJ_EXPECT(breaker.sliding_window_size == 16);
  KJ_EXPECT(breaker.sliding_window_duration == 60 * kj::SECONDS);
  KJ_EXPECT(breaker.open_duration == 5 * kj::SECONDS);
  KJ_EXPECT(breaker.half_open_max_calls == 2);
  KJ_EXPECT(breaker.half_open_success_threshold == 1);

  KJ_EXPECT(config.bulkhead.max_concurrent_calls == 12);
  KJ_EXPECT(config.bulkhead.max_wait_queue == 6);
  KJ_EXPECT(KJ_ASSERT_NONNULL(config.bulkhead.max_wait_duration) == 300 * kj::MILLISECONDS);
  KJ_EXPECT(KJ_ASSERT_NONNULL(config.attempt_timeout) == 1500 * kj::MILLISECONDS);
  KJ_EXPECT(KJ_ASSERT_NONNULL(config.overall_timeout) == 4 * kj::SECONDS);
}

KJ_TEST("parse_resilience_config: Absent keys keep defaults") {
  auto config = parse_resilience_config(Config::parse(R"({"half_open_max_calls": 5})"_kj));
  KJ_EXPECT(config.retry.max_attempts == 3);
  KJ_EXPECT(config.retry.retry_on_timeout);
  KJ_EXPECT(config.circuit_breaker.half_open_success_threshold == 5);
  KJ_EXPECT(config.bulkhead.max_wait_duration == kj::none);
  KJ_EXPECT(config.attempt_timeout == kj::none);
  KJ_EXPECT(config.overall_timeout == kj::none);
}

KJ_TEST("parse_resilience_config: Malformed values are configuration errors") {
  KJ_EXPECT(parse_error(R"({"max_attempts": 0})"_kj) == ErrorCode::ConfigurationError);
  KJ_EXPECT(parse_error(R"({"max_attempts": -2})"_kj) == ErrorCode::ConfigurationError);
  KJ_EXPECT(parse_error(R"({"max_attempts": "three"})"_kj) == ErrorCode::ConfigurationError);
  KJ_EXPECT(parse_error(R"({"failure_rate_threshold": 1.5})"_kj) ==
            ErrorCode::ConfigurationError);
  KJ_EXPECT(parse_error(R"({"minimum_calls": 30, "sliding_window_size": 10})"_kj) ==
            ErrorCode::ConfigurationError);
  KJ_EXPECT(parse_error(R"({"max_concurrent_calls": 0})"_kj) == ErrorCode::ConfigurationError);
  KJ_EXPECT(parse_error(R"({"timeout_ms": 0})"_kj) == ErrorCode::ConfigurationError);
  KJ_EXPECT(parse_error(R"({"half_open_max_calls": 1, "half_open_success_threshold": 2})"_kj) ==
            ErrorCode::ConfigurationError);
}

// ============================================================================
// Documents
// ============================================================================

KJ_TEST("load_resilience_configs: Resources merge onto defaults") {
  LoaderFixture f;
  auto document = Config::parse(R"({
        "defaults": {"max_attempts": 2, "timeout_ms": 500},
        "resources": {
            "payments": {"max_attempts": 5, "max_concurrent_calls": 4},
            "search": {}
        }
    })"_kj);

  KJ_EXPECT(load_resilience_configs(f.registry, document) == 2);
  KJ_EXPECT(f.registry.size() == 2);

  auto payments = f.registry.resource("payments").config();
  KJ_EXPECT(payments->config().retry.max_attempts == 5);
  KJ_EXPECT(KJ_ASSERT_NONNULL(payments->config().attempt_timeout) == 500 * kj::MILLISECONDS);
  KJ_EXPECT(f.registry.resource("payments").bulkhead().config().max_concurrent_calls == 4);

  auto search = f.registry.resource("search").config();
  KJ_EXPECT(search->config().retry.max_attempts == 2);

  // Defaults also apply to resources referenced later
  KJ_EXPECT(f.registry.resource("other").config()->config().retry.max_attempts == 2);
}

KJ_TEST("load_resilience_configs: Non-object resource entry is rejected") {
  LoaderFixture f;
  auto document = Config::parse(R"({"resources": {"payments": 3}})"_kj);
  auto code = thrown_code([&]() { load_resilience_configs(f.registry, document); });
  KJ_EXPECT(KJ_ASSERT_NONNULL(code) == ErrorCode::ConfigurationError);
}

KJ_TEST("load_resilience_configs: From file") {
  LoaderFixture f;
  auto path = std::filesystem::temp_directory_path() / "resilix_resilience_config_test.json";
  {
    std::ofstream out(path);
    out << R"({"resources": {"svc": {"max_attempts": 3, "backoff": {"type": "fixed"}}}})";
  }
  KJ_EXPECT(load_resilience_configs(f.registry, kj::StringPtr(path.c_str())));
  KJ_EXPECT(f.registry.find("svc") != kj::none);

  {
    std::ofstream out(path);
    out << R"({"resources": {"svc": {"max_attempts": 0}}})";
  }
  KJ_EXPECT(!load_resilience_configs(f.registry, kj::StringPtr(path.c_str())));
  KJ_EXPECT(f.registry.resource("svc").config()->config().retry.max_attempts == 3);
  std::filesystem::remove(path);

  {
    KJ_EXPECT_LOG(ERROR, "failed to load configuration file");
    KJ_EXPECT(!load_resilience_configs(f.registry, "/nonexistent/resilix.json"_kj));
  }
}

} // namespace
