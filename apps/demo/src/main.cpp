/**
 * @file main.cpp
 * @brief Resilix demo: a flaky downstream service behind a resilience pipeline
 *
 * Runs a sequence of calls against a simulated service whose failure rate
 * changes over time, then prints each outcome and the collected metrics:
 * 1. Healthy phase: occasional transient failures absorbed by retries
 * 2. Outage phase: the circuit opens and calls are answered by the fallback
 * 3. Recovery phase: trial calls close the circuit again
 */

#include "resilix/core/error.h"
#include "resilix/core/logger.h"
#include "resilix/resilience/config_loader.h"
#include "resilix/resilience/pipeline.h"

#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <kj/async-io.h>
#include <kj/debug.h>
#include <random>

using namespace resilix;
using namespace resilix::resilience;

namespace {

constexpr auto kResource = "inventory"_kj;

/**
 * @brief Simulated downstream dependency with adjustable failure rate
 */
class FlakyService {
public:
  FlakyService(kj::Timer& timer, uint32_t seed) : timer_(timer), rng_(seed) {}

  void set_failure_rate(double rate) {
    failure_rate_ = rate;
  }

  kj::Promise<int> lookup(uint32_t item) {
    ++invocations_;
    auto latency = static_cast<int64_t>(2 + rng_() % 10) * kj::MILLISECONDS;
    bool fail = std::uniform_real_distribution<double>(0.0, 1.0)(rng_) < failure_rate_;
    return timer_.afterDelay(latency).then([fail, item]() -> kj::Promise<int> {
      if (fail) {
        return core::make_exception(core::ErrorCode::TransientFailure,
                                    kj::str("inventory lookup for item ", item, " failed"));
      }
      return static_cast<int>(item) * 10;
    });
  }

  [[nodiscard]] uint64_t invocations() const {
    return invocations_;
  }

private:
  kj::Timer& timer_;
  std::mt19937 rng_;
  double failure_rate_ = 0.0;
  uint64_t invocations_ = 0;
};

void configure_builtin(ResilienceRegistry& registry) {
  ResilienceConfig config;
  config.retry.max_attempts = 3;
  config.retry.backoff = kj::heap<ExponentialBackoff>(10 * kj::MILLISECONDS, 2.0,
                                                      100 * kj::MILLISECONDS, 0.2);
  config.circuit_breaker.failure_rate_threshold = 0.5;
  config.circuit_breaker.minimum_calls = 6;
  config.circuit_breaker.sliding_window_size = 10;
  config.circuit_breaker.open_duration = 200 * kj::MILLISECONDS;
  config.circuit_breaker.half_open_max_calls = 2;
  config.circuit_breaker.half_open_success_threshold = 2;
  config.bulkhead.max_concurrent_calls = 4;
  config.attempt_timeout = 50 * kj::MILLISECONDS;
  config.overall_timeout = 500 * kj::MILLISECONDS;
  registry.configure(kResource, kj::mv(config));
}

void run_phase(kj::StringPtr title, uint32_t calls, double failure_rate, FlakyService& service,
               ResiliencePipeline& pipeline, kj::WaitScope& wait_scope, uint32_t& next_item) {
  std::printf("\n== %s (failure rate %.0f%%) ==\n", title.cStr(), failure_rate * 100.0);
  service.set_failure_rate(failure_rate);

  for (uint32_t i = 0; i < calls; ++i) {
    uint32_t item = next_item++;
    auto result = pipeline
                      .execute<int>(
                          kResource, [&service, item]() { return service.lookup(item); },
                          [](const ResilienceError&) -> kj::Promise<int> { return -1; })
                      .wait(wait_scope);

    auto elapsed_ms = static_cast<long long>(core::to_millis(result.elapsed()));
    if (result.is_failure()) {
      std::printf("item %3u: %-9s attempts=%u elapsed=%lldms  %s\n", item,
                  to_string(result.outcome()).cStr(), result.attempts(), elapsed_ms,
                  to_string(result.error()).cStr());
    } else {
      std::printf("item %3u: %-9s attempts=%u elapsed=%lldms  value=%d\n", item,
                  to_string(result.outcome()).cStr(), result.attempts(), elapsed_ms,
                  result.value());
    }
  }

  auto& breaker = pipeline.registry().resource(kResource).circuit_breaker();
  std::printf("circuit: %s, failure rate %.2f over %zu samples\n",
              to_string(breaker.state()).cStr(), breaker.failure_rate(), breaker.window_size());
}

void run_demo(kj::Maybe<kj::StringPtr> config_path, uint32_t calls) {
  auto io = kj::setupAsyncIo();
  auto& timer = io.provider->getTimer();

  ResilienceRegistry registry;
  KJ_IF_SOME(path, config_path) {
    KJ_REQUIRE(load_resilience_configs(registry, path), "could not load resilience config", path);
    KJ_REQUIRE(registry.find(kResource) != kj::none, "config does not define the resource",
               kResource);
  } else {
    configure_builtin(registry);
  }

  ResiliencePipeline pipeline(registry, timer);
  FlakyService service(timer, 42);
  uint32_t next_item = 1;

  run_phase("healthy", calls, 0.2, service, pipeline, io.waitScope, next_item);
  run_phase("outage", calls, 1.0, service, pipeline, io.waitScope, next_item);

  auto open_duration = registry.resource(kResource).circuit_breaker().config().open_duration;
  timer.afterDelay(open_duration).wait(io.waitScope);
  run_phase("recovery", calls, 0.0, service, pipeline, io.waitScope, next_item);

  std::printf("\nservice invocations: %llu\n",
              static_cast<unsigned long long>(service.invocations()));
  std::printf("\n%s", registry.metrics().to_prometheus().cStr());
}

void print_usage() {
  std::printf("Resilix resilience pipeline demo\n"
              "\n"
              "Usage: resilix_demo [options]\n"
              "\n"
              "Options:\n"
              "  --config PATH     Load resource policies from a JSON file\n"
              "                    (must define the \"inventory\" resource)\n"
              "  --calls N         Calls per phase (default: 12)\n"
              "  --log-level NAME  trace, debug, info, warn, error or off (default: warn)\n"
              "  --help            Show this help message\n"
              "\n"
              "Examples:\n"
              "  resilix_demo\n"
              "  resilix_demo --config apps/demo/config/resilience.json --log-level info\n");
}

} // namespace

int main(int argc, char* argv[]) {
  try {
    kj::Maybe<kj::StringPtr> config_path;
    uint32_t calls = 12;
    auto& logger = core::global_logger();
    logger.set_level(core::LogLevel::Warn);

    for (int i = 1; i < argc; ++i) {
      kj::StringPtr arg = argv[i];
      if (arg == "--help" || arg == "-h") {
        print_usage();
        return 0;
      } else if (arg == "--config" && i + 1 < argc) {
        config_path = kj::StringPtr(argv[++i]);
      } else if (arg == "--calls" && i + 1 < argc) {
        calls = static_cast<uint32_t>(std::atol(argv[++i]));
      } else if (arg == "--log-level" && i + 1 < argc) {
        kj::StringPtr name = argv[++i];
        KJ_IF_SOME(level, core::to_log_level(name)) {
          logger.set_level(level);
        } else {
          std::fprintf(stderr, "Unknown log level: %s\n", name.cStr());
          return 1;
        }
      } else {
        std::fprintf(stderr, "Unknown option: %s\n", arg.cStr());
        print_usage();
        return 1;
      }
    }

    run_demo(config_path, calls);
    return 0;
  } catch (const kj::Exception& e) {
    KJ_LOG(ERROR, "demo failed with exception", e.getDescription());
    return 1;
  } catch (const std::exception& e) {
    std::fprintf(stderr, "demo failed: %s\n", e.what());
    return 1;
  }
}
