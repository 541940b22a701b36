#include "resilix/resilience/config_loader.h"

#include "resilix/core/error.h"
#include "resilix/core/time.h"

#include <kj/debug.h>
#include <kj/vector.h>

namespace resilix::resilience {

using core::ErrorCode;

namespace {

void require_config(bool condition, kj::StringPtr message) {
  if (!condition) {
    core::throw_error(ErrorCode::ConfigurationError, message);
  }
}

kj::Maybe<int64_t> get_non_negative(const core::Config& section, kj::StringPtr key) {
  KJ_IF_SOME(value, section.get<int64_t>(key)) {
    require_config(value >= 0, kj::str("'", key, "' must not be negative"));
    return value;
  }
  require_config(!section.has_key(key), kj::str("'", key, "' must be an integer"));
  return kj::none;
}

kj::Maybe<uint32_t> get_count(const core::Config& section, kj::StringPtr key) {
  KJ_IF_SOME(value, get_non_negative(section, key)) {
    require_config(value <= UINT32_MAX, kj::str("'", key, "' is too large"));
    return static_cast<uint32_t>(value);
  }
  return kj::none;
}

kj::Maybe<kj::Duration> get_millis(const core::Config& section, kj::StringPtr key) {
  KJ_IF_SOME(value, get_non_negative(section, key)) {
    return core::from_millis(value);
  }
  return kj::none;
}

kj::Maybe<double> get_number(const core::Config& section, kj::StringPtr key) {
  KJ_IF_SOME(value, section.get<double>(key)) {
    return value;
  }
  require_config(!section.has_key(key), kj::str("'", key, "' must be a number"));
  return kj::none;
}

} // namespace

kj::Own<const BackoffStrategy> parse_backoff(const core::Config& section) {
  auto type = section.get_or<kj::StringPtr>("type", "exponential"_kj);

  if (type == "fixed") {
    return kj::heap<FixedBackoff>(
        get_millis(section, "delay_ms").orDefault(100 * kj::MILLISECONDS));
  }
  if (type == "linear") {
    return kj::heap<LinearBackoff>(
        get_millis(section, "initial_ms").orDefault(100 * kj::MILLISECONDS),
        get_millis(section, "increment_ms").orDefault(100 * kj::MILLISECONDS),
        get_millis(section, "max_ms").orDefault(30 * kj::SECONDS));
  }
  if (type == "exponential") {
    auto multiplier = get_number(section, "multiplier").orDefault(2.0);
    auto jitter = get_number(section, "jitter").orDefault(0.1);
    require_config(multiplier >= 1.0, "backoff multiplier must be at least 1"_kj);
    require_config(jitter >= 0.0 && jitter <= 1.0, "backoff jitter must be within [0, 1]"_kj);
    return kj::heap<ExponentialBackoff>(
        get_millis(section, "initial_ms").orDefault(100 * kj::MILLISECONDS), multiplier,
        get_millis(section, "max_ms").orDefault(30 * kj::SECONDS), jitter);
  }
  if (type == "schedule") {
    KJ_IF_SOME(delays, section.get<kj::ArrayPtr<const int64_t>>("delays_ms")) {
      auto builder = kj::heapArrayBuilder<kj::Duration>(delays.size());
      for (auto ms : delays) {
        require_config(ms >= 0, "'delays_ms' entries must not be negative"_kj);
        builder.add(core::from_millis(ms));
      }
      return kj::heap<ScheduleBackoff>(builder.finish());
    }
    core::throw_error(ErrorCode::ConfigurationError,
                      "schedule backoff requires an integer array 'delays_ms'"_kj);
  }

  core::throw_error(ErrorCode::ConfigurationError,
                    kj::str("unknown backoff type '", type, "'"));
}

ResilienceConfig parse_resilience_config(const core::Config& section) {
  ResilienceConfig config;

  // Retry
  KJ_IF_SOME(value, get_count(section, "max_attempts")) {
    config.retry.max_attempts = value;
  }
  KJ_IF_SOME(backoff, section.get_section("backoff")) {
    config.retry.backoff = parse_backoff(backoff);
  }
  KJ_IF_SOME(value, section.get<bool>("retry_on_timeout")) {
    config.retry.retry_on_timeout = value;
  }

  // Circuit breaker
  auto& breaker = config.circuit_breaker;
  KJ_IF_SOME(value, get_number(section, "failure_rate_threshold")) {
    breaker.failure_rate_threshold = value;
  }
  KJ_IF_SOME(value, get_count(section, "minimum_calls")) {
    breaker.minimum_calls = value;
  }
  KJ_IF_SOME(value, get_count(section, "sliding_window_size")) {
    breaker.sliding_window_size = value;
  }
  KJ_IF_SOME(value, get_millis(section, "sliding_window_ms")) {
    breaker.sliding_window_duration = value;
  }
  KJ_IF_SOME(value, get_millis(section, "open_duration_ms")) {
    breaker.open_duration = value;
  }
  KJ_IF_SOME(value, get_count(section, "half_open_max_calls")) {
    breaker.half_open_max_calls = value;
  }
  KJ_IF_SOME(value, get_count(section, "half_open_success_threshold")) {
    breaker.half_open_success_threshold = value;
  } else {
    breaker.half_open_success_threshold = breaker.half_open_max_calls;
  }

  // Bulkhead
  KJ_IF_SOME(value, get_count(section, "max_concurrent_calls")) {
    config.bulkhead.max_concurrent_calls = value;
  }
  KJ_IF_SOME(value, get_count(section, "max_wait_queue")) {
    config.bulkhead.max_wait_queue = value;
  }
  config.bulkhead.max_wait_duration = get_millis(section, "max_wait_ms");

  // Timeouts
  config.attempt_timeout = get_millis(section, "timeout_ms");
  config.overall_timeout = get_millis(section, "overall_timeout_ms");

  config.validate();
  return config;
}

size_t load_resilience_configs(ResilienceRegistry& registry, const core::Config& config) {
  core::Config defaults;
  KJ_IF_SOME(section, config.get_section("defaults")) {
    defaults = section.clone();
    registry.set_default_config(parse_resilience_config(defaults));
  }

  size_t count = 0;
  KJ_IF_SOME(resources, config.get_section("resources")) {
    for (auto& name : resources.keys()) {
      auto merged = defaults.clone();
      KJ_IF_SOME(entry, resources.get_section(name)) {
        merged.merge(entry);
      } else {
        core::throw_error(ErrorCode::ConfigurationError,
                          kj::str("resource '", name, "' must be an object"));
      }
      registry.configure(name, parse_resilience_config(merged));
      ++count;
    }
  }
  return count;
}

bool load_resilience_configs(ResilienceRegistry& registry, kj::StringPtr file_path) {
  core::Config config;
  if (!config.load_from_file(file_path)) {
    return false;
  }
  KJ_IF_SOME(exception, kj::runCatchingExceptions(
                            [&]() { load_resilience_configs(registry, config); })) {
    registry.logger().error(kj::str("failed to apply resilience config from ", file_path, ": ",
                                    exception.getDescription()));
    return false;
  }
  return true;
}

} // namespace resilix::resilience
