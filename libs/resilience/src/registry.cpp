#include "resilix/resilience/registry.h"

#include <kj/debug.h>

namespace resilix::resilience {

kj::String metric_safe_name(kj::StringPtr name) {
  auto result = kj::heapString(name);
  for (auto& c : result) {
    bool ok = (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') || (c >= '0' && c <= '9') ||
              c == '_';
    if (!ok) {
      c = '_';
    }
  }
  return result;
}

// ============================================================================
// ResourceState
// ============================================================================

ResourceState::ResourceState(kj::StringPtr name, kj::Own<const ConfigSnapshot> config,
                             const kj::MonotonicClock& clock, ResourceMetrics metrics)
    : name_(kj::heapString(name)), metrics_(metrics),
      breaker_(name, config->config().circuit_breaker, clock),
      bulkhead_(name, config->config().bulkhead), config_(kj::mv(config)) {}

kj::Own<const ConfigSnapshot> ResourceState::config() const {
  auto lock = config_.lockShared();
  return kj::atomicAddRef(**lock);
}

void ResourceState::replace_config(kj::Own<const ConfigSnapshot> config) {
  kj::Own<const ConfigSnapshot> old;
  {
    auto lock = config_.lockExclusive();
    old = kj::mv(*lock);
    *lock = kj::mv(config);
  }
}

// ============================================================================
// ResilienceRegistry
// ============================================================================

ResilienceRegistry::ResilienceRegistry(const kj::MonotonicClock& clock, core::Logger& logger)
    : clock_(clock), logger_(logger), default_config_(make_snapshot(ResilienceConfig())) {}

ResilienceRegistry::~ResilienceRegistry() noexcept = default;

void ResilienceRegistry::configure(kj::StringPtr name, ResilienceConfig config) {
  auto snapshot = make_snapshot(kj::mv(config));
  auto& cfg = snapshot->config();

  bool created = false;
  auto& resource = get_or_create(name, kj::atomicAddRef(*snapshot), created);
  if (!created) {
    resource.circuit_breaker().configure(cfg.circuit_breaker);
    resource.bulkhead().configure(cfg.bulkhead);
    resource.replace_config(kj::atomicAddRef(*snapshot));
  }

  logger_.info(kj::str("resilience config ", created ? "registered" : "replaced", " for '", name,
                       "': max_attempts=", cfg.retry.max_attempts,
                       " failure_rate_threshold=", cfg.circuit_breaker.failure_rate_threshold,
                       " max_concurrent_calls=", cfg.bulkhead.max_concurrent_calls));
}

void ResilienceRegistry::set_default_config(ResilienceConfig config) {
  auto snapshot = make_snapshot(kj::mv(config));
  *default_config_.lockExclusive() = kj::mv(snapshot);
  logger_.info("default resilience config replaced"_kj);
}

ResourceState& ResilienceRegistry::resource(kj::StringPtr name) {
  bool created = false;
  return get_or_create(name, kj::none, created);
}

kj::Maybe<ResourceState&> ResilienceRegistry::find(kj::StringPtr name) {
  auto lock = resources_.lockExclusive();
  KJ_IF_SOME(state, lock->find(name)) {
    return *state;
  }
  return kj::none;
}

void ResilienceRegistry::add_listener(kj::Own<ResilienceListener> listener) {
  listeners_.lockExclusive()->add(kj::mv(listener));
}

kj::Array<kj::String> ResilienceRegistry::resource_names() const {
  auto lock = resources_.lockShared();
  auto builder = kj::heapArrayBuilder<kj::String>(lock->size());
  for (const auto& entry : *lock) {
    builder.add(kj::heapString(entry.key));
  }
  return builder.finish();
}

size_t ResilienceRegistry::size() const {
  return resources_.lockShared()->size();
}

ResourceState& ResilienceRegistry::get_or_create(kj::StringPtr name,
                                                 kj::Maybe<kj::Own<const ConfigSnapshot>> config,
                                                 bool& created) {
  RESILIX_REQUIRE(name.size() > 0, "resource name must not be empty");

  auto lock = resources_.lockExclusive();
  KJ_IF_SOME(state, lock->find(name)) {
    return *state;
  }

  auto safe_name = metric_safe_name(name);
  for (auto& entry : *lock) {
    if (metric_safe_name(entry.key) == safe_name) {
      core::throw_error(core::ErrorCode::ConfigurationError,
                        kj::str("resource name '", name, "' collides with '", entry.key,
                                "' in metric names"));
    }
  }

  kj::Own<const ConfigSnapshot> snapshot;
  KJ_IF_SOME(given, config) {
    snapshot = kj::mv(given);
  } else {
    snapshot = kj::atomicAddRef(**default_config_.lockShared());
  }

  auto state = kj::heap<ResourceState>(name, kj::mv(snapshot), clock_, register_metrics(name));
  auto resource_name = kj::heapString(name);
  state->circuit_breaker().set_state_change_callback(
      [this, resource_name = kj::mv(resource_name)](CircuitState from, CircuitState to) {
        report_state_change(resource_name, from, to);
      });

  auto& ref = *state;
  lock->insert(kj::heapString(name), kj::mv(state));
  created = true;
  logger_.debug(kj::str("resilience resource '", name, "' created"));
  return ref;
}

ResourceMetrics ResilienceRegistry::register_metrics(kj::StringPtr name) {
  auto prefix = kj::str("resilix_", metric_safe_name(name));
  auto counter = [&](kj::StringPtr suffix, kj::StringPtr help) -> core::Counter& {
    return metrics_.register_counter(kj::str(prefix, suffix), kj::str(help, " for ", name));
  };
  return ResourceMetrics{
      .calls = counter("_calls_total"_kj, "Pipeline executions started"_kj),
      .success = counter("_success_total"_kj, "Executions that succeeded"_kj),
      .fallback = counter("_fallback_total"_kj, "Executions answered by the fallback"_kj),
      .failure = counter("_failure_total"_kj, "Executions that failed"_kj),
      .retries = counter("_retries_total"_kj, "Retried attempts"_kj),
      .timeouts = counter("_timeouts_total"_kj, "Calls that timed out"_kj),
      .circuit_rejections =
          counter("_circuit_rejections_total"_kj, "Attempts rejected by an open circuit"_kj),
      .bulkhead_rejections =
          counter("_bulkhead_rejections_total"_kj, "Executions rejected by the bulkhead"_kj),
      .bulkhead_in_flight = metrics_.register_gauge(kj::str(prefix, "_bulkhead_in_flight"),
                                                    kj::str("Calls in flight for ", name)),
      .latency_seconds = metrics_.register_histogram(kj::str(prefix, "_latency_seconds"),
                                                     kj::str("Execution latency for ", name)),
  };
}

void ResilienceRegistry::report_retry(ResourceState& resource, uint32_t attempt,
                                      const kj::Exception& error, kj::Duration delay) {
  resource.metrics().retries.increment();
  logger_.debug(kj::str("retrying '", resource.name(), "' after attempt ", attempt, " in ",
                        core::to_millis(delay), "ms: ", error.getDescription()));
  auto lock = listeners_.lockExclusive();
  for (auto& listener : *lock) {
    listener->on_retry(resource.name(), attempt, error, delay);
  }
}

void ResilienceRegistry::report_timeout(ResourceState& resource) {
  resource.metrics().timeouts.increment();
  logger_.warn(kj::str("call to '", resource.name(), "' timed out"));
  auto lock = listeners_.lockExclusive();
  for (auto& listener : *lock) {
    listener->on_timeout(resource.name());
  }
}

void ResilienceRegistry::report_circuit_rejection(ResourceState& resource) {
  resource.metrics().circuit_rejections.increment();
  logger_.debug(kj::str("circuit for '", resource.name(), "' is open, call short-circuited"));
}

void ResilienceRegistry::report_bulkhead_rejection(ResourceState& resource,
                                                   const kj::Exception& error) {
  resource.metrics().bulkhead_rejections.increment();
  logger_.warn(kj::str("bulkhead rejected call to '", resource.name(),
                       "': ", error.getDescription()));
  auto lock = listeners_.lockExclusive();
  for (auto& listener : *lock) {
    listener->on_bulkhead_reject(resource.name());
  }
}

void ResilienceRegistry::report_state_change(kj::StringPtr resource, CircuitState from,
                                             CircuitState to) {
  logger_.warn(kj::str("circuit breaker '", resource, "' changed state: ", to_string(from),
                       " -> ", to_string(to)));
  auto lock = listeners_.lockExclusive();
  for (auto& listener : *lock) {
    listener->on_circuit_state_change(resource, from, to);
  }
}

} // namespace resilix::resilience
