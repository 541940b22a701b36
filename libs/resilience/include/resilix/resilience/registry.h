#pragma once

#include "resilix/core/logger.h"
#include "resilix/core/metrics.h"
#include "resilix/core/time.h"
#include "resilix/resilience/bulkhead.h"
#include "resilix/resilience/circuit_breaker.h"
#include "resilix/resilience/listener.h"
#include "resilix/resilience/resilience_config.h"

#include <kj/array.h>
#include <kj/common.h>
#include <kj/map.h>
#include <kj/memory.h>
#include <kj/mutex.h>
#include <kj/string.h>
#include <kj/vector.h>

namespace resilix::resilience {

// Per-resource metrics, named resilix_<resource>_*
struct ResourceMetrics {
  core::Counter& calls;
  core::Counter& success;
  core::Counter& fallback;
  core::Counter& failure;
  core::Counter& retries;
  core::Counter& timeouts;
  core::Counter& circuit_rejections;
  core::Counter& bulkhead_rejections;
  core::Gauge& bulkhead_in_flight;
  core::Histogram& latency_seconds;
};

/**
 * @brief Shared state of one named resource
 *
 * Owned by the registry and alive as long as it is. The circuit breaker and
 * bulkhead are internally synchronized.
 */
class ResourceState final {
public:
  ResourceState(kj::StringPtr name, kj::Own<const ConfigSnapshot> config,
                const kj::MonotonicClock& clock, ResourceMetrics metrics);

  KJ_DISALLOW_COPY_AND_MOVE(ResourceState);

  [[nodiscard]] kj::StringPtr name() const noexcept {
    return name_;
  }
  [[nodiscard]] CircuitBreaker& circuit_breaker() noexcept {
    return breaker_;
  }
  [[nodiscard]] Bulkhead& bulkhead() noexcept {
    return bulkhead_;
  }
  [[nodiscard]] const ResourceMetrics& metrics() const noexcept {
    return metrics_;
  }

  // Current config; callers keep the snapshot for the whole execution
  [[nodiscard]] kj::Own<const ConfigSnapshot> config() const;
  void replace_config(kj::Own<const ConfigSnapshot> config);

private:
  kj::String name_;
  ResourceMetrics metrics_;
  CircuitBreaker breaker_;
  Bulkhead bulkhead_;
  kj::MutexGuarded<kj::Own<const ConfigSnapshot>> config_;
};

/**
 * @brief Owner of all named resources and their policies
 *
 * Resources are created lazily and idempotently on first reference, using the
 * default config unless configure() registered one. The registry may be
 * shared by any number of threads, each running its own ResiliencePipeline.
 *
 * The registry also fans resilience events out to the log, its metrics and
 * the registered listeners.
 */
class ResilienceRegistry final {
public:
  explicit ResilienceRegistry(const kj::MonotonicClock& clock = core::monotonic_clock(),
                              core::Logger& logger = core::global_logger());
  ~ResilienceRegistry() noexcept;

  KJ_DISALLOW_COPY_AND_MOVE(ResilienceRegistry);

  /**
   * @brief Register or replace the config of a resource
   *
   * Replacing resets the circuit breaker to Closed with an empty window and
   * applies the new bulkhead limits. Executions already running keep the
   * config they started with. Throws on an invalid config.
   */
  void configure(kj::StringPtr name, ResilienceConfig config);

  // Config for resources created after this call without configure()
  void set_default_config(ResilienceConfig config);

  [[nodiscard]] ResourceState& resource(kj::StringPtr name);
  [[nodiscard]] kj::Maybe<ResourceState&> find(kj::StringPtr name);

  // Callbacks run one at a time and must not call back into the registry
  void add_listener(kj::Own<ResilienceListener> listener);

  [[nodiscard]] kj::Array<kj::String> resource_names() const;
  [[nodiscard]] size_t size() const;

  [[nodiscard]] core::MetricsRegistry& metrics() noexcept {
    return metrics_;
  }
  [[nodiscard]] core::Logger& logger() noexcept {
    return logger_;
  }
  [[nodiscard]] const kj::MonotonicClock& clock() const noexcept {
    return clock_;
  }

  // Event reporting used by ResiliencePipeline
  void report_retry(ResourceState& resource, uint32_t attempt, const kj::Exception& error,
                    kj::Duration delay);
  void report_timeout(ResourceState& resource);
  void report_circuit_rejection(ResourceState& resource);
  void report_bulkhead_rejection(ResourceState& resource, const kj::Exception& error);

private:
  ResourceState& get_or_create(kj::StringPtr name, kj::Maybe<kj::Own<const ConfigSnapshot>> config,
                               bool& created);
  ResourceMetrics register_metrics(kj::StringPtr name);
  void report_state_change(kj::StringPtr resource, CircuitState from, CircuitState to);

  const kj::MonotonicClock& clock_;
  core::Logger& logger_;
  core::MetricsRegistry metrics_;
  kj::MutexGuarded<kj::Own<const ConfigSnapshot>> default_config_;
  kj::MutexGuarded<kj::HashMap<kj::String, kj::Own<ResourceState>>> resources_;
  kj::MutexGuarded<kj::Vector<kj::Own<ResilienceListener>>> listeners_;
};

// Resource name reduced to [a-zA-Z0-9_] for use in metric names
[[nodiscard]] kj::String metric_safe_name(kj::StringPtr name);

} // namespace resilix::resilience
