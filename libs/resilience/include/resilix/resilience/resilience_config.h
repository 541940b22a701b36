#pragma once

#include "resilix/resilience/bulkhead.h"
#include "resilix/resilience/circuit_breaker.h"
#include "resilix/resilience/retry.h"

#include <kj/common.h>
#include <kj/exception.h>
#include <kj/refcount.h>
#include <kj/time.h>

namespace resilix::resilience {

/**
 * @brief Complete resilience policy of one named resource
 *
 * The fallback is not part of the policy: it is typed by the operation's
 * result and is passed to ResiliencePipeline::execute() instead.
 */
struct ResilienceConfig {
  RetryConfig retry;
  CircuitBreakerConfig circuit_breaker;
  BulkheadConfig bulkhead;
  kj::Maybe<kj::Duration> attempt_timeout; // Bound on each attempt
  kj::Maybe<kj::Duration> overall_timeout; // Bound on all attempts and delays combined
  // Which operation failures count as circuit breaker samples; none counts all
  kj::Maybe<FailurePredicate> failure_predicate;

  ResilienceConfig() = default;
  ResilienceConfig(ResilienceConfig&&) = default;
  ResilienceConfig& operator=(ResilienceConfig&&) = default;
  KJ_DISALLOW_COPY(ResilienceConfig);

  /**
   * @brief Whether a failed attempt is a circuit breaker failure sample
   *
   * Timeouts always count; library rejections never do.
   */
  [[nodiscard]] bool counts_as_failure(const kj::Exception& exception) const;

  // Throws an ErrorCode::ConfigurationError exception on invalid values
  void validate() const;
};

/**
 * @brief Immutable, shareable snapshot of a registered config
 *
 * Executions hold a reference for their whole duration, so replacing a
 * resource's config never affects calls already in progress.
 */
class ConfigSnapshot final : public kj::AtomicRefcounted {
public:
  explicit ConfigSnapshot(ResilienceConfig config) : config_(kj::mv(config)) {}

  [[nodiscard]] const ResilienceConfig& config() const noexcept {
    return config_;
  }

private:
  ResilienceConfig config_;
};

[[nodiscard]] kj::Own<const ConfigSnapshot> make_snapshot(ResilienceConfig config);

} // namespace resilix::resilience
