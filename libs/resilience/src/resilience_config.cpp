#include "resilix/resilience/resilience_config.h"

#include "resilix/core/error.h"

namespace resilix::resilience {

using core::ErrorCode;

namespace {

void require_config(bool condition, kj::StringPtr message) {
  if (!condition) {
    core::throw_error(ErrorCode::ConfigurationError,
                      kj::str("invalid resilience config: ", message));
  }
}

} // namespace

bool ResilienceConfig::counts_as_failure(const kj::Exception& exception) const {
  KJ_IF_SOME(code, core::error_code_of(exception)) {
    if (code == ErrorCode::Timeout) {
      return true;
    }
    if (code == ErrorCode::CircuitOpen || code == ErrorCode::BulkheadFull) {
      return false;
    }
  }
  KJ_IF_SOME(predicate, failure_predicate) {
    return predicate(exception);
  }
  return true;
}

void ResilienceConfig::validate() const {
  require_config(retry.max_attempts >= 1, "max_attempts must be at least 1");
  require_config(retry.backoff.get() != nullptr, "a backoff strategy is required");
  circuit_breaker.validate();
  bulkhead.validate();
  KJ_IF_SOME(timeout, attempt_timeout) {
    require_config(timeout > 0 * kj::NANOSECONDS, "attempt timeout must be positive");
  }
  KJ_IF_SOME(timeout, overall_timeout) {
    require_config(timeout > 0 * kj::NANOSECONDS, "overall timeout must be positive");
  }
}

kj::Own<const ConfigSnapshot> make_snapshot(ResilienceConfig config) {
  config.validate();
  return kj::atomicRefcounted<ConfigSnapshot>(kj::mv(config));
}

} // namespace resilix::resilience
