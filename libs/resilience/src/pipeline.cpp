#include "resilix/resilience/pipeline.h"

namespace resilix::resilience {

core::ErrorCode classify_failure(const ResilienceConfig& config, const kj::Exception& error) {
  KJ_IF_SOME(code, core::error_code_of(error)) {
    switch (code) {
    case core::ErrorCode::CircuitOpen:
    case core::ErrorCode::BulkheadFull:
    case core::ErrorCode::Timeout:
    case core::ErrorCode::ConfigurationError:
      return code;
    default:
      break;
    }
  }
  return config.retry.is_retryable(error) ? core::ErrorCode::TransientFailure
                                          : core::ErrorCode::PermanentFailure;
}

AttemptGuard::~AttemptGuard() noexcept {
  if (!settled_) {
    breaker_.release_permission(permit_);
  }
}

void AttemptGuard::succeeded() {
  settled_ = true;
  breaker_.record_success(permit_);
}

void AttemptGuard::failed(const ResilienceConfig& config, const kj::Exception& error) {
  settled_ = true;
  if (config.counts_as_failure(error)) {
    breaker_.record_failure(permit_);
  } else {
    breaker_.release_permission(permit_);
  }
}

} // namespace resilix::resilience
