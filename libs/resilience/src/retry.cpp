#include "resilix/resilience/retry.h"

#include <kj/debug.h>

namespace resilix::resilience {

using core::ErrorCode;

bool RetryConfig::is_retryable(const kj::Exception& exception) const {
  KJ_IF_SOME(code, core::error_code_of(exception)) {
    switch (code) {
    case ErrorCode::CircuitOpen:
    case ErrorCode::BulkheadFull:
    case ErrorCode::ConfigurationError:
    case ErrorCode::FallbackFailure:
      return false;
    case ErrorCode::Timeout:
      return retry_on_timeout;
    default:
      break;
    }
  }

  KJ_IF_SOME(predicate, retry_predicate) {
    return predicate(exception);
  }

  KJ_IF_SOME(code, core::error_code_of(exception)) {
    if (code == ErrorCode::TransientFailure) {
      return true;
    }
    if (code == ErrorCode::PermanentFailure) {
      return false;
    }
  }

  auto type = exception.getType();
  return type == kj::Exception::Type::DISCONNECTED || type == kj::Exception::Type::OVERLOADED;
}

kj::OneOf<kj::Duration, kj::Exception> RetryExecutor::next_step(uint32_t attempt,
                                                               kj::Exception&& error) {
  if (attempt >= config_.max_attempts || !config_.is_retryable(error)) {
    return kj::mv(error);
  }

  auto delay = config_.backoff->delay(attempt);

  KJ_IF_SOME(deadline, deadline_) {
    if (timer_.now() + delay >= deadline) {
      return core::make_exception(ErrorCode::Timeout,
                                  kj::str("deadline reached after ", attempt,
                                          " attempts, last error: ", error.getDescription()));
    }
  }

  KJ_IF_SOME(callback, on_retry_) {
    callback(attempt, error, delay);
  }
  return delay;
}

} // namespace resilix::resilience
