#include "resilix/core/error.h"

#include <kj/array.h>
#include <kj/common.h>
#include <kj/string.h>

namespace resilix::core {

kj::String to_string(ErrorCode code) {
  switch (code) {
  case ErrorCode::Success:
    return kj::str("Success");
  case ErrorCode::TransientFailure:
    return kj::str("Transient Failure");
  case ErrorCode::PermanentFailure:
    return kj::str("Permanent Failure");
  case ErrorCode::CircuitOpen:
    return kj::str("Circuit Open");
  case ErrorCode::BulkheadFull:
    return kj::str("Bulkhead Full");
  case ErrorCode::Timeout:
    return kj::str("Timeout");
  case ErrorCode::FallbackFailure:
    return kj::str("Fallback Failure");
  case ErrorCode::ConfigurationError:
    return kj::str("Configuration Error");
  default:
    return kj::str("Invalid Error Code");
  }
}

kj::Exception make_exception(ErrorCode code, kj::StringPtr message,
                             const std::source_location& location) {
  kj::Exception::Type type = kj::Exception::Type::FAILED;
  switch (code) {
  case ErrorCode::CircuitOpen:
  case ErrorCode::BulkheadFull:
  case ErrorCode::Timeout:
    type = kj::Exception::Type::OVERLOADED;
    break;
  default:
    break;
  }

  kj::Exception exception(type, location.file_name(), static_cast<int>(location.line()),
                          kj::str(message));
  exception.setDetail(ERROR_CODE_DETAIL_ID,
                      kj::heapArray<kj::byte>({static_cast<kj::byte>(code)}));
  return exception;
}

kj::Maybe<ErrorCode> error_code_of(const kj::Exception& exception) {
  KJ_IF_SOME(detail, exception.getDetail(ERROR_CODE_DETAIL_ID)) {
    if (detail.size() == 1) {
      return static_cast<ErrorCode>(detail[0]);
    }
  }
  return kj::none;
}

void throw_error(ErrorCode code, kj::StringPtr message, const std::source_location& location) {
  kj::throwFatalException(make_exception(code, message, location));
}

} // namespace resilix::core
