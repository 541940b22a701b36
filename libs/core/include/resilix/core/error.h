#pragma once

#include <cstdint>
#include <kj/common.h>
#include <kj/debug.h>
#include <kj/exception.h>
#include <kj/string.h>
#include <source_location>

namespace resilix::core {

// Error code definitions
enum class ErrorCode : int {
  Success = 0,
  TransientFailure = 1,
  PermanentFailure = 2,
  CircuitOpen = 3,
  BulkheadFull = 4,
  Timeout = 5,
  FallbackFailure = 6,
  ConfigurationError = 7,
};

[[nodiscard]] kj::String to_string(ErrorCode code);

/**
 * @brief Detail slot used to tag a kj::Exception with an ErrorCode
 *
 * Exceptions cross promise boundaries as kj::Exception, so library-raised
 * rejections (open circuit, full bulkhead, timeout) carry their code as an
 * exception detail instead of a C++ subclass.
 */
constexpr kj::Exception::DetailTypeId ERROR_CODE_DETAIL_ID = 0x9d1c4a7e52b3f061ull;

/**
 * @brief Build a kj::Exception tagged with an ErrorCode
 *
 * CircuitOpen, BulkheadFull and Timeout map to OVERLOADED, everything else to FAILED.
 */
[[nodiscard]] kj::Exception
make_exception(ErrorCode code, kj::StringPtr message,
               const std::source_location& location = std::source_location::current());

/**
 * @brief Read the ErrorCode tag of an exception, if any
 */
[[nodiscard]] kj::Maybe<ErrorCode> error_code_of(const kj::Exception& exception);

[[nodiscard]] inline bool has_error_code(const kj::Exception& exception, ErrorCode code) {
  KJ_IF_SOME(tagged, error_code_of(exception)) {
    return tagged == code;
  }
  return false;
}

/**
 * @brief Throw a tagged exception through KJ's exception infrastructure
 */
[[noreturn]] void
throw_error(ErrorCode code, kj::StringPtr message,
            const std::source_location& location = std::source_location::current());

// Helper macros for precondition checks using KJ infrastructure
#define RESILIX_REQUIRE(condition, ...) KJ_REQUIRE(condition, ##__VA_ARGS__)
#define RESILIX_FAIL_REQUIRE(...) KJ_FAIL_REQUIRE(__VA_ARGS__)
#define RESILIX_ASSERT(condition, ...) KJ_ASSERT(condition, ##__VA_ARGS__)

} // namespace resilix::core
