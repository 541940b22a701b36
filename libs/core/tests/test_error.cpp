#include "kj/test.h"
#include "resilix/core/error.h"

#include <kj/exception.h>
#include <kj/string.h>

using namespace resilix::core;

namespace {

KJ_TEST("ErrorCode: ToString") {
  KJ_EXPECT(to_string(ErrorCode::Success) == "Success");
  KJ_EXPECT(to_string(ErrorCode::CircuitOpen) == "Circuit Open");
  KJ_EXPECT(to_string(ErrorCode::BulkheadFull) == "Bulkhead Full");
  KJ_EXPECT(to_string(ErrorCode::FallbackFailure) == "Fallback Failure");
}

KJ_TEST("Error: Tagged exception carries its code") {
  auto exception = make_exception(ErrorCode::BulkheadFull, "no permits"_kj);

  KJ_EXPECT(exception.getType() == kj::Exception::Type::OVERLOADED);
  KJ_EXPECT(exception.getDescription().contains("no permits"_kj));
  KJ_IF_SOME(code, error_code_of(exception)) {
    KJ_EXPECT(code == ErrorCode::BulkheadFull);
  } else {
    KJ_FAIL_EXPECT("error code missing");
  }
  KJ_EXPECT(has_error_code(exception, ErrorCode::BulkheadFull));
  KJ_EXPECT(!has_error_code(exception, ErrorCode::Timeout));
}

KJ_TEST("Error: Permanent failure maps to FAILED") {
  auto exception = make_exception(ErrorCode::PermanentFailure, "bad request"_kj);
  KJ_EXPECT(exception.getType() == kj::Exception::Type::FAILED);
}

KJ_TEST("Error: Untagged exception has no code") {
  kj::Exception exception(kj::Exception::Type::DISCONNECTED, __FILE__, __LINE__,
                          kj::str("connection reset"));
  KJ_EXPECT(error_code_of(exception) == kj::none);
}

KJ_TEST("Error: throw_error is catchable with its tag") {
  auto result = kj::runCatchingExceptions(
      []() { throw_error(ErrorCode::ConfigurationError, "max_attempts must be at least 1"_kj); });

  KJ_IF_SOME(exception, result) {
    KJ_EXPECT(has_error_code(exception, ErrorCode::ConfigurationError));
    KJ_EXPECT(exception.getDescription().contains("max_attempts"_kj));
  } else {
    KJ_FAIL_EXPECT("expected an exception");
  }
}

KJ_TEST("Error: RESILIX_REQUIRE throws on violation") {
  KJ_EXPECT_THROW_MESSAGE("must be positive", RESILIX_REQUIRE(1 < 0, "must be positive"));
}

} // namespace
