#pragma once

#include "resilix/core/error.h"

#include <cstdint>
#include <kj/common.h>
#include <kj/exception.h>
#include <kj/one-of.h>
#include <kj/string.h>
#include <kj/time.h>

namespace resilix::resilience {

/**
 * @brief Classified failure of one pipeline execution
 */
struct ResilienceError {
  core::ErrorCode code;
  kj::String resource;
  kj::Exception cause;

  [[nodiscard]] ResilienceError clone() const {
    return ResilienceError{code, kj::heapString(resource), cause};
  }
};

[[nodiscard]] kj::String to_string(const ResilienceError& error);

// Terminal state of an execution
enum class Outcome { Succeeded, Fallback, Failed };

[[nodiscard]] kj::StringPtr to_string(Outcome outcome);

template <typename T> struct Success {
  T value;
};

template <typename T> struct Fallback {
  T value;
  ResilienceError cause; // Failure that triggered the fallback
};

struct Failure {
  ResilienceError error;
};

/**
 * @brief Tagged result of ResiliencePipeline::execute()
 *
 * Exactly one of Success(value), Fallback(value) or Failure(error), plus the
 * number of attempts made and the wall time the execution took.
 */
template <typename T> class PipelineResult final {
public:
  using Variant = kj::OneOf<Success<T>, Fallback<T>, Failure>;

  static PipelineResult success(T value, uint32_t attempts, kj::Duration elapsed) {
    return PipelineResult(Success<T>{kj::mv(value)}, attempts, elapsed);
  }
  static PipelineResult fallback(T value, ResilienceError cause, uint32_t attempts,
                                 kj::Duration elapsed) {
    return PipelineResult(Fallback<T>{kj::mv(value), kj::mv(cause)}, attempts, elapsed);
  }
  static PipelineResult failure(ResilienceError error, uint32_t attempts, kj::Duration elapsed) {
    return PipelineResult(Failure{kj::mv(error)}, attempts, elapsed);
  }

  [[nodiscard]] bool is_success() const {
    return variant_.template is<Success<T>>();
  }
  [[nodiscard]] bool is_fallback() const {
    return variant_.template is<Fallback<T>>();
  }
  [[nodiscard]] bool is_failure() const {
    return variant_.template is<Failure>();
  }

  [[nodiscard]] Outcome outcome() const {
    if (is_success()) {
      return Outcome::Succeeded;
    }
    return is_fallback() ? Outcome::Fallback : Outcome::Failed;
  }

  // Value of a Success or Fallback result
  [[nodiscard]] T& value() {
    RESILIX_REQUIRE(!is_failure(), "failed pipeline result has no value");
    if (is_success()) {
      return variant_.template get<Success<T>>().value;
    }
    return variant_.template get<Fallback<T>>().value;
  }
  [[nodiscard]] const T& value() const {
    return const_cast<PipelineResult*>(this)->value();
  }

  // Error of a Failure result, or the cause that triggered a Fallback
  [[nodiscard]] const ResilienceError& error() const {
    if (is_fallback()) {
      return variant_.template get<Fallback<T>>().cause;
    }
    RESILIX_REQUIRE(is_failure(), "successful pipeline result has no error");
    return variant_.template get<Failure>().error;
  }

  [[nodiscard]] Variant& variant() {
    return variant_;
  }
  [[nodiscard]] const Variant& variant() const {
    return variant_;
  }

  [[nodiscard]] uint32_t attempts() const noexcept {
    return attempts_;
  }
  [[nodiscard]] kj::Duration elapsed() const noexcept {
    return elapsed_;
  }

private:
  PipelineResult(Variant variant, uint32_t attempts, kj::Duration elapsed)
      : variant_(kj::mv(variant)), attempts_(attempts), elapsed_(elapsed) {}

  Variant variant_;
  uint32_t attempts_;
  kj::Duration elapsed_;
};

} // namespace resilix::resilience
