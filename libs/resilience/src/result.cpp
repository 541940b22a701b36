#include "resilix/resilience/result.h"

namespace resilix::resilience {

kj::String to_string(const ResilienceError& error) {
  return kj::str(core::to_string(error.code), " [", error.resource, "]: ",
                 error.cause.getDescription());
}

kj::StringPtr to_string(Outcome outcome) {
  switch (outcome) {
  case Outcome::Succeeded:
    return "succeeded"_kj;
  case Outcome::Fallback:
    return "fallback"_kj;
  case Outcome::Failed:
    return "failed"_kj;
  }
  return "unknown"_kj;
}

} // namespace resilix::resilience
