#pragma once

#include "resilix/resilience/circuit_breaker.h"

#include <cstdint>
#include <kj/common.h>
#include <kj/exception.h>
#include <kj/string.h>
#include <kj/time.h>

namespace resilix::resilience {

/**
 * @brief Observability hooks for resilience events
 *
 * Registered with ResilienceRegistry::add_listener(). Callbacks may arrive
 * concurrently from any thread running a pipeline, so implementations must be
 * thread-safe. Every hook defaults to a no-op.
 */
class ResilienceListener {
public:
  virtual ~ResilienceListener() = default;

  // A failed attempt will be retried after `delay`
  virtual void on_retry(kj::StringPtr resource, uint32_t attempt, const kj::Exception& error,
                        kj::Duration delay) {}

  virtual void on_circuit_state_change(kj::StringPtr resource, CircuitState from,
                                       CircuitState to) {}

  virtual void on_bulkhead_reject(kj::StringPtr resource) {}

  // An attempt exceeded its timeout, or the overall deadline stopped retrying
  virtual void on_timeout(kj::StringPtr resource) {}
};

} // namespace resilix::resilience
