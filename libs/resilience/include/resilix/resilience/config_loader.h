#pragma once

#include "resilix/core/config.h"
#include "resilix/resilience/registry.h"
#include "resilix/resilience/resilience_config.h"

#include <kj/memory.h>
#include <kj/string.h>

namespace resilix::resilience {

/**
 * @brief Build a backoff strategy from a `backoff` section
 *
 * Types: fixed {delay_ms}, linear {initial_ms, increment_ms, max_ms},
 * exponential {initial_ms, multiplier, max_ms, jitter} and
 * schedule {delays_ms}. Missing fields take the strategy defaults.
 */
[[nodiscard]] kj::Own<const BackoffStrategy> parse_backoff(const core::Config& section);

/**
 * @brief Build a resource policy from a flat config section
 *
 * Absent keys keep the ResilienceConfig defaults; half_open_success_threshold
 * defaults to half_open_max_calls. Throws an ErrorCode::ConfigurationError
 * exception on malformed or out-of-range values.
 */
[[nodiscard]] ResilienceConfig parse_resilience_config(const core::Config& section);

/**
 * @brief Apply a `{"defaults": {...}, "resources": {...}}` document
 *
 * `defaults` becomes the registry default config and is the base every
 * resource entry is merged onto. Returns the number of resources configured.
 */
size_t load_resilience_configs(ResilienceRegistry& registry, const core::Config& config);

// Returns false (after logging) if the file cannot be loaded or is invalid
bool load_resilience_configs(ResilienceRegistry& registry, kj::StringPtr file_path);

} // namespace resilix::resilience
