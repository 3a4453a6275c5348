#ifndef TESSERA_COMMON_CONFIG_H_
#define TESSERA_COMMON_CONFIG_H_

#include <cstdint>

/// Counter store service
#define COUNTER_SERVICE_PORT 50061
/// Deadline applied to every remote increment.
const int64_t counter_rpc_timeout_ms = 2000;

/// Allocator defaults
/// Counter key of the range ID class.
#define DEFAULT_ID_KEY "range-id-generator"
#define DEFAULT_MIN_ID 1
#define DEFAULT_BLOCK_SIZE 10

/// Reservation retry configs
/// The delay after the first failed reservation attempt
const int64_t id_alloc_initial_backoff_ms = 50;
/// Upper bound for the backoff between two attempts
const int64_t id_alloc_max_backoff_ms = 1000;
/// Growth factor applied after each failed attempt
const int64_t id_alloc_backoff_multiplier = 2;

#endif // TESSERA_COMMON_CONFIG_H_
