#ifndef TESSERA_KV_COUNTER_STORE_H_
#define TESSERA_KV_COUNTER_STORE_H_

#include <cstdint>
#include <string>

#include "absl/status/statusor.h"

namespace Tessera {

/**
 * Increment-capable counter store.
 *
 * Increment adds delta to the counter at key and returns the value after the
 * addition. It must be linearizable with respect to every other Increment on
 * the same key. A key that was never written reads as zero; counters may hold
 * negative values.
 */
class CounterStore {
	public:
		virtual ~CounterStore() = default;

		virtual absl::StatusOr<int64_t> Increment(const std::string& key, int64_t delta) = 0;
};

} // namespace Tessera

#endif // TESSERA_KV_COUNTER_STORE_H_
