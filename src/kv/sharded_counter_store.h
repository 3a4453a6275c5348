#ifndef TESSERA_KV_SHARDED_COUNTER_STORE_H_
#define TESSERA_KV_SHARDED_COUNTER_STORE_H_

#include <array>
#include <cstdint>
#include <string>

#include "absl/container/flat_hash_map.h"
#include "absl/synchronization/mutex.h"

#include "counter_store.h"

namespace Tessera {

// In-memory counter store. Keys are spread over fixed shards, each with its
// own lock, so increments on different keys rarely contend.
class ShardedCounterStore : public CounterStore {
	private:
		// Number of shards - use power of 2 for efficient modulo with bit masking
		static const size_t NUM_SHARDS = 64;

		struct Shard {
			absl::flat_hash_map<std::string, int64_t> counters ABSL_GUARDED_BY(mutex);
			mutable absl::Mutex mutex;

			Shard() = default;

			// Prevent copying and moving
			Shard(const Shard&) = delete;
			Shard& operator=(const Shard&) = delete;
		};

		std::array<Shard, NUM_SHARDS> shards_;

		inline size_t GetShardIndex(const std::string& key) const {
			return std::hash<std::string>{}(key) & (NUM_SHARDS - 1);
		}

	public:
		ShardedCounterStore() = default;

		ShardedCounterStore(const ShardedCounterStore&) = delete;
		ShardedCounterStore& operator=(const ShardedCounterStore&) = delete;

		// Fails with InvalidArgument on an empty key and with OutOfRange,
		// leaving the counter untouched, if the result would overflow.
		absl::StatusOr<int64_t> Increment(const std::string& key, int64_t delta) override;

		// Current value, zero for unknown keys.
		absl::StatusOr<int64_t> Get(const std::string& key) const;
};

} // namespace Tessera

#endif // TESSERA_KV_SHARDED_COUNTER_STORE_H_
