#include "sharded_counter_store.h"

#include <glog/logging.h>

#include "absl/strings/str_cat.h"

namespace Tessera {

absl::StatusOr<int64_t> ShardedCounterStore::Increment(const std::string& key, int64_t delta) {
	if (key.empty()) {
		return absl::InvalidArgumentError("counter key must not be empty");
	}
	Shard& shard = shards_[GetShardIndex(key)];
	absl::MutexLock lock(&shard.mutex);

	int64_t& value = shard.counters[key];
	int64_t new_value;
	if (__builtin_add_overflow(value, delta, &new_value)) {
		return absl::OutOfRangeError(absl::StrCat("incrementing ", key, " (", value, ") by ",
					delta, " overflows"));
	}
	value = new_value;
	VLOG(3) << "Increment " << key << " by " << delta << " -> " << new_value;
	return new_value;
}

absl::StatusOr<int64_t> ShardedCounterStore::Get(const std::string& key) const {
	if (key.empty()) {
		return absl::InvalidArgumentError("counter key must not be empty");
	}
	const Shard& shard = shards_[GetShardIndex(key)];
	absl::MutexLock lock(&shard.mutex);

	auto it = shard.counters.find(key);
	if (it == shard.counters.end()) {
		return int64_t{0};
	}
	return it->second;
}

} // namespace Tessera
