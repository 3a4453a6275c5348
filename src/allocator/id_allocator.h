#ifndef TESSERA_ALLOCATOR_ID_ALLOCATOR_H_
#define TESSERA_ALLOCATOR_ID_ALLOCATOR_H_

#include <cstdint>
#include <deque>
#include <memory>
#include <optional>
#include <string>
#include <utility>

#include "absl/status/statusor.h"
#include "absl/synchronization/mutex.h"
#include "absl/time/time.h"

#include "common/config.h"
#include "common/configuration.h"
#include "common/stopper.h"
#include "kv/counter_store.h"

namespace Tessera {

// Backoff between failed block reservations.
struct RetryOptions {
	absl::Duration initial_backoff = absl::Milliseconds(id_alloc_initial_backoff_ms);
	absl::Duration max_backoff = absl::Milliseconds(id_alloc_max_backoff_ms);
	int64_t multiplier = id_alloc_backoff_multiplier;

	static RetryOptions FromConfig(const TesseraConfig& config);
};

/**
 * Hands out unique, increasing IDs that are never below min_id.
 *
 * IDs are reserved from a CounterStore in blocks of block_size with a single
 * Increment per block and buffered in memory, so most calls to Allocate never
 * reach the store. Only one reservation is outstanding at any time. A refill
 * starts when the buffer holds half a block or less, which keeps warm callers
 * from blocking.
 *
 * Store failures and an invalid (empty) counter key are retried with backoff
 * and never reach callers; they only see higher latency once the buffer runs
 * dry. Allocate fails only with Cancelled, after the Stopper has been stopped.
 *
 * The Stopper must outlive the allocator.
 */
class IdAllocator {
	public:
		// Fails with InvalidArgument if min_id <= 0, block_size < 1, store or
		// stopper is null, or retry has non-positive values.
		static absl::StatusOr<std::unique_ptr<IdAllocator>> Create(
				std::string id_key, std::shared_ptr<CounterStore> store,
				int64_t min_id, int64_t block_size, Stopper* stopper,
				RetryOptions retry = RetryOptions());

		~IdAllocator();

		IdAllocator(const IdAllocator&) = delete;
		IdAllocator& operator=(const IdAllocator&) = delete;

		// Returns the next buffered ID, blocking while the buffer is empty.
		absl::StatusOr<int64_t> Allocate();

		// Replaces the counter key. An empty key suspends reservations until a
		// valid key is stored again. Used for failure injection and operational
		// recovery.
		void StoreIdKey(std::string id_key);
		std::string id_key() const;

		int64_t min_id() const { return min_id_; }
		int64_t block_size() const { return block_size_; }

	private:
		IdAllocator(std::string id_key, std::shared_ptr<CounterStore> store,
				int64_t min_id, int64_t block_size, Stopper* stopper, RetryOptions retry);

		// First and last ID of a reserved block, both inclusive.
		using Block = std::pair<int64_t, int64_t>;

		void RefillWorker();
		bool WaitForRefillRequest();
		// Returns nullopt if shutdown was signalled before a block was reserved.
		std::optional<Block> ReserveBlock();
		// Returns false if shutdown was signalled while sleeping.
		bool SleepForBackoff(absl::Duration backoff);

		void MaybeRequestRefillLocked() ABSL_EXCLUSIVE_LOCKS_REQUIRED(mu_);
		bool Stopped() const ABSL_EXCLUSIVE_LOCKS_REQUIRED(mu_) { return stopping_ || closing_; }
		bool HasIdsOrStopped() const ABSL_EXCLUSIVE_LOCKS_REQUIRED(mu_) {
			return !ids_.empty() || Stopped();
		}
		bool RefillRequestedOrStopped() const ABSL_EXCLUSIVE_LOCKS_REQUIRED(mu_) {
			return allocating_ || Stopped();
		}
		bool WorkerExited() const ABSL_EXCLUSIVE_LOCKS_REQUIRED(mu_) { return !worker_running_; }

		const std::shared_ptr<CounterStore> store_;
		const int64_t min_id_;
		const int64_t block_size_;
		Stopper* const stopper_;
		const RetryOptions retry_;

		mutable absl::Mutex mu_;
		std::string id_key_ ABSL_GUARDED_BY(mu_);
		std::deque<int64_t> ids_ ABSL_GUARDED_BY(mu_);
		// Single-flight: a reservation is requested or in progress.
		bool allocating_ ABSL_GUARDED_BY(mu_) = false;
		bool worker_started_ ABSL_GUARDED_BY(mu_) = false;
		bool worker_running_ ABSL_GUARDED_BY(mu_) = false;
		// Stopper raised the stop signal.
		bool stopping_ ABSL_GUARDED_BY(mu_) = false;
		// Allocator is being destroyed.
		bool closing_ ABSL_GUARDED_BY(mu_) = false;

		Stopper::CallbackId stop_callback_id_ = 0;
};

} // namespace Tessera

#endif // TESSERA_ALLOCATOR_ID_ALLOCATOR_H_
