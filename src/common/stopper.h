#ifndef TESSERA_COMMON_STOPPER_H_
#define TESSERA_COMMON_STOPPER_H_

#include <cstdint>
#include <functional>
#include <thread>
#include <vector>

#include "absl/container/flat_hash_map.h"
#include "absl/synchronization/mutex.h"
#include "absl/synchronization/notification.h"

namespace Tessera {

/**
 * Lifecycle authority shared by the components of one process.
 *
 * Tracks background workers so shutdown can wait for them, and carries a
 * stop signal that, once raised, stays raised. Components that block on their
 * own synchronization register a stop callback to be woken when it is raised.
 */
class Stopper {
	public:
		using CallbackId = uint64_t;

		Stopper() = default;
		~Stopper();

		Stopper(const Stopper&) = delete;
		Stopper& operator=(const Stopper&) = delete;

		// Runs fn on a tracked thread. Returns false without running it once
		// Stop() has been called.
		bool RunWorker(std::function<void()> fn);

		bool ShouldStop() const;

		// Blocks until Stop() is called.
		void WaitForStop() const;

		// cb runs exactly once, on the thread calling Stop(). A callback added
		// after Stop() runs immediately on the calling thread.
		CallbackId AddStopCallback(std::function<void()> cb);

		// After this returns, the callback is neither running nor going to run.
		void RemoveStopCallback(CallbackId id);

		// Raises the signal, runs stop callbacks and joins every worker.
		// Idempotent. Must not be called from a worker thread.
		void Stop();

	private:
		mutable absl::Mutex mu_;
		bool stopping_ ABSL_GUARDED_BY(mu_) = false;
		bool callbacks_done_ ABSL_GUARDED_BY(mu_) = false;
		CallbackId next_callback_id_ ABSL_GUARDED_BY(mu_) = 1;
		absl::flat_hash_map<CallbackId, std::function<void()>> callbacks_ ABSL_GUARDED_BY(mu_);
		std::vector<std::thread> workers_ ABSL_GUARDED_BY(mu_);

		absl::Mutex join_mu_;
		absl::Notification stopped_;
};

} // namespace Tessera

#endif // TESSERA_COMMON_STOPPER_H_
