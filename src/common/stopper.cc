#include "stopper.h"

#include <utility>

#include <glog/logging.h>

namespace Tessera {

Stopper::~Stopper() {
	Stop();
}

bool Stopper::RunWorker(std::function<void()> fn) {
	absl::MutexLock lock(&mu_);
	if (stopping_) {
		VLOG(1) << "[Stopper] Refusing worker, shutdown in progress";
		return false;
	}
	workers_.emplace_back(std::move(fn));
	return true;
}

bool Stopper::ShouldStop() const {
	absl::MutexLock lock(&mu_);
	return stopping_;
}

void Stopper::WaitForStop() const {
	absl::MutexLock lock(&mu_);
	mu_.Await(absl::Condition(&stopping_));
}

Stopper::CallbackId Stopper::AddStopCallback(std::function<void()> cb) {
	{
		absl::MutexLock lock(&mu_);
		if (!stopping_) {
			CallbackId id = next_callback_id_++;
			callbacks_.emplace(id, std::move(cb));
			return id;
		}
	}
	cb();
	return 0;
}

void Stopper::RemoveStopCallback(CallbackId id) {
	absl::MutexLock lock(&mu_);
	if (callbacks_.erase(id) > 0 || !stopping_) {
		return;
	}
	// Stop() already took the callback; wait until it has finished running.
	mu_.Await(absl::Condition(&callbacks_done_));
}

void Stopper::Stop() {
	// Serializes concurrent Stop() calls so every caller returns only after
	// all workers are joined.
	absl::MutexLock join_lock(&join_mu_);
	if (stopped_.HasBeenNotified()) {
		return;
	}

	absl::flat_hash_map<CallbackId, std::function<void()>> callbacks;
	std::vector<std::thread> workers;
	{
		absl::MutexLock lock(&mu_);
		stopping_ = true;
		callbacks.swap(callbacks_);
	}
	LOG(INFO) << "[Stopper] Stopping, " << callbacks.size() << " stop callbacks";

	for (auto& [id, cb] : callbacks) {
		cb();
	}
	{
		absl::MutexLock lock(&mu_);
		callbacks_done_ = true;
		workers.swap(workers_);
	}

	for (auto& worker : workers) {
		if (worker.joinable()) {
			worker.join();
		}
	}
	VLOG(1) << "[Stopper] Joined " << workers.size() << " workers";
	stopped_.Notify();
}

} // namespace Tessera
