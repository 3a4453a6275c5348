#include "id_allocator.h"

#include <algorithm>

#include <glog/logging.h>

#include "absl/status/status.h"
#include "absl/strings/str_cat.h"

namespace Tessera {

RetryOptions RetryOptions::FromConfig(const TesseraConfig& config) {
	RetryOptions retry;
	retry.initial_backoff = absl::Milliseconds(config.allocator.retry.initial_backoff_ms.get());
	retry.max_backoff = absl::Milliseconds(config.allocator.retry.max_backoff_ms.get());
	retry.multiplier = config.allocator.retry.multiplier.get();
	return retry;
}

absl::StatusOr<std::unique_ptr<IdAllocator>> IdAllocator::Create(
		std::string id_key, std::shared_ptr<CounterStore> store,
		int64_t min_id, int64_t block_size, Stopper* stopper, RetryOptions retry) {
	if (min_id <= 0) {
		return absl::InvalidArgumentError(absl::StrCat("minID must be a positive integer: ", min_id));
	}
	if (block_size < 1) {
		return absl::InvalidArgumentError(absl::StrCat("blockSize must be a positive integer: ", block_size));
	}
	if (store == nullptr) {
		return absl::InvalidArgumentError("counter store must not be null");
	}
	if (stopper == nullptr) {
		return absl::InvalidArgumentError("stopper must not be null");
	}
	if (retry.initial_backoff <= absl::ZeroDuration() || retry.max_backoff < retry.initial_backoff ||
			retry.multiplier < 1) {
		return absl::InvalidArgumentError("invalid retry options");
	}
	return std::unique_ptr<IdAllocator>(new IdAllocator(
				std::move(id_key), std::move(store), min_id, block_size, stopper, retry));
}

IdAllocator::IdAllocator(std::string id_key, std::shared_ptr<CounterStore> store,
		int64_t min_id, int64_t block_size, Stopper* stopper, RetryOptions retry)
	: store_(std::move(store)),
	min_id_(min_id),
	block_size_(block_size),
	stopper_(stopper),
	retry_(retry),
	id_key_(std::move(id_key)) {
	// Runs right away if the stopper is already stopping.
	stop_callback_id_ = stopper_->AddStopCallback([this]() {
			absl::MutexLock lock(&mu_);
			stopping_ = true;
			});
	VLOG(1) << "[IdAllocator] key=" << id_key_ << " min_id=" << min_id_ << " block_size=" << block_size_;
}

IdAllocator::~IdAllocator() {
	// The stop callback locks mu_, so it must be gone before we take it.
	stopper_->RemoveStopCallback(stop_callback_id_);

	absl::MutexLock lock(&mu_);
	closing_ = true;
	mu_.Await(absl::Condition(this, &IdAllocator::WorkerExited));
}

absl::StatusOr<int64_t> IdAllocator::Allocate() {
	absl::MutexLock lock(&mu_);
	if (Stopped()) {
		return absl::CancelledError("could not allocate ID; system is draining");
	}

	if (!worker_started_) {
		worker_started_ = true;
		if (!stopper_->RunWorker([this]() { RefillWorker(); })) {
			return absl::CancelledError("could not allocate ID; system is draining");
		}
		worker_running_ = true;
	}

	MaybeRequestRefillLocked();
	mu_.Await(absl::Condition(this, &IdAllocator::HasIdsOrStopped));
	if (ids_.empty()) {
		return absl::CancelledError("could not allocate ID; system is draining");
	}

	int64_t id = ids_.front();
	ids_.pop_front();
	MaybeRequestRefillLocked();
	return id;
}

void IdAllocator::StoreIdKey(std::string id_key) {
	absl::MutexLock lock(&mu_);
	id_key_ = std::move(id_key);
}

std::string IdAllocator::id_key() const {
	absl::MutexLock lock(&mu_);
	return id_key_;
}

void IdAllocator::MaybeRequestRefillLocked() {
	if (!allocating_ && static_cast<int64_t>(ids_.size()) <= block_size_ / 2) {
		allocating_ = true;
	}
}

void IdAllocator::RefillWorker() {
	while (WaitForRefillRequest()) {
		std::optional<Block> block = ReserveBlock();
		if (!block.has_value()) {
			break;
		}

		absl::MutexLock lock(&mu_);
		for (int64_t id = block->first;; ++id) {
			ids_.push_back(id);
			if (id == block->second) {
				break;
			}
		}
		allocating_ = false;
		VLOG(1) << "[IdAllocator] Reserved block [" << block->first << ", " << block->second
			<< "] from " << id_key_ << ", " << ids_.size() << " buffered";
	}

	absl::MutexLock lock(&mu_);
	worker_running_ = false;
}

bool IdAllocator::WaitForRefillRequest() {
	absl::MutexLock lock(&mu_);
	mu_.Await(absl::Condition(this, &IdAllocator::RefillRequestedOrStopped));
	return !Stopped();
}

std::optional<IdAllocator::Block> IdAllocator::ReserveBlock() {
	absl::Duration backoff = retry_.initial_backoff;
	while (true) {
		std::string id_key;
		{
			absl::MutexLock lock(&mu_);
			if (Stopped()) {
				return std::nullopt;
			}
			id_key = id_key_;
		}

		absl::Status status;
		if (id_key.empty()) {
			status = absl::FailedPreconditionError("counter key is invalid");
		} else {
			absl::StatusOr<int64_t> new_value = store_->Increment(id_key, block_size_);
			if (new_value.ok()) {
				if (*new_value < min_id_) {
					// The whole block is below the floor. Push the counter forward
					// again without handing anything out.
					VLOG(2) << "[IdAllocator] Counter " << id_key << " at " << *new_value
						<< " is below min_id " << min_id_ << ", incrementing again";
					continue;
				}
				int64_t first = std::max(*new_value - block_size_ + 1, min_id_);
				return Block(first, *new_value);
			}
			status = new_value.status();
		}

		LOG(WARNING) << "[IdAllocator] Unable to allocate " << block_size_ << " ids from '"
			<< id_key << "': " << status << ", retrying in " << backoff;
		if (!SleepForBackoff(backoff)) {
			return std::nullopt;
		}
		backoff = std::min(backoff * retry_.multiplier, retry_.max_backoff);
	}
}

bool IdAllocator::SleepForBackoff(absl::Duration backoff) {
	absl::MutexLock lock(&mu_);
	// False if shutdown cut the wait short.
	return !mu_.AwaitWithTimeout(absl::Condition(this, &IdAllocator::Stopped), backoff);
}

} // namespace Tessera
