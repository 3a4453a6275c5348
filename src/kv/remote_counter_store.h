#ifndef TESSERA_KV_REMOTE_COUNTER_STORE_H_
#define TESSERA_KV_REMOTE_COUNTER_STORE_H_

#include <memory>
#include <string>

#include <grpcpp/grpcpp.h>
#include <counter.grpc.pb.h>

#include "absl/time/time.h"

#include "common/config.h"
#include "counter_store.h"

namespace Tessera {

/*
	Client side of CounterService.

	auto store = std::make_shared<RemoteCounterStore>("localhost:" + std::to_string(COUNTER_SERVICE_PORT));
	auto value = store->Increment("range-id-generator", 10);

	Every call carries a deadline of rpc_timeout. Server-side errors keep their
	status code; a server that cannot be reached shows up as Unavailable or
	DeadlineExceeded.
*/
class RemoteCounterStore : public CounterStore {
	public:
		explicit RemoteCounterStore(const std::string& server_address,
				absl::Duration rpc_timeout = absl::Milliseconds(counter_rpc_timeout_ms));
		RemoteCounterStore(std::shared_ptr<grpc::Channel> channel, absl::Duration rpc_timeout);

		absl::StatusOr<int64_t> Increment(const std::string& key, int64_t delta) override;
		absl::StatusOr<int64_t> Get(const std::string& key);

	private:
		void SetDeadline(grpc::ClientContext* context) const;

		std::unique_ptr<tessera::kv::CounterService::Stub> stub_;
		const absl::Duration rpc_timeout_;
};

} // namespace Tessera

#endif // TESSERA_KV_REMOTE_COUNTER_STORE_H_
