#include "remote_counter_store.h"

#include <chrono>

#include <glog/logging.h>

#include "status_conversion.h"

namespace Tessera {

using grpc::ClientContext;
using tessera::kv::CounterService;
using tessera::kv::GetRequest;
using tessera::kv::GetResponse;
using tessera::kv::IncrementRequest;
using tessera::kv::IncrementResponse;

RemoteCounterStore::RemoteCounterStore(const std::string& server_address, absl::Duration rpc_timeout)
	: RemoteCounterStore(grpc::CreateChannel(server_address, grpc::InsecureChannelCredentials()),
			rpc_timeout) {}

RemoteCounterStore::RemoteCounterStore(std::shared_ptr<grpc::Channel> channel, absl::Duration rpc_timeout)
	: stub_(CounterService::NewStub(channel)),
	rpc_timeout_(rpc_timeout) {}

void RemoteCounterStore::SetDeadline(ClientContext* context) const {
	context->set_deadline(std::chrono::system_clock::now() +
			absl::ToChronoMilliseconds(rpc_timeout_));
}

absl::StatusOr<int64_t> RemoteCounterStore::Increment(const std::string& key, int64_t delta) {
	IncrementRequest request;
	request.set_key(key);
	request.set_delta(delta);

	IncrementResponse response;
	ClientContext context;
	SetDeadline(&context);

	grpc::Status status = stub_->Increment(&context, request, &response);
	if (!status.ok()) {
		VLOG(1) << "Increment(" << key << ", " << delta << ") failed: " << status.error_message();
		return FromGrpcStatus(status);
	}
	return response.new_value();
}

absl::StatusOr<int64_t> RemoteCounterStore::Get(const std::string& key) {
	GetRequest request;
	request.set_key(key);

	GetResponse response;
	ClientContext context;
	SetDeadline(&context);

	grpc::Status status = stub_->Get(&context, request, &response);
	if (!status.ok()) {
		VLOG(1) << "Get(" << key << ") failed: " << status.error_message();
		return FromGrpcStatus(status);
	}
	return response.value();
}

} // namespace Tessera
