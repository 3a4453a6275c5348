#include "counter_service.h"

#include <glog/logging.h>

#include "status_conversion.h"

namespace Tessera {

Status CounterServiceImpl::Increment(ServerContext* context, const IncrementRequest* request,
		IncrementResponse* response) {
	absl::StatusOr<int64_t> new_value = store_->Increment(request->key(), request->delta());
	if (!new_value.ok()) {
		LOG(WARNING) << "Increment of '" << request->key() << "' by " << request->delta()
			<< " failed: " << new_value.status();
		return ToGrpcStatus(new_value.status());
	}
	response->set_new_value(*new_value);
	return Status::OK;
}

Status CounterServiceImpl::Get(ServerContext* context, const GetRequest* request,
		GetResponse* response) {
	absl::StatusOr<int64_t> value = store_->Get(request->key());
	if (!value.ok()) {
		return ToGrpcStatus(value.status());
	}
	response->set_value(*value);
	return Status::OK;
}

std::unique_ptr<Server> StartCounterServer(const std::string& address,
		CounterServiceImpl* service, int* selected_port) {
	ServerBuilder builder;
	builder.AddListeningPort(address, grpc::InsecureServerCredentials(), selected_port);
	builder.RegisterService(service);

	std::unique_ptr<Server> server(builder.BuildAndStart());
	if (!server) {
		LOG(ERROR) << "Failed to start the counter server on " << address;
		return nullptr;
	}
	LOG(INFO) << "Counter server listening on " << address;
	return server;
}

} // namespace Tessera
