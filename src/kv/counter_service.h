#ifndef TESSERA_KV_COUNTER_SERVICE_H_
#define TESSERA_KV_COUNTER_SERVICE_H_

#include <memory>
#include <string>
#include <utility>

#include <grpcpp/grpcpp.h>
#include <counter.grpc.pb.h>

#include "sharded_counter_store.h"

namespace Tessera {

using grpc::Server;
using grpc::ServerBuilder;
using grpc::ServerContext;
using grpc::Status;
using tessera::kv::CounterService;
using tessera::kv::GetRequest;
using tessera::kv::GetResponse;
using tessera::kv::IncrementRequest;
using tessera::kv::IncrementResponse;

// Serves a ShardedCounterStore over gRPC.
class CounterServiceImpl final : public CounterService::Service {
	public:
		explicit CounterServiceImpl(std::shared_ptr<ShardedCounterStore> store)
			: store_(std::move(store)) {}

		Status Increment(ServerContext* context, const IncrementRequest* request,
				IncrementResponse* response) override;

		Status Get(ServerContext* context, const GetRequest* request,
				GetResponse* response) override;

	private:
		std::shared_ptr<ShardedCounterStore> store_;
};

// Builds and starts a server for service on address ("host:port"). Port 0
// picks a free port, reported through selected_port when it is not null.
// Returns nullptr if the server could not be started.
std::unique_ptr<Server> StartCounterServer(const std::string& address,
		CounterServiceImpl* service, int* selected_port = nullptr);

} // namespace Tessera

#endif // TESSERA_KV_COUNTER_SERVICE_H_
