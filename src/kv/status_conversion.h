#ifndef TESSERA_KV_STATUS_CONVERSION_H_
#define TESSERA_KV_STATUS_CONVERSION_H_

#include <string>

#include <grpcpp/grpcpp.h>

#include "absl/status/status.h"

namespace Tessera {

// absl and gRPC share the canonical status code numbering.
inline grpc::Status ToGrpcStatus(const absl::Status& status) {
	if (status.ok()) {
		return grpc::Status::OK;
	}
	return grpc::Status(static_cast<grpc::StatusCode>(status.code()),
			std::string(status.message()));
}

inline absl::Status FromGrpcStatus(const grpc::Status& status) {
	if (status.ok()) {
		return absl::OkStatus();
	}
	return absl::Status(static_cast<absl::StatusCode>(status.error_code()),
			status.error_message());
}

} // namespace Tessera

#endif // TESSERA_KV_STATUS_CONVERSION_H_
