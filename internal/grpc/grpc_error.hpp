#pragma once

#include <string>

#include <grpcpp/grpcpp.h>
#include "internal/util/errors.hpp"

namespace fleet::grpc {

/*
  Converts internal exceptions into gRPC status codes.
*/

::grpc::Status ToStatus(const std::exception& e);

// Agent key from the x-api-key metadata entry; empty when absent.
std::string ApiKeyFromMetadata(const ::grpc::ServerContext* context);

} // namespace fleet::grpc
