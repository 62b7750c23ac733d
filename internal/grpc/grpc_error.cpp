#include "grpc_error.hpp"

namespace fleet::grpc {

::grpc::Status ToStatus(const std::exception& e) {
  using namespace fleet::util;

  if (dynamic_cast<const AuthenticationFailure*>(&e)) {
    return {::grpc::StatusCode::UNAUTHENTICATED, e.what()};
  }
  if (dynamic_cast<const NotFound*>(&e)) {
    return {::grpc::StatusCode::NOT_FOUND, e.what()};
  }
  if (dynamic_cast<const AlreadyExists*>(&e)) {
    return {::grpc::StatusCode::ALREADY_EXISTS, e.what()};
  }
  if (dynamic_cast<const TerminalStateViolation*>(&e)) {
    return {::grpc::StatusCode::FAILED_PRECONDITION, e.what()};
  }
  if (dynamic_cast<const InvalidArgument*>(&e)) {
    return {::grpc::StatusCode::INVALID_ARGUMENT, e.what()};
  }
  if (dynamic_cast<const StoreUnavailable*>(&e)) {
    return {::grpc::StatusCode::UNAVAILABLE, e.what()};
  }

  return {::grpc::StatusCode::INTERNAL, e.what()};
}

std::string ApiKeyFromMetadata(const ::grpc::ServerContext* context) {
  if (!context) return {};
  const auto& metadata = context->client_metadata();
  const auto  it       = metadata.find("x-api-key");
  if (it == metadata.end()) return {};
  return std::string(it->second.data(), it->second.size());
}

} // namespace fleet::grpc
