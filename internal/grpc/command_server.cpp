#include "command_server.hpp"
#include "grpc_error.hpp"

namespace fleet::grpc {

CommandServer::CommandServer(std::shared_ptr<fleet::service::CommandService> svc)
    : service_(std::move(svc)) {}

::grpc::Status CommandServer::EnqueueCommand(::grpc::ServerContext*,
                                             const fleet::control::v1::EnqueueCommandRequest* req,
                                             fleet::control::v1::CommandResponse* resp) {
  try {
    *resp = service_->EnqueueCommand(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status CommandServer::MarkCommand(::grpc::ServerContext*,
                                          const fleet::control::v1::MarkCommandRequest* req,
                                          fleet::control::v1::CommandResponse* resp) {
  try {
    *resp = service_->MarkCommand(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status CommandServer::ListCommands(::grpc::ServerContext*,
                                           const fleet::control::v1::ListCommandsRequest* req,
                                           fleet::control::v1::ListCommandsResponse* resp) {
  try {
    *resp = service_->ListCommands(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status CommandServer::ExpireCommands(::grpc::ServerContext*,
                                             const fleet::control::v1::ExpireCommandsRequest* req,
                                             fleet::control::v1::ExpireCommandsResponse* resp) {
  try {
    *resp = service_->ExpireCommands(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

}
