#include "key_server.hpp"
#include "grpc_error.hpp"

namespace fleet::grpc {

KeyServer::KeyServer(std::shared_ptr<fleet::service::KeyService> svc)
    : service_(std::move(svc)) {}

::grpc::Status KeyServer::CreateKey(::grpc::ServerContext*,
                                    const fleet::control::v1::CreateKeyRequest* req,
                                    fleet::control::v1::CreateKeyResponse* resp) {
  try {
    *resp = service_->CreateKey(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status KeyServer::RotateKey(::grpc::ServerContext*,
                                    const fleet::control::v1::RotateKeyRequest* req,
                                    fleet::control::v1::CreateKeyResponse* resp) {
  try {
    *resp = service_->RotateKey(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status KeyServer::RevokeKey(::grpc::ServerContext*,
                                    const fleet::control::v1::RevokeKeyRequest* req,
                                    fleet::control::v1::RevokeKeyResponse* resp) {
  try {
    *resp = service_->RevokeKey(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status KeyServer::ListKeys(::grpc::ServerContext*,
                                   const fleet::control::v1::ListKeysRequest* req,
                                   fleet::control::v1::ListKeysResponse* resp) {
  try {
    *resp = service_->ListKeys(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

}
