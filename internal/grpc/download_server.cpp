#include "download_server.hpp"
#include "grpc_error.hpp"

namespace fleet::grpc {

DownloadServer::DownloadServer(std::shared_ptr<fleet::service::DownloadService> svc)
    : service_(std::move(svc)) {}

::grpc::Status DownloadServer::IssueLink(::grpc::ServerContext*,
                                         const fleet::control::v1::IssueLinkRequest* req,
                                         fleet::control::v1::LinkResponse* resp) {
  try {
    *resp = service_->IssueLink(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status DownloadServer::RevokeLink(::grpc::ServerContext*,
                                          const fleet::control::v1::RevokeLinkRequest* req,
                                          fleet::control::v1::LinkResponse* resp) {
  try {
    *resp = service_->RevokeLink(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status DownloadServer::ResolveLink(::grpc::ServerContext* context,
                                           const fleet::control::v1::ResolveLinkRequest* req,
                                           fleet::control::v1::LinkResponse* resp) {
  try {
    *resp = service_->ResolveLink(ApiKeyFromMetadata(context), *req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

}
