#include "ingest_server.hpp"
#include "grpc_error.hpp"

namespace fleet::grpc {

IngestServer::IngestServer(std::shared_ptr<fleet::service::IngestService> svc)
    : service_(std::move(svc)) {}

::grpc::Status IngestServer::Ingest(::grpc::ServerContext* context,
                                    const fleet::control::v1::IngestRequest* req,
                                    fleet::control::v1::IngestResponse* resp) {
  try {
    *resp = service_->Ingest(ApiKeyFromMetadata(context), *req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status IngestServer::IngestBatch(::grpc::ServerContext* context,
                                         const fleet::control::v1::IngestBatchRequest* req,
                                         fleet::control::v1::IngestBatchResponse* resp) {
  try {
    *resp = service_->IngestBatch(ApiKeyFromMetadata(context), *req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status IngestServer::Health(::grpc::ServerContext*,
                                    const google::protobuf::Empty*,
                                    fleet::control::v1::HealthResponse* resp) {
  try {
    *resp = service_->Health();
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

AgentServer::AgentServer(std::shared_ptr<fleet::service::AgentService> svc)
    : service_(std::move(svc)) {}

::grpc::Status AgentServer::PollCommands(::grpc::ServerContext* context,
                                         const fleet::control::v1::PollCommandsRequest* req,
                                         fleet::control::v1::PollCommandsResponse* resp) {
  try {
    *resp = service_->PollCommands(ApiKeyFromMetadata(context), *req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status AgentServer::ReportCommandResult(::grpc::ServerContext* context,
                                                const fleet::control::v1::ReportCommandResultRequest* req,
                                                fleet::control::v1::ReportCommandResultResponse* resp) {
  try {
    *resp = service_->ReportCommandResult(ApiKeyFromMetadata(context), *req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

}
