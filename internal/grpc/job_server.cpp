#include "job_server.hpp"
#include "grpc_error.hpp"

namespace fleet::grpc {

JobServer::JobServer(std::shared_ptr<fleet::service::JobService> svc)
    : service_(std::move(svc)) {}

::grpc::Status JobServer::CreateJob(::grpc::ServerContext*,
                                    const fleet::control::v1::CreateJobRequest* req,
                                    fleet::control::v1::JobResponse* resp) {
  try {
    *resp = service_->CreateJob(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status JobServer::GetJob(::grpc::ServerContext*,
                                 const fleet::control::v1::JobRequest* req,
                                 fleet::control::v1::JobResponse* resp) {
  try {
    *resp = service_->GetJob(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status JobServer::ListJobs(::grpc::ServerContext*,
                                   const fleet::control::v1::ListJobsRequest* req,
                                   fleet::control::v1::ListJobsResponse* resp) {
  try {
    *resp = service_->ListJobs(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status JobServer::CancelJob(::grpc::ServerContext*,
                                    const fleet::control::v1::JobRequest* req,
                                    fleet::control::v1::JobResponse* resp) {
  try {
    *resp = service_->CancelJob(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status JobServer::RescheduleJob(::grpc::ServerContext*,
                                        const fleet::control::v1::RescheduleJobRequest* req,
                                        fleet::control::v1::JobResponse* resp) {
  try {
    *resp = service_->RescheduleJob(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status JobServer::DeleteJob(::grpc::ServerContext*,
                                    const fleet::control::v1::JobRequest* req,
                                    google::protobuf::Empty*) {
  try {
    service_->DeleteJob(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status JobServer::Sweep(::grpc::ServerContext*,
                                const fleet::control::v1::SweepRequest* req,
                                fleet::control::v1::SweepResponse* resp) {
  try {
    *resp = service_->Sweep(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status JobServer::ListJobCommands(::grpc::ServerContext*,
                                          const fleet::control::v1::JobRequest* req,
                                          fleet::control::v1::ListJobCommandsResponse* resp) {
  try {
    *resp = service_->ListJobCommands(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

}
