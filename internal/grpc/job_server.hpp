#pragma once

#include <memory>
#include <grpcpp/grpcpp.h>

#include "fleet/control/v1.hpp"
#include "internal/service/job_service.hpp"

namespace fleet::grpc {

class JobServer final : public fleet::control::v1::FleetJobService::Service {
public:
  explicit JobServer(std::shared_ptr<fleet::service::JobService> svc);

  ::grpc::Status CreateJob(::grpc::ServerContext*,
                           const fleet::control::v1::CreateJobRequest*,
                           fleet::control::v1::JobResponse*) override;

  ::grpc::Status GetJob(::grpc::ServerContext*,
                        const fleet::control::v1::JobRequest*,
                        fleet::control::v1::JobResponse*) override;

  ::grpc::Status ListJobs(::grpc::ServerContext*,
                          const fleet::control::v1::ListJobsRequest*,
                          fleet::control::v1::ListJobsResponse*) override;

  ::grpc::Status CancelJob(::grpc::ServerContext*,
                           const fleet::control::v1::JobRequest*,
                           fleet::control::v1::JobResponse*) override;

  ::grpc::Status RescheduleJob(::grpc::ServerContext*,
                               const fleet::control::v1::RescheduleJobRequest*,
                               fleet::control::v1::JobResponse*) override;

  ::grpc::Status DeleteJob(::grpc::ServerContext*,
                           const fleet::control::v1::JobRequest*,
                           google::protobuf::Empty*) override;

  ::grpc::Status Sweep(::grpc::ServerContext*,
                       const fleet::control::v1::SweepRequest*,
                       fleet::control::v1::SweepResponse*) override;

  ::grpc::Status ListJobCommands(::grpc::ServerContext*,
                                 const fleet::control::v1::JobRequest*,
                                 fleet::control::v1::ListJobCommandsResponse*) override;

private:
  std::shared_ptr<fleet::service::JobService> service_;
};

}
