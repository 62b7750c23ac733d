#pragma once

#include "fleet/control/v1.hpp"
#include "service_context.hpp"

namespace fleet::service {

class JobService {
public:
  explicit JobService(ServiceContext ctx);

  fleet::control::v1::JobResponse CreateJob(const fleet::control::v1::CreateJobRequest& req);
  fleet::control::v1::JobResponse GetJob(const fleet::control::v1::JobRequest& req);
  fleet::control::v1::ListJobsResponse ListJobs(const fleet::control::v1::ListJobsRequest& req);
  fleet::control::v1::JobResponse CancelJob(const fleet::control::v1::JobRequest& req);
  fleet::control::v1::JobResponse RescheduleJob(const fleet::control::v1::RescheduleJobRequest& req);
  void DeleteJob(const fleet::control::v1::JobRequest& req);
  fleet::control::v1::SweepResponse Sweep(const fleet::control::v1::SweepRequest& req);
  fleet::control::v1::ListJobCommandsResponse ListJobCommands(const fleet::control::v1::JobRequest& req);

private:
  ServiceContext ctx_;
};

}
