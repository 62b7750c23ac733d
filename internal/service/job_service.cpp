#include "job_service.hpp"

#include <stdexcept>
#include <string>

#include "internal/dispatch/command_dispatcher.hpp"
#include "internal/scheduler/job_scheduler.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"
#include "observe_rpc.hpp"
#include "proto_mapping.hpp"

namespace fleet::service {

using namespace fleet::control::v1;

namespace {

uint64_t RequiredMs(const google::protobuf::Timestamp& ts, bool present, const char* field) {
  if (!present) {
    throw util::InvalidArgument(std::string(field) + " is required");
  }
  const auto ms = TimestampToMs(ts, field);
  if (ms == 0) {
    throw util::InvalidArgument(std::string(field) + " must be after the epoch");
  }
  return ms;
}

JobResponse Wrap(const db::model::JobRecord& job) {
  JobResponse resp;
  *resp.mutable_job() = ToProto(job);
  return resp;
}

} // namespace

JobService::JobService(ServiceContext ctx) : ctx_(std::move(ctx)) {
  if (!ctx_.scheduler || !ctx_.dispatcher) {
    throw std::invalid_argument("JobService requires scheduler and dispatcher");
  }
}

JobResponse JobService::CreateJob(const CreateJobRequest& req) {
  return ObserveRpc("FleetJobService.CreateJob", [&] {
    scheduler::JobSpec spec;
    spec.name        = req.name();
    spec.action_type = req.action_type();
    spec.run_at_ms   = RequiredMs(req.run_at(), req.has_run_at(), "run_at");
    spec.recurrence  = req.recurrence() == RECURRENCE_UNSPECIFIED ? fleet::model::Recurrence::kOnce : FromProto(req.recurrence());
    spec.target_hosts.assign(req.target_hosts().begin(), req.target_hosts().end());
    spec.payload = req.payload();
    spec.creator = req.creator();
    return Wrap(ctx_.scheduler->Create(spec));
  });
}

JobResponse JobService::GetJob(const JobRequest& req) {
  return ObserveRpc("FleetJobService.GetJob", [&] { return Wrap(ctx_.scheduler->Get(req.id())); });
}

ListJobsResponse JobService::ListJobs(const ListJobsRequest&) {
  return ObserveRpc("FleetJobService.ListJobs", [&] {
    ListJobsResponse resp;
    for (const auto& job : ctx_.scheduler->List()) {
      *resp.add_jobs() = ToProto(job);
    }
    return resp;
  });
}

JobResponse JobService::CancelJob(const JobRequest& req) {
  return ObserveRpc("FleetJobService.CancelJob", [&] { return Wrap(ctx_.scheduler->Cancel(req.id())); });
}

JobResponse JobService::RescheduleJob(const RescheduleJobRequest& req) {
  return ObserveRpc("FleetJobService.RescheduleJob", [&] {
    return Wrap(ctx_.scheduler->Reschedule(req.id(), RequiredMs(req.run_at(), req.has_run_at(), "run_at")));
  });
}

void JobService::DeleteJob(const JobRequest& req) {
  ObserveRpc("FleetJobService.DeleteJob", [&] { ctx_.scheduler->Delete(req.id()); });
}

SweepResponse JobService::Sweep(const SweepRequest& req) {
  return ObserveRpc("FleetJobService.Sweep", [&] {
    const uint64_t now = req.has_now() ? RequiredMs(req.now(), true, "now") : util::NowMs();

    SweepResponse resp;
    for (const auto& job : ctx_.scheduler->Sweep(now)) {
      *resp.add_processed() = ToProto(job);
    }
    return resp;
  });
}

ListJobCommandsResponse JobService::ListJobCommands(const JobRequest& req) {
  return ObserveRpc("FleetJobService.ListJobCommands", [&] {
    ListJobCommandsResponse resp;
    for (const auto& command : ctx_.dispatcher->ListByJob(req.id())) {
      *resp.add_commands() = ToProto(command);
    }
    return resp;
  });
}

}
