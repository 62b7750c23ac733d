#pragma once

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "internal/background/background_pool.hpp"
#include "internal/db/api/repository.hpp"
#include "internal/dispatch/command_dispatcher.hpp"

namespace fleet::scheduler {

struct JobSpec {
  std::string              name;
  std::string              action_type;
  uint64_t                 run_at_ms  = 0;
  fleet::model::Recurrence recurrence = fleet::model::Recurrence::kOnce;
  std::vector<std::string> target_hosts;
  std::string              payload;
  std::string              creator;
};

/*
  Stores scheduled jobs and promotes due ones into remote commands.

  Sweep claims each due job with a conditional scheduled -> running
  update in its own transaction. Any number of sweeps, in this process or
  another one, may overlap; each job is claimed by exactly one of them.

  A claim whose sweep died before recording the outcome is released back
  to scheduled once it has been running for scheduler.stale_claim_sec, so
  such a run may be dispatched again.
*/
class JobScheduler {
 public:
  JobScheduler(std::shared_ptr<db::Repository> repository, std::shared_ptr<dispatch::CommandDispatcher> dispatcher,
               std::shared_ptr<background::BackgroundPool>           pool   = nullptr,
               std::shared_ptr<const runtime::config::RuntimeConfig> config = nullptr);

  db::model::JobRecord Create(const JobSpec& spec);

  // Jobs this call claimed and finished, in their post-sweep state. A
  // failure on one job is logged and does not stop the rest.
  std::vector<db::model::JobRecord> Sweep(uint64_t now_ms);

  // running -> scheduled for claims older than the stale threshold.
  std::size_t ReleaseStaleClaims(uint64_t now_ms);

  // Only while scheduled; TerminalStateViolation otherwise.
  db::model::JobRecord Cancel(uint64_t id);
  db::model::JobRecord Reschedule(uint64_t id, uint64_t run_at_ms);

  // Refused while running. Commands issued by the job are kept.
  void Delete(uint64_t id);

  db::model::JobRecord              Get(uint64_t id);
  std::vector<db::model::JobRecord> List();

 private:
  static constexpr int kFinishAttempts = 3;

  bool                                Claim(const db::model::JobRecord& job, uint64_t now_ms);
  std::optional<db::model::JobRecord> Finish(db::model::JobRecord job, bool failed, uint64_t now_ms);
  std::optional<db::model::JobRecord> FinishWithRetry(const db::model::JobRecord& job, bool failed, uint64_t now_ms);
  void                                Notify(const db::model::JobRecord& job, std::size_t dispatched, bool failed);
  uint64_t                            StaleClaimMs() const;

  std::shared_ptr<db::Repository>                       repository_;
  std::shared_ptr<dispatch::CommandDispatcher>          dispatcher_;
  std::shared_ptr<background::BackgroundPool>           pool_;
  std::shared_ptr<const runtime::config::RuntimeConfig> config_;
};

} // namespace fleet::scheduler
