#include "internal/scheduler/job_scheduler.hpp"

#include <chrono>
#include <thread>
#include <unordered_set>

#include "internal/config/config_loader.hpp"
#include "internal/db/api/db_error.hpp"
#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"

namespace fleet::scheduler {

using fleet::model::JobStatus;
using observability::StringField;
using observability::UintField;

namespace {

std::vector<std::string> NormalizeHosts(const std::vector<std::string>& hosts) {
  std::vector<std::string>        out;
  std::unordered_set<std::string> seen;
  for (const auto& host : hosts) {
    if (host.empty()) {
      throw util::InvalidArgument("target host must not be empty");
    }
    if (host.find('\n') != std::string::npos) {
      throw util::InvalidArgument("target host must not contain a newline");
    }
    if (seen.insert(host).second) out.push_back(host);
  }
  if (out.empty()) {
    throw util::InvalidArgument("at least one target host is required");
  }
  return out;
}

std::string Describe(JobStatus status) {
  return std::string(fleet::model::ToString(status));
}

} // namespace

JobScheduler::JobScheduler(std::shared_ptr<db::Repository> repository, std::shared_ptr<dispatch::CommandDispatcher> dispatcher,
                           std::shared_ptr<background::BackgroundPool>           pool,
                           std::shared_ptr<const runtime::config::RuntimeConfig> config)
    : repository_(std::move(repository)), dispatcher_(std::move(dispatcher)), pool_(std::move(pool)), config_(std::move(config)) {
  if (!repository_ || !dispatcher_) {
    throw std::invalid_argument("JobScheduler requires repository and dispatcher");
  }
}

db::model::JobRecord JobScheduler::Create(const JobSpec& spec) {
  if (spec.name.empty()) throw util::InvalidArgument("job name is required");
  if (spec.action_type.empty()) throw util::InvalidArgument("job action_type is required");
  if (spec.creator.empty()) throw util::InvalidArgument("job creator is required");
  if (spec.run_at_ms == 0) throw util::InvalidArgument("job run_at is required");

  db::model::JobRecord record;
  record.name          = spec.name;
  record.action_type   = spec.action_type;
  record.status        = JobStatus::kScheduled;
  record.recurrence    = spec.recurrence;
  record.run_at_ms     = spec.run_at_ms;
  record.target_hosts  = NormalizeHosts(spec.target_hosts);
  record.payload       = spec.payload;
  record.creator       = spec.creator;
  record.created_at_ms = util::NowMs();
  record.updated_at_ms = record.created_at_ms;

  auto tx = repository_->Begin();
  db::ThrowIfDbError(repository_->InsertJob(*tx, record), "insert job");
  tx->Commit();

  FLEET_LOG_INFO("job scheduled", {UintField("job_id", record.id), StringField("name", record.name),
                                   StringField("recurrence", fleet::model::ToString(record.recurrence)),
                                   UintField("run_at_ms", record.run_at_ms), UintField("hosts", record.target_hosts.size())});
  return record;
}

bool JobScheduler::Claim(const db::model::JobRecord& job, uint64_t now_ms) {
  auto tx = repository_->Begin();

  // A recurring job another sweep already ran is back in scheduled with a
  // later run_at; the listed occurrence is gone.
  auto current = repository_->GetJob(*tx, job.id);
  if (!current || current->status != JobStatus::kScheduled || current->run_at_ms != job.run_at_ms) {
    FLEET_LOG_DEBUG("job claim lost", {UintField("job_id", job.id)});
    return false;
  }

  auto res = repository_->TransitionJob(*tx, job.id, JobStatus::kScheduled, JobStatus::kRunning, now_ms);
  if (res.code == db::ErrorCode::Conflict || res.code == db::ErrorCode::NotFound ||
      res.code == db::ErrorCode::SerializationFailure) {
    FLEET_LOG_DEBUG("job claim lost", {UintField("job_id", job.id)});
    return false;
  }
  db::ThrowIfDbError(res, "claim job " + std::to_string(job.id));
  tx->Commit();
  return true;
}

uint64_t JobScheduler::StaleClaimMs() const {
  uint64_t sec = config_ ? config_->scheduler().stale_claim_sec() : 0;
  if (sec == 0) sec = config::ConfigLoader::kDefaultStaleClaimSec;
  return sec * 1000;
}

std::size_t JobScheduler::ReleaseStaleClaims(uint64_t now_ms) {
  const uint64_t stale_ms = StaleClaimMs();

  auto        tx       = repository_->Begin();
  std::size_t released = 0;
  for (const auto& job : repository_->ListJobs(*tx)) {
    if (job.status != JobStatus::kRunning) continue;
    if (now_ms < job.updated_at_ms || now_ms - job.updated_at_ms < stale_ms) continue;

    auto res = repository_->TransitionJob(*tx, job.id, JobStatus::kRunning, JobStatus::kScheduled, now_ms);
    if (res.code == db::ErrorCode::Conflict || res.code == db::ErrorCode::NotFound) continue;
    db::ThrowIfDbError(res, "release job " + std::to_string(job.id));
    ++released;
    FLEET_LOG_WARN("stale job claim released", {UintField("job_id", job.id), UintField("claimed_at_ms", job.updated_at_ms)});
  }
  if (released > 0) tx->Commit();
  return released;
}

std::vector<db::model::JobRecord> JobScheduler::Sweep(uint64_t now_ms) {
  try {
    ReleaseStaleClaims(now_ms);
  } catch (const std::exception& e) {
    FLEET_LOG_WARN("stale claim release failed", {StringField("error", e.what())});
  }

  std::vector<db::model::JobRecord> due;
  {
    auto tx = repository_->Begin();
    due     = repository_->ListDueJobs(*tx, now_ms);
  }

  std::vector<db::model::JobRecord> processed;
  for (auto& job : due) {
    try {
      if (!Claim(job, now_ms)) continue;
    } catch (const std::exception& e) {
      FLEET_LOG_WARN("job claim failed", {UintField("job_id", job.id), StringField("error", e.what())});
      continue;
    }

    // no transaction is held while commands are dispatched
    bool        failed     = false;
    std::size_t dispatched = 0;
    for (const auto& host : job.target_hosts) {
      try {
        dispatcher_->Enqueue(host, job.action_type, job.payload, job.id);
        ++dispatched;
      } catch (const std::exception& e) {
        failed = true;
        FLEET_LOG_ERROR("command enqueue failed", {UintField("job_id", job.id), StringField("host", host),
                                                   StringField("error", e.what())});
      }
    }

    auto finished = FinishWithRetry(job, failed, now_ms);
    if (!finished) continue;
    Notify(*finished, dispatched, failed);
    processed.push_back(std::move(*finished));
  }
  return processed;
}

std::optional<db::model::JobRecord> JobScheduler::FinishWithRetry(const db::model::JobRecord& job, bool failed,
                                                                  uint64_t now_ms) {
  for (int attempt = 1;; ++attempt) {
    try {
      return Finish(job, failed, now_ms);
    } catch (const std::exception& e) {
      if (attempt >= kFinishAttempts) {
        FLEET_LOG_ERROR("job finish failed; claim left for release",
                        {UintField("job_id", job.id), StringField("error", e.what())});
        return std::nullopt;
      }
      FLEET_LOG_WARN("job finish failed; retrying", {UintField("job_id", job.id), observability::IntField("attempt", attempt),
                                                     StringField("error", e.what())});
      std::this_thread::sleep_for(std::chrono::milliseconds(20 * attempt));
    }
  }
}

std::optional<db::model::JobRecord> JobScheduler::Finish(db::model::JobRecord job, bool failed, uint64_t now_ms) {
  auto tx = repository_->Begin();

  // The claim is ours only while the row is still running since now_ms;
  // a released and re-claimed job belongs to the later sweep.
  auto current = repository_->GetJob(*tx, job.id);
  if (!current || current->status != JobStatus::kRunning || current->updated_at_ms != now_ms) {
    FLEET_LOG_WARN("job claim superseded", {UintField("job_id", job.id)});
    return std::nullopt;
  }

  job.last_run_at_ms = now_ms;
  job.updated_at_ms  = now_ms;

  std::optional<uint64_t> next;
  if (!failed) next = fleet::model::NextRunAtMs(job.recurrence, job.run_at_ms);
  if (next) {
    // completed -> scheduled re-arm, anchored on the prior run_at
    job.status    = JobStatus::kScheduled;
    job.run_at_ms = *next;
  } else {
    job.status = failed ? JobStatus::kFailed : JobStatus::kCompleted;
  }

  auto res = repository_->UpdateJob(*tx, JobStatus::kRunning, job);
  if (res.code == db::ErrorCode::Conflict || res.code == db::ErrorCode::NotFound) {
    FLEET_LOG_WARN("job claim superseded", {UintField("job_id", job.id)});
    return std::nullopt;
  }
  db::ThrowIfDbError(res, "finish job " + std::to_string(job.id));
  tx->Commit();

  FLEET_LOG_INFO("job swept", {UintField("job_id", job.id), StringField("status", Describe(job.status)),
                               UintField("next_run_at_ms", next.value_or(0))});
  return job;
}

void JobScheduler::Notify(const db::model::JobRecord& job, std::size_t dispatched, bool failed) {
  if (!pool_) return;

  pool_->Submit("job notification " + std::to_string(job.id), background::TaskContext{config_, job.creator},
                [job_id = job.id, name = job.name, dispatched, failed](const background::TaskContext& ctx) {
                  FLEET_LOG_INFO("job run finished", {UintField("job_id", job_id), StringField("name", name),
                                                      UintField("commands", dispatched), observability::BoolField("failed", failed),
                                                      StringField("notify", ctx.principal)});
                });
}

db::model::JobRecord JobScheduler::Cancel(uint64_t id) {
  auto tx      = repository_->Begin();
  auto current = repository_->GetJob(*tx, id);
  if (!current) {
    throw util::NotFound("job " + std::to_string(id) + " not found");
  }
  if (!fleet::model::CanTransition(current->status, JobStatus::kCancelled)) {
    throw util::TerminalStateViolation("job " + std::to_string(id) + " is " + Describe(current->status) + " and cannot be cancelled");
  }

  const auto now = util::NowMs();
  db::ThrowIfDbError(repository_->TransitionJob(*tx, id, JobStatus::kScheduled, JobStatus::kCancelled, now),
                     "cancel job " + std::to_string(id));
  tx->Commit();

  current->status        = JobStatus::kCancelled;
  current->updated_at_ms = now;
  FLEET_LOG_INFO("job cancelled", {UintField("job_id", id)});
  return *current;
}

db::model::JobRecord JobScheduler::Reschedule(uint64_t id, uint64_t run_at_ms) {
  if (run_at_ms == 0) throw util::InvalidArgument("job run_at is required");

  auto tx      = repository_->Begin();
  auto current = repository_->GetJob(*tx, id);
  if (!current) {
    throw util::NotFound("job " + std::to_string(id) + " not found");
  }
  if (current->status != JobStatus::kScheduled) {
    throw util::TerminalStateViolation("job " + std::to_string(id) + " is " + Describe(current->status) + " and cannot be rescheduled");
  }

  current->run_at_ms     = run_at_ms;
  current->updated_at_ms = util::NowMs();
  db::ThrowIfDbError(repository_->UpdateJob(*tx, JobStatus::kScheduled, *current), "reschedule job " + std::to_string(id));
  tx->Commit();
  return *current;
}

void JobScheduler::Delete(uint64_t id) {
  auto tx      = repository_->Begin();
  auto current = repository_->GetJob(*tx, id);
  if (!current) {
    throw util::NotFound("job " + std::to_string(id) + " not found");
  }
  if (current->status == JobStatus::kRunning) {
    throw util::TerminalStateViolation("job " + std::to_string(id) + " is running");
  }
  db::ThrowIfDbError(repository_->DeleteJob(*tx, id), "delete job " + std::to_string(id));
  tx->Commit();
  FLEET_LOG_INFO("job deleted", {UintField("job_id", id)});
}

db::model::JobRecord JobScheduler::Get(uint64_t id) {
  auto tx     = repository_->Begin();
  auto record = repository_->GetJob(*tx, id);
  if (!record) {
    throw util::NotFound("job " + std::to_string(id) + " not found");
  }
  return *record;
}

std::vector<db::model::JobRecord> JobScheduler::List() {
  auto tx = repository_->Begin();
  return repository_->ListJobs(*tx);
}

} // namespace fleet::scheduler
