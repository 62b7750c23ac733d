#include "internal/dispatch/command_dispatcher.hpp"

#include "internal/db/api/db_error.hpp"
#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"

namespace fleet::dispatch {

using fleet::model::CanTransition;
using fleet::model::CommandStatus;
using observability::StringField;
using observability::UintField;

namespace {

// Applies the timestamps that belong to entering `target`.
void Stamp(db::model::CommandRecord& record, CommandStatus target, uint64_t now_ms) {
  record.status        = target;
  record.updated_at_ms = now_ms;
  if (target == CommandStatus::kSent) {
    record.sent_at_ms = now_ms;
  } else if (fleet::model::IsTerminal(target)) {
    record.completed_at_ms = now_ms;
  }
}

} // namespace

CommandDispatcher::CommandDispatcher(std::shared_ptr<db::Repository> repository) : repository_(std::move(repository)) {
  if (!repository_) {
    throw std::invalid_argument("CommandDispatcher requires a repository");
  }
}

db::model::CommandRecord CommandDispatcher::Enqueue(const std::string& target_host, const std::string& action_type,
                                                    const std::string& payload, std::optional<uint64_t> source_job_id) {
  if (target_host.empty()) {
    throw util::InvalidArgument("target_host is required");
  }
  if (action_type.empty()) {
    throw util::InvalidArgument("action_type is required");
  }

  db::model::CommandRecord record;
  record.target_host   = target_host;
  record.action_type   = action_type;
  record.payload       = payload;
  record.status        = CommandStatus::kPending;
  record.source_job_id = source_job_id;
  record.created_at_ms = util::NowMs();
  record.updated_at_ms = record.created_at_ms;

  auto tx = repository_->Begin();
  db::ThrowIfDbError(repository_->InsertCommand(*tx, record), "insert command");
  tx->Commit();

  FLEET_LOG_DEBUG("command enqueued", {UintField("command_id", record.id), StringField("host", target_host),
                                       StringField("action", action_type), UintField("job_id", source_job_id.value_or(0))});
  return record;
}

db::model::CommandRecord CommandDispatcher::MarkSent(uint64_t id, const std::string& detail) {
  return Mark(id, CommandStatus::kSent, detail);
}

db::model::CommandRecord CommandDispatcher::MarkAcknowledged(uint64_t id, const std::string& detail) {
  return Mark(id, CommandStatus::kAcknowledged, detail);
}

db::model::CommandRecord CommandDispatcher::MarkFailed(uint64_t id, const std::string& detail) {
  return Mark(id, CommandStatus::kFailed, detail);
}

db::model::CommandRecord CommandDispatcher::Mark(uint64_t id, CommandStatus target, const std::string& detail) {
  auto tx      = repository_->Begin();
  auto current = repository_->GetCommand(*tx, id);
  if (!current) {
    throw util::NotFound("command " + std::to_string(id) + " not found");
  }

  const auto from = current->status;
  if (!CanTransition(from, target)) {
    throw util::TerminalStateViolation("command " + std::to_string(id) + " cannot move from " +
                                       std::string(fleet::model::ToString(from)) + " to " +
                                       std::string(fleet::model::ToString(target)));
  }

  auto updated = *current;
  Stamp(updated, target, util::NowMs());
  if (!detail.empty()) updated.detail = detail;

  db::ThrowIfDbError(repository_->UpdateCommandIf(*tx, from, updated), "update command " + std::to_string(id));
  tx->Commit();

  FLEET_LOG_INFO("command status changed", {UintField("command_id", id), StringField("from", fleet::model::ToString(from)),
                                            StringField("to", fleet::model::ToString(target))});
  return updated;
}

uint64_t CommandDispatcher::Expire(uint64_t now_ms, uint64_t ttl_ms) {
  const uint64_t cutoff = now_ms > ttl_ms ? now_ms - ttl_ms : 0;
  if (cutoff == 0) return 0;

  uint64_t expired = 0;
  auto     tx      = repository_->Begin();
  for (auto record : repository_->ListStaleCommands(*tx, cutoff)) {
    const auto from = record.status;
    Stamp(record, CommandStatus::kExpired, now_ms);
    auto res = repository_->UpdateCommandIf(*tx, from, record);
    if (res.code == db::ErrorCode::Conflict) {
      continue;
    }
    db::ThrowIfDbError(res, "expire command " + std::to_string(record.id));
    ++expired;
  }
  tx->Commit();

  if (expired > 0) {
    FLEET_LOG_INFO("stale commands expired", {UintField("expired", expired), UintField("ttl_ms", ttl_ms)});
  }
  return expired;
}

db::model::CommandRecord CommandDispatcher::Get(uint64_t id) {
  auto tx     = repository_->Begin();
  auto record = repository_->GetCommand(*tx, id);
  if (!record) {
    throw util::NotFound("command " + std::to_string(id) + " not found");
  }
  return *record;
}

std::vector<db::model::CommandRecord> CommandDispatcher::ListByJob(uint64_t job_id) {
  auto tx = repository_->Begin();
  return repository_->ListCommandsByJob(*tx, job_id);
}

std::vector<db::model::CommandRecord> CommandDispatcher::ListForHost(const std::string& host) {
  auto tx = repository_->Begin();
  return repository_->ListCommandsForHost(*tx, host);
}

std::vector<db::model::CommandRecord> CommandDispatcher::PollForHost(const std::string& host) {
  if (host.empty()) {
    throw util::InvalidArgument("host is required");
  }

  std::vector<db::model::CommandRecord> delivered;
  const uint64_t                        now = util::NowMs();

  auto tx = repository_->Begin();
  for (auto record : repository_->ListCommandsForHost(*tx, host)) {
    if (record.status != CommandStatus::kPending) continue;
    Stamp(record, CommandStatus::kSent, now);
    auto res = repository_->UpdateCommandIf(*tx, CommandStatus::kPending, record);
    if (res.code == db::ErrorCode::Conflict) {
      continue;
    }
    db::ThrowIfDbError(res, "deliver command " + std::to_string(record.id));
    delivered.push_back(std::move(record));
  }
  tx->Commit();
  return delivered;
}

} // namespace fleet::dispatch
