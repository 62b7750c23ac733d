#include "internal/service/proto_mapping.hpp"

#include <chrono>
#include <limits>
#include <string>

#include "internal/links/download_link_issuer.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"

namespace fleet::service {

namespace v1 = fleet::control::v1;

using fleet::model::CommandStatus;
using fleet::model::JobStatus;
using fleet::model::Recurrence;

v1::Credential ToProto(const db::model::CredentialRecord& record) {
  v1::Credential out;
  out.set_id(record.id);
  out.set_name(record.name);
  out.set_description(record.description);
  out.set_prefix(record.prefix);
  out.set_default_principal(record.default_principal);
  util::SetTimestampMs(record.created_at_ms, out.mutable_created_at());
  if (record.last_used_at_ms) util::SetTimestampMs(record.last_used_at_ms, out.mutable_last_used_at());
  if (record.revoked_at_ms) util::SetTimestampMs(record.revoked_at_ms, out.mutable_revoked_at());
  out.set_active(record.revoked_at_ms == 0);
  return out;
}

v1::ScheduledJob ToProto(const db::model::JobRecord& record) {
  v1::ScheduledJob out;
  out.set_id(record.id);
  out.set_name(record.name);
  out.set_action_type(record.action_type);
  out.set_status(ToProto(record.status));
  util::SetTimestampMs(record.run_at_ms, out.mutable_run_at());
  out.set_recurrence(ToProto(record.recurrence));
  for (const auto& host : record.target_hosts) out.add_target_hosts(host);
  out.set_payload(record.payload);
  out.set_creator(record.creator);
  util::SetTimestampMs(record.created_at_ms, out.mutable_created_at());
  util::SetTimestampMs(record.updated_at_ms, out.mutable_updated_at());
  if (record.last_run_at_ms) util::SetTimestampMs(record.last_run_at_ms, out.mutable_last_run_at());
  return out;
}

v1::RemoteCommand ToProto(const db::model::CommandRecord& record) {
  v1::RemoteCommand out;
  out.set_id(record.id);
  out.set_target_host(record.target_host);
  out.set_action_type(record.action_type);
  out.set_payload(record.payload);
  out.set_status(ToProto(record.status));
  out.set_source_job_id(record.source_job_id.value_or(0));
  out.set_detail(record.detail);
  util::SetTimestampMs(record.created_at_ms, out.mutable_created_at());
  if (record.sent_at_ms) util::SetTimestampMs(record.sent_at_ms, out.mutable_sent_at());
  if (record.completed_at_ms) util::SetTimestampMs(record.completed_at_ms, out.mutable_completed_at());
  util::SetTimestampMs(record.updated_at_ms, out.mutable_updated_at());
  return out;
}

v1::DownloadLink ToProto(const db::model::DownloadLinkRecord& record, uint64_t now_ms) {
  v1::DownloadLink out;
  out.set_id(record.id);
  out.set_token(record.token);
  out.set_creator(record.creator);
  out.set_visibility(ToProto(record.visibility));
  util::SetTimestampMs(record.created_at_ms, out.mutable_created_at());
  if (record.expires_at_ms) {
    // an already-expired link may carry expires_at == created_at; keep it
    *out.mutable_expires_at() = util::ToProto(util::FromUnixMillis(*record.expires_at_ms));
  }
  if (record.revoked_at_ms) util::SetTimestampMs(record.revoked_at_ms, out.mutable_revoked_at());
  out.set_active(links::DownloadLinkIssuer::IsActive(record, now_ms));
  return out;
}

v1::JobStatus ToProto(JobStatus status) {
  switch (status) {
    case JobStatus::kScheduled:
      return v1::JOB_STATUS_SCHEDULED;
    case JobStatus::kRunning:
      return v1::JOB_STATUS_RUNNING;
    case JobStatus::kCompleted:
      return v1::JOB_STATUS_COMPLETED;
    case JobStatus::kFailed:
      return v1::JOB_STATUS_FAILED;
    case JobStatus::kCancelled:
      return v1::JOB_STATUS_CANCELLED;
  }
  return v1::JOB_STATUS_UNSPECIFIED;
}

v1::CommandStatus ToProto(CommandStatus status) {
  switch (status) {
    case CommandStatus::kPending:
      return v1::COMMAND_STATUS_PENDING;
    case CommandStatus::kSent:
      return v1::COMMAND_STATUS_SENT;
    case CommandStatus::kAcknowledged:
      return v1::COMMAND_STATUS_ACKNOWLEDGED;
    case CommandStatus::kFailed:
      return v1::COMMAND_STATUS_FAILED;
    case CommandStatus::kExpired:
      return v1::COMMAND_STATUS_EXPIRED;
  }
  return v1::COMMAND_STATUS_UNSPECIFIED;
}

v1::Recurrence ToProto(Recurrence recurrence) {
  switch (recurrence) {
    case Recurrence::kOnce:
      return v1::RECURRENCE_ONCE;
    case Recurrence::kDaily:
      return v1::RECURRENCE_DAILY;
    case Recurrence::kWeekly:
      return v1::RECURRENCE_WEEKLY;
    case Recurrence::kMonthly:
      return v1::RECURRENCE_MONTHLY;
  }
  return v1::RECURRENCE_UNSPECIFIED;
}

v1::LinkVisibility ToProto(db::model::LinkVisibility visibility) {
  return visibility == db::model::LinkVisibility::kRestricted ? v1::LINK_VISIBILITY_RESTRICTED : v1::LINK_VISIBILITY_PUBLIC;
}

Recurrence FromProto(v1::Recurrence recurrence) {
  switch (recurrence) {
    case v1::RECURRENCE_ONCE:
      return Recurrence::kOnce;
    case v1::RECURRENCE_DAILY:
      return Recurrence::kDaily;
    case v1::RECURRENCE_WEEKLY:
      return Recurrence::kWeekly;
    case v1::RECURRENCE_MONTHLY:
      return Recurrence::kMonthly;
    default:
      throw util::InvalidArgument("recurrence must be specified");
  }
}

CommandStatus FromProto(v1::CommandStatus status) {
  switch (status) {
    case v1::COMMAND_STATUS_PENDING:
      return CommandStatus::kPending;
    case v1::COMMAND_STATUS_SENT:
      return CommandStatus::kSent;
    case v1::COMMAND_STATUS_ACKNOWLEDGED:
      return CommandStatus::kAcknowledged;
    case v1::COMMAND_STATUS_FAILED:
      return CommandStatus::kFailed;
    case v1::COMMAND_STATUS_EXPIRED:
      return CommandStatus::kExpired;
    default:
      throw util::InvalidArgument("command status must be specified");
  }
}

db::model::LinkVisibility FromProto(v1::LinkVisibility visibility) {
  switch (visibility) {
    case v1::LINK_VISIBILITY_PUBLIC:
      return db::model::LinkVisibility::kPublic;
    case v1::LINK_VISIBILITY_RESTRICTED:
      return db::model::LinkVisibility::kRestricted;
    default:
      throw util::InvalidArgument("link visibility must be specified");
  }
}

uint64_t SecondsToMs(uint64_t sec, uint64_t now_ms, const char* field) {
  constexpr uint64_t kMax = std::numeric_limits<uint64_t>::max();
  if (sec > (kMax - now_ms) / 1000) {
    throw util::InvalidArgument(std::string(field) + " is too large");
  }
  return sec * 1000;
}

uint64_t TimestampToMs(const google::protobuf::Timestamp& ts, const char* field) {
  constexpr auto kMaxSeconds = std::chrono::duration_cast<std::chrono::seconds>(util::Clock::duration::max()).count() - 1;
  if (ts.seconds() < 0 || ts.nanos() < 0) {
    throw util::InvalidArgument(std::string(field) + " must be after the epoch");
  }
  if (ts.seconds() > kMaxSeconds || ts.nanos() > 999'999'999) {
    throw util::InvalidArgument(std::string(field) + " is out of range");
  }
  return util::ToUnixMillis(util::FromProto(ts));
}

} // namespace fleet::service
