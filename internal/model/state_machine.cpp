#include "state_machine.hpp"

namespace fleet::model {

std::string_view ToString(JobStatus s) {
  switch (s) {
    case JobStatus::kScheduled:
      return "scheduled";
    case JobStatus::kRunning:
      return "running";
    case JobStatus::kCompleted:
      return "completed";
    case JobStatus::kFailed:
      return "failed";
    case JobStatus::kCancelled:
      return "cancelled";
  }
  return "unknown";
}

std::string_view ToString(CommandStatus s) {
  switch (s) {
    case CommandStatus::kPending:
      return "pending";
    case CommandStatus::kSent:
      return "sent";
    case CommandStatus::kAcknowledged:
      return "acknowledged";
    case CommandStatus::kFailed:
      return "failed";
    case CommandStatus::kExpired:
      return "expired";
  }
  return "unknown";
}

std::optional<JobStatus> ParseJobStatus(std::string_view s) {
  for (auto status : {JobStatus::kScheduled, JobStatus::kRunning, JobStatus::kCompleted, JobStatus::kFailed, JobStatus::kCancelled}) {
    if (ToString(status) == s) return status;
  }
  return std::nullopt;
}

std::optional<CommandStatus> ParseCommandStatus(std::string_view s) {
  for (auto status : {CommandStatus::kPending, CommandStatus::kSent, CommandStatus::kAcknowledged, CommandStatus::kFailed,
                      CommandStatus::kExpired}) {
    if (ToString(status) == s) return status;
  }
  return std::nullopt;
}

} // namespace fleet::model
