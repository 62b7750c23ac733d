#pragma once

#include <cstdint>
#include <initializer_list>
#include <optional>
#include <string_view>
#include <utility>

namespace fleet::model {

/*
  Lifecycle states and their transition tables.

  Every permitted edge is listed explicitly; anything not listed is
  rejected. Storage enforces the same edges with conditional updates so
  concurrent processes cannot race past them.
*/

enum class CredentialState : std::uint8_t {
  kActive  = 1,
  kRevoked = 2,
};

enum class JobStatus : std::uint8_t {
  kScheduled = 1,
  kRunning   = 2,
  kCompleted = 3,
  kFailed    = 4,
  kCancelled = 5,
};

enum class CommandStatus : std::uint8_t {
  kPending      = 1,
  kSent         = 2,
  kAcknowledged = 3,
  kFailed       = 4,
  kExpired      = 5,
};

template <typename State>
using Edge = std::pair<State, State>;

template <typename State>
constexpr bool EdgeListed(std::initializer_list<Edge<State>> table, State from, State to) {
  for (const auto& edge : table) {
    if (edge.first == from && edge.second == to) return true;
  }
  return false;
}

// Revocation is final; rotation issues a new key and is handled separately.
constexpr bool CanTransition(CredentialState from, CredentialState to) {
  return EdgeListed<CredentialState>({{CredentialState::kActive, CredentialState::kRevoked}}, from, to);
}

// completed -> scheduled is the re-arm edge of recurring jobs;
// running -> scheduled releases a claim whose sweep never finished.
constexpr bool CanTransition(JobStatus from, JobStatus to) {
  return EdgeListed<JobStatus>({{JobStatus::kScheduled, JobStatus::kRunning},
                                {JobStatus::kScheduled, JobStatus::kCancelled},
                                {JobStatus::kRunning, JobStatus::kCompleted},
                                {JobStatus::kRunning, JobStatus::kFailed},
                                {JobStatus::kRunning, JobStatus::kScheduled},
                                {JobStatus::kCompleted, JobStatus::kScheduled}},
                               from, to);
}

constexpr bool CanTransition(CommandStatus from, CommandStatus to) {
  return EdgeListed<CommandStatus>({{CommandStatus::kPending, CommandStatus::kSent},
                                    {CommandStatus::kPending, CommandStatus::kAcknowledged},
                                    {CommandStatus::kPending, CommandStatus::kFailed},
                                    {CommandStatus::kPending, CommandStatus::kExpired},
                                    {CommandStatus::kSent, CommandStatus::kAcknowledged},
                                    {CommandStatus::kSent, CommandStatus::kFailed},
                                    {CommandStatus::kSent, CommandStatus::kExpired}},
                                   from, to);
}

constexpr bool IsTerminal(CommandStatus s) {
  return s == CommandStatus::kAcknowledged || s == CommandStatus::kFailed || s == CommandStatus::kExpired;
}

constexpr bool IsTerminal(JobStatus s) {
  return s == JobStatus::kFailed || s == JobStatus::kCancelled;
}

std::string_view ToString(JobStatus s);
std::string_view ToString(CommandStatus s);

std::optional<JobStatus>     ParseJobStatus(std::string_view s);
std::optional<CommandStatus> ParseCommandStatus(std::string_view s);

} // namespace fleet::model
