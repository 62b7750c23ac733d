#include "memory_repository.hpp"

#include <algorithm>

#include "memory_tx.hpp"

namespace fleet::db::memory {

using fleet::model::CommandStatus;
using fleet::model::IsTerminal;
using fleet::model::JobStatus;

MemoryRepository::MemoryRepository() = default;

std::unique_ptr<db::Transaction> MemoryRepository::Begin() {
  return std::make_unique<MemoryTransaction>(*this);
}

static MemoryTransaction& TX(db::Transaction& tx) {
  return static_cast<MemoryTransaction&>(tx);
}

template <typename Map>
static auto FindRecord(const Map& records, uint64_t id) -> std::optional<typename Map::mapped_type> {
  auto it = records.find(id);
  if (it == records.end()) return std::nullopt;
  return it->second;
}

// ---------------------------------------------------------------------------
// Credentials
// ---------------------------------------------------------------------------

Result MemoryRepository::InsertCredential(Transaction& t, model::CredentialRecord& r) {
  auto& s = TX(t).Mutable();
  for (const auto& [_, existing] : s.credentials) {
    if (existing.prefix == r.prefix) return Result::Err(ErrorCode::AlreadyExists, "credential prefix exists");
  }
  r.id                = s.next_credential_id++;
  s.credentials[r.id] = r;
  return Result::Ok();
}

std::optional<model::CredentialRecord> MemoryRepository::GetCredential(Transaction& t, uint64_t id) {
  return FindRecord(TX(t).View().credentials, id);
}

std::optional<model::CredentialRecord> MemoryRepository::GetCredentialByPrefix(Transaction& t, const std::string& prefix) {
  for (const auto& [_, record] : TX(t).View().credentials) {
    if (record.prefix == prefix) return record;
  }
  return std::nullopt;
}

std::vector<model::CredentialRecord> MemoryRepository::ListCredentials(Transaction& t) {
  std::vector<model::CredentialRecord> out;
  for (const auto& [_, record] : TX(t).View().credentials) out.push_back(record);
  return out;
}

Result MemoryRepository::ReplaceCredentialSecret(Transaction& t, uint64_t id, const std::string& prefix, const std::string& key_hash) {
  auto& s  = TX(t).Mutable();
  auto  it = s.credentials.find(id);
  if (it == s.credentials.end()) return Result::Err(ErrorCode::NotFound);
  for (const auto& [other_id, other] : s.credentials) {
    if (other_id != id && other.prefix == prefix) return Result::Err(ErrorCode::AlreadyExists, "credential prefix exists");
  }
  it->second.prefix   = prefix;
  it->second.key_hash = key_hash;
  it->second.revoked_at_ms = 0;
  return Result::Ok();
}

Result MemoryRepository::RevokeCredential(Transaction& t, uint64_t id, uint64_t revoked_at_ms) {
  auto& s  = TX(t).Mutable();
  auto  it = s.credentials.find(id);
  if (it == s.credentials.end()) return Result::Err(ErrorCode::NotFound);
  if (it->second.revoked_at_ms != 0) return Result::Err(ErrorCode::Conflict, "credential already revoked");
  it->second.revoked_at_ms = revoked_at_ms;
  return Result::Ok();
}

Result MemoryRepository::TouchCredential(Transaction& t, uint64_t id, uint64_t used_at_ms) {
  auto& s  = TX(t).Mutable();
  auto  it = s.credentials.find(id);
  if (it == s.credentials.end()) return Result::Err(ErrorCode::NotFound);
  it->second.last_used_at_ms = used_at_ms;
  return Result::Ok();
}

// ---------------------------------------------------------------------------
// Messages
// ---------------------------------------------------------------------------

Result MemoryRepository::InsertMessage(Transaction& t, model::MessageRecord& r) {
  auto& s = TX(t).Mutable();
  if (r.doc_key && !s.doc_keys.insert(*r.doc_key).second) {
    return Result::Err(ErrorCode::AlreadyExists, "duplicate doc_key");
  }
  r.id             = s.next_message_id++;
  s.messages[r.id] = r;
  return Result::Ok();
}

std::optional<uint64_t> MemoryRepository::LatestMessageReceivedAt(Transaction& t) {
  std::optional<uint64_t> latest;
  for (const auto& [_, record] : TX(t).View().messages) {
    if (!latest || record.received_at_ms > *latest) latest = record.received_at_ms;
  }
  return latest;
}

uint64_t MemoryRepository::CountMessages(Transaction& t) {
  return TX(t).View().messages.size();
}

Result MemoryRepository::DeleteMessagesOlderThan(Transaction& t, uint64_t received_before_ms, uint64_t* deleted) {
  auto&    s     = TX(t).Mutable();
  uint64_t count = 0;
  for (auto it = s.messages.begin(); it != s.messages.end();) {
    if (it->second.received_at_ms < received_before_ms) {
      if (it->second.doc_key) s.doc_keys.erase(*it->second.doc_key);
      it = s.messages.erase(it);
      ++count;
    } else {
      ++it;
    }
  }
  if (deleted) *deleted = count;
  return Result::Ok();
}

// ---------------------------------------------------------------------------
// Jobs
// ---------------------------------------------------------------------------

Result MemoryRepository::InsertJob(Transaction& t, model::JobRecord& r) {
  auto& s      = TX(t).Mutable();
  r.id         = s.next_job_id++;
  s.jobs[r.id] = r;
  return Result::Ok();
}

std::optional<model::JobRecord> MemoryRepository::GetJob(Transaction& t, uint64_t id) {
  return FindRecord(TX(t).View().jobs, id);
}

std::vector<model::JobRecord> MemoryRepository::ListJobs(Transaction& t) {
  std::vector<model::JobRecord> out;
  for (const auto& [_, record] : TX(t).View().jobs) out.push_back(record);
  return out;
}

std::vector<model::JobRecord> MemoryRepository::ListDueJobs(Transaction& t, uint64_t now_ms) {
  std::vector<model::JobRecord> out;
  for (const auto& [_, record] : TX(t).View().jobs) {
    if (record.status == JobStatus::kScheduled && record.run_at_ms <= now_ms) out.push_back(record);
  }
  std::stable_sort(out.begin(), out.end(), [](const auto& a, const auto& b) { return a.run_at_ms < b.run_at_ms; });
  return out;
}

Result MemoryRepository::TransitionJob(Transaction& t, uint64_t id, JobStatus from, JobStatus to, uint64_t updated_at_ms) {
  auto& s  = TX(t).Mutable();
  auto  it = s.jobs.find(id);
  if (it == s.jobs.end()) return Result::Err(ErrorCode::NotFound);
  if (it->second.status != from) return Result::Err(ErrorCode::Conflict, "job status changed");
  it->second.status        = to;
  it->second.updated_at_ms = updated_at_ms;
  return Result::Ok();
}

Result MemoryRepository::UpdateJob(Transaction& t, JobStatus expected, const model::JobRecord& r) {
  auto& s  = TX(t).Mutable();
  auto  it = s.jobs.find(r.id);
  if (it == s.jobs.end()) return Result::Err(ErrorCode::NotFound);
  if (it->second.status != expected) return Result::Err(ErrorCode::Conflict, "job status changed");
  it->second.status         = r.status;
  it->second.run_at_ms      = r.run_at_ms;
  it->second.last_run_at_ms = r.last_run_at_ms;
  it->second.updated_at_ms  = r.updated_at_ms;
  return Result::Ok();
}

Result MemoryRepository::DeleteJob(Transaction& t, uint64_t id) {
  if (TX(t).Mutable().jobs.erase(id) == 0) return Result::Err(ErrorCode::NotFound);
  return Result::Ok();
}

// ---------------------------------------------------------------------------
// Commands
// ---------------------------------------------------------------------------

Result MemoryRepository::InsertCommand(Transaction& t, model::CommandRecord& r) {
  auto& s          = TX(t).Mutable();
  r.id             = s.next_command_id++;
  s.commands[r.id] = r;
  return Result::Ok();
}

std::optional<model::CommandRecord> MemoryRepository::GetCommand(Transaction& t, uint64_t id) {
  return FindRecord(TX(t).View().commands, id);
}

Result MemoryRepository::UpdateCommandIf(Transaction& t, CommandStatus expected, const model::CommandRecord& updated) {
  auto& s  = TX(t).Mutable();
  auto  it = s.commands.find(updated.id);
  if (it == s.commands.end()) return Result::Err(ErrorCode::NotFound);
  if (it->second.status != expected) return Result::Err(ErrorCode::Conflict, "command status changed");
  auto& r           = it->second;
  r.status          = updated.status;
  r.detail          = updated.detail;
  r.sent_at_ms      = updated.sent_at_ms;
  r.completed_at_ms = updated.completed_at_ms;
  r.updated_at_ms   = updated.updated_at_ms;
  return Result::Ok();
}

std::vector<model::CommandRecord> MemoryRepository::ListCommandsByJob(Transaction& t, uint64_t job_id) {
  std::vector<model::CommandRecord> out;
  for (const auto& [_, record] : TX(t).View().commands) {
    if (record.source_job_id == job_id) out.push_back(record);
  }
  return out;
}

std::vector<model::CommandRecord> MemoryRepository::ListCommandsForHost(Transaction& t, const std::string& host) {
  std::vector<model::CommandRecord> out;
  for (const auto& [_, record] : TX(t).View().commands) {
    if (record.target_host == host) out.push_back(record);
  }
  return out;
}

std::vector<model::CommandRecord> MemoryRepository::ListStaleCommands(Transaction& t, uint64_t created_before_ms) {
  std::vector<model::CommandRecord> out;
  for (const auto& [_, record] : TX(t).View().commands) {
    if (!IsTerminal(record.status) && record.created_at_ms < created_before_ms) out.push_back(record);
  }
  return out;
}

// ---------------------------------------------------------------------------
// Download links
// ---------------------------------------------------------------------------

Result MemoryRepository::InsertDownloadLink(Transaction& t, model::DownloadLinkRecord& r) {
  auto& s = TX(t).Mutable();
  for (const auto& [_, existing] : s.links) {
    if (existing.token == r.token) return Result::Err(ErrorCode::AlreadyExists, "link token exists");
  }
  r.id          = s.next_link_id++;
  s.links[r.id] = r;
  return Result::Ok();
}

std::optional<model::DownloadLinkRecord> MemoryRepository::GetDownloadLink(Transaction& t, uint64_t id) {
  return FindRecord(TX(t).View().links, id);
}

std::optional<model::DownloadLinkRecord> MemoryRepository::GetDownloadLinkByToken(Transaction& t, const std::string& token) {
  for (const auto& [_, record] : TX(t).View().links) {
    if (record.token == token) return record;
  }
  return std::nullopt;
}

Result MemoryRepository::RevokeDownloadLink(Transaction& t, uint64_t id, uint64_t revoked_at_ms) {
  auto& s  = TX(t).Mutable();
  auto  it = s.links.find(id);
  if (it == s.links.end()) return Result::Err(ErrorCode::NotFound);
  if (it->second.revoked_at_ms != 0) return Result::Err(ErrorCode::Conflict, "link already revoked");
  it->second.revoked_at_ms = revoked_at_ms;
  return Result::Ok();
}

} // namespace fleet::db::memory
