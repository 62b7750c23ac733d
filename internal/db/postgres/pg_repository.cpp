#include "pg_repository.hpp"

#include <cstddef>

#include "internal/util/errors.hpp"

namespace fleet::db::postgres {

using fleet::model::CommandStatus;
using fleet::model::JobStatus;

namespace {

// BIGINT columns are signed; ids and epoch millis fit comfortably.
int64_t I64(uint64_t v) {
  return static_cast<int64_t>(v);
}

std::optional<int64_t> I64(const std::optional<uint64_t>& v) {
  if (!v) return std::nullopt;
  return static_cast<int64_t>(*v);
}

uint64_t U64(const pqxx::field& f) {
  return f.is_null() ? 0 : static_cast<uint64_t>(f.as<int64_t>());
}

std::string JoinHosts(const std::vector<std::string>& hosts) {
  std::string out;
  for (size_t i = 0; i < hosts.size(); ++i) {
    if (i) out.push_back('\n');
    out += hosts[i];
  }
  return out;
}

std::vector<std::string> SplitHosts(const std::string& joined) {
  std::vector<std::string> out;
  if (joined.empty()) return out;
  size_t start = 0;
  while (true) {
    size_t nl = joined.find('\n', start);
    out.push_back(joined.substr(start, nl == std::string::npos ? std::string::npos : nl - start));
    if (nl == std::string::npos) break;
    start = nl + 1;
  }
  return out;
}

model::CredentialRecord ReadCredential(const pqxx::row& row) {
  model::CredentialRecord r;
  r.id                = U64(row[0]);
  r.name              = row[1].c_str();
  r.description       = row[2].c_str();
  r.prefix            = row[3].c_str();
  r.key_hash          = row[4].c_str();
  r.default_principal = row[5].c_str();
  r.created_at_ms     = U64(row[6]);
  r.last_used_at_ms   = U64(row[7]);
  r.revoked_at_ms     = U64(row[8]);
  return r;
}

model::JobRecord ReadJob(const pqxx::row& row) {
  model::JobRecord r;
  r.id             = U64(row[0]);
  r.name           = row[1].c_str();
  r.action_type    = row[2].c_str();
  r.status         = static_cast<JobStatus>(row[3].as<int>());
  r.recurrence     = static_cast<fleet::model::Recurrence>(row[4].as<int>());
  r.run_at_ms      = U64(row[5]);
  r.target_hosts   = SplitHosts(row[6].c_str());
  r.payload        = row[7].c_str();
  r.creator        = row[8].c_str();
  r.created_at_ms  = U64(row[9]);
  r.updated_at_ms  = U64(row[10]);
  r.last_run_at_ms = U64(row[11]);
  return r;
}

model::CommandRecord ReadCommand(const pqxx::row& row) {
  model::CommandRecord r;
  r.id          = U64(row[0]);
  r.target_host = row[1].c_str();
  r.action_type = row[2].c_str();
  r.payload     = row[3].c_str();
  r.status      = static_cast<CommandStatus>(row[4].as<int>());
  if (!row[5].is_null()) r.source_job_id = U64(row[5]);
  r.detail          = row[6].c_str();
  r.created_at_ms   = U64(row[7]);
  r.sent_at_ms      = U64(row[8]);
  r.completed_at_ms = U64(row[9]);
  r.updated_at_ms   = U64(row[10]);
  return r;
}

model::DownloadLinkRecord ReadLink(const pqxx::row& row) {
  model::DownloadLinkRecord r;
  r.id            = U64(row[0]);
  r.token         = row[1].c_str();
  r.creator       = row[2].c_str();
  r.visibility    = static_cast<model::LinkVisibility>(row[3].as<int>());
  r.created_at_ms = U64(row[4]);
  if (!row[5].is_null()) r.expires_at_ms = U64(row[5]);
  r.revoked_at_ms = U64(row[6]);
  return r;
}

// Reads have no Result channel; surface backend failures as store errors.
template <typename Fn>
auto Read(Fn&& fn) -> decltype(fn()) {
  try {
    return fn();
  } catch (const pqxx::failure& e) {
    throw util::StoreUnavailable(e.what());
  }
}

template <typename Record, typename Reader>
std::vector<Record> Rows(const pqxx::result& res, Reader read) {
  std::vector<Record> out;
  out.reserve(res.size());
  for (const auto& row : res) out.push_back(read(row));
  return out;
}

} // namespace

PgRepository::PgRepository(std::shared_ptr<PgPool> pool) : pool_(std::move(pool)) {
}

std::unique_ptr<db::Transaction> PgRepository::Begin() {
  try {
    return std::make_unique<PgTransaction>(pool_);
  } catch (const pqxx::failure& e) {
    throw util::StoreUnavailable(e.what());
  }
}

PgTransaction& PgRepository::TX(Transaction& t) {
  return static_cast<PgTransaction&>(t);
}

Result PgRepository::Translate(const std::exception& e) {
  if (dynamic_cast<const pqxx::unique_violation*>(&e)) {
    return Result::Err(ErrorCode::AlreadyExists, e.what());
  }
  if (dynamic_cast<const pqxx::integrity_constraint_violation*>(&e)) {
    return Result::Err(ErrorCode::ConstraintViolation, e.what());
  }
  if (dynamic_cast<const pqxx::serialization_failure*>(&e)) {
    return Result::Err(ErrorCode::SerializationFailure, e.what());
  }
  if (dynamic_cast<const pqxx::broken_connection*>(&e)) {
    return Result::Err(ErrorCode::IOError, e.what());
  }
  return Result::Err(ErrorCode::InternalError, e.what());
}

template <typename... Args>
Result PgRepository::GuardedUpdate(Transaction& t, const char* stmt, const char* exists_stmt, uint64_t id, Args&&... args) {
  try {
    auto res = TX(t).Work().exec_prepared(stmt, I64(id), std::forward<Args>(args)...);
    if (res.affected_rows() > 0) return Result::Ok();
    auto exists = TX(t).Work().exec_prepared(exists_stmt, I64(id));
    if (exists.empty()) return Result::Err(ErrorCode::NotFound);
    return Result::Err(ErrorCode::Conflict, "row not in expected state");
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

// ---------------------------------------------------------------------------
// Credentials
// ---------------------------------------------------------------------------

Result PgRepository::InsertCredential(Transaction& t, model::CredentialRecord& r) {
  try {
    auto res = TX(t).Work().exec_prepared("insert_credential", r.name, r.description, r.prefix, r.key_hash,
                                          r.default_principal, I64(r.created_at_ms), I64(r.last_used_at_ms),
                                          I64(r.revoked_at_ms));
    r.id = U64(res[0][0]);
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

std::optional<model::CredentialRecord> PgRepository::GetCredential(Transaction& t, uint64_t id) {
  return Read([&]() -> std::optional<model::CredentialRecord> {
    auto res = TX(t).Work().exec_prepared("get_credential", I64(id));
    if (res.empty()) return std::nullopt;
    return ReadCredential(res[0]);
  });
}

std::optional<model::CredentialRecord> PgRepository::GetCredentialByPrefix(Transaction& t, const std::string& prefix) {
  return Read([&]() -> std::optional<model::CredentialRecord> {
    auto res = TX(t).Work().exec_prepared("get_credential_by_prefix", prefix);
    if (res.empty()) return std::nullopt;
    return ReadCredential(res[0]);
  });
}

std::vector<model::CredentialRecord> PgRepository::ListCredentials(Transaction& t) {
  return Read([&] { return Rows<model::CredentialRecord>(TX(t).Work().exec_prepared("list_credentials"), ReadCredential); });
}

Result PgRepository::ReplaceCredentialSecret(Transaction& t, uint64_t id, const std::string& prefix, const std::string& key_hash) {
  return GuardedUpdate(t, "replace_credential_secret", "credential_exists", id, prefix, key_hash);
}

Result PgRepository::RevokeCredential(Transaction& t, uint64_t id, uint64_t revoked_at_ms) {
  return GuardedUpdate(t, "revoke_credential", "credential_exists", id, I64(revoked_at_ms));
}

Result PgRepository::TouchCredential(Transaction& t, uint64_t id, uint64_t used_at_ms) {
  try {
    auto res = TX(t).Work().exec_prepared("touch_credential", I64(id), I64(used_at_ms));
    if (res.affected_rows() == 0) return Result::Err(ErrorCode::NotFound);
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

// ---------------------------------------------------------------------------
// Messages
// ---------------------------------------------------------------------------

Result PgRepository::InsertMessage(Transaction& t, model::MessageRecord& r) {
  try {
    auto res = TX(t).Work().exec_prepared("insert_message", r.doc_key, pqxx::binary_cast(r.payload),
                                          I64(r.received_at_ms), I64(r.credential_id));
    if (res.empty()) return Result::Err(ErrorCode::AlreadyExists, "duplicate doc_key");
    r.id = U64(res[0][0]);
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

std::optional<uint64_t> PgRepository::LatestMessageReceivedAt(Transaction& t) {
  return Read([&]() -> std::optional<uint64_t> {
    auto res = TX(t).Work().exec_prepared("latest_message");
    if (res.empty() || res[0][0].is_null()) return std::nullopt;
    return U64(res[0][0]);
  });
}

uint64_t PgRepository::CountMessages(Transaction& t) {
  return Read([&] { return U64(TX(t).Work().exec_prepared("count_messages")[0][0]); });
}

Result PgRepository::DeleteMessagesOlderThan(Transaction& t, uint64_t received_before_ms, uint64_t* deleted) {
  try {
    auto res = TX(t).Work().exec_prepared("purge_messages", I64(received_before_ms));
    if (deleted) *deleted = static_cast<uint64_t>(res.affected_rows());
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

// ---------------------------------------------------------------------------
// Jobs
// ---------------------------------------------------------------------------

Result PgRepository::InsertJob(Transaction& t, model::JobRecord& r) {
  try {
    auto res = TX(t).Work().exec_prepared("insert_job", r.name, r.action_type, static_cast<int>(r.status),
                                          static_cast<int>(r.recurrence), I64(r.run_at_ms), JoinHosts(r.target_hosts),
                                          r.payload, r.creator, I64(r.created_at_ms), I64(r.updated_at_ms),
                                          I64(r.last_run_at_ms));
    r.id = U64(res[0][0]);
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

std::optional<model::JobRecord> PgRepository::GetJob(Transaction& t, uint64_t id) {
  return Read([&]() -> std::optional<model::JobRecord> {
    auto res = TX(t).Work().exec_prepared("get_job", I64(id));
    if (res.empty()) return std::nullopt;
    return ReadJob(res[0]);
  });
}

std::vector<model::JobRecord> PgRepository::ListJobs(Transaction& t) {
  return Read([&] { return Rows<model::JobRecord>(TX(t).Work().exec_prepared("list_jobs"), ReadJob); });
}

std::vector<model::JobRecord> PgRepository::ListDueJobs(Transaction& t, uint64_t now_ms) {
  return Read([&] {
    return Rows<model::JobRecord>(
        TX(t).Work().exec_prepared("list_due_jobs", static_cast<int>(JobStatus::kScheduled), I64(now_ms)), ReadJob);
  });
}

Result PgRepository::TransitionJob(Transaction& t, uint64_t id, JobStatus from, JobStatus to, uint64_t updated_at_ms) {
  return GuardedUpdate(t, "transition_job", "job_exists", id, static_cast<int>(from), static_cast<int>(to),
                       I64(updated_at_ms));
}

Result PgRepository::UpdateJob(Transaction& t, JobStatus expected, const model::JobRecord& r) {
  return GuardedUpdate(t, "update_job", "job_exists", r.id, static_cast<int>(expected), static_cast<int>(r.status),
                       I64(r.run_at_ms), I64(r.last_run_at_ms), I64(r.updated_at_ms));
}

Result PgRepository::DeleteJob(Transaction& t, uint64_t id) {
  try {
    auto res = TX(t).Work().exec_prepared("delete_job", I64(id));
    if (res.affected_rows() == 0) return Result::Err(ErrorCode::NotFound);
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

// ---------------------------------------------------------------------------
// Commands
// ---------------------------------------------------------------------------

Result PgRepository::InsertCommand(Transaction& t, model::CommandRecord& r) {
  try {
    auto res = TX(t).Work().exec_prepared("insert_command", r.target_host, r.action_type, r.payload,
                                          static_cast<int>(r.status), I64(r.source_job_id), r.detail,
                                          I64(r.created_at_ms), I64(r.sent_at_ms), I64(r.completed_at_ms),
                                          I64(r.updated_at_ms));
    r.id = U64(res[0][0]);
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

std::optional<model::CommandRecord> PgRepository::GetCommand(Transaction& t, uint64_t id) {
  return Read([&]() -> std::optional<model::CommandRecord> {
    auto res = TX(t).Work().exec_prepared("get_command", I64(id));
    if (res.empty()) return std::nullopt;
    return ReadCommand(res[0]);
  });
}

Result PgRepository::UpdateCommandIf(Transaction& t, CommandStatus expected, const model::CommandRecord& r) {
  return GuardedUpdate(t, "update_command_if", "command_exists", r.id, static_cast<int>(r.status), r.detail,
                       I64(r.sent_at_ms), I64(r.completed_at_ms), I64(r.updated_at_ms), static_cast<int>(expected));
}

std::vector<model::CommandRecord> PgRepository::ListCommandsByJob(Transaction& t, uint64_t job_id) {
  return Read([&] {
    return Rows<model::CommandRecord>(TX(t).Work().exec_prepared("list_commands_by_job", I64(job_id)), ReadCommand);
  });
}

std::vector<model::CommandRecord> PgRepository::ListCommandsForHost(Transaction& t, const std::string& host) {
  return Read([&] {
    return Rows<model::CommandRecord>(TX(t).Work().exec_prepared("list_commands_for_host", host), ReadCommand);
  });
}

std::vector<model::CommandRecord> PgRepository::ListStaleCommands(Transaction& t, uint64_t created_before_ms) {
  return Read([&] {
    return Rows<model::CommandRecord>(
        TX(t).Work().exec_prepared("list_stale_commands", static_cast<int>(CommandStatus::kPending),
                                   static_cast<int>(CommandStatus::kSent), I64(created_before_ms)),
        ReadCommand);
  });
}

// ---------------------------------------------------------------------------
// Download links
// ---------------------------------------------------------------------------

Result PgRepository::InsertDownloadLink(Transaction& t, model::DownloadLinkRecord& r) {
  try {
    auto res = TX(t).Work().exec_prepared("insert_link", r.token, r.creator, static_cast<int>(r.visibility),
                                          I64(r.created_at_ms), I64(r.expires_at_ms), I64(r.revoked_at_ms));
    r.id = U64(res[0][0]);
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

std::optional<model::DownloadLinkRecord> PgRepository::GetDownloadLink(Transaction& t, uint64_t id) {
  return Read([&]() -> std::optional<model::DownloadLinkRecord> {
    auto res = TX(t).Work().exec_prepared("get_link", I64(id));
    if (res.empty()) return std::nullopt;
    return ReadLink(res[0]);
  });
}

std::optional<model::DownloadLinkRecord> PgRepository::GetDownloadLinkByToken(Transaction& t, const std::string& token) {
  return Read([&]() -> std::optional<model::DownloadLinkRecord> {
    auto res = TX(t).Work().exec_prepared("get_link_by_token", token);
    if (res.empty()) return std::nullopt;
    return ReadLink(res[0]);
  });
}

Result PgRepository::RevokeDownloadLink(Transaction& t, uint64_t id, uint64_t revoked_at_ms) {
  return GuardedUpdate(t, "revoke_link", "link_exists", id, I64(revoked_at_ms));
}

} // namespace fleet::db::postgres
