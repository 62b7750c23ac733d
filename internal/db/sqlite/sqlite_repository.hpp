#pragma once

#include <memory>

#include "internal/db/api/repository.hpp"
#include "sqlite_db.hpp"
#include "sqlite_tx.hpp"

namespace fleet::db::sqlite {

class SqliteRepository final : public db::Repository {
public:
  explicit SqliteRepository(std::shared_ptr<SqliteDB> db);

  std::unique_ptr<Transaction> Begin() override;

  Result InsertCredential(Transaction&, model::CredentialRecord&) override;
  std::optional<model::CredentialRecord> GetCredential(Transaction&, uint64_t id) override;
  std::optional<model::CredentialRecord> GetCredentialByPrefix(Transaction&, const std::string& prefix) override;
  std::vector<model::CredentialRecord> ListCredentials(Transaction&) override;
  Result ReplaceCredentialSecret(Transaction&, uint64_t id, const std::string& prefix, const std::string& key_hash) override;
  Result RevokeCredential(Transaction&, uint64_t id, uint64_t revoked_at_ms) override;
  Result TouchCredential(Transaction&, uint64_t id, uint64_t used_at_ms) override;

  Result InsertMessage(Transaction&, model::MessageRecord&) override;
  std::optional<uint64_t> LatestMessageReceivedAt(Transaction&) override;
  uint64_t CountMessages(Transaction&) override;
  Result DeleteMessagesOlderThan(Transaction&, uint64_t received_before_ms, uint64_t* deleted) override;

  Result InsertJob(Transaction&, model::JobRecord&) override;
  std::optional<model::JobRecord> GetJob(Transaction&, uint64_t id) override;
  std::vector<model::JobRecord> ListJobs(Transaction&) override;
  std::vector<model::JobRecord> ListDueJobs(Transaction&, uint64_t now_ms) override;
  Result TransitionJob(Transaction&, uint64_t id, fleet::model::JobStatus from, fleet::model::JobStatus to, uint64_t updated_at_ms) override;
  Result UpdateJob(Transaction&, fleet::model::JobStatus expected, const model::JobRecord&) override;
  Result DeleteJob(Transaction&, uint64_t id) override;

  Result InsertCommand(Transaction&, model::CommandRecord&) override;
  std::optional<model::CommandRecord> GetCommand(Transaction&, uint64_t id) override;
  Result UpdateCommandIf(Transaction&, fleet::model::CommandStatus expected, const model::CommandRecord& updated) override;
  std::vector<model::CommandRecord> ListCommandsByJob(Transaction&, uint64_t job_id) override;
  std::vector<model::CommandRecord> ListCommandsForHost(Transaction&, const std::string& host) override;
  std::vector<model::CommandRecord> ListStaleCommands(Transaction&, uint64_t created_before_ms) override;

  Result InsertDownloadLink(Transaction&, model::DownloadLinkRecord&) override;
  std::optional<model::DownloadLinkRecord> GetDownloadLink(Transaction&, uint64_t id) override;
  std::optional<model::DownloadLinkRecord> GetDownloadLinkByToken(Transaction&, const std::string& token) override;
  Result RevokeDownloadLink(Transaction&, uint64_t id, uint64_t revoked_at_ms) override;

private:
  static SqliteTransaction& TX(Transaction&);

  // Distinguishes NotFound from Conflict after a guarded UPDATE matched nothing.
  Result MissOrConflict(sqlite3* db, const char* exists_sql, uint64_t id);

  std::shared_ptr<SqliteDB> db_;
};

} // namespace fleet::db::sqlite
