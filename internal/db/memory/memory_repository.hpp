#pragma once

#include <map>
#include <mutex>
#include <unordered_set>

#include "internal/db/api/repository.hpp"

namespace fleet::db::memory {

class MemoryTransaction;

class MemoryRepository : public db::Repository {
public:
  MemoryRepository();

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
  friend class MemoryTransaction;

  // Ordered by id so listings come back in insertion order.
  struct State {
    std::map<uint64_t, model::CredentialRecord>   credentials;
    std::map<uint64_t, model::MessageRecord>      messages;
    std::unordered_set<std::string>               doc_keys;
    std::map<uint64_t, model::JobRecord>          jobs;
    std::map<uint64_t, model::CommandRecord>      commands;
    std::map<uint64_t, model::DownloadLinkRecord> links;

    uint64_t next_credential_id = 1;
    uint64_t next_message_id    = 1;
    uint64_t next_job_id        = 1;
    uint64_t next_command_id    = 1;
    uint64_t next_link_id       = 1;
  };

  std::mutex mutex_;
  State      committed_;
};

} // namespace fleet::db::memory
