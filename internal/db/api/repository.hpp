#pragma once

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "internal/db/api/result.hpp"
#include "internal/db/api/transaction.hpp"
#include "internal/db/model/command_record.hpp"
#include "internal/db/model/credential_record.hpp"
#include "internal/db/model/download_link_record.hpp"
#include "internal/db/model/job_record.hpp"
#include "internal/db/model/message_record.hpp"

namespace fleet::db {

/*
  Repository abstraction.

  CRITICAL GUARANTEES:

  - All writes require a Transaction
  - Reads inside a transaction see its writes
  - Conditional updates (Claim*, Transition*, Revoke*) are atomic
    check-and-set: they return Conflict when the row is no longer in
    the expected state and leave it untouched
  - Insert* assigns the record id

  The DB is the source of truth for:
    credentials
    ingested messages
    jobs and their commands
    download links
*/

class Repository {
 public:
  virtual ~Repository() = default;

  // ---------------------------------------------------------------------
  // Transactions
  // ---------------------------------------------------------------------

  virtual std::unique_ptr<Transaction> Begin() = 0;

  // ---------------------------------------------------------------------
  // Credentials
  // ---------------------------------------------------------------------

  virtual Result InsertCredential(Transaction&, model::CredentialRecord&) = 0;

  virtual std::optional<model::CredentialRecord> GetCredential(Transaction&, uint64_t id) = 0;

  virtual std::optional<model::CredentialRecord> GetCredentialByPrefix(Transaction&, const std::string& prefix) = 0;

  virtual std::vector<model::CredentialRecord> ListCredentials(Transaction&) = 0;

  // Replaces prefix and hash and clears revocation (rotation).
  virtual Result ReplaceCredentialSecret(Transaction&, uint64_t id, const std::string& prefix, const std::string& key_hash) = 0;

  // Sets revoked_at only while it is still unset.
  virtual Result RevokeCredential(Transaction&, uint64_t id, uint64_t revoked_at_ms) = 0;

  virtual Result TouchCredential(Transaction&, uint64_t id, uint64_t used_at_ms) = 0;

  // ---------------------------------------------------------------------
  // Ingested messages
  // ---------------------------------------------------------------------

  // AlreadyExists when doc_key is set and already stored.
  virtual Result InsertMessage(Transaction&, model::MessageRecord&) = 0;

  virtual std::optional<uint64_t> LatestMessageReceivedAt(Transaction&) = 0;

  virtual uint64_t CountMessages(Transaction&) = 0;

  virtual Result DeleteMessagesOlderThan(Transaction&, uint64_t received_before_ms, uint64_t* deleted) = 0;

  // ---------------------------------------------------------------------
  // Jobs
  // ---------------------------------------------------------------------

  virtual Result InsertJob(Transaction&, model::JobRecord&) = 0;

  virtual std::optional<model::JobRecord> GetJob(Transaction&, uint64_t id) = 0;

  virtual std::vector<model::JobRecord> ListJobs(Transaction&) = 0;

  // status=scheduled AND run_at <= now, ordered by run_at ascending.
  virtual std::vector<model::JobRecord> ListDueJobs(Transaction&, uint64_t now_ms) = 0;

  // Moves status from `from` to `to`; Conflict when the row is not in `from`.
  virtual Result TransitionJob(Transaction&, uint64_t id, fleet::model::JobStatus from, fleet::model::JobStatus to, uint64_t updated_at_ms) = 0;

  // Overwrites mutable fields (status, run_at, last_run_at, updated_at)
  // when the stored status equals `expected`; Conflict otherwise.
  virtual Result UpdateJob(Transaction&, fleet::model::JobStatus expected, const model::JobRecord&) = 0;

  virtual Result DeleteJob(Transaction&, uint64_t id) = 0;

  // ---------------------------------------------------------------------
  // Remote commands
  // ---------------------------------------------------------------------

  virtual Result InsertCommand(Transaction&, model::CommandRecord&) = 0;

  virtual std::optional<model::CommandRecord> GetCommand(Transaction&, uint64_t id) = 0;

  // Writes status/detail/timestamps from `updated` when the stored status
  // equals `expected`; Conflict otherwise.
  virtual Result UpdateCommandIf(Transaction&, fleet::model::CommandStatus expected, const model::CommandRecord& updated) = 0;

  virtual std::vector<model::CommandRecord> ListCommandsByJob(Transaction&, uint64_t job_id) = 0;

  virtual std::vector<model::CommandRecord> ListCommandsForHost(Transaction&, const std::string& host) = 0;

  // Non-terminal commands created before the cutoff.
  virtual std::vector<model::CommandRecord> ListStaleCommands(Transaction&, uint64_t created_before_ms) = 0;

  // ---------------------------------------------------------------------
  // Download links
  // ---------------------------------------------------------------------

  virtual Result InsertDownloadLink(Transaction&, model::DownloadLinkRecord&) = 0;

  virtual std::optional<model::DownloadLinkRecord> GetDownloadLink(Transaction&, uint64_t id) = 0;

  virtual std::optional<model::DownloadLinkRecord> GetDownloadLinkByToken(Transaction&, const std::string& token) = 0;

  virtual Result RevokeDownloadLink(Transaction&, uint64_t id, uint64_t revoked_at_ms) = 0;
};

} // namespace fleet::db
