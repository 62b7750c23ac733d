#include "internal/ingest/message_ingestor.hpp"

#include "internal/db/api/db_error.hpp"
#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"

namespace fleet::ingest {

using observability::StringField;
using observability::UintField;

namespace {

constexpr uint64_t kMsPerDay = 24ull * 60 * 60 * 1000;

uint64_t PurgeOlderThanRetention(db::Repository& repository, uint32_t retention_days, uint64_t now_ms) {
  if (retention_days == 0) return 0;

  const uint64_t window = static_cast<uint64_t>(retention_days) * kMsPerDay;
  if (now_ms <= window) return 0;

  uint64_t deleted = 0;
  auto     tx      = repository.Begin();
  db::ThrowIfDbError(repository.DeleteMessagesOlderThan(*tx, now_ms - window, &deleted), "purge messages");
  tx->Commit();

  if (deleted > 0) {
    FLEET_LOG_INFO("expired messages purged", {UintField("deleted", deleted), UintField("retention_days", retention_days)});
  }
  return deleted;
}

} // namespace

MessageIngestor::MessageIngestor(std::shared_ptr<db::Repository> repository, std::shared_ptr<auth::KeyRegistry> keys,
                                 std::shared_ptr<background::BackgroundPool> pool, IngestOptions options,
                                 std::shared_ptr<const runtime::config::RuntimeConfig> config)
    : repository_(std::move(repository)),
      keys_(std::move(keys)),
      pool_(std::move(pool)),
      options_(options),
      config_(std::move(config)) {
  if (!repository_ || !keys_) {
    throw std::invalid_argument("MessageIngestor requires repository and key registry");
  }
}

bool MessageIngestor::Ingest(std::string_view raw_key, const std::optional<std::string>& doc_key, const std::string& payload) {
  // Authenticate also records last_used_at, so duplicates still count as
  // agent liveness.
  const auto credential = keys_->Authenticate(raw_key);

  const bool stored = Store(credential, doc_key, payload);
  if (stored) MaybeSchedulePurge(credential);
  return stored;
}

BatchResult MessageIngestor::IngestBatch(std::string_view raw_key, const std::vector<BatchRecord>& records) {
  const auto credential = keys_->Authenticate(raw_key);

  if (records.empty()) {
    throw util::InvalidArgument("batch must contain at least one record");
  }
  if (records.size() > kMaxBatchRecords) {
    throw util::InvalidArgument("batch exceeds " + std::to_string(kMaxBatchRecords) + " records");
  }

  BatchResult result;
  for (std::size_t i = 0; i < records.size(); ++i) {
    try {
      if (Store(credential, records[i].doc_key, records[i].payload)) {
        ++result.stored;
      } else {
        ++result.duplicates;
      }
    } catch (const std::exception& e) {
      FLEET_LOG_WARN("batch record rejected", {UintField("index", i), UintField("credential_id", credential.id),
                                               StringField("error", e.what())});
      result.errors.push_back(BatchRecordError{i, e.what()});
    }
  }

  if (result.stored > 0) MaybeSchedulePurge(credential);
  FLEET_LOG_INFO("message batch ingested", {UintField("records", records.size()), UintField("stored", result.stored),
                                            UintField("duplicates", result.duplicates),
                                            UintField("errors", result.errors.size())});
  return result;
}

bool MessageIngestor::Store(const db::model::CredentialRecord& credential, const std::optional<std::string>& doc_key,
                            const std::string& payload) {
  if (payload.empty()) {
    throw util::InvalidArgument("payload must not be empty");
  }

  db::model::MessageRecord record;
  if (doc_key && !doc_key->empty()) record.doc_key = doc_key;
  record.payload        = payload;
  record.received_at_ms = util::NowMs();
  record.credential_id  = credential.id;

  auto tx  = repository_->Begin();
  auto res = repository_->InsertMessage(*tx, record);
  if (res.code == db::ErrorCode::AlreadyExists) {
    FLEET_LOG_DEBUG("duplicate message suppressed",
                    {StringField("doc_key", *record.doc_key), UintField("credential_id", credential.id)});
    return false;
  }
  db::ThrowIfDbError(res, "insert message");
  tx->Commit();
  return true;
}

IngestHealth MessageIngestor::Health() {
  auto         tx = repository_->Begin();
  IngestHealth health;
  health.last_received_at_ms = repository_->LatestMessageReceivedAt(*tx);
  health.stored_messages     = repository_->CountMessages(*tx);
  return health;
}

uint64_t MessageIngestor::PurgeExpired(uint64_t now_ms) {
  return PurgeOlderThanRetention(*repository_, options_.retention_days, now_ms);
}

void MessageIngestor::MaybeSchedulePurge(const db::model::CredentialRecord& credential) {
  if (!pool_ || options_.retention_days == 0) return;
  const auto& principal = credential.default_principal.empty() ? credential.name : credential.default_principal;

  const uint64_t now  = util::NowMs();
  uint64_t       next = next_purge_at_ms_.load();
  if (now < next) return;

  // one submitter per interval
  const uint64_t following = now + static_cast<uint64_t>(options_.purge_interval_sec) * 1000;
  if (!next_purge_at_ms_.compare_exchange_strong(next, following)) return;

  pool_->Submit("ingest retention purge", background::TaskContext{config_, principal},
                [repository = repository_, retention_days = options_.retention_days](const background::TaskContext&) {
                  PurgeOlderThanRetention(*repository, retention_days, util::NowMs());
                });
}

} // namespace fleet::ingest
