#pragma once

#include <atomic>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "internal/auth/key_registry.hpp"
#include "internal/background/background_pool.hpp"
#include "internal/db/api/repository.hpp"

namespace fleet::ingest {

struct IngestOptions {
  // 0 disables the retention purge.
  uint32_t retention_days     = 0;
  uint32_t purge_interval_sec = 3600;
};

struct BatchRecord {
  std::optional<std::string> doc_key;
  std::string                payload;
};

struct BatchRecordError {
  std::size_t index = 0;
  std::string message;
};

struct BatchResult {
  std::size_t                   stored     = 0;
  std::size_t                   duplicates = 0;
  std::vector<BatchRecordError> errors;
};

struct IngestHealth {
  std::optional<uint64_t> last_received_at_ms;
  uint64_t                stored_messages = 0;
};

/*
  Authenticated, deduplicating message intake.

  Hosted either inside fleet-control or by the standalone fleet-ingest
  listener; both wrap this same class over the same store.

  The doc_key check-and-insert is a single conditional insert, so
  concurrent deliveries of one doc_key store exactly one row no matter
  which process receives them.
*/
class MessageIngestor {
 public:
  MessageIngestor(std::shared_ptr<db::Repository> repository, std::shared_ptr<auth::KeyRegistry> keys,
                  std::shared_ptr<background::BackgroundPool> pool = nullptr, IngestOptions options = {},
                  std::shared_ptr<const runtime::config::RuntimeConfig> config = nullptr);

  // true when stored, false when doc_key was already recorded.
  // AuthenticationFailure before any side effect for a bad key.
  bool Ingest(std::string_view raw_key, const std::optional<std::string>& doc_key, const std::string& payload);

  // Authenticates once, then stores each record as Ingest does. A record
  // that fails is reported by index and does not stop the rest.
  BatchResult IngestBatch(std::string_view raw_key, const std::vector<BatchRecord>& records);

  static constexpr std::size_t kMaxBatchRecords = 1000;

  IngestHealth Health();

  // Deletes messages received before now - retention_days. Returns count.
  uint64_t PurgeExpired(uint64_t now_ms);

 private:
  bool Store(const db::model::CredentialRecord& credential, const std::optional<std::string>& doc_key,
             const std::string& payload);
  void MaybeSchedulePurge(const db::model::CredentialRecord& credential);

  std::shared_ptr<db::Repository>                       repository_;
  std::shared_ptr<auth::KeyRegistry>                    keys_;
  std::shared_ptr<background::BackgroundPool>           pool_;
  IngestOptions                                         options_;
  std::shared_ptr<const runtime::config::RuntimeConfig> config_;

  std::atomic<uint64_t> next_purge_at_ms_{0};
};

} // namespace fleet::ingest
