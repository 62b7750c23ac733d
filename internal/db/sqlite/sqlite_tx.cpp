#include "sqlite_tx.hpp"

#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"

namespace fleet::db::sqlite {

SqliteTransaction::SqliteTransaction(std::shared_ptr<SqliteDB> db) : db_(std::move(db)), lock_(db_->TransactionMutex()) {
  db_->Exec("BEGIN IMMEDIATE;");
}

SqliteTransaction::~SqliteTransaction() {
  if (finished_) return;

  // no throwing from here; a failed rollback leaves sqlite to abort the
  // transaction when the connection is reused
  char* err = nullptr;
  if (sqlite3_exec(db_->Handle(), "ROLLBACK;", nullptr, nullptr, &err) != SQLITE_OK) {
    FLEET_LOG_WARN("sqlite rollback failed", {observability::StringField("error", err ? err : "unknown")});
  }
  sqlite3_free(err);
}

void SqliteTransaction::Commit() {
  if (finished_) throw util::StoreUnavailable("sqlite transaction already finished");
  db_->Exec("COMMIT;");
  committed_ = true;
  Finish();
}

void SqliteTransaction::Rollback() {
  if (finished_) return;
  db_->Exec("ROLLBACK;");
  Finish();
}

void SqliteTransaction::Finish() {
  finished_ = true;
  if (lock_.owns_lock()) lock_.unlock();
}

} // namespace fleet::db::sqlite
