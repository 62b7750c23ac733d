#include "sqlite_repository.hpp"

#include <sqlite3.h>

#include "internal/util/errors.hpp"

namespace fleet::db::sqlite {

using fleet::db::ErrorCode;
using fleet::db::Result;
using fleet::model::CommandStatus;
using fleet::model::JobStatus;

static void BindText(sqlite3_stmt* st, int idx, const std::string& s) {
    sqlite3_bind_text(st, idx, s.c_str(), -1, SQLITE_TRANSIENT);
}

static void BindBlob(sqlite3_stmt* st, int idx, const std::string& s) {
    sqlite3_bind_blob(st, idx, s.data(), static_cast<int>(s.size()), SQLITE_TRANSIENT);
}

static void BindU64(sqlite3_stmt* st, int idx, uint64_t v) {
    sqlite3_bind_int64(st, idx, static_cast<sqlite3_int64>(v));
}

static void BindI32(sqlite3_stmt* st, int idx, int v) {
    sqlite3_bind_int(st, idx, v);
}

static void BindOptText(sqlite3_stmt* st, int idx, const std::optional<std::string>& s) {
    if (s) BindText(st, idx, *s);
    else sqlite3_bind_null(st, idx);
}

static void BindOptU64(sqlite3_stmt* st, int idx, const std::optional<uint64_t>& v) {
    if (v) BindU64(st, idx, *v);
    else sqlite3_bind_null(st, idx);
}

static std::string ColText(sqlite3_stmt* st, int col) {
    const unsigned char* t = sqlite3_column_text(st, col);
    return t ? reinterpret_cast<const char*>(t) : "";
}

static std::string ColBlob(sqlite3_stmt* st, int col) {
    const void* p = sqlite3_column_blob(st, col);
    int         n = sqlite3_column_bytes(st, col);
    return p ? std::string(static_cast<const char*>(p), static_cast<size_t>(n)) : std::string();
}

static uint64_t ColU64(sqlite3_stmt* st, int col) {
    return static_cast<uint64_t>(sqlite3_column_int64(st, col));
}

static int ColI32(sqlite3_stmt* st, int col) {
    return sqlite3_column_int(st, col);
}

static bool ColIsNull(sqlite3_stmt* st, int col) {
    return sqlite3_column_type(st, col) == SQLITE_NULL;
}

static std::string JoinHosts(const std::vector<std::string>& hosts) {
    std::string out;
    for (size_t i = 0; i < hosts.size(); ++i) {
        if (i) out.push_back('\n');
        out += hosts[i];
    }
    return out;
}

static std::vector<std::string> SplitHosts(const std::string& joined) {
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

// Reads have no Result channel; a failing statement is a store failure.
static sqlite3_stmt* PrepareRead(sqlite3* db, const char* sql) {
    sqlite3_stmt* st = nullptr;
    if (sqlite3_prepare_v2(db, sql, -1, &st, nullptr) != SQLITE_OK) {
        throw util::StoreUnavailable(std::string("sqlite prepare: ") + sqlite3_errmsg(db));
    }
    return st;
}

static int StepRead(sqlite3* db, sqlite3_stmt* st) {
    int rc = sqlite3_step(st);
    if (rc != SQLITE_ROW && rc != SQLITE_DONE) {
        std::string msg = sqlite3_errmsg(db);
        sqlite3_finalize(st);
        throw util::StoreUnavailable("sqlite step: " + msg);
    }
    return rc;
}

// ------------------------------------------------------------------
// Row readers
// ------------------------------------------------------------------

static constexpr const char* kCredentialColumns =
    "id,name,description,prefix,key_hash,default_principal,"
    "created_at_ms,last_used_at_ms,revoked_at_ms";

static model::CredentialRecord ReadCredential(sqlite3_stmt* st) {
    model::CredentialRecord r;
    r.id                = ColU64(st, 0);
    r.name              = ColText(st, 1);
    r.description       = ColText(st, 2);
    r.prefix            = ColText(st, 3);
    r.key_hash          = ColText(st, 4);
    r.default_principal = ColText(st, 5);
    r.created_at_ms     = ColU64(st, 6);
    r.last_used_at_ms   = ColU64(st, 7);
    r.revoked_at_ms     = ColU64(st, 8);
    return r;
}

static constexpr const char* kJobColumns =
    "id,name,action_type,status,recurrence,run_at_ms,target_hosts,payload,creator,"
    "created_at_ms,updated_at_ms,last_run_at_ms";

static model::JobRecord ReadJob(sqlite3_stmt* st) {
    model::JobRecord r;
    r.id             = ColU64(st, 0);
    r.name           = ColText(st, 1);
    r.action_type    = ColText(st, 2);
    r.status         = static_cast<JobStatus>(ColI32(st, 3));
    r.recurrence     = static_cast<fleet::model::Recurrence>(ColI32(st, 4));
    r.run_at_ms      = ColU64(st, 5);
    r.target_hosts   = SplitHosts(ColText(st, 6));
    r.payload        = ColText(st, 7);
    r.creator        = ColText(st, 8);
    r.created_at_ms  = ColU64(st, 9);
    r.updated_at_ms  = ColU64(st, 10);
    r.last_run_at_ms = ColU64(st, 11);
    return r;
}

static constexpr const char* kCommandColumns =
    "id,target_host,action_type,payload,status,source_job_id,detail,"
    "created_at_ms,sent_at_ms,completed_at_ms,updated_at_ms";

static model::CommandRecord ReadCommand(sqlite3_stmt* st) {
    model::CommandRecord r;
    r.id          = ColU64(st, 0);
    r.target_host = ColText(st, 1);
    r.action_type = ColText(st, 2);
    r.payload     = ColText(st, 3);
    r.status      = static_cast<CommandStatus>(ColI32(st, 4));
    if (!ColIsNull(st, 5)) r.source_job_id = ColU64(st, 5);
    r.detail          = ColText(st, 6);
    r.created_at_ms   = ColU64(st, 7);
    r.sent_at_ms      = ColU64(st, 8);
    r.completed_at_ms = ColU64(st, 9);
    r.updated_at_ms   = ColU64(st, 10);
    return r;
}

static constexpr const char* kLinkColumns =
    "id,token,creator,visibility,created_at_ms,expires_at_ms,revoked_at_ms";

static model::DownloadLinkRecord ReadLink(sqlite3_stmt* st) {
    model::DownloadLinkRecord r;
    r.id            = ColU64(st, 0);
    r.token         = ColText(st, 1);
    r.creator       = ColText(st, 2);
    r.visibility    = static_cast<model::LinkVisibility>(ColI32(st, 3));
    r.created_at_ms = ColU64(st, 4);
    if (!ColIsNull(st, 5)) r.expires_at_ms = ColU64(st, 5);
    r.revoked_at_ms = ColU64(st, 6);
    return r;
}

template <typename Record, typename Reader, typename Binder>
static std::optional<Record> QueryOne(sqlite3* db, const std::string& sql, Reader read, Binder bind) {
    sqlite3_stmt* st = PrepareRead(db, sql.c_str());
    bind(st);
    if (StepRead(db, st) != SQLITE_ROW) {
        sqlite3_finalize(st);
        return std::nullopt;
    }
    Record r = read(st);
    sqlite3_finalize(st);
    return r;
}

template <typename Record, typename Reader, typename Binder>
static std::vector<Record> QueryAll(sqlite3* db, const std::string& sql, Reader read, Binder bind) {
    sqlite3_stmt* st = PrepareRead(db, sql.c_str());
    bind(st);
    std::vector<Record> out;
    while (StepRead(db, st) == SQLITE_ROW) {
        out.push_back(read(st));
    }
    sqlite3_finalize(st);
    return out;
}

static void NoBind(sqlite3_stmt*) {
}

static Result Translate(sqlite3* db, int rc) {
    if (rc == SQLITE_OK || rc == SQLITE_DONE || rc == SQLITE_ROW)
        return Result::Ok();

    switch (rc & 0xff) {
        case SQLITE_BUSY:
        case SQLITE_LOCKED:
            return Result::Err(ErrorCode::Busy, sqlite3_errmsg(db));
        case SQLITE_CONSTRAINT:
            return Result::Err(ErrorCode::ConstraintViolation, sqlite3_errmsg(db));
        case SQLITE_IOERR:
            return Result::Err(ErrorCode::IOError, sqlite3_errmsg(db));
        case SQLITE_CORRUPT:
            return Result::Err(ErrorCode::Corruption, sqlite3_errmsg(db));
        default:
            return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));
    }
}

// ------------------------------------------------------------------

SqliteRepository::SqliteRepository(std::shared_ptr<SqliteDB> db)
    : db_(std::move(db)) {}

std::unique_ptr<db::Transaction> SqliteRepository::Begin() {
    return std::make_unique<SqliteTransaction>(db_);
}

SqliteTransaction& SqliteRepository::TX(Transaction& t) {
    return static_cast<SqliteTransaction&>(t);
}

Result SqliteRepository::MissOrConflict(sqlite3* db, const char* exists_sql, uint64_t id) {
    sqlite3_stmt* st = nullptr;
    if (sqlite3_prepare_v2(db, exists_sql, -1, &st, nullptr) != SQLITE_OK)
        return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));
    BindU64(st, 1, id);
    int rc = sqlite3_step(st);
    sqlite3_finalize(st);
    if (rc == SQLITE_ROW) return Result::Err(ErrorCode::Conflict, "row not in expected state");
    if (rc == SQLITE_DONE) return Result::Err(ErrorCode::NotFound);
    return Translate(db, rc);
}

// Steps a prepared write and finalizes it. On success *changes holds the
// number of touched rows.
static Result StepWrite(sqlite3* db, sqlite3_stmt* st, int* changes = nullptr) {
    int rc = sqlite3_step(st);
    if (rc != SQLITE_DONE) {
        auto res = Translate(db, rc);
        sqlite3_finalize(st);
        return res;
    }
    sqlite3_finalize(st);
    if (changes) *changes = sqlite3_changes(db);
    return Result::Ok();
}

static sqlite3_stmt* PrepareWrite(sqlite3* db, const char* sql) {
    sqlite3_stmt* st = nullptr;
    if (sqlite3_prepare_v2(db, sql, -1, &st, nullptr) != SQLITE_OK) return nullptr;
    return st;
}

// ------------------------------------------------------------------
// Credentials
// ------------------------------------------------------------------

Result SqliteRepository::InsertCredential(Transaction& t, model::CredentialRecord& r) {
    auto* db = TX(t).Handle();

    const char* sql =
        "INSERT INTO credentials(name,description,prefix,key_hash,default_principal,"
        "created_at_ms,last_used_at_ms,revoked_at_ms) VALUES(?,?,?,?,?,?,?,?);";

    sqlite3_stmt* st = PrepareWrite(db, sql);
    if (!st) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

    BindText(st, 1, r.name);
    BindText(st, 2, r.description);
    BindText(st, 3, r.prefix);
    BindText(st, 4, r.key_hash);
    BindText(st, 5, r.default_principal);
    BindU64(st, 6, r.created_at_ms);
    BindU64(st, 7, r.last_used_at_ms);
    BindU64(st, 8, r.revoked_at_ms);

    auto res = StepWrite(db, st);
    if (res.code == ErrorCode::ConstraintViolation) return Result::Err(ErrorCode::AlreadyExists, res.message);
    if (!res) return res;

    r.id = static_cast<uint64_t>(sqlite3_last_insert_rowid(db));
    return Result::Ok();
}

std::optional<model::CredentialRecord> SqliteRepository::GetCredential(Transaction& t, uint64_t id) {
    return QueryOne<model::CredentialRecord>(
        TX(t).Handle(), std::string("SELECT ") + kCredentialColumns + " FROM credentials WHERE id=?;",
        ReadCredential, [&](sqlite3_stmt* st) { BindU64(st, 1, id); });
}

std::optional<model::CredentialRecord> SqliteRepository::GetCredentialByPrefix(Transaction& t, const std::string& prefix) {
    return QueryOne<model::CredentialRecord>(
        TX(t).Handle(), std::string("SELECT ") + kCredentialColumns + " FROM credentials WHERE prefix=?;",
        ReadCredential, [&](sqlite3_stmt* st) { BindText(st, 1, prefix); });
}

std::vector<model::CredentialRecord> SqliteRepository::ListCredentials(Transaction& t) {
    return QueryAll<model::CredentialRecord>(
        TX(t).Handle(), std::string("SELECT ") + kCredentialColumns + " FROM credentials ORDER BY id;",
        ReadCredential, NoBind);
}

Result SqliteRepository::ReplaceCredentialSecret(Transaction& t, uint64_t id, const std::string& prefix, const std::string& key_hash) {
    auto* db = TX(t).Handle();

    sqlite3_stmt* st = PrepareWrite(db, "UPDATE credentials SET prefix=?,key_hash=?,revoked_at_ms=0 WHERE id=?;");
    if (!st) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

    BindText(st, 1, prefix);
    BindText(st, 2, key_hash);
    BindU64(st, 3, id);

    int  changes = 0;
    auto res     = StepWrite(db, st, &changes);
    if (res.code == ErrorCode::ConstraintViolation) return Result::Err(ErrorCode::AlreadyExists, res.message);
    if (!res) return res;
    if (changes == 0) return Result::Err(ErrorCode::NotFound);
    return Result::Ok();
}

Result SqliteRepository::RevokeCredential(Transaction& t, uint64_t id, uint64_t revoked_at_ms) {
    auto* db = TX(t).Handle();

    sqlite3_stmt* st = PrepareWrite(db, "UPDATE credentials SET revoked_at_ms=? WHERE id=? AND revoked_at_ms=0;");
    if (!st) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

    BindU64(st, 1, revoked_at_ms);
    BindU64(st, 2, id);

    int  changes = 0;
    auto res     = StepWrite(db, st, &changes);
    if (!res) return res;
    if (changes == 0) return MissOrConflict(db, "SELECT 1 FROM credentials WHERE id=?;", id);
    return Result::Ok();
}

Result SqliteRepository::TouchCredential(Transaction& t, uint64_t id, uint64_t used_at_ms) {
    auto* db = TX(t).Handle();

    sqlite3_stmt* st = PrepareWrite(db, "UPDATE credentials SET last_used_at_ms=? WHERE id=?;");
    if (!st) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

    BindU64(st, 1, used_at_ms);
    BindU64(st, 2, id);

    int  changes = 0;
    auto res     = StepWrite(db, st, &changes);
    if (!res) return res;
    if (changes == 0) return Result::Err(ErrorCode::NotFound);
    return Result::Ok();
}

// ------------------------------------------------------------------
// Messages
// ------------------------------------------------------------------

Result SqliteRepository::InsertMessage(Transaction& t, model::MessageRecord& r) {
    auto* db = TX(t).Handle();

    // NULL doc_keys never collide under the UNIQUE index
    const char* sql =
        "INSERT INTO messages(doc_key,payload,received_at_ms,credential_id) VALUES(?,?,?,?) "
        "ON CONFLICT(doc_key) DO NOTHING;";

    sqlite3_stmt* st = PrepareWrite(db, sql);
    if (!st) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

    BindOptText(st, 1, r.doc_key);
    BindBlob(st, 2, r.payload);
    BindU64(st, 3, r.received_at_ms);
    BindU64(st, 4, r.credential_id);

    int  changes = 0;
    auto res     = StepWrite(db, st, &changes);
    if (!res) return res;
    if (changes == 0) return Result::Err(ErrorCode::AlreadyExists, "duplicate doc_key");

    r.id = static_cast<uint64_t>(sqlite3_last_insert_rowid(db));
    return Result::Ok();
}

std::optional<uint64_t> SqliteRepository::LatestMessageReceivedAt(Transaction& t) {
    auto* db = TX(t).Handle();
    sqlite3_stmt* st = PrepareRead(db, "SELECT MAX(received_at_ms) FROM messages;");
    std::optional<uint64_t> out;
    if (StepRead(db, st) == SQLITE_ROW && !ColIsNull(st, 0)) out = ColU64(st, 0);
    sqlite3_finalize(st);
    return out;
}

uint64_t SqliteRepository::CountMessages(Transaction& t) {
    auto* db = TX(t).Handle();
    sqlite3_stmt* st = PrepareRead(db, "SELECT COUNT(*) FROM messages;");
    uint64_t out = 0;
    if (StepRead(db, st) == SQLITE_ROW) out = ColU64(st, 0);
    sqlite3_finalize(st);
    return out;
}

Result SqliteRepository::DeleteMessagesOlderThan(Transaction& t, uint64_t received_before_ms, uint64_t* deleted) {
    auto* db = TX(t).Handle();

    sqlite3_stmt* st = PrepareWrite(db, "DELETE FROM messages WHERE received_at_ms<?;");
    if (!st) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

    BindU64(st, 1, received_before_ms);

    int  changes = 0;
    auto res     = StepWrite(db, st, &changes);
    if (!res) return res;
    if (deleted) *deleted = static_cast<uint64_t>(changes);
    return Result::Ok();
}

// ------------------------------------------------------------------
// Jobs
// ------------------------------------------------------------------

Result SqliteRepository::InsertJob(Transaction& t, model::JobRecord& r) {
    auto* db = TX(t).Handle();

    const char* sql =
        "INSERT INTO jobs(name,action_type,status,recurrence,run_at_ms,target_hosts,payload,creator,"
        "created_at_ms,updated_at_ms,last_run_at_ms) VALUES(?,?,?,?,?,?,?,?,?,?,?);";

    sqlite3_stmt* st = PrepareWrite(db, sql);
    if (!st) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

    BindText(st, 1, r.name);
    BindText(st, 2, r.action_type);
    BindI32(st, 3, static_cast<int>(r.status));
    BindI32(st, 4, static_cast<int>(r.recurrence));
    BindU64(st, 5, r.run_at_ms);
    BindText(st, 6, JoinHosts(r.target_hosts));
    BindText(st, 7, r.payload);
    BindText(st, 8, r.creator);
    BindU64(st, 9, r.created_at_ms);
    BindU64(st, 10, r.updated_at_ms);
    BindU64(st, 11, r.last_run_at_ms);

    auto res = StepWrite(db, st);
    if (!res) return res;

    r.id = static_cast<uint64_t>(sqlite3_last_insert_rowid(db));
    return Result::Ok();
}

std::optional<model::JobRecord> SqliteRepository::GetJob(Transaction& t, uint64_t id) {
    return QueryOne<model::JobRecord>(
        TX(t).Handle(), std::string("SELECT ") + kJobColumns + " FROM jobs WHERE id=?;",
        ReadJob, [&](sqlite3_stmt* st) { BindU64(st, 1, id); });
}

std::vector<model::JobRecord> SqliteRepository::ListJobs(Transaction& t) {
    return QueryAll<model::JobRecord>(
        TX(t).Handle(), std::string("SELECT ") + kJobColumns + " FROM jobs ORDER BY id;", ReadJob, NoBind);
}

std::vector<model::JobRecord> SqliteRepository::ListDueJobs(Transaction& t, uint64_t now_ms) {
    return QueryAll<model::JobRecord>(
        TX(t).Handle(),
        std::string("SELECT ") + kJobColumns + " FROM jobs WHERE status=? AND run_at_ms<=? ORDER BY run_at_ms, id;",
        ReadJob, [&](sqlite3_stmt* st) {
            BindI32(st, 1, static_cast<int>(JobStatus::kScheduled));
            BindU64(st, 2, now_ms);
        });
}

Result SqliteRepository::TransitionJob(Transaction& t, uint64_t id, JobStatus from, JobStatus to, uint64_t updated_at_ms) {
    auto* db = TX(t).Handle();

    sqlite3_stmt* st = PrepareWrite(db, "UPDATE jobs SET status=?,updated_at_ms=? WHERE id=? AND status=?;");
    if (!st) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

    BindI32(st, 1, static_cast<int>(to));
    BindU64(st, 2, updated_at_ms);
    BindU64(st, 3, id);
    BindI32(st, 4, static_cast<int>(from));

    int  changes = 0;
    auto res     = StepWrite(db, st, &changes);
    if (!res) return res;
    if (changes == 0) return MissOrConflict(db, "SELECT 1 FROM jobs WHERE id=?;", id);
    return Result::Ok();
}

Result SqliteRepository::UpdateJob(Transaction& t, JobStatus expected, const model::JobRecord& r) {
    auto* db = TX(t).Handle();

    sqlite3_stmt* st =
        PrepareWrite(db, "UPDATE jobs SET status=?,run_at_ms=?,last_run_at_ms=?,updated_at_ms=? WHERE id=? AND status=?;");
    if (!st) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

    BindI32(st, 1, static_cast<int>(r.status));
    BindU64(st, 2, r.run_at_ms);
    BindU64(st, 3, r.last_run_at_ms);
    BindU64(st, 4, r.updated_at_ms);
    BindU64(st, 5, r.id);
    BindI32(st, 6, static_cast<int>(expected));

    int  changes = 0;
    auto res     = StepWrite(db, st, &changes);
    if (!res) return res;
    if (changes == 0) return MissOrConflict(db, "SELECT 1 FROM jobs WHERE id=?;", r.id);
    return Result::Ok();
}

Result SqliteRepository::DeleteJob(Transaction& t, uint64_t id) {
    auto* db = TX(t).Handle();

    sqlite3_stmt* st = PrepareWrite(db, "DELETE FROM jobs WHERE id=?;");
    if (!st) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

    BindU64(st, 1, id);

    int  changes = 0;
    auto res     = StepWrite(db, st, &changes);
    if (!res) return res;
    if (changes == 0) return Result::Err(ErrorCode::NotFound);
    return Result::Ok();
}

// ------------------------------------------------------------------
// Commands
// ------------------------------------------------------------------

Result SqliteRepository::InsertCommand(Transaction& t, model::CommandRecord& r) {
    auto* db = TX(t).Handle();

    const char* sql =
        "INSERT INTO commands(target_host,action_type,payload,status,source_job_id,detail,"
        "created_at_ms,sent_at_ms,completed_at_ms,updated_at_ms) VALUES(?,?,?,?,?,?,?,?,?,?);";

    sqlite3_stmt* st = PrepareWrite(db, sql);
    if (!st) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

    BindText(st, 1, r.target_host);
    BindText(st, 2, r.action_type);
    BindText(st, 3, r.payload);
    BindI32(st, 4, static_cast<int>(r.status));
    BindOptU64(st, 5, r.source_job_id);
    BindText(st, 6, r.detail);
    BindU64(st, 7, r.created_at_ms);
    BindU64(st, 8, r.sent_at_ms);
    BindU64(st, 9, r.completed_at_ms);
    BindU64(st, 10, r.updated_at_ms);

    auto res = StepWrite(db, st);
    if (!res) return res;

    r.id = static_cast<uint64_t>(sqlite3_last_insert_rowid(db));
    return Result::Ok();
}

std::optional<model::CommandRecord> SqliteRepository::GetCommand(Transaction& t, uint64_t id) {
    return QueryOne<model::CommandRecord>(
        TX(t).Handle(), std::string("SELECT ") + kCommandColumns + " FROM commands WHERE id=?;",
        ReadCommand, [&](sqlite3_stmt* st) { BindU64(st, 1, id); });
}

Result SqliteRepository::UpdateCommandIf(Transaction& t, CommandStatus expected, const model::CommandRecord& r) {
    auto* db = TX(t).Handle();

    const char* sql =
        "UPDATE commands SET status=?,detail=?,sent_at_ms=?,completed_at_ms=?,updated_at_ms=? "
        "WHERE id=? AND status=?;";

    sqlite3_stmt* st = PrepareWrite(db, sql);
    if (!st) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

    BindI32(st, 1, static_cast<int>(r.status));
    BindText(st, 2, r.detail);
    BindU64(st, 3, r.sent_at_ms);
    BindU64(st, 4, r.completed_at_ms);
    BindU64(st, 5, r.updated_at_ms);
    BindU64(st, 6, r.id);
    BindI32(st, 7, static_cast<int>(expected));

    int  changes = 0;
    auto res     = StepWrite(db, st, &changes);
    if (!res) return res;
    if (changes == 0) return MissOrConflict(db, "SELECT 1 FROM commands WHERE id=?;", r.id);
    return Result::Ok();
}

std::vector<model::CommandRecord> SqliteRepository::ListCommandsByJob(Transaction& t, uint64_t job_id) {
    return QueryAll<model::CommandRecord>(
        TX(t).Handle(), std::string("SELECT ") + kCommandColumns + " FROM commands WHERE source_job_id=? ORDER BY id;",
        ReadCommand, [&](sqlite3_stmt* st) { BindU64(st, 1, job_id); });
}

std::vector<model::CommandRecord> SqliteRepository::ListCommandsForHost(Transaction& t, const std::string& host) {
    return QueryAll<model::CommandRecord>(
        TX(t).Handle(), std::string("SELECT ") + kCommandColumns + " FROM commands WHERE target_host=? ORDER BY id;",
        ReadCommand, [&](sqlite3_stmt* st) { BindText(st, 1, host); });
}

std::vector<model::CommandRecord> SqliteRepository::ListStaleCommands(Transaction& t, uint64_t created_before_ms) {
    return QueryAll<model::CommandRecord>(
        TX(t).Handle(),
        std::string("SELECT ") + kCommandColumns + " FROM commands WHERE status IN (?,?) AND created_at_ms<? ORDER BY id;",
        ReadCommand, [&](sqlite3_stmt* st) {
            BindI32(st, 1, static_cast<int>(CommandStatus::kPending));
            BindI32(st, 2, static_cast<int>(CommandStatus::kSent));
            BindU64(st, 3, created_before_ms);
        });
}

// ------------------------------------------------------------------
// Download links
// ------------------------------------------------------------------

Result SqliteRepository::InsertDownloadLink(Transaction& t, model::DownloadLinkRecord& r) {
    auto* db = TX(t).Handle();

    const char* sql =
        "INSERT INTO download_links(token,creator,visibility,created_at_ms,expires_at_ms,revoked_at_ms) "
        "VALUES(?,?,?,?,?,?);";

    sqlite3_stmt* st = PrepareWrite(db, sql);
    if (!st) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

    BindText(st, 1, r.token);
    BindText(st, 2, r.creator);
    BindI32(st, 3, static_cast<int>(r.visibility));
    BindU64(st, 4, r.created_at_ms);
    BindOptU64(st, 5, r.expires_at_ms);
    BindU64(st, 6, r.revoked_at_ms);

    auto res = StepWrite(db, st);
    if (res.code == ErrorCode::ConstraintViolation) return Result::Err(ErrorCode::AlreadyExists, res.message);
    if (!res) return res;

    r.id = static_cast<uint64_t>(sqlite3_last_insert_rowid(db));
    return Result::Ok();
}

std::optional<model::DownloadLinkRecord> SqliteRepository::GetDownloadLink(Transaction& t, uint64_t id) {
    return QueryOne<model::DownloadLinkRecord>(
        TX(t).Handle(), std::string("SELECT ") + kLinkColumns + " FROM download_links WHERE id=?;",
        ReadLink, [&](sqlite3_stmt* st) { BindU64(st, 1, id); });
}

std::optional<model::DownloadLinkRecord> SqliteRepository::GetDownloadLinkByToken(Transaction& t, const std::string& token) {
    return QueryOne<model::DownloadLinkRecord>(
        TX(t).Handle(), std::string("SELECT ") + kLinkColumns + " FROM download_links WHERE token=?;",
        ReadLink, [&](sqlite3_stmt* st) { BindText(st, 1, token); });
}

Result SqliteRepository::RevokeDownloadLink(Transaction& t, uint64_t id, uint64_t revoked_at_ms) {
    auto* db = TX(t).Handle();

    sqlite3_stmt* st = PrepareWrite(db, "UPDATE download_links SET revoked_at_ms=? WHERE id=? AND revoked_at_ms=0;");
    if (!st) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

    BindU64(st, 1, revoked_at_ms);
    BindU64(st, 2, id);

    int  changes = 0;
    auto res     = StepWrite(db, st, &changes);
    if (!res) return res;
    if (changes == 0) return MissOrConflict(db, "SELECT 1 FROM download_links WHERE id=?;", id);
    return Result::Ok();
}

} // namespace fleet::db::sqlite
