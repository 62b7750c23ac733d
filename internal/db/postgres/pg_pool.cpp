#include "pg_pool.hpp"

namespace fleet::db::postgres {

PgPool::PgPool(std::string conninfo, std::size_t max_connections)
    : conninfo_(std::move(conninfo)),
      max_connections_(max_connections == 0 ? 1 : max_connections) {
}

std::shared_ptr<pqxx::connection> PgPool::Acquire() {
  for (;;) {
    {
      std::unique_lock lock(mutex_);

      if (!idle_.empty()) {
        auto conn = std::move(idle_.back());
        idle_.pop_back();
        return Wrap(conn.release());
      }

      if (live_connections_ < max_connections_) {
        ++live_connections_;
        lock.unlock();

        try {
          auto conn = std::make_unique<pqxx::connection>(conninfo_);
          PrepareStatements(*conn);
          return Wrap(conn.release());
        } catch (const std::exception&) {
          std::lock_guard rollback_lock(mutex_);
          --live_connections_;
          cv_.notify_one();
          throw;
        }
      }

      cv_.wait(lock, [this] {
        return !idle_.empty() || live_connections_ < max_connections_;
      });
    }
  }
}

void PgPool::PrepareStatements(pqxx::connection& conn) {
  static constexpr const char* kCredentialColumns =
      "id,name,description,prefix,key_hash,default_principal,created_at_ms,last_used_at_ms,revoked_at_ms";
  static constexpr const char* kJobColumns =
      "id,name,action_type,status,recurrence,run_at_ms,target_hosts,payload,creator,"
      "created_at_ms,updated_at_ms,last_run_at_ms";
  static constexpr const char* kCommandColumns =
      "id,target_host,action_type,payload,status,source_job_id,detail,"
      "created_at_ms,sent_at_ms,completed_at_ms,updated_at_ms";
  static constexpr const char* kLinkColumns =
      "id,token,creator,visibility,created_at_ms,expires_at_ms,revoked_at_ms";

  const std::string credential_cols(kCredentialColumns);
  const std::string job_cols(kJobColumns);
  const std::string command_cols(kCommandColumns);
  const std::string link_cols(kLinkColumns);

  // credentials
  conn.prepare("insert_credential",
               "INSERT INTO credentials(name,description,prefix,key_hash,default_principal,"
               "created_at_ms,last_used_at_ms,revoked_at_ms) VALUES($1,$2,$3,$4,$5,$6,$7,$8) RETURNING id");
  conn.prepare("get_credential", "SELECT " + credential_cols + " FROM credentials WHERE id=$1");
  conn.prepare("get_credential_by_prefix", "SELECT " + credential_cols + " FROM credentials WHERE prefix=$1");
  conn.prepare("list_credentials", "SELECT " + credential_cols + " FROM credentials ORDER BY id");
  conn.prepare("replace_credential_secret",
               "UPDATE credentials SET prefix=$2,key_hash=$3,revoked_at_ms=0 WHERE id=$1");
  conn.prepare("revoke_credential", "UPDATE credentials SET revoked_at_ms=$2 WHERE id=$1 AND revoked_at_ms=0");
  conn.prepare("touch_credential", "UPDATE credentials SET last_used_at_ms=$2 WHERE id=$1");
  conn.prepare("credential_exists", "SELECT 1 FROM credentials WHERE id=$1");

  // messages
  conn.prepare("insert_message",
               "INSERT INTO messages(doc_key,payload,received_at_ms,credential_id) VALUES($1,$2,$3,$4) "
               "ON CONFLICT (doc_key) DO NOTHING RETURNING id");
  conn.prepare("latest_message", "SELECT MAX(received_at_ms) FROM messages");
  conn.prepare("count_messages", "SELECT COUNT(*) FROM messages");
  conn.prepare("purge_messages", "DELETE FROM messages WHERE received_at_ms<$1");

  // jobs
  conn.prepare("insert_job",
               "INSERT INTO jobs(name,action_type,status,recurrence,run_at_ms,target_hosts,payload,creator,"
               "created_at_ms,updated_at_ms,last_run_at_ms) VALUES($1,$2,$3,$4,$5,$6,$7,$8,$9,$10,$11) RETURNING id");
  conn.prepare("get_job", "SELECT " + job_cols + " FROM jobs WHERE id=$1");
  conn.prepare("list_jobs", "SELECT " + job_cols + " FROM jobs ORDER BY id");
  conn.prepare("list_due_jobs",
               "SELECT " + job_cols + " FROM jobs WHERE status=$1 AND run_at_ms<=$2 ORDER BY run_at_ms, id");
  conn.prepare("transition_job", "UPDATE jobs SET status=$3,updated_at_ms=$4 WHERE id=$1 AND status=$2");
  conn.prepare("update_job",
               "UPDATE jobs SET status=$3,run_at_ms=$4,last_run_at_ms=$5,updated_at_ms=$6 WHERE id=$1 AND status=$2");
  conn.prepare("delete_job", "DELETE FROM jobs WHERE id=$1");
  conn.prepare("job_exists", "SELECT 1 FROM jobs WHERE id=$1");

  // commands
  conn.prepare("insert_command",
               "INSERT INTO commands(target_host,action_type,payload,status,source_job_id,detail,"
               "created_at_ms,sent_at_ms,completed_at_ms,updated_at_ms) VALUES($1,$2,$3,$4,$5,$6,$7,$8,$9,$10) "
               "RETURNING id");
  conn.prepare("get_command", "SELECT " + command_cols + " FROM commands WHERE id=$1");
  conn.prepare("update_command_if",
               "UPDATE commands SET status=$2,detail=$3,sent_at_ms=$4,completed_at_ms=$5,updated_at_ms=$6 "
               "WHERE id=$1 AND status=$7");
  conn.prepare("list_commands_by_job", "SELECT " + command_cols + " FROM commands WHERE source_job_id=$1 ORDER BY id");
  conn.prepare("list_commands_for_host", "SELECT " + command_cols + " FROM commands WHERE target_host=$1 ORDER BY id");
  conn.prepare("list_stale_commands",
               "SELECT " + command_cols + " FROM commands WHERE status IN ($1,$2) AND created_at_ms<$3 ORDER BY id");
  conn.prepare("command_exists", "SELECT 1 FROM commands WHERE id=$1");

  // download links
  conn.prepare("insert_link",
               "INSERT INTO download_links(token,creator,visibility,created_at_ms,expires_at_ms,revoked_at_ms) "
               "VALUES($1,$2,$3,$4,$5,$6) RETURNING id");
  conn.prepare("get_link", "SELECT " + link_cols + " FROM download_links WHERE id=$1");
  conn.prepare("get_link_by_token", "SELECT " + link_cols + " FROM download_links WHERE token=$1");
  conn.prepare("revoke_link", "UPDATE download_links SET revoked_at_ms=$2 WHERE id=$1 AND revoked_at_ms=0");
  conn.prepare("link_exists", "SELECT 1 FROM download_links WHERE id=$1");
}

std::shared_ptr<pqxx::connection> PgPool::Wrap(pqxx::connection* conn) {
  std::weak_ptr<PgPool> weak_self = shared_from_this();
  return std::shared_ptr<pqxx::connection>(conn, [weak_self](pqxx::connection* released_conn) {
    if (auto self = weak_self.lock()) {
      self->Release(released_conn);
      return;
    }
    delete released_conn;
  });
}

void PgPool::Release(pqxx::connection* conn) {
  {
    std::lock_guard lock(mutex_);
    idle_.emplace_back(conn);
  }
  cv_.notify_one();
}

} // namespace fleet::db::postgres
