#pragma once

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "internal/db/api/repository.hpp"

namespace fleet::dispatch {

/*
  Per-host remote command lifecycle.

    pending -> sent -> acknowledged | failed | expired
    pending ---------> acknowledged | failed | expired

  acknowledged, failed and expired are terminal. Every transition is a
  conditional update on the current status, so a command that reached a
  terminal state can never be moved again.
*/
class CommandDispatcher {
 public:
  explicit CommandDispatcher(std::shared_ptr<db::Repository> repository);
  virtual ~CommandDispatcher() = default;

  virtual db::model::CommandRecord Enqueue(const std::string& target_host, const std::string& action_type,
                                           const std::string& payload, std::optional<uint64_t> source_job_id = std::nullopt);

  db::model::CommandRecord MarkSent(uint64_t id, const std::string& detail = {});
  db::model::CommandRecord MarkAcknowledged(uint64_t id, const std::string& detail);
  db::model::CommandRecord MarkFailed(uint64_t id, const std::string& detail);

  // TerminalStateViolation when `target` is not reachable from the
  // current status.
  db::model::CommandRecord Mark(uint64_t id, fleet::model::CommandStatus target, const std::string& detail);

  // Expires pending/sent commands created more than ttl_ms before now_ms.
  uint64_t Expire(uint64_t now_ms, uint64_t ttl_ms);

  db::model::CommandRecord              Get(uint64_t id);
  std::vector<db::model::CommandRecord> ListByJob(uint64_t job_id);
  std::vector<db::model::CommandRecord> ListForHost(const std::string& host);

  // Hands every pending command of `host` to its agent, marking it sent.
  std::vector<db::model::CommandRecord> PollForHost(const std::string& host);

 private:
  std::shared_ptr<db::Repository> repository_;
};

} // namespace fleet::dispatch
