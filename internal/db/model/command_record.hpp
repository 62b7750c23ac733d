#pragma once

#include <cstdint>
#include <optional>
#include <string>

#include "internal/model/state_machine.hpp"

namespace fleet::db::model {

/*
  Remote command row. Owned exclusively by the dispatcher.

  source_job_id is a lookup-only back-reference; the job may be deleted
  while its commands remain.
*/
struct CommandRecord {
  uint64_t    id = 0;
  std::string target_host;
  std::string action_type;
  std::string payload;

  fleet::model::CommandStatus status = fleet::model::CommandStatus::kPending;

  std::optional<uint64_t> source_job_id;
  std::string             detail;

  uint64_t created_at_ms   = 0;
  uint64_t sent_at_ms      = 0;
  uint64_t completed_at_ms = 0;
  uint64_t updated_at_ms   = 0;
};

} // namespace fleet::db::model
