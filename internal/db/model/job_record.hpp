#pragma once

#include <cstdint>
#include <string>
#include <vector>

#include "internal/model/recurrence.hpp"
#include "internal/model/state_machine.hpp"

namespace fleet::db::model {

/*
  Scheduled job row. Owned exclusively by the job scheduler.
*/
struct JobRecord {
  uint64_t    id = 0;
  std::string name;
  std::string action_type;

  fleet::model::JobStatus  status     = fleet::model::JobStatus::kScheduled;
  fleet::model::Recurrence recurrence = fleet::model::Recurrence::kOnce;

  uint64_t run_at_ms = 0;

  std::vector<std::string> target_hosts;
  std::string              payload;
  std::string              creator;

  uint64_t created_at_ms  = 0;
  uint64_t updated_at_ms  = 0;
  uint64_t last_run_at_ms = 0;
};

} // namespace fleet::db::model
