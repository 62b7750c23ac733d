#pragma once

#include <cstdint>
#include <optional>
#include <string>

namespace fleet::db::model {

struct MessageRecord {
  uint64_t                   id = 0;
  std::optional<std::string> doc_key;
  std::string                payload;
  uint64_t                   received_at_ms = 0;
  uint64_t                   credential_id  = 0;
};

} // namespace fleet::db::model
