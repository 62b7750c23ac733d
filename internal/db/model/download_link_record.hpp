#pragma once

#include <cstdint>
#include <optional>
#include <string>

namespace fleet::db::model {

enum class LinkVisibility : std::uint8_t {
  kPublic     = 1,
  kRestricted = 2,
};

struct DownloadLinkRecord {
  uint64_t       id = 0;
  std::string    token;
  std::string    creator;
  LinkVisibility visibility = LinkVisibility::kPublic;

  uint64_t                created_at_ms = 0;
  std::optional<uint64_t> expires_at_ms;
  uint64_t                revoked_at_ms = 0;
};

} // namespace fleet::db::model
