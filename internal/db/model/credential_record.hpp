#pragma once

#include <cstdint>
#include <string>

namespace fleet::db::model {

/*
  Agent API credential row.

  IMPORTANT:
  - prefix is public and unique; it is the lookup key for verification.
  - key_hash covers the whole plain key; the plain key is never stored.
  - revoked_at_ms != 0 means revoked.
*/
struct CredentialRecord {
  uint64_t    id = 0;
  std::string name;
  std::string description;
  std::string prefix;
  std::string key_hash;
  std::string default_principal;

  uint64_t created_at_ms   = 0;
  uint64_t last_used_at_ms = 0;
  uint64_t revoked_at_ms   = 0;
};

} // namespace fleet::db::model
