#pragma once

#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "internal/auth/key_hasher.hpp"
#include "internal/db/api/repository.hpp"

namespace fleet::auth {

// Plain key plus the stored credential. The plain key is returned once
// and never persisted.
struct IssuedKey {
  std::string                     plain_key;
  db::model::CredentialRecord     credential;
};

/*
  Agent API-key registry.

  Plain keys look like fleet_<12 hex prefix>_<urlsafe secret>. The prefix
  is public and indexes the credential; the salted hash covers the whole
  key. Verification looks up the prefix first so the hash comparison
  runs at most once per call.
*/
class KeyRegistry {
 public:
  static constexpr std::string_view kTag          = "fleet";
  static constexpr std::size_t      kPrefixBytes  = 6;
  static constexpr std::size_t      kSecretBytes  = 32;

  explicit KeyRegistry(std::shared_ptr<db::Repository> repository, KeyHasher hasher = KeyHasher());

  IssuedKey Generate(const std::string& name, const std::string& description, const std::string& default_principal);

  // Credential on success, nullopt for malformed, unknown, mismatched or
  // revoked keys. Success records last_used_at.
  std::optional<db::model::CredentialRecord> Verify(std::string_view raw_key);

  // Verify() that throws AuthenticationFailure instead of returning nullopt.
  db::model::CredentialRecord Authenticate(std::string_view raw_key);

  // TerminalStateViolation when already revoked.
  db::model::CredentialRecord Revoke(uint64_t id);

  // New prefix and secret for the same credential id; clears revocation.
  IssuedKey Rotate(uint64_t id);

  db::model::CredentialRecord              Get(uint64_t id);
  std::vector<db::model::CredentialRecord> List();

 private:
  struct KeyParts {
    std::string_view prefix;
    std::string_view secret;
  };

  static std::optional<KeyParts> Split(std::string_view raw_key);
  static std::string             Compose(const std::string& prefix, const std::string& secret);

  std::shared_ptr<db::Repository> repository_;
  KeyHasher                       hasher_;
};

} // namespace fleet::auth
