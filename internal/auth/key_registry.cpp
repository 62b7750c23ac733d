#include "internal/auth/key_registry.hpp"

#include "internal/db/api/db_error.hpp"
#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/random.hpp"
#include "internal/util/time.hpp"

namespace fleet::auth {

namespace {

// Prefix collisions are astronomically rare; a few retries cover them.
constexpr int kMaxPrefixAttempts = 4;

} // namespace

KeyRegistry::KeyRegistry(std::shared_ptr<db::Repository> repository, KeyHasher hasher)
    : repository_(std::move(repository)), hasher_(hasher) {
  if (!repository_) {
    throw std::invalid_argument("KeyRegistry requires a repository");
  }
}

std::string KeyRegistry::Compose(const std::string& prefix, const std::string& secret) {
  return std::string(kTag) + "_" + prefix + "_" + secret;
}

std::optional<KeyRegistry::KeyParts> KeyRegistry::Split(std::string_view raw_key) {
  // the secret alphabet includes '_', so only the first two separators count
  const auto first = raw_key.find('_');
  if (first == std::string_view::npos) return std::nullopt;
  const auto second = raw_key.find('_', first + 1);
  if (second == std::string_view::npos) return std::nullopt;

  if (raw_key.substr(0, first) != kTag) return std::nullopt;

  KeyParts parts;
  parts.prefix = raw_key.substr(first + 1, second - first - 1);
  parts.secret = raw_key.substr(second + 1);
  if (parts.prefix.empty() || parts.secret.empty() || !util::IsLowerHex(parts.prefix)) return std::nullopt;
  return parts;
}

IssuedKey KeyRegistry::Generate(const std::string& name, const std::string& description, const std::string& default_principal) {
  if (name.empty()) {
    throw util::InvalidArgument("credential name is required");
  }

  for (int attempt = 0; attempt < kMaxPrefixAttempts; ++attempt) {
    IssuedKey issued;
    const auto prefix = util::RandomHex(kPrefixBytes);
    issued.plain_key  = Compose(prefix, util::UrlSafeToken(kSecretBytes));

    auto& record             = issued.credential;
    record.name              = name;
    record.description       = description;
    record.prefix            = prefix;
    record.key_hash          = hasher_.Hash(issued.plain_key);
    record.default_principal = default_principal;
    record.created_at_ms     = util::NowMs();

    auto tx  = repository_->Begin();
    auto res = repository_->InsertCredential(*tx, record);
    if (res.code == db::ErrorCode::AlreadyExists) {
      continue;
    }
    db::ThrowIfDbError(res, "insert credential");
    tx->Commit();

    FLEET_LOG_INFO("credential issued", {observability::UintField("credential_id", record.id),
                                         observability::StringField("prefix", record.prefix),
                                         observability::StringField("name", record.name)});
    return issued;
  }
  throw util::AlreadyExists("could not allocate a unique credential prefix");
}

std::optional<db::model::CredentialRecord> KeyRegistry::Verify(std::string_view raw_key) {
  const auto parts = Split(raw_key);
  if (!parts) {
    return std::nullopt;
  }

  std::optional<db::model::CredentialRecord> record;
  {
    auto tx = repository_->Begin();
    record  = repository_->GetCredentialByPrefix(*tx, std::string(parts->prefix));
  }
  if (!record || record->revoked_at_ms != 0) {
    return std::nullopt;
  }

  // hash comparison runs outside any transaction
  if (!hasher_.Verify(raw_key, record->key_hash)) {
    return std::nullopt;
  }

  // re-check under the write transaction so a concurrent revoke or
  // rotation wins
  auto tx      = repository_->Begin();
  auto current = repository_->GetCredential(*tx, record->id);
  if (!current || current->revoked_at_ms != 0 || current->key_hash != record->key_hash) {
    return std::nullopt;
  }
  current->last_used_at_ms = util::NowMs();
  db::ThrowIfDbError(repository_->TouchCredential(*tx, current->id, current->last_used_at_ms), "touch credential");
  tx->Commit();
  return current;
}

db::model::CredentialRecord KeyRegistry::Authenticate(std::string_view raw_key) {
  auto record = Verify(raw_key);
  if (!record) {
    throw util::AuthenticationFailure("invalid or revoked API key");
  }
  return *record;
}

db::model::CredentialRecord KeyRegistry::Revoke(uint64_t id) {
  auto       tx  = repository_->Begin();
  const auto now = util::NowMs();
  auto       res = repository_->RevokeCredential(*tx, id, now);
  if (res.code == db::ErrorCode::Conflict) {
    throw util::TerminalStateViolation("credential " + std::to_string(id) + " is already revoked");
  }
  db::ThrowIfDbError(res, "revoke credential " + std::to_string(id));
  auto record = repository_->GetCredential(*tx, id);
  tx->Commit();

  FLEET_LOG_INFO("credential revoked", {observability::UintField("credential_id", id)});
  return *record;
}

IssuedKey KeyRegistry::Rotate(uint64_t id) {
  for (int attempt = 0; attempt < kMaxPrefixAttempts; ++attempt) {
    IssuedKey  issued;
    const auto prefix = util::RandomHex(kPrefixBytes);
    issued.plain_key  = Compose(prefix, util::UrlSafeToken(kSecretBytes));
    const auto hash   = hasher_.Hash(issued.plain_key);

    auto tx  = repository_->Begin();
    auto res = repository_->ReplaceCredentialSecret(*tx, id, prefix, hash);
    if (res.code == db::ErrorCode::AlreadyExists) {
      continue;
    }
    db::ThrowIfDbError(res, "rotate credential " + std::to_string(id));
    issued.credential = *repository_->GetCredential(*tx, id);
    tx->Commit();

    FLEET_LOG_INFO("credential rotated", {observability::UintField("credential_id", id),
                                          observability::StringField("prefix", prefix)});
    return issued;
  }
  throw util::AlreadyExists("could not allocate a unique credential prefix");
}

db::model::CredentialRecord KeyRegistry::Get(uint64_t id) {
  auto tx     = repository_->Begin();
  auto record = repository_->GetCredential(*tx, id);
  if (!record) {
    throw util::NotFound("credential " + std::to_string(id) + " not found");
  }
  return *record;
}

std::vector<db::model::CredentialRecord> KeyRegistry::List() {
  auto tx = repository_->Begin();
  return repository_->ListCredentials(*tx);
}

} // namespace fleet::auth
