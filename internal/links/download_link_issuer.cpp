#include "internal/links/download_link_issuer.hpp"

#include <limits>

#include "internal/db/api/db_error.hpp"
#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/random.hpp"
#include "internal/util/time.hpp"

namespace fleet::links {

using observability::StringField;
using observability::UintField;

DownloadLinkIssuer::DownloadLinkIssuer(std::shared_ptr<db::Repository> repository) : repository_(std::move(repository)) {
  if (!repository_) {
    throw std::invalid_argument("DownloadLinkIssuer requires a repository");
  }
}

bool DownloadLinkIssuer::IsActive(const db::model::DownloadLinkRecord& link, uint64_t now_ms) {
  if (link.revoked_at_ms != 0) return false;
  return !link.expires_at_ms || *link.expires_at_ms > now_ms;
}

bool DownloadLinkIssuer::RequireLogin(const db::model::DownloadLinkRecord& link) {
  return link.visibility == db::model::LinkVisibility::kRestricted;
}

db::model::DownloadLinkRecord DownloadLinkIssuer::Issue(const std::string& creator, std::optional<uint64_t> ttl_ms,
                                                        db::model::LinkVisibility visibility) {
  if (creator.empty()) {
    throw util::InvalidArgument("link creator is required");
  }

  db::model::DownloadLinkRecord record;
  record.token         = util::UrlSafeToken(kTokenBytes);
  record.creator       = creator;
  record.visibility    = visibility;
  record.created_at_ms = util::NowMs();
  if (ttl_ms) {
    if (*ttl_ms > std::numeric_limits<uint64_t>::max() - record.created_at_ms) {
      throw util::InvalidArgument("link ttl is too large");
    }
    record.expires_at_ms = record.created_at_ms + *ttl_ms;
  }

  auto tx = repository_->Begin();
  db::ThrowIfDbError(repository_->InsertDownloadLink(*tx, record), "insert download link");
  tx->Commit();

  FLEET_LOG_INFO("download link issued", {UintField("link_id", record.id), StringField("creator", creator),
                                          observability::BoolField("restricted", RequireLogin(record)),
                                          UintField("expires_at_ms", record.expires_at_ms.value_or(0))});
  return record;
}

db::model::DownloadLinkRecord DownloadLinkIssuer::Revoke(uint64_t id) {
  auto       tx  = repository_->Begin();
  const auto now = util::NowMs();
  auto       res = repository_->RevokeDownloadLink(*tx, id, now);
  if (res.code == db::ErrorCode::Conflict) {
    throw util::TerminalStateViolation("download link " + std::to_string(id) + " is already revoked");
  }
  db::ThrowIfDbError(res, "revoke download link " + std::to_string(id));
  auto record = repository_->GetDownloadLink(*tx, id);
  tx->Commit();

  FLEET_LOG_INFO("download link revoked", {UintField("link_id", id)});
  return *record;
}

db::model::DownloadLinkRecord DownloadLinkIssuer::Resolve(const std::string& token, const std::optional<std::string>& principal,
                                                          uint64_t now_ms) {
  if (token.empty()) {
    throw util::InvalidArgument("token is required");
  }

  std::optional<db::model::DownloadLinkRecord> link;
  {
    auto tx = repository_->Begin();
    link    = repository_->GetDownloadLinkByToken(*tx, token);
  }
  // unknown and inactive links are indistinguishable to the caller
  if (!link || !IsActive(*link, now_ms)) {
    throw util::NotFound("download link not found");
  }
  if (RequireLogin(*link) && (!principal || principal->empty())) {
    throw util::AuthenticationFailure("download link requires login");
  }
  return *link;
}

db::model::DownloadLinkRecord DownloadLinkIssuer::Get(uint64_t id) {
  auto tx   = repository_->Begin();
  auto link = repository_->GetDownloadLink(*tx, id);
  if (!link) {
    throw util::NotFound("download link " + std::to_string(id) + " not found");
  }
  return *link;
}

} // namespace fleet::links
