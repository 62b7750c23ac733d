#pragma once

#include <cstdint>
#include <memory>
#include <optional>
#include <string>

#include "internal/db/api/repository.hpp"

namespace fleet::links {

/*
  Revocable, optionally expiring tokens that gate installer downloads.

  A link is active while it is not revoked and either has no expiry or
  expires strictly after the checked instant. Revocation is final.
*/
class DownloadLinkIssuer {
 public:
  static constexpr std::size_t kTokenBytes = 32;

  explicit DownloadLinkIssuer(std::shared_ptr<db::Repository> repository);

  // ttl_ms == nullopt: never expires. ttl_ms == 0: expires at creation.
  db::model::DownloadLinkRecord Issue(const std::string& creator, std::optional<uint64_t> ttl_ms,
                                      db::model::LinkVisibility visibility);

  db::model::DownloadLinkRecord Revoke(uint64_t id);

  // NotFound for unknown or inactive tokens; AuthenticationFailure when the
  // link is restricted and no principal is given.
  db::model::DownloadLinkRecord Resolve(const std::string& token, const std::optional<std::string>& principal, uint64_t now_ms);

  db::model::DownloadLinkRecord Get(uint64_t id);

  static bool IsActive(const db::model::DownloadLinkRecord& link, uint64_t now_ms);
  static bool RequireLogin(const db::model::DownloadLinkRecord& link);

 private:
  std::shared_ptr<db::Repository> repository_;
};

} // namespace fleet::links
