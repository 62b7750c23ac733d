#pragma once

#include <cstdint>
#include <string_view>

#include "fleet/control/v1.hpp"
#include "service_context.hpp"

namespace fleet::service {

class DownloadService {
public:
  // default_ttl_sec applies when a request carries no ttl; 0 means links
  // without an explicit ttl never expire.
  DownloadService(ServiceContext ctx, uint64_t default_ttl_sec = 0);

  fleet::control::v1::LinkResponse IssueLink(const fleet::control::v1::IssueLinkRequest& req);
  fleet::control::v1::LinkResponse RevokeLink(const fleet::control::v1::RevokeLinkRequest& req);
  // api_key may be empty for anonymous callers; a non-empty key must
  // authenticate and supplies the principal for restricted links.
  fleet::control::v1::LinkResponse ResolveLink(std::string_view api_key, const fleet::control::v1::ResolveLinkRequest& req);

private:
  ServiceContext ctx_;
  uint64_t default_ttl_sec_;
};

}
