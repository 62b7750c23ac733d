#include "download_service.hpp"

#include <optional>
#include <stdexcept>
#include <string>

#include "internal/auth/key_registry.hpp"
#include "internal/links/download_link_issuer.hpp"
#include "internal/util/time.hpp"
#include "observe_rpc.hpp"
#include "proto_mapping.hpp"

namespace fleet::service {

using namespace fleet::control::v1;

DownloadService::DownloadService(ServiceContext ctx, uint64_t default_ttl_sec)
    : ctx_(std::move(ctx)), default_ttl_sec_(default_ttl_sec) {
  if (!ctx_.links || !ctx_.keys) {
    throw std::invalid_argument("DownloadService requires a link issuer and key registry");
  }
}

LinkResponse DownloadService::IssueLink(const IssueLinkRequest& req) {
  return ObserveRpc("FleetDownloadService.IssueLink", [&] {
    const auto              now = util::NowMs();
    std::optional<uint64_t> ttl_ms;
    if (req.has_ttl()) {
      ttl_ms = SecondsToMs(req.ttl_sec(), now, "ttl_sec");
    } else if (default_ttl_sec_ > 0) {
      ttl_ms = SecondsToMs(default_ttl_sec_, now, "download_links.default_ttl_sec");
    }

    const auto visibility =
        req.visibility() == LINK_VISIBILITY_UNSPECIFIED ? db::model::LinkVisibility::kPublic : FromProto(req.visibility());

    LinkResponse resp;
    *resp.mutable_link() = ToProto(ctx_.links->Issue(req.creator(), ttl_ms, visibility), util::NowMs());
    return resp;
  });
}

LinkResponse DownloadService::RevokeLink(const RevokeLinkRequest& req) {
  return ObserveRpc("FleetDownloadService.RevokeLink", [&] {
    LinkResponse resp;
    *resp.mutable_link() = ToProto(ctx_.links->Revoke(req.id()), util::NowMs());
    return resp;
  });
}

LinkResponse DownloadService::ResolveLink(std::string_view api_key, const ResolveLinkRequest& req) {
  return ObserveRpc("FleetDownloadService.ResolveLink", [&] {
    std::optional<std::string> principal;
    if (!api_key.empty()) {
      auto credential = ctx_.keys->Authenticate(api_key);
      principal       = credential.default_principal.empty() ? credential.name : credential.default_principal;
    }

    const auto now = util::NowMs();
    LinkResponse resp;
    *resp.mutable_link() = ToProto(ctx_.links->Resolve(req.token(), principal, now), now);
    return resp;
  });
}

}
