#pragma once

#include <memory>
#include <grpcpp/grpcpp.h>

#include "fleet/control/v1.hpp"
#include "internal/service/download_service.hpp"

namespace fleet::grpc {

class DownloadServer final : public fleet::control::v1::FleetDownloadService::Service {
public:
  explicit DownloadServer(std::shared_ptr<fleet::service::DownloadService> svc);

  ::grpc::Status IssueLink(::grpc::ServerContext*,
                           const fleet::control::v1::IssueLinkRequest*,
                           fleet::control::v1::LinkResponse*) override;

  ::grpc::Status RevokeLink(::grpc::ServerContext*,
                            const fleet::control::v1::RevokeLinkRequest*,
                            fleet::control::v1::LinkResponse*) override;

  ::grpc::Status ResolveLink(::grpc::ServerContext*,
                             const fleet::control::v1::ResolveLinkRequest*,
                             fleet::control::v1::LinkResponse*) override;

private:
  std::shared_ptr<fleet::service::DownloadService> service_;
};

}
