#pragma once

#include <memory>
#include <grpcpp/grpcpp.h>

#include "fleet/control/v1.hpp"
#include "internal/service/key_service.hpp"

namespace fleet::grpc {

class KeyServer final : public fleet::control::v1::FleetKeyService::Service {
public:
  explicit KeyServer(std::shared_ptr<fleet::service::KeyService> svc);

  ::grpc::Status CreateKey(::grpc::ServerContext*,
                           const fleet::control::v1::CreateKeyRequest*,
                           fleet::control::v1::CreateKeyResponse*) override;

  ::grpc::Status RotateKey(::grpc::ServerContext*,
                           const fleet::control::v1::RotateKeyRequest*,
                           fleet::control::v1::CreateKeyResponse*) override;

  ::grpc::Status RevokeKey(::grpc::ServerContext*,
                           const fleet::control::v1::RevokeKeyRequest*,
                           fleet::control::v1::RevokeKeyResponse*) override;

  ::grpc::Status ListKeys(::grpc::ServerContext*,
                          const fleet::control::v1::ListKeysRequest*,
                          fleet::control::v1::ListKeysResponse*) override;

private:
  std::shared_ptr<fleet::service::KeyService> service_;
};

}
