#pragma once

#include "fleet/control/v1.hpp"
#include "service_context.hpp"

namespace fleet::service {

class KeyService {
public:
  explicit KeyService(ServiceContext ctx);

  fleet::control::v1::CreateKeyResponse CreateKey(const fleet::control::v1::CreateKeyRequest& req);
  fleet::control::v1::CreateKeyResponse RotateKey(const fleet::control::v1::RotateKeyRequest& req);
  fleet::control::v1::RevokeKeyResponse RevokeKey(const fleet::control::v1::RevokeKeyRequest& req);
  fleet::control::v1::ListKeysResponse  ListKeys(const fleet::control::v1::ListKeysRequest& req);

private:
  ServiceContext ctx_;
};

}
