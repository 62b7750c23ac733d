#include "key_service.hpp"

#include <stdexcept>

#include "internal/auth/key_registry.hpp"
#include "observe_rpc.hpp"
#include "proto_mapping.hpp"

namespace fleet::service {

using namespace fleet::control::v1;

KeyService::KeyService(ServiceContext ctx) : ctx_(std::move(ctx)) {
  if (!ctx_.keys) {
    throw std::invalid_argument("KeyService requires a key registry");
  }
}

CreateKeyResponse KeyService::CreateKey(const CreateKeyRequest& req) {
  return ObserveRpc("FleetKeyService.CreateKey", [&] {
    auto issued = ctx_.keys->Generate(req.name(), req.description(), req.default_principal());

    CreateKeyResponse resp;
    resp.set_plain_key(issued.plain_key);
    *resp.mutable_credential() = ToProto(issued.credential);
    return resp;
  });
}

CreateKeyResponse KeyService::RotateKey(const RotateKeyRequest& req) {
  return ObserveRpc("FleetKeyService.RotateKey", [&] {
    auto issued = ctx_.keys->Rotate(req.id());

    CreateKeyResponse resp;
    resp.set_plain_key(issued.plain_key);
    *resp.mutable_credential() = ToProto(issued.credential);
    return resp;
  });
}

RevokeKeyResponse KeyService::RevokeKey(const RevokeKeyRequest& req) {
  return ObserveRpc("FleetKeyService.RevokeKey", [&] {
    RevokeKeyResponse resp;
    *resp.mutable_credential() = ToProto(ctx_.keys->Revoke(req.id()));
    return resp;
  });
}

ListKeysResponse KeyService::ListKeys(const ListKeysRequest&) {
  return ObserveRpc("FleetKeyService.ListKeys", [&] {
    ListKeysResponse resp;
    for (const auto& credential : ctx_.keys->List()) {
      *resp.add_credentials() = ToProto(credential);
    }
    return resp;
  });
}

}
