#pragma once

#include <memory>
#include <grpcpp/grpcpp.h>

#include "fleet/control/v1.hpp"
#include "internal/service/command_service.hpp"

namespace fleet::grpc {

class CommandServer final : public fleet::control::v1::FleetCommandService::Service {
public:
  explicit CommandServer(std::shared_ptr<fleet::service::CommandService> svc);

  ::grpc::Status EnqueueCommand(::grpc::ServerContext*,
                                const fleet::control::v1::EnqueueCommandRequest*,
                                fleet::control::v1::CommandResponse*) override;

  ::grpc::Status MarkCommand(::grpc::ServerContext*,
                             const fleet::control::v1::MarkCommandRequest*,
                             fleet::control::v1::CommandResponse*) override;

  ::grpc::Status ListCommands(::grpc::ServerContext*,
                              const fleet::control::v1::ListCommandsRequest*,
                              fleet::control::v1::ListCommandsResponse*) override;

  ::grpc::Status ExpireCommands(::grpc::ServerContext*,
                                const fleet::control::v1::ExpireCommandsRequest*,
                                fleet::control::v1::ExpireCommandsResponse*) override;

private:
  std::shared_ptr<fleet::service::CommandService> service_;
};

}
