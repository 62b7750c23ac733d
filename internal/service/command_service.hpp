#pragma once

#include "fleet/control/v1.hpp"
#include "service_context.hpp"

namespace fleet::service {

class CommandService {
public:
  explicit CommandService(ServiceContext ctx);

  fleet::control::v1::CommandResponse EnqueueCommand(const fleet::control::v1::EnqueueCommandRequest& req);
  fleet::control::v1::CommandResponse MarkCommand(const fleet::control::v1::MarkCommandRequest& req);
  fleet::control::v1::ListCommandsResponse ListCommands(const fleet::control::v1::ListCommandsRequest& req);
  fleet::control::v1::ExpireCommandsResponse ExpireCommands(const fleet::control::v1::ExpireCommandsRequest& req);

private:
  ServiceContext ctx_;
};

}
