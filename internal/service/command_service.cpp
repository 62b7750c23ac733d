#include "command_service.hpp"

#include <stdexcept>

#include "internal/dispatch/command_dispatcher.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"
#include "observe_rpc.hpp"
#include "proto_mapping.hpp"

namespace fleet::service {

using namespace fleet::control::v1;

CommandService::CommandService(ServiceContext ctx) : ctx_(std::move(ctx)) {
  if (!ctx_.dispatcher) {
    throw std::invalid_argument("CommandService requires a dispatcher");
  }
}

CommandResponse CommandService::EnqueueCommand(const EnqueueCommandRequest& req) {
  return ObserveRpc("FleetCommandService.EnqueueCommand", [&] {
    CommandResponse resp;
    *resp.mutable_command() = ToProto(ctx_.dispatcher->Enqueue(req.target_host(), req.action_type(), req.payload()));
    return resp;
  });
}

CommandResponse CommandService::MarkCommand(const MarkCommandRequest& req) {
  return ObserveRpc("FleetCommandService.MarkCommand", [&] {
    const auto target = FromProto(req.status());
    if (target == fleet::model::CommandStatus::kPending) {
      throw util::InvalidArgument("commands cannot be moved back to pending");
    }

    CommandResponse resp;
    *resp.mutable_command() = ToProto(ctx_.dispatcher->Mark(req.id(), target, req.detail()));
    return resp;
  });
}

ListCommandsResponse CommandService::ListCommands(const ListCommandsRequest& req) {
  return ObserveRpc("FleetCommandService.ListCommands", [&] {
    if (req.host().empty()) {
      throw util::InvalidArgument("host is required");
    }
    ListCommandsResponse resp;
    for (const auto& command : ctx_.dispatcher->ListForHost(req.host())) {
      *resp.add_commands() = ToProto(command);
    }
    return resp;
  });
}

ExpireCommandsResponse CommandService::ExpireCommands(const ExpireCommandsRequest& req) {
  return ObserveRpc("FleetCommandService.ExpireCommands", [&] {
    ExpireCommandsResponse resp;
    const auto now = util::NowMs();
    resp.set_expired(ctx_.dispatcher->Expire(now, SecondsToMs(req.ttl_sec(), 0, "ttl_sec")));
    return resp;
  });
}

}
