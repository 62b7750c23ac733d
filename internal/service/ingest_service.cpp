#include "ingest_service.hpp"

#include <stdexcept>
#include <vector>

#include "internal/auth/key_registry.hpp"
#include "internal/dispatch/command_dispatcher.hpp"
#include "internal/ingest/message_ingestor.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"
#include "observe_rpc.hpp"
#include "proto_mapping.hpp"

namespace fleet::service {

using namespace fleet::control::v1;

IngestService::IngestService(ServiceContext ctx) : ctx_(std::move(ctx)) {
  if (!ctx_.ingestor) {
    throw std::invalid_argument("IngestService requires an ingestor");
  }
}

IngestResponse IngestService::Ingest(std::string_view api_key, const IngestRequest& req) {
  return ObserveRpc("FleetIngestService.Ingest", [&] {
    std::optional<std::string> doc_key;
    if (!req.doc_key().empty()) doc_key = req.doc_key();

    IngestResponse resp;
    resp.set_stored(ctx_.ingestor->Ingest(api_key, doc_key, req.payload()));
    return resp;
  });
}

IngestBatchResponse IngestService::IngestBatch(std::string_view api_key, const IngestBatchRequest& req) {
  return ObserveRpc("FleetIngestService.IngestBatch", [&] {
    std::vector<ingest::BatchRecord> records;
    records.reserve(req.records_size());
    for (const auto& record : req.records()) {
      ingest::BatchRecord item;
      if (!record.doc_key().empty()) item.doc_key = record.doc_key();
      item.payload = record.payload();
      records.push_back(std::move(item));
    }

    const auto          result = ctx_.ingestor->IngestBatch(api_key, records);
    IngestBatchResponse resp;
    resp.set_stored(static_cast<uint32_t>(result.stored));
    resp.set_duplicates(static_cast<uint32_t>(result.duplicates));
    resp.set_processed(static_cast<uint32_t>(result.stored + result.duplicates));
    for (const auto& error : result.errors) {
      auto* out = resp.add_errors();
      out->set_index(static_cast<uint32_t>(error.index));
      out->set_message(error.message);
    }
    return resp;
  });
}

HealthResponse IngestService::Health() {
  return ObserveRpc("FleetIngestService.Health", [&] {
    HealthResponse resp;
    const auto     health = ctx_.ingestor->Health();
    if (health.last_received_at_ms) {
      util::SetTimestampMs(*health.last_received_at_ms, resp.mutable_last_received_at());
    }
    resp.set_stored_messages(health.stored_messages);
    return resp;
  });
}

AgentService::AgentService(ServiceContext ctx) : ctx_(std::move(ctx)) {
  if (!ctx_.keys || !ctx_.dispatcher) {
    throw std::invalid_argument("AgentService requires key registry and dispatcher");
  }
}

PollCommandsResponse AgentService::PollCommands(std::string_view api_key, const PollCommandsRequest& req) {
  return ObserveRpc("FleetAgentService.PollCommands", [&] {
    ctx_.keys->Authenticate(api_key);

    PollCommandsResponse resp;
    for (const auto& command : ctx_.dispatcher->PollForHost(req.host())) {
      *resp.add_commands() = ToProto(command);
    }
    return resp;
  });
}

ReportCommandResultResponse AgentService::ReportCommandResult(std::string_view api_key, const ReportCommandResultRequest& req) {
  return ObserveRpc("FleetAgentService.ReportCommandResult", [&] {
    ctx_.keys->Authenticate(api_key);

    // an agent may only settle commands addressed to its own host
    const auto command = ctx_.dispatcher->Get(req.command_id());
    if (command.target_host != req.host()) {
      throw util::NotFound("command " + std::to_string(req.command_id()) + " not found for host " + req.host());
    }

    ReportCommandResultResponse resp;
    const auto updated = req.success() ? ctx_.dispatcher->MarkAcknowledged(req.command_id(), req.detail())
                                       : ctx_.dispatcher->MarkFailed(req.command_id(), req.detail());
    *resp.mutable_command() = ToProto(updated);
    return resp;
  });
}

}
