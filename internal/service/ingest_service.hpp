#pragma once

#include <string_view>

#include "fleet/control/v1.hpp"
#include "service_context.hpp"

namespace fleet::service {

// Shared by the embedded and the standalone ingest listeners.
class IngestService {
public:
  explicit IngestService(ServiceContext ctx);

  fleet::control::v1::IngestResponse
  Ingest(std::string_view api_key, const fleet::control::v1::IngestRequest& req);

  fleet::control::v1::IngestBatchResponse
  IngestBatch(std::string_view api_key, const fleet::control::v1::IngestBatchRequest& req);

  fleet::control::v1::HealthResponse Health();

private:
  ServiceContext ctx_;
};

class AgentService {
public:
  explicit AgentService(ServiceContext ctx);

  fleet::control::v1::PollCommandsResponse
  PollCommands(std::string_view api_key, const fleet::control::v1::PollCommandsRequest& req);

  fleet::control::v1::ReportCommandResultResponse
  ReportCommandResult(std::string_view api_key, const fleet::control::v1::ReportCommandResultRequest& req);

private:
  ServiceContext ctx_;
};

}
