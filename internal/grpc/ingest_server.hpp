#pragma once

#include <memory>
#include <grpcpp/grpcpp.h>

#include "fleet/control/v1.hpp"
#include "internal/service/ingest_service.hpp"

namespace fleet::grpc {

class IngestServer final : public fleet::control::v1::FleetIngestService::Service {
public:
  explicit IngestServer(std::shared_ptr<fleet::service::IngestService> svc);

  ::grpc::Status Ingest(::grpc::ServerContext*,
                        const fleet::control::v1::IngestRequest*,
                        fleet::control::v1::IngestResponse*) override;

  ::grpc::Status IngestBatch(::grpc::ServerContext*,
                             const fleet::control::v1::IngestBatchRequest*,
                             fleet::control::v1::IngestBatchResponse*) override;

  ::grpc::Status Health(::grpc::ServerContext*,
                        const google::protobuf::Empty*,
                        fleet::control::v1::HealthResponse*) override;

private:
  std::shared_ptr<fleet::service::IngestService> service_;
};

class AgentServer final : public fleet::control::v1::FleetAgentService::Service {
public:
  explicit AgentServer(std::shared_ptr<fleet::service::AgentService> svc);

  ::grpc::Status PollCommands(::grpc::ServerContext*,
                              const fleet::control::v1::PollCommandsRequest*,
                              fleet::control::v1::PollCommandsResponse*) override;

  ::grpc::Status ReportCommandResult(::grpc::ServerContext*,
                                     const fleet::control::v1::ReportCommandResultRequest*,
                                     fleet::control::v1::ReportCommandResultResponse*) override;

private:
  std::shared_ptr<fleet::service::AgentService> service_;
};

}
