#pragma once

#include <memory>
#include <vector>

#include <grpcpp/grpcpp.h>

#include "config/config.pb.h"

#include "internal/background/background_pool.hpp"
#include "internal/db/api/repository.hpp"
#include "internal/scheduler/scheduler_loop.hpp"
#include "internal/service/service_context.hpp"

namespace fleet::factory {

/*
  Application

  Owns all long-lived objects of one process. Everything here lives for
  the lifetime of the process.
*/
struct Application {
  std::shared_ptr<const fleet::runtime::config::RuntimeConfig> config;
  std::shared_ptr<db::Repository>                              repository;
  std::shared_ptr<background::BackgroundPool>                  pool;
  service::ServiceContext                                      context;

  // Main listener (server.bind_address).
  std::vector<std::unique_ptr<::grpc::Service>> grpc_services;

  // Set for fleet-control only.
  std::shared_ptr<scheduler::SchedulerLoop> scheduler_loop;
};

/*
  Composition root. The only place allowed to know concrete DB types.
  The schema is bootstrapped before the repository is returned.
*/
std::shared_ptr<db::Repository> BuildRepository(const fleet::runtime::config::RuntimeConfig& config);

// fleet-control: admin and agent services, plus ingestion when
// ingest.mode is embedded, and the scheduler loop (not started).
Application Build(const fleet::runtime::config::RuntimeConfig& config);

// fleet-ingest: only the ingestion service, for ingest.bind_address.
Application BuildIngest(const fleet::runtime::config::RuntimeConfig& config);

} // namespace fleet::factory
