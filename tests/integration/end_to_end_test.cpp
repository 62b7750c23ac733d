#include <cassert>
#include <filesystem>
#include <iostream>
#include <memory>
#include <string>
#include <utility>
#include <vector>

#include <grpcpp/grpcpp.h>

#include "fleet/control/v1.hpp"
#include "internal/background/background_pool.hpp"
#include "internal/config/config_loader.hpp"
#include "internal/factory.hpp"
#include "internal/runtime/server.hpp"
#include "internal/service/ingest_service.hpp"
#include "internal/service/key_service.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"

namespace {

namespace v1 = fleet::control::v1;

// Client side of one fleet-control process listening on an ephemeral port.
struct ControlPlane {
  fleet::factory::Application               app;
  std::unique_ptr<fleet::runtime::Server>   server;
  std::shared_ptr<::grpc::Channel>          channel;

  explicit ControlPlane(const fleet::runtime::config::RuntimeConfig& config) : app(fleet::factory::Build(config)) {
    server = std::make_unique<fleet::runtime::Server>(config.server().bind_address(), std::move(app.grpc_services));
    server->Start();
    channel = ::grpc::CreateChannel("127.0.0.1:" + std::to_string(server->SelectedPort()), ::grpc::InsecureChannelCredentials());
  }
};

std::unique_ptr<::grpc::ClientContext> AgentContext(const std::string& api_key) {
  auto ctx = std::make_unique<::grpc::ClientContext>();
  ctx->AddMetadata("x-api-key", api_key);
  return ctx;
}

v1::IngestResponse Ingest(v1::FleetIngestService::Stub& stub, const std::string& api_key, const std::string& doc_key,
                          const std::string& payload, ::grpc::StatusCode expected = ::grpc::StatusCode::OK) {
  v1::IngestRequest req;
  req.set_doc_key(doc_key);
  req.set_payload(payload);
  v1::IngestResponse resp;
  auto               ctx    = AgentContext(api_key);
  const auto         status = stub.Ingest(ctx.get(), req, &resp);
  assert(status.error_code() == expected);
  return resp;
}

std::string CreateKey(v1::FleetKeyService::Stub& stub, const std::string& name, uint64_t* id = nullptr) {
  v1::CreateKeyRequest req;
  req.set_name(name);
  req.set_default_principal("ops@example.com");
  v1::CreateKeyResponse resp;
  ::grpc::ClientContext ctx;
  assert(stub.CreateKey(&ctx, req, &resp).ok());
  if (id) *id = resp.credential().id();
  return resp.plain_key();
}

void TestIngestDedupAndRevocation(ControlPlane& plane) {
  auto keys   = v1::FleetKeyService::NewStub(plane.channel);
  auto ingest = v1::FleetIngestService::NewStub(plane.channel);

  uint64_t   key_id  = 0;
  const auto api_key = CreateKey(*keys, "collector-01", &key_id);

  assert(Ingest(*ingest, api_key, "inventory-2024-06-01", R"({"hosts":12})").stored());
  assert(!Ingest(*ingest, api_key, "inventory-2024-06-01", R"({"hosts":12})").stored());
  assert(Ingest(*ingest, api_key, "", "heartbeat").stored());

  google::protobuf::Empty empty;
  v1::HealthResponse      health;
  ::grpc::ClientContext   health_ctx;
  assert(ingest->Health(&health_ctx, empty, &health).ok());
  assert(health.stored_messages() == 2);
  assert(health.has_last_received_at());

  // the accepted calls recorded agent liveness
  v1::ListKeysResponse  listed;
  ::grpc::ClientContext list_ctx;
  assert(keys->ListKeys(&list_ctx, v1::ListKeysRequest{}, &listed).ok());
  assert(listed.credentials_size() == 1);
  assert(listed.credentials(0).has_last_used_at());
  assert(listed.credentials(0).active());

  // a batch shares the dedup store with single deliveries
  v1::IngestBatchRequest batch;
  for (const auto& [doc_key, payload] : std::vector<std::pair<std::string, std::string>>{
           {"inventory-2024-06-01", "repeat"}, {"inventory-batch-1", R"({"hosts":3})"}, {"", ""}}) {
    auto* record = batch.add_records();
    record->set_doc_key(doc_key);
    record->set_payload(payload);
  }
  v1::IngestBatchResponse batched;
  auto                    batch_ctx = AgentContext(api_key);
  assert(ingest->IngestBatch(batch_ctx.get(), batch, &batched).ok());
  assert(batched.processed() == 2);
  assert(batched.stored() == 1);
  assert(batched.duplicates() == 1);
  assert(batched.errors_size() == 1);
  assert(batched.errors(0).index() == 2);

  v1::RevokeKeyRequest  revoke;
  revoke.set_id(key_id);
  v1::RevokeKeyResponse revoked;
  ::grpc::ClientContext revoke_ctx;
  assert(keys->RevokeKey(&revoke_ctx, revoke, &revoked).ok());

  Ingest(*ingest, api_key, "inventory-2024-06-02", "late", ::grpc::StatusCode::UNAUTHENTICATED);
  Ingest(*ingest, "", "inventory-2024-06-02", "anonymous", ::grpc::StatusCode::UNAUTHENTICATED);
  auto revoked_batch_ctx = AgentContext(api_key);
  assert(ingest->IngestBatch(revoked_batch_ctx.get(), batch, &batched).error_code() == ::grpc::StatusCode::UNAUTHENTICATED);

  // rotation restores access under a new key only
  v1::RotateKeyRequest  rotate;
  rotate.set_id(key_id);
  v1::CreateKeyResponse rotated;
  ::grpc::ClientContext rotate_ctx;
  assert(keys->RotateKey(&rotate_ctx, rotate, &rotated).ok());
  assert(rotated.plain_key() != api_key);
  Ingest(*ingest, api_key, "inventory-2024-06-02", "late", ::grpc::StatusCode::UNAUTHENTICATED);
  assert(Ingest(*ingest, rotated.plain_key(), "inventory-2024-06-02", "on time").stored());
}

void TestJobSweepToAgentReport(ControlPlane& plane) {
  auto keys  = v1::FleetKeyService::NewStub(plane.channel);
  auto jobs  = v1::FleetJobService::NewStub(plane.channel);
  auto agent = v1::FleetAgentService::NewStub(plane.channel);

  const auto api_key = CreateKey(*keys, "agent-web");

  v1::CreateJobRequest create;
  create.set_name("patch-openssl");
  create.set_action_type("apt-upgrade");
  create.mutable_run_at()->set_seconds(static_cast<int64_t>(fleet::util::NowMs() / 1000) - 60);
  create.set_recurrence(v1::RECURRENCE_ONCE);
  create.add_target_hosts("web-01");
  create.add_target_hosts("web-02");
  create.set_payload(R"({"package":"openssl"})");
  create.set_creator("ops@example.com");
  v1::JobResponse       created;
  ::grpc::ClientContext create_ctx;
  assert(jobs->CreateJob(&create_ctx, create, &created).ok());
  assert(created.job().status() == v1::JOB_STATUS_SCHEDULED);

  v1::SweepResponse     swept;
  ::grpc::ClientContext sweep_ctx;
  assert(jobs->Sweep(&sweep_ctx, v1::SweepRequest{}, &swept).ok());
  assert(swept.processed_size() == 1);
  assert(swept.processed(0).status() == v1::JOB_STATUS_COMPLETED);

  v1::PollCommandsRequest poll;
  poll.set_host("web-01");
  v1::PollCommandsResponse polled;
  auto                     poll_ctx = AgentContext(api_key);
  assert(agent->PollCommands(poll_ctx.get(), poll, &polled).ok());
  assert(polled.commands_size() == 1);
  const auto command = polled.commands(0);
  assert(command.status() == v1::COMMAND_STATUS_SENT);
  assert(command.source_job_id() == created.job().id());
  assert(command.action_type() == "apt-upgrade");

  // another host cannot settle web-01's command
  v1::ReportCommandResultRequest report;
  report.set_command_id(command.id());
  report.set_host("web-02");
  report.set_success(true);
  v1::ReportCommandResultResponse reported;
  auto                            wrong_ctx = AgentContext(api_key);
  assert(agent->ReportCommandResult(wrong_ctx.get(), report, &reported).error_code() == ::grpc::StatusCode::NOT_FOUND);

  report.set_host("web-01");
  report.set_detail("openssl 3.0.13 installed");
  auto ok_ctx = AgentContext(api_key);
  assert(agent->ReportCommandResult(ok_ctx.get(), report, &reported).ok());
  assert(reported.command().status() == v1::COMMAND_STATUS_ACKNOWLEDGED);
  assert(reported.command().detail() == "openssl 3.0.13 installed");

  report.set_success(false);
  auto again_ctx = AgentContext(api_key);
  assert(agent->ReportCommandResult(again_ctx.get(), report, &reported).error_code() ==
         ::grpc::StatusCode::FAILED_PRECONDITION);

  v1::JobRequest                job_req;
  job_req.set_id(created.job().id());
  v1::ListJobCommandsResponse   job_commands;
  ::grpc::ClientContext         list_ctx;
  assert(jobs->ListJobCommands(&list_ctx, job_req, &job_commands).ok());
  assert(job_commands.commands_size() == 2);
}

void TestDownloadLinks(ControlPlane& plane) {
  auto links = v1::FleetDownloadService::NewStub(plane.channel);

  v1::IssueLinkRequest issue;
  issue.set_creator("alice");
  issue.set_has_ttl(true);
  issue.set_ttl_sec(3600);
  issue.set_visibility(v1::LINK_VISIBILITY_PUBLIC);
  v1::LinkResponse      issued;
  ::grpc::ClientContext issue_ctx;
  assert(links->IssueLink(&issue_ctx, issue, &issued).ok());
  assert(issued.link().active());
  assert(issued.link().has_expires_at());

  v1::ResolveLinkRequest resolve;
  resolve.set_token(issued.link().token());
  v1::LinkResponse      resolved;
  ::grpc::ClientContext resolve_ctx;
  assert(links->ResolveLink(&resolve_ctx, resolve, &resolved).ok());
  assert(resolved.link().id() == issued.link().id());

  v1::RevokeLinkRequest revoke;
  revoke.set_id(issued.link().id());
  ::grpc::ClientContext revoke_ctx;
  assert(links->RevokeLink(&revoke_ctx, revoke, &resolved).ok());
  assert(!resolved.link().active());

  ::grpc::ClientContext after_ctx;
  assert(links->ResolveLink(&after_ctx, resolve, &resolved).error_code() == ::grpc::StatusCode::NOT_FOUND);
}

void TestRestrictedLinkNeedsApiKey(ControlPlane& plane) {
  auto keys  = v1::FleetKeyService::NewStub(plane.channel);
  auto links = v1::FleetDownloadService::NewStub(plane.channel);

  v1::IssueLinkRequest issue;
  issue.set_creator("alice");
  issue.set_visibility(v1::LINK_VISIBILITY_RESTRICTED);
  v1::LinkResponse      issued;
  ::grpc::ClientContext issue_ctx;
  assert(links->IssueLink(&issue_ctx, issue, &issued).ok());

  v1::ResolveLinkRequest resolve;
  resolve.set_token(issued.link().token());
  v1::LinkResponse resolved;

  ::grpc::ClientContext anon_ctx;
  assert(links->ResolveLink(&anon_ctx, resolve, &resolved).error_code() == ::grpc::StatusCode::UNAUTHENTICATED);

  auto bad_ctx = AgentContext("fleet_000000000000_forged");
  assert(links->ResolveLink(bad_ctx.get(), resolve, &resolved).error_code() == ::grpc::StatusCode::UNAUTHENTICATED);

  const auto api_key = CreateKey(*keys, "installer-laptop");
  auto       key_ctx = AgentContext(api_key);
  assert(links->ResolveLink(key_ctx.get(), resolve, &resolved).ok());
  assert(resolved.link().id() == issued.link().id());
}

#if FLEET_DB_SQLITE
void RemoveSqliteFiles() {
  const auto db_path = std::filesystem::temp_directory_path() / "fleet_control_end_to_end.sqlite";
  for (const char* suffix : {"", "-wal", "-shm"}) {
    std::filesystem::remove(db_path.string() + suffix);
  }
}

// fleet-control and two standalone fleet-ingest instances over one store.
void TestStandaloneIngestSharesStore() {
  const auto db_path = std::filesystem::temp_directory_path() / "fleet_control_end_to_end.sqlite";
  RemoveSqliteFiles();

  auto config = fleet::config::ConfigLoader::LoadFromString("ingest:\n  mode: standalone\ndatabase:\n  sqlite:\n    path: \"" +
                                                            db_path.string() + "\"\n    wal_mode: true\n");

  auto control = fleet::factory::Build(config);
  assert(!control.context.ingestor);

  auto ingest_a = fleet::factory::BuildIngest(config);
  auto ingest_b = fleet::factory::BuildIngest(config);

  fleet::service::KeyService    keys(control.context);
  fleet::service::IngestService listener_a(ingest_a.context);
  fleet::service::IngestService listener_b(ingest_b.context);

  v1::CreateKeyRequest create;
  create.set_name("collector-shared");
  const auto issued = keys.CreateKey(create);

  v1::IngestRequest req;
  req.set_doc_key("shared-doc");
  req.set_payload("first delivery");
  assert(listener_a.Ingest(issued.plain_key(), req).stored());
  req.set_payload("redelivery");
  assert(!listener_b.Ingest(issued.plain_key(), req).stored());
  assert(listener_b.Health().stored_messages() == 1);

  v1::RevokeKeyRequest revoke;
  revoke.set_id(issued.credential().id());
  keys.RevokeKey(revoke);

  bool threw = false;
  try {
    req.set_doc_key("after-revoke");
    listener_a.Ingest(issued.plain_key(), req);
  } catch (const fleet::util::AuthenticationFailure&) {
    threw = true;
  }
  assert(threw);
}
#endif

} // namespace

int main() {
  auto config = fleet::config::ConfigLoader::LoadFromString(R"(server:
  bind_address: "127.0.0.1:0"
scheduler:
  sweep_interval_sec: 3600
)");

  {
    ControlPlane plane(config);
    TestIngestDedupAndRevocation(plane);
    TestJobSweepToAgentReport(plane);
    TestDownloadLinks(plane);
    TestRestrictedLinkNeedsApiKey(plane);
    plane.server->Stop();
  }

#if FLEET_DB_SQLITE
  TestStandaloneIngestSharesStore();
  RemoveSqliteFiles();
#endif

  fleet::background::ShutdownBackgroundPool();
  std::cout << "fleet_integration_end_to_end: pass\n";
  return 0;
}
