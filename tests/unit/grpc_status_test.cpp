#include <cassert>
#include <iostream>
#include <limits>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>

#include <grpcpp/grpcpp.h>

#include "fleet/control/v1.hpp"
#include "internal/auth/key_registry.hpp"
#include "internal/db/memory/memory_repository.hpp"
#include "internal/dispatch/command_dispatcher.hpp"
#include "internal/grpc/command_server.hpp"
#include "internal/grpc/download_server.hpp"
#include "internal/grpc/grpc_error.hpp"
#include "internal/grpc/ingest_server.hpp"
#include "internal/grpc/job_server.hpp"
#include "internal/grpc/key_server.hpp"
#include "internal/ingest/message_ingestor.hpp"
#include "internal/links/download_link_issuer.hpp"
#include "internal/scheduler/job_scheduler.hpp"
#include "internal/service/command_service.hpp"
#include "internal/service/download_service.hpp"
#include "internal/service/ingest_service.hpp"
#include "internal/service/job_service.hpp"
#include "internal/service/key_service.hpp"
#include "internal/service/service_context.hpp"
#include "internal/util/time.hpp"

namespace {

using fleet::control::v1::LINK_VISIBILITY_RESTRICTED;
using fleet::control::v1::RECURRENCE_ONCE;

fleet::service::ServiceContext BuildServiceContext() {
  fleet::service::ServiceContext ctx;
  auto repository = std::make_shared<fleet::db::memory::MemoryRepository>();
  ctx.keys        = std::make_shared<fleet::auth::KeyRegistry>(repository, fleet::auth::KeyHasher(1000));
  ctx.dispatcher  = std::make_shared<fleet::dispatch::CommandDispatcher>(repository);
  ctx.scheduler   = std::make_shared<fleet::scheduler::JobScheduler>(repository, ctx.dispatcher);
  ctx.links       = std::make_shared<fleet::links::DownloadLinkIssuer>(repository);
  ctx.ingestor    = std::make_shared<fleet::ingest::MessageIngestor>(repository, ctx.keys);
  return ctx;
}

template <typename E, typename Fn>
bool Throws(Fn&& fn) {
  try {
    fn();
  } catch (const E&) {
    return true;
  }
  return false;
}

void TestExceptionMapping() {
  using fleet::grpc::ToStatus;
  assert(ToStatus(fleet::util::AuthenticationFailure("x")).error_code() == ::grpc::StatusCode::UNAUTHENTICATED);
  assert(ToStatus(fleet::util::NotFound("x")).error_code() == ::grpc::StatusCode::NOT_FOUND);
  assert(ToStatus(fleet::util::AlreadyExists("x")).error_code() == ::grpc::StatusCode::ALREADY_EXISTS);
  assert(ToStatus(fleet::util::TerminalStateViolation("x")).error_code() == ::grpc::StatusCode::FAILED_PRECONDITION);
  assert(ToStatus(fleet::util::InvalidArgument("x")).error_code() == ::grpc::StatusCode::INVALID_ARGUMENT);
  assert(ToStatus(fleet::util::StoreUnavailable("x")).error_code() == ::grpc::StatusCode::UNAVAILABLE);
  assert(ToStatus(std::runtime_error("boom")).error_code() == ::grpc::StatusCode::INTERNAL);
  assert(ToStatus(fleet::util::NotFound("job 7 not found")).error_message() == "job 7 not found");
}

void TestIngestWithoutApiKeyIsUnauthenticated() {
  auto                     ctx = BuildServiceContext();
  fleet::grpc::IngestServer server(std::make_shared<fleet::service::IngestService>(ctx));

  fleet::control::v1::IngestRequest req;
  req.set_doc_key("doc-1");
  req.set_payload("hello");
  fleet::control::v1::IngestResponse resp;
  ::grpc::ServerContext              grpc_ctx;

  const auto status = server.Ingest(&grpc_ctx, &req, &resp);
  assert(status.error_code() == ::grpc::StatusCode::UNAUTHENTICATED);

  // nothing was stored by the rejected call
  google::protobuf::Empty            empty;
  fleet::control::v1::HealthResponse health;
  ::grpc::ServerContext              health_ctx;
  assert(server.Health(&health_ctx, &empty, &health).ok());
  assert(health.stored_messages() == 0);
  assert(!health.has_last_received_at());
}

void TestPollWithoutApiKeyIsUnauthenticated() {
  auto                     ctx = BuildServiceContext();
  fleet::grpc::AgentServer server(std::make_shared<fleet::service::AgentService>(ctx));

  fleet::control::v1::PollCommandsRequest req;
  req.set_host("web-01");
  fleet::control::v1::PollCommandsResponse resp;
  ::grpc::ServerContext                    grpc_ctx;

  assert(server.PollCommands(&grpc_ctx, &req, &resp).error_code() == ::grpc::StatusCode::UNAUTHENTICATED);
}

void TestDoubleRevokeReturnsFailedPrecondition() {
  auto                   ctx = BuildServiceContext();
  fleet::grpc::KeyServer server(std::make_shared<fleet::service::KeyService>(ctx));

  fleet::control::v1::CreateKeyRequest create;
  create.set_name("agent-web-01");
  fleet::control::v1::CreateKeyResponse created;
  ::grpc::ServerContext                 create_ctx;
  assert(server.CreateKey(&create_ctx, &create, &created).ok());
  assert(!created.plain_key().empty());

  fleet::control::v1::RevokeKeyRequest revoke;
  revoke.set_id(created.credential().id());
  fleet::control::v1::RevokeKeyResponse revoked;
  ::grpc::ServerContext                 first_ctx;
  assert(server.RevokeKey(&first_ctx, &revoke, &revoked).ok());

  ::grpc::ServerContext second_ctx;
  assert(server.RevokeKey(&second_ctx, &revoke, &revoked).error_code() == ::grpc::StatusCode::FAILED_PRECONDITION);

  fleet::control::v1::CreateKeyRequest unnamed;
  ::grpc::ServerContext                unnamed_ctx;
  assert(server.CreateKey(&unnamed_ctx, &unnamed, &created).error_code() == ::grpc::StatusCode::INVALID_ARGUMENT);
}

void TestJobStatusCodes() {
  auto                   ctx = BuildServiceContext();
  fleet::grpc::JobServer server(std::make_shared<fleet::service::JobService>(ctx));

  fleet::control::v1::JobRequest missing;
  missing.set_id(999);
  fleet::control::v1::JobResponse resp;
  ::grpc::ServerContext           get_ctx;
  assert(server.GetJob(&get_ctx, &missing, &resp).error_code() == ::grpc::StatusCode::NOT_FOUND);

  fleet::control::v1::CreateJobRequest create;
  create.set_name("rotate-logs");
  create.set_action_type("logrotate");
  create.set_recurrence(RECURRENCE_ONCE);
  create.add_target_hosts("web-01");
  create.set_creator("ops");

  // run_at unset
  ::grpc::ServerContext no_time_ctx;
  assert(server.CreateJob(&no_time_ctx, &create, &resp).error_code() == ::grpc::StatusCode::INVALID_ARGUMENT);

  create.mutable_run_at()->set_seconds(1700000000);
  ::grpc::ServerContext create_ctx;
  assert(server.CreateJob(&create_ctx, &create, &resp).ok());

  fleet::control::v1::JobRequest cancel;
  cancel.set_id(resp.job().id());
  ::grpc::ServerContext first_ctx;
  assert(server.CancelJob(&first_ctx, &cancel, &resp).ok());
  ::grpc::ServerContext second_ctx;
  assert(server.CancelJob(&second_ctx, &cancel, &resp).error_code() == ::grpc::StatusCode::FAILED_PRECONDITION);
}

void TestCommandStatusCodes() {
  auto                       ctx = BuildServiceContext();
  fleet::grpc::CommandServer server(std::make_shared<fleet::service::CommandService>(ctx));

  fleet::control::v1::EnqueueCommandRequest enqueue;
  enqueue.set_action_type("restart");
  fleet::control::v1::CommandResponse resp;
  ::grpc::ServerContext               no_host_ctx;
  assert(server.EnqueueCommand(&no_host_ctx, &enqueue, &resp).error_code() == ::grpc::StatusCode::INVALID_ARGUMENT);

  fleet::control::v1::MarkCommandRequest mark;
  mark.set_id(12345);
  mark.set_status(fleet::control::v1::COMMAND_STATUS_ACKNOWLEDGED);
  ::grpc::ServerContext mark_ctx;
  assert(server.MarkCommand(&mark_ctx, &mark, &resp).error_code() == ::grpc::StatusCode::NOT_FOUND);
}

void TestRestrictedLinkWithoutPrincipalIsUnauthenticated() {
  auto                        ctx = BuildServiceContext();
  fleet::grpc::DownloadServer server(std::make_shared<fleet::service::DownloadService>(ctx));

  fleet::control::v1::IssueLinkRequest issue;
  issue.set_creator("alice");
  issue.set_visibility(LINK_VISIBILITY_RESTRICTED);
  fleet::control::v1::LinkResponse issued;
  ::grpc::ServerContext            issue_ctx;
  assert(server.IssueLink(&issue_ctx, &issue, &issued).ok());
  assert(issued.link().active());

  fleet::control::v1::ResolveLinkRequest resolve;
  resolve.set_token(issued.link().token());
  fleet::control::v1::LinkResponse resolved;
  ::grpc::ServerContext            anon_ctx;
  assert(server.ResolveLink(&anon_ctx, &resolve, &resolved).error_code() == ::grpc::StatusCode::UNAUTHENTICATED);

  // a principal carried in the message body is not honoured
  std::string forged;
  resolve.SerializeToString(&forged);
  forged.push_back(static_cast<char>((2 << 3) | 2));
  forged.push_back(static_cast<char>(3));
  forged.append("bob");
  fleet::control::v1::ResolveLinkRequest with_principal;
  assert(with_principal.ParseFromString(forged));
  assert(with_principal.token() == resolve.token());
  ::grpc::ServerContext forged_ctx;
  assert(server.ResolveLink(&forged_ctx, &with_principal, &resolved).error_code() == ::grpc::StatusCode::UNAUTHENTICATED);

  fleet::control::v1::IssueLinkRequest anonymous;
  ::grpc::ServerContext                anonymous_ctx;
  assert(server.IssueLink(&anonymous_ctx, &anonymous, &issued).error_code() == ::grpc::StatusCode::INVALID_ARGUMENT);

  fleet::control::v1::ResolveLinkRequest unknown;
  unknown.set_token("no-such-token");
  ::grpc::ServerContext unknown_ctx;
  assert(server.ResolveLink(&unknown_ctx, &unknown, &resolved).error_code() == ::grpc::StatusCode::NOT_FOUND);
}

void TestOutOfRangeDurationsAreRejected() {
  auto       ctx = BuildServiceContext();
  const auto max = std::numeric_limits<uint64_t>::max();

  fleet::grpc::DownloadServer          links(std::make_shared<fleet::service::DownloadService>(ctx));
  fleet::control::v1::IssueLinkRequest issue;
  issue.set_creator("alice");
  issue.set_has_ttl(true);
  fleet::control::v1::LinkResponse issued;
  for (uint64_t ttl_sec : {max, max / 1000, max / 1000 - 1}) {
    issue.set_ttl_sec(ttl_sec);
    ::grpc::ServerContext issue_ctx;
    assert(links.IssueLink(&issue_ctx, &issue, &issued).error_code() == ::grpc::StatusCode::INVALID_ARGUMENT);
  }
  // ten years is fine
  issue.set_ttl_sec(10ULL * 365 * 24 * 3600);
  ::grpc::ServerContext ok_ctx;
  assert(links.IssueLink(&ok_ctx, &issue, &issued).ok());
  assert(issued.link().active());

  // a wrapped cutoff would expire commands that are seconds old
  fleet::grpc::CommandServer commands(std::make_shared<fleet::service::CommandService>(ctx));
  auto                       fresh = ctx.dispatcher->Enqueue("web-01", "restart", "", std::nullopt);
  fleet::control::v1::ExpireCommandsRequest  expire;
  fleet::control::v1::ExpireCommandsResponse expired;
  expire.set_ttl_sec(max / 1000 + 1);
  ::grpc::ServerContext expire_ctx;
  assert(commands.ExpireCommands(&expire_ctx, &expire, &expired).error_code() == ::grpc::StatusCode::INVALID_ARGUMENT);
  expire.set_ttl_sec(max / 1000);
  ::grpc::ServerContext expire_max_ctx;
  assert(commands.ExpireCommands(&expire_max_ctx, &expire, &expired).ok());
  assert(expired.expired() == 0);
  assert(ctx.dispatcher->Get(fresh.id).status == fleet::model::CommandStatus::kPending);

  // a sweep time before the epoch must not become a huge unsigned instant
  fleet::grpc::JobServer jobs(std::make_shared<fleet::service::JobService>(ctx));
  fleet::scheduler::JobSpec spec;
  spec.name         = "reboot";
  spec.action_type  = "reboot";
  spec.run_at_ms    = fleet::util::NowMs() + 3600 * 1000;
  spec.target_hosts = {"web-01"};
  spec.creator      = "admin";
  auto job          = ctx.scheduler->Create(spec);

  fleet::control::v1::SweepRequest  sweep;
  fleet::control::v1::SweepResponse swept;
  sweep.mutable_now()->set_seconds(-1);
  ::grpc::ServerContext negative_ctx;
  assert(jobs.Sweep(&negative_ctx, &sweep, &swept).error_code() == ::grpc::StatusCode::INVALID_ARGUMENT);
  sweep.mutable_now()->set_seconds(std::numeric_limits<int64_t>::max());
  ::grpc::ServerContext far_ctx;
  assert(jobs.Sweep(&far_ctx, &sweep, &swept).error_code() == ::grpc::StatusCode::INVALID_ARGUMENT);
  assert(ctx.scheduler->Get(job.id).status == fleet::model::JobStatus::kScheduled);
}

void TestRestrictedLinkPrincipalComesFromApiKey() {
  auto ctx     = BuildServiceContext();
  auto service = std::make_shared<fleet::service::DownloadService>(ctx);

  auto link = ctx.links->Issue("alice", std::nullopt, fleet::db::model::LinkVisibility::kRestricted);
  fleet::control::v1::ResolveLinkRequest resolve;
  resolve.set_token(link.token);

  auto key = ctx.keys->Generate("laptop", "", "bob@example.com");
  assert(service->ResolveLink(key.plain_key, resolve).link().id() == link.id);

  // an empty default_principal falls back to the credential name
  auto unnamed = ctx.keys->Generate("kiosk", "", "");
  assert(service->ResolveLink(unnamed.plain_key, resolve).link().id() == link.id);

  assert(Throws<fleet::util::AuthenticationFailure>([&] { service->ResolveLink("", resolve); }));
  assert(Throws<fleet::util::AuthenticationFailure>([&] { service->ResolveLink("fleet_deadbeef0000_nope", resolve); }));

  ctx.keys->Revoke(key.credential.id);
  assert(Throws<fleet::util::AuthenticationFailure>([&] { service->ResolveLink(key.plain_key, resolve); }));

  // public links need no key
  auto open = ctx.links->Issue("alice", std::nullopt, fleet::db::model::LinkVisibility::kPublic);
  fleet::control::v1::ResolveLinkRequest anonymous;
  anonymous.set_token(open.token);
  assert(service->ResolveLink("", anonymous).link().id() == open.id);
}

} // namespace

int main() {
  TestExceptionMapping();
  TestIngestWithoutApiKeyIsUnauthenticated();
  TestPollWithoutApiKeyIsUnauthenticated();
  TestDoubleRevokeReturnsFailedPrecondition();
  TestJobStatusCodes();
  TestCommandStatusCodes();
  TestRestrictedLinkWithoutPrincipalIsUnauthenticated();
  TestRestrictedLinkPrincipalComesFromApiKey();
  TestOutOfRangeDurationsAreRejected();

  std::cout << "fleet_unit_grpc_status: pass\n";
  return 0;
}
