#include <grpcpp/grpcpp.h>

#include <google/protobuf/struct.pb.h>
#include <google/protobuf/util/json_util.h>

#include <cstdlib>
#include <ctime>
#include <fstream>
#include <iostream>
#include <memory>
#include <optional>
#include <sstream>
#include <string>

#include "fleet/control/v1.hpp"

using namespace fleet::control::v1;

static void Usage() {
  std::cout << "Usage:\n"
            << "  fleetctl <addr> key-create <name> [description] [principal]\n"
            << "  fleetctl <addr> key-rotate <id>\n"
            << "  fleetctl <addr> key-revoke <id>\n"
            << "  fleetctl <addr> key-list\n"
            << "  fleetctl <addr> job-create <name> <action> <run_at_unix> <once|daily|weekly|monthly> <host[,host...]> [payload] [creator]\n"
            << "  fleetctl <addr> job-get <id>\n"
            << "  fleetctl <addr> job-list\n"
            << "  fleetctl <addr> job-cancel <id>\n"
            << "  fleetctl <addr> job-reschedule <id> <run_at_unix>\n"
            << "  fleetctl <addr> job-delete <id>\n"
            << "  fleetctl <addr> job-commands <id>\n"
            << "  fleetctl <addr> sweep\n"
            << "  fleetctl <addr> cmd-enqueue <host> <action> [payload]\n"
            << "  fleetctl <addr> cmd-mark <id> <sent|acknowledged|failed|expired> [detail]\n"
            << "  fleetctl <addr> cmd-list <host>\n"
            << "  fleetctl <addr> cmd-expire <ttl_sec>\n"
            << "  fleetctl <addr> link-issue <creator> [ttl_sec|-] [public|restricted]\n"
            << "  fleetctl <addr> link-revoke <id>\n"
            << "  fleetctl <addr> link-resolve <token> [api_key]\n"
            << "  fleetctl <addr> ingest <api_key> <payload> [doc_key]\n"
            << "  fleetctl <addr> ingest-batch <api_key> <ndjson_file>\n"
            << "  fleetctl <addr> health\n"
            << "  fleetctl <addr> poll <api_key> <host>\n"
            << "  fleetctl <addr> report <api_key> <command_id> <host> <ok|fail> [detail]\n";
}

static int Fail(const grpc::Status& status) {
  std::cerr << "error(" << status.error_code() << "): " << status.error_message() << "\n";
  return 2;
}

static std::string Arg(int argc, char** argv, int idx, const std::string& fallback = {}) {
  return idx < argc ? std::string(argv[idx]) : fallback;
}

static google::protobuf::Timestamp UnixSeconds(const std::string& s) {
  google::protobuf::Timestamp ts;
  ts.set_seconds(std::stoll(s));
  return ts;
}

static std::string FormatTime(const google::protobuf::Timestamp& ts) {
  if (ts.seconds() == 0 && ts.nanos() == 0) return "-";
  const std::time_t t = static_cast<std::time_t>(ts.seconds());
  std::tm           tm{};
  gmtime_r(&t, &tm);
  char buf[32];
  std::strftime(buf, sizeof(buf), "%Y-%m-%dT%H:%M:%SZ", &tm);
  return buf;
}

// One record per non-empty line; doc_key (or docKey) is taken from the
// line when it parses as a JSON object.
static IngestBatchRequest ReadNdjson(std::istream& in) {
  IngestBatchRequest req;
  std::string        line;
  while (std::getline(in, line)) {
    if (line.find_first_not_of(" \t\r") == std::string::npos) continue;

    auto* record = req.add_records();
    record->set_payload(line);

    google::protobuf::Struct object;
    if (!google::protobuf::util::JsonStringToMessage(line, &object).ok()) continue;
    for (const char* field : {"doc_key", "docKey"}) {
      auto it = object.fields().find(field);
      if (it != object.fields().end() && it->second.kind_case() == google::protobuf::Value::kStringValue) {
        record->set_doc_key(it->second.string_value());
        break;
      }
    }
  }
  return req;
}

static std::optional<Recurrence> ParseRecurrence(const std::string& value) {
  if (value == "once") return RECURRENCE_ONCE;
  if (value == "daily") return RECURRENCE_DAILY;
  if (value == "weekly") return RECURRENCE_WEEKLY;
  if (value == "monthly") return RECURRENCE_MONTHLY;
  return std::nullopt;
}

static std::optional<CommandStatus> ParseCommandStatus(const std::string& value) {
  if (value == "sent") return COMMAND_STATUS_SENT;
  if (value == "acknowledged") return COMMAND_STATUS_ACKNOWLEDGED;
  if (value == "failed") return COMMAND_STATUS_FAILED;
  if (value == "expired") return COMMAND_STATUS_EXPIRED;
  return std::nullopt;
}

static void Print(const Credential& c) {
  std::cout << "id=" << c.id() << " name=" << c.name() << " prefix=" << c.prefix()
            << " principal=" << c.default_principal() << " active=" << (c.active() ? "yes" : "no")
            << " last_used=" << FormatTime(c.last_used_at()) << "\n";
}

static void Print(const ScheduledJob& j) {
  std::cout << "id=" << j.id() << " name=" << j.name() << " action=" << j.action_type()
            << " status=" << JobStatus_Name(j.status()) << " recurrence=" << Recurrence_Name(j.recurrence())
            << " run_at=" << FormatTime(j.run_at()) << " hosts=";
  for (int i = 0; i < j.target_hosts_size(); ++i) {
    std::cout << (i ? "," : "") << j.target_hosts(i);
  }
  std::cout << "\n";
}

static void Print(const RemoteCommand& c) {
  std::cout << "id=" << c.id() << " host=" << c.target_host() << " action=" << c.action_type()
            << " status=" << CommandStatus_Name(c.status());
  if (c.source_job_id()) std::cout << " job=" << c.source_job_id();
  if (!c.detail().empty()) std::cout << " detail=" << c.detail();
  std::cout << "\n";
}

static void Print(const DownloadLink& l) {
  std::cout << "id=" << l.id() << " token=" << l.token() << " visibility=" << LinkVisibility_Name(l.visibility())
            << " expires=" << FormatTime(l.expires_at()) << " active=" << (l.active() ? "yes" : "no") << "\n";
}

int main(int argc, char** argv) {
  if (argc < 3) {
    Usage();
    return 1;
  }

  std::string addr = argv[1];
  std::string cmd  = argv[2];

  auto channel = grpc::CreateChannel(addr, grpc::InsecureChannelCredentials());

  auto key_stub      = FleetKeyService::NewStub(channel);
  auto job_stub      = FleetJobService::NewStub(channel);
  auto command_stub  = FleetCommandService::NewStub(channel);
  auto download_stub = FleetDownloadService::NewStub(channel);
  auto ingest_stub   = FleetIngestService::NewStub(channel);
  auto agent_stub    = FleetAgentService::NewStub(channel);

  grpc::ClientContext ctx;

  try {
    // ------------------------------------------------------------

    if (cmd == "key-create") {
      if (argc < 4) return 1;

      CreateKeyRequest req;
      req.set_name(argv[3]);
      req.set_description(Arg(argc, argv, 4));
      req.set_default_principal(Arg(argc, argv, 5));

      CreateKeyResponse resp;
      auto              status = key_stub->CreateKey(&ctx, req, &resp);
      if (!status.ok()) return Fail(status);

      Print(resp.credential());
      std::cout << "key=" << resp.plain_key() << "\n";
      return 0;
    }

    if (cmd == "key-rotate") {
      if (argc < 4) return 1;

      RotateKeyRequest req;
      req.set_id(std::stoull(argv[3]));

      CreateKeyResponse resp;
      auto              status = key_stub->RotateKey(&ctx, req, &resp);
      if (!status.ok()) return Fail(status);

      Print(resp.credential());
      std::cout << "key=" << resp.plain_key() << "\n";
      return 0;
    }

    if (cmd == "key-revoke") {
      if (argc < 4) return 1;

      RevokeKeyRequest req;
      req.set_id(std::stoull(argv[3]));

      RevokeKeyResponse resp;
      auto              status = key_stub->RevokeKey(&ctx, req, &resp);
      if (!status.ok()) return Fail(status);

      Print(resp.credential());
      return 0;
    }

    if (cmd == "key-list") {
      ListKeysRequest  req;
      ListKeysResponse resp;
      auto             status = key_stub->ListKeys(&ctx, req, &resp);
      if (!status.ok()) return Fail(status);

      for (const auto& c : resp.credentials()) Print(c);
      return 0;
    }

    // ------------------------------------------------------------

    if (cmd == "job-create") {
      if (argc < 8) return 1;

      auto recurrence = ParseRecurrence(argv[6]);
      if (!recurrence) {
        std::cerr << "unsupported recurrence: " << argv[6] << "\n";
        return 1;
      }

      CreateJobRequest req;
      req.set_name(argv[3]);
      req.set_action_type(argv[4]);
      *req.mutable_run_at() = UnixSeconds(argv[5]);
      req.set_recurrence(*recurrence);

      std::stringstream hosts(argv[7]);
      for (std::string host; std::getline(hosts, host, ',');) {
        req.add_target_hosts(host);
      }
      req.set_payload(Arg(argc, argv, 8));
      req.set_creator(Arg(argc, argv, 9, "fleetctl"));

      JobResponse resp;
      auto        status = job_stub->CreateJob(&ctx, req, &resp);
      if (!status.ok()) return Fail(status);

      Print(resp.job());
      return 0;
    }

    if (cmd == "job-get" || cmd == "job-cancel") {
      if (argc < 4) return 1;

      JobRequest req;
      req.set_id(std::stoull(argv[3]));

      JobResponse resp;
      auto status = cmd == "job-get" ? job_stub->GetJob(&ctx, req, &resp) : job_stub->CancelJob(&ctx, req, &resp);
      if (!status.ok()) return Fail(status);

      Print(resp.job());
      return 0;
    }

    if (cmd == "job-list") {
      ListJobsRequest  req;
      ListJobsResponse resp;
      auto             status = job_stub->ListJobs(&ctx, req, &resp);
      if (!status.ok()) return Fail(status);

      for (const auto& j : resp.jobs()) Print(j);
      return 0;
    }

    if (cmd == "job-reschedule") {
      if (argc < 5) return 1;

      RescheduleJobRequest req;
      req.set_id(std::stoull(argv[3]));
      *req.mutable_run_at() = UnixSeconds(argv[4]);

      JobResponse resp;
      auto        status = job_stub->RescheduleJob(&ctx, req, &resp);
      if (!status.ok()) return Fail(status);

      Print(resp.job());
      return 0;
    }

    if (cmd == "job-delete") {
      if (argc < 4) return 1;

      JobRequest req;
      req.set_id(std::stoull(argv[3]));

      google::protobuf::Empty resp;
      auto                    status = job_stub->DeleteJob(&ctx, req, &resp);
      if (!status.ok()) return Fail(status);

      std::cout << "deleted\n";
      return 0;
    }

    if (cmd == "job-commands") {
      if (argc < 4) return 1;

      JobRequest req;
      req.set_id(std::stoull(argv[3]));

      ListJobCommandsResponse resp;
      auto                    status = job_stub->ListJobCommands(&ctx, req, &resp);
      if (!status.ok()) return Fail(status);

      for (const auto& c : resp.commands()) Print(c);
      return 0;
    }

    if (cmd == "sweep") {
      SweepRequest  req;
      SweepResponse resp;
      auto          status = job_stub->Sweep(&ctx, req, &resp);
      if (!status.ok()) return Fail(status);

      std::cout << "processed=" << resp.processed_size() << "\n";
      for (const auto& j : resp.processed()) Print(j);
      return 0;
    }

    // ------------------------------------------------------------

    if (cmd == "cmd-enqueue") {
      if (argc < 5) return 1;

      EnqueueCommandRequest req;
      req.set_target_host(argv[3]);
      req.set_action_type(argv[4]);
      req.set_payload(Arg(argc, argv, 5));

      CommandResponse resp;
      auto            status = command_stub->EnqueueCommand(&ctx, req, &resp);
      if (!status.ok()) return Fail(status);

      Print(resp.command());
      return 0;
    }

    if (cmd == "cmd-mark") {
      if (argc < 5) return 1;

      auto target = ParseCommandStatus(argv[4]);
      if (!target) {
        std::cerr << "unsupported status: " << argv[4] << "\n";
        return 1;
      }

      MarkCommandRequest req;
      req.set_id(std::stoull(argv[3]));
      req.set_status(*target);
      req.set_detail(Arg(argc, argv, 5));

      CommandResponse resp;
      auto            status = command_stub->MarkCommand(&ctx, req, &resp);
      if (!status.ok()) return Fail(status);

      Print(resp.command());
      return 0;
    }

    if (cmd == "cmd-list") {
      if (argc < 4) return 1;

      ListCommandsRequest req;
      req.set_host(argv[3]);

      ListCommandsResponse resp;
      auto                 status = command_stub->ListCommands(&ctx, req, &resp);
      if (!status.ok()) return Fail(status);

      for (const auto& c : resp.commands()) Print(c);
      return 0;
    }

    if (cmd == "cmd-expire") {
      if (argc < 4) return 1;

      ExpireCommandsRequest req;
      req.set_ttl_sec(std::stoull(argv[3]));

      ExpireCommandsResponse resp;
      auto                   status = command_stub->ExpireCommands(&ctx, req, &resp);
      if (!status.ok()) return Fail(status);

      std::cout << "expired=" << resp.expired() << "\n";
      return 0;
    }

    // ------------------------------------------------------------

    if (cmd == "link-issue") {
      if (argc < 4) return 1;

      IssueLinkRequest req;
      req.set_creator(argv[3]);
      const auto ttl = Arg(argc, argv, 4, "-");
      if (ttl != "-") {
        req.set_has_ttl(true);
        req.set_ttl_sec(std::stoull(ttl));
      }
      const auto visibility = Arg(argc, argv, 5, "public");
      if (visibility == "public") {
        req.set_visibility(LINK_VISIBILITY_PUBLIC);
      } else if (visibility == "restricted") {
        req.set_visibility(LINK_VISIBILITY_RESTRICTED);
      } else {
        std::cerr << "unsupported visibility: " << visibility << "\n";
        return 1;
      }

      LinkResponse resp;
      auto         status = download_stub->IssueLink(&ctx, req, &resp);
      if (!status.ok()) return Fail(status);

      Print(resp.link());
      return 0;
    }

    if (cmd == "link-revoke") {
      if (argc < 4) return 1;

      RevokeLinkRequest req;
      req.set_id(std::stoull(argv[3]));

      LinkResponse resp;
      auto         status = download_stub->RevokeLink(&ctx, req, &resp);
      if (!status.ok()) return Fail(status);

      Print(resp.link());
      return 0;
    }

    if (cmd == "link-resolve") {
      if (argc < 4) return 1;

      ResolveLinkRequest req;
      req.set_token(argv[3]);
      if (argc > 4) ctx.AddMetadata("x-api-key", argv[4]);

      LinkResponse resp;
      auto         status = download_stub->ResolveLink(&ctx, req, &resp);
      if (!status.ok()) return Fail(status);

      Print(resp.link());
      return 0;
    }

    // ------------------------------------------------------------

    if (cmd == "ingest") {
      if (argc < 5) return 1;

      ctx.AddMetadata("x-api-key", argv[3]);

      IngestRequest req;
      req.set_payload(argv[4]);
      req.set_doc_key(Arg(argc, argv, 5));

      IngestResponse resp;
      auto           status = ingest_stub->Ingest(&ctx, req, &resp);
      if (!status.ok()) return Fail(status);

      std::cout << (resp.stored() ? "stored" : "duplicate") << "\n";
      return 0;
    }

    if (cmd == "ingest-batch") {
      if (argc < 5) return 1;

      std::ifstream file(argv[4]);
      if (!file) {
        std::cerr << "cannot open " << argv[4] << "\n";
        return 1;
      }
      ctx.AddMetadata("x-api-key", argv[3]);

      IngestBatchResponse resp;
      auto                status = ingest_stub->IngestBatch(&ctx, ReadNdjson(file), &resp);
      if (!status.ok()) return Fail(status);

      std::cout << "processed=" << resp.processed() << " stored=" << resp.stored() << " duplicates=" << resp.duplicates()
                << " errors=" << resp.errors_size() << "\n";
      for (const auto& e : resp.errors()) {
        std::cout << "  line " << (e.index() + 1) << ": " << e.message() << "\n";
      }
      return resp.errors_size() == 0 ? 0 : 3;
    }

    if (cmd == "health") {
      google::protobuf::Empty req;
      HealthResponse          resp;
      auto                    status = ingest_stub->Health(&ctx, req, &resp);
      if (!status.ok()) return Fail(status);

      std::cout << "last_received_at=" << FormatTime(resp.last_received_at()) << " stored_messages=" << resp.stored_messages()
                << "\n";
      return 0;
    }

    if (cmd == "poll") {
      if (argc < 5) return 1;

      ctx.AddMetadata("x-api-key", argv[3]);

      PollCommandsRequest req;
      req.set_host(argv[4]);

      PollCommandsResponse resp;
      auto                 status = agent_stub->PollCommands(&ctx, req, &resp);
      if (!status.ok()) return Fail(status);

      for (const auto& c : resp.commands()) Print(c);
      return 0;
    }

    if (cmd == "report") {
      if (argc < 7) return 1;

      ctx.AddMetadata("x-api-key", argv[3]);

      ReportCommandResultRequest req;
      req.set_command_id(std::stoull(argv[4]));
      req.set_host(argv[5]);
      req.set_success(std::string(argv[6]) == "ok");
      req.set_detail(Arg(argc, argv, 7));

      ReportCommandResultResponse resp;
      auto                        status = agent_stub->ReportCommandResult(&ctx, req, &resp);
      if (!status.ok()) return Fail(status);

      Print(resp.command());
      return 0;
    }
  } catch (const std::exception& e) {
    // std::stoull / std::stoll on malformed numbers
    std::cerr << "invalid argument: " << e.what() << "\n";
    return 1;
  }

  Usage();
  return 1;
}
