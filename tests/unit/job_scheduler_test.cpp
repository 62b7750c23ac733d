#include <atomic>
#include <cassert>
#include <iostream>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

#include "internal/config/config_loader.hpp"
#include "internal/db/memory/memory_repository.hpp"
#include "internal/dispatch/command_dispatcher.hpp"
#include "internal/scheduler/job_scheduler.hpp"
#include "internal/util/errors.hpp"

namespace {

using fleet::model::CommandStatus;
using fleet::model::JobStatus;
using fleet::model::Recurrence;
using fleet::scheduler::JobScheduler;
using fleet::scheduler::JobSpec;

constexpr uint64_t kT   = 1700000000000ULL; // 2023-11-14T22:13:20Z
constexpr uint64_t kDay = 24ULL * 60 * 60 * 1000;

// Dispatcher whose queue refuses one host.
class RefusingDispatcher final : public fleet::dispatch::CommandDispatcher {
 public:
  RefusingDispatcher(std::shared_ptr<fleet::db::Repository> repository, std::string refused)
      : CommandDispatcher(std::move(repository)), refused_(std::move(refused)) {}

  fleet::db::model::CommandRecord Enqueue(const std::string& target_host, const std::string& action_type,
                                          const std::string& payload, std::optional<uint64_t> source_job_id) override {
    if (target_host == refused_) throw std::runtime_error("queue unavailable for " + target_host);
    return CommandDispatcher::Enqueue(target_host, action_type, payload, source_job_id);
  }

 private:
  std::string refused_;
};

// Store whose job updates fail with an I/O error for one job id.
class FlakyRepository final : public fleet::db::memory::MemoryRepository {
 public:
  fleet::db::Result UpdateJob(fleet::db::Transaction& tx, JobStatus expected, const fleet::db::model::JobRecord& r) override {
    if (r.id == failing_job.load() && failures_left.load() > 0) {
      failures_left.fetch_sub(1);
      return fleet::db::Result::Err(fleet::db::ErrorCode::IOError, "disk I/O error");
    }
    return MemoryRepository::UpdateJob(tx, expected, r);
  }

  std::atomic<uint64_t> failing_job{0};
  std::atomic<int>      failures_left{0};
};

struct Fixture {
  std::shared_ptr<fleet::db::Repository>                repository = std::make_shared<fleet::db::memory::MemoryRepository>();
  std::shared_ptr<fleet::dispatch::CommandDispatcher>   dispatcher = std::make_shared<fleet::dispatch::CommandDispatcher>(repository);
  JobScheduler                                          scheduler{repository, dispatcher};
};

JobSpec Spec(Recurrence recurrence, std::vector<std::string> hosts = {"web-01", "web-02"}) {
  JobSpec spec;
  spec.name         = "nightly-backup";
  spec.action_type  = "backup";
  spec.run_at_ms    = kT;
  spec.recurrence   = recurrence;
  spec.target_hosts = std::move(hosts);
  spec.payload      = R"({"path":"/var/lib"})";
  spec.creator      = "ops@example.com";
  return spec;
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

void TestCreateValidation() {
  Fixture f;

  auto job = f.scheduler.Create(Spec(Recurrence::kOnce, {"a", "b", "a"}));
  assert(job.id != 0);
  assert(job.status == JobStatus::kScheduled);
  assert(job.target_hosts.size() == 2);

  auto no_name = Spec(Recurrence::kOnce);
  no_name.name.clear();
  assert(Throws<fleet::util::InvalidArgument>([&] { f.scheduler.Create(no_name); }));

  auto no_creator = Spec(Recurrence::kOnce);
  no_creator.creator.clear();
  assert(Throws<fleet::util::InvalidArgument>([&] { f.scheduler.Create(no_creator); }));

  auto no_time = Spec(Recurrence::kOnce);
  no_time.run_at_ms = 0;
  assert(Throws<fleet::util::InvalidArgument>([&] { f.scheduler.Create(no_time); }));

  assert(Throws<fleet::util::InvalidArgument>([&] { f.scheduler.Create(Spec(Recurrence::kOnce, {})); }));
  assert(Throws<fleet::util::InvalidArgument>([&] { f.scheduler.Create(Spec(Recurrence::kOnce, {"ok", ""})); }));
  assert(Throws<fleet::util::InvalidArgument>([&] { f.scheduler.Create(Spec(Recurrence::kOnce, {"a\nb"})); }));

  assert(f.scheduler.List().size() == 1);
}

void TestSweepIgnoresFutureJobs() {
  Fixture f;
  f.scheduler.Create(Spec(Recurrence::kOnce));

  assert(f.scheduler.Sweep(kT - 1).empty());
  assert(f.dispatcher->ListForHost("web-01").empty());
}

void TestOnceJobCompletes() {
  Fixture f;
  auto    job = f.scheduler.Create(Spec(Recurrence::kOnce));

  auto swept = f.scheduler.Sweep(kT + 1000);
  assert(swept.size() == 1);
  assert(swept[0].status == JobStatus::kCompleted);
  assert(swept[0].last_run_at_ms == kT + 1000);

  auto commands = f.dispatcher->ListByJob(job.id);
  assert(commands.size() == 2);
  for (const auto& c : commands) {
    assert(c.status == CommandStatus::kPending);
    assert(c.action_type == "backup");
    assert(c.payload == R"({"path":"/var/lib"})");
  }

  // completed jobs are never swept again
  assert(f.scheduler.Sweep(kT + 10 * kDay).empty());
  assert(f.scheduler.Get(job.id).status == JobStatus::kCompleted);
}

void TestDailyJobReArmsFromPriorRunAt() {
  Fixture f;
  auto    job = f.scheduler.Create(Spec(Recurrence::kDaily));

  auto swept = f.scheduler.Sweep(kT + 1000);
  assert(swept.size() == 1);

  auto stored = f.scheduler.Get(job.id);
  assert(stored.status == JobStatus::kScheduled);
  assert(stored.run_at_ms == kT + kDay);
  assert(stored.last_run_at_ms == kT + 1000);

  // not due again until the next occurrence
  assert(f.scheduler.Sweep(kT + kDay - 1).empty());
  assert(f.scheduler.Sweep(kT + kDay + 5 * 60 * 1000).size() == 1);
  assert(f.scheduler.Get(job.id).run_at_ms == kT + 2 * kDay);
  assert(f.dispatcher->ListByJob(job.id).size() == 4);
}

void TestWeeklyJobReArms() {
  Fixture f;
  auto    job = f.scheduler.Create(Spec(Recurrence::kWeekly, {"db-01"}));
  f.scheduler.Sweep(kT);
  assert(f.scheduler.Get(job.id).run_at_ms == kT + 7 * kDay);
}

void TestConcurrentSweepsClaimOnce() {
  Fixture f;
  auto    once  = f.scheduler.Create(Spec(Recurrence::kOnce));
  auto    daily = f.scheduler.Create(Spec(Recurrence::kDaily, {"db-01"}));

  std::atomic<std::size_t> processed{0};
  std::vector<std::thread> threads;
  for (int i = 0; i < 8; ++i) {
    threads.emplace_back([&] { processed.fetch_add(f.scheduler.Sweep(kT + 1000).size()); });
  }
  for (auto& t : threads) t.join();

  assert(processed.load() == 2);
  assert(f.dispatcher->ListByJob(once.id).size() == 2);
  assert(f.dispatcher->ListByJob(daily.id).size() == 1);
  assert(f.scheduler.Get(daily.id).run_at_ms == kT + kDay);
}

void TestEnqueueFailureFailsJob() {
  auto repository = std::make_shared<fleet::db::memory::MemoryRepository>();
  auto dispatcher = std::make_shared<RefusingDispatcher>(repository, "web-02");
  JobScheduler scheduler(repository, dispatcher);

  // a failing recurring job stays failed instead of re-arming
  auto job   = scheduler.Create(Spec(Recurrence::kDaily));
  auto swept = scheduler.Sweep(kT);
  assert(swept.size() == 1);
  assert(swept[0].status == JobStatus::kFailed);
  assert(scheduler.Get(job.id).status == JobStatus::kFailed);
  assert(scheduler.Get(job.id).run_at_ms == kT);

  // the host that accepted its command keeps it
  auto commands = dispatcher->ListByJob(job.id);
  assert(commands.size() == 1);
  assert(commands[0].target_host == "web-01");

  assert(scheduler.Sweep(kT + 2 * kDay).empty());
}

void TestCancelOnlyWhileScheduled() {
  Fixture f;
  auto    job = f.scheduler.Create(Spec(Recurrence::kDaily));

  auto cancelled = f.scheduler.Cancel(job.id);
  assert(cancelled.status == JobStatus::kCancelled);
  assert(f.scheduler.Sweep(kT + 1000).empty());
  assert(Throws<fleet::util::TerminalStateViolation>([&] { f.scheduler.Cancel(job.id); }));

  auto done = f.scheduler.Create(Spec(Recurrence::kOnce));
  f.scheduler.Sweep(kT);
  assert(Throws<fleet::util::TerminalStateViolation>([&] { f.scheduler.Cancel(done.id); }));
  assert(Throws<fleet::util::NotFound>([&] { f.scheduler.Cancel(999); }));
}

void TestReschedule() {
  Fixture f;
  auto    job = f.scheduler.Create(Spec(Recurrence::kOnce));

  auto moved = f.scheduler.Reschedule(job.id, kT + kDay);
  assert(moved.run_at_ms == kT + kDay);
  assert(f.scheduler.Sweep(kT + 1000).empty());
  assert(f.scheduler.Sweep(kT + kDay).size() == 1);

  assert(Throws<fleet::util::TerminalStateViolation>([&] { f.scheduler.Reschedule(job.id, kT + 2 * kDay); }));

  auto other = f.scheduler.Create(Spec(Recurrence::kOnce));
  assert(Throws<fleet::util::InvalidArgument>([&] { f.scheduler.Reschedule(other.id, 0); }));
}

void TestDeleteKeepsIssuedCommands() {
  Fixture f;
  auto    job = f.scheduler.Create(Spec(Recurrence::kOnce));
  f.scheduler.Sweep(kT);

  f.scheduler.Delete(job.id);
  assert(Throws<fleet::util::NotFound>([&] { f.scheduler.Get(job.id); }));
  assert(Throws<fleet::util::NotFound>([&] { f.scheduler.Delete(job.id); }));
  assert(f.dispatcher->ListByJob(job.id).size() == 2);
}

void TestFinishRetriesTransientStoreError() {
  auto         repository = std::make_shared<FlakyRepository>();
  auto         dispatcher = std::make_shared<fleet::dispatch::CommandDispatcher>(repository);
  JobScheduler scheduler(repository, dispatcher);

  auto job = scheduler.Create(Spec(Recurrence::kOnce));
  repository->failing_job   = job.id;
  repository->failures_left = 1;

  auto swept = scheduler.Sweep(kT);
  assert(swept.size() == 1);
  assert(swept[0].status == JobStatus::kCompleted);
  assert(scheduler.Get(job.id).status == JobStatus::kCompleted);
  assert(repository->failures_left.load() == 0);
}

void TestStuckFinishIsReleasedLater() {
  auto         repository = std::make_shared<FlakyRepository>();
  auto         dispatcher = std::make_shared<fleet::dispatch::CommandDispatcher>(repository);
  JobScheduler scheduler(repository, dispatcher);

  auto stuck = scheduler.Create(Spec(Recurrence::kOnce));
  auto other = scheduler.Create(Spec(Recurrence::kOnce, {"db-01"}));
  repository->failing_job   = stuck.id;
  repository->failures_left = 1000;

  // the store error on one job neither escapes nor skips the next one
  auto swept = scheduler.Sweep(kT);
  assert(swept.size() == 1);
  assert(swept[0].id == other.id);
  assert(scheduler.Get(other.id).status == JobStatus::kCompleted);
  assert(scheduler.Get(stuck.id).status == JobStatus::kRunning);
  assert(Throws<fleet::util::TerminalStateViolation>([&] { scheduler.Cancel(stuck.id); }));

  repository->failures_left = 0;
  const uint64_t stale_ms   = fleet::config::ConfigLoader::kDefaultStaleClaimSec * 1000ULL;

  assert(scheduler.Sweep(kT + stale_ms - 1).empty());
  assert(scheduler.Get(stuck.id).status == JobStatus::kRunning);

  // released back to scheduled, then run again in the same sweep
  swept = scheduler.Sweep(kT + stale_ms);
  assert(swept.size() == 1);
  assert(swept[0].id == stuck.id);
  assert(scheduler.Get(stuck.id).status == JobStatus::kCompleted);
  assert(dispatcher->ListByJob(stuck.id).size() == 4);
  assert(dispatcher->ListByJob(other.id).size() == 1);
}

void TestStaleClaimThresholdFromConfig() {
  auto config = std::make_shared<fleet::runtime::config::RuntimeConfig>();
  config->mutable_scheduler()->set_stale_claim_sec(60);

  auto         repository = std::make_shared<FlakyRepository>();
  auto         dispatcher = std::make_shared<fleet::dispatch::CommandDispatcher>(repository);
  JobScheduler scheduler(repository, dispatcher, nullptr, config);

  auto job = scheduler.Create(Spec(Recurrence::kDaily, {"db-01"}));
  repository->failing_job   = job.id;
  repository->failures_left = 1000;
  assert(scheduler.Sweep(kT).empty());

  assert(scheduler.ReleaseStaleClaims(kT + 59'999) == 0);
  assert(scheduler.ReleaseStaleClaims(kT + 60'000) == 1);
  assert(scheduler.Get(job.id).status == JobStatus::kScheduled);
  assert(scheduler.Get(job.id).run_at_ms == kT);
  assert(scheduler.ReleaseStaleClaims(kT + 120'000) == 0);
}

} // namespace

int main() {
  TestCreateValidation();
  TestSweepIgnoresFutureJobs();
  TestOnceJobCompletes();
  TestDailyJobReArmsFromPriorRunAt();
  TestWeeklyJobReArms();
  TestConcurrentSweepsClaimOnce();
  TestEnqueueFailureFailsJob();
  TestCancelOnlyWhileScheduled();
  TestReschedule();
  TestDeleteKeepsIssuedCommands();
  TestFinishRetriesTransientStoreError();
  TestStuckFinishIsReleasedLater();
  TestStaleClaimThresholdFromConfig();

  std::cout << "fleet_unit_job_scheduler: pass\n";
  return 0;
}
