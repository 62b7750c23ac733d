#include <cassert>
#include <iostream>
#include <memory>
#include <string>

#include "internal/db/memory/memory_repository.hpp"
#include "internal/dispatch/command_dispatcher.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"

namespace {

using fleet::dispatch::CommandDispatcher;
using fleet::model::CommandStatus;

std::shared_ptr<fleet::db::Repository> MakeRepository() {
  return std::make_shared<fleet::db::memory::MemoryRepository>();
}

template <typename Fn>
bool ThrowsTerminal(Fn&& fn) {
  try {
    fn();
  } catch (const fleet::util::TerminalStateViolation&) {
    return true;
  }
  return false;
}

void TestEnqueueValidation() {
  CommandDispatcher dispatcher(MakeRepository());

  auto cmd = dispatcher.Enqueue("web-01", "restart", "{}");
  assert(cmd.id != 0);
  assert(cmd.status == CommandStatus::kPending);
  assert(!cmd.source_job_id.has_value());
  assert(cmd.created_at_ms != 0);

  bool threw = false;
  try {
    dispatcher.Enqueue("", "restart", "{}");
  } catch (const fleet::util::InvalidArgument&) {
    threw = true;
  }
  assert(threw);

  threw = false;
  try {
    dispatcher.Enqueue("web-01", "", "{}");
  } catch (const fleet::util::InvalidArgument&) {
    threw = true;
  }
  assert(threw);
}

void TestLifecycleTimestamps() {
  CommandDispatcher dispatcher(MakeRepository());
  auto              cmd = dispatcher.Enqueue("web-01", "restart", "{}", 42);
  assert(cmd.source_job_id == 42u);

  auto sent = dispatcher.MarkSent(cmd.id);
  assert(sent.status == CommandStatus::kSent);
  assert(sent.sent_at_ms != 0);
  assert(sent.completed_at_ms == 0);

  auto acked = dispatcher.MarkAcknowledged(cmd.id, "done");
  assert(acked.status == CommandStatus::kAcknowledged);
  assert(acked.completed_at_ms != 0);
  assert(acked.detail == "done");

  // pending may skip sent
  auto other  = dispatcher.Enqueue("web-01", "reboot", "");
  auto failed = dispatcher.MarkFailed(other.id, "disk full");
  assert(failed.status == CommandStatus::kFailed);
  assert(failed.sent_at_ms == 0);
  assert(dispatcher.Get(other.id).detail == "disk full");
}

void TestTerminalStatusesRejectFurtherMarks() {
  CommandDispatcher dispatcher(MakeRepository());

  auto acked = dispatcher.Enqueue("h", "a", "");
  dispatcher.MarkAcknowledged(acked.id, "ok");
  assert(ThrowsTerminal([&] { dispatcher.MarkFailed(acked.id, "late"); }));
  assert(ThrowsTerminal([&] { dispatcher.MarkSent(acked.id); }));
  assert(ThrowsTerminal([&] { dispatcher.MarkAcknowledged(acked.id, "again"); }));
  assert(dispatcher.Get(acked.id).detail == "ok");

  auto failed = dispatcher.Enqueue("h", "a", "");
  dispatcher.MarkFailed(failed.id, "boom");
  assert(ThrowsTerminal([&] { dispatcher.MarkAcknowledged(failed.id, "ok"); }));

  auto expired = dispatcher.Enqueue("h", "a", "");
  dispatcher.Mark(expired.id, CommandStatus::kExpired, "");
  assert(ThrowsTerminal([&] { dispatcher.MarkSent(expired.id); }));
  assert(dispatcher.Get(expired.id).status == CommandStatus::kExpired);

  // sent cannot go back to pending
  auto sent = dispatcher.Enqueue("h", "a", "");
  dispatcher.MarkSent(sent.id);
  assert(ThrowsTerminal([&] { dispatcher.Mark(sent.id, CommandStatus::kPending, ""); }));
}

void TestUnknownCommand() {
  CommandDispatcher dispatcher(MakeRepository());
  bool              threw = false;
  try {
    dispatcher.MarkSent(12345);
  } catch (const fleet::util::NotFound&) {
    threw = true;
  }
  assert(threw);
}

void TestPollMarksPendingAsSent() {
  CommandDispatcher dispatcher(MakeRepository());
  auto              a = dispatcher.Enqueue("web-01", "restart", "");
  auto              b = dispatcher.Enqueue("web-01", "flush", "");
  dispatcher.Enqueue("web-02", "restart", "");
  dispatcher.MarkFailed(b.id, "cancelled by operator");

  auto delivered = dispatcher.PollForHost("web-01");
  assert(delivered.size() == 1);
  assert(delivered[0].id == a.id);
  assert(delivered[0].status == CommandStatus::kSent);
  assert(dispatcher.Get(a.id).status == CommandStatus::kSent);

  // a second poll hands out nothing new
  assert(dispatcher.PollForHost("web-01").empty());
  assert(dispatcher.ListForHost("web-01").size() == 2);
  assert(dispatcher.ListForHost("web-02").size() == 1);

  bool threw = false;
  try {
    dispatcher.PollForHost("");
  } catch (const fleet::util::InvalidArgument&) {
    threw = true;
  }
  assert(threw);
}

void TestExpireStaleCommands() {
  CommandDispatcher dispatcher(MakeRepository());
  auto              pending = dispatcher.Enqueue("h", "a", "");
  auto              sent    = dispatcher.Enqueue("h", "a", "");
  auto              done    = dispatcher.Enqueue("h", "a", "");
  dispatcher.MarkSent(sent.id);
  dispatcher.MarkAcknowledged(done.id, "");

  const auto now = fleet::util::NowMs();
  // nothing is older than an hour yet
  assert(dispatcher.Expire(now, 3600 * 1000) == 0);

  assert(dispatcher.Expire(now + 10000, 1000) == 2);
  assert(dispatcher.Get(pending.id).status == CommandStatus::kExpired);
  assert(dispatcher.Get(sent.id).status == CommandStatus::kExpired);
  assert(dispatcher.Get(done.id).status == CommandStatus::kAcknowledged);
  assert(dispatcher.Get(pending.id).completed_at_ms == now + 10000);

  // ttl beyond now expires nothing
  assert(dispatcher.Expire(1000, 5000) == 0);
}

void TestListByJob() {
  CommandDispatcher dispatcher(MakeRepository());
  dispatcher.Enqueue("a", "x", "", 7);
  dispatcher.Enqueue("b", "x", "", 7);
  dispatcher.Enqueue("c", "x", "", 8);
  dispatcher.Enqueue("d", "x", "");

  assert(dispatcher.ListByJob(7).size() == 2);
  assert(dispatcher.ListByJob(8).size() == 1);
  assert(dispatcher.ListByJob(9).empty());
}

} // namespace

int main() {
  TestEnqueueValidation();
  TestLifecycleTimestamps();
  TestTerminalStatusesRejectFurtherMarks();
  TestUnknownCommand();
  TestPollMarksPendingAsSent();
  TestExpireStaleCommands();
  TestListByJob();

  std::cout << "fleet_unit_command_dispatcher: pass\n";
  return 0;
}
