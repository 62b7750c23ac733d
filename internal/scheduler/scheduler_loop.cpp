#include "internal/scheduler/scheduler_loop.hpp"

#include "internal/dispatch/command_dispatcher.hpp"
#include "internal/observability/logging.hpp"
#include "internal/scheduler/job_scheduler.hpp"
#include "internal/util/time.hpp"

namespace fleet::scheduler {

SchedulerLoop::SchedulerLoop(std::shared_ptr<JobScheduler> scheduler, std::shared_ptr<dispatch::CommandDispatcher> dispatcher,
                             std::chrono::milliseconds interval, std::chrono::milliseconds command_ttl)
    : scheduler_(std::move(scheduler)),
      dispatcher_(std::move(dispatcher)),
      interval_(interval.count() > 0 ? interval : std::chrono::milliseconds(1000)),
      command_ttl_(command_ttl) {
}

SchedulerLoop::~SchedulerLoop() {
  Stop();
}

void SchedulerLoop::Start() {
  std::lock_guard lock(mutex_);
  if (running_) return;
  running_ = true;
  thread_  = std::thread(&SchedulerLoop::Run, this);
}

void SchedulerLoop::Stop() {
  {
    std::lock_guard lock(mutex_);
    running_ = false;
  }
  cv_.notify_all();
  if (thread_.joinable()) thread_.join();
}

void SchedulerLoop::Tick() {
  const auto now = util::NowMs();
  try {
    auto processed = scheduler_->Sweep(now);
    if (!processed.empty()) {
      FLEET_LOG_DEBUG("sweep tick", {observability::UintField("processed", processed.size())});
    }
  } catch (const std::exception& e) {
    FLEET_LOG_ERROR("job sweep failed", {observability::StringField("error", e.what())});
  }

  // 0 disables command expiry
  if (command_ttl_.count() <= 0) return;
  try {
    dispatcher_->Expire(now, static_cast<uint64_t>(command_ttl_.count()));
  } catch (const std::exception& e) {
    FLEET_LOG_ERROR("command expiry failed", {observability::StringField("error", e.what())});
  }
}

void SchedulerLoop::Run() {
  std::unique_lock lock(mutex_);
  while (running_) {
    lock.unlock();
    Tick();
    lock.lock();
    cv_.wait_for(lock, interval_, [this] { return !running_; });
  }
}

} // namespace fleet::scheduler
