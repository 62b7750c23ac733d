#pragma once

#include <chrono>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <thread>

namespace fleet::dispatch {
class CommandDispatcher;
}

namespace fleet::scheduler {

class JobScheduler;

/*
  Timer thread that sweeps due jobs and expires stale commands.

  A failing sweep is logged and retried on the next tick.
*/
class SchedulerLoop {
 public:
  SchedulerLoop(std::shared_ptr<JobScheduler> scheduler, std::shared_ptr<dispatch::CommandDispatcher> dispatcher,
                std::chrono::milliseconds interval, std::chrono::milliseconds command_ttl);
  ~SchedulerLoop();

  void Start();
  void Stop();

  // Runs one tick on the caller's thread.
  void Tick();

 private:
  void Run();

  std::shared_ptr<JobScheduler>                scheduler_;
  std::shared_ptr<dispatch::CommandDispatcher> dispatcher_;
  std::chrono::milliseconds                    interval_;
  std::chrono::milliseconds                    command_ttl_;

  std::thread             thread_;
  std::mutex              mutex_;
  std::condition_variable cv_;
  bool                    running_ = false;
};

} // namespace fleet::scheduler
