#pragma once

#include <atomic>
#include <memory>
#include <string>
#include <thread>
#include <vector>

#include "background_task.hpp"
#include "task_queue.hpp"

namespace fleet::background {

/*
  Fixed-size worker pool for side work that must not block a request.

  - Task failures are logged with the task description and never reach
    the submitter.
  - Shutdown() abandons queued tasks (their handles complete with false)
    and then blocks until every running task has returned. Workers are
    joined, never detached. Tasks are expected to be short.
*/
class BackgroundPool {
 public:
  static constexpr std::size_t kDefaultThreads = 4;

  explicit BackgroundPool(std::size_t threads = kDefaultThreads);
  ~BackgroundPool();

  BackgroundPool(const BackgroundPool&)            = delete;
  BackgroundPool& operator=(const BackgroundPool&) = delete;

  TaskHandle Submit(std::string description, TaskContext context, TaskFn fn);

  // Blocks while tasks are running; see above.
  void Shutdown();

  std::size_t Threads() const {
    return workers_.size();
  }

  std::size_t Pending() const {
    return queue_.Size();
  }

  std::size_t Running() const {
    return running_.load();
  }

 private:
  void Run();

  TaskQueue                queue_;
  std::vector<std::thread> workers_;
  std::atomic<bool>        stopped_{false};
  std::atomic<std::size_t> running_{0};
};

// Process-wide pool. Initialize is idempotent and returns the live pool;
// ShutdownBackgroundPool stops it and allows a later re-initialize.
std::shared_ptr<BackgroundPool> InitializeBackgroundPool(std::size_t threads);
std::shared_ptr<BackgroundPool> CurrentBackgroundPool();
void                            ShutdownBackgroundPool();

} // namespace fleet::background
