#pragma once

#include <condition_variable>
#include <deque>
#include <mutex>
#include <optional>

#include "background_task.hpp"

namespace fleet::background {

/*
  Thread-safe blocking queue for background workers.
*/
class TaskQueue {
 public:
  // false once the queue is shut down; the task is left untouched
  bool Enqueue(BackgroundTask& task);

  // blocking wait; nullopt after shutdown
  std::optional<BackgroundTask> Dequeue();

  // Stops the queue and hands back every task that never started.
  std::deque<BackgroundTask> Shutdown();

  std::size_t Size() const;

 private:
  mutable std::mutex         mutex_;
  std::condition_variable    cv_;
  std::deque<BackgroundTask> queue_;
  bool                       shutdown_ = false;
};

} // namespace fleet::background
