#include "task_queue.hpp"

namespace fleet::background {

bool TaskQueue::Enqueue(BackgroundTask& task) {
  {
    std::lock_guard lock(mutex_);
    if (shutdown_) return false;
    queue_.push_back(std::move(task));
  }
  cv_.notify_one();
  return true;
}

std::optional<BackgroundTask> TaskQueue::Dequeue() {
  std::unique_lock lock(mutex_);

  cv_.wait(lock, [&] { return shutdown_ || !queue_.empty(); });

  if (shutdown_) return std::nullopt;

  BackgroundTask task = std::move(queue_.front());
  queue_.pop_front();
  return task;
}

std::deque<BackgroundTask> TaskQueue::Shutdown() {
  std::deque<BackgroundTask> abandoned;
  {
    std::lock_guard lock(mutex_);
    shutdown_ = true;
    abandoned.swap(queue_);
  }
  cv_.notify_all();
  return abandoned;
}

std::size_t TaskQueue::Size() const {
  std::lock_guard lock(mutex_);
  return queue_.size();
}

} // namespace fleet::background
