#include "background_pool.hpp"

#include <mutex>

#include "internal/observability/logging.hpp"

namespace fleet::background {

using observability::StringField;

BackgroundPool::BackgroundPool(std::size_t threads) {
  if (threads == 0) threads = kDefaultThreads;
  workers_.reserve(threads);
  for (std::size_t i = 0; i < threads; ++i) {
    workers_.emplace_back(&BackgroundPool::Run, this);
  }
  FLEET_LOG_INFO("background pool started", {observability::UintField("threads", threads)});
}

BackgroundPool::~BackgroundPool() {
  Shutdown();
}

TaskHandle BackgroundPool::Submit(std::string description, TaskContext context, TaskFn fn) {
  BackgroundTask task;
  task.description = std::move(description);
  task.context     = std::move(context);
  task.fn          = std::move(fn);
  TaskHandle handle = task.done.get_future().share();

  const std::string name = task.description;
  if (!queue_.Enqueue(task)) {
    FLEET_LOG_WARN("background pool stopped, task dropped", {StringField("task", name)});
    task.done.set_value(false);
  }
  return handle;
}

void BackgroundPool::Shutdown() {
  if (stopped_.exchange(true)) return;

  auto abandoned = queue_.Shutdown();
  for (auto& task : abandoned) {
    FLEET_LOG_WARN("background task abandoned at shutdown", {StringField("task", task.description)});
    task.done.set_value(false);
  }

  if (const auto running = running_.load(); running > 0) {
    FLEET_LOG_INFO("background pool waiting for running tasks", {observability::UintField("running", running)});
  }
  for (auto& worker : workers_) {
    if (worker.joinable()) worker.join();
  }
  FLEET_LOG_INFO("background pool stopped", {observability::UintField("abandoned", abandoned.size())});
}

void BackgroundPool::Run() {
  while (true) {
    auto task = queue_.Dequeue();
    if (!task) break;

    running_.fetch_add(1);
    bool ok = false;
    try {
      task->fn(task->context);
      ok = true;
    } catch (const std::exception& e) {
      FLEET_LOG_ERROR("background task failed", {StringField("task", task->description), StringField("error", e.what()),
                                                 StringField("principal", task->context.principal)});
    } catch (...) {
      FLEET_LOG_ERROR("background task failed", {StringField("task", task->description),
                                                 StringField("error", "non-standard exception"),
                                                 StringField("principal", task->context.principal)});
    }
    running_.fetch_sub(1);
    task->done.set_value(ok);
  }
}

namespace {

std::mutex                      g_pool_mutex;
std::shared_ptr<BackgroundPool> g_pool;

} // namespace

std::shared_ptr<BackgroundPool> InitializeBackgroundPool(std::size_t threads) {
  std::lock_guard lock(g_pool_mutex);
  if (!g_pool) {
    g_pool = std::make_shared<BackgroundPool>(threads);
  }
  return g_pool;
}

std::shared_ptr<BackgroundPool> CurrentBackgroundPool() {
  std::lock_guard lock(g_pool_mutex);
  return g_pool;
}

void ShutdownBackgroundPool() {
  std::shared_ptr<BackgroundPool> pool;
  {
    std::lock_guard lock(g_pool_mutex);
    pool.swap(g_pool);
  }
  if (pool) pool->Shutdown();
}

} // namespace fleet::background
