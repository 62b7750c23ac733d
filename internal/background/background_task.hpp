#pragma once

#include <functional>
#include <future>
#include <memory>
#include <string>

namespace fleet::runtime::config {
class RuntimeConfig;
}

namespace fleet::background {

/*
  Caller state captured at submission time.

  Tasks run after the request that queued them has returned, so anything
  they need from that request travels here explicitly.
*/
struct TaskContext {
  std::shared_ptr<const fleet::runtime::config::RuntimeConfig> config;
  std::string                                                  principal;
};

using TaskFn = std::function<void(const TaskContext&)>;

// Completes with true when the task ran to completion, false when it threw
// or was abandoned at shutdown.
using TaskHandle = std::shared_future<bool>;

struct BackgroundTask {
  std::string         description;
  TaskContext         context;
  TaskFn              fn;
  std::promise<bool>  done;
};

} // namespace fleet::background
