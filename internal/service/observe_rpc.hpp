#pragma once

#include <chrono>
#include <string_view>
#include <type_traits>

#include "internal/observability/logging.hpp"

namespace fleet::service {

/*
  Wraps one RPC body: failures are logged with route, error and latency,
  then rethrown for the transport layer to map.
*/
template <typename Fn>
auto ObserveRpc(std::string_view route, Fn&& fn) {
  const auto started_at = std::chrono::steady_clock::now();
  const auto elapsed_ms = [&] {
    return static_cast<int64_t>(
        std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - started_at).count());
  };

  try {
    if constexpr (std::is_void_v<std::invoke_result_t<Fn>>) {
      fn();
      FLEET_LOG_DEBUG("RPC ok", {observability::StringField("route", route), observability::IntField("latency_ms", elapsed_ms())});
      return;
    } else {
      auto result = fn();
      FLEET_LOG_DEBUG("RPC ok", {observability::StringField("route", route), observability::IntField("latency_ms", elapsed_ms())});
      return result;
    }
  } catch (const std::exception& ex) {
    FLEET_LOG_ERROR("RPC failed", {observability::StringField("route", route), observability::StringField("error", ex.what()),
                                   observability::IntField("latency_ms", elapsed_ms())});
    throw;
  }
}

} // namespace fleet::service
