#pragma once

#include <cstdint>
#include <optional>
#include <string_view>

namespace fleet::model {

/*
  Closed recurrence policy set for scheduled jobs.

  The next occurrence is always derived from the previous scheduled
  run_at, never from the time the sweep happened to run.
*/
enum class Recurrence : std::uint8_t {
  kOnce    = 1,
  kDaily   = 2,
  kWeekly  = 3,
  kMonthly = 4,
};

constexpr std::string_view ToString(Recurrence r) {
  switch (r) {
    case Recurrence::kOnce:
      return "once";
    case Recurrence::kDaily:
      return "daily";
    case Recurrence::kWeekly:
      return "weekly";
    case Recurrence::kMonthly:
      return "monthly";
  }
  return "unknown";
}

constexpr bool IsRecurring(Recurrence r) {
  return r != Recurrence::kOnce;
}

std::optional<Recurrence> ParseRecurrence(std::string_view s);

// Next run_at (unix ms, UTC) following prior_run_at_ms, or nullopt for kOnce.
// Monthly keeps day-of-month and time of day, clamped to the last day of
// shorter months.
std::optional<uint64_t> NextRunAtMs(Recurrence r, uint64_t prior_run_at_ms);

} // namespace fleet::model
