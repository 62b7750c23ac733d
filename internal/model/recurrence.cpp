#include "recurrence.hpp"

#include <chrono>

namespace fleet::model {

std::optional<Recurrence> ParseRecurrence(std::string_view s) {
  for (auto r : {Recurrence::kOnce, Recurrence::kDaily, Recurrence::kWeekly, Recurrence::kMonthly}) {
    if (ToString(r) == s) return r;
  }
  return std::nullopt;
}

namespace {

uint64_t AddOneMonthMs(uint64_t prior_ms) {
  using namespace std::chrono;

  const sys_time<milliseconds> tp{milliseconds(prior_ms)};
  const auto                   day_start   = floor<days>(tp);
  const auto                   time_of_day = tp - day_start;

  const year_month_day ymd{day_start};
  const year_month     next_month = year_month{ymd.year(), ymd.month()} + months{1};

  const auto last_day = year_month_day_last{next_month.year(), month_day_last{next_month.month()}}.day();
  const auto day      = ymd.day() > last_day ? last_day : ymd.day();

  const sys_days next_day{year_month_day{next_month.year(), next_month.month(), day}};
  return static_cast<uint64_t>((next_day + time_of_day).time_since_epoch().count());
}

} // namespace

std::optional<uint64_t> NextRunAtMs(Recurrence r, uint64_t prior_run_at_ms) {
  constexpr uint64_t kDayMs = 24ULL * 60 * 60 * 1000;

  switch (r) {
    case Recurrence::kOnce:
      return std::nullopt;
    case Recurrence::kDaily:
      return prior_run_at_ms + kDayMs;
    case Recurrence::kWeekly:
      return prior_run_at_ms + 7 * kDayMs;
    case Recurrence::kMonthly:
      return AddOneMonthMs(prior_run_at_ms);
  }
  return std::nullopt;
}

} // namespace fleet::model
