#pragma once

#include <chrono>
#include <cstdint>

#include "google/protobuf/timestamp.pb.h"

namespace fleet::util {

/*
  Time utilities. Single place to control the clock source.

  Persistent rows store unix milliseconds; 0 means "not set".
*/

using Clock     = std::chrono::system_clock;
using TimePoint = Clock::time_point;

TimePoint Now();

google::protobuf::Timestamp ToProto(TimePoint tp);
TimePoint                   FromProto(const google::protobuf::Timestamp& ts);

uint64_t  ToUnixMillis(TimePoint tp);
TimePoint FromUnixMillis(uint64_t ms);

uint64_t NowMs();

// Leaves `out` untouched when ms == 0.
void SetTimestampMs(uint64_t ms, google::protobuf::Timestamp* out);

} // namespace fleet::util
