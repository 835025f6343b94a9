#pragma once

#include <chrono>
#include <cstdint>

#include "google/protobuf/duration.pb.h"
#include "google/protobuf/timestamp.pb.h"

namespace rollout::util {

/*
  Time utilities. Single place to control the clock source.

  Wall clock for persisted timestamps, steady clock for deadlines.
*/

using Clock       = std::chrono::system_clock;
using TimePoint   = Clock::time_point;
using SteadyClock = std::chrono::steady_clock;
using Millis      = std::chrono::milliseconds;

TimePoint Now();

google::protobuf::Timestamp ToProto(TimePoint tp);
TimePoint                   FromProto(const google::protobuf::Timestamp& ts);

google::protobuf::Duration ToProto(Millis d);
Millis                     FromProto(const google::protobuf::Duration& d);

// Returns `fallback` when the duration is unset (zero).
Millis OrDefault(const google::protobuf::Duration& d, Millis fallback);

uint64_t ToUnixMillis(TimePoint tp);
TimePoint FromUnixMillis(uint64_t ms);
uint64_t NowMillis();

} // namespace rollout::util
