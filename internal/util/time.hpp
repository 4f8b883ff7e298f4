#pragma once

#include <chrono>
#include <string>

#include "google/protobuf/timestamp.pb.h"

namespace digiplayer::util {

/*
  Wall-clock time is used for anything persisted or reported; the control
  loop schedules with the monotonic SteadyClock.
*/

using Clock       = std::chrono::system_clock;
using TimePoint   = Clock::time_point;
using SteadyClock = std::chrono::steady_clock;

TimePoint Now();

google::protobuf::Timestamp ToProto(TimePoint tp);
TimePoint                   FromProto(const google::protobuf::Timestamp& ts);

// RFC 3339, UTC ("2024-05-01T12:00:00Z").
std::string FormatRfc3339(TimePoint tp);

} // namespace digiplayer::util
