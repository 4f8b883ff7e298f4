#include "time.hpp"

#include <google/protobuf/util/time_util.h>

#include <cstdint>

namespace digiplayer::util {

TimePoint Now() {
  return Clock::now();
}

google::protobuf::Timestamp ToProto(TimePoint tp) {
  auto sec   = std::chrono::time_point_cast<std::chrono::seconds>(tp);
  auto nanos = std::chrono::duration_cast<std::chrono::nanoseconds>(tp - sec);

  google::protobuf::Timestamp ts;
  ts.set_seconds(sec.time_since_epoch().count());
  ts.set_nanos(static_cast<int32_t>(nanos.count()));
  return ts;
}

TimePoint FromProto(const google::protobuf::Timestamp& ts) {
  return TimePoint{} + std::chrono::duration_cast<Clock::duration>(std::chrono::seconds(ts.seconds()) + std::chrono::nanoseconds(ts.nanos()));
}

std::string FormatRfc3339(TimePoint tp) {
  auto ts = ToProto(std::chrono::time_point_cast<std::chrono::seconds>(tp));
  return google::protobuf::util::TimeUtil::ToString(ts);
}

} // namespace digiplayer::util
