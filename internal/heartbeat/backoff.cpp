#include "backoff.hpp"

#include <algorithm>

namespace digiplayer::heartbeat {

HeartbeatBackoff::HeartbeatBackoff(std::chrono::seconds interval, std::uint32_t max_multiplier)
    : interval_(std::max(interval, std::chrono::seconds(1))), max_multiplier_(std::max<std::uint32_t>(max_multiplier, 1)) {
}

void HeartbeatBackoff::SetInterval(std::chrono::seconds interval) {
  interval_ = std::max(interval, std::chrono::seconds(1));
}

void HeartbeatBackoff::RecordFailure() {
  if (failures_ < UINT32_MAX) {
    ++failures_;
  }
}

void HeartbeatBackoff::RecordSuccess() {
  failures_ = 0;
}

std::chrono::seconds HeartbeatBackoff::NextDelay() const {
  // 2^n overtakes any sane multiplier long before 63 doublings
  const std::uint32_t exponent   = std::min<std::uint32_t>(failures_, 32);
  const std::uint64_t multiplier = std::min<std::uint64_t>(std::uint64_t{1} << exponent, max_multiplier_);
  return interval_ * static_cast<std::int64_t>(multiplier);
}

} // namespace digiplayer::heartbeat
