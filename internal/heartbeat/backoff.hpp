#pragma once

#include <chrono>
#include <cstdint>

namespace digiplayer::heartbeat {

/*
  Exponential backoff between heartbeat attempts.

      delay(n) = min(interval * 2^n, interval * max_multiplier)

  where n is the number of consecutive failures. Monotonically
  non-decreasing while failures accumulate; the first success resets it.
*/
class HeartbeatBackoff {
 public:
  HeartbeatBackoff(std::chrono::seconds interval, std::uint32_t max_multiplier);

  void SetInterval(std::chrono::seconds interval);

  void RecordFailure();
  void RecordSuccess();

  std::chrono::seconds NextDelay() const;
  std::uint32_t        ConsecutiveFailures() const {
    return failures_;
  }
  bool BackingOff() const {
    return failures_ > 0;
  }

 private:
  std::chrono::seconds interval_;
  std::uint32_t        max_multiplier_;
  std::uint32_t        failures_ = 0;
};

} // namespace digiplayer::heartbeat
