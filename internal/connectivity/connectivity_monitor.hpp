#pragma once

#include <atomic>
#include <cstdint>
#include <mutex>
#include <string_view>

namespace digiplayer::connectivity {

enum class ConnectivityState : std::uint8_t {
  kNoNetwork,
  kNetworkNoServer,
  kServerOnline,
};

constexpr std::string_view ToString(ConnectivityState state) {
  switch (state) {
    case ConnectivityState::kNoNetwork:
      return "NO_NETWORK";
    case ConnectivityState::kNetworkNoServer:
      return "NETWORK_NO_SERVER";
    case ConnectivityState::kServerOnline:
      return "SERVER_ONLINE";
  }
  return "UNKNOWN";
}

struct ProbeResult {
  bool network_reachable = false;
  bool server_reachable  = false;
};

enum class FallbackAction : std::uint8_t {
  kNone,
  kActivate,
  kDeactivate,
};

struct Transition {
  ConnectivityState previous = ConnectivityState::kNoNetwork;
  ConnectivityState current  = ConnectivityState::kNoNetwork;
  FallbackAction    fallback = FallbackAction::kNone;

  bool Changed() const {
    return previous != current;
  }
};

/*
  Connectivity state machine.

  Pure: probes are performed by the caller and fed in through Observe().

  Fallback hysteresis:
      grace_probes consecutive NO_NETWORK observations -> activate
      any observation outside NO_NETWORK            -> deactivate at once

  Heartbeat failures feed the same server signal through
  ReportHeartbeatDegraded(); the degradation holds until a probe sees the
  server again.
*/
class ConnectivityMonitor {
 public:
  explicit ConnectivityMonitor(std::uint32_t grace_probes);

  Transition Observe(const ProbeResult& probe);

  // SERVER_ONLINE -> NETWORK_NO_SERVER regardless of the last probe.
  Transition ReportHeartbeatDegraded();

  // New credentials were applied: drop fallback and restart the grace
  // count, so a network that still does not come up re-arms it.
  void ClearFallback();

  // Safe from any thread; consumed by the control loop.
  void RequestReprobe();
  bool ReprobeRequested() const;
  bool TakeReprobeRequest();

  ConnectivityState State() const;
  bool              FallbackActive() const;
  bool              HeartbeatDegraded() const;
  std::uint32_t     ConsecutiveOfflineProbes() const;

 private:
  const std::uint32_t grace_probes_;

  mutable std::mutex mutex_;
  ConnectivityState  state_           = ConnectivityState::kNoNetwork;
  bool               fallback_active_ = false;
  bool               degraded_        = false;
  std::uint32_t      offline_probes_  = 0;

  std::atomic<bool> reprobe_requested_{false};
};

} // namespace digiplayer::connectivity
