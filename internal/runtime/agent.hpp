#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <filesystem>
#include <memory>
#include <mutex>
#include <optional>
#include <string>

#include "digiplayer/agent/v1/status.pb.h"
#include "internal/connectivity/connectivity_monitor.hpp"
#include "internal/content/content_reconciler.hpp"
#include "internal/heartbeat/backoff.hpp"
#include "internal/heartbeat/response_parser.hpp"
#include "internal/model/registration.hpp"
#include "internal/util/time.hpp"

namespace digiplayer::identity {
class IdentityStore;
}
namespace digiplayer::state {
class AgentStateStore;
}
namespace digiplayer::connectivity {
class NetworkProbe;
class ServerProbe;
}
namespace digiplayer::provisioning {
class Provisioner;
}
namespace digiplayer::heartbeat {
class HeartbeatClient;
}
namespace digiplayer::command {
class CommandExecutor;
}

namespace digiplayer::runtime {

using SteadyTime = util::SteadyClock::time_point;

/*
  Everything the control loop knows, passed explicitly through the
  phases. Rebuilt from disk at start; the registration is re-read at the
  top of every cycle.
*/
struct AgentState {
  explicit AgentState(std::chrono::seconds heartbeat_interval, std::uint32_t max_backoff_multiplier)
      : backoff(heartbeat_interval, max_backoff_multiplier) {
  }

  model::Registration registration;

  connectivity::ConnectivityState connectivity   = connectivity::ConnectivityState::kNoNetwork;
  bool                            fallback_active = false;
  bool                            access_point_up = false;

  heartbeat::HeartbeatBackoff   backoff;
  std::optional<util::TimePoint> last_heartbeat_at;
  std::optional<util::TimePoint> last_seen_online;

  std::string                last_command_id;  // mirror of state.json
  std::optional<std::string> command_error;    // reported by the next heartbeat
  std::string                last_error;

  content::ReconcileReport content;

  SteadyTime next_probe{};
  SteadyTime next_heartbeat{};
  SteadyTime next_content_retry{};

  bool force_heartbeat = false;
  bool force_reconcile = false;
};

struct AgentComponents {
  std::shared_ptr<identity::IdentityStore>        identity;
  std::shared_ptr<state::AgentStateStore>         state_store;
  std::shared_ptr<connectivity::ConnectivityMonitor> monitor;
  std::shared_ptr<connectivity::NetworkProbe>     network_probe;
  std::shared_ptr<connectivity::ServerProbe>      server_probe;
  std::shared_ptr<provisioning::Provisioner>      provisioner;  // null when fallback is disabled
  std::shared_ptr<heartbeat::HeartbeatClient>     heartbeat;
  std::shared_ptr<command::CommandExecutor>       executor;
  std::shared_ptr<content::ContentReconciler>     reconciler;
};

struct AgentOptions {
  std::chrono::seconds  probe_interval{10};
  std::uint32_t         max_backoff_multiplier = 10;
  std::filesystem::path status_file;
};

/*
  Top-level scheduler.

      Probe -> Heartbeat -> Commands -> Reconcile

  Run() repeats RunCycle() and sleeps until the next probe or heartbeat
  deadline in slices of at most one second, waking early for reprobe
  requests, forced heartbeats and Stop(). Transient failures end up in
  AgentState; nothing but a failed identity bootstrap escapes.
*/
class Agent {
 public:
  Agent(AgentComponents components, AgentOptions options);

  // Creates the device id and restores content state. Throws StorageError.
  void Bootstrap();

  void RunCycle(AgentState& state, SteadyTime now, util::TimePoint wall_now);

  // Blocks until Stop().
  void Run();
  void Stop();

  // Thread safe; both wake the loop.
  void ForceHeartbeat();
  void RequestRefresh();

  AgentState&                       State();
  digiplayer::agent::v1::AgentStatus Status() const;

 private:
  void RefreshRegistration(AgentState& state);
  void ProbePhase(AgentState& state, SteadyTime now);
  void ApplyFallback(AgentState& state, connectivity::FallbackAction action);

  std::optional<heartbeat::HeartbeatResponse> HeartbeatPhase(AgentState& state, SteadyTime now, util::TimePoint wall_now);
  void AdoptPlayerId(AgentState& state, const heartbeat::HeartbeatResponse& response);
  void CommandPhase(AgentState& state, const heartbeat::HeartbeatResponse& response);
  void ReconcilePhase(AgentState& state, const std::optional<heartbeat::HeartbeatResponse>& response, SteadyTime now);

  void       PublishStatus(const AgentState& state, util::TimePoint wall_now);
  SteadyTime NextDeadline(const AgentState& state) const;
  bool       WakeRequested() const;

  AgentComponents c_;
  AgentOptions    options_;
  AgentState      state_;

  std::atomic<bool> running_{false};
  std::atomic<bool> force_heartbeat_{false};
  std::atomic<bool> refresh_requested_{false};

  std::mutex              wake_mutex_;
  std::condition_variable wake_cv_;

  mutable std::mutex                 status_mutex_;
  digiplayer::agent::v1::AgentStatus status_;
};

} // namespace digiplayer::runtime
