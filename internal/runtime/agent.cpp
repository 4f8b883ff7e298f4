#include "agent.hpp"

#include <algorithm>
#include <exception>
#include <string>

#include "internal/command/command_executor.hpp"
#include "internal/command/command_order.hpp"
#include "internal/connectivity/probes.hpp"
#include "internal/heartbeat/heartbeat_client.hpp"
#include "internal/identity/identity_store.hpp"
#include "internal/observability/logging.hpp"
#include "internal/provisioning/provisioner.hpp"
#include "internal/state/agent_state_store.hpp"
#include "internal/storage/durable_file.hpp"
#include "internal/storage/json_document.hpp"
#include "internal/util/errors.hpp"

namespace digiplayer::runtime {

using connectivity::ConnectivityState;
using connectivity::FallbackAction;
using observability::BoolField;
using observability::IntField;
using observability::StringField;

namespace {

std::string ProvisioningState(const std::shared_ptr<provisioning::Provisioner>& provisioner) {
  if (!provisioner) return "disabled";
  const auto snapshot = provisioner->Snapshot();
  if (snapshot.applying) return "applying";
  if (snapshot.active) return "access_point";
  return "idle";
}

// A phase that throws ends only itself; the loop carries on next cycle.
template <typename Fn>
void GuardPhase(AgentState& state, const char* phase, Fn&& fn) {
  try {
    fn();
  } catch (const std::exception& e) {
    state.last_error = std::string(phase) + ": " + e.what();
    DIGIPLAYER_LOG_ERROR("Cycle phase failed", {StringField("phase", phase), StringField("error", e.what())});
  }
}

} // namespace

Agent::Agent(AgentComponents components, AgentOptions options)
    : c_(std::move(components)), options_(std::move(options)), state_(std::chrono::seconds(30), options_.max_backoff_multiplier) {
  c_.executor->OnRefresh([this] { RequestRefresh(); });
}

void Agent::Bootstrap() {
  const auto device_id = c_.identity->GetOrCreateDeviceId();
  state_.registration  = c_.identity->Current();
  state_.backoff.SetInterval(state_.registration.heartbeat_interval);

  state_.last_command_id  = c_.state_store->LastCommandId();
  state_.last_seen_online = c_.state_store->LastSeenOnline();
  c_.reconciler->Restore();

  DIGIPLAYER_LOG_INFO("Agent bootstrapped", {StringField("device_id", device_id),
                                             StringField("server_url", state_.registration.server_url),
                                             BoolField("registered", state_.registration.Registered())});
}

// ------------------------------------------------------------

void Agent::RunCycle(AgentState& state, SteadyTime now, util::TimePoint wall_now) {
  if (force_heartbeat_.exchange(false)) {
    state.force_heartbeat = true;
  }
  if (refresh_requested_.exchange(false)) {
    state.force_heartbeat = true;
    state.force_reconcile = true;
  }

  GuardPhase(state, "registration", [&] { RefreshRegistration(state); });
  GuardPhase(state, "probe", [&] { ProbePhase(state, now); });

  std::optional<heartbeat::HeartbeatResponse> response;
  GuardPhase(state, "heartbeat", [&] { response = HeartbeatPhase(state, now, wall_now); });
  if (response) {
    GuardPhase(state, "commands", [&] { CommandPhase(state, *response); });
  }

  GuardPhase(state, "content", [&] { ReconcilePhase(state, response, now); });
  GuardPhase(state, "status", [&] { PublishStatus(state, wall_now); });
}

void Agent::RefreshRegistration(AgentState& state) {
  c_.state_store->Reload();
  state.last_command_id = c_.state_store->LastCommandId();

  model::Registration current;
  try {
    current = c_.identity->Current();
  } catch (const util::StorageError& e) {
    state.last_error = e.what();
    DIGIPLAYER_LOG_WARN("Registration unreadable, keeping previous view", {StringField("error", e.what())});
    return;
  }

  const auto& previous = state.registration;
  if (!previous.device_id.empty() && (current.player_id != previous.player_id || current.device_id != previous.device_id)) {
    DIGIPLAYER_LOG_INFO("Registration changed on disk", {StringField("device_id", current.device_id),
                                                         IntField("player_id", current.player_id.value_or(0))});
    // cached media and the watermark stay; only the content report starts over
    c_.heartbeat->ResetContentReport();
    state.backoff.RecordSuccess();
    state.force_heartbeat = true;
  }
  if (!previous.server_url.empty() && (current.server_url != previous.server_url || current.api_prefix != previous.api_prefix)) {
    DIGIPLAYER_LOG_INFO("Server changed, probing", {StringField("server_url", current.server_url)});
    state.next_probe = SteadyTime{};
    state.backoff.RecordSuccess();
  }

  state.registration = std::move(current);
  state.backoff.SetInterval(state.registration.heartbeat_interval);
}

// ------------------------------------------------------------

void Agent::ProbePhase(AgentState& state, SteadyTime now) {
  const bool reprobe = c_.monitor->TakeReprobeRequest();
  if (!reprobe && now < state.next_probe) {
    return;
  }

  connectivity::ProbeResult probe;
  probe.network_reachable = c_.network_probe->Reachable();
  probe.server_reachable  = probe.network_reachable && c_.server_probe->Reachable(state.registration);

  const auto transition = c_.monitor->Observe(probe);
  state.next_probe      = now + options_.probe_interval;
  state.connectivity    = transition.current;

  if (transition.Changed()) {
    DIGIPLAYER_LOG_INFO("Connectivity changed", {StringField("from", connectivity::ToString(transition.previous)),
                                                 StringField("to", connectivity::ToString(transition.current))});
    if (transition.current == ConnectivityState::kServerOnline && !state.backoff.BackingOff()) {
      state.next_heartbeat = now;
    }
  }

  ApplyFallback(state, transition.fallback);
}

void Agent::ApplyFallback(AgentState& state, FallbackAction action) {
  state.fallback_active = c_.monitor->FallbackActive();
  if (action == FallbackAction::kActivate) {
    DIGIPLAYER_LOG_WARN("Network unreachable past grace period, entering access-point fallback",
                        {IntField("offline_probes", c_.monitor->ConsecutiveOfflineProbes())});
  }
  if (!c_.provisioner) {
    return;
  }

  if (action == FallbackAction::kDeactivate || (!state.fallback_active && state.access_point_up)) {
    try {
      c_.provisioner->Deactivate();
    } catch (const util::ExecutionError& e) {
      DIGIPLAYER_LOG_WARN("Access point teardown failed", {StringField("error", e.what())});
    }
    state.access_point_up = false;
    return;
  }

  if (state.fallback_active && !state.access_point_up) {
    try {
      c_.provisioner->Activate(state.registration.device_id);
      state.access_point_up = true;
    } catch (const util::ExecutionError& e) {
      state.last_error = e.what();
      DIGIPLAYER_LOG_ERROR("Access point could not be started, retrying next probe", {StringField("error", e.what())});
    }
  }
}

// ------------------------------------------------------------

std::optional<heartbeat::HeartbeatResponse> Agent::HeartbeatPhase(AgentState& state, SteadyTime now, util::TimePoint wall_now) {
  if (state.connectivity != ConnectivityState::kServerOnline) {
    return std::nullopt;
  }
  if (!state.force_heartbeat && now < state.next_heartbeat) {
    return std::nullopt;
  }

  heartbeat::HeartbeatContext context;
  context.last_command_id = state.last_command_id;
  context.command_error   = state.command_error;
  context.current_content = c_.reconciler->ActiveVersion();

  auto outcome = c_.heartbeat->Cycle(state.registration, context, state.backoff, *c_.monitor, wall_now);
  state.force_heartbeat   = false;
  state.last_heartbeat_at = wall_now;

  if (!outcome.delivered) {
    state.last_error     = outcome.error;
    state.next_heartbeat = now + state.backoff.NextDelay();
    state.connectivity   = c_.monitor->State();
    return std::nullopt;
  }

  state.last_error.clear();
  if (context.command_error) {
    state.command_error.reset();
  }
  state.next_heartbeat   = now + state.registration.heartbeat_interval;
  state.last_seen_online = wall_now;
  if (!c_.state_store->SetLastSeenOnline(wall_now)) {
    DIGIPLAYER_LOG_DEBUG("last_seen_online held in memory");
  }

  AdoptPlayerId(state, outcome.response);
  return std::move(outcome.response);
}

void Agent::AdoptPlayerId(AgentState& state, const heartbeat::HeartbeatResponse& response) {
  if (!response.player_id || state.registration.player_id == response.player_id) {
    return;
  }

  const bool was_registered = state.registration.Registered();
  try {
    c_.identity->SetPlayerId(*response.player_id);
  } catch (const util::StorageError& e) {
    DIGIPLAYER_LOG_WARN("Player id from server not persisted", {StringField("error", e.what())});
    return;
  } catch (const util::InvalidArgument& e) {
    DIGIPLAYER_LOG_WARN("Ignoring player id from server", {StringField("error", e.what())});
    return;
  }

  DIGIPLAYER_LOG_INFO(was_registered ? "Player id reassigned by server" : "Device registered",
                      {IntField("player_id", *response.player_id)});
  state.registration.player_id = response.player_id;
  c_.heartbeat->ResetContentReport();
  if (!was_registered) {
    state.force_heartbeat = true;
  }
}

void Agent::CommandPhase(AgentState& state, const heartbeat::HeartbeatResponse& response) {
  auto commands = response.commands;
  std::stable_sort(commands.begin(), commands.end(), [](const model::Command& lhs, const model::Command& rhs) {
    return command::CompareCommandIds(lhs.command_id, rhs.command_id) < 0;
  });

  for (const auto& pending : commands) {
    const auto result = c_.executor->Apply(pending, state.registration);
    if (result.status == command::ExecutionStatus::kFailed && result.error) {
      state.command_error = pending.command_id + " " + result.error->what();
    }
  }

  state.last_command_id = c_.state_store->LastCommandId();

  if (refresh_requested_.exchange(false)) {
    state.force_heartbeat = true;
    state.force_reconcile = true;
  }
}

void Agent::ReconcilePhase(AgentState& state, const std::optional<heartbeat::HeartbeatResponse>& response, SteadyTime now) {
  std::optional<model::ContentAssignment> assignment;
  if (response && response->content_assignment) {
    assignment = response->content_assignment;
  }

  const bool online    = state.connectivity == ConnectivityState::kServerOnline;
  const bool retry_due = ((c_.reconciler->HasPendingTarget() && online) || c_.reconciler->PublishPending()) &&
                         now >= state.next_content_retry;
  if (!assignment && !state.force_reconcile && !retry_due) {
    return;
  }

  state.content            = c_.reconciler->Reconcile(assignment, state.registration, state.force_reconcile);
  state.force_reconcile    = false;
  state.next_content_retry = now + state.registration.heartbeat_interval;
}

// ------------------------------------------------------------

void Agent::PublishStatus(const AgentState& state, util::TimePoint wall_now) {
  digiplayer::agent::v1::AgentStatus status;
  status.set_device_id(state.registration.device_id);
  if (state.registration.player_id) {
    status.set_player_id(*state.registration.player_id);
  }
  status.set_server_url(state.registration.server_url);
  status.set_connectivity(std::string(connectivity::ToString(state.connectivity)));
  status.set_fallback_active(state.fallback_active);
  if (state.last_heartbeat_at) status.set_last_heartbeat_at(util::FormatRfc3339(*state.last_heartbeat_at));
  if (state.last_seen_online) status.set_last_seen_online(util::FormatRfc3339(*state.last_seen_online));
  status.set_consecutive_failures(state.backoff.ConsecutiveFailures());
  status.set_last_error(state.last_error);
  status.set_last_command_id(state.last_command_id);
  status.set_active_playlist(c_.reconciler->ActiveVersion().value_or(""));
  status.set_pending_playlist(c_.reconciler->TargetVersion().value_or(""));
  status.set_pending_items_missing(c_.reconciler->HasPendingTarget() ? static_cast<std::uint32_t>(state.content.missing) : 0);
  status.set_provisioning(ProvisioningState(c_.provisioner));
  status.set_updated_at(util::FormatRfc3339(wall_now));

  {
    std::lock_guard<std::mutex> lock(status_mutex_);
    status_ = status;
  }

  if (options_.status_file.empty()) {
    return;
  }
  try {
    storage::ScopedFileLock lock(options_.status_file, storage::ScopedFileLock::Mode::kExclusive);
    storage::SaveJsonDocument(options_.status_file, status);
  } catch (const util::StorageError& e) {
    DIGIPLAYER_LOG_DEBUG("status.json not written", {StringField("error", e.what())});
  }
}

// ------------------------------------------------------------

void Agent::Run() {
  running_.store(true);
  DIGIPLAYER_LOG_INFO("Control loop started");

  while (running_.load()) {
    RunCycle(state_, util::SteadyClock::now(), util::Now());

    const auto                   deadline = NextDeadline(state_);
    std::unique_lock<std::mutex> lock(wake_mutex_);
    while (running_.load() && !WakeRequested()) {
      const auto now = util::SteadyClock::now();
      if (now >= deadline) {
        break;
      }
      const auto slice = std::min<util::SteadyClock::duration>(deadline - now, std::chrono::seconds(1));
      wake_cv_.wait_for(lock, slice);
    }
  }

  DIGIPLAYER_LOG_INFO("Control loop stopped");
}

void Agent::Stop() {
  running_.store(false);
  wake_cv_.notify_all();
}

void Agent::ForceHeartbeat() {
  force_heartbeat_.store(true);
  wake_cv_.notify_all();
}

void Agent::RequestRefresh() {
  refresh_requested_.store(true);
  wake_cv_.notify_all();
}

AgentState& Agent::State() {
  return state_;
}

digiplayer::agent::v1::AgentStatus Agent::Status() const {
  std::lock_guard<std::mutex> lock(status_mutex_);
  return status_;
}

SteadyTime Agent::NextDeadline(const AgentState& state) const {
  SteadyTime deadline = state.next_probe;
  if (c_.reconciler->PublishPending()) {
    deadline = std::min(deadline, state.next_content_retry);
  }
  if (state.connectivity == ConnectivityState::kServerOnline) {
    deadline = std::min(deadline, state.next_heartbeat);
    if (c_.reconciler->HasPendingTarget()) {
      deadline = std::min(deadline, state.next_content_retry);
    }
  }
  return deadline;
}

bool Agent::WakeRequested() const {
  const bool online = state_.connectivity == ConnectivityState::kServerOnline;
  return force_heartbeat_.load() || refresh_requested_.load() || c_.monitor->ReprobeRequested() ||
         (online && (state_.force_heartbeat || state_.force_reconcile));
}

} // namespace digiplayer::runtime
