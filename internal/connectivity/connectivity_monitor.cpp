#include "connectivity_monitor.hpp"

#include <algorithm>

namespace digiplayer::connectivity {

ConnectivityMonitor::ConnectivityMonitor(std::uint32_t grace_probes) : grace_probes_(std::max<std::uint32_t>(grace_probes, 1)) {
}

Transition ConnectivityMonitor::Observe(const ProbeResult& probe) {
  std::lock_guard<std::mutex> lock(mutex_);

  Transition transition;
  transition.previous = state_;

  if (!probe.network_reachable) {
    state_ = ConnectivityState::kNoNetwork;
    ++offline_probes_;
    if (!fallback_active_ && offline_probes_ >= grace_probes_) {
      fallback_active_    = true;
      transition.fallback = FallbackAction::kActivate;
    }
  } else {
    offline_probes_ = 0;
    if (fallback_active_) {
      fallback_active_    = false;
      transition.fallback = FallbackAction::kDeactivate;
    }

    if (probe.server_reachable) {
      degraded_ = false;
      state_    = ConnectivityState::kServerOnline;
    } else {
      state_ = ConnectivityState::kNetworkNoServer;
    }
  }

  transition.current = state_;
  return transition;
}

Transition ConnectivityMonitor::ReportHeartbeatDegraded() {
  std::lock_guard<std::mutex> lock(mutex_);

  Transition transition;
  transition.previous = state_;
  degraded_           = true;
  if (state_ == ConnectivityState::kServerOnline) {
    state_ = ConnectivityState::kNetworkNoServer;
  }
  transition.current = state_;
  return transition;
}

void ConnectivityMonitor::ClearFallback() {
  std::lock_guard<std::mutex> lock(mutex_);
  fallback_active_ = false;
  offline_probes_  = 0;
}

void ConnectivityMonitor::RequestReprobe() {
  reprobe_requested_.store(true);
}

bool ConnectivityMonitor::ReprobeRequested() const {
  return reprobe_requested_.load();
}

bool ConnectivityMonitor::TakeReprobeRequest() {
  return reprobe_requested_.exchange(false);
}

ConnectivityState ConnectivityMonitor::State() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return state_;
}

bool ConnectivityMonitor::FallbackActive() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return fallback_active_;
}

bool ConnectivityMonitor::HeartbeatDegraded() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return degraded_;
}

std::uint32_t ConnectivityMonitor::ConsecutiveOfflineProbes() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return offline_probes_;
}

} // namespace digiplayer::connectivity
