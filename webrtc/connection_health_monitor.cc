#include "webrtc/connection_health_monitor.h"

namespace roomcast {
namespace mesh {
namespace webrtc {

const char* ToString(HealthState state) {
  switch (state) {
    case HealthState::New:
      return "new";
    case HealthState::Checking:
      return "checking";
    case HealthState::Connected:
      return "connected";
    case HealthState::Disconnected:
      return "disconnected";
    case HealthState::Failed:
      return "failed";
    case HealthState::Closed:
      return "closed";
  }
  return "unknown";
}

const char* ToString(HealthAction action) {
  switch (action) {
    case HealthAction::RestartIce:
      return "restart-ice";
    case HealthAction::StartGraceTimer:
      return "start-grace-timer";
    case HealthAction::CancelGraceTimer:
      return "cancel-grace-timer";
    case HealthAction::Teardown:
      return "teardown";
  }
  return "unknown";
}

ConnectionHealthMonitor::ConnectionHealthMonitor(
    const HealthMonitorConfig& config)
    : config_(config) {}

HealthActions ConnectionHealthMonitor::OnConnectionStateChange(
    PeerConnectionState state, Clock::time_point now) {
  if (isTerminal()) {
    return {};
  }

  switch (state) {
    case PeerConnectionState::New:
      return {};

    case PeerConnectionState::Connecting:
      // A pending grace timer keeps running: only Connected counts as
      // recovery.
      if (state_ != HealthState::Disconnected) {
        state_ = HealthState::Checking;
      }
      return {};

    case PeerConnectionState::Connected: {
      HealthActions actions;
      if (grace_pending_) {
        grace_pending_ = false;
        actions.push_back(HealthAction::CancelGraceTimer);
      }
      state_ = HealthState::Connected;
      disconnected_since_.reset();
      return actions;
    }

    case PeerConnectionState::Disconnected:
      if (state_ == HealthState::Disconnected || grace_pending_) {
        return {};
      }
      state_ = HealthState::Disconnected;
      disconnected_since_ = now;
      grace_pending_ = true;
      return {HealthAction::StartGraceTimer};

    case PeerConnectionState::Failed:
      return EnterTerminal(HealthState::Failed);

    case PeerConnectionState::Closed:
      return EnterTerminal(HealthState::Closed);
  }
  return {};
}

HealthActions ConnectionHealthMonitor::OnIceConnectionStateChange(
    IceConnectionState state) {
  if (isTerminal()) {
    return {};
  }

  switch (state) {
    case IceConnectionState::Connected:
    case IceConnectionState::Completed:
      ice_restart_count_ = 0;
      restart_issued_for_failure_ = false;
      return {};

    case IceConnectionState::New:
    case IceConnectionState::Checking:
      restart_issued_for_failure_ = false;
      return {};

    case IceConnectionState::Failed:
      if (restart_issued_for_failure_) {
        return {};
      }
      restart_issued_for_failure_ = true;
      if (config_.max_ice_restarts > 0 &&
          ice_restart_count_ >= config_.max_ice_restarts) {
        return EnterTerminal(HealthState::Failed);
      }
      ++ice_restart_count_;
      return {HealthAction::RestartIce};

    case IceConnectionState::Disconnected:
    case IceConnectionState::Closed:
      // Surfaced through the aggregate state.
      return {};
  }
  return {};
}

HealthActions ConnectionHealthMonitor::OnGraceTimerExpired() {
  if (!grace_pending_ || isTerminal()) {
    return {};
  }
  grace_pending_ = false;
  if (state_ == HealthState::Connected) {
    return {};
  }
  return EnterTerminal(HealthState::Failed);
}

HealthActions ConnectionHealthMonitor::EnterTerminal(HealthState terminal) {
  HealthActions actions;
  if (grace_pending_) {
    grace_pending_ = false;
    actions.push_back(HealthAction::CancelGraceTimer);
  }
  state_ = terminal;
  actions.push_back(HealthAction::Teardown);
  return actions;
}

}  // namespace webrtc
}  // namespace mesh
}  // namespace roomcast
