#ifndef CONNECTION_HEALTH_MONITOR_H
#define CONNECTION_HEALTH_MONITOR_H

#include <chrono>
#include <optional>
#include <vector>

#include "webrtc/peer_connection.h"

namespace roomcast {
namespace mesh {
namespace webrtc {

// Aggregate health of one connection.
//   New -> Checking -> Connected -> Disconnected -> Failed | Closed
// Disconnected may recover to Connected. Failed and Closed are terminal.
enum class HealthState { New, Checking, Connected, Disconnected, Failed, Closed };

const char* ToString(HealthState state);

// Side effects requested by a transition. The owner of the connection
// carries them out; the monitor itself never touches the transport or a
// timer.
enum class HealthAction {
  RestartIce,        // In-place ICE restart, media session kept.
  StartGraceTimer,   // Arm the single disconnection grace timer.
  CancelGraceTimer,  // Recovered before expiry.
  Teardown,          // Terminal: end the remote stream and release.
};

const char* ToString(HealthAction action);

using HealthActions = std::vector<HealthAction>;

struct HealthMonitorConfig {
  // Maximum ICE restarts between two successful ICE connections.
  // 0 means no limit.
  int max_ice_restarts = 0;
};

// Explicit per-connection state machine that turns transport and ICE state
// observations into lifecycle actions. Each instance is independent; it is
// not thread-safe and is driven from the manager's execution context.
class ConnectionHealthMonitor {
 public:
  using Clock = std::chrono::steady_clock;

  explicit ConnectionHealthMonitor(const HealthMonitorConfig& config = {});

  // Aggregate transport state observation.
  HealthActions OnConnectionStateChange(PeerConnectionState state,
                                        Clock::time_point now = Clock::now());

  // ICE layer observation. Only Failed produces a restart; Checking re-arms
  // the one-restart-per-failure latch; Connected/Completed also resets the
  // restart counter.
  HealthActions OnIceConnectionStateChange(IceConnectionState state);

  // The grace timer fired. Produces Teardown if the connection did not
  // return to Connected in the meantime; stale expiries produce nothing.
  HealthActions OnGraceTimerExpired();

  HealthState state() const { return state_; }
  bool isTerminal() const {
    return state_ == HealthState::Failed || state_ == HealthState::Closed;
  }
  bool gracePending() const { return grace_pending_; }
  // Set while Disconnected.
  std::optional<Clock::time_point> disconnectedSince() const {
    return disconnected_since_;
  }
  int iceRestartCount() const { return ice_restart_count_; }

 private:
  HealthActions EnterTerminal(HealthState terminal);

  HealthMonitorConfig config_;
  HealthState state_ = HealthState::New;
  bool grace_pending_ = false;
  std::optional<Clock::time_point> disconnected_since_;

  bool restart_issued_for_failure_ = false;
  int ice_restart_count_ = 0;
};

}  // namespace webrtc
}  // namespace mesh
}  // namespace roomcast

#endif  // CONNECTION_HEALTH_MONITOR_H
