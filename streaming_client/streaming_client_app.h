#ifndef STREAMING_CLIENT_APP_H
#define STREAMING_CLIENT_APP_H

#include <atomic>
#include <functional>
#include <memory>
#include <optional>
#include <string>

#include <boost/asio/executor_work_guard.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/signal_set.hpp>
#include <boost/asio/steady_timer.hpp>

#include "config/client_config.h"
#include "room/room_session.h"
#include "signaling/signaling_client.h"
#include "webrtc/media_stream.h"
#include "webrtc/peer_connection.h"
#include "webrtc/peer_connection_manager.h"

namespace roomcast {
namespace mesh {
namespace client {

// Define application states
enum class AppState {
  Uninitialized,
  Initializing,
  Initialized,
  Running,
  Stopping,
  Stopped
};

const char* ToString(AppState state);

// One participant of one room: signaling connection, room session and the
// mesh of peer connections, all driven from a single io_context.
class StreamingClientApp {
 public:
  // Produces the local stream to publish, or nullptr if capture failed.
  using LocalStreamProvider =
      std::function<std::shared_ptr<webrtc::MediaStream>()>;

  StreamingClientApp();

  // Destructor - ensures cleanup
  virtual ~StreamingClientApp();

  // Takes ownership of the injected components and wires their callbacks.
  // Returns false if a component is missing.
  bool init(const config::ClientConfig& config,
            std::unique_ptr<signaling::SignalingClient> signalingClient,
            std::unique_ptr<webrtc::IPeerConnectionFactory> connectionFactory,
            LocalStreamProvider localStreamProvider);

  // Connects and runs the event loop until stop() or SIGINT/SIGTERM.
  // Returns 0 on graceful exit, non-zero if the signaling connection was lost.
  int run();

  // Leaves the room and stops the event loop. Safe from any thread; can be
  // called multiple times.
  void stop();

  // Publishes / withdraws the local stream. Posted onto the event loop.
  void startStreaming();
  void stopStreaming();

  AppState state() const { return state_; }

 private:
  // Application State
  std::atomic<AppState> state_{AppState::Uninitialized};
  int exitCode_ = 0;

  // Configuration
  config::ClientConfig config_;

  boost::asio::io_context ioContext_;
  std::optional<
      boost::asio::executor_work_guard<boost::asio::io_context::executor_type>>
      workGuard_;
  boost::asio::signal_set signals_;
  boost::asio::steady_timer keepaliveTimer_;

  // Core components - owned by the app
  std::unique_ptr<signaling::SignalingClient> signalingClient_;
  std::unique_ptr<webrtc::IPeerConnectionFactory> connectionFactory_;
  LocalStreamProvider localStreamProvider_;
  std::unique_ptr<webrtc::PeerConnectionManagerImpl> peerManager_;
  std::unique_ptr<room::RoomSession> roomSession_;

  // Internal setup methods
  bool setupPeerManager();
  bool setupRoomSession();
  bool setupSignalingClient();

  // Runs on the event loop.
  void shutdown();
  void scheduleKeepalive();

  // Handlers for signaling events (posted onto the event loop)
  void handleSignalingConnected();
  void handleSignalingDisconnected();
  void handleSignalingError(const std::string& error_msg);
  void handleSignalMessage(const signaling::SignalMessage& message);

  // Handlers for peer connection manager events
  void handleRemoteStream(const std::string& remote_id,
                          const std::shared_ptr<webrtc::MediaStream>& stream);
  void handleRemoteStreamEnded(const std::string& remote_id);
  void handlePeerError(const std::string& remote_id,
                       const std::string& error_msg);

  // Prevent copying
  StreamingClientApp(const StreamingClientApp&) = delete;
  StreamingClientApp& operator=(const StreamingClientApp&) = delete;
};

// Converts the loaded configuration into the manager's.
webrtc::PeerConnectionManagerConfig MakeManagerConfig(
    const config::ClientConfig& config);

}  // namespace client
}  // namespace mesh
}  // namespace roomcast

#endif  // STREAMING_CLIENT_APP_H
