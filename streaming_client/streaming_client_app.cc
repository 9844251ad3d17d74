#include "streaming_client/streaming_client_app.h"

#include <chrono>
#include <csignal>
#include <iostream>
#include <utility>

#include <boost/asio/post.hpp>

namespace roomcast {
namespace mesh {
namespace client {

const char* ToString(AppState state) {
  switch (state) {
    case AppState::Uninitialized:
      return "uninitialized";
    case AppState::Initializing:
      return "initializing";
    case AppState::Initialized:
      return "initialized";
    case AppState::Running:
      return "running";
    case AppState::Stopping:
      return "stopping";
    case AppState::Stopped:
      return "stopped";
  }
  return "unknown";
}

webrtc::PeerConnectionManagerConfig MakeManagerConfig(
    const config::ClientConfig& config) {
  webrtc::PeerConnectionManagerConfig manager_config;
  manager_config.local_id = config.room.user_id;
  manager_config.room_id = config.room.room_id;
  for (const auto& server : config.ice_servers) {
    webrtc::IceServer ice_server;
    ice_server.urls = server.urls;
    ice_server.username = server.username;
    ice_server.credential = server.credential;
    manager_config.ice_servers.push_back(ice_server);
  }
  manager_config.disconnect_grace_period =
      std::chrono::milliseconds(config.disconnect_grace_period_ms);
  manager_config.max_ice_restarts = config.max_ice_restarts;
  return manager_config;
}

// --- Constructor and Destructor ---

StreamingClientApp::StreamingClientApp()
    : signals_(ioContext_), keepaliveTimer_(ioContext_) {
  std::cout << "StreamingClientApp created." << std::endl;
}

StreamingClientApp::~StreamingClientApp() {
  std::cout << "StreamingClientApp destroying..." << std::endl;
  if (state_ == AppState::Initialized) {
    // Never ran; nothing is queued on the event loop.
    shutdown();
  }
  std::cout << "StreamingClientApp destroyed." << std::endl;
}

// --- Initialization ---

bool StreamingClientApp::init(
    const config::ClientConfig& config,
    std::unique_ptr<signaling::SignalingClient> signalingClient,
    std::unique_ptr<webrtc::IPeerConnectionFactory> connectionFactory,
    LocalStreamProvider localStreamProvider) {
  if (state_ != AppState::Uninitialized) {
    std::cerr
        << "StreamingClientApp: Already initialized or in a different state."
        << std::endl;
    return false;
  }

  state_ = AppState::Initializing;
  std::cout << "StreamingClientApp: Initializing..." << std::endl;

  config_ = config;
  signalingClient_ = std::move(signalingClient);
  connectionFactory_ = std::move(connectionFactory);
  localStreamProvider_ = std::move(localStreamProvider);

  if (!setupPeerManager()) {
    std::cerr << "StreamingClientApp: Failed to setup peer connection manager."
              << std::endl;
    state_ = AppState::Uninitialized;
    return false;
  }
  if (!setupRoomSession()) {
    std::cerr << "StreamingClientApp: Failed to setup room session."
              << std::endl;
    state_ = AppState::Uninitialized;
    return false;
  }
  if (!setupSignalingClient()) {
    std::cerr << "StreamingClientApp: Failed to setup signaling client."
              << std::endl;
    state_ = AppState::Uninitialized;
    return false;
  }

  state_ = AppState::Initialized;
  std::cout << "StreamingClientApp: Initialization successful." << std::endl;
  return true;
}

// --- Running the Application ---

int StreamingClientApp::run() {
  if (state_ != AppState::Initialized) {
    std::cerr << "StreamingClientApp: Cannot run, not in Initialized state."
              << std::endl;
    return 1;
  }

  state_ = AppState::Running;
  std::cout << "StreamingClientApp: Running main loop..." << std::endl;

  workGuard_.emplace(boost::asio::make_work_guard(ioContext_));
  signals_.add(SIGINT);
  signals_.add(SIGTERM);
  signals_.async_wait([this](const boost::system::error_code& ec, int signo) {
    if (ec) {
      return;
    }
    std::cout << "StreamingClientApp: Caught signal " << signo << "."
              << std::endl;
    stop();
  });

  signalingClient_->connect();
  ioContext_.run();

  std::cout << "StreamingClientApp: Main loop finished." << std::endl;
  state_ = AppState::Stopped;
  return exitCode_;
}

// --- Stopping the Application ---

void StreamingClientApp::stop() {
  AppState expected = AppState::Running;
  if (!state_.compare_exchange_strong(expected, AppState::Stopping)) {
    std::cout << "StreamingClientApp: Not running (" << ToString(expected)
              << "). Skipping stop." << std::endl;
    return;
  }
  std::cout << "StreamingClientApp: Stopping..." << std::endl;
  boost::asio::post(ioContext_, [this]() { shutdown(); });
}

void StreamingClientApp::shutdown() {
  keepaliveTimer_.cancel();
  boost::system::error_code ignored;
  signals_.cancel(ignored);

  if (roomSession_) {
    roomSession_->leave();
  }
  if (signalingClient_) {
    signalingClient_->disconnect();
  }
  workGuard_.reset();
  std::cout << "StreamingClientApp: All components stopped." << std::endl;
}

void StreamingClientApp::startStreaming() {
  boost::asio::post(ioContext_, [this]() {
    if (!roomSession_->joined()) {
      std::cerr << "StreamingClientApp: Cannot stream before joining."
                << std::endl;
      return;
    }
    if (roomSession_->streaming()) {
      return;
    }
    std::shared_ptr<webrtc::MediaStream> stream =
        localStreamProvider_ ? localStreamProvider_() : nullptr;
    if (!stream) {
      std::cerr << "StreamingClientApp: No local stream available."
                << std::endl;
      return;
    }
    roomSession_->startStreaming(std::move(stream));
  });
}

void StreamingClientApp::stopStreaming() {
  boost::asio::post(ioContext_, [this]() { roomSession_->stopStreaming(); });
}

// --- Component Setup Methods ---

bool StreamingClientApp::setupPeerManager() {
  if (!connectionFactory_) {
    std::cerr << "StreamingClientApp: Connection factory not injected!"
              << std::endl;
    return false;
  }
  if (!signalingClient_) {
    std::cerr << "StreamingClientApp: SignalingClient not injected!"
              << std::endl;
    return false;
  }

  signaling::SignalingClient* signalingClient = signalingClient_.get();
  peerManager_ = std::make_unique<webrtc::PeerConnectionManagerImpl>(
      ioContext_, MakeManagerConfig(config_), *connectionFactory_,
      [signalingClient](const signaling::SignalMessage& message) {
        signalingClient->sendSignal(message);
      });

  peerManager_->onRemoteStream(
      [this](const std::string& remote_id,
             std::shared_ptr<webrtc::MediaStream> stream) {
        handleRemoteStream(remote_id, stream);
      });
  peerManager_->onRemoteStreamEnded(
      [this](const std::string& remote_id) { handleRemoteStreamEnded(remote_id); });
  peerManager_->onPeerError(
      [this](const std::string& remote_id, const std::string& error_msg) {
        handlePeerError(remote_id, error_msg);
      });
  return true;
}

bool StreamingClientApp::setupRoomSession() {
  room::RoomSessionConfig room_config;
  room_config.room_id = config_.room.room_id;
  room_config.user_id = config_.room.user_id;
  room_config.user_name = config_.room.user_name;

  signaling::SignalingClient* signalingClient = signalingClient_.get();
  roomSession_ = std::make_unique<room::RoomSession>(
      room_config, *peerManager_,
      [signalingClient](const signaling::SignalMessage& message) {
        signalingClient->sendSignal(message);
      });

  roomSession_->onParticipantsChanged(
      [](const std::vector<signaling::Participant>& participants) {
        std::cout << "App: " << participants.size()
                  << " other participants in the room." << std::endl;
      });
  roomSession_->onError([this](const std::string& error_msg) {
    std::cerr << "App: Room error: " << error_msg << std::endl;
    if (!roomSession_->joined()) {
      exitCode_ = 1;
      stop();
    }
  });
  return true;
}

// Signaling callbacks arrive on the client's network thread.
bool StreamingClientApp::setupSignalingClient() {
  signalingClient_->onConnected([this]() {
    boost::asio::post(ioContext_, [this]() { handleSignalingConnected(); });
  });
  signalingClient_->onDisconnected([this]() {
    boost::asio::post(ioContext_, [this]() { handleSignalingDisconnected(); });
  });
  signalingClient_->onError([this](const std::string& error_msg) {
    boost::asio::post(ioContext_,
                      [this, error_msg]() { handleSignalingError(error_msg); });
  });
  signalingClient_->onMessageReceived(
      [this](const signaling::SignalMessage& message) {
        boost::asio::post(ioContext_,
                          [this, message]() { handleSignalMessage(message); });
      });
  return true;
}

void StreamingClientApp::scheduleKeepalive() {
  if (config_.keepalive_interval_ms <= 0) {
    return;
  }
  keepaliveTimer_.expires_after(
      std::chrono::milliseconds(config_.keepalive_interval_ms));
  keepaliveTimer_.async_wait([this](const boost::system::error_code& ec) {
    if (ec || state_ != AppState::Running) {
      return;
    }
    roomSession_->ping();
    scheduleKeepalive();
  });
}

// --- Handlers for signaling events ---

void StreamingClientApp::handleSignalingConnected() {
  std::cout << "App: Connected to signaling server." << std::endl;
  if (state_ != AppState::Running) {
    return;
  }
  roomSession_->join();
  scheduleKeepalive();
}

void StreamingClientApp::handleSignalingDisconnected() {
  if (state_ != AppState::Running) {
    return;
  }
  std::cerr << "App: Lost connection to signaling server." << std::endl;
  exitCode_ = 1;
  stop();
}

void StreamingClientApp::handleSignalingError(const std::string& error_msg) {
  std::cerr << "App: Signaling error: " << error_msg << std::endl;
}

void StreamingClientApp::handleSignalMessage(
    const signaling::SignalMessage& message) {
  if (state_ != AppState::Running) {
    return;
  }
  roomSession_->handleMessage(message);
  if (message.type == signaling::SignalMessage::Type::ROOM_JOINED &&
      config_.stream_on_join) {
    startStreaming();
  }
}

// --- Handlers for peer connection manager events ---

void StreamingClientApp::handleRemoteStream(
    const std::string& remote_id,
    const std::shared_ptr<webrtc::MediaStream>& stream) {
  std::cout << "App: Receiving stream " << stream->id() << " from "
            << remote_id << " (" << stream->GetTracks().size() << " tracks)."
            << std::endl;
}

void StreamingClientApp::handleRemoteStreamEnded(const std::string& remote_id) {
  std::cout << "App: Stream from " << remote_id << " ended." << std::endl;
}

void StreamingClientApp::handlePeerError(const std::string& remote_id,
                                         const std::string& error_msg) {
  std::cerr << "App: Connection to " << remote_id << " reported: " << error_msg
            << std::endl;
}

}  // namespace client
}  // namespace mesh
}  // namespace roomcast
