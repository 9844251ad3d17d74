#include "webrtc/peer_connection_manager.h"

#include <cstdint>
#include <iostream>
#include <utility>

#include <boost/asio/error.hpp>
#include <boost/asio/post.hpp>

namespace roomcast {
namespace mesh {
namespace webrtc {

// --- PeerConnectionManagerImpl Implementation ---

PeerConnectionManagerImpl::PeerConnectionManagerImpl(
    boost::asio::io_context& io_context,
    const PeerConnectionManagerConfig& config, IPeerConnectionFactory& factory,
    SignalSender sender)
    : io_context_(io_context),
      config_(config),
      factory_(factory),
      ice_(config.ice_servers),
      registry_([this](const std::string& remote_id) {
        return createSession(remote_id);
      }),
      binder_(registry_),
      negotiator_(io_context, config.local_id, config.room_id, registry_,
                  std::move(sender)) {
  negotiator_.setErrorReporter(
      [this](const std::string& remote_id, const std::string& error) {
        invokePeerErrorCallback(remote_id, error);
      });
  std::cout << "PeerConnectionManagerImpl created for " << config_.local_id
            << " in room " << config_.room_id << "." << std::endl;
}

PeerConnectionManagerImpl::~PeerConnectionManagerImpl() {
  std::cout << "PeerConnectionManagerImpl destroying..." << std::endl;
  cleanup();
}

// --- Local media ---

void PeerConnectionManagerImpl::startStreaming(
    std::shared_ptr<MediaStream> stream) {
  binder_.startLocal(std::move(stream));
}

void PeerConnectionManagerImpl::stopStreaming() { binder_.stopLocal(); }

// --- Negotiation ---

void PeerConnectionManagerImpl::createOffer(const std::string& remote_id,
                                            CompletionHandler done) {
  if (remote_id.empty() || remote_id == config_.local_id) {
    std::cerr << "PeerConnectionManagerImpl: Refusing to offer to '"
              << remote_id << "'." << std::endl;
    if (done) done(false, "invalid remote id");
    return;
  }
  negotiator_.createOffer(remote_id, std::move(done));
}

void PeerConnectionManagerImpl::handleOffer(const std::string& from_id,
                                            const SessionDescription& offer,
                                            CompletionHandler done) {
  if (from_id.empty() || from_id == config_.local_id) {
    std::cerr << "PeerConnectionManagerImpl: Dropping offer from '" << from_id
              << "'." << std::endl;
    if (done) done(false, "invalid remote id");
    return;
  }
  negotiator_.handleOffer(from_id, offer, std::move(done));
}

void PeerConnectionManagerImpl::handleAnswer(const std::string& from_id,
                                             const SessionDescription& answer,
                                             CompletionHandler done) {
  negotiator_.handleAnswer(from_id, answer, std::move(done));
}

void PeerConnectionManagerImpl::handleIceCandidate(
    const std::string& from_id, const IceCandidate& candidate) {
  negotiator_.handleIceCandidate(from_id, candidate);
}

// --- Lifecycle ---

void PeerConnectionManagerImpl::removePeer(const std::string& remote_id) {
  std::shared_ptr<PeerSession> session = registry_.take(remote_id);
  if (!session) {
    std::cout << "PeerConnectionManagerImpl: No connection to " << remote_id
              << ", nothing to remove." << std::endl;
    return;
  }
  endSession(session, "removed");
}

void PeerConnectionManagerImpl::cleanup() {
  binder_.stopLocal();

  std::vector<std::shared_ptr<PeerSession>> sessions = registry_.takeAll();
  if (sessions.empty()) {
    return;
  }
  std::cout << "PeerConnectionManagerImpl: Closing " << sessions.size()
            << " peer connections." << std::endl;
  for (const auto& session : sessions) {
    endSession(session, "cleanup");
  }
}

// --- Queries ---

bool PeerConnectionManagerImpl::hasPeer(const std::string& remote_id) const {
  return registry_.contains(remote_id);
}

std::size_t PeerConnectionManagerImpl::peerCount() const {
  return registry_.size();
}

std::vector<std::string> PeerConnectionManagerImpl::peerIds() const {
  return registry_.ids();
}

bool PeerConnectionManagerImpl::isStreaming() const {
  return binder_.isStreaming();
}

std::optional<SignalingState> PeerConnectionManagerImpl::signalingState(
    const std::string& remote_id) const {
  std::shared_ptr<PeerSession> session = registry_.get(remote_id);
  if (!session) {
    return std::nullopt;
  }
  return session->connection().GetSignalingState();
}

std::optional<HealthState> PeerConnectionManagerImpl::healthState(
    const std::string& remote_id) const {
  std::shared_ptr<PeerSession> session = registry_.get(remote_id);
  if (!session) {
    return std::nullopt;
  }
  return session->health().state();
}

// --- Handler registration ---

void PeerConnectionManagerImpl::onRemoteStream(OnRemoteStreamHandler handler) {
  std::lock_guard<std::mutex> lock(mutex_);
  onRemoteStreamHandler_ = std::move(handler);
}

void PeerConnectionManagerImpl::onRemoteStreamEnded(
    OnRemoteStreamEndedHandler handler) {
  std::lock_guard<std::mutex> lock(mutex_);
  onRemoteStreamEndedHandler_ = std::move(handler);
}

void PeerConnectionManagerImpl::onPeerError(OnPeerErrorHandler handler) {
  std::lock_guard<std::mutex> lock(mutex_);
  onPeerErrorHandler_ = std::move(handler);
}

// --- Session creation ---

std::shared_ptr<PeerSession> PeerConnectionManagerImpl::createSession(
    const std::string& remote_id) {
  HealthMonitorConfig health_config;
  health_config.max_ice_restarts = config_.max_ice_restarts;
  auto session =
      std::make_shared<PeerSession>(remote_id, io_context_, health_config);

  // Each callback is marshalled onto io_context and re-checks the session
  // there; a callback for a session that is gone touches nothing.
  boost::asio::io_context* io = &io_context_;
  std::weak_ptr<PeerSession> weak = session;
  PeerConnectionCallbacks callbacks;
  callbacks.onLocalCandidateGenerated = [this, io,
                                         weak](const IceCandidate& candidate) {
    boost::asio::post(*io, [this, weak, candidate]() {
      if (auto s = weak.lock()) handlePeerLocalCandidate(s, candidate);
    });
  };
  callbacks.onConnectionStateChange = [this, io,
                                       weak](PeerConnectionState state) {
    boost::asio::post(*io, [this, weak, state]() {
      if (auto s = weak.lock()) handlePeerConnectionStateChange(s, state);
    });
  };
  callbacks.onIceConnectionStateChange = [this, io,
                                          weak](IceConnectionState state) {
    boost::asio::post(*io, [this, weak, state]() {
      if (auto s = weak.lock()) handlePeerIceConnectionStateChange(s, state);
    });
  };
  callbacks.onSignalingStateChange = [remote_id](SignalingState state) {
    std::cout << "PeerConnectionManagerImpl: Signaling state with "
              << remote_id << " is now " << ToString(state) << "."
              << std::endl;
  };
  callbacks.onRemoteStream = [this, io,
                              weak](std::shared_ptr<MediaStream> stream) {
    boost::asio::post(*io, [this, weak, stream]() {
      if (auto s = weak.lock()) handlePeerRemoteStream(s, stream);
    });
  };
  callbacks.onRenegotiationNeeded = [remote_id]() {
    std::cout << "PeerConnectionManagerImpl: Renegotiation needed with "
              << remote_id << "; left to the room's offer policy."
              << std::endl;
  };
  callbacks.onError = [this, io, weak](const std::string& error_msg) {
    boost::asio::post(*io, [this, weak, error_msg]() {
      if (auto s = weak.lock()) handlePeerError(s, error_msg);
    });
  };

  std::shared_ptr<IPeerConnection> connection =
      factory_.CreatePeerConnection(ice_.servers(), callbacks);
  if (!connection) {
    std::cerr << "PeerConnectionManagerImpl: Failed to create PeerConnection "
                 "for "
              << remote_id << "." << std::endl;
    return nullptr;
  }
  session->setConnection(std::move(connection));
  return session;
}

// --- Internal Handlers for PeerConnection Events ---

void PeerConnectionManagerImpl::handlePeerLocalCandidate(
    const std::shared_ptr<PeerSession>& session,
    const IceCandidate& candidate) {
  if (session->closed()) {
    return;
  }
  negotiator_.sendLocalCandidate(session->remoteId(), candidate);
}

void PeerConnectionManagerImpl::handlePeerConnectionStateChange(
    const std::shared_ptr<PeerSession>& session, PeerConnectionState state) {
  if (session->closed()) {
    return;
  }
  std::cout << "PeerConnectionManagerImpl: Connection state with "
            << session->remoteId() << " is now " << ToString(state) << "."
            << std::endl;
  applyHealthActions(session, session->health().OnConnectionStateChange(state));
}

void PeerConnectionManagerImpl::handlePeerIceConnectionStateChange(
    const std::shared_ptr<PeerSession>& session, IceConnectionState state) {
  if (session->closed()) {
    return;
  }
  std::cout << "PeerConnectionManagerImpl: ICE state with "
            << session->remoteId() << " is now " << ToString(state) << "."
            << std::endl;
  applyHealthActions(session,
                     session->health().OnIceConnectionStateChange(state));
}

void PeerConnectionManagerImpl::handlePeerRemoteStream(
    const std::shared_ptr<PeerSession>& session,
    std::shared_ptr<MediaStream> stream) {
  if (session->closed() || !stream) {
    return;
  }
  // Reported once per track; only a new stream object is news.
  if (session->remoteStream() == stream) {
    return;
  }
  session->setRemoteStream(stream);
  std::cout << "PeerConnectionManagerImpl: Remote stream " << stream->id()
            << " from " << session->remoteId() << "." << std::endl;
  invokeRemoteStreamCallback(session->remoteId(), std::move(stream));
}

void PeerConnectionManagerImpl::handlePeerError(
    const std::shared_ptr<PeerSession>& session, const std::string& error_msg) {
  if (session->closed()) {
    return;
  }
  std::cerr << "PeerConnectionManagerImpl: Error on connection to "
            << session->remoteId() << ": " << error_msg << std::endl;
  invokePeerErrorCallback(session->remoteId(), error_msg);
}

// --- Health actions ---

void PeerConnectionManagerImpl::applyHealthActions(
    const std::shared_ptr<PeerSession>& session, const HealthActions& actions) {
  for (HealthAction action : actions) {
    if (session->closed()) {
      return;
    }
    switch (action) {
      case HealthAction::RestartIce: {
        const std::string remote_id = session->remoteId();
        negotiator_.restartIce(remote_id, [remote_id](bool ok,
                                                      const std::string& error) {
          if (!ok) {
            std::cerr << "PeerConnectionManagerImpl: ICE restart with "
                      << remote_id << " did not complete: " << error << "."
                      << std::endl;
          }
        });
        break;
      }
      case HealthAction::StartGraceTimer:
        startGraceTimer(session);
        break;
      case HealthAction::CancelGraceTimer:
        std::cout << "PeerConnectionManagerImpl: " << session->remoteId()
                  << " recovered within the grace period." << std::endl;
        session->cancelGraceTimer();
        break;
      case HealthAction::Teardown:
        teardownPeer(session, ToString(session->health().state()));
        return;
    }
  }
}

void PeerConnectionManagerImpl::startGraceTimer(
    const std::shared_ptr<PeerSession>& session) {
  std::cout << "PeerConnectionManagerImpl: " << session->remoteId()
            << " disconnected, waiting "
            << config_.disconnect_grace_period.count() << " ms to recover."
            << std::endl;
  std::weak_ptr<PeerSession> weak = session;
  const uint64_t generation =
      session->armGraceTimer(config_.disconnect_grace_period);
  session->graceTimer().async_wait(
      [this, weak, generation](const boost::system::error_code& ec) {
        if (ec == boost::asio::error::operation_aborted) {
          return;
        }
        std::shared_ptr<PeerSession> s = weak.lock();
        if (!s || s->closed()) {
          return;
        }
        // Fired for an arm that was cancelled or replaced after its
        // completion was queued.
        if (!s->isCurrentGraceArm(generation)) {
          return;
        }
        applyHealthActions(s, s->health().OnGraceTimerExpired());
      });
}

void PeerConnectionManagerImpl::teardownPeer(
    const std::shared_ptr<PeerSession>& session, const std::string& reason) {
  // A newer session for the same id may already be registered.
  registry_.take(session->remoteId(), session.get());
  endSession(session, reason);
}

void PeerConnectionManagerImpl::endSession(
    const std::shared_ptr<PeerSession>& session, const std::string& reason) {
  std::cout << "PeerConnectionManagerImpl: Destroying PeerConnection for peer "
            << session->remoteId() << ". Reason: " << reason << std::endl;
  session->close();
  if (session->markEnded()) {
    invokeRemoteStreamEndedCallback(session->remoteId());
  }
}

// --- Application callbacks ---
// Handlers are copied under the lock and invoked outside it, so a handler
// may call back into the manager.

void PeerConnectionManagerImpl::invokeRemoteStreamCallback(
    const std::string& remote_id, std::shared_ptr<MediaStream> stream) {
  OnRemoteStreamHandler handler;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    handler = onRemoteStreamHandler_;
  }
  if (handler) {
    handler(remote_id, std::move(stream));
  }
}

void PeerConnectionManagerImpl::invokeRemoteStreamEndedCallback(
    const std::string& remote_id) {
  OnRemoteStreamEndedHandler handler;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    handler = onRemoteStreamEndedHandler_;
  }
  if (handler) {
    handler(remote_id);
  }
}

void PeerConnectionManagerImpl::invokePeerErrorCallback(
    const std::string& remote_id, const std::string& error_msg) {
  OnPeerErrorHandler handler;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    handler = onPeerErrorHandler_;
  }
  if (handler) {
    handler(remote_id, error_msg);
  }
}

}  // namespace webrtc
}  // namespace mesh
}  // namespace roomcast
