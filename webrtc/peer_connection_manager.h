#ifndef PEER_CONNECTION_MANAGER_IMPL_H
#define PEER_CONNECTION_MANAGER_IMPL_H

#include <chrono>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include <absl/base/thread_annotations.h>
#include <boost/asio/io_context.hpp>

#include "signaling/signaling_message.h"
#include "webrtc/connection_health_monitor.h"
#include "webrtc/connection_registry.h"
#include "webrtc/i_peer_connection_manager.h"
#include "webrtc/ice_server_config.h"
#include "webrtc/media_binder.h"
#include "webrtc/negotiator.h"
#include "webrtc/peer_connection.h"

namespace roomcast {
namespace mesh {
namespace webrtc {

struct PeerConnectionManagerConfig {
  std::string local_id;  // This participant's id; also the glare tie-breaker.
  std::string room_id;   // Stamped on outgoing negotiation messages.
  std::vector<IceServer> ice_servers;  // Empty means the default STUN pair.
  // How long a Disconnected connection may take to recover before it is
  // torn down. Same for every connection.
  std::chrono::milliseconds disconnect_grace_period{5000};
  // ICE restarts allowed between two successful ICE connections; 0 means
  // unlimited. Exceeding it tears the connection down.
  int max_ice_restarts = 0;
};

// Mesh peer-connection lifecycle manager. Composes the registry, media
// binder, negotiator and one health monitor per connection.
//
// Transport callbacks arrive on library threads and are posted onto
// io_context; nothing here blocks. The io_context must outlive the manager.
class PeerConnectionManagerImpl : public IPeerConnectionManager {
 public:
  // Injected capability that delivers a message to message.to out-of-band.
  using SignalSender = Negotiator::SignalSender;

  PeerConnectionManagerImpl(boost::asio::io_context& io_context,
                            const PeerConnectionManagerConfig& config,
                            IPeerConnectionFactory& factory,
                            SignalSender sender);

  // Calls cleanup().
  ~PeerConnectionManagerImpl() override;

  // --- Implementation of IPeerConnectionManager Interface ---
  void startStreaming(std::shared_ptr<MediaStream> stream) override;
  void stopStreaming() override;

  void createOffer(const std::string& remote_id,
                   CompletionHandler done) override;
  void handleOffer(const std::string& from_id, const SessionDescription& offer,
                   CompletionHandler done) override;
  void handleAnswer(const std::string& from_id,
                    const SessionDescription& answer,
                    CompletionHandler done) override;
  void handleIceCandidate(const std::string& from_id,
                          const IceCandidate& candidate) override;

  void removePeer(const std::string& remote_id) override;
  void cleanup() override;

  bool hasPeer(const std::string& remote_id) const override;
  std::size_t peerCount() const override;
  std::vector<std::string> peerIds() const override;
  bool isStreaming() const override;

  void onRemoteStream(OnRemoteStreamHandler handler) override;
  void onRemoteStreamEnded(OnRemoteStreamEndedHandler handler) override;
  void onPeerError(OnPeerErrorHandler handler) override;

  // --- Diagnostics ---
  std::optional<SignalingState> signalingState(
      const std::string& remote_id) const;
  std::optional<HealthState> healthState(const std::string& remote_id) const;

  const std::vector<IceServer>& iceServers() const { return ice_.servers(); }
  const PeerConnectionManagerConfig& config() const { return config_; }

 private:
  // Session factory handed to the registry: builds the session, wires the
  // transport callbacks to it and creates the transport.
  std::shared_ptr<PeerSession> createSession(const std::string& remote_id);

  // --- Handlers for PeerConnection events (run on io_context) ---
  void handlePeerLocalCandidate(const std::shared_ptr<PeerSession>& session,
                                const IceCandidate& candidate);
  void handlePeerConnectionStateChange(
      const std::shared_ptr<PeerSession>& session, PeerConnectionState state);
  void handlePeerIceConnectionStateChange(
      const std::shared_ptr<PeerSession>& session, IceConnectionState state);
  void handlePeerRemoteStream(const std::shared_ptr<PeerSession>& session,
                              std::shared_ptr<MediaStream> stream);
  void handlePeerError(const std::shared_ptr<PeerSession>& session,
                       const std::string& error_msg);

  // Carries out what the health monitor asked for.
  void applyHealthActions(const std::shared_ptr<PeerSession>& session,
                          const HealthActions& actions);
  void startGraceTimer(const std::shared_ptr<PeerSession>& session);

  // Terminal failure: evicts the session (only if it is still the
  // registered one) and ends it.
  void teardownPeer(const std::shared_ptr<PeerSession>& session,
                    const std::string& reason);
  // Closes the transport and fires onRemoteStreamEnded once.
  void endSession(const std::shared_ptr<PeerSession>& session,
                  const std::string& reason);

  void invokeRemoteStreamCallback(const std::string& remote_id,
                                  std::shared_ptr<MediaStream> stream);
  void invokeRemoteStreamEndedCallback(const std::string& remote_id);
  void invokePeerErrorCallback(const std::string& remote_id,
                               const std::string& error_msg);

  boost::asio::io_context& io_context_;
  const PeerConnectionManagerConfig config_;
  IPeerConnectionFactory& factory_;
  const IceConfigurationProvider ice_;

  ConnectionRegistry registry_;
  MediaBinder binder_;
  Negotiator negotiator_;

  // Protects the application handlers only; sessions live in registry_.
  mutable std::mutex mutex_;
  OnRemoteStreamHandler onRemoteStreamHandler_ ABSL_GUARDED_BY(mutex_);
  OnRemoteStreamEndedHandler onRemoteStreamEndedHandler_
      ABSL_GUARDED_BY(mutex_);
  OnPeerErrorHandler onPeerErrorHandler_ ABSL_GUARDED_BY(mutex_);

  PeerConnectionManagerImpl(const PeerConnectionManagerImpl&) = delete;
  PeerConnectionManagerImpl& operator=(const PeerConnectionManagerImpl&) =
      delete;
};

}  // namespace webrtc
}  // namespace mesh
}  // namespace roomcast

#endif  // PEER_CONNECTION_MANAGER_IMPL_H
