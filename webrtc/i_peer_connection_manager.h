#ifndef I_PEER_CONNECTION_MANAGER_H
#define I_PEER_CONNECTION_MANAGER_H

#include <cstddef>
#include <functional>
#include <memory>
#include <string>
#include <vector>

#include "webrtc/media_stream.h"
#include "webrtc/peer_connection.h"

namespace roomcast {
namespace mesh {
namespace webrtc {

// Public surface of the mesh peer-connection lifecycle manager.
//
// One instance per room session. All methods are meant to be called on the
// manager's execution context, and all handlers are invoked there. Every
// operation is safe in any order for a given remote id: unknown ids and
// out-of-order messages are dropped, never thrown.
class IPeerConnectionManager {
 public:
  // --- Handler typedefs ---
  // First (or renegotiated) inbound stream of a remote participant.
  using OnRemoteStreamHandler = std::function<void(
      const std::string& remote_id, std::shared_ptr<MediaStream> stream)>;
  // Terminal: fired exactly once per connection. The host removes the tile.
  using OnRemoteStreamEndedHandler =
      std::function<void(const std::string& remote_id)>;
  // Informational: transient negotiation or transport errors.
  using OnPeerErrorHandler = std::function<void(const std::string& remote_id,
                                                const std::string& error_msg)>;
  // Outcome of one asynchronous operation. May be empty.
  using CompletionHandler =
      std::function<void(bool ok, const std::string& error)>;

  virtual ~IPeerConnectionManager() = default;

  // --- Local media ---

  // Attaches stream's tracks to every existing and future connection.
  // Returns after every existing connection has been updated.
  virtual void startStreaming(std::shared_ptr<MediaStream> stream) = 0;

  // Stops the local tracks and detaches them from every connection.
  virtual void stopStreaming() = 0;

  // --- Negotiation ---

  virtual void createOffer(const std::string& remote_id,
                           CompletionHandler done) = 0;
  virtual void handleOffer(const std::string& from_id,
                           const SessionDescription& offer,
                           CompletionHandler done) = 0;
  virtual void handleAnswer(const std::string& from_id,
                            const SessionDescription& answer,
                            CompletionHandler done) = 0;
  virtual void handleIceCandidate(const std::string& from_id,
                                  const IceCandidate& candidate) = 0;

  // --- Lifecycle ---

  // Closes and forgets the connection to remote_id, firing
  // onRemoteStreamEnded if it existed. No-op for unknown ids.
  virtual void removePeer(const std::string& remote_id) = 0;

  // Stops streaming and tears down every connection. Intended for room exit.
  virtual void cleanup() = 0;

  // --- Queries ---
  virtual bool hasPeer(const std::string& remote_id) const = 0;
  virtual std::size_t peerCount() const = 0;
  virtual std::vector<std::string> peerIds() const = 0;
  virtual bool isStreaming() const = 0;

  // --- Handler registration ---
  virtual void onRemoteStream(OnRemoteStreamHandler handler) = 0;
  virtual void onRemoteStreamEnded(OnRemoteStreamEndedHandler handler) = 0;
  virtual void onPeerError(OnPeerErrorHandler handler) = 0;

 protected:
  IPeerConnectionManager() = default;

  IPeerConnectionManager(const IPeerConnectionManager&) = delete;
  IPeerConnectionManager& operator=(const IPeerConnectionManager&) = delete;
};

}  // namespace webrtc
}  // namespace mesh
}  // namespace roomcast

#endif  // I_PEER_CONNECTION_MANAGER_H
