#ifndef I_PEER_CONNECTION_H
#define I_PEER_CONNECTION_H

#include <functional>
#include <memory>
#include <string>
#include <vector>

#include "webrtc/ice_server_config.h"
#include "webrtc/media_stream.h"

namespace roomcast {
namespace mesh {
namespace webrtc {

// Common WebRTC states. Concrete implementations map the underlying library's
// enums onto these.
enum class PeerConnectionState {
  New,
  Connecting,
  Connected,
  Disconnected,
  Failed,
  Closed
};
enum class IceConnectionState {
  New,
  Checking,
  Connected,
  Completed,
  Failed,
  Disconnected,
  Closed
};
enum class SignalingState {
  Stable,
  HaveLocalOffer,
  HaveLocalPrAnswer,
  HaveRemoteOffer,
  HaveRemotePrAnswer,
  Closed
};

const char* ToString(PeerConnectionState state);
const char* ToString(IceConnectionState state);
const char* ToString(SignalingState state);

enum class SdpType { Offer, PrAnswer, Answer, Rollback };

// "offer", "pranswer", "answer", "rollback".
std::string SdpTypeToString(SdpType type);
// Returns false if type_str is not one of the four known values.
bool SdpTypeFromString(const std::string& type_str, SdpType* type);

struct SessionDescription {
  SdpType type = SdpType::Offer;
  std::string sdp;
};

// A trickle-ICE candidate as exchanged over signaling.
struct IceCandidate {
  std::string candidate;
  std::string sdpMid;
  int sdpMLineIndex = -1;

  // A candidate needs a candidate line and something identifying the m-line
  // it belongs to.
  bool isWellFormed() const {
    return !candidate.empty() && (!sdpMid.empty() || sdpMLineIndex >= 0);
  }
};

struct OfferAnswerOptions {
  bool offer_to_receive_audio = true;
  bool offer_to_receive_video = true;
  bool ice_restart = false;
};

// Callbacks for the state-change and discovery events of one connection.
// Implementations may invoke these from any thread; consumers must marshal
// them onto their own execution context before touching shared state.
struct PeerConnectionCallbacks {
  // A local ICE candidate was discovered.
  std::function<void(const IceCandidate& candidate)> onLocalCandidateGenerated;

  // Aggregate (transport level) connection state changed.
  std::function<void(PeerConnectionState state)> onConnectionStateChange;

  // ICE connection state changed.
  std::function<void(IceConnectionState state)> onIceConnectionStateChange;

  std::function<void(SignalingState state)> onSignalingStateChange;

  // A remote track arrived. stream is the stream the track belongs to; the
  // same stream object is reported again for each of its tracks.
  std::function<void(std::shared_ptr<MediaStream> stream)> onRemoteStream;

  std::function<void()> onRenegotiationNeeded;

  // A significant error specific to this connection.
  std::function<void(const std::string& error_msg)> onError;
};

// Interface for a single WebRTC connection to exactly one remote peer.
// Abstracts the underlying WebRTC library implementation.
class IPeerConnection {
 public:
  // Delivers a generated description, or ok == false and an error message.
  using SdpCompletion = std::function<void(
      bool ok, const SessionDescription& description, const std::string& error)>;
  // Delivers the outcome of a description assignment.
  using OperationCompletion =
      std::function<void(bool ok, const std::string& error)>;

  virtual ~IPeerConnection() = default;

  // Replaces the event callbacks. Safe to call at any time.
  virtual void SetCallbacks(const PeerConnectionCallbacks& callbacks) = 0;

  // --- Signaling Operations ---
  // All four complete asynchronously. The completion may run on a library
  // thread and may also run after Close().

  virtual void CreateOffer(const OfferAnswerOptions& options,
                           SdpCompletion on_complete) = 0;
  virtual void CreateAnswer(const OfferAnswerOptions& options,
                            SdpCompletion on_complete) = 0;

  // A description of type Rollback reverts a pending local offer and returns
  // the connection to SignalingState::Stable.
  virtual void SetLocalDescription(const SessionDescription& description,
                                   OperationCompletion on_complete) = 0;
  virtual void SetRemoteDescription(const SessionDescription& description,
                                    OperationCompletion on_complete) = 0;

  // Adds a remote ICE candidate. Returns false if the candidate could not be
  // parsed or applied.
  virtual bool AddRemoteCandidate(const IceCandidate& candidate) = 0;

  // Marks ICE for restart. The next offer created with ice_restart set
  // carries fresh ICE credentials; the media session is kept.
  virtual void RestartIce() = 0;

  // --- Media Operations ---

  // Adds a local track to this connection under stream_id. Adding a track id
  // that is already attached is a no-op that returns true.
  virtual bool AddLocalTrack(const std::shared_ptr<MediaStreamTrack>& track,
                             const std::string& stream_id) = 0;

  // Removes the sender carrying track_id. Unknown ids are ignored.
  virtual void RemoveLocalTrack(const std::string& track_id) = 0;

  virtual std::vector<std::string> GetLocalTrackIds() const = 0;

  // --- Lifecycle Control ---

  // Closes the connection and releases its resources. Safe to call multiple
  // times. Pending operations fail or become no-ops afterwards.
  virtual void Close() = 0;

  // --- State Getters ---
  virtual PeerConnectionState GetConnectionState() const = 0;
  virtual IceConnectionState GetIceConnectionState() const = 0;
  virtual SignalingState GetSignalingState() const = 0;

 protected:
  IPeerConnection() = default;

  // PeerConnection instances are unique resources.
  IPeerConnection(const IPeerConnection&) = delete;
  IPeerConnection& operator=(const IPeerConnection&) = delete;
};

// Creates initialized connections. The manager owns one and calls it the
// first time a connection to a remote id is needed.
class IPeerConnectionFactory {
 public:
  virtual ~IPeerConnectionFactory() = default;

  // Returns nullptr if the underlying library refused to create the
  // connection.
  virtual std::shared_ptr<IPeerConnection> CreatePeerConnection(
      const std::vector<IceServer>& ice_servers,
      const PeerConnectionCallbacks& callbacks) = 0;
};

}  // namespace webrtc
}  // namespace mesh
}  // namespace roomcast

#endif  // I_PEER_CONNECTION_H
