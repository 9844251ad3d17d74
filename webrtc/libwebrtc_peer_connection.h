#ifndef LIBWEBRTC_PEER_CONNECTION_H
#define LIBWEBRTC_PEER_CONNECTION_H

#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include <absl/base/thread_annotations.h>

#include "api/peer_connection_interface.h"
#include "api/scoped_refptr.h"
#include "rtc_base/thread.h"
#include "webrtc/media_stream.h"
#include "webrtc/peer_connection.h"

namespace roomcast {
namespace mesh {
namespace webrtc {

// IPeerConnection over a libwebrtc PeerConnectionInterface. This object is
// the PeerConnectionObserver of the connection it wraps; libwebrtc calls the
// observer methods on its signaling thread and they forward to the stored
// callbacks without further marshalling.
class LibwebrtcPeerConnection : public IPeerConnection,
                                public ::webrtc::PeerConnectionObserver {
 public:
  LibwebrtcPeerConnection();
  // Closes the underlying connection.
  ~LibwebrtcPeerConnection() override;

  // Creates the underlying connection with this object as its observer.
  bool init(::webrtc::PeerConnectionFactoryInterface* factory,
            const std::vector<IceServer>& ice_servers);

  // --- Implementation of IPeerConnection ---
  void SetCallbacks(const PeerConnectionCallbacks& callbacks) override;

  void CreateOffer(const OfferAnswerOptions& options,
                   SdpCompletion on_complete) override;
  void CreateAnswer(const OfferAnswerOptions& options,
                    SdpCompletion on_complete) override;
  void SetLocalDescription(const SessionDescription& description,
                           OperationCompletion on_complete) override;
  void SetRemoteDescription(const SessionDescription& description,
                            OperationCompletion on_complete) override;
  bool AddRemoteCandidate(const IceCandidate& candidate) override;
  void RestartIce() override;

  bool AddLocalTrack(const std::shared_ptr<MediaStreamTrack>& track,
                     const std::string& stream_id) override;
  void RemoveLocalTrack(const std::string& track_id) override;
  std::vector<std::string> GetLocalTrackIds() const override;

  void Close() override;

  PeerConnectionState GetConnectionState() const override;
  IceConnectionState GetIceConnectionState() const override;
  SignalingState GetSignalingState() const override;

  // --- Implementation of libwebrtc PeerConnectionObserver ---
  void OnSignalingChange(
      ::webrtc::PeerConnectionInterface::SignalingState new_state) override;
  void OnDataChannel(
      rtc::scoped_refptr<::webrtc::DataChannelInterface> data_channel) override;
  void OnRenegotiationNeeded() override;
  void OnStandardizedIceConnectionChange(
      ::webrtc::PeerConnectionInterface::IceConnectionState new_state) override;
  void OnConnectionChange(
      ::webrtc::PeerConnectionInterface::PeerConnectionState new_state)
      override;
  void OnIceGatheringChange(
      ::webrtc::PeerConnectionInterface::IceGatheringState new_state) override;
  void OnIceCandidate(const ::webrtc::IceCandidateInterface* candidate) override;
  void OnIceCandidateError(const std::string& address, int port,
                           const std::string& url, int error_code,
                           const std::string& error_text) override;
  void OnTrack(
      rtc::scoped_refptr<::webrtc::RtpTransceiverInterface> transceiver)
      override;

 private:
  PeerConnectionCallbacks callbacksSnapshot() const;
  rtc::scoped_refptr<::webrtc::PeerConnectionInterface> connection() const;
  void applyDescription(bool local, const SessionDescription& description,
                        OperationCompletion on_complete);

  mutable std::mutex mutex_;
  rtc::scoped_refptr<::webrtc::PeerConnectionInterface> rtc_peer_connection_
      ABSL_GUARDED_BY(mutex_);
  PeerConnectionCallbacks callbacks_ ABSL_GUARDED_BY(mutex_);
  // Local track id -> sender carrying it.
  std::map<std::string, rtc::scoped_refptr<::webrtc::RtpSenderInterface>>
      senders_ ABSL_GUARDED_BY(mutex_);
  // Remote stream id -> stream reported to the owner.
  std::map<std::string, std::shared_ptr<MediaStream>> remote_streams_
      ABSL_GUARDED_BY(mutex_);
  bool closed_ ABSL_GUARDED_BY(mutex_) = false;

  LibwebrtcPeerConnection(const LibwebrtcPeerConnection&) = delete;
  LibwebrtcPeerConnection& operator=(const LibwebrtcPeerConnection&) = delete;
};

// Owns the libwebrtc threads and PeerConnectionFactory shared by every
// connection of the process.
class LibwebrtcPeerConnectionFactory : public IPeerConnectionFactory {
 public:
  // Starts the network, worker and signaling threads and builds the factory.
  // Returns nullptr on failure.
  static std::unique_ptr<LibwebrtcPeerConnectionFactory> Create();

  ~LibwebrtcPeerConnectionFactory() override;

  std::shared_ptr<IPeerConnection> CreatePeerConnection(
      const std::vector<IceServer>& ice_servers,
      const PeerConnectionCallbacks& callbacks) override;

  // Local microphone stream for publishing.
  std::shared_ptr<MediaStream> CreateLocalStream(const std::string& stream_id);

 private:
  LibwebrtcPeerConnectionFactory() = default;

  std::unique_ptr<rtc::Thread> network_thread_;
  std::unique_ptr<rtc::Thread> worker_thread_;
  std::unique_ptr<rtc::Thread> signaling_thread_;
  rtc::scoped_refptr<::webrtc::PeerConnectionFactoryInterface> factory_;
};

}  // namespace webrtc
}  // namespace mesh
}  // namespace roomcast

#endif  // LIBWEBRTC_PEER_CONNECTION_H
