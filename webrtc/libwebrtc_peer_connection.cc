#include "webrtc/libwebrtc_peer_connection.h"

#include <iostream>
#include <utility>

#include "api/audio_codecs/builtin_audio_decoder_factory.h"
#include "api/audio_codecs/builtin_audio_encoder_factory.h"
#include "api/create_peerconnection_factory.h"
#include "api/jsep.h"
#include "api/make_ref_counted.h"
#include "api/rtp_receiver_interface.h"
#include "api/rtp_transceiver_interface.h"
#include "api/set_local_description_observer_interface.h"
#include "api/set_remote_description_observer_interface.h"
#include "api/video_codecs/builtin_video_decoder_factory.h"
#include "api/video_codecs/builtin_video_encoder_factory.h"
#include "webrtc/libwebrtc_media_source.h"

namespace roomcast {
namespace mesh {
namespace webrtc {

namespace {

using RtcPc = ::webrtc::PeerConnectionInterface;

// --- State and type mapping ---

SignalingState FromRtc(RtcPc::SignalingState state) {
  switch (state) {
    case RtcPc::kStable:
      return SignalingState::Stable;
    case RtcPc::kHaveLocalOffer:
      return SignalingState::HaveLocalOffer;
    case RtcPc::kHaveLocalPrAnswer:
      return SignalingState::HaveLocalPrAnswer;
    case RtcPc::kHaveRemoteOffer:
      return SignalingState::HaveRemoteOffer;
    case RtcPc::kHaveRemotePrAnswer:
      return SignalingState::HaveRemotePrAnswer;
    case RtcPc::kClosed:
      return SignalingState::Closed;
  }
  return SignalingState::Closed;
}

IceConnectionState FromRtc(RtcPc::IceConnectionState state) {
  switch (state) {
    case RtcPc::kIceConnectionNew:
      return IceConnectionState::New;
    case RtcPc::kIceConnectionChecking:
      return IceConnectionState::Checking;
    case RtcPc::kIceConnectionConnected:
      return IceConnectionState::Connected;
    case RtcPc::kIceConnectionCompleted:
      return IceConnectionState::Completed;
    case RtcPc::kIceConnectionFailed:
      return IceConnectionState::Failed;
    case RtcPc::kIceConnectionDisconnected:
      return IceConnectionState::Disconnected;
    case RtcPc::kIceConnectionClosed:
    case RtcPc::kIceConnectionMax:
      return IceConnectionState::Closed;
  }
  return IceConnectionState::Closed;
}

PeerConnectionState FromRtc(RtcPc::PeerConnectionState state) {
  switch (state) {
    case RtcPc::PeerConnectionState::kNew:
      return PeerConnectionState::New;
    case RtcPc::PeerConnectionState::kConnecting:
      return PeerConnectionState::Connecting;
    case RtcPc::PeerConnectionState::kConnected:
      return PeerConnectionState::Connected;
    case RtcPc::PeerConnectionState::kDisconnected:
      return PeerConnectionState::Disconnected;
    case RtcPc::PeerConnectionState::kFailed:
      return PeerConnectionState::Failed;
    case RtcPc::PeerConnectionState::kClosed:
      return PeerConnectionState::Closed;
  }
  return PeerConnectionState::Closed;
}

::webrtc::SdpType ToRtc(SdpType type) {
  switch (type) {
    case SdpType::Offer:
      return ::webrtc::SdpType::kOffer;
    case SdpType::PrAnswer:
      return ::webrtc::SdpType::kPrAnswer;
    case SdpType::Answer:
      return ::webrtc::SdpType::kAnswer;
    case SdpType::Rollback:
      return ::webrtc::SdpType::kRollback;
  }
  return ::webrtc::SdpType::kOffer;
}

SdpType FromRtc(::webrtc::SdpType type) {
  switch (type) {
    case ::webrtc::SdpType::kOffer:
      return SdpType::Offer;
    case ::webrtc::SdpType::kPrAnswer:
      return SdpType::PrAnswer;
    case ::webrtc::SdpType::kAnswer:
      return SdpType::Answer;
    case ::webrtc::SdpType::kRollback:
      return SdpType::Rollback;
  }
  return SdpType::Offer;
}

RtcPc::RTCOfferAnswerOptions ToRtc(const OfferAnswerOptions& options) {
  RtcPc::RTCOfferAnswerOptions rtc_options;
  rtc_options.offer_to_receive_audio =
      options.offer_to_receive_audio
          ? RtcPc::RTCOfferAnswerOptions::kOfferToReceiveMediaTrue
          : 0;
  rtc_options.offer_to_receive_video =
      options.offer_to_receive_video
          ? RtcPc::RTCOfferAnswerOptions::kOfferToReceiveMediaTrue
          : 0;
  rtc_options.ice_restart = options.ice_restart;
  return rtc_options;
}

// --- Completion observers ---

class CreateDescriptionObserver
    : public ::webrtc::CreateSessionDescriptionObserver {
 public:
  explicit CreateDescriptionObserver(IPeerConnection::SdpCompletion done)
      : done_(std::move(done)) {}

  // Takes ownership of desc.
  void OnSuccess(::webrtc::SessionDescriptionInterface* desc) override {
    std::unique_ptr<::webrtc::SessionDescriptionInterface> owned(desc);
    SessionDescription description;
    description.type = FromRtc(owned->GetType());
    if (!owned->ToString(&description.sdp)) {
      done_(false, SessionDescription(), "failed to serialize description");
      return;
    }
    done_(true, description, std::string());
  }

  void OnFailure(::webrtc::RTCError error) override {
    done_(false, SessionDescription(), error.message());
  }

 private:
  IPeerConnection::SdpCompletion done_;
};

class SetLocalObserver : public ::webrtc::SetLocalDescriptionObserverInterface {
 public:
  explicit SetLocalObserver(IPeerConnection::OperationCompletion done)
      : done_(std::move(done)) {}

  void OnSetLocalDescriptionComplete(::webrtc::RTCError error) override {
    done_(error.ok(), error.ok() ? std::string() : error.message());
  }

 private:
  IPeerConnection::OperationCompletion done_;
};

class SetRemoteObserver
    : public ::webrtc::SetRemoteDescriptionObserverInterface {
 public:
  explicit SetRemoteObserver(IPeerConnection::OperationCompletion done)
      : done_(std::move(done)) {}

  void OnSetRemoteDescriptionComplete(::webrtc::RTCError error) override {
    done_(error.ok(), error.ok() ? std::string() : error.message());
  }

 private:
  IPeerConnection::OperationCompletion done_;
};

}  // namespace

// --- LibwebrtcPeerConnection Method Implementations ---

LibwebrtcPeerConnection::LibwebrtcPeerConnection() {
  std::cout << "LibwebrtcPeerConnection created." << std::endl;
}

LibwebrtcPeerConnection::~LibwebrtcPeerConnection() {
  std::cout << "LibwebrtcPeerConnection destroying." << std::endl;
  Close();
}

bool LibwebrtcPeerConnection::init(
    ::webrtc::PeerConnectionFactoryInterface* factory,
    const std::vector<IceServer>& ice_servers) {
  RtcPc::RTCConfiguration rtc_config;
  rtc_config.sdp_semantics = ::webrtc::SdpSemantics::kUnifiedPlan;
  for (const IceServer& server : ice_servers) {
    RtcPc::IceServer rtc_server;
    rtc_server.urls = server.urls;
    rtc_server.username = server.username;
    rtc_server.password = server.credential;
    rtc_config.servers.push_back(rtc_server);
  }

  ::webrtc::PeerConnectionDependencies dependencies(this);
  auto result =
      factory->CreatePeerConnectionOrError(rtc_config, std::move(dependencies));
  if (!result.ok()) {
    std::cerr << "LibwebrtcPeerConnection: Failed to create underlying "
                 "libwebrtc PeerConnection: "
              << result.error().message() << std::endl;
    return false;
  }

  std::lock_guard<std::mutex> lock(mutex_);
  rtc_peer_connection_ = result.MoveValue();
  return true;
}

void LibwebrtcPeerConnection::SetCallbacks(
    const PeerConnectionCallbacks& callbacks) {
  std::lock_guard<std::mutex> lock(mutex_);
  callbacks_ = callbacks;
}

PeerConnectionCallbacks LibwebrtcPeerConnection::callbacksSnapshot() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return callbacks_;
}

rtc::scoped_refptr<::webrtc::PeerConnectionInterface>
LibwebrtcPeerConnection::connection() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return closed_ ? nullptr : rtc_peer_connection_;
}

// --- Signaling Operations ---

void LibwebrtcPeerConnection::CreateOffer(const OfferAnswerOptions& options,
                                          SdpCompletion on_complete) {
  auto pc = connection();
  if (!pc) {
    on_complete(false, SessionDescription(), "connection closed");
    return;
  }
  pc->CreateOffer(
      rtc::make_ref_counted<CreateDescriptionObserver>(std::move(on_complete))
          .get(),
      ToRtc(options));
}

void LibwebrtcPeerConnection::CreateAnswer(const OfferAnswerOptions& options,
                                           SdpCompletion on_complete) {
  auto pc = connection();
  if (!pc) {
    on_complete(false, SessionDescription(), "connection closed");
    return;
  }
  pc->CreateAnswer(
      rtc::make_ref_counted<CreateDescriptionObserver>(std::move(on_complete))
          .get(),
      ToRtc(options));
}

void LibwebrtcPeerConnection::SetLocalDescription(
    const SessionDescription& description, OperationCompletion on_complete) {
  applyDescription(true, description, std::move(on_complete));
}

void LibwebrtcPeerConnection::SetRemoteDescription(
    const SessionDescription& description, OperationCompletion on_complete) {
  applyDescription(false, description, std::move(on_complete));
}

void LibwebrtcPeerConnection::applyDescription(
    bool local, const SessionDescription& description,
    OperationCompletion on_complete) {
  auto pc = connection();
  if (!pc) {
    on_complete(false, "connection closed");
    return;
  }

  ::webrtc::SdpParseError parse_error;
  std::unique_ptr<::webrtc::SessionDescriptionInterface> rtc_description =
      ::webrtc::CreateSessionDescription(ToRtc(description.type),
                                         description.sdp, &parse_error);
  if (!rtc_description) {
    on_complete(false, "failed to parse " + SdpTypeToString(description.type) +
                           ": " + parse_error.description);
    return;
  }

  if (local) {
    pc->SetLocalDescription(
        std::move(rtc_description),
        rtc::make_ref_counted<SetLocalObserver>(std::move(on_complete)));
  } else {
    pc->SetRemoteDescription(
        std::move(rtc_description),
        rtc::make_ref_counted<SetRemoteObserver>(std::move(on_complete)));
  }
}

bool LibwebrtcPeerConnection::AddRemoteCandidate(
    const IceCandidate& candidate) {
  auto pc = connection();
  if (!pc) {
    return false;
  }
  ::webrtc::SdpParseError parse_error;
  std::unique_ptr<::webrtc::IceCandidateInterface> rtc_candidate(
      ::webrtc::CreateIceCandidate(candidate.sdpMid,
                                   candidate.sdpMLineIndex < 0
                                       ? 0
                                       : candidate.sdpMLineIndex,
                                   candidate.candidate, &parse_error));
  if (!rtc_candidate) {
    std::cerr << "LibwebrtcPeerConnection: Failed to parse candidate: "
              << parse_error.description << std::endl;
    return false;
  }
  return pc->AddIceCandidate(rtc_candidate.get());
}

void LibwebrtcPeerConnection::RestartIce() {
  if (auto pc = connection()) {
    pc->RestartIce();
  }
}

// --- Media Operations ---

bool LibwebrtcPeerConnection::AddLocalTrack(
    const std::shared_ptr<MediaStreamTrack>& track,
    const std::string& stream_id) {
  auto rtc_track = std::dynamic_pointer_cast<LibwebrtcMediaStreamTrack>(track);
  if (!rtc_track) {
    std::cerr << "LibwebrtcPeerConnection: Track " << track->id()
              << " is not a libwebrtc track." << std::endl;
    return false;
  }
  auto pc = connection();
  if (!pc) {
    return false;
  }
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (senders_.count(track->id()) > 0) {
      return true;
    }
  }

  auto result = pc->AddTrack(rtc_track->rtcTrack(), {stream_id});
  if (!result.ok()) {
    std::cerr << "LibwebrtcPeerConnection: AddTrack failed: "
              << result.error().message() << std::endl;
    return false;
  }
  std::lock_guard<std::mutex> lock(mutex_);
  senders_[track->id()] = result.MoveValue();
  return true;
}

void LibwebrtcPeerConnection::RemoveLocalTrack(const std::string& track_id) {
  rtc::scoped_refptr<::webrtc::RtpSenderInterface> sender;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = senders_.find(track_id);
    if (it == senders_.end()) {
      return;
    }
    sender = it->second;
    senders_.erase(it);
  }
  auto pc = connection();
  if (!pc) {
    return;
  }
  ::webrtc::RTCError error = pc->RemoveTrackOrError(sender);
  if (!error.ok()) {
    std::cerr << "LibwebrtcPeerConnection: RemoveTrack failed: "
              << error.message() << std::endl;
  }
}

std::vector<std::string> LibwebrtcPeerConnection::GetLocalTrackIds() const {
  std::lock_guard<std::mutex> lock(mutex_);
  std::vector<std::string> ids;
  ids.reserve(senders_.size());
  for (const auto& entry : senders_) {
    ids.push_back(entry.first);
  }
  return ids;
}

// --- Lifecycle Control ---

void LibwebrtcPeerConnection::Close() {
  rtc::scoped_refptr<::webrtc::PeerConnectionInterface> pc;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (closed_) {
      return;
    }
    closed_ = true;
    pc = std::move(rtc_peer_connection_);
    senders_.clear();
    remote_streams_.clear();
  }
  if (pc) {
    pc->Close();
  }
}

PeerConnectionState LibwebrtcPeerConnection::GetConnectionState() const {
  auto pc = connection();
  return pc ? FromRtc(pc->peer_connection_state())
            : PeerConnectionState::Closed;
}

IceConnectionState LibwebrtcPeerConnection::GetIceConnectionState() const {
  auto pc = connection();
  return pc ? FromRtc(pc->standardized_ice_connection_state())
            : IceConnectionState::Closed;
}

SignalingState LibwebrtcPeerConnection::GetSignalingState() const {
  auto pc = connection();
  return pc ? FromRtc(pc->signaling_state()) : SignalingState::Closed;
}

// --- PeerConnectionObserver (libwebrtc signaling thread) ---

void LibwebrtcPeerConnection::OnSignalingChange(
    RtcPc::SignalingState new_state) {
  auto callbacks = callbacksSnapshot();
  if (callbacks.onSignalingStateChange) {
    callbacks.onSignalingStateChange(FromRtc(new_state));
  }
}

void LibwebrtcPeerConnection::OnDataChannel(
    rtc::scoped_refptr<::webrtc::DataChannelInterface> data_channel) {
  std::cout << "LibwebrtcPeerConnection: Ignoring remote data channel "
            << data_channel->label() << "." << std::endl;
}

void LibwebrtcPeerConnection::OnRenegotiationNeeded() {
  auto callbacks = callbacksSnapshot();
  if (callbacks.onRenegotiationNeeded) {
    callbacks.onRenegotiationNeeded();
  }
}

void LibwebrtcPeerConnection::OnStandardizedIceConnectionChange(
    RtcPc::IceConnectionState new_state) {
  auto callbacks = callbacksSnapshot();
  if (callbacks.onIceConnectionStateChange) {
    callbacks.onIceConnectionStateChange(FromRtc(new_state));
  }
}

void LibwebrtcPeerConnection::OnConnectionChange(
    RtcPc::PeerConnectionState new_state) {
  auto callbacks = callbacksSnapshot();
  if (callbacks.onConnectionStateChange) {
    callbacks.onConnectionStateChange(FromRtc(new_state));
  }
}

void LibwebrtcPeerConnection::OnIceGatheringChange(
    RtcPc::IceGatheringState new_state) {
  if (new_state == RtcPc::kIceGatheringComplete) {
    std::cout << "LibwebrtcPeerConnection: ICE gathering complete."
              << std::endl;
  }
}

void LibwebrtcPeerConnection::OnIceCandidate(
    const ::webrtc::IceCandidateInterface* candidate) {
  IceCandidate local;
  if (!candidate->ToString(&local.candidate)) {
    std::cerr << "LibwebrtcPeerConnection: Failed to serialize local "
                 "candidate."
              << std::endl;
    return;
  }
  local.sdpMid = candidate->sdp_mid();
  local.sdpMLineIndex = candidate->sdp_mline_index();

  auto callbacks = callbacksSnapshot();
  if (callbacks.onLocalCandidateGenerated) {
    callbacks.onLocalCandidateGenerated(local);
  }
}

void LibwebrtcPeerConnection::OnIceCandidateError(
    const std::string& address, int port, const std::string& url,
    int error_code, const std::string& error_text) {
  // Individual STUN/TURN failures are common and not fatal.
  std::cerr << "LibwebrtcPeerConnection: ICE candidate error " << error_code
            << " from " << url << " (" << address << ":" << port
            << "): " << error_text << std::endl;
}

void LibwebrtcPeerConnection::OnTrack(
    rtc::scoped_refptr<::webrtc::RtpTransceiverInterface> transceiver) {
  rtc::scoped_refptr<::webrtc::RtpReceiverInterface> receiver =
      transceiver->receiver();
  rtc::scoped_refptr<::webrtc::MediaStreamTrackInterface> track =
      receiver->track();
  if (!track) {
    return;
  }
  const std::vector<std::string> stream_ids = receiver->stream_ids();
  const std::string stream_id =
      stream_ids.empty() ? track->id() : stream_ids.front();

  std::shared_ptr<MediaStream> stream;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (closed_) {
      return;
    }
    std::shared_ptr<MediaStream>& slot = remote_streams_[stream_id];
    if (!slot) {
      slot = std::make_shared<MediaStream>(stream_id);
    }
    stream = slot;
  }
  stream->AddTrack(std::make_shared<LibwebrtcMediaStreamTrack>(track));

  auto callbacks = callbacksSnapshot();
  if (callbacks.onRemoteStream) {
    callbacks.onRemoteStream(stream);
  }
}

// --- LibwebrtcPeerConnectionFactory ---

std::unique_ptr<LibwebrtcPeerConnectionFactory>
LibwebrtcPeerConnectionFactory::Create() {
  std::unique_ptr<LibwebrtcPeerConnectionFactory> self(
      new LibwebrtcPeerConnectionFactory());

  self->network_thread_ = rtc::Thread::CreateWithSocketServer();
  self->worker_thread_ = rtc::Thread::Create();
  self->signaling_thread_ = rtc::Thread::Create();
  self->network_thread_->SetName("roomcast-network", nullptr);
  self->worker_thread_->SetName("roomcast-worker", nullptr);
  self->signaling_thread_->SetName("roomcast-signaling", nullptr);
  if (!self->network_thread_->Start() || !self->worker_thread_->Start() ||
      !self->signaling_thread_->Start()) {
    std::cerr << "LibwebrtcPeerConnectionFactory: Failed to start threads."
              << std::endl;
    return nullptr;
  }

  self->factory_ = ::webrtc::CreatePeerConnectionFactory(
      self->network_thread_.get(), self->worker_thread_.get(),
      self->signaling_thread_.get(), nullptr /* default audio device */,
      ::webrtc::CreateBuiltinAudioEncoderFactory(),
      ::webrtc::CreateBuiltinAudioDecoderFactory(),
      ::webrtc::CreateBuiltinVideoEncoderFactory(),
      ::webrtc::CreateBuiltinVideoDecoderFactory(), nullptr /* mixer */,
      nullptr /* audio processing */);
  if (!self->factory_) {
    std::cerr << "LibwebrtcPeerConnectionFactory: Failed to create "
                 "PeerConnectionFactory."
              << std::endl;
    return nullptr;
  }
  std::cout << "LibwebrtcPeerConnectionFactory created." << std::endl;
  return self;
}

LibwebrtcPeerConnectionFactory::~LibwebrtcPeerConnectionFactory() {
  // Connections hold the factory internally; release ours before the
  // threads go away.
  factory_ = nullptr;
}

std::shared_ptr<IPeerConnection>
LibwebrtcPeerConnectionFactory::CreatePeerConnection(
    const std::vector<IceServer>& ice_servers,
    const PeerConnectionCallbacks& callbacks) {
  auto connection = std::make_shared<LibwebrtcPeerConnection>();
  connection->SetCallbacks(callbacks);
  if (!connection->init(factory_.get(), ice_servers)) {
    return nullptr;
  }
  return connection;
}

std::shared_ptr<MediaStream> LibwebrtcPeerConnectionFactory::CreateLocalStream(
    const std::string& stream_id) {
  return CreateLocalAudioStream(factory_.get(), stream_id);
}

}  // namespace webrtc
}  // namespace mesh
}  // namespace roomcast
