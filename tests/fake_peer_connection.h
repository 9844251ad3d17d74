#ifndef TESTS_FAKE_PEER_CONNECTION_H
#define TESTS_FAKE_PEER_CONNECTION_H

#include <memory>
#include <set>
#include <string>
#include <utility>
#include <vector>

#include <boost/asio/io_context.hpp>
#include <boost/asio/post.hpp>

#include "webrtc/media_stream.h"
#include "webrtc/peer_connection.h"

namespace roomcast {
namespace mesh {
namespace webrtc {
namespace fakes {

class FakeTrack : public MediaStreamTrack {
 public:
  FakeTrack(std::string id, MediaKind kind) : id_(std::move(id)), kind_(kind) {}

  std::string id() const override { return id_; }
  MediaKind kind() const override { return kind_; }
  void Stop() override { stopped_ = true; }
  bool stopped() const override { return stopped_; }

 private:
  std::string id_;
  MediaKind kind_;
  bool stopped_ = false;
};

// Local stream with one audio and one video track.
inline std::shared_ptr<MediaStream> MakeStream(const std::string& id) {
  auto stream = std::make_shared<MediaStream>(id);
  stream->AddTrack(std::make_shared<FakeTrack>(id + "-audio", MediaKind::Audio));
  stream->AddTrack(std::make_shared<FakeTrack>(id + "-video", MediaKind::Video));
  return stream;
}

// In-memory IPeerConnection. Models the JSEP signaling-state machine and
// completes every asynchronous operation through io_context, as a real
// library completes them from its own thread. Transport events are injected
// by the test through the emit* methods.
class FakePeerConnection
    : public IPeerConnection,
      public std::enable_shared_from_this<FakePeerConnection> {
 public:
  FakePeerConnection(boost::asio::io_context& io_context, std::string tag)
      : io_context_(io_context), tag_(std::move(tag)) {}

  void SetCallbacks(const PeerConnectionCallbacks& callbacks) override {
    callbacks_ = callbacks;
  }

  void CreateOffer(const OfferAnswerOptions& options,
                   SdpCompletion on_complete) override {
    auto self = shared_from_this();
    boost::asio::post(io_context_, [self, options, on_complete]() {
      if (self->closed_ || self->fail_create_) {
        on_complete(false, SessionDescription(), "create offer rejected");
        return;
      }
      ++self->offers_created_;
      if (options.ice_restart) ++self->ice_restart_offers_;
      SessionDescription offer;
      offer.type = SdpType::Offer;
      offer.sdp = "v=0 offer " + self->tag_ + " #" +
                  std::to_string(self->offers_created_);
      on_complete(true, offer, std::string());
    });
  }

  void CreateAnswer(const OfferAnswerOptions& /*options*/,
                    SdpCompletion on_complete) override {
    auto self = shared_from_this();
    boost::asio::post(io_context_, [self, on_complete]() {
      if (self->closed_ || self->fail_create_ ||
          self->signaling_state_ != SignalingState::HaveRemoteOffer) {
        on_complete(false, SessionDescription(), "create answer rejected");
        return;
      }
      ++self->answers_created_;
      SessionDescription answer;
      answer.type = SdpType::Answer;
      answer.sdp = "v=0 answer " + self->tag_;
      on_complete(true, answer, std::string());
    });
  }

  void SetLocalDescription(const SessionDescription& description,
                           OperationCompletion on_complete) override {
    auto self = shared_from_this();
    boost::asio::post(io_context_, [self, description, on_complete]() {
      const SignalingState s = self->signaling_state_;
      bool ok = !self->closed_;
      SignalingState next = s;
      switch (description.type) {
        case SdpType::Offer:
          ok = ok && (s == SignalingState::Stable ||
                      s == SignalingState::HaveLocalOffer);
          next = SignalingState::HaveLocalOffer;
          break;
        case SdpType::Answer:
        case SdpType::PrAnswer:
          ok = ok && s == SignalingState::HaveRemoteOffer;
          next = SignalingState::Stable;
          break;
        case SdpType::Rollback:
          ok = ok && s == SignalingState::HaveLocalOffer;
          next = SignalingState::Stable;
          ++self->rollbacks_;
          break;
      }
      if (!ok) {
        on_complete(false, "invalid local description in state " +
                               std::string(ToString(s)));
        return;
      }
      if (description.type != SdpType::Rollback) {
        self->local_description_ = description;
      }
      self->setSignalingState(next);
      on_complete(true, std::string());
    });
  }

  void SetRemoteDescription(const SessionDescription& description,
                            OperationCompletion on_complete) override {
    auto self = shared_from_this();
    boost::asio::post(io_context_, [self, description, on_complete]() {
      const SignalingState s = self->signaling_state_;
      bool ok = !self->closed_;
      SignalingState next = s;
      if (description.type == SdpType::Offer) {
        ok = ok && s == SignalingState::Stable;
        next = SignalingState::HaveRemoteOffer;
      } else if (description.type == SdpType::Answer) {
        ok = ok && (s == SignalingState::HaveLocalOffer ||
                    s == SignalingState::HaveRemotePrAnswer);
        next = SignalingState::Stable;
      } else {
        ok = false;
      }
      if (!ok) {
        on_complete(false, "invalid remote description in state " +
                               std::string(ToString(s)));
        return;
      }
      self->remote_description_ = description;
      self->setSignalingState(next);
      on_complete(true, std::string());
    });
  }

  bool AddRemoteCandidate(const IceCandidate& candidate) override {
    if (closed_) return false;
    remote_candidates_.push_back(candidate);
    return true;
  }

  void RestartIce() override { ++restart_ice_calls_; }

  bool AddLocalTrack(const std::shared_ptr<MediaStreamTrack>& track,
                     const std::string& /*stream_id*/) override {
    if (closed_) return false;
    local_tracks_.insert(track->id());
    return true;
  }

  void RemoveLocalTrack(const std::string& track_id) override {
    local_tracks_.erase(track_id);
  }

  std::vector<std::string> GetLocalTrackIds() const override {
    return std::vector<std::string>(local_tracks_.begin(), local_tracks_.end());
  }

  void Close() override {
    if (closed_) return;
    closed_ = true;
    ++close_calls_;
    signaling_state_ = SignalingState::Closed;
  }

  PeerConnectionState GetConnectionState() const override {
    return closed_ ? PeerConnectionState::Closed : connection_state_;
  }
  IceConnectionState GetIceConnectionState() const override {
    return closed_ ? IceConnectionState::Closed : ice_state_;
  }
  SignalingState GetSignalingState() const override { return signaling_state_; }

  // --- Event injection ---
  void emitConnectionState(PeerConnectionState state) {
    connection_state_ = state;
    if (callbacks_.onConnectionStateChange) {
      callbacks_.onConnectionStateChange(state);
    }
  }
  void emitIceState(IceConnectionState state) {
    ice_state_ = state;
    if (callbacks_.onIceConnectionStateChange) {
      callbacks_.onIceConnectionStateChange(state);
    }
  }
  void emitLocalCandidate(const IceCandidate& candidate) {
    if (callbacks_.onLocalCandidateGenerated) {
      callbacks_.onLocalCandidateGenerated(candidate);
    }
  }
  void emitRemoteStream(std::shared_ptr<MediaStream> stream) {
    if (callbacks_.onRemoteStream) {
      callbacks_.onRemoteStream(std::move(stream));
    }
  }
  void emitError(const std::string& error_msg) {
    if (callbacks_.onError) {
      callbacks_.onError(error_msg);
    }
  }

  // --- Scripting and inspection ---
  void setFailCreate(bool fail) { fail_create_ = fail; }

  const std::string& tag() const { return tag_; }
  bool closed() const { return closed_; }
  int closeCalls() const { return close_calls_; }
  int offersCreated() const { return offers_created_; }
  int answersCreated() const { return answers_created_; }
  int rollbacks() const { return rollbacks_; }
  int restartIceCalls() const { return restart_ice_calls_; }
  int iceRestartOffers() const { return ice_restart_offers_; }
  const std::vector<IceCandidate>& remoteCandidates() const {
    return remote_candidates_;
  }
  const std::set<std::string>& localTracks() const { return local_tracks_; }
  const SessionDescription& localDescription() const {
    return local_description_;
  }
  const SessionDescription& remoteDescription() const {
    return remote_description_;
  }

 private:
  void setSignalingState(SignalingState state) {
    signaling_state_ = state;
    if (callbacks_.onSignalingStateChange) {
      callbacks_.onSignalingStateChange(state);
    }
  }

  boost::asio::io_context& io_context_;
  const std::string tag_;
  PeerConnectionCallbacks callbacks_;

  SignalingState signaling_state_ = SignalingState::Stable;
  PeerConnectionState connection_state_ = PeerConnectionState::New;
  IceConnectionState ice_state_ = IceConnectionState::New;

  bool closed_ = false;
  bool fail_create_ = false;
  int close_calls_ = 0;
  int offers_created_ = 0;
  int answers_created_ = 0;
  int rollbacks_ = 0;
  int restart_ice_calls_ = 0;
  int ice_restart_offers_ = 0;
  std::vector<IceCandidate> remote_candidates_;
  std::set<std::string> local_tracks_;
  SessionDescription local_description_;
  SessionDescription remote_description_;
};

// Hands out FakePeerConnections and keeps them for inspection, in creation
// order.
class FakePeerConnectionFactory : public IPeerConnectionFactory {
 public:
  explicit FakePeerConnectionFactory(boost::asio::io_context& io_context,
                                     std::string tag = "fake")
      : io_context_(io_context), tag_(std::move(tag)) {}

  std::shared_ptr<IPeerConnection> CreatePeerConnection(
      const std::vector<IceServer>& ice_servers,
      const PeerConnectionCallbacks& callbacks) override {
    last_ice_servers_ = ice_servers;
    if (fail_next_) {
      fail_next_ = false;
      return nullptr;
    }
    auto connection = std::make_shared<FakePeerConnection>(
        io_context_, tag_ + std::to_string(created_.size()));
    connection->SetCallbacks(callbacks);
    created_.push_back(connection);
    return connection;
  }

  void failNext() { fail_next_ = true; }

  std::size_t createdCount() const { return created_.size(); }
  const std::shared_ptr<FakePeerConnection>& connection(std::size_t i) const {
    return created_.at(i);
  }
  const std::shared_ptr<FakePeerConnection>& last() const {
    return created_.back();
  }
  const std::vector<IceServer>& lastIceServers() const {
    return last_ice_servers_;
  }

 private:
  boost::asio::io_context& io_context_;
  const std::string tag_;
  bool fail_next_ = false;
  std::vector<std::shared_ptr<FakePeerConnection>> created_;
  std::vector<IceServer> last_ice_servers_;
};

}  // namespace fakes
}  // namespace webrtc
}  // namespace mesh
}  // namespace roomcast

#endif  // TESTS_FAKE_PEER_CONNECTION_H
