#include "webrtc/negotiator.h"

#include <iostream>
#include <utility>

#include <boost/asio/post.hpp>

namespace roomcast {
namespace mesh {
namespace webrtc {

Negotiator::Negotiator(boost::asio::io_context& io_context,
                       std::string local_id, std::string room_id,
                       ConnectionRegistry& registry, SignalSender sender)
    : io_context_(io_context),
      local_id_(std::move(local_id)),
      room_id_(std::move(room_id)),
      registry_(registry),
      sender_(std::move(sender)) {}

void Negotiator::createOffer(const std::string& remote_id,
                             CompletionHandler done) {
  std::shared_ptr<PeerSession> session = registry_.getOrCreate(remote_id);
  if (!session) {
    fail(remote_id, "could not create connection", done);
    return;
  }
  startOffer(session, OfferAnswerOptions(), std::move(done));
}

void Negotiator::restartIce(const std::string& remote_id,
                            CompletionHandler done) {
  std::shared_ptr<PeerSession> session = registry_.get(remote_id);
  if (!session || session->closed()) {
    drop(remote_id, "ICE restart requested for unknown connection", done);
    return;
  }
  std::cout << "Negotiator: Restarting ICE with " << remote_id << "."
            << std::endl;
  session->connection().RestartIce();

  OfferAnswerOptions options;
  options.ice_restart = true;
  startOffer(session, options, std::move(done));
}

void Negotiator::handleOffer(const std::string& from_id,
                             const SessionDescription& offer,
                             CompletionHandler done) {
  if (offer.type != SdpType::Offer || offer.sdp.empty()) {
    drop(from_id, "malformed offer", done);
    return;
  }

  std::shared_ptr<PeerSession> session = registry_.getOrCreate(from_id);
  if (!session) {
    fail(from_id, "could not create connection", done);
    return;
  }

  if (session->connection().GetSignalingState() !=
      SignalingState::HaveLocalOffer) {
    acceptOffer(session, offer, std::move(done));
    return;
  }

  // Glare: both sides have an offer outstanding.
  if (!IsPolite(local_id_, from_id)) {
    std::cout << "Negotiator: Glare with " << from_id
              << ", keeping local offer and ignoring the remote one."
              << std::endl;
    succeed(done);
    return;
  }

  std::cout << "Negotiator: Glare with " << from_id
            << ", rolling back local offer." << std::endl;
  SessionDescription rollback;
  rollback.type = SdpType::Rollback;

  boost::asio::io_context* io = &io_context_;
  std::weak_ptr<PeerSession> weak = session;
  session->connection().SetLocalDescription(
      rollback, [this, io, weak, from_id, offer, done](
                    bool ok, const std::string& error) {
        boost::asio::post(*io, [this, weak, from_id, offer, done, ok, error]() {
          std::shared_ptr<PeerSession> s = weak.lock();
          if (!s || s->closed()) {
            abandon(from_id, done);
            return;
          }
          if (!ok) {
            fail(from_id, "rollback failed: " + error, done);
            return;
          }
          acceptOffer(s, offer, done);
        });
      });
}

void Negotiator::handleAnswer(const std::string& from_id,
                              const SessionDescription& answer,
                              CompletionHandler done) {
  std::shared_ptr<PeerSession> session = registry_.get(from_id);
  if (!session || session->closed()) {
    drop(from_id, "answer without a matching connection", done);
    return;
  }
  if (answer.type != SdpType::Answer && answer.type != SdpType::PrAnswer) {
    drop(from_id, "description is not an answer", done);
    return;
  }
  const SignalingState state = session->connection().GetSignalingState();
  if (state != SignalingState::HaveLocalOffer &&
      state != SignalingState::HaveRemotePrAnswer) {
    drop(from_id, std::string("answer received in state ") + ToString(state),
         done);
    return;
  }

  boost::asio::io_context* io = &io_context_;
  std::weak_ptr<PeerSession> weak = session;
  session->connection().SetRemoteDescription(
      answer, [this, io, weak, from_id, done](bool ok,
                                              const std::string& error) {
        boost::asio::post(*io, [this, weak, from_id, done, ok, error]() {
          std::shared_ptr<PeerSession> s = weak.lock();
          if (!s || s->closed()) {
            abandon(from_id, done);
            return;
          }
          if (!ok) {
            fail(from_id, "set remote answer failed: " + error, done);
            return;
          }
          std::cout << "Negotiator: Answer from " << from_id << " applied."
                    << std::endl;
          succeed(done);
        });
      });
}

void Negotiator::handleIceCandidate(const std::string& from_id,
                                    const IceCandidate& candidate) {
  std::shared_ptr<PeerSession> session = registry_.get(from_id);
  if (!session || session->closed()) {
    drop(from_id, "candidate without a matching connection", nullptr);
    return;
  }
  if (!candidate.isWellFormed()) {
    drop(from_id, "malformed candidate", nullptr);
    return;
  }
  if (!session->connection().AddRemoteCandidate(candidate)) {
    drop(from_id, "candidate rejected by transport", nullptr);
  }
}

void Negotiator::sendLocalCandidate(const std::string& remote_id,
                                    const IceCandidate& candidate) {
  SignalMessage message(SignalMessage::Type::CANDIDATE, local_id_, remote_id);
  message.roomId = room_id_;
  message.candidate = candidate.candidate;
  if (!candidate.sdpMid.empty()) {
    message.sdpMid = candidate.sdpMid;
  }
  if (candidate.sdpMLineIndex >= 0) {
    message.sdpMlineIndex = candidate.sdpMLineIndex;
  }
  if (sender_) {
    sender_(message);
  }
}

void Negotiator::startOffer(const std::shared_ptr<PeerSession>& session,
                            const OfferAnswerOptions& options,
                            CompletionHandler done) {
  const std::string remote_id = session->remoteId();
  std::cout << "Negotiator: Creating offer for " << remote_id << "."
            << std::endl;

  boost::asio::io_context* io = &io_context_;
  std::weak_ptr<PeerSession> weak = session;
  session->connection().CreateOffer(options, [this, io, weak, remote_id, done](
                                                 bool ok,
                                                 const SessionDescription& offer,
                                                 const std::string& error) {
    boost::asio::post(*io, [this, io, weak, remote_id, done, ok, offer,
                            error]() {
      std::shared_ptr<PeerSession> s = weak.lock();
      if (!s || s->closed()) {
        abandon(remote_id, done);
        return;
      }
      if (!ok) {
        fail(remote_id, "create offer failed: " + error, done);
        return;
      }
      s->connection().SetLocalDescription(
          offer, [this, io, weak, remote_id, done, offer](
                     bool ok, const std::string& error) {
            boost::asio::post(*io, [this, weak, remote_id, done, offer, ok,
                                    error]() {
              std::shared_ptr<PeerSession> s = weak.lock();
              if (!s || s->closed()) {
                abandon(remote_id, done);
                return;
              }
              if (!ok) {
                fail(remote_id, "set local offer failed: " + error, done);
                return;
              }
              sendDescription(remote_id, offer);
              succeed(done);
            });
          });
    });
  });
}

void Negotiator::acceptOffer(const std::shared_ptr<PeerSession>& session,
                             const SessionDescription& offer,
                             CompletionHandler done) {
  const std::string remote_id = session->remoteId();
  boost::asio::io_context* io = &io_context_;
  std::weak_ptr<PeerSession> weak = session;

  // Remote offer -> local answer -> apply answer -> send.
  session->connection().SetRemoteDescription(
      offer, [this, io, weak, remote_id, done](bool ok,
                                               const std::string& error) {
        boost::asio::post(*io, [this, io, weak, remote_id, done, ok, error]() {
          std::shared_ptr<PeerSession> s = weak.lock();
          if (!s || s->closed()) {
            abandon(remote_id, done);
            return;
          }
          if (!ok) {
            fail(remote_id, "set remote offer failed: " + error, done);
            return;
          }
          s->connection().CreateAnswer(
              OfferAnswerOptions(),
              [this, io, weak, remote_id, done](
                  bool ok, const SessionDescription& answer,
                  const std::string& error) {
                boost::asio::post(*io, [this, io, weak, remote_id, done, ok,
                                        answer, error]() {
                  std::shared_ptr<PeerSession> s = weak.lock();
                  if (!s || s->closed()) {
                    abandon(remote_id, done);
                    return;
                  }
                  if (!ok) {
                    fail(remote_id, "create answer failed: " + error, done);
                    return;
                  }
                  s->connection().SetLocalDescription(
                      answer, [this, io, weak, remote_id, done, answer](
                                  bool ok, const std::string& error) {
                        boost::asio::post(*io, [this, weak, remote_id, done,
                                                answer, ok, error]() {
                          std::shared_ptr<PeerSession> s = weak.lock();
                          if (!s || s->closed()) {
                            abandon(remote_id, done);
                            return;
                          }
                          if (!ok) {
                            fail(remote_id,
                                 "set local answer failed: " + error, done);
                            return;
                          }
                          sendDescription(remote_id, answer);
                          succeed(done);
                        });
                      });
                });
              });
        });
      });
}

void Negotiator::sendDescription(const std::string& remote_id,
                                 const SessionDescription& description) {
  const bool is_offer = description.type == SdpType::Offer;
  SignalMessage message(
      is_offer ? SignalMessage::Type::OFFER : SignalMessage::Type::ANSWER,
      local_id_, remote_id);
  message.roomId = room_id_;
  message.sdpType = SdpTypeToString(description.type);
  message.sdp = description.sdp;

  std::cout << "Negotiator: Sending " << message.sdpType.value() << " to "
            << remote_id << "." << std::endl;
  if (sender_) {
    sender_(message);
  }
}

void Negotiator::fail(const std::string& remote_id, const std::string& error,
                      const CompletionHandler& done) {
  std::cerr << "Negotiator: Negotiation with " << remote_id
            << " failed: " << error << "." << std::endl;
  if (errorReporter_) {
    errorReporter_(remote_id, error);
  }
  if (done) {
    done(false, error);
  }
}

void Negotiator::drop(const std::string& remote_id, const std::string& reason,
                      const CompletionHandler& done) {
  std::cerr << "Negotiator: Dropping message from " << remote_id << ": "
            << reason << "." << std::endl;
  if (done) {
    done(false, reason);
  }
}

void Negotiator::abandon(const std::string& remote_id,
                         const CompletionHandler& done) {
  std::cout << "Negotiator: Connection to " << remote_id
            << " closed during negotiation." << std::endl;
  if (done) {
    done(false, "connection closed during negotiation");
  }
}

void Negotiator::succeed(const CompletionHandler& done) {
  if (done) {
    done(true, std::string());
  }
}

}  // namespace webrtc
}  // namespace mesh
}  // namespace roomcast
