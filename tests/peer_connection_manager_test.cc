#include "webrtc/peer_connection_manager.h"

#include <chrono>
#include <map>
#include <memory>
#include <string>
#include <thread>
#include <utility>
#include <vector>

#include <boost/asio/io_context.hpp>
#include <boost/asio/post.hpp>
#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include "tests/fake_peer_connection.h"

namespace roomcast {
namespace mesh {
namespace webrtc {
namespace {

using fakes::FakePeerConnection;
using fakes::FakePeerConnectionFactory;
using fakes::MakeStream;
using signaling::SignalMessage;
using ::testing::ElementsAre;
using ::testing::IsEmpty;
using ::testing::UnorderedElementsAre;

// Records the outcome of one completion handler.
struct Outcome {
  bool called = false;
  bool ok = false;
  std::string error;

  IPeerConnectionManager::CompletionHandler handler() {
    return [this](bool success, const std::string& message) {
      called = true;
      ok = success;
      error = message;
    };
  }
};

SessionDescription Description(SdpType type, const std::string& sdp) {
  SessionDescription description;
  description.type = type;
  description.sdp = sdp;
  return description;
}

IceCandidate Candidate(const std::string& line) {
  IceCandidate candidate;
  candidate.candidate = line;
  candidate.sdpMid = "0";
  candidate.sdpMLineIndex = 0;
  return candidate;
}

class PeerConnectionManagerTest : public ::testing::Test {
 protected:
  PeerConnectionManagerTest() : factory_(io_, "pc") {}

  void SetUp() override { createManager(PeerConnectionManagerConfig()); }

  void createManager(
      PeerConnectionManagerConfig config,
      std::chrono::milliseconds grace = std::chrono::milliseconds(20)) {
    manager_.reset();
    config.local_id = "alice";
    config.room_id = "r1";
    config.disconnect_grace_period = grace;
    manager_ = std::make_unique<PeerConnectionManagerImpl>(
        io_, config, factory_,
        [this](const SignalMessage& message) { sent_.push_back(message); });
    manager_->onRemoteStream(
        [this](const std::string& remote_id, std::shared_ptr<MediaStream> s) {
          remoteStreams_.emplace_back(remote_id, s);
        });
    manager_->onRemoteStreamEnded(
        [this](const std::string& remote_id) { ++ended_[remote_id]; });
    manager_->onPeerError(
        [this](const std::string& remote_id, const std::string& error) {
          errors_.push_back(remote_id + ": " + error);
        });
  }

  // Runs every queued handler, including timers, until none is left.
  void drain() {
    io_.restart();
    io_.run();
  }

  // Establishes a connection to remote_id by offering to it.
  std::shared_ptr<FakePeerConnection> connectTo(const std::string& remote_id) {
    Outcome outcome;
    manager_->createOffer(remote_id, outcome.handler());
    drain();
    EXPECT_TRUE(outcome.ok) << outcome.error;
    return factory_.last();
  }

  boost::asio::io_context io_;
  FakePeerConnectionFactory factory_;
  std::vector<SignalMessage> sent_;
  std::vector<std::pair<std::string, std::shared_ptr<MediaStream>>>
      remoteStreams_;
  std::map<std::string, int> ended_;
  std::vector<std::string> errors_;
  std::unique_ptr<PeerConnectionManagerImpl> manager_;
};

TEST_F(PeerConnectionManagerTest, CreateOfferSendsOffer) {
  Outcome outcome;
  manager_->createOffer("bob", outcome.handler());
  EXPECT_FALSE(outcome.called);
  drain();

  ASSERT_TRUE(outcome.called);
  EXPECT_TRUE(outcome.ok);
  ASSERT_EQ(sent_.size(), 1u);
  const SignalMessage& offer = sent_[0];
  EXPECT_EQ(offer.type, SignalMessage::Type::OFFER);
  EXPECT_EQ(offer.from, "alice");
  EXPECT_EQ(offer.to, "bob");
  EXPECT_EQ(offer.roomId, "r1");
  EXPECT_EQ(offer.sdpType.value_or(""), "offer");
  EXPECT_FALSE(offer.sdp.value_or("").empty());

  EXPECT_TRUE(manager_->hasPeer("bob"));
  EXPECT_EQ(manager_->signalingState("bob"), SignalingState::HaveLocalOffer);
}

TEST_F(PeerConnectionManagerTest, OneConnectionPerRemoteId) {
  connectTo("bob");
  connectTo("bob");
  EXPECT_EQ(factory_.createdCount(), 1u);
  EXPECT_EQ(manager_->peerCount(), 1u);
}

TEST_F(PeerConnectionManagerTest, UsesDefaultIceServersWhenUnconfigured) {
  connectTo("bob");
  EXPECT_EQ(factory_.lastIceServers().size(), 2u);
}

TEST_F(PeerConnectionManagerTest, RejectsEmptyAndSelfIds) {
  Outcome empty;
  manager_->createOffer("", empty.handler());
  EXPECT_TRUE(empty.called);
  EXPECT_FALSE(empty.ok);

  Outcome self;
  manager_->handleOffer("alice", Description(SdpType::Offer, "v=0"),
                        self.handler());
  EXPECT_FALSE(self.ok);
  EXPECT_EQ(self.error, "invalid remote id");
  EXPECT_EQ(factory_.createdCount(), 0u);
}

TEST_F(PeerConnectionManagerTest, IncomingOfferIsAnswered) {
  Outcome outcome;
  manager_->handleOffer("bob", Description(SdpType::Offer, "v=0 remote"),
                        outcome.handler());
  drain();

  EXPECT_TRUE(outcome.ok) << outcome.error;
  ASSERT_EQ(sent_.size(), 1u);
  EXPECT_EQ(sent_[0].type, SignalMessage::Type::ANSWER);
  EXPECT_EQ(sent_[0].to, "bob");
  EXPECT_EQ(sent_[0].sdpType.value_or(""), "answer");
  EXPECT_EQ(manager_->signalingState("bob"), SignalingState::Stable);
  EXPECT_EQ(factory_.last()->remoteDescription().sdp, "v=0 remote");
}

TEST_F(PeerConnectionManagerTest, AnswerCompletesOffer) {
  connectTo("bob");

  Outcome outcome;
  manager_->handleAnswer("bob", Description(SdpType::Answer, "v=0 answer"),
                         outcome.handler());
  drain();

  EXPECT_TRUE(outcome.ok) << outcome.error;
  EXPECT_EQ(manager_->signalingState("bob"), SignalingState::Stable);
}

TEST_F(PeerConnectionManagerTest, AnswerForUnknownPeerIsDropped) {
  Outcome outcome;
  manager_->handleAnswer("bob", Description(SdpType::Answer, "v=0"),
                         outcome.handler());
  drain();

  EXPECT_TRUE(outcome.called);
  EXPECT_FALSE(outcome.ok);
  EXPECT_FALSE(manager_->hasPeer("bob"));
  EXPECT_EQ(factory_.createdCount(), 0u);
}

TEST_F(PeerConnectionManagerTest, AnswerInStableStateIsDropped) {
  manager_->handleOffer("bob", Description(SdpType::Offer, "v=0"), nullptr);
  drain();

  Outcome outcome;
  manager_->handleAnswer("bob", Description(SdpType::Answer, "v=0"),
                         outcome.handler());
  EXPECT_FALSE(outcome.ok);
  EXPECT_EQ(manager_->signalingState("bob"), SignalingState::Stable);
  EXPECT_TRUE(manager_->hasPeer("bob"));
}

TEST_F(PeerConnectionManagerTest, RemoteCandidatesReachTheirConnection) {
  manager_->handleIceCandidate("bob", Candidate("candidate:1"));
  EXPECT_FALSE(manager_->hasPeer("bob"));

  auto bob = connectTo("bob");
  auto carol = connectTo("carol");

  manager_->handleIceCandidate("bob", Candidate("candidate:2"));
  IceCandidate malformed;
  malformed.candidate = "candidate:3";
  manager_->handleIceCandidate("bob", malformed);

  ASSERT_EQ(bob->remoteCandidates().size(), 1u);
  EXPECT_EQ(bob->remoteCandidates()[0].candidate, "candidate:2");
  EXPECT_THAT(carol->remoteCandidates(), IsEmpty());
}

TEST_F(PeerConnectionManagerTest, LocalCandidatesAreForwarded) {
  auto bob = connectTo("bob");
  sent_.clear();

  IceCandidate candidate = Candidate("candidate:local");
  candidate.sdpMid = "video";
  candidate.sdpMLineIndex = 1;
  bob->emitLocalCandidate(candidate);
  drain();

  ASSERT_EQ(sent_.size(), 1u);
  EXPECT_EQ(sent_[0].type, SignalMessage::Type::CANDIDATE);
  EXPECT_EQ(sent_[0].to, "bob");
  EXPECT_EQ(sent_[0].candidate.value_or(""), "candidate:local");
  EXPECT_EQ(sent_[0].sdpMid.value_or(""), "video");
  EXPECT_EQ(sent_[0].sdpMlineIndex.value_or(-1), 1);
}

TEST_F(PeerConnectionManagerTest, StreamingAttachesToNewConnections) {
  manager_->startStreaming(MakeStream("local"));
  EXPECT_TRUE(manager_->isStreaming());

  auto bob = connectTo("bob");
  EXPECT_THAT(bob->localTracks(),
              UnorderedElementsAre("local-audio", "local-video"));

  manager_->stopStreaming();
  EXPECT_FALSE(manager_->isStreaming());
  EXPECT_THAT(bob->localTracks(), IsEmpty());
}

TEST_F(PeerConnectionManagerTest, RemoteStreamReportedOncePerStream) {
  auto bob = connectTo("bob");
  auto first = MakeStream("bob-stream");

  // One report per track of the same stream.
  bob->emitRemoteStream(first);
  bob->emitRemoteStream(first);
  drain();
  ASSERT_EQ(remoteStreams_.size(), 1u);
  EXPECT_EQ(remoteStreams_[0].first, "bob");
  EXPECT_EQ(remoteStreams_[0].second, first);

  bob->emitRemoteStream(MakeStream("bob-stream-2"));
  drain();
  EXPECT_EQ(remoteStreams_.size(), 2u);
}

TEST_F(PeerConnectionManagerTest, RecoveryWithinGracePeriodKeepsConnection) {
  auto bob = connectTo("bob");
  bob->emitConnectionState(PeerConnectionState::Connected);
  bob->emitConnectionState(PeerConnectionState::Disconnected);
  bob->emitConnectionState(PeerConnectionState::Connected);
  drain();

  EXPECT_TRUE(ended_.empty());
  EXPECT_TRUE(manager_->hasPeer("bob"));
  EXPECT_FALSE(bob->closed());
  EXPECT_EQ(manager_->healthState("bob"), HealthState::Connected);
}

TEST_F(PeerConnectionManagerTest, GracePeriodExpiryEndsStreamOnce) {
  auto bob = connectTo("bob");
  bob->emitConnectionState(PeerConnectionState::Connected);
  bob->emitConnectionState(PeerConnectionState::Disconnected);
  drain();

  EXPECT_EQ(ended_["bob"], 1);
  EXPECT_FALSE(manager_->hasPeer("bob"));
  EXPECT_TRUE(bob->closed());

  // Late events from the dead transport change nothing.
  bob->emitConnectionState(PeerConnectionState::Failed);
  drain();
  manager_->removePeer("bob");
  EXPECT_EQ(ended_["bob"], 1);
}

TEST_F(PeerConnectionManagerTest, SecondDisconnectGetsAFullGracePeriod) {
  createManager(PeerConnectionManagerConfig(), std::chrono::milliseconds(200));
  auto bob = connectTo("bob");
  bob->emitConnectionState(PeerConnectionState::Connected);
  bob->emitConnectionState(PeerConnectionState::Disconnected);
  io_.restart();
  io_.poll();
  ASSERT_EQ(manager_->healthState("bob"), HealthState::Disconnected);

  // The first grace timer expires while this handler blocks, so its
  // completion can be queued ahead of the recovery and the new disconnect.
  boost::asio::post(io_, [&bob]() {
    std::this_thread::sleep_for(std::chrono::milliseconds(250));
    bob->emitConnectionState(PeerConnectionState::Connected);
    bob->emitConnectionState(PeerConnectionState::Disconnected);
  });
  io_.restart();
  io_.poll();

  EXPECT_TRUE(ended_.empty());
  EXPECT_TRUE(manager_->hasPeer("bob"));
  EXPECT_FALSE(bob->closed());
  EXPECT_EQ(manager_->healthState("bob"), HealthState::Disconnected);

  // Without another recovery the second grace period ends the connection.
  drain();
  EXPECT_EQ(ended_["bob"], 1);
  EXPECT_FALSE(manager_->hasPeer("bob"));
}

TEST_F(PeerConnectionManagerTest, ConnectionFailureTearsDownImmediately) {
  auto bob = connectTo("bob");
  bob->emitConnectionState(PeerConnectionState::Failed);
  drain();

  EXPECT_EQ(ended_["bob"], 1);
  EXPECT_FALSE(manager_->hasPeer("bob"));
}

TEST_F(PeerConnectionManagerTest, IceFailureRestartsIce) {
  auto bob = connectTo("bob");
  sent_.clear();

  bob->emitIceState(IceConnectionState::Failed);
  drain();

  EXPECT_EQ(bob->restartIceCalls(), 1);
  EXPECT_EQ(bob->iceRestartOffers(), 1);
  ASSERT_EQ(sent_.size(), 1u);
  EXPECT_EQ(sent_[0].type, SignalMessage::Type::OFFER);
  EXPECT_TRUE(manager_->hasPeer("bob"));
  EXPECT_TRUE(ended_.empty());
}

TEST_F(PeerConnectionManagerTest, ExhaustedIceRestartsTearDown) {
  PeerConnectionManagerConfig config;
  config.max_ice_restarts = 1;
  createManager(config);

  auto bob = connectTo("bob");
  bob->emitIceState(IceConnectionState::Failed);
  drain();
  EXPECT_EQ(bob->restartIceCalls(), 1);

  bob->emitIceState(IceConnectionState::Checking);
  bob->emitIceState(IceConnectionState::Failed);
  drain();

  EXPECT_EQ(bob->restartIceCalls(), 1);
  EXPECT_EQ(ended_["bob"], 1);
  EXPECT_FALSE(manager_->hasPeer("bob"));
}

TEST_F(PeerConnectionManagerTest, RemovePeerOfUnknownIdIsNoOp) {
  manager_->removePeer("nobody");
  EXPECT_TRUE(ended_.empty());
  EXPECT_EQ(manager_->peerCount(), 0u);
}

TEST_F(PeerConnectionManagerTest, RemovePeerEndsStreamOnce) {
  auto bob = connectTo("bob");
  manager_->removePeer("bob");
  manager_->removePeer("bob");

  EXPECT_EQ(ended_["bob"], 1);
  EXPECT_TRUE(bob->closed());
  EXPECT_FALSE(manager_->hasPeer("bob"));
}

TEST_F(PeerConnectionManagerTest, CleanupEndsEveryConnection) {
  manager_->startStreaming(MakeStream("local"));
  auto bob = connectTo("bob");
  auto carol = connectTo("carol");

  // bob is waiting out a grace period, carol is healthy.
  bob->emitConnectionState(PeerConnectionState::Connected);
  bob->emitConnectionState(PeerConnectionState::Disconnected);
  carol->emitConnectionState(PeerConnectionState::Connected);
  io_.restart();
  io_.poll();
  ASSERT_EQ(manager_->healthState("bob"), HealthState::Disconnected);
  ASSERT_EQ(manager_->healthState("carol"), HealthState::Connected);

  manager_->cleanup();

  EXPECT_EQ(manager_->peerCount(), 0u);
  EXPECT_FALSE(manager_->isStreaming());
  EXPECT_TRUE(bob->closed());
  EXPECT_TRUE(carol->closed());
  EXPECT_EQ(ended_["bob"], 1);
  EXPECT_EQ(ended_["carol"], 1);

  manager_->cleanup();
  EXPECT_EQ(ended_.size(), 2u);

  // bob's cancelled grace timer reports nothing later.
  drain();
  EXPECT_EQ(ended_["bob"], 1);
  EXPECT_EQ(ended_["carol"], 1);
  EXPECT_THAT(errors_, IsEmpty());
}

TEST_F(PeerConnectionManagerTest, RemovalDuringNegotiationAbandonsIt) {
  Outcome outcome;
  manager_->createOffer("bob", outcome.handler());
  manager_->removePeer("bob");
  drain();

  ASSERT_TRUE(outcome.called);
  EXPECT_FALSE(outcome.ok);
  EXPECT_EQ(outcome.error, "connection closed during negotiation");
  EXPECT_THAT(sent_, IsEmpty());
}

TEST_F(PeerConnectionManagerTest, FactoryFailureIsReported) {
  factory_.failNext();
  Outcome outcome;
  manager_->createOffer("bob", outcome.handler());

  EXPECT_TRUE(outcome.called);
  EXPECT_FALSE(outcome.ok);
  EXPECT_FALSE(manager_->hasPeer("bob"));
  EXPECT_THAT(errors_, ElementsAre("bob: could not create connection"));

  // The next attempt gets a fresh chance.
  connectTo("bob");
  EXPECT_TRUE(manager_->hasPeer("bob"));
}

TEST_F(PeerConnectionManagerTest, TransportErrorsAreReported) {
  auto bob = connectTo("bob");
  bob->emitError("dtls alert");
  drain();
  EXPECT_THAT(errors_, ElementsAre("bob: dtls alert"));
  EXPECT_TRUE(manager_->hasPeer("bob"));
}

// Two managers wired back to back through a relay on one io_context.
class GlareTest : public ::testing::Test {
 protected:
  GlareTest() : aliceFactory_(io_, "alice-pc"), bobFactory_(io_, "bob-pc") {
    alice_ = makeManager("alice", aliceFactory_, &bob_);
    bob_ = makeManager("bob", bobFactory_, &alice_);
  }

  std::unique_ptr<PeerConnectionManagerImpl> makeManager(
      const std::string& id, FakePeerConnectionFactory& factory,
      std::unique_ptr<PeerConnectionManagerImpl>* peer) {
    PeerConnectionManagerConfig config;
    config.local_id = id;
    config.room_id = "r1";
    return std::make_unique<PeerConnectionManagerImpl>(
        io_, config, factory, [this, peer](const SignalMessage& message) {
          boost::asio::post(io_, [this, peer, message]() {
            deliver(**peer, message);
          });
        });
  }

  void deliver(PeerConnectionManagerImpl& to, const SignalMessage& message) {
    SdpType type = SdpType::Offer;
    switch (message.type) {
      case SignalMessage::Type::OFFER:
        to.handleOffer(message.from,
                       Description(SdpType::Offer, message.sdp.value_or("")),
                       [this](bool ok, const std::string&) {
                         offersAccepted_ += ok ? 1 : 0;
                       });
        break;
      case SignalMessage::Type::ANSWER:
        SdpTypeFromString(message.sdpType.value_or("answer"), &type);
        to.handleAnswer(message.from,
                        Description(type, message.sdp.value_or("")),
                        [this](bool ok, const std::string&) {
                          answersApplied_ += ok ? 1 : 0;
                        });
        break;
      default:
        break;
    }
  }

  boost::asio::io_context io_;
  FakePeerConnectionFactory aliceFactory_;
  FakePeerConnectionFactory bobFactory_;
  std::unique_ptr<PeerConnectionManagerImpl> alice_;
  std::unique_ptr<PeerConnectionManagerImpl> bob_;
  int offersAccepted_ = 0;
  int answersApplied_ = 0;
};

TEST_F(GlareTest, PoliteSideRollsBackAndBothEndStable) {
  EXPECT_TRUE(Negotiator::IsPolite("alice", "bob"));
  EXPECT_FALSE(Negotiator::IsPolite("bob", "alice"));

  Outcome aliceOffer;
  Outcome bobOffer;
  alice_->createOffer("bob", aliceOffer.handler());
  bob_->createOffer("alice", bobOffer.handler());

  // Between alice's rollback and the arrival of her answer, bob keeps his
  // own offer outstanding.
  int stepsBetweenRollbackAndAnswer = 0;
  while (io_.run_one()) {
    if (aliceFactory_.createdCount() == 0 || bobFactory_.createdCount() == 0) {
      continue;
    }
    if (aliceFactory_.last()->rollbacks() == 1 &&
        bobFactory_.last()->remoteDescription().sdp.empty()) {
      ++stepsBetweenRollbackAndAnswer;
      EXPECT_EQ(bob_->signalingState("alice"), SignalingState::HaveLocalOffer);
    }
  }
  EXPECT_GT(stepsBetweenRollbackAndAnswer, 0);

  EXPECT_TRUE(aliceOffer.ok);
  EXPECT_TRUE(bobOffer.ok);

  ASSERT_EQ(aliceFactory_.createdCount(), 1u);
  ASSERT_EQ(bobFactory_.createdCount(), 1u);
  auto alicePc = aliceFactory_.last();
  auto bobPc = bobFactory_.last();

  // alice yielded: her offer was rolled back and bob's was answered.
  EXPECT_EQ(alicePc->rollbacks(), 1);
  EXPECT_EQ(alicePc->answersCreated(), 1);
  // bob ignored alice's offer and kept his own.
  EXPECT_EQ(bobPc->rollbacks(), 0);
  EXPECT_EQ(bobPc->answersCreated(), 0);

  EXPECT_EQ(offersAccepted_, 2);  // Ignoring counts as success.
  EXPECT_EQ(answersApplied_, 1);
  EXPECT_EQ(alice_->signalingState("bob"), SignalingState::Stable);
  EXPECT_EQ(bob_->signalingState("alice"), SignalingState::Stable);
  EXPECT_EQ(alicePc->remoteDescription().sdp,
            bobPc->localDescription().sdp);
}

TEST_F(GlareTest, SequentialOffersNeedNoRollback) {
  alice_->createOffer("bob", nullptr);
  io_.run();

  EXPECT_EQ(aliceFactory_.last()->rollbacks(), 0);
  EXPECT_EQ(bobFactory_.last()->answersCreated(), 1);
  EXPECT_EQ(alice_->signalingState("bob"), SignalingState::Stable);
  EXPECT_EQ(bob_->signalingState("alice"), SignalingState::Stable);
}

}  // namespace
}  // namespace webrtc
}  // namespace mesh
}  // namespace roomcast
