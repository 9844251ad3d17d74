#include "room/room_session.h"

#include <iostream>
#include <utility>

#include "webrtc/peer_connection.h"

namespace roomcast {
namespace mesh {
namespace room {

using webrtc::IceCandidate;
using webrtc::SdpType;
using webrtc::SessionDescription;

namespace {

// Logs the outcome of a negotiation step started by the room.
webrtc::IPeerConnectionManager::CompletionHandler LogOutcome(
    const std::string& what, const std::string& remote_id) {
  return [what, remote_id](bool ok, const std::string& error) {
    if (!ok) {
      std::cerr << "RoomSession: " << what << " with " << remote_id
                << " failed: " << error << std::endl;
    }
  };
}

}  // namespace

RoomSession::RoomSession(const RoomSessionConfig& config,
                         webrtc::IPeerConnectionManager& manager,
                         SendHandler send)
    : config_(config), manager_(manager), send_(std::move(send)) {}

void RoomSession::join() {
  std::cout << "RoomSession: Joining room " << config_.room_id << " as "
            << config_.user_id << "." << std::endl;
  SignalMessage message(SignalMessage::Type::JOIN_ROOM, config_.user_id);
  message.userName = config_.user_name;
  send(std::move(message));
}

void RoomSession::leave() {
  std::cout << "RoomSession: Leaving room " << config_.room_id << "."
            << std::endl;
  manager_.cleanup();
  streaming_ = false;
  joined_ = false;
  participants_.clear();
}

void RoomSession::startStreaming(std::shared_ptr<webrtc::MediaStream> stream) {
  if (!stream) {
    reportError("cannot stream without a local stream");
    return;
  }
  manager_.startStreaming(std::move(stream));
  streaming_ = true;
  send(SignalMessage(SignalMessage::Type::START_STREAMING, config_.user_id));
}

void RoomSession::stopStreaming() {
  if (!streaming_) {
    return;
  }
  manager_.stopStreaming();
  streaming_ = false;
  send(SignalMessage(SignalMessage::Type::STOP_STREAMING, config_.user_id));
}

void RoomSession::ping() {
  send(SignalMessage(SignalMessage::Type::PING, config_.user_id));
}

void RoomSession::handleMessage(const SignalMessage& message) {
  switch (message.type) {
    case SignalMessage::Type::ROOM_JOINED:
      handleRoomJoined(message);
      break;
    case SignalMessage::Type::USER_JOINED:
      handleUserJoined(message);
      break;
    case SignalMessage::Type::USER_LEFT:
      handleUserLeft(message);
      break;
    case SignalMessage::Type::USER_STREAMING_STARTED:
      handleStreamingStarted(message);
      break;
    case SignalMessage::Type::USER_STREAMING_STOPPED:
      handleStreamingStopped(message);
      break;
    case SignalMessage::Type::OFFER:
      handleOffer(message);
      break;
    case SignalMessage::Type::ANSWER:
      handleAnswer(message);
      break;
    case SignalMessage::Type::CANDIDATE:
      handleCandidate(message);
      break;
    case SignalMessage::Type::JOIN_ROOM_ERROR:
      reportError("join rejected: " + message.reason.value_or("unknown"));
      break;
    case SignalMessage::Type::PONG:
      break;
    default:
      std::cout << "RoomSession: Ignoring message of type "
                << SignalMessage::TypeToString(message.type) << "."
                << std::endl;
      break;
  }
}

std::vector<Participant> RoomSession::participants() const {
  std::vector<Participant> result;
  result.reserve(participants_.size());
  for (const auto& entry : participants_) {
    result.push_back(entry.second);
  }
  return result;
}

// --- Room events ---

// Peers that are already streaming offer to us; nothing to start here.
void RoomSession::handleRoomJoined(const SignalMessage& message) {
  joined_ = true;
  std::cout << "RoomSession: Joined room " << config_.room_id << " with "
            << message.participants.size() << " participants." << std::endl;
  updateParticipants(message);
}

void RoomSession::handleUserJoined(const SignalMessage& message) {
  updateParticipants(message);
  if (message.from.empty() || message.from == config_.user_id) {
    return;
  }
  std::cout << "RoomSession: " << message.userName.value_or(message.from)
            << " joined." << std::endl;
  if (streaming_) {
    offerTo(message.from);
  }
}

void RoomSession::handleUserLeft(const SignalMessage& message) {
  const bool known = participants_.count(message.from) > 0;
  updateParticipants(message);
  if (known) {
    std::cout << "RoomSession: " << message.from << " left." << std::endl;
    manager_.removePeer(message.from);
  }
}

void RoomSession::handleStreamingStarted(const SignalMessage& message) {
  updateParticipants(message);

  if (message.from == config_.user_id) {
    // The lower id offers, so only peers that sort after us are ours.
    for (const Participant& p : message.participants) {
      if (p.userId != config_.user_id && p.isStreaming &&
          config_.user_id < p.userId) {
        offerTo(p.userId);
      }
    }
    return;
  }

  std::cout << "RoomSession: " << message.from << " started streaming."
            << std::endl;
  if (streaming_ && config_.user_id < message.from) {
    offerTo(message.from);
  }
}

void RoomSession::handleStreamingStopped(const SignalMessage& message) {
  updateParticipants(message);
  if (message.from.empty() || message.from == config_.user_id) {
    return;
  }
  std::cout << "RoomSession: " << message.from << " stopped streaming."
            << std::endl;
  manager_.removePeer(message.from);
}

// --- Negotiation relay ---

void RoomSession::handleOffer(const SignalMessage& message) {
  if (!addressedToMe(message)) {
    return;
  }
  SessionDescription offer;
  if (!message.sdp || !webrtc::SdpTypeFromString(
                          message.sdpType.value_or("offer"), &offer.type)) {
    std::cerr << "RoomSession: Malformed offer from " << message.from << "."
              << std::endl;
    return;
  }
  offer.sdp = *message.sdp;
  manager_.handleOffer(message.from, offer,
                       LogOutcome("Answering offer", message.from));
}

void RoomSession::handleAnswer(const SignalMessage& message) {
  if (!addressedToMe(message)) {
    return;
  }
  SessionDescription answer;
  if (!message.sdp || !webrtc::SdpTypeFromString(
                          message.sdpType.value_or("answer"), &answer.type)) {
    std::cerr << "RoomSession: Malformed answer from " << message.from << "."
              << std::endl;
    return;
  }
  answer.sdp = *message.sdp;
  manager_.handleAnswer(message.from, answer,
                        LogOutcome("Applying answer", message.from));
}

void RoomSession::handleCandidate(const SignalMessage& message) {
  if (!addressedToMe(message)) {
    return;
  }
  IceCandidate candidate;
  candidate.candidate = message.candidate.value_or("");
  candidate.sdpMid = message.sdpMid.value_or("");
  candidate.sdpMLineIndex = message.sdpMlineIndex.value_or(-1);
  manager_.handleIceCandidate(message.from, candidate);
}

// --- Helpers ---

void RoomSession::updateParticipants(const SignalMessage& message) {
  participants_.clear();
  for (const Participant& p : message.participants) {
    if (p.userId != config_.user_id) {
      participants_[p.userId] = p;
    }
  }
  if (onParticipantsChangedHandler_) {
    onParticipantsChangedHandler_(participants());
  }
}

bool RoomSession::addressedToMe(const SignalMessage& message) const {
  if (message.from.empty() || message.from == config_.user_id) {
    std::cerr << "RoomSession: Dropping "
              << SignalMessage::TypeToString(message.type)
              << " without a valid sender." << std::endl;
    return false;
  }
  if (!message.to.empty() && message.to != config_.user_id) {
    std::cerr << "RoomSession: Dropping "
              << SignalMessage::TypeToString(message.type) << " addressed to "
              << message.to << "." << std::endl;
    return false;
  }
  return true;
}

void RoomSession::offerTo(const std::string& remote_id) {
  std::cout << "RoomSession: Offering to " << remote_id << "." << std::endl;
  manager_.createOffer(remote_id, LogOutcome("Offer", remote_id));
}

void RoomSession::send(SignalMessage message) {
  message.roomId = config_.room_id;
  if (send_) {
    send_(message);
  }
}

void RoomSession::reportError(const std::string& error_msg) {
  std::cerr << "RoomSession: " << error_msg << std::endl;
  if (onErrorHandler_) {
    onErrorHandler_(error_msg);
  }
}

}  // namespace room
}  // namespace mesh
}  // namespace roomcast
