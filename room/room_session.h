#ifndef ROOM_SESSION_H
#define ROOM_SESSION_H

#include <functional>
#include <map>
#include <memory>
#include <string>
#include <vector>

#include "signaling/signaling_message.h"
#include "webrtc/i_peer_connection_manager.h"
#include "webrtc/media_stream.h"

namespace roomcast {
namespace mesh {
namespace room {

using signaling::Participant;
using signaling::SignalMessage;

struct RoomSessionConfig {
  std::string room_id;
  std::string user_id;
  std::string user_name;
};

// Room membership and the offer policy on top of the peer-connection manager.
//
// Decides who offers to whom: a participant that starts streaming offers to
// every peer already streaming whose id sorts after its own, and a streaming
// participant offers to everyone who joins later. Everything else
// (answering, candidates, teardown) is driven by the manager.
//
// Runs on the manager's execution context; not thread-safe.
class RoomSession {
 public:
  using SendHandler = std::function<void(const SignalMessage& message)>;
  using OnParticipantsChangedHandler =
      std::function<void(const std::vector<Participant>& participants)>;
  using OnErrorHandler = std::function<void(const std::string& error_msg)>;

  RoomSession(const RoomSessionConfig& config,
              webrtc::IPeerConnectionManager& manager, SendHandler send);

  // Sends join-room.
  void join();
  // Tears down every connection and forgets the roster. The server notices
  // the socket closing; no message is sent.
  void leave();

  // Publishes stream to current and future peers, then announces it.
  void startStreaming(std::shared_ptr<webrtc::MediaStream> stream);
  void stopStreaming();

  // Sends a keep-alive ping.
  void ping();

  // Entry point for every message from the signaling channel.
  void handleMessage(const SignalMessage& message);

  bool joined() const { return joined_; }
  bool streaming() const { return streaming_; }
  // Other participants, ordered by id.
  std::vector<Participant> participants() const;

  void onParticipantsChanged(OnParticipantsChangedHandler handler) {
    onParticipantsChangedHandler_ = std::move(handler);
  }
  void onError(OnErrorHandler handler) { onErrorHandler_ = std::move(handler); }

 private:
  void handleRoomJoined(const SignalMessage& message);
  void handleUserJoined(const SignalMessage& message);
  void handleUserLeft(const SignalMessage& message);
  void handleStreamingStarted(const SignalMessage& message);
  void handleStreamingStopped(const SignalMessage& message);
  void handleOffer(const SignalMessage& message);
  void handleAnswer(const SignalMessage& message);
  void handleCandidate(const SignalMessage& message);

  // Replaces the roster with message.participants, skipping self. Every
  // roster message from the server carries the full list.
  void updateParticipants(const SignalMessage& message);
  bool addressedToMe(const SignalMessage& message) const;
  void offerTo(const std::string& remote_id);
  void send(SignalMessage message);
  void reportError(const std::string& error_msg);

  const RoomSessionConfig config_;
  webrtc::IPeerConnectionManager& manager_;
  SendHandler send_;

  bool joined_ = false;
  bool streaming_ = false;
  std::map<std::string, Participant> participants_;

  OnParticipantsChangedHandler onParticipantsChangedHandler_;
  OnErrorHandler onErrorHandler_;

  RoomSession(const RoomSession&) = delete;
  RoomSession& operator=(const RoomSession&) = delete;
};

}  // namespace room
}  // namespace mesh
}  // namespace roomcast

#endif  // ROOM_SESSION_H
