#ifndef SIGNALING_MESSAGE_H
#define SIGNALING_MESSAGE_H

#include <optional>
#include <string>
#include <vector>

namespace roomcast {
namespace mesh {
namespace signaling {

// A room member as reported by the room server.
struct Participant {
  std::string userId;
  std::string userName;
  bool isStreaming = false;
};

// Represents a structured signaling message payload
struct SignalMessage {
  enum class Type {
    UNKNOWN,
    // Room protocol
    JOIN_ROOM,               // Client -> server: enter a room
    ROOM_JOINED,             // Server -> client: roster on entry
    USER_JOINED,             // Another member entered
    USER_LEFT,               // A member left
    START_STREAMING,         // Client -> server
    STOP_STREAMING,          // Client -> server
    USER_STREAMING_STARTED,  // A member (possibly self) started streaming
    USER_STREAMING_STOPPED,
    JOIN_ROOM_ERROR,
    PING,
    PONG,
    // Peer-to-peer negotiation, relayed by the server
    OFFER,      // WebRTC SDP Offer
    ANSWER,     // WebRTC SDP Answer
    CANDIDATE,  // WebRTC ICE Candidate
  };

  Type type = Type::UNKNOWN;
  std::string from;  // Sender's user id (fromUserId / userId on the wire).
  std::string to;    // Receiver's user id, empty for room messages.
  std::string roomId;

  std::optional<std::string> userName;  // JOIN_ROOM, USER_JOINED

  // OFFER, ANSWER. sdpType is "offer" or "answer".
  std::optional<std::string> sdpType;
  std::optional<std::string> sdp;

  // CANDIDATE
  std::optional<std::string> candidate;
  std::optional<std::string> sdpMid;
  std::optional<int> sdpMlineIndex;

  std::vector<Participant> participants;  // Roster updates
  std::optional<std::string> reason;      // JOIN_ROOM_ERROR

  SignalMessage(Type msg_type = Type::UNKNOWN, const std::string& sender = "",
                const std::string& receiver = "")
      : type(msg_type), from(sender), to(receiver) {}

  // Wire name, e.g. "webrtc-offer".
  static std::string TypeToString(Type type);
  // Unknown names map to UNKNOWN.
  static Type StringToType(const std::string& typeStr);
};

// Serializes to a compact JSON object in the room server's format.
std::string SerializeSignalMessage(const SignalMessage& message);

// Returns std::nullopt if data is not a JSON object. Unknown message types
// parse successfully with type UNKNOWN.
std::optional<SignalMessage> DeserializeSignalMessage(const std::string& data);

}  // namespace signaling
}  // namespace mesh
}  // namespace roomcast

#endif  // SIGNALING_MESSAGE_H
