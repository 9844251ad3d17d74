#include "signaling/signaling_message.h"

#include <json/json.h>

#include <memory>
#include <string>

#include <gtest/gtest.h>

namespace roomcast {
namespace mesh {
namespace signaling {
namespace {

Json::Value Parse(const std::string& text) {
  Json::CharReaderBuilder builder;
  std::unique_ptr<Json::CharReader> reader(builder.newCharReader());
  Json::Value root;
  std::string errors;
  EXPECT_TRUE(
      reader->parse(text.data(), text.data() + text.size(), &root, &errors))
      << errors;
  return root;
}

TEST(SignalMessageTest, TypeNamesMatchTheWireFormat) {
  EXPECT_EQ(SignalMessage::TypeToString(SignalMessage::Type::OFFER),
            "webrtc-offer");
  EXPECT_EQ(SignalMessage::TypeToString(SignalMessage::Type::CANDIDATE),
            "webrtc-ice-candidate");
  EXPECT_EQ(SignalMessage::StringToType("user-streaming-started"),
            SignalMessage::Type::USER_STREAMING_STARTED);
  EXPECT_EQ(SignalMessage::StringToType("no-such-type"),
            SignalMessage::Type::UNKNOWN);
}

TEST(SignalMessageTest, SerializesOfferWithNestedDescription) {
  SignalMessage message(SignalMessage::Type::OFFER, "alice", "bob");
  message.roomId = "r1";
  message.sdp = "v=0";

  Json::Value root = Parse(SerializeSignalMessage(message));
  EXPECT_EQ(root["type"].asString(), "webrtc-offer");
  EXPECT_EQ(root["roomId"].asString(), "r1");
  EXPECT_EQ(root["fromUserId"].asString(), "alice");
  EXPECT_EQ(root["toUserId"].asString(), "bob");
  EXPECT_EQ(root["offer"]["type"].asString(), "offer");
  EXPECT_EQ(root["offer"]["sdp"].asString(), "v=0");
  EXPECT_FALSE(root.isMember("userId"));
}

TEST(SignalMessageTest, SerializesCandidateWithNullsForMissingFields) {
  SignalMessage message(SignalMessage::Type::CANDIDATE, "alice", "bob");
  message.candidate = "candidate:1 1 udp 1 1.2.3.4 5 typ host";

  Json::Value root = Parse(SerializeSignalMessage(message));
  const Json::Value& candidate = root["candidate"];
  EXPECT_EQ(candidate["candidate"].asString(), *message.candidate);
  EXPECT_TRUE(candidate.isMember("sdpMid"));
  EXPECT_TRUE(candidate["sdpMid"].isNull());
  EXPECT_TRUE(candidate["sdpMLineIndex"].isNull());
}

TEST(SignalMessageTest, SerializesRoomMessagesWithUserId) {
  SignalMessage message(SignalMessage::Type::JOIN_ROOM, "alice");
  message.roomId = "r1";
  message.userName = "Alice";

  Json::Value root = Parse(SerializeSignalMessage(message));
  EXPECT_EQ(root["type"].asString(), "join-room");
  EXPECT_EQ(root["userId"].asString(), "alice");
  EXPECT_EQ(root["userName"].asString(), "Alice");
  EXPECT_FALSE(root.isMember("fromUserId"));
}

TEST(SignalMessageTest, ParsesRoster) {
  auto message = DeserializeSignalMessage(R"({
    "type": "user-joined", "roomId": "r1", "userId": "carol",
    "userName": "Carol",
    "participants": [
      {"userId": "alice", "userName": "Alice", "isStreaming": true},
      {"userId": "carol"},
      {"userName": "no id"},
      "garbage"
    ]})");
  ASSERT_TRUE(message.has_value());
  EXPECT_EQ(message->type, SignalMessage::Type::USER_JOINED);
  EXPECT_EQ(message->from, "carol");
  EXPECT_EQ(message->userName.value_or(""), "Carol");
  ASSERT_EQ(message->participants.size(), 2u);
  EXPECT_TRUE(message->participants[0].isStreaming);
  EXPECT_EQ(message->participants[1].userName, "carol");
  EXPECT_FALSE(message->participants[1].isStreaming);
}

TEST(SignalMessageTest, ParsesAnswer) {
  auto message = DeserializeSignalMessage(
      R"({"type": "webrtc-answer", "fromUserId": "bob", "toUserId": "alice",
          "answer": {"type": "answer", "sdp": "v=0 b"}})");
  ASSERT_TRUE(message.has_value());
  EXPECT_EQ(message->type, SignalMessage::Type::ANSWER);
  EXPECT_EQ(message->from, "bob");
  EXPECT_EQ(message->to, "alice");
  EXPECT_EQ(message->sdpType.value_or(""), "answer");
  EXPECT_EQ(message->sdp.value_or(""), "v=0 b");
}

TEST(SignalMessageTest, ParsesCandidateIndexFromNumberOrString) {
  auto numeric = DeserializeSignalMessage(
      R"({"type": "webrtc-ice-candidate", "fromUserId": "bob",
          "candidate": {"candidate": "c", "sdpMid": "0", "sdpMLineIndex": 2}})");
  ASSERT_TRUE(numeric.has_value());
  EXPECT_EQ(numeric->sdpMlineIndex.value_or(-1), 2);
  EXPECT_EQ(numeric->sdpMid.value_or(""), "0");

  auto text = DeserializeSignalMessage(
      R"({"type": "webrtc-ice-candidate", "fromUserId": "bob",
          "candidate": {"candidate": "c", "sdpMlineIndex": "1"}})");
  ASSERT_TRUE(text.has_value());
  EXPECT_EQ(text->sdpMlineIndex.value_or(-1), 1);
  EXPECT_FALSE(text->sdpMid.has_value());

  auto bad = DeserializeSignalMessage(
      R"({"type": "webrtc-ice-candidate", "fromUserId": "bob",
          "candidate": {"candidate": "c", "sdpMLineIndex": "1x"}})");
  ASSERT_TRUE(bad.has_value());
  EXPECT_FALSE(bad->sdpMlineIndex.has_value());
}

TEST(SignalMessageTest, ParsesJoinError) {
  auto message = DeserializeSignalMessage(
      R"({"type": "join-room-error", "error": "room is full"})");
  ASSERT_TRUE(message.has_value());
  EXPECT_EQ(message->type, SignalMessage::Type::JOIN_ROOM_ERROR);
  EXPECT_EQ(message->reason.value_or(""), "room is full");
}

TEST(SignalMessageTest, UnknownTypeStillParses) {
  auto message = DeserializeSignalMessage(R"({"type": "server-hello"})");
  ASSERT_TRUE(message.has_value());
  EXPECT_EQ(message->type, SignalMessage::Type::UNKNOWN);
}

TEST(SignalMessageTest, RejectsNonObjects) {
  EXPECT_FALSE(DeserializeSignalMessage("not json").has_value());
  EXPECT_FALSE(DeserializeSignalMessage("[1, 2]").has_value());
  EXPECT_FALSE(DeserializeSignalMessage("").has_value());
}

TEST(SignalMessageTest, WrongFieldTypesAreIgnored) {
  auto message = DeserializeSignalMessage(
      R"({"type": "webrtc-offer", "fromUserId": 5, "offer": 7})");
  ASSERT_TRUE(message.has_value());
  EXPECT_EQ(message->type, SignalMessage::Type::OFFER);
  EXPECT_TRUE(message->from.empty());
  EXPECT_FALSE(message->sdp.has_value());
}

}  // namespace
}  // namespace signaling
}  // namespace mesh
}  // namespace roomcast
