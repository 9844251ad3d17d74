#include "signaling/signaling_message.h"

#include <json/json.h>

#include <exception>
#include <iostream>
#include <map>
#include <memory>
#include <string>

namespace roomcast {
namespace mesh {
namespace signaling {

namespace {
// Map enum to string
const std::map<SignalMessage::Type, std::string> typeToStringMap = {
    {SignalMessage::Type::UNKNOWN, "unknown"},
    {SignalMessage::Type::JOIN_ROOM, "join-room"},
    {SignalMessage::Type::ROOM_JOINED, "room-joined"},
    {SignalMessage::Type::USER_JOINED, "user-joined"},
    {SignalMessage::Type::USER_LEFT, "user-left"},
    {SignalMessage::Type::START_STREAMING, "start-streaming"},
    {SignalMessage::Type::STOP_STREAMING, "stop-streaming"},
    {SignalMessage::Type::USER_STREAMING_STARTED, "user-streaming-started"},
    {SignalMessage::Type::USER_STREAMING_STOPPED, "user-streaming-stopped"},
    {SignalMessage::Type::JOIN_ROOM_ERROR, "join-room-error"},
    {SignalMessage::Type::PING, "ping"},
    {SignalMessage::Type::PONG, "pong"},
    {SignalMessage::Type::OFFER, "webrtc-offer"},
    {SignalMessage::Type::ANSWER, "webrtc-answer"},
    {SignalMessage::Type::CANDIDATE, "webrtc-ice-candidate"}};

// Map string to enum
const std::map<std::string, SignalMessage::Type> stringToTypeMap = [] {
  std::map<std::string, SignalMessage::Type> reversed;
  for (const auto& entry : typeToStringMap) {
    reversed.emplace(entry.second, entry.first);
  }
  return reversed;
}();

// Returns the member as a string if it is one.
std::optional<std::string> StringMember(const Json::Value& object,
                                        const char* key) {
  const Json::Value& value = object[key];
  if (!value.isString()) {
    return std::nullopt;
  }
  return value.asString();
}

// Accepts a JSON integer or a numeric string.
std::optional<int> IntMember(const Json::Value& object, const char* key) {
  const Json::Value& value = object[key];
  if (value.isInt()) {
    return value.asInt();
  }
  if (value.isString()) {
    const std::string text = value.asString();
    if (text.empty()) {
      return std::nullopt;
    }
    size_t consumed = 0;
    try {
      int parsed = std::stoi(text, &consumed);
      if (consumed == text.size()) {
        return parsed;
      }
    } catch (const std::exception&) {
      // Falls through to nullopt.
    }
  }
  return std::nullopt;
}

Json::Value ParticipantsToJson(const std::vector<Participant>& participants) {
  Json::Value array(Json::arrayValue);
  for (const auto& p : participants) {
    Json::Value entry(Json::objectValue);
    entry["userId"] = p.userId;
    entry["userName"] = p.userName;
    entry["isStreaming"] = p.isStreaming;
    array.append(entry);
  }
  return array;
}

std::vector<Participant> ParticipantsFromJson(const Json::Value& array) {
  std::vector<Participant> participants;
  if (!array.isArray()) {
    return participants;
  }
  for (const auto& entry : array) {
    if (!entry.isObject()) {
      continue;
    }
    auto user_id = StringMember(entry, "userId");
    if (!user_id) {
      continue;
    }
    Participant p;
    p.userId = *user_id;
    p.userName = StringMember(entry, "userName").value_or(*user_id);
    p.isStreaming = entry["isStreaming"].isBool() && entry["isStreaming"].asBool();
    participants.push_back(p);
  }
  return participants;
}

bool IsNegotiation(SignalMessage::Type type) {
  return type == SignalMessage::Type::OFFER ||
         type == SignalMessage::Type::ANSWER ||
         type == SignalMessage::Type::CANDIDATE;
}

SignalMessage FromJson(const Json::Value& root) {
  SignalMessage msg;
  msg.type = SignalMessage::StringToType(
      StringMember(root, "type").value_or("unknown"));
  msg.roomId = StringMember(root, "roomId").value_or("");

  // Negotiation messages name both ends; room messages only carry userId.
  if (auto from = StringMember(root, "fromUserId")) {
    msg.from = *from;
  } else {
    msg.from = StringMember(root, "userId").value_or("");
  }
  msg.to = StringMember(root, "toUserId").value_or("");
  msg.userName = StringMember(root, "userName");
  msg.participants = ParticipantsFromJson(root["participants"]);
  msg.reason = StringMember(root, "error");

  const char* description_key = nullptr;
  if (msg.type == SignalMessage::Type::OFFER) description_key = "offer";
  if (msg.type == SignalMessage::Type::ANSWER) description_key = "answer";
  if (description_key) {
    const Json::Value& description = root[description_key];
    if (description.isObject()) {
      msg.sdpType = StringMember(description, "type");
      msg.sdp = StringMember(description, "sdp");
    } else if (description.isString()) {
      msg.sdp = description.asString();
    }
  }

  if (msg.type == SignalMessage::Type::CANDIDATE) {
    const Json::Value& candidate = root["candidate"];
    if (candidate.isObject()) {
      msg.candidate = StringMember(candidate, "candidate");
      msg.sdpMid = StringMember(candidate, "sdpMid");
      msg.sdpMlineIndex = IntMember(candidate, "sdpMLineIndex");
      if (!msg.sdpMlineIndex) {
        msg.sdpMlineIndex = IntMember(candidate, "sdpMlineIndex");
      }
    } else if (candidate.isString()) {
      msg.candidate = candidate.asString();
    }
  }
  return msg;
}

}  // anonymous namespace

std::string SignalMessage::TypeToString(Type type) {
  auto it = typeToStringMap.find(type);
  if (it != typeToStringMap.end()) {
    return it->second;
  }
  return "unknown";
}

SignalMessage::Type SignalMessage::StringToType(const std::string& typeStr) {
  auto it = stringToTypeMap.find(typeStr);
  if (it != stringToTypeMap.end()) {
    return it->second;
  }
  return SignalMessage::Type::UNKNOWN;
}

std::string SerializeSignalMessage(const SignalMessage& message) {
  Json::Value root(Json::objectValue);
  root["type"] = SignalMessage::TypeToString(message.type);
  if (!message.roomId.empty()) {
    root["roomId"] = message.roomId;
  }

  if (IsNegotiation(message.type)) {
    root["fromUserId"] = message.from;
    root["toUserId"] = message.to;
  } else if (!message.from.empty()) {
    root["userId"] = message.from;
  }
  if (message.userName) root["userName"] = *message.userName;

  switch (message.type) {
    case SignalMessage::Type::OFFER:
    case SignalMessage::Type::ANSWER: {
      const bool is_offer = message.type == SignalMessage::Type::OFFER;
      Json::Value description(Json::objectValue);
      description["type"] =
          message.sdpType.value_or(is_offer ? "offer" : "answer");
      description["sdp"] = message.sdp.value_or("");
      root[is_offer ? "offer" : "answer"] = description;
      break;
    }
    case SignalMessage::Type::CANDIDATE: {
      Json::Value candidate(Json::objectValue);
      candidate["candidate"] = message.candidate.value_or("");
      if (message.sdpMid) {
        candidate["sdpMid"] = *message.sdpMid;
      } else {
        candidate["sdpMid"] = Json::Value();
      }
      if (message.sdpMlineIndex) {
        candidate["sdpMLineIndex"] = *message.sdpMlineIndex;
      } else {
        candidate["sdpMLineIndex"] = Json::Value();
      }
      root["candidate"] = candidate;
      break;
    }
    case SignalMessage::Type::ROOM_JOINED:
    case SignalMessage::Type::USER_JOINED:
    case SignalMessage::Type::USER_LEFT:
    case SignalMessage::Type::USER_STREAMING_STARTED:
    case SignalMessage::Type::USER_STREAMING_STOPPED:
      root["participants"] = ParticipantsToJson(message.participants);
      break;
    case SignalMessage::Type::JOIN_ROOM_ERROR:
      if (message.reason) root["error"] = *message.reason;
      break;
    default:
      break;
  }

  Json::StreamWriterBuilder builder;
  builder["indentation"] = "";
  return Json::writeString(builder, root);
}

std::optional<SignalMessage> DeserializeSignalMessage(const std::string& data) {
  Json::CharReaderBuilder builder;
  std::unique_ptr<Json::CharReader> reader(builder.newCharReader());
  Json::Value root;
  std::string errors;
  if (!reader->parse(data.data(), data.data() + data.size(), &root, &errors)) {
    std::cerr << "DeserializeSignalMessage Error: JSON parse failed: "
              << errors << std::endl;
    return std::nullopt;
  }
  if (!root.isObject()) {
    std::cerr << "DeserializeSignalMessage Error: payload is not a JSON object."
              << std::endl;
    return std::nullopt;
  }

  try {
    return FromJson(root);
  } catch (const Json::Exception& e) {
    std::cerr << "DeserializeSignalMessage Error: " << e.what() << std::endl;
    return std::nullopt;
  }
}

}  // namespace signaling
}  // namespace mesh
}  // namespace roomcast
