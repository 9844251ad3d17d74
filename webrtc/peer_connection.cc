#include "webrtc/peer_connection.h"

#include <map>

namespace roomcast {
namespace mesh {
namespace webrtc {

namespace {
const std::map<SdpType, std::string> sdpTypeToStringMap = {
    {SdpType::Offer, "offer"},
    {SdpType::PrAnswer, "pranswer"},
    {SdpType::Answer, "answer"},
    {SdpType::Rollback, "rollback"}};

const std::map<std::string, SdpType> stringToSdpTypeMap = {
    {"offer", SdpType::Offer},
    {"pranswer", SdpType::PrAnswer},
    {"answer", SdpType::Answer},
    {"rollback", SdpType::Rollback}};
}  // anonymous namespace

const char* ToString(PeerConnectionState state) {
  switch (state) {
    case PeerConnectionState::New:
      return "new";
    case PeerConnectionState::Connecting:
      return "connecting";
    case PeerConnectionState::Connected:
      return "connected";
    case PeerConnectionState::Disconnected:
      return "disconnected";
    case PeerConnectionState::Failed:
      return "failed";
    case PeerConnectionState::Closed:
      return "closed";
  }
  return "unknown";
}

const char* ToString(IceConnectionState state) {
  switch (state) {
    case IceConnectionState::New:
      return "new";
    case IceConnectionState::Checking:
      return "checking";
    case IceConnectionState::Connected:
      return "connected";
    case IceConnectionState::Completed:
      return "completed";
    case IceConnectionState::Failed:
      return "failed";
    case IceConnectionState::Disconnected:
      return "disconnected";
    case IceConnectionState::Closed:
      return "closed";
  }
  return "unknown";
}

const char* ToString(SignalingState state) {
  switch (state) {
    case SignalingState::Stable:
      return "stable";
    case SignalingState::HaveLocalOffer:
      return "have-local-offer";
    case SignalingState::HaveLocalPrAnswer:
      return "have-local-pranswer";
    case SignalingState::HaveRemoteOffer:
      return "have-remote-offer";
    case SignalingState::HaveRemotePrAnswer:
      return "have-remote-pranswer";
    case SignalingState::Closed:
      return "closed";
  }
  return "unknown";
}

std::string SdpTypeToString(SdpType type) {
  auto it = sdpTypeToStringMap.find(type);
  if (it != sdpTypeToStringMap.end()) {
    return it->second;
  }
  return "offer";
}

bool SdpTypeFromString(const std::string& type_str, SdpType* type) {
  auto it = stringToSdpTypeMap.find(type_str);
  if (it == stringToSdpTypeMap.end()) {
    return false;
  }
  *type = it->second;
  return true;
}

}  // namespace webrtc
}  // namespace mesh
}  // namespace roomcast
