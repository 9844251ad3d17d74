#ifndef CLIENT_CONFIG_H
#define CLIENT_CONFIG_H

#include <string>
#include <vector>

namespace roomcast {
namespace mesh {
namespace config {

struct SignalingServerConfig {
  std::string uri;  // ws:// or wss:// room server URI
  std::string jwt;  // Optional JWT
};

struct RoomConfig {
  std::string room_id;
  std::string user_id;    // Unique within the room
  std::string user_name;  // Display name; defaults to user_id
};

// Structure to hold all configuration parameters for the streaming client
struct ClientConfig {
  SignalingServerConfig signaling;
  RoomConfig room;

  // STUN/TURN servers. Empty means the default public STUN pair.
  struct IceServer {
    std::vector<std::string> urls;
    std::string username;    // for TURN
    std::string credential;  // for TURN
  };
  std::vector<IceServer> ice_servers;

  int disconnect_grace_period_ms = 5000;
  int max_ice_restarts = 0;  // 0 means unlimited

  // Publish the local stream as soon as the room is joined.
  bool stream_on_join = false;
  int keepalive_interval_ms = 25000;  // 0 disables the ping
};

}  // namespace config
}  // namespace mesh
}  // namespace roomcast

#endif  // CLIENT_CONFIG_H
