#ifndef JSON_CONFIG_LOADER_H
#define JSON_CONFIG_LOADER_H

#include <optional>
#include <string>

#include "config/client_config.h"

namespace roomcast {
namespace mesh {
namespace config {

// Loads ClientConfig from JSON. Example:
//
//   {
//     "signaling": {"uri": "wss://rooms.example.com/ws", "jwt": "..."},
//     "room": {"room_id": "standup", "user_id": "alice"},
//     "ice_servers": [{"urls": "stun:stun.l.google.com:19302"}],
//     "disconnect_grace_period_ms": 5000,
//     "stream_on_join": true
//   }
//
// Failures are logged and reported as std::nullopt.
class JsonConfigLoader {
 public:
  static std::optional<ClientConfig> loadConfig(const std::string& path);
  static std::optional<ClientConfig> loadConfigFromString(
      const std::string& text);
};

}  // namespace config
}  // namespace mesh
}  // namespace roomcast

#endif  // JSON_CONFIG_LOADER_H
