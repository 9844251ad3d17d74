#ifndef ICE_SERVER_CONFIG_H
#define ICE_SERVER_CONFIG_H

#include <string>
#include <vector>

namespace roomcast {
namespace mesh {
namespace webrtc {

// A STUN/TURN server descriptor.
struct IceServer {
  std::vector<std::string> urls;  // e.g. "stun:stun.l.google.com:19302"
  std::string username;           // for TURN
  std::string credential;         // for TURN

  bool hasCredentials() const {
    return !username.empty() && !credential.empty();
  }
};

// Supplies the traversal endpoints used for every new connection.
// Constructed once from configuration; the list does not change afterwards.
class IceConfigurationProvider {
 public:
  // Uses DefaultServers().
  IceConfigurationProvider();

  // Invalid entries are dropped with a log line. If nothing valid remains the
  // defaults are used instead.
  explicit IceConfigurationProvider(const std::vector<IceServer>& servers);

  const std::vector<IceServer>& servers() const { return servers_; }

  // Two public Google STUN servers.
  static std::vector<IceServer> DefaultServers();

  // Checks url schemes and TURN credentials. On failure, error (if non-null)
  // receives the reason.
  static bool Validate(const IceServer& server, std::string* error);

 private:
  std::vector<IceServer> servers_;
};

}  // namespace webrtc
}  // namespace mesh
}  // namespace roomcast

#endif  // ICE_SERVER_CONFIG_H
