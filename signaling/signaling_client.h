#ifndef SIGNALING_CLIENT_H
#define SIGNALING_CLIENT_H

#include <functional>
#include <memory>
#include <string>

#include "signaling/signaling_message.h"

namespace roomcast {
namespace mesh {
namespace signaling {

// WebSocket channel to the room server. Handlers are invoked on the client's
// own network thread; callers that need another context must marshal.
class SignalingClient {
 public:
  // --- Callbacks for different signaling events ---
  using OnConnectedHandler = std::function<void()>;
  using OnDisconnectedHandler = std::function<void()>;
  using OnErrorHandler = std::function<void(const std::string& error_msg)>;
  // Receives parsed signal message
  using OnMessageReceivedHandler =
      std::function<void(const SignalMessage& message)>;

  // uri: ws:// or wss:// room server URI.
  // jwt: Optional token, appended as the "token" query parameter.
  SignalingClient(const std::string& uri, const std::string& jwt = "")
      : uri_(uri), jwt_(jwt) {}

  virtual ~SignalingClient() = default;

  // --- Core Signaling Actions ---

  // Initiates the connection process. This is asynchronous.
  virtual void connect() = 0;

  // Gracefully disconnects and stops the network thread.
  virtual void disconnect() = 0;

  // Sends a message to the server, which routes it by message.to. Messages
  // sent before the connection opens are queued and flushed on open.
  virtual void sendSignal(const SignalMessage& message) = 0;

  // --- Registering Event Handlers ---
  // Set these before connect().
  virtual void onConnected(OnConnectedHandler handler) = 0;
  virtual void onDisconnected(OnDisconnectedHandler handler) = 0;
  virtual void onError(OnErrorHandler handler) = 0;
  virtual void onMessageReceived(OnMessageReceivedHandler handler) = 0;

 protected:
  OnConnectedHandler onConnectedHandler_;
  OnDisconnectedHandler onDisconnectedHandler_;
  OnErrorHandler onErrorHandler_;
  OnMessageReceivedHandler onMessageReceivedHandler_;

  std::string uri_;
  std::string jwt_;

  // Prevent copying and assignment
  SignalingClient(const SignalingClient&) = delete;
  SignalingClient& operator=(const SignalingClient&) = delete;
};

// Builds the websocketpp-backed client. wss:// URIs get a TLS transport.
// Returns nullptr if the URI scheme is neither ws nor wss.
std::unique_ptr<SignalingClient> CreateSignalingClient(const std::string& uri,
                                                       const std::string& jwt);

}  // namespace signaling
}  // namespace mesh
}  // namespace roomcast

#endif  // SIGNALING_CLIENT_H
