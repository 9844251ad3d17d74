#ifndef NEGOTIATOR_H
#define NEGOTIATOR_H

#include <functional>
#include <memory>
#include <string>
#include <utility>

#include <boost/asio/io_context.hpp>

#include "signaling/signaling_message.h"
#include "webrtc/connection_registry.h"
#include "webrtc/peer_connection.h"

namespace roomcast {
namespace mesh {
namespace webrtc {

using signaling::SignalMessage;

// Drives the offer/answer exchange for every connection and resolves glare
// (both sides offering at once) with a fixed rule: the side whose own id
// sorts lower is polite and rolls back its offer, the other side ignores the
// incoming offer and keeps its own in flight.
//
// All methods run on the manager's execution context. Asynchronous steps hold
// only a weak reference to the session; if the connection is closed while a
// step is pending, the continuation reports "connection closed" to the
// completion handler and sends nothing.
class Negotiator {
 public:
  using SignalSender = std::function<void(const SignalMessage& message)>;
  // ok == false carries a human-readable error. Never throws.
  using CompletionHandler =
      std::function<void(bool ok, const std::string& error)>;
  // Transient negotiation errors, for logging/reporting by the owner.
  using ErrorReporter = std::function<void(const std::string& remote_id,
                                           const std::string& error)>;

  // Completions from the transport are posted onto io_context before any
  // state is read.
  Negotiator(boost::asio::io_context& io_context, std::string local_id,
             std::string room_id, ConnectionRegistry& registry,
             SignalSender sender);

  void setErrorReporter(ErrorReporter reporter) {
    errorReporter_ = std::move(reporter);
  }

  // Gets or creates the connection, creates a send/receive audio+video offer,
  // applies it locally and sends it to remote_id. On failure the connection
  // is left in place for a retry.
  void createOffer(const std::string& remote_id, CompletionHandler done);

  // Same as createOffer but requests fresh ICE credentials on an existing
  // connection. No-op (reported as failure) for unknown ids.
  void restartIce(const std::string& remote_id, CompletionHandler done);

  // Applies a remote offer and answers it, resolving glare first. An offer
  // ignored by the impolite side completes with ok == true and sends nothing.
  void handleOffer(const std::string& from_id, const SessionDescription& offer,
                   CompletionHandler done);

  // Applies a remote answer. An answer for an unknown connection is dropped
  // without creating one.
  void handleAnswer(const std::string& from_id,
                    const SessionDescription& answer, CompletionHandler done);

  // Adds a remote candidate. Unknown connections and malformed candidates are
  // dropped; there is no retry.
  void handleIceCandidate(const std::string& from_id,
                          const IceCandidate& candidate);

  // Forwards a locally discovered candidate to remote_id immediately.
  void sendLocalCandidate(const std::string& remote_id,
                          const IceCandidate& candidate);

  // True if the local side yields when both sides offer at once.
  static bool IsPolite(const std::string& local_id,
                       const std::string& remote_id) {
    return local_id < remote_id;
  }

  const std::string& localId() const { return local_id_; }

 private:
  void startOffer(const std::shared_ptr<PeerSession>& session,
                  const OfferAnswerOptions& options, CompletionHandler done);
  void acceptOffer(const std::shared_ptr<PeerSession>& session,
                   const SessionDescription& offer, CompletionHandler done);
  void sendDescription(const std::string& remote_id,
                       const SessionDescription& description);

  // Reports the failure and completes done with ok == false.
  void fail(const std::string& remote_id, const std::string& error,
            const CompletionHandler& done);
  // Protocol anomaly from an untrusted peer: logged and dropped.
  static void drop(const std::string& remote_id, const std::string& reason,
                   const CompletionHandler& done);
  // The session closed mid-negotiation.
  static void abandon(const std::string& remote_id,
                      const CompletionHandler& done);
  static void succeed(const CompletionHandler& done);

  boost::asio::io_context& io_context_;
  const std::string local_id_;
  const std::string room_id_;
  ConnectionRegistry& registry_;
  SignalSender sender_;
  ErrorReporter errorReporter_;
};

}  // namespace webrtc
}  // namespace mesh
}  // namespace roomcast

#endif  // NEGOTIATOR_H
