#ifndef CONNECTION_REGISTRY_H
#define CONNECTION_REGISTRY_H

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <utility>
#include <vector>

#include <absl/base/thread_annotations.h>
#include <boost/asio/io_context.hpp>
#include <boost/asio/steady_timer.hpp>

#include "webrtc/connection_health_monitor.h"
#include "webrtc/media_stream.h"
#include "webrtc/peer_connection.h"

namespace roomcast {
namespace mesh {
namespace webrtc {

// Everything the manager tracks for one remote participant: the transport,
// the last remote stream, the health state machine and its grace timer.
// Sessions are only mutated on the manager's execution context.
class PeerSession {
 public:
  PeerSession(std::string remote_id, boost::asio::io_context& io_context,
              const HealthMonitorConfig& health_config);
  ~PeerSession();

  const std::string& remoteId() const { return remote_id_; }

  // Attaches the transport. Called once by the session factory.
  void setConnection(std::shared_ptr<IPeerConnection> connection);
  IPeerConnection& connection() const { return *connection_; }
  bool hasConnection() const { return connection_ != nullptr; }

  std::shared_ptr<MediaStream> remoteStream() const { return remote_stream_; }
  void setRemoteStream(std::shared_ptr<MediaStream> stream) {
    remote_stream_ = std::move(stream);
  }

  ConnectionHealthMonitor& health() { return health_; }
  const ConnectionHealthMonitor& health() const { return health_; }
  boost::asio::steady_timer& graceTimer() { return grace_timer_; }

  // Re-arms the grace timer and returns the arm's generation. A completion
  // that was already queued for an earlier arm carries an older generation.
  uint64_t armGraceTimer(std::chrono::milliseconds period);
  // Cancels the pending arm, including a completion already queued for it.
  void cancelGraceTimer();
  bool isCurrentGraceArm(uint64_t generation) const {
    return generation == grace_generation_;
  }

  // Closes the transport and cancels the grace timer. Idempotent.
  void close();
  bool closed() const { return closed_; }

  // Returns true exactly once, for the caller that gets to report the end of
  // the remote stream.
  bool markEnded();
  bool ended() const { return ended_; }

 private:
  const std::string remote_id_;
  std::shared_ptr<IPeerConnection> connection_;
  std::shared_ptr<MediaStream> remote_stream_;
  ConnectionHealthMonitor health_;
  boost::asio::steady_timer grace_timer_;
  uint64_t grace_generation_ = 0;
  bool closed_ = false;
  bool ended_ = false;

  PeerSession(const PeerSession&) = delete;
  PeerSession& operator=(const PeerSession&) = delete;
};

// Owns the mapping from remote participant id to its session. The only piece
// of shared mutable state in the manager; every insert and remove is atomic
// per key.
class ConnectionRegistry {
 public:
  // Builds a session with its transport attached, or returns nullptr if the
  // transport could not be created.
  using SessionFactory =
      std::function<std::shared_ptr<PeerSession>(const std::string& remote_id)>;
  // Invoked for each newly created session before it becomes visible to
  // other callers. Must not call back into the registry.
  using SessionCreatedHandler = std::function<void(PeerSession& session)>;

  explicit ConnectionRegistry(SessionFactory factory);
  ~ConnectionRegistry();

  void onSessionCreated(SessionCreatedHandler handler);

  // Returns the session for remote_id, creating it on first use. Idempotent:
  // repeated calls return the same object until it is removed. Returns
  // nullptr only if creation failed. created (optional) reports whether this
  // call constructed the session.
  std::shared_ptr<PeerSession> getOrCreate(const std::string& remote_id,
                                           bool* created = nullptr);

  std::shared_ptr<PeerSession> get(const std::string& remote_id) const;

  // Closes the transport and evicts the entry. No-op for unknown ids.
  // Returns true if an entry was removed.
  bool remove(const std::string& remote_id);

  // Evicts the entry without closing it and hands it to the caller. If
  // expected is non-null, the entry is only taken when it is that session.
  std::shared_ptr<PeerSession> take(const std::string& remote_id,
                                    const PeerSession* expected = nullptr);

  // Evicts every entry.
  std::vector<std::shared_ptr<PeerSession>> takeAll();

  // Runs fn for every session while holding the registry lock, so no session
  // is added or removed during the walk. fn must not call back into the
  // registry.
  void forEach(const std::function<void(PeerSession& session)>& fn) const;

  bool contains(const std::string& remote_id) const;
  std::size_t size() const;
  std::vector<std::string> ids() const;

 private:
  SessionFactory factory_;

  mutable std::mutex mutex_;
  std::map<std::string, std::shared_ptr<PeerSession>> sessions_
      ABSL_GUARDED_BY(mutex_);
  SessionCreatedHandler onSessionCreatedHandler_ ABSL_GUARDED_BY(mutex_);

  ConnectionRegistry(const ConnectionRegistry&) = delete;
  ConnectionRegistry& operator=(const ConnectionRegistry&) = delete;
};

}  // namespace webrtc
}  // namespace mesh
}  // namespace roomcast

#endif  // CONNECTION_REGISTRY_H
