#ifndef MEDIA_BINDER_H
#define MEDIA_BINDER_H

#include <memory>
#include <mutex>

#include <absl/base/thread_annotations.h>

#include "webrtc/connection_registry.h"
#include "webrtc/media_stream.h"

namespace roomcast {
namespace mesh {
namespace webrtc {

// Attaches the local outgoing stream's tracks to every connection in the
// registry, including connections created later. Whether a connection is
// created before or after startLocal(), it ends up carrying the same tracks.
class MediaBinder {
 public:
  // Registers itself as the registry's session-created hook.
  explicit MediaBinder(ConnectionRegistry& registry);

  // Stores stream and adds each of its tracks to every registered
  // connection. A previously started stream is detached first (its tracks
  // are not stopped). Returns once every connection has been updated.
  void startLocal(std::shared_ptr<MediaStream> stream);

  // Stops every local track, removes them from every connection and clears
  // the stored stream. No-op if nothing is streaming.
  void stopLocal();

  // Attaches the current local stream, if any, to a freshly created
  // connection.
  void onConnectionCreated(PeerSession& session);

  std::shared_ptr<MediaStream> localStream() const;
  bool isStreaming() const { return localStream() != nullptr; }

 private:
  static void Attach(PeerSession& session, const MediaStream& stream);
  static void Detach(PeerSession& session, const MediaStream& stream);

  ConnectionRegistry& registry_;

  mutable std::mutex mutex_;
  std::shared_ptr<MediaStream> local_stream_ ABSL_GUARDED_BY(mutex_);

  MediaBinder(const MediaBinder&) = delete;
  MediaBinder& operator=(const MediaBinder&) = delete;
};

}  // namespace webrtc
}  // namespace mesh
}  // namespace roomcast

#endif  // MEDIA_BINDER_H
