#include "webrtc/media_binder.h"

#include <iostream>
#include <utility>

namespace roomcast {
namespace mesh {
namespace webrtc {

MediaBinder::MediaBinder(ConnectionRegistry& registry) : registry_(registry) {
  registry_.onSessionCreated(
      [this](PeerSession& session) { onConnectionCreated(session); });
}

void MediaBinder::startLocal(std::shared_ptr<MediaStream> stream) {
  if (!stream) {
    std::cerr << "MediaBinder: startLocal called without a stream." << std::endl;
    return;
  }

  std::shared_ptr<MediaStream> previous;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    previous = std::exchange(local_stream_, stream);
  }
  if (previous == stream) {
    return;
  }

  // Connections created from here on pick up the new stream in
  // onConnectionCreated(); the walk below covers the existing ones. Attach is
  // idempotent per track id, so a connection seen by both is unaffected.
  registry_.forEach([&](PeerSession& session) {
    if (previous) {
      Detach(session, *previous);
    }
    Attach(session, *stream);
  });

  std::cout << "MediaBinder: Local stream " << stream->id() << " attached to "
            << registry_.size() << " connection(s)." << std::endl;
}

void MediaBinder::stopLocal() {
  std::shared_ptr<MediaStream> stream;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    stream = std::move(local_stream_);
    local_stream_.reset();
  }
  if (!stream) {
    return;
  }

  stream->StopAll();
  registry_.forEach([&](PeerSession& session) { Detach(session, *stream); });
  std::cout << "MediaBinder: Local stream " << stream->id() << " stopped."
            << std::endl;
}

void MediaBinder::onConnectionCreated(PeerSession& session) {
  std::shared_ptr<MediaStream> stream = localStream();
  if (stream) {
    Attach(session, *stream);
  }
}

std::shared_ptr<MediaStream> MediaBinder::localStream() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return local_stream_;
}

void MediaBinder::Attach(PeerSession& session, const MediaStream& stream) {
  if (session.closed()) {
    return;
  }
  for (const auto& track : stream.GetTracks()) {
    if (!session.connection().AddLocalTrack(track, stream.id())) {
      std::cerr << "MediaBinder: Failed to add " << ToString(track->kind())
                << " track " << track->id() << " to connection for "
                << session.remoteId() << "." << std::endl;
    }
  }
}

void MediaBinder::Detach(PeerSession& session, const MediaStream& stream) {
  if (session.closed()) {
    return;
  }
  for (const auto& track : stream.GetTracks()) {
    session.connection().RemoveLocalTrack(track->id());
  }
}

}  // namespace webrtc
}  // namespace mesh
}  // namespace roomcast
