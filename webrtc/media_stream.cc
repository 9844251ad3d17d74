#include "webrtc/media_stream.h"

#include <algorithm>
#include <utility>

namespace roomcast {
namespace mesh {
namespace webrtc {

const char* ToString(MediaKind kind) {
  return kind == MediaKind::Audio ? "audio" : "video";
}

MediaStream::MediaStream(std::string id) : id_(std::move(id)) {}

bool MediaStream::AddTrack(std::shared_ptr<MediaStreamTrack> track) {
  if (!track) {
    return false;
  }
  std::lock_guard<std::mutex> lock(mutex_);
  const std::string track_id = track->id();
  auto it = std::find_if(tracks_.begin(), tracks_.end(),
                         [&track_id](const auto& t) {
                           return t->id() == track_id;
                         });
  if (it != tracks_.end()) {
    return false;
  }
  tracks_.push_back(std::move(track));
  return true;
}

bool MediaStream::RemoveTrack(const std::string& track_id) {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = std::find_if(tracks_.begin(), tracks_.end(),
                         [&track_id](const auto& t) {
                           return t->id() == track_id;
                         });
  if (it == tracks_.end()) {
    return false;
  }
  tracks_.erase(it);
  return true;
}

std::vector<std::shared_ptr<MediaStreamTrack>> MediaStream::GetTracks() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return tracks_;
}

std::shared_ptr<MediaStreamTrack> MediaStream::FindTrack(
    const std::string& track_id) const {
  std::lock_guard<std::mutex> lock(mutex_);
  for (const auto& track : tracks_) {
    if (track->id() == track_id) {
      return track;
    }
  }
  return nullptr;
}

void MediaStream::StopAll() {
  // Copy under the lock; Stop() may call back into the source.
  for (const auto& track : GetTracks()) {
    track->Stop();
  }
}

}  // namespace webrtc
}  // namespace mesh
}  // namespace roomcast
