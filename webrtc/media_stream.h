#ifndef MEDIA_STREAM_H
#define MEDIA_STREAM_H

#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace roomcast {
namespace mesh {
namespace webrtc {

enum class MediaKind { Audio, Video };

const char* ToString(MediaKind kind);

// Abstract media track. Concrete tracks wrap the underlying library's track
// objects (see libwebrtc_media_source.h) or are test doubles.
class MediaStreamTrack {
 public:
  virtual ~MediaStreamTrack() = default;

  virtual std::string id() const = 0;
  virtual MediaKind kind() const = 0;

  // Stops the track's source. Idempotent.
  virtual void Stop() = 0;
  virtual bool stopped() const = 0;
};

// An ordered collection of tracks sharing one stream id. Local streams are
// owned by the application and borrowed by the manager; remote streams are
// produced by the connection implementation.
class MediaStream {
 public:
  explicit MediaStream(std::string id);

  const std::string& id() const { return id_; }

  // Adds a track. Returns false if a track with the same id is present.
  bool AddTrack(std::shared_ptr<MediaStreamTrack> track);
  // Returns false if no track with track_id is present.
  bool RemoveTrack(const std::string& track_id);

  std::vector<std::shared_ptr<MediaStreamTrack>> GetTracks() const;
  std::shared_ptr<MediaStreamTrack> FindTrack(const std::string& track_id) const;

  // Stops every track in the stream.
  void StopAll();

 private:
  const std::string id_;

  mutable std::mutex mutex_;
  std::vector<std::shared_ptr<MediaStreamTrack>> tracks_;

  MediaStream(const MediaStream&) = delete;
  MediaStream& operator=(const MediaStream&) = delete;
};

}  // namespace webrtc
}  // namespace mesh
}  // namespace roomcast

#endif  // MEDIA_STREAM_H
