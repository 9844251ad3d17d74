#ifndef LIBWEBRTC_MEDIA_SOURCE_H
#define LIBWEBRTC_MEDIA_SOURCE_H

#include <atomic>
#include <memory>
#include <string>

#include "api/media_stream_interface.h"
#include "api/peer_connection_interface.h"
#include "api/scoped_refptr.h"
#include "webrtc/media_stream.h"

namespace roomcast {
namespace mesh {
namespace webrtc {

// MediaStreamTrack backed by a libwebrtc track. Used both for local tracks
// created from a factory and for remote tracks delivered by a receiver.
class LibwebrtcMediaStreamTrack : public MediaStreamTrack {
 public:
  explicit LibwebrtcMediaStreamTrack(
      rtc::scoped_refptr<::webrtc::MediaStreamTrackInterface> track);

  std::string id() const override;
  MediaKind kind() const override;

  // Disables the track. libwebrtc has no per-track stop on the native API;
  // a disabled track sends silence/black and the sender is removed on detach.
  void Stop() override;
  bool stopped() const override { return stopped_; }

  const rtc::scoped_refptr<::webrtc::MediaStreamTrackInterface>& rtcTrack()
      const {
    return track_;
  }

 private:
  rtc::scoped_refptr<::webrtc::MediaStreamTrackInterface> track_;
  std::atomic<bool> stopped_{false};
};

// Creates a local stream with one microphone track. Returns nullptr if the
// factory could not create the audio source.
std::shared_ptr<MediaStream> CreateLocalAudioStream(
    ::webrtc::PeerConnectionFactoryInterface* factory,
    const std::string& stream_id);

}  // namespace webrtc
}  // namespace mesh
}  // namespace roomcast

#endif  // LIBWEBRTC_MEDIA_SOURCE_H
