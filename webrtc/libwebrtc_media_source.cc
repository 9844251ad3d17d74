#include "webrtc/libwebrtc_media_source.h"

#include <iostream>
#include <utility>

#include "api/audio_options.h"

namespace roomcast {
namespace mesh {
namespace webrtc {

LibwebrtcMediaStreamTrack::LibwebrtcMediaStreamTrack(
    rtc::scoped_refptr<::webrtc::MediaStreamTrackInterface> track)
    : track_(std::move(track)) {}

std::string LibwebrtcMediaStreamTrack::id() const { return track_->id(); }

MediaKind LibwebrtcMediaStreamTrack::kind() const {
  return track_->kind() == ::webrtc::MediaStreamTrackInterface::kAudioKind
             ? MediaKind::Audio
             : MediaKind::Video;
}

void LibwebrtcMediaStreamTrack::Stop() {
  if (stopped_.exchange(true)) {
    return;
  }
  track_->set_enabled(false);
}

std::shared_ptr<MediaStream> CreateLocalAudioStream(
    ::webrtc::PeerConnectionFactoryInterface* factory,
    const std::string& stream_id) {
  rtc::scoped_refptr<::webrtc::AudioSourceInterface> source =
      factory->CreateAudioSource(cricket::AudioOptions());
  if (!source) {
    std::cerr << "CreateLocalAudioStream: Failed to create audio source."
              << std::endl;
    return nullptr;
  }
  rtc::scoped_refptr<::webrtc::AudioTrackInterface> track =
      factory->CreateAudioTrack(stream_id + "-audio", source.get());
  if (!track) {
    std::cerr << "CreateLocalAudioStream: Failed to create audio track."
              << std::endl;
    return nullptr;
  }

  auto stream = std::make_shared<MediaStream>(stream_id);
  stream->AddTrack(std::make_shared<LibwebrtcMediaStreamTrack>(
      rtc::scoped_refptr<::webrtc::MediaStreamTrackInterface>(track)));
  return stream;
}

}  // namespace webrtc
}  // namespace mesh
}  // namespace roomcast
