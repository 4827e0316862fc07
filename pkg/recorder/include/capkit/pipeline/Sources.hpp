// Repository: Capkit-recorder
// Component: Pipeline Sources
// Purpose: Capability interfaces for video and audio producers wired into an
//          OutputPipeline.
// Copyright (c) 2025 Capkit

#ifndef CAPKIT_PIPELINE_SOURCES_HPP_
#define CAPKIT_PIPELINE_SOURCES_HPP_

#include <string>

#include "capkit/media/MediaTypes.hpp"
#include "capkit/util/BoundedChannel.hpp"

namespace capkit::pipeline {

using VideoChannelPtr = util::ChannelPtr<media::VideoFrame>;
using AudioChannelPtr = util::ChannelPtr<media::AudioFrame>;

// Lifecycle, driven by the pipeline:
//   Setup(tx) once during Build(); returns the stream format. Throws
//     SetupError when the device/stream is unavailable.
//   Start() after every component is wired. Throws SetupError on failure.
//   Stop() during shutdown; must return once the source no longer sends.
//     The pipeline closes tx before calling Stop(), so a blocked send
//     returns promptly.
//
// Frames carry capture timestamps on the pipeline clock.
class IVideoSource {
 public:
  virtual ~IVideoSource() = default;

  virtual media::VideoInfo Setup(VideoChannelPtr tx) = 0;
  virtual void Start() {}
  virtual void Stop() {}
};

class IAudioSource {
 public:
  virtual ~IAudioSource() = default;

  virtual media::AudioInfo Setup(AudioChannelPtr tx) = 0;
  virtual void Start() {}
  virtual void Stop() {}

  // Used in mixer logs.
  virtual std::string Name() const { return "audio"; }
};

}  // namespace capkit::pipeline

#endif  // CAPKIT_PIPELINE_SOURCES_HPP_
