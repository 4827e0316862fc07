// Repository: Capkit-recorder
// Component: Muxer Interfaces
// Purpose: Capability interfaces between the pipeline, the muxers and the
//          opaque encoder/container implementations.
// Copyright (c) 2025 Capkit

#ifndef CAPKIT_MUX_IMUXER_HPP_
#define CAPKIT_MUX_IMUXER_HPP_

#include <atomic>
#include <cstdint>
#include <filesystem>
#include <functional>
#include <memory>
#include <optional>
#include <string>

#include "capkit/media/MediaTypes.hpp"

namespace capkit::mux {

// Everything a muxer needs at setup time.
struct MuxerSetup {
  std::filesystem::path output_path;
  std::optional<media::VideoInfo> video;
  std::optional<media::AudioInfo> audio;
  // Shared with the pipeline's Pause()/Resume(); null means never paused.
  std::shared_ptr<std::atomic<bool>> pause_flag;
};

// Frame timestamps are relative to the pipeline epoch (ns), non-decreasing
// per stream. Send* throw StreamError on encode/write failure and
// TimestampInvariantViolation on clock regression. Finish() is idempotent.
class IMuxer {
 public:
  virtual ~IMuxer() = default;

  virtual void SendVideoFrame(media::VideoFrame frame, int64_t timestamp_ns) = 0;
  virtual void SendAudioFrame(media::AudioFrame frame, int64_t timestamp_ns) = 0;
  virtual void Finish() = 0;
};

// Throws SetupError when the output cannot be opened.
using MuxerFactory = std::function<std::unique_ptr<IMuxer>(const MuxerSetup&)>;

// One encoder + container writing one self-contained segment file. Driven
// from a single dedicated thread for its whole lifetime. pts values are
// relative to the segment start and never negative; the first audio pts is
// where the audio track begins inside the segment.
class ISegmentEncoder {
 public:
  virtual ~ISegmentEncoder() = default;

  virtual bool Open(const std::filesystem::path& path,
                    const std::optional<media::VideoInfo>& video,
                    const std::optional<media::AudioInfo>& audio, std::string* error) = 0;
  virtual bool WriteVideo(const media::VideoFrame& frame, int64_t pts_ns, std::string* error) = 0;
  virtual bool WriteAudio(const media::AudioFrame& frame, int64_t pts_ns, std::string* error) = 0;
  // Flushes the encoders and writes the trailer.
  virtual bool Finish(std::string* error) = 0;
};

using SegmentEncoderFactory = std::function<std::unique_ptr<ISegmentEncoder>()>;

// A continuous encode whose container cuts init_name + segment_NNN<ext>
// files into dir as a side effect (DASH-style). Segment files are written
// under a ".tmp" suffix and renamed when complete.
class IFragmentingEncoder {
 public:
  virtual ~IFragmentingEncoder() = default;

  virtual bool Open(const std::filesystem::path& dir, int64_t segment_duration_ns,
                    const std::optional<media::VideoInfo>& video,
                    const std::optional<media::AudioInfo>& audio, std::string* error) = 0;
  virtual bool WriteVideo(const media::VideoFrame& frame, int64_t pts_ns, std::string* error) = 0;
  virtual bool WriteAudio(const media::AudioFrame& frame, int64_t pts_ns, std::string* error) = 0;
  virtual bool Finish(std::string* error) = 0;

  virtual std::string InitSegmentName() const = 0;
  virtual std::string SegmentExtension() const = 0;
};

}  // namespace capkit::mux

#endif  // CAPKIT_MUX_IMUXER_HPP_
