// Repository: Capkit-recorder
// Component: FFmpeg Encoders
// Purpose: libavcodec/libavformat implementations of the segment and
//          fragmenting encoder capabilities (H.264 via libx264, AAC).
// Copyright (c) 2025 Capkit

#ifndef CAPKIT_MUX_FFMPEG_ENCODERS_HPP_
#define CAPKIT_MUX_FFMPEG_ENCODERS_HPP_

#include <memory>
#include <string>

#include "capkit/mux/IMuxer.hpp"

namespace capkit::mux {

class FfmpegEncoderCore;

struct FfmpegEncoderConfig {
  int video_bitrate = 6000000;       // 6 Mbps
  int gop_frames = 0;                // 0: one keyframe per second
  std::string x264_preset = "veryfast";
  int audio_bitrate = 128000;
};

// One MP4 (".m4a" content when audio-only) per segment. The container
// format is named explicitly because segment paths carry a ".tmp" suffix
// while they are written.
class FfmpegSegmentEncoder : public ISegmentEncoder {
 public:
  explicit FfmpegSegmentEncoder(FfmpegEncoderConfig config = FfmpegEncoderConfig());
  ~FfmpegSegmentEncoder() override;

  bool Open(const std::filesystem::path& path, const std::optional<media::VideoInfo>& video,
            const std::optional<media::AudioInfo>& audio, std::string* error) override;
  bool WriteVideo(const media::VideoFrame& frame, int64_t pts_ns, std::string* error) override;
  bool WriteAudio(const media::AudioFrame& frame, int64_t pts_ns, std::string* error) override;
  bool Finish(std::string* error) override;

 private:
  FfmpegEncoderConfig config_;
  std::unique_ptr<FfmpegEncoderCore> core_;
};

SegmentEncoderFactory MakeFfmpegSegmentEncoderFactory(FfmpegEncoderConfig config = FfmpegEncoderConfig());

// libavformat "dash" muxer: init.mp4 plus segment_NNN.m4s, cut at
// keyframes every segment duration. Carries a single stream (video when
// configured, otherwise audio); Open() fails when given both.
class FfmpegDashEncoder : public IFragmentingEncoder {
 public:
  explicit FfmpegDashEncoder(FfmpegEncoderConfig config = FfmpegEncoderConfig());
  ~FfmpegDashEncoder() override;

  bool Open(const std::filesystem::path& dir, int64_t segment_duration_ns,
            const std::optional<media::VideoInfo>& video,
            const std::optional<media::AudioInfo>& audio, std::string* error) override;
  bool WriteVideo(const media::VideoFrame& frame, int64_t pts_ns, std::string* error) override;
  bool WriteAudio(const media::AudioFrame& frame, int64_t pts_ns, std::string* error) override;
  bool Finish(std::string* error) override;

  std::string InitSegmentName() const override { return "init.mp4"; }
  std::string SegmentExtension() const override { return ".m4s"; }

 private:
  FfmpegEncoderConfig config_;
  std::unique_ptr<FfmpegEncoderCore> core_;
};

}  // namespace capkit::mux

#endif  // CAPKIT_MUX_FFMPEG_ENCODERS_HPP_
