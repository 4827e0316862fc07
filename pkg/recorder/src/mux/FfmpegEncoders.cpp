// Repository: Capkit-recorder
// Component: FFmpeg Encoders
// Purpose: Segment (mp4) and fragmenting (dash) encoders over FfmpegEncoderCore.
// Copyright (c) 2025 Capkit

#include "capkit/mux/FfmpegEncoders.hpp"

#include <string>
#include <utility>

#include "capkit/util/Logger.hpp"
#include "mux/FfmpegEncoderCore.hpp"

namespace capkit::mux {

namespace {

bool NotOpen(std::string* error) {
  if (error) *error = "Encoder not open";
  return false;
}

}  // namespace

// ======================================================================
// FfmpegSegmentEncoder
// ======================================================================

FfmpegSegmentEncoder::FfmpegSegmentEncoder(FfmpegEncoderConfig config)
    : config_(std::move(config)) {}

FfmpegSegmentEncoder::~FfmpegSegmentEncoder() = default;

bool FfmpegSegmentEncoder::Open(const std::filesystem::path& path,
                                const std::optional<media::VideoInfo>& video,
                                const std::optional<media::AudioInfo>& audio,
                                std::string* error) {
  core_ = std::make_unique<FfmpegEncoderCore>(config_);
  if (!core_->Open("mp4", path.string(), video, audio, nullptr, error)) {
    core_.reset();
    return false;
  }
  return true;
}

bool FfmpegSegmentEncoder::WriteVideo(const media::VideoFrame& frame, int64_t pts_ns,
                                      std::string* error) {
  if (!core_) return NotOpen(error);
  return core_->WriteVideo(frame, pts_ns, error);
}

bool FfmpegSegmentEncoder::WriteAudio(const media::AudioFrame& frame, int64_t pts_ns,
                                      std::string* error) {
  if (!core_) return NotOpen(error);
  return core_->WriteAudio(frame, pts_ns, error);
}

bool FfmpegSegmentEncoder::Finish(std::string* error) {
  if (!core_) return true;
  return core_->Finish(error);
}

SegmentEncoderFactory MakeFfmpegSegmentEncoderFactory(FfmpegEncoderConfig config) {
  return [config]() -> std::unique_ptr<ISegmentEncoder> {
    return std::make_unique<FfmpegSegmentEncoder>(config);
  };
}

// ======================================================================
// FfmpegDashEncoder
// ======================================================================

FfmpegDashEncoder::FfmpegDashEncoder(FfmpegEncoderConfig config) : config_(std::move(config)) {}

FfmpegDashEncoder::~FfmpegDashEncoder() = default;

bool FfmpegDashEncoder::Open(const std::filesystem::path& dir, int64_t segment_duration_ns,
                             const std::optional<media::VideoInfo>& video,
                             const std::optional<media::AudioInfo>& audio, std::string* error) {
  if (video && audio) {
    if (error) *error = "DASH encoder carries a single stream";
    return false;
  }
  if (!video && !audio) {
    if (error) *error = "DASH encoder needs a stream";
    return false;
  }

  AVDictionary* options = nullptr;
  const std::string seg_duration =
      std::to_string(static_cast<double>(segment_duration_ns) / 1e9);
  av_dict_set(&options, "seg_duration", seg_duration.c_str(), 0);
  av_dict_set(&options, "init_seg_name", InitSegmentName().c_str(), 0);
  av_dict_set(&options, "media_seg_name", "segment_$Number%03d$.m4s", 0);
  av_dict_set(&options, "use_template", "1", 0);
  av_dict_set(&options, "use_timeline", "0", 0);

  const std::filesystem::path mpd = dir / "stream.mpd";
  util::Logger::Debug("[FfmpegDashEncoder] Opening " + mpd.string() + " seg_duration=" + seg_duration);

  core_ = std::make_unique<FfmpegEncoderCore>(config_);
  if (!core_->Open("dash", mpd.string(), video, audio, options, error)) {
    core_.reset();
    return false;
  }
  return true;
}

bool FfmpegDashEncoder::WriteVideo(const media::VideoFrame& frame, int64_t pts_ns,
                                   std::string* error) {
  if (!core_) return NotOpen(error);
  return core_->WriteVideo(frame, pts_ns, error);
}

bool FfmpegDashEncoder::WriteAudio(const media::AudioFrame& frame, int64_t pts_ns,
                                   std::string* error) {
  if (!core_) return NotOpen(error);
  return core_->WriteAudio(frame, pts_ns, error);
}

bool FfmpegDashEncoder::Finish(std::string* error) {
  if (!core_) return true;
  return core_->Finish(error);
}

}  // namespace capkit::mux
