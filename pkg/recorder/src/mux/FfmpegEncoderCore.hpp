// Repository: Capkit-recorder
// Component: FFmpeg Encoder Core
// Purpose: Owns the libavformat output context plus H.264/AAC encoders
//          shared by the segment and DASH encoders.
// Copyright (c) 2025 Capkit

#ifndef CAPKIT_MUX_FFMPEG_ENCODER_CORE_HPP_
#define CAPKIT_MUX_FFMPEG_ENCODER_CORE_HPP_

#include <cstdint>
#include <optional>
#include <string>

#include "capkit/media/MediaTypes.hpp"
#include "capkit/mux/FfmpegEncoders.hpp"

extern "C" {
#include <libavcodec/avcodec.h>
#include <libavformat/avformat.h>
#include <libavutil/audio_fifo.h>
#include <libswresample/swresample.h>
#include <libswscale/swscale.h>
}

namespace capkit::mux {

// FfmpegEncoderCore opens a muxer by format name, adds at most one video
// (libx264, yuv420p) and one audio (AAC, fltp) stream, and encodes raw
// frames into it.
//
// Video pts come from the caller (ns, rescaled to 1/fps). Audio pts start
// at the first audio frame's pts and are then counted in samples, so audio
// lines up with video at the start and stays continuous afterwards.
class FfmpegEncoderCore {
 public:
  explicit FfmpegEncoderCore(const FfmpegEncoderConfig& config);
  ~FfmpegEncoderCore();

  FfmpegEncoderCore(const FfmpegEncoderCore&) = delete;
  FfmpegEncoderCore& operator=(const FfmpegEncoderCore&) = delete;

  // mux_options is consumed (freed) in every case.
  bool Open(const char* format_name, const std::string& url,
            const std::optional<media::VideoInfo>& video,
            const std::optional<media::AudioInfo>& audio, AVDictionary* mux_options,
            std::string* error);

  bool WriteVideo(const media::VideoFrame& frame, int64_t pts_ns, std::string* error);
  bool WriteAudio(const media::AudioFrame& frame, int64_t pts_ns, std::string* error);

  // Drains both encoders and writes the trailer. Idempotent.
  bool Finish(std::string* error);

  // Releases every handle without writing a trailer.
  void Close();

 private:
  bool OpenVideo(const media::VideoInfo& info, std::string* error);
  bool OpenAudio(const media::AudioInfo& info, std::string* error);
  bool EnsureScaler(const media::VideoFrame& frame, std::string* error);
  bool EncodeAudioFromFifo(bool final, std::string* error);
  bool Drain(AVCodecContext* ctx, AVStream* stream, AVFrame* frame, std::string* error);

  FfmpegEncoderConfig config_;

  AVFormatContext* format_ctx_ = nullptr;
  bool header_written_ = false;
  bool finished_ = false;

  AVCodecContext* video_ctx_ = nullptr;
  AVStream* video_stream_ = nullptr;
  AVFrame* video_frame_ = nullptr;
  SwsContext* sws_ctx_ = nullptr;
  int sws_src_width_ = 0;
  int sws_src_height_ = 0;
  media::PixelFormat sws_src_format_ = media::PixelFormat::kYUV420P;
  int64_t last_video_pts_ = -1;

  AVCodecContext* audio_ctx_ = nullptr;
  AVStream* audio_stream_ = nullptr;
  AVFrame* audio_frame_ = nullptr;
  SwrContext* swr_ctx_ = nullptr;
  AVAudioFifo* audio_fifo_ = nullptr;
  media::AudioInfo audio_input_;
  bool audio_started_ = false;
  int64_t audio_samples_written_ = 0;

  AVPacket* packet_ = nullptr;
};

}  // namespace capkit::mux

#endif  // CAPKIT_MUX_FFMPEG_ENCODER_CORE_HPP_
