// Repository: Capkit-recorder
// Component: FFmpeg Encoder Core
// Purpose: libavformat output context plus H.264/AAC encoders.
// Copyright (c) 2025 Capkit

#include "mux/FfmpegEncoderCore.hpp"

#include <algorithm>
#include <sstream>

extern "C" {
#include <libavutil/channel_layout.h>
#include <libavutil/imgutils.h>
#include <libavutil/mathematics.h>
#include <libavutil/opt.h>
}

#include "media/FfmpegFormats.hpp"

namespace capkit::mux {

namespace {

constexpr AVRational kNsTimeBase{1, 1000000000};

bool Fail(std::string* error, const std::string& what, int err = 0) {
  if (error) {
    *error = err < 0 ? what + ": " + media::AvErrorString(err) : what;
  }
  return false;
}

}  // namespace

FfmpegEncoderCore::FfmpegEncoderCore(const FfmpegEncoderConfig& config) : config_(config) {}

FfmpegEncoderCore::~FfmpegEncoderCore() {
  Close();
}

bool FfmpegEncoderCore::Open(const char* format_name, const std::string& url,
                             const std::optional<media::VideoInfo>& video,
                             const std::optional<media::AudioInfo>& audio,
                             AVDictionary* mux_options, std::string* error) {
  int ret = avformat_alloc_output_context2(&format_ctx_, nullptr, format_name, url.c_str());
  if (ret < 0 || !format_ctx_) {
    av_dict_free(&mux_options);
    return Fail(error, std::string("Failed to allocate ") + format_name + " output context", ret);
  }

  packet_ = av_packet_alloc();
  if (!packet_) {
    av_dict_free(&mux_options);
    Close();
    return Fail(error, "Failed to allocate packet");
  }

  if ((video && !OpenVideo(*video, error)) || (audio && !OpenAudio(*audio, error))) {
    av_dict_free(&mux_options);
    Close();
    return false;
  }

  if (!(format_ctx_->oformat->flags & AVFMT_NOFILE)) {
    ret = avio_open(&format_ctx_->pb, url.c_str(), AVIO_FLAG_WRITE);
    if (ret < 0) {
      av_dict_free(&mux_options);
      Close();
      return Fail(error, "Failed to open output " + url, ret);
    }
  }

  ret = avformat_write_header(format_ctx_, &mux_options);
  av_dict_free(&mux_options);
  if (ret < 0) {
    Close();
    return Fail(error, "Failed to write header", ret);
  }
  header_written_ = true;
  return true;
}

bool FfmpegEncoderCore::OpenVideo(const media::VideoInfo& info, std::string* error) {
  if (info.width <= 0 || info.height <= 0 || info.fps_num <= 0 || info.fps_den <= 0) {
    return Fail(error, "Invalid video format");
  }

  const AVCodec* codec = avcodec_find_encoder_by_name("libx264");
  if (!codec) {
    codec = avcodec_find_encoder(AV_CODEC_ID_H264);
  }
  if (!codec) {
    return Fail(error, "No H.264 encoder available");
  }

  video_stream_ = avformat_new_stream(format_ctx_, nullptr);
  if (!video_stream_) return Fail(error, "Failed to create video stream");
  video_stream_->id = static_cast<int>(format_ctx_->nb_streams) - 1;

  video_ctx_ = avcodec_alloc_context3(codec);
  if (!video_ctx_) return Fail(error, "Failed to allocate video codec context");

  video_ctx_->codec_id = codec->id;
  video_ctx_->codec_type = AVMEDIA_TYPE_VIDEO;
  video_ctx_->width = info.width;
  video_ctx_->height = info.height;
  video_ctx_->pix_fmt = AV_PIX_FMT_YUV420P;
  video_ctx_->bit_rate = config_.video_bitrate;
  video_ctx_->time_base = AVRational{info.fps_den, info.fps_num};
  video_ctx_->framerate = AVRational{info.fps_num, info.fps_den};
  video_ctx_->gop_size = config_.gop_frames > 0
                             ? config_.gop_frames
                             : std::max(1, info.fps_num / std::max(1, info.fps_den));
  video_ctx_->max_b_frames = 0;
  if (format_ctx_->oformat->flags & AVFMT_GLOBALHEADER) {
    video_ctx_->flags |= AV_CODEC_FLAG_GLOBAL_HEADER;
  }
  if (std::string(codec->name) == "libx264") {
    av_opt_set(video_ctx_->priv_data, "preset", config_.x264_preset.c_str(), 0);
  }

  int ret = avcodec_open2(video_ctx_, codec, nullptr);
  if (ret < 0) return Fail(error, "Failed to open video codec", ret);

  ret = avcodec_parameters_from_context(video_stream_->codecpar, video_ctx_);
  if (ret < 0) return Fail(error, "Failed to copy video codec parameters", ret);
  video_stream_->time_base = video_ctx_->time_base;

  video_frame_ = av_frame_alloc();
  if (!video_frame_) return Fail(error, "Failed to allocate video frame");
  video_frame_->format = video_ctx_->pix_fmt;
  video_frame_->width = info.width;
  video_frame_->height = info.height;
  ret = av_frame_get_buffer(video_frame_, 0);
  if (ret < 0) return Fail(error, "Failed to allocate video frame buffer", ret);
  return true;
}

bool FfmpegEncoderCore::OpenAudio(const media::AudioInfo& info, std::string* error) {
  const AVCodec* codec = avcodec_find_encoder_by_name("aac");
  if (!codec) {
    codec = avcodec_find_encoder(AV_CODEC_ID_AAC);
  }
  if (!codec) return Fail(error, "No AAC encoder available");

  audio_stream_ = avformat_new_stream(format_ctx_, nullptr);
  if (!audio_stream_) return Fail(error, "Failed to create audio stream");
  audio_stream_->id = static_cast<int>(format_ctx_->nb_streams) - 1;

  audio_ctx_ = avcodec_alloc_context3(codec);
  if (!audio_ctx_) return Fail(error, "Failed to allocate audio codec context");

  audio_ctx_->codec_type = AVMEDIA_TYPE_AUDIO;
  audio_ctx_->sample_fmt = AV_SAMPLE_FMT_FLTP;
  audio_ctx_->sample_rate = media::kMixerSampleRate;
  audio_ctx_->bit_rate = config_.audio_bitrate;
  audio_ctx_->time_base = AVRational{1, media::kMixerSampleRate};
  int ret = av_channel_layout_from_mask(&audio_ctx_->ch_layout, AV_CH_LAYOUT_STEREO);
  if (ret < 0) return Fail(error, "Failed to set audio channel layout", ret);
  if (format_ctx_->oformat->flags & AVFMT_GLOBALHEADER) {
    audio_ctx_->flags |= AV_CODEC_FLAG_GLOBAL_HEADER;
  }

  ret = avcodec_open2(audio_ctx_, codec, nullptr);
  if (ret < 0) return Fail(error, "Failed to open audio codec", ret);

  ret = avcodec_parameters_from_context(audio_stream_->codecpar, audio_ctx_);
  if (ret < 0) return Fail(error, "Failed to copy audio codec parameters", ret);
  audio_stream_->time_base = audio_ctx_->time_base;

  AVChannelLayout src_layout;
  av_channel_layout_default(&src_layout, info.channels);
  ret = swr_alloc_set_opts2(&swr_ctx_, &audio_ctx_->ch_layout, audio_ctx_->sample_fmt,
                            audio_ctx_->sample_rate, &src_layout,
                            media::ToAVSampleFormat(info.sample_format), info.sample_rate, 0,
                            nullptr);
  av_channel_layout_uninit(&src_layout);
  if (ret < 0) return Fail(error, "Failed to set audio resampler options", ret);
  ret = swr_init(swr_ctx_);
  if (ret < 0) return Fail(error, "Failed to initialize audio resampler", ret);

  audio_fifo_ = av_audio_fifo_alloc(audio_ctx_->sample_fmt, audio_ctx_->ch_layout.nb_channels,
                                    std::max(audio_ctx_->frame_size, 1024) * 4);
  if (!audio_fifo_) return Fail(error, "Failed to allocate audio FIFO");

  audio_frame_ = av_frame_alloc();
  if (!audio_frame_) return Fail(error, "Failed to allocate audio frame");
  audio_input_ = info;
  return true;
}

bool FfmpegEncoderCore::EnsureScaler(const media::VideoFrame& frame, std::string* error) {
  if (sws_ctx_ && frame.width == sws_src_width_ && frame.height == sws_src_height_ &&
      frame.pixel_format == sws_src_format_) {
    return true;
  }
  sws_freeContext(sws_ctx_);
  sws_ctx_ = sws_getContext(frame.width, frame.height, media::ToAVPixelFormat(frame.pixel_format),
                            video_ctx_->width, video_ctx_->height, video_ctx_->pix_fmt,
                            SWS_BILINEAR, nullptr, nullptr, nullptr);
  if (!sws_ctx_) return Fail(error, "Failed to create scaler");
  sws_src_width_ = frame.width;
  sws_src_height_ = frame.height;
  sws_src_format_ = frame.pixel_format;
  return true;
}

bool FfmpegEncoderCore::Drain(AVCodecContext* ctx, AVStream* stream, AVFrame* frame,
                              std::string* error) {
  int ret = avcodec_send_frame(ctx, frame);
  if (ret < 0 && ret != AVERROR_EOF) return Fail(error, "Error sending frame", ret);

  while (true) {
    ret = avcodec_receive_packet(ctx, packet_);
    if (ret == AVERROR(EAGAIN) || ret == AVERROR_EOF) return true;
    if (ret < 0) return Fail(error, "Error receiving packet", ret);

    av_packet_rescale_ts(packet_, ctx->time_base, stream->time_base);
    packet_->stream_index = stream->index;
    // av_interleaved_write_frame takes ownership and unrefs the packet.
    ret = av_interleaved_write_frame(format_ctx_, packet_);
    if (ret < 0) return Fail(error, "Error writing packet", ret);
  }
}

bool FfmpegEncoderCore::WriteVideo(const media::VideoFrame& frame, int64_t pts_ns,
                                   std::string* error) {
  if (!header_written_ || finished_ || !video_ctx_) return Fail(error, "Video stream not open");
  if (frame.width <= 0 || frame.height <= 0) return Fail(error, "Invalid frame dimensions");
  const size_t expected = media::PictureSize(frame.pixel_format, frame.width, frame.height);
  if (frame.data.size() < expected) {
    std::ostringstream oss;
    oss << "Frame data too small: got " << frame.data.size() << ", need " << expected;
    return Fail(error, oss.str());
  }
  if (!EnsureScaler(frame, error)) return false;

  int ret = av_frame_make_writable(video_frame_);
  if (ret < 0) return Fail(error, "av_frame_make_writable failed", ret);

  uint8_t* src_data[4] = {nullptr};
  int src_linesize[4] = {0};
  ret = av_image_fill_arrays(src_data, src_linesize, frame.data.data(),
                             media::ToAVPixelFormat(frame.pixel_format), frame.width,
                             frame.height, 1);
  if (ret < 0) return Fail(error, "Failed to map frame planes", ret);
  sws_scale(sws_ctx_, src_data, src_linesize, 0, frame.height, video_frame_->data,
            video_frame_->linesize);

  int64_t pts = av_rescale_q(std::max<int64_t>(0, pts_ns), kNsTimeBase, video_ctx_->time_base);
  if (pts <= last_video_pts_) pts = last_video_pts_ + 1;
  last_video_pts_ = pts;
  video_frame_->pts = pts;

  return Drain(video_ctx_, video_stream_, video_frame_, error);
}

bool FfmpegEncoderCore::EncodeAudioFromFifo(bool final, std::string* error) {
  const int frame_size = audio_ctx_->frame_size > 0 ? audio_ctx_->frame_size : 1024;
  while (av_audio_fifo_size(audio_fifo_) >= frame_size ||
         (final && av_audio_fifo_size(audio_fifo_) > 0)) {
    const int n = std::min(frame_size, av_audio_fifo_size(audio_fifo_));
    av_frame_unref(audio_frame_);
    audio_frame_->format = audio_ctx_->sample_fmt;
    audio_frame_->sample_rate = audio_ctx_->sample_rate;
    int ret = av_channel_layout_copy(&audio_frame_->ch_layout, &audio_ctx_->ch_layout);
    if (ret < 0) return Fail(error, "Failed to copy channel layout", ret);
    audio_frame_->nb_samples = n;
    ret = av_frame_get_buffer(audio_frame_, 0);
    if (ret < 0) return Fail(error, "Failed to allocate audio frame buffer", ret);
    if (av_audio_fifo_read(audio_fifo_, reinterpret_cast<void**>(audio_frame_->data), n) < n) {
      return Fail(error, "Audio FIFO underrun");
    }
    audio_frame_->pts = audio_samples_written_;
    audio_samples_written_ += n;
    if (!Drain(audio_ctx_, audio_stream_, audio_frame_, error)) return false;
  }
  return true;
}

bool FfmpegEncoderCore::WriteAudio(const media::AudioFrame& frame, int64_t pts_ns,
                                   std::string* error) {
  if (!header_written_ || finished_ || !audio_ctx_) return Fail(error, "Audio stream not open");
  if (frame.nb_samples <= 0) return true;
  if (frame.Info() != audio_input_) return Fail(error, "Audio frame format changed mid-stream");
  if (!audio_started_) {
    // The sample counter starts at the first frame's offset into the file.
    audio_started_ = true;
    audio_samples_written_ =
        av_rescale_q(std::max<int64_t>(0, pts_ns), kNsTimeBase, audio_ctx_->time_base);
  }

  const int out_samples = swr_get_out_samples(swr_ctx_, frame.nb_samples);
  uint8_t** converted = nullptr;
  int ret = av_samples_alloc_array_and_samples(&converted, nullptr,
                                               audio_ctx_->ch_layout.nb_channels, out_samples,
                                               audio_ctx_->sample_fmt, 0);
  if (ret < 0) return Fail(error, "Failed to allocate conversion buffer", ret);

  const uint8_t* in_data[AV_NUM_DATA_POINTERS] = {nullptr};
  for (size_t i = 0; i < frame.planes.size() && i < AV_NUM_DATA_POINTERS; ++i) {
    in_data[i] = frame.planes[i].data();
  }
  const int converted_samples =
      swr_convert(swr_ctx_, converted, out_samples, in_data, frame.nb_samples);
  bool ok = converted_samples >= 0;
  if (!ok) {
    Fail(error, "Resampling failed", converted_samples);
  } else if (converted_samples > 0 &&
             av_audio_fifo_write(audio_fifo_, reinterpret_cast<void**>(converted),
                                 converted_samples) < converted_samples) {
    ok = Fail(error, "Failed to queue audio samples");
  }
  av_freep(&converted[0]);
  av_freep(&converted);
  if (!ok) return false;

  return EncodeAudioFromFifo(false, error);
}

bool FfmpegEncoderCore::Finish(std::string* error) {
  if (finished_) return true;
  finished_ = true;
  if (!header_written_) {
    Close();
    return true;
  }

  bool ok = true;
  std::string first_error;
  auto note = [&](bool step_ok) {
    if (!step_ok && ok) {
      ok = false;
      if (error) first_error = *error;
    }
  };

  if (audio_ctx_) {
    note(EncodeAudioFromFifo(true, error));
    note(Drain(audio_ctx_, audio_stream_, nullptr, error));
  }
  if (video_ctx_) {
    note(Drain(video_ctx_, video_stream_, nullptr, error));
  }
  const int ret = av_write_trailer(format_ctx_);
  if (ret < 0) note(Fail(error, "Error writing trailer", ret));

  Close();
  if (!ok && error) *error = first_error;
  return ok;
}

void FfmpegEncoderCore::Close() {
  if (format_ctx_) {
    if (format_ctx_->pb && !(format_ctx_->oformat->flags & AVFMT_NOFILE)) {
      avio_closep(&format_ctx_->pb);
    }
    avformat_free_context(format_ctx_);
    format_ctx_ = nullptr;
  }
  if (video_ctx_) avcodec_free_context(&video_ctx_);
  if (audio_ctx_) avcodec_free_context(&audio_ctx_);
  if (video_frame_) av_frame_free(&video_frame_);
  if (audio_frame_) av_frame_free(&audio_frame_);
  if (packet_) av_packet_free(&packet_);
  if (sws_ctx_) {
    sws_freeContext(sws_ctx_);
    sws_ctx_ = nullptr;
  }
  if (swr_ctx_) swr_free(&swr_ctx_);
  if (audio_fifo_) {
    av_audio_fifo_free(audio_fifo_);
    audio_fifo_ = nullptr;
  }
  video_stream_ = nullptr;
  audio_stream_ = nullptr;
}

}  // namespace capkit::mux
