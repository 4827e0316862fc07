// Repository: Capkit-recorder
// Component: FFmpeg Format Mapping
// Purpose: Maps capkit sample/pixel formats to libavutil enums.
// Copyright (c) 2025 Capkit

#ifndef CAPKIT_MEDIA_FFMPEG_FORMATS_HPP_
#define CAPKIT_MEDIA_FFMPEG_FORMATS_HPP_

#include <string>

#include "capkit/media/MediaTypes.hpp"

extern "C" {
#include <libavutil/error.h>
#include <libavutil/pixfmt.h>
#include <libavutil/samplefmt.h>
}

namespace capkit::media {

inline AVSampleFormat ToAVSampleFormat(SampleFormat format) {
  switch (format) {
    case SampleFormat::kU8: return AV_SAMPLE_FMT_U8;
    case SampleFormat::kS16: return AV_SAMPLE_FMT_S16;
    case SampleFormat::kS32: return AV_SAMPLE_FMT_S32;
    case SampleFormat::kF32: return AV_SAMPLE_FMT_FLT;
    case SampleFormat::kU8P: return AV_SAMPLE_FMT_U8P;
    case SampleFormat::kS16P: return AV_SAMPLE_FMT_S16P;
    case SampleFormat::kS32P: return AV_SAMPLE_FMT_S32P;
    case SampleFormat::kF32P: return AV_SAMPLE_FMT_FLTP;
  }
  return AV_SAMPLE_FMT_NONE;
}

inline AVPixelFormat ToAVPixelFormat(PixelFormat format) {
  switch (format) {
    case PixelFormat::kYUV420P: return AV_PIX_FMT_YUV420P;
    case PixelFormat::kNV12: return AV_PIX_FMT_NV12;
    case PixelFormat::kBGRA: return AV_PIX_FMT_BGRA;
    case PixelFormat::kRGBA: return AV_PIX_FMT_RGBA;
  }
  return AV_PIX_FMT_NONE;
}

inline std::string AvErrorString(int err) {
  char errbuf[AV_ERROR_MAX_STRING_SIZE];
  av_strerror(err, errbuf, AV_ERROR_MAX_STRING_SIZE);
  return errbuf;
}

}  // namespace capkit::media

#endif  // CAPKIT_MEDIA_FFMPEG_FORMATS_HPP_
