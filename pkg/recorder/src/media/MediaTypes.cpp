// Repository: Capkit-recorder
// Component: Media Types
// Purpose: Sample-format helpers and silent frame synthesis.
// Copyright (c) 2025 Capkit

#include "capkit/media/MediaTypes.hpp"

#include <cstring>

namespace capkit::media {

int BytesPerSample(SampleFormat format) {
  switch (format) {
    case SampleFormat::kU8:
    case SampleFormat::kU8P:
      return 1;
    case SampleFormat::kS16:
    case SampleFormat::kS16P:
      return 2;
    case SampleFormat::kS32:
    case SampleFormat::kS32P:
    case SampleFormat::kF32:
    case SampleFormat::kF32P:
      return 4;
  }
  return 0;
}

bool IsPlanar(SampleFormat format) {
  switch (format) {
    case SampleFormat::kU8P:
    case SampleFormat::kS16P:
    case SampleFormat::kS32P:
    case SampleFormat::kF32P:
      return true;
    default:
      return false;
  }
}

const char* SampleFormatName(SampleFormat format) {
  switch (format) {
    case SampleFormat::kU8: return "u8";
    case SampleFormat::kS16: return "s16";
    case SampleFormat::kS32: return "s32";
    case SampleFormat::kF32: return "f32";
    case SampleFormat::kU8P: return "u8p";
    case SampleFormat::kS16P: return "s16p";
    case SampleFormat::kS32P: return "s32p";
    case SampleFormat::kF32P: return "f32p";
  }
  return "unknown";
}

AudioInfo MixerOutputInfo() {
  AudioInfo info;
  info.sample_format = SampleFormat::kF32;
  info.sample_rate = kMixerSampleRate;
  info.channels = kMixerChannels;
  info.buffer_size = kMixerFrameSamples;
  return info;
}

AudioInfo AudioFrame::Info() const {
  AudioInfo info;
  info.sample_format = sample_format;
  info.sample_rate = sample_rate;
  info.channels = channels;
  info.buffer_size = nb_samples;
  return info;
}

int64_t AudioFrame::DurationNs() const {
  return SamplesToNs(nb_samples, sample_rate);
}

int64_t SamplesToNs(int64_t nb_samples, int sample_rate) {
  if (sample_rate <= 0) return 0;
  return nb_samples * 1'000'000'000LL / sample_rate;
}

int64_t NsToSamples(int64_t duration_ns, int sample_rate) {
  if (duration_ns <= 0 || sample_rate <= 0) return 0;
  return (duration_ns * sample_rate + 500'000'000LL) / 1'000'000'000LL;
}

AudioFrame MakeSilentFrame(const AudioInfo& info, int nb_samples, int64_t timestamp_ns) {
  AudioFrame frame;
  frame.sample_format = info.sample_format;
  frame.sample_rate = info.sample_rate;
  frame.channels = info.channels;
  frame.nb_samples = nb_samples;
  frame.timestamp_ns = timestamp_ns;

  const size_t bps = static_cast<size_t>(BytesPerSample(info.sample_format));
  const uint8_t fill =
      (info.sample_format == SampleFormat::kU8 || info.sample_format == SampleFormat::kU8P)
          ? 0x80
          : 0x00;
  if (IsPlanar(info.sample_format)) {
    frame.planes.assign(static_cast<size_t>(info.channels),
                        std::vector<uint8_t>(static_cast<size_t>(nb_samples) * bps, fill));
  } else {
    frame.planes.assign(
        1, std::vector<uint8_t>(
               static_cast<size_t>(nb_samples) * static_cast<size_t>(info.channels) * bps, fill));
  }
  return frame;
}

bool TrimLeadingSamples(AudioFrame& frame, int n) {
  if (n <= 0) return true;
  if (n >= frame.nb_samples) return false;

  const size_t bps = static_cast<size_t>(BytesPerSample(frame.sample_format));
  const size_t stride =
      IsPlanar(frame.sample_format) ? bps : bps * static_cast<size_t>(frame.channels);
  const size_t cut = stride * static_cast<size_t>(n);
  for (auto& plane : frame.planes) {
    if (plane.size() <= cut) {
      plane.clear();
    } else {
      plane.erase(plane.begin(), plane.begin() + static_cast<std::ptrdiff_t>(cut));
    }
  }
  frame.timestamp_ns += SamplesToNs(n, frame.sample_rate);
  frame.nb_samples -= n;
  return true;
}

float ReadSampleAsFloat(const AudioFrame& frame, int channel, int index) {
  const bool planar = IsPlanar(frame.sample_format);
  const size_t bps = static_cast<size_t>(BytesPerSample(frame.sample_format));
  const size_t plane_idx = planar ? static_cast<size_t>(channel) : 0;
  if (plane_idx >= frame.planes.size()) return 0.0f;
  const size_t offset =
      planar ? static_cast<size_t>(index) * bps
             : (static_cast<size_t>(index) * static_cast<size_t>(frame.channels) +
                static_cast<size_t>(channel)) * bps;
  const auto& plane = frame.planes[plane_idx];
  if (offset + bps > plane.size()) return 0.0f;
  const uint8_t* p = plane.data() + offset;

  switch (frame.sample_format) {
    case SampleFormat::kU8:
    case SampleFormat::kU8P:
      return (static_cast<float>(*p) - 128.0f) / 128.0f;
    case SampleFormat::kS16:
    case SampleFormat::kS16P: {
      int16_t v;
      std::memcpy(&v, p, sizeof(v));
      return static_cast<float>(v) / 32768.0f;
    }
    case SampleFormat::kS32:
    case SampleFormat::kS32P: {
      int32_t v;
      std::memcpy(&v, p, sizeof(v));
      return static_cast<float>(static_cast<double>(v) / 2147483648.0);
    }
    case SampleFormat::kF32:
    case SampleFormat::kF32P: {
      float v;
      std::memcpy(&v, p, sizeof(v));
      return v;
    }
  }
  return 0.0f;
}

const char* PixelFormatName(PixelFormat format) {
  switch (format) {
    case PixelFormat::kYUV420P: return "yuv420p";
    case PixelFormat::kNV12: return "nv12";
    case PixelFormat::kBGRA: return "bgra";
    case PixelFormat::kRGBA: return "rgba";
  }
  return "unknown";
}

int64_t VideoInfo::FrameDurationNs() const {
  if (fps_num <= 0 || fps_den <= 0) return 0;
  return static_cast<int64_t>(fps_den) * 1'000'000'000LL / fps_num;
}

size_t PictureSize(PixelFormat format, int width, int height) {
  const size_t w = static_cast<size_t>(width);
  const size_t h = static_cast<size_t>(height);
  switch (format) {
    case PixelFormat::kYUV420P:
    case PixelFormat::kNV12:
      return w * h + 2 * (((w + 1) / 2) * ((h + 1) / 2));
    case PixelFormat::kBGRA:
    case PixelFormat::kRGBA:
      return w * h * 4;
  }
  return 0;
}

}  // namespace capkit::media
