// Repository: Capkit-recorder
// Component: Media Types
// Purpose: Raw audio/video frame and stream-info types exchanged between
//          capture sources, the mixer and the muxers.
// Copyright (c) 2025 Capkit

#ifndef CAPKIT_MEDIA_MEDIA_TYPES_HPP_
#define CAPKIT_MEDIA_MEDIA_TYPES_HPP_

#include <cstdint>
#include <string>
#include <vector>

namespace capkit::media {

// Mixer output ("house" audio format).
constexpr int kMixerSampleRate = 48000;
constexpr int kMixerChannels = 2;
constexpr int kMixerFrameSamples = 1024;

enum class SampleFormat {
  kU8,
  kS16,
  kS32,
  kF32,
  kU8P,
  kS16P,
  kS32P,
  kF32P,
};

int BytesPerSample(SampleFormat format);
bool IsPlanar(SampleFormat format);
const char* SampleFormatName(SampleFormat format);

struct AudioInfo {
  SampleFormat sample_format = SampleFormat::kF32;
  int sample_rate = kMixerSampleRate;
  int channels = kMixerChannels;
  // Capture callback size in samples; 0 when unknown.
  int buffer_size = 0;
  // Bluetooth and similar transports deliver with much larger jitter.
  bool is_wireless_transport = false;

  bool operator==(const AudioInfo& o) const {
    return sample_format == o.sample_format && sample_rate == o.sample_rate &&
           channels == o.channels;
  }
  bool operator!=(const AudioInfo& o) const { return !(*this == o); }
};

// Format of the mixer output.
AudioInfo MixerOutputInfo();

// One block of audio. Packed formats use a single plane holding
// nb_samples * channels interleaved samples; planar formats carry one plane
// per channel.
struct AudioFrame {
  SampleFormat sample_format = SampleFormat::kF32;
  int sample_rate = kMixerSampleRate;
  int channels = kMixerChannels;
  int nb_samples = 0;
  std::vector<std::vector<uint8_t>> planes;
  // Capture instant on the shared clock (ns).
  int64_t timestamp_ns = 0;

  AudioInfo Info() const;
  int64_t DurationNs() const;
  int64_t EndNs() const { return timestamp_ns + DurationNs(); }
};

// Allocates a zero-filled frame. Zero is silence for every supported format
// except U8 (0x80).
AudioFrame MakeSilentFrame(const AudioInfo& info, int nb_samples, int64_t timestamp_ns);

// Duration of n samples at rate, in ns (truncated).
int64_t SamplesToNs(int64_t nb_samples, int sample_rate);

// Number of whole samples covering duration_ns at rate (rounded to nearest).
int64_t NsToSamples(int64_t duration_ns, int sample_rate);

// Drops the first n samples; advances timestamp_ns by their duration.
// Returns false (frame unchanged) if n >= nb_samples.
bool TrimLeadingSamples(AudioFrame& frame, int n);

// Reads sample i of channel c as float in [-1, 1].
float ReadSampleAsFloat(const AudioFrame& frame, int channel, int index);

enum class PixelFormat {
  kYUV420P,
  kNV12,
  kBGRA,
  kRGBA,
};

const char* PixelFormatName(PixelFormat format);

struct VideoInfo {
  int width = 0;
  int height = 0;
  PixelFormat pixel_format = PixelFormat::kYUV420P;
  int fps_num = 30;
  int fps_den = 1;

  // Nominal frame interval in ns.
  int64_t FrameDurationNs() const;
};

// Raw picture. data holds the planes back to back with tight strides
// (Y, U, V for YUV420P; Y, UV for NV12; one plane for BGRA/RGBA).
struct VideoFrame {
  int width = 0;
  int height = 0;
  PixelFormat pixel_format = PixelFormat::kYUV420P;
  std::vector<uint8_t> data;
  int64_t timestamp_ns = 0;
};

// Byte size of a tightly packed picture.
size_t PictureSize(PixelFormat format, int width, int height);

}  // namespace capkit::media

#endif  // CAPKIT_MEDIA_MEDIA_TYPES_HPP_
