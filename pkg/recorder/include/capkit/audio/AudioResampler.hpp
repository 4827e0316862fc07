// Repository: Capkit-recorder
// Component: AudioResampler
// Purpose: libswresample wrapper converting one source's native format to
//          the mixer's interleaved float stereo at 48 kHz.
// Copyright (c) 2025 Capkit

#ifndef CAPKIT_AUDIO_AUDIO_RESAMPLER_HPP_
#define CAPKIT_AUDIO_AUDIO_RESAMPLER_HPP_

#include <vector>

#include "capkit/media/MediaTypes.hpp"

struct SwrContext;

namespace capkit::audio {

// Inputs already in the mixer format bypass swr entirely and are copied
// through unchanged, so they add no resampler delay.
class AudioResampler {
 public:
  // Throws SetupError if the resampler cannot be configured.
  explicit AudioResampler(const media::AudioInfo& input);
  ~AudioResampler();

  AudioResampler(const AudioResampler&) = delete;
  AudioResampler& operator=(const AudioResampler&) = delete;

  // Appends the converted samples (interleaved, kMixerChannels wide) to out.
  // Throws StreamError on conversion failure.
  void Convert(const media::AudioFrame& frame, std::vector<float>& out);

  // Appends whatever swr still holds internally.
  void Flush(std::vector<float>& out);

  bool IsPassthrough() const { return swr_ctx_ == nullptr; }

 private:
  media::AudioInfo input_;
  SwrContext* swr_ctx_ = nullptr;
};

}  // namespace capkit::audio

#endif  // CAPKIT_AUDIO_AUDIO_RESAMPLER_HPP_
