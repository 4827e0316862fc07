// Repository: Capkit-recorder
// Component: MixingStage
// Purpose: N per-source sample buffers in, fixed-format mixed frames out.
// Copyright (c) 2025 Capkit

#ifndef CAPKIT_AUDIO_MIXING_STAGE_HPP_
#define CAPKIT_AUDIO_MIXING_STAGE_HPP_

#include <cstdint>
#include <memory>
#include <optional>
#include <vector>

#include "capkit/audio/AudioResampler.hpp"
#include "capkit/media/MediaTypes.hpp"

namespace capkit::audio {

// Each input is resampled to interleaved float stereo at 48 kHz into its own
// FIFO. A mixed frame is produced only when every FIFO holds enough samples,
// so an input that lags holds the output back instead of being mixed in as
// an implicit hole. Inputs are summed with equal weight 1/N.
class MixingStage {
 public:
  // Throws SetupError if inputs is empty or a resampler cannot be created.
  explicit MixingStage(const std::vector<media::AudioInfo>& inputs,
                       int frame_samples = media::kMixerFrameSamples);

  // Throws StreamError on resampling failure.
  void Push(size_t input, const media::AudioFrame& frame);

  // Returns the next mixed frame of frame_samples samples. With partial set,
  // returns whatever every input can supply (possibly fewer samples).
  // timestamp_ns on the result is left at 0; the caller stamps it.
  std::optional<media::AudioFrame> PullFrame(bool partial = false);

  // Drains the resamplers into the FIFOs.
  void Flush();

  size_t Inputs() const { return fifos_.size(); }
  // Samples every input can currently contribute.
  int64_t AvailableSamples() const;

 private:
  struct Fifo {
    std::unique_ptr<AudioResampler> resampler;
    std::vector<float> samples;  // interleaved
    size_t read_pos = 0;         // in floats

    int64_t Frames() const;
    void Compact();
  };

  std::vector<Fifo> fifos_;
  int frame_samples_;
};

}  // namespace capkit::audio

#endif  // CAPKIT_AUDIO_MIXING_STAGE_HPP_
