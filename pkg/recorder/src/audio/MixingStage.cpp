// Repository: Capkit-recorder
// Component: MixingStage
// Purpose: Equal-weight sample-domain mixing of resampled inputs.
// Copyright (c) 2025 Capkit

#include "capkit/audio/MixingStage.hpp"

#include <algorithm>
#include <limits>
#include <string>

#include "capkit/util/Errors.hpp"

namespace capkit::audio {

int64_t MixingStage::Fifo::Frames() const {
  return static_cast<int64_t>((samples.size() - read_pos) / media::kMixerChannels);
}

void MixingStage::Fifo::Compact() {
  if (read_pos == 0) return;
  if (read_pos >= samples.size()) {
    samples.clear();
  } else if (read_pos > samples.size() / 2) {
    samples.erase(samples.begin(), samples.begin() + static_cast<std::ptrdiff_t>(read_pos));
  } else {
    return;
  }
  read_pos = 0;
}

MixingStage::MixingStage(const std::vector<media::AudioInfo>& inputs, int frame_samples)
    : frame_samples_(frame_samples > 0 ? frame_samples : media::kMixerFrameSamples) {
  if (inputs.empty()) {
    throw SetupError("[MixingStage] At least one input is required");
  }
  fifos_.reserve(inputs.size());
  for (const auto& info : inputs) {
    Fifo fifo;
    fifo.resampler = std::make_unique<AudioResampler>(info);
    fifos_.push_back(std::move(fifo));
  }
}

void MixingStage::Push(size_t input, const media::AudioFrame& frame) {
  if (input >= fifos_.size()) {
    throw StreamError("[MixingStage] No such input: " + std::to_string(input));
  }
  fifos_[input].resampler->Convert(frame, fifos_[input].samples);
}

int64_t MixingStage::AvailableSamples() const {
  int64_t available = std::numeric_limits<int64_t>::max();
  for (const auto& fifo : fifos_) {
    available = std::min(available, fifo.Frames());
  }
  return available;
}

std::optional<media::AudioFrame> MixingStage::PullFrame(bool partial) {
  const int64_t available = AvailableSamples();
  int64_t n = frame_samples_;
  if (available < n) {
    if (!partial || available <= 0) return std::nullopt;
    n = available;
  }

  media::AudioFrame out =
      media::MakeSilentFrame(media::MixerOutputInfo(), static_cast<int>(n), 0);
  float* dst = reinterpret_cast<float*>(out.planes[0].data());
  const size_t count = static_cast<size_t>(n) * media::kMixerChannels;
  const float weight = 1.0f / static_cast<float>(fifos_.size());

  for (auto& fifo : fifos_) {
    const float* src = fifo.samples.data() + fifo.read_pos;
    for (size_t i = 0; i < count; ++i) {
      dst[i] += src[i];
    }
    fifo.read_pos += count;
    fifo.Compact();
  }
  for (size_t i = 0; i < count; ++i) {
    dst[i] *= weight;
  }
  return out;
}

void MixingStage::Flush() {
  for (auto& fifo : fifos_) {
    fifo.resampler->Flush(fifo.samples);
  }
}

}  // namespace capkit::audio
