// Repository: Capkit-recorder
// Component: Synthetic Sources
// Purpose: Test-pattern video and sine-tone audio producers for diagnostics
//          and end-to-end tests. No capture hardware involved.
// Copyright (c) 2025 Capkit

#ifndef CAPKIT_PIPELINE_SYNTHETIC_SOURCES_HPP_
#define CAPKIT_PIPELINE_SYNTHETIC_SOURCES_HPP_

#include <atomic>
#include <cstdint>
#include <memory>
#include <string>
#include <thread>

#include "capkit/pipeline/Sources.hpp"
#include "capkit/timing/Clock.hpp"
#include "capkit/util/CancellationToken.hpp"

namespace capkit::pipeline {

struct TestPatternConfig {
  int width = 1280;
  int height = 720;
  int fps_num = 30;
  int fps_den = 1;
};

// Emits YUV420P colour bars with a moving luma stripe at the nominal frame
// rate. Timestamps are start + k * frame duration on the given clock.
class TestPatternVideoSource : public IVideoSource {
 public:
  TestPatternVideoSource(TestPatternConfig config, std::shared_ptr<timing::IClock> clock);
  ~TestPatternVideoSource() override;

  media::VideoInfo Setup(VideoChannelPtr tx) override;
  void Start() override;
  void Stop() override;

  uint64_t FramesProduced() const { return frames_produced_.load(std::memory_order_acquire); }

 private:
  void ProduceLoop();
  media::VideoFrame RenderFrame(uint64_t index, int64_t timestamp_ns) const;

  TestPatternConfig config_;
  media::VideoInfo info_;
  std::shared_ptr<timing::IClock> clock_;
  VideoChannelPtr tx_;
  std::unique_ptr<util::CancellationToken> stop_;
  std::thread thread_;
  std::atomic<uint64_t> frames_produced_{0};
};

struct SineToneConfig {
  std::string name = "sine";
  double frequency_hz = 440.0;
  double amplitude = 0.2;
  int sample_rate = media::kMixerSampleRate;
  int channels = 1;
  // Samples per delivered buffer (10 ms at 48 kHz).
  int buffer_samples = 480;
};

// Emits packed F32 sine buffers at real-time cadence. Timestamps are
// start + samples_sent / rate on the given clock.
class SineToneAudioSource : public IAudioSource {
 public:
  SineToneAudioSource(SineToneConfig config, std::shared_ptr<timing::IClock> clock);
  ~SineToneAudioSource() override;

  media::AudioInfo Setup(AudioChannelPtr tx) override;
  void Start() override;
  void Stop() override;
  std::string Name() const override { return config_.name; }

  int64_t SamplesProduced() const { return samples_produced_.load(std::memory_order_acquire); }

 private:
  void ProduceLoop();

  SineToneConfig config_;
  media::AudioInfo info_;
  std::shared_ptr<timing::IClock> clock_;
  AudioChannelPtr tx_;
  std::unique_ptr<util::CancellationToken> stop_;
  std::thread thread_;
  std::atomic<int64_t> samples_produced_{0};
};

}  // namespace capkit::pipeline

#endif  // CAPKIT_PIPELINE_SYNTHETIC_SOURCES_HPP_
