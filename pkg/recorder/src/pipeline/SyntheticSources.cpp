// Repository: Capkit-recorder
// Component: Synthetic Sources
// Purpose: Test-pattern video and sine-tone audio producer threads.
// Copyright (c) 2025 Capkit

#include "capkit/pipeline/SyntheticSources.hpp"

#include <algorithm>
#include <chrono>
#include <cmath>
#include <cstring>
#include <sstream>

#include "capkit/util/Errors.hpp"
#include "capkit/util/Logger.hpp"

namespace capkit::pipeline {

namespace {

constexpr double kTwoPi = 6.283185307179586;

// SMPTE-ish 75% bars: Y, U, V per bar.
constexpr uint8_t kBars[8][3] = {
    {180, 128, 128}, {162, 44, 142}, {131, 156, 44}, {112, 72, 58},
    {84, 184, 198},  {65, 100, 212}, {35, 212, 114}, {16, 128, 128},
};

constexpr int kStripeHeight = 8;

// Waits until the clock reaches target_ns or the token is cancelled.
// Returns false when cancelled.
bool SleepUntil(const timing::IClock& clock, int64_t target_ns, util::CancellationToken& stop) {
  const int64_t delta = target_ns - clock.NowNs();
  if (delta <= 0) return !stop.IsCancelled();
  return !stop.WaitFor(std::chrono::nanoseconds(std::min<int64_t>(delta, 100 * timing::kNsPerMs)));
}

}  // namespace

// ======================================================================
// TestPatternVideoSource
// ======================================================================

TestPatternVideoSource::TestPatternVideoSource(TestPatternConfig config,
                                               std::shared_ptr<timing::IClock> clock)
    : config_(config), clock_(clock ? std::move(clock) : timing::MakeSystemClock()) {}

TestPatternVideoSource::~TestPatternVideoSource() {
  Stop();
}

media::VideoInfo TestPatternVideoSource::Setup(VideoChannelPtr tx) {
  if (config_.width <= 0 || config_.height <= 0 || config_.width % 2 != 0 ||
      config_.height % 2 != 0) {
    throw SetupError("Test pattern needs positive even dimensions");
  }
  if (config_.fps_num <= 0 || config_.fps_den <= 0) {
    throw SetupError("Test pattern needs a positive frame rate");
  }
  info_.width = config_.width;
  info_.height = config_.height;
  info_.pixel_format = media::PixelFormat::kYUV420P;
  info_.fps_num = config_.fps_num;
  info_.fps_den = config_.fps_den;
  tx_ = std::move(tx);
  return info_;
}

void TestPatternVideoSource::Start() {
  if (thread_.joinable()) return;
  if (!tx_) throw SetupError("Test pattern started before Setup");
  stop_ = std::make_unique<util::CancellationToken>();
  frames_produced_.store(0, std::memory_order_release);
  thread_ = std::thread(&TestPatternVideoSource::ProduceLoop, this);
}

void TestPatternVideoSource::Stop() {
  if (!thread_.joinable()) return;
  stop_->Cancel();
  thread_.join();
}

media::VideoFrame TestPatternVideoSource::RenderFrame(uint64_t index, int64_t timestamp_ns) const {
  const int w = info_.width;
  const int h = info_.height;
  media::VideoFrame frame;
  frame.width = w;
  frame.height = h;
  frame.pixel_format = media::PixelFormat::kYUV420P;
  frame.timestamp_ns = timestamp_ns;
  frame.data.resize(media::PictureSize(frame.pixel_format, w, h));

  uint8_t* y = frame.data.data();
  uint8_t* u = y + static_cast<size_t>(w) * h;
  uint8_t* v = u + static_cast<size_t>(w / 2) * (h / 2);

  for (int row = 0; row < h; ++row) {
    for (int col = 0; col < w; ++col) {
      y[static_cast<size_t>(row) * w + col] = kBars[col * 8 / w][0];
    }
  }
  for (int row = 0; row < h / 2; ++row) {
    for (int col = 0; col < w / 2; ++col) {
      const int bar = col * 2 * 8 / w;
      u[static_cast<size_t>(row) * (w / 2) + col] = kBars[bar][1];
      v[static_cast<size_t>(row) * (w / 2) + col] = kBars[bar][2];
    }
  }

  // Moving white stripe makes dropped or duplicated frames visible.
  const int stripe_top = static_cast<int>((index * 4) % static_cast<uint64_t>(h));
  for (int row = stripe_top; row < std::min(h, stripe_top + kStripeHeight); ++row) {
    std::memset(y + static_cast<size_t>(row) * w, 235, static_cast<size_t>(w));
  }
  return frame;
}

void TestPatternVideoSource::ProduceLoop() {
  const int64_t frame_ns = info_.FrameDurationNs();
  const int64_t start_ns = clock_->NowNs();
  uint64_t index = 0;
  uint64_t dropped = 0;

  while (!stop_->IsCancelled()) {
    const int64_t ts = start_ns + static_cast<int64_t>(index) * frame_ns;
    if (!SleepUntil(*clock_, ts, *stop_)) break;
    if (clock_->NowNs() < ts) continue;

    if (tx_->IsClosed()) break;
    if (tx_->SendFor(RenderFrame(index, ts), std::chrono::nanoseconds(frame_ns))) {
      frames_produced_.fetch_add(1, std::memory_order_relaxed);
    } else if (!tx_->IsClosed()) {
      ++dropped;
    }
    ++index;
  }

  std::ostringstream oss;
  oss << "[TestPatternVideoSource] Produce loop exited. Frames produced: "
      << frames_produced_.load(std::memory_order_acquire) << ", dropped: " << dropped;
  util::Logger::Info(oss.str());
}

// ======================================================================
// SineToneAudioSource
// ======================================================================

SineToneAudioSource::SineToneAudioSource(SineToneConfig config,
                                         std::shared_ptr<timing::IClock> clock)
    : config_(std::move(config)), clock_(clock ? std::move(clock) : timing::MakeSystemClock()) {}

SineToneAudioSource::~SineToneAudioSource() {
  Stop();
}

media::AudioInfo SineToneAudioSource::Setup(AudioChannelPtr tx) {
  if (config_.sample_rate <= 0 || config_.channels <= 0 || config_.buffer_samples <= 0) {
    throw SetupError("Sine source '" + config_.name + "' has an invalid format");
  }
  info_.sample_format = media::SampleFormat::kF32;
  info_.sample_rate = config_.sample_rate;
  info_.channels = config_.channels;
  info_.buffer_size = config_.buffer_samples;
  tx_ = std::move(tx);
  return info_;
}

void SineToneAudioSource::Start() {
  if (thread_.joinable()) return;
  if (!tx_) throw SetupError("Sine source '" + config_.name + "' started before Setup");
  stop_ = std::make_unique<util::CancellationToken>();
  samples_produced_.store(0, std::memory_order_release);
  thread_ = std::thread(&SineToneAudioSource::ProduceLoop, this);
}

void SineToneAudioSource::Stop() {
  if (!thread_.joinable()) return;
  stop_->Cancel();
  thread_.join();
}

void SineToneAudioSource::ProduceLoop() {
  const int64_t start_ns = clock_->NowNs();
  const int n = config_.buffer_samples;
  const int64_t buffer_ns = media::SamplesToNs(n, info_.sample_rate);
  int64_t samples_sent = 0;
  uint64_t dropped = 0;

  while (!stop_->IsCancelled()) {
    const int64_t ts = start_ns + media::SamplesToNs(samples_sent, info_.sample_rate);
    // A buffer is delivered once it has been fully "captured".
    if (!SleepUntil(*clock_, ts + buffer_ns, *stop_)) break;
    if (clock_->NowNs() < ts + buffer_ns) continue;

    media::AudioFrame frame = media::MakeSilentFrame(info_, n, ts);
    float* out = reinterpret_cast<float*>(frame.planes[0].data());
    for (int i = 0; i < n; ++i) {
      const double phase =
          kTwoPi * config_.frequency_hz * static_cast<double>(samples_sent + i) / info_.sample_rate;
      const float value = static_cast<float>(config_.amplitude * std::sin(phase));
      for (int c = 0; c < info_.channels; ++c) {
        out[static_cast<size_t>(i) * info_.channels + c] = value;
      }
    }
    samples_sent += n;

    if (tx_->IsClosed()) break;
    if (tx_->SendFor(std::move(frame), std::chrono::nanoseconds(buffer_ns))) {
      samples_produced_.fetch_add(n, std::memory_order_relaxed);
    } else if (!tx_->IsClosed()) {
      ++dropped;
    }
  }

  std::ostringstream oss;
  oss << "[SineToneAudioSource] " << config_.name
      << " exited. Samples produced: " << samples_produced_.load(std::memory_order_acquire)
      << ", buffers dropped: " << dropped;
  util::Logger::Info(oss.str());
}

}  // namespace capkit::pipeline
