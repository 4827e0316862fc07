// Repository: Capkit-recorder
// Component: Channel Sources
// Purpose: Adapt externally fed frame channels into pipeline sources.
// Copyright (c) 2025 Capkit

#ifndef CAPKIT_PIPELINE_CHANNEL_SOURCES_HPP_
#define CAPKIT_PIPELINE_CHANNEL_SOURCES_HPP_

#include <atomic>
#include <chrono>
#include <cstdint>
#include <string>
#include <thread>
#include <utility>

#include "capkit/pipeline/Sources.hpp"

namespace capkit::pipeline {

// Relays frames from an external channel into the pipeline channel on a
// dedicated thread. The relay ends when the external channel is drained,
// the pipeline channel closes, or Stop() is called.
template <typename Frame, typename Info>
class ChannelRelay {
 public:
  ChannelRelay(Info info, util::ChannelPtr<Frame> rx) : info_(info), rx_(std::move(rx)) {}
  ~ChannelRelay() { Stop(); }

  ChannelRelay(const ChannelRelay&) = delete;
  ChannelRelay& operator=(const ChannelRelay&) = delete;

  Info Setup(util::ChannelPtr<Frame> tx) {
    tx_ = std::move(tx);
    return info_;
  }

  void Start() {
    if (thread_.joinable() || !tx_) return;
    stop_requested_.store(false, std::memory_order_release);
    thread_ = std::thread(&ChannelRelay::Run, this);
  }

  void Stop() {
    stop_requested_.store(true, std::memory_order_release);
    if (thread_.joinable()) thread_.join();
  }

  uint64_t FramesRelayed() const { return frames_relayed_.load(std::memory_order_acquire); }

 private:
  void Run() {
    constexpr auto kPoll = std::chrono::milliseconds(20);
    while (!stop_requested_.load(std::memory_order_acquire)) {
      auto frame = rx_->RecvFor(kPoll);
      if (!frame) {
        if (rx_->IsDrained()) return;
        continue;
      }
      // Retry while full so backpressure reaches the external producer.
      bool sent = false;
      while (!sent) {
        if (tx_->IsClosed() || stop_requested_.load(std::memory_order_acquire)) return;
        sent = tx_->SendFor(*frame, kPoll);
      }
      frames_relayed_.fetch_add(1, std::memory_order_relaxed);
    }
  }

  Info info_;
  util::ChannelPtr<Frame> rx_;
  util::ChannelPtr<Frame> tx_;
  std::thread thread_;
  std::atomic<bool> stop_requested_{false};
  std::atomic<uint64_t> frames_relayed_{0};
};

class ChannelVideoSource : public IVideoSource {
 public:
  ChannelVideoSource(const media::VideoInfo& info, VideoChannelPtr rx) : relay_(info, std::move(rx)) {}

  media::VideoInfo Setup(VideoChannelPtr tx) override { return relay_.Setup(std::move(tx)); }
  void Start() override { relay_.Start(); }
  void Stop() override { relay_.Stop(); }

  uint64_t FramesRelayed() const { return relay_.FramesRelayed(); }

 private:
  ChannelRelay<media::VideoFrame, media::VideoInfo> relay_;
};

class ChannelAudioSource : public IAudioSource {
 public:
  ChannelAudioSource(std::string name, const media::AudioInfo& info, AudioChannelPtr rx)
      : name_(std::move(name)), relay_(info, std::move(rx)) {}

  media::AudioInfo Setup(AudioChannelPtr tx) override { return relay_.Setup(std::move(tx)); }
  void Start() override { relay_.Start(); }
  void Stop() override { relay_.Stop(); }
  std::string Name() const override { return name_; }

  uint64_t FramesRelayed() const { return relay_.FramesRelayed(); }

 private:
  std::string name_;
  ChannelRelay<media::AudioFrame, media::AudioInfo> relay_;
};

}  // namespace capkit::pipeline

#endif  // CAPKIT_PIPELINE_CHANNEL_SOURCES_HPP_
