// Repository: Capkit-recorder
// Component: AudioMixer
// Purpose: Merges N push-based, independently clocked audio sources into one
//          continuous 48 kHz stereo float stream.
// Copyright (c) 2025 Capkit

#ifndef CAPKIT_AUDIO_AUDIO_MIXER_HPP_
#define CAPKIT_AUDIO_AUDIO_MIXER_HPP_

#include <atomic>
#include <condition_variable>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>

#include "capkit/audio/AudioSourceBuffer.hpp"
#include "capkit/audio/MixingStage.hpp"
#include "capkit/media/MediaTypes.hpp"
#include "capkit/timing/Clock.hpp"
#include "capkit/util/BoundedChannel.hpp"

namespace capkit::audio {

using AudioChannelPtr = util::ChannelPtr<media::AudioFrame>;

// Adaptive timeout bounds (used when AudioMixerConfig::adaptive_buffer_timeout).
constexpr int64_t kDefaultAdaptiveTimeoutNs = 100 * timing::kNsPerMs;
constexpr int64_t kMinBufferTimeoutWiredNs = 20 * timing::kNsPerMs;
constexpr int64_t kMinBufferTimeoutWirelessNs = 90 * timing::kNsPerMs;
constexpr int64_t kMaxBufferTimeoutNs = 250 * timing::kNsPerMs;
constexpr double kBufferTimeoutHeadroom = 2.5;

struct AudioMixerConfig {
  int64_t tick_interval_ns = 5 * timing::kNsPerMs;
  // Silence chunk size and the lag after which a silent source is filled.
  int64_t buffer_timeout_ns = 200 * timing::kNsPerMs;
  // Derive each source's timeout from its callback size instead.
  bool adaptive_buffer_timeout = false;
  // Upper bound on silence chunks synthesized per source per tick.
  int max_silence_chunks_per_tick = 5;
  int output_frame_samples = media::kMixerFrameSamples;
};

// Per-source timeout: buffer_size / rate * headroom, clamped to
// [20 ms wired | 90 ms wireless, 250 ms]; 100 ms when buffer_size is unknown.
int64_t AdaptiveBufferTimeoutNs(const media::AudioInfo& info);

class AudioMixer;

class AudioMixerBuilder {
 public:
  explicit AudioMixerBuilder(AudioMixerConfig config = AudioMixerConfig());

  AudioMixerBuilder& AddSource(std::string name, const media::AudioInfo& info,
                               AudioChannelPtr rx);
  bool HasSources() const { return !sources_.empty(); }

  // Throws SetupError when no source is registered or a source format
  // cannot be resampled. output receives mixed frames.
  std::unique_ptr<AudioMixer> Build(AudioChannelPtr output);

 private:
  struct PendingSource {
    std::string name;
    media::AudioInfo info;
    AudioChannelPtr rx;
  };
  AudioMixerConfig config_;
  std::vector<PendingSource> sources_;
};

// AudioMixer runs a tick loop (Start) or is ticked by hand (Tick). Each tick:
//   1. For every source: fill silence up to now - buffer_timeout, then take
//      newly arrived frames.
//   2. Start time = earliest first-buffered timestamp, fixed once set.
//      Sources are aligned to it as their first data appears.
//   3. Past start + max timeout, sources that never delivered are
//      back-filled with silence from start.
//   4. Aligned sources feed the mixing stage; mixed frames are stamped
//      start + samples_emitted / 48000 and sent to the output channel.
//
// Output timestamps are therefore exact functions of the emitted sample
// count and never decrease.
class AudioMixer {
 public:
  ~AudioMixer();

  AudioMixer(const AudioMixer&) = delete;
  AudioMixer& operator=(const AudioMixer&) = delete;

  // Runs one tick at now_ns. Returns false once the output channel is
  // closed; the loop ends cleanly on that.
  bool Tick(int64_t now_ns);

  // Spawns the tick thread driven by clock.
  void Start(std::shared_ptr<timing::IClock> clock);

  // Joins the tick thread, pads every source with silence to the furthest
  // delivered sample, emits the remaining mix and closes the output
  // channel. Idempotent.
  void Stop();

  int64_t SamplesEmitted() const { return samples_emitted_.load(); }
  std::optional<int64_t> StartTimestampNs() const;
  int64_t MaxBufferTimeoutNs() const { return max_buffer_timeout_ns_; }

  size_t SourceCount() const { return sources_.size(); }
  // Tick-thread state; inspect only while no tick thread is running.
  const AudioSourceBuffer& Source(size_t i) const { return sources_[i].buffer; }

  static media::AudioInfo OutputInfo() { return media::MixerOutputInfo(); }

 private:
  friend class AudioMixerBuilder;

  struct Input {
    AudioSourceBuffer buffer;
    AudioChannelPtr rx;
  };

  AudioMixer(AudioMixerConfig config, std::vector<Input> inputs,
             std::unique_ptr<MixingStage> stage, AudioChannelPtr output);

  void BufferSources(int64_t now_ns);
  // Fixes the start timestamp once any source has data and aligns every
  // source that has buffered its first frame.
  std::optional<int64_t> AlignSources();
  // Stop only: extends every source with silence to the furthest buffered
  // end across sources.
  void PadSourcesToEnd(int64_t start_ns);
  bool EmitMixed(bool partial);
  bool Emit(media::AudioFrame frame);
  void RunLoop();

  AudioMixerConfig config_;
  std::vector<Input> sources_;
  std::unique_ptr<MixingStage> stage_;
  AudioChannelPtr output_;
  int64_t max_buffer_timeout_ns_ = 0;

  mutable std::mutex state_mutex_;
  std::optional<int64_t> start_ns_;
  std::atomic<int64_t> samples_emitted_{0};

  std::shared_ptr<timing::IClock> clock_;
  std::thread thread_;
  std::mutex loop_mutex_;
  std::condition_variable loop_cv_;
  std::atomic<bool> stop_requested_{false};
  bool stopped_ = false;
};

}  // namespace capkit::audio

#endif  // CAPKIT_AUDIO_AUDIO_MIXER_HPP_
