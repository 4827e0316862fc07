// Repository: Capkit-recorder
// Component: AudioMixer
// Purpose: Tick loop that keeps every source contiguous and emits mixed,
//          sample-count-stamped output.
// Copyright (c) 2025 Capkit

#include "capkit/audio/AudioMixer.hpp"

#include <algorithm>
#include <chrono>
#include <sstream>

#include "capkit/util/Errors.hpp"
#include "capkit/util/Logger.hpp"

namespace capkit::audio {

int64_t AdaptiveBufferTimeoutNs(const media::AudioInfo& info) {
  const int64_t min_timeout =
      info.is_wireless_transport ? kMinBufferTimeoutWirelessNs : kMinBufferTimeoutWiredNs;
  if (info.buffer_size <= 0 || info.sample_rate <= 0) {
    return std::max(kDefaultAdaptiveTimeoutNs, min_timeout);
  }
  const double seconds = static_cast<double>(info.buffer_size) /
                         static_cast<double>(info.sample_rate) * kBufferTimeoutHeadroom;
  const int64_t timeout = timing::SecondsToNs(seconds);
  return std::clamp(timeout, min_timeout, kMaxBufferTimeoutNs);
}

// =============================================================================
// AudioMixerBuilder
// =============================================================================

AudioMixerBuilder::AudioMixerBuilder(AudioMixerConfig config) : config_(config) {}

AudioMixerBuilder& AudioMixerBuilder::AddSource(std::string name, const media::AudioInfo& info,
                                                AudioChannelPtr rx) {
  sources_.push_back(PendingSource{std::move(name), info, std::move(rx)});
  return *this;
}

std::unique_ptr<AudioMixer> AudioMixerBuilder::Build(AudioChannelPtr output) {
  if (sources_.empty()) {
    throw SetupError("[AudioMixer] No audio sources registered");
  }
  if (!output) {
    throw SetupError("[AudioMixer] Output channel is required");
  }
  if (config_.buffer_timeout_ns <= 0 || config_.tick_interval_ns <= 0) {
    throw SetupError("[AudioMixer] buffer_timeout and tick_interval must be positive");
  }

  std::vector<media::AudioInfo> infos;
  std::vector<AudioMixer::Input> inputs;
  for (auto& src : sources_) {
    if (!src.rx) {
      throw SetupError("[AudioMixer] Source '" + src.name + "' has no receive channel");
    }
    const int64_t timeout = config_.adaptive_buffer_timeout
                                ? AdaptiveBufferTimeoutNs(src.info)
                                : config_.buffer_timeout_ns;
    infos.push_back(src.info);
    inputs.push_back(AudioMixer::Input{AudioSourceBuffer(src.name, src.info, timeout), src.rx});
  }

  // Throws SetupError for formats swr cannot handle.
  auto stage = std::make_unique<MixingStage>(infos, config_.output_frame_samples);

  std::ostringstream oss;
  oss << "[AudioMixer] Built with " << inputs.size() << " source(s)";
  for (const auto& in : inputs) {
    oss << " '" << in.buffer.name() << "'("
        << media::SampleFormatName(in.buffer.info().sample_format) << "/"
        << in.buffer.info().sample_rate << "Hz/" << in.buffer.info().channels
        << "ch timeout=" << in.buffer.buffer_timeout_ns() / timing::kNsPerMs << "ms)";
  }
  util::Logger::Info(oss.str());

  sources_.clear();
  return std::unique_ptr<AudioMixer>(
      new AudioMixer(config_, std::move(inputs), std::move(stage), std::move(output)));
}

// =============================================================================
// AudioMixer
// =============================================================================

AudioMixer::AudioMixer(AudioMixerConfig config, std::vector<Input> inputs,
                       std::unique_ptr<MixingStage> stage, AudioChannelPtr output)
    : config_(config),
      sources_(std::move(inputs)),
      stage_(std::move(stage)),
      output_(std::move(output)) {
  for (const auto& in : sources_) {
    max_buffer_timeout_ns_ = std::max(max_buffer_timeout_ns_, in.buffer.buffer_timeout_ns());
  }
}

AudioMixer::~AudioMixer() {
  Stop();
}

std::optional<int64_t> AudioMixer::StartTimestampNs() const {
  std::lock_guard<std::mutex> lock(state_mutex_);
  return start_ns_;
}

void AudioMixer::BufferSources(int64_t now_ns) {
  for (auto& in : sources_) {
    in.buffer.FillSilenceUntil(now_ns - in.buffer.buffer_timeout_ns(),
                               config_.max_silence_chunks_per_tick);
    while (auto frame = in.rx->TryRecv()) {
      in.buffer.PushFrame(std::move(*frame));
    }
  }

  const std::optional<int64_t> start = AlignSources();
  if (!start) return;

  if (now_ns - *start > max_buffer_timeout_ns_) {
    for (auto& in : sources_) {
      if (!in.buffer.HasAnchor()) {
        in.buffer.BackfillFrom(*start, now_ns - in.buffer.buffer_timeout_ns());
      }
    }
  }
}

std::optional<int64_t> AudioMixer::AlignSources() {
  std::optional<int64_t> start;
  {
    std::lock_guard<std::mutex> lock(state_mutex_);
    if (!start_ns_) {
      for (const auto& in : sources_) {
        auto first = in.buffer.FirstTimestampNs();
        if (first && (!start_ns_ || *first < *start_ns_)) {
          start_ns_ = first;
        }
      }
      if (start_ns_) {
        util::Logger::Info("[AudioMixer] Start timestamp established at " +
                           std::to_string(*start_ns_) + "ns");
      }
    }
    start = start_ns_;
  }
  if (!start) return std::nullopt;

  for (auto& in : sources_) {
    if (!in.buffer.IsAligned()) {
      in.buffer.AlignStart(*start);
    }
  }
  return start;
}

void AudioMixer::PadSourcesToEnd(int64_t start_ns) {
  int64_t end_ns = start_ns;
  for (const auto& in : sources_) {
    if (auto last_end = in.buffer.LastEndNs()) end_ns = std::max(end_ns, *last_end);
  }
  for (auto& in : sources_) {
    if (in.buffer.HasAnchor()) {
      in.buffer.FillSilenceUntil(end_ns);
    } else {
      in.buffer.BackfillFrom(start_ns, end_ns);
    }
  }
}

bool AudioMixer::Emit(media::AudioFrame frame) {
  int64_t start = 0;
  {
    std::lock_guard<std::mutex> lock(state_mutex_);
    start = start_ns_.value_or(0);
  }
  frame.timestamp_ns = start + media::SamplesToNs(samples_emitted_.load(), media::kMixerSampleRate);
  const int nb_samples = frame.nb_samples;

  // Blocking send, but never past a Stop() request or a closed consumer.
  // SendFor consumes its argument, so each attempt gets a copy.
  while (!output_->SendFor(frame, std::chrono::milliseconds(20))) {
    if (output_->IsClosed()) {
      return false;
    }
    if (stop_requested_.load()) {
      util::Logger::Warn("[AudioMixer] Output stalled during stop; dropping " +
                         std::to_string(nb_samples) + " samples");
      samples_emitted_ += nb_samples;
      return true;
    }
  }
  samples_emitted_ += nb_samples;
  return true;
}

bool AudioMixer::EmitMixed(bool partial) {
  while (auto mixed = stage_->PullFrame(partial)) {
    if (!Emit(std::move(*mixed))) {
      return false;
    }
  }
  return true;
}

bool AudioMixer::Tick(int64_t now_ns) {
  if (output_->IsClosed()) return false;

  BufferSources(now_ns);
  if (!StartTimestampNs()) return true;

  for (size_t i = 0; i < sources_.size(); ++i) {
    if (!sources_[i].buffer.IsAligned()) continue;
    for (auto& frame : sources_[i].buffer.Drain()) {
      stage_->Push(i, frame);
    }
  }
  return EmitMixed(false);
}

void AudioMixer::Start(std::shared_ptr<timing::IClock> clock) {
  if (thread_.joinable() || stopped_) return;
  clock_ = std::move(clock);
  if (!clock_) clock_ = timing::MakeSystemClock();
  thread_ = std::thread(&AudioMixer::RunLoop, this);
}

void AudioMixer::RunLoop() {
  const auto interval = std::chrono::nanoseconds(config_.tick_interval_ns);
  while (!stop_requested_.load()) {
    try {
      if (!Tick(clock_->NowNs())) {
        util::Logger::Info("[AudioMixer] Output channel closed; tick loop ending");
        return;
      }
    } catch (const StreamError& e) {
      util::Logger::Error(std::string("[AudioMixer] ") + e.what());
      output_->Close();
      return;
    }
    std::unique_lock<std::mutex> lock(loop_mutex_);
    loop_cv_.wait_for(lock, interval, [this] { return stop_requested_.load(); });
  }
}

void AudioMixer::Stop() {
  if (stopped_) return;
  stopped_ = true;
  {
    std::lock_guard<std::mutex> lock(loop_mutex_);
    stop_requested_.store(true);
  }
  loop_cv_.notify_all();
  if (thread_.joinable()) {
    thread_.join();
  }

  if (!output_->IsClosed()) {
    try {
      // Frames queued before the sources stopped still belong to the mix.
      for (auto& in : sources_) {
        while (auto frame = in.rx->TryRecv()) {
          in.buffer.PushFrame(std::move(*frame));
        }
      }
      if (const auto start = AlignSources()) {
        PadSourcesToEnd(*start);
        for (size_t i = 0; i < sources_.size(); ++i) {
          if (!sources_[i].buffer.IsAligned()) continue;
          for (auto& frame : sources_[i].buffer.Drain()) {
            stage_->Push(i, frame);
          }
        }
        stage_->Flush();
        EmitMixed(true);
      }
    } catch (const StreamError& e) {
      util::Logger::Error(std::string("[AudioMixer] Flush failed: ") + e.what());
    }
  }
  output_->Close();

  std::ostringstream oss;
  oss << "[AudioMixer] Stopped: samples_emitted=" << samples_emitted_.load();
  for (const auto& in : sources_) {
    oss << " '" << in.buffer.name() << "'(silence=" << in.buffer.SilenceSamples()
        << " trimmed=" << in.buffer.TrimmedSamples()
        << " dropped=" << in.buffer.DroppedFrames() << ")";
  }
  util::Logger::Info(oss.str());
}

}  // namespace capkit::audio
