// Repository: Capkit-recorder
// Component: OutputPipeline
// Purpose: Builder validation, forwarding tasks and ordered shutdown.
// Copyright (c) 2025 Capkit

#include "capkit/pipeline/OutputPipeline.hpp"

#include <algorithm>
#include <sstream>
#include <utility>

#include "capkit/util/Errors.hpp"
#include "capkit/util/Logger.hpp"

namespace capkit::pipeline {

// ======================================================================
// OutputPipelineBuilder
// ======================================================================

OutputPipelineBuilder::OutputPipelineBuilder(std::filesystem::path output_path)
    : output_path_(std::move(output_path)) {}

OutputPipelineBuilder& OutputPipelineBuilder::WithVideo(std::unique_ptr<IVideoSource> source) {
  video_ = std::move(source);
  return *this;
}

OutputPipelineBuilder& OutputPipelineBuilder::WithAudioSource(
    std::unique_ptr<IAudioSource> source) {
  if (source) audio_.push_back(std::move(source));
  return *this;
}

OutputPipelineBuilder& OutputPipelineBuilder::RequireAudio() {
  require_audio_ = true;
  return *this;
}

OutputPipelineBuilder& OutputPipelineBuilder::WithClock(std::shared_ptr<timing::IClock> clock) {
  clock_ = std::move(clock);
  return *this;
}

OutputPipelineBuilder& OutputPipelineBuilder::WithEpochNs(int64_t epoch_ns) {
  epoch_ns_ = epoch_ns;
  return *this;
}

OutputPipelineBuilder& OutputPipelineBuilder::WithConfig(OutputPipelineConfig config) {
  config_ = std::move(config);
  return *this;
}

std::unique_ptr<OutputPipeline> OutputPipelineBuilder::Build(
    const mux::MuxerFactory& muxer_factory) {
  if (!video_ && audio_.empty()) {
    throw SetupError("OutputPipeline needs a video source or at least one audio source");
  }
  if (require_audio_ && audio_.empty()) {
    throw SetupError("Audio output requested but no audio source was registered");
  }
  if (!muxer_factory) {
    throw SetupError("OutputPipeline needs a muxer factory");
  }
  if (config_.video_channel_capacity == 0 || config_.audio_channel_capacity == 0 ||
      config_.mixed_channel_capacity == 0) {
    throw SetupError("OutputPipeline channel capacities must be positive");
  }

  auto clock = clock_ ? clock_ : timing::MakeSystemClock();
  const int64_t epoch_ns = epoch_ns_ ? *epoch_ns_ : clock->NowNs();

  // Setup: formats and channels, nothing running yet.
  VideoChannelPtr video_rx;
  std::optional<media::VideoInfo> video_info;
  if (video_) {
    video_rx = util::MakeChannel<media::VideoFrame>(config_.video_channel_capacity);
    video_info = video_->Setup(video_rx);
  }

  std::vector<AudioChannelPtr> audio_channels;
  audio::AudioMixerBuilder mixer_builder(config_.mixer);
  for (auto& source : audio_) {
    auto channel = util::MakeChannel<media::AudioFrame>(config_.audio_channel_capacity);
    const media::AudioInfo info = source->Setup(channel);
    mixer_builder.AddSource(source->Name(), info, channel);
    audio_channels.push_back(std::move(channel));
  }

  AudioChannelPtr mixed_rx;
  std::unique_ptr<audio::AudioMixer> mixer;
  if (mixer_builder.HasSources()) {
    mixed_rx = util::MakeChannel<media::AudioFrame>(config_.mixed_channel_capacity);
    mixer = mixer_builder.Build(mixed_rx);
  }

  auto pause_flag = std::make_shared<std::atomic<bool>>(false);

  mux::MuxerSetup setup;
  setup.output_path = output_path_;
  setup.video = video_info;
  if (mixer) setup.audio = audio::AudioMixer::OutputInfo();
  setup.pause_flag = pause_flag;

  // Start sources, then open the muxer. Anything started is stopped again
  // if a later step fails.
  bool video_started = false;
  size_t audio_started = 0;
  auto stop_started = [&]() {
    if (video_rx) video_rx->Close();
    for (auto& channel : audio_channels) channel->Close();
    if (video_started) video_->Stop();
    for (size_t i = 0; i < audio_started; ++i) audio_[i]->Stop();
  };

  std::unique_ptr<mux::IMuxer> muxer;
  try {
    if (video_) {
      video_->Start();
      video_started = true;
    }
    for (auto& source : audio_) {
      source->Start();
      ++audio_started;
    }
    muxer = muxer_factory(setup);
    if (!muxer) throw SetupError("Muxer factory returned no muxer");
  } catch (const std::exception& e) {
    util::Logger::Error(std::string("[OutputPipeline] Build failed: ") + e.what());
    stop_started();
    throw;
  }

  std::unique_ptr<OutputPipeline> pipeline(
      new OutputPipeline(output_path_, config_, clock, epoch_ns, pause_flag));
  pipeline->video_source_ = std::move(video_);
  pipeline->video_info_ = video_info;
  pipeline->video_rx_ = std::move(video_rx);
  pipeline->audio_sources_ = std::move(audio_);
  pipeline->audio_source_channels_ = std::move(audio_channels);
  pipeline->mixer_ = std::move(mixer);
  pipeline->mixed_rx_ = std::move(mixed_rx);
  pipeline->muxer_ = std::move(muxer);
  audio_.clear();

  pipeline->StartTasks();

  std::ostringstream oss;
  oss << "[OutputPipeline] Built pipeline for output " << output_path_.string()
      << " (video=" << (pipeline->video_info_ ? "yes" : "no")
      << ", audio_sources=" << pipeline->audio_sources_.size() << ")";
  util::Logger::Info(oss.str());
  return pipeline;
}

// ======================================================================
// OutputPipeline
// ======================================================================

OutputPipeline::OutputPipeline(std::filesystem::path output_path, OutputPipelineConfig config,
                               std::shared_ptr<timing::IClock> clock, int64_t epoch_ns,
                               std::shared_ptr<std::atomic<bool>> pause_flag)
    : output_path_(std::move(output_path)),
      config_(std::move(config)),
      clock_(std::move(clock)),
      epoch_ns_(epoch_ns),
      pause_flag_(std::move(pause_flag)),
      first_timestamp_(first_promise_.get_future().share()) {}

OutputPipeline::~OutputPipeline() {
  if (finished_) return;
  try {
    Stop();
  } catch (const std::exception& e) {
    util::Logger::Error(std::string("[OutputPipeline] Stop during destruction: ") + e.what());
  }
}

void OutputPipeline::StartTasks() {
  if (mixer_) {
    mixer_->Start(clock_);
    tasks_.emplace_back(&OutputPipeline::ForwardAudio, this);
  }
  if (video_rx_) {
    tasks_.emplace_back(&OutputPipeline::ForwardVideo, this);
  }
}

int64_t OutputPipeline::RelativeTimestamp(int64_t timestamp_ns) const {
  // Frames captured before the epoch land on it.
  return std::max<int64_t>(0, timestamp_ns - epoch_ns_);
}

void OutputPipeline::PublishFirstTimestamp(int64_t timestamp_ns) {
  if (first_published_.load(std::memory_order_acquire)) return;
  std::call_once(first_once_, [this, timestamp_ns]() {
    first_timestamp_ns_.store(timestamp_ns);
    first_promise_.set_value(timestamp_ns);
    first_published_.store(true, std::memory_order_release);
  });
}

void OutputPipeline::RecordTaskFailure(const char* task, const std::exception& e, bool invariant) {
  util::Logger::Error(std::string("[OutputPipeline] ") + task + " forwarding stopped: " + e.what());
  std::lock_guard<std::mutex> lock(errors_mutex_);
  if (invariant) {
    if (!invariant_violation_) invariant_violation_ = std::current_exception();
  } else {
    errors_.push_back(std::string(task) + ": " + e.what());
  }
}

void OutputPipeline::ForwardVideo() {
  while (true) {
    auto frame = video_rx_->RecvFor(config_.forward_poll_interval);
    if (!frame) {
      if (video_rx_->IsDrained()) break;
      continue;
    }
    const int64_t timestamp_ns = frame->timestamp_ns;
    PublishFirstTimestamp(timestamp_ns);
    try {
      std::lock_guard<std::mutex> lock(muxer_mutex_);
      muxer_->SendVideoFrame(std::move(*frame), RelativeTimestamp(timestamp_ns));
    } catch (const TimestampInvariantViolation& e) {
      RecordTaskFailure("video", e, true);
      break;
    } catch (const std::exception& e) {
      RecordTaskFailure("video", e, false);
      break;
    }
    video_frames_.fetch_add(1, std::memory_order_relaxed);
  }

  std::ostringstream oss;
  oss << "[OutputPipeline] Video forwarding done ("
      << (cancel_.IsCancelled() ? "stopped" : "upstream ended")
      << "): frames=" << video_frames_.load();
  util::Logger::Info(oss.str());
}

void OutputPipeline::ForwardAudio() {
  while (true) {
    auto frame = mixed_rx_->RecvFor(config_.forward_poll_interval);
    if (!frame) {
      if (mixed_rx_->IsDrained()) break;
      continue;
    }
    const int64_t timestamp_ns = frame->timestamp_ns;
    PublishFirstTimestamp(timestamp_ns);
    try {
      std::lock_guard<std::mutex> lock(muxer_mutex_);
      muxer_->SendAudioFrame(std::move(*frame), RelativeTimestamp(timestamp_ns));
    } catch (const TimestampInvariantViolation& e) {
      RecordTaskFailure("audio", e, true);
      break;
    } catch (const std::exception& e) {
      RecordTaskFailure("audio", e, false);
      break;
    }
    audio_frames_.fetch_add(1, std::memory_order_relaxed);
  }

  std::ostringstream oss;
  oss << "[OutputPipeline] Audio forwarding done ("
      << (cancel_.IsCancelled() ? "stopped" : "upstream ended")
      << "): frames=" << audio_frames_.load();
  util::Logger::Info(oss.str());
}

void OutputPipeline::Pause() {
  if (!pause_flag_->exchange(true)) {
    util::Logger::Info("[OutputPipeline] Paused");
  }
}

void OutputPipeline::Resume() {
  if (pause_flag_->exchange(false)) {
    util::Logger::Info("[OutputPipeline] Resumed");
  }
}

FinishedOutputPipeline OutputPipeline::Stop() {
  std::lock_guard<std::mutex> stop_lock(stop_mutex_);
  if (finished_) return *finished_;

  util::Logger::Info("[OutputPipeline] Stopping " + output_path_.string());
  cancel_.Cancel();

  // Sends from sources fail from here on; queued frames remain readable.
  if (video_rx_) video_rx_->Close();
  for (auto& channel : audio_source_channels_) channel->Close();

  std::vector<std::string> stop_errors;
  auto stop_source = [&stop_errors](const std::string& name, auto& source) {
    try {
      source.Stop();
    } catch (const std::exception& e) {
      util::Logger::Error("[OutputPipeline] Stopping " + name + " failed: " + e.what());
      stop_errors.push_back(name + ": " + e.what());
    }
  };
  if (video_source_) stop_source("video source", *video_source_);
  for (auto& source : audio_sources_) stop_source(source->Name(), *source);

  // Flushes the last partial mixed frame and closes mixed_rx_.
  if (mixer_) mixer_->Stop();

  for (auto& task : tasks_) {
    if (task.joinable()) task.join();
  }
  tasks_.clear();

  if (muxer_) {
    try {
      std::lock_guard<std::mutex> lock(muxer_mutex_);
      muxer_->Finish();
    } catch (const std::exception& e) {
      util::Logger::Error(std::string("[OutputPipeline] Muxer finish failed: ") + e.what());
      stop_errors.push_back(std::string("muxer: ") + e.what());
    }
  }

  std::call_once(first_once_, [this]() {
    first_promise_.set_exception(
        std::make_exception_ptr(StreamError("Pipeline stopped before any frame was forwarded")));
  });

  FinishedOutputPipeline result;
  result.output_path = output_path_;
  if (first_published_.load(std::memory_order_acquire)) {
    result.first_timestamp_ns = first_timestamp_ns_.load();
  }
  result.video_frames = video_frames_.load();
  result.audio_frames = audio_frames_.load();
  std::exception_ptr invariant;
  {
    std::lock_guard<std::mutex> lock(errors_mutex_);
    result.errors = errors_;
    invariant = invariant_violation_;
  }
  result.errors.insert(result.errors.end(), stop_errors.begin(), stop_errors.end());
  finished_ = result;

  std::ostringstream oss;
  oss << "[OutputPipeline] Stopped: video_frames=" << result.video_frames
      << " audio_frames=" << result.audio_frames << " errors=" << result.errors.size();
  util::Logger::Info(oss.str());

  if (invariant) std::rethrow_exception(invariant);
  return result;
}

}  // namespace capkit::pipeline
