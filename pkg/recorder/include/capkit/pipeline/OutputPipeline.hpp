// Repository: Capkit-recorder
// Component: OutputPipeline
// Purpose: Wires an optional video source and N audio sources (through the
//          AudioMixer) into one shared muxer; owns startup and shutdown.
// Copyright (c) 2025 Capkit

#ifndef CAPKIT_PIPELINE_OUTPUT_PIPELINE_HPP_
#define CAPKIT_PIPELINE_OUTPUT_PIPELINE_HPP_

#include <atomic>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <exception>
#include <filesystem>
#include <future>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>

#include "capkit/audio/AudioMixer.hpp"
#include "capkit/mux/IMuxer.hpp"
#include "capkit/pipeline/Sources.hpp"
#include "capkit/timing/Clock.hpp"
#include "capkit/util/CancellationToken.hpp"

namespace capkit::pipeline {

struct OutputPipelineConfig {
  size_t video_channel_capacity = 8;
  size_t audio_channel_capacity = 64;
  // Mixer output to the audio forwarding task.
  size_t mixed_channel_capacity = 64;
  audio::AudioMixerConfig mixer;
  // Forwarding tasks wake at least this often to observe cancellation.
  std::chrono::milliseconds forward_poll_interval{50};
};

// Returned by OutputPipeline::Stop().
struct FinishedOutputPipeline {
  std::filesystem::path output_path;
  // Capture timestamp of the first frame that reached the muxer.
  std::optional<int64_t> first_timestamp_ns;
  uint64_t video_frames = 0;
  uint64_t audio_frames = 0;
  // StreamErrors logged by forwarding tasks and by muxer Finish().
  std::vector<std::string> errors;
};

class OutputPipeline;

// Runtime-validated builder. Build() requires at least one of video or
// audio; after RequireAudio() it also requires at least one audio source.
// Every failure throws SetupError with nothing left running.
class OutputPipelineBuilder {
 public:
  explicit OutputPipelineBuilder(std::filesystem::path output_path);

  OutputPipelineBuilder& WithVideo(std::unique_ptr<IVideoSource> source);
  OutputPipelineBuilder& WithAudioSource(std::unique_ptr<IAudioSource> source);
  // Declares an audio-capable output (e.g. a muxer that always carries an
  // audio track).
  OutputPipelineBuilder& RequireAudio();
  OutputPipelineBuilder& WithClock(std::shared_ptr<timing::IClock> clock);
  // Timestamps sent to the muxer are relative to this instant. Defaults to
  // the clock's now at Build().
  OutputPipelineBuilder& WithEpochNs(int64_t epoch_ns);
  OutputPipelineBuilder& WithConfig(OutputPipelineConfig config);

  // Consumes the builder's sources.
  std::unique_ptr<OutputPipeline> Build(const mux::MuxerFactory& muxer_factory);

 private:
  std::filesystem::path output_path_;
  std::unique_ptr<IVideoSource> video_;
  std::vector<std::unique_ptr<IAudioSource>> audio_;
  bool require_audio_ = false;
  std::shared_ptr<timing::IClock> clock_;
  std::optional<int64_t> epoch_ns_;
  OutputPipelineConfig config_;
};

// A running recording. One forwarding thread per stream (video; mixed
// audio) relays frames into the muxer, which every thread accesses under a
// single mutex. Frames from one stream reach the muxer in arrival order.
//
// Stop():
//   1. Cancels the shared token and closes the source channels.
//   2. Stops the sources, then the mixer (which flushes and closes its
//      output).
//   3. Joins every forwarding thread; each drains what is already queued.
//   4. Calls muxer Finish() exactly once.
//   5. Rethrows a TimestampInvariantViolation hit by any forwarding thread.
class OutputPipeline {
 public:
  ~OutputPipeline();

  OutputPipeline(const OutputPipeline&) = delete;
  OutputPipeline& operator=(const OutputPipeline&) = delete;

  // Idempotent; later calls return the first result without rethrowing.
  FinishedOutputPipeline Stop();

  void Pause();
  void Resume();
  bool IsPaused() const { return pause_flag_->load(); }

  // Resolves with the capture timestamp of the first frame forwarded
  // (video or audio, whichever comes first). Fails with StreamError if the
  // pipeline stops before any frame.
  std::shared_future<int64_t> FirstTimestamp() const { return first_timestamp_; }

  const std::optional<media::VideoInfo>& VideoInfo() const { return video_info_; }
  bool HasAudio() const { return mixer_ != nullptr; }
  int64_t EpochNs() const { return epoch_ns_; }
  const std::filesystem::path& OutputPath() const { return output_path_; }

 private:
  friend class OutputPipelineBuilder;

  OutputPipeline(std::filesystem::path output_path, OutputPipelineConfig config,
                 std::shared_ptr<timing::IClock> clock, int64_t epoch_ns,
                 std::shared_ptr<std::atomic<bool>> pause_flag);

  void StartTasks();
  void ForwardVideo();
  void ForwardAudio();
  void PublishFirstTimestamp(int64_t timestamp_ns);
  int64_t RelativeTimestamp(int64_t timestamp_ns) const;
  // Call from inside the catch block.
  void RecordTaskFailure(const char* task, const std::exception& e, bool invariant);

  std::filesystem::path output_path_;
  OutputPipelineConfig config_;
  std::shared_ptr<timing::IClock> clock_;
  int64_t epoch_ns_;
  std::shared_ptr<std::atomic<bool>> pause_flag_;

  std::unique_ptr<IVideoSource> video_source_;
  std::optional<media::VideoInfo> video_info_;
  VideoChannelPtr video_rx_;

  std::vector<std::unique_ptr<IAudioSource>> audio_sources_;
  std::vector<AudioChannelPtr> audio_source_channels_;
  std::unique_ptr<audio::AudioMixer> mixer_;
  AudioChannelPtr mixed_rx_;

  std::mutex muxer_mutex_;
  std::unique_ptr<mux::IMuxer> muxer_;

  util::CancellationToken cancel_;
  std::vector<std::thread> tasks_;

  std::once_flag first_once_;
  std::promise<int64_t> first_promise_;
  std::shared_future<int64_t> first_timestamp_;
  std::atomic<int64_t> first_timestamp_ns_{-1};
  std::atomic<bool> first_published_{false};

  std::atomic<uint64_t> video_frames_{0};
  std::atomic<uint64_t> audio_frames_{0};

  std::mutex errors_mutex_;
  std::vector<std::string> errors_;
  std::exception_ptr invariant_violation_;

  std::mutex stop_mutex_;
  std::optional<FinishedOutputPipeline> finished_;
};

}  // namespace capkit::pipeline

#endif  // CAPKIT_PIPELINE_OUTPUT_PIPELINE_HPP_
