// Repository: Capkit-recorder
// Component: SegmentedMuxer
// Purpose: Segment-owning muxer with per-segment encoder threads.
// Copyright (c) 2025 Capkit

#include "capkit/mux/SegmentedMuxer.hpp"

#include <algorithm>
#include <sstream>
#include <system_error>

#include "capkit/util/Errors.hpp"
#include "capkit/util/Logger.hpp"

namespace capkit::mux {

namespace fs = std::filesystem;

namespace {

constexpr const char* kVideoSegmentExtension = ".mp4";
constexpr const char* kAudioSegmentExtension = ".m4a";

}  // namespace

std::unique_ptr<SegmentedMuxer> SegmentedMuxer::Setup(const SegmentedMuxerConfig& config,
                                                      const MuxerSetup& setup,
                                                      SegmentEncoderFactory factory,
                                                      std::shared_ptr<timing::IClock> clock) {
  if (!setup.video && !setup.audio) {
    throw SetupError("[SegmentedMuxer] Neither video nor audio configured");
  }
  if (!factory) {
    throw SetupError("[SegmentedMuxer] No segment encoder factory");
  }
  if (config.segment_duration_ns <= 0) {
    throw SetupError("[SegmentedMuxer] Segment duration must be positive");
  }
  std::error_code ec;
  fs::create_directories(setup.output_path, ec);
  if (ec) {
    throw SetupError("[SegmentedMuxer] Cannot create output directory " +
                     setup.output_path.string() + ": " + ec.message());
  }
  return std::unique_ptr<SegmentedMuxer>(
      new SegmentedMuxer(config, setup, std::move(factory), std::move(clock)));
}

SegmentedMuxer::SegmentedMuxer(const SegmentedMuxerConfig& config, const MuxerSetup& setup,
                               SegmentEncoderFactory factory,
                               std::shared_ptr<timing::IClock> clock)
    : config_(config),
      setup_(setup),
      factory_(std::move(factory)),
      clock_(clock ? std::move(clock) : timing::MakeSystemClock()),
      extension_(setup.video ? kVideoSegmentExtension : kAudioSegmentExtension),
      ledger_(setup.output_path,
              setup.video ? kManifestTypeVideoSegments : kManifestTypeAudioSegments, extension_,
              config.segment_duration_ns),
      disk_monitor_(setup.output_path, clock_, config.on_disk_space),
      video_clock_(setup.pause_flag),
      audio_clock_(setup.pause_flag) {
  std::ostringstream oss;
  oss << "[SegmentedMuxer] Setup " << setup_.output_path.string()
      << " segment_duration=" << timing::NsToSeconds(config_.segment_duration_ns) << "s";
  if (setup_.video) {
    oss << " video=" << setup_.video->width << "x" << setup_.video->height << "@"
        << setup_.video->fps_num << "/" << setup_.video->fps_den;
  }
  if (setup_.audio) {
    oss << " audio=" << setup_.audio->sample_rate << "Hz/" << setup_.audio->channels << "ch";
  }
  util::Logger::Info(oss.str());
}

SegmentedMuxer::~SegmentedMuxer() {
  try {
    Finish();
  } catch (const std::exception& e) {
    util::Logger::Error(std::string("[SegmentedMuxer] Finish during destruction failed: ") +
                        e.what());
  }
}

SegmentInfo SegmentedMuxer::ActiveEntry() const {
  SegmentInfo entry;
  entry.path = active_->final_path;
  entry.index = active_->index;
  entry.duration_ns = 0;
  entry.is_complete = false;
  return entry;
}

void SegmentedMuxer::OpenSegment(int64_t start_ns) {
  Active a;
  a.index = next_index_;
  a.start_ns = start_ns;
  a.last_end_ns = start_ns;
  a.wall_start_ns = clock_->NowNs();
  a.final_path = setup_.output_path / SegmentFileName(a.index, extension_);
  a.tmp_path = a.final_path.string() + kTmpSuffix;
  a.worker = SegmentEncoderWorker::Spawn(factory_, a.tmp_path, setup_.video, setup_.audio,
                                         config_.encoder_queue_capacity,
                                         config_.encoder_join_timeout);
  ++next_index_;
  active_ = std::move(a);

  util::Logger::Info("[SegmentedMuxer] Opened segment " + active_->final_path.filename().string() +
                     " at " + std::to_string(timing::NsToSeconds(start_ns)) + "s");
  ledger_.WriteInProgressManifest(ActiveEntry());
}

void SegmentedMuxer::CloseActive(std::optional<int64_t> end_ns) {
  Active a = std::move(*active_);
  active_.reset();

  const WorkerFinishResult result = a.worker->Finish(config_.encoder_join_timeout);
  if (!result.joined || !result.ok) {
    util::Logger::Warn("[SegmentedMuxer] Segment " + a.final_path.filename().string() +
                       " did not close cleanly (" + result.error + "); left for recovery");
    return;
  }

  std::error_code ec;
  fs::rename(a.tmp_path, a.final_path, ec);
  if (ec) {
    util::Logger::Warn("[SegmentedMuxer] Failed to finalize " + a.tmp_path.filename().string() +
                       ": " + ec.message() + "; left for recovery");
    return;
  }
  SyncFile(a.final_path);

  SegmentInfo info;
  info.path = a.final_path;
  info.index = a.index;
  info.duration_ns = std::max<int64_t>(0, end_ns.value_or(a.last_end_ns) - a.start_ns);
  info.is_complete = true;
  std::error_code size_ec;
  const auto size = fs::file_size(a.final_path, size_ec);
  if (!size_ec) info.file_size = size;
  ledger_.AddCompleted(info);

  std::ostringstream oss;
  oss << "[SegmentedMuxer] Completed segment " << a.final_path.filename().string() << " duration="
      << timing::NsToSeconds(info.duration_ns) << "s size=" << info.file_size.value_or(0);
  util::Logger::Info(oss.str());

  if (config_.check_disk_space) {
    disk_monitor_.MaybeCheck();
  }
}

void SegmentedMuxer::Dispatch(EncodeCommand command, int64_t timestamp_ns) {
  if (!active_->worker->Send(std::move(command))) {
    throw StreamError("[SegmentedMuxer] Encoder for segment " +
                      active_->final_path.filename().string() + " failed at " +
                      std::to_string(timestamp_ns) + "ns: " + active_->worker->LastError());
  }
}

void SegmentedMuxer::SendVideoFrame(media::VideoFrame frame, int64_t timestamp_ns) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (finished_) {
    util::Logger::Debug("[SegmentedMuxer] Dropping video frame after finish");
    return;
  }
  if (!setup_.video) {
    throw StreamError("[SegmentedMuxer] Video frame sent to a muxer without video");
  }

  const auto adjusted = video_clock_.Adjust(timestamp_ns);
  if (!adjusted) return;
  const int64_t t = *adjusted;

  if (!active_) {
    OpenSegment(t);
  } else if (t - active_->start_ns >= config_.segment_duration_ns) {
    CloseActive(t);
    OpenSegment(t);
  }
  active_->last_end_ns = std::max(active_->last_end_ns, t + setup_.video->FrameDurationNs());
  Dispatch(EncodeVideo{std::move(frame), t - active_->start_ns}, timestamp_ns);
}

void SegmentedMuxer::SendAudioFrame(media::AudioFrame frame, int64_t timestamp_ns) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (finished_) {
    util::Logger::Debug("[SegmentedMuxer] Dropping audio frame after finish");
    return;
  }
  if (!setup_.audio) {
    throw StreamError("[SegmentedMuxer] Audio frame sent to a muxer without audio");
  }

  const auto adjusted = audio_clock_.Adjust(timestamp_ns);
  if (!adjusted) return;
  const int64_t t = *adjusted;

  if (!active_) {
    OpenSegment(t);
  } else if (!DrivenByVideo() && t - active_->start_ns >= config_.segment_duration_ns) {
    CloseActive(t);
    OpenSegment(t);
  }
  if (!DrivenByVideo()) {
    active_->last_end_ns = std::max(active_->last_end_ns, t + frame.DurationNs());
  }

  // Audio captured before a video-driven rotation belongs to the closed
  // segment; only the part from the segment start on is written here.
  int64_t pts_ns = t - active_->start_ns;
  if (pts_ns < 0) {
    const int64_t cut =
        std::min<int64_t>(media::NsToSamples(-pts_ns, frame.sample_rate), frame.nb_samples);
    if (!media::TrimLeadingSamples(frame, static_cast<int>(cut))) {
      util::Logger::Debug("[SegmentedMuxer] Dropping audio frame from before segment " +
                          active_->final_path.filename().string());
      return;
    }
    pts_ns = 0;
  }
  Dispatch(EncodeAudio{std::move(frame), pts_ns}, timestamp_ns);
}

void SegmentedMuxer::Finish() {
  std::lock_guard<std::mutex> lock(mutex_);
  if (finished_) return;
  finished_ = true;

  std::optional<ActiveSegment> active;
  if (active_) {
    active = ActiveSegment{active_->index, clock_->NowNs() - active_->wall_start_ns};
    CloseActive(std::nullopt);
  }

  ledger_.FinalizePendingTmpFiles();
  ledger_.CollectOrphanedSegments(active);
  ledger_.WriteFinalManifest();

  std::ostringstream oss;
  oss << "[SegmentedMuxer] Finished: " << ledger_.Completed().size() << " segment(s), total "
      << timing::NsToSeconds(ledger_.TotalDurationNs()) << "s";
  util::Logger::Info(oss.str());
}

std::vector<SegmentInfo> SegmentedMuxer::CompletedSegments() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return ledger_.Completed();
}

fs::path SegmentedMuxer::ManifestPath() const {
  return ledger_.ManifestPath();
}

uint32_t SegmentedMuxer::CurrentIndex() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return active_ ? active_->index : next_index_ - 1;
}

bool SegmentedMuxer::HasActiveSegment() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return active_.has_value();
}

bool SegmentedMuxer::IsFinished() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return finished_;
}

}  // namespace capkit::mux
