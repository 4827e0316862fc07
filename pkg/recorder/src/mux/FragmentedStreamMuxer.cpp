// Repository: Capkit-recorder
// Component: FragmentedStreamMuxer
// Purpose: Fragment-detecting muxer over a continuous DASH-style encode.
// Copyright (c) 2025 Capkit

#include "capkit/mux/FragmentedStreamMuxer.hpp"

#include <algorithm>
#include <sstream>
#include <system_error>

#include "capkit/util/Errors.hpp"
#include "capkit/util/Logger.hpp"

namespace capkit::mux {

namespace fs = std::filesystem;

std::unique_ptr<FragmentedStreamMuxer> FragmentedStreamMuxer::Setup(
    const FragmentedMuxerConfig& config, const MuxerSetup& setup,
    std::unique_ptr<IFragmentingEncoder> encoder, std::shared_ptr<timing::IClock> clock) {
  if (!setup.video && !setup.audio) {
    throw SetupError("[FragmentedStreamMuxer] Neither video nor audio configured");
  }
  if (!encoder) {
    throw SetupError("[FragmentedStreamMuxer] No fragmenting encoder");
  }
  if (config.segment_duration_ns <= 0) {
    throw SetupError("[FragmentedStreamMuxer] Segment duration must be positive");
  }
  std::error_code ec;
  fs::create_directories(setup.output_path, ec);
  if (ec) {
    throw SetupError("[FragmentedStreamMuxer] Cannot create output directory " +
                     setup.output_path.string() + ": " + ec.message());
  }
  std::string error;
  if (!encoder->Open(setup.output_path, config.segment_duration_ns, setup.video, setup.audio,
                     &error)) {
    throw SetupError("[FragmentedStreamMuxer] Failed to open encoder: " + error);
  }
  return std::unique_ptr<FragmentedStreamMuxer>(
      new FragmentedStreamMuxer(config, setup, std::move(encoder), std::move(clock)));
}

FragmentedStreamMuxer::FragmentedStreamMuxer(const FragmentedMuxerConfig& config,
                                             const MuxerSetup& setup,
                                             std::unique_ptr<IFragmentingEncoder> encoder,
                                             std::shared_ptr<timing::IClock> clock)
    : config_(config),
      setup_(setup),
      encoder_(std::move(encoder)),
      clock_(clock ? std::move(clock) : timing::MakeSystemClock()),
      ledger_(setup.output_path, kManifestTypeFragmented, encoder_->SegmentExtension(),
              config.segment_duration_ns, encoder_->InitSegmentName()),
      disk_monitor_(setup.output_path, clock_, config.on_disk_space),
      video_clock_(setup.pause_flag),
      audio_clock_(setup.pause_flag) {
  ledger_.WriteInProgressManifest(std::nullopt);
  util::Logger::Info("[FragmentedStreamMuxer] Setup " + setup_.output_path.string() +
                     " segment_duration=" +
                     std::to_string(timing::NsToSeconds(config_.segment_duration_ns)) + "s");
}

FragmentedStreamMuxer::~FragmentedStreamMuxer() {
  try {
    Finish();
  } catch (const std::exception& e) {
    util::Logger::Error(std::string("[FragmentedStreamMuxer] Finish during destruction failed: ") +
                        e.what());
  }
}

fs::path FragmentedStreamMuxer::InitSegmentPath() const {
  return setup_.output_path / encoder_->InitSegmentName();
}

bool FragmentedStreamMuxer::ValidateInitSegment(std::string* error) const {
  const fs::path init = InitSegmentPath();
  std::error_code ec;
  if (!fs::exists(init, ec)) {
    if (error) *error = init.filename().string() + " is missing at " + init.string();
    return false;
  }
  const auto size = fs::file_size(init, ec);
  if (ec) {
    if (error) *error = "cannot stat " + init.string() + ": " + ec.message();
    return false;
  }
  if (size < kMinViableSegmentBytes) {
    if (error) {
      *error = init.filename().string() + " is too small (" + std::to_string(size) + " bytes)";
    }
    return false;
  }
  return true;
}

size_t FragmentedStreamMuxer::DetectSegments() {
  std::error_code ec;
  fs::directory_iterator it(setup_.output_path, ec);
  if (ec) return 0;

  std::vector<std::pair<uint32_t, fs::path>> found;
  for (const auto& entry : it) {
    auto index = ParseSegmentIndex(entry.path().filename().string(), ledger_.extension());
    if (index && !ledger_.Contains(*index)) {
      found.emplace_back(*index, entry.path());
    }
  }
  if (found.empty()) return 0;
  std::sort(found.begin(), found.end(),
            [](const auto& a, const auto& b) { return a.first < b.first; });

  for (const auto& [index, path] : found) {
    SegmentInfo info;
    info.path = path;
    info.index = index;
    info.duration_ns = config_.segment_duration_ns;
    std::error_code size_ec;
    const auto size = fs::file_size(path, size_ec);
    if (!size_ec) info.file_size = size;
    ledger_.AddCompleted(info);
    util::Logger::Info("[FragmentedStreamMuxer] Segment " + path.filename().string() +
                       " complete (" + std::to_string(info.file_size.value_or(0)) + " bytes)");
  }

  if (!init_validated_) {
    std::string error;
    if (!ValidateInitSegment(&error)) {
      util::Logger::Error("[FragmentedStreamMuxer] " + error +
                          "; segments are unplayable without it");
    }
    init_validated_ = true;
  }

  // The segment after the newest completed one is being written.
  SegmentInfo current;
  current.index = ledger_.Completed().back().index + 1;
  current.path = setup_.output_path / SegmentFileName(current.index, ledger_.extension());
  current.is_complete = false;
  ledger_.WriteInProgressManifest(current);

  if (config_.check_disk_space) {
    disk_monitor_.MaybeCheck();
  }
  return found.size();
}

void FragmentedStreamMuxer::AfterWrite(int64_t media_ns) {
  if (media_ns >= next_scan_ns_) {
    DetectSegments();
    next_scan_ns_ = media_ns + config_.scan_interval_ns;
  }
}

void FragmentedStreamMuxer::SendVideoFrame(media::VideoFrame frame, int64_t timestamp_ns) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (finished_) return;
  if (failed_) throw StreamError("[FragmentedStreamMuxer] Encoder already failed");
  if (!setup_.video) {
    throw StreamError("[FragmentedStreamMuxer] Video frame sent to a muxer without video");
  }

  const auto adjusted = video_clock_.Adjust(timestamp_ns);
  if (!adjusted) return;
  if (!first_ns_) first_ns_ = *adjusted;

  std::string error;
  if (!encoder_->WriteVideo(frame, *adjusted, &error)) {
    failed_ = true;
    throw StreamError("[FragmentedStreamMuxer] Video write failed: " + error);
  }
  media_end_ns_ = std::max(media_end_ns_, *adjusted + setup_.video->FrameDurationNs());
  AfterWrite(*adjusted);
}

void FragmentedStreamMuxer::SendAudioFrame(media::AudioFrame frame, int64_t timestamp_ns) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (finished_) return;
  if (failed_) throw StreamError("[FragmentedStreamMuxer] Encoder already failed");
  if (!setup_.audio) {
    throw StreamError("[FragmentedStreamMuxer] Audio frame sent to a muxer without audio");
  }

  const auto adjusted = audio_clock_.Adjust(timestamp_ns);
  if (!adjusted) return;
  if (!first_ns_) first_ns_ = *adjusted;

  std::string error;
  if (!encoder_->WriteAudio(frame, *adjusted, &error)) {
    failed_ = true;
    throw StreamError("[FragmentedStreamMuxer] Audio write failed: " + error);
  }
  if (!setup_.video) {
    media_end_ns_ = std::max(media_end_ns_, *adjusted + frame.DurationNs());
    AfterWrite(*adjusted);
  }
}

void FragmentedStreamMuxer::Finish() {
  std::lock_guard<std::mutex> lock(mutex_);
  if (finished_) return;
  finished_ = true;

  std::string error;
  if (!encoder_->Finish(&error)) {
    util::Logger::Error("[FragmentedStreamMuxer] Encoder finish failed: " + error);
  }

  ledger_.FinalizePendingTmpFiles();

  // The highest unregistered segment is the one the encoder was writing
  // when it stopped; it is the only one shorter than nominal.
  std::optional<ActiveSegment> active;
  std::optional<uint32_t> last_index;
  std::error_code ec;
  for (const auto& entry : fs::directory_iterator(setup_.output_path, ec)) {
    auto index = ParseSegmentIndex(entry.path().filename().string(), ledger_.extension());
    if (index && !ledger_.Contains(*index) && (!last_index || *index > *last_index)) {
      last_index = index;
    }
  }
  // Encoder indices start at 1; a stray segment_000 is adopted as a plain orphan.
  if (first_ns_ && last_index && *last_index > 0) {
    const int64_t last_start =
        *first_ns_ + static_cast<int64_t>(*last_index - 1) * config_.segment_duration_ns;
    // Media time, not wall time: the encoder cuts segments on media time, so
    // the last one spans from its nominal start to the last written sample.
    active = ActiveSegment{*last_index, media_end_ns_ - last_start};
  }
  ledger_.CollectOrphanedSegments(active);

  if (!ValidateInitSegment(&error)) {
    util::Logger::Error("[FragmentedStreamMuxer] " + error);
  }
  ledger_.WriteFinalManifest();
}

std::vector<SegmentInfo> FragmentedStreamMuxer::CompletedSegments() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return ledger_.Completed();
}

fs::path FragmentedStreamMuxer::ManifestPath() const {
  return ledger_.ManifestPath();
}

}  // namespace capkit::mux
