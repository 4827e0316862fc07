// Repository: Capkit-recorder
// Component: FragmentedStreamMuxer
// Purpose: Fragment-detecting muxer: one continuous DASH-style encode whose
//          container cuts segment files; this class discovers them and keeps
//          the manifest current.
// Copyright (c) 2025 Capkit

#ifndef CAPKIT_MUX_FRAGMENTED_STREAM_MUXER_HPP_
#define CAPKIT_MUX_FRAGMENTED_STREAM_MUXER_HPP_

#include <cstdint>
#include <filesystem>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "capkit/mux/DiskSpaceMonitor.hpp"
#include "capkit/mux/IMuxer.hpp"
#include "capkit/mux/SegmentLedger.hpp"
#include "capkit/timing/Clock.hpp"
#include "capkit/timing/PauseClock.hpp"

namespace capkit::mux {

struct FragmentedMuxerConfig {
  int64_t segment_duration_ns = 3 * timing::kNsPerSec;
  // Media time between directory scans for newly completed segments.
  int64_t scan_interval_ns = 500 * timing::kNsPerMs;
  bool check_disk_space = true;
  DiskSpaceMonitor::Callback on_disk_space;
};

// Segments are detected, never created here: a final-named segment file
// that is not yet in the ledger is complete (the container renames its
// .tmp when it closes a fragment). Detected segments get the nominal
// duration; at Finish() the last one gets media end minus its start.
//
// All public methods are mutex-protected.
class FragmentedStreamMuxer : public IMuxer {
 public:
  // Throws SetupError when neither stream is configured, the directory
  // cannot be created, or the encoder fails to open.
  static std::unique_ptr<FragmentedStreamMuxer> Setup(
      const FragmentedMuxerConfig& config, const MuxerSetup& setup,
      std::unique_ptr<IFragmentingEncoder> encoder,
      std::shared_ptr<timing::IClock> clock = nullptr);

  ~FragmentedStreamMuxer() override;

  void SendVideoFrame(media::VideoFrame frame, int64_t timestamp_ns) override;
  void SendAudioFrame(media::AudioFrame frame, int64_t timestamp_ns) override;
  void Finish() override;

  std::vector<SegmentInfo> CompletedSegments() const;
  std::filesystem::path ManifestPath() const;
  std::filesystem::path InitSegmentPath() const;

  // init segment must exist and be at least kMinViableSegmentBytes.
  bool ValidateInitSegment(std::string* error) const;

 private:
  FragmentedStreamMuxer(const FragmentedMuxerConfig& config, const MuxerSetup& setup,
                        std::unique_ptr<IFragmentingEncoder> encoder,
                        std::shared_ptr<timing::IClock> clock);

  // Registers newly appeared segment files. Returns how many were added.
  size_t DetectSegments();
  void AfterWrite(int64_t media_ns);

  FragmentedMuxerConfig config_;
  MuxerSetup setup_;
  std::unique_ptr<IFragmentingEncoder> encoder_;
  std::shared_ptr<timing::IClock> clock_;

  mutable std::mutex mutex_;
  SegmentLedger ledger_;
  DiskSpaceMonitor disk_monitor_;
  timing::PauseClock video_clock_;
  timing::PauseClock audio_clock_;
  std::optional<int64_t> first_ns_;
  int64_t media_end_ns_ = 0;
  int64_t next_scan_ns_ = 0;
  bool init_validated_ = false;
  bool failed_ = false;
  bool finished_ = false;
};

}  // namespace capkit::mux

#endif  // CAPKIT_MUX_FRAGMENTED_STREAM_MUXER_HPP_
