// Repository: Capkit-recorder
// Component: SegmentedMuxer
// Purpose: Segment-owning muxer: a fresh encoder + container per
//          bounded-duration segment, each on its own thread, with a durable
//          manifest and crash recovery at Finish().
// Copyright (c) 2025 Capkit

#ifndef CAPKIT_MUX_SEGMENTED_MUXER_HPP_
#define CAPKIT_MUX_SEGMENTED_MUXER_HPP_

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <memory>
#include <mutex>
#include <optional>
#include <vector>

#include "capkit/mux/DiskSpaceMonitor.hpp"
#include "capkit/mux/IMuxer.hpp"
#include "capkit/mux/SegmentEncoderWorker.hpp"
#include "capkit/mux/SegmentLedger.hpp"
#include "capkit/timing/Clock.hpp"
#include "capkit/timing/PauseClock.hpp"

namespace capkit::mux {

struct SegmentedMuxerConfig {
  int64_t segment_duration_ns = 3 * timing::kNsPerSec;
  size_t encoder_queue_capacity = kEncoderQueueCapacity;
  std::chrono::milliseconds encoder_join_timeout = kEncoderJoinTimeout;
  bool check_disk_space = true;
  DiskSpaceMonitor::Callback on_disk_space;
};

// States: no segment -> active(index, start) on the first frame of either
// stream -> rotate (finish outgoing worker with a bounded join, then open
// the next) -> finished.
//
// Rotation is driven by video timestamps, or by audio timestamps when the
// recording has no video. A segment is rotated once the driving timestamp
// is at least segment_duration past its start; the triggering frame opens
// the next segment.
//
// Files are "segment_NNN.mp4" (".m4a" without video), written as ".tmp"
// until the encoder has written its trailer. Indices start at 1 and grow by
// one per rotation.
//
// All public methods are mutex-protected.
class SegmentedMuxer : public IMuxer {
 public:
  // Creates output_dir if needed. Throws SetupError when neither stream is
  // configured or the directory cannot be created. No file is written until
  // the first frame.
  static std::unique_ptr<SegmentedMuxer> Setup(const SegmentedMuxerConfig& config,
                                               const MuxerSetup& setup,
                                               SegmentEncoderFactory factory,
                                               std::shared_ptr<timing::IClock> clock = nullptr);

  ~SegmentedMuxer() override;

  void SendVideoFrame(media::VideoFrame frame, int64_t timestamp_ns) override;
  void SendAudioFrame(media::AudioFrame frame, int64_t timestamp_ns) override;

  // Flushes and closes the active segment, finalizes leftover .tmp files,
  // adopts orphans, writes the final manifest. The second and later calls
  // change nothing.
  void Finish() override;

  std::vector<SegmentInfo> CompletedSegments() const;
  std::filesystem::path ManifestPath() const;
  uint32_t CurrentIndex() const;
  bool HasActiveSegment() const;
  bool IsFinished() const;

 private:
  struct Active {
    uint32_t index = 0;
    int64_t start_ns = 0;          // pause-adjusted media time
    int64_t wall_start_ns = 0;     // clock time the segment opened
    int64_t last_end_ns = 0;       // end of the last driving frame
    std::filesystem::path tmp_path;
    std::filesystem::path final_path;
    std::unique_ptr<SegmentEncoderWorker> worker;
  };

  SegmentedMuxer(const SegmentedMuxerConfig& config, const MuxerSetup& setup,
                 SegmentEncoderFactory factory, std::shared_ptr<timing::IClock> clock);

  bool DrivenByVideo() const { return setup_.video.has_value(); }
  void OpenSegment(int64_t start_ns);
  // Closes the active segment; registers it if the worker finished cleanly.
  void CloseActive(std::optional<int64_t> end_ns);
  SegmentInfo ActiveEntry() const;
  void Dispatch(EncodeCommand command, int64_t timestamp_ns);

  SegmentedMuxerConfig config_;
  MuxerSetup setup_;
  SegmentEncoderFactory factory_;
  std::shared_ptr<timing::IClock> clock_;
  std::string extension_;

  mutable std::mutex mutex_;
  SegmentLedger ledger_;
  DiskSpaceMonitor disk_monitor_;
  timing::PauseClock video_clock_;
  timing::PauseClock audio_clock_;
  std::optional<Active> active_;
  uint32_t next_index_ = 1;
  bool finished_ = false;
};

}  // namespace capkit::mux

#endif  // CAPKIT_MUX_SEGMENTED_MUXER_HPP_
