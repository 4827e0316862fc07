// Repository: Capkit-recorder
// Component: PauseClock
// Purpose: Converts raw capture timestamps into continuous, pause-excluded
//          timestamps so a muxer never observes a jump at resume.
// Copyright (c) 2025 Capkit

#ifndef CAPKIT_TIMING_PAUSE_CLOCK_HPP_
#define CAPKIT_TIMING_PAUSE_CLOCK_HPP_

#include <atomic>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>

namespace capkit::timing {

struct PauseState {
  bool paused = false;
  // Raw timestamp of the first frame observed while paused.
  std::optional<int64_t> paused_at_ns;
  // Total paused duration subtracted from raw timestamps.
  int64_t cumulative_offset_ns = 0;
};

// PauseClock is driven by a pause flag that may be shared by every stream of
// a recording (the pipeline flips it; each stream owns its own PauseClock).
//
// Adjust(raw):
//   - flag set: remembers the first raw timestamp seen while paused and
//     returns nullopt; the caller drops the frame.
//   - flag clear after a pause: offset += raw - paused_at.
//   - returns raw - offset.
//
// Throws TimestampInvariantViolation when raw precedes paused_at, when the
// adjusted value would be negative, or when it would be earlier than the
// previously returned value. Nothing is clamped.
class PauseClock {
 public:
  // A null flag gets a private one, driven only through Pause()/Resume().
  explicit PauseClock(std::shared_ptr<std::atomic<bool>> pause_flag = nullptr);

  std::optional<int64_t> Adjust(int64_t raw_ns);

  void Pause();
  void Resume();
  bool IsPaused() const;

  PauseState State() const;

  const std::shared_ptr<std::atomic<bool>>& Flag() const { return flag_; }

 private:
  std::shared_ptr<std::atomic<bool>> flag_;
  mutable std::mutex mutex_;
  std::optional<int64_t> paused_at_ns_;
  int64_t offset_ns_ = 0;
  std::optional<int64_t> last_adjusted_ns_;
};

}  // namespace capkit::timing

#endif  // CAPKIT_TIMING_PAUSE_CLOCK_HPP_
