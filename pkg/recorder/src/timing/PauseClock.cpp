// Repository: Capkit-recorder
// Component: PauseClock
// Purpose: Pause-excluded timestamp adjustment.
// Copyright (c) 2025 Capkit

#include "capkit/timing/PauseClock.hpp"

#include <string>

#include "capkit/util/Errors.hpp"

namespace capkit::timing {

PauseClock::PauseClock(std::shared_ptr<std::atomic<bool>> pause_flag)
    : flag_(pause_flag ? std::move(pause_flag) : std::make_shared<std::atomic<bool>>(false)) {}

std::optional<int64_t> PauseClock::Adjust(int64_t raw_ns) {
  std::lock_guard<std::mutex> lock(mutex_);

  if (flag_->load(std::memory_order_acquire)) {
    if (!paused_at_ns_) {
      paused_at_ns_ = raw_ns;
    }
    return std::nullopt;
  }

  if (paused_at_ns_) {
    const int64_t paused_at = *paused_at_ns_;
    if (raw_ns < paused_at) {
      throw TimestampInvariantViolation(
          "[PauseClock] raw timestamp " + std::to_string(raw_ns) +
          "ns precedes pause start " + std::to_string(paused_at) + "ns");
    }
    offset_ns_ += raw_ns - paused_at;
    paused_at_ns_.reset();
  }

  const int64_t adjusted = raw_ns - offset_ns_;
  if (adjusted < 0) {
    throw TimestampInvariantViolation(
        "[PauseClock] adjusted timestamp is negative: raw=" + std::to_string(raw_ns) +
        "ns offset=" + std::to_string(offset_ns_) + "ns");
  }
  if (last_adjusted_ns_ && adjusted < *last_adjusted_ns_) {
    throw TimestampInvariantViolation(
        "[PauseClock] adjusted timestamp moved backward: " + std::to_string(adjusted) +
        "ns < " + std::to_string(*last_adjusted_ns_) + "ns");
  }
  last_adjusted_ns_ = adjusted;
  return adjusted;
}

void PauseClock::Pause() {
  flag_->store(true, std::memory_order_release);
}

void PauseClock::Resume() {
  flag_->store(false, std::memory_order_release);
}

bool PauseClock::IsPaused() const {
  return flag_->load(std::memory_order_acquire);
}

PauseState PauseClock::State() const {
  std::lock_guard<std::mutex> lock(mutex_);
  PauseState state;
  state.paused = flag_->load(std::memory_order_acquire);
  state.paused_at_ns = paused_at_ns_;
  state.cumulative_offset_ns = offset_ns_;
  return state;
}

}  // namespace capkit::timing
