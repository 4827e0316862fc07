// Repository: Capkit-recorder
// Component: PauseClock Tests
// Purpose: Pause-excluded timestamps stay continuous across pause/resume
//          and violations are raised, never clamped.
// Copyright (c) 2025 Capkit

#include <gtest/gtest.h>

#include <atomic>
#include <memory>
#include <vector>

#include "capkit/timing/Clock.hpp"
#include "capkit/timing/PauseClock.hpp"
#include "capkit/util/Errors.hpp"

namespace capkit::tests {
namespace {

using timing::kNsPerMs;
using timing::PauseClock;

constexpr int64_t kStepNs = 10 * kNsPerMs;

TEST(PauseClockTest, PassesThroughWhenNeverPaused) {
  PauseClock clock;
  for (int64_t raw = 0; raw < 100 * kStepNs; raw += kStepNs) {
    auto adjusted = clock.Adjust(raw);
    ASSERT_TRUE(adjusted.has_value());
    EXPECT_EQ(*adjusted, raw);
  }
  EXPECT_EQ(clock.State().cumulative_offset_ns, 0);
}

// =============================================================================
// Pause window excluded
// =============================================================================

TEST(PauseClockTest, PauseWindowIsRemovedWithoutDiscontinuity) {
  PauseClock clock;
  std::vector<int64_t> out;
  int dropped = 0;

  // Frames every 10 ms for 3 s; paused from 1.0 s to 1.5 s.
  for (int64_t raw = 0; raw < 3000 * kNsPerMs; raw += kStepNs) {
    if (raw == 1000 * kNsPerMs) clock.Pause();
    if (raw == 1500 * kNsPerMs) clock.Resume();
    auto adjusted = clock.Adjust(raw);
    if (!adjusted) {
      ++dropped;
      continue;
    }
    out.push_back(*adjusted);
  }

  EXPECT_EQ(dropped, 50);
  ASSERT_EQ(out.size(), 250u);
  for (size_t i = 1; i < out.size(); ++i) {
    EXPECT_EQ(out[i] - out[i - 1], kStepNs) << "at output " << i;
  }
  EXPECT_EQ(out.back(), 2990 * kNsPerMs - 500 * kNsPerMs);
  EXPECT_EQ(clock.State().cumulative_offset_ns, 500 * kNsPerMs);
}

TEST(PauseClockTest, OffsetsAccumulateAcrossPauses) {
  PauseClock clock;
  clock.Adjust(0);

  clock.Pause();
  EXPECT_FALSE(clock.Adjust(100 * kNsPerMs).has_value());
  clock.Resume();
  EXPECT_EQ(clock.Adjust(300 * kNsPerMs), 100 * kNsPerMs);

  clock.Pause();
  EXPECT_FALSE(clock.Adjust(400 * kNsPerMs).has_value());
  EXPECT_FALSE(clock.Adjust(450 * kNsPerMs).has_value());
  clock.Resume();
  EXPECT_EQ(clock.Adjust(700 * kNsPerMs), 200 * kNsPerMs);

  EXPECT_EQ(clock.State().cumulative_offset_ns, 500 * kNsPerMs);
}

TEST(PauseClockTest, StateReportsPauseStart) {
  PauseClock clock;
  clock.Adjust(0);
  clock.Pause();
  clock.Adjust(50 * kNsPerMs);
  clock.Adjust(60 * kNsPerMs);

  auto state = clock.State();
  EXPECT_TRUE(state.paused);
  ASSERT_TRUE(state.paused_at_ns.has_value());
  EXPECT_EQ(*state.paused_at_ns, 50 * kNsPerMs);
}

TEST(PauseClockTest, StreamsSharingAFlagPauseTogether) {
  auto flag = std::make_shared<std::atomic<bool>>(false);
  PauseClock video(flag);
  PauseClock audio(flag);

  video.Adjust(0);
  audio.Adjust(0);
  flag->store(true);
  EXPECT_TRUE(video.IsPaused());
  EXPECT_TRUE(audio.IsPaused());
  EXPECT_FALSE(video.Adjust(100 * kNsPerMs).has_value());
  EXPECT_FALSE(audio.Adjust(105 * kNsPerMs).has_value());
  flag->store(false);

  // Each stream measures the pause from its own first paused frame.
  EXPECT_EQ(video.Adjust(400 * kNsPerMs), 100 * kNsPerMs);
  EXPECT_EQ(audio.Adjust(405 * kNsPerMs), 105 * kNsPerMs);
}

// =============================================================================
// Violations
// =============================================================================

TEST(PauseClockTest, RegressionThrows) {
  PauseClock clock;
  clock.Adjust(100 * kNsPerMs);
  EXPECT_THROW(clock.Adjust(50 * kNsPerMs), TimestampInvariantViolation);
}

TEST(PauseClockTest, RawBeforePauseStartThrows) {
  PauseClock clock;
  clock.Adjust(0);
  clock.Pause();
  clock.Adjust(200 * kNsPerMs);
  clock.Resume();
  EXPECT_THROW(clock.Adjust(150 * kNsPerMs), TimestampInvariantViolation);
}

TEST(PauseClockTest, NegativeAdjustedThrows) {
  PauseClock clock;
  EXPECT_THROW(clock.Adjust(-1), TimestampInvariantViolation);
}

TEST(PauseClockTest, EqualTimestampsAreAllowed) {
  PauseClock clock;
  EXPECT_EQ(clock.Adjust(5), 5);
  EXPECT_EQ(clock.Adjust(5), 5);
}

}  // namespace
}  // namespace capkit::tests
