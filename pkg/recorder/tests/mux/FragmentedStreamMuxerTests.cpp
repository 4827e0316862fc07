// Repository: Capkit-recorder
// Component: FragmentedStreamMuxer Tests
// Purpose: Segment detection over a fragmenting encoder, last-segment
//          duration at Finish, init segment validation.
// Copyright (c) 2025 Capkit

#include <gtest/gtest.h>

#include <filesystem>

#include "capkit/mux/FragmentedStreamMuxer.hpp"
#include "capkit/util/Errors.hpp"
#include "support/DeterministicClock.hpp"
#include "support/FakeEncoders.hpp"
#include "support/MediaTestUtils.hpp"
#include "support/TempDir.hpp"

namespace capkit::tests {
namespace {

namespace fs = std::filesystem;
using namespace capkit::mux;
using timing::kNsPerSec;

int64_t FrameTs(int64_t k) {
  return k * kNsPerSec / 30;
}

class FragmentedStreamMuxerTest : public ::testing::Test {
 protected:
  void SetUp() override {
    control_ = std::make_shared<FakeEncoderControl>();
    setup_.output_path = dir_.path();
    setup_.video = SmallVideoInfo(30);
    config_.segment_duration_ns = kNsPerSec;
    config_.check_disk_space = false;
  }

  std::unique_ptr<FragmentedStreamMuxer> MakeMuxer() {
    return FragmentedStreamMuxer::Setup(config_, setup_,
                                        std::make_unique<FakeFragmentingEncoder>(control_),
                                        std::make_shared<DeterministicClock>(0));
  }

  void SendFrames(FragmentedStreamMuxer& muxer, int64_t from, int64_t to) {
    for (int64_t k = from; k < to; ++k) {
      muxer.SendVideoFrame(MakeVideoFrame(*setup_.video, FrameTs(k)), FrameTs(k));
    }
  }

  Manifest ReadManifest(const FragmentedStreamMuxer& muxer) {
    Manifest m;
    std::string error;
    EXPECT_TRUE(ReadManifestFile(muxer.ManifestPath(), &m, &error)) << error;
    return m;
  }

  TempDir dir_{"fragmented"};
  std::shared_ptr<FakeEncoderControl> control_;
  MuxerSetup setup_;
  FragmentedMuxerConfig config_;
};

TEST_F(FragmentedStreamMuxerTest, SetupFailsWhenEncoderCannotOpen) {
  control_->fail_open = true;
  EXPECT_THROW(MakeMuxer(), SetupError);
}

TEST_F(FragmentedStreamMuxerTest, SetupWritesInProgressManifest) {
  auto muxer = MakeMuxer();
  Manifest m = ReadManifest(*muxer);
  EXPECT_FALSE(m.is_complete);
  EXPECT_EQ(m.type, kManifestTypeFragmented);
  EXPECT_EQ(m.init_segment, "init.mp4");
  EXPECT_TRUE(m.segments.empty());
  EXPECT_EQ(muxer->InitSegmentPath(), dir_ / "init.mp4");
}

// =============================================================================
// Detection
// =============================================================================

TEST_F(FragmentedStreamMuxerTest, CompletedFragmentsAreDetectedWhileRecording) {
  auto muxer = MakeMuxer();
  SendFrames(*muxer, 0, 78);  // through 2.57 s

  auto segments = muxer->CompletedSegments();
  ASSERT_EQ(segments.size(), 2u);
  EXPECT_EQ(segments[0].index, 1u);
  EXPECT_EQ(segments[1].index, 2u);
  EXPECT_EQ(segments[0].duration_ns, kNsPerSec);
  EXPECT_TRUE(segments[0].file_size.has_value());

  Manifest m = ReadManifest(*muxer);
  EXPECT_FALSE(m.is_complete);
  ASSERT_EQ(m.segments.size(), 3u);
  EXPECT_EQ(m.segments[2].path, "segment_003.m4s");
  EXPECT_FALSE(m.segments[2].is_complete);
}

TEST_F(FragmentedStreamMuxerTest, FinishGivesLastSegmentItsMediaDuration) {
  auto muxer = MakeMuxer();
  SendFrames(*muxer, 0, 105);  // 3.5 s
  muxer->Finish();

  auto segments = muxer->CompletedSegments();
  ASSERT_EQ(segments.size(), 4u);
  EXPECT_EQ(segments[3].index, 4u);
  EXPECT_EQ(segments[3].duration_ns, 499'999'999);

  Manifest m = ReadManifest(*muxer);
  EXPECT_TRUE(m.is_complete);
  ASSERT_EQ(m.segments.size(), 4u);
  for (const auto& s : m.segments) EXPECT_TRUE(s.is_complete);
  ASSERT_TRUE(m.total_duration.has_value());
  EXPECT_NEAR(*m.total_duration, 3.5, 1e-6);
  EXPECT_EQ(control_->finished.load(), 1);
}

TEST_F(FragmentedStreamMuxerTest, LastFragmentLeftAsTmpIsFinalized) {
  control_->leave_last_tmp = true;
  auto muxer = MakeMuxer();
  SendFrames(*muxer, 0, 105);
  muxer->Finish();

  EXPECT_TRUE(fs::exists(dir_ / "segment_004.m4s"));
  EXPECT_FALSE(fs::exists(dir_ / "segment_004.m4s.tmp"));
  auto segments = muxer->CompletedSegments();
  ASSERT_EQ(segments.size(), 4u);
  EXPECT_EQ(segments[3].duration_ns, 499'999'999);
}

TEST_F(FragmentedStreamMuxerTest, PausedTimeIsExcluded) {
  setup_.pause_flag = std::make_shared<std::atomic<bool>>(false);
  auto muxer = MakeMuxer();
  for (int64_t k = 0; k < 75; ++k) {
    if (k == 15) setup_.pause_flag->store(true);
    if (k == 45) setup_.pause_flag->store(false);
    muxer->SendVideoFrame(MakeVideoFrame(*setup_.video, FrameTs(k)), FrameTs(k));
  }
  muxer->Finish();

  // 2.5 s captured, 1 s of it paused.
  Manifest m = ReadManifest(*muxer);
  ASSERT_EQ(m.segments.size(), 2u);
  EXPECT_NEAR(*m.total_duration, 1.5, 1e-6);
}

TEST_F(FragmentedStreamMuxerTest, AudioOnlyStreamDrivesDetection) {
  setup_.video.reset();
  setup_.audio = media::MixerOutputInfo();
  auto muxer = MakeMuxer();
  for (int k = 0; k < 100; ++k) {
    const int64_t ts = media::SamplesToNs(int64_t{k} * 1024, media::kMixerSampleRate);
    muxer->SendAudioFrame(MakeMixerFrame(1024, ts, 0.1f), ts);
  }
  EXPECT_EQ(muxer->CompletedSegments().size(), 2u);
  muxer->Finish();
  EXPECT_EQ(muxer->CompletedSegments().size(), 3u);
}

// =============================================================================
// Init segment and failures
// =============================================================================

TEST_F(FragmentedStreamMuxerTest, MissingInitSegmentIsReported) {
  control_->skip_init = true;
  auto muxer = MakeMuxer();
  std::string error;
  EXPECT_FALSE(muxer->ValidateInitSegment(&error));
  EXPECT_NE(error.find("missing"), std::string::npos) << error;

  SendFrames(*muxer, 0, 40);
  muxer->Finish();
  // Segments and manifest are still written.
  EXPECT_TRUE(ReadManifest(*muxer).is_complete);
  EXPECT_EQ(muxer->CompletedSegments().size(), 2u);
}

TEST_F(FragmentedStreamMuxerTest, UndersizedInitSegmentIsRejected) {
  auto muxer = MakeMuxer();
  WriteFileOfSize(dir_ / "init.mp4", 10);
  std::string error;
  EXPECT_FALSE(muxer->ValidateInitSegment(&error));
  EXPECT_NE(error.find("too small"), std::string::npos) << error;
}

TEST_F(FragmentedStreamMuxerTest, WriteFailureIsStickyButFinishStillCompletes) {
  control_->fail_write_at = 35;
  auto muxer = MakeMuxer();
  SendFrames(*muxer, 0, 35);
  EXPECT_THROW(SendFrames(*muxer, 35, 36), StreamError);
  EXPECT_THROW(SendFrames(*muxer, 36, 37), StreamError);

  muxer->Finish();
  Manifest m = ReadManifest(*muxer);
  EXPECT_TRUE(m.is_complete);
  EXPECT_EQ(m.segments.size(), 2u);
}

TEST_F(FragmentedStreamMuxerTest, StraySegmentZeroIsAdoptedWithNominalDuration) {
  control_->fail_write_at = 0;
  auto muxer = MakeMuxer();
  WriteFileOfSize(dir_ / "segment_000.m4s", 1000);
  EXPECT_THROW(SendFrames(*muxer, 0, 1), StreamError);

  muxer->Finish();
  Manifest m = ReadManifest(*muxer);
  ASSERT_EQ(m.segments.size(), 1u);
  EXPECT_EQ(m.segments[0].index, 0u);
  EXPECT_DOUBLE_EQ(m.segments[0].duration, 1.0);
  ASSERT_TRUE(m.total_duration.has_value());
  EXPECT_DOUBLE_EQ(*m.total_duration, 1.0);
}

TEST_F(FragmentedStreamMuxerTest, FinishIsIdempotent) {
  auto muxer = MakeMuxer();
  SendFrames(*muxer, 0, 40);
  muxer->Finish();
  const std::string first = ReadWholeFile(muxer->ManifestPath());
  muxer->Finish();
  SendFrames(*muxer, 40, 80);
  EXPECT_EQ(ReadWholeFile(muxer->ManifestPath()), first);
  EXPECT_EQ(control_->finished.load(), 1);
}

}  // namespace
}  // namespace capkit::tests
