// Repository: Capkit-recorder
// Component: OutputPipeline Contract Tests
// Purpose: Build validation and rollback, epoch-relative forwarding, first
//          timestamp, ordered shutdown and error reporting.
// Copyright (c) 2025 Capkit

#include <gtest/gtest.h>

#include <atomic>
#include <chrono>
#include <filesystem>
#include <mutex>
#include <thread>

#include "capkit/mux/Manifest.hpp"
#include "capkit/mux/SegmentedMuxer.hpp"
#include "capkit/pipeline/ChannelSources.hpp"
#include "capkit/pipeline/OutputPipeline.hpp"
#include "capkit/pipeline/SyntheticSources.hpp"
#include "capkit/util/Errors.hpp"
#include "support/DeterministicClock.hpp"
#include "support/FakeEncoders.hpp"
#include "support/MediaTestUtils.hpp"
#include "support/RecordingMuxer.hpp"
#include "support/TempDir.hpp"

namespace capkit::tests {
namespace {

using namespace capkit::pipeline;
using timing::kNsPerMs;
using timing::kNsPerSec;

constexpr int64_t kEpochNs = 10 * kNsPerSec;
constexpr int64_t kFrameNs = 33 * kNsPerMs;

// Lets a test reach into a source after the pipeline has taken ownership.
struct SourceSpy {
  std::atomic<int> setup_calls{0};
  std::atomic<int> start_calls{0};
  std::atomic<int> stop_calls{0};
  bool fail_start = false;

  std::mutex mutex;
  VideoChannelPtr video_tx;
  AudioChannelPtr audio_tx;

  VideoChannelPtr VideoTx() {
    std::lock_guard<std::mutex> lock(mutex);
    return video_tx;
  }
  AudioChannelPtr AudioTx() {
    std::lock_guard<std::mutex> lock(mutex);
    return audio_tx;
  }
};

class SpyVideoSource : public IVideoSource {
 public:
  explicit SpyVideoSource(std::shared_ptr<SourceSpy> spy) : spy_(std::move(spy)) {}

  media::VideoInfo Setup(VideoChannelPtr tx) override {
    ++spy_->setup_calls;
    std::lock_guard<std::mutex> lock(spy_->mutex);
    spy_->video_tx = std::move(tx);
    return SmallVideoInfo(30);
  }
  void Start() override {
    ++spy_->start_calls;
    if (spy_->fail_start) throw SetupError("camera unavailable");
  }
  void Stop() override { ++spy_->stop_calls; }

 private:
  std::shared_ptr<SourceSpy> spy_;
};

class SpyAudioSource : public IAudioSource {
 public:
  explicit SpyAudioSource(std::shared_ptr<SourceSpy> spy) : spy_(std::move(spy)) {}

  media::AudioInfo Setup(AudioChannelPtr tx) override {
    ++spy_->setup_calls;
    std::lock_guard<std::mutex> lock(spy_->mutex);
    spy_->audio_tx = std::move(tx);
    return media::MixerOutputInfo();
  }
  void Start() override { ++spy_->start_calls; }
  void Stop() override { ++spy_->stop_calls; }
  std::string Name() const override { return "spy-mic"; }

 private:
  std::shared_ptr<SourceSpy> spy_;
};

class OutputPipelineContractTest : public ::testing::Test {
 protected:
  void SetUp() override {
    spy_ = std::make_shared<SourceSpy>();
    log_ = std::make_shared<MuxerLog>();
    clock_ = std::make_shared<DeterministicClock>(kEpochNs);
  }

  OutputPipelineBuilder VideoBuilder() {
    OutputPipelineBuilder builder(dir_.path());
    builder.WithVideo(std::make_unique<SpyVideoSource>(spy_))
        .WithClock(clock_)
        .WithEpochNs(kEpochNs);
    return builder;
  }

  void PushVideo(int count, int64_t base_ns = kEpochNs) {
    auto tx = spy_->VideoTx();
    ASSERT_NE(tx, nullptr);
    for (int k = 0; k < count; ++k) {
      const int64_t ts = base_ns + k * kFrameNs;
      ASSERT_TRUE(tx->Send(MakeVideoFrame(SmallVideoInfo(30), ts)));
    }
  }

  TempDir dir_{"pipeline"};
  std::shared_ptr<SourceSpy> spy_;
  std::shared_ptr<MuxerLog> log_;
  std::shared_ptr<DeterministicClock> clock_;
};

// =============================================================================
// Build validation
// =============================================================================

TEST_F(OutputPipelineContractTest, BuildWithoutSourcesFails) {
  OutputPipelineBuilder builder(dir_.path());
  EXPECT_THROW(builder.Build(MakeRecordingMuxerFactory(log_)), SetupError);
  EXPECT_FALSE(log_->setup.has_value());
}

TEST_F(OutputPipelineContractTest, RequireAudioWithoutAudioSourceFailsBeforeSetup) {
  auto builder = VideoBuilder();
  builder.RequireAudio();
  EXPECT_THROW(builder.Build(MakeRecordingMuxerFactory(log_)), SetupError);
  EXPECT_EQ(spy_->setup_calls.load(), 0);
  EXPECT_EQ(spy_->start_calls.load(), 0);
}

TEST_F(OutputPipelineContractTest, MissingMuxerFactoryFails) {
  auto builder = VideoBuilder();
  EXPECT_THROW(builder.Build(mux::MuxerFactory()), SetupError);
}

TEST_F(OutputPipelineContractTest, ZeroChannelCapacityFails) {
  OutputPipelineConfig config;
  config.video_channel_capacity = 0;
  auto builder = VideoBuilder();
  builder.WithConfig(config);
  EXPECT_THROW(builder.Build(MakeRecordingMuxerFactory(log_)), SetupError);
}

TEST_F(OutputPipelineContractTest, SourceStartFailureLeavesNoMuxer) {
  spy_->fail_start = true;
  auto builder = VideoBuilder();
  EXPECT_THROW(builder.Build(MakeRecordingMuxerFactory(log_)), SetupError);
  EXPECT_FALSE(log_->setup.has_value());
}

TEST_F(OutputPipelineContractTest, MuxerFailureStopsStartedSources) {
  auto builder = VideoBuilder();
  mux::MuxerFactory failing = [](const mux::MuxerSetup&) -> std::unique_ptr<mux::IMuxer> {
    throw SetupError("disk full");
  };
  EXPECT_THROW(builder.Build(failing), SetupError);
  EXPECT_EQ(spy_->start_calls.load(), 1);
  EXPECT_EQ(spy_->stop_calls.load(), 1);
  EXPECT_TRUE(spy_->VideoTx()->IsClosed());
}

TEST_F(OutputPipelineContractTest, MuxerSetupDescribesStreams) {
  auto audio_spy = std::make_shared<SourceSpy>();
  auto builder = VideoBuilder();
  builder.WithAudioSource(std::make_unique<SpyAudioSource>(audio_spy));
  auto pipeline = builder.Build(MakeRecordingMuxerFactory(log_));

  ASSERT_TRUE(log_->setup.has_value());
  EXPECT_EQ(log_->setup->output_path, dir_.path());
  ASSERT_TRUE(log_->setup->video.has_value());
  EXPECT_EQ(log_->setup->video->width, 16);
  ASSERT_TRUE(log_->setup->audio.has_value());
  EXPECT_EQ(*log_->setup->audio, media::MixerOutputInfo());
  EXPECT_NE(log_->setup->pause_flag, nullptr);
  EXPECT_TRUE(pipeline->HasAudio());
  EXPECT_EQ(pipeline->EpochNs(), kEpochNs);
  pipeline->Stop();
  EXPECT_EQ(audio_spy->stop_calls.load(), 1);
}

// =============================================================================
// Forwarding
// =============================================================================

TEST_F(OutputPipelineContractTest, VideoReachesMuxerRelativeToEpoch) {
  auto pipeline = VideoBuilder().Build(MakeRecordingMuxerFactory(log_));
  PushVideo(20);
  auto result = pipeline->Stop();

  EXPECT_EQ(result.video_frames, 20u);
  EXPECT_TRUE(result.errors.empty());
  auto timestamps = log_->VideoTimestamps();
  ASSERT_EQ(timestamps.size(), 20u);
  for (size_t k = 0; k < timestamps.size(); ++k) {
    EXPECT_EQ(timestamps[k], static_cast<int64_t>(k) * kFrameNs);
  }
  EXPECT_EQ(log_->FinishCalls(), 1);
  EXPECT_EQ(log_->sends_after_finish, 0);
}

TEST_F(OutputPipelineContractTest, FirstTimestampIsTheFirstCaptureInstant) {
  auto pipeline = VideoBuilder().Build(MakeRecordingMuxerFactory(log_));
  auto first = pipeline->FirstTimestamp();
  PushVideo(3, kEpochNs + 250 * kNsPerMs);

  ASSERT_EQ(first.wait_for(std::chrono::seconds(5)), std::future_status::ready);
  EXPECT_EQ(first.get(), kEpochNs + 250 * kNsPerMs);
  auto result = pipeline->Stop();
  EXPECT_EQ(result.first_timestamp_ns, kEpochNs + 250 * kNsPerMs);
}

TEST_F(OutputPipelineContractTest, FirstTimestampFailsWhenNothingWasForwarded) {
  auto pipeline = VideoBuilder().Build(MakeRecordingMuxerFactory(log_));
  auto result = pipeline->Stop();
  EXPECT_FALSE(result.first_timestamp_ns.has_value());
  EXPECT_THROW(pipeline->FirstTimestamp().get(), StreamError);
  EXPECT_EQ(log_->FinishCalls(), 1);
}

TEST_F(OutputPipelineContractTest, FramesBeforeEpochLandOnZero) {
  auto pipeline = VideoBuilder().Build(MakeRecordingMuxerFactory(log_));
  PushVideo(2, kEpochNs - 100 * kNsPerMs);
  pipeline->Stop();
  auto timestamps = log_->VideoTimestamps();
  ASSERT_EQ(timestamps.size(), 2u);
  EXPECT_EQ(timestamps[0], 0);
  EXPECT_EQ(timestamps[1], 0);
}

TEST_F(OutputPipelineContractTest, EpochDefaultsToClockAtBuild) {
  clock_->SetNs(42 * kNsPerSec);
  OutputPipelineBuilder builder(dir_.path());
  builder.WithVideo(std::make_unique<SpyVideoSource>(spy_)).WithClock(clock_);
  auto pipeline = builder.Build(MakeRecordingMuxerFactory(log_));
  EXPECT_EQ(pipeline->EpochNs(), 42 * kNsPerSec);
}

TEST_F(OutputPipelineContractTest, AudioIsMixedAndStampedFromEpoch) {
  auto system_clock = timing::MakeSystemClock();
  const int64_t epoch = system_clock->NowNs();
  auto audio_spy = std::make_shared<SourceSpy>();

  OutputPipelineBuilder builder(dir_.path());
  builder.WithAudioSource(std::make_unique<SpyAudioSource>(audio_spy))
      .WithClock(system_clock)
      .WithEpochNs(epoch);
  auto pipeline = builder.Build(MakeRecordingMuxerFactory(log_));
  EXPECT_FALSE(pipeline->VideoInfo().has_value());

  auto tx = audio_spy->AudioTx();
  for (int k = 0; k < 50; ++k) {
    ASSERT_TRUE(tx->Send(MakeMixerFrame(480, epoch + k * 10 * kNsPerMs, 0.25f)));
  }
  auto result = pipeline->Stop();

  EXPECT_TRUE(result.errors.empty());
  EXPECT_EQ(result.first_timestamp_ns, epoch);
  auto timestamps = log_->AudioTimestamps();
  ASSERT_FALSE(timestamps.empty());
  EXPECT_EQ(timestamps.front(), 0);
  for (size_t i = 1; i < timestamps.size(); ++i) {
    EXPECT_GT(timestamps[i], timestamps[i - 1]);
  }
  std::lock_guard<std::mutex> lock(log_->mutex);
  EXPECT_GE(log_->audio_samples, 24000);
  EXPECT_EQ(result.audio_frames, timestamps.size());
}

TEST_F(OutputPipelineContractTest, ChannelVideoSourceRelaysExternalFrames) {
  auto external = util::MakeChannel<media::VideoFrame>(32);
  auto source = std::make_unique<ChannelVideoSource>(SmallVideoInfo(30), external);
  ChannelVideoSource* relay = source.get();

  OutputPipelineBuilder builder(dir_.path());
  builder.WithVideo(std::move(source)).WithClock(clock_).WithEpochNs(kEpochNs);
  auto pipeline = builder.Build(MakeRecordingMuxerFactory(log_));

  for (int k = 0; k < 10; ++k) {
    external->Send(MakeVideoFrame(SmallVideoInfo(30), kEpochNs + k * kFrameNs));
  }
  const auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(5);
  while (relay->FramesRelayed() < 10 && std::chrono::steady_clock::now() < deadline) {
    std::this_thread::sleep_for(std::chrono::milliseconds(2));
  }
  ASSERT_EQ(relay->FramesRelayed(), 10u);

  auto result = pipeline->Stop();
  EXPECT_EQ(result.video_frames, 10u);
}

// =============================================================================
// Pause
// =============================================================================

TEST_F(OutputPipelineContractTest, PauseAndResumeDriveTheMuxerFlag) {
  auto pipeline = VideoBuilder().Build(MakeRecordingMuxerFactory(log_));
  auto flag = log_->setup->pause_flag;
  ASSERT_NE(flag, nullptr);

  pipeline->Pause();
  EXPECT_TRUE(pipeline->IsPaused());
  EXPECT_TRUE(flag->load());
  pipeline->Pause();
  EXPECT_TRUE(flag->load());

  pipeline->Resume();
  EXPECT_FALSE(pipeline->IsPaused());
  EXPECT_FALSE(flag->load());
}

// =============================================================================
// Shutdown and errors
// =============================================================================

TEST_F(OutputPipelineContractTest, StopIsIdempotent) {
  auto pipeline = VideoBuilder().Build(MakeRecordingMuxerFactory(log_));
  PushVideo(5);
  auto first = pipeline->Stop();
  auto second = pipeline->Stop();
  EXPECT_EQ(first.video_frames, second.video_frames);
  EXPECT_EQ(log_->FinishCalls(), 1);
  EXPECT_EQ(spy_->stop_calls.load(), 1);
  pipeline.reset();
  EXPECT_EQ(log_->FinishCalls(), 1);
}

TEST_F(OutputPipelineContractTest, DestructorStopsAndFinishes) {
  {
    auto pipeline = VideoBuilder().Build(MakeRecordingMuxerFactory(log_));
    PushVideo(3);
  }
  EXPECT_EQ(log_->FinishCalls(), 1);
  EXPECT_EQ(log_->VideoTimestamps().size(), 3u);
}

TEST_F(OutputPipelineContractTest, StreamErrorEndsForwardingButShutdownCompletes) {
  log_->on_video = [](int64_t ts) {
    if (ts >= 2 * kFrameNs) throw StreamError("encoder exploded");
  };
  auto pipeline = VideoBuilder().Build(MakeRecordingMuxerFactory(log_));
  PushVideo(5);
  auto result = pipeline->Stop();

  EXPECT_EQ(result.video_frames, 2u);
  ASSERT_EQ(result.errors.size(), 1u);
  EXPECT_NE(result.errors[0].find("video"), std::string::npos);
  EXPECT_NE(result.errors[0].find("encoder exploded"), std::string::npos);
  EXPECT_EQ(log_->FinishCalls(), 1);
}

TEST_F(OutputPipelineContractTest, TimestampViolationIsRethrownAfterShutdown) {
  log_->on_video = [](int64_t ts) {
    if (ts >= kFrameNs) throw TimestampInvariantViolation("clock went backwards");
  };
  auto pipeline = VideoBuilder().Build(MakeRecordingMuxerFactory(log_));
  PushVideo(3);

  EXPECT_THROW(pipeline->Stop(), TimestampInvariantViolation);
  EXPECT_EQ(log_->FinishCalls(), 1);
  EXPECT_EQ(spy_->stop_calls.load(), 1);

  // Later calls report the result without rethrowing.
  auto result = pipeline->Stop();
  EXPECT_EQ(result.video_frames, 1u);
}

// =============================================================================
// End to end with synthetic sources and the segment-owning muxer
// =============================================================================

TEST(OutputPipelineEndToEndTest, SyntheticSourcesProduceACompleteRecording) {
  TempDir dir("pipeline_e2e");
  auto clock = timing::MakeSystemClock();
  auto control = std::make_shared<FakeEncoderControl>();

  TestPatternConfig pattern;
  pattern.width = 32;
  pattern.height = 16;
  SineToneConfig tone;
  tone.channels = 1;

  mux::SegmentedMuxerConfig muxer_config;
  muxer_config.segment_duration_ns = 200 * kNsPerMs;
  muxer_config.check_disk_space = false;
  mux::MuxerFactory factory = [&](const mux::MuxerSetup& setup) -> std::unique_ptr<mux::IMuxer> {
    return mux::SegmentedMuxer::Setup(muxer_config, setup, MakeFakeSegmentEncoderFactory(control),
                                      clock);
  };

  OutputPipelineBuilder builder(dir.path());
  builder.WithVideo(std::make_unique<TestPatternVideoSource>(pattern, clock))
      .WithAudioSource(std::make_unique<SineToneAudioSource>(tone, clock))
      .WithClock(clock);
  auto pipeline = builder.Build(factory);

  std::this_thread::sleep_for(std::chrono::milliseconds(700));
  auto result = pipeline->Stop();

  EXPECT_TRUE(result.errors.empty());
  EXPECT_GT(result.video_frames, 5u);
  EXPECT_GT(result.audio_frames, 5u);
  ASSERT_TRUE(result.first_timestamp_ns.has_value());

  mux::Manifest manifest;
  std::string error;
  ASSERT_TRUE(mux::ReadManifestFile(dir / mux::kManifestFileName, &manifest, &error)) << error;
  EXPECT_TRUE(manifest.is_complete);
  EXPECT_EQ(manifest.type, mux::kManifestTypeVideoSegments);
  EXPECT_GE(manifest.segments.size(), 2u);
  for (const auto& segment : manifest.segments) {
    EXPECT_TRUE(std::filesystem::exists(dir / segment.path)) << segment.path;
  }
}

}  // namespace
}  // namespace capkit::tests
