// Repository: Capkit-recorder
// Component: SegmentLedger Recovery Tests
// Purpose: Pending .tmp finalization, orphan adoption and manifest
//          bookkeeping after an interrupted recording.
// Copyright (c) 2025 Capkit

#include <gtest/gtest.h>

#include <filesystem>
#include <string>
#include <vector>

#include "capkit/mux/SegmentLedger.hpp"
#include "capkit/timing/Clock.hpp"
#include "capkit/util/Logger.hpp"
#include "support/TempDir.hpp"

namespace capkit::tests {
namespace {

namespace fs = std::filesystem;
using namespace capkit::mux;
using timing::kNsPerSec;

constexpr int64_t kNominalNs = 3 * kNsPerSec;

TEST(SegmentFileNameTest, ZeroPadsToThreeDigits) {
  EXPECT_EQ(SegmentFileName(1, ".mp4"), "segment_001.mp4");
  EXPECT_EQ(SegmentFileName(42, ".m4s"), "segment_042.m4s");
  EXPECT_EQ(SegmentFileName(1234, ".m4a"), "segment_1234.m4a");
}

TEST(SegmentFileNameTest, ParseAcceptsOnlyMatchingNames) {
  EXPECT_EQ(ParseSegmentIndex("segment_007.mp4", ".mp4"), 7u);
  EXPECT_EQ(ParseSegmentIndex("segment_1234.mp4", ".mp4"), 1234u);
  EXPECT_FALSE(ParseSegmentIndex("segment_007.mp4.tmp", ".mp4").has_value());
  EXPECT_FALSE(ParseSegmentIndex("segment_007.m4a", ".mp4").has_value());
  EXPECT_FALSE(ParseSegmentIndex("segment_.mp4", ".mp4").has_value());
  EXPECT_FALSE(ParseSegmentIndex("segment_0x7.mp4", ".mp4").has_value());
  EXPECT_FALSE(ParseSegmentIndex("init.mp4", ".mp4").has_value());
  EXPECT_EQ(ParseSegmentIndex("segment_007.mp4.tmp", ".mp4.tmp"), 7u);
}

class SegmentLedgerRecoveryTest : public ::testing::Test {
 protected:
  SegmentInfo Completed(uint32_t index, int64_t duration_ns) {
    const fs::path path = dir_ / SegmentFileName(index, ".mp4");
    WriteFileOfSize(path, 4096);
    SegmentInfo info;
    info.path = path;
    info.index = index;
    info.duration_ns = duration_ns;
    info.file_size = 4096;
    return info;
  }

  Manifest ReadManifest() {
    Manifest m;
    std::string error;
    EXPECT_TRUE(ReadManifestFile(ledger_.ManifestPath(), &m, &error)) << error;
    return m;
  }

  TempDir dir_{"ledger"};
  SegmentLedger ledger_{dir_.path(), kManifestTypeVideoSegments, ".mp4", kNominalNs};
};

TEST_F(SegmentLedgerRecoveryTest, CompletedStaysSortedAndUnique) {
  ledger_.AddCompleted(Completed(2, kNominalNs));
  ledger_.AddCompleted(Completed(1, kNominalNs));
  ledger_.AddCompleted(Completed(2, 1));
  ASSERT_EQ(ledger_.Completed().size(), 2u);
  EXPECT_EQ(ledger_.Completed()[0].index, 1u);
  EXPECT_EQ(ledger_.Completed()[1].duration_ns, kNominalNs);
  EXPECT_EQ(ledger_.TotalDurationNs(), 2 * kNominalNs);
}

// =============================================================================
// Pending .tmp files
// =============================================================================

TEST_F(SegmentLedgerRecoveryTest, PendingTmpFilesAreRenamed) {
  WriteFileOfSize(dir_ / "segment_003.mp4.tmp", 2048);
  WriteFileOfSize(dir_ / "segment_004.mp4.tmp", 0);
  WriteFileOfSize(dir_ / "manifest.json.tmp", 50);

  EXPECT_EQ(ledger_.FinalizePendingTmpFiles(), 1u);
  EXPECT_TRUE(fs::exists(dir_ / "segment_003.mp4"));
  EXPECT_FALSE(fs::exists(dir_ / "segment_003.mp4.tmp"));
  // Empty tmp files and unrelated files are left alone.
  EXPECT_TRUE(fs::exists(dir_ / "segment_004.mp4.tmp"));
  EXPECT_TRUE(fs::exists(dir_ / "manifest.json.tmp"));
}

// =============================================================================
// Orphan adoption
// =============================================================================

TEST_F(SegmentLedgerRecoveryTest, OrphansAreAdoptedInIndexOrder) {
  ledger_.AddCompleted(Completed(1, kNominalNs));
  WriteFileOfSize(dir_ / "segment_003.mp4", 1000);
  WriteFileOfSize(dir_ / "segment_002.mp4", 1000);

  auto adopted = ledger_.CollectOrphanedSegments(std::nullopt);
  ASSERT_EQ(adopted.size(), 2u);
  EXPECT_EQ(adopted[0].index, 2u);
  EXPECT_EQ(adopted[1].index, 3u);
  EXPECT_EQ(adopted[0].duration_ns, kNominalNs);
  EXPECT_EQ(adopted[0].file_size, 1000u);

  ASSERT_EQ(ledger_.Completed().size(), 3u);
  EXPECT_EQ(ledger_.TotalDurationNs(), 3 * kNominalNs);
  EXPECT_TRUE(ledger_.CollectOrphanedSegments(std::nullopt).empty());
}

TEST_F(SegmentLedgerRecoveryTest, TinyOrphansAreSkipped) {
  WriteFileOfSize(dir_ / "segment_001.mp4", kMinViableSegmentBytes - 1);
  WriteFileOfSize(dir_ / "segment_002.mp4", kMinViableSegmentBytes);

  std::vector<std::string> warnings;
  util::Logger::SetWarnSink([&warnings](const std::string& line) { warnings.push_back(line); });
  auto adopted = ledger_.CollectOrphanedSegments(std::nullopt);
  util::Logger::SetWarnSink(nullptr);

  ASSERT_EQ(adopted.size(), 1u);
  EXPECT_EQ(adopted[0].index, 2u);
  EXPECT_FALSE(ledger_.Contains(1));
  // Skipped, not thrown.
  ASSERT_EQ(warnings.size(), 1u);
  EXPECT_NE(warnings[0].find("segment_001.mp4"), std::string::npos);
}

TEST_F(SegmentLedgerRecoveryTest, ActiveOrphanGetsElapsedDuration) {
  WriteFileOfSize(dir_ / "segment_001.mp4", 1000);
  WriteFileOfSize(dir_ / "segment_002.mp4", 1000);

  auto adopted = ledger_.CollectOrphanedSegments(ActiveSegment{2, 1'250'000'000});
  ASSERT_EQ(adopted.size(), 2u);
  EXPECT_EQ(adopted[0].duration_ns, kNominalNs);
  EXPECT_EQ(adopted[1].duration_ns, 1'250'000'000);
}

TEST_F(SegmentLedgerRecoveryTest, ActiveOrphanWithoutElapsedFallsBackToNominal) {
  WriteFileOfSize(dir_ / "segment_001.mp4", 1000);
  auto adopted = ledger_.CollectOrphanedSegments(ActiveSegment{1, 0});
  ASSERT_EQ(adopted.size(), 1u);
  EXPECT_EQ(adopted[0].duration_ns, kNominalNs);
}

TEST_F(SegmentLedgerRecoveryTest, InterruptedRecordingIsRecoveredEndToEnd) {
  // Segment 1 finished, segment 2 was still a .tmp when the process died.
  ledger_.AddCompleted(Completed(1, kNominalNs));
  WriteFileOfSize(dir_ / "segment_002.mp4.tmp", 5000);

  EXPECT_EQ(ledger_.FinalizePendingTmpFiles(), 1u);
  ledger_.CollectOrphanedSegments(ActiveSegment{2, 2 * kNsPerSec});
  ASSERT_TRUE(ledger_.WriteFinalManifest());

  Manifest m = ReadManifest();
  EXPECT_TRUE(m.is_complete);
  EXPECT_EQ(m.type, kManifestTypeVideoSegments);
  ASSERT_EQ(m.segments.size(), 2u);
  EXPECT_EQ(m.segments[1].path, "segment_002.mp4");
  EXPECT_DOUBLE_EQ(m.segments[1].duration, 2.0);
  EXPECT_EQ(m.segments[1].file_size, 5000u);
  ASSERT_TRUE(m.total_duration.has_value());
  EXPECT_DOUBLE_EQ(*m.total_duration, 5.0);
}

TEST_F(SegmentLedgerRecoveryTest, SeededEntriesAreNotReadopted) {
  Completed(1, kNominalNs);
  Completed(2, kNominalNs);
  WriteFileOfSize(dir_ / "segment_003.mp4", 1000);

  Manifest previous;
  previous.type = kManifestTypeVideoSegments;
  ManifestSegment first;
  first.path = "segment_001.mp4";
  first.index = 1;
  first.duration = 3.0;
  first.is_complete = true;
  first.file_size = 4096;
  ManifestSegment second = first;
  second.path = "segment_002.mp4";
  second.index = 2;
  second.duration = 0.5;
  ManifestSegment open;
  open.path = "segment_003.mp4";
  open.index = 3;
  previous.segments = {first, second, open};

  EXPECT_EQ(ledger_.SeedFromManifest(previous), 2u);
  EXPECT_EQ(ledger_.Completed()[1].duration_ns, kNsPerSec / 2);

  auto adopted = ledger_.CollectOrphanedSegments(std::nullopt);
  ASSERT_EQ(adopted.size(), 1u);
  EXPECT_EQ(adopted[0].index, 3u);
  EXPECT_EQ(ledger_.TotalDurationNs(), timing::SecondsToNs(3.0) + kNsPerSec / 2 + kNominalNs);
}

// =============================================================================
// Manifest writes
// =============================================================================

TEST_F(SegmentLedgerRecoveryTest, InProgressManifestListsCurrentSegment) {
  ledger_.AddCompleted(Completed(1, kNominalNs));
  SegmentInfo current;
  current.path = dir_ / "segment_002.mp4";
  current.index = 2;
  current.is_complete = false;
  ASSERT_TRUE(ledger_.WriteInProgressManifest(current));

  Manifest m = ReadManifest();
  EXPECT_FALSE(m.is_complete);
  ASSERT_EQ(m.segments.size(), 2u);
  EXPECT_TRUE(m.segments[0].is_complete);
  EXPECT_FALSE(m.segments[1].is_complete);
  EXPECT_DOUBLE_EQ(m.segments[1].duration, 0.0);
  EXPECT_DOUBLE_EQ(*m.total_duration, 3.0);
}

TEST_F(SegmentLedgerRecoveryTest, FinalManifestIsWrittenOnce) {
  ledger_.AddCompleted(Completed(1, kNominalNs));
  ASSERT_TRUE(ledger_.WriteFinalManifest());
  EXPECT_TRUE(ledger_.IsFinalized());

  ledger_.AddCompleted(Completed(2, kNominalNs));
  EXPECT_TRUE(ledger_.WriteFinalManifest());
  EXPECT_TRUE(ledger_.WriteInProgressManifest(std::nullopt));

  Manifest m = ReadManifest();
  EXPECT_TRUE(m.is_complete);
  EXPECT_EQ(m.segments.size(), 1u);
}

TEST_F(SegmentLedgerRecoveryTest, FailedFinalWriteCanBeRetried) {
  ledger_.AddCompleted(Completed(1, kNominalNs));
  SetAtomicWriteFaultHook([](AtomicWriteStage s) { return s == AtomicWriteStage::kBeforeRename; });
  EXPECT_FALSE(ledger_.WriteFinalManifest());
  EXPECT_FALSE(ledger_.IsFinalized());
  SetAtomicWriteFaultHook(nullptr);

  EXPECT_TRUE(ledger_.WriteFinalManifest());
  EXPECT_TRUE(ReadManifest().is_complete);
}

TEST_F(SegmentLedgerRecoveryTest, FragmentedManifestNamesInitSegment) {
  SegmentLedger ledger(dir_.path(), kManifestTypeFragmented, ".m4s", kNominalNs, "init.mp4");
  Manifest m = ledger.BuildManifest(true, std::nullopt);
  EXPECT_EQ(m.init_segment, "init.mp4");
  EXPECT_EQ(m.type, kManifestTypeFragmented);
  EXPECT_TRUE(m.segments.empty());
}

}  // namespace
}  // namespace capkit::tests
