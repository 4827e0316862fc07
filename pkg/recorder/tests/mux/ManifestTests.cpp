// Repository: Capkit-recorder
// Component: Segment Manifest Tests
// Purpose: manifest.json shape, tolerant parsing and crash-safe writes.
// Copyright (c) 2025 Capkit

#include <gtest/gtest.h>

#include <filesystem>

#include "capkit/mux/Manifest.hpp"
#include "support/TempDir.hpp"

namespace capkit::tests {
namespace {

using namespace capkit::mux;

Manifest SampleManifest() {
  Manifest m;
  m.type = kManifestTypeFragmented;
  m.init_segment = "init.mp4";
  ManifestSegment a;
  a.path = "segment_001.m4s";
  a.index = 1;
  a.duration = 3.0;
  a.is_complete = true;
  a.file_size = 123456;
  ManifestSegment b;
  b.path = "segment_002.m4s";
  b.index = 2;
  b.duration = 0.0;
  b.is_complete = false;
  m.segments = {a, b};
  m.total_duration = 3.0;
  m.is_complete = false;
  return m;
}

TEST(ManifestTest, JsonCarriesEveryField) {
  const std::string json = ManifestToJson(SampleManifest());
  EXPECT_NE(json.find("\"version\": 5"), std::string::npos) << json;
  EXPECT_NE(json.find("\"type\": \"m4s_segments\""), std::string::npos) << json;
  EXPECT_NE(json.find("\"init_segment\": \"init.mp4\""), std::string::npos) << json;
  EXPECT_NE(json.find("\"file_size\": 123456"), std::string::npos) << json;
  EXPECT_NE(json.find("\"total_duration\": 3.000000"), std::string::npos) << json;
  EXPECT_NE(json.find("\"is_complete\": false"), std::string::npos) << json;
}

TEST(ManifestTest, ParseReadsBackWhatWasWritten) {
  const Manifest original = SampleManifest();
  Manifest parsed;
  std::string error;
  ASSERT_TRUE(ParseManifest(ManifestToJson(original), &parsed, &error)) << error;

  EXPECT_EQ(parsed.version, kManifestVersion);
  EXPECT_EQ(parsed.type, original.type);
  EXPECT_EQ(parsed.init_segment, original.init_segment);
  EXPECT_EQ(parsed.segments, original.segments);
  EXPECT_EQ(parsed.total_duration, original.total_duration);
  EXPECT_FALSE(parsed.is_complete);
}

TEST(ManifestTest, SegmentKeysDoNotLeakIntoTopLevel) {
  // Top-level is_complete is true while the segment says false.
  Manifest m = SampleManifest();
  m.segments.resize(1);
  m.segments[0].is_complete = false;
  m.is_complete = true;
  Manifest parsed;
  ASSERT_TRUE(ParseManifest(ManifestToJson(m), &parsed, nullptr));
  EXPECT_TRUE(parsed.is_complete);
  ASSERT_EQ(parsed.segments.size(), 1u);
  EXPECT_FALSE(parsed.segments[0].is_complete);
}

TEST(ManifestTest, EmptySegmentListWithoutOptionalFields) {
  Manifest m;
  m.type = kManifestTypeAudioSegments;
  m.is_complete = true;
  Manifest parsed;
  std::string error;
  ASSERT_TRUE(ParseManifest(ManifestToJson(m), &parsed, &error)) << error;
  EXPECT_TRUE(parsed.segments.empty());
  EXPECT_FALSE(parsed.init_segment.has_value());
  EXPECT_FALSE(parsed.total_duration.has_value());
}

TEST(ManifestTest, AcceptsCompactForeignFormatting) {
  const std::string json =
      R"({"version":5,"type":"mp4_segments","segments":[{"path":"segment_001.mp4",)"
      R"("index":1,"duration":2.5,"is_complete":true}],"total_duration":null,"is_complete":true})";
  Manifest parsed;
  std::string error;
  ASSERT_TRUE(ParseManifest(json, &parsed, &error)) << error;
  ASSERT_EQ(parsed.segments.size(), 1u);
  EXPECT_DOUBLE_EQ(parsed.segments[0].duration, 2.5);
  EXPECT_FALSE(parsed.segments[0].file_size.has_value());
  EXPECT_FALSE(parsed.total_duration.has_value());
}

// =============================================================================
// Truncated / malformed documents are rejected
// =============================================================================

TEST(ManifestTest, TruncatedDocumentIsRejected) {
  const std::string json = ManifestToJson(SampleManifest());
  for (size_t cut : {size_t{1}, json.size() / 3, json.size() / 2, json.size() - 3}) {
    Manifest parsed;
    std::string error;
    EXPECT_FALSE(ParseManifest(json.substr(0, cut), &parsed, &error)) << "cut at " << cut;
    EXPECT_FALSE(error.empty());
  }
}

TEST(ManifestTest, MissingRequiredFieldIsRejected) {
  Manifest parsed;
  std::string error;
  EXPECT_FALSE(ParseManifest(R"({"type":"x","segments":[],"is_complete":true})", &parsed, &error));
  EXPECT_EQ(error, "missing version");
  EXPECT_FALSE(ParseManifest("[]", &parsed, &error));
  EXPECT_FALSE(ParseManifest(R"({"version":5} trailing)", &parsed, &error));
}

// =============================================================================
// Atomic write
// =============================================================================

class AtomicWriteTest : public ::testing::Test {
 protected:
  void TearDown() override { SetAtomicWriteFaultHook(nullptr); }

  TempDir dir_{"atomic_write"};
};

TEST_F(AtomicWriteTest, WritesAndReplaces) {
  const auto path = dir_ / "manifest.json";
  std::string error;
  ASSERT_TRUE(AtomicWriteFile(path, "first", &error)) << error;
  ASSERT_TRUE(AtomicWriteFile(path, "second", &error)) << error;
  EXPECT_EQ(ReadWholeFile(path), "second");
  EXPECT_FALSE(std::filesystem::exists(path.string() + ".tmp"));
}

TEST_F(AtomicWriteTest, InterruptionAtAnyStageLeavesPreviousVersion) {
  const auto path = dir_ / "manifest.json";
  Manifest before = SampleManifest();
  ASSERT_TRUE(AtomicWriteFile(path, ManifestToJson(before), nullptr));

  Manifest after = SampleManifest();
  after.is_complete = true;
  for (auto stage : {AtomicWriteStage::kTempOpened, AtomicWriteStage::kTempHalfWritten,
                     AtomicWriteStage::kBeforeRename}) {
    SetAtomicWriteFaultHook([stage](AtomicWriteStage s) { return s == stage; });
    std::string error;
    EXPECT_FALSE(AtomicWriteFile(path, ManifestToJson(after), &error));
    EXPECT_EQ(error, "write interrupted");

    Manifest read;
    ASSERT_TRUE(ReadManifestFile(path, &read, &error)) << error;
    EXPECT_FALSE(read.is_complete);
  }
  SetAtomicWriteFaultHook(nullptr);

  ASSERT_TRUE(AtomicWriteFile(path, ManifestToJson(after), nullptr));
  Manifest read;
  ASSERT_TRUE(ReadManifestFile(path, &read, nullptr));
  EXPECT_TRUE(read.is_complete);
}

TEST_F(AtomicWriteTest, HalfWrittenTempIsNotAValidManifest) {
  const auto path = dir_ / "manifest.json";
  SetAtomicWriteFaultHook([](AtomicWriteStage s) { return s == AtomicWriteStage::kTempHalfWritten; });
  EXPECT_FALSE(AtomicWriteFile(path, ManifestToJson(SampleManifest()), nullptr));

  EXPECT_FALSE(std::filesystem::exists(path));
  Manifest read;
  std::string error;
  EXPECT_FALSE(ReadManifestFile(path.string() + ".tmp", &read, &error));
}

TEST_F(AtomicWriteTest, ReadMissingFileFails) {
  Manifest read;
  std::string error;
  EXPECT_FALSE(ReadManifestFile(dir_ / "nope.json", &read, &error));
  EXPECT_NE(error.find("cannot open"), std::string::npos);
}

}  // namespace
}  // namespace capkit::tests
