// Repository: Capkit-recorder
// Component: SessionRecovery
// Purpose: Finalizes a recording directory left behind by a session that
//          never reached Finish.
// Copyright (c) 2025 Capkit

#include "capkit/mux/SessionRecovery.hpp"

#include <algorithm>
#include <chrono>
#include <optional>
#include <sstream>
#include <system_error>
#include <utility>

#include "capkit/mux/Manifest.hpp"
#include "capkit/util/Logger.hpp"

namespace capkit::mux {

namespace fs = std::filesystem;

namespace {

constexpr const char* kInitSegmentName = "init.mp4";

struct Layout {
  std::string type;
  std::string extension;
  std::optional<std::string> init_segment;
};

std::optional<Layout> LayoutForType(const std::string& type) {
  if (type == kManifestTypeFragmented) return Layout{type, ".m4s", std::string(kInitSegmentName)};
  if (type == kManifestTypeVideoSegments) return Layout{type, ".mp4", std::nullopt};
  if (type == kManifestTypeAudioSegments) return Layout{type, ".m4a", std::nullopt};
  return std::nullopt;
}

bool HasSegmentFiles(const fs::path& dir, const std::string& extension) {
  std::error_code ec;
  fs::directory_iterator it(dir, ec);
  if (ec) return false;
  const std::string tmp_ext = extension + kTmpSuffix;
  for (const auto& entry : it) {
    const std::string name = entry.path().filename().string();
    if (ParseSegmentIndex(name, extension) || ParseSegmentIndex(name, tmp_ext)) return true;
  }
  return false;
}

// Manifest-less directories: the file names tell the shape.
std::optional<Layout> DetectLayout(const fs::path& dir) {
  std::error_code ec;
  if (fs::exists(dir / kInitSegmentName, ec) || HasSegmentFiles(dir, ".m4s")) {
    return LayoutForType(kManifestTypeFragmented);
  }
  if (HasSegmentFiles(dir, ".mp4")) return LayoutForType(kManifestTypeVideoSegments);
  if (HasSegmentFiles(dir, ".m4a")) return LayoutForType(kManifestTypeAudioSegments);
  return std::nullopt;
}

std::optional<fs::file_time_type> WriteTime(const fs::path& path) {
  std::error_code ec;
  const auto t = fs::last_write_time(path, ec);
  if (ec) return std::nullopt;
  return t;
}

// The manifest is rewritten when a segment opens, so its write time marks
// the start of the segment it lists as incomplete.
std::optional<ActiveSegment> EstimateActiveSegment(const fs::path& dir, const Manifest& manifest,
                                                   std::optional<fs::file_time_type> manifest_time,
                                                   const std::string& extension) {
  auto open = std::find_if(manifest.segments.rbegin(), manifest.segments.rend(),
                           [](const ManifestSegment& s) { return !s.is_complete; });
  if (open == manifest.segments.rend()) return std::nullopt;

  ActiveSegment active{open->index, 0};
  auto file_time = WriteTime(dir / SegmentFileName(open->index, extension));
  if (manifest_time && file_time && *file_time > *manifest_time) {
    active.elapsed_ns =
        std::chrono::duration_cast<std::chrono::nanoseconds>(*file_time - *manifest_time).count();
  }
  return active;
}

bool Fail(std::string* error, const std::string& message) {
  if (error) *error = message;
  return false;
}

}  // namespace

std::vector<fs::path> FindIncompleteRecordings(const fs::path& root) {
  std::vector<fs::path> candidates{root};
  std::error_code ec;
  fs::directory_iterator it(root, ec);
  if (ec) {
    util::Logger::Warn("[SessionRecovery] Cannot scan " + root.string() + ": " + ec.message());
    return {};
  }
  for (const auto& entry : it) {
    std::error_code type_ec;
    if (entry.is_directory(type_ec)) candidates.push_back(entry.path());
  }

  std::vector<fs::path> incomplete;
  for (const auto& dir : candidates) {
    const fs::path manifest_path = dir / kManifestFileName;
    std::error_code exists_ec;
    if (fs::exists(manifest_path, exists_ec)) {
      Manifest manifest;
      std::string error;
      if (!ReadManifestFile(manifest_path, &manifest, &error) || !manifest.is_complete) {
        incomplete.push_back(dir);
      }
    } else if (DetectLayout(dir)) {
      incomplete.push_back(dir);
    }
  }
  std::sort(incomplete.begin(), incomplete.end());
  return incomplete;
}

bool RecoverRecording(const fs::path& dir, const RecoveryOptions& options, RecoveryResult* out,
                      std::string* error) {
  std::error_code ec;
  if (!fs::is_directory(dir, ec)) {
    return Fail(error, dir.string() + " is not a directory");
  }

  const fs::path manifest_path = dir / kManifestFileName;
  const auto manifest_time = WriteTime(manifest_path);
  Manifest manifest;
  std::string read_error;
  const bool have_manifest =
      manifest_time && ReadManifestFile(manifest_path, &manifest, &read_error);
  if (manifest_time && !have_manifest) {
    util::Logger::Warn("[SessionRecovery] Ignoring unreadable " + manifest_path.string() + ": " +
                       read_error);
  }

  RecoveryResult result;
  if (have_manifest && manifest.is_complete) {
    result.manifest_type = manifest.type;
    result.already_complete = true;
    util::Logger::Info("[SessionRecovery] " + dir.string() + " is already complete");
    if (out) *out = std::move(result);
    return true;
  }

  std::optional<Layout> layout = have_manifest ? LayoutForType(manifest.type) : DetectLayout(dir);
  if (!layout) {
    return Fail(error, have_manifest ? "unknown manifest type '" + manifest.type + "'"
                                     : "no recording found in " + dir.string());
  }
  if (have_manifest && manifest.init_segment) layout->init_segment = manifest.init_segment;
  if (layout->init_segment && !fs::exists(dir / *layout->init_segment, ec)) {
    return Fail(error, "init segment " + *layout->init_segment + " is missing");
  }

  SegmentLedger ledger(dir, layout->type, layout->extension, options.nominal_segment_duration_ns,
                       layout->init_segment);
  if (have_manifest) result.seeded = ledger.SeedFromManifest(manifest);
  result.finalized = ledger.FinalizePendingTmpFiles();

  std::optional<ActiveSegment> active;
  if (have_manifest) {
    active = EstimateActiveSegment(dir, manifest, manifest_time, layout->extension);
  }
  result.adopted = ledger.CollectOrphanedSegments(active);

  if (ledger.Completed().empty()) {
    return Fail(error, "no recoverable segments in " + dir.string());
  }
  if (!ledger.WriteFinalManifest()) {
    return Fail(error, "cannot write " + ledger.ManifestPath().string());
  }

  result.manifest_type = layout->type;
  result.segments = ledger.Completed();
  result.total_duration_ns = ledger.TotalDurationNs();

  std::ostringstream oss;
  oss << "[SessionRecovery] Recovered " << dir.string() << ": " << result.segments.size()
      << " segment(s) (" << result.seeded << " from manifest, " << result.adopted.size()
      << " adopted), " << timing::NsToSeconds(result.total_duration_ns) << "s";
  util::Logger::Info(oss.str());

  if (out) *out = std::move(result);
  return true;
}

}  // namespace capkit::mux
