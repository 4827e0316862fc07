// Repository: Capkit-recorder
// Component: Segment Manifest
// Purpose: manifest.json model, serializer, tolerant reader and the atomic
//          file write every manifest update goes through.
// Copyright (c) 2025 Capkit

#ifndef CAPKIT_MUX_MANIFEST_HPP_
#define CAPKIT_MUX_MANIFEST_HPP_

#include <cstdint>
#include <filesystem>
#include <functional>
#include <optional>
#include <string>
#include <vector>

namespace capkit::mux {

constexpr int kManifestVersion = 5;
constexpr const char* kManifestFileName = "manifest.json";

constexpr const char* kManifestTypeFragmented = "m4s_segments";
constexpr const char* kManifestTypeVideoSegments = "mp4_segments";
constexpr const char* kManifestTypeAudioSegments = "m4a_segments";

struct ManifestSegment {
  // File name relative to the manifest's directory.
  std::string path;
  uint32_t index = 0;
  double duration = 0.0;  // seconds
  bool is_complete = false;
  std::optional<uint64_t> file_size;

  bool operator==(const ManifestSegment& o) const {
    return path == o.path && index == o.index && duration == o.duration &&
           is_complete == o.is_complete && file_size == o.file_size;
  }
};

struct Manifest {
  int version = kManifestVersion;
  std::string type;
  std::optional<std::string> init_segment;
  std::vector<ManifestSegment> segments;
  std::optional<double> total_duration;  // seconds
  bool is_complete = false;
};

// Pretty-printed JSON, one key per line, stable field order.
std::string ManifestToJson(const Manifest& manifest);

// Rejects anything that is not a complete manifest document (truncated
// writes included). Accepts is_complete=false.
bool ParseManifest(const std::string& json, Manifest* out, std::string* error);

bool ReadManifestFile(const std::filesystem::path& path, Manifest* out, std::string* error);

// Write-to-temp, fsync, rename over destination, fsync directory (best
// effort). A reader sees either the old file or the new one, never a mix.
// The temp file is "<path>.tmp" in the same directory.
bool AtomicWriteFile(const std::filesystem::path& path, const std::string& contents,
                     std::string* error);

// Test-only: called at each stage of AtomicWriteFile; returning true
// abandons the write at that point, as a crash would. Pass nullptr to clear.
enum class AtomicWriteStage {
  kTempOpened,
  kTempHalfWritten,
  kBeforeRename,
};
void SetAtomicWriteFaultHook(std::function<bool(AtomicWriteStage)> hook);

}  // namespace capkit::mux

#endif  // CAPKIT_MUX_MANIFEST_HPP_
