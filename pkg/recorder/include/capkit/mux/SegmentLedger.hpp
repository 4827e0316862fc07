// Repository: Capkit-recorder
// Component: SegmentLedger
// Purpose: Completed-segment bookkeeping, manifest persistence and crash
//          recovery of segment files the muxer never registered.
// Copyright (c) 2025 Capkit

#ifndef CAPKIT_MUX_SEGMENT_LEDGER_HPP_
#define CAPKIT_MUX_SEGMENT_LEDGER_HPP_

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

#include "capkit/mux/Manifest.hpp"

namespace capkit::mux {

// Orphans smaller than this are leftovers from a segment that never got
// past its header, not recoverable media.
constexpr uint64_t kMinViableSegmentBytes = 100;
constexpr const char* kTmpSuffix = ".tmp";

struct SegmentInfo {
  std::filesystem::path path;
  uint32_t index = 0;
  int64_t duration_ns = 0;
  std::optional<uint64_t> file_size;
  bool is_complete = true;

  bool operator==(const SegmentInfo& o) const {
    return path == o.path && index == o.index && duration_ns == o.duration_ns &&
           file_size == o.file_size && is_complete == o.is_complete;
  }
};

// The segment being written when recovery runs. Its orphan, if any, gets
// elapsed_ns as duration instead of the nominal one.
struct ActiveSegment {
  uint32_t index = 0;
  int64_t elapsed_ns = 0;
};

// "segment_001" + extension.
std::string SegmentFileName(uint32_t index, const std::string& extension);

// Index of "segment_NNN<extension>", nullopt for anything else.
std::optional<uint32_t> ParseSegmentIndex(const std::string& file_name,
                                          const std::string& extension);

// fsync a file by path. Best effort; returns false on failure.
bool SyncFile(const std::filesystem::path& path);

// SegmentLedger is the in-memory truth about which segments are complete,
// and the only writer of manifest.json. Not thread-safe; the owning muxer
// serializes access.
class SegmentLedger {
 public:
  SegmentLedger(std::filesystem::path dir, std::string manifest_type, std::string extension,
                int64_t nominal_duration_ns,
                std::optional<std::string> init_segment = std::nullopt);

  // Ignored if the index is already registered. Keeps ascending index order.
  void AddCompleted(SegmentInfo info);

  const std::vector<SegmentInfo>& Completed() const { return completed_; }
  bool Contains(uint32_t index) const;
  int64_t TotalDurationNs() const;

  // Registers the complete entries of an earlier session's manifest whose
  // files are still on disk. An entry whose file size no longer matches the
  // recorded one is skipped with a warning and left to orphan adoption.
  // Returns the number of entries registered.
  size_t SeedFromManifest(const Manifest& manifest);

  // Renames every non-empty "segment_NNN<ext>.tmp" to its final name and
  // fsyncs it. Returns the number of files finalized.
  size_t FinalizePendingTmpFiles();

  // Adopts on-disk segment files missing from Completed(), ascending by
  // index. Files under kMinViableSegmentBytes are skipped with a warning.
  // Returns the adopted entries.
  std::vector<SegmentInfo> CollectOrphanedSegments(std::optional<ActiveSegment> active);

  // Completed segments plus, if given, the active one as is_complete=false.
  bool WriteInProgressManifest(const std::optional<SegmentInfo>& current);

  // Writes is_complete=true. Only the first successful call writes; later
  // calls return true without touching the file.
  bool WriteFinalManifest();

  Manifest BuildManifest(bool complete, const std::optional<SegmentInfo>& current) const;

  bool IsFinalized() const { return finalized_; }
  const std::filesystem::path& dir() const { return dir_; }
  std::filesystem::path ManifestPath() const { return dir_ / kManifestFileName; }
  const std::string& extension() const { return extension_; }
  int64_t nominal_duration_ns() const { return nominal_duration_ns_; }

 private:
  bool WriteManifest(const Manifest& manifest);

  std::filesystem::path dir_;
  std::string manifest_type_;
  std::string extension_;
  int64_t nominal_duration_ns_;
  std::optional<std::string> init_segment_;
  std::vector<SegmentInfo> completed_;
  bool finalized_ = false;
};

}  // namespace capkit::mux

#endif  // CAPKIT_MUX_SEGMENT_LEDGER_HPP_
