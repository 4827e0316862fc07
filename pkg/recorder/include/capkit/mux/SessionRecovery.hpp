// Repository: Capkit-recorder
// Component: SessionRecovery
// Purpose: Finalizes a recording directory left behind by a session that
//          never reached Finish (crash, kill, power loss).
// Copyright (c) 2025 Capkit

#ifndef CAPKIT_MUX_SESSION_RECOVERY_HPP_
#define CAPKIT_MUX_SESSION_RECOVERY_HPP_

#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>

#include "capkit/mux/SegmentLedger.hpp"
#include "capkit/timing/Clock.hpp"

namespace capkit::mux {

struct RecoveryOptions {
  // Duration given to adopted segments the manifest never described.
  int64_t nominal_segment_duration_ns = 3 * timing::kNsPerSec;
};

struct RecoveryResult {
  std::string manifest_type;
  // The directory already had a complete manifest; nothing was touched.
  bool already_complete = false;
  size_t seeded = 0;     // complete entries taken over from the old manifest
  size_t finalized = 0;  // pending .tmp files renamed
  std::vector<SegmentInfo> adopted;
  std::vector<SegmentInfo> segments;
  int64_t total_duration_ns = 0;
};

// root itself and its immediate subdirectories that hold an unfinished
// recording: a manifest with is_complete=false, an unreadable manifest, or
// segment files with no manifest at all. Sorted by path.
std::vector<std::filesystem::path> FindIncompleteRecordings(const std::filesystem::path& root);

// Rebuilds dir's manifest.json from the old manifest and the files on disk
// and marks it complete.
//
// Entries the old manifest recorded as complete keep their durations.
// Pending .tmp files are renamed and adopted with the other orphans. The
// segment that was open at the crash gets the time between the manifest's
// last write (its open) and the segment file's last write; every other
// orphan gets the nominal duration.
//
// Returns false with *error set when dir holds no recognizable recording,
// a fragmented recording lost its init segment, nothing is recoverable, or
// the final manifest cannot be written.
bool RecoverRecording(const std::filesystem::path& dir, const RecoveryOptions& options,
                      RecoveryResult* out, std::string* error);

}  // namespace capkit::mux

#endif  // CAPKIT_MUX_SESSION_RECOVERY_HPP_
