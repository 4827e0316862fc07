// Repository: Capkit-recorder
// Component: SegmentLedger
// Purpose: Completed-segment bookkeeping, manifest persistence and crash
//          recovery.
// Copyright (c) 2025 Capkit

#include "capkit/mux/SegmentLedger.hpp"

#include <algorithm>
#include <cctype>
#include <cstdio>
#include <fcntl.h>
#include <sstream>
#include <system_error>
#include <unistd.h>

#include "capkit/timing/Clock.hpp"
#include "capkit/util/Logger.hpp"

namespace capkit::mux {

namespace fs = std::filesystem;

std::string SegmentFileName(uint32_t index, const std::string& extension) {
  char buf[32];
  std::snprintf(buf, sizeof(buf), "segment_%03u", index);
  return std::string(buf) + extension;
}

std::optional<uint32_t> ParseSegmentIndex(const std::string& file_name,
                                          const std::string& extension) {
  static const std::string kPrefix = "segment_";
  if (file_name.size() <= kPrefix.size() + extension.size()) return std::nullopt;
  if (file_name.compare(0, kPrefix.size(), kPrefix) != 0) return std::nullopt;
  if (file_name.compare(file_name.size() - extension.size(), extension.size(), extension) != 0) {
    return std::nullopt;
  }
  const std::string digits =
      file_name.substr(kPrefix.size(), file_name.size() - kPrefix.size() - extension.size());
  if (digits.empty() || digits.size() > 9) return std::nullopt;
  for (char c : digits) {
    if (!std::isdigit(static_cast<unsigned char>(c))) return std::nullopt;
  }
  return static_cast<uint32_t>(std::stoul(digits));
}

bool SyncFile(const fs::path& path) {
  const int fd = ::open(path.c_str(), O_RDONLY | O_CLOEXEC);
  if (fd < 0) return false;
  const bool ok = ::fsync(fd) == 0;
  ::close(fd);
  return ok;
}

SegmentLedger::SegmentLedger(fs::path dir, std::string manifest_type, std::string extension,
                             int64_t nominal_duration_ns,
                             std::optional<std::string> init_segment)
    : dir_(std::move(dir)),
      manifest_type_(std::move(manifest_type)),
      extension_(std::move(extension)),
      nominal_duration_ns_(nominal_duration_ns),
      init_segment_(std::move(init_segment)) {}

void SegmentLedger::AddCompleted(SegmentInfo info) {
  if (Contains(info.index)) return;
  auto pos = std::upper_bound(
      completed_.begin(), completed_.end(), info.index,
      [](uint32_t index, const SegmentInfo& s) { return index < s.index; });
  completed_.insert(pos, std::move(info));
}

bool SegmentLedger::Contains(uint32_t index) const {
  return std::any_of(completed_.begin(), completed_.end(),
                     [index](const SegmentInfo& s) { return s.index == index; });
}

int64_t SegmentLedger::TotalDurationNs() const {
  int64_t total = 0;
  for (const auto& s : completed_) total += s.duration_ns;
  return total;
}

size_t SegmentLedger::SeedFromManifest(const Manifest& manifest) {
  size_t seeded = 0;
  for (const auto& entry : manifest.segments) {
    if (!entry.is_complete) continue;
    const fs::path path = dir_ / entry.path;
    std::error_code ec;
    const auto size = fs::file_size(path, ec);
    if (ec) {
      util::Logger::Warn("[SegmentLedger] Manifest lists missing segment " + entry.path);
      continue;
    }
    if (entry.file_size && *entry.file_size != size) {
      util::Logger::Warn("[SegmentLedger] Size mismatch for " + entry.path + ": manifest " +
                         std::to_string(*entry.file_size) + " bytes, disk " +
                         std::to_string(size) + " bytes");
      continue;
    }
    if (Contains(entry.index)) continue;

    SegmentInfo info;
    info.path = path;
    info.index = entry.index;
    info.duration_ns = timing::SecondsToNs(entry.duration);
    info.file_size = size;
    AddCompleted(std::move(info));
    ++seeded;
  }
  if (seeded > 0) {
    util::Logger::Info("[SegmentLedger] Seeded " + std::to_string(seeded) +
                       " segment(s) from " + ManifestPath().filename().string());
  }
  return seeded;
}

size_t SegmentLedger::FinalizePendingTmpFiles() {
  std::error_code ec;
  fs::directory_iterator it(dir_, ec);
  if (ec) {
    util::Logger::Warn("[SegmentLedger] Cannot scan " + dir_.string() + ": " + ec.message());
    return 0;
  }

  size_t finalized = 0;
  const std::string tmp_ext = extension_ + kTmpSuffix;
  for (const auto& entry : it) {
    const std::string name = entry.path().filename().string();
    if (!ParseSegmentIndex(name, tmp_ext)) continue;

    std::error_code size_ec;
    const auto size = fs::file_size(entry.path(), size_ec);
    if (size_ec || size == 0) {
      util::Logger::Debug("[SegmentLedger] Leaving empty tmp segment " + name);
      continue;
    }

    const fs::path final_path = dir_ / name.substr(0, name.size() - std::string(kTmpSuffix).size());
    std::error_code rename_ec;
    fs::rename(entry.path(), final_path, rename_ec);
    if (rename_ec) {
      util::Logger::Warn("[SegmentLedger] Failed to rename tmp segment " + name + " to " +
                         final_path.filename().string() + ": " + rename_ec.message());
      continue;
    }
    SyncFile(final_path);
    util::Logger::Info("[SegmentLedger] Finalized pending segment " +
                       final_path.filename().string() + " (" + std::to_string(size) + " bytes)");
    ++finalized;
  }
  return finalized;
}

std::vector<SegmentInfo> SegmentLedger::CollectOrphanedSegments(
    std::optional<ActiveSegment> active) {
  std::vector<std::pair<uint32_t, fs::path>> orphaned;
  std::error_code ec;
  fs::directory_iterator it(dir_, ec);
  if (ec) {
    util::Logger::Warn("[SegmentLedger] Cannot scan " + dir_.string() + ": " + ec.message());
    return {};
  }
  for (const auto& entry : it) {
    auto index = ParseSegmentIndex(entry.path().filename().string(), extension_);
    if (index && !Contains(*index)) {
      orphaned.emplace_back(*index, entry.path());
    }
  }
  std::sort(orphaned.begin(), orphaned.end(),
            [](const auto& a, const auto& b) { return a.first < b.first; });

  std::vector<SegmentInfo> adopted;
  for (const auto& [index, path] : orphaned) {
    std::error_code size_ec;
    const auto size = fs::file_size(path, size_ec);
    if (size_ec) {
      util::Logger::Warn("[SegmentLedger] Cannot stat orphaned segment " +
                         path.filename().string() + ": " + size_ec.message());
      continue;
    }
    if (size < kMinViableSegmentBytes) {
      util::Logger::Warn("[SegmentLedger] Skipping tiny orphaned segment " +
                         path.filename().string() + " (" + std::to_string(size) + " bytes)");
      continue;
    }

    SyncFile(path);

    SegmentInfo info;
    info.path = path;
    info.index = index;
    info.file_size = size;
    info.duration_ns = (active && active->index == index && active->elapsed_ns > 0)
                           ? active->elapsed_ns
                           : nominal_duration_ns_;

    std::ostringstream oss;
    oss << "[SegmentLedger] Recovered orphaned segment " << path.filename().string() << " with "
        << size << " bytes, estimated duration " << timing::NsToSeconds(info.duration_ns) << "s";
    util::Logger::Info(oss.str());

    AddCompleted(info);
    adopted.push_back(std::move(info));
  }
  return adopted;
}

Manifest SegmentLedger::BuildManifest(bool complete,
                                      const std::optional<SegmentInfo>& current) const {
  Manifest m;
  m.version = kManifestVersion;
  m.type = manifest_type_;
  m.init_segment = init_segment_;
  for (const auto& s : completed_) {
    ManifestSegment entry;
    entry.path = s.path.filename().string();
    entry.index = s.index;
    entry.duration = timing::NsToSeconds(s.duration_ns);
    entry.is_complete = true;
    entry.file_size = s.file_size;
    m.segments.push_back(std::move(entry));
  }
  if (current && !complete && !Contains(current->index)) {
    ManifestSegment entry;
    entry.path = current->path.filename().string();
    entry.index = current->index;
    entry.duration = 0.0;
    entry.is_complete = false;
    m.segments.push_back(std::move(entry));
  }
  m.total_duration = timing::NsToSeconds(TotalDurationNs());
  m.is_complete = complete;
  return m;
}

bool SegmentLedger::WriteManifest(const Manifest& manifest) {
  std::string error;
  if (!AtomicWriteFile(ManifestPath(), ManifestToJson(manifest), &error)) {
    util::Logger::Warn("[SegmentLedger] Failed to write manifest " + ManifestPath().string() +
                       ": " + error);
    return false;
  }
  return true;
}

bool SegmentLedger::WriteInProgressManifest(const std::optional<SegmentInfo>& current) {
  if (finalized_) return true;
  return WriteManifest(BuildManifest(false, current));
}

bool SegmentLedger::WriteFinalManifest() {
  if (finalized_) return true;
  if (!WriteManifest(BuildManifest(true, std::nullopt))) {
    return false;
  }
  finalized_ = true;
  std::ostringstream oss;
  oss << "[SegmentLedger] Final manifest written: " << completed_.size() << " segment(s), "
      << timing::NsToSeconds(TotalDurationNs()) << "s";
  util::Logger::Info(oss.str());
  return true;
}

}  // namespace capkit::mux
