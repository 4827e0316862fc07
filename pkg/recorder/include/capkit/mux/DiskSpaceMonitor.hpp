// Repository: Capkit-recorder
// Component: DiskSpaceMonitor
// Purpose: Rate-limited free-space checks on the recording volume.
// Copyright (c) 2025 Capkit

#ifndef CAPKIT_MUX_DISK_SPACE_MONITOR_HPP_
#define CAPKIT_MUX_DISK_SPACE_MONITOR_HPP_

#include <cstdint>
#include <filesystem>
#include <functional>
#include <memory>
#include <optional>

#include "capkit/timing/Clock.hpp"

namespace capkit::mux {

constexpr uint64_t kDiskSpaceWarningBytes = 500ull * 1024 * 1024;
constexpr uint64_t kDiskSpaceCriticalBytes = 200ull * 1024 * 1024;
constexpr int64_t kDiskSpaceCheckIntervalNs = 10 * timing::kNsPerSec;

enum class DiskSpaceLevel { kOk, kWarning, kCritical };

struct DiskSpaceStatus {
  DiskSpaceLevel level = DiskSpaceLevel::kOk;
  uint64_t available_bytes = 0;
};

// Checks free space at most once per interval. Low-space transitions are
// logged and reported through the callback; the recording itself continues.
class DiskSpaceMonitor {
 public:
  using Callback = std::function<void(const DiskSpaceStatus&)>;
  using SpaceProvider = std::function<std::optional<uint64_t>(const std::filesystem::path&)>;

  DiskSpaceMonitor(std::filesystem::path dir, std::shared_ptr<timing::IClock> clock,
                   Callback callback = nullptr);

  // Runs a check if the interval has elapsed since the last one.
  std::optional<DiskSpaceStatus> MaybeCheck();
  std::optional<DiskSpaceStatus> CheckNow();

  // Test-only: replaces the filesystem query.
  void SetSpaceProvider(SpaceProvider provider) { provider_ = std::move(provider); }

 private:
  std::filesystem::path dir_;
  std::shared_ptr<timing::IClock> clock_;
  Callback callback_;
  SpaceProvider provider_;
  std::optional<int64_t> last_check_ns_;
  DiskSpaceLevel last_level_ = DiskSpaceLevel::kOk;
};

}  // namespace capkit::mux

#endif  // CAPKIT_MUX_DISK_SPACE_MONITOR_HPP_
