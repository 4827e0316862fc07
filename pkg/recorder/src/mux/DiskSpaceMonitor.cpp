// Repository: Capkit-recorder
// Component: DiskSpaceMonitor
// Purpose: Rate-limited free-space checks on the recording volume.
// Copyright (c) 2025 Capkit

#include "capkit/mux/DiskSpaceMonitor.hpp"

#include <sstream>
#include <system_error>

#include "capkit/util/Logger.hpp"

namespace capkit::mux {

DiskSpaceMonitor::DiskSpaceMonitor(std::filesystem::path dir,
                                   std::shared_ptr<timing::IClock> clock, Callback callback)
    : dir_(std::move(dir)),
      clock_(clock ? std::move(clock) : timing::MakeSystemClock()),
      callback_(std::move(callback)) {}

std::optional<DiskSpaceStatus> DiskSpaceMonitor::MaybeCheck() {
  const int64_t now = clock_->NowNs();
  if (last_check_ns_ && now - *last_check_ns_ < kDiskSpaceCheckIntervalNs) {
    return std::nullopt;
  }
  return CheckNow();
}

std::optional<DiskSpaceStatus> DiskSpaceMonitor::CheckNow() {
  last_check_ns_ = clock_->NowNs();

  std::optional<uint64_t> available;
  if (provider_) {
    available = provider_(dir_);
  } else {
    std::error_code ec;
    const auto info = std::filesystem::space(dir_, ec);
    if (!ec) available = static_cast<uint64_t>(info.available);
  }
  if (!available) {
    util::Logger::Debug("[DiskSpaceMonitor] Free space query failed for " + dir_.string());
    return std::nullopt;
  }

  DiskSpaceStatus status;
  status.available_bytes = *available;
  if (*available < kDiskSpaceCriticalBytes) {
    status.level = DiskSpaceLevel::kCritical;
  } else if (*available < kDiskSpaceWarningBytes) {
    status.level = DiskSpaceLevel::kWarning;
  }

  if (status.level != last_level_) {
    std::ostringstream oss;
    oss << "[DiskSpaceMonitor] " << dir_.string() << ": "
        << (*available / (1024 * 1024)) << " MB available";
    if (status.level == DiskSpaceLevel::kCritical) {
      oss << " (critical)";
      util::Logger::Error(oss.str());
    } else if (status.level == DiskSpaceLevel::kWarning) {
      oss << " (low)";
      util::Logger::Warn(oss.str());
    } else {
      oss << " (recovered)";
      util::Logger::Info(oss.str());
    }
    last_level_ = status.level;
  }
  if (callback_ && status.level != DiskSpaceLevel::kOk) {
    callback_(status);
  }
  return status;
}

}  // namespace capkit::mux
