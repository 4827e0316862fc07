// Repository: Capkit-recorder
// Component: Clock
// Purpose: Shared monotonic time reference all capture timestamps are
//          measured against.
// Copyright (c) 2025 Capkit

#ifndef CAPKIT_TIMING_CLOCK_HPP_
#define CAPKIT_TIMING_CLOCK_HPP_

#include <cstdint>
#include <memory>

namespace capkit::timing {

constexpr int64_t kNsPerMs = 1'000'000;
constexpr int64_t kNsPerSec = 1'000'000'000;

class IClock {
 public:
  virtual ~IClock() = default;
  // Monotonic nanoseconds. Only differences are meaningful.
  virtual int64_t NowNs() const = 0;
};

// std::chrono::steady_clock.
class SystemClock : public IClock {
 public:
  int64_t NowNs() const override;
};

std::shared_ptr<IClock> MakeSystemClock();

inline double NsToSeconds(int64_t ns) {
  return static_cast<double>(ns) / static_cast<double>(kNsPerSec);
}

inline int64_t SecondsToNs(double seconds) {
  return static_cast<int64_t>(seconds * static_cast<double>(kNsPerSec));
}

}  // namespace capkit::timing

#endif  // CAPKIT_TIMING_CLOCK_HPP_
