// Repository: Capkit-recorder
// Component: Clock
// Purpose: Steady-clock implementation of IClock.
// Copyright (c) 2025 Capkit

#include "capkit/timing/Clock.hpp"

#include <chrono>

namespace capkit::timing {

int64_t SystemClock::NowNs() const {
  return std::chrono::duration_cast<std::chrono::nanoseconds>(
             std::chrono::steady_clock::now().time_since_epoch())
      .count();
}

std::shared_ptr<IClock> MakeSystemClock() {
  return std::make_shared<SystemClock>();
}

}  // namespace capkit::timing
