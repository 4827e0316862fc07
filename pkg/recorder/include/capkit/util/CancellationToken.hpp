// Repository: Capkit-recorder
// Component: CancellationToken
// Purpose: Cooperative stop signal shared by pipeline tasks.
// Copyright (c) 2025 Capkit

#ifndef CAPKIT_UTIL_CANCELLATION_TOKEN_HPP_
#define CAPKIT_UTIL_CANCELLATION_TOKEN_HPP_

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <mutex>

namespace capkit::util {

// Cancel() is sticky and idempotent. Tasks poll IsCancelled() between
// units of work or sleep in WaitFor() so a cancel wakes them promptly.
class CancellationToken {
 public:
  void Cancel() {
    {
      std::lock_guard<std::mutex> lock(mutex_);
      cancelled_.store(true, std::memory_order_release);
    }
    cv_.notify_all();
  }

  bool IsCancelled() const { return cancelled_.load(std::memory_order_acquire); }

  // Returns true if cancelled before the timeout elapsed.
  template <typename Rep, typename Period>
  bool WaitFor(std::chrono::duration<Rep, Period> timeout) {
    std::unique_lock<std::mutex> lock(mutex_);
    return cv_.wait_for(lock, timeout, [this] { return IsCancelled(); });
  }

 private:
  std::atomic<bool> cancelled_{false};
  std::mutex mutex_;
  std::condition_variable cv_;
};

}  // namespace capkit::util

#endif  // CAPKIT_UTIL_CANCELLATION_TOKEN_HPP_
