// Repository: Capkit-recorder
// Component: BoundedChannel
// Purpose: Mutex/condvar bounded FIFO connecting capture callbacks, the
//          mixer tick thread, forwarding tasks and segment encoder threads.
// Copyright (c) 2025 Capkit

#ifndef CAPKIT_UTIL_BOUNDED_CHANNEL_HPP_
#define CAPKIT_UTIL_BOUNDED_CHANNEL_HPP_

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <deque>
#include <memory>
#include <mutex>
#include <optional>

namespace capkit::util {

// Multi-producer multi-consumer bounded queue.
//
// Send blocks while full; Recv blocks while empty. After Close():
//   - Send/TrySend/SendFor fail immediately (the item is dropped).
//   - Recv keeps returning queued items until the queue is drained, then
//     returns nullopt.
template <typename T>
class BoundedChannel {
 public:
  explicit BoundedChannel(size_t capacity) : capacity_(capacity == 0 ? 1 : capacity) {}

  BoundedChannel(const BoundedChannel&) = delete;
  BoundedChannel& operator=(const BoundedChannel&) = delete;

  bool Send(T item) {
    std::unique_lock<std::mutex> lock(mutex_);
    not_full_.wait(lock, [this] { return closed_ || items_.size() < capacity_; });
    if (closed_) return false;
    items_.push_back(std::move(item));
    not_empty_.notify_one();
    return true;
  }

  // Returns false on timeout or when closed.
  template <typename Rep, typename Period>
  bool SendFor(T item, std::chrono::duration<Rep, Period> timeout) {
    std::unique_lock<std::mutex> lock(mutex_);
    if (!not_full_.wait_for(lock, timeout,
                            [this] { return closed_ || items_.size() < capacity_; })) {
      return false;
    }
    if (closed_) return false;
    items_.push_back(std::move(item));
    not_empty_.notify_one();
    return true;
  }

  bool TrySend(T item) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (closed_ || items_.size() >= capacity_) return false;
    items_.push_back(std::move(item));
    not_empty_.notify_one();
    return true;
  }

  std::optional<T> Recv() {
    std::unique_lock<std::mutex> lock(mutex_);
    not_empty_.wait(lock, [this] { return closed_ || !items_.empty(); });
    return PopLocked();
  }

  template <typename Rep, typename Period>
  std::optional<T> RecvFor(std::chrono::duration<Rep, Period> timeout) {
    std::unique_lock<std::mutex> lock(mutex_);
    not_empty_.wait_for(lock, timeout, [this] { return closed_ || !items_.empty(); });
    return PopLocked();
  }

  std::optional<T> TryRecv() {
    std::lock_guard<std::mutex> lock(mutex_);
    return PopLocked();
  }

  void Close() {
    std::lock_guard<std::mutex> lock(mutex_);
    closed_ = true;
    not_empty_.notify_all();
    not_full_.notify_all();
  }

  bool IsClosed() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return closed_;
  }

  // Closed and nothing left to receive.
  bool IsDrained() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return closed_ && items_.empty();
  }

  size_t Size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return items_.size();
  }

  size_t Capacity() const { return capacity_; }

 private:
  std::optional<T> PopLocked() {
    if (items_.empty()) return std::nullopt;
    T item = std::move(items_.front());
    items_.pop_front();
    not_full_.notify_one();
    return item;
  }

  const size_t capacity_;
  mutable std::mutex mutex_;
  std::condition_variable not_empty_;
  std::condition_variable not_full_;
  std::deque<T> items_;
  bool closed_ = false;
};

template <typename T>
using ChannelPtr = std::shared_ptr<BoundedChannel<T>>;

template <typename T>
ChannelPtr<T> MakeChannel(size_t capacity) {
  return std::make_shared<BoundedChannel<T>>(capacity);
}

}  // namespace capkit::util

#endif  // CAPKIT_UTIL_BOUNDED_CHANNEL_HPP_
