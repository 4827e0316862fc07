// Repository: Capkit-recorder
// Component: SegmentEncoderWorker
// Purpose: Dedicated OS thread owning one segment encoder for its whole
//          lifetime, fed through a bounded channel.
// Copyright (c) 2025 Capkit

#ifndef CAPKIT_MUX_SEGMENT_ENCODER_WORKER_HPP_
#define CAPKIT_MUX_SEGMENT_ENCODER_WORKER_HPP_

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <thread>
#include <variant>

#include "capkit/mux/IMuxer.hpp"

namespace capkit::mux {

constexpr size_t kEncoderQueueCapacity = 8;
constexpr std::chrono::milliseconds kEncoderJoinTimeout{5000};

struct EncodeVideo {
  media::VideoFrame frame;
  int64_t pts_ns = 0;
};

struct EncodeAudio {
  media::AudioFrame frame;
  int64_t pts_ns = 0;
};

using EncodeCommand = std::variant<EncodeVideo, EncodeAudio>;

struct WorkerFinishResult {
  // False when the thread missed the join timeout and was abandoned.
  bool joined = false;
  bool ok = false;
  std::string error;
};

// The thread creates the encoder, opens the file and reports through a
// one-shot ready signal before any frame is accepted. All state the thread
// touches is shared-owned, so an abandoned thread can finish (or hang) on
// its own without touching freed memory.
class SegmentEncoderWorker {
 public:
  // Blocks until the encoder is open. Throws StreamError if the factory or
  // Open() fails, or if the ready signal does not arrive within
  // ready_timeout.
  static std::unique_ptr<SegmentEncoderWorker> Spawn(
      const SegmentEncoderFactory& factory, const std::filesystem::path& path,
      const std::optional<media::VideoInfo>& video, const std::optional<media::AudioInfo>& audio,
      size_t queue_capacity = kEncoderQueueCapacity,
      std::chrono::milliseconds ready_timeout = kEncoderJoinTimeout);

  ~SegmentEncoderWorker();

  SegmentEncoderWorker(const SegmentEncoderWorker&) = delete;
  SegmentEncoderWorker& operator=(const SegmentEncoderWorker&) = delete;

  // Blocks while the queue is full. Returns false once the thread has
  // failed; LastError() then says why.
  bool Send(EncodeCommand command);

  // Closes the queue and waits up to timeout for the encoder to drain and
  // write its trailer. Past the timeout the thread is detached. Idempotent.
  WorkerFinishResult Finish(std::chrono::milliseconds timeout = kEncoderJoinTimeout);

  std::string LastError() const;
  const std::filesystem::path& path() const { return path_; }

 private:
  struct Shared;

  SegmentEncoderWorker(std::filesystem::path path, std::shared_ptr<Shared> shared);

  // Thread body.
  static void Run(std::shared_ptr<Shared> shared, SegmentEncoderFactory factory,
                  std::filesystem::path path, std::optional<media::VideoInfo> video,
                  std::optional<media::AudioInfo> audio);

  std::filesystem::path path_;
  std::shared_ptr<Shared> shared_;
  std::thread thread_;
  std::optional<WorkerFinishResult> finish_result_;
};

}  // namespace capkit::mux

#endif  // CAPKIT_MUX_SEGMENT_ENCODER_WORKER_HPP_
