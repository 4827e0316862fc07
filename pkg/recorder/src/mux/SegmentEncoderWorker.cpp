// Repository: Capkit-recorder
// Component: SegmentEncoderWorker
// Purpose: Dedicated OS thread owning one segment encoder.
// Copyright (c) 2025 Capkit

#include "capkit/mux/SegmentEncoderWorker.hpp"

#include <condition_variable>
#include <future>
#include <mutex>

#include "capkit/util/BoundedChannel.hpp"
#include "capkit/util/Errors.hpp"
#include "capkit/util/Logger.hpp"

namespace capkit::mux {

struct SegmentEncoderWorker::Shared {
  explicit Shared(size_t capacity) : queue(capacity) {}

  util::BoundedChannel<EncodeCommand> queue;
  std::promise<std::string> ready;

  std::mutex mutex;
  std::condition_variable cv;
  bool done = false;
  bool ok = false;
  std::string error;

  void SetError(const std::string& e) {
    std::lock_guard<std::mutex> lock(mutex);
    if (error.empty()) error = e;
  }
};

SegmentEncoderWorker::SegmentEncoderWorker(std::filesystem::path path,
                                           std::shared_ptr<Shared> shared)
    : path_(std::move(path)), shared_(std::move(shared)) {}

std::unique_ptr<SegmentEncoderWorker> SegmentEncoderWorker::Spawn(
    const SegmentEncoderFactory& factory, const std::filesystem::path& path,
    const std::optional<media::VideoInfo>& video, const std::optional<media::AudioInfo>& audio,
    size_t queue_capacity, std::chrono::milliseconds ready_timeout) {
  auto shared = std::make_shared<Shared>(queue_capacity);
  std::future<std::string> ready = shared->ready.get_future();

  std::unique_ptr<SegmentEncoderWorker> worker(new SegmentEncoderWorker(path, shared));
  worker->thread_ = std::thread(&SegmentEncoderWorker::Run, shared, factory, path, video, audio);

  if (ready.wait_for(ready_timeout) != std::future_status::ready) {
    shared->queue.Close();
    worker->thread_.detach();
    worker->finish_result_ = WorkerFinishResult{false, false, "encoder never became ready"};
    throw StreamError("[SegmentEncoderWorker] Encoder for " + path.filename().string() +
                      " did not become ready within " + std::to_string(ready_timeout.count()) +
                      "ms");
  }
  const std::string error = ready.get();
  if (!error.empty()) {
    worker->thread_.join();
    worker->finish_result_ = WorkerFinishResult{true, false, error};
    throw StreamError("[SegmentEncoderWorker] Failed to open " + path.filename().string() +
                      ": " + error);
  }
  return worker;
}

SegmentEncoderWorker::~SegmentEncoderWorker() {
  if (!finish_result_) {
    Finish();
  }
}

bool SegmentEncoderWorker::Send(EncodeCommand command) {
  return shared_->queue.Send(std::move(command));
}

std::string SegmentEncoderWorker::LastError() const {
  std::lock_guard<std::mutex> lock(shared_->mutex);
  return shared_->error;
}

WorkerFinishResult SegmentEncoderWorker::Finish(std::chrono::milliseconds timeout) {
  if (finish_result_) return *finish_result_;

  shared_->queue.Close();

  WorkerFinishResult result;
  bool done = false;
  {
    std::unique_lock<std::mutex> lock(shared_->mutex);
    done = shared_->cv.wait_for(lock, timeout, [this] { return shared_->done; });
    result.ok = shared_->ok;
    result.error = shared_->error;
  }

  if (done) {
    if (thread_.joinable()) thread_.join();
    result.joined = true;
  } else {
    if (thread_.joinable()) thread_.detach();
    result.joined = false;
    result.ok = false;
    result.error = "encoder thread did not finish within " + std::to_string(timeout.count()) +
                   "ms; abandoned";
    util::Logger::Warn("[SegmentEncoderWorker] " + path_.filename().string() + ": " +
                       result.error);
  }
  finish_result_ = result;
  return result;
}

void SegmentEncoderWorker::Run(std::shared_ptr<Shared> shared, SegmentEncoderFactory factory,
                               std::filesystem::path path, std::optional<media::VideoInfo> video,
                               std::optional<media::AudioInfo> audio) {
  std::unique_ptr<ISegmentEncoder> encoder;
  std::string error;
  try {
    encoder = factory();
  } catch (const std::exception& e) {
    error = e.what();
  }
  if (!encoder && error.empty()) {
    error = "encoder factory returned nothing";
  }
  if (encoder && !encoder->Open(path, video, audio, &error)) {
    if (error.empty()) error = "open failed";
    encoder.reset();
  }
  if (!encoder) {
    shared->queue.Close();
    {
      std::lock_guard<std::mutex> lock(shared->mutex);
      shared->done = true;
      shared->ok = false;
      shared->error = error;
    }
    shared->cv.notify_all();
    shared->ready.set_value(error);
    return;
  }
  shared->ready.set_value(std::string());

  bool ok = true;
  while (auto command = shared->queue.Recv()) {
    if (!ok) continue;
    std::string write_error;
    bool written = false;
    if (auto* v = std::get_if<EncodeVideo>(&*command)) {
      written = encoder->WriteVideo(v->frame, v->pts_ns, &write_error);
    } else if (auto* a = std::get_if<EncodeAudio>(&*command)) {
      written = encoder->WriteAudio(a->frame, a->pts_ns, &write_error);
    }
    if (!written) {
      ok = false;
      shared->SetError(write_error.empty() ? "write failed" : write_error);
      util::Logger::Error("[SegmentEncoderWorker] " + path.filename().string() +
                          ": write failed: " + write_error);
      // Producers see the failure on their next Send().
      shared->queue.Close();
    }
  }

  // The trailer is attempted even after a write failure so the frames
  // already encoded stay playable.
  std::string finish_error;
  if (!encoder->Finish(&finish_error)) {
    ok = false;
    shared->SetError(finish_error.empty() ? "finish failed" : finish_error);
    util::Logger::Error("[SegmentEncoderWorker] " + path.filename().string() +
                        ": finish failed: " + finish_error);
  }
  encoder.reset();

  {
    std::lock_guard<std::mutex> lock(shared->mutex);
    shared->done = true;
    shared->ok = ok;
  }
  shared->cv.notify_all();
}

}  // namespace capkit::mux
