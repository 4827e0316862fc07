// Repository: Capkit-recorder
// Component: Thread-Safe Logger
// Purpose: Mutex-protected log emission shared by mixer, muxer and pipeline threads.
// Copyright (c) 2025 Capkit

#ifndef CAPKIT_UTIL_LOGGER_HPP_
#define CAPKIT_UTIL_LOGGER_HPP_

#include <functional>
#include <mutex>
#include <string>

namespace capkit::util {

// Logger provides thread-safe log emission with a single static mutex.
// Each call acquires the mutex, writes the full line, appends '\n', and
// flushes, so lines from the mixer tick thread, segment encoder threads and
// forwarding tasks never interleave.
//
// Info  → stdout (normal operational logs)
// Debug → stdout only when CAPKIT_DEBUG env is set
// Warn  → stderr (degraded but recoverable conditions, recovery skips)
// Error → stderr (stream failures, invariant violations)
//
// Test-only: the sinks receive every line of their level in addition to the
// console. Pass nullptr to clear.
class Logger {
 public:
  using Sink = std::function<void(const std::string&)>;

  static void Info(const std::string& line);
  static void Debug(const std::string& line);
  static void Warn(const std::string& line);
  static void Error(const std::string& line);

  static void SetInfoSink(Sink sink);
  static void SetWarnSink(Sink sink);
  static void SetErrorSink(Sink sink);

 private:
  static bool DebugEnabled();

  static std::mutex mutex_;
  static Sink info_sink_;
  static Sink warn_sink_;
  static Sink error_sink_;
};

}  // namespace capkit::util

#endif  // CAPKIT_UTIL_LOGGER_HPP_
