// Repository: Capkit-recorder
// Component: Thread-Safe Logger
// Purpose: Mutex-protected log emission shared by mixer, muxer and pipeline threads.
// Copyright (c) 2025 Capkit

#include "capkit/util/Logger.hpp"

#include <cstdlib>
#include <iostream>
#include <utility>

namespace capkit::util {

namespace {

// Caller holds Logger's mutex.
void Emit(std::ostream& out, const Logger::Sink& sink, const std::string& line) {
  if (sink) sink(line);
  out << line << '\n';
  out.flush();
}

}  // namespace

std::mutex Logger::mutex_;
Logger::Sink Logger::info_sink_;
Logger::Sink Logger::warn_sink_;
Logger::Sink Logger::error_sink_;

bool Logger::DebugEnabled() {
  // Read once per process.
  static const bool enabled = std::getenv("CAPKIT_DEBUG") != nullptr;
  return enabled;
}

void Logger::SetInfoSink(Sink sink) {
  std::lock_guard<std::mutex> lock(mutex_);
  info_sink_ = std::move(sink);
}

void Logger::SetWarnSink(Sink sink) {
  std::lock_guard<std::mutex> lock(mutex_);
  warn_sink_ = std::move(sink);
}

void Logger::SetErrorSink(Sink sink) {
  std::lock_guard<std::mutex> lock(mutex_);
  error_sink_ = std::move(sink);
}

void Logger::Info(const std::string& line) {
  std::lock_guard<std::mutex> lock(mutex_);
  Emit(std::cout, info_sink_, line);
}

void Logger::Debug(const std::string& line) {
  if (!DebugEnabled()) return;
  std::lock_guard<std::mutex> lock(mutex_);
  Emit(std::cout, Sink(), line);
}

void Logger::Warn(const std::string& line) {
  std::lock_guard<std::mutex> lock(mutex_);
  Emit(std::cerr, warn_sink_, line);
}

void Logger::Error(const std::string& line) {
  std::lock_guard<std::mutex> lock(mutex_);
  Emit(std::cerr, error_sink_, line);
}

}  // namespace capkit::util
