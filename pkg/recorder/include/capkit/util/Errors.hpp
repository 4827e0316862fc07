// Repository: Capkit-recorder
// Component: Error Taxonomy
// Purpose: Exception types shared by the mixer, muxers and pipeline.
// Copyright (c) 2025 Capkit

#ifndef CAPKIT_UTIL_ERRORS_HPP_
#define CAPKIT_UTIL_ERRORS_HPP_

#include <stdexcept>
#include <string>

namespace capkit {

// Fatal, synchronous. Raised by builders and Setup() before any task runs;
// whatever was partially constructed has already been torn down.
class SetupError : public std::runtime_error {
 public:
  explicit SetupError(const std::string& what) : std::runtime_error(what) {}
};

// Mid-recording encode/write/channel failure. The offending task logs it and
// exits; data written up to that point stays valid.
class StreamError : public std::runtime_error {
 public:
  explicit StreamError(const std::string& what) : std::runtime_error(what) {}
};

// Clock regression or negative adjusted timestamp. Never clamped.
class TimestampInvariantViolation : public std::logic_error {
 public:
  explicit TimestampInvariantViolation(const std::string& what)
      : std::logic_error(what) {}
};

}  // namespace capkit

#endif  // CAPKIT_UTIL_ERRORS_HPP_
