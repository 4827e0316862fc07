// Repository: Capkit-recorder
// Component: AudioSourceBuffer
// Purpose: Per-source contiguous audio timeline. Gaps are filled with
//          synthesized silence so the mixing stage never sees a hole.
// Copyright (c) 2025 Capkit

#ifndef CAPKIT_AUDIO_AUDIO_SOURCE_BUFFER_HPP_
#define CAPKIT_AUDIO_AUDIO_SOURCE_BUFFER_HPP_

#include <cstdint>
#include <deque>
#include <optional>
#include <string>
#include <vector>

#include "capkit/media/MediaTypes.hpp"

namespace capkit::audio {

// Gaps and overlaps at or below this are treated as capture jitter.
constexpr int64_t kGapToleranceNs = 1'000'000;

// AudioSourceBuffer holds the frames one source has delivered but the mixer
// has not consumed yet, plus last_end: the end of the most recently buffered
// frame (real or silent). last_end survives Drain(), so coverage stays
// contiguous across ticks.
//
// Every frame it hands out starts exactly at the previous frame's end:
//   - a real frame that starts later than last_end (beyond tolerance) is
//     preceded by silence;
//   - one that starts earlier has its overlapping samples trimmed, or is
//     dropped when fully covered;
//   - jitter within tolerance is re-stamped onto last_end.
//
// Not thread-safe; owned by the mixer tick thread.
class AudioSourceBuffer {
 public:
  AudioSourceBuffer(std::string name, media::AudioInfo info, int64_t buffer_timeout_ns);

  void PushFrame(media::AudioFrame frame);

  // Appends silence from last_end up to target_ns in chunks of at most one
  // buffer timeout, stopping after max_chunks (<= 0: no limit). No-op until
  // the buffer has an anchor. Returns the number of samples synthesized.
  int64_t FillSilenceUntil(int64_t target_ns, int max_chunks = 0);

  // Lines the first buffered frame up with the mixer start: leading silence
  // if it starts later, leading samples trimmed if it starts earlier.
  void AlignStart(int64_t start_ns);

  // For a source that never delivered: anchors the timeline at start_ns and
  // fills silence up to until_ns.
  void BackfillFrom(int64_t start_ns, int64_t until_ns);

  // Hands every buffered frame to the caller, in timeline order.
  std::vector<media::AudioFrame> Drain();

  const std::string& name() const { return name_; }
  const media::AudioInfo& info() const { return info_; }
  int64_t buffer_timeout_ns() const { return buffer_timeout_ns_; }

  bool HasAnchor() const { return last_end_ns_.has_value(); }
  bool IsAligned() const { return aligned_; }
  bool Empty() const { return frames_.empty(); }
  size_t PendingFrames() const { return frames_.size(); }
  std::optional<int64_t> FirstTimestampNs() const;
  std::optional<int64_t> LastEndNs() const { return last_end_ns_; }

  int64_t SilenceSamples() const { return silence_samples_; }
  int64_t TrimmedSamples() const { return trimmed_samples_; }
  int64_t DroppedFrames() const { return dropped_frames_; }

 private:
  int64_t ChunkSamples() const;
  // Appends silence covering [last_end, last_end + nb_samples).
  void AppendSilence(int64_t nb_samples);

  std::string name_;
  media::AudioInfo info_;
  int64_t buffer_timeout_ns_;

  std::deque<media::AudioFrame> frames_;
  std::optional<int64_t> last_end_ns_;
  bool aligned_ = false;

  int64_t silence_samples_ = 0;
  int64_t trimmed_samples_ = 0;
  int64_t dropped_frames_ = 0;
  bool format_warned_ = false;
};

}  // namespace capkit::audio

#endif  // CAPKIT_AUDIO_AUDIO_SOURCE_BUFFER_HPP_
