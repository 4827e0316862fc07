// Repository: Capkit-recorder
// Component: AudioSourceBuffer
// Purpose: Silence synthesis, overlap trimming and start alignment for one
//          mixer input.
// Copyright (c) 2025 Capkit

#include "capkit/audio/AudioSourceBuffer.hpp"

#include <algorithm>
#include <sstream>

#include "capkit/util/Logger.hpp"

namespace capkit::audio {

using media::AudioFrame;

AudioSourceBuffer::AudioSourceBuffer(std::string name, media::AudioInfo info,
                                     int64_t buffer_timeout_ns)
    : name_(std::move(name)), info_(info), buffer_timeout_ns_(buffer_timeout_ns) {}

int64_t AudioSourceBuffer::ChunkSamples() const {
  return std::max<int64_t>(1, media::NsToSamples(buffer_timeout_ns_, info_.sample_rate));
}

void AudioSourceBuffer::AppendSilence(int64_t nb_samples) {
  const int64_t chunk = ChunkSamples();
  while (nb_samples > 0) {
    const int64_t n = std::min(nb_samples, chunk);
    AudioFrame silence = media::MakeSilentFrame(info_, static_cast<int>(n), *last_end_ns_);
    last_end_ns_ = silence.EndNs();
    frames_.push_back(std::move(silence));
    silence_samples_ += n;
    nb_samples -= n;
  }
}

std::optional<int64_t> AudioSourceBuffer::FirstTimestampNs() const {
  if (frames_.empty()) return std::nullopt;
  return frames_.front().timestamp_ns;
}

void AudioSourceBuffer::PushFrame(AudioFrame frame) {
  if (frame.nb_samples <= 0) return;
  if (frame.Info() != info_) {
    if (!format_warned_) {
      std::ostringstream oss;
      oss << "[AudioMixer] Source '" << name_ << "' delivered "
          << media::SampleFormatName(frame.sample_format) << "/" << frame.sample_rate << "Hz/"
          << frame.channels << "ch, registered as "
          << media::SampleFormatName(info_.sample_format) << "/" << info_.sample_rate << "Hz/"
          << info_.channels << "ch; dropping mismatched frames";
      util::Logger::Warn(oss.str());
      format_warned_ = true;
    }
    ++dropped_frames_;
    return;
  }

  if (last_end_ns_) {
    const int64_t delta = frame.timestamp_ns - *last_end_ns_;
    if (delta > kGapToleranceNs) {
      AppendSilence(media::NsToSamples(delta, info_.sample_rate));
    } else if (delta < -kGapToleranceNs) {
      const int64_t overlap = media::NsToSamples(-delta, info_.sample_rate);
      if (overlap >= frame.nb_samples) {
        ++dropped_frames_;
        return;
      }
      TrimLeadingSamples(frame, static_cast<int>(overlap));
      trimmed_samples_ += overlap;
    }
    frame.timestamp_ns = *last_end_ns_;
  }

  last_end_ns_ = frame.EndNs();
  frames_.push_back(std::move(frame));
}

int64_t AudioSourceBuffer::FillSilenceUntil(int64_t target_ns, int max_chunks) {
  if (!last_end_ns_) return 0;
  const int64_t gap = target_ns - *last_end_ns_;
  if (gap <= kGapToleranceNs) return 0;

  int64_t needed = media::NsToSamples(gap, info_.sample_rate);
  if (max_chunks > 0) {
    needed = std::min(needed, ChunkSamples() * max_chunks);
  }
  AppendSilence(needed);
  return needed;
}

void AudioSourceBuffer::AlignStart(int64_t start_ns) {
  if (aligned_ || frames_.empty()) return;
  aligned_ = true;

  const int64_t first = frames_.front().timestamp_ns;
  if (first - start_ns > kGapToleranceNs) {
    // Build leading silence back to start, newest chunk first.
    int64_t remaining = media::NsToSamples(first - start_ns, info_.sample_rate);
    const int64_t chunk = ChunkSamples();
    int64_t cursor_end = first;
    while (remaining > 0) {
      const int64_t n = std::min(remaining, chunk);
      const int64_t ts = cursor_end - media::SamplesToNs(n, info_.sample_rate);
      frames_.push_front(media::MakeSilentFrame(info_, static_cast<int>(n), ts));
      silence_samples_ += n;
      remaining -= n;
      cursor_end = ts;
    }
    return;
  }

  if (start_ns - first > kGapToleranceNs) {
    while (!frames_.empty() && frames_.front().EndNs() <= start_ns) {
      trimmed_samples_ += frames_.front().nb_samples;
      frames_.pop_front();
      ++dropped_frames_;
    }
    if (!frames_.empty() && frames_.front().timestamp_ns < start_ns) {
      const int64_t cut =
          media::NsToSamples(start_ns - frames_.front().timestamp_ns, info_.sample_rate);
      if (TrimLeadingSamples(frames_.front(), static_cast<int>(cut))) {
        trimmed_samples_ += cut;
      }
    }
    if (frames_.empty()) {
      last_end_ns_ = start_ns;
    }
  }
}

void AudioSourceBuffer::BackfillFrom(int64_t start_ns, int64_t until_ns) {
  if (last_end_ns_) return;
  last_end_ns_ = start_ns;
  aligned_ = true;
  FillSilenceUntil(until_ns);
  std::ostringstream oss;
  oss << "[AudioMixer] Source '" << name_ << "' has not delivered; back-filled "
      << silence_samples_ << " samples of silence from start";
  util::Logger::Debug(oss.str());
}

std::vector<AudioFrame> AudioSourceBuffer::Drain() {
  std::vector<AudioFrame> out;
  out.reserve(frames_.size());
  while (!frames_.empty()) {
    out.push_back(std::move(frames_.front()));
    frames_.pop_front();
  }
  return out;
}

}  // namespace capkit::audio
