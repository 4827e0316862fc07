// Repository: Capkit-recorder
// Component: AudioResampler
// Purpose: libswresample wrapper for mixer inputs.
// Copyright (c) 2025 Capkit

#include "capkit/audio/AudioResampler.hpp"

#include <algorithm>
#include <cstring>
#include <sstream>

extern "C" {
#include <libavutil/channel_layout.h>
#include <libavutil/mathematics.h>
#include <libswresample/swresample.h>
}

#include "capkit/util/Errors.hpp"
#include "capkit/util/Logger.hpp"
#include "media/FfmpegFormats.hpp"

namespace capkit::audio {

AudioResampler::AudioResampler(const media::AudioInfo& input) : input_(input) {
  if (input.sample_rate <= 0 || input.channels <= 0) {
    std::ostringstream oss;
    oss << "[AudioResampler] Invalid input format: " << input.sample_rate << "Hz/"
        << input.channels << "ch";
    throw SetupError(oss.str());
  }
  if (input == media::MixerOutputInfo()) {
    return;
  }

  AVChannelLayout src_ch_layout;
  AVChannelLayout dst_ch_layout;
  av_channel_layout_default(&src_ch_layout, input.channels);
  av_channel_layout_default(&dst_ch_layout, media::kMixerChannels);

  int ret = swr_alloc_set_opts2(&swr_ctx_,
                                &dst_ch_layout, AV_SAMPLE_FMT_FLT, media::kMixerSampleRate,
                                &src_ch_layout, media::ToAVSampleFormat(input.sample_format),
                                input.sample_rate, 0, nullptr);
  av_channel_layout_uninit(&src_ch_layout);
  av_channel_layout_uninit(&dst_ch_layout);
  if (ret < 0) {
    swr_free(&swr_ctx_);
    throw SetupError("[AudioResampler] Failed to set resampler options: " + media::AvErrorString(ret));
  }

  ret = swr_init(swr_ctx_);
  if (ret < 0) {
    swr_free(&swr_ctx_);
    throw SetupError("[AudioResampler] Failed to initialize resampler: " + media::AvErrorString(ret));
  }

  std::ostringstream oss;
  oss << "[AudioResampler] Creating audio resampler: "
      << media::SampleFormatName(input.sample_format) << "/" << input.sample_rate << "Hz/"
      << input.channels << "ch -> f32/" << media::kMixerSampleRate << "Hz/"
      << media::kMixerChannels << "ch";
  util::Logger::Debug(oss.str());
}

AudioResampler::~AudioResampler() {
  if (swr_ctx_) {
    swr_free(&swr_ctx_);
  }
}

void AudioResampler::Convert(const media::AudioFrame& frame, std::vector<float>& out) {
  if (frame.nb_samples <= 0) return;

  if (!swr_ctx_) {
    const size_t count = static_cast<size_t>(frame.nb_samples) * media::kMixerChannels;
    const size_t offset = out.size();
    out.resize(offset + count, 0.0f);
    if (!frame.planes.empty()) {
      std::memcpy(out.data() + offset, frame.planes[0].data(),
                  std::min(count * sizeof(float), frame.planes[0].size()));
    }
    return;
  }

  const int dst_nb_samples = static_cast<int>(
      av_rescale_rnd(swr_get_delay(swr_ctx_, input_.sample_rate) + frame.nb_samples,
                     media::kMixerSampleRate, input_.sample_rate, AV_ROUND_UP));

  const uint8_t* in_data[AV_NUM_DATA_POINTERS] = {nullptr};
  for (size_t i = 0; i < frame.planes.size() && i < AV_NUM_DATA_POINTERS; ++i) {
    in_data[i] = frame.planes[i].data();
  }

  const size_t offset = out.size();
  out.resize(offset + static_cast<size_t>(dst_nb_samples) * media::kMixerChannels);
  uint8_t* out_data[1] = {reinterpret_cast<uint8_t*>(out.data() + offset)};

  const int ret = swr_convert(swr_ctx_, out_data, dst_nb_samples, in_data, frame.nb_samples);
  if (ret < 0) {
    out.resize(offset);
    throw StreamError("[AudioResampler] Resampling failed: " + media::AvErrorString(ret));
  }
  out.resize(offset + static_cast<size_t>(ret) * media::kMixerChannels);
}

void AudioResampler::Flush(std::vector<float>& out) {
  if (!swr_ctx_) return;
  const int pending = static_cast<int>(
      av_rescale_rnd(swr_get_delay(swr_ctx_, input_.sample_rate), media::kMixerSampleRate,
                     input_.sample_rate, AV_ROUND_UP));
  if (pending <= 0) return;

  const size_t offset = out.size();
  out.resize(offset + static_cast<size_t>(pending) * media::kMixerChannels);
  uint8_t* out_data[1] = {reinterpret_cast<uint8_t*>(out.data() + offset)};
  const int ret = swr_convert(swr_ctx_, out_data, pending, nullptr, 0);
  if (ret < 0) {
    out.resize(offset);
    util::Logger::Warn("[AudioResampler] Flush failed: " + media::AvErrorString(ret));
    return;
  }
  out.resize(offset + static_cast<size_t>(ret) * media::kMixerChannels);
}

}  // namespace capkit::audio
