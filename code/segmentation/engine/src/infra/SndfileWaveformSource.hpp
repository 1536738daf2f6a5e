#pragma once
#include "core/WaveformSource.hpp"
#include <cstddef>

namespace gate {

// libsndfile-backed source: any container/codec libsndfile can open (WAV,
// AIFF, FLAC, OGG, ...). Channels are reduced to one signal with the
// per-frame quadratic mean sqrt(mean_c x_c^2), which keeps window RMS equal to
// the RMS over all channel samples.
class SndfileWaveformSource final : public WaveformSource {
public:
  explicit SndfileWaveformSource(std::size_t block_frames = 64 * 1024)
      : block_frames_(block_frames) {}

  Waveform load(const std::string &path) const override;
  bool exists(const std::string &path) const override;

private:
  std::size_t block_frames_;
};

} // namespace gate
