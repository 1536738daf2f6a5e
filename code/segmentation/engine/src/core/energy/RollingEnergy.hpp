#pragma once
#include "models/CoreTypes.hpp"
#include <cstddef>
#include <cstdint>
#include <vector>

namespace gate {

// Window RMS over a Waveform at millisecond resolution.
//
// All window edges used by the detector fall on whole milliseconds, so the
// calculator keeps one running sum of squares per millisecond boundary
// instead of one per sample: prefix_[k] = sum of x^2 over frames
// [0, frame_at(k)). Any window [a, b) then costs two lookups.
class RollingEnergyCalculator {
public:
  explicit RollingEnergyCalculator(const Waveform &w);

  // RMS of frames [frame_at(start_ms), frame_at(end_ms)); 0 for an empty
  // window. Bounds are clamped to the waveform.
  double rms(int64_t start_ms, int64_t end_ms) const;

  // 20*log10(rms), or kFloorDb when the window is digital silence.
  double dbfs(int64_t start_ms, int64_t end_ms) const;

  // floor(ms * rate / 1000) clamped to [0, frames]
  std::size_t frame_at(int64_t ms) const;

  int64_t duration_ms() const noexcept { return duration_ms_; }

  static constexpr double kFloorDb = -120.0;

private:
  std::vector<double> prefix_;
  std::size_t frames_ = 0;
  int rate_ = 0;
  int64_t duration_ms_ = 0;
};

// 10^(db/20), full scale = 1.0
double db_to_amplitude(double db);

} // namespace gate
