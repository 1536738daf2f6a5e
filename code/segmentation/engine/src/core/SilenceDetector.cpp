#include "core/SilenceDetector.hpp"

#include "core/IntervalUtils.hpp"
#include "core/energy/RollingEnergy.hpp"
#include <stdexcept>
#include <vector>

namespace gate {

IntervalList SilenceDetector::silent_ranges(const Waveform &w) const {
  if (min_silence_ms_ <= 0 || seek_step_ms_ <= 0)
    throw std::invalid_argument("min_silence_ms and seek_step_ms must be > 0");

  IntervalList ranges;
  const int64_t len = w.duration_ms;
  if (len < min_silence_ms_)
    return ranges;

  RollingEnergyCalculator energy(w);
  const double thr = db_to_amplitude(threshold_db_);
  const int64_t last_start = len - min_silence_ms_;

  std::vector<int64_t> silent_starts;
  auto probe = [&](int64_t start) {
    if (energy.rms(start, start + min_silence_ms_) <= thr)
      silent_starts.push_back(start);
  };
  for (int64_t start = 0; start <= last_start; start += seek_step_ms_)
    probe(start);
  // the tail window is always probed, even off the step grid
  if (last_start % seek_step_ms_ != 0)
    probe(last_start);

  if (silent_starts.empty())
    return ranges;

  // Join window starts into ranges. A start opens a new range only if it is
  // not exactly one step after the previous silent start AND leaves a gap
  // after the previous window.
  int64_t prev = silent_starts.front();
  int64_t range_start = prev;
  for (int64_t start : silent_starts) {
    const bool continuous = (start - prev == seek_step_ms_);
    const bool has_gap = start - prev > min_silence_ms_;
    if (!continuous && has_gap) {
      ranges.push_back({range_start, prev + min_silence_ms_});
      range_start = start;
    }
    prev = start;
  }
  ranges.push_back({range_start, prev + min_silence_ms_});
  return ranges;
}

IntervalList SilenceDetector::nonsilent(const Waveform &w) const {
  return IntervalUtils::complement(silent_ranges(w), w.duration_ms);
}

} // namespace gate
