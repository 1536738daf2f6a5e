#pragma once
#include "models/CoreTypes.hpp"
#include "models/params.hpp"

namespace gate {

// Energy-threshold detector. A window of min_silence_ms is silent when its
// RMS is at or below the dBFS floor; windows are probed every seek_step_ms.
class SilenceDetector {
public:
  explicit SilenceDetector(const GateParams &p)
      : threshold_db_(p.silence_threshold_db),
        min_silence_ms_(p.min_silence_ms), seek_step_ms_(p.seek_step_ms) {}

  // Maximal runs of silence, sorted, disjoint, within [0, duration].
  IntervalList silent_ranges(const Waveform &w) const;

  // Complement of silent_ranges(). [0, duration] when nothing is silent,
  // empty when everything is.
  IntervalList nonsilent(const Waveform &w) const;

private:
  double threshold_db_;
  int64_t min_silence_ms_;
  int64_t seek_step_ms_;
};

} // namespace gate
