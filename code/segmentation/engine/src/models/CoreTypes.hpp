#pragma once

#include <cmath>
#include <cstddef>
#include <cstdint>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <vector>

using Json = nlohmann::json;

namespace gate {

// Decoded audio handed to the engine by a WaveformSource. One amplitude value
// per frame (multichannel input is already reduced to a single signal), full
// scale = 1.0. Owned by the caller, read-only for the engine.
struct Waveform {
  std::vector<float> samples;
  int sample_rate = 0;
  int64_t duration_ms = 0;
  std::string source; // path or label, only used for logs
};

// round(1000 * frames / rate), the length of a waveform in milliseconds.
// Halves round to even.
inline int64_t duration_ms_for(std::size_t frames, int sample_rate) {
  if (sample_rate <= 0)
    return 0;
  return static_cast<int64_t>(
      std::nearbyint(1000.0 * static_cast<double>(frames) / sample_rate));
}

// A [start_ms, end_ms) span of the timeline. Stage outputs only ever hold
// intervals with start_ms < end_ms.
struct Interval {
  int64_t start_ms = 0;
  int64_t end_ms = 0;

  int64_t length() const noexcept { return end_ms - start_ms; }
  bool empty() const noexcept { return end_ms <= start_ms; }

  bool operator==(const Interval &o) const noexcept {
    return start_ms == o.start_ms && end_ms == o.end_ms;
  }
  bool operator!=(const Interval &o) const noexcept { return !(*this == o); }
};

// Sorted by start, pairwise disjoint after every pipeline stage.
using IntervalList = std::vector<Interval>;

// Output unit of the engine: a classified, gapless piece of the timeline.
struct Segment {
  double start_sec = 0.0;
  double end_sec = 0.0;
  bool is_silence = false;
  // Frame numbers carried by a segment file written with fps; they win over
  // the seconds when clips are planned.
  std::optional<int64_t> start_frame;
  std::optional<int64_t> end_frame;

  double duration_sec() const noexcept { return end_sec - start_sec; }
};

} // namespace gate
