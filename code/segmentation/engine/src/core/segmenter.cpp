// SegmentEngine runs the silence gate pipeline over one waveform.

#include "segmenter.hpp"

#include "core/IntervalUtils.hpp"
#include "core/SilenceDetector.hpp"
#include "debug/log.hpp"
#include <string>
#include <utility>

namespace gate {

std::vector<Segment> SegmentEngine::run(const Waveform &w, Trace *trace) const {
  P.validate();

  // 1) Non-silence detection
  SilenceDetector detector(P);
  IntervalList raw = detector.nonsilent(w);
  log::debug("engine", w.source + ": " + std::to_string(raw.size()) +
                           " raw intervals over " +
                           std::to_string(w.duration_ms) + " ms");

  // 2..5) Interval post-processing and partition
  return segment_intervals(std::move(raw), w.duration_ms, trace);
}

std::vector<Segment> SegmentEngine::segment_intervals(IntervalList raw,
                                                      int64_t duration_ms,
                                                      Trace *trace) const {
  P.validate();
  if (trace)
    trace->raw = raw;

  // 2) Padding and trailing hold, clamped to the waveform
  IntervalList padded =
      IntervalUtils::pad_and_hold(std::move(raw), P.padding_ms, P.hold_ms,
                                  duration_ms);
  if (trace)
    trace->padded = padded;

  // 3) Overlap merge with acoustic slack
  IntervalList merged =
      IntervalUtils::merge_within(std::move(padded), P.merge_tolerance_ms);
  if (trace)
    trace->merged = merged;

  // 4) Swallow gaps no longer than one video frame
  IntervalList coalesced =
      IntervalUtils::merge_within(std::move(merged), P.frame_ms());
  if (trace)
    trace->coalesced = coalesced;

  log::debug("engine", "speech intervals after coalescing: " +
                           std::to_string(coalesced.size()) + ", " +
                           std::to_string(IntervalUtils::total_length(coalesced)) +
                           " ms of speech (frame_ms=" +
                           std::to_string(P.frame_ms()) + ")");

  // 5) Alternating partition
  return IntervalUtils::build_partition(coalesced, duration_ms);
}

} // namespace gate
