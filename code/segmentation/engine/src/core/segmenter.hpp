#pragma once
#include "models/CoreTypes.hpp"
#include "models/params.hpp"
#include <vector>
// Main entry of the silence gate engine.
//
// SegmentEngine
//------------------------------------------------------------------------------
// detect -> pad/hold -> merge -> one-frame coalesce -> alternating partition.
// Stateless across calls: one engine may serve any number of threads.
namespace gate {

class SegmentEngine {
public:
  explicit SegmentEngine(GateParams p = GateParams{}) : P(p) {}

  const GateParams &params() const noexcept { return P; }

  // Intermediate interval lists, filled on request for logs and the lab.
  struct Trace {
    IntervalList raw;
    IntervalList padded;
    IntervalList merged;
    IntervalList coalesced;
  };

  // Throws std::invalid_argument on bad params.
  std::vector<Segment> run(const Waveform &w, Trace *trace = nullptr) const;

  // Everything after detection, for callers that already have raw
  // non-silent intervals.
  std::vector<Segment> segment_intervals(IntervalList raw, int64_t duration_ms,
                                         Trace *trace = nullptr) const;

private:
  GateParams P;
};

} // namespace gate
