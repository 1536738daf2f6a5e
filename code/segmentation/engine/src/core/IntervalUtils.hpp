#pragma once
#include "models/CoreTypes.hpp"
#include <cstdint>
#include <vector>

namespace gate {

// Pure interval-list stages used by SegmentEngine. Every function takes its
// list by value and returns a sorted, disjoint list with no empty intervals.
class IntervalUtils {
public:
  // (max(0, s - pad), min(duration, e + pad + hold)) for every interval.
  // Output may overlap; empty results are dropped.
  static IntervalList pad_and_hold(IntervalList in, int64_t padding_ms,
                                   int64_t hold_ms, int64_t duration_ms);

  // Sort by start and fold: (s, e) joins the last kept (s', e') when
  // s <= e' + tolerance_ms, giving (s', max(e', e)).
  // Used twice: once with the merge tolerance, once with one frame.
  static IntervalList merge_within(IntervalList in, int64_t tolerance_ms);

  // Cut points 0, s0, e0, s1, e1, ..., duration. The piece between cut i and
  // i + 1 is silence for even i and speech for odd i; zero-length pieces are
  // skipped without renumbering.
  static std::vector<Segment> build_partition(const IntervalList &speech,
                                              int64_t duration_ms);

  // Complement of `in` inside [0, duration_ms].
  static IntervalList complement(const IntervalList &in, int64_t duration_ms);

  static int64_t total_length(const IntervalList &in);

  // true if sorted by start, pairwise disjoint, no empty interval
  static bool is_normalized(const IntervalList &in);
};

} // namespace gate
