#include "core/IntervalUtils.hpp"

#include <algorithm>

namespace gate {

IntervalList IntervalUtils::pad_and_hold(IntervalList in, int64_t padding_ms,
                                         int64_t hold_ms,
                                         int64_t duration_ms) {
  // Nothing reaches past the waveform, so larger widths only saturate.
  const int64_t pad = std::min(padding_ms, duration_ms);
  const int64_t hold = std::min(hold_ms, duration_ms);

  IntervalList out;
  out.reserve(in.size());
  for (const auto &iv : in) {
    const int64_t start = std::max<int64_t>(0, iv.start_ms);
    const int64_t end = std::min(iv.end_ms, duration_ms);
    Interval e{std::max<int64_t>(0, start - pad),
               std::min(duration_ms, end + pad + hold)};
    if (!e.empty())
      out.push_back(e);
  }
  return out;
}

IntervalList IntervalUtils::merge_within(IntervalList in,
                                         int64_t tolerance_ms) {
  std::stable_sort(in.begin(), in.end(),
                   [](const Interval &a, const Interval &b) {
                     if (a.start_ms != b.start_ms)
                       return a.start_ms < b.start_ms;
                     return a.end_ms < b.end_ms;
                   });
  IntervalList merged;
  merged.reserve(in.size());
  for (const auto &iv : in) {
    if (iv.empty())
      continue;
    if (!merged.empty() && iv.start_ms - merged.back().end_ms <= tolerance_ms) {
      merged.back().end_ms = std::max(merged.back().end_ms, iv.end_ms);
    } else {
      merged.push_back(iv);
    }
  }
  return merged;
}

std::vector<Segment> IntervalUtils::build_partition(const IntervalList &speech,
                                                    int64_t duration_ms) {
  std::vector<int64_t> cuts;
  cuts.reserve(speech.size() * 2 + 2);
  cuts.push_back(0);
  for (const auto &iv : speech) {
    cuts.push_back(iv.start_ms);
    cuts.push_back(iv.end_ms);
  }
  cuts.push_back(duration_ms);

  std::vector<Segment> segs;
  segs.reserve(cuts.size());
  for (std::size_t i = 0; i + 1 < cuts.size(); ++i) {
    const int64_t a = cuts[i];
    const int64_t b = cuts[i + 1];
    if (b <= a)
      continue;
    segs.push_back(Segment{a / 1000.0, b / 1000.0, i % 2 == 0});
  }
  return segs;
}

IntervalList IntervalUtils::complement(const IntervalList &in,
                                       int64_t duration_ms) {
  IntervalList out;
  int64_t cur = 0;
  for (const auto &iv : in) {
    if (iv.start_ms > cur)
      out.push_back({cur, std::min(iv.start_ms, duration_ms)});
    cur = std::max(cur, iv.end_ms);
    if (cur >= duration_ms)
      break;
  }
  if (cur < duration_ms)
    out.push_back({cur, duration_ms});
  return out;
}

int64_t IntervalUtils::total_length(const IntervalList &in) {
  int64_t sum = 0;
  for (const auto &iv : in)
    sum += iv.length();
  return sum;
}

bool IntervalUtils::is_normalized(const IntervalList &in) {
  for (std::size_t i = 0; i < in.size(); ++i) {
    if (in[i].empty())
      return false;
    if (i > 0 && in[i].start_ms < in[i - 1].end_ms)
      return false;
  }
  return true;
}

} // namespace gate
