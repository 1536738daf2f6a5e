#include "core/IntervalUtils.hpp"
#include "test_support.hpp"

#include <limits>

using gate::Interval;
using gate::IntervalList;
using gate::IntervalUtils;

int main() {
  bool ok = true;

  // ---- pad_and_hold ----
  {
    auto out = IntervalUtils::pad_and_hold({{1000, 2000}}, 100, 50, 10000);
    ok &= expect(out.size() == 1 && out[0] == Interval{900, 2150},
                 "pad widens both sides and hold extends only the end");
  }
  {
    auto out = IntervalUtils::pad_and_hold({{50, 100}, {9950, 10000}}, 100,
                                           500, 10000);
    ok &= expect(out.size() == 2, "two clamped intervals");
    ok &= expect(out[0] == Interval{0, 700}, "start clamps at zero");
    ok &= expect(out[1] == Interval{9850, 10000}, "end clamps at duration");
  }
  {
    auto out = IntervalUtils::pad_and_hold({{10500, 11000}}, 100, 0, 10000);
    ok &= expect(out.empty(), "interval past the end collapses and is dropped");
  }
  {
    auto out = IntervalUtils::pad_and_hold({{1000, 2000}, {1500, 2500}}, 0, 0,
                                           10000);
    ok &= expect(out.size() == 2, "pad_and_hold leaves overlaps to the merge");
  }

  {
    const int64_t big = std::numeric_limits<int64_t>::max() / 2;
    auto out = IntervalUtils::pad_and_hold({{100, 200}}, big, big, 1000);
    ok &= expect(out.size() == 1 && out[0] == Interval{0, 1000},
                 "huge pad and hold saturate at the waveform");
  }

  // ---- merge_within ----
  {
    IntervalList in = {{3000, 4000}, {1000, 2000}, {2050, 2500}};
    auto out = IntervalUtils::merge_within(in, 50);
    ok &= expect(out.size() == 2, "gap of exactly the tolerance merges");
    ok &= expect(out[0] == Interval{1000, 2500}, "merged span");
    ok &= expect(out[1] == Interval{3000, 4000}, "distant span kept");
  }
  {
    auto out = IntervalUtils::merge_within({{1000, 2000}, {2051, 2500}}, 50);
    ok &= expect(out.size() == 2, "gap one past the tolerance stays open");
  }
  {
    auto out = IntervalUtils::merge_within({{1000, 2000}, {2000, 3000}}, 0);
    ok &= expect(out.size() == 1 && out[0] == Interval{1000, 3000},
                 "touching intervals merge with zero tolerance");
  }
  {
    auto out = IntervalUtils::merge_within({{0, 5000}, {1000, 2000}}, 0);
    ok &= expect(out.size() == 1 && out[0] == Interval{0, 5000},
                 "contained interval does not shorten the span");
  }
  {
    auto out = IntervalUtils::merge_within(
        {{0, 10}, {500, 600}}, std::numeric_limits<int64_t>::max());
    ok &= expect(out.size() == 1 && out[0] == Interval{0, 600},
                 "int64 max tolerance joins everything");
  }
  {
    auto out = IntervalUtils::merge_within({}, 100);
    ok &= expect(out.empty(), "empty list stays empty");
  }
  {
    IntervalList in = {{5, 9}, {0, 3}, {20, 30}, {12, 14}};
    auto once = IntervalUtils::merge_within(in, 2);
    auto twice = IntervalUtils::merge_within(once, 2);
    ok &= expect(once == twice, "merge is idempotent");
    ok &= expect(IntervalUtils::is_normalized(once), "merge output normalized");
  }

  // ---- build_partition ----
  {
    auto segs = IntervalUtils::build_partition({{0, 1000}, {2000, 3000}}, 3000);
    ok &= expect(segs.size() == 3, "edge-touching speech gives three pieces");
    ok &= expect(!segs[0].is_silence && segs[1].is_silence &&
                     !segs[2].is_silence,
                 "speech, silence, speech");
    ok &= expect(is_alternating_partition(segs, 3000), "partition is valid");
  }
  {
    auto segs = IntervalUtils::build_partition({}, 4000);
    ok &= expect(segs.size() == 1 && segs[0].is_silence &&
                     nearly_equal(segs[0].end_sec, 4.0),
                 "no speech is one silence segment");
  }
  {
    auto segs = IntervalUtils::build_partition({}, 0);
    ok &= expect(segs.empty(), "zero duration gives no segments");
  }
  {
    auto segs = IntervalUtils::build_partition({{0, 4000}}, 4000);
    ok &= expect(segs.size() == 1 && !segs[0].is_silence,
                 "full-length speech is one speech segment");
  }
  {
    auto segs = IntervalUtils::build_partition({{250, 1250}}, 2000);
    ok &= expect(segs.size() == 3, "inner speech gives three pieces");
    ok &= expect(nearly_equal(segs[1].start_sec, 0.25) &&
                     nearly_equal(segs[1].end_sec, 1.25),
                 "times are milliseconds over 1000");
  }

  // ---- complement / helpers ----
  {
    auto out = IntervalUtils::complement({{100, 200}, {300, 400}}, 500);
    ok &= expect(out.size() == 3, "complement has three gaps");
    ok &= expect(out[0] == Interval{0, 100} && out[1] == Interval{200, 300} &&
                     out[2] == Interval{400, 500},
                 "complement bounds");
  }
  {
    ok &= expect(IntervalUtils::complement({{0, 500}}, 500).empty(),
                 "full cover has empty complement");
    auto all = IntervalUtils::complement({}, 500);
    ok &= expect(all.size() == 1 && all[0] == Interval{0, 500},
                 "complement of nothing is everything");
  }
  {
    ok &= expect(IntervalUtils::total_length({{0, 10}, {20, 25}}) == 15,
                 "total_length");
    ok &= expect(!IntervalUtils::is_normalized({{0, 10}, {5, 20}}),
                 "overlap is not normalized");
    ok &= expect(!IntervalUtils::is_normalized({{5, 5}}),
                 "empty interval is not normalized");
  }

  return ok ? 0 : 1;
}
