#include "core/ClipPlanner.hpp"
#include "test_support.hpp"

#include <stdexcept>

using gate::ClipPlanner;
using gate::FrameSpan;
using gate::Segment;

int main() {
  bool ok = true;

  const std::vector<Segment> segs = {
      {0.0, 0.5, true}, {0.5, 1.0, false}, {1.0, 2.0, true}};

  // ---- seconds -> frames ----
  {
    auto spans = ClipPlanner::to_frame_spans(segs, 30.0);
    ok &= expect(spans.size() == 3, "one span per segment");
    ok &= expect(spans[0].start_frame == 0 && spans[0].end_frame == 15 &&
                     spans[1].start_frame == 15 && spans[1].end_frame == 30 &&
                     spans[2].start_frame == 30 && spans[2].end_frame == 60,
                 "frames are int(sec * fps)");
    ok &= expect(spans[0].is_silence && !spans[1].is_silence,
                 "kind carried over");
  }
  {
    auto spans = ClipPlanner::to_frame_spans(segs, 30.0, int64_t{50});
    ok &= expect(spans.size() == 3 && spans[2].end_frame == 50,
                 "end clamps to media length");

    std::vector<Segment> past = {{2.0, 3.0, false}};
    auto tail = ClipPlanner::to_frame_spans(past, 30.0, int64_t{50});
    ok &= expect(tail.size() == 1 && tail[0].start_frame == 49 &&
                     tail[0].end_frame == 50,
                 "start clamps to the last frame");
  }
  {
    std::vector<Segment> tiny = {{1.0, 1.01, false}, {1.01, 2.0, true}};
    auto spans = ClipPlanner::to_frame_spans(tiny, 30.0);
    ok &= expect(spans.size() == 1 && spans[0].is_silence,
                 "segment shorter than a frame is dropped");
  }
  {
    Segment framed{1.0, 2.0, false};
    framed.start_frame = 29;
    framed.end_frame = 61;
    auto spans = ClipPlanner::to_frame_spans({framed}, 30.0);
    ok &= expect(spans.size() == 1 && spans[0].start_frame == 29 &&
                     spans[0].end_frame == 61,
                 "frame numbers from the file win over seconds");

    auto clamped = ClipPlanner::to_frame_spans({framed}, 30.0, int64_t{50});
    ok &= expect(clamped.size() == 1 && clamped[0].end_frame == 50,
                 "carried frames still clamp to media length");
  }

  // ---- plan ----
  {
    auto spans = ClipPlanner::to_frame_spans(segs, 30.0);
    auto plan = ClipPlanner::plan(spans, 1000, 30.0, 20.0);
    ok &= expect(plan.clips.size() == 3, "every span placed");
    ok &= expect(plan.clips[0].record_frame == 1000 &&
                     plan.clips[1].record_frame == 1015 &&
                     plan.clips[2].record_frame == 1030,
                 "clips are butt-joined");
    ok &= expect(plan.end_record_frame == 1060, "end of the placed run");
    ok &= expect(plan.speech_count == 1 && plan.silence_count == 2,
                 "speech and silence counts");
    ok &= expect(plan.fade_frames == 1, "20 ms at 30 fps floors to the 1 minimum");

    auto slow = ClipPlanner::plan(spans, 0, 30.0, 100.0);
    ok &= expect(slow.fade_frames == 3, "100 ms at 30 fps is 3 frames");

    Json j = gate::to_json(plan);
    ok &= expect(j.at("clips").size() == 3 &&
                     j.at("clips")[1].at("recordFrame") == 1015 &&
                     j.at("clips")[1].at("startFrame") == 15 &&
                     j.at("clips")[1].at("endFrame") == 30 &&
                     j.at("clips")[1].at("is_silence") == false,
                 "clip JSON");
    ok &= expect(j.at("end_record_frame") == 1060 && j.at("fade_frames") == 1,
                 "plan JSON totals");
  }
  {
    auto plan = ClipPlanner::plan({}, 7, 25.0, 20.0);
    ok &= expect(plan.clips.empty() && plan.end_record_frame == 7,
                 "empty plan ends where it starts");
  }

  // ---- chunk ----
  {
    auto plan =
        ClipPlanner::plan(ClipPlanner::to_frame_spans(segs, 30.0), 0, 30.0, 20.0);
    auto batches = ClipPlanner::chunk(plan, 2);
    ok &= expect(batches.size() == 2 && batches[0].size() == 2 &&
                     batches[1].size() == 1,
                 "3 clips in batches of 2");
    ok &= expect(batches[1][0].record_frame == 30, "chunking keeps order");
    ok &= expect(ClipPlanner::chunk(plan, 250).size() == 1, "one full batch");
    ok &= expect(ClipPlanner::chunk(gate::ClipPlan{}, 250).empty(),
                 "no clips, no batches");

    bool threw = false;
    try {
      ClipPlanner::chunk(plan, 0);
    } catch (const std::invalid_argument &) {
      threw = true;
    }
    ok &= expect(threw, "zero batch size rejected");
  }
  {
    bool threw = false;
    try {
      ClipPlanner::to_frame_spans(segs, 0.0);
    } catch (const std::invalid_argument &) {
      threw = true;
    }
    ok &= expect(threw, "zero fps rejected");
  }

  return ok ? 0 : 1;
}
