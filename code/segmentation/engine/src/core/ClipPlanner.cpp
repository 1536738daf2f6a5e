#include "ClipPlanner.hpp"

#include "models/segment.hpp"
#include <algorithm>
#include <stdexcept>

namespace gate {

std::vector<FrameSpan>
ClipPlanner::to_frame_spans(const std::vector<Segment> &segs, double fps,
                            std::optional<int64_t> duration_frames) {
  if (!(fps > 0.0))
    throw std::invalid_argument("fps must be > 0");

  auto clamp = [](int64_t v, int64_t lo, int64_t hi) {
    return std::max(lo, std::min(v, hi));
  };

  std::vector<FrameSpan> spans;
  spans.reserve(segs.size());
  for (const auto &s : segs) {
    const bool framed = s.start_frame && s.end_frame;
    int64_t sF = framed ? *s.start_frame : seconds_to_frame(s.start_sec, fps);
    int64_t eF = framed ? *s.end_frame : seconds_to_frame(s.end_sec, fps);
    if (duration_frames) {
      sF = clamp(sF, 0, *duration_frames - 1);
      eF = clamp(eF, 0, *duration_frames);
    }
    if (eF <= sF)
      continue;
    spans.push_back(FrameSpan{sF, eF, s.is_silence});
  }
  return spans;
}

ClipPlan ClipPlanner::plan(const std::vector<FrameSpan> &spans,
                           int64_t record_start_frame, double fps,
                           double crossfade_ms) {
  if (!(fps > 0.0))
    throw std::invalid_argument("fps must be > 0");

  ClipPlan out;
  out.fade_frames = std::max<int64_t>(
      1, static_cast<int64_t>(crossfade_ms / 1000.0 * fps));

  int64_t rec = record_start_frame;
  out.clips.reserve(spans.size());
  for (const auto &span : spans) {
    out.clips.push_back(PlannedClip{span, rec});
    rec += span.length();
    if (span.is_silence)
      ++out.silence_count;
    else
      ++out.speech_count;
  }
  out.end_record_frame = rec;
  return out;
}

std::vector<std::vector<PlannedClip>>
ClipPlanner::chunk(const ClipPlan &plan, std::size_t batch_size) {
  if (batch_size == 0)
    throw std::invalid_argument("batch_size must be > 0");
  std::vector<std::vector<PlannedClip>> batches;
  for (std::size_t i = 0; i < plan.clips.size(); i += batch_size) {
    const std::size_t end = std::min(plan.clips.size(), i + batch_size);
    batches.emplace_back(plan.clips.begin() + i, plan.clips.begin() + end);
  }
  return batches;
}

Json to_json(const ClipPlan &plan) {
  Json clips = Json::array();
  for (const auto &c : plan.clips) {
    clips.push_back({{"startFrame", c.span.start_frame},
                     {"endFrame", c.span.end_frame},
                     {"recordFrame", c.record_frame},
                     {"is_silence", c.span.is_silence}});
  }
  return Json{{"clips", clips},
              {"fade_frames", plan.fade_frames},
              {"end_record_frame", plan.end_record_frame},
              {"speech_count", plan.speech_count},
              {"silence_count", plan.silence_count}};
}

} // namespace gate
