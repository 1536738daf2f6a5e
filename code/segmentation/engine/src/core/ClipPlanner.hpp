#pragma once
#include "models/CoreTypes.hpp"
#include <cstddef>
#include <cstdint>
#include <optional>
#include <vector>

namespace gate {

// Segment converted to source-media frames.
struct FrameSpan {
  int64_t start_frame = 0;
  int64_t end_frame = 0; // exclusive
  bool is_silence = false;

  int64_t length() const noexcept { return end_frame - start_frame; }
};

// One clip placed on the destination track.
struct PlannedClip {
  FrameSpan span;
  int64_t record_frame = 0; // timeline position of span.start_frame
};

// Butt-joined placement of every span, in order. Silence clips are kept (to
// be disabled on the editor side) so the processed track stays in sync with
// the source.
struct ClipPlan {
  std::vector<PlannedClip> clips;
  int64_t fade_frames = 1; // audio fade in/out applied to every clip
  int64_t end_record_frame = 0;
  std::size_t speech_count = 0;
  std::size_t silence_count = 0;
};

class ClipPlanner {
public:
  // sF = int(start_sec * fps), eF = int(end_sec * fps), unless the segment
  // carries its own frame numbers. With a known media
  // length, sF is clamped to [0, dur - 1] and eF to [0, dur]. Spans with
  // eF <= sF are dropped.
  static std::vector<FrameSpan>
  to_frame_spans(const std::vector<Segment> &segs, double fps,
                 std::optional<int64_t> duration_frames = std::nullopt);

  // fade_frames = max(1, int(crossfade_ms / 1000 * fps)).
  static ClipPlan plan(const std::vector<FrameSpan> &spans,
                       int64_t record_start_frame, double fps,
                       double crossfade_ms);

  // Consecutive groups of at most batch_size clips (batch_size > 0).
  static std::vector<std::vector<PlannedClip>> chunk(const ClipPlan &plan,
                                                     std::size_t batch_size);
};

Json to_json(const ClipPlan &plan);

} // namespace gate
