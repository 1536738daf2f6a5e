#pragma once

#include "models/CoreTypes.hpp"
#include <cstdint>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

// JSON form of the segment list: the only artifact the clip-assembly side
// reads back. Records are {"start_sec", "end_sec", "is_silence"}, optionally
// with integer "startF"/"endF" frame numbers.

namespace gate {

inline void to_json(Json &j, const Segment &s) {
  j = Json{{"start_sec", s.start_sec},
           {"end_sec", s.end_sec},
           {"is_silence", s.is_silence}};
}

inline void from_json(const Json &j, Segment &s) {
  s.start_sec = j.value("start_sec", 0.0);
  s.end_sec = j.value("end_sec", 0.0);
  s.is_silence = j.value("is_silence", false);
  s.start_frame.reset();
  s.end_frame.reset();
  // frame numbers only count as a pair
  if (j.contains("startF") && j.contains("endF")) {
    s.start_frame = j.at("startF").get<int64_t>();
    s.end_frame = j.at("endF").get<int64_t>();
  }
}

// seconds -> frame index, truncating toward zero
inline int64_t seconds_to_frame(double seconds, double fps) {
  return static_cast<int64_t>(seconds * fps);
}

inline Json segments_to_json(const std::vector<Segment> &segs,
                             std::optional<double> fps = std::nullopt) {
  Json arr = Json::array();
  for (const auto &s : segs) {
    Json rec = s;
    if (s.start_frame && s.end_frame) {
      rec["startF"] = *s.start_frame;
      rec["endF"] = *s.end_frame;
    } else if (fps) {
      rec["startF"] = seconds_to_frame(s.start_sec, *fps);
      rec["endF"] = seconds_to_frame(s.end_sec, *fps);
    }
    arr.push_back(std::move(rec));
  }
  return arr;
}

// Accepts either a bare record list or {"segments": [...]}.
inline std::vector<Segment> segments_from_json(const Json &j) {
  const Json *list = &j;
  if (j.is_object()) {
    if (!j.contains("segments"))
      throw std::invalid_argument("segment document has no \"segments\" key");
    list = &j.at("segments");
  }
  if (!list->is_array())
    throw std::invalid_argument("segment list must be a JSON array");
  return list->get<std::vector<Segment>>();
}

inline std::vector<Segment> load_segment_json(const std::string &text) {
  return segments_from_json(Json::parse(text));
}

} // namespace gate
