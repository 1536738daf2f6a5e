#pragma once

#include "models/CoreTypes.hpp"
#include <cmath>
#include <cstdint>
#include <limits>
#include <stdexcept>
#include <string>

namespace gate {

// User-supplied thresholds controlling the silence gate. Defaults are the
// "default" profile; see podcast() for the longer-gap profile.
struct GateParams {
  double silence_threshold_db = -50.0; // dBFS floor, window RMS <= floor is silent
  int64_t min_silence_ms = 600;        // shortest run that counts as silence
  int64_t padding_ms = 120;            // added on both sides of speech
  int64_t hold_ms = 500;               // added after the trailing pad only
  int64_t merge_tolerance_ms = 100;    // gaps up to this are merged
  double fps = 30.0;                   // drives the one-frame coalescing pass
  int64_t seek_step_ms = 20;           // detector scan step

  static GateParams podcast() {
    GateParams p;
    p.min_silence_ms = 1000;
    p.padding_ms = 400;
    p.hold_ms = 100;
    return p;
  }

  // One video frame in ms, rounded half-to-even like the scripts that
  // consume the segment files.
  int64_t frame_ms() const {
    return static_cast<int64_t>(std::nearbyint(1000.0 / fps));
  }

  // Throws std::invalid_argument naming the first bad field.
  void validate() const {
    if (!std::isfinite(silence_threshold_db))
      throw std::invalid_argument("silence_threshold_db must be finite");
    if (min_silence_ms <= 0)
      throw std::invalid_argument("min_silence_ms must be > 0");
    if (seek_step_ms <= 0)
      throw std::invalid_argument("seek_step_ms must be > 0");
    if (!(fps > 0.0) || !std::isfinite(fps))
      throw std::invalid_argument("fps must be > 0");
    // frame_ms() has to fit in int64
    if (!(1000.0 / fps <
          static_cast<double>(std::numeric_limits<int64_t>::max())))
      throw std::invalid_argument("fps is too small");
    if (padding_ms < 0)
      throw std::invalid_argument("padding_ms must be >= 0");
    if (hold_ms < 0)
      throw std::invalid_argument("hold_ms must be >= 0");
    if (merge_tolerance_ms < 0)
      throw std::invalid_argument("merge_tolerance_ms must be >= 0");
  }

  // Overlay the keys present in `j` onto `base`.
  static GateParams from_json(const Json &j, GateParams base) {
    GateParams p = base;
    if (!j.is_object())
      throw std::invalid_argument("gate params must be a JSON object");
    if (j.contains("silence_threshold_db"))
      p.silence_threshold_db = j.at("silence_threshold_db").get<double>();
    if (j.contains("min_silence_ms"))
      p.min_silence_ms = j.at("min_silence_ms").get<int64_t>();
    if (j.contains("padding_ms"))
      p.padding_ms = j.at("padding_ms").get<int64_t>();
    if (j.contains("hold_ms"))
      p.hold_ms = j.at("hold_ms").get<int64_t>();
    if (j.contains("merge_tolerance_ms"))
      p.merge_tolerance_ms = j.at("merge_tolerance_ms").get<int64_t>();
    if (j.contains("fps"))
      p.fps = j.at("fps").get<double>();
    if (j.contains("seek_step_ms"))
      p.seek_step_ms = j.at("seek_step_ms").get<int64_t>();
    return p;
  }

  static GateParams from_json(const Json &j) {
    return from_json(j, GateParams{});
  }

  Json to_json() const {
    return Json{{"silence_threshold_db", silence_threshold_db},
                {"min_silence_ms", min_silence_ms},
                {"padding_ms", padding_ms},
                {"hold_ms", hold_ms},
                {"merge_tolerance_ms", merge_tolerance_ms},
                {"fps", fps},
                {"seek_step_ms", seek_step_ms}};
  }
};

} // namespace gate
