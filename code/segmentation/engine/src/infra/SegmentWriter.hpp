#pragma once
#include "models/CoreTypes.hpp"
#include <optional>
#include <string>
#include <vector>

namespace gate {

// Writes output artifacts all-or-nothing: the text goes to "<path>.tmp" in
// the same directory and is renamed over <path> only after a clean write.
// A failed write leaves any previous <path> untouched.
class SegmentWriter {
public:
  // Throws std::runtime_error.
  static void write_text_atomic(const std::string &path,
                                const std::string &text);

  // Segment list as an indented JSON array, optionally with frame numbers.
  static void write_segments(const std::string &path,
                             const std::vector<Segment> &segs,
                             std::optional<double> fps = std::nullopt);
};

} // namespace gate
