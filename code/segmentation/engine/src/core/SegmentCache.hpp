#pragma once
#include "models/params.hpp"
#include <array>
#include <cstdint>
#include <filesystem>
#include <string>

namespace gate {

// Reuse rules for segment files produced by earlier runs.
//
// A cached "<name>.json" is fresh when it is at least as new as its source
// audio, younger than the max age, and its "<name>.json.stamp" sidecar holds
// the parameter stamp of the current run. The stamp is the hex SHA-256 of
// "v1|" + params JSON, so a changed threshold never reuses old segments.
class SegmentCache {
public:
  using Clock = std::filesystem::file_time_type::clock;

  static std::array<uint8_t, 32> digest(const GateParams &p);
  static std::string stamp(const GateParams &p);
  static std::string stamp_path(const std::string &json_path) {
    return json_path + ".stamp";
  }

  // Throws std::runtime_error if the sidecar cannot be written.
  static void write_stamp(const std::string &json_path, const GateParams &p);

  static bool is_fresh(const std::string &json_path,
                       const std::string &source_path, const GateParams &p,
                       int64_t max_age_s, Clock::time_point now = Clock::now());
};

} // namespace gate
