#pragma once
#include "core/Settings.hpp"
#include "core/WaveformSource.hpp"
#include "models/params.hpp"
#include <cstddef>
#include <string>
#include <utility>
#include <vector>

namespace gate {

// One rendered track to gate. `clip` is the clip name the render was named
// after; `name` (optional) is the track label used for the output file.
struct TrackRequest {
  std::string clip;
  std::string name;
};

struct TrackResult {
  enum class Status { Written, Cached, Missing, Failed };

  std::string name;       // normalised track name
  std::string audio_path; // resolved input, empty when Missing
  std::string json_path;  // <out_dir>/<name>.json
  Status status = Status::Failed;
  std::size_t segment_count = 0;
  std::string error;
};

const char *status_to_string(TrackResult::Status s);

// Gates several rendered tracks, one engine call per track on its own worker.
// A failing track is reported in its result and never affects the others.
class BatchRunner {
public:
  BatchRunner(const WaveformSource &source, BatchSettings settings)
      : source_(source), settings_(std::move(settings)) {}

  std::vector<TrackResult> run(const std::string &audio_dir,
                               const std::vector<TrackRequest> &tracks,
                               const GateParams &params) const;

  // Trimmed, title-cased: "  jane DOE " -> "Jane Doe".
  static std::string normalize_track_name(const std::string &raw);

  // Render names tried in order: <clip>.wav, <clip>00000000.wav, <name>.wav,
  // <name>00000000.wav.
  static std::vector<std::string>
  candidate_audio_paths(const std::string &dir, const std::string &clip,
                        const std::string &name);

private:
  TrackResult runOne(const std::string &audio_dir, const TrackRequest &req,
                     const std::string &name, const GateParams &params) const;

  const WaveformSource &source_;
  BatchSettings settings_;
};

} // namespace gate
