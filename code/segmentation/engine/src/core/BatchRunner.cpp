// BatchRunner: per-track resolve -> cache check -> segment -> write.

#include "BatchRunner.hpp"

#include "core/SegmentCache.hpp"
#include "core/segmenter.hpp"
#include "debug/log.hpp"
#include "infra/SegmentWriter.hpp"
#include "models/segment.hpp"
#include <cctype>
#include <filesystem>
#include <fstream>
#include <future>
#include <set>
#include <sstream>

namespace fs = std::filesystem;

namespace gate {

const char *status_to_string(TrackResult::Status s) {
  switch (s) {
  case TrackResult::Status::Written:
    return "written";
  case TrackResult::Status::Cached:
    return "cached";
  case TrackResult::Status::Missing:
    return "missing";
  case TrackResult::Status::Failed:
    return "failed";
  }
  return "?";
}

std::string BatchRunner::normalize_track_name(const std::string &raw) {
  const auto first = raw.find_first_not_of(" \t\r\n");
  if (first == std::string::npos)
    return "";
  const auto last = raw.find_last_not_of(" \t\r\n");
  std::string out = raw.substr(first, last - first + 1);

  bool word_start = true;
  for (char &c : out) {
    const unsigned char uc = static_cast<unsigned char>(c);
    if (std::isalpha(uc)) {
      c = static_cast<char>(word_start ? std::toupper(uc) : std::tolower(uc));
      word_start = false;
    } else {
      word_start = true;
    }
  }
  return out;
}

std::vector<std::string>
BatchRunner::candidate_audio_paths(const std::string &dir,
                                   const std::string &clip,
                                   const std::string &name) {
  const fs::path base(dir);
  return {(base / (clip + ".wav")).string(),
          (base / (clip + "00000000.wav")).string(),
          (base / (name + ".wav")).string(),
          (base / (name + "00000000.wav")).string()};
}

static std::size_t count_cached_segments(const std::string &json_path) {
  std::ifstream in(json_path);
  std::stringstream buf;
  buf << in.rdbuf();
  return load_segment_json(buf.str()).size();
}

TrackResult BatchRunner::runOne(const std::string &audio_dir,
                                const TrackRequest &req,
                                const std::string &name,
                                const GateParams &params) const {
  TrackResult r;
  r.name = name;
  const std::string out_dir =
      settings_.output_dir.empty() ? audio_dir : settings_.output_dir;
  r.json_path = (fs::path(out_dir) / (name + ".json")).string();

  // 1) Resolve the rendered file
  const auto candidates = candidate_audio_paths(audio_dir, req.clip, name);
  for (const auto &c : candidates) {
    if (source_.exists(c)) {
      r.audio_path = c;
      break;
    }
  }
  if (r.audio_path.empty()) {
    std::string tried;
    for (const auto &c : candidates)
      tried += (tried.empty() ? "" : ", ") + fs::path(c).filename().string();
    r.status = TrackResult::Status::Missing;
    r.error = "no audio file found (tried " + tried + ")";
    log::error("batch", name + ": " + r.error);
    return r;
  }

  // 2) Reuse a fresh result
  if (SegmentCache::is_fresh(r.json_path, r.audio_path, params,
                             settings_.max_json_age_s)) {
    try {
      r.segment_count = count_cached_segments(r.json_path);
      r.status = TrackResult::Status::Cached;
      log::info("batch", name + ": cached " + r.json_path);
      return r;
    } catch (const std::exception &e) {
      log::warn("batch", name + ": unreadable cache, recomputing (" +
                             std::string(e.what()) + ")");
    }
  }

  // 3) Segment and write
  try {
    log::info("batch", name + ": analyzing " +
                           fs::path(r.audio_path).filename().string());
    const Waveform w = source_.load(r.audio_path);
    const auto segs = SegmentEngine(params).run(w);
    SegmentWriter::write_segments(r.json_path, segs);
    SegmentCache::write_stamp(r.json_path, params);
    r.segment_count = segs.size();
    r.status = TrackResult::Status::Written;
    log::info("batch", name + ": " + std::to_string(segs.size()) +
                           " segments -> " + r.json_path);
  } catch (const std::exception &e) {
    r.status = TrackResult::Status::Failed;
    r.error = e.what();
    log::error("batch", name + ": " + r.error);
  }
  return r;
}

std::vector<TrackResult>
BatchRunner::run(const std::string &audio_dir,
                 const std::vector<TrackRequest> &tracks,
                 const GateParams &params) const {
  params.validate();

  // one worker per distinct track name, results kept in request order
  std::vector<std::future<TrackResult>> jobs;
  std::set<std::string> seen;
  for (const auto &req : tracks) {
    const std::string label = req.name.empty() ? req.clip : req.name;
    const std::string name = settings_.normalize_names
                                 ? normalize_track_name(label)
                                 : label;
    if (name.empty()) {
      log::warn("batch", "skipping track with empty name");
      continue;
    }
    if (!seen.insert(name).second)
      continue;
    jobs.push_back(std::async(std::launch::async, [this, &audio_dir, req,
                                                   name, params]() {
      return runOne(audio_dir, req, name, params);
    }));
  }

  std::vector<TrackResult> results;
  results.reserve(jobs.size());
  std::size_t ok = 0;
  for (auto &job : jobs) {
    results.push_back(job.get());
    if (results.back().status == TrackResult::Status::Written ||
        results.back().status == TrackResult::Status::Cached)
      ++ok;
  }
  log::info("batch", "silence detection complete: " + std::to_string(ok) +
                         "/" + std::to_string(results.size()) +
                         " successful");
  return results;
}

} // namespace gate
