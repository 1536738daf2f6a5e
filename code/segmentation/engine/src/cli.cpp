// audiogate: command-line front end of the silence gate.
//
//   audiogate <audio> [min_sil_ms] [pad_ms] [out_json] [options]
//   audiogate --batch <dir> <clip[=Name]>... [options]
//   audiogate --plan <segments.json> [options]
//
// Exit codes: 0 ok, 1 runtime failure, 2 usage error.

#include "core/BatchRunner.hpp"
#include "core/ClipPlanner.hpp"
#include "core/IntervalUtils.hpp"
#include "core/SegmentCache.hpp"
#include "core/Settings.hpp"
#include "core/segmenter.hpp"
#include "debug/EnergyLab.hpp"
#include "debug/log.hpp"
#include "infra/SegmentWriter.hpp"
#include "infra/SndfileWaveformSource.hpp"
#include "models/segment.hpp"

#include <cstdlib>
#include <fstream>
#include <iostream>
#include <optional>
#include <sstream>
#include <string>
#include <vector>

static const char *kUsage =
    "Usage: audiogate <audio> [min_sil_ms] [pad_ms] [out_json]\n"
    "       audiogate --batch <dir> <clip[=Name]>...\n"
    "       audiogate --plan <segments.json>\n"
    "Options:\n"
    "  --config <settings.json>  --profile <name>\n"
    "  --threshold-db <dB>  --hold-ms <ms>  --merge-ms <ms>\n"
    "  --fps <fps>  --seek-step-ms <ms>\n"
    "  --frames   add startF/endF to each record\n"
    "  --stats    print the energy summary to stderr\n"
    "  --stats-csv <path>  write the energy envelope as t_sec,db rows\n"
    "  --verbose  per-stage debug lines\n"
    "Env: FPS_HINT overrides the profile fps (--fps wins).\n";

// ultra-light arg parser
struct Options {
  std::vector<std::string> positional;
  std::string config;             // --config config/settings.json
  std::string profile = "default"; // --profile podcast
  std::optional<double> threshold_db;
  std::optional<double> fps;
  std::optional<int64_t> hold_ms;
  std::optional<int64_t> merge_ms;
  std::optional<int64_t> seek_step_ms;
  std::string batch_dir; // --batch <dir>
  std::string plan_path; // --plan <segments.json>
  std::string stats_csv; // --stats-csv <path>
  bool frames = false;
  bool stats = false;
  bool verbose = false;
  bool help = false;
};

// Throws std::invalid_argument on a malformed command line.
static Options parse(int argc, char **argv) {
  Options o;
  for (int i = 1; i < argc; i++) {
    std::string a(argv[i]);
    auto value = [&]() -> std::string {
      if (i + 1 >= argc)
        throw std::invalid_argument("missing value after " + a);
      return argv[++i];
    };
    auto nextd = [&](std::optional<double> &tgt) { tgt = std::stod(value()); };
    auto nexti = [&](std::optional<int64_t> &tgt) {
      tgt = std::stoll(value());
    };

    if (a == "--config")
      o.config = value();
    else if (a == "--profile")
      o.profile = value();
    else if (a == "--threshold-db")
      nextd(o.threshold_db);
    else if (a == "--fps")
      nextd(o.fps);
    else if (a == "--hold-ms")
      nexti(o.hold_ms);
    else if (a == "--merge-ms")
      nexti(o.merge_ms);
    else if (a == "--seek-step-ms")
      nexti(o.seek_step_ms);
    else if (a == "--batch")
      o.batch_dir = value();
    else if (a == "--plan")
      o.plan_path = value();
    else if (a == "--frames")
      o.frames = true;
    else if (a == "--stats")
      o.stats = true;
    else if (a == "--stats-csv")
      o.stats_csv = value();
    else if (a == "--verbose")
      o.verbose = true;
    else if (a == "-h" || a == "--help")
      o.help = true;
    else if (a.size() > 1 && a[0] == '-' && a != "-")
      throw std::invalid_argument("Unknown arg: " + a);
    else
      o.positional.push_back(a);
  }
  return o;
}

// FPS_HINT, when set to a positive number.
static std::optional<double> fps_from_env() {
  const char *env = std::getenv("FPS_HINT");
  if (!env || !*env)
    return std::nullopt;
  char *end = nullptr;
  const double v = std::strtod(env, &end);
  if (end == env || *end != '\0' || !(v > 0.0)) {
    gate::log::warn("cli", std::string("ignoring FPS_HINT=") + env);
    return std::nullopt;
  }
  return v;
}

// profile -> FPS_HINT -> positional min/pad -> flags
static gate::GateParams resolve_params(const gate::Settings &settings,
                                       const Options &o, bool positional_gate) {
  gate::GateParams p = settings.profile(o.profile);
  if (auto env = fps_from_env())
    p.fps = *env;
  if (positional_gate) {
    if (o.positional.size() > 1)
      p.min_silence_ms = std::stoll(o.positional[1]);
    if (o.positional.size() > 2)
      p.padding_ms = std::stoll(o.positional[2]);
  }
  if (o.threshold_db)
    p.silence_threshold_db = *o.threshold_db;
  if (o.fps)
    p.fps = *o.fps;
  if (o.hold_ms)
    p.hold_ms = *o.hold_ms;
  if (o.merge_ms)
    p.merge_tolerance_ms = *o.merge_ms;
  if (o.seek_step_ms)
    p.seek_step_ms = *o.seek_step_ms;
  p.validate();
  return p;
}

static std::string read_file(const std::string &path) {
  std::ifstream in(path);
  if (!in)
    throw std::runtime_error("Cannot open: " + path);
  std::stringstream buf;
  buf << in.rdbuf();
  return buf.str();
}

// ---- modes ----

static int run_gate(const Options &o, const gate::GateParams &p,
                    const gate::WaveformSource &source) {
  const std::string &audio = o.positional[0];
  const std::string out_json = o.positional.size() > 3 ? o.positional[3] : "";
  if (out_json.empty())
    gate::log::set_stdout_enabled(false);

  const gate::Waveform w = source.load(audio);
  gate::log::info("cli", "analyzing " + audio + " (" +
                             std::to_string(w.duration_ms) + " ms, " +
                             std::to_string(w.sample_rate) + " Hz)");

  gate::SegmentEngine::Trace trace;
  const auto segs = gate::SegmentEngine(p).run(w, &trace);
  const std::optional<double> fps =
      o.frames ? std::optional<double>(p.fps) : std::nullopt;

  std::optional<gate::EnergyEnvelope> env;
  if (o.stats || !o.stats_csv.empty())
    env = gate::energy_envelope(w, 50, p.seek_step_ms);
  if (!o.stats_csv.empty())
    gate::write_energy_csv(o.stats_csv, *env);
  if (o.stats) {
    gate::print_energy_stats(std::cerr, audio,
                             gate::summarize(*env, p.silence_threshold_db));
    std::cerr << "      intervals raw=" << trace.raw.size()
              << " padded=" << trace.padded.size()
              << " merged=" << trace.merged.size()
              << " coalesced=" << trace.coalesced.size()
              << " segments=" << segs.size() << "\n"
              << "      speech_ms="
              << gate::IntervalUtils::total_length(trace.coalesced) << " of "
              << w.duration_ms << "\n";
  }

  if (out_json.empty()) {
    std::cout << gate::segments_to_json(segs, fps).dump(2) << std::endl;
  } else {
    gate::SegmentWriter::write_segments(out_json, segs, fps);
    gate::SegmentCache::write_stamp(out_json, p);
    gate::log::info("cli", "wrote " + std::to_string(segs.size()) +
                               " segments -> " + out_json);
  }
  return 0;
}

static int run_batch(const Options &o, const gate::GateParams &p,
                     const gate::Settings &settings,
                     const gate::WaveformSource &source) {
  if (o.positional.empty())
    throw std::invalid_argument("--batch needs at least one track");
  gate::log::set_stdout_enabled(false);

  std::vector<gate::TrackRequest> tracks;
  for (const auto &arg : o.positional) {
    gate::TrackRequest t;
    const auto eq = arg.find('=');
    if (eq == std::string::npos) {
      t.clip = arg;
    } else {
      t.clip = arg.substr(0, eq);
      t.name = arg.substr(eq + 1);
    }
    tracks.push_back(t);
  }

  gate::BatchRunner runner(source, settings.batch());
  const auto results = runner.run(o.batch_dir, tracks, p);

  int rc = 0;
  for (const auto &r : results) {
    std::cout << gate::status_to_string(r.status) << "\t" << r.name << "\t"
              << r.segment_count << "\t"
              << (r.error.empty() ? r.json_path : r.error) << "\n";
    if (r.status == gate::TrackResult::Status::Missing ||
        r.status == gate::TrackResult::Status::Failed)
      rc = 1;
  }
  return rc;
}

static int run_plan(const Options &o, const gate::GateParams &p,
                    const gate::Settings &settings) {
  gate::log::set_stdout_enabled(false);
  const auto segs = gate::load_segment_json(read_file(o.plan_path));
  const auto spans = gate::ClipPlanner::to_frame_spans(segs, p.fps);
  const auto plan =
      gate::ClipPlanner::plan(spans, 0, p.fps, settings.batch().crossfade_ms);
  const auto batches = gate::ClipPlanner::chunk(plan, settings.batch().batch_size);
  gate::log::info("cli", std::to_string(plan.clips.size()) + " clips in " +
                             std::to_string(batches.size()) + " batch(es)");
  std::cout << gate::to_json(plan).dump(2) << std::endl;
  return 0;
}

int main(int argc, char **argv) {
  Options opt;
  gate::Settings settings;
  gate::GateParams params;
  bool batch_mode = false;

  try {
    opt = parse(argc, argv);
    if (opt.help) {
      std::cout << kUsage;
      return 0;
    }
    batch_mode = !opt.batch_dir.empty();
    const bool gate_mode = !batch_mode && opt.plan_path.empty();
    if (gate_mode && (opt.positional.empty() || opt.positional.size() > 4))
      throw std::invalid_argument("expected <audio> [min_sil_ms] [pad_ms] "
                                  "[out_json]");
    gate::log::set_verbose(opt.verbose);
    if (!opt.config.empty())
      settings = gate::Settings::load(opt.config);
    params = resolve_params(settings, opt, gate_mode);
  } catch (const std::exception &e) {
    std::cerr << "audiogate: " << e.what() << "\n" << kUsage;
    return 2;
  }

  try {
    gate::SndfileWaveformSource source;
    if (batch_mode)
      return run_batch(opt, params, settings, source);
    if (!opt.plan_path.empty())
      return run_plan(opt, params, settings);
    return run_gate(opt, params, source);
  } catch (const std::exception &e) {
    gate::log::error("cli", e.what());
    return 1;
  }
}
