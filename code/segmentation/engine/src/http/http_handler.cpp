#include "http_handler.hpp"
#include "core/BatchRunner.hpp"
#include "core/ClipPlanner.hpp"
#include "core/SegmentCache.hpp"
#include "core/segmenter.hpp"
#include "debug/EnergyLab.hpp"
#include "debug/json_debug.hpp"
#include "debug/log.hpp"
#include "infra/SegmentWriter.hpp"
#include "models/segment.hpp"

#include <optional>
#include <string>
#include <vector>

using json = nlohmann::json;

static void send_error(httplib::Response &res, int status,
                       const std::string &kind, const std::string &what) {
  json err = {{"ok", false}, {"kind", kind}, {"what", what}};
  res.status = status;
  res.set_content(err.dump(), "application/json");
}

// Parses req.body into `out`; on failure answers 400 with line/column context.
static bool parse_body(const httplib::Request &req, httplib::Response &res,
                       json &out) {
  try {
    out = json::parse(req.body);
  } catch (const json::parse_error &e) {
    res.status = 400;
    res.set_content(gate::parse_error_json(e, req.body).dump(2),
                    "application/json");
    return false;
  }
  if (!out.is_object()) {
    send_error(res, 400, "bad_request", "request body must be a JSON object");
    return false;
  }
  return true;
}

// Maps the failures a handler can expect to HTTP statuses. Anything else
// reaches the route lambda in main and becomes a 500.
template <class F> static void guarded(httplib::Response &res, F &&fn) {
  try {
    fn();
  } catch (const gate::SourceError &e) {
    send_error(res, 404, "source_error", e.what());
  } catch (const std::invalid_argument &e) {
    send_error(res, 400, "invalid_argument", e.what());
  } catch (const std::out_of_range &e) {
    send_error(res, 400, "out_of_range", e.what());
  } catch (const json::exception &e) {
    send_error(res, 400, "bad_request", e.what());
  }
}

// ===== routes =====

void HttpHandler::callPostHandler(std::string action,
                                  const httplib::Request &req,
                                  httplib::Response &res) {
  if (action == "segment") {
    handleSegment(req, res);
  } else if (action == "batch") {
    handleBatch(req, res);
  } else if (action == "plan") {
    handlePlan(req, res);
  } else {
    res.status = 404;
    res.set_content("Unknown action: " + action, "text/plain");
  }
}
void HttpHandler::callGetHandler(std::string action,
                                 const httplib::Request &req,
                                 httplib::Response &res) {
  if (action == "profiles") {
    handleProfiles(req, res);
  } else if (action == "health") {
    handleHealth(req, res);
  } else if (action == "lab/energy") {
    handleLabEnergy(req, res);
  }
  // default
  else {
    res.status = 404;
    res.set_content("Unknown action: " + action, "text/plain");
  }
}

gate::GateParams HttpHandler::resolveParams(const json &body) const {
  const std::string name = body.value("profile", std::string("default"));
  gate::GateParams p = settings_.profile(name);
  if (body.contains("params"))
    p = gate::GateParams::from_json(body.at("params"), p);
  p.validate();
  return p;
}

// ===== POST: /segment =====

void HttpHandler::handleSegment(const httplib::Request &req,
                                httplib::Response &res) {
  json body;
  if (!parse_body(req, res, body))
    return;

  guarded(res, [&] {
    const std::string audio = body.at("audio").get<std::string>();
    if (audio.empty())
      throw std::invalid_argument("\"audio\" must not be empty");
    const gate::GateParams p = resolveParams(body);
    const bool frames = body.value("frames", false);
    const std::optional<double> fps =
        frames ? std::optional<double>(p.fps) : std::nullopt;

    const gate::Waveform w = source_.load(audio);
    gate::SegmentEngine::Trace trace;
    const auto segs = gate::SegmentEngine(p).run(w, &trace);

    json out = {{"ok", true},
                {"audio", audio},
                {"params", p.to_json()},
                {"duration_sec", w.duration_ms / 1000.0},
                {"raw_intervals", trace.raw.size()},
                {"count", segs.size()},
                {"segments", gate::segments_to_json(segs, fps)}};

    const std::string dest = body.value("out", std::string());
    if (!dest.empty()) {
      gate::SegmentWriter::write_segments(dest, segs, fps);
      gate::SegmentCache::write_stamp(dest, p);
      out["out"] = dest;
    }
    gate::log::info("http", "/segment " + audio + " -> " +
                                std::to_string(segs.size()) + " segments");
    res.set_content(out.dump(), "application/json");
  });
}

// ===== POST: /batch =====

void HttpHandler::handleBatch(const httplib::Request &req,
                              httplib::Response &res) {
  json body;
  if (!parse_body(req, res, body))
    return;

  guarded(res, [&] {
    const std::string dir = body.at("dir").get<std::string>();
    std::vector<gate::TrackRequest> tracks;
    for (const auto &t : body.at("tracks")) {
      gate::TrackRequest tr;
      if (t.is_string()) {
        tr.clip = t.get<std::string>();
      } else {
        tr.clip = t.at("clip").get<std::string>();
        tr.name = t.value("name", std::string());
      }
      tracks.push_back(tr);
    }
    if (tracks.empty())
      throw std::invalid_argument("\"tracks\" must not be empty");

    const gate::GateParams p = resolveParams(body);
    gate::BatchRunner runner(source_, settings_.batch());
    const auto results = runner.run(dir, tracks, p);

    json arr = json::array();
    std::size_t ok = 0;
    for (const auto &r : results) {
      json jr = {{"name", r.name},
                 {"status", gate::status_to_string(r.status)},
                 {"audio", r.audio_path},
                 {"json", r.json_path},
                 {"segments", r.segment_count}};
      if (!r.error.empty())
        jr["error"] = r.error;
      if (r.status == gate::TrackResult::Status::Written ||
          r.status == gate::TrackResult::Status::Cached)
        ok++;
      arr.push_back(jr);
    }
    json out = {{"ok", ok == results.size()},
                {"successful", ok},
                {"total", results.size()},
                {"tracks", arr}};
    res.set_content(out.dump(), "application/json");
  });
}

// ===== POST: /plan =====

void HttpHandler::handlePlan(const httplib::Request &req,
                             httplib::Response &res) {
  json body;
  if (!parse_body(req, res, body))
    return;

  guarded(res, [&] {
    const auto segs = gate::segments_from_json(body.at("segments"));
    const double fps = body.at("fps").get<double>();
    const int64_t record_start = body.value("record_start_frame", int64_t{0});
    std::optional<int64_t> duration;
    if (body.contains("duration_frames"))
      duration = body.at("duration_frames").get<int64_t>();
    const double crossfade =
        body.value("crossfade_ms", settings_.batch().crossfade_ms);

    const auto spans = gate::ClipPlanner::to_frame_spans(segs, fps, duration);
    const auto plan =
        gate::ClipPlanner::plan(spans, record_start, fps, crossfade);
    const auto batches =
        gate::ClipPlanner::chunk(plan, settings_.batch().batch_size);

    json out = gate::to_json(plan);
    out["ok"] = true;
    out["batch_size"] = settings_.batch().batch_size;
    out["batch_count"] = batches.size();
    res.set_content(out.dump(), "application/json");
  });
}

// ===== GET =====

void HttpHandler::handleProfiles(const httplib::Request &,
                                 httplib::Response &res) {
  json out = {{"ok", true}, {"profiles", settings_.profiles_json()}};
  res.set_content(out.dump(2), "application/json");
}

void HttpHandler::handleHealth(const httplib::Request &,
                               httplib::Response &res) {
  json out = {{"ok", true},
              {"service", "audiogate"},
              {"profiles", settings_.profile_names()}};
  res.set_content(out.dump(), "application/json");
}

// GET /lab/energy?audio=<path>&profile=<name>[&window_ms=50][&step_ms=<seek>]
void HttpHandler::handleLabEnergy(const httplib::Request &req,
                                  httplib::Response &res) {
  if (!req.has_param("audio")) {
    send_error(res, 400, "bad_request", "Missing ?audio=<path>");
    return;
  }

  guarded(res, [&] {
    const std::string audio = req.get_param_value("audio");
    const std::string profile = req.has_param("profile")
                                    ? req.get_param_value("profile")
                                    : std::string("default");
    const gate::GateParams p = settings_.profile(profile);
    const int64_t window_ms = req.has_param("window_ms")
                                  ? std::stoll(req.get_param_value("window_ms"))
                                  : 50;
    const int64_t step_ms = req.has_param("step_ms")
                                ? std::stoll(req.get_param_value("step_ms"))
                                : p.seek_step_ms;

    const gate::Waveform w = source_.load(audio);
    const auto env = gate::energy_envelope(w, window_ms, step_ms);
    const auto stats = gate::summarize(env, p.silence_threshold_db);
    const auto segs = gate::SegmentEngine(p).run(w);

    json out = {{"ok", true},
                {"audio", audio},
                {"profile", profile},
                {"envelope", gate::to_json(env)},
                {"stats", gate::to_json(stats)},
                {"segments", gate::segments_to_json(segs)}};
    res.set_content(out.dump(), "application/json");
  });
}
