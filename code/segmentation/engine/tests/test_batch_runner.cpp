#include "core/BatchRunner.hpp"
#include "core/SegmentCache.hpp"
#include "models/segment.hpp"
#include "test_support.hpp"

#include <chrono>
#include <fstream>
#include <sstream>

namespace fs = std::filesystem;
using gate::BatchRunner;
using gate::TrackRequest;
using gate::TrackResult;

namespace {

std::string slurp(const fs::path &p) {
  std::ifstream in(p);
  std::stringstream buf;
  buf << in.rdbuf();
  return buf.str();
}

} // namespace

int main() {
  bool ok = true;

  // ---- names and lookup ----
  {
    ok &= expect(BatchRunner::normalize_track_name("  jane DOE ") == "Jane Doe",
                 "trim and title case");
    ok &= expect(BatchRunner::normalize_track_name("mc-donald") == "Mc-Donald",
                 "every alphabetic run is capitalised");
    ok &= expect(BatchRunner::normalize_track_name("host2b") == "Host2B",
                 "digits end a run");
    ok &= expect(BatchRunner::normalize_track_name(" \t ").empty(),
                 "blank name");

    auto c = BatchRunner::candidate_audio_paths("/r", "Clip 1", "Jane");
    ok &= expect(c.size() == 4 && c[0] == "/r/Clip 1.wav" &&
                     c[1] == "/r/Clip 100000000.wav" && c[2] == "/r/Jane.wav" &&
                     c[3] == "/r/Jane00000000.wav",
                 "candidate order");
  }

  // ---- run ----
  {
    const auto dir = temp_dir("batch");
    const std::string d = dir.string();

    gate::MemoryWaveformSource source;
    const auto speech = make_waveform({{1000, 0.5f}, {2000, 0.0f}, {1000, 0.5f}});
    source.add((dir / "Alice.wav").string(), speech);
    source.add((dir / "bobclip00000000.wav").string(), speech);
    source.add((dir / "Carol.wav").string(), make_waveform({{3000, 0.0f}}));

    // a real file behind Alice lets the second run reuse her result
    {
      std::ofstream out(dir / "Alice.wav");
      out << "RIFF";
    }
    fs::last_write_time(dir / "Alice.wav", fs::last_write_time(dir / "Alice.wav") -
                                               std::chrono::seconds(10));
    // a directory where Carol's json should go makes her write fail
    fs::create_directories(dir / "Carol.json");

    std::vector<TrackRequest> tracks = {{"Alice", "alice"},
                                        {"bobclip", "bob smith"},
                                        {"ghost", ""},
                                        {"Carol", ""},
                                        {"Alice", "ALICE"}};
    BatchRunner runner(source, gate::BatchSettings{});
    auto results = runner.run(d, tracks, gate::GateParams{});

    ok &= expect(results.size() == 4, "duplicate name processed once");
    if (results.size() == 4) {
      ok &= expect(results[0].name == "Alice" &&
                       results[1].name == "Bob Smith" &&
                       results[2].name == "Ghost" && results[3].name == "Carol",
                   "results keep request order");

      ok &= expect(results[0].status == TrackResult::Status::Written &&
                       results[0].segment_count == 3,
                   "Alice written with three segments");
      ok &= expect(results[0].json_path == (dir / "Alice.json").string(),
                   "json next to the audio");
      auto segs = gate::load_segment_json(slurp(dir / "Alice.json"));
      ok &= expect(segs.size() == 3 && !segs[0].is_silence,
                   "written file holds the segments");
      ok &= expect(fs::exists(gate::SegmentCache::stamp_path(
                       results[0].json_path)),
                   "stamp written beside the json");

      ok &= expect(results[1].status == TrackResult::Status::Written &&
                       results[1].audio_path ==
                           (dir / "bobclip00000000.wav").string(),
                   "render with frame suffix found by clip name");
      ok &= expect(fs::exists(dir / "Bob Smith.json"),
                   "output named after the track");

      ok &= expect(results[2].status == TrackResult::Status::Missing &&
                       results[2].error.find("Ghost.wav") != std::string::npos,
                   "missing render lists the names tried");

      ok &= expect(results[3].status == TrackResult::Status::Failed &&
                       !results[3].error.empty(),
                   "write failure is reported for that track only");
    }

    auto again = runner.run(d, {{"Alice", ""}}, gate::GateParams{});
    ok &= expect(again.size() == 1 &&
                     again[0].status == TrackResult::Status::Cached &&
                     again[0].segment_count == 3,
                 "fresh json is reused");

    gate::GateParams wider;
    wider.padding_ms = 300;
    auto redo = runner.run(d, {{"Alice", ""}}, wider);
    ok &= expect(redo.size() == 1 &&
                     redo[0].status == TrackResult::Status::Written,
                 "new params recompute");

    gate::BatchSettings elsewhere;
    elsewhere.output_dir = (dir / "out").string();
    auto moved = BatchRunner(source, elsewhere)
                     .run(d, {{"bobclip", "Bob"}}, gate::GateParams{});
    ok &= expect(moved.size() == 1 &&
                     moved[0].status == TrackResult::Status::Written &&
                     fs::exists(dir / "out" / "Bob.json"),
                 "output_dir redirects the json");

    fs::remove_all(dir);
  }

  return ok ? 0 : 1;
}
