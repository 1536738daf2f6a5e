#include "models/segment.hpp"
#include "test_support.hpp"

#include <stdexcept>

using gate::Segment;

int main() {
  bool ok = true;

  {
    Json j = Segment{0.9, 2.1, false};
    ok &= expect(j.size() == 3 && j.at("start_sec") == 0.9 &&
                     j.at("end_sec") == 2.1 && j.at("is_silence") == false,
                 "record has exactly start_sec, end_sec, is_silence");
  }
  {
    std::vector<Segment> segs = {{0.0, 1.5, true}, {1.5, 2.999, false}};
    Json plain = gate::segments_to_json(segs);
    ok &= expect(plain.is_array() && plain.size() == 2 &&
                     !plain[0].contains("startF"),
                 "no frame fields without fps");

    Json framed = gate::segments_to_json(segs, 30.0);
    ok &= expect(framed[1].at("startF") == 45, "startF = int(1.5 * 30)");
    ok &= expect(framed[1].at("endF") == 89, "endF truncates 89.97");
    ok &= expect(gate::seconds_to_frame(10.0, 29.97) == 299,
                 "seconds_to_frame truncates");
  }
  {
    const std::string bare = R"([
      {"start_sec": 0.0, "end_sec": 0.9, "is_silence": true},
      {"start_sec": 0.9, "end_sec": 2.1, "is_silence": false, "startF": 27}
    ])";
    auto segs = gate::load_segment_json(bare);
    ok &= expect(segs.size() == 2 && segs[0].is_silence &&
                     !segs[1].is_silence && nearly_equal(segs[1].end_sec, 2.1),
                 "bare list loads");
    ok &= expect(!segs[1].start_frame && !segs[1].end_frame,
                 "a lone startF is ignored");

    auto framed = gate::load_segment_json(
        R"([{"start_sec": 0.9, "end_sec": 2.1, "is_silence": false,
             "startF": 26, "endF": 64}])");
    ok &= expect(framed.size() == 1 && framed[0].start_frame == 26 &&
                     framed[0].end_frame == 64,
                 "startF and endF are kept as a pair");
    Json again = gate::segments_to_json(framed, 30.0);
    ok &= expect(again[0].at("startF") == 26 && again[0].at("endF") == 64,
                 "carried frames are written back as they were");

    const std::string wrapped =
        R"({"segments": [{"start_sec": 1, "end_sec": 2, "is_silence": false}]})";
    auto w = gate::load_segment_json(wrapped);
    ok &= expect(w.size() == 1 && nearly_equal(w[0].start_sec, 1.0),
                 "wrapped list loads");
  }
  {
    bool threw = false;
    try {
      gate::load_segment_json(R"({"clips": []})");
    } catch (const std::invalid_argument &) {
      threw = true;
    }
    ok &= expect(threw, "object without segments is rejected");

    threw = false;
    try {
      gate::segments_from_json(Json{{"segments", 3}});
    } catch (const std::invalid_argument &) {
      threw = true;
    }
    ok &= expect(threw, "segments must be an array");

    threw = false;
    try {
      gate::load_segment_json("[{\"start_sec\": 0,");
    } catch (const Json::parse_error &) {
      threw = true;
    }
    ok &= expect(threw, "truncated file is a parse error");
  }
  {
    std::vector<Segment> segs = {{0.0, 0.9, true}, {0.9, 2.1, false},
                                 {2.1, 10.0, true}};
    auto back = gate::segments_from_json(gate::segments_to_json(segs, 25.0));
    bool same = back.size() == segs.size();
    for (std::size_t i = 0; same && i < segs.size(); ++i)
      same = back[i].start_sec == segs[i].start_sec &&
             back[i].end_sec == segs[i].end_sec &&
             back[i].is_silence == segs[i].is_silence;
    ok &= expect(same, "written records read back unchanged");
  }

  return ok ? 0 : 1;
}
