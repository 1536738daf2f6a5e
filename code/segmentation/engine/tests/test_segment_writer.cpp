#include "infra/SegmentWriter.hpp"
#include "models/segment.hpp"
#include "test_support.hpp"

#include <fstream>
#include <sstream>
#include <stdexcept>

namespace fs = std::filesystem;
using gate::SegmentWriter;

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
  const auto dir = temp_dir("writer");

  {
    const auto target = dir / "a" / "b" / "out.txt";
    SegmentWriter::write_text_atomic(target.string(), "first");
    ok &= expect(slurp(target) == "first", "missing parent directories created");
    ok &= expect(!fs::exists(target.string() + ".tmp"), "no temp file left");

    SegmentWriter::write_text_atomic(target.string(), "second");
    ok &= expect(slurp(target) == "second", "existing file replaced");
  }
  {
    const auto blocker = dir / "taken.json";
    fs::create_directories(blocker);
    bool threw = false;
    try {
      SegmentWriter::write_text_atomic(blocker.string(), "x");
    } catch (const std::runtime_error &) {
      threw = true;
    }
    ok &= expect(threw, "rename onto a directory fails");
    ok &= expect(fs::is_directory(blocker), "failed write leaves target alone");
    ok &= expect(!fs::exists(blocker.string() + ".tmp"),
                 "failed write removes its temp file");
  }
  {
    const auto target = dir / "segs.json";
    std::vector<gate::Segment> segs = {{0.0, 1.0, true}, {1.0, 2.5, false}};
    SegmentWriter::write_segments(target.string(), segs, 30.0);
    const std::string text = slurp(target);
    ok &= expect(!text.empty() && text.back() == '\n', "file ends with newline");
    Json j = Json::parse(text);
    ok &= expect(j.is_array() && j.size() == 2 && j[1].at("startF") == 30 &&
                     j[1].at("endF") == 75,
                 "frame numbers written when fps is given");
    ok &= expect(gate::load_segment_json(text).size() == 2,
                 "written file loads back");
  }

  fs::remove_all(dir);
  return ok ? 0 : 1;
}
