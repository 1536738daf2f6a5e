#include "SegmentWriter.hpp"

#include "models/segment.hpp"
#include <filesystem>
#include <fstream>
#include <stdexcept>
#include <system_error>

namespace fs = std::filesystem;

namespace gate {

void SegmentWriter::write_text_atomic(const std::string &path,
                                      const std::string &text) {
  const fs::path target(path);
  std::error_code ec;
  if (target.has_parent_path()) {
    fs::create_directories(target.parent_path(), ec);
    if (ec)
      throw std::runtime_error("cannot create directory for '" + path +
                               "': " + ec.message());
  }

  const std::string tmp = path + ".tmp";
  {
    std::ofstream out(tmp, std::ios::binary | std::ios::trunc);
    if (!out)
      throw std::runtime_error("cannot open '" + tmp + "' for writing");
    out << text;
    out.flush();
    if (!out) {
      out.close();
      fs::remove(tmp, ec);
      throw std::runtime_error("write failed for '" + tmp + "'");
    }
  }

  fs::rename(tmp, target, ec);
  if (ec) {
    const std::string why = ec.message();
    fs::remove(tmp, ec);
    throw std::runtime_error("cannot move '" + tmp + "' to '" + path +
                             "': " + why);
  }
}

void SegmentWriter::write_segments(const std::string &path,
                                   const std::vector<Segment> &segs,
                                   std::optional<double> fps) {
  write_text_atomic(path, segments_to_json(segs, fps).dump(2) + "\n");
}

} // namespace gate
