#include "SegmentCache.hpp"

#include "infra/SegmentWriter.hpp"
#include <chrono>
#include <fstream>
#include <iomanip>
#include <openssl/sha.h>
#include <sstream>

namespace fs = std::filesystem;

namespace gate {

static std::string to_hex(const uint8_t *p, size_t n) {
  std::ostringstream oss;
  oss << std::hex << std::setfill('0');
  for (size_t i = 0; i < n; ++i)
    oss << std::setw(2) << (int)p[i];
  return oss.str();
}

std::array<uint8_t, 32> SegmentCache::digest(const GateParams &p) {
  // nlohmann's default object type keeps keys sorted, so the dump is canonical
  const std::string material = "v1|" + p.to_json().dump();
  std::array<uint8_t, 32> out{};
  SHA256(reinterpret_cast<const unsigned char *>(material.data()),
         material.size(), out.data());
  return out;
}

std::string SegmentCache::stamp(const GateParams &p) {
  const auto d = digest(p);
  return to_hex(d.data(), d.size());
}

void SegmentCache::write_stamp(const std::string &json_path,
                               const GateParams &p) {
  SegmentWriter::write_text_atomic(stamp_path(json_path), stamp(p) + "\n");
}

bool SegmentCache::is_fresh(const std::string &json_path,
                            const std::string &source_path,
                            const GateParams &p, int64_t max_age_s,
                            Clock::time_point now) {
  std::error_code ec;
  if (!fs::is_regular_file(json_path, ec) ||
      !fs::is_regular_file(source_path, ec))
    return false;

  const auto json_mtime = fs::last_write_time(json_path, ec);
  if (ec)
    return false;
  const auto src_mtime = fs::last_write_time(source_path, ec);
  if (ec)
    return false;

  if (json_mtime < src_mtime)
    return false;
  if (now - json_mtime >= std::chrono::seconds(max_age_s))
    return false;

  std::ifstream in(stamp_path(json_path));
  std::string recorded;
  if (!(in >> recorded))
    return false;
  return recorded == stamp(p);
}

} // namespace gate
