#pragma once

#include "models/CoreTypes.hpp"
#include "models/params.hpp"
#include <cstdint>
#include <map>
#include <string>
#include <vector>

namespace gate {

struct ServerSettings {
  std::string host = "0.0.0.0";
  int port = 5005;
  bool verbose = false;
  std::vector<std::string> post_endpoints = {"/segment", "/batch", "/plan"};
  std::vector<std::string> get_endpoints = {"/profiles", "/health",
                                            "/lab/energy"};
};

// Knobs for multi-track runs and for the clip plan handed to the editor side.
struct BatchSettings {
  std::string output_dir;        // empty = next to the audio files
  int64_t max_json_age_s = 86400; // cached segment files older than this are redone
  double crossfade_ms = 20.0;
  std::size_t batch_size = 250;
  bool normalize_names = true;
};

// Contents of config/settings.json: server block, named GateParams profiles
// and batch defaults. The "default" and "podcast" profiles always exist. A
// profile in the file overlays its keys onto the built-in profile of the same
// name, or onto "default" for new names.
class Settings {
public:
  Settings();

  // Throws std::runtime_error (missing file, parse error with line:column)
  // or std::invalid_argument (bad values).
  static Settings load(const std::string &path);
  static Settings from_json(const Json &j);

  // Throws std::out_of_range for unknown names.
  GateParams profile(const std::string &name) const;
  bool has_profile(const std::string &name) const;
  std::vector<std::string> profile_names() const;
  Json profiles_json() const;

  const ServerSettings &server() const noexcept { return server_; }
  const BatchSettings &batch() const noexcept { return batch_; }

private:
  ServerSettings server_;
  BatchSettings batch_;
  std::map<std::string, GateParams> profiles_;
};

} // namespace gate
