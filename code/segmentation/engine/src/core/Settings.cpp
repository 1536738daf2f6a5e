#include "Settings.hpp"

#include "debug/json_debug.hpp"
#include <fstream>
#include <sstream>
#include <stdexcept>

namespace gate {

Settings::Settings() {
  profiles_["default"] = GateParams{};
  profiles_["podcast"] = GateParams::podcast();
}

Settings Settings::load(const std::string &path) {
  std::ifstream in(path);
  if (!in)
    throw std::runtime_error("Cannot open " + path);
  std::stringstream buf;
  buf << in.rdbuf();
  const std::string text = buf.str();

  Json j;
  try {
    j = Json::parse(text);
  } catch (const Json::parse_error &e) {
    throw std::runtime_error(describe_parse_error(e, text, path));
  }
  return from_json(j);
}

Settings Settings::from_json(const Json &j) {
  Settings s;
  if (!j.is_object())
    throw std::invalid_argument("settings root must be a JSON object");

  // ---------------------- server ------------------------------------------
  if (j.contains("server")) {
    const auto &srv = j.at("server");
    s.server_.host = srv.value("host", s.server_.host);
    s.server_.port = srv.value("port", s.server_.port);
    s.server_.verbose = srv.value("verbose", s.server_.verbose);
    if (srv.contains("post_endpoints"))
      s.server_.post_endpoints =
          srv.at("post_endpoints").get<std::vector<std::string>>();
    if (srv.contains("get_endpoints"))
      s.server_.get_endpoints =
          srv.at("get_endpoints").get<std::vector<std::string>>();
    if (s.server_.port <= 0 || s.server_.port > 65535)
      throw std::invalid_argument("server.port out of range");
  }

  // ---------------------- profiles ----------------------------------------
  if (j.contains("profiles")) {
    const Json &profiles = j.at("profiles");
    if (!profiles.is_object())
      throw std::invalid_argument("profiles must be a JSON object");
    auto apply = [&s](const std::string &name, const Json &body) {
      auto base = s.profiles_.find(name);
      GateParams p = GateParams::from_json(
          body, base != s.profiles_.end() ? base->second
                                          : s.profiles_.at("default"));
      try {
        p.validate();
      } catch (const std::invalid_argument &e) {
        throw std::invalid_argument("profile '" + name + "': " + e.what());
      }
      s.profiles_[name] = p;
    };
    // "default" first so new profiles overlay the configured default
    if (profiles.contains("default"))
      apply("default", profiles.at("default"));
    for (const auto &item : profiles.items()) {
      if (item.key() != "default")
        apply(item.key(), item.value());
    }
  }

  // ---------------------- batch -------------------------------------------
  if (j.contains("batch")) {
    const auto &b = j.at("batch");
    s.batch_.output_dir = b.value("output_dir", s.batch_.output_dir);
    s.batch_.max_json_age_s = b.value("max_json_age_s", s.batch_.max_json_age_s);
    s.batch_.crossfade_ms = b.value("crossfade_ms", s.batch_.crossfade_ms);
    s.batch_.batch_size = b.value("batch_size", s.batch_.batch_size);
    s.batch_.normalize_names =
        b.value("normalize_names", s.batch_.normalize_names);
    if (s.batch_.batch_size == 0)
      throw std::invalid_argument("batch.batch_size must be > 0");
  }
  return s;
}

GateParams Settings::profile(const std::string &name) const {
  auto it = profiles_.find(name);
  if (it == profiles_.end())
    throw std::out_of_range("unknown profile '" + name + "'");
  return it->second;
}

bool Settings::has_profile(const std::string &name) const {
  return profiles_.count(name) != 0;
}

std::vector<std::string> Settings::profile_names() const {
  std::vector<std::string> names;
  names.reserve(profiles_.size());
  for (const auto &kv : profiles_)
    names.push_back(kv.first);
  return names;
}

Json Settings::profiles_json() const {
  Json out = Json::object();
  for (const auto &[name, p] : profiles_)
    out[name] = p.to_json();
  return out;
}

} // namespace gate
