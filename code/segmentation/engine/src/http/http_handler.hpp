#pragma once

#include "core/Settings.hpp"       // Settings, profiles
#include "core/WaveformSource.hpp" // WaveformSource
#include "httplib.h"
#include <nlohmann/json.hpp>

// Thin wrapper around httplib callbacks.  The main server forwards requests to
// these member functions based on the action string parsed from the URL.
class HttpHandler {
public:
  HttpHandler(const gate::Settings &settings,
              const gate::WaveformSource &source)
      : settings_(settings), source_(source) {}

  void callPostHandler(std::string action, const httplib::Request &req,
                       httplib::Response &res);
  void callGetHandler(std::string action, const httplib::Request &req,
                      httplib::Response &res);

  // Profile named in body["profile"] (default "default") with the keys of
  // body["params"] laid over it. Throws on unknown profile or bad values.
  gate::GateParams resolveParams(const nlohmann::json &body) const;

private:
  const gate::Settings &settings_;
  const gate::WaveformSource &source_;

  // Individual request handlers
  void handleSegment(const httplib::Request &req, httplib::Response &res);
  void handleBatch(const httplib::Request &req, httplib::Response &res);
  void handlePlan(const httplib::Request &req, httplib::Response &res);
  void handleProfiles(const httplib::Request &req, httplib::Response &res);
  void handleHealth(const httplib::Request &req, httplib::Response &res);
  void handleLabEnergy(const httplib::Request &req, httplib::Response &res);
};
