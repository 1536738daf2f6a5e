// Entry point for the audiogate HTTP server.  It wires up the httplib server,
// loads configuration and exposes the REST endpoints handled by `HttpHandler`.
//
//   audiogate_server [config/settings.json]

#include "core/Settings.hpp"
#include "debug/log.hpp"
#include "http/http_handler.hpp"
#include "infra/SndfileWaveformSource.hpp"

#include <execinfo.h>
#include <iostream>
#include <signal.h>
#include <string>
#include <unistd.h>

static void bt_handler(int sig) {
  void *bt[64];
  int n = backtrace(bt, 64);
  dprintf(2, "\n=== FATAL SIG %d ===\n", sig);
  backtrace_symbols_fd(bt, n, 2);
  _exit(128 + sig);
}
static void install_bt_handlers() {
  signal(SIGSEGV, bt_handler);
  signal(SIGABRT, bt_handler);
  signal(SIGFPE, bt_handler);
  signal(SIGILL, bt_handler);
  signal(SIGBUS, bt_handler);
}

int main(int argc, char **argv) {
  install_bt_handlers();

  // ---------------------- Load configuration ------------------------------
  const std::string cfg_path = argc > 1 ? argv[1] : "config/settings.json";
  gate::Settings settings;
  try {
    settings = gate::Settings::load(cfg_path);
  } catch (const std::exception &e) {
    gate::log::error("main", e.what());
    return 1;
  }
  gate::log::set_verbose(settings.server().verbose);
  const auto &srv = settings.server();
  gate::log::info("main", "Starting server on " + srv.host + ":" +
                              std::to_string(srv.port));

  // ---------------------- HTTP server setup -------------------------------
  httplib::Server server;
  server.set_payload_max_length(1024ull * 1024ull * 16ull); // 16MB of JSON
  server.set_read_timeout(60, 0);
  server.set_write_timeout(600, 0); // long files take a while to gate

  // Simple echo endpoint useful during development
  server.Post("/_echo", [](const auto &req, auto &res) {
    std::string reply = "Received POST to " + req.path +
                        ", content-length=" + std::to_string(req.body.size());
    res.set_content(reply, "text/plain");
  });

  gate::SndfileWaveformSource source;
  HttpHandler handler(settings, source);

  // ---------------------- Register POST endpoints -------------------------
  for (const auto &path : srv.post_endpoints) {
    std::string action =
        (!path.empty() && path[0] == '/') ? path.substr(1) : path;
    server.Post(path, [action, &handler](const auto &req, auto &res) {
      try {
        handler.callPostHandler(action, req, res);
      } catch (const std::exception &e) {
        gate::log::error("POST " + action, std::string("EXCEPTION: ") +
                                               e.what());
        res.status = 500;
        res.set_content(std::string("exception: ") + e.what(), "text/plain");
      }
    });
  }

  // ---------------------- Register GET endpoints --------------------------
  for (const auto &path : srv.get_endpoints) {
    std::string action =
        (!path.empty() && path[0] == '/') ? path.substr(1) : path;
    server.Get(path, [action, &handler](const auto &req, auto &res) {
      try {
        handler.callGetHandler(action, req, res);
      } catch (const std::exception &e) {
        gate::log::error("GET " + action, std::string("EXCEPTION: ") +
                                              e.what());
        res.status = 500;
        res.set_content(std::string("exception: ") + e.what(), "text/plain");
      }
    });
  }

  // ---------------------- Start server ------------------------------------
  if (!server.listen(srv.host, srv.port)) {
    gate::log::error("main", "Cannot listen on " + srv.host + ":" +
                                 std::to_string(srv.port));
    return 1;
  }
  return 0;
}
