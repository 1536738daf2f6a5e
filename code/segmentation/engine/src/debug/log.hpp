#pragma once
#include <atomic>
#include <iostream>
#include <mutex>
#include <string>

// Tagged console lines: "[LEVEL] [component] message". DEBUG is dropped unless
// verbose is on; WARN and ERROR always go to stderr. Lines from batch workers are
// serialised so they never interleave.
namespace gate::log {

inline std::atomic<bool> &verbose_flag() {
  static std::atomic<bool> flag{false};
  return flag;
}
inline void set_verbose(bool on) { verbose_flag().store(on); }
inline bool verbose() { return verbose_flag().load(); }

// CLI runs that print JSON on stdout move DEBUG/INFO to stderr.
inline std::atomic<bool> &stdout_flag() {
  static std::atomic<bool> flag{true};
  return flag;
}
inline void set_stdout_enabled(bool on) { stdout_flag().store(on); }
inline std::ostream &out() {
  return stdout_flag().load() ? std::cout : std::cerr;
}

inline void write(std::ostream &os, const char *level, const std::string &tag,
                  const std::string &msg) {
  static std::mutex mu;
  std::lock_guard<std::mutex> lock(mu);
  os << "[" << level << "] [" << tag << "] " << msg << std::endl;
}

inline void debug(const std::string &tag, const std::string &msg) {
  if (verbose())
    write(out(), "DEBUG", tag, msg);
}
inline void info(const std::string &tag, const std::string &msg) {
  write(out(), "INFO", tag, msg);
}
inline void warn(const std::string &tag, const std::string &msg) {
  write(std::cerr, "WARN", tag, msg);
}
inline void error(const std::string &tag, const std::string &msg) {
  write(std::cerr, "ERROR", tag, msg);
}

} // namespace gate::log
