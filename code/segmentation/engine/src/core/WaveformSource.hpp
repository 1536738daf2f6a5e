#pragma once
#include "models/CoreTypes.hpp"
#include <map>
#include <stdexcept>
#include <string>
#include <utility>

namespace gate {

// Raised when a source cannot produce a waveform (missing file, unreadable
// or undecodable data). Fatal for that one invocation only.
class SourceError : public std::runtime_error {
public:
  using std::runtime_error::runtime_error;
};

// Decoding lives behind this seam; the engine only ever sees a Waveform.
// Implementations must be safe to call from several threads at once.
class WaveformSource {
public:
  virtual ~WaveformSource() = default;

  // Throws SourceError.
  virtual Waveform load(const std::string &path) const = 0;

  // Cheap existence check used before scheduling work.
  virtual bool exists(const std::string &path) const = 0;
};

// In-memory source keyed by path; used by tests and embedding callers.
class MemoryWaveformSource final : public WaveformSource {
public:
  void add(const std::string &path, Waveform w) {
    w.source = path;
    waves_[path] = std::move(w);
  }

  Waveform load(const std::string &path) const override {
    auto it = waves_.find(path);
    if (it == waves_.end())
      throw SourceError("no waveform registered for '" + path + "'");
    return it->second;
  }

  bool exists(const std::string &path) const override {
    return waves_.count(path) != 0;
  }

private:
  std::map<std::string, Waveform> waves_;
};

} // namespace gate
