#pragma once
#include "models/CoreTypes.hpp"
#include <cstddef>
#include <cstdint>
#include <iosfwd>
#include <string>
#include <vector>

// Energy Lab: windowed dBFS envelope of a waveform, for picking a threshold
// and a profile by eye. Not used by the gate itself.
namespace gate {

struct EnergyEnvelope {
  int64_t window_ms = 0;
  int64_t step_ms = 0;
  std::vector<double> t_sec; // window start
  std::vector<double> db;    // window level, floored at kFloorDb
};

struct EnergyStats {
  std::size_t windows = 0;
  double min_db = 0.0;
  double max_db = 0.0;
  double mean_db = 0.0;
  double threshold_db = 0.0;
  double pct_below = 0.0; // share of windows at or under threshold_db, 0..100
};

// Throws std::invalid_argument when window_ms or step_ms is not positive.
EnergyEnvelope energy_envelope(const Waveform &w, int64_t window_ms,
                               int64_t step_ms);

EnergyStats summarize(const EnergyEnvelope &env, double threshold_db);

void print_energy_stats(std::ostream &os, const std::string &label,
                        const EnergyStats &st);

// t_sec,db rows. Throws std::runtime_error when the file cannot be written.
void write_energy_csv(const std::string &path, const EnergyEnvelope &env);

Json to_json(const EnergyEnvelope &env);
Json to_json(const EnergyStats &st);

} // namespace gate
