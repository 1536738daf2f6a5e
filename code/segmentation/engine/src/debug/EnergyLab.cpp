#include "EnergyLab.hpp"

#include "core/energy/RollingEnergy.hpp"
#include "debug/log.hpp"
#include <algorithm>
#include <fstream>
#include <iomanip>
#include <limits>
#include <ostream>
#include <stdexcept>

namespace gate {

EnergyEnvelope energy_envelope(const Waveform &w, int64_t window_ms,
                               int64_t step_ms) {
  if (window_ms <= 0 || step_ms <= 0)
    throw std::invalid_argument("window_ms and step_ms must be > 0");

  EnergyEnvelope env;
  env.window_ms = window_ms;
  env.step_ms = step_ms;

  RollingEnergyCalculator energy(w);
  const int64_t dur = energy.duration_ms();
  if (dur <= 0)
    return env;

  const std::size_t n = static_cast<std::size_t>((dur - 1) / step_ms + 1);
  env.t_sec.reserve(n);
  env.db.reserve(n);
  for (int64_t t = 0; t < dur; t += step_ms) {
    env.t_sec.push_back(t / 1000.0);
    env.db.push_back(energy.dbfs(t, std::min(dur, t + window_ms)));
  }
  return env;
}

EnergyStats summarize(const EnergyEnvelope &env, double threshold_db) {
  EnergyStats st;
  st.threshold_db = threshold_db;
  st.windows = env.db.size();
  if (env.db.empty())
    return st;

  double lo = std::numeric_limits<double>::infinity();
  double hi = -std::numeric_limits<double>::infinity();
  double sum = 0.0;
  std::size_t below = 0;
  for (double v : env.db) {
    lo = std::min(lo, v);
    hi = std::max(hi, v);
    sum += v;
    if (v <= threshold_db)
      below++;
  }
  st.min_db = lo;
  st.max_db = hi;
  st.mean_db = sum / env.db.size();
  st.pct_below = 100.0 * below / env.db.size();
  return st;
}

void print_energy_stats(std::ostream &os, const std::string &label,
                        const EnergyStats &st) {
  os << std::fixed << std::setprecision(2) << "  [" << label
     << "] windows=" << st.windows << "\n"
     << "      db{min=" << st.min_db << ", max=" << st.max_db
     << ", mean=" << st.mean_db << "}\n"
     << "      below " << st.threshold_db << " dBFS: " << st.pct_below
     << "%\n";
}

void write_energy_csv(const std::string &path, const EnergyEnvelope &env) {
  std::ofstream out(path);
  if (!out)
    throw std::runtime_error("Cannot open for writing: " + path);
  out << "t_sec,db\n";
  for (std::size_t k = 0; k < env.db.size(); k++)
    out << env.t_sec[k] << "," << env.db[k] << "\n";
  if (!out)
    throw std::runtime_error("Write failed: " + path);
  log::info("lab", "wrote " + path + " rows=" + std::to_string(env.db.size()));
}

Json to_json(const EnergyEnvelope &env) {
  return Json{{"window_ms", env.window_ms},
              {"step_ms", env.step_ms},
              {"t_sec", env.t_sec},
              {"db", env.db}};
}

Json to_json(const EnergyStats &st) {
  return Json{{"windows", st.windows},   {"min_db", st.min_db},
              {"max_db", st.max_db},     {"mean_db", st.mean_db},
              {"threshold_db", st.threshold_db},
              {"pct_below", st.pct_below}};
}

} // namespace gate
