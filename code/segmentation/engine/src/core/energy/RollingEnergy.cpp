#include "RollingEnergy.hpp"

#include <algorithm>
#include <cmath>

namespace gate {

double db_to_amplitude(double db) { return std::pow(10.0, db / 20.0); }

RollingEnergyCalculator::RollingEnergyCalculator(const Waveform &w)
    : frames_(w.samples.size()), rate_(w.sample_rate),
      duration_ms_(std::max<int64_t>(0, w.duration_ms)) {
  // one extra boundary so queries at duration_ms (and the frames a rounded-up
  // duration leaves past it) stay inside the table
  int64_t last_ms = duration_ms_;
  if (rate_ > 0)
    last_ms = std::max<int64_t>(
        last_ms, static_cast<int64_t>(frames_) * 1000 / rate_ + 1);
  prefix_.assign(static_cast<std::size_t>(last_ms) + 1, 0.0);

  double acc = 0.0;
  std::size_t f = 0;
  for (int64_t k = 1; k <= last_ms; ++k) {
    const std::size_t upto = frame_at(k);
    for (; f < upto; ++f) {
      const double x = w.samples[f];
      acc += x * x;
    }
    prefix_[static_cast<std::size_t>(k)] = acc;
  }
}

std::size_t RollingEnergyCalculator::frame_at(int64_t ms) const {
  if (ms <= 0 || rate_ <= 0)
    return 0;
  // integer math keeps exact frame edges for every common rate
  const int64_t f = (ms * static_cast<int64_t>(rate_)) / 1000;
  return std::min<std::size_t>(static_cast<std::size_t>(f), frames_);
}

double RollingEnergyCalculator::rms(int64_t start_ms, int64_t end_ms) const {
  const int64_t top = static_cast<int64_t>(prefix_.size()) - 1;
  start_ms = std::clamp<int64_t>(start_ms, 0, top);
  end_ms = std::clamp<int64_t>(end_ms, 0, top);
  const std::size_t a = frame_at(start_ms);
  const std::size_t b = frame_at(end_ms);
  if (b <= a)
    return 0.0;
  const double sum2 = prefix_[static_cast<std::size_t>(end_ms)] -
                      prefix_[static_cast<std::size_t>(start_ms)];
  // cancellation in the running sum can leave a tiny negative residue
  return std::sqrt(std::max(0.0, sum2) / static_cast<double>(b - a));
}

double RollingEnergyCalculator::dbfs(int64_t start_ms, int64_t end_ms) const {
  const double r = rms(start_ms, end_ms);
  if (r <= 0.0)
    return kFloorDb;
  return std::max(kFloorDb, 20.0 * std::log10(r));
}

} // namespace gate
