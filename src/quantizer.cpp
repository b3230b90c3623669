#include "quantizer.hpp"
#include "charter_error.hpp"
#include <algorithm>
#include <cmath>
#include <string>

double subdivisionDuration(double bpm, int gridDivision) {
  if (!(bpm > 0.0)) {
    throw CharterError(ErrorKind::InvalidConfig, "BPM must be positive");
  }
  if (gridDivision <= 0) {
    throw CharterError(ErrorKind::InvalidConfig,
                       "grid division must be positive, got " + std::to_string(gridDivision));
  }
  return (60.0 / bpm) / gridDivision;
}

double snapToGrid(double t, double bpm, int gridDivision, double maxTime) {
  const double sub = subdivisionDuration(bpm, gridDivision);
  double q = std::round(t / sub) * sub;
  if (q > maxTime) {
    q = std::floor(maxTime / sub + 1e-9) * sub;
    if (q > maxTime) q = maxTime;
  }
  return std::max(0.0, q);
}

std::vector<double> quantizeTimes(const std::vector<double>& times, double bpm, int gridDivision,
                                  double maxTime) {
  subdivisionDuration(bpm, gridDivision);  // throws on a bad grid even for empty input
  std::vector<double> snapped;
  snapped.reserve(times.size());
  for (double t : times) snapped.push_back(snapToGrid(t, bpm, gridDivision, maxTime));
  std::sort(snapped.begin(), snapped.end());

  std::vector<double> out;
  for (double t : snapped) {
    // compare with the last kept time so a run of near-duplicates keeps its first
    if (!out.empty() && t - out.back() < kDedupToleranceSec) continue;
    out.push_back(t);
  }
  return out;
}
