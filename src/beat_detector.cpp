#include "beat_detector.hpp"
#include "charter_error.hpp"
#include <algorithm>
#include <cmath>

// Parabolic interpolation over (i-1, i, i+1) for a sub-frame peak position.
static double refineTime(const std::vector<double>& times, const std::vector<float>& env,
                         size_t i, size_t n) {
  if (i == 0 || i + 1 >= n) return times[i];
  double y1 = env[i-1], y2 = env[i], y3 = env[i+1];
  double a = (y1 - 2.0*y2 + y3) / 2.0;
  double b = (y3 - y1) / 2.0;
  if (std::abs(a) < 1e-12) return times[i];
  double offset = -b / (2.0*a);
  if (std::abs(offset) >= 1.0) return times[i];
  double step = offset > 0 ? times[i+1] - times[i] : times[i] - times[i-1];
  return times[i] + offset * step;
}

std::vector<PeakCandidate> findPeaks(const std::vector<double>& times,
                                     const std::vector<float>& envelope, double threshold) {
  std::vector<PeakCandidate> peaks;
  const size_t n = std::min(times.size(), envelope.size());
  if (n == 0) return peaks;

  float maxVal = *std::max_element(envelope.begin(), envelope.begin() + n);
  if (maxVal <= 0.f) return peaks;
  const double minEnergy = threshold * maxVal;

  for (size_t i = 0; i < n; ++i) {
    float e = envelope[i];
    if (e <= minEnergy) continue;
    bool aboveLeft = (i == 0) || e > envelope[i-1];
    bool notBelowRight = (i + 1 == n) || e >= envelope[i+1];
    if (aboveLeft && notBelowRight) {
      double t = refineTime(times, envelope, i, n);
      peaks.push_back(PeakCandidate{std::max(0.0, t), e, i});
    }
  }
  return peaks;
}

std::vector<PeakCandidate> mergeClosePeaks(const std::vector<PeakCandidate>& peaks, double minInterval) {
  std::vector<PeakCandidate> out;
  for (const auto& p : peaks) {
    if (!out.empty() && p.time - out.back().time < minInterval) {
      if (p.energy > out.back().energy) out.back() = p;
      continue;
    }
    out.push_back(p);
  }
  return out;
}

std::optional<double> estimateBpm(const std::vector<PeakCandidate>& peaks) {
  std::vector<double> gaps;
  for (size_t i = 1; i < peaks.size(); ++i) {
    double g = peaks[i].time - peaks[i-1].time;
    if (g > 0.0) gaps.push_back(g);
  }
  if (gaps.empty()) return std::nullopt;
  std::sort(gaps.begin(), gaps.end());
  size_t mid = gaps.size() / 2;
  double median = (gaps.size() % 2) ? gaps[mid] : 0.5 * (gaps[mid-1] + gaps[mid]);
  return 60.0 / median;
}

BeatResult detectBeats(const std::vector<double>& times, const std::vector<float>& envelope,
                       const BeatParams& params) {
  BeatResult r;
  r.peaks = mergeClosePeaks(findPeaks(times, envelope, params.threshold), params.minPeakInterval);

  if (r.peaks.empty() && !params.bpmOverride) {
    throw CharterError(ErrorKind::NoBeatsDetected, "no energy peaks found and no BPM given");
  }

  auto est = estimateBpm(r.peaks);
  r.estimatedBpm = est.value_or(0.0);
  if (params.bpmOverride) {
    r.bpm = *params.bpmOverride;
  } else if (est) {
    r.bpm = *est;
  } else {
    r.bpm = params.defaultBpm;
    r.bpmFallback = true;
  }
  return r;
}
