#pragma once
#include <vector>
#include <optional>
#include <cstddef>

struct PeakCandidate {
  double time = 0.0;  // seconds, sub-frame refined
  float energy = 0.f;
  size_t frame = 0;
};

struct BeatParams {
  double threshold = 0.5;         // fraction of envelope maximum
  double minPeakInterval = 0.1;   // seconds
  double defaultBpm = 120.0;
  std::optional<double> bpmOverride;
};

struct BeatResult {
  std::vector<PeakCandidate> peaks;
  double bpm = 0.0;
  double estimatedBpm = 0.0;  // 0 when no gap was usable
  bool bpmFallback = false;   // defaultBpm stood in for the estimate
};

// Local maxima above threshold * max(envelope). Plateaus report their first frame.
std::vector<PeakCandidate> findPeaks(const std::vector<double>& times,
                                     const std::vector<float>& envelope, double threshold);

// Peaks closer than minInterval collapse to the stronger one.
std::vector<PeakCandidate> mergeClosePeaks(const std::vector<PeakCandidate>& peaks, double minInterval);

// 60 / median positive gap; nullopt when there is no positive gap.
std::optional<double> estimateBpm(const std::vector<PeakCandidate>& peaks);

// Throws CharterError(NoBeatsDetected) when nothing is found and no override is set.
BeatResult detectBeats(const std::vector<double>& times, const std::vector<float>& envelope,
                       const BeatParams& params);
