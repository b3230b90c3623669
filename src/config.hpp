#pragma once
#include <optional>
#include <string>
#include "spectral.hpp"
#include "lane_assigner.hpp"

struct CharterConfig {
  std::optional<double> bpm;        // overrides the estimate when set
  int gridDivision = 4;             // subdivisions per beat
  double sustainThreshold = 0.5;
  double minHoldDuration = 0.25;    // seconds
  LaneStrategy laneStrategy;

  AnalysisParams analysis;
  double minPeakInterval = 0.1;     // seconds
  double defaultBpm = 120.0;        // only when a single beat gives no spacing
  bool instrumentFocus = false;     // detect beats on the instrument band only
  bool verbose = false;
};

// Throws CharterError(InvalidConfig) naming the first bad field.
void validateConfig(const CharterConfig& c);

// JSON persistence; loadConfig keeps current values for keys the file lacks.
bool saveConfig(const std::string& path, const CharterConfig& c);
bool loadConfig(const std::string& path, CharterConfig& c);
