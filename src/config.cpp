#include "config.hpp"
#include "charter_error.hpp"
#include <fstream>
#include <iostream>
#include <nlohmann/json.hpp>

using json = nlohmann::json;

static void fail(const std::string& msg) {
  throw CharterError(ErrorKind::InvalidConfig, msg);
}

void validateConfig(const CharterConfig& c) {
  if (c.gridDivision <= 0)
    fail("grid division must be positive, got " + std::to_string(c.gridDivision));
  if (!(c.sustainThreshold >= 0.0 && c.sustainThreshold <= 1.0))
    fail("sustain threshold must be within [0, 1]");
  if (!(c.minHoldDuration > 0.0))
    fail("minimum hold duration must be positive");
  if (c.bpm && !(*c.bpm > 0.0))
    fail("BPM override must be positive");
  const unsigned w = c.analysis.winSize;
  if (w < 2 || (w & (w - 1)) != 0)
    fail("window size must be a power of two, got " + std::to_string(w));
  if (c.analysis.hopSize == 0 || c.analysis.hopSize >= w)
    fail("hop size must be in (0, window size)");
  if (c.analysis.smoothWidth == 0 || c.analysis.smoothWidth % 2 == 0)
    fail("smoothing width must be odd");
  if (c.analysis.threads == 0)
    fail("thread count must be at least 1");
  if (!(c.minPeakInterval >= 0.0))
    fail("minimum peak interval must not be negative");
  if (!(c.defaultBpm > 0.0))
    fail("default BPM must be positive");
}

bool saveConfig(const std::string& path, const CharterConfig& c) {
  json j;
  if (c.bpm) j["bpm"] = *c.bpm;
  j["grid_division"] = c.gridDivision;
  j["sustain_threshold"] = c.sustainThreshold;
  j["min_hold_duration"] = c.minHoldDuration;
  j["lane_strategy"] = laneStrategyName(c.laneStrategy.kind);
  j["seed"] = c.laneStrategy.seed;
  j["win_size"] = c.analysis.winSize;
  j["hop_size"] = c.analysis.hopSize;
  j["smooth_width"] = c.analysis.smoothWidth;
  j["threads"] = c.analysis.threads;
  j["min_peak_interval"] = c.minPeakInterval;
  j["default_bpm"] = c.defaultBpm;
  j["instrument_focus"] = c.instrumentFocus;
  j["verbose"] = c.verbose;

  std::ofstream f(path);
  if (!f) return false;
  f << j.dump(2);
  return (bool)f;
}

bool loadConfig(const std::string& path, CharterConfig& c) {
  std::ifstream f(path);
  if (!f) return false;
  json j;
  try {
    f >> j;
  } catch (const json::parse_error& e) {
    std::cerr << "config: " << path << ": " << e.what() << "\n";
    return false;
  }
  if (!j.is_object()) return false;

  try {
    if (j.contains("bpm")) {
      if (j["bpm"].is_null()) c.bpm.reset();
      else c.bpm = j["bpm"].get<double>();
    }
    c.gridDivision = j.value("grid_division", c.gridDivision);
    c.sustainThreshold = j.value("sustain_threshold", c.sustainThreshold);
    c.minHoldDuration = j.value("min_hold_duration", c.minHoldDuration);
    if (j.contains("lane_strategy")) {
      auto kind = parseLaneStrategy(j["lane_strategy"].get<std::string>());
      if (!kind) {
        std::cerr << "config: unknown lane strategy in " << path << "\n";
        return false;
      }
      c.laneStrategy.kind = *kind;
    }
    c.laneStrategy.seed = j.value("seed", c.laneStrategy.seed);
    c.analysis.winSize = j.value("win_size", c.analysis.winSize);
    c.analysis.hopSize = j.value("hop_size", c.analysis.hopSize);
    c.analysis.smoothWidth = j.value("smooth_width", c.analysis.smoothWidth);
    c.analysis.threads = j.value("threads", c.analysis.threads);
    c.minPeakInterval = j.value("min_peak_interval", c.minPeakInterval);
    c.defaultBpm = j.value("default_bpm", c.defaultBpm);
    c.instrumentFocus = j.value("instrument_focus", c.instrumentFocus);
    c.verbose = j.value("verbose", c.verbose);
  } catch (const json::type_error& e) {
    std::cerr << "config: " << path << ": " << e.what() << "\n";
    return false;
  }
  return true;
}
