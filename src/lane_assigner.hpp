#pragma once
#include <vector>
#include <string>
#include <optional>
#include <cstdint>
#include "chart.hpp"
#include "spectral.hpp"

// Closed set of lane strategies; `seed` only matters for Random.
struct LaneStrategy {
  enum class Kind { Sequential, Frequency, Random };
  Kind kind = Kind::Sequential;
  uint32_t seed = 1;

  static LaneStrategy sequential() { return LaneStrategy{Kind::Sequential, 1}; }
  static LaneStrategy frequency() { return LaneStrategy{Kind::Frequency, 1}; }
  static LaneStrategy random(uint32_t seed) { return LaneStrategy{Kind::Random, seed}; }
};

const char* laneStrategyName(LaneStrategy::Kind k);
std::optional<LaneStrategy::Kind> parseLaneStrategy(const std::string& s);

// Classic rand()-style LCG. Same seed, same sequence.
class Lcg {
public:
  explicit Lcg(uint64_t seed) : state_(seed) {}
  uint32_t next() {
    state_ = state_ * 1103515245ull + 12345ull;
    return (uint32_t)((state_ / 65536) % 32768);
  }
private:
  uint64_t state_;
};

int strongestLane(const LaneEnergies& energies, double time);

// One note per time, lanes chosen by `strategy`. Frequency without energy data
// falls back to Sequential. Throws CharterError(InvalidLaneCount) for lanes <= 0.
std::vector<Note> assignLanes(const std::vector<double>& times, int lanes,
                              const LaneStrategy& strategy,
                              const LaneEnergies* energies = nullptr);
