#include "lane_assigner.hpp"
#include "charter_error.hpp"
#include <algorithm>
#include <cctype>

const char* laneStrategyName(LaneStrategy::Kind k) {
  switch (k) {
    case LaneStrategy::Kind::Sequential: return "sequential";
    case LaneStrategy::Kind::Frequency:  return "frequency";
    case LaneStrategy::Kind::Random:     return "random";
  }
  return "sequential";
}

std::optional<LaneStrategy::Kind> parseLaneStrategy(const std::string& s) {
  std::string l = s;
  std::transform(l.begin(), l.end(), l.begin(),
                 [](unsigned char c){ return (char)std::tolower(c); });
  if (l == "sequential") return LaneStrategy::Kind::Sequential;
  if (l == "frequency")  return LaneStrategy::Kind::Frequency;
  if (l == "random")     return LaneStrategy::Kind::Random;
  return std::nullopt;
}

int strongestLane(const LaneEnergies& energies, double time) {
  const size_t n = energies.frameCount();
  if (n == 0 || energies.lanes <= 0) return 0;
  const size_t center = energies.frameAt(time);
  const size_t from = center >= kOnsetSearchFrames ? center - kOnsetSearchFrames : 0;
  const size_t to = std::min(n, center + kOnsetSearchFrames + 1);

  int best = 0;
  float bestEnergy = -1.f;
  for (int lane = 0; lane < energies.lanes; ++lane) {
    float e = 0.f;
    for (size_t f = from; f < to; ++f) e = std::max(e, energies.at(lane, f));
    if (e > bestEnergy) { bestEnergy = e; best = lane; }  // strict: ties keep the lower lane
  }
  return best;
}

std::vector<Note> assignLanes(const std::vector<double>& times, int lanes,
                              const LaneStrategy& strategy, const LaneEnergies* energies) {
  if (lanes <= 0) {
    throw CharterError(ErrorKind::InvalidLaneCount,
                       "lane count must be positive, got " + std::to_string(lanes));
  }
  if (strategy.kind == LaneStrategy::Kind::Frequency && energies && energies->lanes != lanes) {
    throw CharterError(ErrorKind::InvalidLaneCount,
                       "band data has " + std::to_string(energies->lanes) +
                       " lanes, expected " + std::to_string(lanes));
  }

  std::vector<Note> notes;
  notes.reserve(times.size());
  Lcg rng(strategy.seed);
  for (size_t i = 0; i < times.size(); ++i) {
    Note n;
    n.time = times[i];
    switch (strategy.kind) {
      case LaneStrategy::Kind::Sequential:
        n.lane = (int)(i % (size_t)lanes);
        break;
      case LaneStrategy::Kind::Frequency:
        n.lane = energies ? strongestLane(*energies, times[i]) : (int)(i % (size_t)lanes);
        break;
      case LaneStrategy::Kind::Random:
        n.lane = (int)(rng.next() % (uint32_t)lanes);
        break;
    }
    notes.push_back(n);
  }
  return notes;
}
