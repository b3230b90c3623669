#include "../src/lane_assigner.hpp"
#include "../src/charter_error.hpp"
#include <cassert>

static std::vector<double> evenTimes(size_t n) {
  std::vector<double> t;
  for (size_t i = 0; i < n; ++i) t.push_back(0.25 * i);
  return t;
}

// Frames every 10 ms, `lanes` bands, all zero.
static SpectralAnalysis blankAnalysis(size_t frames, int lanes) {
  SpectralAnalysis a;
  a.sampleRate = 1000;
  a.hopSize = 10;
  a.winSize = 32;
  a.signalDuration = frames * 0.01;
  for (size_t k = 0; k < frames; ++k) a.times.push_back(k * 0.01);
  a.energy.assign(frames, 0.f);
  a.smoothed.assign(frames, 0.f);
  a.bandEnergy.assign(lanes, std::vector<float>(frames, 0.f));
  return a;
}

int main() {
  // Sequential: lane i mod N for every N
  for (int lanes = 1; lanes <= 6; ++lanes) {
    auto notes = assignLanes(evenTimes(23), lanes, LaneStrategy::sequential());
    assert(notes.size() == 23);
    for (size_t i = 0; i < notes.size(); ++i) {
      assert(notes[i].lane == (int)(i % lanes));
      assert(notes[i].time == 0.25 * i);
      assert(!notes[i].duration);
    }
  }

  // Random: same seed, same lanes; all lanes valid
  {
    auto a = assignLanes(evenTimes(64), 5, LaneStrategy::random(1234));
    auto b = assignLanes(evenTimes(64), 5, LaneStrategy::random(1234));
    auto c = assignLanes(evenTimes(64), 5, LaneStrategy::random(99));
    assert(a == b);
    assert(a != c);
    for (const auto& n : a) assert(n.lane >= 0 && n.lane < 5);

    // generator advances once per note
    Lcg rng(1234);
    for (const auto& n : a) assert(n.lane == (int)(rng.next() % 5));
  }

  // Frequency: strongest band near the note wins
  {
    SpectralAnalysis a = blankAnalysis(200, 4);
    a.bandEnergy[2][50] = 5.f;  // note at 0.5 s
    a.bandEnergy[1][51] = 4.f;
    a.bandEnergy[3][100] = 1.f; // note at 1.0 s, onset one frame late
    a.bandEnergy[0][101] = 0.5f;
    // note at 1.5 s: tie between bands 1 and 3
    a.bandEnergy[1][150] = 2.f;
    a.bandEnergy[3][150] = 2.f;
    LaneEnergies le{&a, 0, 4};
    auto notes = assignLanes({0.5, 1.01, 1.5, 1.9}, 4, LaneStrategy::frequency(), &le);
    assert(notes[0].lane == 2);
    assert(notes[1].lane == 3);
    assert(notes[2].lane == 1);
    assert(notes[3].lane == 0);  // silent: all tie, lowest band

    assert(strongestLane(le, 0.5) == 2);
  }

  // Frequency without band data degrades to the sequential pattern
  {
    auto notes = assignLanes(evenTimes(9), 4, LaneStrategy::frequency(), nullptr);
    for (size_t i = 0; i < notes.size(); ++i) assert(notes[i].lane == (int)(i % 4));
  }

  // Lane count must be positive and match the band data
  for (int bad : {0, -1}) {
    bool threw = false;
    try { assignLanes(evenTimes(3), bad, LaneStrategy::sequential()); }
    catch (const CharterError& e) { threw = e.kind() == ErrorKind::InvalidLaneCount; }
    assert(threw);
  }
  {
    SpectralAnalysis a = blankAnalysis(10, 4);
    LaneEnergies le{&a, 0, 4};
    bool threw = false;
    try { assignLanes(evenTimes(3), 5, LaneStrategy::frequency(), &le); }
    catch (const CharterError& e) { threw = e.kind() == ErrorKind::InvalidLaneCount; }
    assert(threw);
  }

  // Strategy names
  assert(parseLaneStrategy("Sequential") == LaneStrategy::Kind::Sequential);
  assert(parseLaneStrategy("FREQUENCY") == LaneStrategy::Kind::Frequency);
  assert(parseLaneStrategy("random") == LaneStrategy::Kind::Random);
  assert(!parseLaneStrategy("zigzag"));
  assert(std::string(laneStrategyName(LaneStrategy::Kind::Random)) == "random");
  return 0;
}
