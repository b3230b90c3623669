#include "../src/hold_detector.hpp"
#include <cassert>
#include <cmath>

static bool near(double a, double b) { return std::abs(a - b) < 1e-9; }

// 2 s at 10 ms frames, four lane bands.
static SpectralAnalysis laneFixture() {
  const size_t frames = 200;
  SpectralAnalysis a;
  a.sampleRate = 100;
  a.hopSize = 1;
  a.winSize = 4;
  a.signalDuration = 2.0;
  for (size_t k = 0; k < frames; ++k) a.times.push_back(k / 100.0);
  a.energy.assign(frames, 0.f);
  a.smoothed.assign(frames, 0.f);
  a.bandEnergy.assign(4, std::vector<float>(frames, 0.f));

  // lane 0: steady 0.5 s tone from 0.1 s
  for (size_t f = 10; f < 60; ++f) a.bandEnergy[0][f] = 1.f;
  // lane 1: 0.11 s burst at 1.0 s
  for (size_t f = 100; f <= 110; ++f) a.bandEnergy[1][f] = 1.f;
  // lane 2: two attacks into one decaying sustain
  for (size_t f = 30; f < 40; ++f) a.bandEnergy[2][f] = 2.f;
  for (size_t f = 40; f < 90; ++f) a.bandEnergy[2][f] = 1.2f;
  // lane 3: rings out to the end of the file
  for (size_t f = 150; f < frames; ++f) a.bandEnergy[3][f] = 1.f;
  return a;
}

int main() {
  SpectralAnalysis a = laneFixture();
  LaneEnergies le{&a, 0, 4};
  HoldParams params;

  // Sustain measured until the band drops under half the onset level
  assert(near(sustainedDuration(Note{0.1, 0, {}}, le, 2.0, 0.5), 0.5));
  // A lower threshold does not help once the band is silent
  assert(near(sustainedDuration(Note{0.1, 0, {}}, le, 2.0, 0.1), 0.5));
  // Nothing in the band at the note
  assert(sustainedDuration(Note{1.0, 3, {}}, le, 2.0, 0.5) == 0.0);
  // Lanes outside the view
  assert(sustainedDuration(Note{0.1, 4, {}}, le, 2.0, 0.5) == 0.0);
  assert(sustainedDuration(Note{0.1, -1, {}}, le, 2.0, 0.5) == 0.0);

  std::vector<Note> notes = {
    {0.1, 0, {}},
    {0.3, 2, {}},
    {0.4, 2, {}},
    {1.0, 1, {}},
    {1.0, 3, 5.0},  // stale duration on a silent onset
    {1.5, 3, {}},
  };
  auto held = detectHolds(notes, le, a.signalDuration, params);
  assert(held.size() == notes.size());
  for (size_t i = 0; i < held.size(); ++i) {
    assert(held[i].time == notes[i].time);
    assert(held[i].lane == notes[i].lane);
  }

  assert(held[0].duration && near(*held[0].duration, 0.5));
  // Overlapping holds in one lane keep their own lengths
  assert(held[1].duration && near(*held[1].duration, 0.6));
  assert(held[2].duration && near(*held[2].duration, 0.5));
  // Short burst stays a tap
  assert(!held[3].duration);
  assert(!held[4].duration);
  // Sustained to the end of the signal
  assert(held[5].duration && near(*held[5].duration, 0.5));

  // Every hold reaches the minimum and ends inside the signal
  HoldParams strict;
  strict.minHoldDuration = 0.55;
  auto longOnly = detectHolds(notes, le, a.signalDuration, strict);
  size_t holds = 0;
  for (const auto& n : longOnly) {
    if (!n.duration) continue;
    ++holds;
    assert(*n.duration >= strict.minHoldDuration);
    assert(n.time + *n.duration <= a.signalDuration + 1e-9);
  }
  assert(holds == 1 && longOnly[1].duration);

  // No band data: every note is a tap
  {
    SpectralAnalysis empty;
    LaneEnergies none{&empty, 0, 4};
    auto taps = detectHolds(notes, none, 2.0, params);
    for (const auto& n : taps) assert(!n.duration);
  }
  return 0;
}
