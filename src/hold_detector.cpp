#include "hold_detector.hpp"
#include <algorithm>

double sustainedDuration(const Note& note, const LaneEnergies& energies,
                         double signalDuration, double sustainThreshold) {
  const size_t n = energies.frameCount();
  if (n == 0 || note.lane < 0 || note.lane >= energies.lanes) return 0.0;

  // the onset may sit a frame or two off the grid time
  const size_t center = energies.frameAt(note.time);
  const size_t from = center >= kOnsetSearchFrames ? center - kOnsetSearchFrames : 0;
  const size_t to = std::min(n, center + kOnsetSearchFrames + 1);
  size_t onset = from;
  float reference = 0.f;
  for (size_t f = from; f < to; ++f) {
    float e = energies.at(note.lane, f);
    if (e > reference) { reference = e; onset = f; }
  }
  if (reference <= 0.f) return 0.0;

  const double level = sustainThreshold * reference;
  double end = signalDuration;
  for (size_t f = onset + 1; f < n; ++f) {
    if (energies.at(note.lane, f) < level) {
      end = energies.timeOf(f);
      break;
    }
  }
  return std::max(0.0, std::min(end, signalDuration) - note.time);
}

std::vector<Note> detectHolds(const std::vector<Note>& notes, const LaneEnergies& energies,
                              double signalDuration, const HoldParams& params) {
  std::vector<Note> out;
  out.reserve(notes.size());
  for (const auto& n : notes) {
    Note held = n;
    held.duration.reset();
    double d = sustainedDuration(n, energies, signalDuration, params.sustainThreshold);
    if (d >= params.minHoldDuration && d > 0.0) held.duration = d;
    out.push_back(held);
  }
  return out;
}
