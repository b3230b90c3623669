#pragma once
#include <vector>
#include "chart.hpp"
#include "spectral.hpp"

struct HoldParams {
  double sustainThreshold = 0.5;  // fraction of the onset's band energy
  double minHoldDuration = 0.25;  // seconds
};

// How long the note's lane band stays at or above threshold * onset energy,
// measured from note.time. 0 when the onset has no energy in that band.
double sustainedDuration(const Note& note, const LaneEnergies& energies,
                         double signalDuration, double sustainThreshold);

// Copies `notes`, giving a duration to every note sustained for at least
// minHoldDuration. Holds overlapping in one lane keep their own durations.
std::vector<Note> detectHolds(const std::vector<Note>& notes, const LaneEnergies& energies,
                              double signalDuration, const HoldParams& params);
