#pragma once
#include <vector>
#include <limits>

// Two grid times closer than this are one note; the earlier survives.
static constexpr double kDedupToleranceSec = 0.010;

double subdivisionDuration(double bpm, int gridDivision);

// Nearest grid instant, clamped to [0, maxTime] on the grid.
double snapToGrid(double t, double bpm, int gridDivision,
                  double maxTime = std::numeric_limits<double>::infinity());

// Snap, sort ascending, drop near-duplicates. Throws CharterError(InvalidConfig)
// for bpm <= 0 or gridDivision <= 0.
std::vector<double> quantizeTimes(const std::vector<double>& times, double bpm, int gridDivision,
                                  double maxTime = std::numeric_limits<double>::infinity());
