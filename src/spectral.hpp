#pragma once
#include <vector>
#include <string>
#include <optional>
#include <cstddef>
#include "audio_source.hpp"

struct AnalysisParams {
  unsigned winSize = 2048;   // FFT size, power of two
  unsigned hopSize = 512;
  unsigned smoothWidth = 3;  // odd, frames
  unsigned threads = 1;
};

struct FrequencyBand {
  float lowHz = 0.f;
  float highHz = 0.f;
};

// Per-frame energies of one pass over the signal. Frame k is centred on
// sample k*hop; its timestamp is k*hop/sampleRate.
struct SpectralAnalysis {
  unsigned sampleRate = 0;
  unsigned winSize = 0;
  unsigned hopSize = 0;
  double signalDuration = 0.0;
  std::vector<double> times;
  std::vector<float> energy;    // raw: sum of |X(k)|^2 over all bins
  std::vector<float> smoothed;  // moving average of energy
  std::vector<FrequencyBand> bands;
  std::vector<std::vector<float>> bandEnergy;  // [band][frame]

  size_t frameCount() const { return times.size(); }
  size_t frameAt(double t) const;
};

// FFT bins [first, last) summed for a band.
struct BinRange { size_t first = 0, last = 0; };

// Bin ranges for `bands`. A band starting where the previous one ends is a lane
// split: it begins after the previous range and gets at least one bin.
std::vector<BinRange> bandBins(const std::vector<FrequencyBand>& bands,
                               unsigned sampleRate, unsigned winSize);

SpectralAnalysis analyzeSpectrum(const Samples& samples, const AnalysisParams& params,
                                 const std::vector<FrequencyBand>& bands = {});

// Frames on either side of a note's frame searched for its onset energy.
static constexpr size_t kOnsetSearchFrames = 2;

// View of `lanes` consecutive bands of an analysis, band `firstBand` = lane 0.
struct LaneEnergies {
  const SpectralAnalysis* analysis = nullptr;
  size_t firstBand = 0;
  int lanes = 0;

  float at(int lane, size_t frame) const {
    return analysis->bandEnergy[firstBand + lane][frame];
  }
  size_t frameCount() const { return analysis ? analysis->frameCount() : 0; }
  size_t frameAt(double t) const { return analysis->frameAt(t); }
  double timeOf(size_t frame) const { return analysis->times[frame]; }
};

// Centred moving average over `width` frames, zero beyond the ends.
std::vector<float> smoothEnvelope(const std::vector<float>& values, unsigned width);

// Case-insensitive; nullopt for anything but vocals/bass/drums/lead.
std::optional<FrequencyBand> bandForInstrument(const std::string& instrument);

// Log-spaced split of `range` (clamped to Nyquist) into `lanes` bands, lowest first.
std::vector<FrequencyBand> laneBands(const FrequencyBand& range, int lanes, unsigned sampleRate);
