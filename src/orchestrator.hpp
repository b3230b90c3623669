#pragma once
#include <array>
#include <vector>
#include <string>
#include <optional>
#include <filesystem>
#include "audio_source.hpp"
#include "spectral.hpp"
#include "chart.hpp"
#include "config.hpp"
#include "charter_error.hpp"

static constexpr std::array<const char*, 4> kInstruments = {"vocals", "bass", "drums", "lead"};

struct DifficultyPreset {
  Difficulty difficulty = Difficulty::Easy;
  int columns = 4;
  int gridDivision = 4;
  double peakThreshold = 0.5;  // fraction of envelope max
  double gapFill = 0.0;        // add a midpoint to gaps longer than this; 0 = off
};

// Easy/Normal/Hard/Expert for a base grid division.
std::array<DifficultyPreset, 4> difficultyPresets(int gridDivision);

// One spectral pass per (song, instrument), shared read-only by every difficulty.
// Band 0 is the instrument band, bands 1-4 the 4-lane split, 5-9 the 5-lane split.
struct SongAnalysis {
  std::string instrument;
  FrequencyBand instrumentBand;
  SpectralAnalysis spectrum;
  std::vector<float> focusEnvelope;  // smoothed band 0, filled when instrumentFocus is on

  double duration() const { return spectrum.signalDuration; }
  const std::vector<float>& beatEnvelope() const {
    return focusEnvelope.empty() ? spectrum.smoothed : focusEnvelope;
  }
  LaneEnergies lanesFor(int columns) const;
};

SongAnalysis analyzeSong(const Samples& samples, const std::string& instrument,
                         const CharterConfig& config);

// Midpoints inserted into gaps longer than maxGap; input and output sorted.
std::vector<double> fillGaps(const std::vector<double>& times, double maxGap);

// Stages 3-7 for one difficulty. Throws CharterError.
Chart buildChart(const SongAnalysis& song, const std::string& songId,
                 const DifficultyPreset& preset, const CharterConfig& config,
                 bool* bpmFallback = nullptr);

struct DifficultyOutcome {
  std::string instrument;
  Difficulty difficulty = Difficulty::Easy;
  std::optional<Chart> chart;
  std::optional<ErrorKind> error;
  std::string message;
  bool bpmFallback = false;
  std::filesystem::path written;

  bool ok() const { return chart.has_value() && !error; }
  // built, but nothing to play (only possible with a tempo override)
  bool noNotes() const { return ok() && chart->notes.empty(); }
};

// Always four outcomes in Easy..Expert order; a failing difficulty does not stop the others.
std::vector<DifficultyOutcome> generateDifficulties(const SongAnalysis& song, const std::string& songId,
                                                    const CharterConfig& config);

// Validates config and instrument, analyzes, then generates every difficulty.
std::vector<DifficultyOutcome> generateAllDifficulties(const Samples& samples, const std::string& songId,
                                                       const std::string& instrument,
                                                       const CharterConfig& config);

struct ChartJob {
  std::filesystem::path audioPath;
  std::string songId;
  std::vector<std::string> instruments;
  std::filesystem::path outputDir = ".";
  ChartFormat format = ChartFormat::Json;
};

struct RunReport {
  std::vector<DifficultyOutcome> outcomes;

  size_t failures() const;
  // every (instrument, difficulty) chart was built and written
  bool succeeded() const { return !outcomes.empty() && failures() == 0; }
};

// Load, generate and write. Config and instrument errors throw before any work;
// everything later is recorded per unit in the report.
RunReport runCharter(const ChartJob& job, const CharterConfig& config);
