#include "orchestrator.hpp"
#include "beat_detector.hpp"
#include "quantizer.hpp"
#include "lane_assigner.hpp"
#include "hold_detector.hpp"
#include "join_threads.hpp"
#include <algorithm>
#include <chrono>
#include <exception>
#include <iostream>
#include <thread>

namespace fs = std::filesystem;

static constexpr size_t kInstrumentBand = 0;
static constexpr size_t kFourLaneBands = 1;
static constexpr size_t kFiveLaneBands = 5;

std::array<DifficultyPreset, 4> difficultyPresets(int gridDivision) {
  return {{
    {Difficulty::Easy,   4, std::max(1, gridDivision / 2), 0.6, 0.0},
    {Difficulty::Normal, 4, gridDivision,                  0.5, 0.0},
    {Difficulty::Hard,   4, gridDivision,                  0.4, 0.0},
    {Difficulty::Expert, 5, gridDivision * 2,              0.3, 0.5},
  }};
}

LaneEnergies SongAnalysis::lanesFor(int columns) const {
  if (columns == 4) return LaneEnergies{&spectrum, kFourLaneBands, 4};
  if (columns == 5) return LaneEnergies{&spectrum, kFiveLaneBands, 5};
  throw CharterError(ErrorKind::InvalidLaneCount,
                     "no band layout for " + std::to_string(columns) + " lanes");
}

SongAnalysis analyzeSong(const Samples& samples, const std::string& instrument,
                         const CharterConfig& config) {
  auto band = bandForInstrument(instrument);
  if (!band) {
    throw CharterError(ErrorKind::InvalidConfig, "unknown instrument: " + instrument);
  }
  SongAnalysis song;
  song.instrument = instrument;
  song.instrumentBand = *band;

  std::vector<FrequencyBand> bands{*band};
  for (const auto& b : laneBands(*band, 4, samples.sampleRate)) bands.push_back(b);
  for (const auto& b : laneBands(*band, 5, samples.sampleRate)) bands.push_back(b);

  song.spectrum = analyzeSpectrum(samples, config.analysis, bands);
  if (config.instrumentFocus) {
    song.focusEnvelope = smoothEnvelope(song.spectrum.bandEnergy[kInstrumentBand],
                                        config.analysis.smoothWidth);
  }
  if (config.verbose) {
    std::cout << instrument << ": " << song.spectrum.frameCount() << " frames, band "
              << band->lowHz << "-" << band->highHz << " Hz\n";
  }
  return song;
}

std::vector<double> fillGaps(const std::vector<double>& times, double maxGap) {
  if (maxGap <= 0.0 || times.size() < 2) return times;
  std::vector<double> out;
  out.reserve(times.size() * 2);
  for (size_t i = 0; i + 1 < times.size(); ++i) {
    out.push_back(times[i]);
    if (times[i+1] - times[i] > maxGap) out.push_back(0.5 * (times[i] + times[i+1]));
  }
  out.push_back(times.back());
  return out;
}

static int64_t unixNow() {
  return std::chrono::duration_cast<std::chrono::seconds>(
    std::chrono::system_clock::now().time_since_epoch()).count();
}

Chart buildChart(const SongAnalysis& song, const std::string& songId,
                 const DifficultyPreset& preset, const CharterConfig& config,
                 bool* bpmFallback) {
  BeatParams bp;
  bp.threshold = preset.peakThreshold;
  bp.minPeakInterval = config.minPeakInterval;
  bp.defaultBpm = config.defaultBpm;
  bp.bpmOverride = config.bpm;
  BeatResult beats = detectBeats(song.spectrum.times, song.beatEnvelope(), bp);
  if (bpmFallback) *bpmFallback = beats.bpmFallback;

  std::vector<double> onsets;
  for (const auto& p : beats.peaks) onsets.push_back(p.time);
  onsets = fillGaps(onsets, preset.gapFill);

  std::vector<double> grid = quantizeTimes(onsets, beats.bpm, preset.gridDivision, song.duration());
  LaneEnergies lanes = song.lanesFor(preset.columns);
  std::vector<Note> notes = assignLanes(grid, preset.columns, config.laneStrategy, &lanes);
  notes = detectHolds(notes, lanes, song.duration(),
                      HoldParams{config.sustainThreshold, config.minHoldDuration});
  std::stable_sort(notes.begin(), notes.end(), noteBefore);

  Chart c;
  c.songId = songId;
  c.instrument = song.instrument;
  c.difficulty = preset.difficulty;
  c.columns = preset.columns;
  c.bpm = beats.bpm;
  c.generatedAt = unixNow();
  c.notes = std::move(notes);
  return c;
}

std::vector<DifficultyOutcome> generateDifficulties(const SongAnalysis& song, const std::string& songId,
                                                    const CharterConfig& config) {
  const auto presets = difficultyPresets(config.gridDivision);
  std::vector<DifficultyOutcome> out(presets.size());
  std::vector<std::exception_ptr> crashes(presets.size());

  auto runOne = [&](size_t i) {
    DifficultyOutcome& o = out[i];
    o.instrument = song.instrument;
    o.difficulty = presets[i].difficulty;
    try {
      o.chart = buildChart(song, songId, presets[i], config, &o.bpmFallback);
    } catch (const CharterError& e) {
      o.error = e.kind();
      o.message = e.what();
    } catch (...) {
      crashes[i] = std::current_exception();
    }
  };

  if (config.analysis.threads > 1) {
    std::vector<std::thread> pool;
    JoinThreads joiner{pool};
    for (size_t i = 0; i < presets.size(); ++i) pool.emplace_back(runOne, i);
  } else {
    for (size_t i = 0; i < presets.size(); ++i) runOne(i);
  }
  for (auto& c : crashes)
    if (c) std::rethrow_exception(c);

  for (auto& o : out) {
    if (o.noNotes()) {
      o.message = "no beats detected, chart has no notes";
      std::cerr << "warning: " << o.instrument << " " << difficultyName(o.difficulty)
                << ": " << o.message << "\n";
    }
    if (o.bpmFallback) {
      std::cerr << "warning: " << o.instrument << " " << difficultyName(o.difficulty)
                << ": tempo could not be estimated from beat spacing, using "
                << config.defaultBpm << " BPM\n";
    }
  }
  return out;
}

std::vector<DifficultyOutcome> generateAllDifficulties(const Samples& samples, const std::string& songId,
                                                       const std::string& instrument,
                                                       const CharterConfig& config) {
  validateConfig(config);
  SongAnalysis song = analyzeSong(samples, instrument, config);
  return generateDifficulties(song, songId, config);
}

size_t RunReport::failures() const {
  return (size_t)std::count_if(outcomes.begin(), outcomes.end(),
                               [](const DifficultyOutcome& o){ return !o.ok() || o.written.empty(); });
}

static void failAll(RunReport& report, const std::string& instrument, const CharterError& e) {
  for (Difficulty d : kAllDifficulties) {
    DifficultyOutcome o;
    o.instrument = instrument;
    o.difficulty = d;
    o.error = e.kind();
    o.message = e.what();
    report.outcomes.push_back(o);
  }
}

RunReport runCharter(const ChartJob& job, const CharterConfig& config) {
  validateConfig(config);
  if (job.songId.empty()) {
    throw CharterError(ErrorKind::InvalidConfig, "song id must not be empty");
  }
  if (job.instruments.empty()) {
    throw CharterError(ErrorKind::InvalidConfig, "no instrument requested");
  }
  for (const auto& inst : job.instruments) {
    if (!bandForInstrument(inst)) {
      throw CharterError(ErrorKind::InvalidConfig, "unknown instrument: " + inst);
    }
  }

  RunReport report;
  Samples samples;
  try {
    samples = loadAudio(job.audioPath);
  } catch (const CharterError& e) {
    std::cerr << "error: " << e.what() << "\n";
    for (const auto& inst : job.instruments) failAll(report, inst, e);
    return report;
  }
  if (config.verbose) {
    std::cout << "Loaded " << job.audioPath.string() << ": " << samples.duration() << " s at "
              << samples.sampleRate << " Hz\n";
  }

  for (const auto& inst : job.instruments) {
    std::vector<DifficultyOutcome> outcomes;
    try {
      SongAnalysis song = analyzeSong(samples, inst, config);
      outcomes = generateDifficulties(song, job.songId, config);
    } catch (const CharterError& e) {
      std::cerr << "error: " << inst << ": " << e.what() << "\n";
      failAll(report, inst, e);
      continue;
    }
    for (auto& o : outcomes) {
      if (o.ok()) {
        try {
          o.written = writeChart(*o.chart, job.outputDir, job.format);
          if (config.verbose)
            std::cout << "Saved " << difficultyName(o.difficulty) << " chart to " << o.written.string() << "\n";
        } catch (const CharterError& e) {
          o.error = e.kind();
          o.message = e.what();
        }
      }
      if (o.error) {
        std::cerr << "error: " << inst << " " << difficultyName(o.difficulty) << ": "
                  << o.message << "\n";
      }
      report.outcomes.push_back(std::move(o));
    }
  }
  return report;
}
