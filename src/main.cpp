#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <string>
#include <vector>
#include <optional>
#include <iostream>
#include <filesystem>
#include <stdexcept>

#include "orchestrator.hpp"

namespace fs = std::filesystem;

// --------- Usage ---------
static void printUsage(const char* program) {
  std::cout << "Usage: " << program << " --audio FILE --song-id ID --instrument NAME [options]\n\n";
  std::cout << "Options:\n";
  std::cout << "  --audio FILE              Audio file (wav, flac, ogg, mp3, ...)\n";
  std::cout << "  --song-id ID              Song identifier used in chart names\n";
  std::cout << "  --instrument NAME         vocals, bass, drums or lead\n";
  std::cout << "  --all-instruments         Chart all four instruments\n";
  std::cout << "  --output DIR              Output directory (default: .)\n";
  std::cout << "  --bpm N                   Tempo override (default: detected)\n";
  std::cout << "  --grid-division N         Subdivisions per beat (default: 4)\n";
  std::cout << "  --format FMT              json or chart (default: json)\n";
  std::cout << "  --sustain-threshold F     Hold energy ratio 0-1 (default: 0.5)\n";
  std::cout << "  --min-hold-duration S     Shortest hold in seconds (default: 0.25)\n";
  std::cout << "  --lane-strategy NAME      sequential, frequency or random (default: sequential)\n";
  std::cout << "  --seed N                  Seed for the random lane strategy\n";
  std::cout << "  --threads N               Worker threads for analysis (default: 1)\n";
  std::cout << "  --instrument-focus        Detect beats on the instrument's band only\n";
  std::cout << "  --config FILE             JSON config; command-line flags override it\n";
  std::cout << "  --verbose                 Print progress\n";
  std::cout << "  --help                    Show this help message\n";
}

struct UsageError : std::runtime_error {
  using std::runtime_error::runtime_error;
};

static double parseNumber(const std::string& flag, const char* v) {
  try {
    size_t used = 0;
    double d = std::stod(v, &used);
    if (used != std::strlen(v)) throw std::invalid_argument(v);
    return d;
  } catch (const std::exception&) {
    throw UsageError(flag + " expects a number, got '" + v + "'");
  }
}

static long parseInteger(const std::string& flag, const char* v) {
  try {
    size_t used = 0;
    long n = std::stol(v, &used);
    if (used != std::strlen(v)) throw std::invalid_argument(v);
    return n;
  } catch (const std::exception&) {
    throw UsageError(flag + " expects an integer, got '" + v + "'");
  }
}

struct CliOptions {
  ChartJob job;
  CharterConfig config;
  bool help = false;
};

static CliOptions parseArgs(int argc, char** argv) {
  CliOptions o;
  bool allInstruments = false;
  std::optional<std::string> instrument;
  // config file first, so flags win regardless of order
  for (int i = 1; i + 1 < argc; ++i) {
    if (std::string(argv[i]) != "--config") continue;
    const char* path = argv[++i];
    if (!loadConfig(path, o.config)) throw UsageError(std::string("cannot read config ") + path);
  }
  for (int i = 1; i < argc; ++i) {
    std::string a = argv[i];
    auto next = [&]() -> const char* {
      if (i + 1 >= argc) throw UsageError(a + " needs a value");
      return argv[++i];
    };
    if (a == "--help" || a == "-h") { o.help = true; return o; }
    else if (a == "--audio" || a == "-a") o.job.audioPath = next();
    else if (a == "--song-id" || a == "-s") o.job.songId = next();
    else if (a == "--instrument" || a == "-i") instrument = next();
    else if (a == "--all-instruments") allInstruments = true;
    else if (a == "--output" || a == "-o") o.job.outputDir = next();
    else if (a == "--bpm") o.config.bpm = parseNumber(a, next());
    else if (a == "--grid-division") o.config.gridDivision = (int)parseInteger(a, next());
    else if (a == "--format") {
      const char* v = next();
      auto f = parseChartFormat(v);
      if (!f) throw UsageError(std::string("unknown format '") + v + "'");
      o.job.format = *f;
    }
    else if (a == "--sustain-threshold") o.config.sustainThreshold = parseNumber(a, next());
    else if (a == "--min-hold-duration") o.config.minHoldDuration = parseNumber(a, next());
    else if (a == "--lane-strategy") {
      const char* v = next();
      auto k = parseLaneStrategy(v);
      if (!k) throw UsageError(std::string("unknown lane strategy '") + v + "'");
      o.config.laneStrategy.kind = *k;
    }
    else if (a == "--seed") o.config.laneStrategy.seed = (uint32_t)parseInteger(a, next());
    else if (a == "--threads") {
      long n = parseInteger(a, next());
      if (n < 1) throw UsageError("--threads must be at least 1");
      o.config.analysis.threads = (unsigned)n;
    }
    else if (a == "--instrument-focus") o.config.instrumentFocus = true;
    else if (a == "--config") next();
    else if (a == "--verbose" || a == "-v") o.config.verbose = true;
    else throw UsageError("unknown option " + a);
  }

  if (o.job.audioPath.empty()) throw UsageError("--audio is required");
  if (o.job.songId.empty()) throw UsageError("--song-id is required");
  if (allInstruments) {
    o.job.instruments.assign(kInstruments.begin(), kInstruments.end());
  } else if (instrument) {
    o.job.instruments.push_back(*instrument);
  } else {
    throw UsageError("--instrument is required");
  }
  return o;
}

static void printSummary(const RunReport& report) {
  std::cout << "\n=== Chart Summary ===\n";
  for (const auto& o : report.outcomes) {
    char line[160];
    if (o.ok() && !o.written.empty()) {
      std::snprintf(line, sizeof(line), "%-7s %-7s | %4zu notes | %d columns | %.1f BPM%s%s",
                    o.instrument.c_str(), difficultyName(o.difficulty), o.chart->notes.size(),
                    o.chart->columns, o.chart->bpm, o.bpmFallback ? " (default)" : "",
                    o.noNotes() ? " | WARNING: no beats detected" : "");
    } else {
      std::snprintf(line, sizeof(line), "%-7s %-7s | FAILED (%s)",
                    o.instrument.c_str(), difficultyName(o.difficulty),
                    o.error ? errorKindName(*o.error) : "not written");
    }
    std::cout << line << "\n";
  }
  std::cout << "=== End Summary ===\n";
}

// --------- Main ---------
#ifndef ROCKCHARTER_NO_MAIN
int main(int argc, char** argv) {
  CliOptions opts;
  try {
    opts = parseArgs(argc, argv);
  } catch (const UsageError& e) {
    std::cerr << e.what() << "\n\n";
    printUsage(argv[0]);
    return 2;
  }
  if (opts.help) {
    printUsage(argv[0]);
    return 0;
  }

  if (opts.config.verbose) {
    std::cout << "Charting " << opts.job.songId << " from " << opts.job.audioPath.string()
              << " (" << laneStrategyName(opts.config.laneStrategy.kind) << " lanes, "
              << chartExtension(opts.job.format) << ")\n";
  }

  RunReport report;
  try {
    report = runCharter(opts.job, opts.config);
  } catch (const CharterError& e) {
    std::cerr << errorKindName(e.kind()) << ": " << e.what() << "\n";
    return 1;
  } catch (const fs::filesystem_error& e) {
    std::cerr << "IoError: " << e.what() << "\n";
    return 1;
  }

  printSummary(report);
  return report.succeeded() ? 0 : 1;
}
#endif // ROCKCHARTER_NO_MAIN
