#include "chart.hpp"
#include "charter_error.hpp"
#include <algorithm>
#include <cctype>
#include <fstream>
#include <system_error>

namespace fs = std::filesystem;

static std::string lower(std::string s) {
  std::transform(s.begin(), s.end(), s.begin(),
                 [](unsigned char c){ return (char)std::tolower(c); });
  return s;
}

const char* difficultyName(Difficulty d) {
  switch (d) {
    case Difficulty::Easy:   return "Easy";
    case Difficulty::Normal: return "Normal";
    case Difficulty::Hard:   return "Hard";
    case Difficulty::Expert: return "Expert";
  }
  return "Easy";
}

std::optional<Difficulty> parseDifficulty(const std::string& s) {
  std::string l = lower(s);
  for (Difficulty d : kAllDifficulties)
    if (l == lower(difficultyName(d))) return d;
  return std::nullopt;
}

std::optional<ChartFormat> parseChartFormat(const std::string& s) {
  std::string l = lower(s);
  if (l == "json") return ChartFormat::Json;
  if (l == "chart" || l == "chart-text") return ChartFormat::ChartText;
  return std::nullopt;
}

const char* chartExtension(ChartFormat f) {
  return f == ChartFormat::Json ? "json" : "chart";
}

std::string sanitizeSongId(const std::string& songId) {
  std::string out = songId;
  for (auto& ch : out)
    if (!std::isalnum((unsigned char)ch)) ch = '_';
  return out;
}

std::string chartFileName(const std::string& songId, const std::string& instrument,
                          Difficulty d, ChartFormat f) {
  return sanitizeSongId(songId) + "_" + lower(instrument) + "_" +
         lower(difficultyName(d)) + "." + chartExtension(f);
}

fs::path writeChart(const Chart& c, const fs::path& dir, ChartFormat f) {
  std::error_code ec;
  if (!fs::is_directory(dir, ec)) {
    throw CharterError(ErrorKind::IoError, "output directory not found: " + dir.string());
  }
  fs::path out = dir / chartFileName(c.songId, c.instrument, c.difficulty, f);
  std::string body = f == ChartFormat::Json ? chartToJson(c) : formatChartText(c);

  std::ofstream file(out, std::ios::binary | std::ios::trunc);
  if (!file) {
    throw CharterError(ErrorKind::IoError, "cannot open " + out.string() + " for writing");
  }
  file << body;
  file.close();
  if (!file) {
    throw CharterError(ErrorKind::IoError, "failed writing " + out.string());
  }
  return out;
}
