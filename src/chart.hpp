#pragma once
#include <vector>
#include <string>
#include <array>
#include <optional>
#include <filesystem>
#include <cstdint>

struct Note {
  double time = 0.0;                // seconds from song start
  int lane = 0;                     // 0..columns-1
  std::optional<double> duration;   // set => hold
};

inline bool operator==(const Note& a, const Note& b) {
  return a.time == b.time && a.lane == b.lane && a.duration == b.duration;
}
inline bool operator!=(const Note& a, const Note& b) { return !(a == b); }

// Time ascending, lane ascending on ties.
inline bool noteBefore(const Note& a, const Note& b) {
  return a.time < b.time || (a.time == b.time && a.lane < b.lane);
}

enum class Difficulty { Easy, Normal, Hard, Expert };

static constexpr std::array<Difficulty, 4> kAllDifficulties = {
  Difficulty::Easy, Difficulty::Normal, Difficulty::Hard, Difficulty::Expert
};

const char* difficultyName(Difficulty d);                 // "Easy"
std::optional<Difficulty> parseDifficulty(const std::string& s);  // any case

struct Chart {
  std::string songId;
  std::string instrument;
  Difficulty difficulty = Difficulty::Easy;
  int columns = 4;
  double bpm = 120.0;
  int64_t generatedAt = 0;  // unix seconds
  std::vector<Note> notes;
};

enum class ChartFormat { Json, ChartText };

std::optional<ChartFormat> parseChartFormat(const std::string& s);
const char* chartExtension(ChartFormat f);

// --------- JSON ---------
std::string chartToJson(const Chart& c);
std::optional<Chart> parseChartJson(const std::string& text);
std::optional<Chart> loadChartJson(const std::filesystem::path& path);

// --------- Chart text ---------
struct ChartTextBlock {
  std::string instrument;
  std::string difficulty;
  int columns = 0;
  int declaredNotes = -1;  // "Notes = N" header
  std::vector<Note> notes;
};

std::string formatChartText(const Chart& c);
// One [SONG] block (taken from the first chart) and one [NOTES] block per chart.
std::string formatChartText(const std::vector<Chart>& charts);
std::vector<ChartTextBlock> parseChartTextBlocks(const std::string& text);

// --------- Files ---------
std::string sanitizeSongId(const std::string& songId);
std::string chartFileName(const std::string& songId, const std::string& instrument,
                          Difficulty d, ChartFormat f);
// Throws CharterError(IoError) when the directory is missing or the file cannot be written.
std::filesystem::path writeChart(const Chart& c, const std::filesystem::path& dir, ChartFormat f);
