#include "chart.hpp"
#include <algorithm>
#include <fstream>
#include <sstream>
#include <nlohmann/json.hpp>

using json = nlohmann::json;
namespace fs = std::filesystem;

static json chartToJsonValue(const Chart& c) {
  json j;
  j["song_id"] = c.songId;
  j["instrument"] = c.instrument;
  j["difficulty"] = difficultyName(c.difficulty);
  j["columns"] = c.columns;
  j["bpm"] = c.bpm;
  j["generated_at"] = c.generatedAt;
  json notes = json::array();
  for (const auto& n : c.notes) {
    json nj;
    nj["time"] = n.time;
    nj["col"] = n.lane;
    if (n.duration) nj["duration"] = *n.duration;
    notes.push_back(nj);
  }
  j["notes"] = notes;
  return j;
}

std::string chartToJson(const Chart& c) {
  return chartToJsonValue(c).dump(2);
}

static std::optional<Chart> chartFromJson(const json& j) {
  if (!j.is_object()) return std::nullopt;
  Chart c;
  c.songId = j.value("song_id", std::string{});
  c.instrument = j.value("instrument", std::string{});
  auto d = parseDifficulty(j.value("difficulty", std::string{"Easy"}));
  if (!d) return std::nullopt;
  c.difficulty = *d;
  c.columns = j.value("columns", 4);
  c.bpm = j.value("bpm", 120.0);
  c.generatedAt = j.value("generated_at", (int64_t)0);
  if (j.contains("notes") && j["notes"].is_array()) {
    for (auto& nj : j["notes"]) {
      Note n;
      n.time = nj.value("time", 0.0);
      n.lane = nj.value("col", 0);
      if (nj.contains("duration") && nj["duration"].is_number())
        n.duration = nj["duration"].get<double>();
      c.notes.push_back(n);
    }
  }
  std::stable_sort(c.notes.begin(), c.notes.end(), noteBefore);
  return c;
}

std::optional<Chart> parseChartJson(const std::string& text) {
  try {
    return chartFromJson(json::parse(text));
  } catch (const json::exception&) {
    return std::nullopt;
  }
}

std::optional<Chart> loadChartJson(const fs::path& path) {
  std::ifstream f(path);
  if (!f) return std::nullopt;
  std::stringstream ss;
  ss << f.rdbuf();
  return parseChartJson(ss.str());
}
