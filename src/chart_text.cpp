#include "chart.hpp"
#include <cstdio>
#include <stdexcept>
#include <sstream>

static std::string fmt3(double v) {
  char buf[32];
  std::snprintf(buf, sizeof(buf), "%.3f", v);
  return buf;
}

static std::string fmtBpm(double v) {
  char buf[32];
  std::snprintf(buf, sizeof(buf), "%g", v);
  return buf;
}

static void writeNotesBlock(std::ostringstream& out, const Chart& c) {
  out << "[NOTES]\n";
  out << "  Instrument = " << c.instrument << "\n";
  out << "  Difficulty = " << difficultyName(c.difficulty) << "\n";
  out << "  Columns = " << c.columns << "\n";
  out << "  Notes = " << c.notes.size() << "\n";
  out << ":\n";
  for (const auto& n : c.notes) {
    // 1 = tap, 2 = hold head, 3 = hold tail (not a note of its own)
    out << "  " << (n.duration ? 2 : 1) << "|" << n.lane << "|" << fmt3(n.time) << "\n";
    if (n.duration)
      out << "  3|" << n.lane << "|" << fmt3(n.time + *n.duration) << "\n";
  }
  out << ";\n";
}

std::string formatChartText(const std::vector<Chart>& charts) {
  std::ostringstream out;
  if (charts.empty()) return out.str();
  const Chart& head = charts.front();
  out << "[SONG]\n";
  out << "  Title = \"" << head.songId << "\"\n";
  out << "  Artist = \"\"\n";
  out << "  BPM = " << fmtBpm(head.bpm) << "\n";
  out << "  Gap = 0\n";
  for (const auto& c : charts) {
    out << "\n";
    writeNotesBlock(out, c);
  }
  return out.str();
}

std::string formatChartText(const Chart& c) {
  return formatChartText(std::vector<Chart>{c});
}

static std::string trim(const std::string& s) {
  size_t a = s.find_first_not_of(" \t\r");
  if (a == std::string::npos) return "";
  size_t b = s.find_last_not_of(" \t\r");
  return s.substr(a, b - a + 1);
}

std::vector<ChartTextBlock> parseChartTextBlocks(const std::string& text) {
  std::vector<ChartTextBlock> blocks;
  std::istringstream in(text);
  std::string line;
  ChartTextBlock* cur = nullptr;
  bool inNotes = false;
  while (std::getline(in, line)) {
    line = trim(line);
    if (line.empty()) continue;
    if (line == "[NOTES]") {
      blocks.emplace_back();
      cur = &blocks.back();
      inNotes = false;
      continue;
    }
    if (line.front() == '[') { cur = nullptr; continue; }
    if (!cur) continue;
    if (line == ":") { inNotes = true; continue; }
    if (line == ";") { inNotes = false; cur = nullptr; continue; }

    if (!inNotes) {
      size_t eq = line.find('=');
      if (eq == std::string::npos) continue;
      std::string key = trim(line.substr(0, eq));
      std::string val = trim(line.substr(eq + 1));
      try {
        if (key == "Instrument") cur->instrument = val;
        else if (key == "Difficulty") cur->difficulty = val;
        else if (key == "Columns") cur->columns = std::stoi(val);
        else if (key == "Notes") cur->declaredNotes = std::stoi(val);
      } catch (const std::exception&) {
        cur->declaredNotes = -1;
      }
      continue;
    }

    int type = 0, lane = 0;
    double t = 0.0;
    if (std::sscanf(line.c_str(), "%d|%d|%lf", &type, &lane, &t) != 3) continue;
    if (type == 1 || type == 2) {
      cur->notes.push_back(Note{t, lane, std::nullopt});
    } else if (type == 3 && !cur->notes.empty() && cur->notes.back().lane == lane) {
      cur->notes.back().duration = t - cur->notes.back().time;
    }
  }
  return blocks;
}
