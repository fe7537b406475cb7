/**
 * @file subtitles.cpp
 * @brief SRT handling implementation
 */

#include "vidcut/subtitles.hpp"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <fstream>
#include <sstream>

#include <fmt/core.h>

#include "vidcut/logging.hpp"

namespace vidcut {

namespace {

/// Cues shorter than this after remapping are dropped
constexpr double MIN_CUE_SEC = 0.001;

std::string trim(const std::string &s) {
  size_t b = 0, e = s.size();
  while (b < e && std::isspace(static_cast<unsigned char>(s[b])))
    ++b;
  while (e > b && std::isspace(static_cast<unsigned char>(s[e - 1])))
    --e;
  return s.substr(b, e - b);
}

/// "HH:MM:SS,mmm" or "HH:MM:SS.mmm"
std::optional<double> parse_srt_time(const std::string &text) {
  std::string s = trim(text);
  int h = 0, m = 0, sec = 0, ms = 0;
  char c1 = 0, c2 = 0, sep = 0;
  std::istringstream in(s);
  if (!(in >> h >> c1 >> m >> c2 >> sec >> sep >> ms))
    return std::nullopt;
  if (c1 != ':' || c2 != ':' || (sep != ',' && sep != '.'))
    return std::nullopt;
  if (h < 0 || m < 0 || m >= 60 || sec < 0 || sec >= 60 || ms < 0 ||
      ms > 999)
    return std::nullopt;
  return h * 3600.0 + m * 60.0 + sec + ms / 1000.0;
}

bool parse_timing_line(const std::string &line, double &start, double &end) {
  size_t arrow = line.find("-->");
  if (arrow == std::string::npos)
    return false;
  auto s = parse_srt_time(line.substr(0, arrow));
  /// Position hints may follow the end time ("... X1:40 X2:600")
  std::istringstream rest(line.substr(arrow + 3));
  std::string end_token;
  rest >> end_token;
  auto e = parse_srt_time(end_token);
  if (!s || !e)
    return false;
  start = *s;
  end = *e;
  return true;
}

bool is_index_line(const std::string &line) {
  return !line.empty() &&
         std::all_of(line.begin(), line.end(), [](unsigned char c) {
           return std::isdigit(c);
         });
}

} // anonymous namespace

SubtitleTrack parse_srt(const std::string &input) {
  std::string text = input;
  if (text.size() >= 3 && text.compare(0, 3, "\xEF\xBB\xBF") == 0)
    text.erase(0, 3);

  /// Split into blank-line separated blocks
  std::vector<std::vector<std::string>> blocks;
  std::vector<std::string> current;
  std::istringstream in(text);
  std::string line;
  while (std::getline(in, line)) {
    if (!line.empty() && line.back() == '\r')
      line.pop_back();
    if (trim(line).empty()) {
      if (!current.empty()) {
        blocks.push_back(std::move(current));
        current.clear();
      }
      continue;
    }
    current.push_back(line);
  }
  if (!current.empty())
    blocks.push_back(std::move(current));

  SubtitleTrack track;
  size_t skipped = 0;
  for (const auto &block : blocks) {
    size_t i = 0;
    if (is_index_line(trim(block[0])))
      i = 1;
    SubtitleCue cue;
    if (i >= block.size() || !parse_timing_line(block[i], cue.start, cue.end)) {
      ++skipped;
      continue;
    }
    for (size_t j = i + 1; j < block.size(); ++j) {
      if (!cue.text.empty())
        cue.text += '\n';
      cue.text += block[j];
    }
    track.push_back(std::move(cue));
  }
  if (skipped > 0)
    LOG_DEBUG("Skipped {} malformed subtitle block(s)", skipped);
  return track;
}

std::optional<SubtitleTrack> read_srt_file(const std::string &path) {
  std::ifstream file(path, std::ios::binary);
  if (!file)
    return std::nullopt;
  std::stringstream buf;
  buf << file.rdbuf();
  return parse_srt(buf.str());
}

std::string format_srt_time(double seconds) {
  long long total_ms =
      static_cast<long long>(std::llround(std::max(0.0, seconds) * 1000.0));
  long long ms = total_ms % 1000;
  long long s = (total_ms / 1000) % 60;
  long long m = (total_ms / 60000) % 60;
  long long h = total_ms / 3600000;
  return fmt::format("{:02d}:{:02d}:{:02d},{:03d}", h, m, s, ms);
}

std::string format_srt(const SubtitleTrack &track) {
  std::string out;
  for (size_t i = 0; i < track.size(); ++i) {
    const auto &cue = track[i];
    out += fmt::format("{}\n{} --> {}\n{}\n\n", i + 1,
                       format_srt_time(cue.start), format_srt_time(cue.end),
                       cue.text);
  }
  return out;
}

bool write_srt(const std::string &path, const SubtitleTrack &track) {
  std::ofstream file(path, std::ios::binary | std::ios::trunc);
  if (!file) {
    LOG_ERROR("Cannot write subtitles to {}", path);
    return false;
  }
  file << format_srt(track);
  file.flush();
  return static_cast<bool>(file);
}

SubtitleTrack normalize_track(SubtitleTrack track) {
  SubtitleTrack out;
  out.reserve(track.size());
  for (auto &cue : track) {
    cue.text = trim(cue.text);
    if (cue.text.empty() || !(cue.end > cue.start) || cue.start < 0.0)
      continue;
    out.push_back(std::move(cue));
  }
  std::stable_sort(out.begin(), out.end(),
                   [](const SubtitleCue &a, const SubtitleCue &b) {
                     return a.start < b.start;
                   });

  /// Clamp each cue so it ends no later than the next one starts
  SubtitleTrack result;
  result.reserve(out.size());
  for (size_t i = 0; i < out.size(); ++i) {
    if (i + 1 < out.size() && out[i].end > out[i + 1].start)
      out[i].end = out[i + 1].start;
    if (out[i].end > out[i].start)
      result.push_back(std::move(out[i]));
  }
  return result;
}

SubtitleTrack remap_to_cut_list(const SubtitleTrack &track,
                                const CutList &cuts) {
  SubtitleTrack out;
  for (const auto &cue : track) {
    std::optional<double> first, last;
    double offset = 0.0; //< Output time at which the current segment starts
    for (const auto &seg : cuts.segments) {
      double lo = std::max(cue.start, seg.start);
      double hi = std::min(cue.end, seg.end);
      if (hi > lo) {
        if (!first)
          first = offset + (lo - seg.start);
        last = offset + (hi - seg.start);
      }
      offset += seg.length();
    }
    if (!first || *last - *first < MIN_CUE_SEC)
      continue;
    out.push_back({*first, *last, cue.text});
  }
  return out;
}

} // namespace vidcut
