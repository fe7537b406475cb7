/**
 * @file clip_analyzer.cpp
 * @brief Filler and silence detection implementation
 */

#include "vidcut/clip_analyzer.hpp"

#include <algorithm>
#include <cctype>

#include "vidcut/segment_resolver.hpp"

namespace vidcut {

namespace {

std::string trim(const std::string &s) {
  size_t b = 0, e = s.size();
  while (b < e && std::isspace(static_cast<unsigned char>(s[b])))
    ++b;
  while (e > b && std::isspace(static_cast<unsigned char>(s[e - 1])))
    --e;
  return s.substr(b, e - b);
}

} // anonymous namespace

const char *to_string(ClipType type) {
  switch (type) {
  case ClipType::Filler:
    return "filler";
  case ClipType::Silence:
    return "silence";
  }
  return "unknown";
}

std::vector<AnalyzedClip> analyze(const SubtitleTrack &words,
                                  const std::vector<std::string> &filler_words,
                                  double silence_threshold) {
  std::vector<AnalyzedClip> clips;
  double last_word_end = 0.0;

  for (const auto &word : words) {
    double gap = word.start - last_word_end;
    if (gap > silence_threshold) {
      clips.push_back(
          {ClipType::Silence, {last_word_end, word.start}, std::string()});
    }

    std::string text = trim(word.text);
    if (!text.empty() && std::find(filler_words.begin(), filler_words.end(),
                                   text) != filler_words.end()) {
      clips.push_back({ClipType::Filler, {word.start, word.end}, text});
    }

    last_word_end = std::max(last_word_end, word.end);
  }
  return clips;
}

ClipSummary summarize(const std::vector<AnalyzedClip> &clips) {
  ClipSummary s;
  for (const auto &c : clips) {
    if (c.type == ClipType::Filler) {
      ++s.filler_count;
      s.filler_duration += c.range.length();
    } else {
      ++s.silence_count;
      s.silence_duration += c.range.length();
    }
  }
  return s;
}

std::vector<TimeSegment> merge_ranges(std::vector<TimeSegment> ranges) {
  std::sort(ranges.begin(), ranges.end(),
            [](const TimeSegment &a, const TimeSegment &b) {
              return a.start < b.start;
            });

  std::vector<TimeSegment> merged;
  for (const auto &r : ranges) {
    if (!(r.end > r.start))
      continue;
    if (!merged.empty() && r.start <= merged.back().end) {
      merged.back().end = std::max(merged.back().end, r.end);
    } else {
      merged.push_back(r);
    }
  }
  return merged;
}

std::vector<TimeSegment>
to_remove_segments(const std::vector<AnalyzedClip> &clips) {
  std::vector<TimeSegment> ranges;
  ranges.reserve(clips.size());
  for (const auto &c : clips)
    ranges.push_back(c.range);
  return merge_ranges(std::move(ranges));
}

std::vector<TimeSegment>
auto_cut_ranges(double duration, const std::vector<TimeSegment> &user,
                const std::vector<AnalyzedClip> &clips) {
  resolve_segments(duration, user);

  /// Word timings may run a few milliseconds past the probed duration
  std::vector<TimeSegment> ranges = to_remove_segments(clips);
  for (auto &r : ranges) {
    r.start = std::max(0.0, r.start);
    r.end = std::min(r.end, duration);
  }
  ranges.insert(ranges.end(), user.begin(), user.end());
  return merge_ranges(std::move(ranges));
}

} // namespace vidcut
