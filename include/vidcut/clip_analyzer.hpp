/**
 * @file clip_analyzer.hpp
 * @brief Detection of filler words and long pauses in a word-level transcript
 *
 * @details Input is one cue per word (transcription with word timestamps).
 *          Detected clips can be turned into remove-segments for a cut.
 */

#ifndef VIDCUT_CLIP_ANALYZER_HPP
#define VIDCUT_CLIP_ANALYZER_HPP

#include <string>
#include <vector>

#include "types.hpp"

namespace vidcut {

enum class ClipType { Filler, Silence };

const char *to_string(ClipType type);

struct AnalyzedClip {
  ClipType type = ClipType::Silence;
  TimeSegment range;
  std::string content; //< The filler word; empty for silence
};

struct ClipSummary {
  size_t filler_count = 0;
  size_t silence_count = 0;
  double filler_duration = 0.0;
  double silence_duration = 0.0;
};

/**
 * @brief Walk word cues in order and report fillers and silences.
 *
 * @param words Word-level cues
 * @param filler_words Words that count as fillers (exact match after trim)
 * @param silence_threshold Gaps strictly longer than this are silences
 */
std::vector<AnalyzedClip> analyze(const SubtitleTrack &words,
                                  const std::vector<std::string> &filler_words,
                                  double silence_threshold);

ClipSummary summarize(const std::vector<AnalyzedClip> &clips);

/**
 * @brief Sort ranges and merge the overlapping or touching ones.
 * @note Empty or inverted ranges are dropped.
 */
std::vector<TimeSegment> merge_ranges(std::vector<TimeSegment> ranges);

/**
 * @brief Sorted, merged, non-overlapping ranges covering all clips.
 */
std::vector<TimeSegment>
to_remove_segments(const std::vector<AnalyzedClip> &clips);

/**
 * @brief Combine user ranges with the detected clips for an automatic cut.
 *
 * @details The user ranges are validated on their own first, so an overlap
 *          between two of them is still an error. Clip ranges are clamped to
 *          [0, duration] and may overlap anything; the union is merged.
 *
 * @throws SegmentValidationError when the user ranges are invalid
 */
std::vector<TimeSegment>
auto_cut_ranges(double duration, const std::vector<TimeSegment> &user,
                const std::vector<AnalyzedClip> &clips);

} // namespace vidcut

#endif // VIDCUT_CLIP_ANALYZER_HPP
