/**
 * @file subtitles.hpp
 * @brief SRT reading/writing and cut-list remapping
 *
 * @details A transcript is produced on the source timeline. After cutting,
 *          every cue is moved onto the output timeline:
 *
 *          - cues entirely inside removed ranges are dropped
 *
 *          - cues spanning a cut are collapsed to the span between their
 *            first and last kept instants
 */

#ifndef VIDCUT_SUBTITLES_HPP
#define VIDCUT_SUBTITLES_HPP

#include <optional>
#include <string>

#include "types.hpp"

namespace vidcut {

/**
 * @brief Parse SRT text. Malformed blocks are skipped.
 */
SubtitleTrack parse_srt(const std::string &text);

/**
 * @brief Read and parse an SRT file.
 * @return nullopt if the file cannot be read
 */
std::optional<SubtitleTrack> read_srt_file(const std::string &path);

/// "HH:MM:SS,mmm"
std::string format_srt_time(double seconds);

/// Full SRT document with 1-based indices
std::string format_srt(const SubtitleTrack &track);

/**
 * @brief Write a track as SRT.
 * @return false on I/O error
 */
bool write_srt(const std::string &path, const SubtitleTrack &track);

/**
 * @brief Sort by start, drop empty and zero-length cues, clamp overlaps.
 */
SubtitleTrack normalize_track(SubtitleTrack track);

/**
 * @brief Move a source-timeline track onto the timeline of the cut output.
 */
SubtitleTrack remap_to_cut_list(const SubtitleTrack &track,
                                const CutList &cuts);

} // namespace vidcut

#endif // VIDCUT_SUBTITLES_HPP
