/**
 * @file types.hpp
 * @brief Core data types shared across the vidcut pipeline
 *
 * @details Contains the fundamental value types used throughout the
 * application:
 *          - TimeSegment and CutList for time ranges
 *
 *          - VideoSource describing a probed input file
 *
 *          - EncoderCapability, EncodingProfile and QualityIntent
 *
 *          - ProgressSample emitted while a job executes
 *
 *          - SubtitleCue / SubtitleTrack for timed text
 */

#ifndef VIDCUT_TYPES_HPP
#define VIDCUT_TYPES_HPP

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace vidcut {

// **----- TIME RANGES -----**

/**
 * @struct TimeSegment
 * @brief Represents a time range [start, end) in seconds.
 * @note Used both for user "remove" ranges and resolved "keep" ranges.
 */
struct TimeSegment {
  double start = 0.0; //< Start time in seconds
  double end = 0.0;   //< End time in seconds

  double length() const { return end - start; }
};

/**
 * @struct CutList
 * @brief Ordered, non-overlapping keep-segments of a source.
 * @note Segments are sorted by start time and are never reordered downstream.
 */
struct CutList {
  std::vector<TimeSegment> segments;

  bool empty() const { return segments.empty(); }
  size_t size() const { return segments.size(); }

  /// Sum of all keep-segment lengths
  double total_duration() const {
    double total = 0.0;
    for (const auto &s : segments)
      total += s.length();
    return total;
  }
};

// **----- SOURCE -----**

/**
 * @struct VideoSource
 * @brief Metadata of an imported video, immutable once probed.
 */
struct VideoSource {
  std::string path;        //< Path to the input file
  double duration = 0.0;   //< Total duration in seconds
  std::string container;   //< Demuxer name (e.g. "mov,mp4,m4a,3gp,3g2,mj2")
  std::string video_codec; //< Video codec name (e.g. "h264")
  int width = 0;
  int height = 0;
  double fps = 0.0;      //< Average frame rate (0 = unknown)
  bool has_audio = true; //< Whether an audio stream is present
};

// **----- ENCODING -----**

/**
 * @brief Encoding paths the host can execute.
 * @note Cpu is the software fallback ("no hardware acceleration").
 */
enum class EncoderCapability { Cpu, Nvenc, Amf, Qsv };

/// Codec family requested by the user
enum class VideoCodec { H264, Hevc };

/// Rate-control mode
enum class RateControl {
  QualityFactor, //< Constant quality (crf / cq / qp), bitrate used as ceiling
  BitrateCap     //< Target bitrate equal to the ceiling
};

/**
 * @struct QualityIntent
 * @brief What the user asks for; unset fields fall back to config and table.
 */
struct QualityIntent {
  VideoCodec codec = VideoCodec::H264;
  RateControl rate_control = RateControl::QualityFactor;
  std::optional<int> quality_factor;
  std::optional<std::string> bitrate_ceiling;
};

/**
 * @struct EncodingProfile
 * @brief Concrete encoder parameters selected for one job.
 */
struct EncodingProfile {
  EncoderCapability encoder = EncoderCapability::Cpu;
  std::string codec; //< Encoder identifier (e.g. "libx264", "h264_nvenc")
  RateControl rate_control = RateControl::QualityFactor;
  int quality_factor = 16;
  std::string preset;          //< Preset / speed tier
  std::string bitrate_ceiling; //< e.g. "20000k"
};

// **----- PROGRESS -----**

/**
 * @struct ProgressSample
 * @brief One progress observation of a running encode. Never persisted.
 */
struct ProgressSample {
  double source_time = 0.0; //< Output time processed so far (seconds)
  double percent = 0.0;     //< Fraction in [0, 1]
  double elapsed_sec = 0.0; //< Wall-clock time since execution started
  double eta_sec = 0.0;     //< Smoothed estimated remaining time (>= 0)
};

// **----- SUBTITLES -----**

/**
 * @struct SubtitleCue
 * @brief A single caption (or a single word in word-level transcripts).
 */
struct SubtitleCue {
  double start = 0.0;
  double end = 0.0;
  std::string text;
};

/// Time-ordered, non-overlapping sequence of cues
using SubtitleTrack = std::vector<SubtitleCue>;

// **----- NAMES -----**

const char *to_string(EncoderCapability capability);
const char *to_string(VideoCodec codec);
const char *to_string(RateControl mode);

} // namespace vidcut

#endif // VIDCUT_TYPES_HPP
