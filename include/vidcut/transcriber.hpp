/**
 * @file transcriber.hpp
 * @brief Speech-to-text subtitle generation
 *
 * @details Two external tools run in sequence inside a private temporary
 *          directory:
 *
 *          1. the encoding tool extracts 16 kHz mono PCM audio
 *
 *          2. the transcription engine writes an SRT transcript
 *
 *          The transcript is parsed and normalized; it stays on the source
 *          timeline (remapping through a cut-list is the caller's job).
 */

#ifndef VIDCUT_TRANSCRIBER_HPP
#define VIDCUT_TRANSCRIBER_HPP

#include <atomic>
#include <optional>
#include <string>
#include <vector>

#include "config.hpp"
#include "types.hpp"

namespace vidcut {

class SubtitleIntegrator {
public:
  explicit SubtitleIntegrator(Settings settings)
      : settings_(std::move(settings)) {}

  /**
   * @brief Transcribe the audio of a source.
   *
   * @param source Input media (must have an audio stream)
   * @param language Language hint; unset = auto-detect
   * @param word_timestamps One cue per word instead of per sentence
   * @param cancel Optional flag; set = abort the running tool
   * @throws SubtitleGenerationError on any failure, cancellation included
   */
  SubtitleTrack generate(const VideoSource &source,
                         const std::optional<std::string> &language,
                         bool word_timestamps,
                         const std::atomic<bool> *cancel = nullptr) const;

  /**
   * @brief Model file used for transcription.
   * @details A value containing '/' or ending in ".bin" is a path; anything
   *          else is a model id looked up as
   *          "<whisper_models_dir>/ggml-<id>.bin".
   */
  std::string model_path() const;

  /// Audio extraction command
  std::vector<std::string> extract_args(const std::string &input,
                                        const std::string &wav) const;

  /// Transcription command; writes "<base>.srt"
  std::vector<std::string>
  transcribe_args(const std::string &wav, const std::string &base,
                  const std::optional<std::string> &language,
                  bool word_timestamps) const;

private:
  Settings settings_;
};

} // namespace vidcut

#endif // VIDCUT_TRANSCRIBER_HPP
