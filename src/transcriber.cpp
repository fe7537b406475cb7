/**
 * @file transcriber.cpp
 * @brief Subtitle generation implementation
 */

#include "vidcut/transcriber.hpp"

#include <cstdlib>
#include <filesystem>
#include <system_error>

#include <fmt/core.h>

#include "vidcut/errors.hpp"
#include "vidcut/logging.hpp"
#include "vidcut/process.hpp"
#include "vidcut/subtitles.hpp"
#include "vidcut/system.hpp"

namespace fs = std::filesystem;

namespace vidcut {

namespace {

/// Private working directory, removed with its contents on scope exit
class TempDir {
public:
  TempDir() {
    std::error_code ec;
    fs::path base = fs::temp_directory_path(ec);
    if (ec)
      base = "/tmp";
    std::string tmpl = (base / "vidcut-XXXXXX").string();
    if (mkdtemp(tmpl.data()))
      path_ = tmpl;
  }

  ~TempDir() {
    if (path_.empty())
      return;
    std::error_code ec;
    fs::remove_all(path_, ec);
    if (ec)
      LOG_WARN("Cannot remove temp directory {}: {}", path_.string(),
               ec.message());
  }

  TempDir(const TempDir &) = delete;
  TempDir &operator=(const TempDir &) = delete;

  bool valid() const { return !path_.empty(); }
  const fs::path &path() const { return path_; }

private:
  fs::path path_;
};

std::string describe(const ProcessResult &r) {
  if (!r.started)
    return r.spawn_error;
  if (r.timed_out)
    return "timed out";
  std::string msg = fmt::format("exit code {}", r.exit_code);
  if (!r.error_tail.empty())
    msg += ": " + r.error_tail;
  return msg;
}

} // anonymous namespace

std::string SubtitleIntegrator::model_path() const {
  const std::string &model = settings_.whisper_model;
  bool is_path = model.find('/') != std::string::npos ||
                 (model.size() > 4 &&
                  model.compare(model.size() - 4, 4, ".bin") == 0);
  if (is_path)
    return model;
  return (fs::path(settings_.whisper_models_dir) /
          fmt::format("ggml-{}.bin", model))
      .string();
}

std::vector<std::string>
SubtitleIntegrator::extract_args(const std::string &input,
                                 const std::string &wav) const {
  return {settings_.ffmpeg_path, "-y", "-hide_banner", "-loglevel", "error",
          "-nostdin", "-i", input, "-vn", "-ac", "1", "-ar", "16000", "-c:a",
          "pcm_s16le", wav};
}

std::vector<std::string> SubtitleIntegrator::transcribe_args(
    const std::string &wav, const std::string &base,
    const std::optional<std::string> &language, bool word_timestamps) const {
  std::vector<std::string> args = {settings_.whisper_path,
                                   "-m",
                                   model_path(),
                                   "-f",
                                   wav,
                                   "-osrt",
                                   "-of",
                                   base,
                                   "-t",
                                   std::to_string(detect_cpu_limit())};
  if (language && !language->empty()) {
    args.push_back("-l");
    args.push_back(*language);
  }
  if (word_timestamps) {
    args.push_back("-ml");
    args.push_back("1");
    args.push_back("-sow");
  }
  args.push_back("-np");
  return args;
}

SubtitleTrack
SubtitleIntegrator::generate(const VideoSource &source,
                             const std::optional<std::string> &language,
                             bool word_timestamps,
                             const std::atomic<bool> *cancel) const {
  if (!source.has_audio)
    throw SubtitleGenerationError(
        fmt::format("'{}' has no audio stream", source.path));

  TempDir tmp;
  if (!tmp.valid())
    throw SubtitleGenerationError("cannot create temporary directory");

  const std::string wav = (tmp.path() / "audio.wav").string();
  const std::string base = (tmp.path() / "transcript").string();
  const size_t tail = static_cast<size_t>(Config::diagnostic_tail_lines());

  // **---- AUDIO EXTRACTION ----**

  TIMER_START(extract);
  ProcessResult extract =
      run_process(extract_args(source.path, wav), 0, cancel, tail);
  TIMER_END(extract, "audio extraction");
  if (extract.cancelled)
    throw SubtitleGenerationError("cancelled during audio extraction");
  if (!extract.ok() || !is_nonempty_file(wav))
    throw SubtitleGenerationError(
        fmt::format("audio extraction failed ({})", describe(extract)));

  // **---- TRANSCRIPTION ----**

  std::string model = model_path();
  if (!fs::exists(model))
    throw SubtitleGenerationError(
        fmt::format("transcription model not found: {}", model));

  LOG_INFO("Transcribing {} with {}", source.path, model);
  TIMER_START(transcribe);
  ProcessResult run = run_process(
      transcribe_args(wav, base, language, word_timestamps), 0, cancel, tail);
  TIMER_END(transcribe, "transcription");
  if (run.cancelled)
    throw SubtitleGenerationError("cancelled during transcription");
  if (!run.ok())
    throw SubtitleGenerationError(
        fmt::format("transcription failed ({})", describe(run)));

  auto track = read_srt_file(base + ".srt");
  if (!track)
    throw SubtitleGenerationError("transcription produced no subtitle file");

  SubtitleTrack normalized = normalize_track(std::move(*track));
  LOG_DEBUG("Transcript has {} cue(s)", normalized.size());
  return normalized;
}

} // namespace vidcut
