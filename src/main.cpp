/**
 * @file main.cpp
 * @brief Entry point for the vidcut command line
 *
 * @details Main entry point that handles:
 *
 *          - Command-line argument parsing
 *
 *          - Cut mode: remove ranges from one video and re-encode it
 *
 *          - Analyze mode: find filler words and pauses (optionally cut them)
 *
 *          - Probe mode: report the detected encoder capability
 *
 * @note SIGINT/SIGTERM cancel the running job; its partial output is removed.
 *       Exit status: 0 completed, 1 failed, 2 usage/validation error,
 *       130 cancelled.
 */

#include <algorithm>
#include <atomic>
#include <chrono>
#include <csignal>
#include <cstdio>
#include <filesystem>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

#include <fmt/color.h>
#include <fmt/core.h>

#include "vidcut/capability_prober.hpp"
#include "vidcut/clip_analyzer.hpp"
#include "vidcut/config.hpp"
#include "vidcut/errors.hpp"
#include "vidcut/logging.hpp"
#include "vidcut/media_probe.hpp"
#include "vidcut/orchestrator.hpp"
#include "vidcut/segment_resolver.hpp"
#include "vidcut/system.hpp"
#include "vidcut/transcriber.hpp"

using namespace vidcut;

namespace {

constexpr int EXIT_OK = 0;
constexpr int EXIT_FAILED = 1;
constexpr int EXIT_USAGE = 2;
constexpr int EXIT_CANCELLED = 130;

std::atomic<bool> g_interrupted{false};

void on_signal(int) { g_interrupted.store(true); }

struct CliOptions {
  std::string input;
  std::string output;
  std::vector<TimeSegment> remove;
  QualityIntent intent;
  bool subtitles = false;
  std::optional<std::string> language;
  std::string config_path;
  bool no_hwaccel = false;
  bool analyze = false;
  bool auto_cut = false;
  bool probe = false;
};

void print_usage() {
  fmt::print(stderr,
             "Usage: vidcut <input> [output] [--remove START-END]...\n"
             "              [--codec h264|hevc] [--quality N] "
             "[--bitrate RATE] [--bitrate-cap]\n"
             "              [--subtitles] [--language CODE] "
             "[--config FILE] [--no-hwaccel]\n"
             "              [--analyze [--auto-cut]]\n"
             "       vidcut --probe [--config FILE] [--no-hwaccel]\n"
             "\n"
             "Times are seconds or [HH:]MM:SS[.mmm].\n");
}

std::optional<TimeSegment> parse_range(const std::string &text) {
  size_t dash = text.find('-');
  if (dash == std::string::npos)
    return std::nullopt;
  auto start = parse_time(text.substr(0, dash));
  auto end = parse_time(text.substr(dash + 1));
  if (!start || !end)
    return std::nullopt;
  return TimeSegment{*start, *end};
}

std::optional<int> parse_int(const std::string &text) {
  try {
    size_t used = 0;
    int v = std::stoi(text, &used);
    if (used != text.size())
      return std::nullopt;
    return v;
  } catch (const std::logic_error &) {
    return std::nullopt;
  }
}

/**
 * @brief Parse argv into options.
 * @return false (after printing the reason) on a usage error
 */
bool parse_args(int argc, char *argv[], CliOptions &opt) {
  std::vector<std::string> positional;

  for (int i = 1; i < argc; ++i) {
    std::string arg = argv[i];
    auto value = [&](std::string &out) {
      if (i + 1 >= argc) {
        LOG_ERROR("{} requires a value", arg);
        return false;
      }
      out = argv[++i];
      return true;
    };

    std::string v;
    if (arg == "--remove") {
      if (!value(v))
        return false;
      auto range = parse_range(v);
      if (!range) {
        LOG_ERROR("Invalid range '{}' (expected START-END)", v);
        return false;
      }
      opt.remove.push_back(*range);
    } else if (arg == "--codec") {
      if (!value(v))
        return false;
      if (v == "h264") {
        opt.intent.codec = VideoCodec::H264;
      } else if (v == "hevc" || v == "h265") {
        opt.intent.codec = VideoCodec::Hevc;
      } else {
        LOG_ERROR("Unknown codec '{}' (h264 or hevc)", v);
        return false;
      }
    } else if (arg == "--quality") {
      if (!value(v))
        return false;
      auto q = parse_int(v);
      if (!q) {
        LOG_ERROR("Invalid quality factor '{}'", v);
        return false;
      }
      opt.intent.quality_factor = *q;
    } else if (arg == "--bitrate") {
      if (!value(v))
        return false;
      opt.intent.bitrate_ceiling = v;
    } else if (arg == "--bitrate-cap") {
      opt.intent.rate_control = RateControl::BitrateCap;
    } else if (arg == "--subtitles") {
      opt.subtitles = true;
    } else if (arg == "--language") {
      if (!value(v))
        return false;
      opt.language = v;
    } else if (arg == "--config") {
      if (!value(opt.config_path))
        return false;
    } else if (arg == "--no-hwaccel") {
      opt.no_hwaccel = true;
    } else if (arg == "--analyze") {
      opt.analyze = true;
    } else if (arg == "--auto-cut") {
      opt.auto_cut = true;
    } else if (arg == "--probe") {
      opt.probe = true;
    } else if (arg == "-h" || arg == "--help") {
      return false;
    } else if (!arg.empty() && arg[0] == '-' && arg.size() > 1) {
      LOG_ERROR("Unknown option '{}'", arg);
      return false;
    } else {
      positional.push_back(arg);
    }
  }

  if (opt.probe)
    return positional.empty();
  if (positional.empty() || positional.size() > 2)
    return false;
  if (opt.auto_cut && !opt.analyze) {
    LOG_ERROR("--auto-cut requires --analyze");
    return false;
  }
  opt.input = positional[0];
  if (positional.size() == 2)
    opt.output = positional[1];
  return true;
}

std::string default_output_path(const Settings &settings,
                                const std::string &input) {
  namespace fs = std::filesystem;
  fs::path in(input);
  std::string name = in.stem().string() + "_cut" + in.extension().string();
  return (fs::path(settings.default_output_dir) / name).string();
}

// **---- Probe Mode ----**

int run_probe(const Settings &settings) {
  CapabilityProber &prober = CapabilityProber::shared();
  prober.configure(settings.ffmpeg_path, settings.hardware_acceleration);
  ProbeReport report = prober.report();

  fmt::print(fg(fmt::color::cyan),
             "================ ENCODER CAPABILITY ================\n");
  fmt::print("{:<24} {:>20}\n", "Capability:", to_string(report.capability));
  fmt::print("{:<24} {:>20}\n", "Encoder list read:",
             report.encoder_list_read ? "yes" : "no");
  fmt::print("{:<24} {:>20}\n", "Software encoder:",
             report.software_available ? "yes" : "no");
  std::string listed;
  for (const auto &name : report.hardware_listed)
    listed += (listed.empty() ? "" : ",") + name;
  fmt::print("{:<24} {:>20}\n", "Hardware listed:",
             listed.empty() ? "-" : listed);
  fmt::print(fg(fmt::color::cyan),
             "====================================================\n");
  return EXIT_OK;
}

// **---- Analyze Mode ----**

/**
 * @brief Transcribe word by word and report fillers and pauses.
 * @param remove Output: ranges to cut when auto-cut is requested
 * @return Exit status, or -1 to continue with the cut
 */
int run_analyze(const Settings &settings, const CliOptions &opt,
                const VideoSource &source, std::vector<TimeSegment> &remove) {
  LOG_PHASE("Analyzing speech...");
  SubtitleIntegrator integrator(settings);
  SubtitleTrack words;
  try {
    words = integrator.generate(source, opt.language, true, &g_interrupted);
  } catch (const SubtitleGenerationError &e) {
    if (g_interrupted.load()) {
      LOG_WARN("Analysis cancelled");
      return EXIT_CANCELLED;
    }
    LOG_ERROR("Analysis failed: {}", e.what());
    return EXIT_FAILED;
  }

  std::vector<AnalyzedClip> clips =
      analyze(words, settings.filler_words, settings.silence_threshold);
  ClipSummary summary = summarize(clips);

  for (const auto &c : clips) {
    fmt::print("{:<8} {} - {}  {}\n", to_string(c.type),
               format_time(c.range.start), format_time(c.range.end),
               c.content);
  }
  fmt::print("\n");
  fmt::print(fg(fmt::color::cyan),
             "================= ANALYSIS SUMMARY =================\n");
  fmt::print("{:<20} {:>10} {:>15}\n", "Words:", words.size(), "");
  fmt::print("{:<20} {:>10} {:>14.1f}s\n", "Fillers:", summary.filler_count,
             summary.filler_duration);
  fmt::print("{:<20} {:>10} {:>14.1f}s\n", "Silences:", summary.silence_count,
             summary.silence_duration);
  fmt::print(fg(fmt::color::cyan),
             "====================================================\n");

  if (!opt.auto_cut)
    return EXIT_OK;

  try {
    remove = auto_cut_ranges(source.duration, remove, clips);
  } catch (const SegmentValidationError &e) {
    LOG_ERROR("Invalid ranges: {}", e.what());
    return EXIT_USAGE;
  }
  LOG_INFO("Auto-cut: {} range(s) to remove", remove.size());
  return -1;
}

// **---- Cut Summary ----**

void print_cut_summary(const VideoSource &source, const JobSnapshot &snap) {
  double kept = snap.cut_list.total_duration();
  double removed = source.duration - kept;
  double saved_pct =
      (source.duration > 0) ? removed / source.duration * 100.0 : 0.0;

  fmt::print("\n");
  fmt::print(fg(fmt::color::cyan),
             "=================== CUT SUMMARY ====================\n");
  fmt::print("{:<20} {:>15}\n", "Original:", format_time(source.duration));
  fmt::print("{:<20} {:>15}\n", "Output:", format_time(kept));
  fmt::print("{:<20} {:>15}\n", "Removed:", format_time(removed));
  fmt::print("{:<20} {:>14}%\n", "Saved:", static_cast<int>(saved_pct));
  if (snap.profile)
    fmt::print("{:<20} {:>15}\n", "Encoder:", snap.profile->codec);
  if (snap.subtitle_path)
    fmt::print("{:<20} {}\n", "Subtitles:", *snap.subtitle_path);
  fmt::print(fg(fmt::color::cyan),
             "====================================================\n");
  std::fflush(stdout);
}

// **---- Cut Mode ----**

int run_cut(const Settings &settings, const CliOptions &opt,
            const VideoSource &source, std::vector<TimeSegment> remove) {
  JobRequest request;
  request.source = source;
  request.remove = std::move(remove);
  request.intent = opt.intent;
  request.output_path =
      opt.output.empty() ? default_output_path(settings, opt.input)
                         : opt.output;
  if (opt.subtitles)
    request.subtitles = SubtitleRequest{opt.language, false};

  JobOrchestrator orchestrator(settings);
  JobId id = 0;
  try {
    id = orchestrator.submit(std::move(request));
  } catch (const SegmentValidationError &e) {
    LOG_ERROR("Invalid ranges: {}", e.what());
    return EXIT_USAGE;
  }

  /// Progress is reported in 5% steps
  int last_step = -1;
  bool cancel_sent = false;
  std::optional<JobSnapshot> final_snapshot;

  while (!final_snapshot) {
    if (g_interrupted.load() && !cancel_sent) {
      cancel_sent = true;
      orchestrator.cancel(id);
    }

    auto event = orchestrator.events().pop_for(std::chrono::milliseconds(200));
    if (!event)
      continue;

    switch (event->kind) {
    case JobEventKind::Progress: {
      int step = static_cast<int>(event->progress.percent * 20.0);
      if (step > last_step) {
        last_step = step;
        LOG_INFO("[Job {}] {:5.1f}%  elapsed {}  ETA {}", id,
                 event->progress.percent * 100.0,
                 format_time(event->progress.elapsed_sec),
                 format_eta(event->progress.eta_sec));
      }
      break;
    }
    case JobEventKind::Finished:
      final_snapshot = orchestrator.snapshot(id);
      break;
    default:
      break;
    }
  }

  TimingCollector::print_summary();

  switch (final_snapshot->state) {
  case JobState::Completed:
    print_cut_summary(source, *final_snapshot);
    return EXIT_OK;
  case JobState::Cancelled:
    LOG_WARN("Cancelled, partial output removed");
    return EXIT_CANCELLED;
  default:
    if (final_snapshot->error &&
        final_snapshot->error->kind == ErrorKind::SegmentValidation)
      return EXIT_USAGE;
    return EXIT_FAILED;
  }
}

} // anonymous namespace

// **---- MAIN ----**

int main(int argc, char *argv[]) {
  /// Disable stdout buffering for real-time log visibility
  std::setvbuf(stdout, nullptr, _IONBF, 0);

  CliOptions opt;
  if (!parse_args(argc, argv, opt)) {
    print_usage();
    return EXIT_USAGE;
  }

  std::signal(SIGINT, on_signal);
  std::signal(SIGTERM, on_signal);

  Settings settings = load_settings(opt.config_path);
  if (opt.no_hwaccel)
    settings.hardware_acceleration = false;

  if (opt.probe)
    return run_probe(settings);

  LOG_INFO("vidcut - {} mode", opt.analyze ? "Analyze" : "Cut");
  LOG_INFO("Input: {}", opt.input);

  VideoSource source;
  std::string probe_error;
  TIMER_START(media_probe);
  if (!probe_video_source(opt.input, source, probe_error)) {
    LOG_ERROR("{}", probe_error);
    return EXIT_USAGE;
  }
  TIMER_END(media_probe, "media probe");
  LOG_INFO("Duration: {} ({}x{} {} @ {:.2f}fps{})",
           format_time(source.duration), source.width, source.height,
           source.video_codec, source.fps,
           source.has_audio ? "" : ", no audio");

  std::vector<TimeSegment> remove = opt.remove;
  if (opt.analyze) {
    int rc = run_analyze(settings, opt, source, remove);
    if (rc >= 0)
      return rc;
  }

  if (remove.empty()) {
    LOG_WARN("No ranges to remove; the whole video will be re-encoded");
  }
  return run_cut(settings, opt, source, std::move(remove));
}
