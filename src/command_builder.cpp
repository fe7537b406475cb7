/**
 * @file command_builder.cpp
 * @brief Encoder command rendering
 */

#include "vidcut/command_builder.hpp"

#include <algorithm>
#include <cctype>
#include <iterator>

#include <fmt/core.h>

#include "vidcut/errors.hpp"
#include "vidcut/profile_selector.hpp"

namespace vidcut {

namespace {

const std::vector<std::string> kSoftwarePresets = {
    "ultrafast", "superfast", "veryfast", "faster", "fast",
    "medium",    "slow",      "slower",   "veryslow", "placebo"};

const std::vector<std::string> kNvencPresets = {
    "default", "slow", "medium", "fast", "hp", "hq",  "bd", "ll",
    "llhq",    "llhp", "lossless", "losslesshp", "p1", "p2", "p3", "p4",
    "p5",      "p6",   "p7"};

const std::vector<std::string> kQsvPresets = {
    "veryfast", "faster", "fast", "medium", "slow", "slower", "veryslow"};

bool contains(const std::vector<std::string> &list, const std::string &v) {
  return std::find(list.begin(), list.end(), v) != list.end();
}

/// AMF has no -preset; the tier maps onto its -quality option
std::string amf_quality(const std::string &preset) {
  if (preset == "slow" || preset == "slower" || preset == "quality")
    return "quality";
  if (preset == "medium" || preset == "balanced")
    return "balanced";
  if (preset == "fast" || preset == "faster" || preset == "speed")
    return "speed";
  return "";
}

/// Validate "<digits>[kKmM]" and return the doubled value for -bufsize
std::string double_rate(const std::string &rate) {
  if (rate.empty())
    return "";
  size_t digits = 0;
  while (digits < rate.size() &&
         std::isdigit(static_cast<unsigned char>(rate[digits])))
    ++digits;
  if (digits == 0)
    return "";
  std::string suffix = rate.substr(digits);
  if (!(suffix.empty() || suffix == "k" || suffix == "K" || suffix == "m" ||
        suffix == "M"))
    return "";
  unsigned long long value = 0;
  try {
    value = std::stoull(rate.substr(0, digits));
  } catch (const std::exception &) {
    return "";
  }
  if (value == 0)
    return "";
  return fmt::format("{}{}", value * 2, suffix);
}

std::string fmt_time(double t) { return fmt::format("{:.3f}", t); }

bool is_shell_safe(const std::string &arg) {
  if (arg.empty())
    return false;
  return std::all_of(arg.begin(), arg.end(), [](unsigned char c) {
    return std::isalnum(c) || c == '_' || c == '-' || c == '.' || c == '/' ||
           c == ':' || c == '=' || c == '+' || c == ',' || c == '@' ||
           c == '%';
  });
}

} // anonymous namespace

std::vector<std::string> CommandSpec::argv() const {
  std::vector<std::string> out;
  out.reserve(args.size() + 1);
  out.push_back(program);
  out.insert(out.end(), args.begin(), args.end());
  return out;
}

std::string build_filter_graph(const CutList &cuts, bool with_audio) {
  std::string graph;
  std::string concat_inputs;

  for (size_t i = 0; i < cuts.segments.size(); ++i) {
    const auto &s = cuts.segments[i];
    graph += fmt::format("[0:v]trim=start={}:end={},setpts=PTS-STARTPTS[v{}];",
                         fmt_time(s.start), fmt_time(s.end), i);
    concat_inputs += fmt::format("[v{}]", i);
    if (with_audio) {
      graph += fmt::format(
          "[0:a]atrim=start={}:end={},asetpts=PTS-STARTPTS[a{}];",
          fmt_time(s.start), fmt_time(s.end), i);
      concat_inputs += fmt::format("[a{}]", i);
    }
  }

  graph += fmt::format("{}concat=n={}:v=1:a={}{}", concat_inputs,
                       cuts.segments.size(), with_audio ? 1 : 0,
                       with_audio ? "[v][a]" : "[v]");
  return graph;
}

std::vector<std::string> render_video_args(const EncodingProfile &profile) {
  // **---- COMMON VALIDATION ----**

  if (profile.codec != encoder_name(profile.encoder, VideoCodec::H264) &&
      profile.codec != encoder_name(profile.encoder, VideoCodec::Hevc)) {
    throw ProfileIncompatibleError(
        fmt::format("codec '{}' is not rendered by the {} encoder",
                    profile.codec, to_string(profile.encoder)));
  }
  if (profile.quality_factor < 0 || profile.quality_factor > 51) {
    throw ProfileIncompatibleError(fmt::format(
        "quality factor {} outside 0-51", profile.quality_factor));
  }
  const std::string buffer = double_rate(profile.bitrate_ceiling);
  if (buffer.empty()) {
    throw ProfileIncompatibleError(fmt::format(
        "bitrate ceiling '{}' is not <digits>[k|M]", profile.bitrate_ceiling));
  }

  const std::string q = std::to_string(profile.quality_factor);
  const std::string &rate = profile.bitrate_ceiling;
  const bool capped = (profile.rate_control == RateControl::BitrateCap);

  std::vector<std::string> a = {"-c:v", profile.codec};

  switch (profile.encoder) {
  case EncoderCapability::Cpu: {
    if (!contains(kSoftwarePresets, profile.preset))
      break;
    a.insert(a.end(), {"-preset", profile.preset});
    if (capped) {
      a.insert(a.end(), {"-b:v", rate});
    } else {
      a.insert(a.end(), {"-crf", q});
    }
    a.insert(a.end(), {"-maxrate", rate, "-bufsize", buffer});
    if (profile.codec == "libx264")
      a.insert(a.end(), {"-x264-params", "aq-mode=2:aq-strength=1.0"});
    return a;
  }
  case EncoderCapability::Nvenc: {
    if (!contains(kNvencPresets, profile.preset))
      break;
    a.insert(a.end(), {"-preset", profile.preset, "-rc", "vbr"});
    if (capped) {
      a.insert(a.end(), {"-b:v", rate});
    } else {
      a.insert(a.end(), {"-cq", q, "-b:v", "0"});
    }
    a.insert(a.end(), {"-maxrate", rate, "-bufsize", buffer});
    return a;
  }
  case EncoderCapability::Amf: {
    const std::string quality = amf_quality(profile.preset);
    if (quality.empty())
      break;
    a.insert(a.end(), {"-quality", quality});
    if (capped) {
      a.insert(a.end(), {"-rc", "vbr_peak", "-b:v", rate});
    } else {
      a.insert(a.end(), {"-rc", "qvbr", "-qvbr_quality_level", q});
    }
    a.insert(a.end(), {"-maxrate", rate, "-bufsize", buffer});
    return a;
  }
  case EncoderCapability::Qsv: {
    if (!contains(kQsvPresets, profile.preset))
      break;
    a.insert(a.end(), {"-preset", profile.preset});
    if (capped) {
      a.insert(a.end(), {"-b:v", rate});
    } else {
      a.insert(a.end(), {"-global_quality", q});
    }
    a.insert(a.end(), {"-maxrate", rate, "-bufsize", buffer});
    return a;
  }
  }

  throw ProfileIncompatibleError(
      fmt::format("preset '{}' has no parameter set for the {} encoder",
                  profile.preset, to_string(profile.encoder)));
}

CommandSpec build_command(const VideoSource &source, const CutList &cuts,
                          const EncodingProfile &profile,
                          const std::string &output_path) {
  if (cuts.empty())
    throw ProfileIncompatibleError("cannot render an empty cut-list");

  CommandSpec spec;
  spec.filter_graph = build_filter_graph(cuts, source.has_audio);

  std::vector<std::string> video = render_video_args(profile);

  auto &a = spec.args;
  a = {"-hide_banner", "-nostdin", "-y",       "-loglevel", "error",
       "-nostats",     "-progress", "pipe:1",  "-i",        source.path,
       "-filter_complex", spec.filter_graph, "-map", "[v]"};
  if (source.has_audio)
    a.insert(a.end(), {"-map", "[a]"});

  a.insert(a.end(), std::make_move_iterator(video.begin()),
           std::make_move_iterator(video.end()));
  a.insert(a.end(), {"-pix_fmt", "yuv420p"});
  if (source.has_audio)
    a.insert(a.end(), {"-c:a", "aac", "-b:a", "192k"});
  a.insert(a.end(), {"-movflags", "+faststart", output_path});

  return spec;
}

std::string render(const CommandSpec &spec) {
  std::string line;
  for (const auto &arg : spec.argv()) {
    if (!line.empty())
      line += ' ';
    if (is_shell_safe(arg)) {
      line += arg;
      continue;
    }
    line += '\'';
    for (char c : arg) {
      if (c == '\'')
        line += "'\\''";
      else
        line += c;
    }
    line += '\'';
  }
  return line;
}

} // namespace vidcut
