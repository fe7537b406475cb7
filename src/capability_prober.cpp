/**
 * @file capability_prober.cpp
 * @brief Hardware encoder detection implementation
 */

#include "vidcut/capability_prober.hpp"

#include <algorithm>
#include <sstream>

#include "vidcut/config.hpp"
#include "vidcut/logging.hpp"
#include "vidcut/process.hpp"

namespace vidcut {

namespace {

struct Candidate {
  EncoderCapability capability;
  const char *encoder;
};

/// Fixed priority order
const Candidate kCandidates[] = {
    {EncoderCapability::Nvenc, "h264_nvenc"},
    {EncoderCapability::Amf, "h264_amf"},
    {EncoderCapability::Qsv, "h264_qsv"},
};

bool listed(const std::vector<std::string> &names, const std::string &name) {
  return std::find(names.begin(), names.end(), name) != names.end();
}

} // anonymous namespace

std::vector<std::string> parse_encoder_list(const std::string &output) {
  /// Lines look like " V....D libx264   libx264 H.264 / AVC ..."; the header
  /// legend ends with a " ------" separator line.
  std::vector<std::string> names;
  std::istringstream in(output);
  std::string line;
  bool in_body = false;
  bool saw_separator = output.find("------") != std::string::npos;

  while (std::getline(in, line)) {
    std::istringstream fields(line);
    std::string flags, name;
    if (!(fields >> flags))
      continue;
    if (flags.find("------") != std::string::npos) {
      in_body = true;
      continue;
    }
    if (saw_separator && !in_body)
      continue;
    if (flags.size() != 6 || !(fields >> name))
      continue;
    if (flags[0] != 'V' && flags[0] != 'A' && flags[0] != 'S')
      continue;
    names.push_back(name);
  }
  return names;
}

CapabilityProber::CapabilityProber(std::string ffmpeg_path,
                                   bool hardware_enabled)
    : ffmpeg_path_(std::move(ffmpeg_path)),
      hardware_enabled_(hardware_enabled) {}

CapabilityProber &CapabilityProber::shared() {
  static CapabilityProber instance;
  return instance;
}

EncoderCapability CapabilityProber::probe() { return report().capability; }

ProbeReport CapabilityProber::report() {
  std::lock_guard<std::mutex> lock(mutex_);
  return lookup_locked({ffmpeg_path_, hardware_enabled_});
}

ProbeReport CapabilityProber::report_for(const std::string &ffmpeg_path,
                                         bool hardware_enabled) {
  std::lock_guard<std::mutex> lock(mutex_);
  return lookup_locked({ffmpeg_path, hardware_enabled});
}

ProbeReport CapabilityProber::lookup_locked(const CacheKey &key) {
  auto it = cache_.find(key);
  if (it != cache_.end())
    return it->second;

  TIMER_START(probe);
  ProbeReport report = run_probe(key.first, key.second);
  TIMER_END(probe, "capability probe");
  cache_.emplace(key, report);
  return report;
}

std::optional<EncoderCapability> CapabilityProber::cached() const {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = cache_.find({ffmpeg_path_, hardware_enabled_});
  if (it == cache_.end())
    return std::nullopt;
  return it->second.capability;
}

void CapabilityProber::invalidate() {
  std::lock_guard<std::mutex> lock(mutex_);
  cache_.clear();
}

void CapabilityProber::configure(std::string ffmpeg_path,
                                 bool hardware_enabled) {
  std::lock_guard<std::mutex> lock(mutex_);
  ffmpeg_path_ = std::move(ffmpeg_path);
  hardware_enabled_ = hardware_enabled;
}

bool CapabilityProber::dry_run(const std::string &ffmpeg_path,
                               const std::string &encoder) {
  ProcessResult r = run_process(
      {ffmpeg_path, "-hide_banner", "-nostdin", "-loglevel", "error", "-f",
       "lavfi", "-i", "color=c=black:s=256x256:d=0.1", "-frames:v", "1",
       "-c:v", encoder, "-f", "null", "-"},
      Config::probe_timeout_ms(), nullptr, 5);
  if (!r.ok()) {
    LOG_DEBUG("Dry run of {} failed (exit {}): {}", encoder, r.exit_code,
              r.error_tail.empty() ? r.spawn_error : r.error_tail);
  }
  return r.ok();
}

ProbeReport CapabilityProber::run_probe(const std::string &ffmpeg_path,
                                        bool hardware_enabled) {
  ProbeReport report;

  if (!hardware_enabled) {
    LOG_INFO("Hardware acceleration disabled, using software encoder");
    return report;
  }

  LOG_PHASE("Probing hardware encoders...");

  ProcessResult list = run_process(
      {ffmpeg_path, "-hide_banner", "-nostdin", "-encoders"},
      Config::probe_timeout_ms(), nullptr, 5);
  if (!list.ok()) {
    LOG_WARN("Encoder query failed ({}), using software encoder",
             list.started ? fmt::format("exit {}", list.exit_code)
                          : list.spawn_error);
    return report;
  }

  std::vector<std::string> names = parse_encoder_list(list.output);
  report.encoder_list_read = true;
  report.software_available =
      listed(names, "libx264") || listed(names, "libx265");

  for (const auto &c : kCandidates) {
    if (!listed(names, c.encoder))
      continue;
    report.hardware_listed.push_back(c.encoder);
    if (dry_run(ffmpeg_path, c.encoder)) {
      report.capability = c.capability;
      LOG_SUCCESS("Hardware encoder available: {}", c.encoder);
      return report;
    }
    LOG_INFO("{} is listed but not functional on this host", c.encoder);
  }

  LOG_INFO("No hardware encoder available, using software encoder");
  return report;
}

} // namespace vidcut
