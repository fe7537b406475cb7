/**
 * @file logging.cpp
 * @brief Log sink and timing collector
 */

#include "vidcut/logging.hpp"

#include <cstdio>

#include <fmt/color.h>

#include "vidcut/config.hpp"

namespace vidcut {

namespace {

std::mutex log_mutex;

const auto kStartTime = std::chrono::steady_clock::now();

struct LevelStyle {
  const char *tag;
  fmt::text_style style;
  bool to_stderr;
};

LevelStyle style_for(LogLevel level) {
  switch (level) {
  case LogLevel::Debug:
    return {"[DEBUG] ", fg(fmt::color::gray), false};
  case LogLevel::Info:
    return {"[INFO] ", fmt::text_style(), false};
  case LogLevel::Phase:
    return {"", fg(fmt::color::cyan), false};
  case LogLevel::Success:
    return {"", fg(fmt::color::green), false};
  case LogLevel::Warn:
    return {"[WARN] ", fg(fmt::color::yellow), true};
  case LogLevel::Error:
    return {"[ERROR] ", fg(fmt::color::red), true};
  }
  return {"", fmt::text_style(), false};
}

} // anonymous namespace

bool debug_enabled() {
  static bool val = (Config::get_env_int("VIDCUT_DEBUG", 0) != 0);
  return val;
}

namespace detail {

void log_line(LogLevel level, const std::string &message) {
  const LevelStyle s = style_for(level);
  const double uptime = std::chrono::duration<double>(
                            std::chrono::steady_clock::now() - kStartTime)
                            .count();
  std::FILE *out = s.to_stderr ? stderr : stdout;

  std::lock_guard<std::mutex> lock(log_mutex);
  fmt::print(out, "{:9.3f} ", uptime);
  fmt::print(out, s.style, "{}{}\n", s.tag, message);
  std::fflush(out);
}

} // namespace detail

// **----- TIMING COLLECTOR -----**

std::mutex TimingCollector::mutex_;
std::vector<TimingEntry> TimingCollector::entries_;

void TimingCollector::record(std::string label,
                             std::chrono::microseconds elapsed) {
  std::lock_guard<std::mutex> lock(mutex_);
  entries_.push_back({std::move(label), elapsed});
}

void TimingCollector::print_summary() {
  std::vector<TimingEntry> all = entries();
  if (all.empty())
    return;

  std::chrono::microseconds total{0};
  for (const auto &e : all)
    total += e.elapsed;

  std::lock_guard<std::mutex> lock(log_mutex);
  fmt::print("\n");
  fmt::print(fg(fmt::color::cyan),
             "================== TIMING SUMMARY ==================\n");
  fmt::print("{:<30} {:>12} {:>8}\n", "Phase", "Seconds", "Share");
  fmt::print("{:-<30} {:->12} {:->8}\n", "", "", "");
  for (const auto &e : all) {
    double share = total.count() > 0
                       ? 100.0 * e.elapsed.count() / total.count()
                       : 0.0;
    fmt::print("{:<30} {:>12.3f} {:>7.1f}%\n", e.label,
               e.elapsed.count() / 1e6, share);
  }
  fmt::print("{:<30} {:>12.3f}\n", "Total", total.count() / 1e6);
  fmt::print(fg(fmt::color::cyan),
             "====================================================\n");
  std::fflush(stdout);
}

std::vector<TimingEntry> TimingCollector::entries() {
  std::lock_guard<std::mutex> lock(mutex_);
  return entries_;
}

void TimingCollector::clear() {
  std::lock_guard<std::mutex> lock(mutex_);
  entries_.clear();
}

} // namespace vidcut
