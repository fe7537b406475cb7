/**
 * @file system.cpp
 * @brief System utilities implementation
 */

#include "vidcut/system.hpp"

#include <cctype>
#include <cmath>
#include <filesystem>
#include <fstream>
#include <system_error>
#include <thread>
#include <vector>

#include <fmt/core.h>

#include "vidcut/logging.hpp"

namespace vidcut {

namespace fs = std::filesystem;

// **---- Internal Helpers ----**

namespace {

/// Helper to read a number from a file
long read_long_from_file(const char *path) {
  std::ifstream f(path);
  if (!f)
    return -1;
  long val;
  f >> val;
  return f.fail() ? -1 : val;
}

} // anonymous namespace

// **---- CPU Detection ----**

int detect_cpu_limit() {
  int limit = -1;

  /// Try cgroup v2 first (unified hierarchy)
  {
    std::ifstream f("/sys/fs/cgroup/cpu.max");
    if (f) {
      std::string quota_str, period_str;
      f >> quota_str >> period_str;
      if (quota_str != "max" && !period_str.empty()) {
        try {
          long quota = std::stol(quota_str);
          long period = std::stol(period_str);
          if (quota > 0 && period > 0)
            limit = static_cast<int>((quota + period - 1) / period);
        } catch (const std::exception &) {
          limit = -1;
        }
      }
    }
  }

  /// Try cgroup v1 CPU quota
  if (limit <= 0) {
    long quota = read_long_from_file("/sys/fs/cgroup/cpu/cpu.cfs_quota_us");
    long period = read_long_from_file("/sys/fs/cgroup/cpu/cpu.cfs_period_us");
    if (quota > 0 && period > 0)
      limit = static_cast<int>((quota + period - 1) / period);
  }

  /// Fallback to hardware_concurrency
  if (limit <= 0)
    limit = static_cast<int>(std::thread::hardware_concurrency());

  if (limit <= 0)
    limit = 4;
  if (limit > 64)
    limit = 64;
  return limit;
}

// **---- Time Formatting ----**

std::string format_time(double seconds) {
  if (!(seconds > 0))
    seconds = 0;
  int h = static_cast<int>(seconds) / 3600;
  int m = (static_cast<int>(seconds) % 3600) / 60;
  int s = static_cast<int>(seconds) % 60;
  return fmt::format("{:02d}:{:02d}:{:02d}", h, m, s);
}

std::string format_eta(double seconds) {
  if (!(seconds > 0))
    return "0s";
  long total = std::lround(seconds);
  if (total < 60)
    return fmt::format("{}s", total);
  if (total < 3600)
    return fmt::format("{}m {:02d}s", total / 60, static_cast<int>(total % 60));
  return fmt::format("{}h {:02d}m", total / 3600,
                     static_cast<int>((total % 3600) / 60));
}

std::optional<double> parse_time(const std::string &text) {
  if (text.empty())
    return std::nullopt;

  std::vector<std::string> parts;
  size_t pos = 0;
  while (true) {
    size_t colon = text.find(':', pos);
    parts.push_back(text.substr(pos, colon - pos));
    if (colon == std::string::npos)
      break;
    pos = colon + 1;
  }
  if (parts.size() > 3)
    return std::nullopt;

  double total = 0.0;
  for (size_t i = 0; i < parts.size(); ++i) {
    const std::string &p = parts[i];
    if (p.empty())
      return std::nullopt;
    bool last = (i + 1 == parts.size());
    for (char c : p) {
      if (!(std::isdigit(static_cast<unsigned char>(c)) || (last && c == '.')))
        return std::nullopt;
    }
    double v = 0.0;
    try {
      v = std::stod(p);
    } catch (const std::exception &) {
      return std::nullopt;
    }
    if (i > 0 && v >= 60.0)
      return std::nullopt;
    total = total * 60.0 + v;
  }
  return total;
}

// **---- Output Files ----**

bool remove_partial_output(const std::string &path) {
  if (path.empty())
    return true;
  std::error_code ec;
  if (!fs::exists(path, ec))
    return true;
  fs::remove(path, ec);
  if (ec) {
    LOG_WARN("Failed to remove partial output {}: {}", path, ec.message());
    return false;
  }
  LOG_DEBUG("Removed partial output {}", path);
  return true;
}

bool is_nonempty_file(const std::string &path) {
  std::error_code ec;
  if (!fs::is_regular_file(path, ec))
    return false;
  auto size = fs::file_size(path, ec);
  return !ec && size > 0;
}

std::string subtitle_path_for(const std::string &output_path) {
  fs::path p(output_path);
  p.replace_extension(".srt");
  return p.string();
}

} // namespace vidcut
