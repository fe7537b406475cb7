/**
 * @file progress_parser.cpp
 * @brief Progress grammar and ETA smoothing
 */

#include "vidcut/progress_parser.hpp"

#include <algorithm>
#include <cctype>
#include <cmath>

namespace vidcut {

namespace {

std::string_view trim(std::string_view s) {
  while (!s.empty() && std::isspace(static_cast<unsigned char>(s.front())))
    s.remove_prefix(1);
  while (!s.empty() && std::isspace(static_cast<unsigned char>(s.back())))
    s.remove_suffix(1);
  return s;
}

bool starts_with(std::string_view s, std::string_view prefix) {
  return s.size() >= prefix.size() && s.substr(0, prefix.size()) == prefix;
}

/// Strict unsigned integer; the whole view must be digits
std::optional<double> parse_uint(std::string_view s) {
  if (s.empty() || s.size() > 18)
    return std::nullopt;
  unsigned long long v = 0;
  for (char c : s) {
    if (!std::isdigit(static_cast<unsigned char>(c)))
      return std::nullopt;
    v = v * 10 + static_cast<unsigned long long>(c - '0');
  }
  return static_cast<double>(v);
}

/// Reads digits at s[pos..], returns count read
size_t read_digits(std::string_view s, size_t pos, long &value) {
  size_t n = 0;
  value = 0;
  while (pos + n < s.size() &&
         std::isdigit(static_cast<unsigned char>(s[pos + n])) && n < 9) {
    value = value * 10 + (s[pos + n] - '0');
    ++n;
  }
  return n;
}

/**
 * @brief Parse a clock at the start of s.
 * @param consumed Output: characters used
 */
std::optional<double> parse_clock_prefix(std::string_view s, size_t &consumed) {
  long h = 0, m = 0, sec = 0;
  size_t pos = 0;

  size_t n = read_digits(s, pos, h);
  if (n == 0)
    return std::nullopt;
  pos += n;
  if (pos >= s.size() || s[pos] != ':')
    return std::nullopt;
  ++pos;

  n = read_digits(s, pos, m);
  if (n != 2 || m >= 60)
    return std::nullopt;
  pos += n;
  if (pos >= s.size() || s[pos] != ':')
    return std::nullopt;
  ++pos;

  n = read_digits(s, pos, sec);
  if (n != 2 || sec >= 60)
    return std::nullopt;
  pos += n;

  double frac = 0.0;
  if (pos < s.size() && s[pos] == '.') {
    ++pos;
    double scale = 0.1;
    size_t start = pos;
    while (pos < s.size() && std::isdigit(static_cast<unsigned char>(s[pos]))) {
      frac += (s[pos] - '0') * scale;
      scale /= 10.0;
      ++pos;
    }
    if (pos == start)
      return std::nullopt;
  }

  consumed = pos;
  return static_cast<double>(h) * 3600.0 + static_cast<double>(m) * 60.0 +
         static_cast<double>(sec) + frac;
}

} // anonymous namespace

std::optional<double> parse_clock(std::string_view text) {
  text = trim(text);
  size_t consumed = 0;
  auto v = parse_clock_prefix(text, consumed);
  if (!v || consumed != text.size())
    return std::nullopt;
  return v;
}

std::optional<double> parse_progress_line(std::string_view line) {
  line = trim(line);
  if (line.empty())
    return std::nullopt;

  // **---- KEY/VALUE LINES (-progress pipe:1) ----**

  if (starts_with(line, "out_time_us=")) {
    auto us = parse_uint(trim(line.substr(12)));
    if (!us)
      return std::nullopt;
    return *us / 1e6;
  }
  if (starts_with(line, "out_time_ms=")) {
    auto us = parse_uint(trim(line.substr(12)));
    if (!us)
      return std::nullopt;
    return *us / 1e6;
  }
  if (starts_with(line, "out_time=")) {
    return parse_clock(line.substr(9));
  }
  constexpr auto npos = std::string_view::npos;
  if (line.find('=') != npos && line.find(' ') == npos &&
      line.find("time=") == npos) {
    /// Other key/value pairs (frame=, fps=, progress=...) carry no time
    return std::nullopt;
  }

  // **---- STATS LINES (stderr) ----**

  size_t pos = 0;
  while ((pos = line.find("time=", pos)) != std::string_view::npos) {
    /// Must be a standalone key, not e.g. "out_time=" or "runtime="
    bool standalone =
        pos == 0 || std::isspace(static_cast<unsigned char>(line[pos - 1]));
    size_t value_pos = pos + 5;
    if (standalone) {
      std::string_view rest = line.substr(value_pos);
      size_t consumed = 0;
      auto v = parse_clock_prefix(rest, consumed);
      if (v && (consumed == rest.size() ||
                std::isspace(static_cast<unsigned char>(rest[consumed])))) {
        return v;
      }
      return std::nullopt;
    }
    pos = value_pos;
  }
  return std::nullopt;
}

// **---- ProgressTracker ----**

std::optional<double> ProgressTracker::feed(std::string_view line) {
  auto t = parse_progress_line(line);
  if (!t)
    return std::nullopt;
  if (seen_ && *t <= last_time_)
    return std::nullopt;
  seen_ = true;
  last_time_ = *t;
  return t;
}

// **---- EtaEstimator ----**

EtaEstimator::EtaEstimator(double total_sec, double alpha)
    : total_sec_(total_sec), alpha_(alpha) {
  if (!(alpha_ > 0.0) || alpha_ > 1.0)
    alpha_ = 1.0;
}

ProgressSample EtaEstimator::update(double processed_sec, double elapsed_sec) {
  ProgressSample sample;
  sample.source_time = processed_sec;
  sample.elapsed_sec = std::max(0.0, elapsed_sec);

  double percent = (total_sec_ > 0.0) ? processed_sec / total_sec_ : 0.0;
  sample.percent = std::clamp(percent, 0.0, 1.0);

  if (sample.percent > 0.0) {
    double raw =
        sample.elapsed_sec * (1.0 - sample.percent) / sample.percent;
    eta_ = has_eta_ ? alpha_ * raw + (1.0 - alpha_) * eta_ : raw;
    has_eta_ = true;
  }
  if (sample.percent >= 1.0)
    eta_ = 0.0;
  sample.eta_sec = std::max(0.0, eta_);
  return sample;
}

} // namespace vidcut
