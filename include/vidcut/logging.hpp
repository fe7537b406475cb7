/**
 * @file logging.hpp
 * @brief Leveled log macros and phase timing
 *
 * @details Provides:
 *          - LOG_INFO / LOG_WARN / LOG_ERROR / LOG_PHASE / LOG_SUCCESS
 *
 *          - LOG_DEBUG, printed only when VIDCUT_DEBUG is non-zero
 *
 *          - TIMER_START / TIMER_END feeding the TimingCollector
 *
 * @note Lines are prefixed with the seconds elapsed since start-up, so
 *       interleaved output of several job workers can be followed. Warnings
 *       and errors go to stderr, everything else to stdout. Every line is
 *       flushed as soon as it is written.
 */

#ifndef VIDCUT_LOGGING_HPP
#define VIDCUT_LOGGING_HPP

#include <chrono>
#include <mutex>
#include <string>
#include <vector>

#include <fmt/core.h>

namespace vidcut {

// **----- LOGGING CONFIGURATION -----**

#ifndef ENABLE_LOGGING
#define ENABLE_LOGGING 1
#endif

#ifndef ENABLE_TIMING
#define ENABLE_TIMING 1
#endif

enum class LogLevel { Debug, Info, Phase, Success, Warn, Error };

/// True when VIDCUT_DEBUG is set to a non-zero value (memoized)
bool debug_enabled();

namespace detail {

/// Writes one already formatted line under the log mutex
void log_line(LogLevel level, const std::string &message);

} // namespace detail

// **----- LOGGING MACROS -----**

#if ENABLE_LOGGING
#define VIDCUT_LOG(level, format_str, ...)                                     \
  vidcut::detail::log_line(level, fmt::format(format_str, ##__VA_ARGS__))

#define LOG_INFO(format_str, ...)                                              \
  VIDCUT_LOG(vidcut::LogLevel::Info, format_str, ##__VA_ARGS__)
#define LOG_WARN(format_str, ...)                                              \
  VIDCUT_LOG(vidcut::LogLevel::Warn, format_str, ##__VA_ARGS__)
#define LOG_ERROR(format_str, ...)                                             \
  VIDCUT_LOG(vidcut::LogLevel::Error, format_str, ##__VA_ARGS__)
#define LOG_PHASE(format_str, ...)                                             \
  VIDCUT_LOG(vidcut::LogLevel::Phase, format_str, ##__VA_ARGS__)
#define LOG_SUCCESS(format_str, ...)                                           \
  VIDCUT_LOG(vidcut::LogLevel::Success, format_str, ##__VA_ARGS__)

/// Arguments are not evaluated unless debug output is on
#define LOG_DEBUG(format_str, ...)                                             \
  do {                                                                         \
    if (vidcut::debug_enabled())                                               \
      VIDCUT_LOG(vidcut::LogLevel::Debug, format_str, ##__VA_ARGS__);          \
  } while (0)
#else
#define LOG_INFO(...) ((void)0)
#define LOG_DEBUG(...) ((void)0)
#define LOG_WARN(...) ((void)0)
#define LOG_ERROR(...) ((void)0)
#define LOG_PHASE(...) ((void)0)
#define LOG_SUCCESS(...) ((void)0)
#endif

// **----- TIMING COLLECTION -----**

struct TimingEntry {
  std::string label;                 //< e.g. "job 3 execute"
  std::chrono::microseconds elapsed; //< Wall-clock duration
};

/**
 * @class TimingCollector
 * @brief Process-wide list of phase timings.
 * @note Job workers record from several threads; the CLI prints the table
 *       once its job has finished.
 */
class TimingCollector {
public:
  static void record(std::string label, std::chrono::microseconds elapsed);

  /// Table of every entry with its share of the summed time
  static void print_summary();

  static std::vector<TimingEntry> entries();

  static void clear();

private:
  static std::mutex mutex_;
  static std::vector<TimingEntry> entries_;
};

// **----- TIMING MACROS -----**

#if ENABLE_TIMING
#define TIMER_START(name)                                                      \
  const auto timer_start_##name = std::chrono::steady_clock::now()

/// label may be any expression convertible to std::string
#define TIMER_END(name, label)                                                 \
  vidcut::TimingCollector::record(                                             \
      label, std::chrono::duration_cast<std::chrono::microseconds>(            \
                 std::chrono::steady_clock::now() - timer_start_##name))
#else
#define TIMER_START(name) ((void)0)
#define TIMER_END(name, label) ((void)0)
#endif

} // namespace vidcut

#endif // VIDCUT_LOGGING_HPP
