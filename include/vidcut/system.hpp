/**
 * @file system.hpp
 * @brief System utilities: CPU detection, time formatting, output files
 *
 * @details Provides:
 *
 *          - Cgroup-aware CPU limit detection (thread hint for transcription)
 *
 *          - Time and ETA formatting / parsing for the command line
 *
 *          - Output artifact helpers used by the job orchestrator
 */

#ifndef VIDCUT_SYSTEM_HPP
#define VIDCUT_SYSTEM_HPP

#include <optional>
#include <string>

namespace vidcut {

// **---- CPU Detection ----**

/**
 * @brief Detect the number of CPUs available to this process.
 *
 * @note In containers std::thread::hardware_concurrency() reports the host's
 *       cores, so the cgroup quota (v2 `cpu.max`, v1 `cpu.cfs_quota_us`) is
 *       consulted first.
 *
 * @return Detected CPU limit, clamped to [1, 64]
 */
int detect_cpu_limit();

// **---- Time Formatting ----**

/**
 * @brief Format seconds as HH:MM:SS string.
 */
std::string format_time(double seconds);

/**
 * @brief Human readable remaining time ("42s", "3m 05s", "1h 02m").
 */
std::string format_eta(double seconds);

/**
 * @brief Parse "SS[.mmm]", "MM:SS[.mmm]" or "HH:MM:SS[.mmm]" into seconds.
 * @return std::nullopt on malformed or negative input
 */
std::optional<double> parse_time(const std::string &text);

// **---- Output Files ----**

/**
 * @brief Remove a partial output file if present.
 * @return true if nothing remains at path afterwards
 */
bool remove_partial_output(const std::string &path);

/**
 * @brief Check that path is a regular file with non-zero size.
 */
bool is_nonempty_file(const std::string &path);

/**
 * @brief Subtitle file written beside an artifact ("<dir>/<stem>.srt").
 */
std::string subtitle_path_for(const std::string &output_path);

} // namespace vidcut

#endif // VIDCUT_SYSTEM_HPP
