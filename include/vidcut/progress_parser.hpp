/**
 * @file progress_parser.hpp
 * @brief Line-oriented progress extraction and ETA estimation
 *
 * @details Grammar accepted by parse_progress_line() (leading/trailing
 *          whitespace ignored):
 *
 *            line       := kv-line | stats-line
 *            kv-line    := "out_time_us=" uint      ; microseconds
 *                        | "out_time_ms=" uint      ; microseconds (sic)
 *                        | "out_time=" clock
 *            stats-line := any "time=" clock any    ; stderr statistics
 *            clock      := hh ":" mm ":" ss ["." frac]
 *
 *          "-progress" key/value output reports out_time_ms in microseconds,
 *          so both keys share one unit. Negative clocks, "N/A", empty values
 *          and trailing garbage in kv-lines produce no sample.
 */

#ifndef VIDCUT_PROGRESS_PARSER_HPP
#define VIDCUT_PROGRESS_PARSER_HPP

#include <optional>
#include <string_view>

#include "types.hpp"

namespace vidcut {

/**
 * @brief Extract processed output time (seconds) from one line.
 * @return std::nullopt when the line carries no valid time
 */
std::optional<double> parse_progress_line(std::string_view line);

/**
 * @brief Parse "HH:MM:SS[.frac]" into seconds.
 */
std::optional<double> parse_clock(std::string_view text);

/**
 * @class ProgressTracker
 * @brief Filters parsed times into a monotonic sequence.
 * @note Bursty output and repeated key/value blocks may report the same or an
 *       older time; only strictly increasing times are forwarded.
 */
class ProgressTracker {
public:
  /**
   * @brief Feed one output line.
   * @return The new processed time if the line advanced progress
   */
  std::optional<double> feed(std::string_view line);

  double last_time() const { return last_time_; }

private:
  double last_time_ = 0.0;
  bool seen_ = false;
};

/**
 * @class EtaEstimator
 * @brief Converts processed time into percent and a smoothed ETA.
 *
 * @details percent = processed / total (clamped to [0, 1]),
 *          raw eta  = elapsed * (1 - percent) / percent,
 *          eta      = alpha * raw + (1 - alpha) * previous eta, clamped >= 0.
 *          With percent == 0 no ETA is computed (previous value kept).
 */
class EtaEstimator {
public:
  /**
   * @param total_sec Duration of the output (sum of keep-segments)
   * @param alpha Smoothing weight of the newest estimate, in (0, 1]
   */
  explicit EtaEstimator(double total_sec, double alpha);

  ProgressSample update(double processed_sec, double elapsed_sec);

private:
  double total_sec_;
  double alpha_;
  double eta_ = 0.0;
  bool has_eta_ = false;
};

} // namespace vidcut

#endif // VIDCUT_PROGRESS_PARSER_HPP
