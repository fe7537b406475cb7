/**
 * @file capability_prober.hpp
 * @brief Detection of usable hardware encoders
 *
 * @details Candidates are tried in fixed priority order:
 *
 *          1. NVENC (h264_nvenc)
 *
 *          2. AMF   (h264_amf)
 *
 *          3. QSV   (h264_qsv)
 *
 *          A candidate wins when the encoding tool lists it in `-encoders`
 *          AND a one-frame dry-run encode into the null muxer succeeds. If
 *          none does, the software encoder is used. Probing never fails:
 *          every tool error is logged and treated as "unavailable".
 *
 * @attention THREAD MODEL:
 *
 *            - Results are cached per prober (process-wide for shared()),
 *              one entry per (tool path, hardware switch) pair, so users
 *              with different settings never evict each other's result
 *
 *            - probe() and invalidate() serialize on one mutex, so a job's
 *              capability snapshot never observes a half-finished re-probe
 */

#ifndef VIDCUT_CAPABILITY_PROBER_HPP
#define VIDCUT_CAPABILITY_PROBER_HPP

#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "types.hpp"

namespace vidcut {

/**
 * @struct ProbeReport
 * @brief Details of the last probe.
 */
struct ProbeReport {
  EncoderCapability capability = EncoderCapability::Cpu;
  bool encoder_list_read = false; //< `-encoders` query succeeded
  bool software_available = true; //< libx264/libx265 listed (or unknown)
  std::vector<std::string> hardware_listed; //< Hardware encoders listed
};

class CapabilityProber {
public:
  /**
   * @param ffmpeg_path Encoding tool to query
   * @param hardware_enabled false = skip probing, always report Cpu
   */
  explicit CapabilityProber(std::string ffmpeg_path = "ffmpeg",
                            bool hardware_enabled = true);

  /**
   * @brief Process-wide instance (init-on-first-use).
   */
  static CapabilityProber &shared();

  /**
   * @brief Return the cached capability, probing on first use.
   */
  EncoderCapability probe();

  /**
   * @brief Cached report for the configured tool, probing on first use.
   */
  ProbeReport report();

  /**
   * @brief Cached report for an explicit tool and hardware switch.
   * @note Does not change the configured defaults.
   */
  ProbeReport report_for(const std::string &ffmpeg_path,
                         bool hardware_enabled);

  /// Cached capability of the configured tool, without probing
  std::optional<EncoderCapability> cached() const;

  /**
   * @brief Drop every cached result; the next probe() queries the tool again.
   */
  void invalidate();

  /**
   * @brief Change the tool or the hardware switch used by probe()/report().
   * @note Results cached for other settings are kept.
   */
  void configure(std::string ffmpeg_path, bool hardware_enabled);

private:
  using CacheKey = std::pair<std::string, bool>;

  ProbeReport lookup_locked(const CacheKey &key);
  static ProbeReport run_probe(const std::string &ffmpeg_path,
                               bool hardware_enabled);
  static bool dry_run(const std::string &ffmpeg_path,
                      const std::string &encoder);

  mutable std::mutex mutex_;
  std::string ffmpeg_path_;
  bool hardware_enabled_;
  std::map<CacheKey, ProbeReport> cache_;
};

/**
 * @brief Parse `ffmpeg -encoders` output into encoder names.
 */
std::vector<std::string> parse_encoder_list(const std::string &output);

} // namespace vidcut

#endif // VIDCUT_CAPABILITY_PROBER_HPP
