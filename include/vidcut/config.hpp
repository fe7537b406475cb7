/**
 * @file config.hpp
 * @brief Configuration: tuning knobs and the user settings document
 *
 * @details Two layers:
 *
 *          - Config namespace: lazy-initialized, memoized tuning parameters
 *            read from VIDCUT_* environment variables
 *
 *          - Settings: the user-facing JSON document (see
 *            config/vidcut.json), loaded from a file and then overridden by
 *            VIDCUT_<KEY> environment variables
 */

#ifndef VIDCUT_CONFIG_HPP
#define VIDCUT_CONFIG_HPP

#include <cstdlib>
#include <cstring>
#include <istream>
#include <stdexcept>
#include <string>
#include <vector>

namespace vidcut {
namespace Config {

/**
 * @brief Get a double value from environment variable.
 * @param name Environment variable name
 * @param default_val Default value if not set
 * @return Parsed double value, or default if unset or not a number
 */
inline double get_env_double(const char *name, double default_val) {
  const char *val = std::getenv(name);
  if (!val)
    return default_val;
  try {
    size_t used = 0;
    double v = std::stod(val, &used);
    return used == std::strlen(val) ? v : default_val;
  } catch (const std::logic_error &) {
    return default_val;
  }
}

/**
 * @brief Get an integer value from environment variable.
 * @param name Environment variable name
 * @param default_val Default value if not set
 * @return Parsed integer value, or default if unset or not an integer
 */
inline int get_env_int(const char *name, int default_val) {
  const char *val = std::getenv(name);
  if (!val)
    return default_val;
  try {
    size_t used = 0;
    int v = std::stoi(val, &used);
    return used == std::strlen(val) ? v : default_val;
  } catch (const std::logic_error &) {
    return default_val;
  }
}

/// How often a running job polls its child process (milliseconds)
inline int poll_interval_ms() {
  static int val = get_env_int("VIDCUT_POLL_INTERVAL_MS", 100);
  return val;
}

/// Time a cancelled child gets between SIGTERM and SIGKILL (milliseconds)
inline int cancel_grace_ms() {
  static int val = get_env_int("VIDCUT_CANCEL_GRACE_MS", 3000);
  return val;
}

/**
 * @brief Weight of the newest ETA estimate in the exponential smoothing.
 * @note 1.0 disables smoothing; lower values react slower to bursty output.
 */
inline double eta_smoothing() {
  static double val = get_env_double("VIDCUT_ETA_SMOOTHING", 0.3);
  return val;
}

/// Keep-segments shorter than this are dropped when the frame rate is unknown
inline double min_keep_sec() {
  static double val = get_env_double("VIDCUT_MIN_KEEP_SEC", 0.04);
  return val;
}

/// Upper bound for each capability probe invocation (milliseconds)
inline int probe_timeout_ms() {
  static int val = get_env_int("VIDCUT_PROBE_TIMEOUT_MS", 10000);
  return val;
}

/// Number of stderr lines attached to a failed job
inline int diagnostic_tail_lines() {
  static int val = get_env_int("VIDCUT_DIAGNOSTIC_TAIL_LINES", 20);
  return val;
}

} // namespace Config

// **---- SETTINGS DOCUMENT ----**

/**
 * @struct Settings
 * @brief User settings. Every field has a built-in default.
 */
struct Settings {
  std::string default_output_dir = "output";
  std::string ffmpeg_path = "ffmpeg";
  std::string whisper_path = "whisper-cli";
  std::string whisper_model = "small";
  std::string whisper_models_dir = "models";
  bool hardware_acceleration = true;
  std::string default_bitrate = "20000k";
  int quality_factor = 16;
  int max_concurrent_jobs = 1;
  std::vector<std::string> filler_words = {"嗯", "那个", "就是", "然后",
                                           "这个"};
  double silence_threshold = 0.8;
};

/**
 * @brief Apply a JSON settings document on top of the given settings.
 * @note The document is one object of key/value members. Keys match case
 *       insensitively. Unknown keys are ignored; values of the wrong type or
 *       out of range keep the previous value; a document that is not valid
 *       JSON is ignored as a whole.
 * @return Number of recognized keys applied
 */
int apply_settings(std::istream &in, Settings &settings);

/**
 * @brief Apply VIDCUT_<KEY> environment overrides.
 * @return Number of overrides applied
 */
int apply_env_overrides(Settings &settings);

/**
 * @brief Load defaults, then the document at path (if it exists), then the
 *        environment overrides.
 * @param path Settings file; empty = default_settings_path()
 */
Settings load_settings(const std::string &path = "");

/**
 * @brief Default settings location.
 * @note $VIDCUT_CONFIG, else $XDG_CONFIG_HOME/vidcut/vidcut.json, else
 *       ~/.config/vidcut/vidcut.json
 */
std::string default_settings_path();

} // namespace vidcut

#endif // VIDCUT_CONFIG_HPP
