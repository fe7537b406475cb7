/**
 * @file profile_selector.hpp
 * @brief Maps encoder capability + quality intent to an encoding profile
 *
 * @details Deterministic table lookup:
 *
 *          | capability | rate-control      | preset | ceiling |
 *          |------------|-------------------|--------|---------|
 *          | CPU        | quality-factor 16 | slower | 20000k  |
 *          | NVENC      | quality-factor 16 | medium | 20000k  |
 *          | AMF / QSV  | quality-factor 16 | slow   | 20000k  |
 *
 *          Quality factor and ceiling come from the intent when set, then
 *          from the settings, then from the table.
 */

#ifndef VIDCUT_PROFILE_SELECTOR_HPP
#define VIDCUT_PROFILE_SELECTOR_HPP

#include <string>

#include "config.hpp"
#include "types.hpp"

namespace vidcut {

/**
 * @struct ProfileRow
 * @brief Default policy for one capability.
 */
struct ProfileRow {
  EncoderCapability capability;
  RateControl rate_control;
  int quality_factor;
  const char *preset;
  const char *bitrate_ceiling;
};

/**
 * @brief Table row for a capability (every capability has exactly one).
 */
const ProfileRow &profile_row(EncoderCapability capability);

/**
 * @brief Encoder identifier for a capability and codec family.
 * @note e.g. (Nvenc, H264) -> "h264_nvenc", (Cpu, Hevc) -> "libx265"
 */
std::string encoder_name(EncoderCapability capability, VideoCodec codec);

/**
 * @brief Select the encoding profile of a job using the table defaults.
 */
EncodingProfile select_profile(EncoderCapability capability,
                               const QualityIntent &intent);

/**
 * @brief Select the encoding profile with configured quality/ceiling
 *        defaults applied underneath the intent.
 */
EncodingProfile select_profile(EncoderCapability capability,
                               const QualityIntent &intent,
                               const Settings &settings);

} // namespace vidcut

#endif // VIDCUT_PROFILE_SELECTOR_HPP
