/**
 * @file profile_selector.cpp
 * @brief Profile table and selection
 */

#include "vidcut/profile_selector.hpp"

namespace vidcut {

namespace {

const ProfileRow kProfileTable[] = {
    {EncoderCapability::Cpu, RateControl::QualityFactor, 16, "slower",
     "20000k"},
    {EncoderCapability::Nvenc, RateControl::QualityFactor, 16, "medium",
     "20000k"},
    {EncoderCapability::Amf, RateControl::QualityFactor, 16, "slow",
     "20000k"},
    {EncoderCapability::Qsv, RateControl::QualityFactor, 16, "slow",
     "20000k"},
};

} // anonymous namespace

const ProfileRow &profile_row(EncoderCapability capability) {
  for (const auto &row : kProfileTable) {
    if (row.capability == capability)
      return row;
  }
  /// Unreachable for valid enumerators; software row is the safe default
  return kProfileTable[0];
}

std::string encoder_name(EncoderCapability capability, VideoCodec codec) {
  const bool hevc = (codec == VideoCodec::Hevc);
  switch (capability) {
  case EncoderCapability::Cpu:
    return hevc ? "libx265" : "libx264";
  case EncoderCapability::Nvenc:
    return hevc ? "hevc_nvenc" : "h264_nvenc";
  case EncoderCapability::Amf:
    return hevc ? "hevc_amf" : "h264_amf";
  case EncoderCapability::Qsv:
    return hevc ? "hevc_qsv" : "h264_qsv";
  }
  return hevc ? "libx265" : "libx264";
}

EncodingProfile select_profile(EncoderCapability capability,
                               const QualityIntent &intent) {
  const ProfileRow &row = profile_row(capability);

  EncodingProfile profile;
  profile.encoder = capability;
  profile.codec = encoder_name(capability, intent.codec);
  profile.rate_control = intent.rate_control;
  profile.quality_factor = intent.quality_factor.value_or(row.quality_factor);
  profile.preset = row.preset;
  profile.bitrate_ceiling =
      intent.bitrate_ceiling.value_or(row.bitrate_ceiling);
  return profile;
}

EncodingProfile select_profile(EncoderCapability capability,
                               const QualityIntent &intent,
                               const Settings &settings) {
  QualityIntent effective = intent;
  if (!effective.quality_factor)
    effective.quality_factor = settings.quality_factor;
  if (!effective.bitrate_ceiling && !settings.default_bitrate.empty())
    effective.bitrate_ceiling = settings.default_bitrate;
  return select_profile(capability, effective);
}

} // namespace vidcut
