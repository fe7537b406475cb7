/**
 * @file types.cpp
 * @brief Display names for enumerations
 */

#include "vidcut/errors.hpp"
#include "vidcut/types.hpp"

namespace vidcut {

const char *to_string(EncoderCapability capability) {
  switch (capability) {
  case EncoderCapability::Cpu:
    return "cpu";
  case EncoderCapability::Nvenc:
    return "nvenc";
  case EncoderCapability::Amf:
    return "amf";
  case EncoderCapability::Qsv:
    return "qsv";
  }
  return "unknown";
}

const char *to_string(VideoCodec codec) {
  switch (codec) {
  case VideoCodec::H264:
    return "h264";
  case VideoCodec::Hevc:
    return "hevc";
  }
  return "unknown";
}

const char *to_string(RateControl mode) {
  switch (mode) {
  case RateControl::QualityFactor:
    return "quality-factor";
  case RateControl::BitrateCap:
    return "bitrate-cap";
  }
  return "unknown";
}

const char *to_string(ErrorKind kind) {
  switch (kind) {
  case ErrorKind::SegmentValidation:
    return "SegmentValidationError";
  case ErrorKind::EncoderUnavailable:
    return "EncoderUnavailable";
  case ErrorKind::ProfileIncompatible:
    return "ProfileIncompatibleError";
  case ErrorKind::ProcessExecution:
    return "ProcessExecutionError";
  case ErrorKind::SubtitleGeneration:
    return "SubtitleGenerationError";
  case ErrorKind::Cancelled:
    return "CancelledError";
  }
  return "UnknownError";
}

} // namespace vidcut
