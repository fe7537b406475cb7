/**
 * @file errors.hpp
 * @brief Error taxonomy for the processing pipeline
 *
 * @details Two reporting channels are used:
 *
 *          - Exceptions for synchronous contract violations (bad user ranges,
 *            profile/builder mismatch, transcription failure)
 *
 *          - JobError values recorded on a job when execution fails
 *            asynchronously (only observable through the job's terminal state)
 */

#ifndef VIDCUT_ERRORS_HPP
#define VIDCUT_ERRORS_HPP

#include <stdexcept>
#include <string>

namespace vidcut {

enum class ErrorKind {
  SegmentValidation,   //< Bad or overlapping user ranges, job never starts
  EncoderUnavailable,  //< No usable encoder at all, not even software
  ProfileIncompatible, //< Builder cannot render the selected profile
  ProcessExecution,    //< Tool missing or exited non-zero
  SubtitleGeneration,  //< Non-fatal, attached as a warning
  Cancelled            //< Terminal, distinguished from success
};

const char *to_string(ErrorKind kind);

/**
 * @struct JobError
 * @brief Failure (or warning) attached to a job record.
 */
struct JobError {
  ErrorKind kind = ErrorKind::ProcessExecution;
  std::string message;
  int exit_code = 0;       //< External tool exit code (0 when not applicable)
  std::string diagnostics; //< Tail of the tool's diagnostic stream
};

/// Base class of all vidcut exceptions
class Error : public std::runtime_error {
public:
  Error(ErrorKind kind, const std::string &what)
      : std::runtime_error(what), kind_(kind) {}

  ErrorKind kind() const noexcept { return kind_; }

private:
  ErrorKind kind_;
};

class SegmentValidationError : public Error {
public:
  explicit SegmentValidationError(const std::string &what)
      : Error(ErrorKind::SegmentValidation, what) {}
};

class ProfileIncompatibleError : public Error {
public:
  explicit ProfileIncompatibleError(const std::string &what)
      : Error(ErrorKind::ProfileIncompatible, what) {}
};

class SubtitleGenerationError : public Error {
public:
  explicit SubtitleGenerationError(const std::string &what)
      : Error(ErrorKind::SubtitleGeneration, what) {}
};

} // namespace vidcut

#endif // VIDCUT_ERRORS_HPP
