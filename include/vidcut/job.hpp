/**
 * @file job.hpp
 * @brief Job identity, lifecycle state machine and snapshots
 *
 * @details Lifecycle:
 *
 *          Pending -> Validating -> Building -> Executing -> Finalizing
 *                  -> Completed
 *
 *          Failed and Cancelled are reachable from every non-terminal state.
 *          Terminal states (Completed, Failed, Cancelled) never change again.
 */

#ifndef VIDCUT_JOB_HPP
#define VIDCUT_JOB_HPP

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "command_builder.hpp"
#include "errors.hpp"
#include "types.hpp"

namespace vidcut {

using JobId = std::uint64_t;

enum class JobState {
  Pending,
  Validating,
  Building,
  Executing,
  Finalizing,
  Completed,
  Failed,
  Cancelled
};

const char *to_string(JobState state);
bool is_terminal(JobState state);

/**
 * @class JobStateMachine
 * @brief Enforces the lifecycle transitions and records the path taken.
 */
class JobStateMachine {
public:
  JobStateMachine() : history_{JobState::Pending} {}

  JobState state() const { return history_.back(); }
  const std::vector<JobState> &history() const { return history_; }

  /**
   * @brief Move to next if the transition is legal.
   * @return false (state unchanged) for an illegal transition
   */
  bool advance(JobState next);

  /// Whether state() -> next is a legal transition
  bool can_advance(JobState next) const;

private:
  std::vector<JobState> history_;
};

/**
 * @struct SubtitleRequest
 * @brief Optional transcription attached to a job.
 */
struct SubtitleRequest {
  std::optional<std::string> language; //< Unset = auto-detect
  bool word_timestamps = false;
};

/**
 * @struct JobRequest
 * @brief Everything submit() needs to run one cut.
 */
struct JobRequest {
  VideoSource source;
  std::vector<TimeSegment> remove; //< Ranges to cut out
  QualityIntent intent;
  std::string output_path;
  std::optional<SubtitleRequest> subtitles;
};

/**
 * @struct JobSnapshot
 * @brief Consistent copy of a job record at one point in time.
 */
struct JobSnapshot {
  JobId id = 0;
  JobState state = JobState::Pending;
  std::vector<JobState> history;
  std::string source_path;
  std::string output_path;
  CutList cut_list;
  std::optional<EncodingProfile> profile;
  std::optional<CommandSpec> command;
  ProgressSample progress;
  std::optional<JobError> error;
  std::vector<JobError> warnings;
  std::optional<std::string> subtitle_path;
};

enum class JobEventKind { StateChanged, Progress, Warning, Finished };

const char *to_string(JobEventKind kind);

/**
 * @struct JobEvent
 * @brief Notification published by the orchestrator.
 */
struct JobEvent {
  JobId job = 0;
  JobEventKind kind = JobEventKind::StateChanged;
  JobState state = JobState::Pending;
  ProgressSample progress;
  std::optional<JobError> error; //< Failure (Finished) or warning (Warning)
  std::string message;
};

} // namespace vidcut

#endif // VIDCUT_JOB_HPP
