/**
 * @file job.cpp
 * @brief Job lifecycle implementation
 */

#include "vidcut/job.hpp"

namespace vidcut {

const char *to_string(JobState state) {
  switch (state) {
  case JobState::Pending:
    return "Pending";
  case JobState::Validating:
    return "Validating";
  case JobState::Building:
    return "Building";
  case JobState::Executing:
    return "Executing";
  case JobState::Finalizing:
    return "Finalizing";
  case JobState::Completed:
    return "Completed";
  case JobState::Failed:
    return "Failed";
  case JobState::Cancelled:
    return "Cancelled";
  }
  return "Unknown";
}

const char *to_string(JobEventKind kind) {
  switch (kind) {
  case JobEventKind::StateChanged:
    return "StateChanged";
  case JobEventKind::Progress:
    return "Progress";
  case JobEventKind::Warning:
    return "Warning";
  case JobEventKind::Finished:
    return "Finished";
  }
  return "Unknown";
}

bool is_terminal(JobState state) {
  return state == JobState::Completed || state == JobState::Failed ||
         state == JobState::Cancelled;
}

bool JobStateMachine::can_advance(JobState next) const {
  JobState current = state();
  if (is_terminal(current))
    return false;
  if (next == JobState::Failed || next == JobState::Cancelled)
    return true;

  switch (current) {
  case JobState::Pending:
    return next == JobState::Validating;
  case JobState::Validating:
    return next == JobState::Building;
  case JobState::Building:
    return next == JobState::Executing;
  case JobState::Executing:
    return next == JobState::Finalizing;
  case JobState::Finalizing:
    return next == JobState::Completed;
  default:
    return false;
  }
}

bool JobStateMachine::advance(JobState next) {
  if (!can_advance(next))
    return false;
  history_.push_back(next);
  return true;
}

} // namespace vidcut
