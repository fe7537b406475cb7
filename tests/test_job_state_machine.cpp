#include <catch2/catch.hpp>

#include "vidcut/job.hpp"

using namespace vidcut;

namespace {

const JobState kAllStates[] = {
    JobState::Pending,   JobState::Validating, JobState::Building,
    JobState::Executing, JobState::Finalizing, JobState::Completed,
    JobState::Failed,    JobState::Cancelled};

JobStateMachine machine_at(JobState target) {
  const JobState path[] = {JobState::Validating, JobState::Building,
                           JobState::Executing, JobState::Finalizing,
                           JobState::Completed};
  JobStateMachine m;
  if (target == JobState::Failed || target == JobState::Cancelled) {
    m.advance(target);
    return m;
  }
  for (auto s : path) {
    if (m.state() == target)
      break;
    m.advance(s);
  }
  return m;
}

} // anonymous namespace

TEST_CASE("Happy path walks every state in order", "[job]") {
  JobStateMachine m;
  CHECK(m.state() == JobState::Pending);
  CHECK(m.advance(JobState::Validating));
  CHECK(m.advance(JobState::Building));
  CHECK(m.advance(JobState::Executing));
  CHECK(m.advance(JobState::Finalizing));
  CHECK(m.advance(JobState::Completed));

  const std::vector<JobState> expected = {
      JobState::Pending,   JobState::Validating, JobState::Building,
      JobState::Executing, JobState::Finalizing, JobState::Completed};
  CHECK(m.history() == expected);
}

TEST_CASE("States cannot be skipped or revisited", "[job]") {
  JobStateMachine m;
  CHECK_FALSE(m.advance(JobState::Executing));
  CHECK_FALSE(m.advance(JobState::Completed));
  CHECK(m.advance(JobState::Validating));
  CHECK_FALSE(m.advance(JobState::Pending));
  CHECK_FALSE(m.advance(JobState::Validating));
  CHECK(m.state() == JobState::Validating);
  CHECK(m.history().size() == 2);
}

TEST_CASE("Failure and cancellation are reachable from every live state",
          "[job]") {
  for (auto s : {JobState::Pending, JobState::Validating, JobState::Building,
                 JobState::Executing, JobState::Finalizing}) {
    CHECK(machine_at(s).can_advance(JobState::Failed));
    CHECK(machine_at(s).can_advance(JobState::Cancelled));
  }

  JobStateMachine m = machine_at(JobState::Executing);
  REQUIRE(m.state() == JobState::Executing);
  CHECK(m.advance(JobState::Cancelled));
  CHECK(m.state() == JobState::Cancelled);
}

TEST_CASE("Terminal states never change", "[job]") {
  for (auto terminal :
       {JobState::Completed, JobState::Failed, JobState::Cancelled}) {
    JobStateMachine m = machine_at(terminal);
    REQUIRE(m.state() == terminal);
    CHECK(is_terminal(m.state()));
    for (auto next : kAllStates) {
      CHECK_FALSE(m.advance(next));
    }
    CHECK(m.state() == terminal);
  }
}

TEST_CASE("State names", "[job]") {
  CHECK(std::string(to_string(JobState::Executing)) == "Executing");
  CHECK(std::string(to_string(JobEventKind::Finished)) == "Finished");
  CHECK_FALSE(is_terminal(JobState::Finalizing));
}
