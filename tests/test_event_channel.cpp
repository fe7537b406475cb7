#include <catch2/catch.hpp>

#include "vidcut/event_channel.hpp"

using namespace vidcut;

namespace {

JobEvent progress_event(JobId job, double percent) {
  JobEvent e;
  e.job = job;
  e.kind = JobEventKind::Progress;
  e.state = JobState::Executing;
  e.progress.percent = percent;
  return e;
}

JobEvent state_event(JobId job, JobState state) {
  JobEvent e;
  e.job = job;
  e.kind = JobEventKind::StateChanged;
  e.state = state;
  return e;
}

} // anonymous namespace

TEST_CASE("Empty channel", "[events]") {
  EventChannel channel;
  CHECK_FALSE(channel.try_pop());
  CHECK_FALSE(channel.pop_for(std::chrono::milliseconds(10)));
}

TEST_CASE("Undrained progress stays bounded", "[events]") {
  EventChannel channel;
  channel.push(state_event(1, JobState::Executing));
  for (int i = 1; i <= 1000; ++i)
    channel.push(progress_event(1, i / 1000.0));

  REQUIRE(channel.size() == 2);
  CHECK(channel.try_pop()->kind == JobEventKind::StateChanged);
  auto latest = channel.try_pop();
  REQUIRE(latest);
  CHECK(latest->progress.percent == Approx(1.0));
}

TEST_CASE("Progress never jumps over a state change", "[events]") {
  EventChannel channel;
  channel.push(progress_event(1, 0.5));
  channel.push(state_event(1, JobState::Finalizing));
  channel.push(progress_event(1, 1.0));

  REQUIRE(channel.size() == 3);
  CHECK(channel.try_pop()->progress.percent == Approx(0.5));
  CHECK(channel.try_pop()->state == JobState::Finalizing);
  CHECK(channel.try_pop()->progress.percent == Approx(1.0));
}

TEST_CASE("Progress of different jobs is kept apart", "[events]") {
  EventChannel channel;
  channel.push(progress_event(1, 0.2));
  channel.push(progress_event(2, 0.3));
  channel.push(progress_event(1, 0.4));
  channel.push(progress_event(2, 0.6));

  REQUIRE(channel.size() == 2);
  auto first = channel.try_pop();
  CHECK(first->job == 1);
  CHECK(first->progress.percent == Approx(0.4));
  auto second = channel.try_pop();
  CHECK(second->job == 2);
  CHECK(second->progress.percent == Approx(0.6));
}
