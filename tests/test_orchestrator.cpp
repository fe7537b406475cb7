#include <catch2/catch.hpp>

#include <algorithm>
#include <thread>

#include "test_helpers.hpp"
#include "vidcut/orchestrator.hpp"
#include "vidcut/subtitles.hpp"
#include "vidcut/system.hpp"

using namespace vidcut;
using namespace vidcut::testing;

namespace {

constexpr auto kWait = std::chrono::milliseconds(15000);

/// Writes a small artifact to the last argument and reports progress
const char *kSuccessfulEncoder = "for last; do :; done\n"
                                 "printf 'video' > \"$last\"\n"
                                 "echo out_time_us=1000000\n"
                                 "echo progress=continue\n"
                                 "echo out_time_us=8000000\n"
                                 "echo progress=end\n"
                                 "exit 0\n";

Settings test_settings(const std::string &ffmpeg) {
  Settings s;
  s.ffmpeg_path = ffmpeg;
  s.hardware_acceleration = false;
  s.max_concurrent_jobs = 1;
  return s;
}

JobRequest test_request(const ScratchDir &dir) {
  JobRequest req;
  req.source.path = dir.file("input.mp4");
  req.source.duration = 10.0;
  req.source.fps = 25.0;
  req.source.has_audio = true;
  req.remove = {{2.0, 4.0}};
  req.output_path = dir.file("out/result.mp4");
  return req;
}

/// Writes a partial artifact, then encodes "forever"
const char *kStalledEncoder = "for last; do :; done\n"
                              "printf 'partial' > \"$last\"\n"
                              "sleep 30\n";

bool in_history(const JobSnapshot &snap, JobState state) {
  return std::find(snap.history.begin(), snap.history.end(), state) !=
         snap.history.end();
}

std::vector<JobEvent> drain_events(JobOrchestrator &orch) {
  std::vector<JobEvent> events;
  while (auto e = orch.events().try_pop())
    events.push_back(*e);
  return events;
}

} // anonymous namespace

TEST_CASE("Successful job completes with its artifact", "[orchestrator]") {
  ScratchDir dir;
  Settings settings =
      test_settings(write_script(dir, "ffmpeg", kSuccessfulEncoder));
  CapabilityProber prober(settings.ffmpeg_path, false);
  JobOrchestrator orch(settings, prober);

  JobRequest req = test_request(dir);
  JobId id = orch.submit(req);
  auto snap = orch.wait(id, kWait);

  REQUIRE(snap);
  REQUIRE(snap->state == JobState::Completed);
  CHECK_FALSE(snap->error);
  CHECK(is_nonempty_file(req.output_path));
  CHECK(snap->progress.percent == Approx(1.0));
  CHECK(snap->cut_list.total_duration() == Approx(8.0));
  REQUIRE(snap->profile);
  CHECK(snap->profile->codec == "libx264");
  REQUIRE(snap->command);
  CHECK(snap->command->program == settings.ffmpeg_path);

  const std::vector<JobState> expected = {
      JobState::Pending,   JobState::Validating, JobState::Building,
      JobState::Executing, JobState::Finalizing, JobState::Completed};
  CHECK(snap->history == expected);

  auto events = drain_events(orch);
  REQUIRE_FALSE(events.empty());
  CHECK(events.back().kind == JobEventKind::Finished);
  CHECK(events.back().state == JobState::Completed);
  auto last_progress =
      std::find_if(events.rbegin(), events.rend(), [](const JobEvent &e) {
        return e.kind == JobEventKind::Progress;
      });
  REQUIRE(last_progress != events.rend());
  CHECK(last_progress->progress.percent == Approx(1.0));
}

TEST_CASE("Encoder failure attaches its diagnostics", "[orchestrator]") {
  ScratchDir dir;
  Settings settings = test_settings(write_script(
      dir, "ffmpeg", "echo 'codec not found' >&2\nexit 1\n"));
  CapabilityProber prober(settings.ffmpeg_path, false);
  JobOrchestrator orch(settings, prober);

  JobRequest req = test_request(dir);
  JobId id = orch.submit(req);
  auto snap = orch.wait(id, kWait);

  REQUIRE(snap);
  REQUIRE(snap->state == JobState::Failed);
  REQUIRE(snap->error);
  CHECK(snap->error->kind == ErrorKind::ProcessExecution);
  CHECK(snap->error->exit_code == 1);
  CHECK(snap->error->diagnostics.find("codec not found") != std::string::npos);
  CHECK_FALSE(fs::exists(req.output_path));

  auto events = drain_events(orch);
  REQUIRE_FALSE(events.empty());
  CHECK(events.back().kind == JobEventKind::Finished);
  REQUIRE(events.back().error);
  CHECK(events.back().error->exit_code == 1);
}

TEST_CASE("Cancelling a running job removes the partial output",
          "[orchestrator]") {
  ScratchDir dir;
  Settings settings = test_settings(
      write_script(dir, "ffmpeg",
                   "for last; do :; done\n"
                   "printf 'partial' > \"$last\"\n"
                   "i=0\n"
                   "while true; do\n"
                   "  i=$((i + 1))\n"
                   "  echo out_time_us=${i}0000\n"
                   "  sleep 0.05\n"
                   "done\n"));
  CapabilityProber prober(settings.ffmpeg_path, false);
  JobOrchestrator orch(settings, prober);

  JobRequest req = test_request(dir);
  JobId id = orch.submit(req);

  REQUIRE(eventually([&] {
    auto s = orch.snapshot(id);
    return s && s->state == JobState::Executing &&
           is_nonempty_file(req.output_path);
  }));
  CHECK(orch.cancel(id));

  auto snap = orch.wait(id, kWait);
  REQUIRE(snap);
  CHECK(snap->state == JobState::Cancelled);
  REQUIRE(snap->error);
  CHECK(snap->error->kind == ErrorKind::Cancelled);
  CHECK(in_history(*snap, JobState::Executing));
  CHECK_FALSE(fs::exists(req.output_path));

  /// Terminal jobs cannot be cancelled again
  CHECK_FALSE(orch.cancel(id));
}

TEST_CASE("Missing encoding tool fails with exit code 127",
          "[orchestrator]") {
  ScratchDir dir;
  Settings settings = test_settings(dir.file("no-such-ffmpeg"));
  CapabilityProber prober(settings.ffmpeg_path, false);
  JobOrchestrator orch(settings, prober);

  JobId id = orch.submit(test_request(dir));
  auto snap = orch.wait(id, kWait);

  REQUIRE(snap);
  CHECK(snap->state == JobState::Failed);
  REQUIRE(snap->error);
  CHECK(snap->error->kind == ErrorKind::ProcessExecution);
  CHECK(snap->error->exit_code == 127);
}

TEST_CASE("Empty artifact fails the job", "[orchestrator]") {
  ScratchDir dir;
  Settings settings = test_settings(write_script(dir, "ffmpeg", "exit 0\n"));
  CapabilityProber prober(settings.ffmpeg_path, false);
  JobOrchestrator orch(settings, prober);

  JobId id = orch.submit(test_request(dir));
  auto snap = orch.wait(id, kWait);

  REQUIRE(snap);
  CHECK(snap->state == JobState::Failed);
  CHECK(in_history(*snap, JobState::Finalizing));
}

TEST_CASE("Invalid ranges fail synchronously", "[orchestrator]") {
  ScratchDir dir;
  Settings settings =
      test_settings(write_script(dir, "ffmpeg", kSuccessfulEncoder));
  CapabilityProber prober(settings.ffmpeg_path, false);
  JobOrchestrator orch(settings, prober);

  SECTION("overlap") {
    JobRequest req = test_request(dir);
    req.remove = {{1.0, 3.0}, {2.0, 4.0}};
    CHECK_THROWS_AS(orch.submit(req), SegmentValidationError);
  }
  SECTION("nothing left to keep") {
    JobRequest req = test_request(dir);
    req.remove = {{0.0, 10.0}};
    CHECK_THROWS_AS(orch.submit(req), SegmentValidationError);
  }

  auto all = orch.snapshots();
  REQUIRE(all.size() == 1);
  CHECK(all[0].state == JobState::Failed);
  REQUIRE(all[0].error);
  CHECK(all[0].error->kind == ErrorKind::SegmentValidation);
  CHECK_FALSE(all[0].command);
}

TEST_CASE("Incompatible profile fails the job", "[orchestrator]") {
  ScratchDir dir;
  Settings settings =
      test_settings(write_script(dir, "ffmpeg", kSuccessfulEncoder));
  CapabilityProber prober(settings.ffmpeg_path, false);
  JobOrchestrator orch(settings, prober);

  JobRequest req = test_request(dir);
  req.intent.bitrate_ceiling = "lots";
  JobId id = orch.submit(req);
  auto snap = orch.wait(id, kWait);

  REQUIRE(snap);
  CHECK(snap->state == JobState::Failed);
  REQUIRE(snap->error);
  CHECK(snap->error->kind == ErrorKind::ProfileIncompatible);
}

TEST_CASE("Missing software encoder is reported as unavailable",
          "[orchestrator]") {
  ScratchDir dir;
  Settings settings = test_settings(write_script(
      dir, "ffmpeg",
      "case \"$*\" in\n"
      "  *-encoders*) printf ' ------\\n V....D mpeg4  MPEG-4\\n'; exit 0 ;;\n"
      "esac\n"
      "exit 1\n"));
  settings.hardware_acceleration = true;
  CapabilityProber prober(settings.ffmpeg_path, true);
  JobOrchestrator orch(settings, prober);

  JobId id = orch.submit(test_request(dir));
  auto snap = orch.wait(id, kWait);

  REQUIRE(snap);
  CHECK(snap->state == JobState::Failed);
  REQUIRE(snap->error);
  CHECK(snap->error->kind == ErrorKind::EncoderUnavailable);
}

TEST_CASE("Subtitle failure is a warning", "[orchestrator]") {
  ScratchDir dir;
  Settings settings =
      test_settings(write_script(dir, "ffmpeg", kSuccessfulEncoder));
  settings.whisper_path = dir.file("no-such-whisper");
  settings.whisper_model = dir.file("missing-model.bin");
  CapabilityProber prober(settings.ffmpeg_path, false);
  JobOrchestrator orch(settings, prober);

  JobRequest req = test_request(dir);
  req.subtitles = SubtitleRequest{};
  JobId id = orch.submit(req);
  auto snap = orch.wait(id, kWait);

  REQUIRE(snap);
  CHECK(snap->state == JobState::Completed);
  REQUIRE(snap->warnings.size() == 1);
  CHECK(snap->warnings[0].kind == ErrorKind::SubtitleGeneration);
  CHECK_FALSE(snap->subtitle_path);
  CHECK(is_nonempty_file(req.output_path));
}

TEST_CASE("Subtitles are remapped onto the cut output", "[orchestrator]") {
  ScratchDir dir;
  Settings settings =
      test_settings(write_script(dir, "ffmpeg", kSuccessfulEncoder));
  settings.whisper_path = write_script(
      dir, "whisper-cli",
      "base=''\n"
      "while [ $# -gt 0 ]; do\n"
      "  if [ \"$1\" = '-of' ]; then base=\"$2\"; fi\n"
      "  shift\n"
      "done\n"
      "printf '1\\n00:00:00,500 --> 00:00:01,500\\nhello\\n\\n"
      "2\\n00:00:02,500 --> 00:00:03,500\\nremoved\\n\\n"
      "3\\n00:00:05,000 --> 00:00:06,000\\nworld\\n' > \"$base.srt\"\n");
  settings.whisper_model = dir.file("ggml-test.bin");
  write_file(settings.whisper_model, "model");
  CapabilityProber prober(settings.ffmpeg_path, false);
  JobOrchestrator orch(settings, prober);

  JobRequest req = test_request(dir);
  req.subtitles = SubtitleRequest{std::string("en"), false};
  JobId id = orch.submit(req);
  auto snap = orch.wait(id, kWait);

  REQUIRE(snap);
  REQUIRE(snap->state == JobState::Completed);
  CHECK(snap->warnings.empty());
  REQUIRE(snap->subtitle_path);
  CHECK(*snap->subtitle_path == subtitle_path_for(req.output_path));

  auto track = read_srt_file(*snap->subtitle_path);
  REQUIRE(track);
  REQUIRE(track->size() == 2);
  CHECK(track->at(0).text == "hello");
  CHECK(track->at(0).start == Approx(0.5));
  CHECK(track->at(1).text == "world");
  CHECK(track->at(1).start == Approx(3.0));
  CHECK(track->at(1).end == Approx(4.0));
}

TEST_CASE("Queued jobs are cancelled immediately", "[orchestrator]") {
  ScratchDir dir;
  Settings settings =
      test_settings(write_script(dir, "ffmpeg", kStalledEncoder));
  CapabilityProber prober(settings.ffmpeg_path, false);
  JobOrchestrator orch(settings, prober);

  JobRequest first = test_request(dir);
  JobRequest second = test_request(dir);
  second.output_path = dir.file("out/second.mp4");

  JobId running = orch.submit(first);
  JobId queued = orch.submit(second);
  REQUIRE(eventually([&] {
    auto s = orch.snapshot(running);
    return s && s->state == JobState::Executing;
  }));

  CHECK(orch.cancel(queued));
  auto snap = orch.snapshot(queued);
  REQUIRE(snap);
  CHECK(snap->state == JobState::Cancelled);
  CHECK_FALSE(in_history(*snap, JobState::Building));

  CHECK(orch.cancel(running));
  auto done = orch.wait(running, kWait);
  REQUIRE(done);
  CHECK(done->state == JobState::Cancelled);
}

TEST_CASE("A single slot runs one job at a time", "[orchestrator]") {
  ScratchDir dir;
  Settings settings =
      test_settings(write_script(dir, "ffmpeg", kStalledEncoder));
  REQUIRE(settings.max_concurrent_jobs == 1);
  CapabilityProber prober(settings.ffmpeg_path, false);
  JobOrchestrator orch(settings, prober);

  JobRequest first = test_request(dir);
  JobRequest second = test_request(dir);
  second.output_path = dir.file("out/second.mp4");

  JobId running = orch.submit(first);
  JobId waiting = orch.submit(second);
  REQUIRE(eventually([&] {
    auto s = orch.snapshot(running);
    return s && s->state == JobState::Executing;
  }));

  std::this_thread::sleep_for(std::chrono::milliseconds(300));
  auto queued = orch.snapshot(waiting);
  REQUIRE(queued);
  CHECK(queued->state == JobState::Validating);
  CHECK_FALSE(fs::exists(second.output_path));

  /// The second job starts once the first one has left its slot
  CHECK(orch.cancel(running));
  REQUIRE(eventually([&] {
    auto s = orch.snapshot(waiting);
    return s && s->state == JobState::Executing;
  }));
  auto first_done = orch.snapshot(running);
  REQUIRE(first_done);
  CHECK(first_done->state == JobState::Cancelled);

  CHECK(orch.cancel(waiting));
  auto second_done = orch.wait(waiting, kWait);
  REQUIRE(second_done);
  CHECK(second_done->state == JobState::Cancelled);
}

TEST_CASE("Cancelling while subtitles are pending removes both outputs",
          "[orchestrator]") {
  ScratchDir dir;
  Settings settings =
      test_settings(write_script(dir, "ffmpeg", kSuccessfulEncoder));
  settings.whisper_path = write_script(dir, "whisper-cli", "sleep 30\n");
  settings.whisper_model = dir.file("ggml-test.bin");
  write_file(settings.whisper_model, "model");
  CapabilityProber prober(settings.ffmpeg_path, false);
  JobOrchestrator orch(settings, prober);

  JobRequest req = test_request(dir);
  req.subtitles = SubtitleRequest{};
  JobId id = orch.submit(req);

  /// The encode is done; finalizing waits for the transcription
  REQUIRE(eventually([&] {
    auto s = orch.snapshot(id);
    return s && s->state == JobState::Finalizing;
  }));
  CHECK(orch.cancel(id));

  auto snap = orch.wait(id, kWait);
  REQUIRE(snap);
  CHECK(snap->state == JobState::Cancelled);
  CHECK(in_history(*snap, JobState::Finalizing));
  CHECK(snap->warnings.empty());
  CHECK_FALSE(snap->subtitle_path);
  CHECK_FALSE(fs::exists(req.output_path));
  CHECK_FALSE(fs::exists(subtitle_path_for(req.output_path)));
}

TEST_CASE("Destroying the orchestrator stops its running job",
          "[orchestrator]") {
  ScratchDir dir;
  Settings settings =
      test_settings(write_script(dir, "ffmpeg", kStalledEncoder));
  CapabilityProber prober(settings.ffmpeg_path, false);
  JobRequest req = test_request(dir);

  {
    JobOrchestrator orch(settings, prober);
    JobId id = orch.submit(req);
    REQUIRE(eventually([&] {
      auto s = orch.snapshot(id);
      return s && s->state == JobState::Executing &&
             is_nonempty_file(req.output_path);
    }));
  }

  CHECK_FALSE(fs::exists(req.output_path));
}
