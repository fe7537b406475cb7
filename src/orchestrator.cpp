/**
 * @file orchestrator.cpp
 * @brief Job orchestrator implementation
 *
 * @details Record ownership: records live in jobs_ for the lifetime of the
 *          orchestrator and are never erased, so a worker may keep a
 *          reference to its record. Every mutable field except the cancel
 *          flag is written under mutex_; the request is immutable after
 *          submit().
 */

#include "vidcut/orchestrator.hpp"

#include <algorithm>
#include <filesystem>
#include <future>
#include <system_error>

#include <fmt/core.h>

#include "vidcut/command_builder.hpp"
#include "vidcut/logging.hpp"
#include "vidcut/process.hpp"
#include "vidcut/profile_selector.hpp"
#include "vidcut/progress_parser.hpp"
#include "vidcut/segment_resolver.hpp"
#include "vidcut/subtitles.hpp"
#include "vidcut/system.hpp"
#include "vidcut/transcriber.hpp"

namespace fs = std::filesystem;

namespace vidcut {

/// Stops and joins the transcription when the job leaves early
struct JobOrchestrator::SubtitleTask {
  std::atomic<bool> abort{false};
  std::future<SubtitleTrack> result;

  ~SubtitleTask() {
    abort.store(true);
    if (result.valid())
      result.wait();
  }
};

// **---- Constructor / Destructor ----**

JobOrchestrator::JobOrchestrator(Settings settings, CapabilityProber &prober)
    : settings_(std::move(settings)), prober_(prober) {
  int num_workers = std::max(1, settings_.max_concurrent_jobs);
  for (int i = 0; i < num_workers; ++i) {
    workers_.emplace_back(&JobOrchestrator::worker_loop, this);
  }
}

JobOrchestrator::~JobOrchestrator() {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    for (auto &entry : jobs_) {
      Record &rec = *entry.second;
      if (is_terminal(rec.machine.state()))
        continue;
      rec.cancel.store(true);
      JobState s = rec.machine.state();
      if (s == JobState::Pending || s == JobState::Validating) {
        advance_locked(rec, JobState::Cancelled,
                       JobError{ErrorKind::Cancelled,
                                "cancelled at shutdown", 0, ""});
      }
    }
  }
  state_cv_.notify_all();

  queue_.finish();
  for (auto &w : workers_) {
    if (w.joinable())
      w.join();
  }
}

// **---- Public API ----**

JobId JobOrchestrator::submit(JobRequest request) {
  Record *rec = nullptr;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    auto record = std::make_unique<Record>();
    record->id = next_id_++;
    record->request = std::move(request);
    rec = record.get();
    jobs_.emplace(rec->id, std::move(record));

    JobEvent created;
    created.job = rec->id;
    created.kind = JobEventKind::StateChanged;
    created.state = JobState::Pending;
    created.message = "submitted";
    events_.push(std::move(created));
  }

  const JobRequest &req = rec->request;
  LOG_INFO("[Job {}] {} -> {} ({} range(s) to remove)", rec->id,
           req.source.path, req.output_path, req.remove.size());

  advance(*rec, JobState::Validating);

  // **----- VALIDATING -----**

  TIMER_START(validate);
  CutList cuts;
  try {
    /// A keep-segment shorter than one frame cannot be encoded
    double min_keep = (req.source.fps > 0.0) ? 1.0 / req.source.fps : -1.0;
    cuts = resolve_segments(req.source.duration, req.remove, min_keep);
    if (cuts.empty()) {
      throw SegmentValidationError(
          "remove-ranges cover the whole source, nothing would be kept");
    }
  } catch (const SegmentValidationError &e) {
    TIMER_END(validate, fmt::format("job {} validate", rec->id));
    fail(*rec, ErrorKind::SegmentValidation, e.what());
    throw;
  }
  TIMER_END(validate, fmt::format("job {} validate", rec->id));

  {
    std::lock_guard<std::mutex> lock(mutex_);
    rec->cut_list = cuts;
  }
  LOG_INFO("[Job {}] Keeping {} segment(s), {} of {}", rec->id, cuts.size(),
           format_time(cuts.total_duration()),
           format_time(req.source.duration));

  queue_.push(rec->id);
  return rec->id;
}

bool JobOrchestrator::cancel(JobId id) {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = jobs_.find(id);
    if (it == jobs_.end())
      return false;
    Record &rec = *it->second;
    if (is_terminal(rec.machine.state()))
      return false;

    rec.cancel.store(true);

    /// Not picked up by a worker yet: nothing to stop
    JobState s = rec.machine.state();
    if (s == JobState::Pending || s == JobState::Validating) {
      advance_locked(rec, JobState::Cancelled,
                     JobError{ErrorKind::Cancelled, "cancelled before start",
                              0, ""});
    }
  }
  state_cv_.notify_all();
  LOG_WARN("[Job {}] Cancellation requested", id);
  return true;
}

std::optional<JobSnapshot> JobOrchestrator::snapshot(JobId id) const {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = jobs_.find(id);
  if (it == jobs_.end())
    return std::nullopt;
  return snapshot_locked(*it->second);
}

std::vector<JobSnapshot> JobOrchestrator::snapshots() const {
  std::lock_guard<std::mutex> lock(mutex_);
  std::vector<JobSnapshot> out;
  out.reserve(jobs_.size());
  for (const auto &entry : jobs_)
    out.push_back(snapshot_locked(*entry.second));
  return out;
}

std::optional<JobSnapshot>
JobOrchestrator::wait(JobId id, std::chrono::milliseconds timeout) {
  std::unique_lock<std::mutex> lock(mutex_);
  auto it = jobs_.find(id);
  if (it == jobs_.end())
    return std::nullopt;
  const Record &rec = *it->second;
  state_cv_.wait_for(lock, timeout,
                     [&rec] { return is_terminal(rec.machine.state()); });
  return snapshot_locked(rec);
}

// **---- Worker ----**

void JobOrchestrator::worker_loop() {
  JobId id = 0;
  while (queue_.pop(id)) {
    Record *rec = nullptr;
    {
      std::lock_guard<std::mutex> lock(mutex_);
      auto it = jobs_.find(id);
      if (it != jobs_.end())
        rec = it->second.get();
    }
    if (!rec)
      continue;

    try {
      run_job(*rec);
    } catch (const std::exception &e) {
      LOG_ERROR("[Job {}] Unexpected error: {}", rec->id, e.what());
      remove_partial_output(rec->request.output_path);
      fail(*rec, ErrorKind::ProcessExecution,
           fmt::format("internal error: {}", e.what()));
    }
  }
}

void JobOrchestrator::run_job(Record &rec) {
  const JobRequest &req = rec.request;

  /// Fails when the job was cancelled while queued
  if (!advance(rec, JobState::Building))
    return;
  if (rec.cancel.load()) {
    finish_cancelled(rec);
    return;
  }

  // **----- BUILDING -----**

  TIMER_START(build);
  ProbeReport report = prober_.report_for(settings_.ffmpeg_path,
                                          settings_.hardware_acceleration);
  if (report.capability == EncoderCapability::Cpu &&
      report.encoder_list_read && !report.software_available) {
    fail(rec, ErrorKind::EncoderUnavailable,
         "no usable encoder: no hardware encoder works and the software "
         "encoders are missing from the encoding tool");
    return;
  }

  EncodingProfile profile;
  CommandSpec command;
  try {
    profile = select_profile(report.capability, req.intent, settings_);
    command =
        build_command(req.source, rec.cut_list, profile, req.output_path);
    command.program = settings_.ffmpeg_path;
  } catch (const ProfileIncompatibleError &e) {
    fail(rec, ErrorKind::ProfileIncompatible, e.what());
    return;
  }

  {
    std::lock_guard<std::mutex> lock(mutex_);
    rec.profile = profile;
    rec.command = command;
  }
  LOG_INFO("[Job {}] Encoder: {} ({}, {})", rec.id, profile.codec,
           to_string(profile.encoder), to_string(profile.rate_control));
  LOG_DEBUG("[Job {}] {}", rec.id, render(command));

  std::unique_ptr<SubtitleTask> subtitles;
  if (req.subtitles) {
    subtitles = std::make_unique<SubtitleTask>();
    SubtitleTask *task = subtitles.get();
    subtitles->result = std::async(std::launch::async, [this, &req, task] {
      SubtitleIntegrator integrator(settings_);
      return integrator.generate(req.source, req.subtitles->language,
                                 req.subtitles->word_timestamps,
                                 &task->abort);
    });
    LOG_INFO("[Job {}] Transcription started", rec.id);
  }
  TIMER_END(build, fmt::format("job {} build", rec.id));

  if (!execute(rec, command))
    return;
  finalize(rec, subtitles.get());
}

bool JobOrchestrator::execute(Record &rec, const CommandSpec &command) {
  const std::string &output = rec.request.output_path;

  if (!advance(rec, JobState::Executing))
    return false;
  if (rec.cancel.load()) {
    finish_cancelled(rec);
    return false;
  }

  // **----- EXECUTING -----**

  TIMER_START(execute);
  fs::path parent = fs::path(output).parent_path();
  if (!parent.empty()) {
    std::error_code ec;
    fs::create_directories(parent, ec);
    if (ec) {
      fail(rec, ErrorKind::ProcessExecution,
           fmt::format("cannot create output directory {}: {}",
                       parent.string(), ec.message()));
      return false;
    }
  }

  ChildProcess child;
  std::string spawn_error;
  if (!child.spawn(command.argv(), spawn_error)) {
    fail(rec, ErrorKind::ProcessExecution, spawn_error, EXIT_SPAWN_FAILED);
    return false;
  }
  LOG_PHASE("[Job {}] Encoding (pid {})...", rec.id, child.pid());

  ProgressTracker tracker;
  EtaEstimator eta(rec.cut_list.total_duration(), Config::eta_smoothing());
  DiagnosticTail tail(
      static_cast<size_t>(std::max(0, Config::diagnostic_tail_lines())));
  auto start = std::chrono::steady_clock::now();

  auto handle = [&](const std::vector<OutputLine> &lines) {
    for (const auto &line : lines) {
      if (line.from_stderr)
        tail.push(line.text);
      if (auto t = tracker.feed(line.text)) {
        double elapsed = std::chrono::duration<double>(
                             std::chrono::steady_clock::now() - start)
                             .count();
        publish_progress(rec, eta.update(*t, elapsed));
      }
    }
  };

  const int poll_ms = std::max(10, Config::poll_interval_ms());
  int exit_code = 0;
  bool cancelled = false;
  while (true) {
    handle(child.read_lines(poll_ms));
    if (child.try_wait(exit_code))
      break;
    if (rec.cancel.load()) {
      cancelled = true;
      LOG_WARN("[Job {}] Stopping encoder (pid {})", rec.id, child.pid());
      child.terminate(Config::cancel_grace_ms(), exit_code);
      break;
    }
  }
  handle(child.drain());
  TIMER_END(execute, fmt::format("job {} execute", rec.id));

  if (cancelled || rec.cancel.load()) {
    finish_cancelled(rec);
    return false;
  }
  if (exit_code != 0) {
    remove_partial_output(output);
    fail(rec, ErrorKind::ProcessExecution,
         fmt::format("encoder exited with code {}", exit_code), exit_code,
         tail.str());
    return false;
  }
  return true;
}

void JobOrchestrator::finalize(Record &rec, SubtitleTask *subtitles) {
  const std::string &output = rec.request.output_path;

  if (!advance(rec, JobState::Finalizing))
    return;

  // **----- FINALIZING -----**

  TIMER_START(finalize);
  if (!is_nonempty_file(output)) {
    remove_partial_output(output);
    fail(rec, ErrorKind::ProcessExecution,
         fmt::format("encoder reported success but {} is missing or empty",
                     output));
    return;
  }

  std::optional<std::string> srt_path;
  if (subtitles) {
    const auto poll = std::chrono::milliseconds(
        std::max(10, Config::poll_interval_ms()));
    while (subtitles->result.wait_for(poll) != std::future_status::ready) {
      if (rec.cancel.load())
        subtitles->abort.store(true);
    }

    try {
      SubtitleTrack track = subtitles->result.get();
      if (!rec.cancel.load()) {
        std::string path = subtitle_path_for(output);
        SubtitleTrack remapped = remap_to_cut_list(track, rec.cut_list);
        if (write_srt(path, remapped)) {
          srt_path = path;
          LOG_INFO("[Job {}] Subtitles: {} ({} cue(s))", rec.id, path,
                   remapped.size());
        } else {
          add_warning(rec, JobError{ErrorKind::SubtitleGeneration,
                                    fmt::format("cannot write {}", path), 0,
                                    ""});
        }
      }
    } catch (const SubtitleGenerationError &e) {
      if (!rec.cancel.load())
        add_warning(rec, JobError{ErrorKind::SubtitleGeneration, e.what(), 0,
                                  ""});
    }
  }

  ProgressSample done;
  bool completed = false;
  {
    /// Decided under the lock: a concurrent cancel() either lands first
    /// (Cancelled) or sees a terminal job and is refused
    std::lock_guard<std::mutex> lock(mutex_);
    if (!rec.cancel.load()) {
      done = rec.progress;
      done.source_time = rec.cut_list.total_duration();
      done.percent = 1.0;
      done.eta_sec = 0.0;
      rec.progress = done;
      rec.subtitle_path = srt_path;

      JobEvent ev;
      ev.job = rec.id;
      ev.kind = JobEventKind::Progress;
      ev.state = rec.machine.state();
      ev.progress = done;
      events_.push(std::move(ev));

      completed = advance_locked(rec, JobState::Completed);
    }
  }
  state_cv_.notify_all();
  TIMER_END(finalize, fmt::format("job {} finalize", rec.id));

  if (!completed) {
    finish_cancelled(rec);
    return;
  }
  LOG_SUCCESS("[Job {}] Completed: {}", rec.id, output);
}

// **---- State Helpers ----**

bool JobOrchestrator::advance_locked(Record &rec, JobState next,
                                     std::optional<JobError> error) {
  JobState prev = rec.machine.state();
  if (!rec.machine.advance(next)) {
    LOG_DEBUG("[Job {}] Ignored transition {} -> {}", rec.id, to_string(prev),
              to_string(next));
    return false;
  }
  if (error)
    rec.error = std::move(error);

  JobEvent ev;
  ev.job = rec.id;
  ev.kind = JobEventKind::StateChanged;
  ev.state = next;
  ev.progress = rec.progress;
  ev.message = fmt::format("{} -> {}", to_string(prev), to_string(next));
  events_.push(ev);

  if (is_terminal(next)) {
    ev.kind = JobEventKind::Finished;
    ev.error = rec.error;
    ev.message = rec.error ? rec.error->message : "completed";
    events_.push(std::move(ev));
  }
  return true;
}

bool JobOrchestrator::advance(Record &rec, JobState next,
                              std::optional<JobError> error) {
  bool ok;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    ok = advance_locked(rec, next, std::move(error));
  }
  state_cv_.notify_all();
  return ok;
}

void JobOrchestrator::fail(Record &rec, ErrorKind kind,
                           const std::string &message, int exit_code,
                           const std::string &diagnostics) {
  if (!advance(rec, JobState::Failed,
               JobError{kind, message, exit_code, diagnostics}))
    return;
  LOG_ERROR("[Job {}] {}: {}", rec.id, to_string(kind), message);
  if (!diagnostics.empty())
    LOG_ERROR("[Job {}] Encoder output:\n{}", rec.id, diagnostics);
}

void JobOrchestrator::finish_cancelled(Record &rec) {
  const std::string &output = rec.request.output_path;
  if (!remove_partial_output(output))
    LOG_WARN("[Job {}] Could not remove partial output {}", rec.id, output);
  if (rec.request.subtitles)
    remove_partial_output(subtitle_path_for(output));

  if (advance(rec, JobState::Cancelled,
              JobError{ErrorKind::Cancelled, "cancelled by request", 0, ""}))
    LOG_WARN("[Job {}] Cancelled", rec.id);
}

void JobOrchestrator::add_warning(Record &rec, JobError warning) {
  LOG_WARN("[Job {}] {}: {}", rec.id, to_string(warning.kind),
           warning.message);
  std::lock_guard<std::mutex> lock(mutex_);
  rec.warnings.push_back(warning);

  JobEvent ev;
  ev.job = rec.id;
  ev.kind = JobEventKind::Warning;
  ev.state = rec.machine.state();
  ev.progress = rec.progress;
  ev.message = warning.message;
  ev.error = std::move(warning);
  events_.push(std::move(ev));
}

void JobOrchestrator::publish_progress(Record &rec,
                                       const ProgressSample &sample) {
  std::lock_guard<std::mutex> lock(mutex_);
  rec.progress = sample;

  JobEvent ev;
  ev.job = rec.id;
  ev.kind = JobEventKind::Progress;
  ev.state = rec.machine.state();
  ev.progress = sample;
  events_.push(std::move(ev));
}

JobSnapshot JobOrchestrator::snapshot_locked(const Record &rec) const {
  JobSnapshot s;
  s.id = rec.id;
  s.state = rec.machine.state();
  s.history = rec.machine.history();
  s.source_path = rec.request.source.path;
  s.output_path = rec.request.output_path;
  s.cut_list = rec.cut_list;
  s.profile = rec.profile;
  s.command = rec.command;
  s.progress = rec.progress;
  s.error = rec.error;
  s.warnings = rec.warnings;
  s.subtitle_path = rec.subtitle_path;
  return s;
}

} // namespace vidcut
