/**
 * @file orchestrator.hpp
 * @brief Job lifecycle owner: validation, encoding, cancellation, events
 *
 * @details Each job runs through:
 *
 *          1. Validating  (synchronous inside submit(): cut-list resolution)
 *
 *          2. Building    (capability snapshot, profile, command)
 *
 *          3. Executing   (encoder subprocess, progress, diagnostics)
 *
 *          4. Finalizing  (artifact check, subtitles)
 *
 *          Steps 2-4 run on worker threads pulling from a JobQueue; at most
 *          max_concurrent_jobs jobs execute at once.
 *
 * @note All log messages of a job are prefixed with [Job N].
 */

#ifndef VIDCUT_ORCHESTRATOR_HPP
#define VIDCUT_ORCHESTRATOR_HPP

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>

#include "capability_prober.hpp"
#include "config.hpp"
#include "event_channel.hpp"
#include "job.hpp"
#include "job_queue.hpp"

namespace vidcut {

class JobOrchestrator {
public:
  /**
   * @param settings Tool paths, encoder defaults and concurrency
   * @param prober Capability cache, queried for settings' tool and hardware
   *               switch (its configured defaults are left alone)
   */
  explicit JobOrchestrator(
      Settings settings, CapabilityProber &prober = CapabilityProber::shared());

  /// Cancels every unfinished job and joins the workers
  ~JobOrchestrator();

  JobOrchestrator(const JobOrchestrator &) = delete;
  JobOrchestrator &operator=(const JobOrchestrator &) = delete;

  /**
   * @brief Validate a request and queue it.
   * @return Id of the queued job
   * @throws SegmentValidationError if the remove-ranges are invalid or leave
   *         nothing to keep (the job is recorded as Failed)
   */
  JobId submit(JobRequest request);

  /**
   * @brief Request cancellation.
   * @details A queued job is cancelled at once; a running job stops at its
   *          next poll.
   * @return false if the job is unknown or already terminal
   */
  bool cancel(JobId id);

  std::optional<JobSnapshot> snapshot(JobId id) const;
  std::vector<JobSnapshot> snapshots() const;

  /**
   * @brief Block until the job is terminal or the timeout expires.
   * @return Latest snapshot (nullopt for an unknown id)
   */
  std::optional<JobSnapshot> wait(JobId id, std::chrono::milliseconds timeout);

  EventChannel &events() { return events_; }
  const Settings &settings() const { return settings_; }

private:
  struct Record {
    JobId id = 0;
    JobRequest request;
    JobStateMachine machine;
    CutList cut_list;
    std::optional<EncodingProfile> profile;
    std::optional<CommandSpec> command;
    ProgressSample progress;
    std::optional<JobError> error;
    std::vector<JobError> warnings;
    std::optional<std::string> subtitle_path;
    std::atomic<bool> cancel{false};
  };

  /// Concurrent transcription of one job (defined in orchestrator.cpp)
  struct SubtitleTask;

  void worker_loop();
  void run_job(Record &rec);

  /// Runs the encoder; returns true if it exited with status 0
  bool execute(Record &rec, const CommandSpec &command);
  void finalize(Record &rec, SubtitleTask *subtitles);

  /// State transition + events; caller must hold mutex_
  bool advance_locked(Record &rec, JobState next,
                      std::optional<JobError> error = std::nullopt);
  bool advance(Record &rec, JobState next,
               std::optional<JobError> error = std::nullopt);
  void fail(Record &rec, ErrorKind kind, const std::string &message,
            int exit_code = 0, const std::string &diagnostics = "");
  void finish_cancelled(Record &rec);
  void add_warning(Record &rec, JobError warning);
  void publish_progress(Record &rec, const ProgressSample &sample);

  JobSnapshot snapshot_locked(const Record &rec) const;

  Settings settings_;
  CapabilityProber &prober_;

  mutable std::mutex mutex_;
  std::condition_variable state_cv_;
  std::map<JobId, std::unique_ptr<Record>> jobs_;
  JobId next_id_ = 1;

  JobQueue queue_;
  EventChannel events_;
  std::vector<std::thread> workers_;
};

} // namespace vidcut

#endif // VIDCUT_ORCHESTRATOR_HPP
