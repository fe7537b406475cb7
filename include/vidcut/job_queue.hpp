/**
 * @file job_queue.hpp
 * @brief Thread-safe queue of admitted jobs (producer-consumer pattern)
 *
 * @attention USAGE:
 *
 *   - submit() pushes the id of a validated job
 *
 *   - Worker threads call pop() in a loop
 *
 *   - finish() wakes every worker once no more jobs will be pushed
 */

#ifndef VIDCUT_JOB_QUEUE_HPP
#define VIDCUT_JOB_QUEUE_HPP

#include <atomic>
#include <condition_variable>
#include <mutex>
#include <queue>

#include "job.hpp"

namespace vidcut {

class JobQueue {
public:
  /**
   * @brief Push a job id to the queue.
   */
  void push(JobId id);

  /**
   * @brief Pop a job id (blocking).
   * @param id Output: the job to run
   * @return true if an id was retrieved, false if the queue is finished
   */
  bool pop(JobId &id);

  /**
   * @brief Signal that no more jobs will be pushed.
   */
  void finish();

  bool empty() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return ids_.empty();
  }

private:
  mutable std::mutex mutex_;
  std::condition_variable cv_;
  std::queue<JobId> ids_;
  std::atomic<bool> done_{false};
};

} // namespace vidcut

#endif // VIDCUT_JOB_QUEUE_HPP
