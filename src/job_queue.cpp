/**
 * @file job_queue.cpp
 * @brief Job queue implementation
 */

#include "vidcut/job_queue.hpp"

namespace vidcut {

void JobQueue::push(JobId id) {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    ids_.push(id);
  }
  cv_.notify_one();
}

bool JobQueue::pop(JobId &id) {
  std::unique_lock<std::mutex> lock(mutex_);
  cv_.wait(lock, [this] { return !ids_.empty() || done_.load(); });

  if (ids_.empty()) {
    return false;
  }

  id = ids_.front();
  ids_.pop();
  return true;
}

void JobQueue::finish() {
  {
    /// Taking the lock orders the store against a waiter's predicate check
    std::lock_guard<std::mutex> lock(mutex_);
    done_.store(true);
  }
  cv_.notify_all();
}

} // namespace vidcut
