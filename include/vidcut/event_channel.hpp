/**
 * @file event_channel.hpp
 * @brief Job event channel
 *
 * @details The orchestrator publishes from worker threads; consumers poll
 *          with try_pop() or wait with pop_for(). Publishing never blocks
 *          on the consumer, so a slow (or absent) reader cannot stall a job.
 *
 * @note Progress events coalesce: a new sample replaces the job's queued
 *       one unless another event of that job was queued after it. The queue
 *       therefore holds at most one Progress event per job between two of
 *       its state changes or warnings, however long nobody drains it.
 */

#ifndef VIDCUT_EVENT_CHANNEL_HPP
#define VIDCUT_EVENT_CHANNEL_HPP

#include <chrono>
#include <condition_variable>
#include <deque>
#include <mutex>
#include <optional>

#include "job.hpp"

namespace vidcut {

class EventChannel {
public:
  /// Queue an event (or merge a Progress event into the pending one)
  void push(JobEvent event);

  /// Next event, or nullopt if none is queued
  std::optional<JobEvent> try_pop();

  /// Next event, waiting up to timeout
  std::optional<JobEvent> pop_for(std::chrono::milliseconds timeout);

  size_t size() const;

private:
  mutable std::mutex mutex_;
  std::condition_variable cv_;
  std::deque<JobEvent> events_;
};

} // namespace vidcut

#endif // VIDCUT_EVENT_CHANNEL_HPP
