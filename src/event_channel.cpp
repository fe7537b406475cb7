/**
 * @file event_channel.cpp
 * @brief Event channel implementation
 */

#include "vidcut/event_channel.hpp"

namespace vidcut {

void EventChannel::push(JobEvent event) {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (event.kind == JobEventKind::Progress) {
      for (auto it = events_.rbegin(); it != events_.rend(); ++it) {
        if (it->job != event.job)
          continue;
        if (it->kind == JobEventKind::Progress) {
          *it = std::move(event);
          return;
        }
        break;
      }
    }
    events_.push_back(std::move(event));
  }
  cv_.notify_one();
}

std::optional<JobEvent> EventChannel::try_pop() {
  std::lock_guard<std::mutex> lock(mutex_);
  if (events_.empty())
    return std::nullopt;
  JobEvent e = std::move(events_.front());
  events_.pop_front();
  return e;
}

std::optional<JobEvent>
EventChannel::pop_for(std::chrono::milliseconds timeout) {
  std::unique_lock<std::mutex> lock(mutex_);
  if (!cv_.wait_for(lock, timeout, [this] { return !events_.empty(); }))
    return std::nullopt;
  JobEvent e = std::move(events_.front());
  events_.pop_front();
  return e;
}

size_t EventChannel::size() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return events_.size();
}

} // namespace vidcut
