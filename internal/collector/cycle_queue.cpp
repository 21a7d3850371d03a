#include "cycle_queue.hpp"

namespace portwatch::collector {

bool CycleQueue::Enqueue(CycleRequest& request) {
  {
    std::lock_guard lock(mutex_);
    if (shutdown_) return false;
    queue_.push_back(std::move(request));
  }
  cv_.notify_one();
  return true;
}

std::optional<CycleRequest> CycleQueue::DequeueUntil(Deadline deadline) {
  std::unique_lock lock(mutex_);

  cv_.wait_until(lock, deadline, [&] { return shutdown_ || !queue_.empty(); });

  if (shutdown_ || queue_.empty()) return std::nullopt;

  CycleRequest request = std::move(queue_.front());
  queue_.pop_front();
  return request;
}

std::vector<CycleRequest> CycleQueue::Shutdown() {
  std::vector<CycleRequest> pending;
  {
    std::lock_guard lock(mutex_);
    shutdown_ = true;
    while (!queue_.empty()) {
      pending.push_back(std::move(queue_.front()));
      queue_.pop_front();
    }
  }
  cv_.notify_all();
  return pending;
}

bool CycleQueue::IsShutdown() const {
  std::lock_guard lock(mutex_);
  return shutdown_;
}

} // namespace portwatch::collector
