#pragma once

#include <chrono>
#include <condition_variable>
#include <deque>
#include <mutex>
#include <optional>
#include <vector>

#include "cycle_request.hpp"

namespace portwatch::collector {

/*
  Thread-safe blocking queue feeding the collector worker.
*/
class CycleQueue {
 public:
  using Deadline = std::chrono::steady_clock::time_point;

  // false once shut down; the request is handed back untouched.
  bool Enqueue(CycleRequest& request);

  // Blocks until a request arrives, the deadline passes or the queue shuts
  // down. nullopt for the latter two.
  std::optional<CycleRequest> DequeueUntil(Deadline deadline);

  // Stops accepting requests and returns those never dequeued.
  std::vector<CycleRequest> Shutdown();

  bool IsShutdown() const;

 private:
  mutable std::mutex       mutex_;
  std::condition_variable  cv_;
  std::deque<CycleRequest> queue_;
  bool                     shutdown_ = false;
};

} // namespace portwatch::collector
