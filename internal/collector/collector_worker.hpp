#pragma once

#include <atomic>
#include <chrono>
#include <future>
#include <memory>
#include <thread>

#include "cycle_queue.hpp"

namespace portwatch::core {
class Reconciler;
}

namespace portwatch::collector {

struct CollectorOptions {
  std::chrono::seconds interval{60};
  bool                 run_on_start = true;
};

/*
  Background worker that owns the reconciliation schedule.

  Executes:
      one cycle every interval, plus queued manual cycles

  Every cycle, scheduled or manual, runs on this thread, so cycles never
  overlap. A failed scheduled cycle is logged and the schedule continues.
*/
class CollectorWorker {
 public:
  CollectorWorker(std::shared_ptr<CycleQueue> queue, std::shared_ptr<core::Reconciler> reconciler,
                  CollectorOptions options);
  ~CollectorWorker();

  void Start();
  void Stop();

  // Queues a manual cycle; the future carries its report or its error.
  std::future<core::CycleReport> TriggerNow(std::string reason);

 private:
  void Run();
  void RunScheduled();

  std::shared_ptr<CycleQueue>       queue_;
  std::shared_ptr<core::Reconciler> reconciler_;
  CollectorOptions                  options_;

  std::thread       thread_;
  std::atomic<bool> running_{false};
};

} // namespace portwatch::collector
