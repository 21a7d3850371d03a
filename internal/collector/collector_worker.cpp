#include "collector_worker.hpp"

#include <stdexcept>

#include "internal/core/reconciler.hpp"
#include "internal/observability/logging.hpp"

namespace portwatch::collector {

CollectorWorker::CollectorWorker(std::shared_ptr<CycleQueue> queue, std::shared_ptr<core::Reconciler> reconciler,
                                 CollectorOptions options)
    : queue_(std::move(queue)), reconciler_(std::move(reconciler)), options_(options) {
}

CollectorWorker::~CollectorWorker() {
  Stop();
}

void CollectorWorker::Start() {
  if (running_.exchange(true)) return;
  thread_ = std::thread(&CollectorWorker::Run, this);
  observability::LogInfo("collector started", {observability::StringField("host_id", reconciler_->HostId()),
                                               observability::IntField("interval_seconds", options_.interval.count()),
                                               observability::BoolField("run_on_start", options_.run_on_start)});
}

void CollectorWorker::Stop() {
  auto pending = queue_->Shutdown();
  for (auto& request : pending) {
    request.done.set_exception(std::make_exception_ptr(std::runtime_error("collector stopped before the cycle ran")));
  }

  running_ = false;
  if (thread_.joinable()) thread_.join();
}

std::future<core::CycleReport> CollectorWorker::TriggerNow(std::string reason) {
  CycleRequest request;
  request.reason = std::move(reason);
  auto future    = request.done.get_future();

  // nothing drains the queue before Start()
  if (!running_ || !queue_->Enqueue(request)) {
    request.done.set_exception(std::make_exception_ptr(std::runtime_error("collector is not running")));
  }
  return future;
}

void CollectorWorker::Run() {
  using Clock = std::chrono::steady_clock;

  auto next = options_.run_on_start ? Clock::now() : Clock::now() + options_.interval;

  while (running_) {
    auto request = queue_->DequeueUntil(next);
    if (request) {
      observability::LogInfo("manual cycle requested", {observability::StringField("reason", request->reason)});
      try {
        request->done.set_value(reconciler_->RunCycle());
      } catch (const std::exception&) {
        request->done.set_exception(std::current_exception());
      }
      continue;
    }

    if (queue_->IsShutdown()) break;

    if (Clock::now() >= next) {
      RunScheduled();
      next = Clock::now() + options_.interval;
    }
  }
}

void CollectorWorker::RunScheduled() {
  try {
    reconciler_->RunCycle();
  } catch (const std::exception& e) {
    observability::LogError("scheduled cycle failed", {observability::StringField("host_id", reconciler_->HostId()),
                                                       observability::StringField("error", e.what())});
  }
}

} // namespace portwatch::collector
