#pragma once

#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include "internal/core/cycle_report.hpp"
#include "internal/db/api/repository.hpp"
#include "internal/scan/socket_scanner.hpp"

namespace portwatch::core {

struct ReconcilerOptions {
  // heartbeat event on every continuation without a process change
  bool emit_alive_events = false;

  // injectable for tests; defaults to wall clock
  std::function<uint64_t()> clock;
};

/*
  Mutations for one cycle, computed without touching the store.

  Events reference facts by key because inserted facts have no id until
  the plan is applied. Events are in emission order.
*/
struct CyclePlan {
  struct PendingEvent {
    model::PortKey   key;
    model::EventKind kind = model::EventKind::kAppeared;
    int32_t          pid  = 0;
    std::string      process_name;
  };

  std::vector<db::model::FactRecord> inserts;
  std::vector<db::model::FactRecord> updates;
  std::vector<PendingEvent>          events;
  CycleReport                        report;
};

/*
  Diffs the scanner's observation against stored facts of one host.

  At most one cycle runs at a time per Reconciler; a cycle's writes land
  in a single transaction or not at all. Scan failures abort the cycle
  before the store is opened.
*/
class Reconciler {
 public:
  Reconciler(std::shared_ptr<db::Repository> repository, std::shared_ptr<scan::SocketScanner> scanner,
             ReconcilerOptions options = {});

  const std::string& HostId() const;

  // Throws util::ScanFailure or util::StoreUnavailable; nothing is written on failure.
  CycleReport RunCycle();

  static CyclePlan Plan(const std::string& host_id, const scan::ObservationMap& observed,
                        const std::vector<db::model::FactRecord>& existing, uint64_t now_ms, bool emit_alive_events);

 private:
  std::shared_ptr<db::Repository>      repository_;
  std::shared_ptr<scan::SocketScanner> scanner_;
  ReconcilerOptions                    options_;

  std::mutex cycle_mutex_;
};

} // namespace portwatch::core
