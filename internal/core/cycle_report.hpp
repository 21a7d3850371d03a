#pragma once

#include <cstdint>
#include <string>

namespace portwatch::core {

// Outcome of one reconciliation cycle.
struct CycleReport {
  std::string host_id;
  uint64_t    started_at_ms = 0;
  uint64_t    duration_ms   = 0;

  uint64_t observed        = 0; // keys in the scan
  uint64_t appeared        = 0; // new facts
  uint64_t reappeared      = 0; // disappeared -> active
  uint64_t continued       = 0; // active -> active
  uint64_t process_changed = 0;
  uint64_t disappeared     = 0;
};

} // namespace portwatch::core
