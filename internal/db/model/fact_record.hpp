#pragma once

#include <cstdint>
#include <optional>
#include <string>

#include "internal/model/port.hpp"

namespace portwatch::db::model {

/*
  Persistent fact row (table port_runtime).

  IMPORTANT:
  - One row per (host_id, protocol, port); enforced by a UNIQUE constraint.
  - Mutated in place by every reconciliation cycle, never replaced.
  - Never deleted by the reconciler; only an explicit operator delete removes it.
  - Process fields hold the last observed values, also after disappearance.
*/

struct FactRecord {
  uint64_t id = 0; // assigned by the repository on insert

  portwatch::model::PortKey key;

  uint64_t                first_seen_at_ms = 0;
  uint64_t                last_seen_at_ms  = 0;
  std::optional<uint64_t> last_disappeared_at_ms; // nullopt = never disappeared

  portwatch::model::PortState state = portwatch::model::PortState::kActive;

  int32_t     pid = 0;
  std::string process_name;
  std::string cmdline;

  uint64_t total_seen_count     = 0;
  uint64_t total_uptime_seconds = 0;
};

} // namespace portwatch::db::model
