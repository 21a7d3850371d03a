#pragma once

#include <cstdint>
#include <string>

#include "internal/model/port.hpp"

namespace portwatch::db::model {

/*
  Append-only timeline row (table port_event).

  References its fact by id; removed together with the fact (ON DELETE CASCADE).
*/

struct TimelineEventRecord {
  uint64_t id      = 0; // assigned by the repository on append
  uint64_t fact_id = 0;

  portwatch::model::EventKind kind = portwatch::model::EventKind::kAppeared;

  uint64_t    timestamp_ms = 0;
  int32_t     pid          = 0;
  std::string process_name;

  // free-form output of an inspection tool; only set for diagnosis events
  std::string diagnostic_output;
};

} // namespace portwatch::db::model
