#pragma once

#include <cstdint>
#include <string>

#include "internal/model/port.hpp"

namespace portwatch::db::model {

/*
  Operator-entered memory about a tuple (table port_note).

  Keyed by the same tuple as facts but deliberately NOT a foreign key:
  notes outlive fact deletion and may exist for tuples never observed.
*/

struct AnnotationRecord {
  uint64_t id = 0;

  portwatch::model::PortKey key;

  std::string title;
  std::string description;
  std::string owner;

  portwatch::model::RiskLevel risk_level = portwatch::model::RiskLevel::kExpected;
  bool                        is_pinned  = false;
};

} // namespace portwatch::db::model
