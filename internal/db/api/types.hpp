#pragma once

#include <optional>
#include <string>

#include "internal/model/port.hpp"

namespace portwatch::db {

struct FactFilter {
  std::optional<std::string>                 host_id;
  std::optional<portwatch::model::PortState> state;
};

struct AnnotationFilter {
  std::optional<std::string> host_id;
};

} // namespace portwatch::db
