#pragma once

#include <optional>
#include <string>
#include <string_view>

#include "internal/model/port.hpp"
#include "internal/util/errors.hpp"

namespace portwatch::db::sql {

/*
  Enum columns are stored as their wire strings so that rows stay
  readable from a plain SQL shell. An unreadable value means the store
  was written by something else and is reported as unavailable.
*/

template <typename T>
T RequireColumn(std::optional<T> parsed, std::string_view column, std::string_view raw) {
  if (!parsed) {
    throw util::StoreUnavailable("unreadable " + std::string(column) + " value '" + std::string(raw) + "'");
  }
  return *parsed;
}

inline portwatch::model::Protocol ProtocolColumn(std::string_view raw) {
  return RequireColumn(portwatch::model::ParseProtocol(raw), "protocol", raw);
}

inline portwatch::model::PortState StateColumn(std::string_view raw) {
  return RequireColumn(portwatch::model::ParsePortState(raw), "current_state", raw);
}

inline portwatch::model::EventKind EventKindColumn(std::string_view raw) {
  return RequireColumn(portwatch::model::ParseEventKind(raw), "event_type", raw);
}

inline portwatch::model::RiskLevel RiskColumn(std::string_view raw) {
  return RequireColumn(portwatch::model::ParseRiskLevel(raw), "risk_level", raw);
}

inline std::string Text(auto value) {
  return std::string(portwatch::model::ToString(value));
}

} // namespace portwatch::db::sql
