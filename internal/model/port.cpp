#include "port.hpp"

namespace portwatch::model {

std::string_view ToString(Protocol protocol) {
  switch (protocol) {
    case Protocol::kTcp:
      return "tcp";
    case Protocol::kUdp:
      return "udp";
  }
  return "unknown";
}

std::string_view ToString(PortState state) {
  switch (state) {
    case PortState::kActive:
      return "active";
    case PortState::kDisappeared:
      return "disappeared";
  }
  return "unknown";
}

// Persisted spellings match the legacy store so archived data stays readable.
std::string_view ToString(EventKind kind) {
  switch (kind) {
    case EventKind::kAppeared:
      return "appeared";
    case EventKind::kAlive:
      return "alive";
    case EventKind::kProcessChanged:
      return "process_change";
    case EventKind::kDisappeared:
      return "disappeared";
    case EventKind::kAcknowledged:
      return "acknowledged";
    case EventKind::kDiagnosed:
      return "diagnosis";
  }
  return "unknown";
}

std::string_view ToString(RiskLevel risk) {
  switch (risk) {
    case RiskLevel::kTrusted:
      return "trusted";
    case RiskLevel::kExpected:
      return "expected";
    case RiskLevel::kSuspicious:
      return "suspicious";
  }
  return "unknown";
}

std::string_view ToString(DerivedStatus status) {
  switch (status) {
    case DerivedStatus::kHealthy:
      return "healthy";
    case DerivedStatus::kSuspicious:
      return "suspicious";
    case DerivedStatus::kGhost:
      return "ghost";
    case DerivedStatus::kUnknown:
      return "unknown";
  }
  return "unknown";
}

std::optional<Protocol> ParseProtocol(std::string_view text) {
  if (text == "tcp") return Protocol::kTcp;
  if (text == "udp") return Protocol::kUdp;
  return std::nullopt;
}

std::optional<PortState> ParsePortState(std::string_view text) {
  if (text == "active") return PortState::kActive;
  if (text == "disappeared") return PortState::kDisappeared;
  return std::nullopt;
}

std::optional<EventKind> ParseEventKind(std::string_view text) {
  if (text == "appeared") return EventKind::kAppeared;
  if (text == "alive") return EventKind::kAlive;
  if (text == "process_change" || text == "process_changed" || text == "process-changed") return EventKind::kProcessChanged;
  if (text == "disappeared") return EventKind::kDisappeared;
  if (text == "acknowledged") return EventKind::kAcknowledged;
  if (text == "diagnosis" || text == "diagnosed") return EventKind::kDiagnosed;
  return std::nullopt;
}

std::optional<RiskLevel> ParseRiskLevel(std::string_view text) {
  if (text == "trusted") return RiskLevel::kTrusted;
  if (text == "expected") return RiskLevel::kExpected;
  if (text == "suspicious") return RiskLevel::kSuspicious;
  return std::nullopt;
}

std::string ToString(const PortKey& key) {
  return key.host_id + "/" + std::string(ToString(key.protocol)) + "/" + std::to_string(key.port);
}

} // namespace portwatch::model
