#pragma once

#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <string_view>

namespace portwatch::model {

enum class Protocol : std::uint8_t {
  kTcp = 1,
  kUdp = 2,
};

enum class PortState : std::uint8_t {
  kActive      = 1,
  kDisappeared = 2,
};

enum class EventKind : std::uint8_t {
  kAppeared       = 1,
  kAlive          = 2,
  kProcessChanged = 3,
  kDisappeared    = 4,
  kAcknowledged   = 5,
  kDiagnosed      = 6,
};

enum class RiskLevel : std::uint8_t {
  kTrusted    = 1,
  kExpected   = 2,
  kSuspicious = 3,
};

enum class DerivedStatus : std::uint8_t {
  kHealthy    = 1,
  kSuspicious = 2,
  kGhost      = 3,
  kUnknown    = 4,
};

// Acknowledgements and diagnoses annotate the timeline but never move the state.
constexpr bool IsStateBearing(EventKind kind) {
  return kind == EventKind::kAppeared || kind == EventKind::kAlive || kind == EventKind::kProcessChanged ||
         kind == EventKind::kDisappeared;
}

constexpr bool IsValidPort(std::int64_t port) {
  return port >= 1 && port <= 65535;
}

std::string_view ToString(Protocol protocol);
std::string_view ToString(PortState state);
std::string_view ToString(EventKind kind);
std::string_view ToString(RiskLevel risk);
std::string_view ToString(DerivedStatus status);

std::optional<Protocol>  ParseProtocol(std::string_view text);
std::optional<PortState> ParsePortState(std::string_view text);
std::optional<EventKind> ParseEventKind(std::string_view text);
std::optional<RiskLevel> ParseRiskLevel(std::string_view text);

/*
  Identity of a monitored endpoint.

  Shared by facts and annotations as a logical join key only; there is no
  referential constraint between the two.
*/
struct PortKey {
  std::string   host_id;
  Protocol      protocol = Protocol::kTcp;
  std::uint16_t port     = 0;

  bool operator==(const PortKey&) const = default;
};

std::string ToString(const PortKey& key);

struct PortKeyHash {
  std::size_t operator()(const PortKey& key) const {
    std::size_t h = std::hash<std::string>{}(key.host_id);
    h ^= std::hash<std::uint8_t>{}(static_cast<std::uint8_t>(key.protocol)) + 0x9e3779b9 + (h << 6) + (h >> 2);
    h ^= std::hash<std::uint16_t>{}(key.port) + 0x9e3779b9 + (h << 6) + (h >> 2);
    return h;
  }
};

} // namespace portwatch::model
