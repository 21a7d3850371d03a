#include "internal/core/key_validation.hpp"

#include <string>

#include "internal/util/errors.hpp"

namespace portwatch::core {

model::PortKey MakeKey(std::string_view host_id, model::Protocol protocol, std::int64_t port) {
  if (host_id.empty()) {
    throw util::InvalidArgument("host_id is required");
  }
  if (!model::IsValidPort(port)) {
    throw util::InvalidArgument("port must be in 1..65535, got " + std::to_string(port));
  }
  return model::PortKey{std::string(host_id), protocol, static_cast<std::uint16_t>(port)};
}

model::PortKey MakeKey(std::string_view host_id, std::string_view protocol, std::int64_t port) {
  auto parsed = model::ParseProtocol(protocol);
  if (!parsed) {
    throw util::InvalidArgument("protocol must be tcp or udp, got '" + std::string(protocol) + "'");
  }
  return MakeKey(host_id, *parsed, port);
}

void ValidateKey(const model::PortKey& key) {
  MakeKey(key.host_id, key.protocol, key.port);
}

model::RiskLevel ParseRiskOrThrow(std::string_view risk) {
  auto parsed = model::ParseRiskLevel(risk);
  if (!parsed) {
    throw util::InvalidArgument("risk_level must be trusted, expected or suspicious, got '" + std::string(risk) + "'");
  }
  return *parsed;
}

} // namespace portwatch::core
