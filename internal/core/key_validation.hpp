#pragma once

#include <cstdint>
#include <string_view>

#include "internal/model/port.hpp"

namespace portwatch::core {

/*
  Builds a tuple from untrusted input.

  Throws util::InvalidArgument for an empty host, a protocol other than
  tcp/udp, or a port outside 1..65535. Never touches the store.
*/
model::PortKey MakeKey(std::string_view host_id, std::string_view protocol, std::int64_t port);

model::PortKey MakeKey(std::string_view host_id, model::Protocol protocol, std::int64_t port);

// Same checks for a tuple built elsewhere.
void ValidateKey(const model::PortKey& key);

model::RiskLevel ParseRiskOrThrow(std::string_view risk);

} // namespace portwatch::core
