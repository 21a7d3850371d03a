#include "internal/service/proto_convert.hpp"

#include "internal/core/key_validation.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"

namespace portwatch::service {

using namespace portwatch::v1;

Protocol ToProto(model::Protocol protocol) {
  switch (protocol) {
    case model::Protocol::kTcp:
      return PROTOCOL_TCP;
    case model::Protocol::kUdp:
      return PROTOCOL_UDP;
  }
  return PROTOCOL_UNSPECIFIED;
}

PortState ToProto(model::PortState state) {
  switch (state) {
    case model::PortState::kActive:
      return PORT_STATE_ACTIVE;
    case model::PortState::kDisappeared:
      return PORT_STATE_DISAPPEARED;
  }
  return PORT_STATE_UNSPECIFIED;
}

EventKind ToProto(model::EventKind kind) {
  switch (kind) {
    case model::EventKind::kAppeared:
      return EVENT_KIND_APPEARED;
    case model::EventKind::kAlive:
      return EVENT_KIND_ALIVE;
    case model::EventKind::kProcessChanged:
      return EVENT_KIND_PROCESS_CHANGE;
    case model::EventKind::kDisappeared:
      return EVENT_KIND_DISAPPEARED;
    case model::EventKind::kAcknowledged:
      return EVENT_KIND_ACKNOWLEDGED;
    case model::EventKind::kDiagnosed:
      return EVENT_KIND_DIAGNOSIS;
  }
  return EVENT_KIND_UNSPECIFIED;
}

RiskLevel ToProto(model::RiskLevel risk) {
  switch (risk) {
    case model::RiskLevel::kTrusted:
      return RISK_LEVEL_TRUSTED;
    case model::RiskLevel::kExpected:
      return RISK_LEVEL_EXPECTED;
    case model::RiskLevel::kSuspicious:
      return RISK_LEVEL_SUSPICIOUS;
  }
  return RISK_LEVEL_UNSPECIFIED;
}

DerivedStatus ToProto(model::DerivedStatus status) {
  switch (status) {
    case model::DerivedStatus::kHealthy:
      return DERIVED_STATUS_HEALTHY;
    case model::DerivedStatus::kSuspicious:
      return DERIVED_STATUS_SUSPICIOUS;
    case model::DerivedStatus::kGhost:
      return DERIVED_STATUS_GHOST;
    case model::DerivedStatus::kUnknown:
      return DERIVED_STATUS_UNKNOWN;
  }
  return DERIVED_STATUS_UNSPECIFIED;
}

PortKey ToProto(const model::PortKey& key) {
  PortKey out;
  out.set_host_id(key.host_id);
  out.set_protocol(ToProto(key.protocol));
  out.set_port(key.port);
  return out;
}

Fact ToProto(const db::model::FactRecord& fact) {
  Fact out;
  out.set_id(fact.id);
  *out.mutable_key()           = ToProto(fact.key);
  *out.mutable_first_seen_at() = util::ToProto(fact.first_seen_at_ms);
  *out.mutable_last_seen_at()  = util::ToProto(fact.last_seen_at_ms);
  if (fact.last_disappeared_at_ms) {
    *out.mutable_last_disappeared_at() = util::ToProto(*fact.last_disappeared_at_ms);
  }
  out.set_state(ToProto(fact.state));
  out.set_pid(fact.pid);
  out.set_process_name(fact.process_name);
  out.set_cmdline(fact.cmdline);
  out.set_total_seen_count(fact.total_seen_count);
  out.set_total_uptime_seconds(fact.total_uptime_seconds);
  return out;
}

Annotation ToProto(const db::model::AnnotationRecord& annotation) {
  Annotation out;
  out.set_id(annotation.id);
  *out.mutable_key() = ToProto(annotation.key);
  out.set_title(annotation.title);
  out.set_description(annotation.description);
  out.set_owner(annotation.owner);
  out.set_risk_level(ToProto(annotation.risk_level));
  out.set_is_pinned(annotation.is_pinned);
  return out;
}

TimelineEvent ToProto(const db::model::TimelineEventRecord& event) {
  TimelineEvent out;
  out.set_id(event.id);
  out.set_fact_id(event.fact_id);
  out.set_kind(ToProto(event.kind));
  *out.mutable_timestamp() = util::ToProto(event.timestamp_ms);
  out.set_pid(event.pid);
  out.set_process_name(event.process_name);
  out.set_diagnostic_output(event.diagnostic_output);
  return out;
}

CycleReport ToProto(const core::CycleReport& report) {
  CycleReport out;
  out.set_host_id(report.host_id);
  out.set_observed(static_cast<uint32_t>(report.observed));
  out.set_appeared(static_cast<uint32_t>(report.appeared));
  out.set_reappeared(static_cast<uint32_t>(report.reappeared));
  out.set_continued(static_cast<uint32_t>(report.continued));
  out.set_process_changed(static_cast<uint32_t>(report.process_changed));
  out.set_disappeared(static_cast<uint32_t>(report.disappeared));
  out.set_duration_ms(report.duration_ms);
  return out;
}

model::PortKey FromProto(const PortKey& key, const std::string& default_host) {
  const std::string& host = key.host_id().empty() ? default_host : key.host_id();
  switch (key.protocol()) {
    case PROTOCOL_TCP:
      return core::MakeKey(host, model::Protocol::kTcp, key.port());
    case PROTOCOL_UDP:
      return core::MakeKey(host, model::Protocol::kUdp, key.port());
    default:
      throw util::InvalidArgument("protocol must be tcp or udp");
  }
}

model::RiskLevel FromProto(RiskLevel risk) {
  switch (risk) {
    case RISK_LEVEL_TRUSTED:
      return model::RiskLevel::kTrusted;
    case RISK_LEVEL_EXPECTED:
      return model::RiskLevel::kExpected;
    case RISK_LEVEL_SUSPICIOUS:
      return model::RiskLevel::kSuspicious;
    default:
      throw util::InvalidArgument("risk_level must be trusted, expected or suspicious");
  }
}

std::string FormatUptime(uint64_t seconds) {
  const uint64_t days  = seconds / 86400;
  const uint64_t hours = (seconds % 86400) / 3600;
  if (days > 0) {
    return std::to_string(days) + "d " + std::to_string(hours) + "h";
  }
  return std::to_string(hours) + "h";
}

} // namespace portwatch::service
