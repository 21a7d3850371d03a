#pragma once

#include <cstdint>
#include <string>

#include "internal/core/cycle_report.hpp"
#include "internal/db/model/annotation_record.hpp"
#include "internal/db/model/fact_record.hpp"
#include "internal/db/model/timeline_event_record.hpp"
#include "portwatch/v1.hpp"

namespace portwatch::service {

// Domain <-> wire conversions. The From* variants validate and throw
// util::InvalidArgument before anything reaches the store.

portwatch::v1::Protocol      ToProto(model::Protocol protocol);
portwatch::v1::PortState     ToProto(model::PortState state);
portwatch::v1::EventKind     ToProto(model::EventKind kind);
portwatch::v1::RiskLevel     ToProto(model::RiskLevel risk);
portwatch::v1::DerivedStatus ToProto(model::DerivedStatus status);

portwatch::v1::PortKey       ToProto(const model::PortKey& key);
portwatch::v1::Fact          ToProto(const db::model::FactRecord& fact);
portwatch::v1::Annotation    ToProto(const db::model::AnnotationRecord& annotation);
portwatch::v1::TimelineEvent ToProto(const db::model::TimelineEventRecord& event);
portwatch::v1::CycleReport   ToProto(const core::CycleReport& report);

model::PortKey   FromProto(const portwatch::v1::PortKey& key, const std::string& default_host);
model::RiskLevel FromProto(portwatch::v1::RiskLevel risk);

// "<d>d <h>h" from one day on, "<h>h" below.
std::string FormatUptime(uint64_t seconds);

} // namespace portwatch::service
