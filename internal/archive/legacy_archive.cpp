#include "internal/archive/legacy_archive.hpp"

#include <google/protobuf/util/json_util.h>

#include <algorithm>
#include <stdexcept>
#include <tuple>
#include <unordered_map>

#include "internal/core/db_errors.hpp"
#include "internal/core/key_validation.hpp"
#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"
#include "portwatch/archive/v1/legacy_export.pb.h"

namespace portwatch::archive {

namespace v1 = portwatch::archive::v1;

using db::model::AnnotationRecord;
using db::model::FactRecord;
using db::model::TimelineEventRecord;

namespace {

uint64_t RequiredTime(const std::string& text, const std::string& what) {
  std::optional<uint64_t> parsed;
  try {
    parsed = util::ParseIso8601(text);
  } catch (const std::invalid_argument& e) {
    throw util::InvalidArgument(what + ": " + e.what());
  }
  if (!parsed) {
    throw util::InvalidArgument(what + " is missing");
  }
  return *parsed;
}

std::optional<uint64_t> OptionalTime(const std::string& text, const std::string& what) {
  try {
    return util::ParseIso8601(text);
  } catch (const std::invalid_argument& e) {
    throw util::InvalidArgument(what + ": " + e.what());
  }
}

std::string RowLabel(const char* table, int32_t id) {
  return std::string(table) + " " + std::to_string(id);
}

FactRecord ToFact(const v1::LegacyRuntime& row) {
  const auto label = RowLabel("runtime", row.id());

  FactRecord fact;
  fact.key              = core::MakeKey(row.host_id(), row.protocol(), row.port());
  fact.first_seen_at_ms = RequiredTime(row.first_seen_at(), label + " first_seen_at");
  fact.last_seen_at_ms  = RequiredTime(row.last_seen_at(), label + " last_seen_at");
  fact.last_disappeared_at_ms = OptionalTime(row.last_disappeared_at(), label + " last_disappeared_at");

  const auto state = model::ParsePortState(row.current_state());
  if (!state) {
    throw util::InvalidArgument(label + ": unknown state '" + row.current_state() + "'");
  }
  fact.state                = *state;
  fact.pid                  = row.current_pid();
  fact.process_name         = row.process_name();
  fact.cmdline              = row.cmdline();
  fact.total_seen_count     = static_cast<uint64_t>(std::max(row.total_seen_count(), 0));
  fact.total_uptime_seconds = static_cast<uint64_t>(std::max(row.total_uptime_seconds(), 0));
  return fact;
}

AnnotationRecord ToNote(const v1::LegacyNote& row) {
  AnnotationRecord note;
  note.key         = core::MakeKey(row.host_id(), row.protocol(), row.port());
  note.title       = row.title();
  note.description = row.description();
  note.owner       = row.owner();
  note.risk_level  = row.risk_level().empty() ? model::RiskLevel::kExpected : core::ParseRiskOrThrow(row.risk_level());
  note.is_pinned   = row.is_pinned();
  return note;
}

void FillRuntime(const FactRecord& fact, v1::LegacyRuntime* row) {
  row->set_id(static_cast<int32_t>(fact.id));
  row->set_host_id(fact.key.host_id);
  row->set_protocol(std::string(model::ToString(fact.key.protocol)));
  row->set_port(fact.key.port);
  row->set_first_seen_at(util::FormatIso8601(fact.first_seen_at_ms));
  row->set_last_seen_at(util::FormatIso8601(fact.last_seen_at_ms));
  if (fact.last_disappeared_at_ms) {
    row->set_last_disappeared_at(util::FormatIso8601(*fact.last_disappeared_at_ms));
  }
  row->set_current_state(std::string(model::ToString(fact.state)));
  row->set_current_pid(fact.pid);
  row->set_process_name(fact.process_name);
  row->set_cmdline(fact.cmdline);
  row->set_total_seen_count(static_cast<int32_t>(fact.total_seen_count));
  row->set_total_uptime_seconds(static_cast<int32_t>(fact.total_uptime_seconds));
}

void FillEvent(const TimelineEventRecord& event, v1::LegacyEvent* row) {
  row->set_id(static_cast<int32_t>(event.id));
  row->set_port_runtime_id(static_cast<int32_t>(event.fact_id));
  row->set_event_type(std::string(model::ToString(event.kind)));
  row->set_timestamp(util::FormatIso8601(event.timestamp_ms));
  row->set_pid(event.pid);
  row->set_process_name(event.process_name);
  row->set_diagnostic_output(event.diagnostic_output);
}

void FillNote(const AnnotationRecord& note, v1::LegacyNote* row) {
  row->set_id(static_cast<int32_t>(note.id));
  row->set_host_id(note.key.host_id);
  row->set_protocol(std::string(model::ToString(note.key.protocol)));
  row->set_port(note.key.port);
  row->set_title(note.title);
  row->set_description(note.description);
  row->set_owner(note.owner);
  row->set_risk_level(std::string(model::ToString(note.risk_level)));
  row->set_is_pinned(note.is_pinned);
}

} // namespace

ImportReport ImportLegacyJson(db::Repository& repository, const std::string& json) {
  v1::LegacyExport document;

  google::protobuf::util::JsonParseOptions options;
  options.ignore_unknown_fields = true;

  auto status = google::protobuf::util::JsonStringToMessage(json, &document, options);
  if (!status.ok()) {
    throw util::InvalidArgument("malformed legacy export: " + std::string(status.message()));
  }

  ImportReport report;
  auto         tx = repository.Begin();

  std::unordered_map<int32_t, uint64_t> fact_ids;
  for (const auto& row : document.runtimes()) {
    auto fact = ToFact(row);
    if (repository.GetFact(*tx, fact.key)) {
      PORTWATCH_LOG_WARN("skipping runtime for existing tuple", {observability::IntField("legacy_id", row.id()),
                                                                 observability::StringField("key", model::ToString(fact.key))});
      ++report.facts_skipped;
      continue;
    }
    core::ThrowIfDbError(repository.InsertFact(*tx, fact), "import fact " + model::ToString(fact.key));
    fact_ids[row.id()] = fact.id;
    ++report.facts_imported;
  }

  // oldest first so fresh ids keep timeline order
  std::vector<std::pair<uint64_t, const v1::LegacyEvent*>> events;
  events.reserve(document.events_size());
  for (const auto& row : document.events()) {
    events.emplace_back(RequiredTime(row.timestamp(), RowLabel("event", row.id()) + " timestamp"), &row);
  }
  std::stable_sort(events.begin(), events.end(), [](const auto& a, const auto& b) {
    return std::make_tuple(a.first, a.second->id()) < std::make_tuple(b.first, b.second->id());
  });

  for (const auto& [timestamp_ms, row] : events) {
    const auto it = fact_ids.find(row->port_runtime_id());
    if (it == fact_ids.end()) {
      PORTWATCH_LOG_WARN("skipping event for unknown runtime", {observability::IntField("legacy_id", row->id()),
                                                                observability::IntField("runtime_id", row->port_runtime_id())});
      ++report.events_skipped;
      continue;
    }

    const auto kind = model::ParseEventKind(row->event_type());
    if (!kind) {
      throw util::InvalidArgument(RowLabel("event", row->id()) + ": unknown event type '" + row->event_type() + "'");
    }

    TimelineEventRecord event;
    event.fact_id           = it->second;
    event.kind              = *kind;
    event.timestamp_ms      = timestamp_ms;
    event.pid               = row->pid();
    event.process_name      = row->process_name();
    event.diagnostic_output = row->diagnostic_output();
    core::ThrowIfDbError(repository.AppendEvent(*tx, event), "import event");
    ++report.events_imported;
  }

  for (const auto& row : document.notes()) {
    auto note = ToNote(row);
    core::ThrowIfDbError(repository.UpsertAnnotation(*tx, note), "import note " + model::ToString(note.key));
    ++report.notes_imported;
  }

  tx->Commit();

  PORTWATCH_LOG_INFO("legacy import finished", {observability::IntField("facts", report.facts_imported),
                                                observability::IntField("facts_skipped", report.facts_skipped),
                                                observability::IntField("events", report.events_imported),
                                                observability::IntField("events_skipped", report.events_skipped),
                                                observability::IntField("notes", report.notes_imported)});
  return report;
}

std::string ExportLegacyJson(db::Repository& repository) {
  v1::LegacyExport document;

  auto tx = repository.BeginRead();
  for (const auto& fact : repository.ListFacts(*tx, db::FactFilter{})) {
    FillRuntime(fact, document.add_runtimes());

    auto events = repository.ListEvents(*tx, fact.id);
    std::reverse(events.begin(), events.end());
    for (const auto& event : events) {
      FillEvent(event, document.add_events());
    }
  }
  for (const auto& note : repository.ListAnnotations(*tx, db::AnnotationFilter{})) {
    FillNote(note, document.add_notes());
  }
  tx->Commit();

  google::protobuf::util::JsonPrintOptions options;
  options.add_whitespace                = true;
  options.always_print_primitive_fields = true;
  options.preserve_proto_field_names    = true;

  std::string json;
  auto        status = google::protobuf::util::MessageToJsonString(document, &json, options);
  if (!status.ok()) {
    throw std::runtime_error("failed to serialize export: " + std::string(status.message()));
  }
  return json;
}

} // namespace portwatch::archive
