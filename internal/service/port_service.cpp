#include "port_service.hpp"

#include <algorithm>
#include <map>
#include <stdexcept>
#include <tuple>

#include "internal/collector/collector_worker.hpp"
#include "internal/core/annotation_store.hpp"
#include "internal/core/db_errors.hpp"
#include "internal/core/status.hpp"
#include "internal/db/api/repository.hpp"
#include "internal/diagnostics/diagnostic_runner.hpp"
#include "internal/observability/logging.hpp"
#include "internal/service/proto_convert.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"

namespace portwatch::service {

using namespace portwatch::v1;

namespace {

// Logs a failed call with its route and rethrows it unchanged.
template <typename Fn>
auto Logged(const char* route, Fn&& fn) -> decltype(fn()) {
  try {
    return fn();
  } catch (const std::exception& ex) {
    PORTWATCH_LOG_ERROR("request failed", {observability::StringField("route", route), observability::StringField("error", ex.what())});
    throw;
  }
}

struct KeyOrder {
  bool operator()(const model::PortKey& a, const model::PortKey& b) const {
    return std::tie(a.host_id, a.protocol, a.port) < std::tie(b.host_id, b.protocol, b.port);
  }
};

} // namespace

PortService::PortService(ServiceContext ctx) : ctx_(std::move(ctx)) {
  if (!ctx_.clock) {
    ctx_.clock = [] { return util::NowMillis(); };
  }
}

const std::string& PortService::ResolveHost(const std::string& requested) const {
  return requested.empty() ? ctx_.host_id : requested;
}

TriggerScanResponse PortService::TriggerScan(const TriggerScanRequest& req) {
  return Logged("PortService.TriggerScan", [&] {
    const auto& host = ResolveHost(req.host_id());
    if (host != ctx_.host_id) {
      throw util::InvalidArgument("this collector observes host '" + ctx_.host_id + "', not '" + host + "'");
    }

    TriggerScanResponse resp;
    try {
      auto report = ctx_.collector->TriggerNow("TriggerScan").get();
      resp.set_ok(true);
      *resp.mutable_report() = ToProto(report);
    } catch (const std::exception& e) {
      PORTWATCH_LOG_WARN("manual cycle failed", {observability::StringField("host_id", host), observability::StringField("error", e.what())});
      resp.set_ok(false);
      resp.set_error(e.what());
    }
    return resp;
  });
}

ListPortsResponse PortService::ListPorts(const ListPortsRequest& req) {
  return Logged("PortService.ListPorts", [&] {
    const auto& host = ResolveHost(req.host_id());
    const auto  now  = ctx_.clock();

    struct Joined {
      std::optional<db::model::FactRecord>          fact;
      std::optional<db::model::AnnotationRecord>    annotation;
      std::optional<db::model::TimelineEventRecord> latest;
    };
    std::map<model::PortKey, Joined, KeyOrder> rows;

    auto tx = ctx_.repository->BeginRead();
    for (auto& fact : ctx_.repository->ListFacts(*tx, db::FactFilter{host, std::nullopt})) {
      auto& row  = rows[fact.key];
      row.latest = ctx_.repository->LatestEvent(*tx, fact.id);
      row.fact   = std::move(fact);
    }
    for (auto& note : ctx_.repository->ListAnnotations(*tx, db::AnnotationFilter{host})) {
      rows[note.key].annotation = std::move(note);
    }
    tx->Commit();

    ListPortsResponse resp;
    for (const auto& [key, row] : rows) {
      auto* item             = resp.add_ports();
      *item->mutable_key()   = ToProto(key);
      const auto* fact       = row.fact ? &*row.fact : nullptr;
      const auto* annotation = row.annotation ? &*row.annotation : nullptr;
      item->set_status(ToProto(core::DeriveStatus(fact, annotation)));

      if (fact) {
        *item->mutable_fact() = ToProto(*fact);
        if (fact->state == model::PortState::kActive) {
          const uint64_t seconds = now > fact->first_seen_at_ms ? (now - fact->first_seen_at_ms) / 1000 : 0;
          item->set_uptime_human(FormatUptime(seconds));
        }
      }
      if (annotation) {
        *item->mutable_annotation() = ToProto(*annotation);
      }
      if (row.latest) {
        item->set_latest_event_kind(ToProto(row.latest->kind));
        *item->mutable_latest_event_at() = util::ToProto(row.latest->timestamp_ms);
      }
    }
    return resp;
  });
}

GetHistoryResponse PortService::GetHistory(const GetHistoryRequest& req) {
  return Logged("PortService.GetHistory", [&] {
    const auto key = FromProto(req.key(), ctx_.host_id);

    auto tx   = ctx_.repository->BeginRead();
    auto fact = ctx_.repository->GetFact(*tx, key);
    if (!fact) {
      throw util::NotFound("no fact for " + model::ToString(key));
    }
    auto events = ctx_.repository->ListEvents(*tx, fact->id);
    tx->Commit();

    GetHistoryResponse resp;
    for (const auto& event : events) {
      *resp.add_events() = ToProto(event);
    }
    return resp;
  });
}

UpsertNoteResponse PortService::UpsertNote(const UpsertNoteRequest& req) {
  return Logged("PortService.UpsertNote", [&] {
    const auto key = FromProto(req.key(), ctx_.host_id);

    core::AnnotationPatch patch;
    if (req.has_title()) patch.title = req.title();
    if (req.has_description()) patch.description = req.description();
    if (req.has_owner()) patch.owner = req.owner();
    if (req.has_risk_level()) patch.risk_level = FromProto(req.risk_level());
    if (req.has_is_pinned()) patch.is_pinned = req.is_pinned();

    UpsertNoteResponse resp;
    *resp.mutable_annotation() = ToProto(ctx_.annotations->Upsert(key, patch));
    return resp;
  });
}

DeletePortResponse PortService::DeletePort(const DeletePortRequest& req) {
  return Logged("PortService.DeletePort", [&] {
    const auto key = FromProto(req.key(), ctx_.host_id);

    DeletePortResponse resp;
    try {
      auto tx     = ctx_.repository->Begin();
      auto result = ctx_.repository->DeleteFact(*tx, key);
      if (result.code != db::ErrorCode::NotFound) {
        core::ThrowIfDbError(result, "delete fact " + model::ToString(key));
        tx->Commit();
        resp.set_fact_deleted(true);
      }
    } catch (const std::runtime_error& e) {
      PORTWATCH_LOG_WARN("fact delete failed", {observability::StringField("key", model::ToString(key)),
                                                observability::StringField("error", e.what())});
      resp.set_fact_error(e.what());
    }

    // independent of the fact outcome
    try {
      resp.set_annotation_deleted(ctx_.annotations->Delete(key));
    } catch (const std::runtime_error& e) {
      PORTWATCH_LOG_WARN("annotation delete failed", {observability::StringField("key", model::ToString(key)),
                                                      observability::StringField("error", e.what())});
      resp.set_annotation_error(e.what());
    }

    PORTWATCH_LOG_INFO("port deleted", {observability::StringField("key", model::ToString(key)),
                                        observability::BoolField("fact", resp.fact_deleted()),
                                        observability::BoolField("annotation", resp.annotation_deleted())});
    return resp;
  });
}

AcknowledgeResponse PortService::Acknowledge(const AcknowledgeRequest& req) {
  return Logged("PortService.Acknowledge", [&] {
    const auto key = FromProto(req.key(), ctx_.host_id);

    AcknowledgeResponse resp;
    *resp.mutable_event() = ToProto(AppendToFact(key, model::EventKind::kAcknowledged, {}));
    return resp;
  });
}

DiagnoseResponse PortService::Diagnose(const DiagnoseRequest& req) {
  return Logged("PortService.Diagnose", [&] {
    const auto key = FromProto(req.key(), ctx_.host_id);

    const auto result = ctx_.diagnostics->Inspect(key.port);

    DiagnoseResponse resp;
    resp.set_output(result.output);
    resp.set_error(result.error);

    try {
      AppendToFact(key, model::EventKind::kDiagnosed, result.output);
      resp.set_recorded(true);
    } catch (const util::NotFound&) {
      PORTWATCH_LOG_INFO("diagnosis not recorded: no fact", {observability::StringField("key", model::ToString(key))});
    }
    return resp;
  });
}

RecordDiagnosisResponse PortService::RecordDiagnosis(const RecordDiagnosisRequest& req) {
  return Logged("PortService.RecordDiagnosis", [&] {
    const auto key = FromProto(req.key(), ctx_.host_id);

    RecordDiagnosisResponse resp;
    *resp.mutable_event() = ToProto(AppendToFact(key, model::EventKind::kDiagnosed, req.output()));
    return resp;
  });
}

db::model::TimelineEventRecord PortService::AppendToFact(const model::PortKey& key, model::EventKind kind, std::string output) {
  auto tx   = ctx_.repository->Begin();
  auto fact = ctx_.repository->GetFact(*tx, key);
  if (!fact) {
    throw util::NotFound("no fact for " + model::ToString(key));
  }

  db::model::TimelineEventRecord event;
  event.fact_id           = fact->id;
  event.kind              = kind;
  event.timestamp_ms      = ctx_.clock();
  event.pid               = fact->pid;
  event.process_name      = fact->process_name;
  event.diagnostic_output = std::move(output);

  core::ThrowIfDbError(ctx_.repository->AppendEvent(*tx, event), "append event " + model::ToString(key));
  tx->Commit();
  return event;
}

} // namespace portwatch::service
