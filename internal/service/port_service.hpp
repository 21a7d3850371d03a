#pragma once

#include "internal/db/model/timeline_event_record.hpp"
#include "internal/model/port.hpp"
#include "portwatch/v1.hpp"
#include "service_context.hpp"

namespace portwatch::service {

/*
  Transport-independent operations over the fact, timeline and annotation
  stores. Every key is validated before the store is touched.

  Errors surface as util:: exceptions (NotFound, InvalidArgument,
  StoreUnavailable); the gRPC adapter maps them onto status codes.
*/
class PortService {
public:
  explicit PortService(ServiceContext ctx);

  // Runs a manual cycle on the collector and waits for it. A failed cycle
  // is reported in the response, not thrown.
  portwatch::v1::TriggerScanResponse TriggerScan(const portwatch::v1::TriggerScanRequest& req);

  portwatch::v1::ListPortsResponse ListPorts(const portwatch::v1::ListPortsRequest& req);

  // Newest first. NotFound when no fact exists for the tuple.
  portwatch::v1::GetHistoryResponse GetHistory(const portwatch::v1::GetHistoryRequest& req);

  portwatch::v1::UpsertNoteResponse UpsertNote(const portwatch::v1::UpsertNoteRequest& req);

  // Fact and annotation are deleted independently; the response says which
  // existed. A store failure on one part is reported in the response and
  // never stops the other.
  portwatch::v1::DeletePortResponse DeletePort(const portwatch::v1::DeletePortRequest& req);

  portwatch::v1::AcknowledgeResponse Acknowledge(const portwatch::v1::AcknowledgeRequest& req);

  // Runs the inspection tool, then records the output on the tuple's fact if there is one.
  portwatch::v1::DiagnoseResponse Diagnose(const portwatch::v1::DiagnoseRequest& req);

  portwatch::v1::RecordDiagnosisResponse RecordDiagnosis(const portwatch::v1::RecordDiagnosisRequest& req);

private:
  const std::string& ResolveHost(const std::string& requested) const;

  db::model::TimelineEventRecord AppendToFact(const model::PortKey& key, model::EventKind kind, std::string output);

  ServiceContext ctx_;
};

}
