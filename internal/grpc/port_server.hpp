#pragma once

#include <grpcpp/grpcpp.h>

#include <memory>

#include "internal/service/port_service.hpp"
#include "portwatch/services/v1/port_service.grpc.pb.h"

namespace portwatch::grpc {

class PortServer final : public portwatch::services::v1::PortService::Service {
public:
  explicit PortServer(std::shared_ptr<portwatch::service::PortService> svc);

  ::grpc::Status TriggerScan(::grpc::ServerContext*, const portwatch::services::v1::TriggerScanRequest*,
                             portwatch::services::v1::TriggerScanResponse*) override;

  ::grpc::Status ListPorts(::grpc::ServerContext*, const portwatch::services::v1::ListPortsRequest*,
                           portwatch::services::v1::ListPortsResponse*) override;

  ::grpc::Status GetHistory(::grpc::ServerContext*, const portwatch::services::v1::GetHistoryRequest*,
                            portwatch::services::v1::GetHistoryResponse*) override;

  ::grpc::Status UpsertNote(::grpc::ServerContext*, const portwatch::services::v1::UpsertNoteRequest*,
                            portwatch::services::v1::UpsertNoteResponse*) override;

  ::grpc::Status DeletePort(::grpc::ServerContext*, const portwatch::services::v1::DeletePortRequest*,
                            portwatch::services::v1::DeletePortResponse*) override;

  ::grpc::Status Acknowledge(::grpc::ServerContext*, const portwatch::services::v1::AcknowledgeRequest*,
                             portwatch::services::v1::AcknowledgeResponse*) override;

  ::grpc::Status Diagnose(::grpc::ServerContext*, const portwatch::services::v1::DiagnoseRequest*,
                          portwatch::services::v1::DiagnoseResponse*) override;

  ::grpc::Status RecordDiagnosis(::grpc::ServerContext*, const portwatch::services::v1::RecordDiagnosisRequest*,
                                 portwatch::services::v1::RecordDiagnosisResponse*) override;

private:
  std::shared_ptr<portwatch::service::PortService> service_;
};

}
