#include "port_server.hpp"

#include "grpc_error.hpp"

namespace portwatch::grpc {

using namespace portwatch::services::v1;

namespace {

template <typename Fn>
::grpc::Status Handle(Fn&& fn) {
  try {
    fn();
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

} // namespace

PortServer::PortServer(std::shared_ptr<portwatch::service::PortService> svc) : service_(std::move(svc)) {
}

::grpc::Status PortServer::TriggerScan(::grpc::ServerContext*, const TriggerScanRequest* req, TriggerScanResponse* resp) {
  return Handle([&] { *resp = service_->TriggerScan(*req); });
}

::grpc::Status PortServer::ListPorts(::grpc::ServerContext*, const ListPortsRequest* req, ListPortsResponse* resp) {
  return Handle([&] { *resp = service_->ListPorts(*req); });
}

::grpc::Status PortServer::GetHistory(::grpc::ServerContext*, const GetHistoryRequest* req, GetHistoryResponse* resp) {
  return Handle([&] { *resp = service_->GetHistory(*req); });
}

::grpc::Status PortServer::UpsertNote(::grpc::ServerContext*, const UpsertNoteRequest* req, UpsertNoteResponse* resp) {
  return Handle([&] { *resp = service_->UpsertNote(*req); });
}

::grpc::Status PortServer::DeletePort(::grpc::ServerContext*, const DeletePortRequest* req, DeletePortResponse* resp) {
  return Handle([&] { *resp = service_->DeletePort(*req); });
}

::grpc::Status PortServer::Acknowledge(::grpc::ServerContext*, const AcknowledgeRequest* req, AcknowledgeResponse* resp) {
  return Handle([&] { *resp = service_->Acknowledge(*req); });
}

::grpc::Status PortServer::Diagnose(::grpc::ServerContext*, const DiagnoseRequest* req, DiagnoseResponse* resp) {
  return Handle([&] { *resp = service_->Diagnose(*req); });
}

::grpc::Status PortServer::RecordDiagnosis(::grpc::ServerContext*, const RecordDiagnosisRequest* req,
                                           RecordDiagnosisResponse* resp) {
  return Handle([&] { *resp = service_->RecordDiagnosis(*req); });
}

} // namespace portwatch::grpc
