#include <grpcpp/grpcpp.h>

#include <cctype>
#include <cstdlib>
#include <iostream>
#include <map>
#include <memory>
#include <optional>
#include <string>

#include "portwatch/services/v1/port_service.grpc.pb.h"
#include "portwatch/v1.hpp"

using namespace portwatch::v1;

static void Usage() {
  std::cout << "Usage:\n"
            << "  portwatchctl <addr> ports [host=<id>]\n"
            << "  portwatchctl <addr> history <tcp|udp> <port> [host=<id>]\n"
            << "  portwatchctl <addr> note <tcp|udp> <port> [title=..] [description=..] [owner=..]\n"
            << "                          [risk=trusted|expected|suspicious] [pinned=true|false] [host=<id>]\n"
            << "  portwatchctl <addr> delete <tcp|udp> <port> [host=<id>]\n"
            << "  portwatchctl <addr> ack <tcp|udp> <port> [host=<id>]\n"
            << "  portwatchctl <addr> inspect <tcp|udp> <port> [host=<id>]\n"
            << "  portwatchctl <addr> scan [host=<id>]\n";
}

// key=value arguments starting at argv[first]
static std::map<std::string, std::string> ParseOptions(int argc, char** argv, int first) {
  std::map<std::string, std::string> options;
  for (int i = first; i < argc; ++i) {
    const std::string arg = argv[i];
    const auto        eq  = arg.find('=');
    if (eq == std::string::npos) {
      std::cerr << "expected key=value, got '" << arg << "'\n";
      std::exit(1);
    }
    options[arg.substr(0, eq)] = arg.substr(eq + 1);
  }
  return options;
}

static std::string HostOption(const std::map<std::string, std::string>& options) {
  const auto it = options.find("host");
  return it == options.end() ? std::string() : it->second;
}

static PortKey MakeKey(const std::string& host, const std::string& protocol, const std::string& port) {
  PortKey key;
  key.set_host_id(host);
  if (protocol == "tcp") {
    key.set_protocol(PROTOCOL_TCP);
  } else if (protocol == "udp") {
    key.set_protocol(PROTOCOL_UDP);
  } else {
    std::cerr << "unsupported protocol: " << protocol << "\n";
    std::exit(1);
  }

  char* end   = nullptr;
  long  value = std::strtol(port.c_str(), &end, 10);
  if (port.empty() || *end != '\0' || value < 1 || value > 65535) {
    std::cerr << "invalid port: " << port << "\n";
    std::exit(1);
  }
  key.set_port(static_cast<uint32_t>(value));
  return key;
}

static std::optional<RiskLevel> ParseRisk(const std::string& value) {
  if (value == "trusted") return RISK_LEVEL_TRUSTED;
  if (value == "expected") return RISK_LEVEL_EXPECTED;
  if (value == "suspicious") return RISK_LEVEL_SUSPICIOUS;
  return std::nullopt;
}

static std::string Lower(const std::string& enum_name, const std::string& prefix) {
  std::string out = enum_name.rfind(prefix, 0) == 0 ? enum_name.substr(prefix.size()) : enum_name;
  for (auto& c : out) c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
  return out;
}

static std::string KeyString(const PortKey& key) {
  return key.host_id() + "/" + Lower(Protocol_Name(key.protocol()), "PROTOCOL_") + "/" + std::to_string(key.port());
}

static int Fail(const grpc::Status& status) {
  std::cerr << status.error_message() << "\n";
  return 2;
}

int main(int argc, char** argv) {
  if (argc < 3) {
    Usage();
    return 1;
  }

  std::string addr = argv[1];
  std::string cmd  = argv[2];

  auto channel = grpc::CreateChannel(addr, grpc::InsecureChannelCredentials());
  auto stub    = PortService::NewStub(channel);

  grpc::ClientContext ctx;

  // ------------------------------------------------------------

  if (cmd == "ports") {
    auto options = ParseOptions(argc, argv, 3);

    ListPortsRequest req;
    req.set_host_id(HostOption(options));

    ListPortsResponse resp;
    auto              status = stub->ListPorts(&ctx, req, &resp);
    if (!status.ok()) return Fail(status);

    for (const auto& port : resp.ports()) {
      std::cout << KeyString(port.key()) << " status=" << Lower(DerivedStatus_Name(port.status()), "DERIVED_STATUS_");
      if (port.has_fact()) {
        std::cout << " state=" << Lower(PortState_Name(port.fact().state()), "PORT_STATE_")
                  << " pid=" << port.fact().pid() << " process=" << port.fact().process_name();
      }
      if (!port.uptime_human().empty()) std::cout << " uptime=" << port.uptime_human();
      if (port.has_annotation()) {
        std::cout << " title=\"" << port.annotation().title() << "\""
                  << " risk=" << Lower(RiskLevel_Name(port.annotation().risk_level()), "RISK_LEVEL_");
        if (port.annotation().is_pinned()) std::cout << " pinned";
      }
      std::cout << "\n";
    }
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "scan") {
    auto options = ParseOptions(argc, argv, 3);

    TriggerScanRequest req;
    req.set_host_id(HostOption(options));

    TriggerScanResponse resp;
    auto                status = stub->TriggerScan(&ctx, req, &resp);
    if (!status.ok()) return Fail(status);

    if (!resp.ok()) {
      std::cerr << "scan failed: " << resp.error() << "\n";
      return 2;
    }
    const auto& r = resp.report();
    std::cout << "observed=" << r.observed() << " appeared=" << r.appeared() << " reappeared=" << r.reappeared()
              << " continued=" << r.continued() << " process_changed=" << r.process_changed()
              << " disappeared=" << r.disappeared() << " duration_ms=" << r.duration_ms() << "\n";
    return 0;
  }

  // every remaining command addresses one tuple
  if (argc < 5) {
    Usage();
    return 1;
  }
  auto options = ParseOptions(argc, argv, 5);
  auto key     = MakeKey(HostOption(options), argv[3], argv[4]);

  // ------------------------------------------------------------

  if (cmd == "history") {
    GetHistoryRequest req;
    *req.mutable_key() = key;

    GetHistoryResponse resp;
    auto               status = stub->GetHistory(&ctx, req, &resp);
    if (!status.ok()) return Fail(status);

    for (const auto& event : resp.events()) {
      std::cout << event.timestamp().seconds() << " " << Lower(EventKind_Name(event.kind()), "EVENT_KIND_")
                << " pid=" << event.pid() << " process=" << event.process_name() << "\n";
      if (!event.diagnostic_output().empty()) std::cout << event.diagnostic_output() << "\n";
    }
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "note") {
    UpsertNoteRequest req;
    *req.mutable_key() = key;
    options.erase("host");

    for (const auto& [name, value] : options) {
      if (name == "title") {
        req.set_title(value);
      } else if (name == "description") {
        req.set_description(value);
      } else if (name == "owner") {
        req.set_owner(value);
      } else if (name == "risk") {
        auto risk = ParseRisk(value);
        if (!risk) {
          std::cerr << "unsupported risk: " << value << "\n";
          return 1;
        }
        req.set_risk_level(*risk);
      } else if (name == "pinned") {
        req.set_is_pinned(value == "true" || value == "1");
      } else {
        std::cerr << "unknown note field: " << name << "\n";
        return 1;
      }
    }

    UpsertNoteResponse resp;
    auto               status = stub->UpsertNote(&ctx, req, &resp);
    if (!status.ok()) return Fail(status);

    std::cout << "noted " << KeyString(resp.annotation().key()) << "\n";
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "delete") {
    DeletePortRequest req;
    *req.mutable_key() = key;

    DeletePortResponse resp;
    auto               status = stub->DeletePort(&ctx, req, &resp);
    if (!status.ok()) return Fail(status);

    std::cout << "fact_deleted=" << (resp.fact_deleted() ? "true" : "false")
              << " annotation_deleted=" << (resp.annotation_deleted() ? "true" : "false") << "\n";
    if (!resp.fact_error().empty()) std::cerr << "fact delete failed: " << resp.fact_error() << "\n";
    if (!resp.annotation_error().empty()) std::cerr << "annotation delete failed: " << resp.annotation_error() << "\n";
    return resp.fact_error().empty() && resp.annotation_error().empty() ? 0 : 1;
  }

  // ------------------------------------------------------------

  if (cmd == "ack") {
    AcknowledgeRequest req;
    *req.mutable_key() = key;

    AcknowledgeResponse resp;
    auto                status = stub->Acknowledge(&ctx, req, &resp);
    if (!status.ok()) return Fail(status);

    std::cout << "acknowledged\n";
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "inspect") {
    DiagnoseRequest req;
    *req.mutable_key() = key;

    DiagnoseResponse resp;
    auto             status = stub->Diagnose(&ctx, req, &resp);
    if (!status.ok()) return Fail(status);

    std::cout << resp.output() << "\n";
    if (!resp.recorded()) std::cerr << "(not recorded: no fact for this tuple)\n";
    return resp.error() ? 2 : 0;
  }

  Usage();
  return 1;
}
