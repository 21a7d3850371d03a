#pragma once

#include <cstdint>
#include <filesystem>
#include <string>
#include <unordered_map>
#include <unordered_set>
#include <vector>

#include "internal/scan/proc_net_parser.hpp"
#include "internal/scan/socket_scanner.hpp"

namespace portwatch::scan {

/*
  Linux scanner over procfs.

  proc_root is normally /proc; tests point it at a fixture tree with the
  same layout (net/tcp, <pid>/fd/N -> socket:[inode], <pid>/comm, ...).
*/
class ProcNetScanner final : public SocketScanner {
 public:
  ProcNetScanner(std::string host_id, std::filesystem::path proc_root);

  const std::string& HostId() const override {
    return host_id_;
  }

  ObservationMap Scan() override;

 private:
  struct ListeningSocket {
    model::Protocol protocol;
    uint16_t        port;
    uint64_t        inode;
  };

  void ReadTable(const std::string& name, model::Protocol protocol, bool required,
                 std::vector<ListeningSocket>& out) const;

  std::unordered_map<uint64_t, int32_t> MapInodesToPids(const std::unordered_set<uint64_t>& wanted) const;

  Observation DescribeProcess(int32_t pid) const;

  std::string           host_id_;
  std::filesystem::path proc_root_;
};

} // namespace portwatch::scan
