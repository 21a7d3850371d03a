#include "internal/scan/proc_net_scanner.hpp"

#include <cerrno>
#include <cstring>
#include <fstream>
#include <iterator>

#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"

namespace portwatch::scan {

namespace fs = std::filesystem;

namespace {

std::string ReadSmallFile(const fs::path& path) {
  std::ifstream in(path, std::ios::binary);
  if (!in) return {};
  return std::string(std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>());
}

bool IsPidName(const std::string& name) {
  if (name.empty()) return false;
  for (char c : name) {
    if (c < '0' || c > '9') return false;
  }
  return true;
}

} // namespace

ProcNetScanner::ProcNetScanner(std::string host_id, fs::path proc_root)
    : host_id_(std::move(host_id)), proc_root_(std::move(proc_root)) {
}

ObservationMap ProcNetScanner::Scan() {
  std::vector<ListeningSocket> sockets;
  ReadTable("tcp", model::Protocol::kTcp, true, sockets);
  ReadTable("tcp6", model::Protocol::kTcp, false, sockets);
  ReadTable("udp", model::Protocol::kUdp, true, sockets);
  ReadTable("udp6", model::Protocol::kUdp, false, sockets);

  std::unordered_set<uint64_t> wanted;
  for (const auto& s : sockets) wanted.insert(s.inode);

  const auto owners = MapInodesToPids(wanted);

  ObservationMap                           out;
  std::unordered_map<int32_t, Observation> described;
  std::size_t                              unowned = 0;
  for (const auto& s : sockets) {
    auto owner = owners.find(s.inode);
    if (owner == owners.end()) {
      ++unowned;
      continue;
    }

    model::PortKey key{host_id_, s.protocol, s.port};
    if (out.contains(key)) continue; // first owned socket wins

    auto it = described.find(owner->second);
    if (it == described.end()) {
      it = described.emplace(owner->second, DescribeProcess(owner->second)).first;
    }
    out.emplace(std::move(key), it->second);
  }

  observability::LogDebug("socket scan complete", {observability::StringField("host_id", host_id_),
                                                   observability::IntField("sockets", static_cast<int64_t>(sockets.size())),
                                                   observability::IntField("observed", static_cast<int64_t>(out.size())),
                                                   observability::IntField("unowned", static_cast<int64_t>(unowned))});
  return out;
}

void ProcNetScanner::ReadTable(const std::string& name, model::Protocol protocol, bool required,
                               std::vector<ListeningSocket>& out) const {
  const fs::path path = proc_root_ / "net" / name;

  std::ifstream in(path);
  if (!in) {
    const int err = errno;
    std::error_code ec;
    if (!required && !fs::exists(path, ec) && !ec) {
      observability::LogDebug("socket table absent", {observability::StringField("path", path.string())});
      return;
    }
    throw util::ScanFailure("cannot read " + path.string() + ": " + std::strerror(err));
  }

  for (const auto& row : ParseNetTable(in)) {
    if (!IsListening(protocol, row)) continue;
    out.push_back(ListeningSocket{protocol, row.local_port, row.inode});
  }

  if (in.bad()) {
    throw util::ScanFailure("read error on " + path.string());
  }
}

std::unordered_map<uint64_t, int32_t> ProcNetScanner::MapInodesToPids(const std::unordered_set<uint64_t>& wanted) const {
  std::unordered_map<uint64_t, int32_t> owners;
  if (wanted.empty()) return owners;

  std::error_code ec;
  fs::directory_iterator procs(proc_root_, ec);
  if (ec) {
    throw util::ScanFailure("cannot list " + proc_root_.string() + ": " + ec.message());
  }

  for (auto proc = procs; proc != fs::directory_iterator(); proc.increment(ec)) {
    if (ec) {
      throw util::ScanFailure("cannot list " + proc_root_.string() + ": " + ec.message());
    }
    const auto pid_name = proc->path().filename().string();
    if (!IsPidName(pid_name)) continue;

    // processes exit and fds close while we walk; unreadable entries are skipped
    std::error_code        fd_ec;
    fs::directory_iterator fds(proc->path() / "fd", fd_ec);
    if (fd_ec) continue;

    const auto pid = static_cast<int32_t>(std::stol(pid_name));
    for (auto fd = fds; !fd_ec && fd != fs::directory_iterator(); fd.increment(fd_ec)) {
      std::error_code link_ec;
      const auto      target = fs::read_symlink(fd->path(), link_ec);
      if (link_ec) continue;

      auto inode = ParseSocketLink(target.string());
      if (!inode || !wanted.contains(*inode)) continue;
      owners.emplace(*inode, pid);
    }
    if (owners.size() == wanted.size()) break;
  }
  return owners;
}

Observation ProcNetScanner::DescribeProcess(int32_t pid) const {
  const fs::path dir = proc_root_ / std::to_string(pid);

  Observation obs;
  obs.pid          = pid;
  obs.process_name = TrimComm(ReadSmallFile(dir / "comm"));
  obs.cmdline      = JoinCmdline(ReadSmallFile(dir / "cmdline"));
  return obs;
}

} // namespace portwatch::scan
