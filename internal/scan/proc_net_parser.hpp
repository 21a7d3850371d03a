#pragma once

#include <cstdint>
#include <istream>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "internal/model/port.hpp"

namespace portwatch::scan {

// One row of /proc/net/{tcp,tcp6,udp,udp6}.
struct NetSocketRow {
  uint16_t local_port = 0;
  uint8_t  state      = 0;
  uint64_t inode      = 0;
};

inline constexpr uint8_t kTcpListen = 0x0A;

// Parses a whole table including its header line. Malformed rows are skipped.
std::vector<NetSocketRow> ParseNetTable(std::istream& in);

// Parses one data row; nullopt for the header or a malformed row.
std::optional<NetSocketRow> ParseNetRow(std::string_view line);

// TCP counts only LISTEN; UDP is connectionless, so any bound port counts.
bool IsListening(model::Protocol protocol, const NetSocketRow& row);

// "socket:[12345]" -> 12345
std::optional<uint64_t> ParseSocketLink(std::string_view target);

// /proc/<pid>/comm content without the trailing newline.
std::string TrimComm(std::string_view raw);

// /proc/<pid>/cmdline content: NUL separated, usually NUL terminated.
std::string JoinCmdline(std::string_view raw);

} // namespace portwatch::scan
