#include "internal/scan/proc_net_parser.hpp"

#include <charconv>

namespace portwatch::scan {

namespace {

template <typename T>
bool ParseNumber(std::string_view text, T& out, int base) {
  if (text.empty()) return false;
  auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), out, base);
  return ec == std::errc() && ptr == text.data() + text.size();
}

std::vector<std::string_view> Tokenize(std::string_view line) {
  std::vector<std::string_view> tokens;
  std::size_t                   pos = 0;
  while (pos < line.size()) {
    while (pos < line.size() && (line[pos] == ' ' || line[pos] == '\t')) ++pos;
    if (pos >= line.size()) break;
    std::size_t end = pos;
    while (end < line.size() && line[end] != ' ' && line[end] != '\t' && line[end] != '\n') ++end;
    tokens.push_back(line.substr(pos, end - pos));
    pos = end;
  }
  return tokens;
}

} // namespace

std::optional<NetSocketRow> ParseNetRow(std::string_view line) {
  // sl local_address rem_address st tx:rx tr:when retrnsmt uid timeout inode ...
  auto tokens = Tokenize(line);
  if (tokens.size() < 10) return std::nullopt;
  if (tokens[0].empty() || tokens[0].back() != ':') return std::nullopt;

  const auto local = tokens[1];
  const auto colon = local.rfind(':');
  if (colon == std::string_view::npos) return std::nullopt;

  NetSocketRow row;
  uint32_t     port = 0;
  if (!ParseNumber(local.substr(colon + 1), port, 16) || port > 0xFFFF) return std::nullopt;
  row.local_port = static_cast<uint16_t>(port);

  unsigned state = 0;
  if (!ParseNumber(tokens[3], state, 16) || state > 0xFF) return std::nullopt;
  row.state = static_cast<uint8_t>(state);

  if (!ParseNumber(tokens[9], row.inode, 10)) return std::nullopt;
  return row;
}

std::vector<NetSocketRow> ParseNetTable(std::istream& in) {
  std::vector<NetSocketRow> rows;
  std::string               line;
  bool                      header = true;
  while (std::getline(in, line)) {
    if (header) {
      header = false;
      continue;
    }
    if (auto row = ParseNetRow(line)) rows.push_back(*row);
  }
  return rows;
}

bool IsListening(model::Protocol protocol, const NetSocketRow& row) {
  if (row.local_port == 0) return false;
  if (protocol == model::Protocol::kTcp) return row.state == kTcpListen;
  return true;
}

std::optional<uint64_t> ParseSocketLink(std::string_view target) {
  constexpr std::string_view kPrefix = "socket:[";
  if (target.size() <= kPrefix.size() + 1 || target.substr(0, kPrefix.size()) != kPrefix || target.back() != ']') {
    return std::nullopt;
  }
  uint64_t inode = 0;
  if (!ParseNumber(target.substr(kPrefix.size(), target.size() - kPrefix.size() - 1), inode, 10)) return std::nullopt;
  return inode;
}

std::string TrimComm(std::string_view raw) {
  while (!raw.empty() && (raw.back() == '\n' || raw.back() == ' ' || raw.back() == '\t' || raw.back() == '\r')) {
    raw.remove_suffix(1);
  }
  return std::string(raw);
}

std::string JoinCmdline(std::string_view raw) {
  while (!raw.empty() && raw.back() == '\0') raw.remove_suffix(1);
  std::string out(raw);
  for (char& c : out) {
    if (c == '\0') c = ' ';
  }
  return out;
}

} // namespace portwatch::scan
