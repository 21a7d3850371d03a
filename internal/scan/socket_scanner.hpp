#pragma once

#include <cstdint>
#include <string>
#include <unordered_map>

#include "internal/model/port.hpp"

namespace portwatch::scan {

// Owning process of a listening socket as seen during one scan.
struct Observation {
  int32_t     pid = 0;
  std::string process_name;
  std::string cmdline;
};

using ObservationMap = std::unordered_map<model::PortKey, Observation, model::PortKeyHash>;

/*
  Source of the current set of listening sockets for one host.

  Scan() returns only sockets with a resolvable owning process and
  throws util::ScanFailure when the socket table itself is unreadable.
  An empty map always means "nothing is listening", never "could not look".
*/
class SocketScanner {
 public:
  virtual ~SocketScanner() = default;

  virtual const std::string& HostId() const = 0;

  virtual ObservationMap Scan() = 0;
};

} // namespace portwatch::scan
