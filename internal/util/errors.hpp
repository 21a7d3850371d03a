#pragma once

#include <stdexcept>
#include <string>

namespace portwatch::util {

/*
  Central error types.

  These get translated later to gRPC status codes.
*/

class NotFound : public std::runtime_error {
 public:
  explicit NotFound(const std::string& msg) : std::runtime_error(msg) {
  }
};

class AlreadyExists : public std::runtime_error {
 public:
  explicit AlreadyExists(const std::string& msg) : std::runtime_error(msg) {
  }
};

// Malformed port, protocol or risk level; raised before the store is touched.
class InvalidArgument : public std::runtime_error {
 public:
  explicit InvalidArgument(const std::string& msg) : std::runtime_error(msg) {
  }
};

// The OS socket table could not be read. Never means "no ports open".
class ScanFailure : public std::runtime_error {
 public:
  explicit ScanFailure(const std::string& msg) : std::runtime_error(msg) {
  }
};

class StoreUnavailable : public std::runtime_error {
 public:
  explicit StoreUnavailable(const std::string& msg) : std::runtime_error(msg) {
  }
};

} // namespace portwatch::util
