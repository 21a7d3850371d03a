#pragma once

#include <string>

namespace portwatch::db {

/*
  Outcome of a repository call.

  Backends translate their driver errors into these codes; nothing above
  the repository sees sqlite3 or pqxx error types.
*/

enum class ErrorCode {
  OK = 0,

  // lookup or delete by tuple found no row
  NotFound,
  // second fact or note for the same (host_id, protocol, port)
  AlreadyExists,

  // foreign key on port_event, or another constraint
  ConstraintViolation,
  // sqlite SQLITE_BUSY / postgres serialization failure
  Busy,
  SerializationFailure,

  IOError,
  Corruption,
  InternalError
};

struct Result {
  ErrorCode   code = ErrorCode::OK;
  std::string message;

  static Result Ok() {
    return {};
  }

  static Result Err(ErrorCode c, std::string msg = {}) {
    return {c, std::move(msg)};
  }

  explicit operator bool() const {
    return code == ErrorCode::OK;
  }
};

} // namespace portwatch::db
