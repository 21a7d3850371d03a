#pragma once

#include <string>

#include "internal/db/api/result.hpp"
#include "internal/util/errors.hpp"

namespace portwatch::core {

// Maps a repository result onto the service error types. Anything the
// caller cannot act on is reported as the store being unavailable.
inline void ThrowIfDbError(const db::Result& result, const std::string& context) {
  if (result) {
    return;
  }

  const auto message = result.message.empty() ? context : context + ": " + result.message;
  switch (result.code) {
    case db::ErrorCode::AlreadyExists:
      throw util::AlreadyExists(message);
    case db::ErrorCode::NotFound:
      throw util::NotFound(message);
    default:
      throw util::StoreUnavailable(message);
  }
}

} // namespace portwatch::core
