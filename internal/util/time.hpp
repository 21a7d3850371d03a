#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

#include "google/protobuf/timestamp.pb.h"

namespace portwatch::util {

/*
  Time utilities. Single place to control the clock source.

  Persisted timestamps are Unix epoch milliseconds.
*/

using Clock     = std::chrono::system_clock;
using TimePoint = Clock::time_point;

TimePoint Now();
uint64_t  NowMillis();

uint64_t  ToUnixMillis(TimePoint tp);
TimePoint FromUnixMillis(uint64_t ms);

google::protobuf::Timestamp ToProto(uint64_t unix_ms);

// RFC 3339 UTC with millisecond precision, e.g. 2026-02-10T11:55:10.009Z
std::string FormatIso8601(uint64_t unix_ms);

/*
  Lenient ISO-8601 parser for archived data.

  Accepts:
    2026-02-10T11:55:10Z
    2026-02-10T11:55:10.009789+08:00
    2026-02-10T11:55:10.009789      (no zone, read as UTC)
    2026-02-10 11:55:10

  Returns nullopt for empty input or "null"; throws std::invalid_argument
  for anything else it cannot read.
*/
std::optional<uint64_t> ParseIso8601(std::string_view text);

} // namespace portwatch::util
