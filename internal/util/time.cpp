#include "time.hpp"

#include <cctype>
#include <cstdio>
#include <ctime>
#include <stdexcept>

namespace portwatch::util {

namespace {

// Days since 1970-01-01 for a proleptic Gregorian date (H. Hinnant's algorithm).
int64_t DaysFromCivil(int64_t y, unsigned m, unsigned d) {
  y -= m <= 2;
  const int64_t  era = (y >= 0 ? y : y - 399) / 400;
  const unsigned yoe = static_cast<unsigned>(y - era * 400);
  const unsigned doy = (153 * (m > 2 ? m - 3 : m + 9) + 2) / 5 + d - 1;
  const unsigned doe = yoe * 365 + yoe / 4 - yoe / 100 + doy;
  return era * 146097 + static_cast<int64_t>(doe) - 719468;
}

bool ReadDigits(std::string_view text, std::size_t& pos, std::size_t count, int& out) {
  if (pos + count > text.size()) {
    return false;
  }
  int value = 0;
  for (std::size_t i = 0; i < count; ++i) {
    const char c = text[pos + i];
    if (!std::isdigit(static_cast<unsigned char>(c))) {
      return false;
    }
    value = value * 10 + (c - '0');
  }
  pos += count;
  out = value;
  return true;
}

bool Expect(std::string_view text, std::size_t& pos, char c) {
  if (pos >= text.size() || text[pos] != c) {
    return false;
  }
  ++pos;
  return true;
}

[[noreturn]] void Reject(std::string_view text) {
  throw std::invalid_argument("unrecognised timestamp: '" + std::string(text) + "'");
}

} // namespace

TimePoint Now() {
  return Clock::now();
}

uint64_t NowMillis() {
  return ToUnixMillis(Now());
}

uint64_t ToUnixMillis(TimePoint tp) {
  return std::chrono::duration_cast<std::chrono::milliseconds>(tp.time_since_epoch()).count();
}

TimePoint FromUnixMillis(uint64_t ms) {
  return TimePoint{} + std::chrono::milliseconds(ms);
}

google::protobuf::Timestamp ToProto(uint64_t unix_ms) {
  google::protobuf::Timestamp ts;
  ts.set_seconds(static_cast<int64_t>(unix_ms / 1000));
  ts.set_nanos(static_cast<int32_t>((unix_ms % 1000) * 1'000'000));
  return ts;
}

std::string FormatIso8601(uint64_t unix_ms) {
  const std::time_t secs = static_cast<std::time_t>(unix_ms / 1000);
  std::tm           utc{};
  gmtime_r(&secs, &utc);

  char buf[32];
  std::snprintf(buf, sizeof(buf), "%04d-%02d-%02dT%02d:%02d:%02d.%03uZ", utc.tm_year + 1900, utc.tm_mon + 1, utc.tm_mday, utc.tm_hour,
                utc.tm_min, utc.tm_sec, static_cast<unsigned>(unix_ms % 1000));
  return buf;
}

std::optional<uint64_t> ParseIso8601(std::string_view text) {
  while (!text.empty() && std::isspace(static_cast<unsigned char>(text.front()))) text.remove_prefix(1);
  while (!text.empty() && std::isspace(static_cast<unsigned char>(text.back()))) text.remove_suffix(1);
  if (text.empty() || text == "null") {
    return std::nullopt;
  }

  std::size_t pos = 0;
  int         year = 0, month = 0, day = 0, hour = 0, minute = 0, second = 0;

  if (!ReadDigits(text, pos, 4, year) || !Expect(text, pos, '-') || !ReadDigits(text, pos, 2, month) || !Expect(text, pos, '-') ||
      !ReadDigits(text, pos, 2, day)) {
    Reject(text);
  }
  if (pos >= text.size() || (text[pos] != 'T' && text[pos] != 't' && text[pos] != ' ')) {
    Reject(text);
  }
  ++pos;
  if (!ReadDigits(text, pos, 2, hour) || !Expect(text, pos, ':') || !ReadDigits(text, pos, 2, minute) || !Expect(text, pos, ':') ||
      !ReadDigits(text, pos, 2, second)) {
    Reject(text);
  }
  if (month < 1 || month > 12 || day < 1 || day > 31 || hour > 23 || minute > 59 || second > 60) {
    Reject(text);
  }

  // Fractional seconds: any number of digits, truncated to milliseconds.
  int64_t millis = 0;
  if (pos < text.size() && (text[pos] == '.' || text[pos] == ',')) {
    ++pos;
    std::size_t digits = 0;
    int64_t     scale  = 100;
    while (pos < text.size() && std::isdigit(static_cast<unsigned char>(text[pos]))) {
      if (digits < 3) {
        millis += (text[pos] - '0') * scale;
        scale /= 10;
      }
      ++digits;
      ++pos;
    }
    if (digits == 0) {
      Reject(text);
    }
  }

  int64_t offset_minutes = 0;
  if (pos < text.size()) {
    const char zone = text[pos];
    if (zone == 'Z' || zone == 'z') {
      ++pos;
    } else if (zone == '+' || zone == '-') {
      ++pos;
      int oh = 0, om = 0;
      if (!ReadDigits(text, pos, 2, oh)) {
        Reject(text);
      }
      Expect(text, pos, ':');
      if (!ReadDigits(text, pos, 2, om)) {
        Reject(text);
      }
      offset_minutes = (oh * 60 + om) * (zone == '-' ? -1 : 1);
    } else {
      Reject(text);
    }
  }
  if (pos != text.size()) {
    Reject(text);
  }

  const int64_t days    = DaysFromCivil(year, static_cast<unsigned>(month), static_cast<unsigned>(day));
  const int64_t seconds = days * 86400 + hour * 3600 + minute * 60 + second - offset_minutes * 60;
  if (seconds < 0) {
    Reject(text);
  }
  return static_cast<uint64_t>(seconds * 1000 + millis);
}

} // namespace portwatch::util
