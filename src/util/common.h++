#pragma once
#include <stdint.h>
#include <stdlib.h>
#include <time.h>
#include <charconv>
#include <chrono>
#include <limits>
#include <optional>
#include <regex>
#include <stdexcept>
#include <string>
#include <string_view>
#include <fmt/core.h>
#include <fmt/chrono.h>
#include <spdlog/spdlog.h>

namespace Tessera {

constexpr std::string_view VERSION = "0.1.0";

using TimestampMs = std::chrono::time_point<std::chrono::system_clock, std::chrono::milliseconds>;

static inline auto timestamp_to_ms(TimestampMs ts) noexcept -> int64_t {
  return ts.time_since_epoch().count();
}
static inline auto ms_to_timestamp(int64_t ms) noexcept -> TimestampMs {
  return TimestampMs(std::chrono::milliseconds(ms));
}
static inline auto now_ms() -> TimestampMs {
  return std::chrono::time_point_cast<std::chrono::milliseconds>(std::chrono::system_clock::now());
}

enum class IdErrorCode : uint8_t {
  InvalidMachineId,
  InvalidEpoch,
  ClockRegression,
  FieldOverflow,
  InvalidCharacter,
  MalformedId
};

static constexpr auto id_error_name(IdErrorCode code) -> std::string_view {
  switch (code) {
    case IdErrorCode::InvalidMachineId: return "Invalid machine ID";
    case IdErrorCode::InvalidEpoch: return "Invalid epoch";
    case IdErrorCode::ClockRegression: return "Clock regression";
    case IdErrorCode::FieldOverflow: return "Field overflow";
    case IdErrorCode::InvalidCharacter: return "Invalid character";
    case IdErrorCode::MalformedId: return "Malformed ID";
  }
  return "Unknown error";
}

struct IdError : public std::runtime_error {
  IdErrorCode code;
  std::string message;
  IdError(IdErrorCode code, std::string message)
    : std::runtime_error(fmt::format("{}: {}", id_error_name(code), message)),
      code(code), message(message) {}
};

#define ISO8601_REGEX_SRC R"((\d{4})-(\d{2})-(\d{2})[T ](\d{2}):(\d{2}):(\d{2})(?:\.(\d{1,3}))?Z?)"
const std::regex iso8601_regex(ISO8601_REGEX_SRC);

// Accepts "YYYY-MM-DDTHH:MM:SS[.mmm][Z]", always interpreted as UTC
static inline auto parse_iso8601(std::string_view str) -> std::optional<TimestampMs> {
  std::match_results<std::string_view::const_iterator> match;
  if (!std::regex_match(str.begin(), str.end(), match, iso8601_regex)) return {};
  struct tm t {};
  t.tm_year = std::stoi(match[1].str()) - 1900;
  t.tm_mon = std::stoi(match[2].str()) - 1;
  t.tm_mday = std::stoi(match[3].str());
  t.tm_hour = std::stoi(match[4].str());
  t.tm_min = std::stoi(match[5].str());
  t.tm_sec = std::stoi(match[6].str());
  if (t.tm_hour > 23 || t.tm_min > 59 || t.tm_sec > 59) return {};
  const int mon = t.tm_mon, mday = t.tm_mday;
  const time_t secs = timegm(&t);
  // timegm normalizes out-of-range days (Feb 30 -> Mar 2), so reject anything it moved
  if (t.tm_mon != mon || t.tm_mday != mday) return {};
  int64_t ms = 0;
  if (match[7].matched) {
    auto frac = match[7].str();
    frac.resize(3, '0');
    ms = std::stoi(frac);
  }
  return ms_to_timestamp(static_cast<int64_t>(secs) * 1000 + ms);
}

// Formats as "YYYY-MM-DDTHH:MM:SS.mmm" with no zone suffix
static inline auto format_iso8601(TimestampMs ts) -> std::string {
  const auto ms = timestamp_to_ms(ts);
  auto secs = static_cast<time_t>(ms / 1000);
  auto frac = ms % 1000;
  if (frac < 0) {
    secs -= 1;
    frac += 1000;
  }
  return fmt::format("{:%Y-%m-%dT%H:%M:%S}.{:03d}", fmt::gmtime(secs), frac);
}

// Host timezone offset from UTC in effect at the given instant
static inline auto local_utc_offset(TimestampMs at) -> std::chrono::seconds {
  const auto secs = static_cast<time_t>(timestamp_to_ms(at) / 1000);
  return std::chrono::seconds(fmt::localtime(secs).tm_gmtoff);
}

// Unsigned decimal option value; rejects signs, blanks and trailing garbage
static inline auto parse_uint(std::string_view str) noexcept -> std::optional<uint64_t> {
  uint64_t n;
  const auto res = std::from_chars(str.data(), str.data() + str.length(), n);
  if (res.ec != std::errc{} || res.ptr != str.data() + str.length()) return {};
  return n;
}

// Common base class for custom formatters
struct CustomFormatter {
  constexpr auto parse(fmt::format_parse_context& ctx) -> fmt::format_parse_context::iterator {
    return ctx.begin();
  }
};

}
