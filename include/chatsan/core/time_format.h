#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace chatsan::core {

// Locale-independent UTC calendar conversions.
// No gmtime/strftime: these are pure functions and safe to call from worker threads.

struct CivilDateTime {
  std::int64_t year{1970};
  unsigned month{1};  // 1..12
  unsigned day{1};    // 1..31
  unsigned hour{0};
  unsigned minute{0};
  unsigned second{0};
};

[[nodiscard]] std::int64_t days_from_civil(std::int64_t year, unsigned month, unsigned day);
[[nodiscard]] CivilDateTime to_civil(std::int64_t unix_seconds);

// "YYYY-MM-DDTHH:MM:SS"
[[nodiscard]] std::string format_iso8601(std::int64_t unix_seconds);

// "HH:MM"
[[nodiscard]] std::string format_hhmm(std::int64_t unix_seconds);

// "YYYYmmdd_HHMMSS", used in output file names.
[[nodiscard]] std::string format_compact(std::int64_t unix_seconds);

// Parses "YYYY-MM-DDTHH:MM:SS" (a space separator is accepted too), with an
// optional fractional part and an optional "Z" or "+HH:MM"/"-HH:MM" offset.
// A time without an offset is treated as UTC. Returns nullopt on malformed input.
[[nodiscard]] std::optional<std::int64_t> parse_iso8601(std::string_view text);

}  // namespace chatsan::core
