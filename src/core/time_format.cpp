#include "chatsan/core/time_format.h"

#include <array>
#include <cstdio>

namespace chatsan::core {

namespace {

constexpr std::int64_t kSecondsPerDay = 86400;

std::int64_t floor_div(const std::int64_t a, const std::int64_t b) {
  std::int64_t q = a / b;
  if ((a % b != 0) && ((a < 0) != (b < 0))) {
    --q;
  }
  return q;
}

bool is_leap_year(const std::int64_t year) {
  return (year % 4 == 0 && year % 100 != 0) || year % 400 == 0;
}

unsigned days_in_month(const std::int64_t year, const unsigned month) {
  constexpr std::array<unsigned, 12> kDays = {31, 28, 31, 30, 31, 30, 31, 31, 30, 31, 30, 31};
  if (month == 2 && is_leap_year(year)) {
    return 29;
  }
  return kDays[month - 1];
}

// Reads exactly `width` decimal digits starting at `pos`.
std::optional<unsigned> read_digits(const std::string_view text, const std::size_t pos,
                                    const std::size_t width) {
  if (pos + width > text.size()) {
    return std::nullopt;
  }
  unsigned value = 0;
  for (std::size_t i = pos; i < pos + width; ++i) {
    const char ch = text[i];
    if (ch < '0' || ch > '9') {
      return std::nullopt;
    }
    value = value * 10u + static_cast<unsigned>(ch - '0');
  }
  return value;
}

}  // namespace

// Howard Hinnant's days_from_civil.
std::int64_t days_from_civil(std::int64_t year, const unsigned month, const unsigned day) {
  year -= month <= 2 ? 1 : 0;
  const std::int64_t era = floor_div(year, 400);
  const auto yoe = static_cast<unsigned>(year - era * 400);
  const unsigned doy = (153u * (month > 2 ? month - 3u : month + 9u) + 2u) / 5u + day - 1u;
  const unsigned doe = yoe * 365u + yoe / 4u - yoe / 100u + doy;
  return era * 146097 + static_cast<std::int64_t>(doe) - 719468;
}

CivilDateTime to_civil(const std::int64_t unix_seconds) {
  const std::int64_t days = floor_div(unix_seconds, kSecondsPerDay);
  const std::int64_t secs_of_day = unix_seconds - days * kSecondsPerDay;

  const std::int64_t z = days + 719468;
  const std::int64_t era = floor_div(z, 146097);
  const auto doe = static_cast<unsigned>(z - era * 146097);
  const unsigned yoe = (doe - doe / 1460u + doe / 36524u - doe / 146096u) / 365u;
  const unsigned doy = doe - (365u * yoe + yoe / 4u - yoe / 100u);
  const unsigned mp = (5u * doy + 2u) / 153u;

  CivilDateTime out;
  out.day = doy - (153u * mp + 2u) / 5u + 1u;
  out.month = mp < 10u ? mp + 3u : mp - 9u;
  out.year = static_cast<std::int64_t>(yoe) + era * 400 + (out.month <= 2 ? 1 : 0);
  out.hour = static_cast<unsigned>(secs_of_day / 3600);
  out.minute = static_cast<unsigned>((secs_of_day % 3600) / 60);
  out.second = static_cast<unsigned>(secs_of_day % 60);
  return out;
}

std::string format_iso8601(const std::int64_t unix_seconds) {
  const CivilDateTime c = to_civil(unix_seconds);
  std::array<char, 48> buf{};
  std::snprintf(buf.data(), buf.size(), "%04lld-%02u-%02uT%02u:%02u:%02u",
                static_cast<long long>(c.year), c.month, c.day, c.hour, c.minute, c.second);
  return std::string(buf.data());
}

std::string format_hhmm(const std::int64_t unix_seconds) {
  const CivilDateTime c = to_civil(unix_seconds);
  std::array<char, 16> buf{};
  std::snprintf(buf.data(), buf.size(), "%02u:%02u", c.hour, c.minute);
  return std::string(buf.data());
}

std::string format_compact(const std::int64_t unix_seconds) {
  const CivilDateTime c = to_civil(unix_seconds);
  std::array<char, 48> buf{};
  std::snprintf(buf.data(), buf.size(), "%04lld%02u%02u_%02u%02u%02u",
                static_cast<long long>(c.year), c.month, c.day, c.hour, c.minute, c.second);
  return std::string(buf.data());
}

std::optional<std::int64_t> parse_iso8601(const std::string_view text) {
  // YYYY-MM-DDTHH:MM:SS is 19 characters.
  if (text.size() < 19 || text[4] != '-' || text[7] != '-' ||
      (text[10] != 'T' && text[10] != ' ') || text[13] != ':' || text[16] != ':') {
    return std::nullopt;
  }

  const auto year = read_digits(text, 0, 4);
  const auto month = read_digits(text, 5, 2);
  const auto day = read_digits(text, 8, 2);
  const auto hour = read_digits(text, 11, 2);
  const auto minute = read_digits(text, 14, 2);
  const auto second = read_digits(text, 17, 2);
  if (!year || !month || !day || !hour || !minute || !second) {
    return std::nullopt;
  }
  if (*month < 1 || *month > 12 || *day < 1 || *day > days_in_month(*year, *month) ||
      *hour > 23 || *minute > 59 || *second > 60) {
    return std::nullopt;
  }

  std::size_t pos = 19;
  if (pos < text.size() && text[pos] == '.') {
    ++pos;
    const std::size_t digits_start = pos;
    while (pos < text.size() && text[pos] >= '0' && text[pos] <= '9') {
      ++pos;
    }
    if (pos == digits_start) {
      return std::nullopt;
    }
  }

  std::int64_t offset_seconds = 0;
  if (pos < text.size()) {
    if (text[pos] == 'Z' && pos + 1 == text.size()) {
      pos = text.size();
    } else if ((text[pos] == '+' || text[pos] == '-') && pos + 6 == text.size() &&
               text[pos + 3] == ':') {
      const auto off_h = read_digits(text, pos + 1, 2);
      const auto off_m = read_digits(text, pos + 4, 2);
      if (!off_h || !off_m || *off_h > 23 || *off_m > 59) {
        return std::nullopt;
      }
      offset_seconds = static_cast<std::int64_t>(*off_h) * 3600 + *off_m * 60;
      if (text[pos] == '-') {
        offset_seconds = -offset_seconds;
      }
    } else {
      return std::nullopt;
    }
  }

  const std::int64_t days = days_from_civil(*year, *month, *day);
  const std::int64_t local = days * kSecondsPerDay + static_cast<std::int64_t>(*hour) * 3600 +
                             static_cast<std::int64_t>(*minute) * 60 + *second;
  return local - offset_seconds;
}

}  // namespace chatsan::core
