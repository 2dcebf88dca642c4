#include "chatsan/core/clock.h"

#include "chatsan/core/time_format.h"

#include <chrono>

namespace chatsan::core {

std::string IClock::now_iso8601() {
  return format_iso8601(now_unix_seconds());
}

std::int64_t SystemClock::now_unix_seconds() {
  const auto now = std::chrono::system_clock::now().time_since_epoch();
  return std::chrono::duration_cast<std::chrono::seconds>(now).count();
}

std::int64_t FixedClock::now_unix_seconds() {
  return fixed_;
}

}  // namespace chatsan::core
