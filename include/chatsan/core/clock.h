#pragma once

#include <cstdint>
#include <string>

namespace chatsan::core {

// Abstract clock interface for timestamp injection.
// Production code reads the system clock; tests pin time with FixedClock so that
// generated-at metadata and output file names are reproducible.
class IClock {
 public:
  virtual ~IClock() = default;

  // Seconds since the Unix epoch, UTC.
  virtual std::int64_t now_unix_seconds() = 0;

  // Convenience: now_unix_seconds() rendered as "YYYY-MM-DDTHH:MM:SS".
  std::string now_iso8601();

 protected:
  IClock() = default;
  IClock(const IClock&) = default;
  IClock& operator=(const IClock&) = default;
  IClock(IClock&&) = default;
  IClock& operator=(IClock&&) = default;
};

class SystemClock final : public IClock {
 public:
  SystemClock() = default;
  ~SystemClock() override = default;

  SystemClock(const SystemClock&) = default;
  SystemClock& operator=(const SystemClock&) = default;
  SystemClock(SystemClock&&) = default;
  SystemClock& operator=(SystemClock&&) = default;

  std::int64_t now_unix_seconds() override;
};

// Returns a constant instant; for tests and reproducible runs.
class FixedClock final : public IClock {
 public:
  explicit FixedClock(std::int64_t fixed_unix_seconds) : fixed_(fixed_unix_seconds) {}
  ~FixedClock() override = default;

  FixedClock(const FixedClock&) = default;
  FixedClock& operator=(const FixedClock&) = default;
  FixedClock(FixedClock&&) = default;
  FixedClock& operator=(FixedClock&&) = default;

  std::int64_t now_unix_seconds() override;

 private:
  std::int64_t fixed_;
};

}  // namespace chatsan::core
