#pragma once

#include <string>

namespace chatsan::core {

// Salt is the secret mixed into every pseudonym digest of one run.
struct Salt {
  std::string value;
  auto operator<=>(const Salt&) const = default;
};

// Abstract salt source for dependency injection.
// Production runs draw a fresh random salt per invocation; tests and
// reproducible runs inject a fixed one.
class ISaltSource {
 public:
  virtual ~ISaltSource() = default;

  // Contract: returned salt is non-empty.
  virtual Salt generate() = 0;

 protected:
  ISaltSource() = default;
  ISaltSource(const ISaltSource&) = default;
  ISaltSource& operator=(const ISaltSource&) = default;
  ISaltSource(ISaltSource&&) = default;
  ISaltSource& operator=(ISaltSource&&) = default;
};

// 128 bits from std::random_device, hex encoded (32 characters).
// Not thread-safe: call from a single thread and hand the salts out.
class RandomSaltSource final : public ISaltSource {
 public:
  RandomSaltSource() = default;
  ~RandomSaltSource() override = default;

  RandomSaltSource(const RandomSaltSource&) = delete;
  RandomSaltSource& operator=(const RandomSaltSource&) = delete;
  RandomSaltSource(RandomSaltSource&&) = delete;
  RandomSaltSource& operator=(RandomSaltSource&&) = delete;

  Salt generate() override;
};

// Always returns the same salt.
class FixedSaltSource final : public ISaltSource {
 public:
  explicit FixedSaltSource(Salt salt) : salt_(std::move(salt)) {}
  ~FixedSaltSource() override = default;

  FixedSaltSource(const FixedSaltSource&) = default;
  FixedSaltSource& operator=(const FixedSaltSource&) = default;
  FixedSaltSource(FixedSaltSource&&) = default;
  FixedSaltSource& operator=(FixedSaltSource&&) = default;

  Salt generate() override;

 private:
  Salt salt_;
};

}  // namespace chatsan::core
