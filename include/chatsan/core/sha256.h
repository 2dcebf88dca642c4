#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>

namespace chatsan::core {

using Sha256Digest = std::array<std::uint8_t, 32>;

// Incremental FIPS 180-4 SHA-256.
// Feed any number of update() calls, then finish() exactly once.
class Sha256 {
 public:
  Sha256();

  void update(std::string_view data);

  // Applies padding and returns the digest. The hasher must not be reused.
  [[nodiscard]] Sha256Digest finish();

 private:
  void process_block(const std::uint8_t* block);

  std::array<std::uint32_t, 8> state_;
  std::array<std::uint8_t, 64> buffer_{};
  std::size_t buffered_{0};
  std::uint64_t total_bytes_{0};
};

// Lower-case hex of a digest (64 characters).
[[nodiscard]] std::string to_hex(const Sha256Digest& digest);

// One-shot convenience over Sha256.
[[nodiscard]] std::string sha256_hex(std::string_view input);

}  // namespace chatsan::core
